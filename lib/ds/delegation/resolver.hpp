/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_DELEGATION_RESOLVER_HPP
#define DELEGATION_SCOUT_DELEGATION_RESOLVER_HPP

#include <vector>
#include <ds/delegation/result.hpp>
#include <ds/solana/rpc.hpp>

namespace delegation_scout::delegation {
    struct resolver {
        explicit resolver(const solana::rpc::client &client);

        // Throws invalid_input_error before any network call if the account is not a valid key.
        // Performs exactly one account read; network failures propagate as network_error.
        [[nodiscard]] result resolve(std::string_view account) const;

        // Sequential and order-preserving. An item that fails with invalid_input_error, network_error
        // or derivation_error is replaced by result::placeholder; other exceptions propagate.
        [[nodiscard]] std::vector<result> resolve_many(const std::vector<std::string> &accounts) const;
    private:
        const solana::rpc::client &_client;
    };

    // Use the default RPC endpoint from the rpc config unless an endpoint is given
    extern result resolve(std::string_view account, const std::optional<std::string> &endpoint={});
    extern std::vector<result> resolve_many(const std::vector<std::string> &accounts, const std::optional<std::string> &endpoint={});
}

#endif // !DELEGATION_SCOUT_DELEGATION_RESOLVER_HPP
