/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_DELEGATION_PING_HPP
#define DELEGATION_SCOUT_DELEGATION_PING_HPP

#include <ds/solana/rpc.hpp>
#include <ds/solana/signer.hpp>

namespace delegation_scout::delegation {
    struct receipt {
        std::string signature {};
        solana::blockhash blockhash {};
        uint64_t last_valid_block_height = 0;

        [[nodiscard]] json::object to_json() const;
    };

    // Submits a zero-lamport transfer from `from` to `to` and waits for its confirmation.
    // The signer is called exactly once. Failures keep their error kind with the ping context prepended.
    extern receipt send_ping(const solana::rpc::client &client, const solana::pubkey &from, const solana::pubkey &to, const solana::signer &signer);
    extern receipt send_ping(const solana::pubkey &from, const solana::pubkey &to, const solana::signer &signer, const std::optional<std::string> &endpoint={});
}

#endif // !DELEGATION_SCOUT_DELEGATION_PING_HPP
