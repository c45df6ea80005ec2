/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_COMMON_ERROR_HPP
#define DELEGATION_SCOUT_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace delegation_scout {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };

    // a string is not a valid account key or a keypair file is malformed
    struct invalid_input_error: error {
        using error::error;
    };

    // no off-curve program address could be produced from the given seeds
    struct derivation_error: error {
        using error::error;
    };

    // transport, HTTP, JSON-RPC or on-chain execution failures
    struct network_error: error {
        using error::error;
    };

    struct signing_rejected_error: error {
        using error::error;
    };

    // the block height passed the transaction's last valid height before it was confirmed
    struct confirmation_timeout_error: error {
        using error::error;
    };
}

#endif // !DELEGATION_SCOUT_COMMON_ERROR_HPP
