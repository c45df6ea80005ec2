/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_DELEGATION_RESULT_HPP
#define DELEGATION_SCOUT_DELEGATION_RESULT_HPP

#include <optional>
#include <string>
#include <ds/delegation/record.hpp>
#include <ds/json.hpp>

namespace delegation_scout::delegation {
    enum class status {
        not_delegated,
        delegated
    };

    struct account_meta {
        uint64_t lamports = 0;
        solana::pubkey owner {};
        size_t data_length = 0;
        bool executable = false;
        uint64_t rent_epoch = 0;
    };

    struct raw_fields {
        delegation::discriminator discriminator {};
        solana::pubkey identity {};
    };

    struct result {
        std::string account {};
        // absent for the placeholders of failed batch items
        std::optional<solana::pda> pda {};
        delegation::status status = delegation::status::not_delegated;
        std::optional<account_meta> pda_account {};
        std::optional<solana::pubkey> validator_identity {};
        std::optional<raw_fields> raw_data {};

        static result placeholder(const std::string_view account)
        {
            return result { std::string { account } };
        }

        [[nodiscard]] bool delegated() const noexcept
        {
            return status == delegation::status::delegated;
        }

        [[nodiscard]] json::object to_json() const;
    };
}

namespace fmt {
    template<>
    struct formatter<delegation_scout::delegation::status>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using delegation_scout::delegation::status;
            switch (v) {
                case status::delegated: return fmt::format_to(ctx.out(), "DELEGATED");
                case status::not_delegated: return fmt::format_to(ctx.out(), "NOT_DELEGATED");
                default: throw delegation_scout::error(fmt::format("unsupported delegation status: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !DELEGATION_SCOUT_DELEGATION_RESULT_HPP
