/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_SOLANA_PUBKEY_HPP
#define DELEGATION_SCOUT_SOLANA_PUBKEY_HPP

#include <string>
#include <ds/array.hpp>

namespace delegation_scout::solana {
    struct pubkey: byte_array<32> {
        using byte_array::byte_array;

        // throws invalid_input_error unless the text is base58 and decodes to exactly 32 bytes
        static pubkey from_base58(std::string_view text);

        pubkey() =default;

        pubkey(const byte_array<32> &bytes): byte_array { bytes }
        {
        }

        [[nodiscard]] std::string to_base58() const;
    };

    extern const pubkey system_program;
}

namespace fmt {
    template<>
    struct formatter<delegation_scout::solana::pubkey>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_base58());
        }
    };
}

#endif // !DELEGATION_SCOUT_SOLANA_PUBKEY_HPP
