/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_SOLANA_PDA_HPP
#define DELEGATION_SCOUT_SOLANA_PDA_HPP

#include <vector>
#include <ds/solana/pubkey.hpp>

namespace delegation_scout::solana {
    static constexpr size_t max_seeds = 16;
    static constexpr size_t max_seed_size = 32;

    using seed_list = std::vector<buffer>;

    struct pda {
        pubkey address {};
        uint8_t bump = 0;

        bool operator==(const pda &o) const noexcept
        {
            return address == o.address && bump == o.bump;
        }
    };

    // The address for the exact seeds without a bump search.
    // Throws derivation_error if the seeds are invalid or the result lies on the ed25519 curve.
    extern pubkey create_program_address(const seed_list &seeds, const pubkey &program_id);

    // Searches bump values from 255 down to 0 and returns the first off-curve address
    extern pda find_program_address(const seed_list &seeds, const pubkey &program_id);
}

namespace fmt {
    template<>
    struct formatter<delegation_scout::solana::pda>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{} (bump: {})", v.address, v.bump);
        }
    };
}

#endif // !DELEGATION_SCOUT_SOLANA_PDA_HPP
