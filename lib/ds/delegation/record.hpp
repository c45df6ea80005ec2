/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_DELEGATION_RECORD_HPP
#define DELEGATION_SCOUT_DELEGATION_RECORD_HPP

#include <optional>
#include <ds/solana/pda.hpp>

namespace delegation_scout::delegation {
    static constexpr std::string_view seed_prefix { "delegation" };
    static constexpr size_t record_size = 96;
    static constexpr size_t discriminator_offset = 0;
    static constexpr size_t identity_offset = 8;

    using discriminator = byte_array<8>;

    // The owner of all delegation records
    extern const solana::pubkey &program_id();

    // The fixed 96-byte record: an 8-byte discriminator, the 32-byte validator identity and opaque metadata
    struct record {
        delegation::discriminator discriminator {};
        solana::pubkey validator_identity {};
    };

    // nullopt for any length other than record_size; the discriminator value is not checked
    extern std::optional<record> decode_record(const buffer &data) noexcept;

    // The PDA of the delegation record of the given account: seeds ["delegation", account]
    extern solana::pda record_address(const solana::pubkey &account);
}

#endif // !DELEGATION_SCOUT_DELEGATION_RECORD_HPP
