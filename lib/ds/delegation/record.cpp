/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <cstring>
#include <ds/delegation/record.hpp>

namespace delegation_scout::delegation {
    const solana::pubkey &program_id()
    {
        static const auto id = solana::pubkey::from_base58("DELeGGvXpWV2fqJUhqcF5ZSYMS4JTLjteaAMARRSaeSh");
        return id;
    }

    std::optional<record> decode_record(const buffer &data) noexcept
    {
        if (data.size() != record_size)
            return {};
        record rec {};
        memcpy(rec.discriminator.data(), data.data() + discriminator_offset, rec.discriminator.size());
        memcpy(rec.validator_identity.data(), data.data() + identity_offset, rec.validator_identity.size());
        return rec;
    }

    solana::pda record_address(const solana::pubkey &account)
    {
        return solana::find_program_address({ buffer { seed_prefix }, account }, program_id());
    }
}
