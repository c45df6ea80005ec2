/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <optional>
#include <ds/ed25519.hpp>
#include <ds/sha2.hpp>
#include <ds/solana/pda.hpp>

namespace delegation_scout::solana {
    static constexpr std::string_view pda_marker { "ProgramDerivedAddress" };

    static void validate_seeds(const seed_list &seeds, const size_t extra)
    {
        if (seeds.size() + extra > max_seeds)
            throw derivation_error(fmt::format("at most {} seeds are allowed but got {}", max_seeds, seeds.size() + extra));
        for (size_t i = 0; i < seeds.size(); ++i) {
            if (seeds[i].size() > max_seed_size)
                throw derivation_error(fmt::format("seed #{} has {} bytes while the maximum is {}", i, seeds[i].size(), max_seed_size));
        }
    }

    static std::optional<pubkey> candidate(const seed_list &seeds, const std::optional<uint8_t> bump, const pubkey &program_id)
    {
        uint8_vector preimage {};
        for (const auto &s: seeds)
            preimage << s;
        if (bump)
            preimage << *bump;
        preimage << program_id << buffer { pda_marker };
        pubkey addr { sha2::digest(preimage) };
        if (ed25519::on_curve(addr))
            return {};
        return addr;
    }

    pubkey create_program_address(const seed_list &seeds, const pubkey &program_id)
    {
        validate_seeds(seeds, 0);
        if (auto addr = candidate(seeds, {}, program_id); addr)
            return *addr;
        throw derivation_error(fmt::format("the address for {} seeds under program {} lies on the ed25519 curve", seeds.size(), program_id));
    }

    pda find_program_address(const seed_list &seeds, const pubkey &program_id)
    {
        validate_seeds(seeds, 1);
        for (int bump = 255; bump >= 0; --bump) {
            if (auto addr = candidate(seeds, static_cast<uint8_t>(bump), program_id); addr)
                return pda { *addr, static_cast<uint8_t>(bump) };
        }
        throw derivation_error(fmt::format("no bump value produces an off-curve address under program {}", program_id));
    }
}
