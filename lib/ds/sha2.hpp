/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_SHA2_HPP
#define DELEGATION_SCOUT_SHA2_HPP

extern "C" {
#   include <sodium.h>
};
#include <ds/array.hpp>
#include <ds/ed25519.hpp>

namespace delegation_scout::sha2
{
    using hash_256 = byte_array<crypto_hash_sha256_BYTES>;

    inline hash_256 digest(const buffer &in)
    {
        hash_256 out {};
        ed25519::ensure_initialized();
        if (crypto_hash_sha256(out.data(), in.data(), in.size()) != 0)
            throw error("sha2 computation hash failed!");
        return out;
    }
}

#endif // !DELEGATION_SCOUT_SHA2_HPP
