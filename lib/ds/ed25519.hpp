/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_ED25519_HPP
#define DELEGATION_SCOUT_ED25519_HPP

#include <utility>
#include <ds/array.hpp>

namespace delegation_scout::ed25519 {
    using vkey = byte_array<32>;
    using skey = secure_byte_array<64>;
    using signature = byte_array<64>;
    using seed = secure_byte_array<32>;

    extern void ensure_initialized();
    extern void create(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk);
    extern void create_from_seed(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk, const buffer &sd);
    extern std::pair<skey, vkey> create_from_seed(const buffer &seed);
    extern vkey extract_vk(const buffer &sk);
    extern signature sign(const buffer &msg, const buffer &sk);
    extern bool verify(const buffer &sig, const buffer &vk, const buffer &msg);

    // true when the 32 bytes are the compressed encoding of a point on the curve,
    // that is, when the encoded y-coordinate has a matching x-coordinate
    extern bool on_curve(const buffer &point);
}

#endif // !DELEGATION_SCOUT_ED25519_HPP
