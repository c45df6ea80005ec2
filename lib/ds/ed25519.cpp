/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

extern "C" {
#   include <sodium.h>
};
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <ds/ed25519.hpp>

namespace delegation_scout::ed25519 {
    using boost::multiprecision::cpp_int;

    struct sodium_initializer {
        sodium_initializer() {
            if (sodium_init() == -1)
                throw error("Failed to initialize libsodium!");
        }
    };

    void ensure_initialized()
    {
        // will be initialized on the first call, after that do nothing
        static sodium_initializer init {};
    }

    void create(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk)
    {
        if (sk.size() != sizeof(skey))
            throw error(fmt::format("private key must have {} bytes but got: {}!", sizeof(skey), sk.size()));
        if (vk.size() != sizeof(vkey))
            throw error(fmt::format("verification key must have {} bytes but got: {}!", sizeof(vkey), vk.size()));
        ensure_initialized();
        if (crypto_sign_keypair(vk.data(), sk.data()) != 0)
            throw error("failed to generate a cryptographic key pair!");
    }

    void create_from_seed(const std::span<uint8_t> &sk, const std::span<uint8_t> &vk, const buffer &sd)
    {
        if (sk.size() != sizeof(skey))
            throw error(fmt::format("private key must have {} bytes but got: {}!", sizeof(skey), sk.size()));
        if (vk.size() != sizeof(vkey))
            throw error(fmt::format("verification key must have {} bytes but got: {}!", sizeof(vkey), vk.size()));
        if (sd.size() != sizeof(seed))
            throw error(fmt::format("seed must have {} bytes but got: {}!", sizeof(seed), sd.size()));
        ensure_initialized();
        if (crypto_sign_seed_keypair(vk.data(), sk.data(), sd.data()) != 0)
            throw error("failed to generate a cryptographic key pair!");
    }

    std::pair<skey, vkey> create_from_seed(const buffer &sd)
    {
        skey sk {};
        vkey vk {};
        create_from_seed(sk, vk, sd);
        return std::make_pair(sk, vk);
    }

    vkey extract_vk(const buffer &sk)
    {
        if (sk.size() != sizeof(skey))
            throw error(fmt::format("private key must have {} bytes but got: {}!", sizeof(skey), sk.size()));
        vkey vk {};
        if (crypto_sign_ed25519_sk_to_pk(vk.data(), sk.data()) != 0)
            throw error("failed to extract the verification key from a secret key!");
        return vk;
    }

    signature sign(const buffer &msg, const buffer &sk)
    {
        if (sk.size() != sizeof(skey))
            throw error(fmt::format("private key must have {} bytes but got: {}!", sizeof(skey), sk.size()));
        ensure_initialized();
        signature sig {};
        if (crypto_sign_detached(sig.data(), nullptr, msg.data(), msg.size(), sk.data()) != 0)
            throw error("failed to cryptographically sign a message!");
        return sig;
    }

    bool verify(const buffer &sig, const buffer &vk, const buffer &msg)
    {
        if (sig.size() != sizeof(signature))
            throw error(fmt::format("signature must have {} bytes but got: {}!", sizeof(signature), sig.size()));
        if (vk.size() != sizeof(vkey))
            throw error(fmt::format("public key must have {} bytes but got: {}!", sizeof(vkey), vk.size()));
        ensure_initialized();
        return crypto_sign_verify_detached(sig.data(), msg.data(), msg.size(), vk.data()) == 0;
    }

    // Edwards25519 over GF(2^255 - 19): -x^2 + y^2 = 1 + d*x^2*y^2 with d = -121665/121666.
    // Only the y-coordinate matters: a point exists iff (y^2 - 1) / (d*y^2 + 1) is a square.
    // The sign bit selects between x and -x and is ignored.
    struct field {
        const cpp_int p = (cpp_int { 1 } << 255) - 19;
        const cpp_int inverse_exp = p - 2;
        const cpp_int legendre_exp = (p - 1) / 2;
        const cpp_int d = ((p - 121665) * cpp_int { powm(cpp_int { 121666 }, inverse_exp, p) }) % p;

        static const field &get()
        {
            static const field f {};
            return f;
        }
    };

    bool on_curve(const buffer &point)
    {
        if (point.size() != sizeof(vkey))
            throw error(fmt::format("a compressed curve point must have {} bytes but got: {}!", sizeof(vkey), point.size()));
        const auto &f = field::get();
        cpp_int y = 0;
        for (size_t i = point.size(); i > 0; --i) {
            y <<= 8;
            y += i == point.size() ? point[i - 1] & 0x7F : point[i - 1];
        }
        const cpp_int y2 = (y * y) % f.p;
        const cpp_int u = (y2 + f.p - 1) % f.p;
        const cpp_int v = (f.d * y2 + 1) % f.p;
        if (u == 0)
            return true;
        if (v == 0)
            return false;
        const cpp_int w = (u * cpp_int { powm(v, f.inverse_exp, f.p) }) % f.p;
        return cpp_int { powm(w, f.legendre_exp, f.p) } == 1;
    }
}
