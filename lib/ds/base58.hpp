/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_BASE58_HPP
#define DELEGATION_SCOUT_BASE58_HPP

#include <array>
#include <string>
#include <ds/common/bytes.hpp>

// The Bitcoin alphabet without a checksum: the encoding of Solana keys and signatures
namespace delegation_scout::base58 {
    static constexpr std::string_view alphabet { "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz" };

    inline std::string encode(const buffer &in)
    {
        size_t leading_zeros = 0;
        while (leading_zeros < in.size() && in[leading_zeros] == 0)
            ++leading_zeros;
        // little-endian base-58 digits of the remaining big-endian number
        std::vector<uint8_t> digits {};
        digits.reserve(in.size() * 138 / 100 + 1);
        for (size_t i = leading_zeros; i < in.size(); ++i) {
            uint32_t carry = in[i];
            for (auto &d: digits) {
                carry += static_cast<uint32_t>(d) << 8;
                d = carry % 58;
                carry /= 58;
            }
            while (carry) {
                digits.push_back(carry % 58);
                carry /= 58;
            }
        }
        std::string out(leading_zeros, alphabet[0]);
        out.reserve(leading_zeros + digits.size());
        for (auto it = digits.rbegin(); it != digits.rend(); ++it)
            out.push_back(alphabet[*it]);
        return out;
    }

    inline uint8_vector decode(const std::string_view in)
    {
        static const std::array<int8_t, 128> codes = [] {
            std::array<int8_t, 128> c {};
            c.fill(-1);
            for (size_t i = 0; i < alphabet.size(); ++i)
                c[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
            return c;
        }();
        size_t leading_ones = 0;
        while (leading_ones < in.size() && in[leading_ones] == alphabet[0])
            ++leading_ones;
        // little-endian base-256 bytes of the remaining big-endian number
        std::vector<uint8_t> bytes {};
        bytes.reserve(in.size() * 733 / 1000 + 1);
        for (size_t pos = leading_ones; pos < in.size(); ++pos) {
            const auto k = static_cast<uint8_t>(in[pos]);
            if (k >= codes.size() || codes[k] < 0)
                throw error(fmt::format("unsupported base58 character: '0x{:02x}' at pos {} in {}!", k, pos, in));
            uint32_t carry = static_cast<uint32_t>(codes[k]);
            for (auto &b: bytes) {
                carry += static_cast<uint32_t>(b) * 58;
                b = carry & 0xFF;
                carry >>= 8;
            }
            while (carry) {
                bytes.push_back(carry & 0xFF);
                carry >>= 8;
            }
        }
        uint8_vector out(leading_ones, 0);
        out.insert(out.end(), bytes.rbegin(), bytes.rend());
        return out;
    }
}

#endif // !DELEGATION_SCOUT_BASE58_HPP
