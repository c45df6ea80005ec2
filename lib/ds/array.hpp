/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef DELEGATION_SCOUT_ARRAY_HPP
#define DELEGATION_SCOUT_ARRAY_HPP

#include <algorithm>
#include <array>
#include <cstring>
#include <initializer_list>
#include <span>
#include <ds/common/error.hpp>
#include <ds/common/format.hpp>
#include <ds/common/bytes.hpp>

namespace delegation_scout {
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data;
            init_from_hex(data, hex);
            return data;
        }

        byte_array() =default;

        byte_array(const std::initializer_list<uint8_t> s) {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("span must be of size {} but got {}", SZ, s.size()));
            size_t i = 0;
            for (const auto b: s)
                *(base_type::data() + i++) = b;
        }

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), std::data(s), SZ);
        }

        byte_array &operator=(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), std::data(s), SZ);
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }

        explicit operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(base_type::data()), base_type::size() };
        }
    };

    inline void secure_clear(const std::span<uint8_t> store)
    {
        std::fill_n<volatile uint8_t *>(store.data(), store.size(), 0);
    }

    template<size_t SZ>
    struct secure_byte_array: byte_array<SZ>
    {
        using byte_array<SZ>::byte_array;

        static secure_byte_array<SZ> from_hex(const std::string_view &hex)
        {
            secure_byte_array<SZ> data;
            init_from_hex(data, hex);
            return data;
        }

        secure_byte_array() =default;
        secure_byte_array(const secure_byte_array<SZ> &) =default;
        secure_byte_array &operator=(const secure_byte_array<SZ> &) =default;

        ~secure_byte_array()
        {
            secure_clear(*this);
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<delegation_scout::byte_array<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", static_cast<delegation_scout::buffer>(v));
        }
    };

    template<size_t SZ>
    struct formatter<delegation_scout::secure_byte_array<SZ>>: formatter<delegation_scout::byte_array<SZ>> {
    };
}

#endif // !DELEGATION_SCOUT_ARRAY_HPP
