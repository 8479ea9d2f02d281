/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_COMMON_BYTES_HPP
#define ADDRGEN_COMMON_BYTES_HPP

#include <cstring>
#include <span>
#include <string_view>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace addrgen {
    struct buffer: std::span<const uint8_t> {
        buffer() =default;

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        std::string_view string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }
    };

    inline uint8_t uint_from_hex(const char k)
    {
        if (k >= '0' && k <= '9')
            return static_cast<uint8_t>(k - '0');
        if (k >= 'a' && k <= 'f')
            return static_cast<uint8_t>(k - 'a' + 10);
        if (k >= 'A' && k <= 'F')
            return static_cast<uint8_t>(k - 'A' + 10);
        throw error(fmt::format("unexpected character in a hex number: {}!", k));
    }

    inline void init_from_hex(std::span<uint8_t> out, const std::string_view hex)
    {
        if (hex.size() != out.size() * 2)
            throw error(fmt::format("hex string must have {} characters but got {}: {}!", out.size() * 2, hex.size(), hex));
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = static_cast<uint8_t>(uint_from_hex(hex[i * 2]) << 4 | uint_from_hex(hex[i * 2 + 1]));
    }

    struct uint8_vector: std::vector<uint8_t> {
        static uint8_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0)
                throw error(fmt::format("hex string must have an even number of characters but got {}!", hex.size()));
            uint8_vector data(hex.size() / 2);
            init_from_hex(data, hex);
            return data;
        }

        uint8_vector() =default;

        explicit uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        explicit uint8_vector(const buffer bytes):
            std::vector<uint8_t> { bytes.begin(), bytes.end() }
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }
    };

    inline uint8_vector &operator<<(uint8_vector &v, const uint8_t b)
    {
        v.push_back(b);
        return v;
    }

    inline uint8_vector &operator<<(uint8_vector &v, const buffer bytes)
    {
        v.insert(v.end(), bytes.begin(), bytes.end());
        return v;
    }
}

namespace fmt {
    template<>
    struct formatter<addrgen::buffer>: addrgen::hex_formatter {
    };

    template<>
    struct formatter<addrgen::uint8_vector>: addrgen::hex_formatter {
        template<typename FormatContext>
        auto format(const addrgen::uint8_vector &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return hex_formatter::format(static_cast<addrgen::buffer>(v), ctx);
        }
    };
}

#endif // !ADDRGEN_COMMON_BYTES_HPP
