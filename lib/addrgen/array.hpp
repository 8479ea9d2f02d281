/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_ARRAY_HPP
#define ADDRGEN_ARRAY_HPP

#include <array>
#include <addrgen/common/bytes.hpp>

namespace addrgen {
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data {};
            init_from_hex(data, hex);
            return data;
        }

        operator buffer() const noexcept
        {
            return { this->data(), SZ };
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<addrgen::byte_array<SZ>>: addrgen::hex_formatter {
        template<typename FormatContext>
        auto format(const addrgen::byte_array<SZ> &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return hex_formatter::format(static_cast<addrgen::buffer>(v), ctx);
        }
    };
}

#endif // !ADDRGEN_ARRAY_HPP
