/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_COMMON_FORMAT_HPP
#define ADDRGEN_COMMON_FORMAT_HPP

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#       pragma GCC diagnostic ignored "-Wstringop-overflow"
#   endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

namespace addrgen {
    // Byte sequences print as hex: uppercase with "{}" and lowercase with "{:x}"
    struct hex_formatter {
        bool lower = false;

        constexpr auto parse(fmt::format_parse_context &ctx) -> decltype(ctx.begin())
        {
            auto it = ctx.begin();
            if (it != ctx.end() && *it == 'x') {
                lower = true;
                ++it;
            }
            if (it != ctx.end() && *it != '}')
                throw fmt::format_error("byte sequences support only the 'x' format specifier");
            return it;
        }

        template<typename FormatContext>
        auto format(const std::span<const uint8_t> bytes, FormatContext &ctx) const -> decltype(ctx.out())
        {
            auto out_it = ctx.out();
            for (const auto b: bytes)
                out_it = lower ? fmt::format_to(out_it, "{:02x}", b) : fmt::format_to(out_it, "{:02X}", b);
            return out_it;
        }
    };
}

namespace fmt {
    template<>
    struct formatter<std::span<const uint8_t>>: addrgen::hex_formatter {
    };

    template<>
    struct formatter<std::vector<uint8_t>>: addrgen::hex_formatter {
    };

    template<size_t SZ>
    struct formatter<std::array<uint8_t, SZ>>: addrgen::hex_formatter {
    };
}

#endif // !ADDRGEN_COMMON_FORMAT_HPP
