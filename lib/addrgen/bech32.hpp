/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_BECH32_HPP
#define ADDRGEN_BECH32_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <addrgen/common/bytes.hpp>

namespace addrgen::bech32 {
    using namespace std::literals;

    struct bech32_error: error {
        using error::error;
    };

    static constexpr char separator = '1';
    static constexpr std::string_view charset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l"sv;
    static constexpr std::array<uint32_t, 5> generator { 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };
    static constexpr size_t checksum_size = 6;

    using symbol_list = std::vector<uint8_t>;
    using checksum = std::array<uint8_t, checksum_size>;

    // Repacks from_bits-wide values into to_bits-wide values, most-significant bit first.
    // Returns std::nullopt when an input value does not fit into from_bits or, with pad=false,
    // when the trailing bits cannot be dropped without losing information.
    extern std::optional<symbol_list> convert_bits(std::span<const uint8_t> data, unsigned from_bits, unsigned to_bits, bool pad);

    extern uint32_t polymod(std::span<const uint8_t> vals);
    extern symbol_list expand_prefix(std::string_view prefix);
    extern checksum create_checksum(std::string_view prefix, std::span<const uint8_t> data);

    // data must be a sequence of 5-bit symbols
    extern std::string encode(std::string_view prefix, std::span<const uint8_t> data);
    extern std::string encode_bytes(std::string_view prefix, buffer bytes);
}

#endif // !ADDRGEN_BECH32_HPP
