/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <addrgen/bech32.hpp>

namespace addrgen::bech32 {
    std::optional<symbol_list> convert_bits(const std::span<const uint8_t> data, const unsigned from_bits, const unsigned to_bits, const bool pad)
    {
        if (from_bits == 0 || from_bits > 8 || to_bits == 0 || to_bits > 8) [[unlikely]]
            throw error(fmt::format("unsupported bit widths for conversion: {} -> {}", from_bits, to_bits));
        const uint32_t max_v = (1U << to_bits) - 1;
        const uint32_t max_acc = (1U << (from_bits + to_bits - 1)) - 1;
        uint32_t acc = 0;
        unsigned bits = 0;
        symbol_list res {};
        res.reserve((data.size() * from_bits + to_bits - 1) / to_bits);
        for (const auto v: data) {
            if (v >> from_bits)
                return {};
            acc = ((acc << from_bits) | v) & max_acc;
            bits += from_bits;
            while (bits >= to_bits) {
                bits -= to_bits;
                res.push_back((acc >> bits) & max_v);
            }
        }
        if (pad) {
            if (bits)
                res.push_back((acc << (to_bits - bits)) & max_v);
        } else if (bits >= from_bits || ((acc << (to_bits - bits)) & max_v)) {
            return {};
        }
        return res;
    }

    uint32_t polymod(const std::span<const uint8_t> vals)
    {
        uint32_t chk = 1;
        for (const auto v: vals) {
            const uint32_t b = chk >> 25;
            chk = (chk & 0x1ffffff) << 5 ^ v;
            for (size_t i = 0; i < generator.size(); ++i) {
                chk ^= (b >> i) & 1 ? generator[i] : 0;
            }
        }
        return chk;
    }

    symbol_list expand_prefix(const std::string_view prefix)
    {
        symbol_list x {};
        x.reserve(prefix.size() * 2 + 1);
        for (const auto k: prefix)
            x.push_back(static_cast<uint8_t>(k) >> 5);
        x.push_back(0);
        for (const auto k: prefix)
            x.push_back(static_cast<uint8_t>(k) & 31);
        return x;
    }

    checksum create_checksum(const std::string_view prefix, const std::span<const uint8_t> data)
    {
        auto vals = expand_prefix(prefix);
        vals.insert(vals.end(), data.begin(), data.end());
        vals.resize(vals.size() + checksum_size, 0);
        const uint32_t mod = polymod(vals) ^ 1;
        checksum res {};
        for (size_t i = 0; i < checksum_size; ++i)
            res[i] = (mod >> (5 * (5 - i))) & 31;
        return res;
    }

    std::string encode(const std::string_view prefix, const std::span<const uint8_t> data)
    {
        if (prefix.empty()) [[unlikely]]
            throw bech32_error("bech32 prefix must not be empty!");
        for (const auto k: prefix) {
            if (k < 33 || k > 126) [[unlikely]]
                throw bech32_error(fmt::format("bech32 prefix contains an unsupported character code: {}", static_cast<int>(k)));
        }
        for (size_t i = 0; i < data.size(); ++i) {
            if (data[i] >= charset.size()) [[unlikely]]
                throw bech32_error(fmt::format("bech32 data symbol #{} is out of the 5-bit range: {}", i, data[i]));
        }
        const auto chk = create_checksum(prefix, data);
        std::string res {};
        res.reserve(prefix.size() + 1 + data.size() + chk.size());
        res.append(prefix);
        res.push_back(separator);
        for (const auto v: data)
            res.push_back(charset[v]);
        for (const auto v: chk)
            res.push_back(charset[v]);
        return res;
    }

    std::string encode_bytes(const std::string_view prefix, const buffer bytes)
    {
        // 8-bit values always fit, and padding never rejects
        const auto symbols = convert_bits(bytes, 8, 5, true);
        if (!symbols) [[unlikely]]
            throw bech32_error(fmt::format("cannot convert {} bytes to 5-bit symbols", bytes.size()));
        return encode(prefix, *symbols);
    }
}
