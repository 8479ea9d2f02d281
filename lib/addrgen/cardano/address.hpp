/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_CARDANO_ADDRESS_HPP
#define ADDRGEN_CARDANO_ADDRESS_HPP

#include <string>
#include <string_view>
#include <addrgen/array.hpp>
#include <addrgen/common/bytes.hpp>

namespace addrgen::cardano {
    struct cardano_error: error {
        using error::error;
    };

    // Payment credentials are Blake2b-224 hashes of a verification key or of a script
    static constexpr size_t credential_hash_size = 28;
    using credential_hash = byte_array<credential_hash_size>;
    using key_hash = credential_hash;
    using script_hash = credential_hash;

    enum class network: uint8_t {
        testnet = 0,
        mainnet = 1
    };

    enum class credential_type: uint8_t {
        key = 0,
        script = 1
    };

    // Strict: accepts only mainnet and testnet
    extern network network_parse(std::string_view name);
    // Lenient: anything but mainnet is treated as testnet
    extern network network_from_name(std::string_view name);
    extern credential_type credential_parse(std::string_view name);

    extern std::string_view network_name(network net);
    extern std::string_view address_prefix(network net);

    // The high nibble holds the address type, the low one the network id.
    // Enterprise addresses have a payment credential and no stake part: 0b0110 for keys and 0b0111 for scripts.
    inline uint8_t enterprise_header(const network net, const credential_type cred)
    {
        const uint8_t type = cred == credential_type::script ? 0b0111 : 0b0110;
        return static_cast<uint8_t>(type << 4) | static_cast<uint8_t>(net);
    }

    extern uint8_vector enterprise_address_bytes(network net, credential_type cred, buffer hash);
    extern std::string enterprise_address(network net, credential_type cred, buffer hash);

    inline std::string script_address(const script_hash &hash, const network net)
    {
        return enterprise_address(net, credential_type::script, hash);
    }

    inline std::string key_address(const key_hash &hash, const network net)
    {
        return enterprise_address(net, credential_type::key, hash);
    }

    // Both accept an optional leading 0x and either letter case
    extern uint8_vector hash_from_hex(std::string_view hex);
    extern credential_hash credential_hash_from_hex(std::string_view hex);

    extern std::string script_hash_to_address(std::string_view hash_hex, std::string_view net_name);
}

namespace fmt {
    template<>
    struct formatter<addrgen::cardano::network>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const addrgen::cardano::network &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::string_view>::format(addrgen::cardano::network_name(v), ctx);
        }
    };
}

#endif // !ADDRGEN_CARDANO_ADDRESS_HPP
