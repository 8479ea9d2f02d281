/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <addrgen/bech32.hpp>
#include <addrgen/cardano/address.hpp>

namespace addrgen::cardano {
    network network_parse(const std::string_view name)
    {
        if (name == "mainnet")
            return network::mainnet;
        if (name == "testnet")
            return network::testnet;
        throw cardano_error(fmt::format("unsupported network: '{}'", name));
    }

    network network_from_name(const std::string_view name)
    {
        return name == "mainnet" ? network::mainnet : network::testnet;
    }

    credential_type credential_parse(const std::string_view name)
    {
        if (name == "script")
            return credential_type::script;
        if (name == "key")
            return credential_type::key;
        throw cardano_error(fmt::format("unsupported credential type: '{}'", name));
    }

    std::string_view network_name(const network net)
    {
        switch (net) {
            case network::mainnet: return "mainnet";
            case network::testnet: return "testnet";
            default: throw cardano_error(fmt::format("unsupported network id: {}", static_cast<int>(net)));
        }
    }

    std::string_view address_prefix(const network net)
    {
        switch (net) {
            case network::mainnet: return "addr";
            case network::testnet: return "addr_test";
            default: throw cardano_error(fmt::format("unsupported network id: {}", static_cast<int>(net)));
        }
    }

    uint8_vector enterprise_address_bytes(const network net, const credential_type cred, const buffer hash)
    {
        uint8_vector bytes {};
        bytes.reserve(1 + hash.size());
        bytes << enterprise_header(net, cred) << hash;
        return bytes;
    }

    std::string enterprise_address(const network net, const credential_type cred, const buffer hash)
    {
        return bech32::encode_bytes(address_prefix(net), enterprise_address_bytes(net, cred, hash));
    }

    uint8_vector hash_from_hex(const std::string_view hex)
    {
        static constexpr std::string_view hex_prefix { "0x" };
        const auto data = hex.starts_with(hex_prefix) ? hex.substr(hex_prefix.size()) : hex;
        try {
            return uint8_vector::from_hex(data);
        } catch (const error &ex) {
            throw cardano_error(fmt::format("failed to decode a hash from hex '{}'", hex), ex);
        }
    }

    credential_hash credential_hash_from_hex(const std::string_view hex)
    {
        const auto bytes = hash_from_hex(hex);
        if (bytes.size() != credential_hash_size)
            throw cardano_error(fmt::format("a credential hash must have {} bytes but '{}' has {}", credential_hash_size, hex, bytes.size()));
        credential_hash hash {};
        std::copy(bytes.begin(), bytes.end(), hash.begin());
        return hash;
    }

    std::string script_hash_to_address(const std::string_view hash_hex, const std::string_view net_name)
    {
        return enterprise_address(network_from_name(net_name), credential_type::script, hash_from_hex(hash_hex));
    }
}
