/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <addrgen/cardano/validators.hpp>

namespace addrgen::cardano {
    static std::string string_field(const json::object &item, const std::string_view name, const size_t idx)
    {
        const auto *val = item.if_contains(name);
        if (!val || !val->is_string())
            throw config_error(fmt::format("validator #{} must have a string field '{}'", idx, name));
        return std::string { static_cast<std::string_view>(val->as_string()) };
    }

    validator_list validator_list::from_json(const json::array &items)
    {
        validator_list res {};
        res.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            if (!items[i].is_object())
                throw config_error(fmt::format("validator #{} must be a JSON object", i));
            const auto &item = items[i].as_object();
            auto &v = res.emplace_back();
            v.name = string_field(item, "name", i);
            v.title = string_field(item, "title", i);
            v.hash_hex = string_field(item, "hash", i);
            v.env = string_field(item, "env", i);
            v.hash = credential_hash_from_hex(v.hash_hex);
        }
        return res;
    }

    validator_list validator_list::from_config(const config &cfg)
    {
        const auto &items = cfg.at("validators");
        if (!items.is_array())
            throw config_error(fmt::format("{}: the validators element must be a JSON array", cfg.source()));
        return from_json(items.as_array());
    }

    std::string validator_report(const validator_list &validators, const network env_network)
    {
        std::string res {};
        auto out_it = std::back_inserter(res);
        for (const auto &v: validators) {
            out_it = fmt::format_to(out_it, "=== {} ===\n", v.title);
            out_it = fmt::format_to(out_it, "Hash: {}\n", v.hash_hex);
            out_it = fmt::format_to(out_it, "Testnet Address: {}\n", v.address(network::testnet));
            out_it = fmt::format_to(out_it, "Mainnet Address: {}\n", v.address(network::mainnet));
            out_it = fmt::format_to(out_it, "\n");
        }
        out_it = fmt::format_to(out_it, "=== For .env file ===\n");
        for (const auto &v: validators)
            out_it = fmt::format_to(out_it, "{}={}\n", v.env, v.address(env_network));
        return res;
    }
}
