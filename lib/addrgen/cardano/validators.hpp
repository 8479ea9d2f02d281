/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_CARDANO_VALIDATORS_HPP
#define ADDRGEN_CARDANO_VALIDATORS_HPP

#include <string>
#include <vector>
#include <addrgen/cardano/address.hpp>
#include <addrgen/config.hpp>

namespace addrgen::cardano {
    struct validator_info {
        std::string name {};
        std::string title {};
        std::string hash_hex {};
        std::string env {};
        script_hash hash {};

        std::string address(const network net) const
        {
            return script_address(hash, net);
        }
    };

    struct validator_list: std::vector<validator_info> {
        // Expects a "validators" array of objects with name, title, hash and env string fields
        static validator_list from_config(const config &cfg);
        static validator_list from_json(const json::array &items);
    };

    extern std::string validator_report(const validator_list &validators, network env_network=network::testnet);
}

#endif // !ADDRGEN_CARDANO_VALIDATORS_HPP
