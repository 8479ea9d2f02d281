/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <addrgen/cardano/validators.hpp>
#include <addrgen/cli.hpp>

namespace addrgen::cli::validator_addresses {
    using namespace cardano;

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "validator-addresses";
            cmd.desc = "print the testnet and mainnet addresses of the configured validators and the matching .env lines";
            cmd.opts.try_emplace("env-network", "the network of the addresses in the .env lines", "testnet", std::vector<std::string> { "mainnet", "testnet" });
        }

        void run(const parse_result &in, std::ostream &out) const override
        {
            const auto &cfg = configs_dir::get().at("validators");
            const auto validators = validator_list::from_config(cfg);
            const auto env_net = network_parse(in.opts.at("env-network"));
            logger::debug("loaded {} validators from {}, .env lines use {}", validators.size(), cfg.source(), env_net);
            out << validator_report(validators, env_net);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
