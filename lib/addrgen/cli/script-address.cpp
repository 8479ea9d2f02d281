/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <addrgen/cardano/address.hpp>
#include <addrgen/cli.hpp>

namespace addrgen::cli::script_address {
    using namespace cardano;

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "script-address";
            cmd.desc = "print the Bech32 enterprise address of a script or key hash";
            cmd.args = { "<hash-hex>" };
            cmd.opts.try_emplace("network", "the target network", "testnet", std::vector<std::string> { "mainnet", "testnet" });
            cmd.opts.try_emplace("credential", "the credential type of the hash", "script", std::vector<std::string> { "script", "key" });
        }

        void run(const parse_result &in, std::ostream &out) const override
        {
            const auto net = network_parse(in.opts.at("network"));
            const auto cred = credential_parse(in.opts.at("credential"));
            const auto hash = credential_hash_from_hex(in.args.at(0));
            const auto addr = cred == credential_type::script ? cardano::script_address(hash, net) : key_address(hash, net);
            logger::debug("{} hash {:x} on {} maps to {}", in.opts.at("credential"), hash, net, addr);
            out << addr << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
