/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <sstream>
#include <addrgen/common/test.hpp>
#include <addrgen/cli.hpp>

using namespace addrgen;
using namespace addrgen::cli;

namespace {
    struct echo_cmd: command {
        mutable std::optional<parse_result> last {};

        void configure(cli::config &cmd) const override
        {
            cmd.name = "echo";
            cmd.desc = "prints its arguments and remembers them";
            cmd.args = { "<first>", "<second>" };
            cmd.opts.try_emplace("mode", "how to echo", "fast", std::vector<std::string> { "fast", "slow" });
            cmd.opts.try_emplace("tag", "any text");
        }

        void run(const parse_result &in, std::ostream &out) const override
        {
            last.emplace(in);
            out << in.args.at(0) << ' ' << in.args.at(1) << ' ' << in.opts.at("mode") << '\n';
        }
    };

    struct run_result {
        int code = 0;
        std::string out {};
    };

    static run_result run_args(const command::command_list &cmds, const std::vector<std::string> &args)
    {
        std::vector<const char *> argv { "addrgen" };
        for (const auto &a: args)
            argv.emplace_back(a.c_str());
        std::ostringstream out {};
        const auto code = cli::run(static_cast<int>(argv.size()), argv.data(), cmds, out);
        return { code, out.str() };
    }

    static command::command_list registered(const std::string &name)
    {
        for (const auto &cmd: command::registry()) {
            cli::config cfg {};
            cmd->configure(cfg);
            if (cfg.name == name)
                return { cmd };
        }
        return {};
    }

    static constexpr std::string_view escrow_hash { "795b08f17216887d0fdd83dec60790a79fba0998ac9d76eb2c7ed80a" };
}

suite cli_suite = [] {
    "cli"_test = [] {
        "parse"_test = [] {
            cli::config cfg {};
            echo_cmd {}.configure(cfg);
            const auto pr = parse(cfg, { "a", "--mode=slow", "b", "--tag=x=y" });
            test_same(2, pr.args.size());
            test_same(std::string { "a" }, pr.args.at(0));
            test_same(std::string { "b" }, pr.args.at(1));
            test_same(std::string { "slow" }, pr.opts.at("mode"));
            test_same(std::string { "x=y" }, pr.opts.at("tag"));
            const auto defaults = parse(cfg, { "a", "b" });
            test_same(std::string { "fast" }, defaults.opts.at("mode"));
            expect(!defaults.opts.contains("tag"));
        };
        "parse errors"_test = [] {
            cli::config cfg {};
            echo_cmd {}.configure(cfg);
            expect_throws_msg([&] { parse(cfg, { "a" }); }, "expected 2 argument(s) but got 1; usage: echo <first> <second>");
            expect_throws_msg([&] { parse(cfg, { "a", "b", "c" }); }, "expected 2 argument(s) but got 3");
            expect_throws_msg([&] { parse(cfg, { "a", "b", "--mode=medium" }); }, "unsupported value 'medium' of --mode");
            expect_throws_msg([&] { parse(cfg, { "a", "b", "--speed=1" }); }, "unknown option --speed");
            expect_throws_msg([&] { parse(cfg, { "a", "b", "--tag" }); }, "option --tag requires a value");
            expect_throws_msg([&] { parse(cfg, { "a", "b", "--tag=1", "--tag=2" }); }, "option --tag is given more than once");
        };
        "run"_test = [] {
            const auto echo = std::make_shared<echo_cmd>();
            const command::command_list cmds { echo };
            const auto res = run_args(cmds, { "echo", "one", "two", "--mode=slow" });
            test_same(0, res.code);
            test_same(std::string { "one two slow\n" }, res.out);
            expect(static_cast<bool>(echo->last));
            if (echo->last) {
                test_same(2, echo->last->args.size());
                // options without a default stay absent
                expect(!echo->last->opts.contains("config-dir"));
                expect(!echo->last->opts.contains("tag"));
            }
        };
        "run errors"_test = [] {
            const command::command_list cmds { std::make_shared<echo_cmd>() };
            test_same(1, run_args(cmds, {}).code);
            test_same(1, run_args(cmds, { "unknown" }).code);
            const auto res = run_args(cmds, { "echo", "one" });
            test_same(1, res.code);
            test_same(std::string {}, res.out);
            const command::command_list dup { std::make_shared<echo_cmd>(), std::make_shared<echo_cmd>() };
            expect(throws<error>([&] { run_args(dup, { "echo", "1", "2" }); }));
        };
        "script-address"_test = [] {
            const auto cmds = registered("script-address");
            test_same(1, cmds.size());
            if (cmds.empty())
                return;
            const auto testnet = run_args(cmds, { "script-address", std::string { escrow_hash } });
            test_same(0, testnet.code);
            test_same(std::string { "addr_test1wpu4kz83wgtgslg0mkpaa3s8jznelwsfnzkf6aht93ldszsfh7ty7\n" }, testnet.out);
            const auto mainnet = run_args(cmds, { "script-address", fmt::format("0x{}", escrow_hash), "--network=mainnet" });
            test_same(0, mainnet.code);
            test_same(std::string { "addr1w9u4kz83wgtgslg0mkpaa3s8jznelwsfnzkf6aht93ldszsjl2htm\n" }, mainnet.out);
            const auto key = run_args(cmds, { "script-address", std::string { escrow_hash }, "--network=mainnet", "--credential=key" });
            test_same(0, key.code);
            test_same(std::string { "addr1v9u4kz83wgtgslg0mkpaa3s8jznelwsfnzkf6aht93ldszsmhkhum\n" }, key.out);
            const auto key_testnet = run_args(cmds, { "script-address", std::string { escrow_hash }, "--credential=key" });
            test_same(std::string { "addr_test1vpu4kz83wgtgslg0mkpaa3s8jznelwsfnzkf6aht93ldszsqlztn7\n" }, key_testnet.out);
            for (const auto &bad: std::vector<std::vector<std::string>> {
                { "script-address", std::string { escrow_hash.substr(1) } },
                { "script-address", std::string { escrow_hash.substr(2) } },
                { "script-address", std::string { escrow_hash }, "--network=preprod" },
                { "script-address", std::string { escrow_hash }, "--credential=stake" }
            }) {
                const auto res = run_args(cmds, bad);
                test_same(1, res.code);
                test_same(std::string {}, res.out);
            }
        };
        "validator-addresses"_test = [] {
            const auto cmds = registered("validator-addresses");
            test_same(1, cmds.size());
            if (cmds.empty())
                return;
            const std::string validators_part {
                "=== ESCROW VALIDATOR ===\n"
                "Hash: 795b08f17216887d0fdd83dec60790a79fba0998ac9d76eb2c7ed80a\n"
                "Testnet Address: addr_test1wpu4kz83wgtgslg0mkpaa3s8jznelwsfnzkf6aht93ldszsfh7ty7\n"
                "Mainnet Address: addr1w9u4kz83wgtgslg0mkpaa3s8jznelwsfnzkf6aht93ldszsjl2htm\n"
                "\n"
                "=== POOL VALIDATOR ===\n"
                "Hash: 734799794c30fc4fe3431c3ccf811d15b6fed58d397d2cf1cde33a43\n"
                "Testnet Address: addr_test1wpe50xtefsc0cnlrgvwrenupr52mdlk435uh6t83eh3n5scjt5vpz\n"
                "Mainnet Address: addr1w9e50xtefsc0cnlrgvwrenupr52mdlk435uh6t83eh3n5scfrqsw8\n"
                "\n"
                "=== For .env file ===\n"
            };
            const auto testnet = run_args(cmds, { "validator-addresses" });
            test_same(0, testnet.code);
            test_same(validators_part
                + "ESCROW_SCRIPT_ADDRESS=addr_test1wpu4kz83wgtgslg0mkpaa3s8jznelwsfnzkf6aht93ldszsfh7ty7\n"
                + "POOL_SCRIPT_ADDRESS=addr_test1wpe50xtefsc0cnlrgvwrenupr52mdlk435uh6t83eh3n5scjt5vpz\n", testnet.out);
            const auto mainnet = run_args(cmds, { "validator-addresses", "--env-network=mainnet" });
            test_same(0, mainnet.code);
            test_same(validators_part
                + "ESCROW_SCRIPT_ADDRESS=addr1w9u4kz83wgtgslg0mkpaa3s8jznelwsfnzkf6aht93ldszsjl2htm\n"
                + "POOL_SCRIPT_ADDRESS=addr1w9e50xtefsc0cnlrgvwrenupr52mdlk435uh6t83eh3n5scfrqsw8\n", mainnet.out);
            const auto extra = run_args(cmds, { "validator-addresses", "extra" });
            test_same(1, extra.code);
            test_same(std::string {}, extra.out);
        };
    };
};
