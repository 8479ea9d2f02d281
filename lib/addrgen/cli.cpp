/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <cstdio>
#include <addrgen/cli.hpp>

namespace addrgen::cli {
    std::string config::usage() const
    {
        std::string res { name };
        for (const auto &a: args)
            res += fmt::format(" {}", a);
        if (!opts.empty())
            res += " [--option=value ...]";
        res += fmt::format(" - {}", desc);
        for (const auto &[opt_name, opt]: opts) {
            res += fmt::format("\n    --{} - {}", opt_name, opt.desc);
            if (!opt.choices.empty()) {
                res += ", one of:";
                for (const auto &c: opt.choices)
                    res += fmt::format(" {}", c);
            }
            if (opt.default_value)
                res += fmt::format(" ({} by default)", *opt.default_value);
        }
        return res;
    }

    parse_result parse(const config &cfg, const arguments &args)
    {
        parse_result res {};
        for (const auto &arg: args) {
            if (!arg.starts_with("--")) {
                res.args.emplace_back(arg);
                continue;
            }
            const auto eq_pos = arg.find('=');
            if (eq_pos == arg.npos)
                throw error(fmt::format("option {} requires a value: {}=<value>", arg, arg));
            const auto name = arg.substr(2, eq_pos - 2);
            const auto opt_it = cfg.opts.find(name);
            if (opt_it == cfg.opts.end())
                throw error(fmt::format("unknown option --{}", name));
            const auto value = arg.substr(eq_pos + 1);
            const auto &choices = opt_it->second.choices;
            if (!choices.empty() && std::find(choices.begin(), choices.end(), value) == choices.end())
                throw error(fmt::format("unsupported value '{}' of --{}", value, name));
            if (!res.opts.try_emplace(name, value).second)
                throw error(fmt::format("option --{} is given more than once", name));
        }
        for (const auto &[name, opt]: cfg.opts) {
            if (opt.default_value)
                res.opts.try_emplace(name, *opt.default_value);
        }
        if (res.args.size() != cfg.args.size())
            throw error(fmt::format("expected {} argument(s) but got {}; usage: {}", cfg.args.size(), res.args.size(), cfg.usage()));
        return res;
    }

    static command::command_list &mutable_registry()
    {
        static command::command_list commands {};
        return commands;
    }

    const command::command_list &command::registry()
    {
        return mutable_registry();
    }

    std::shared_ptr<command> command::reg(std::shared_ptr<command> &&cmd)
    {
        return mutable_registry().emplace_back(std::move(cmd));
    }

    int run(const int argc, const char **argv, const command::command_list &commands, std::ostream &out)
    {
        std::map<std::string, std::pair<const command *, config>> known {};
        for (const auto &cmd: commands) {
            config cfg {};
            cmd->configure(cfg);
            cfg.opts.try_emplace("config-dir", "a directory with addrgen configuration files");
            const auto name = cfg.name;
            if (!known.try_emplace(name, cmd.get(), std::move(cfg)).second) [[unlikely]]
                throw error(fmt::format("multiple definitions of command {}", name));
        }
        if (argc < 2) {
            fmt::print(stderr, "usage: addrgen <command> [<arg> ...], where <command> is one of:\n");
            for (const auto &[name, entry]: known)
                fmt::print(stderr, "  {}\n", entry.second.usage());
            return 1;
        }

        const std::string name { argv[1] };
        const auto it = known.find(name);
        if (it == known.end()) {
            logger::error("unknown command {}", name);
            return 1;
        }
        try {
            const auto &[cmd, cfg] = it->second;
            const auto in = parse(cfg, arguments(argv + 2, argv + argc));
            if (const auto dir_it = in.opts.find("config-dir"); dir_it != in.opts.end())
                configs_dir::set_default_path(dir_it->second);
            logger::debug("running {} with {} argument(s)", name, in.args.size());
            cmd->run(in, out);
        } catch (const base_error &ex) {
            logger::error("{}: {}", name, ex.what());
            logger::debug("{} failed at:\n{}", name, ex.stacktrace());
            return 1;
        } catch (const std::exception &ex) {
            logger::error("{}: {}", name, ex.what());
            return 1;
        }
        return 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
