/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_CLI_HPP
#define ADDRGEN_CLI_HPP

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <addrgen/config.hpp>
#include <addrgen/logger.hpp>

namespace addrgen::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::string>;

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};
        // when not empty, the only accepted values
        std::vector<std::string> choices {};
    };

    struct config {
        std::string name {};
        std::string desc {};
        // names of the required positional arguments
        std::vector<std::string> args {};
        std::map<std::string, option_config> opts {};

        std::string usage() const;
    };

    struct parse_result {
        arguments args {};
        options opts {};
    };

    // Options have the form --name=value; defaults are filled in for the options not given
    extern parse_result parse(const config &cfg, const arguments &args);

    struct command {
        using command_list = std::vector<std::shared_ptr<command>>;

        static const command_list &registry();
        static std::shared_ptr<command> reg(std::shared_ptr<command> &&cmd);

        virtual ~command() =default;
        virtual void configure(config &cfg) const =0;
        virtual void run(const parse_result &in, std::ostream &out) const =0;
    };

    // Returns the process exit code: 0 on success and 1 on any failure
    extern int run(int argc, const char **argv, const command::command_list &commands, std::ostream &out=std::cout);
    extern int run(int argc, const char **argv);
}

#endif // !ADDRGEN_CLI_HPP
