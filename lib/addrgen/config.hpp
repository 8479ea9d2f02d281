/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_CONFIG_HPP
#define ADDRGEN_CONFIG_HPP

#include <map>
#include <optional>
#include <string>
#include <addrgen/json.hpp>

namespace addrgen {
    struct config_error: error {
        using error::error;
    };

    extern void consider_bin_dir(std::string_view bin_path);
    extern std::string install_path(std::string_view rel_path);

    // A JSON object with the name of its origin for error messages
    struct config {
        static config from_file(const std::string &path);

        explicit config(json::object root, std::string source="<memory>");

        [[nodiscard]] const json::value &at(std::string_view name) const;

        [[nodiscard]] const std::string &source() const
        {
            return _source;
        }
    private:
        json::object _root;
        std::string _source;
    };

    // Every *.json file of a directory keyed by its name without the extension
    struct configs_dir {
        // The path used by get(); must be set before the first call to get() to take effect
        static void set_default_path(const std::optional<std::string> &path);
        static std::string default_path();
        static const configs_dir &get();

        explicit configs_dir(const std::string &dir);

        [[nodiscard]] const config &at(const std::string &name) const;
    private:
        std::string _dir;
        std::map<std::string, config> _configs {};
    };
}

#endif // !ADDRGEN_CONFIG_HPP
