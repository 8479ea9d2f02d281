/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <filesystem>
#include <addrgen/config.hpp>
#include <addrgen/file.hpp>

namespace addrgen {
    static bool has_validators(const std::filesystem::path &dir)
    {
        return std::getenv("ADDRGEN_ETC") || std::filesystem::exists(dir / "etc" / "validators.json");
    }

    static std::optional<std::filesystem::path> &install_dir_override()
    {
        static std::optional<std::filesystem::path> dir {};
        return dir;
    }

    // The binary lives in bin/ of an installation or in build/ of a source checkout,
    // so the parent of its directory is the install directory when it carries the configuration.
    void consider_bin_dir(const std::string_view bin_path)
    {
        const auto dir = std::filesystem::weakly_canonical(std::filesystem::absolute(bin_path)).parent_path().parent_path();
        if (has_validators(dir))
            install_dir_override() = dir;
    }

    std::string install_path(const std::string_view rel_path)
    {
        std::filesystem::path path { rel_path };
        if (path.is_relative())
            path = install_dir_override().value_or(std::filesystem::current_path()) / path;
        return std::filesystem::weakly_canonical(std::filesystem::absolute(path)).string();
    }

    config config::from_file(const std::string &path)
    {
        const auto raw = file::read(path);
        json::value parsed {};
        try {
            parsed = json::parse(raw);
        } catch (const std::exception &ex) {
            throw config_error(fmt::format("{} is not valid JSON", path), ex);
        }
        if (!parsed.is_object())
            throw config_error(fmt::format("{} must contain a JSON object", path));
        return config { std::move(parsed.as_object()), path };
    }

    config::config(json::object root, std::string source):
        _root { std::move(root) }, _source { std::move(source) }
    {
    }

    const json::value &config::at(const std::string_view name) const
    {
        const auto *val = _root.if_contains(name);
        if (!val)
            throw config_error(fmt::format("{} has no element '{}'", _source, name));
        return *val;
    }

    static std::optional<std::string> &default_path_override()
    {
        static std::optional<std::string> path {};
        return path;
    }

    void configs_dir::set_default_path(const std::optional<std::string> &path)
    {
        default_path_override() = path;
    }

    std::string configs_dir::default_path()
    {
        if (const auto &path = default_path_override(); path)
            return *path;
        if (const char *env_path = std::getenv("ADDRGEN_ETC"); env_path)
            return env_path;
        return install_path("etc");
    }

    const configs_dir &configs_dir::get()
    {
        static const configs_dir dir { default_path() };
        return dir;
    }

    configs_dir::configs_dir(const std::string &dir):
        _dir { dir }
    {
        if (!std::filesystem::is_directory(dir))
            throw config_error(fmt::format("configuration directory {} does not exist", dir));
        for (const auto &path: file::files_with_ext(dir, ".json"))
            _configs.emplace(path.stem().string(), config::from_file(path.string()));
    }

    const config &configs_dir::at(const std::string &name) const
    {
        const auto it = _configs.find(name);
        if (it == _configs.end())
            throw config_error(fmt::format("configuration directory {} has no {}.json", _dir, name));
        return it->second;
    }
}
