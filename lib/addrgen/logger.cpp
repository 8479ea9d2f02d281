/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <addrgen/config.hpp>
#include <addrgen/logger.hpp>

namespace addrgen::logger {
    static spdlog::level::level_enum spdlog_level(const level lev)
    {
        switch (lev) {
            case level::trace: return spdlog::level::trace;
            case level::debug: return spdlog::level::debug;
            case level::info: return spdlog::level::info;
            case level::warn: return spdlog::level::warn;
            case level::error: return spdlog::level::err;
            default: throw addrgen::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }

    std::shared_ptr<spdlog::logger> create(const std::string &path, const bool console)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (console) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        try {
            if (const auto dir = std::filesystem::path { path }.parent_path(); !dir.empty())
                std::filesystem::create_directories(dir);
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
        } catch (const std::exception &ex) {
            fmt::print(stderr, "addrgen: the log file {} is not writable, logging to the console only: {}\n", path, ex.what());
        }
        auto log = std::make_shared<spdlog::logger>("addrgen", sinks.begin(), sinks.end());
        log->set_level(std::getenv("ADDRGEN_DEBUG") ? spdlog::level::trace : spdlog::level::debug);
        log->flush_on(spdlog::level::debug);
        return log;
    }

    static spdlog::logger &get()
    {
        static const auto log = [] {
            const char *env_path = std::getenv("ADDRGEN_LOG");
            const auto path = install_path(env_path ? env_path : "log/addrgen.log");
            auto l = create(path, std::getenv("ADDRGEN_LOG_NO_CONSOLE") == nullptr);
            l->debug("log path: {}", path);
            return l;
        }();
        return *log;
    }

    bool enabled(const level lev)
    {
        return get().should_log(spdlog_level(lev));
    }

    void write(const level lev, const std::string_view msg)
    {
        get().log(spdlog_level(lev), spdlog::string_view_t { msg.data(), msg.size() });
    }
}
