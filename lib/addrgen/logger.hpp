/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_LOGGER_HPP
#define ADDRGEN_LOGGER_HPP

#include <memory>
#include <string>
#include <string_view>
#include <addrgen/common/error.hpp>
#include <addrgen/common/format.hpp>

namespace spdlog {
    class logger;
}

namespace addrgen::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    // Console output goes to stderr at the info level and above, the file receives everything that passes the logger's level.
    // A log file that cannot be created is reported on stderr and the returned logger writes to the console only.
    extern std::shared_ptr<spdlog::logger> create(const std::string &path, bool console);

    extern bool enabled(level lev);
    extern void write(level lev, std::string_view msg);

    template<typename... Args>
    void log(const level lev, fmt::format_string<Args...> fmt, Args &&...a)
    {
        if (enabled(lev))
            write(lev, fmt::format(fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args &&...a)
    {
        log(level::error, fmt, std::forward<Args>(a)...);
    }
}

#endif // !ADDRGEN_LOGGER_HPP
