/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_COMMON_ERROR_HPP
#define ADDRGEN_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <exception>
#include <string>
#include <string_view>

namespace addrgen {
    // Records the call stack where it was thrown; rendering it is left to the top-level handler
    struct base_error: std::exception {
        explicit base_error(std::string msg);

        const char *what() const noexcept override
        {
            return _msg.c_str();
        }

        std::string stacktrace() const;
    private:
        static constexpr size_t max_frames = 32;

        std::string _msg;
        std::array<std::byte, sizeof(void *) * max_frames> _frames {};
    };

    struct error: base_error {
        explicit error(std::string msg);
        // the message of the cause follows after a colon
        error(std::string_view msg, const std::exception &cause);
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !ADDRGEN_COMMON_ERROR_HPP
