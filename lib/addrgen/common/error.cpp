/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <cstring>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"

namespace addrgen {
    base_error::base_error(std::string msg):
        _msg { std::move(msg) }
    {
        // the first frames are safe_dump_to and the constructors of this class and of error
        boost::stacktrace::safe_dump_to(3, _frames.data(), _frames.size());
    }

    std::string base_error::stacktrace() const
    {
        return boost::stacktrace::to_string(boost::stacktrace::stacktrace::from_dump(_frames.data(), _frames.size()));
    }

    error::error(std::string msg):
        base_error { std::move(msg) }
    {
    }

    error::error(const std::string_view msg, const std::exception &cause):
        error { fmt::format("{}: {}", msg, cause.what()) }
    {
    }

    static std::string with_errno(const std::string_view msg)
    {
        const int err = errno;
        return fmt::format("{}: {} (errno {})", msg, std::strerror(err), err);
    }

    error_sys::error_sys(const std::string_view msg):
        error { with_errno(msg) }
    {
    }
}
