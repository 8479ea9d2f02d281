/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_COMMON_TEST_HPP
#define ADDRGEN_COMMON_TEST_HPP

#include <iostream>
#include <optional>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "format.hpp"

namespace addrgen {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer &operator<<(T &&t)
        {
            std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer &operator<<(const std::string_view sv)
        {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename X, typename Y>
    bool test_same(const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<X>(y);
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename X, typename Y>
    bool test_same(const std::string_view name, const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<X>(y);
        expect(res, loc) << fmt::format("{}: {} != {}", name, x, y);
        return res;
    }

    // Expects f to throw E with a message starting with prefix
    template<typename E=error, typename F>
    void expect_throws_msg(const F &f, const std::string_view prefix, const std::source_location &loc=std::source_location::current())
    {
        std::optional<std::string> msg {};
        try {
            f();
        } catch (const E &ex) {
            msg = ex.what();
        }
        expect(static_cast<bool>(msg), loc) << "no exception has been thrown";
        if (msg)
            expect(msg->starts_with(prefix), loc) << fmt::format("'{}' does not start with '{}'", *msg, prefix);
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<addrgen::test_printer>> {};

#endif // !ADDRGEN_COMMON_TEST_HPP
