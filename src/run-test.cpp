/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <iostream>
#include <addrgen/common/test.hpp>
#include <addrgen/config.hpp>
#include <addrgen/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace addrgen;
    consider_bin_dir(argv[0]);
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    logger::info("run-test finished with {}", failed ? "failures" : "success");
    return failed ? 1 : 0;
}
