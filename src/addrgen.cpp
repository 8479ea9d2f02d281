/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <addrgen/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace addrgen;
    consider_bin_dir(argv[0]);
    return cli::run(argc, argv);
}
