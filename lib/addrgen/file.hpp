/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_FILE_HPP
#define ADDRGEN_FILE_HPP

#include <filesystem>
#include <string>
#include <vector>
#include <addrgen/common/bytes.hpp>

namespace addrgen::file {
    using path_list = std::vector<std::filesystem::path>;

    extern uint8_vector read(const std::string &path);
    // Regular files of dir with the given extension, sorted by name
    extern path_list files_with_ext(const std::string &dir, std::string_view ext);
}

#endif // !ADDRGEN_FILE_HPP
