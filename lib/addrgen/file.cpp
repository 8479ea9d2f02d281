/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <array>
#include <fstream>
#include <addrgen/file.hpp>

namespace addrgen::file {
    uint8_vector read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        uint8_vector data {};
        std::array<char, 0x1000> chunk {};
        while (is.read(chunk.data(), chunk.size()) || is.gcount() > 0)
            data << buffer { reinterpret_cast<const uint8_t *>(chunk.data()), static_cast<size_t>(is.gcount()) };
        if (is.bad())
            throw error_sys(fmt::format("failed to read {}", path));
        return data;
    }

    path_list files_with_ext(const std::string &dir, const std::string_view ext)
    {
        path_list paths {};
        for (const auto &entry: std::filesystem::directory_iterator { dir }) {
            if (entry.is_regular_file() && entry.path().extension().string() == ext)
                paths.emplace_back(entry.path());
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }
}
