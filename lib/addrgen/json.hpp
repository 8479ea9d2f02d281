/* This file is part of Addrgen project.
 * Copyright (c) 2025 Addrgen contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ADDRGEN_JSON_HPP
#define ADDRGEN_JSON_HPP

#include <boost/json.hpp>
#include <addrgen/common/bytes.hpp>

namespace addrgen::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf.string_view(), sp);
    }
}

#endif // !ADDRGEN_JSON_HPP
