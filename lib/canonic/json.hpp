/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_JSON_HPP
#define CANONIC_JSON_HPP

#include <boost/json.hpp>
#include <canonic/file.hpp>

namespace canonic::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(static_cast<std::string_view>(buf), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }
}

#endif // !CANONIC_JSON_HPP
