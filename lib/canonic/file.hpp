/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_FILE_HPP
#define CANONIC_FILE_HPP

#include <string>
#include <canonic/common/bytes.hpp>

namespace canonic::file {
    extern void read(const std::string &path, uint8_vector &buf);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    extern void write(const std::string &path, buffer data);
}

#endif // !CANONIC_FILE_HPP
