/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <fstream>
#include <canonic/file.hpp>

namespace canonic::file {
    void read(const std::string &path, uint8_vector &buf)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open file {} for reading", path));
        const auto sz = std::filesystem::file_size(path);
        buf.resize(sz);
        if (sz > 0 && !is.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(sz)))
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
    }

    void write(const std::string &path, const buffer data)
    {
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("failed to open file {} for writing", path));
        if (!os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size())))
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }
}
