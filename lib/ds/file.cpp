/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <filesystem>
#include <fstream>
#include <ds/file.hpp>

namespace delegation_scout::file {
    void read(const std::string &path, uint8_vector &buf)
    {
        std::ifstream is { path, std::ios::binary | std::ios::ate };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        const auto sz = is.tellg();
        if (sz < 0)
            throw error_sys(fmt::format("failed to determine the size of {}", path));
        buf.resize(static_cast<size_t>(sz));
        is.seekg(0);
        if (!buf.empty() && !is.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size())))
            throw error_sys(fmt::format("failed to read {} bytes from {}", buf.size(), path));
    }

    uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    void write(const std::string &path, const buffer &data)
    {
        if (const auto dir = std::filesystem::path { path }.parent_path(); !dir.empty())
            std::filesystem::create_directories(dir);
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("failed to open {} for writing", path));
        if (!os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size())))
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }
}
