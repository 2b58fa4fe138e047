/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdio>
#include <system_error>
#include "file.hpp"

namespace gstate::file {
    std::string install_path(const std::string_view rel_path)
    {
        // relative to the current working directory
        return fmt::format("./{}", rel_path);
    }

    uint8_vector read(const std::string &path)
    {
        std::FILE *f = std::fopen(path.c_str(), "rb");
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open a file for reading: {}", path));
        std::error_code ec {};
        const auto sz = std::filesystem::file_size(path, ec);
        if (ec) [[unlikely]] {
            std::fclose(f);
            throw error(fmt::format("failed to get the size of {}: {}", path, ec.message()));
        }
        uint8_vector buf(static_cast<size_t>(sz));
        if (!buf.empty() && std::fread(buf.data(), 1, buf.size(), f) != buf.size()) [[unlikely]] {
            std::fclose(f);
            throw error_sys(fmt::format("failed to read {} bytes from {}", buf.size(), path));
        }
        std::fclose(f);
        return buf;
    }

    void write(const std::string &path, const buffer data)
    {
        std::FILE *f = std::fopen(path.c_str(), "wb");
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open a file for writing: {}", path));
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f) != data.size()) [[unlikely]] {
            std::fclose(f);
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
        }
        if (std::fclose(f) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to close {}", path));
    }

    tmp_directory::tmp_directory(const std::string_view name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
        std::filesystem::remove_all(_path);
        std::filesystem::create_directories(_path);
    }

    tmp_directory::~tmp_directory()
    {
        std::error_code ec {};
        std::filesystem::remove_all(_path, ec);
    }

    tmp::tmp(const std::string_view name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
    }
}
