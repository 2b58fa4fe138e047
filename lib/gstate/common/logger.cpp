/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif

#include "error.hpp"
#include "file.hpp"
#include "logger.hpp"

namespace gstate::logger {
    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("GSTATE_DEBUG") != nullptr;
        return enabled;
    }

    std::string log_path()
    {
        const char *env_log_path = std::getenv("GSTATE_LOG");
        return file::install_path(env_log_path ? env_log_path : "log/gstate.log");
    }

    static spdlog::logger create(const std::string &path)
    {
        if (const auto parent = std::filesystem::path { path }.parent_path(); !parent.empty())
            std::filesystem::create_directories(parent);
        if (std::ofstream os { path, std::ios_base::app }; !os) [[unlikely]]
            throw error_sys(fmt::format("logger: the log file {} is not writable", path));

        std::vector<spdlog::sink_ptr> sinks {};
        auto &file_sink = sinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path));
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
        if (!std::getenv("GSTATE_LOG_NO_CONSOLE")) {
            auto &console_sink = sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
        }
        spdlog::logger logger { "gstate", sinks.begin(), sinks.end() };
        logger.set_level(tracing_enabled() ? spdlog::level::trace : spdlog::level::debug);
        logger.flush_on(spdlog::level::debug);
        logger.log(spdlog::level::debug, fmt::format("logging to {}", path));
        return logger;
    }

    spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }
}
