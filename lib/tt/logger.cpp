/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <tt/logger.hpp>
#include <tt/mutex.hpp>

namespace treasury_turbo::logger {
    static mutex::mutex_type last_error_mutex {};
    static std::shared_ptr<std::string> last_error_ptr {};

    std::shared_ptr<std::string> last_error()
    {
        mutex::scoped_lock lk { last_error_mutex };
        return last_error_ptr;
    }

    void reset_last_error()
    {
        mutex::scoped_lock lk { last_error_mutex };
        last_error_ptr.reset();
    }

    bool tracing_enabled()
    {
        static const bool enabled = std::getenv("TT_DEBUG") != nullptr;
        return enabled;
    }

    static spdlog::level::level_enum spdlog_level(const level lev)
    {
        switch (lev) {
            case level::trace: return spdlog::level::trace;
            case level::debug: return spdlog::level::debug;
            case level::info: return spdlog::level::info;
            case level::warn: return spdlog::level::warn;
            case level::error: return spdlog::level::err;
            default: throw treasury_turbo::error("unsupported logger::level: {}", static_cast<int>(lev));
        }
    }

    struct sinks {
        std::shared_ptr<spdlog::logger> logger {};
        std::optional<std::string> path {};
    };

    static std::optional<std::string> prepare_file(const std::string &path)
    {
        const std::filesystem::path fs_path { path };
        if (fs_path.has_parent_path()) {
            std::error_code ec {};
            std::filesystem::create_directories(fs_path.parent_path(), ec);
            if (ec) {
                std::cerr << fmt::format("TT_INIT: cannot create the log directory {}: {}\n", fs_path.parent_path().string(), ec.message());
                return {};
            }
        }
        return path;
    }

    static sinks create()
    {
        sinks res {};
        std::vector<spdlog::sink_ptr> outputs {};
        if (!std::getenv("TT_LOG_NO_CONSOLE")) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_level(spdlog::level::info);
            console->set_pattern("[%^%l%$] %v");
            outputs.emplace_back(std::move(console));
        }
        const char *env_path = std::getenv("TT_LOG");
        if (const auto path = prepare_file(env_path ? env_path : "./log/tt.log"); path) {
            try {
                auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*path);
                file->set_level(spdlog::level::trace);
                file->set_pattern("[%Y-%m-%d %T.%e %z] [%t] [%l] %v");
                outputs.emplace_back(std::move(file));
                res.path = path;
            } catch (const spdlog::spdlog_ex &ex) {
                std::cerr << fmt::format("TT_INIT: logging to the console only, the log file is unavailable: {}\n", ex.what());
            }
        }
        res.logger = std::make_shared<spdlog::logger>("tt", outputs.begin(), outputs.end());
        res.logger->set_level(tracing_enabled() ? spdlog::level::trace : spdlog::level::debug);
        res.logger->flush_on(spdlog::level::warn);
        return res;
    }

    static sinks &get()
    {
        static sinks s = create();
        return s;
    }

    std::optional<std::string> file_path()
    {
        return get().path;
    }

    void log(const level lev, const std::string &msg)
    {
        get().logger->log(spdlog_level(lev), msg);
        if (lev == level::error) {
            mutex::scoped_lock lk { last_error_mutex };
            last_error_ptr = std::make_shared<std::string>(msg);
        }
    }
}
