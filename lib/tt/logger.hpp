/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_LOGGER_HPP
#define TREASURY_TURBO_LOGGER_HPP

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <tt/common/error.hpp>
#include <tt/common/format.hpp>

/*
 * Process-wide logging backed by spdlog.
 * Messages go to stderr from the info level up and to the file named by TT_LOG (./log/tt.log by default)
 * from the debug level up, or from the trace level up when TT_DEBUG is set.
 * TT_LOG_NO_CONSOLE turns the stderr output off. A log file that cannot be opened leaves only the console.
 */
namespace treasury_turbo::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    extern void log(level lev, const std::string &msg);
    // The most recent error-level message, empty if none has been logged since the last reset
    extern std::shared_ptr<std::string> last_error();
    extern void reset_last_error();
    extern bool tracing_enabled();
    // Empty when the file sink could not be created
    extern std::optional<std::string> file_path();

    template<typename... Args>
    void log(const level lev, const std::string_view &fmt, Args&&... a)
    {
        log(lev, format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const std::string_view &fmt, Args&&... a)
    {
        log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view &fmt, Args&&... a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view &fmt, Args&&... a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view &fmt, Args&&... a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(const std::string_view &fmt, Args&&... a)
    {
        log(level::error, fmt, std::forward<Args>(a)...);
    }

    using action = std::function<void()>;

    // Runs the action and logs a std::exception escaping it together with the caller's location
    inline std::exception_ptr run_log_errors(const action &main, const std::optional<action> &cleanup={},
            const std::source_location &loc=std::source_location::current())
    {
        std::exception_ptr cur_ex {};
        try {
            main();
        } catch (const std::exception &ex) {
            cur_ex = std::current_exception();
            logger::error("{}:{} failed: {}", loc.file_name(), loc.line(), ex.what());
        }
        if (cleanup)
            (*cleanup)();
        return cur_ex;
    }
}

namespace fmt {
    template<>
    struct formatter<treasury_turbo::logger::level>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using treasury_turbo::logger::level;
            switch (v) {
                case level::trace: return fmt::format_to(ctx.out(), "trace");
                case level::debug: return fmt::format_to(ctx.out(), "debug");
                case level::info: return fmt::format_to(ctx.out(), "info");
                case level::warn: return fmt::format_to(ctx.out(), "warn");
                case level::error: return fmt::format_to(ctx.out(), "error");
                default: throw treasury_turbo::error("unsupported logger::level: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TREASURY_TURBO_LOGGER_HPP
