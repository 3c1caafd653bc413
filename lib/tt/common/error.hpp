/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_COMMON_ERROR_HPP
#define TREASURY_TURBO_COMMON_ERROR_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <tt/common/format.hpp>

namespace treasury_turbo {
    struct error: std::runtime_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);

        template<typename A, typename... Args>
        requires (!std::is_base_of_v<std::exception, std::decay_t<A>>)
        explicit error(fmt::format_string<A, Args...> fmt, A &&a, Args&&... args):
            error { std::string_view { fmt::format(fmt, std::forward<A>(a), std::forward<Args>(args)...) } }
        {
        }
    };

    // A dependency was reachable but returned an error or malformed data
    struct upstream_error: error {
        using error::error;
    };

    // A packed or binary field was outside of its valid domain
    struct decode_error: error {
        using error::error;
    };

    // Required configuration is missing, e.g., no RPC endpoints for a chain
    struct config_error: error {
        using error::error;
    };

    struct circuit_open_error: error {
        explicit circuit_open_error(std::string_view name, std::chrono::milliseconds retry_after);

        std::chrono::milliseconds retry_after() const noexcept
        {
            return _retry_after;
        }
    private:
        std::chrono::milliseconds _retry_after;
    };
}

#endif // !TREASURY_TURBO_COMMON_ERROR_HPP
