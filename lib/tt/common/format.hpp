/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_COMMON_FORMAT_HPP
#define TREASURY_TURBO_COMMON_FORMAT_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#   endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

namespace treasury_turbo {
    using fmt::format;

    // Writes the items separated by a comma, used by the container formatters below
    template<typename It, typename Out>
    Out format_sequence(Out out, It begin, const It end)
    {
        for (auto it = begin; it != end; ++it) {
            if (it != begin)
                out = fmt::format_to(out, ", ");
            out = fmt::format_to(out, "{}", *it);
        }
        return out;
    }
}

namespace fmt {
    // Calldata, return data and hashes as lower-case hex without a prefix
    template<>
    struct formatter<std::span<const uint8_t>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &data, FormatContext &ctx) const -> decltype(ctx.out()) {
            static constexpr char digits[] = "0123456789abcdef";
            auto out = ctx.out();
            for (const uint8_t b: data) {
                *out++ = digits[b >> 4];
                *out++ = digits[b & 0xF];
            }
            return out;
        }
    };

    template<typename T, typename A>
    struct formatter<std::vector<T, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out = fmt::format_to(ctx.out(), "[");
            out = treasury_turbo::format_sequence(out, v.begin(), v.end());
            return fmt::format_to(out, "]");
        }
    };

    // An empty value prints as "none" so that log lines about missing slots stay readable
    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "none");
        }
    };
}

#endif // !TREASURY_TURBO_COMMON_FORMAT_HPP
