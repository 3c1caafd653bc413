/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_COMMON_BYTES_HPP
#define TREASURY_TURBO_COMMON_BYTES_HPP

#include <array>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <tt/common/error.hpp>
#include <tt/common/format.hpp>

namespace treasury_turbo {
    using buffer = std::span<const uint8_t>;

    inline uint8_t uint_from_hex(const char k)
    {
        switch (k) {
            case '0': return 0;
            case '1': return 1;
            case '2': return 2;
            case '3': return 3;
            case '4': return 4;
            case '5': return 5;
            case '6': return 6;
            case '7': return 7;
            case '8': return 8;
            case '9': return 9;
            case 'a': case 'A': return 10;
            case 'b': case 'B': return 11;
            case 'c': case 'C': return 12;
            case 'd': case 'D': return 13;
            case 'e': case 'E': return 14;
            case 'f': case 'F': return 15;
            default: throw decode_error("unexpected character in a hex number: {}!", k);
        }
    }

    // EVM tooling prefixes hex data with 0x, the prefix is optional here
    inline std::string_view strip_hex_prefix(const std::string_view hex)
    {
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
            return hex.substr(2);
        return hex;
    }

    inline void init_from_hex(std::span<uint8_t> out, const std::string_view hex_with_prefix)
    {
        const auto hex = strip_hex_prefix(hex_with_prefix);
        if (hex.size() != out.size() * 2)
            throw decode_error("hex string must have {} characters but got {}: {}!", out.size() * 2, hex.size(), hex);
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = uint_from_hex(hex[i * 2]) << 4 | uint_from_hex(hex[i * 2 + 1]);
    }

    inline std::string to_hex(const buffer data, const bool prefix=true)
    {
        return fmt::format("{}{}", prefix ? "0x" : "", data);
    }

    struct uint8_vector: std::vector<uint8_t> {
        static uint8_vector from_hex(const std::string_view hex_with_prefix)
        {
            const auto hex = strip_hex_prefix(hex_with_prefix);
            if (hex.size() % 2 != 0)
                throw decode_error("hex string must have an even number of characters but got {}!", hex.size());
            uint8_vector data(hex.size() / 2);
            init_from_hex(data, hex);
            return data;
        }

        uint8_vector() =default;

        explicit uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        uint8_vector(const buffer bytes):
            std::vector<uint8_t>(bytes.begin(), bytes.end())
        {
        }

        std::string_view str() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }
    };

    inline uint8_vector &operator<<(uint8_vector &v, const buffer buf)
    {
        v.insert(v.end(), buf.begin(), buf.end());
        return v;
    }

    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data {};
            init_from_hex(data, hex);
            return data;
        }

        byte_array() =default;

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw decode_error("buffer must be of size {} but got {}", SZ, s.size());
            memcpy(base_type::data(), s.data(), SZ);
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<treasury_turbo::byte_array<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", std::span<const uint8_t>(v));
        }
    };

    template<>
    struct formatter<treasury_turbo::uint8_vector>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", std::span<const uint8_t>(v));
        }
    };
}

#endif // !TREASURY_TURBO_COMMON_BYTES_HPP
