/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_BIG_INT_HPP
#define TREASURY_TURBO_BIG_INT_HPP

#include <sstream>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <tt/common/bytes.hpp>
#include <tt/common/format.hpp>

namespace treasury_turbo {
    using boost::multiprecision::cpp_int;
    using boost::multiprecision::uint256_t;

    static constexpr size_t evm_word_size = 32;
    using evm_word = byte_array<evm_word_size>;

    inline cpp_int big_uint_from_bytes(const buffer data)
    {
        if (data.size() > evm_word_size)
            throw decode_error("big uints larger than {} bytes are not supported but got: {}!", evm_word_size, data.size());
        cpp_int val = 0;
        for (const uint8_t &b: data) {
            val *= 256;
            val += b;
        }
        return val;
    }

    inline uint256_t uint256_from_bytes(const buffer data)
    {
        return static_cast<uint256_t>(big_uint_from_bytes(data));
    }

    inline evm_word big_uint_to_word(const cpp_int &val)
    {
        if (val < 0 || (val >> 256) != 0)
            throw decode_error("value does not fit into a 256-bit word: {}", val.str());
        evm_word out {};
        auto val_copy = val;
        for (size_t i = evm_word_size; i > 0 && val_copy; --i) {
            out[i - 1] = static_cast<uint8_t>(val_copy & 0xFF);
            val_copy >>= 8;
        }
        return out;
    }

    // Accepts either decimal digits or 0x-prefixed hex as returned by JSON-RPC and GraphQL APIs
    inline cpp_int big_uint_from_string(const std::string_view s)
    {
        if (s.empty())
            throw decode_error("an empty string is not a valid number!");
        cpp_int val = 0;
        if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
            for (const char k: s.substr(2)) {
                val <<= 4;
                val += uint_from_hex(k);
            }
            return val;
        }
        for (const char k: s) {
            if (k < '0' || k > '9')
                throw decode_error("unexpected character in a decimal number: {}!", s);
            val *= 10;
            val += k - '0';
        }
        return val;
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !TREASURY_TURBO_BIG_INT_HPP
