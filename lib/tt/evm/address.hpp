/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_EVM_ADDRESS_HPP
#define TREASURY_TURBO_EVM_ADDRESS_HPP

#include <algorithm>
#include <string>
#include <tt/common/bytes.hpp>

namespace treasury_turbo::evm {
    struct address: byte_array<20> {
        static address from_hex(const std::string_view hex)
        {
            address a {};
            init_from_hex(a, hex);
            return a;
        }

        using byte_array<20>::byte_array;

        [[nodiscard]] bool is_zero() const noexcept
        {
            return std::all_of(begin(), end(), [](const auto b) { return b == 0; });
        }

        // Lower-case hex with the 0x prefix, the canonical form used for comparisons and map keys
        [[nodiscard]] std::string to_string() const
        {
            return to_hex(*this);
        }
    };

    // Holder addresses arrive with mixed-case checksums from different chains
    inline std::string normalize_address(const std::string_view addr)
    {
        std::string res { addr };
        std::transform(res.begin(), res.end(), res.begin(), [](const char c) {
            return static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
        });
        return res;
    }
}

namespace fmt {
    template<>
    struct formatter<treasury_turbo::evm::address>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "0x{}", std::span<const uint8_t>(v));
        }
    };
}

#endif // !TREASURY_TURBO_EVM_ADDRESS_HPP
