/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_PROTOCOL_CALC_HPP
#define TREASURY_TURBO_PROTOCOL_CALC_HPP

#include <tt/protocol/types.hpp>

namespace treasury_turbo::protocol {
    // Payout limits are stored as uint224 and exactly the maximum value stands for no limit
    extern const cpp_int unlimited_payout_limit;

    enum class payout_mode { disabled, limited, unlimited };

    struct payout_availability {
        payout_mode mode = payout_mode::disabled;
        cpp_int available {};
    };

    extern payout_availability available_payout(const cpp_int &limit, const cpp_int &used, const cpp_int &terminal_balance);

    /*
     * The bonding curve of cash outs: redeeming the fraction x of the token supply returns
     * the fraction y = x * ((1 - r) + r * x) of the treasury where r = cash_out_tax_rate / 10000.
     */
    extern double cash_out_fraction(double x, uint32_t cash_out_tax_rate);

    // The exact amount of the balance returned for redeeming tokens, rounded down; zero when the supply is zero
    extern cpp_int cash_out_amount(const cpp_int &balance, const cpp_int &total_supply, uint32_t cash_out_tax_rate, const cpp_int &tokens);

    // What redeeming one whole token returns; the average over the whole supply when less than one token exists
    extern cpp_int floor_price(const cpp_int &balance, const cpp_int &total_supply, uint32_t cash_out_tax_rate, uint32_t token_decimals=18);
}

namespace fmt {
    template<>
    struct formatter<treasury_turbo::protocol::payout_mode>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using treasury_turbo::protocol::payout_mode;
            switch (v) {
                case payout_mode::disabled: return fmt::format_to(ctx.out(), "disabled");
                case payout_mode::limited: return fmt::format_to(ctx.out(), "limited");
                case payout_mode::unlimited: return fmt::format_to(ctx.out(), "unlimited");
                default: throw treasury_turbo::error("unsupported payout_mode: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TREASURY_TURBO_PROTOCOL_CALC_HPP
