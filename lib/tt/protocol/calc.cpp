/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <tt/protocol/calc.hpp>

namespace treasury_turbo::protocol {
    const cpp_int unlimited_payout_limit = (cpp_int { 1 } << 224) - 1;

    payout_availability available_payout(const cpp_int &limit, const cpp_int &used, const cpp_int &terminal_balance)
    {
        if (limit == 0)
            return { payout_mode::disabled, 0 };
        if (limit == unlimited_payout_limit)
            return { payout_mode::unlimited, terminal_balance };
        if (used >= limit)
            return { payout_mode::limited, 0 };
        return { payout_mode::limited, limit - used };
    }

    static void check_tax_rate(const uint32_t cash_out_tax_rate)
    {
        if (cash_out_tax_rate > max_basis_points)
            throw error("cashOutTaxRate {} is above {}", cash_out_tax_rate, max_basis_points);
    }

    double cash_out_fraction(const double x, const uint32_t cash_out_tax_rate)
    {
        check_tax_rate(cash_out_tax_rate);
        const double r = static_cast<double>(cash_out_tax_rate) / max_basis_points;
        return x * ((1.0 - r) + r * x);
    }

    cpp_int cash_out_amount(const cpp_int &balance, const cpp_int &total_supply, const uint32_t cash_out_tax_rate, const cpp_int &tokens)
    {
        check_tax_rate(cash_out_tax_rate);
        if (total_supply == 0 || balance == 0 || tokens == 0)
            return 0;
        if (tokens > total_supply)
            throw error("cannot cash out {} tokens out of the total supply of {}", tokens, total_supply);
        if (tokens == total_supply)
            return balance;
        // balance * x * ((1 - r) + r * x) with x = tokens / supply and r = rate / 10000 kept as integers
        const cpp_int numerator = balance * tokens * ((max_basis_points - cash_out_tax_rate) * total_supply + cash_out_tax_rate * tokens);
        const cpp_int denominator = total_supply * total_supply * max_basis_points;
        return numerator / denominator;
    }

    cpp_int floor_price(const cpp_int &balance, const cpp_int &total_supply, const uint32_t cash_out_tax_rate, const uint32_t token_decimals)
    {
        if (total_supply == 0)
            return 0;
        const cpp_int unit = boost::multiprecision::pow(cpp_int { 10 }, token_decimals);
        if (unit > total_supply)
            return balance * unit / total_supply;
        return cash_out_amount(balance, total_supply, cash_out_tax_rate, unit);
    }
}
