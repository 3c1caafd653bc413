/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <array>
#include <functional>
#include <tt/protocol/metadata.hpp>

namespace treasury_turbo::protocol {
    static constexpr unsigned cash_out_tax_rate_shift = 16;
    static constexpr unsigned base_currency_shift = 32;
    static constexpr unsigned flags_shift = 64;
    static constexpr unsigned data_hook_shift = 80;
    static constexpr unsigned metadata_shift = 240;

    using flag_ptr = bool ruleset_metadata::*;

    static const std::array<flag_ptr, ruleset_metadata::num_flags> &flag_fields()
    {
        static const std::array<flag_ptr, ruleset_metadata::num_flags> fields {
            &ruleset_metadata::pause_pay,
            &ruleset_metadata::pause_cash_out,
            &ruleset_metadata::pause_credit_transfers,
            &ruleset_metadata::allow_owner_minting,
            &ruleset_metadata::allow_set_custom_token,
            &ruleset_metadata::allow_terminal_migration,
            &ruleset_metadata::allow_set_terminals,
            &ruleset_metadata::allow_set_controller,
            &ruleset_metadata::allow_add_accounting_context,
            &ruleset_metadata::allow_add_price_feed,
            &ruleset_metadata::owner_must_send_payouts,
            &ruleset_metadata::hold_fees,
            &ruleset_metadata::use_total_surplus_for_cash_outs,
            &ruleset_metadata::use_data_hook_for_pay,
            &ruleset_metadata::use_data_hook_for_cash_out
        };
        return fields;
    }

    template<typename T>
    static T bits_at(const uint256_t &packed, const unsigned shift, const unsigned width)
    {
        const uint256_t mask = (uint256_t { 1 } << width) - 1;
        return static_cast<T>((packed >> shift) & mask);
    }

    ruleset_metadata ruleset_metadata::decode(const uint256_t &packed)
    {
        ruleset_metadata m {};
        m.reserved_percent = bits_at<uint16_t>(packed, 0, 16);
        m.cash_out_tax_rate = bits_at<uint16_t>(packed, cash_out_tax_rate_shift, 16);
        if (m.cash_out_tax_rate > max_basis_points)
            throw decode_error("cashOutTaxRate must be at most {} but got {}", max_basis_points, m.cash_out_tax_rate);
        m.base_currency = bits_at<uint32_t>(packed, base_currency_shift, 32);
        const auto &flags = flag_fields();
        for (size_t i = 0; i < flags.size(); ++i)
            m.*flags[i] = bit_test(packed, flags_shift + i);
        const auto hook = bits_at<uint256_t>(packed, data_hook_shift, 160);
        for (size_t i = 0; i < m.data_hook.size(); ++i)
            m.data_hook[m.data_hook.size() - 1 - i] = static_cast<uint8_t>((hook >> (i * 8)) & 0xFF);
        m.metadata = bits_at<uint16_t>(packed, metadata_shift, 16);
        return m;
    }

    uint256_t ruleset_metadata::encode() const
    {
        if (cash_out_tax_rate > max_basis_points)
            throw decode_error("cashOutTaxRate must be at most {} but got {}", max_basis_points, cash_out_tax_rate);
        uint256_t packed = reserved_percent;
        packed |= uint256_t { cash_out_tax_rate } << cash_out_tax_rate_shift;
        packed |= uint256_t { base_currency } << base_currency_shift;
        const auto &flags = flag_fields();
        for (size_t i = 0; i < flags.size(); ++i) {
            if (this->*flags[i])
                packed |= uint256_t { 1 } << (flags_shift + i);
        }
        uint256_t hook = 0;
        for (const auto b: data_hook) {
            hook <<= 8;
            hook |= b;
        }
        packed |= hook << data_hook_shift;
        packed |= uint256_t { metadata } << metadata_shift;
        return packed;
    }
}
