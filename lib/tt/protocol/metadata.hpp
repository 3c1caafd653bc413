/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_PROTOCOL_METADATA_HPP
#define TREASURY_TURBO_PROTOCOL_METADATA_HPP

#include <tt/protocol/types.hpp>

namespace treasury_turbo::protocol {
    /*
     * The packed ruleset metadata word:
     *   bits   0..15  reservedPercent
     *   bits  16..31  cashOutTaxRate, at most 10000
     *   bits  32..63  baseCurrency
     *   bits  64..78  capability flags in the declaration order below
     *   bit       79  unused, always zero in words produced by encode
     *   bits  80..239 dataHook
     *   bits 240..255 metadata
     */
    struct ruleset_metadata {
        uint16_t reserved_percent = 0;
        uint16_t cash_out_tax_rate = 0;
        uint32_t base_currency = 0;
        bool pause_pay = false;
        bool pause_cash_out = false;
        bool pause_credit_transfers = false;
        bool allow_owner_minting = false;
        bool allow_set_custom_token = false;
        bool allow_terminal_migration = false;
        bool allow_set_terminals = false;
        bool allow_set_controller = false;
        bool allow_add_accounting_context = false;
        bool allow_add_price_feed = false;
        bool owner_must_send_payouts = false;
        bool hold_fees = false;
        bool use_total_surplus_for_cash_outs = false;
        bool use_data_hook_for_pay = false;
        bool use_data_hook_for_cash_out = false;
        evm::address data_hook {};
        uint16_t metadata = 0;

        static constexpr size_t num_flags = 15;

        /*
         * Throws decode_error when cashOutTaxRate is above 10000. Bit 79 is ignored, so
         * decode(w).encode() == w holds only for words that have it clear.
         */
        static ruleset_metadata decode(const uint256_t &packed);
        [[nodiscard]] uint256_t encode() const;

        bool operator==(const ruleset_metadata &) const =default;
    };
}

#endif // !TREASURY_TURBO_PROTOCOL_METADATA_HPP
