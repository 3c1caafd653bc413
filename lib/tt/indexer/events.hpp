/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_INDEXER_EVENTS_HPP
#define TREASURY_TURBO_INDEXER_EVENTS_HPP

#include <string_view>
#include <variant>
#include <tt/indexer/types.hpp>
#include <tt/json.hpp>

namespace treasury_turbo::indexer {
    struct event_base {
        std::string id {};
        chain_id_t chain_id = 0;
        uint64_t timestamp = 0;
        std::string project_name {};
        std::string project_handle {};
        uint32_t decimals = default_decimals;
        uint32_t currency = currency_eth;
        std::string from {};
        std::string tx_hash {};
    };

    struct pay_activity: event_base {
        cpp_int amount {};
        std::optional<std::string> amount_usd {};
    };

    struct project_create_activity: event_base {
    };

    struct cash_out_activity: event_base {
        cpp_int reclaim_amount {};
    };

    struct add_to_balance_activity: event_base {
        cpp_int amount {};
    };

    struct mint_tokens_activity: event_base {
        cpp_int token_count {};
        std::string beneficiary {};
    };

    struct burn_activity: event_base {
        cpp_int amount {};
    };

    struct deploy_erc20_activity: event_base {
        std::string symbol {};
    };

    struct send_payouts_activity: event_base {
        cpp_int amount {};
    };

    struct send_reserved_tokens_activity: event_base {
    };

    struct use_allowance_activity: event_base {
        cpp_int amount {};
    };

    struct mint_nft_activity: event_base {
    };

    // An event of a kind this library does not know yet
    struct unknown_activity: event_base {
    };

    using activity_event = std::variant<pay_activity, project_create_activity, cash_out_activity, add_to_balance_activity,
        mint_tokens_activity, burn_activity, deploy_erc20_activity, send_payouts_activity, send_reserved_tokens_activity,
        use_allowance_activity, mint_nft_activity, unknown_activity>;

    // The kind is chosen by the first non-null per-kind field of the raw indexer record
    extern activity_event parse_activity_event(const json::object &raw);
    extern std::string_view kind_name(const activity_event &ev);

    inline const event_base &base_of(const activity_event &ev)
    {
        return std::visit([](const auto &e) -> const event_base & { return e; }, ev);
    }
}

#endif // !TREASURY_TURBO_INDEXER_EVENTS_HPP
