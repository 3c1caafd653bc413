/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <iterator>
#include <tt/indexer/events.hpp>

namespace treasury_turbo::indexer {
    static void parse_base(event_base &ev, const json::object &raw, const json::object *details)
    {
        ev.id = json::string_or(raw, "id");
        ev.chain_id = json::uint64_or(raw, "chainId");
        ev.timestamp = json::uint64_or(raw, "timestamp");
        if (const auto *p = json::find(raw, "project"); p && p->is_object()) {
            const auto &proj = p->get_object();
            ev.project_name = json::string_or(proj, "name");
            ev.project_handle = json::string_or(proj, "handle");
            ev.decimals = static_cast<uint32_t>(json::uint64_or(proj, "decimals", default_decimals));
            std::optional<uint32_t> reported {};
            if (json::find(proj, "currency"))
                reported = static_cast<uint32_t>(json::uint64_or(proj, "currency"));
            ev.currency = accounting_currency(ev.decimals, reported);
        }
        ev.from = json::string_or(raw, "from");
        ev.tx_hash = json::string_or(raw, "txHash");
        if (details) {
            ev.from = json::string_or(*details, "from", ev.from);
            ev.tx_hash = json::string_or(*details, "txHash", ev.tx_hash);
        }
    }

    template<typename T>
    static T parse_kind(const json::object &raw, const json::object &details)
    {
        T ev {};
        parse_base(ev, raw, &details);
        return ev;
    }

    static const json::object *details_of(const json::object &raw, const std::string_view field)
    {
        const auto *v = json::find(raw, field);
        if (!v)
            return nullptr;
        if (!v->is_object())
            throw upstream_error("activity event field {} must be an object", field);
        return &v->get_object();
    }

    activity_event parse_activity_event(const json::object &raw)
    {
        if (const auto *d = details_of(raw, "payEvent")) {
            auto ev = parse_kind<pay_activity>(raw, *d);
            ev.amount = json::big_uint_or(*d, "amount");
            // reported either as a decimal string or as a plain number
            if (const auto *usd = json::find(*d, "amountUsd"))
                ev.amount_usd = usd->is_string() ? std::string { usd->get_string() } : json::serialize(*usd);
            return ev;
        }
        if (const auto *d = details_of(raw, "projectCreateEvent"))
            return parse_kind<project_create_activity>(raw, *d);
        if (const auto *d = details_of(raw, "cashOutTokensEvent")) {
            auto ev = parse_kind<cash_out_activity>(raw, *d);
            ev.reclaim_amount = json::big_uint_or(*d, "reclaimAmount");
            return ev;
        }
        if (const auto *d = details_of(raw, "addToBalanceEvent")) {
            auto ev = parse_kind<add_to_balance_activity>(raw, *d);
            ev.amount = json::big_uint_or(*d, "amount");
            return ev;
        }
        if (const auto *d = details_of(raw, "mintTokensEvent")) {
            auto ev = parse_kind<mint_tokens_activity>(raw, *d);
            ev.token_count = json::big_uint_or(*d, "tokenCount");
            ev.beneficiary = json::string_or(*d, "beneficiary");
            return ev;
        }
        if (const auto *d = details_of(raw, "burnEvent")) {
            auto ev = parse_kind<burn_activity>(raw, *d);
            ev.amount = json::big_uint_or(*d, "amount");
            return ev;
        }
        if (const auto *d = details_of(raw, "deployErc20Event")) {
            auto ev = parse_kind<deploy_erc20_activity>(raw, *d);
            ev.symbol = json::string_or(*d, "symbol");
            return ev;
        }
        if (const auto *d = details_of(raw, "sendPayoutsEvent")) {
            auto ev = parse_kind<send_payouts_activity>(raw, *d);
            ev.amount = json::big_uint_or(*d, "amount");
            return ev;
        }
        if (const auto *d = details_of(raw, "sendReservedTokensToSplitsEvent"))
            return parse_kind<send_reserved_tokens_activity>(raw, *d);
        if (const auto *d = details_of(raw, "useAllowanceEvent")) {
            auto ev = parse_kind<use_allowance_activity>(raw, *d);
            ev.amount = json::big_uint_or(*d, "amount");
            return ev;
        }
        if (const auto *d = details_of(raw, "mintNftEvent"))
            return parse_kind<mint_nft_activity>(raw, *d);
        unknown_activity ev {};
        parse_base(ev, raw, nullptr);
        return ev;
    }

    std::string_view kind_name(const activity_event &ev)
    {
        static constexpr std::string_view names[] {
            "pay", "projectCreate", "cashOut", "addToBalance", "mintTokens", "burn", "deployErc20",
            "sendPayouts", "sendReservedTokens", "useAllowance", "mintNft", "unknown"
        };
        static_assert(std::size(names) == std::variant_size_v<activity_event>);
        return names[ev.index()];
    }
}
