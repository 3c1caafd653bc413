/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <limits>
#include <tt/logger.hpp>
#include <tt/protocol/chain-reader.hpp>

namespace treasury_turbo::protocol {
    using evm::address;
    using evm::abi::decoder;
    using evm::abi::encoder;

    static constexpr size_t ruleset_words = 9;
    static constexpr size_t split_words = 6;
    static constexpr size_t currency_amount_words = 2;

    static uint32_t decode_uint32(const decoder &dec, const size_t idx)
    {
        const auto val = dec.uint64(idx);
        if (val > std::numeric_limits<uint32_t>::max())
            throw decode_error("abi word {} does not fit into 32 bits: {}", idx, val);
        return static_cast<uint32_t>(val);
    }

    ruleset decode_ruleset(const decoder &dec, const size_t first_word)
    {
        ruleset rs {};
        rs.cycle_number = dec.uint64(first_word);
        rs.id = dec.uint64(first_word + 1);
        rs.based_on_id = dec.uint64(first_word + 2);
        rs.start = dec.uint64(first_word + 3);
        rs.duration = dec.uint64(first_word + 4);
        rs.weight = dec.uint(first_word + 5);
        rs.weight_cut_percent = decode_uint32(dec, first_word + 6);
        if (rs.weight_cut_percent > max_ppb)
            throw decode_error("ruleset {} has weightCutPercent {} above {}", rs.id, rs.weight_cut_percent, max_ppb);
        rs.approval_hook = dec.addr(first_word + 7);
        rs.metadata = static_cast<uint256_t>(dec.uint(first_word + 8));
        return rs;
    }

    static split decode_split(const decoder &dec)
    {
        split s {};
        s.percent = decode_uint32(dec, 0);
        s.project_id = dec.uint64(1);
        s.beneficiary = dec.addr(2);
        s.prefer_add_to_balance = dec.boolean(3);
        s.locked_until = dec.uint64(4);
        s.hook = dec.addr(5);
        return s;
    }

    chain_reader::chain_reader(const contract_registry &reg, evm::rpc &rpc, const cache_ttls &ttls, const clock &clk):
        _reg { reg }, _rpc { rpc },
        _current { ttls.current_ruleset, clk },
        _queued { ttls.queued_ruleset, clk },
        _records { {}, clk },
        _reserved_splits { ttls.splits, clk },
        _payout_splits { ttls.splits, clk },
        _limits { ttls.splits, clk },
        _supplies { ttls.balances, clk },
        _balances { ttls.balances, clk },
        _symbols { ttls.token_symbols, clk }
    {
    }

    uint8_vector chain_reader::_call(const chain_id_t chain_id, const address &to, const encoder &data, const std::string_view call_id)
    {
        auto res = _rpc.call(chain_id, to, data, call_id);
        return std::move(res.value());
    }

    std::optional<ruleset> chain_reader::current_ruleset(const contract_bundle &b, const chain_id_t chain_id, const project_id_t project_id)
    {
        const project_key key { chain_id, project_id };
        if (auto cached = _current.get(key))
            return cached;
        encoder call { "currentOf(uint256)" };
        call.uint(project_id);
        const auto data = _call(chain_id, b.rulesets, call, "JBRulesets.currentOf");
        auto rs = decode_ruleset(decoder { data });
        if (rs.cycle_number == 0)
            return {};
        // a fallback bundle may point at the wrong generation so its answers are not remembered
        if (!b.degraded)
            _current.set(key, rs);
        return rs;
    }

    std::optional<ruleset> chain_reader::ruleset_of(const contract_bundle &b, const chain_id_t chain_id, const project_id_t project_id, const uint64_t ruleset_id)
    {
        const record_key key { chain_id, project_id, ruleset_id };
        if (auto cached = _records.get(key))
            return cached;
        encoder call { "getRulesetOf(uint256,uint256)" };
        call.uint(project_id).uint(ruleset_id);
        const auto data = _call(chain_id, b.rulesets, call, "JBRulesets.getRulesetOf");
        auto rs = decode_ruleset(decoder { data });
        if (rs.cycle_number == 0)
            return {};
        if (!b.degraded)
            _records.set(key, rs);
        return rs;
    }

    std::optional<queued_ruleset> chain_reader::latest_queued_ruleset(const contract_bundle &b, const chain_id_t chain_id, const project_id_t project_id)
    {
        const project_key key { chain_id, project_id };
        if (auto cached = _queued.get(key))
            return cached;
        encoder call { "latestQueuedOf(uint256)" };
        call.uint(project_id);
        const auto data = _call(chain_id, b.rulesets, call, "JBRulesets.latestQueuedOf");
        const decoder dec { data };
        queued_ruleset q {};
        q.rs = decode_ruleset(dec);
        const auto status = dec.uint64(ruleset_words);
        if (status > static_cast<uint64_t>(approval_status::failed))
            throw decode_error("unsupported approval status: {}", status);
        q.status = static_cast<approval_status>(status);
        if (q.rs.cycle_number == 0)
            return {};
        if (!b.degraded)
            _queued.set(key, q);
        return q;
    }

    std::vector<split> chain_reader::_splits_of(const chain_id_t chain_id, const project_id_t project_id, const uint64_t ruleset_id, const cpp_int &group)
    {
        encoder call { "splitsOf(uint256,uint256,uint256)" };
        call.uint(project_id).uint(ruleset_id).uint(group);
        const auto data = _call(chain_id, _reg.shared.splits, call, "JBSplits.splitsOf");
        std::vector<split> res {};
        for (const auto &item: decoder { data }.tuple_array(0, split_words))
            res.emplace_back(decode_split(item));
        return res;
    }

    std::vector<split> chain_reader::reserved_splits(const chain_id_t chain_id, const project_id_t project_id, const uint64_t ruleset_id)
    {
        return _reserved_splits.get_or_compute(record_key { chain_id, project_id, ruleset_id }, [&] {
            return _splits_of(chain_id, project_id, ruleset_id, reserved_split_group);
        });
    }

    std::vector<split> chain_reader::payout_splits(const chain_id_t chain_id, const project_id_t project_id, const uint64_t ruleset_id)
    {
        return _payout_splits.get_or_compute(record_key { chain_id, project_id, ruleset_id }, [&] {
            auto res = _splits_of(chain_id, project_id, ruleset_id, big_uint_from_bytes(_reg.native_token));
            if (res.empty()) {
                if (const auto usdc = _reg.usdc_of(chain_id))
                    res = _splits_of(chain_id, project_id, ruleset_id, big_uint_from_bytes(*usdc));
            }
            return res;
        });
    }

    std::vector<currency_amount> chain_reader::_amounts_of(const std::string_view signature, const contract_bundle &b, const chain_id_t chain_id,
        const project_id_t project_id, const uint64_t ruleset_id, const address &token)
    {
        encoder call { signature };
        call.uint(project_id).uint(ruleset_id).addr(b.terminal).addr(token);
        const auto data = _call(chain_id, _reg.shared.fund_access_limits, call, fmt::format("JBFundAccessLimits.{}", signature.substr(0, signature.find('('))));
        std::vector<currency_amount> res {};
        for (const auto &item: decoder { data }.tuple_array(0, currency_amount_words))
            res.push_back(currency_amount { item.uint(0), decode_uint32(item, 1) });
        return res;
    }

    fund_access_limits chain_reader::fund_access(const contract_bundle &b, const chain_id_t chain_id, const project_id_t project_id, const uint64_t ruleset_id)
    {
        const auto fetch = [&](const address &token) {
            fund_access_limits lim {};
            lim.payout_limits = _amounts_of("payoutLimitsOf(uint256,uint256,address,address)", b, chain_id, project_id, ruleset_id, token);
            lim.surplus_allowances = _amounts_of("surplusAllowancesOf(uint256,uint256,address,address)", b, chain_id, project_id, ruleset_id, token);
            return lim;
        };
        const record_key key { chain_id, project_id, ruleset_id };
        if (auto cached = _limits.get(key))
            return std::move(*cached);
        auto lim = fetch(_reg.native_token);
        if (lim.payout_limits.empty() && lim.surplus_allowances.empty()) {
            if (const auto usdc = _reg.usdc_of(chain_id))
                lim = fetch(*usdc);
        }
        if (!b.degraded)
            _limits.set(key, lim);
        return lim;
    }

    cpp_int chain_reader::token_supply(const chain_id_t chain_id, const project_id_t project_id)
    {
        return _supplies.get_or_compute(project_key { chain_id, project_id }, [&] {
            encoder call { "totalSupplyOf(uint256)" };
            call.uint(project_id);
            return decoder { _call(chain_id, _reg.shared.tokens, call, "JBTokens.totalSupplyOf") }.uint(0);
        });
    }

    std::optional<std::string> chain_reader::token_symbol(const chain_id_t chain_id, const project_id_t project_id)
    {
        return _symbols.get_or_compute(project_key { chain_id, project_id }, [&]() -> std::optional<std::string> {
            encoder token_call { "tokenOf(uint256)" };
            token_call.uint(project_id);
            const auto token = decoder { _call(chain_id, _reg.shared.tokens, token_call, "JBTokens.tokenOf") }.addr(0);
            if (token.is_zero())
                return {};
            const encoder symbol_call { "symbol()" };
            return evm::abi::decode_symbol(_call(chain_id, token, symbol_call, "ERC20.symbol"));
        });
    }

    std::optional<cpp_int> chain_reader::terminal_balance(const contract_bundle &b, const chain_id_t chain_id, const project_id_t project_id)
    {
        if (!b.terminal_store)
            return {};
        const project_key key { chain_id, project_id };
        if (auto cached = _balances.get(key))
            return cached;
        encoder call { "balanceOf(address,uint256,address)" };
        call.addr(b.terminal).uint(project_id).addr(_reg.native_token);
        auto balance = decoder { _call(chain_id, *b.terminal_store, call, "JBTerminalStore.balanceOf") }.uint(0);
        if (!b.degraded)
            _balances.set(key, balance);
        return balance;
    }

    std::optional<cpp_int> chain_reader::used_payout_limit(const contract_bundle &b, const chain_id_t chain_id, const project_id_t project_id,
        const uint64_t cycle_number, const uint32_t currency)
    {
        if (!b.terminal_store)
            return {};
        encoder call { "usedPayoutLimitOf(address,uint256,address,uint256,uint256)" };
        call.addr(b.terminal).uint(project_id).addr(_reg.native_token).uint(cycle_number).uint(currency);
        return decoder { _call(chain_id, *b.terminal_store, call, "JBTerminalStore.usedPayoutLimitOf") }.uint(0);
    }
}
