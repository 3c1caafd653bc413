/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <tt/common/test.hpp>
#include <tt/protocol/chain-mock.hpp>

using namespace treasury_turbo;
using namespace treasury_turbo::protocol;

namespace {
    using evm::rpc_responder;
    using evm::abi::encoder;
    using reader_env = chain_mock;

    static const std::string rpc_url { "http://rpc.local/eth" };
    static const auto beneficiary = evm::address::from_hex("0x00000000000000000000000000000000000000b1");
    static const auto hook = evm::address::from_hex("0x00000000000000000000000000000000000000c1");
    static const auto token = evm::address::from_hex("0x00000000000000000000000000000000000000d1");

    ruleset sample_ruleset()
    {
        ruleset rs {};
        rs.cycle_number = 4;
        rs.id = 1700000300;
        rs.based_on_id = 1700000200;
        rs.start = 1700000300;
        rs.duration = 604800;
        rs.weight = cpp_int { "1000000000000000000000" };
        rs.weight_cut_percent = 50'000'000;
        rs.approval_hook = hook;
        rs.metadata = uint256_t { 5000 } << 16;
        return rs;
    }
}

suite protocol_chain_reader_suite = [] {
    "protocol::chain_reader"_test = [] {
        "current ruleset"_test = [] {
            reader_env env {};
            const auto rs = sample_ruleset();
            encoder call { "currentOf(uint256)" };
            call.uint(12);
            env.chain.on_call(env.reg.v5_1.rulesets, call, chain_mock::ruleset_result(rs));
            const auto b = env.bundle(env.reg.v5_1);
            const auto cur = env.reader.current_ruleset(b, 1, 12);
            expect((cur.has_value()) >> fatal);
            expect(*cur == rs);
            test_same(size_t { 1 }, env.http.num_requests(rpc_url));
            expect(env.reader.current_ruleset(b, 1, 12) == rs);
            test_same(size_t { 1 }, env.http.num_requests(rpc_url));
            env.clk.advance(std::chrono::seconds { 301 });
            expect(env.reader.current_ruleset(b, 1, 12) == rs);
            test_same(size_t { 2 }, env.http.num_requests(rpc_url));
        };
        "no ruleset"_test = [] {
            reader_env env {};
            encoder call { "currentOf(uint256)" };
            call.uint(13);
            env.chain.on_call(env.reg.v5.rulesets, call, chain_mock::ruleset_result(ruleset {}));
            expect(!env.reader.current_ruleset(env.bundle(env.reg.v5), 1, 13));
        };
        "stored records are cached permanently"_test = [] {
            reader_env env {};
            auto rs = sample_ruleset();
            rs.cycle_number = 1;
            encoder call { "getRulesetOf(uint256,uint256)" };
            call.uint(12).uint(rs.id);
            env.chain.on_call(env.reg.v5_1.rulesets, call, chain_mock::ruleset_result(rs));
            const auto b = env.bundle(env.reg.v5_1);
            expect(env.reader.ruleset_of(b, 1, 12, rs.id) == rs);
            env.clk.advance(std::chrono::hours { 24 * 365 });
            expect(env.reader.ruleset_of(b, 1, 12, rs.id) == rs);
            test_same(size_t { 1 }, env.http.num_requests(rpc_url));
        };
        "degraded bundles are not cached"_test = [] {
            reader_env env {};
            const auto rs = sample_ruleset();
            encoder call { "currentOf(uint256)" };
            call.uint(12);
            env.chain.on_call(env.reg.v5_1.rulesets, call, chain_mock::ruleset_result(rs));
            auto b = env.bundle(env.reg.v5_1);
            b.degraded = true;
            expect(env.reader.current_ruleset(b, 1, 12) == rs);
            expect(env.reader.current_ruleset(b, 1, 12) == rs);
            test_same(size_t { 2 }, env.http.num_requests(rpc_url));
        };
        "queued ruleset"_test = [] {
            reader_env env {};
            const auto rs = sample_ruleset();
            encoder call { "latestQueuedOf(uint256)" };
            call.uint(12);
            env.chain.on_call(env.reg.v5_1.rulesets, call, chain_mock::ruleset_result(rs, approval_status::approval_expected));
            const auto q = env.reader.latest_queued_ruleset(env.bundle(env.reg.v5_1), 1, 12);
            expect((q.has_value()) >> fatal);
            expect(q->rs == rs);
            expect(q->status == approval_status::approval_expected);
        };
        "unsupported approval status"_test = [] {
            reader_env env {};
            encoder call { "latestQueuedOf(uint256)" };
            call.uint(12);
            auto data = uint8_vector::from_hex(chain_mock::ruleset_result(sample_ruleset()));
            data << big_uint_to_word(6);
            env.chain.on_call(env.reg.v5_1.rulesets, call, to_hex(data));
            expect(throws<decode_error>([&] { std::ignore = env.reader.latest_queued_ruleset(env.bundle(env.reg.v5_1), 1, 12); }));
        };
        "reserved splits"_test = [] {
            reader_env env {};
            encoder call { "splitsOf(uint256,uint256,uint256)" };
            call.uint(12).uint(77).uint(reserved_split_group);
            env.chain.on_call(env.reg.shared.splits, call, rpc_responder::words({
                32, 2,
                600'000'000, 0, rpc_responder::word_of(beneficiary), 0, 1800000000, 0,
                400'000'000, 5, 0, 1, 0, rpc_responder::word_of(hook)
            }));
            const auto splits = env.reader.reserved_splits(1, 12, 77);
            expect((splits.size() == 2U) >> fatal);
            test_same(uint32_t { 600'000'000 }, splits[0].percent);
            test_same(beneficiary.to_string(), splits[0].beneficiary.to_string());
            test_same(uint64_t { 1800000000 }, splits[0].locked_until);
            test_same(uint64_t { 5 }, splits[1].project_id);
            test_same(true, splits[1].prefer_add_to_balance);
            test_same(hook.to_string(), splits[1].hook.to_string());
        };
        "payout splits fall back to usdc"_test = [] {
            reader_env env {};
            encoder native_call { "splitsOf(uint256,uint256,uint256)" };
            native_call.uint(12).uint(77).uint(rpc_responder::word_of(env.reg.native_token));
            env.chain.on_call(env.reg.shared.splits, native_call, rpc_responder::words({ 32, 0 }));
            encoder usdc_call { "splitsOf(uint256,uint256,uint256)" };
            usdc_call.uint(12).uint(77).uint(rpc_responder::word_of(*env.reg.usdc_of(1)));
            env.chain.on_call(env.reg.shared.splits, usdc_call, rpc_responder::words({
                32, 1, 1'000'000'000, 0, rpc_responder::word_of(beneficiary), 0, 0, 0
            }));
            const auto splits = env.reader.payout_splits(1, 12, 77);
            expect((splits.size() == 1U) >> fatal);
            test_same(uint32_t { 1'000'000'000 }, splits[0].percent);
        };
        "fund access limits"_test = [] {
            reader_env env {};
            const auto b = env.bundle(env.reg.v5_1);
            encoder payouts { "payoutLimitsOf(uint256,uint256,address,address)" };
            payouts.uint(12).uint(77).addr(b.terminal).addr(env.reg.native_token);
            env.chain.on_call(env.reg.shared.fund_access_limits, payouts, rpc_responder::words({ 32, 1, cpp_int { "5000000000000000000" }, 1 }));
            encoder allowances { "surplusAllowancesOf(uint256,uint256,address,address)" };
            allowances.uint(12).uint(77).addr(b.terminal).addr(env.reg.native_token);
            env.chain.on_call(env.reg.shared.fund_access_limits, allowances, rpc_responder::words({ 32, 0 }));
            const auto lim = env.reader.fund_access(b, 1, 12, 77);
            expect((lim.payout_limits.size() == 1U) >> fatal);
            test_same(cpp_int { "5000000000000000000" }, lim.payout_limits[0].amount);
            test_same(uint32_t { 1 }, lim.payout_limits[0].currency);
            expect(lim.surplus_allowances.empty());
        };
        "token supply and symbol"_test = [] {
            reader_env env {};
            encoder supply { "totalSupplyOf(uint256)" };
            supply.uint(12);
            env.chain.on_call(env.reg.shared.tokens, supply, rpc_responder::words({ cpp_int { "250000000000000000000" } }));
            test_same(cpp_int { "250000000000000000000" }, env.reader.token_supply(1, 12));
            encoder token_of { "tokenOf(uint256)" };
            token_of.uint(12);
            env.chain.on_call(env.reg.shared.tokens, token_of, rpc_responder::words({ rpc_responder::word_of(token) }));
            env.chain.on_selector(token, "symbol()", chain_mock::string_result("JBX"));
            test_same(std::string { "JBX" }, env.reader.token_symbol(1, 12).value_or(""));
        };
        "no erc20 token"_test = [] {
            reader_env env {};
            encoder token_of { "tokenOf(uint256)" };
            token_of.uint(14);
            env.chain.on_call(env.reg.shared.tokens, token_of, rpc_responder::words({ 0 }));
            expect(!env.reader.token_symbol(1, 14));
        };
        "terminal store"_test = [] {
            reader_env env {};
            expect(!env.reader.terminal_balance(env.bundle(env.reg.v5), 1, 12));
            const auto b = env.bundle(env.reg.v5_1);
            encoder balance { "balanceOf(address,uint256,address)" };
            balance.addr(b.terminal).uint(12).addr(env.reg.native_token);
            env.chain.on_call(*b.terminal_store, balance, rpc_responder::words({ 1234 }));
            test_same(cpp_int { 1234 }, env.reader.terminal_balance(b, 1, 12).value_or(0));
            encoder used { "usedPayoutLimitOf(address,uint256,address,uint256,uint256)" };
            used.addr(b.terminal).uint(12).addr(env.reg.native_token).uint(4).uint(1);
            env.chain.on_call(*b.terminal_store, used, rpc_responder::words({ 200 }));
            test_same(cpp_int { 200 }, env.reader.used_payout_limit(b, 1, 12, 4, 1).value_or(0));
        };
        "failures open the rpc circuit"_test = [] {
            reader_env env {};
            for (size_t i = 0; i + 1 < env.cfg.rpc_breaker.failure_threshold; ++i)
                expect(throws<upstream_error>([&] { std::ignore = env.reader.token_supply(1, 99); }));
            expect(throws<circuit_open_error>([&] { std::ignore = env.reader.token_supply(1, 99); }));
            const auto num_requests = env.http.num_requests(rpc_url);
            expect(throws<circuit_open_error>([&] { std::ignore = env.reader.token_supply(1, 99); }));
            test_same(num_requests, env.http.num_requests(rpc_url));
        };
    };
};
