/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <algorithm>
#include <stdexcept>
#include <tt/common/test.hpp>
#include <tt/indexer/indexer-mock.hpp>
#include <tt/protocol/chain-mock.hpp>
#include <tt/treasury.hpp>

using namespace treasury_turbo;

namespace {
    using evm::rpc_responder;
    using evm::abi::encoder;
    using indexer::indexer_mock;
    using protocol::chain_mock;

    static const std::string rpc_url { "http://rpc.local/eth" };
    static const cpp_int ether { "1000000000000000000" };

    // Indexer and chain share one HTTP mock the way they share one HTTP client in production
    struct treasury_env {
        settings cfg {};
        clock_manual clk {};
        resilience::debug_sink_memory sink {};
        http::client_mock http {};
        rpc_responder chain {};
        indexer::indexer_responder gql {};
        protocol::contract_registry reg = protocol::contract_registry::defaults();
        treasury tr { cfg, http, clk, sink, 2 };

        treasury_env()
        {
            cfg.rpc_endpoints[1] = { rpc_url };
            chain.install(http, rpc_url);
            gql.install(http, cfg.indexer_url);
        }

        void project_12(const bool original_generation=false, const cpp_int &payout_limit=ether)
        {
            const auto &v = original_generation ? reg.v5 : reg.v5_1;
            encoder ctl { "controllerOf(uint256)" };
            ctl.uint(12);
            chain.on_call(reg.shared.directory, ctl, rpc_responder::words({ rpc_responder::word_of(v.controller) }));

            protocol::ruleset rs {};
            rs.cycle_number = 3;
            rs.id = 1700000300;
            rs.based_on_id = 1700000200;
            rs.start = 1700000300;
            rs.duration = 604800;
            rs.weight = ether * 1000;
            rs.metadata = uint256_t { 5000 } << 16;
            encoder cur { "currentOf(uint256)" };
            cur.uint(12);
            chain.on_call(v.rulesets, cur, chain_mock::ruleset_result(rs));

            encoder supply { "totalSupplyOf(uint256)" };
            supply.uint(12);
            chain.on_call(reg.shared.tokens, supply, rpc_responder::words({ ether * 100 }));

            if (v.terminal_store) {
                encoder balance { "balanceOf(address,uint256,address)" };
                balance.addr(v.terminal).uint(12).addr(reg.native_token);
                chain.on_call(*v.terminal_store, balance, rpc_responder::words({ ether * 5 }));
                encoder used { "usedPayoutLimitOf(address,uint256,address,uint256,uint256)" };
                used.addr(v.terminal).uint(12).addr(reg.native_token).uint(3).uint(1);
                chain.on_call(*v.terminal_store, used, rpc_responder::words({ ether / 5 }));
            }

            encoder payouts { "payoutLimitsOf(uint256,uint256,address,address)" };
            payouts.uint(12).uint(rs.id).addr(v.terminal).addr(reg.native_token);
            chain.on_call(reg.shared.fund_access_limits, payouts, rpc_responder::words({ 32, 1, payout_limit, 1 }));
            encoder allowances { "surplusAllowancesOf(uint256,uint256,address,address)" };
            allowances.uint(12).uint(rs.id).addr(v.terminal).addr(reg.native_token);
            chain.on_call(reg.shared.fund_access_limits, allowances, rpc_responder::words({ 32, 0 }));


            gql.on("Project", [](const auto &) {
                return indexer_mock::project_json(1, 12, "1000000000000000000000");
            });
            gql.on("PayEventsHistory", [](const json::object &) {
                return indexer_mock::connection_json("payEvents", json::array {
                    json::object { { "amount", "1000000000000000000" }, { "newlyIssuedTokenCount", "1000000000000000000000" } }
                });
            });
            gql.on("Participants", [](const json::object &) {
                return indexer_mock::connection_json("participants", json::array {
                    indexer_mock::holder_json("0x00000000000000000000000000000000000000B1", 1, 12, "25000000000000000000")
                });
            });
        }
    };
}

suite treasury_suite = [] {
    "treasury"_test = [] {
        "snapshot"_test = [] {
            treasury_env env {};
            env.project_12();
            const auto snap = env.tr.snapshot(12, 1);
            expect((snap.has_value()) >> fatal);
            test_same(env.reg.v5_1.name, snap->contracts.version);
            expect(!snap->contracts.degraded);
            expect((snap->ruleset.has_value()) >> fatal);
            test_same(uint64_t { 3 }, snap->ruleset->cycle_number);
            expect((snap->metadata.has_value()) >> fatal);
            test_same(uint16_t { 5000 }, snap->metadata->cash_out_tax_rate);
            expect((snap->totals.has_value()) >> fatal);
            test_same(cpp_int { ether * 1000 }, snap->totals->balance);
            test_same(cpp_int { ether * 100 }, snap->totals->token_supply);
            expect(snap->token_supply == std::optional<cpp_int> { ether * 100 });
            expect(snap->terminal_balance == std::optional<cpp_int> { ether * 5 });

            expect((snap->payout.has_value()) >> fatal);
            test_same(protocol::payout_mode::limited, snap->payout->availability.mode);
            test_same(cpp_int { "800000000000000000" }, snap->payout->availability.available);

            // 1000 ETH behind 100 tokens at a 50% tax: one token returns 1000 * 0.01 * 0.505 ETH
            expect(snap->floor_price == std::optional<cpp_int> { cpp_int { "5050000000000000000" } });

            expect((snap->issuance.has_value()) >> fatal);
            test_close(1000.0, snap->issuance->tokens_per_unit);
            expect((snap->holders.has_value()) >> fatal);
            test_same(size_t { 1 }, snap->holders->owners_count);
            test_close(25.0, snap->holders->holders.at(0).percent);

            // tokenOf is not answered by the chain so only the symbol is missing
            expect(!snap->token_symbol.has_value());
            expect(snap->failed_slots == std::vector<std::string> { "token_symbol" });
            expect(!snap->complete());
        };
        "unlimited payout without a terminal store"_test = [] {
            treasury_env env {};
            env.project_12(true, protocol::unlimited_payout_limit);
            const auto snap = env.tr.snapshot(12, 1, snapshot_options { false, false });
            expect((snap.has_value()) >> fatal);
            test_same(env.reg.v5.name, snap->contracts.version);
            expect(!snap->terminal_balance.has_value());
            expect((snap->payout.has_value()) >> fatal);
            test_same(protocol::payout_mode::unlimited, snap->payout->availability.mode);
            // the indexed balance of the project stands in for the terminal balance
            test_same(cpp_int { ether * 1000 }, snap->payout->availability.available);
            expect(std::find(snap->failed_slots.begin(), snap->failed_slots.end(), "payout") == snap->failed_slots.end());
        };
        "unexpected slot failure"_test = [] {
            treasury_env env {};
            env.project_12();
            env.gql.on("PayEventsHistory", [](const json::object &) -> json::value {
                throw std::runtime_error("malformed pay events page");
            });
            const auto snap = env.tr.snapshot(12, 1);
            expect((snap.has_value()) >> fatal);
            expect(!snap->issuance.has_value());
            expect(snap->failed_slots == std::vector<std::string> { "token_symbol", "issuance" });
            expect((snap->payout.has_value()) >> fatal);
            test_same(cpp_int { "800000000000000000" }, snap->payout->availability.available);
        };
        "unknown project"_test = [] {
            treasury_env env {};
            env.gql.on("Project", [](const auto &) {
                return json::value { json::object { { "project", nullptr } } };
            });
            env.gql.on("PayEventsHistory", [](const json::object &) {
                return indexer_mock::connection_json("payEvents", json::array {});
            });
            expect(!env.tr.snapshot(404, 1).has_value());
        };
        "indexer failure is fatal"_test = [] {
            treasury_env env {};
            env.gql.on_error("Project", "indexer is reindexing");
            expect(throws<upstream_error>([&] { std::ignore = env.tr.snapshot(12, 1); }));
        };
        "degraded contracts"_test = [] {
            treasury_env env {};
            env.gql.on("Project", [](const auto &) {
                return indexer_mock::project_json(1, 12, "100");
            });
            const auto snap = env.tr.snapshot(12, 1, snapshot_options { false, false });
            expect((snap.has_value()) >> fatal);
            expect(snap->contracts.degraded);
            expect(!snap->ruleset.has_value());
            expect(!snap->payout.has_value());
            expect(!snap->floor_price.has_value());
            expect(!snap->holders.has_value());
            expect(!snap->failed_slots.empty());
        };
    };
};
