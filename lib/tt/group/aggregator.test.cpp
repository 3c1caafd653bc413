/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <tt/common/test.hpp>
#include <tt/group/aggregator.hpp>
#include <tt/indexer/indexer-mock.hpp>
#include <tt/protocol/chain-mock.hpp>

using namespace treasury_turbo;
using namespace treasury_turbo::group;

namespace {
    using indexer::indexer_mock;

    struct group_env {
        protocol::chain_mock chain {};
        indexer_mock indexer_env {};
        aggregator agg { indexer_env.idx, chain.reader };

        void supply_of(const project_id_t project_id, const cpp_int &supply)
        {
            evm::abi::encoder call { "totalSupplyOf(uint256)" };
            call.uint(project_id);
            chain.chain.on_call(chain.reg.shared.tokens, call, evm::rpc_responder::words({ supply }));
        }

        void group_of_two(const bool with_totals)
        {
            indexer_env.gql.on("Project", [](const auto &) {
                return indexer_mock::project_json(1, 12, "700", std::string { "group-a" });
            });
            indexer_env.gql.on("SuckerGroupById", [with_totals](const auto &) {
                json::object grp {
                    { "id", "group-a" },
                    { "projects", json::object { { "items", json::array {
                        json::object { { "projectId", 12 }, { "chainId", 1 }, { "balance", "700" }, { "volume", "1000" }, { "paymentsCount", 4 },
                            { "tokenSupply", "6000" }, { "decimals", 18 }, { "currency", 1 } },
                        json::object { { "projectId", 4 }, { "chainId", 10 }, { "balance", "300" }, { "volume", "500" }, { "paymentsCount", 2 },
                            { "tokenSupply", "4000" }, { "decimals", 18 }, { "currency", 1 } }
                    } } } }
                };
                if (with_totals) {
                    grp.emplace("balance", "1200");
                    grp.emplace("volume", "1600");
                    grp.emplace("paymentsCount", 6);
                    grp.emplace("tokenSupply", "10000");
                }
                return json::value { json::object { { "suckerGroup", std::move(grp) } } };
            });
        }
    };
}

suite group_aggregator_suite = [] {
    "group::aggregator"_test = [] {
        "merge participants"_test = [] {
            const std::vector<indexer::participant> parts {
                { "0xAbC0000000000000000000000000000000000001", 1, 12, 600, 0 },
                { "0xabc0000000000000000000000000000000000001", 10, 4, 400, 0 },
                { "0xabc0000000000000000000000000000000000001", 10, 4, 0, 0 },
                { "0x0000000000000000000000000000000000000002", 10, 4, 1000, 0 }
            };
            const auto holders = merge_participants(parts, 4000);
            expect((holders.size() == 2U) >> fatal);
            test_same(std::string { "0xabc0000000000000000000000000000000000001" }, holders.at(0).address);
            test_same(cpp_int { 1000 }, holders.at(0).balance);
            expect(holders.at(0).chains == std::vector<chain_id_t> { 1, 10 });
            test_close(25.0, holders.at(0).percent);
            expect(holders.at(1).chains == std::vector<chain_id_t> { 10 });
            test_same(size_t { 2 }, owners_count(parts));
        };
        "percent of an unknown supply"_test = [] {
            test_same(0.0, percent_of(10, 0));
            test_close(50.0, percent_of(1, 2));
            test_close(0.000001, percent_of(1, 100'000'000), 1e-6);
        };
        "unknown project"_test = [] {
            group_env env {};
            env.indexer_env.gql.on("Project", [](const auto &) {
                return json::value { json::object { { "project", nullptr } } };
            });
            expect(!env.agg.totals(1, 77).has_value());
        };
        "singleton project"_test = [] {
            group_env env {};
            env.indexer_env.gql.on("Project", [](const auto &) {
                return indexer_mock::project_json(1, 12, "5000");
            });
            env.supply_of(12, 800);
            const auto gt = env.agg.totals(1, 12);
            expect((gt.has_value()) >> fatal);
            expect(!gt->group_id.has_value());
            expect(!gt->pre_aggregated);
            test_same(cpp_int { 5000 }, gt->balance);
            test_same(cpp_int { 800 }, gt->token_supply);
            expect((gt->chains.size() == 1U) >> fatal);
            expect(!gt->chains.at(0).failed);
        };
        "pre-aggregated group totals win"_test = [] {
            group_env env {};
            env.group_of_two(true);
            const auto gt = env.agg.totals(1, 12);
            expect((gt.has_value()) >> fatal);
            expect(gt->group_id == std::optional<std::string> { "group-a" });
            expect(gt->pre_aggregated);
            test_same(cpp_int { 1200 }, gt->balance);
            test_same(cpp_int { 1600 }, gt->volume);
            test_same(uint64_t { 6 }, gt->payments_count);
            test_same(cpp_int { 10000 }, gt->token_supply);
            test_same(size_t { 2 }, gt->chains.size());
            test_same(size_t { 0 }, env.chain.http.requests().size());
        };
        "member sums without group totals"_test = [] {
            group_env env {};
            env.group_of_two(false);
            const auto gt = env.agg.totals(1, 12);
            expect((gt.has_value()) >> fatal);
            expect(!gt->pre_aggregated);
            test_same(cpp_int { 1000 }, gt->balance);
            test_same(cpp_int { 1500 }, gt->volume);
            test_same(uint64_t { 6 }, gt->payments_count);
            test_same(cpp_int { 10000 }, gt->token_supply);
        };
        "stable coin members are not added to ether sums"_test = [] {
            group_env env {};
            env.indexer_env.gql.on("Project", [](const auto &) {
                return indexer_mock::project_json(1, 12, "700", std::string { "group-b" });
            });
            env.indexer_env.gql.on("SuckerGroupById", [](const auto &) {
                return json::value { json::object { { "suckerGroup", json::object {
                    { "id", "group-b" },
                    { "tokenSupply", "1" },
                    { "projects", json::object { { "items", json::array {
                        json::object { { "projectId", 12 }, { "chainId", 1 }, { "balance", "700" }, { "decimals", 18 }, { "currency", 1 } },
                        json::object { { "projectId", 4 }, { "chainId", 10 }, { "balance", "300" }, { "decimals", 6 }, { "currency", 1 } }
                    } } } }
                } } } };
            });
            const auto gt = env.agg.totals(1, 12);
            expect((gt.has_value()) >> fatal);
            test_same(cpp_int { 700 }, gt->balance);
            test_same(indexer::currency_usd, gt->chains.at(1).currency);
        };
        "failing chain gives a zeroed entry"_test = [] {
            group_env env {};
            env.indexer_env.gql.on("Project", [](const auto &) {
                return indexer_mock::project_json(1, 12, "700", std::string { "group-a" });
            });
            env.indexer_env.gql.on("SuckerGroupById", [](const auto &) {
                return json::value { json::object { { "suckerGroup", json::object {
                    { "id", "group-a" },
                    { "projects", json::object { { "items", json::array {
                        json::object { { "projectId", 12 }, { "chainId", 1 }, { "balance", "700" } },
                        json::object { { "projectId", 4 }, { "chainId", 8453 }, { "balance", "300" } }
                    } } } }
                } } } };
            });
            env.supply_of(12, 900);
            const auto gt = env.agg.totals(1, 12);
            expect((gt.has_value()) >> fatal);
            expect((gt->chains.size() == 2U) >> fatal);
            expect(!gt->chains.at(0).failed);
            expect(gt->chains.at(1).failed);
            test_same(cpp_int { 0 }, gt->chains.at(1).token_supply);
            test_same(cpp_int { 900 }, gt->token_supply);
            test_same(cpp_int { 1000 }, gt->balance);
        };
        "unavailable group falls back to the project"_test = [] {
            group_env env {};
            env.indexer_env.gql.on("Project", [](const auto &) {
                return indexer_mock::project_json(1, 12, "700", std::string { "group-a" });
            });
            env.indexer_env.gql.on_error("SuckerGroupById", "timeout");
            env.supply_of(12, 50);
            const auto gt = env.agg.totals(1, 12);
            expect((gt.has_value()) >> fatal);
            expect(!gt->group_id.has_value());
            test_same(cpp_int { 700 }, gt->balance);
        };
        "group participants"_test = [] {
            group_env env {};
            env.group_of_two(true);
            env.indexer_env.gql.on("Participants", [](const json::object &vars) {
                const auto chain_id = vars.at("chainId").to_number<uint64_t>();
                if (chain_id == 1) {
                    return indexer_mock::connection_json("participants", json::array {
                        indexer_mock::holder_json("0xAA00000000000000000000000000000000000001", 1, 12, "3000"),
                        indexer_mock::holder_json("0x00000000000000000000000000000000000000b2", 1, 12, "1000")
                    });
                }
                return indexer_mock::connection_json("participants", json::array {
                    indexer_mock::holder_json("0xaa00000000000000000000000000000000000001", 10, 4, "2000")
                });
            });
            const auto gt = env.agg.totals(1, 12);
            expect((gt.has_value()) >> fatal);
            const auto sum = env.agg.participants(*gt);
            test_same(size_t { 2 }, sum.owners_count);
            expect(sum.failed_chains.empty());
            expect((sum.holders.size() == 2U) >> fatal);
            test_same(cpp_int { 5000 }, sum.holders.at(0).balance);
            test_close(50.0, sum.holders.at(0).percent);
            expect(sum.holders.at(0).chains == std::vector<chain_id_t> { 1, 10 });
            test_close(10.0, sum.holders.at(1).percent);
        };
        "participants of a failing chain are skipped"_test = [] {
            group_env env {};
            env.group_of_two(true);
            env.indexer_env.gql.on("Participants", [](const json::object &vars) {
                if (vars.at("chainId").to_number<uint64_t>() == 10)
                    throw upstream_error("chain 10 is not indexed yet");
                return indexer_mock::connection_json("participants", json::array {
                    indexer_mock::holder_json("0x00000000000000000000000000000000000000b2", 1, 12, "1000")
                });
            });
            const auto gt = env.agg.totals(1, 12);
            expect((gt.has_value()) >> fatal);
            const auto sum = env.agg.participants(*gt);
            expect(sum.failed_chains == std::vector<chain_id_t> { 10 });
            test_same(size_t { 1 }, sum.owners_count);
        };
    };
};
