/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <tt/common/test.hpp>
#include <tt/protocol/chain-mock.hpp>
#include <tt/protocol/history.hpp>

using namespace treasury_turbo;
using namespace treasury_turbo::protocol;

namespace {
    ruleset make_ruleset(const uint64_t id, const uint64_t based_on_id, const uint64_t cycle, const uint64_t start, const uint64_t duration,
        const cpp_int &weight, const uint32_t cut=0)
    {
        ruleset rs {};
        rs.id = id;
        rs.based_on_id = based_on_id;
        rs.cycle_number = cycle;
        rs.start = start;
        rs.duration = duration;
        rs.weight = weight;
        rs.weight_cut_percent = cut;
        return rs;
    }

    // What currentOf reports for a base that has been rolling over by itself
    ruleset rolled(const ruleset &base, const uint64_t cycle)
    {
        auto rs = base;
        const auto after = cycle - base.cycle_number;
        rs.cycle_number = cycle;
        rs.start = base.start + after * base.duration;
        rs.weight = decayed_weight(base.weight, base.weight_cut_percent, after);
        return rs;
    }

    stored_ruleset_fn stored_from(const std::vector<ruleset> &items)
    {
        return [items](const uint64_t id) -> std::optional<ruleset> {
            for (const auto &rs: items) {
                if (rs.id == id)
                    return rs;
            }
            return {};
        };
    }
}

suite protocol_history_suite = [] {
    "protocol::history"_test = [] {
        "decayed weight"_test = [] {
            test_same(cpp_int { 1000 }, decayed_weight(1000, 0, 25));
            test_same(cpp_int { 900 }, decayed_weight(1000, 100'000'000, 1));
            test_same(cpp_int { 125 }, decayed_weight(1000, 500'000'000, 3));
            // integer division after every cycle
            test_same(cpp_int { 7 }, decayed_weight(10, 250'000'000, 1));
            test_same(cpp_int { 5 }, decayed_weight(10, 250'000'000, 2));
            test_same(cpp_int { 0 }, decayed_weight(1000, max_ppb, 1));
            expect(throws<error>([] { std::ignore = decayed_weight(1000, max_ppb + 1, 1); }));
        };
        "constant weight"_test = [] {
            const auto base = make_ruleset(100, 0, 1, 1'000, 10, cpp_int { "1000000000000000000" });
            const auto cur = rolled(base, 5);
            const auto bases = collect_bases(cur, stored_from({ base }));
            test_same(size_t { 1 }, bases.size());
            const auto hist = expand_history(cur, bases, 20);
            expect((hist.size() == 5U) >> fatal);
            for (size_t i = 0; i < hist.size(); ++i) {
                test_same(base.weight, hist[i].weight);
                test_same(uint64_t { 5 - i }, hist[i].cycle_number);
                test_same(uint64_t { 1'000 + (4 - i) * 10 }, hist[i].start);
                test_same(i == 0 ? cycle_status::current : cycle_status::past, hist[i].status);
            }
        };
        "decaying weight"_test = [] {
            const auto base = make_ruleset(100, 0, 1, 1'000, 10, cpp_int { "1000000000000000000" }, 100'000'000);
            const auto cur = rolled(base, 8);
            const auto cycles = expand_cycles(cur, collect_bases(cur, stored_from({ base })));
            expect((cycles.size() == 8U) >> fatal);
            for (size_t i = 1; i < cycles.size(); ++i)
                expect(cycles[i].weight < cycles[i - 1].weight);
            test_same(cpp_int { "900000000000000000" }, cycles[1].weight);
            test_same(cur.weight, cycles.back().weight);
        };
        "reconfigurations"_test = [] {
            const auto a = make_ruleset(100, 0, 1, 1'000, 100, 1'000'000);
            const auto b = make_ruleset(200, 100, 4, 1'300, 50, 2'000'000, 500'000'000);
            const auto cur = rolled(b, 6);
            const auto bases = collect_bases(cur, stored_from({ a, b }));
            expect((bases.size() == 2U) >> fatal);
            test_same(uint64_t { 100 }, bases[0].id);
            const auto cycles = expand_cycles(cur, bases);
            expect((cycles.size() == 6U) >> fatal);
            test_same(uint64_t { 100 }, cycles[2].ruleset_id);
            test_same(uint64_t { 1'200 }, cycles[2].start);
            test_same(cpp_int { 1'000'000 }, cycles[2].weight);
            test_same(uint64_t { 200 }, cycles[3].ruleset_id);
            test_same(uint64_t { 1'300 }, cycles[3].start);
            test_same(cpp_int { 2'000'000 }, cycles[3].weight);
            test_same(uint64_t { 1'350 }, cycles[4].start);
            test_same(cpp_int { 1'000'000 }, cycles[4].weight);
            test_same(cpp_int { 500'000 }, cycles[5].weight);
            test_same(cycle_status::current, cycles[5].status);
        };
        "zero duration"_test = [] {
            const auto a = make_ruleset(100, 0, 1, 1'000, 0, 1'000);
            const auto cur = make_ruleset(300, 100, 3, 5'000, 0, 3'000);
            const auto cycles = expand_cycles(cur, collect_bases(cur, stored_from({ a, cur })));
            expect((cycles.size() == 2U) >> fatal);
            test_same(uint64_t { 1 }, cycles[0].cycle_number);
            test_same(uint64_t { 1'000 }, cycles[0].start);
            test_same(uint64_t { 3 }, cycles[1].cycle_number);
        };
        "truncation"_test = [] {
            const auto base = make_ruleset(100, 0, 1, 0, 10, 1'000);
            const auto cur = rolled(base, 10);
            const auto hist = expand_history(cur, collect_bases(cur, stored_from({ base })), 3);
            expect((hist.size() == 3U) >> fatal);
            test_same(uint64_t { 10 }, hist[0].cycle_number);
            test_same(uint64_t { 9 }, hist[1].cycle_number);
            test_same(uint64_t { 8 }, hist[2].cycle_number);
            expect(expand_history(cur, {}, 0).empty());
        };
        "long timeline"_test = [] {
            const auto base = make_ruleset(100, 0, 1, 0, 3'600, cpp_int { "1000000000000000000000000" }, 1'000'000);
            const auto cur = rolled(base, 10'000);
            const auto bases = collect_bases(cur, stored_from({ base }));
            const auto hist = expand_history(cur, bases, 20);
            expect((hist.size() == 20U) >> fatal);
            test_same(uint64_t { 10'000 }, hist[0].cycle_number);
            test_same(cur.weight, hist[0].weight);
            test_same(uint64_t { 9'981 }, hist[19].cycle_number);
            test_same(uint64_t { 9'980 * 3'600 }, hist[19].start);
            test_same(decayed_weight(base.weight, base.weight_cut_percent, 9'980), hist[19].weight);
            for (size_t i = 1; i < hist.size(); ++i)
                expect(hist[i].weight > hist[i - 1].weight);
            const auto all = expand_cycles(cur, bases);
            test_same(size_t { 10'000 }, all.size());
            test_same(hist[1].weight, all[all.size() - 2].weight);
        };
        "hop limit"_test = [] {
            std::vector<ruleset> chain {};
            for (uint64_t i = 1; i <= 60; ++i)
                chain.push_back(make_ruleset(i, i - 1, i, i * 10, 10, 1'000));
            size_t num_lookups = 0;
            const auto stored = stored_from(chain);
            const auto bases = collect_bases(chain.back(), [&](const uint64_t id) {
                ++num_lookups;
                return stored(id);
            });
            test_same(max_based_on_hops, bases.size());
            test_same(max_based_on_hops, num_lookups);
            test_same(uint64_t { 11 }, bases.front().cycle_number);
            test_same(uint64_t { 60 }, bases.back().cycle_number);
            const auto cycles = expand_cycles(chain.back(), bases);
            test_same(size_t { 50 }, cycles.size());
            test_same(uint64_t { 11 }, cycles.front().cycle_number);
        };
        "linked twice"_test = [] {
            const auto a = make_ruleset(100, 200, 1, 1'000, 10, 1'000);
            const auto b = make_ruleset(200, 100, 2, 1'010, 10, 1'000);
            test_same(size_t { 2 }, collect_bases(b, stored_from({ a, b })).size());
        };
        "missing stored current"_test = [] {
            const auto cur = make_ruleset(100, 0, 1, 1'000, 10, 1'000);
            const auto bases = collect_bases(cur, stored_from({}));
            expect((bases.size() == 1U) >> fatal);
            expect(bases[0] == cur);
        };
        "upcoming cycles"_test = [] {
            const auto next = make_ruleset(100, 0, 5, 1'000, 10, 1'000, 100'000'000);
            const auto cycles = project_upcoming(next, 3);
            expect((cycles.size() == 3U) >> fatal);
            test_same(uint64_t { 5 }, cycles[0].cycle_number);
            test_same(uint64_t { 1'020 }, cycles[2].start);
            test_same(cpp_int { 1'000 }, cycles[0].weight);
            test_same(cpp_int { 810 }, cycles[2].weight);
            test_same(cycle_status::upcoming, cycles[2].status);
            expect(project_upcoming(make_ruleset(100, 0, 5, 1'000, 0, 1'000), 3).empty());
        };
        "reconstructor"_test = [] {
            chain_mock env {};
            const auto &ver = env.reg.v5_1;
            const auto a = make_ruleset(100, 0, 1, 1'000, 100, 1'000'000);
            const auto b = make_ruleset(200, 100, 3, 1'200, 100, 1'000'000, 100'000'000);
            const auto cur = rolled(b, 4);
            env.current_ruleset(ver, 12, cur);
            env.stored_ruleset(ver, 12, a);
            env.stored_ruleset(ver, 12, b);
            history_reconstructor rec { env.reader };
            const auto bundle = env.bundle(ver);
            const auto hist = rec.history(bundle, chain_mock::chain_id, 12);
            expect((hist.size() == 4U) >> fatal);
            test_same(cycle_status::current, hist[0].status);
            test_same(cpp_int { 900'000 }, hist[0].weight);
            test_same(uint64_t { 200 }, hist[1].ruleset_id);
            test_same(uint64_t { 100 }, hist[3].ruleset_id);
            const auto num_requests = env.http.num_requests(env.rpc_url);
            expect(rec.history(bundle, chain_mock::chain_id, 12, 2) == std::vector<cycle_record> { hist[0], hist[1] });
            test_same(num_requests, env.http.num_requests(env.rpc_url));
        };
        "reconstructor without a ruleset"_test = [] {
            chain_mock env {};
            env.current_ruleset(env.reg.v5_1, 13, ruleset {});
            history_reconstructor rec { env.reader };
            expect(rec.history(env.bundle(env.reg.v5_1), chain_mock::chain_id, 13).empty());
        };
        "upcoming from the queue"_test = [] {
            chain_mock env {};
            const auto &ver = env.reg.v5_1;
            const auto cur = make_ruleset(200, 100, 4, 1'300, 100, 1'000'000);
            const auto queued = make_ruleset(300, 200, 5, 1'400, 50, 2'000'000);
            env.current_ruleset(ver, 12, cur);
            env.queued_ruleset(ver, 12, queued, approval_status::approved);
            history_reconstructor rec { env.reader };
            const auto cycles = rec.upcoming(env.bundle(ver), chain_mock::chain_id, 12, 2);
            expect((cycles.size() == 2U) >> fatal);
            test_same(uint64_t { 300 }, cycles[0].ruleset_id);
            test_same(uint64_t { 1'450 }, cycles[1].start);
        };
        "upcoming rolls the current ruleset"_test = [] {
            chain_mock env {};
            const auto &ver = env.reg.v5_1;
            const auto cur = make_ruleset(200, 100, 4, 1'300, 100, 1'000'000, 500'000'000);
            env.current_ruleset(ver, 12, cur);
            env.queued_ruleset(ver, 12, cur, approval_status::empty);
            history_reconstructor rec { env.reader };
            const auto cycles = rec.upcoming(env.bundle(ver), chain_mock::chain_id, 12, 2);
            expect((cycles.size() == 2U) >> fatal);
            test_same(uint64_t { 5 }, cycles[0].cycle_number);
            test_same(uint64_t { 1'400 }, cycles[0].start);
            test_same(cpp_int { 500'000 }, cycles[0].weight);
            test_same(cpp_int { 250'000 }, cycles[1].weight);
        };
    };
};
