/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <algorithm>
#include <deque>
#include <iterator>
#include <set>
#include <tt/logger.hpp>
#include <tt/protocol/history.hpp>

namespace treasury_turbo::protocol {
    cpp_int decayed_weight(const cpp_int &weight, const uint32_t weight_cut_percent, const uint64_t num_cycles)
    {
        if (weight_cut_percent > max_ppb)
            throw error("weightCutPercent {} is above {}", weight_cut_percent, max_ppb);
        cpp_int w = weight;
        if (weight_cut_percent == 0)
            return w;
        for (uint64_t i = 0; i < num_cycles && w != 0; ++i)
            w = w * (max_ppb - weight_cut_percent) / max_ppb;
        return w;
    }

    std::vector<ruleset> collect_bases(const ruleset &current, const stored_ruleset_fn &stored_of, const size_t max_hops)
    {
        std::vector<ruleset> bases {};
        std::set<uint64_t> seen {};
        uint64_t next_id = current.id;
        while (next_id != 0 && bases.size() < max_hops) {
            if (!seen.emplace(next_id).second) {
                logger::warn("ruleset {} is linked twice in its basedOnId chain", next_id);
                break;
            }
            auto rs = stored_of(next_id);
            if (!rs) {
                // the current ruleset is always usable as its own base
                if (next_id == current.id)
                    rs = current;
                else
                    break;
            }
            next_id = rs->based_on_id;
            bases.emplace_back(std::move(*rs));
        }
        std::sort(bases.begin(), bases.end(), [](const auto &a, const auto &b) {
            return a.cycle_number < b.cycle_number;
        });
        return bases;
    }

    static cycle_record make_record(const ruleset &rs, const uint64_t cycle, const uint64_t start, cpp_int weight, const cycle_status status)
    {
        return cycle_record { cycle, rs.id, start, rs.duration, std::move(weight), rs.weight_cut_percent, rs.metadata, status };
    }

    std::vector<cycle_record> expand_cycles(const ruleset &current, const std::vector<ruleset> &bases, const size_t max_records)
    {
        if (max_records == 0)
            return {};
        std::deque<cycle_record> past {};
        for (size_t i = 0; i < bases.size(); ++i) {
            const auto &base = bases[i];
            // a base is in force until the next one takes effect
            uint64_t end = current.cycle_number;
            if (i + 1 < bases.size())
                end = std::min(end, bases[i + 1].cycle_number);
            // rulesets without a duration stay at their first cycle until replaced
            if (base.duration == 0)
                end = std::min(end, base.cycle_number + 1);
            const uint64_t first = std::max(base.cycle_number, uint64_t { 1 });
            if (first >= end)
                continue;
            auto weight = decayed_weight(base.weight, base.weight_cut_percent, first - base.cycle_number);
            for (uint64_t cycle = first; cycle < end; ++cycle) {
                if (cycle > first)
                    weight = decayed_weight(weight, base.weight_cut_percent, 1);
                const auto cycles_after_base = cycle - base.cycle_number;
                const auto start = cycles_after_base == 0 ? base.start : base.start + cycles_after_base * base.duration;
                past.push_back(make_record(base, cycle, start, weight, cycle_status::past));
                // one slot stays reserved for the current cycle
                if (past.size() >= max_records)
                    past.pop_front();
            }
        }
        std::vector<cycle_record> cycles { std::make_move_iterator(past.begin()), std::make_move_iterator(past.end()) };
        cycles.push_back(make_record(current, current.cycle_number, current.start, current.weight, cycle_status::current));
        return cycles;
    }

    std::vector<cycle_record> expand_history(const ruleset &current, const std::vector<ruleset> &bases, const size_t max_history)
    {
        auto cycles = expand_cycles(current, bases, max_history);
        std::reverse(cycles.begin(), cycles.end());
        return cycles;
    }

    std::vector<cycle_record> project_upcoming(const ruleset &next, const size_t count)
    {
        std::vector<cycle_record> cycles {};
        if (next.duration == 0)
            return cycles;
        cpp_int weight = next.weight;
        for (uint64_t i = 0; i < count; ++i) {
            if (i > 0)
                weight = decayed_weight(weight, next.weight_cut_percent, 1);
            cycles.push_back(make_record(next, next.cycle_number + i, next.start + i * next.duration, weight, cycle_status::upcoming));
        }
        return cycles;
    }

    history_reconstructor::history_reconstructor(chain_reader &reader): _reader { reader }
    {
    }

    std::vector<cycle_record> history_reconstructor::history(const contract_bundle &b, const chain_id_t chain_id, const project_id_t project_id, const size_t max_history)
    {
        const auto cur = _reader.current_ruleset(b, chain_id, project_id);
        if (!cur || max_history == 0)
            return {};
        const history_key key { chain_id, project_id, cur->cycle_number, max_history };
        auto past = _past.get(key);
        if (!past) {
            const auto bases = collect_bases(*cur, [&](const uint64_t id) {
                return _reader.ruleset_of(b, chain_id, project_id, id);
            });
            auto all = expand_cycles(*cur, bases, max_history);
            all.pop_back();
            if (!b.degraded)
                _past.set(key, all);
            past.emplace(std::move(all));
        }
        std::vector<cycle_record> res {};
        res.reserve(past->size() + 1);
        res.push_back(make_record(*cur, cur->cycle_number, cur->start, cur->weight, cycle_status::current));
        for (auto it = past->rbegin(); it != past->rend() && res.size() < max_history; ++it)
            res.emplace_back(*it);
        return res;
    }

    std::vector<cycle_record> history_reconstructor::upcoming(const contract_bundle &b, const chain_id_t chain_id, const project_id_t project_id, const size_t count)
    {
        const auto cur = _reader.current_ruleset(b, chain_id, project_id);
        if (!cur)
            return {};
        const auto queued = _reader.latest_queued_ruleset(b, chain_id, project_id);
        if (queued && queued->rs.cycle_number > cur->cycle_number && queued->status != approval_status::failed)
            return project_upcoming(queued->rs, count);
        if (cur->duration == 0)
            return {};
        auto next = *cur;
        next.cycle_number = cur->cycle_number + 1;
        next.start = cur->start + cur->duration;
        next.weight = decayed_weight(cur->weight, cur->weight_cut_percent, 1);
        return project_upcoming(next, count);
    }
}
