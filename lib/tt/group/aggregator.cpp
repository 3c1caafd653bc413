/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <algorithm>
#include <map>
#include <set>
#include <tt/evm/address.hpp>
#include <tt/group/aggregator.hpp>
#include <tt/logger.hpp>

namespace treasury_turbo::group {
    double percent_of(const cpp_int &part, const cpp_int &total)
    {
        if (total == 0)
            return 0.0;
        // six decimal digits of a percent survive the conversion to double
        const cpp_int scaled = part * 100'000'000 / total;
        return scaled.convert_to<double>() / 1'000'000.0;
    }

    std::vector<holder> merge_participants(const std::vector<indexer::participant> &parts, const cpp_int &group_supply)
    {
        std::map<std::string, holder> merged {};
        for (const auto &p: parts) {
            const auto addr = evm::normalize_address(p.address);
            auto [it, created] = merged.try_emplace(addr);
            auto &h = it->second;
            if (created)
                h.address = addr;
            h.balance += p.balance;
            if (std::find(h.chains.begin(), h.chains.end(), p.chain_id) == h.chains.end())
                h.chains.emplace_back(p.chain_id);
        }
        std::vector<holder> res {};
        res.reserve(merged.size());
        for (auto &[addr, h]: merged) {
            std::sort(h.chains.begin(), h.chains.end());
            h.percent = percent_of(h.balance, group_supply);
            res.emplace_back(std::move(h));
        }
        std::stable_sort(res.begin(), res.end(), [](const auto &a, const auto &b) {
            return a.balance > b.balance;
        });
        return res;
    }

    size_t owners_count(const std::vector<indexer::participant> &parts)
    {
        std::set<std::string> owners {};
        for (const auto &p: parts) {
            if (p.balance > 0)
                owners.emplace(evm::normalize_address(p.address));
        }
        return owners.size();
    }

    aggregator::aggregator(indexer::client &idx, protocol::chain_reader &reader):
        _idx { idx }, _reader { reader }
    {
    }

    void aggregator::_fill_supply(chain_totals &ct)
    {
        try {
            ct.token_supply = _reader.token_supply(ct.chain_id, ct.project_id);
        } catch (const std::exception &ex) {
            logger::warn("token supply of project {} on chain {} is unavailable: {}", ct.project_id, ct.chain_id, ex.what());
            ct.token_supply = 0;
            ct.failed = true;
        }
    }

    std::optional<group_totals> aggregator::totals(const chain_id_t chain_id, const project_id_t project_id, const uint32_t version)
    {
        const auto proj = _idx.project(chain_id, project_id, version);
        if (!proj)
            return {};
        group_totals gt {};
        gt.decimals = proj->decimals;
        gt.currency = proj->currency;

        std::optional<indexer::sucker_group> grp {};
        if (proj->sucker_group_id) {
            try {
                grp = _idx.sucker_group_by_id(chain_id, *proj->sucker_group_id);
            } catch (const std::exception &ex) {
                logger::warn("sucker group {} of project {} on chain {} is unavailable, using the project alone: {}",
                    *proj->sucker_group_id, project_id, chain_id, ex.what());
            }
        }

        if (!grp || grp->members.empty()) {
            chain_totals ct { proj->chain_id, proj->project_id, proj->balance, proj->volume, proj->payments_count, 0, proj->decimals, proj->currency, false };
            _fill_supply(ct);
            gt.balance = ct.balance;
            gt.volume = ct.volume;
            gt.payments_count = ct.payments_count;
            gt.token_supply = ct.token_supply;
            gt.chains.emplace_back(std::move(ct));
            return gt;
        }

        gt.group_id = grp->id;
        cpp_int sum_balance {}, sum_volume {}, sum_supply {};
        uint64_t sum_payments = 0;
        for (const auto &m: grp->members) {
            chain_totals ct { m.chain_id, m.project_id, m.balance, m.volume, m.payments_count, m.token_supply, m.decimals, m.currency, false };
            if (!grp->token_supply && ct.token_supply == 0)
                _fill_supply(ct);
            // amounts in different accounting units cannot be added without a price
            if (ct.currency == gt.currency && ct.decimals == gt.decimals) {
                sum_balance += ct.balance;
                sum_volume += ct.volume;
            } else if (!grp->balance || !grp->volume) {
                logger::warn("group {}: member {} on chain {} uses currency {} with {} decimals, left out of the sums",
                    grp->id, ct.project_id, ct.chain_id, ct.currency, ct.decimals);
            }
            sum_payments += ct.payments_count;
            sum_supply += ct.token_supply;
            gt.chains.emplace_back(std::move(ct));
        }
        gt.pre_aggregated = grp->balance.has_value();
        gt.balance = grp->balance.value_or(sum_balance);
        gt.volume = grp->volume.value_or(sum_volume);
        gt.payments_count = grp->payments_count.value_or(sum_payments);
        gt.token_supply = grp->token_supply.value_or(sum_supply);
        return gt;
    }

    holders_summary aggregator::participants(const group_totals &totals)
    {
        holders_summary res {};
        std::vector<indexer::participant> parts {};
        for (const auto &ct: totals.chains) {
            try {
                auto chain_parts = _idx.participants_of_project(ct.chain_id, ct.project_id);
                parts.insert(parts.end(), std::make_move_iterator(chain_parts.begin()), std::make_move_iterator(chain_parts.end()));
            } catch (const std::exception &ex) {
                logger::warn("holders of project {} on chain {} are unavailable: {}", ct.project_id, ct.chain_id, ex.what());
                res.failed_chains.emplace_back(ct.chain_id);
            }
        }
        res.owners_count = owners_count(parts);
        res.holders = merge_participants(parts, totals.token_supply);
        return res;
    }
}
