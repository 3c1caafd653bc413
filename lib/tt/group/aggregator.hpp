/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_GROUP_AGGREGATOR_HPP
#define TREASURY_TURBO_GROUP_AGGREGATOR_HPP

#include <optional>
#include <string>
#include <vector>
#include <tt/indexer/client.hpp>
#include <tt/protocol/chain-reader.hpp>

namespace treasury_turbo::group {
    using indexer::project_id_t;

    struct chain_totals {
        chain_id_t chain_id = 0;
        project_id_t project_id = 0;
        cpp_int balance {};
        cpp_int volume {};
        uint64_t payments_count = 0;
        cpp_int token_supply {};
        uint32_t decimals = indexer::default_decimals;
        uint32_t currency = indexer::currency_eth;
        // the on-chain token supply could not be read and is zeroed
        bool failed = false;
    };

    struct group_totals {
        // empty for a project deployed on a single chain
        std::optional<std::string> group_id {};
        cpp_int balance {};
        cpp_int volume {};
        uint64_t payments_count = 0;
        cpp_int token_supply {};
        uint32_t decimals = indexer::default_decimals;
        uint32_t currency = indexer::currency_eth;
        // balance, volume and payments count come from the indexer's group entity rather than a sum of the members
        bool pre_aggregated = false;
        std::vector<chain_totals> chains {};
    };

    struct holder {
        std::string address {};
        cpp_int balance {};
        // every chain the address holds tokens on, each listed once
        std::vector<chain_id_t> chains {};
        // share of the group's token supply in percent, zero when the supply is unknown
        double percent = 0.0;
    };

    struct holders_summary {
        std::vector<holder> holders {};
        size_t owners_count = 0;
        std::vector<chain_id_t> failed_chains {};
    };

    // Merges per-chain records by lower-cased address, the result is ordered by balance from the largest
    extern std::vector<holder> merge_participants(const std::vector<indexer::participant> &parts, const cpp_int &group_supply);
    // Distinct addresses with a positive balance
    extern size_t owners_count(const std::vector<indexer::participant> &parts);
    extern double percent_of(const cpp_int &part, const cpp_int &total);

    /*
     * Reconciles one logical project deployed on several chains.
     * The indexer's pre-aggregated group numbers are preferred over sums of the members.
     * A chain whose data cannot be fetched contributes a zeroed entry and is logged,
     * only the seed project's lookup is load-bearing.
     */
    struct aggregator {
        aggregator(indexer::client &idx, protocol::chain_reader &reader);

        // Empty when the indexer does not know the project
        std::optional<group_totals> totals(chain_id_t chain_id, project_id_t project_id, uint32_t version=indexer::default_version);
        holders_summary participants(const group_totals &totals);
    private:
        indexer::client &_idx;
        protocol::chain_reader &_reader;

        void _fill_supply(chain_totals &ct);
    };
}

#endif // !TREASURY_TURBO_GROUP_AGGREGATOR_HPP
