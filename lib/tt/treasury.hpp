/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_TREASURY_HPP
#define TREASURY_TURBO_TREASURY_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <tt/group/aggregator.hpp>
#include <tt/protocol/calc.hpp>
#include <tt/protocol/history.hpp>
#include <tt/protocol/metadata.hpp>

namespace treasury_turbo {
    struct payout_summary {
        protocol::currency_amount limit {};
        cpp_int used {};
        protocol::payout_availability availability {};
    };

    struct treasury_snapshot {
        chain_id_t chain_id = 0;
        indexer::project_id_t project_id = 0;
        protocol::contract_bundle contracts {};
        std::optional<protocol::ruleset> ruleset {};
        std::optional<protocol::ruleset_metadata> metadata {};
        std::optional<group::group_totals> totals {};
        std::optional<group::holders_summary> holders {};
        std::optional<cpp_int> token_supply {};
        std::optional<std::string> token_symbol {};
        std::optional<cpp_int> terminal_balance {};
        std::optional<payout_summary> payout {};
        // the value of cashing out one whole token
        std::optional<cpp_int> floor_price {};
        std::optional<indexer::issuance_rate> issuance {};
        std::vector<protocol::cycle_record> history {};
        // names of the parts that could not be fetched and were left empty
        std::vector<std::string> failed_slots {};

        [[nodiscard]] bool complete() const noexcept
        {
            return failed_slots.empty();
        }
    };

    struct snapshot_options {
        bool with_holders = true;
        bool with_history = false;
        size_t max_history = protocol::default_max_history;
    };

    /*
     * The entry point of the library: owns the indexer and RPC circuit breakers, the caches
     * and a worker pool, and composes a project's financial view out of indexer data and chain reads.
     * Independent parts are fetched concurrently. A part that fails is logged and left empty;
     * only the contract resolution and the indexer lookup of the seed project are load-bearing.
     */
    struct treasury {
        static constexpr size_t default_num_workers = 8;

        explicit treasury(const settings &cfg, http::client &http=http::client_beast::get(), const clock &clk=clock_steady::get(),
            resilience::debug_sink &sink=resilience::debug_sink_log::get(), size_t num_workers=default_num_workers);
        ~treasury();

        // Empty when the indexer does not know the project
        std::optional<treasury_snapshot> snapshot(indexer::project_id_t project_id, chain_id_t chain_id, const snapshot_options &opts={});
        std::vector<protocol::cycle_record> history(indexer::project_id_t project_id, chain_id_t chain_id, size_t max_history=protocol::default_max_history);
        std::vector<protocol::cycle_record> upcoming(indexer::project_id_t project_id, chain_id_t chain_id, size_t count=protocol::default_upcoming_cycles);

        [[nodiscard]] protocol::contract_resolver &resolver();
        [[nodiscard]] protocol::chain_reader &reader();
        [[nodiscard]] indexer::client &indexer();
        [[nodiscard]] group::aggregator &aggregator();
        [[nodiscard]] resilience::circuit_breaker &indexer_breaker();
        [[nodiscard]] resilience::circuit_breaker &rpc_breaker();
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}

#endif // !TREASURY_TURBO_TREASURY_HPP
