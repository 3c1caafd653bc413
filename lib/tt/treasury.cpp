/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <condition_variable>
#include <future>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <tt/logger.hpp>
#include <tt/mutex.hpp>
#include <tt/treasury.hpp>

namespace treasury_turbo {
    // Counts the tasks submitted on behalf of one call and blocks on scope exit until all of them have finished
    struct task_group {
        task_group() =default;
        task_group(const task_group &) =delete;

        ~task_group()
        {
            mutex::unique_lock lk { _mutex };
            _cv.wait(lk, [&] { return _pending == 0; });
        }

        void add()
        {
            mutex::scoped_lock lk { _mutex };
            ++_pending;
        }

        void done()
        {
            // notified under the lock since the waiter destroys the group as soon as it sees zero
            mutex::scoped_lock lk { _mutex };
            --_pending;
            _cv.notify_all();
        }
    private:
        mutex::mutex_type _mutex {};
        std::condition_variable _cv {};
        size_t _pending = 0;
    };

    struct treasury::impl {
        impl(const settings &cfg, http::client &http, const clock &clk, resilience::debug_sink &sink, const size_t num_workers):
            _pool { num_workers },
            _indexer_breaker { "indexer", resilience::breaker_options::from_settings(cfg.indexer_breaker), clk, sink },
            _rpc_breaker { "rpc", resilience::breaker_options::from_settings(cfg.rpc_breaker), clk, sink },
            _rpc { cfg, http, _rpc_breaker },
            _registry { protocol::contract_registry::from_settings(cfg) },
            _resolver { _registry, _rpc },
            _reader { _registry, _rpc, cfg.ttls, clk },
            _history { _reader },
            _indexer { cfg, http, _indexer_breaker },
            _aggregator { _indexer, _reader }
        {
        }

        ~impl()
        {
            _pool.join();
        }

        std::optional<treasury_snapshot> snapshot(const indexer::project_id_t project_id, const chain_id_t chain_id, const snapshot_options &opts)
        {
            treasury_snapshot snap {};
            snap.chain_id = chain_id;
            snap.project_id = project_id;
            snap.contracts = _resolver.resolve(chain_id, project_id);
            const auto &b = snap.contracts;
            // the tasks below reference this frame, every exit waits for them
            task_group tasks {};

            auto totals_f = _submit(tasks, [&] { return _aggregator.totals(chain_id, project_id); });
            auto ruleset_f = _submit(tasks, [&] { return _reader.current_ruleset(b, chain_id, project_id); });
            auto supply_f = _submit(tasks, [&] { return _reader.token_supply(chain_id, project_id); });
            auto symbol_f = _submit(tasks, [&] { return _reader.token_symbol(chain_id, project_id); });
            auto balance_f = _submit(tasks, [&] { return _reader.terminal_balance(b, chain_id, project_id); });
            auto issuance_f = _submit(tasks, [&] { return _indexer.issuance_rate_of(chain_id, project_id); });
            std::optional<std::future<std::vector<protocol::cycle_record>>> history_f {};
            if (opts.with_history)
                history_f.emplace(_submit(tasks, [&] { return _history.history(b, chain_id, project_id, opts.max_history); }));

            if (auto rs = _collect(snap, "ruleset", ruleset_f))
                snap.ruleset = std::move(*rs);
            snap.token_supply = _collect(snap, "token_supply", supply_f);
            if (auto sym = _collect(snap, "token_symbol", symbol_f))
                snap.token_symbol = std::move(*sym);
            if (auto bal = _collect(snap, "terminal_balance", balance_f))
                snap.terminal_balance = std::move(*bal);
            if (auto rate = _collect(snap, "issuance", issuance_f))
                snap.issuance = std::move(*rate);
            if (history_f) {
                if (auto hist = _collect(snap, "history", *history_f))
                    snap.history = std::move(*hist);
            }
            // the seed lookup is load-bearing so its failures propagate
            snap.totals = totals_f.get();
            if (!snap.totals)
                return {};

            std::optional<std::future<group::holders_summary>> holders_f {};
            if (opts.with_holders)
                holders_f.emplace(_submit(tasks, [&] { return _aggregator.participants(*snap.totals); }));

            if (snap.ruleset) {
                try {
                    snap.metadata = protocol::ruleset_metadata::decode(snap.ruleset->metadata);
                } catch (const decode_error &ex) {
                    logger::warn("project {} on chain {}: ruleset {} metadata is corrupt: {}", project_id, chain_id, snap.ruleset->id, ex.what());
                    snap.failed_slots.emplace_back("metadata");
                }
                _fill_payout(snap);
            }
            _fill_floor_price(snap);

            if (holders_f)
                snap.holders = _collect(snap, "holders", *holders_f);
            return snap;
        }

        std::vector<protocol::cycle_record> history(const indexer::project_id_t project_id, const chain_id_t chain_id, const size_t max_history)
        {
            const auto b = _resolver.resolve(chain_id, project_id);
            return _history.history(b, chain_id, project_id, max_history);
        }

        std::vector<protocol::cycle_record> upcoming(const indexer::project_id_t project_id, const chain_id_t chain_id, const size_t count)
        {
            const auto b = _resolver.resolve(chain_id, project_id);
            return _history.upcoming(b, chain_id, project_id, count);
        }

        protocol::contract_resolver &resolver()
        {
            return _resolver;
        }

        protocol::chain_reader &reader()
        {
            return _reader;
        }

        indexer::client &indexer_client()
        {
            return _indexer;
        }

        group::aggregator &group_aggregator()
        {
            return _aggregator;
        }

        resilience::circuit_breaker &indexer_breaker()
        {
            return _indexer_breaker;
        }

        resilience::circuit_breaker &rpc_breaker()
        {
            return _rpc_breaker;
        }
    private:
        boost::asio::thread_pool _pool;
        resilience::circuit_breaker _indexer_breaker;
        resilience::circuit_breaker _rpc_breaker;
        evm::rpc _rpc;
        protocol::contract_registry _registry;
        protocol::contract_resolver _resolver;
        protocol::chain_reader _reader;
        protocol::history_reconstructor _history;
        indexer::client _indexer;
        group::aggregator _aggregator;

        template<typename F>
        auto _submit(task_group &group, F &&f) -> std::future<decltype(f())>
        {
            using result_type = decltype(f());
            auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(f));
            auto fut = task->get_future();
            group.add();
            boost::asio::post(_pool, [task, &group] {
                (*task)();
                group.done();
            });
            return fut;
        }

        template<typename T>
        std::optional<T> _collect(treasury_snapshot &snap, const std::string_view slot, std::future<T> &fut)
        {
            try {
                return fut.get();
            } catch (const std::exception &ex) {
                logger::warn("project {} on chain {}: {} is unavailable: {}", snap.project_id, snap.chain_id, slot, ex.what());
                snap.failed_slots.emplace_back(slot);
                return {};
            }
        }

        void _fill_payout(treasury_snapshot &snap)
        {
            const auto &rs = *snap.ruleset;
            try {
                const auto limits = _reader.fund_access(snap.contracts, snap.chain_id, snap.project_id, rs.id);
                payout_summary ps {};
                // no configured limit means nothing can be paid out this cycle
                if (!limits.payout_limits.empty())
                    ps.limit = limits.payout_limits.front();
                if (ps.limit.amount != 0) {
                    const auto used = _reader.used_payout_limit(snap.contracts, snap.chain_id, snap.project_id, rs.cycle_number, ps.limit.currency);
                    if (!used)
                        logger::debug("project {} on chain {}: {} has no terminal store, assuming nothing has been paid out",
                            snap.project_id, snap.chain_id, snap.contracts.version);
                    ps.used = used.value_or(0);
                }
                auto balance = snap.terminal_balance;
                if (ps.limit.amount == protocol::unlimited_payout_limit && !balance) {
                    balance = _indexed_balance(snap);
                    if (!balance) {
                        logger::warn("project {} on chain {}: the payout limit is unlimited but the treasury balance is unknown",
                            snap.project_id, snap.chain_id);
                        snap.failed_slots.emplace_back("payout");
                        return;
                    }
                    logger::debug("project {} on chain {}: no terminal balance, using the indexed project balance {}",
                        snap.project_id, snap.chain_id, *balance);
                }
                ps.availability = protocol::available_payout(ps.limit.amount, ps.used, balance.value_or(0));
                snap.payout = std::move(ps);
            } catch (const std::exception &ex) {
                logger::warn("project {} on chain {}: payout availability is unavailable: {}", snap.project_id, snap.chain_id, ex.what());
                snap.failed_slots.emplace_back("payout");
            }
        }

        static std::optional<cpp_int> _indexed_balance(const treasury_snapshot &snap)
        {
            if (!snap.totals)
                return {};
            for (const auto &ct: snap.totals->chains) {
                if (ct.chain_id == snap.chain_id && ct.project_id == snap.project_id)
                    return ct.balance;
            }
            return {};
        }

        void _fill_floor_price(treasury_snapshot &snap)
        {
            if (!snap.metadata)
                return;
            // the group's numbers describe the whole treasury, the chain's ones only a shard of it
            std::optional<cpp_int> balance {};
            std::optional<cpp_int> supply {};
            if (snap.totals && snap.totals->token_supply > 0) {
                balance = snap.totals->balance;
                supply = snap.totals->token_supply;
            } else if (snap.terminal_balance && snap.token_supply) {
                balance = snap.terminal_balance;
                supply = snap.token_supply;
            }
            if (!balance || !supply)
                return;
            try {
                snap.floor_price = protocol::floor_price(*balance, *supply, snap.metadata->cash_out_tax_rate);
            } catch (const std::exception &ex) {
                logger::warn("project {} on chain {}: floor price is unavailable: {}", snap.project_id, snap.chain_id, ex.what());
                snap.failed_slots.emplace_back("floor_price");
            }
        }
    };

    treasury::treasury(const settings &cfg, http::client &http, const clock &clk, resilience::debug_sink &sink, const size_t num_workers):
        _impl { std::make_unique<impl>(cfg, http, clk, sink, num_workers) }
    {
    }

    treasury::~treasury() =default;

    std::optional<treasury_snapshot> treasury::snapshot(const indexer::project_id_t project_id, const chain_id_t chain_id, const snapshot_options &opts)
    {
        return _impl->snapshot(project_id, chain_id, opts);
    }

    std::vector<protocol::cycle_record> treasury::history(const indexer::project_id_t project_id, const chain_id_t chain_id, const size_t max_history)
    {
        return _impl->history(project_id, chain_id, max_history);
    }

    std::vector<protocol::cycle_record> treasury::upcoming(const indexer::project_id_t project_id, const chain_id_t chain_id, const size_t count)
    {
        return _impl->upcoming(project_id, chain_id, count);
    }

    protocol::contract_resolver &treasury::resolver()
    {
        return _impl->resolver();
    }

    protocol::chain_reader &treasury::reader()
    {
        return _impl->reader();
    }

    indexer::client &treasury::indexer()
    {
        return _impl->indexer_client();
    }

    group::aggregator &treasury::aggregator()
    {
        return _impl->group_aggregator();
    }

    resilience::circuit_breaker &treasury::indexer_breaker()
    {
        return _impl->indexer_breaker();
    }

    resilience::circuit_breaker &treasury::rpc_breaker()
    {
        return _impl->rpc_breaker();
    }
}
