/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_PROTOCOL_HISTORY_HPP
#define TREASURY_TURBO_PROTOCOL_HISTORY_HPP

#include <functional>
#include <limits>
#include <optional>
#include <vector>
#include <tt/protocol/chain-reader.hpp>

namespace treasury_turbo::protocol {
    static constexpr size_t max_based_on_hops = 50;
    static constexpr size_t default_max_history = 20;
    static constexpr size_t default_upcoming_cycles = 20;

    enum class cycle_status { past, current, upcoming };

    struct cycle_record {
        uint64_t cycle_number = 0;
        uint64_t ruleset_id = 0;
        uint64_t start = 0;
        uint64_t duration = 0;
        cpp_int weight {};
        uint32_t weight_cut_percent = 0;
        uint256_t metadata {};
        cycle_status status = cycle_status::past;

        bool operator==(const cycle_record &) const =default;
    };

    using stored_ruleset_fn = std::function<std::optional<ruleset>(uint64_t ruleset_id)>;

    // Applies the per-cycle cut the same way the rulesets contract does: one integer division per cycle
    extern cpp_int decayed_weight(const cpp_int &weight, uint32_t weight_cut_percent, uint64_t num_cycles);

    /*
     * Follows basedOnId links starting with the stored record of the current ruleset.
     * Stops at a zero link, a missing record, a repeated id or after max_hops records.
     * Returns the distinct stored configurations sorted by the cycle number they took effect at.
     */
    extern std::vector<ruleset> collect_bases(const ruleset &current, const stored_ruleset_fn &stored_of, size_t max_hops=max_based_on_hops);

    /*
     * Cycles from the earliest known base to the current one in ascending order, the last one marked current.
     * Weights are carried forward one cycle at a time and only the newest max_records records are kept.
     */
    extern std::vector<cycle_record> expand_cycles(const ruleset &current, const std::vector<ruleset> &bases,
        size_t max_records=std::numeric_limits<size_t>::max());

    // The most recent max_history records of expand_cycles, newest first
    extern std::vector<cycle_record> expand_history(const ruleset &current, const std::vector<ruleset> &bases, size_t max_history=default_max_history);

    // Cycles following next, which is either a queued ruleset or the current one moved one cycle forward
    extern std::vector<cycle_record> project_upcoming(const ruleset &next, size_t count=default_upcoming_cycles);

    struct history_reconstructor {
        explicit history_reconstructor(chain_reader &reader);

        // Empty when the project has no active ruleset
        std::vector<cycle_record> history(const contract_bundle &b, chain_id_t chain_id, project_id_t project_id, size_t max_history=default_max_history);
        // Empty when the project has no active ruleset or its rulesets do not advance by time
        std::vector<cycle_record> upcoming(const contract_bundle &b, chain_id_t chain_id, project_id_t project_id, size_t count=default_upcoming_cycles);
    private:
        using history_key = std::tuple<chain_id_t, project_id_t, uint64_t, size_t>;

        chain_reader &_reader;
        // cycles before the current one never change so they are remembered for good
        ttl_cache<history_key, std::vector<cycle_record>> _past {};
    };
}

namespace fmt {
    template<>
    struct formatter<treasury_turbo::protocol::cycle_status>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using treasury_turbo::protocol::cycle_status;
            switch (v) {
                case cycle_status::past: return fmt::format_to(ctx.out(), "past");
                case cycle_status::current: return fmt::format_to(ctx.out(), "current");
                case cycle_status::upcoming: return fmt::format_to(ctx.out(), "upcoming");
                default: throw treasury_turbo::error("unsupported cycle_status: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TREASURY_TURBO_PROTOCOL_HISTORY_HPP
