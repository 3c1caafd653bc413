/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_PROTOCOL_TYPES_HPP
#define TREASURY_TURBO_PROTOCOL_TYPES_HPP

#include <vector>
#include <tt/big-int.hpp>
#include <tt/config.hpp>
#include <tt/evm/address.hpp>

namespace treasury_turbo::protocol {
    using project_id_t = uint64_t;

    // 100% in the basis points of cashOutTaxRate and reservedPercent
    static constexpr uint32_t max_basis_points = 10'000;
    // 100% in the parts-per-billion of split percents and weightCutPercent
    static constexpr uint32_t max_ppb = 1'000'000'000;
    static constexpr uint64_t reserved_split_group = 1;

    struct project_key {
        chain_id_t chain_id = 0;
        project_id_t project_id = 0;

        auto operator<=>(const project_key &) const =default;
    };

    struct ruleset {
        uint64_t cycle_number = 0;
        uint64_t id = 0;
        uint64_t based_on_id = 0;
        uint64_t start = 0;
        uint64_t duration = 0;
        cpp_int weight {};
        uint32_t weight_cut_percent = 0;
        evm::address approval_hook {};
        uint256_t metadata {};

        bool operator==(const ruleset &) const =default;
    };

    // The order of JBApprovalStatus
    enum class approval_status: uint8_t {
        empty, upcoming, active, approval_expected, approved, failed
    };

    struct queued_ruleset {
        ruleset rs {};
        approval_status status = approval_status::empty;
    };

    struct split {
        uint32_t percent = 0;
        project_id_t project_id = 0;
        evm::address beneficiary {};
        bool prefer_add_to_balance = false;
        uint64_t locked_until = 0;
        evm::address hook {};

        bool operator==(const split &) const =default;
    };

    struct currency_amount {
        cpp_int amount {};
        uint32_t currency = 0;

        bool operator==(const currency_amount &) const =default;
    };

    struct fund_access_limits {
        std::vector<currency_amount> payout_limits {};
        std::vector<currency_amount> surplus_allowances {};
    };
}

namespace fmt {
    template<>
    struct formatter<treasury_turbo::protocol::project_key>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}:{}", v.chain_id, v.project_id);
        }
    };
}

#endif // !TREASURY_TURBO_PROTOCOL_TYPES_HPP
