/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_INDEXER_TYPES_HPP
#define TREASURY_TURBO_INDEXER_TYPES_HPP

#include <optional>
#include <string>
#include <vector>
#include <tt/big-int.hpp>
#include <tt/config.hpp>

namespace treasury_turbo::indexer {
    using project_id_t = uint64_t;

    static constexpr uint32_t default_version = 5;
    static constexpr uint32_t currency_eth = 1;
    static constexpr uint32_t currency_usd = 2;
    static constexpr uint32_t default_decimals = 18;

    // Six decimals always mean a USD stable coin even when the reported currency says otherwise
    inline uint32_t accounting_currency(const uint32_t decimals, const std::optional<uint32_t> reported={})
    {
        if (decimals == 6)
            return currency_usd;
        return reported.value_or(currency_eth);
    }

    struct project_info {
        chain_id_t chain_id = 0;
        project_id_t project_id = 0;
        uint32_t version = default_version;
        std::string handle {};
        std::string name {};
        std::string owner {};
        std::string metadata_uri {};
        cpp_int balance {};
        cpp_int volume {};
        uint64_t payments_count = 0;
        uint64_t created_at = 0;
        uint32_t decimals = default_decimals;
        uint32_t currency = currency_eth;
        std::optional<std::string> sucker_group_id {};
    };

    struct group_member {
        chain_id_t chain_id = 0;
        project_id_t project_id = 0;
        cpp_int balance {};
        cpp_int volume {};
        uint64_t payments_count = 0;
        cpp_int token_supply {};
        uint32_t decimals = default_decimals;
        uint32_t currency = currency_eth;
    };

    // The totals are the indexer's own aggregation and are empty when it did not report them
    struct sucker_group {
        std::string id {};
        std::optional<cpp_int> balance {};
        std::optional<cpp_int> volume {};
        std::optional<uint64_t> payments_count {};
        std::optional<cpp_int> token_supply {};
        std::vector<group_member> members {};
    };

    struct participant {
        std::string address {};
        chain_id_t chain_id = 0;
        project_id_t project_id = 0;
        cpp_int balance {};
        cpp_int volume {};
    };

    struct pay_event {
        cpp_int amount {};
        std::optional<std::string> amount_usd {};
        cpp_int newly_issued_tokens {};
        uint64_t timestamp = 0;
        std::string from {};
        std::string tx_hash {};
        std::string memo {};
    };

    struct issuance_rate {
        // tokens issued per unit of the accounting token, both sides in their smallest units
        double tokens_per_unit = 0.0;
        size_t based_on_payments = 0;
    };

    template<typename T>
    struct page {
        std::vector<T> items {};
        bool has_next_page = false;
        std::optional<std::string> end_cursor {};
    };
}

#endif // !TREASURY_TURBO_INDEXER_TYPES_HPP
