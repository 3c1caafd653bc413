/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_PROTOCOL_SPLITS_HPP
#define TREASURY_TURBO_PROTOCOL_SPLITS_HPP

#include <vector>
#include <tt/protocol/types.hpp>

namespace treasury_turbo::protocol {
    enum class split_recipient { hook, project, beneficiary };

    // Throws decode_error when the percents of a group add up to more than 100%
    extern uint64_t validate_split_group(const std::vector<split> &group);
    // The share of a group that is not assigned to any split and accrues to the project owner
    extern uint32_t owner_remainder(const std::vector<split> &group);
    extern cpp_int split_amount(const split &s, const cpp_int &amount);

    inline bool is_locked(const split &s, const uint64_t now)
    {
        return s.locked_until > now;
    }

    // A hook receives the funds first, then a project's balance, then a plain beneficiary
    inline split_recipient recipient_of(const split &s)
    {
        if (!s.hook.is_zero())
            return split_recipient::hook;
        if (s.project_id != 0)
            return split_recipient::project;
        return split_recipient::beneficiary;
    }
}

#endif // !TREASURY_TURBO_PROTOCOL_SPLITS_HPP
