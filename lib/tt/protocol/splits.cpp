/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <tt/protocol/splits.hpp>

namespace treasury_turbo::protocol {
    uint64_t validate_split_group(const std::vector<split> &group)
    {
        uint64_t total = 0;
        for (const auto &s: group)
            total += s.percent;
        if (total > max_ppb)
            throw decode_error("split percents add up to {} which is above {}", total, max_ppb);
        return total;
    }

    uint32_t owner_remainder(const std::vector<split> &group)
    {
        return static_cast<uint32_t>(max_ppb - validate_split_group(group));
    }

    cpp_int split_amount(const split &s, const cpp_int &amount)
    {
        return amount * s.percent / max_ppb;
    }
}
