/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_MUTEX_HPP
#define TREASURY_TURBO_MUTEX_HPP

#include <mutex>

namespace treasury_turbo::mutex {
    // Caches, breakers and mocks guard their state with these; none of them holds a lock while calling out
    using mutex_type = std::mutex;
    using scoped_lock = std::scoped_lock<mutex_type>;
    using unique_lock = std::unique_lock<mutex_type>;
}

#endif // !TREASURY_TURBO_MUTEX_HPP
