/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_RESILIENCE_RETRY_HPP
#define TREASURY_TURBO_RESILIENCE_RETRY_HPP

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>
#include <tt/common/error.hpp>
#include <tt/logger.hpp>

namespace treasury_turbo::resilience {
    struct retry_policy {
        std::vector<std::string> endpoints {};
        std::chrono::milliseconds per_attempt_timeout { 15'000 };
        // zero means one attempt per endpoint
        size_t max_attempts = 0;

        [[nodiscard]] size_t num_attempts() const noexcept
        {
            if (max_attempts == 0)
                return endpoints.size();
            return std::min(max_attempts, endpoints.size());
        }
    };

    /*
     * Tries the endpoints sequentially in their configured order and returns the first success.
     * Every failed attempt is logged. Exhausting the attempts is an upstream_error.
     */
    template<typename F>
    auto try_each(const retry_policy &policy, const F &attempt) -> decltype(attempt(std::string {}, std::chrono::milliseconds {}))
    {
        if (policy.endpoints.empty())
            throw config_error("retry policy has no endpoints to try");
        std::string last_error {};
        const auto num_attempts = policy.num_attempts();
        for (size_t i = 0; i < num_attempts; ++i) {
            const auto &endpoint = policy.endpoints[i];
            try {
                return attempt(endpoint, policy.per_attempt_timeout);
            } catch (const std::exception &ex) {
                last_error = ex.what();
                logger::warn("attempt {}/{} at {} failed: {}", i + 1, num_attempts, endpoint, ex.what());
            }
        }
        throw upstream_error("all {} attempts failed, last error: {}", num_attempts, last_error);
    }
}

#endif // !TREASURY_TURBO_RESILIENCE_RETRY_HPP
