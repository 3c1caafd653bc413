/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <tt/common/test.hpp>
#include <tt/resilience/retry.hpp>

using namespace treasury_turbo;
using namespace treasury_turbo::resilience;

suite resilience_retry_suite = [] {
    "resilience::try_each"_test = [] {
        using namespace std::chrono_literals;
        "first success wins"_test = [] {
            const retry_policy policy { { "http://a", "http://b", "http://c" }, 5'000ms };
            std::vector<std::string> tried {};
            const auto res = try_each(policy, [&](const std::string &url, const std::chrono::milliseconds timeout) {
                tried.emplace_back(url);
                test_same(5'000, timeout.count());
                if (url == "http://a")
                    throw upstream_error("timeout");
                return url;
            });
            test_same(std::string { "http://b" }, res);
            test_same(size_t { 2 }, tried.size());
        };
        "exhaustion is an upstream failure"_test = [] {
            const retry_policy policy { { "http://a", "http://b" } };
            size_t num_attempts = 0;
            expect(throws<upstream_error>([&] {
                try_each(policy, [&](const std::string &, std::chrono::milliseconds) -> int {
                    ++num_attempts;
                    throw error("connection refused");
                });
            }));
            test_same(size_t { 2 }, num_attempts);
        };
        "max attempts"_test = [] {
            const retry_policy policy { { "http://a", "http://b", "http://c" }, 15'000ms, 1 };
            test_same(size_t { 1 }, policy.num_attempts());
            size_t num_attempts = 0;
            expect(throws<upstream_error>([&] {
                try_each(policy, [&](const std::string &, std::chrono::milliseconds) -> int {
                    ++num_attempts;
                    throw error("connection refused");
                });
            }));
            test_same(size_t { 1 }, num_attempts);
        };
        "no endpoints"_test = [] {
            const retry_policy policy {};
            expect(throws<config_error>([&] {
                try_each(policy, [](const std::string &, std::chrono::milliseconds) { return 1; });
            }));
        };
    };
};
