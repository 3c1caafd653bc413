/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <string>
#include <tt/cache.hpp>
#include <tt/common/test.hpp>

using namespace treasury_turbo;

suite cache_suite = [] {
    "ttl_cache"_test = [] {
        using namespace std::chrono_literals;
        "expiration"_test = [] {
            clock_manual clk {};
            ttl_cache<std::string, int> c { std::chrono::milliseconds { 60'000 }, clk };
            c.set("1:42", 7);
            test_same(7, c.get("1:42").value_or(0));
            clk.advance(59'999ms);
            expect(c.get("1:42").has_value());
            clk.advance(1ms);
            expect(!c.get("1:42").has_value());
            test_same(size_t { 1 }, c.size());
            test_same(size_t { 1 }, c.cleanup_expired());
            test_same(size_t { 0 }, c.size());
        };
        "permanent entries"_test = [] {
            clock_manual clk {};
            ttl_cache<int, std::string> c { std::chrono::milliseconds { 1'000 }, clk };
            c.set(1, "short");
            c.set(2, "forever", std::nullopt);
            clk.advance(std::chrono::hours { 24 * 365 });
            expect(!c.get(1).has_value());
            test_same(std::string { "forever" }, c.get(2).value_or(""));
            test_same(size_t { 1 }, c.cleanup_expired());
            test_same(size_t { 1 }, c.size());
        };
        "no default ttl"_test = [] {
            clock_manual clk {};
            ttl_cache<int, int> c { {}, clk };
            c.set(1, 10);
            clk.advance(std::chrono::hours { 1000 });
            test_same(10, c.get(1).value_or(0));
        };
        "last writer wins"_test = [] {
            ttl_cache<int, int> c {};
            c.set(1, 10);
            c.set(1, 20);
            test_same(20, c.get(1).value_or(0));
            test_same(size_t { 1 }, c.size());
        };
        "erase and clear"_test = [] {
            ttl_cache<int, int> c {};
            c.set(1, 10);
            c.set(2, 20);
            expect(c.erase(1));
            expect(!c.erase(1));
            expect(!c.get(1).has_value());
            c.clear();
            test_same(size_t { 0 }, c.size());
        };
        "get_or_compute"_test = [] {
            ttl_cache<int, int> c {};
            size_t calls = 0;
            const auto compute = [&] { ++calls; return 99; };
            test_same(99, c.get_or_compute(5, compute));
            test_same(99, c.get_or_compute(5, compute));
            test_same(size_t { 1 }, calls);
        };
    };
};
