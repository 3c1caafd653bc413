/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <tt/common/test.hpp>
#include <tt/config.hpp>

using namespace treasury_turbo;

namespace {
    static void my_setenv(const char *name, const char *val)
    {
        if (name == nullptr)
            throw error("my_setenv: name cannot be null!");
#if _WIN32
        std::string putexpr { fmt::format("{}={}", name, val != nullptr ? val : "") };
        putenv(putexpr.c_str());
#else
        if (val != nullptr)
            setenv(name, val, 1);
        else
            unsetenv(name);
#endif
    }

    static settings settings_of(const std::string_view text)
    {
        auto jv = json::parse(text);
        return settings::from_config(config_json { std::move(jv.as_object()) });
    }
}

suite config_suite = [] {
    "config"_test = [] {
        "defaults"_test = [] {
            const settings s {};
            test_same(size_t { 3 }, s.indexer_breaker.failure_threshold);
            test_same(int64_t { 120'000 }, s.indexer_breaker.cooldown.count());
            test_same(size_t { 5 }, s.rpc_breaker.failure_threshold);
            test_same(int64_t { 15'000 }, s.rpc_timeout.count());
            test_same(int64_t { 300 }, s.ttls.current_ruleset.count());
            test_same(int64_t { 1800 }, s.ttls.token_symbols.count());
        };
        "mock"_test = [] {
            const config_json cfg { json::object { { "indexer", json::object { { "url", "http://idx" } } } } };
            expect(cfg.at("indexer").is_object());
            expect(cfg.find("rpc") == nullptr);
            expect(throws<config_error>([&] { std::ignore = cfg.at("rpc"); }));
        };
        "settings"_test = [] {
            const auto s = settings_of(R"({
                "indexer": { "url": "http://idx/graphql", "testnetUrl": "http://idx-test/graphql", "timeoutMs": 5000,
                    "breaker": { "failureThreshold": 2, "cooldownMs": 1000, "maxCooldownMs": 8000 } },
                "rpc": { "timeoutMs": 2000, "maxAttempts": 2,
                    "endpoints": { "1": [ "http://a", "http://b" ], "10": [ "http://c" ] } },
                "cacheTtlSec": { "splits": 30 }
            })");
            test_same(std::string { "http://idx/graphql" }, s.indexer_url);
            test_same(int64_t { 5000 }, s.indexer_timeout.count());
            test_same(size_t { 2 }, s.indexer_breaker.failure_threshold);
            test_same(int64_t { 8000 }, s.indexer_breaker.max_cooldown.count());
            test_same(int64_t { 60'000 }, s.indexer_breaker.failure_window.count());
            test_same(int64_t { 2000 }, s.rpc_timeout.count());
            test_same(size_t { 2 }, s.rpc_max_attempts);
            expect(s.rpc_endpoints_for(1) == std::vector<std::string> { "http://a", "http://b" });
            expect(s.rpc_endpoints_for(10) == std::vector<std::string> { "http://c" });
            test_same(int64_t { 30 }, s.ttls.splits.count());
            test_same(int64_t { 300 }, s.ttls.current_ruleset.count());
        };
        "missing endpoints"_test = [] {
            const auto s = settings_of(R"({ "rpc": { "endpoints": { "1": [] } } })");
            expect(throws<config_error>([&] { std::ignore = s.rpc_endpoints_for(1); }));
            expect(throws<config_error>([&] { std::ignore = s.rpc_endpoints_for(8453); }));
        };
        "invalid settings"_test = [] {
            expect(throws<config_error>([] { std::ignore = settings_of(R"({ "indexer": [] })"); }));
            expect(throws<config_error>([] { std::ignore = settings_of(R"({ "rpc": { "endpoints": { "1": "http://a" } } })"); }));
            expect(throws<config_error>([] { std::ignore = settings_of(R"({ "rpc": { "endpoints": { "1": [ 1 ] } } })"); }));
            expect(throws<config_error>([] { std::ignore = settings_of(R"({ "rpc": { "breaker": { "failureThreshold": 0 } } })"); }));
            expect(throws<config_error>([] { std::ignore = settings_of(R"({ "indexer": { "breaker": { "cooldownMs": 10, "maxCooldownMs": 5 } } })"); }));
            expect(throws<config_error>([] { std::ignore = settings_of(R"({ "cacheTtlSec": 5 })"); }));
        };
        "testnet routing"_test = [] {
            settings s {};
            expect(is_testnet(11155111));
            expect(!is_testnet(1));
            expect(mainnet_of(84532) == std::optional<chain_id_t> { 8453 });
            expect(!mainnet_of(1).has_value());
            test_same(s.testnet_indexer_url, s.indexer_url_for(11155111));
            test_same(s.indexer_url, s.indexer_url_for(10));
            s.testnet_routes_to_mainnet = true;
            test_same(s.indexer_url, s.indexer_url_for(11155111));
        };
        "file"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "tt-config-test.json").string();
            {
                std::ofstream os { path };
                os << R"({ "indexer": { "url": "http://from-file/graphql" } })";
            }
            const config_file cfg { path };
            test_same(std::string { "http://from-file/graphql" }, settings::from_config(cfg).indexer_url);
            expect(throws<config_error>([&] { std::ignore = cfg.at("rpc"); }));
            std::filesystem::remove(path);
            expect(throws<config_error>([&] { config_file missing { path }; }));
        };
        "environment overrides"_test = [] {
            expect(std::getenv("TT_INDEXER_URL") == nullptr);
            my_setenv("TT_INDEXER_URL", "http://from-env/graphql");
            my_setenv("TT_TESTNET_ROUTES_TO_MAINNET", "1");
            const auto s = settings::from_env();
            test_same(std::string { "http://from-env/graphql" }, s.indexer_url);
            expect(s.testnet_routes_to_mainnet);
            my_setenv("TT_INDEXER_URL", nullptr);
            my_setenv("TT_TESTNET_ROUTES_TO_MAINNET", nullptr);
        };
    };
};
