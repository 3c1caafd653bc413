/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_CONFIG_HPP
#define TREASURY_TURBO_CONFIG_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <tt/json.hpp>

namespace treasury_turbo {
    using chain_id_t = uint64_t;

    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            return json::find(json(), name);
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw config_error("config does not have the requested {} element!", name);
            return it->value();
        }

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        std::string _path;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;
        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };

    struct breaker_settings {
        size_t failure_threshold = 5;
        std::chrono::milliseconds failure_window { 30'000 };
        std::chrono::milliseconds cooldown { 60'000 };
        std::chrono::milliseconds max_cooldown { 600'000 };
    };

    struct cache_ttls {
        std::chrono::seconds current_ruleset { 300 };
        std::chrono::seconds queued_ruleset { 300 };
        std::chrono::seconds splits { 120 };
        std::chrono::seconds balances { 60 };
        std::chrono::seconds token_symbols { 1800 };
    };

    struct settings {
        static constexpr std::chrono::milliseconds default_rpc_timeout { 15'000 };

        std::string indexer_url { "http://localhost:8080/graphql" };
        std::string testnet_indexer_url { "http://localhost:8081/graphql" };
        bool testnet_routes_to_mainnet = false;
        std::map<chain_id_t, std::vector<std::string>> rpc_endpoints {};
        std::chrono::milliseconds rpc_timeout = default_rpc_timeout;
        // zero means every configured endpoint is tried
        size_t rpc_max_attempts = 0;
        std::chrono::milliseconds indexer_timeout { 30'000 };
        breaker_settings indexer_breaker { 3, std::chrono::seconds { 60 }, std::chrono::seconds { 120 }, std::chrono::seconds { 900 } };
        breaker_settings rpc_breaker { 5, std::chrono::seconds { 30 }, std::chrono::seconds { 60 }, std::chrono::seconds { 600 } };
        cache_ttls ttls {};
        // per-version contract address overrides, applied by the contract resolver
        json::object contracts {};

        static settings from_config(const config &cfg);
        // Loads the file named by TT_CONFIG when set and applies the environment overrides
        static settings from_env();

        void apply_env();
        [[nodiscard]] const std::vector<std::string> &rpc_endpoints_for(chain_id_t chain_id) const;
        [[nodiscard]] const std::string &indexer_url_for(chain_id_t chain_id) const;
    };

    extern bool is_testnet(chain_id_t chain_id);
    extern std::optional<chain_id_t> mainnet_of(chain_id_t chain_id);
}

#endif // !TREASURY_TURBO_CONFIG_HPP
