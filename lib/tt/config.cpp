/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <tt/config.hpp>
#include <tt/logger.hpp>

namespace treasury_turbo {
    static const std::map<chain_id_t, chain_id_t> &testnet_to_mainnet()
    {
        static const std::map<chain_id_t, chain_id_t> m {
            { 11155111, 1 },
            { 11155420, 10 },
            { 84532, 8453 },
            { 421614, 42161 }
        };
        return m;
    }

    bool is_testnet(const chain_id_t chain_id)
    {
        return testnet_to_mainnet().contains(chain_id);
    }

    std::optional<chain_id_t> mainnet_of(const chain_id_t chain_id)
    {
        if (const auto it = testnet_to_mainnet().find(chain_id); it != testnet_to_mainnet().end())
            return it->second;
        return {};
    }

    config_file::config_file(const std::string &path)
        : _path { path }, _parsed { json::load(path).as_object() }
    {
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw config_error("configuration file {} does not have the element {}!", _path, name);
        return it->value();
    }

    static std::chrono::milliseconds millis_or(const json::object &obj, const std::string_view name, const std::chrono::milliseconds def)
    {
        return std::chrono::milliseconds { json::uint64_or(obj, name, def.count()) };
    }

    static std::chrono::seconds seconds_or(const json::object &obj, const std::string_view name, const std::chrono::seconds def)
    {
        return std::chrono::seconds { json::uint64_or(obj, name, def.count()) };
    }

    static breaker_settings parse_breaker(const json::value *jv, const breaker_settings &def)
    {
        if (!jv)
            return def;
        if (!jv->is_object())
            throw config_error("breaker settings must be a json object!");
        const auto &obj = jv->get_object();
        breaker_settings res {
            json::uint64_or(obj, "failureThreshold", def.failure_threshold),
            millis_or(obj, "failureWindowMs", def.failure_window),
            millis_or(obj, "cooldownMs", def.cooldown),
            millis_or(obj, "maxCooldownMs", def.max_cooldown)
        };
        if (res.failure_threshold == 0)
            throw config_error("failureThreshold must be positive!");
        if (res.max_cooldown < res.cooldown)
            throw config_error("maxCooldownMs must not be smaller than cooldownMs!");
        return res;
    }

    settings settings::from_config(const config &cfg)
    {
        settings s {};
        const auto &root = cfg.json();
        if (const auto *indexer = cfg.find("indexer")) {
            if (!indexer->is_object())
                throw config_error("indexer must be a json object!");
            const auto &obj = indexer->get_object();
            s.indexer_url = json::string_or(obj, "url", s.indexer_url);
            s.testnet_indexer_url = json::string_or(obj, "testnetUrl", s.testnet_indexer_url);
            s.testnet_routes_to_mainnet = json::bool_or(obj, "testnetRoutesToMainnet", s.testnet_routes_to_mainnet);
            s.indexer_timeout = millis_or(obj, "timeoutMs", s.indexer_timeout);
            s.indexer_breaker = parse_breaker(json::find(obj, "breaker"), s.indexer_breaker);
        }
        if (const auto *rpc = cfg.find("rpc")) {
            if (!rpc->is_object())
                throw config_error("rpc must be a json object!");
            const auto &obj = rpc->get_object();
            s.rpc_timeout = millis_or(obj, "timeoutMs", s.rpc_timeout);
            s.rpc_max_attempts = json::uint64_or(obj, "maxAttempts", s.rpc_max_attempts);
            s.rpc_breaker = parse_breaker(json::find(obj, "breaker"), s.rpc_breaker);
            if (const auto *endpoints = json::find(obj, "endpoints")) {
                if (!endpoints->is_object())
                    throw config_error("rpc.endpoints must map chain ids to url lists!");
                for (const auto &kv: endpoints->get_object()) {
                    if (!kv.value().is_array())
                        throw config_error("rpc endpoints of chain {} must be a list of urls!", std::string_view { kv.key() });
                    const auto chain_id = static_cast<chain_id_t>(big_uint_from_string(kv.key()));
                    auto &list = s.rpc_endpoints[chain_id];
                    for (const auto &url: kv.value().get_array()) {
                        if (!url.is_string())
                            throw config_error("rpc endpoints of chain {} must be strings!", chain_id);
                        list.emplace_back(url.get_string());
                    }
                }
            }
        }
        if (const auto *caches = json::find(root, "cacheTtlSec")) {
            if (!caches->is_object())
                throw config_error("cacheTtlSec must be a json object!");
            const auto &obj = caches->get_object();
            s.ttls.current_ruleset = seconds_or(obj, "currentRuleset", s.ttls.current_ruleset);
            s.ttls.queued_ruleset = seconds_or(obj, "queuedRuleset", s.ttls.queued_ruleset);
            s.ttls.splits = seconds_or(obj, "splits", s.ttls.splits);
            s.ttls.balances = seconds_or(obj, "balances", s.ttls.balances);
            s.ttls.token_symbols = seconds_or(obj, "tokenSymbols", s.ttls.token_symbols);
        }
        if (const auto *contracts = json::find(root, "contracts")) {
            if (!contracts->is_object())
                throw config_error("contracts must be a json object!");
            s.contracts = contracts->get_object();
        }
        return s;
    }

    settings settings::from_env()
    {
        settings s {};
        if (const char *path = std::getenv("TT_CONFIG"); path) {
            logger::info("loading configuration from {}", path);
            s = from_config(config_file { path });
        }
        s.apply_env();
        return s;
    }

    void settings::apply_env()
    {
        if (const char *url = std::getenv("TT_INDEXER_URL"); url) {
            logger::debug("indexer url overridden by TT_INDEXER_URL: {}", url);
            indexer_url = url;
        }
        if (const char *flag = std::getenv("TT_TESTNET_ROUTES_TO_MAINNET"); flag) {
            const std::string_view val { flag };
            testnet_routes_to_mainnet = val == "1" || val == "true";
        }
    }

    const std::vector<std::string> &settings::rpc_endpoints_for(const chain_id_t chain_id) const
    {
        const auto it = rpc_endpoints.find(chain_id);
        if (it == rpc_endpoints.end() || it->second.empty())
            throw config_error("no rpc endpoints are configured for chain {}", chain_id);
        return it->second;
    }

    const std::string &settings::indexer_url_for(const chain_id_t chain_id) const
    {
        if (is_testnet(chain_id) && !testnet_routes_to_mainnet)
            return testnet_indexer_url;
        return indexer_url;
    }
}
