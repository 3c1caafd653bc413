/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_INDEXER_INDEXER_MOCK_HPP
#define TREASURY_TURBO_INDEXER_INDEXER_MOCK_HPP

#include <functional>
#include <map>
#include <tt/http/client-mock.hpp>
#include <tt/indexer/client.hpp>
#include <tt/resilience/debug-sink.hpp>

namespace treasury_turbo::indexer {
    // Answers GraphQL operations by name, operations without a handler fail like an unreachable server
    struct indexer_responder {
        using handler_type = std::function<json::value(const json::object &vars)>;

        void on(const std::string &operation, handler_type handler)
        {
            mutex::scoped_lock lk { _mutex };
            _handlers.insert_or_assign(operation, std::move(handler));
        }

        void on_error(const std::string &operation, const std::string &message)
        {
            on(operation, [message](const auto &) -> json::value {
                throw graphql_error { message };
            });
        }

        void install(http::client_mock &http, const std::string &url)
        {
            http.add_json(url, [this](const json::object &req) {
                const std::string op { json::at_string(req, "operationName") };
                handler_type handler {};
                {
                    mutex::scoped_lock lk { _mutex };
                    const auto it = _handlers.find(op);
                    if (it == _handlers.end())
                        throw upstream_error("no handler for operation {}", op);
                    handler = it->second;
                }
                json::object vars {};
                if (const auto *v = json::find(req, "variables"); v && v->is_object())
                    vars = v->get_object();
                try {
                    return json::value { json::object { { "data", handler(vars) } } };
                } catch (const graphql_error &ex) {
                    return json::value { json::object {
                        { "data", nullptr },
                        { "errors", json::array { json::object { { "message", ex.message } } } }
                    } };
                }
            });
        }
    private:
        struct graphql_error {
            std::string message {};
        };

        mutable mutex::mutex_type _mutex {};
        std::map<std::string, handler_type> _handlers {};
    };

    struct indexer_mock {
        settings cfg {};
        clock_manual clk {};
        resilience::debug_sink_memory sink {};
        http::client_mock http {};
        indexer_responder gql {};
        resilience::circuit_breaker breaker { "indexer", resilience::breaker_options::from_settings(cfg.indexer_breaker), clk, sink };
        client idx { cfg, http, breaker };

        indexer_mock()
        {
            gql.install(http, cfg.indexer_url);
            gql.install(http, cfg.testnet_indexer_url);
        }

        static json::value project_json(const chain_id_t chain_id, const project_id_t project_id, const std::string_view balance,
            const std::optional<std::string> &group_id={}, const uint32_t decimals=18)
        {
            json::object p {
                { "projectId", project_id },
                { "chainId", chain_id },
                { "version", 5 },
                { "handle", fmt::format("project{}", project_id) },
                { "owner", "0x00000000000000000000000000000000000000AA" },
                { "metadataUri", "ipfs://meta" },
                { "metadata", json::object { { "name", fmt::format("Project {}", project_id) } } },
                { "balance", balance },
                { "volume", balance },
                { "paymentsCount", 3 },
                { "createdAt", 1700000000 },
                { "decimals", decimals },
                { "currency", 1 }
            };
            if (group_id)
                p.emplace("suckerGroupId", *group_id);
            else
                p.emplace("suckerGroupId", nullptr);
            return json::object { { "project", std::move(p) } };
        }

        static json::object holder_json(const std::string_view address, const chain_id_t chain_id, const project_id_t project_id, const std::string_view balance)
        {
            return json::object {
                { "address", address },
                { "chainId", chain_id },
                { "projectId", project_id },
                { "balance", balance },
                { "volume", "0" }
            };
        }

        static json::value connection_json(const std::string_view field, json::array items, const std::optional<std::string> &next_cursor={})
        {
            json::object page_info { { "hasNextPage", next_cursor.has_value() } };
            if (next_cursor)
                page_info.emplace("endCursor", *next_cursor);
            else
                page_info.emplace("endCursor", nullptr);
            return json::object {
                { field, json::object { { "items", std::move(items) }, { "pageInfo", std::move(page_info) } } }
            };
        }
    };
}

#endif // !TREASURY_TURBO_INDEXER_INDEXER_MOCK_HPP
