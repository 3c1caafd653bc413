/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_INDEXER_CLIENT_HPP
#define TREASURY_TURBO_INDEXER_CLIENT_HPP

#include <optional>
#include <string>
#include <vector>
#include <tt/http/client.hpp>
#include <tt/indexer/events.hpp>
#include <tt/logger.hpp>
#include <tt/resilience/circuit-breaker.hpp>

namespace treasury_turbo::indexer {
    static constexpr size_t default_page_size = 100;
    static constexpr size_t default_max_pages = 10;
    static constexpr size_t recent_pay_events_limit = 5;

    /*
     * Follows endCursor links until a page reports no next page or max_pages pages have been read.
     * fetch_page receives the cursor of the previous page, empty for the first one.
     */
    template<typename T, typename F>
    std::vector<T> fetch_all_pages(const F &fetch_page, const size_t max_pages=default_max_pages)
    {
        std::vector<T> items {};
        std::optional<std::string> cursor {};
        for (size_t i = 0; i < max_pages; ++i) {
            page<T> p = fetch_page(cursor);
            items.insert(items.end(), std::make_move_iterator(p.items.begin()), std::make_move_iterator(p.items.end()));
            if (!p.has_next_page || !p.end_cursor)
                return items;
            cursor = std::move(p.end_cursor);
        }
        logger::warn("stopped paging after {} pages with {} items, more are available", max_pages, items.size());
        return items;
    }

    /*
     * Typed read-only queries against the GraphQL indexing API.
     * Every request goes through the indexer circuit breaker; the typed methods throw circuit_open_error
     * or upstream_error on failures and return empty values when the indexer has no such record.
     * The chain id of a request selects between the mainnet and the testnet indexer.
     */
    struct client {
        client(const settings &cfg, http::client &http, resilience::circuit_breaker &breaker);

        // The data member of a GraphQL response; a response with errors is a failure
        [[nodiscard]] resilience::gate_result<json::object> query(chain_id_t chain_id, std::string_view operation, std::string_view text, json::object variables);

        std::optional<project_info> project(chain_id_t chain_id, project_id_t project_id, uint32_t version=default_version);
        std::optional<sucker_group> sucker_group_by_id(chain_id_t chain_id, const std::string &group_id);
        // The group of the project or empty when the project is deployed on one chain only
        std::optional<sucker_group> sucker_group_of(chain_id_t chain_id, project_id_t project_id, uint32_t version=default_version);

        page<participant> participants_page(chain_id_t chain_id, project_id_t project_id, size_t limit, const std::optional<std::string> &after);
        page<participant> group_participants_page(chain_id_t chain_id, const std::string &group_id, size_t limit, const std::optional<std::string> &after);
        // Holders with a positive balance
        std::vector<participant> participants_of_project(chain_id_t chain_id, project_id_t project_id, size_t max_pages=default_max_pages);
        std::vector<participant> participants_of_group(chain_id_t chain_id, const std::string &group_id, size_t max_pages=default_max_pages);

        page<pay_event> pay_events_page(chain_id_t chain_id, project_id_t project_id, uint32_t version, size_t limit, const std::optional<std::string> &after);
        std::vector<pay_event> recent_pay_events(chain_id_t chain_id, project_id_t project_id, uint32_t version=default_version, size_t limit=recent_pay_events_limit);
        // Averaged over the recent payments, empty when there are none or they carry no value
        std::optional<issuance_rate> issuance_rate_of(chain_id_t chain_id, project_id_t project_id, uint32_t version=default_version);

        page<activity_event> activity_events(chain_id_t chain_id, size_t limit, const std::optional<std::string> &after);
    private:
        const settings &_cfg;
        http::client &_http;
        resilience::circuit_breaker &_breaker;

        json::object _query_value(chain_id_t chain_id, std::string_view operation, std::string_view text, json::object variables);
    };
}

#endif // !TREASURY_TURBO_INDEXER_CLIENT_HPP
