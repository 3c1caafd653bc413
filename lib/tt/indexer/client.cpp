/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <limits>
#include <tt/evm/address.hpp>
#include <tt/indexer/client.hpp>

namespace treasury_turbo::indexer {
    static constexpr std::string_view project_query = R"(
        query Project($projectId: Float!, $chainId: Float!, $version: Float!) {
          project(projectId: $projectId, chainId: $chainId, version: $version) {
            projectId chainId version handle owner metadataUri metadata
            volume balance paymentsCount createdAt decimals currency suckerGroupId
          }
        })";

    static constexpr std::string_view sucker_group_query = R"(
        query SuckerGroupById($id: String!) {
          suckerGroup(id: $id) {
            id balance volume paymentsCount tokenSupply
            projects {
              items { projectId chainId balance volume paymentsCount tokenSupply decimals currency }
            }
          }
        })";

    static constexpr std::string_view participants_query = R"(
        query Participants($projectId: Int!, $chainId: Int!, $limit: Int, $after: String) {
          participants(
            where: { projectId: $projectId, chainId: $chainId, balance_gt: "0" }
            limit: $limit
            after: $after
            orderBy: "balance"
            orderDirection: "desc"
          ) {
            items { address chainId projectId balance volume }
            pageInfo { hasNextPage endCursor }
          }
        })";

    static constexpr std::string_view group_participants_query = R"(
        query SuckerGroupParticipants($suckerGroupId: String!, $limit: Int, $after: String) {
          participants(
            where: { suckerGroupId: $suckerGroupId, balance_gt: "0" }
            limit: $limit
            after: $after
            orderBy: "balance"
            orderDirection: "desc"
          ) {
            items { address chainId projectId balance volume }
            pageInfo { hasNextPage endCursor }
          }
        })";

    static constexpr std::string_view pay_events_query = R"(
        query PayEventsHistory($projectId: Int!, $chainId: Int!, $version: Int!, $limit: Int, $after: String) {
          payEvents(
            where: { projectId: $projectId, chainId: $chainId, version: $version }
            limit: $limit
            after: $after
            orderBy: "timestamp"
            orderDirection: "desc"
          ) {
            items { amount amountUsd newlyIssuedTokenCount timestamp from txHash memo }
            pageInfo { hasNextPage endCursor }
          }
        })";

    static constexpr std::string_view activity_events_query = R"(
        query ActivityEvents($limit: Int, $after: String) {
          activityEvents(limit: $limit, after: $after, orderBy: "timestamp", orderDirection: "desc") {
            items {
              id chainId timestamp from txHash
              project { name handle decimals currency }
              payEvent { amount amountUsd from txHash }
              projectCreateEvent { from txHash }
              cashOutTokensEvent { reclaimAmount from txHash }
              addToBalanceEvent { amount from txHash }
              mintTokensEvent { tokenCount beneficiary from txHash }
              burnEvent { amount from txHash }
              deployErc20Event { symbol from txHash }
              sendPayoutsEvent { amount from txHash }
              sendReservedTokensToSplitsEvent { from txHash }
              useAllowanceEvent { amount from txHash }
              mintNftEvent { from txHash }
            }
            pageInfo { hasNextPage endCursor }
          }
        })";

    static json::value cursor_value(const std::optional<std::string> &after)
    {
        if (after)
            return json::value { *after };
        return json::value { nullptr };
    }

    static uint32_t uint32_or(const json::object &obj, const std::string_view name, const uint32_t def)
    {
        const auto val = json::uint64_or(obj, name, def);
        if (val > std::numeric_limits<uint32_t>::max())
            throw upstream_error("field {} does not fit into 32 bits: {}", name, val);
        return static_cast<uint32_t>(val);
    }

    static std::string project_name(const json::object &obj, const project_id_t project_id)
    {
        if (const auto *meta = json::find(obj, "metadata")) {
            if (meta->is_object())
                return json::string_or(meta->get_object(), "name", fmt::format("Project #{}", project_id));
            // some indexer versions return the metadata scalar as a serialized json document
            if (meta->is_string()) {
                try {
                    const auto parsed = json::parse(meta->get_string());
                    if (parsed.is_object())
                        return json::string_or(parsed.get_object(), "name", fmt::format("Project #{}", project_id));
                } catch (const decode_error &ex) {
                    logger::debug("project {} has unparsable metadata: {}", project_id, ex.what());
                }
            }
        }
        return fmt::format("Project #{}", project_id);
    }

    static project_info parse_project(const json::object &obj)
    {
        project_info p {};
        p.project_id = json::uint64_or(obj, "projectId");
        p.chain_id = json::uint64_or(obj, "chainId");
        p.version = uint32_or(obj, "version", default_version);
        p.handle = json::string_or(obj, "handle");
        p.name = project_name(obj, p.project_id);
        p.owner = evm::normalize_address(json::string_or(obj, "owner"));
        p.metadata_uri = json::string_or(obj, "metadataUri");
        p.balance = json::big_uint_or(obj, "balance");
        p.volume = json::big_uint_or(obj, "volume");
        p.payments_count = json::uint64_or(obj, "paymentsCount");
        p.created_at = json::uint64_or(obj, "createdAt");
        p.decimals = uint32_or(obj, "decimals", default_decimals);
        std::optional<uint32_t> reported {};
        if (json::find(obj, "currency"))
            reported = uint32_or(obj, "currency", currency_eth);
        p.currency = accounting_currency(p.decimals, reported);
        if (const auto *g = json::find(obj, "suckerGroupId"); g && g->is_string() && !g->get_string().empty())
            p.sucker_group_id.emplace(g->get_string());
        return p;
    }

    static group_member parse_member(const json::object &obj)
    {
        group_member m {};
        m.project_id = json::uint64_or(obj, "projectId");
        m.chain_id = json::uint64_or(obj, "chainId");
        m.balance = json::big_uint_or(obj, "balance");
        m.volume = json::big_uint_or(obj, "volume");
        m.payments_count = json::uint64_or(obj, "paymentsCount");
        m.token_supply = json::big_uint_or(obj, "tokenSupply");
        m.decimals = uint32_or(obj, "decimals", default_decimals);
        std::optional<uint32_t> reported {};
        if (json::find(obj, "currency"))
            reported = uint32_or(obj, "currency", currency_eth);
        m.currency = accounting_currency(m.decimals, reported);
        return m;
    }

    static participant parse_participant(const json::object &obj)
    {
        participant p {};
        // older indexer versions name the holder field wallet
        p.address = evm::normalize_address(json::find(obj, "address") ? json::string_or(obj, "address") : json::string_or(obj, "wallet"));
        p.chain_id = json::uint64_or(obj, "chainId");
        p.project_id = json::uint64_or(obj, "projectId");
        p.balance = json::big_uint_or(obj, "balance");
        p.volume = json::big_uint_or(obj, "volume");
        return p;
    }

    static pay_event parse_pay_event(const json::object &obj)
    {
        pay_event ev {};
        ev.amount = json::big_uint_or(obj, "amount");
        if (const auto *usd = json::find(obj, "amountUsd"))
            ev.amount_usd = usd->is_string() ? std::string { usd->get_string() } : json::serialize(*usd);
        ev.newly_issued_tokens = json::big_uint_or(obj, "newlyIssuedTokenCount");
        ev.timestamp = json::uint64_or(obj, "timestamp");
        ev.from = evm::normalize_address(json::string_or(obj, "from"));
        ev.tx_hash = json::string_or(obj, "txHash");
        ev.memo = json::string_or(obj, "memo");
        return ev;
    }

    template<typename T, typename F>
    static page<T> parse_page(const json::object &data, const std::string_view field, const F &parse_item)
    {
        const auto *c = json::find(data, field);
        if (!c || !c->is_object())
            throw upstream_error("json response is missing object field {}", field);
        const auto &conn = c->get_object();
        page<T> p {};
        if (const auto *items = json::find(conn, "items")) {
            if (!items->is_array())
                throw upstream_error("{}.items must be an array", field);
            for (const auto &item: items->get_array()) {
                if (!item.is_object())
                    throw upstream_error("{}.items must contain objects only", field);
                p.items.emplace_back(parse_item(item.get_object()));
            }
        }
        if (const auto *info = json::find(conn, "pageInfo"); info && info->is_object()) {
            const auto &pi = info->get_object();
            p.has_next_page = json::bool_or(pi, "hasNextPage");
            if (const auto *cur = json::find(pi, "endCursor"); cur && cur->is_string())
                p.end_cursor.emplace(cur->get_string());
        }
        return p;
    }

    client::client(const settings &cfg, http::client &http, resilience::circuit_breaker &breaker):
        _cfg { cfg }, _http { http }, _breaker { breaker }
    {
    }

    resilience::gate_result<json::object> client::query(const chain_id_t chain_id, const std::string_view operation, const std::string_view text, json::object variables)
    {
        const auto &url = _cfg.indexer_url_for(chain_id);
        const resilience::call_info info { std::string { operation }, json::serialize(variables) };
        const json::object req {
            { "operationName", operation },
            { "query", text },
            { "variables", std::move(variables) }
        };
        return _breaker.call<json::object>([&] {
            const auto resp = _http.post_json(url, req, _cfg.indexer_timeout);
            if (!resp.is_object())
                throw upstream_error("indexer query {} returned a non-object response", operation);
            if (const auto *errs = json::find(resp.get_object(), "errors"); errs && errs->is_array() && !errs->get_array().empty()) {
                const auto &first = errs->get_array().front();
                const auto msg = first.is_object() ? json::string_or(first.get_object(), "message", "unknown error") : json::serialize(first);
                throw upstream_error("indexer query {} failed: {}", operation, msg);
            }
            return json::object { json::at_object(resp, "data") };
        }, info);
    }

    json::object client::_query_value(const chain_id_t chain_id, const std::string_view operation, const std::string_view text, json::object variables)
    {
        auto res = query(chain_id, operation, text, std::move(variables));
        return std::move(res.value());
    }

    std::optional<project_info> client::project(const chain_id_t chain_id, const project_id_t project_id, const uint32_t version)
    {
        const auto data = _query_value(chain_id, "Project", project_query, {
            { "projectId", project_id },
            { "chainId", chain_id },
            { "version", version }
        });
        const auto *proj = json::find(data, "project");
        if (!proj)
            return {};
        if (!proj->is_object())
            throw upstream_error("project must be an object");
        return parse_project(proj->get_object());
    }

    std::optional<sucker_group> client::sucker_group_by_id(const chain_id_t chain_id, const std::string &group_id)
    {
        const auto data = _query_value(chain_id, "SuckerGroupById", sucker_group_query, { { "id", group_id } });
        const auto *grp = json::find(data, "suckerGroup");
        if (!grp)
            return {};
        if (!grp->is_object())
            throw upstream_error("suckerGroup must be an object");
        const auto &obj = grp->get_object();
        sucker_group g {};
        g.id = json::string_or(obj, "id", group_id);
        if (json::find(obj, "balance"))
            g.balance = json::big_uint_or(obj, "balance");
        if (json::find(obj, "volume"))
            g.volume = json::big_uint_or(obj, "volume");
        if (json::find(obj, "paymentsCount"))
            g.payments_count = json::uint64_or(obj, "paymentsCount");
        if (json::find(obj, "tokenSupply"))
            g.token_supply = json::big_uint_or(obj, "tokenSupply");
        if (const auto *projects = json::find(obj, "projects"); projects && projects->is_object())
            g.members = parse_page<group_member>(obj, "projects", parse_member).items;
        return g;
    }

    std::optional<sucker_group> client::sucker_group_of(const chain_id_t chain_id, const project_id_t project_id, const uint32_t version)
    {
        const auto proj = project(chain_id, project_id, version);
        if (!proj || !proj->sucker_group_id)
            return {};
        return sucker_group_by_id(chain_id, *proj->sucker_group_id);
    }

    page<participant> client::participants_page(const chain_id_t chain_id, const project_id_t project_id, const size_t limit, const std::optional<std::string> &after)
    {
        const auto data = _query_value(chain_id, "Participants", participants_query, {
            { "projectId", project_id },
            { "chainId", chain_id },
            { "limit", limit },
            { "after", cursor_value(after) }
        });
        return parse_page<participant>(data, "participants", parse_participant);
    }

    page<participant> client::group_participants_page(const chain_id_t chain_id, const std::string &group_id, const size_t limit, const std::optional<std::string> &after)
    {
        const auto data = _query_value(chain_id, "SuckerGroupParticipants", group_participants_query, {
            { "suckerGroupId", group_id },
            { "limit", limit },
            { "after", cursor_value(after) }
        });
        return parse_page<participant>(data, "participants", parse_participant);
    }

    std::vector<participant> client::participants_of_project(const chain_id_t chain_id, const project_id_t project_id, const size_t max_pages)
    {
        return fetch_all_pages<participant>([&](const std::optional<std::string> &after) {
            return participants_page(chain_id, project_id, default_page_size, after);
        }, max_pages);
    }

    std::vector<participant> client::participants_of_group(const chain_id_t chain_id, const std::string &group_id, const size_t max_pages)
    {
        return fetch_all_pages<participant>([&](const std::optional<std::string> &after) {
            return group_participants_page(chain_id, group_id, default_page_size, after);
        }, max_pages);
    }

    page<pay_event> client::pay_events_page(const chain_id_t chain_id, const project_id_t project_id, const uint32_t version, const size_t limit, const std::optional<std::string> &after)
    {
        const auto data = _query_value(chain_id, "PayEventsHistory", pay_events_query, {
            { "projectId", project_id },
            { "chainId", chain_id },
            { "version", version },
            { "limit", limit },
            { "after", cursor_value(after) }
        });
        return parse_page<pay_event>(data, "payEvents", parse_pay_event);
    }

    std::vector<pay_event> client::recent_pay_events(const chain_id_t chain_id, const project_id_t project_id, const uint32_t version, const size_t limit)
    {
        return pay_events_page(chain_id, project_id, version, limit, {}).items;
    }

    std::optional<issuance_rate> client::issuance_rate_of(const chain_id_t chain_id, const project_id_t project_id, const uint32_t version)
    {
        const auto events = recent_pay_events(chain_id, project_id, version);
        if (events.empty())
            return {};
        cpp_int total_tokens {};
        cpp_int total_amount {};
        for (const auto &ev: events) {
            total_tokens += ev.newly_issued_tokens;
            total_amount += ev.amount;
        }
        if (total_amount == 0)
            return {};
        return issuance_rate { total_tokens.convert_to<double>() / total_amount.convert_to<double>(), events.size() };
    }

    page<activity_event> client::activity_events(const chain_id_t chain_id, const size_t limit, const std::optional<std::string> &after)
    {
        const auto data = _query_value(chain_id, "ActivityEvents", activity_events_query, {
            { "limit", limit },
            { "after", cursor_value(after) }
        });
        return parse_page<activity_event>(data, "activityEvents", parse_activity_event);
    }
}
