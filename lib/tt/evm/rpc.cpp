/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <tt/evm/rpc.hpp>
#include <tt/logger.hpp>

namespace treasury_turbo::evm {
    rpc::rpc(const settings &cfg, http::client &http, resilience::circuit_breaker &breaker):
        _cfg { cfg }, _http { http }, _breaker { breaker }
    {
    }

    resilience::retry_policy rpc::policy(const chain_id_t chain_id) const
    {
        return { _cfg.rpc_endpoints_for(chain_id), _cfg.rpc_timeout, _cfg.rpc_max_attempts };
    }

    resilience::gate_result<uint8_vector> rpc::call(const chain_id_t chain_id, const address &to, const abi::encoder &data, const std::string_view call_id)
    {
        resilience::retry_policy pol {};
        try {
            pol = policy(chain_id);
        } catch (const config_error &) {
            logger::warn("{} on chain {}: no rpc endpoints configured", call_id, chain_id);
            resilience::gate_result<uint8_vector> res {};
            res.status = resilience::call_status::failure;
            res.error = std::current_exception();
            res.source = _breaker.name();
            return res;
        }
        const resilience::call_info info { std::string { call_id }, fmt::format("{{chainId: {}, to: {}, data: {}}}", chain_id, to, to_hex(data.data())) };
        return _breaker.call<uint8_vector>([&] {
            return resilience::try_each(pol, [&](const std::string &url, const std::chrono::milliseconds timeout) {
                return _eth_call(url, timeout, to, data.data());
            });
        }, info);
    }

    uint8_vector rpc::_eth_call(const std::string &url, const std::chrono::milliseconds timeout, const address &to, const uint8_vector &data)
    {
        const json::object req {
            { "jsonrpc", "2.0" },
            { "id", _next_id.fetch_add(1) },
            { "method", "eth_call" },
            { "params", json::array {
                json::object {
                    { "to", to.to_string() },
                    { "data", to_hex(data) }
                },
                "latest"
            } }
        };
        const auto resp = _http.post_json(url, req, timeout);
        if (!resp.is_object())
            throw upstream_error("eth_call at {} returned a non-object response", url);
        const auto &obj = resp.get_object();
        if (const auto *err = json::find(obj, "error"))
            throw upstream_error("eth_call at {} failed: {}", url, json::serialize(*err));
        return uint8_vector::from_hex(json::at_string(obj, "result"));
    }
}
