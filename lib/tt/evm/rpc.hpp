/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_EVM_RPC_HPP
#define TREASURY_TURBO_EVM_RPC_HPP

#include <atomic>
#include <tt/config.hpp>
#include <tt/evm/abi.hpp>
#include <tt/http/client.hpp>
#include <tt/resilience/circuit-breaker.hpp>
#include <tt/resilience/retry.hpp>

namespace treasury_turbo::evm {
    /*
     * Read-only eth_call access to the configured chains.
     * Each call goes through the shared RPC circuit breaker and inside of it
     * tries the chain's endpoints in their configured order.
     */
    struct rpc {
        rpc(const settings &cfg, http::client &http, resilience::circuit_breaker &breaker);

        [[nodiscard]] resilience::gate_result<uint8_vector> call(chain_id_t chain_id, const address &to, const abi::encoder &data, std::string_view call_id);

        [[nodiscard]] resilience::retry_policy policy(chain_id_t chain_id) const;

        [[nodiscard]] resilience::circuit_breaker &breaker() noexcept
        {
            return _breaker;
        }
    private:
        const settings &_cfg;
        http::client &_http;
        resilience::circuit_breaker &_breaker;
        std::atomic_uint64_t _next_id { 1 };

        uint8_vector _eth_call(const std::string &url, std::chrono::milliseconds timeout, const address &to, const uint8_vector &data);
    };
}

#endif // !TREASURY_TURBO_EVM_RPC_HPP
