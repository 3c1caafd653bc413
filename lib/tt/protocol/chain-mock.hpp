/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_PROTOCOL_CHAIN_MOCK_HPP
#define TREASURY_TURBO_PROTOCOL_CHAIN_MOCK_HPP

#include <tt/evm/rpc-mock.hpp>
#include <tt/protocol/chain-reader.hpp>

namespace treasury_turbo::protocol {
    // A single mocked chain behind a mocked HTTP client with every component sharing one manual clock
    struct chain_mock {
        static constexpr chain_id_t chain_id = 1;
        std::string rpc_url { "http://rpc.local/eth" };
        settings cfg {};
        clock_manual clk {};
        resilience::debug_sink_memory sink {};
        http::client_mock http {};
        evm::rpc_responder chain {};
        resilience::circuit_breaker breaker { "rpc", resilience::breaker_options::from_settings(cfg.rpc_breaker), clk, sink };
        evm::rpc rpc { cfg, http, breaker };
        contract_registry reg = contract_registry::defaults();
        chain_reader reader { reg, rpc, cfg.ttls, clk };

        chain_mock()
        {
            cfg.rpc_endpoints[chain_id] = { rpc_url };
            chain.install(http, rpc_url);
        }

        [[nodiscard]] contract_bundle bundle(const contract_version &v) const
        {
            return { v.name, v.controller, v.rulesets, v.terminal, v.terminal_store, v.special, false };
        }

        static std::string ruleset_result(const ruleset &rs, const std::optional<approval_status> status={})
        {
            uint8_vector data = uint8_vector::from_hex(evm::rpc_responder::words({
                rs.cycle_number, rs.id, rs.based_on_id, rs.start, rs.duration, rs.weight, rs.weight_cut_percent,
                evm::rpc_responder::word_of(rs.approval_hook), static_cast<cpp_int>(rs.metadata)
            }));
            if (status)
                data << big_uint_to_word(static_cast<uint64_t>(*status));
            return to_hex(data);
        }

        static std::string string_result(const std::string_view s)
        {
            uint8_vector data {};
            data << big_uint_to_word(32);
            data << big_uint_to_word(s.size());
            evm_word w {};
            std::copy(s.begin(), s.end(), w.begin());
            data << w;
            return to_hex(data);
        }

        void current_ruleset(const contract_version &v, const project_id_t project_id, const ruleset &rs)
        {
            evm::abi::encoder call { "currentOf(uint256)" };
            call.uint(project_id);
            chain.on_call(v.rulesets, call, ruleset_result(rs));
        }

        void stored_ruleset(const contract_version &v, const project_id_t project_id, const ruleset &rs)
        {
            evm::abi::encoder call { "getRulesetOf(uint256,uint256)" };
            call.uint(project_id).uint(rs.id);
            chain.on_call(v.rulesets, call, ruleset_result(rs));
        }

        void queued_ruleset(const contract_version &v, const project_id_t project_id, const ruleset &rs, const approval_status status)
        {
            evm::abi::encoder call { "latestQueuedOf(uint256)" };
            call.uint(project_id);
            chain.on_call(v.rulesets, call, ruleset_result(rs, status));
        }

        void controller_of(const project_id_t project_id, const evm::address &controller)
        {
            evm::abi::encoder call { "controllerOf(uint256)" };
            call.uint(project_id);
            chain.on_call(reg.shared.directory, call, evm::rpc_responder::words({ evm::rpc_responder::word_of(controller) }));
        }
    };
}

#endif // !TREASURY_TURBO_PROTOCOL_CHAIN_MOCK_HPP
