/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <tt/logger.hpp>
#include <tt/protocol/contracts.hpp>

namespace treasury_turbo::protocol {
    using evm::address;

    contract_registry contract_registry::defaults()
    {
        contract_registry reg {};
        reg.v5 = contract_version {
            "v5",
            address::from_hex("0x27da30646502e2f642be5281322ae8c394f7668a"),
            address::from_hex("0x6292281d69c3593fcf6ea074e5797341476ab428"),
            address::from_hex("0x2db6d704058e552defe415753465df8df0361846"),
            {},
            true
        };
        reg.v5_1 = contract_version {
            "v5.1",
            address::from_hex("0xf3cc99b11bd73a2e3b8815fb85fe0381b29987e1"),
            address::from_hex("0xd4257005ca8d27bbe11f356453b0e4692414b056"),
            address::from_hex("0x52869db3d61dde1e391967f2ce5039ad0ecd371c"),
            address::from_hex("0x5cdfcf7f5f25da0dcb0eccd027e5feebada1d964"),
            false
        };
        reg.shared = shared_contracts {
            address::from_hex("0x0061e516886a0540f63157f112c0588ee0651dcf"),
            address::from_hex("0x7160a322fea44945a6ef9adfd65c322258df3c5e"),
            address::from_hex("0x3a46b21720c8b70184b0434a2293b2fdcc497ce7"),
            address::from_hex("0x4d0edd347fb1fa21589c1e109b3474924be87636")
        };
        reg.native_token = address::from_hex("0x000000000000000000000000000000000000EEEe");
        reg.usdc = {
            { 1, address::from_hex("0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48") },
            { 10, address::from_hex("0x0b2C639c533813f4Aa9D7837CAf62653d097Ff85") },
            { 8453, address::from_hex("0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913") },
            { 42161, address::from_hex("0xaf88d065e77c8cC2239327C5EDb3A432268e5831") },
            { 11155111, address::from_hex("0x1c7D4B196Cb0C7B01d743Fbc6116a902379C7238") },
            { 11155420, address::from_hex("0x5fd84259d66Cd46123540766Be93DFE6D43130D7") },
            { 84532, address::from_hex("0x036CbD53842c5426634e7929541eC2318f3dCF7e") },
            { 421614, address::from_hex("0x75faf114eafb1BDbe2F0316DF893fd58CE46AA4d") }
        };
        return reg;
    }

    static void override_address(const json::object &obj, const std::string_view name, address &dst)
    {
        if (const auto *v = json::find(obj, name)) {
            if (!v->is_string())
                throw config_error("contract address {} must be a hex string", name);
            dst = address::from_hex(v->get_string());
        }
    }

    static void override_version(const json::object &contracts, const std::string_view name, contract_version &ver)
    {
        const auto *v = json::find(contracts, name);
        if (!v)
            return;
        if (!v->is_object())
            throw config_error("contracts.{} must be a json object", name);
        const auto &obj = v->get_object();
        override_address(obj, "controller", ver.controller);
        override_address(obj, "rulesets", ver.rulesets);
        override_address(obj, "terminal", ver.terminal);
        if (json::find(obj, "terminalStore")) {
            address store {};
            override_address(obj, "terminalStore", store);
            ver.terminal_store.emplace(store);
        }
    }

    contract_registry contract_registry::from_settings(const settings &cfg)
    {
        auto reg = defaults();
        const auto &contracts = cfg.contracts;
        override_version(contracts, "v5", reg.v5);
        override_version(contracts, "v5.1", reg.v5_1);
        if (const auto *shared = json::find(contracts, "shared")) {
            const auto &obj = shared->as_object();
            override_address(obj, "directory", reg.shared.directory);
            override_address(obj, "splits", reg.shared.splits);
            override_address(obj, "fundAccessLimits", reg.shared.fund_access_limits);
            override_address(obj, "tokens", reg.shared.tokens);
        }
        return reg;
    }

    std::optional<address> contract_registry::usdc_of(const chain_id_t chain_id) const
    {
        if (const auto it = usdc.find(chain_id); it != usdc.end())
            return it->second;
        return {};
    }

    contract_resolver::contract_resolver(const contract_registry &reg, evm::rpc &rpc):
        _reg { reg }, _rpc { rpc }
    {
    }

    contract_bundle contract_resolver::_bundle(const contract_version &ver, const address &controller, const bool degraded) const
    {
        return contract_bundle { ver.name, controller, ver.rulesets, ver.terminal, ver.terminal_store, ver.special, degraded };
    }

    contract_bundle contract_resolver::resolve(const chain_id_t chain_id, const project_id_t project_id)
    {
        evm::abi::encoder call { "controllerOf(uint256)" };
        call.uint(project_id);
        auto res = _rpc.call(chain_id, _reg.shared.directory, call, "JBDirectory.controllerOf");
        if (!res.ok()) {
            logger::warn("project {} on chain {}: directory lookup failed, assuming {}: {}",
                project_id, chain_id, _reg.v5_1.name, res.status == resilience::call_status::circuit_open ? "circuit open" : res.error_message());
            return _bundle(_reg.v5_1, _reg.v5_1.controller, true);
        }
        address controller {};
        try {
            controller = evm::abi::decoder { *res.data }.addr(0);
        } catch (const decode_error &ex) {
            logger::warn("project {} on chain {}: malformed directory response, assuming {}: {}", project_id, chain_id, _reg.v5_1.name, ex.what());
            return _bundle(_reg.v5_1, _reg.v5_1.controller, true);
        }
        if (controller.is_zero()) {
            logger::warn("project {} on chain {}: directory has no controller, assuming {}", project_id, chain_id, _reg.v5_1.name);
            return _bundle(_reg.v5_1, _reg.v5_1.controller, true);
        }
        if (controller == _reg.v5.controller)
            return _bundle(_reg.v5, controller, false);
        return _bundle(_reg.v5_1, controller, false);
    }
}
