/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_PROTOCOL_CONTRACTS_HPP
#define TREASURY_TURBO_PROTOCOL_CONTRACTS_HPP

#include <map>
#include <optional>
#include <string>
#include <tt/evm/rpc.hpp>
#include <tt/protocol/types.hpp>

namespace treasury_turbo::protocol {
    // One protocol generation: the contracts that must never be mixed with another generation's
    struct contract_version {
        std::string name {};
        evm::address controller {};
        evm::address rulesets {};
        evm::address terminal {};
        std::optional<evm::address> terminal_store {};
        // revnets are deployed with the original generation and are read differently
        bool special = false;
    };

    // Contracts that serve every generation, same CREATE2 addresses on all chains
    struct shared_contracts {
        evm::address directory {};
        evm::address splits {};
        evm::address fund_access_limits {};
        evm::address tokens {};
    };

    struct contract_registry {
        contract_version v5 {};
        contract_version v5_1 {};
        shared_contracts shared {};
        evm::address native_token {};
        std::map<chain_id_t, evm::address> usdc {};

        static contract_registry defaults();
        // The defaults with the overrides from the "contracts" section of the configuration
        static contract_registry from_settings(const settings &cfg);

        [[nodiscard]] std::optional<evm::address> usdc_of(chain_id_t chain_id) const;
    };

    // The contracts governing one project on one chain
    struct contract_bundle {
        std::string version {};
        evm::address controller {};
        evm::address rulesets {};
        evm::address terminal {};
        std::optional<evm::address> terminal_store {};
        bool special = false;
        // the directory could not be read and the default generation has been assumed
        bool degraded = false;
    };

    struct contract_resolver {
        contract_resolver(const contract_registry &reg, evm::rpc &rpc);

        // Never throws on a directory failure: falls back to the default generation and logs a warning
        [[nodiscard]] contract_bundle resolve(chain_id_t chain_id, project_id_t project_id);

        [[nodiscard]] const contract_registry &registry() const noexcept
        {
            return _reg;
        }
    private:
        const contract_registry &_reg;
        evm::rpc &_rpc;

        [[nodiscard]] contract_bundle _bundle(const contract_version &ver, const evm::address &controller, bool degraded) const;
    };
}

#endif // !TREASURY_TURBO_PROTOCOL_CONTRACTS_HPP
