/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_PROTOCOL_CHAIN_READER_HPP
#define TREASURY_TURBO_PROTOCOL_CHAIN_READER_HPP

#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include <tt/cache.hpp>
#include <tt/protocol/contracts.hpp>

namespace treasury_turbo::protocol {
    // Decodes a JBRuleset tuple occupying nine consecutive words starting at first_word
    extern ruleset decode_ruleset(const evm::abi::decoder &dec, size_t first_word=0);

    /*
     * Read-only access to a project's on-chain state through the contracts of its resolved bundle.
     * Every method throws circuit_open_error or upstream_error when the chain cannot be read,
     * and returns an empty value when the requested record does not exist.
     * Results are cached with the configured TTLs; stored ruleset records never change and are cached permanently.
     */
    struct chain_reader {
        chain_reader(const contract_registry &reg, evm::rpc &rpc, const cache_ttls &ttls={}, const clock &clk=clock_steady::get());

        std::optional<ruleset> current_ruleset(const contract_bundle &b, chain_id_t chain_id, project_id_t project_id);
        std::optional<ruleset> ruleset_of(const contract_bundle &b, chain_id_t chain_id, project_id_t project_id, uint64_t ruleset_id);
        std::optional<queued_ruleset> latest_queued_ruleset(const contract_bundle &b, chain_id_t chain_id, project_id_t project_id);

        std::vector<split> reserved_splits(chain_id_t chain_id, project_id_t project_id, uint64_t ruleset_id);
        // The splits of the native token group and when it is empty the ones of the chain's USDC group
        std::vector<split> payout_splits(chain_id_t chain_id, project_id_t project_id, uint64_t ruleset_id);
        // The limits of the native token and when there are none the ones of the chain's USDC
        fund_access_limits fund_access(const contract_bundle &b, chain_id_t chain_id, project_id_t project_id, uint64_t ruleset_id);

        cpp_int token_supply(chain_id_t chain_id, project_id_t project_id);
        // Empty when the project has not deployed an ERC-20 token
        std::optional<std::string> token_symbol(chain_id_t chain_id, project_id_t project_id);

        // Both are empty when the bundle's generation has no terminal store to read from
        std::optional<cpp_int> terminal_balance(const contract_bundle &b, chain_id_t chain_id, project_id_t project_id);
        std::optional<cpp_int> used_payout_limit(const contract_bundle &b, chain_id_t chain_id, project_id_t project_id,
            uint64_t cycle_number, uint32_t currency);

        [[nodiscard]] const contract_registry &registry() const noexcept
        {
            return _reg;
        }
    private:
        using record_key = std::tuple<chain_id_t, project_id_t, uint64_t>;

        const contract_registry &_reg;
        evm::rpc &_rpc;
        ttl_cache<project_key, ruleset> _current;
        ttl_cache<project_key, queued_ruleset> _queued;
        ttl_cache<record_key, ruleset> _records;
        ttl_cache<record_key, std::vector<split>> _reserved_splits;
        ttl_cache<record_key, std::vector<split>> _payout_splits;
        ttl_cache<record_key, fund_access_limits> _limits;
        ttl_cache<project_key, cpp_int> _supplies;
        ttl_cache<project_key, cpp_int> _balances;
        ttl_cache<project_key, std::optional<std::string>> _symbols;

        uint8_vector _call(chain_id_t chain_id, const evm::address &to, const evm::abi::encoder &data, std::string_view call_id);
        std::vector<split> _splits_of(chain_id_t chain_id, project_id_t project_id, uint64_t ruleset_id, const cpp_int &group);
        std::vector<currency_amount> _amounts_of(std::string_view signature, const contract_bundle &b, chain_id_t chain_id,
            project_id_t project_id, uint64_t ruleset_id, const evm::address &token);
    };
}

#endif // !TREASURY_TURBO_PROTOCOL_CHAIN_READER_HPP
