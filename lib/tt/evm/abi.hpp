/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_EVM_ABI_HPP
#define TREASURY_TURBO_EVM_ABI_HPP

#include <string>
#include <vector>
#include <tt/big-int.hpp>
#include <tt/evm/address.hpp>

namespace treasury_turbo::evm::abi {
    using selector = byte_array<4>;

    // The first four bytes of keccak-256 of a canonical signature such as "controllerOf(uint256)"
    extern selector function_selector(std::string_view signature);

    // Call data for functions with static arguments only
    struct encoder {
        explicit encoder(std::string_view signature);

        encoder &uint(const cpp_int &val);
        encoder &addr(const address &a);

        [[nodiscard]] const uint8_vector &data() const noexcept
        {
            return _data;
        }
    private:
        uint8_vector _data {};
    };

    /*
     * A view over return data organized in 32-byte words.
     * Dynamic values (strings, arrays) are referenced by a byte offset stored in their head word.
     */
    struct decoder {
        explicit decoder(buffer data);

        [[nodiscard]] size_t num_words() const noexcept
        {
            return _data.size() / evm_word_size;
        }

        [[nodiscard]] buffer word(size_t idx) const;
        [[nodiscard]] cpp_int uint(size_t idx) const;
        [[nodiscard]] uint64_t uint64(size_t idx) const;
        [[nodiscard]] bool boolean(size_t idx) const;
        [[nodiscard]] address addr(size_t idx) const;
        [[nodiscard]] std::string string(size_t idx) const;
        // A dynamic array of static tuples, each element is returned as its own decoder
        [[nodiscard]] std::vector<decoder> tuple_array(size_t idx, size_t tuple_words) const;
    private:
        uint8_vector _data;

        [[nodiscard]] size_t _offset(size_t idx) const;
        [[nodiscard]] buffer _slice(size_t off, size_t size) const;
    };

    // ERC-20 symbol() is a string in most tokens but a bytes32 in a few early ones
    extern std::string decode_symbol(buffer data);
}

#endif // !TREASURY_TURBO_EVM_ABI_HPP
