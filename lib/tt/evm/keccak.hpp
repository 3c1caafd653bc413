/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_EVM_KECCAK_HPP
#define TREASURY_TURBO_EVM_KECCAK_HPP

#include <string_view>
#include <tt/common/bytes.hpp>

namespace treasury_turbo::evm::keccak
{
    using hash_256 = byte_array<32>;

    extern void digest(const std::span<uint8_t> &out, const buffer &in);

    inline hash_256 digest(const buffer &in)
    {
        hash_256 out;
        digest(out, in);
        return out;
    }

    inline hash_256 digest(const std::string_view in)
    {
        return digest(buffer { reinterpret_cast<const uint8_t *>(in.data()), in.size() });
    }
}

#endif // !TREASURY_TURBO_EVM_KECCAK_HPP
