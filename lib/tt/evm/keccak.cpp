/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <hash-library/keccak.h>
#include <tt/evm/keccak.hpp>

namespace treasury_turbo::evm::keccak {
    void digest(const std::span<uint8_t> &out, const buffer &in)
    {
        if (out.size() != 32)
            throw error("keccak-256 output must be 32 bytes but got {}", out.size());
        Keccak hasher {};
        hasher.add(in.data(), in.size());
        hasher.getHashBin(out);
    }
}
