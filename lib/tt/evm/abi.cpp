/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <limits>
#include <tt/evm/abi.hpp>
#include <tt/evm/keccak.hpp>

namespace treasury_turbo::evm::abi {
    selector function_selector(const std::string_view signature)
    {
        const auto hash = keccak::digest(signature);
        return selector { buffer { hash.data(), 4 } };
    }

    encoder::encoder(const std::string_view signature)
    {
        _data << function_selector(signature);
    }

    encoder &encoder::uint(const cpp_int &val)
    {
        _data << big_uint_to_word(val);
        return *this;
    }

    encoder &encoder::addr(const address &a)
    {
        evm_word w {};
        std::copy(a.begin(), a.end(), w.begin() + (evm_word_size - a.size()));
        _data << w;
        return *this;
    }

    decoder::decoder(const buffer data): _data { data }
    {
        if (_data.size() % evm_word_size != 0)
            throw decode_error("abi data must be a multiple of {} bytes but got {}", evm_word_size, _data.size());
    }

    buffer decoder::_slice(const size_t off, const size_t size) const
    {
        if (off > _data.size() || size > _data.size() - off)
            throw decode_error("abi data of {} bytes is too short to read {} bytes at {}", _data.size(), size, off);
        return buffer { _data.data() + off, size };
    }

    buffer decoder::word(const size_t idx) const
    {
        return _slice(idx * evm_word_size, evm_word_size);
    }

    cpp_int decoder::uint(const size_t idx) const
    {
        return big_uint_from_bytes(word(idx));
    }

    uint64_t decoder::uint64(const size_t idx) const
    {
        const auto val = uint(idx);
        if (val > std::numeric_limits<uint64_t>::max())
            throw decode_error("abi word {} does not fit into 64 bits: {}", idx, val.str());
        return static_cast<uint64_t>(val);
    }

    bool decoder::boolean(const size_t idx) const
    {
        const auto val = uint64(idx);
        if (val > 1)
            throw decode_error("abi word {} is not a valid boolean: {}", idx, val);
        return val == 1;
    }

    address decoder::addr(const size_t idx) const
    {
        const auto w = word(idx);
        for (size_t i = 0; i < evm_word_size - 20; ++i) {
            if (w[i] != 0)
                throw decode_error("abi word {} is not a valid address: {}", idx, w);
        }
        return address { w.subspan(evm_word_size - 20) };
    }

    size_t decoder::_offset(const size_t idx) const
    {
        const auto off = uint(idx);
        if (off > _data.size())
            throw decode_error("abi offset at word {} points outside of the data: {}", idx, off.str());
        return static_cast<size_t>(off);
    }

    std::string decoder::string(const size_t idx) const
    {
        const auto off = _offset(idx);
        const auto len = big_uint_from_bytes(_slice(off, evm_word_size));
        if (len > _data.size())
            throw decode_error("abi string length is too big: {}", len.str());
        const auto bytes = _slice(off + evm_word_size, static_cast<size_t>(len));
        return std::string { reinterpret_cast<const char *>(bytes.data()), bytes.size() };
    }

    std::vector<decoder> decoder::tuple_array(const size_t idx, const size_t tuple_words) const
    {
        const auto off = _offset(idx);
        const auto len = big_uint_from_bytes(_slice(off, evm_word_size));
        if (len > _data.size() / evm_word_size)
            throw decode_error("abi array length is too big: {}", len.str());
        const auto num_items = static_cast<size_t>(len);
        const auto item_size = tuple_words * evm_word_size;
        std::vector<decoder> items {};
        items.reserve(num_items);
        for (size_t i = 0; i < num_items; ++i)
            items.emplace_back(_slice(off + evm_word_size + i * item_size, item_size));
        return items;
    }

    std::string decode_symbol(const buffer data)
    {
        if (data.size() == evm_word_size) {
            std::string res {};
            for (const auto b: data) {
                if (b == 0)
                    break;
                res.push_back(static_cast<char>(b));
            }
            return res;
        }
        return decoder { data }.string(0);
    }
}
