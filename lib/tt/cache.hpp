/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_CACHE_HPP
#define TREASURY_TURBO_CACHE_HPP

#include <map>
#include <optional>
#include <tt/clock.hpp>
#include <tt/mutex.hpp>

namespace treasury_turbo {
    /*
     * A process-wide map with per-entry expiration.
     * Entries stored without a TTL never expire and represent immutable facts such as past ruleset cycles.
     * Writes are last-writer-wins since a recomputation of the same key produces the same value.
     */
    template<typename K, typename V>
    struct ttl_cache {
        using ttl_type = std::optional<clock::duration>;

        explicit ttl_cache(const ttl_type default_ttl={}, const clock &clk=clock_steady::get()):
            _default_ttl { default_ttl }, _clock { clk }
        {
        }

        [[nodiscard]] std::optional<V> get(const K &key) const
        {
            mutex::scoped_lock lk { _mutex };
            const auto it = _entries.find(key);
            if (it == _entries.end() || _expired(it->second))
                return {};
            return it->second.value;
        }

        void set(const K &key, V value)
        {
            set(key, std::move(value), _default_ttl);
        }

        void set(const K &key, V value, const ttl_type ttl)
        {
            std::optional<clock::time_point> expires {};
            if (ttl)
                expires.emplace(_clock.now() + *ttl);
            mutex::scoped_lock lk { _mutex };
            _entries.insert_or_assign(key, entry { std::move(value), expires });
        }

        bool erase(const K &key)
        {
            mutex::scoped_lock lk { _mutex };
            return _entries.erase(key) > 0;
        }

        void clear()
        {
            mutex::scoped_lock lk { _mutex };
            _entries.clear();
        }

        // Returns the number of removed entries
        size_t cleanup_expired()
        {
            mutex::scoped_lock lk { _mutex };
            size_t num_removed = 0;
            for (auto it = _entries.begin(); it != _entries.end(); ) {
                if (_expired(it->second)) {
                    it = _entries.erase(it);
                    ++num_removed;
                } else {
                    ++it;
                }
            }
            return num_removed;
        }

        // Includes the expired entries not yet removed by cleanup_expired
        [[nodiscard]] size_t size() const
        {
            mutex::scoped_lock lk { _mutex };
            return _entries.size();
        }

        template<typename F>
        V get_or_compute(const K &key, const F &compute)
        {
            if (auto cached = get(key))
                return std::move(*cached);
            V value = compute();
            set(key, value);
            return value;
        }
    private:
        struct entry {
            V value;
            std::optional<clock::time_point> expires {};
        };

        const ttl_type _default_ttl;
        const clock &_clock;
        mutable mutex::mutex_type _mutex {};
        std::map<K, entry> _entries {};

        bool _expired(const entry &e) const
        {
            return e.expires && _clock.now() >= *e.expires;
        }
    };
}

#endif // !TREASURY_TURBO_CACHE_HPP
