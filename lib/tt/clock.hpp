/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_CLOCK_HPP
#define TREASURY_TURBO_CLOCK_HPP

#include <chrono>
#include <tt/mutex.hpp>

namespace treasury_turbo {
    struct clock {
        using time_point = std::chrono::steady_clock::time_point;
        using duration = std::chrono::milliseconds;

        virtual ~clock() =default;

        [[nodiscard]] time_point now() const
        {
            return _now_impl();
        }
    private:
        virtual time_point _now_impl() const =0;
    };

    struct clock_steady: clock {
        static const clock_steady &get()
        {
            static clock_steady c {};
            return c;
        }
    private:
        time_point _now_impl() const override
        {
            return std::chrono::steady_clock::now();
        }
    };

    // Time moves only when advance is called
    struct clock_manual: clock {
        void advance(const duration d)
        {
            mutex::scoped_lock lk { _mutex };
            _now += d;
        }
    private:
        mutable mutex::mutex_type _mutex {};
        time_point _now { std::chrono::hours { 24 } };

        time_point _now_impl() const override
        {
            mutex::scoped_lock lk { _mutex };
            return _now;
        }
    };
}

#endif // !TREASURY_TURBO_CLOCK_HPP
