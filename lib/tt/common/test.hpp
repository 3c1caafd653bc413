/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_COMMON_TEST_HPP
#define TREASURY_TURBO_COMMON_TEST_HPP

#include <cmath>
#include <iostream>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include <tt/common/format.hpp>

/*
 * Shared helpers of the unit tests. Everything a failed expectation prints
 * goes through fmt, so the big integers and byte strings of the protocol
 * code show up in the same form as in the logs.
 */

namespace treasury_turbo {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer &operator<<(T &&v)
        {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>)
                _write(fmt::format("{}", std::span<const uint8_t> { v }));
            else
                std::cerr << std::forward<T>(v);
            return *this;
        }

        test_printer &operator<<(const std::string_view sv)
        {
            _write(sv);
            return *this;
        }
    private:
        static void _write(const std::string_view sv)
        {
            std::cerr.write(sv.data(), static_cast<std::streamsize>(sv.size()));
        }
    };

    // relative tolerance unless the expected value is zero
    template<typename T>
    void test_close(const T &exp, const T &act, T eps=1e-4, const std::source_location &loc=std::source_location::current())
    {
        const T diff = std::fabs(act - exp);
        if (exp == T {}) {
            expect(diff <= eps, loc) << fmt::format("expected zero but got {} (tolerance {})", act, eps);
            return;
        }
        const T rel = diff / std::fabs(exp);
        expect(rel <= eps, loc) << fmt::format("{} is not close to {}: relative error {} > {}", act, exp, rel, eps);
    }

    template<typename X, typename Y>
    bool test_same(const X &exp, const Y &act, const std::source_location &loc=std::source_location::current())
    {
        bool ok;
        if constexpr (std::is_same_v<X, Y>)
            ok = exp == act;
        else
            ok = exp == static_cast<X>(act);
        expect(ok, loc) << fmt::format("expected {} but got {}", exp, act);
        return ok;
    }

    template<typename X, typename Y>
    bool test_same(const std::string_view name, const X &exp, const Y &act, const std::source_location &loc=std::source_location::current())
    {
        const bool ok = exp == static_cast<X>(act);
        expect(ok, loc) << fmt::format("{}: expected {} but got {}", name, exp, act);
        return ok;
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<treasury_turbo::test_printer>> {};

#endif // !TREASURY_TURBO_COMMON_TEST_HPP
