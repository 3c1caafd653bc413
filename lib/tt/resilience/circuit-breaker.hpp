/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_RESILIENCE_CIRCUIT_BREAKER_HPP
#define TREASURY_TURBO_RESILIENCE_CIRCUIT_BREAKER_HPP

#include <deque>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <typeinfo>
#include <tt/clock.hpp>
#include <tt/common/error.hpp>
#include <tt/config.hpp>
#include <tt/mutex.hpp>
#include <tt/resilience/debug-sink.hpp>

namespace treasury_turbo::resilience {
    enum class circuit_state { closed, open, half_open };
    enum class call_status { success, failure, circuit_open };

    extern std::string exception_message(const std::exception_ptr &ex);

    template<typename T>
    struct gate_result {
        call_status status = call_status::failure;
        std::optional<T> data {};
        std::exception_ptr error {};
        clock::duration retry_after {};
        std::string source {};

        [[nodiscard]] bool ok() const noexcept
        {
            return status == call_status::success;
        }

        // For load-bearing slots: converts a non-success into the matching exception
        T &value()
        {
            switch (status) {
                case call_status::success:
                    return *data;
                case call_status::circuit_open:
                    throw circuit_open_error { source, retry_after };
                default:
                    if (error)
                        std::rethrow_exception(error);
                    throw upstream_error("{} call failed without an error", source);
            }
        }

        [[nodiscard]] std::string error_message() const
        {
            return exception_message(error);
        }
    };

    // Identifies a call in the observability records
    struct call_info {
        std::string call_id {};
        std::string variables {};
    };

    struct breaker_options {
        size_t failure_threshold = 3;
        clock::duration failure_window { 60'000 };
        clock::duration cooldown { 300'000 };
        clock::duration max_cooldown { 1'800'000 };
        std::function<void()> on_open {};
        std::function<void()> on_close {};

        static breaker_options from_settings(const breaker_settings &s)
        {
            return { s.failure_threshold, s.failure_window, s.cooldown, s.max_cooldown };
        }
    };

    struct circuit_breaker {
        explicit circuit_breaker(std::string name, breaker_options opts={}, const clock &clk=clock_steady::get(), debug_sink &sink=debug_sink_log::get());

        // Failures are reported through the result, the function's exceptions never escape unless they are not std::exception
        template<typename T, typename F>
        gate_result<T> call(const F &fn, const call_info &info={})
        {
            gate_result<T> res {};
            res.source = _name;
            const auto admission = _admit();
            if (!admission) {
                res.status = call_status::circuit_open;
                res.retry_after = retry_after();
                _emit(info, "circuit open", fmt::format("retry after {} ms", res.retry_after.count()));
                return res;
            }
            try {
                res.data.emplace(fn());
                res.status = call_status::success;
                _record_success(*admission);
            } catch (const std::exception &ex) {
                res.error = std::current_exception();
                _emit(info, ex.what(), typeid(ex).name());
                if (_record_failure(*admission)) {
                    res.status = call_status::circuit_open;
                    res.retry_after = retry_after();
                } else {
                    res.status = call_status::failure;
                }
            } catch (...) {
                // not an error the caller can branch on, but the admission must still be released
                _emit(info, "non-standard exception", "unknown");
                _record_failure(*admission);
                throw;
            }
            return res;
        }

        [[nodiscard]] const std::string &name() const noexcept
        {
            return _name;
        }

        [[nodiscard]] circuit_state state() const;
        // Zero unless the circuit is open
        [[nodiscard]] clock::duration retry_after() const;
        [[nodiscard]] size_t failure_count() const;
        void reset();
    private:
        enum class admission_type { normal, trial };

        const std::string _name;
        const breaker_options _opts;
        const clock &_clock;
        debug_sink &_sink;
        mutable mutex::mutex_type _mutex {};
        circuit_state _state = circuit_state::closed;
        mutable std::deque<clock::time_point> _failures {};
        clock::time_point _opened_at {};
        clock::duration _cur_cooldown;
        bool _trial_in_flight = false;

        std::optional<admission_type> _admit();
        void _record_success(admission_type adm);
        bool _record_failure(admission_type adm);
        void _prune_failures(clock::time_point now) const;
        void _open(clock::time_point now);
        void _emit(const call_info &info, std::string_view err, std::string_view details);
        void _notify(const std::function<void()> &cb, std::string_view event) const;
    };
}

namespace fmt {
    template<>
    struct formatter<treasury_turbo::resilience::circuit_state>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using treasury_turbo::resilience::circuit_state;
            switch (v) {
                case circuit_state::closed: return fmt::format_to(ctx.out(), "closed");
                case circuit_state::open: return fmt::format_to(ctx.out(), "open");
                case circuit_state::half_open: return fmt::format_to(ctx.out(), "half_open");
                default: throw treasury_turbo::error("unsupported circuit_state: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<treasury_turbo::resilience::call_status>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using treasury_turbo::resilience::call_status;
            switch (v) {
                case call_status::success: return fmt::format_to(ctx.out(), "success");
                case call_status::failure: return fmt::format_to(ctx.out(), "failure");
                case call_status::circuit_open: return fmt::format_to(ctx.out(), "circuit_open");
                default: throw treasury_turbo::error("unsupported call_status: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TREASURY_TURBO_RESILIENCE_CIRCUIT_BREAKER_HPP
