/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <algorithm>
#include <tt/logger.hpp>
#include <tt/resilience/circuit-breaker.hpp>

namespace treasury_turbo::resilience {
    std::string exception_message(const std::exception_ptr &ex)
    {
        if (!ex)
            return {};
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception &e) {
            return e.what();
        }
    }

    circuit_breaker::circuit_breaker(std::string name, breaker_options opts, const clock &clk, debug_sink &sink):
        _name { std::move(name) }, _opts { std::move(opts) }, _clock { clk }, _sink { sink }, _cur_cooldown { _opts.cooldown }
    {
        if (_opts.failure_threshold == 0)
            throw config_error("circuit breaker {}: failure threshold must be positive", _name);
    }

    circuit_state circuit_breaker::state() const
    {
        mutex::scoped_lock lk { _mutex };
        return _state;
    }

    clock::duration circuit_breaker::retry_after() const
    {
        mutex::scoped_lock lk { _mutex };
        if (_state != circuit_state::open)
            return clock::duration::zero();
        const auto elapsed = std::chrono::duration_cast<clock::duration>(_clock.now() - _opened_at);
        return std::max(clock::duration::zero(), _cur_cooldown - elapsed);
    }

    size_t circuit_breaker::failure_count() const
    {
        mutex::scoped_lock lk { _mutex };
        _prune_failures(_clock.now());
        return _failures.size();
    }

    void circuit_breaker::reset()
    {
        {
            mutex::scoped_lock lk { _mutex };
            _state = circuit_state::closed;
            _failures.clear();
            _cur_cooldown = _opts.cooldown;
            _trial_in_flight = false;
        }
        logger::info("circuit {} manually reset", _name);
    }

    std::optional<circuit_breaker::admission_type> circuit_breaker::_admit()
    {
        mutex::scoped_lock lk { _mutex };
        switch (_state) {
            case circuit_state::closed:
                return admission_type::normal;
            case circuit_state::open:
                if (_clock.now() - _opened_at < _cur_cooldown)
                    return {};
                _state = circuit_state::half_open;
                _trial_in_flight = true;
                logger::info("circuit {} half-open: testing recovery", _name);
                return admission_type::trial;
            case circuit_state::half_open:
                // a single trial call at a time
                if (_trial_in_flight)
                    return {};
                _trial_in_flight = true;
                return admission_type::trial;
            default:
                throw error("circuit {}: unsupported state {}", _name, static_cast<int>(_state));
        }
    }

    void circuit_breaker::_record_success(const admission_type adm)
    {
        bool closed = false;
        {
            mutex::scoped_lock lk { _mutex };
            _failures.clear();
            if (adm == admission_type::trial && _state == circuit_state::half_open) {
                _state = circuit_state::closed;
                _cur_cooldown = _opts.cooldown;
                _trial_in_flight = false;
                closed = true;
            }
        }
        if (closed) {
            logger::info("circuit {} closed: service recovered", _name);
            _notify(_opts.on_close, "on_close");
        }
    }

    bool circuit_breaker::_record_failure(const admission_type adm)
    {
        bool opened = false;
        {
            mutex::scoped_lock lk { _mutex };
            const auto now = _clock.now();
            if (adm == admission_type::trial && _state == circuit_state::half_open) {
                _cur_cooldown = std::min(_cur_cooldown * 2, _opts.max_cooldown);
                _trial_in_flight = false;
                _open(now);
                opened = true;
            } else if (_state == circuit_state::closed) {
                _failures.emplace_back(now);
                _prune_failures(now);
                if (_failures.size() >= _opts.failure_threshold) {
                    _open(now);
                    opened = true;
                }
            } else {
                // the circuit has been opened by a concurrent call
                opened = _state == circuit_state::open;
            }
        }
        if (opened) {
            logger::warn("circuit {} opened, retry after {} ms", _name, retry_after().count());
            _notify(_opts.on_open, "on_open");
        }
        return opened;
    }

    void circuit_breaker::_prune_failures(const clock::time_point now) const
    {
        while (!_failures.empty() && now - _failures.front() >= _opts.failure_window)
            _failures.pop_front();
    }

    void circuit_breaker::_open(const clock::time_point now)
    {
        _state = circuit_state::open;
        _opened_at = now;
        _failures.clear();
    }

    void circuit_breaker::_emit(const call_info &info, const std::string_view err, const std::string_view details)
    {
        try {
            _sink.record(debug_record { _name, info.call_id, info.variables, std::string { err }, std::string { details } });
        } catch (const std::exception &ex) {
            logger::warn("circuit {}: debug sink failed: {}", _name, ex.what());
        }
    }

    void circuit_breaker::_notify(const std::function<void()> &cb, const std::string_view event) const
    {
        if (!cb)
            return;
        try {
            cb();
        } catch (const std::exception &ex) {
            logger::warn("circuit {}: {} callback failed: {}", _name, event, ex.what());
        }
    }
}
