/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_RESILIENCE_DEBUG_SINK_HPP
#define TREASURY_TURBO_RESILIENCE_DEBUG_SINK_HPP

#include <string>
#include <vector>
#include <tt/logger.hpp>
#include <tt/mutex.hpp>

namespace treasury_turbo::resilience {
    struct debug_record {
        std::string source {};
        std::string call_id {};
        std::string variables {};
        std::string error {};
        std::string error_details {};

        bool operator==(const debug_record &o) const =default;
    };

    struct debug_sink {
        virtual ~debug_sink() =default;

        void record(const debug_record &rec)
        {
            _record_impl(rec);
        }
    private:
        virtual void _record_impl(const debug_record &) =0;
    };

    struct debug_sink_log: debug_sink {
        static debug_sink_log &get()
        {
            static debug_sink_log sink {};
            return sink;
        }
    private:
        void _record_impl(const debug_record &rec) override
        {
            logger::warn("{} call {} with {} failed: {} ({})", rec.source, rec.call_id, rec.variables, rec.error, rec.error_details);
        }
    };

    // Used as a mock
    struct debug_sink_memory: debug_sink {
        std::vector<debug_record> records() const
        {
            mutex::scoped_lock lk { _mutex };
            return _records;
        }
    private:
        mutable mutex::mutex_type _mutex {};
        std::vector<debug_record> _records {};

        void _record_impl(const debug_record &rec) override
        {
            mutex::scoped_lock lk { _mutex };
            _records.emplace_back(rec);
        }
    };
}

#endif // !TREASURY_TURBO_RESILIENCE_DEBUG_SINK_HPP
