/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <typeinfo>
#include <tt/common/error.hpp>
#include <tt/logger.hpp>

namespace treasury_turbo {
    error::error(const std::string_view msg):
        std::runtime_error { std::string { msg } }
    {
        logger::debug("an exception created: {}", msg);
    }

    error::error(const std::string_view msg, const std::exception &ex):
        error { std::string_view { fmt::format("{} caused by {}: {}", msg, typeid(ex).name(), ex.what()) } }
    {
    }

    circuit_open_error::circuit_open_error(const std::string_view name, const std::chrono::milliseconds retry_after):
        error { "circuit {} is open, retry after {} ms", name, retry_after.count() },
        _retry_after { retry_after }
    {
    }
}
