/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_JSON_HPP
#define TREASURY_TURBO_JSON_HPP

#include <fstream>
#include <optional>
#include <sstream>
#include <boost/json.hpp>
#include <tt/big-int.hpp>
#include <tt/common/error.hpp>

namespace treasury_turbo::json {
    using namespace boost::json;

    inline json::value parse(const std::string_view text, json::storage_ptr sp={})
    {
        boost::system::error_code ec {};
        auto jv = boost::json::parse(text, ec, sp);
        if (ec)
            throw decode_error("invalid json: {}", ec.message());
        return jv;
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw config_error("unable to open {}", path);
        std::ostringstream ss {};
        ss << is.rdbuf();
        return parse(ss.str(), sp);
    }

    inline const json::value *find(const json::object &obj, const std::string_view name)
    {
        const auto it = obj.find(name);
        if (it == obj.end() || it->value().is_null())
            return nullptr;
        return &it->value();
    }

    inline const json::object &at_object(const json::value &jv, const std::string_view name)
    {
        const auto *v = jv.is_object() ? find(jv.get_object(), name) : nullptr;
        if (!v || !v->is_object())
            throw upstream_error("json response is missing object field {}", name);
        return v->get_object();
    }

    inline std::string_view at_string(const json::object &obj, const std::string_view name)
    {
        const auto *v = find(obj, name);
        if (!v || !v->is_string())
            throw upstream_error("json response is missing string field {}", name);
        return v->get_string();
    }

    inline std::string string_or(const json::object &obj, const std::string_view name, const std::string_view def={})
    {
        if (const auto *v = find(obj, name); v && v->is_string())
            return std::string { v->get_string() };
        return std::string { def };
    }

    inline uint64_t uint64_or(const json::object &obj, const std::string_view name, const uint64_t def=0)
    {
        const auto *v = find(obj, name);
        if (!v)
            return def;
        switch (v->kind()) {
            case json::kind::uint64: return v->get_uint64();
            case json::kind::int64:
                if (v->get_int64() < 0)
                    throw upstream_error("field {} must be non-negative but got {}", name, v->get_int64());
                return static_cast<uint64_t>(v->get_int64());
            case json::kind::string: return static_cast<uint64_t>(big_uint_from_string(v->get_string()));
            default: throw upstream_error("field {} is not an unsigned integer", name);
        }
    }

    // Indexers serialize big amounts as strings to avoid precision loss, small ones may arrive as plain numbers
    inline cpp_int big_uint_or(const json::object &obj, const std::string_view name, const cpp_int &def=0)
    {
        const auto *v = find(obj, name);
        if (!v)
            return def;
        switch (v->kind()) {
            case json::kind::uint64: return cpp_int { v->get_uint64() };
            case json::kind::int64:
                if (v->get_int64() < 0)
                    throw upstream_error("field {} must be non-negative but got {}", name, v->get_int64());
                return cpp_int { v->get_int64() };
            case json::kind::string: return big_uint_from_string(v->get_string());
            default: throw upstream_error("field {} is not a big unsigned integer", name);
        }
    }

    inline bool bool_or(const json::object &obj, const std::string_view name, const bool def=false)
    {
        if (const auto *v = find(obj, name); v && v->is_bool())
            return v->get_bool();
        return def;
    }
}

#endif // !TREASURY_TURBO_JSON_HPP
