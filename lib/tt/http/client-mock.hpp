/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_HTTP_CLIENT_MOCK_HPP
#define TREASURY_TURBO_HTTP_CLIENT_MOCK_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <tt/http/client.hpp>
#include <tt/mutex.hpp>

namespace treasury_turbo::http {
    // Routes requests to scripted handlers by URL, a handler may throw to simulate a failing endpoint
    struct client_mock: client {
        using handler_type = std::function<std::string(const std::string &body)>;

        struct request {
            std::string url {};
            std::string body {};
        };

        void add(const std::string &url, handler_type handler)
        {
            mutex::scoped_lock lk { _mutex };
            _handlers.insert_or_assign(url, std::move(handler));
        }

        void add_json(const std::string &url, const std::function<json::value(const json::object &req)> &handler)
        {
            add(url, [handler](const std::string &body) {
                return json::serialize(handler(json::parse(body).as_object()));
            });
        }

        std::vector<request> requests() const
        {
            mutex::scoped_lock lk { _mutex };
            return _requests;
        }

        size_t num_requests(const std::string &url) const
        {
            mutex::scoped_lock lk { _mutex };
            size_t cnt = 0;
            for (const auto &r: _requests) {
                if (r.url == url)
                    ++cnt;
            }
            return cnt;
        }
    private:
        mutable mutex::mutex_type _mutex {};
        std::map<std::string, handler_type> _handlers {};
        std::vector<request> _requests {};

        std::string _post_impl(const std::string &url, const std::string &body, std::chrono::milliseconds) override
        {
            handler_type handler {};
            {
                mutex::scoped_lock lk { _mutex };
                _requests.emplace_back(request { url, body });
                const auto it = _handlers.find(url);
                if (it == _handlers.end())
                    throw upstream_error("POST {} failed: async_connect failed: Connection refused", url);
                handler = it->second;
            }
            return handler(body);
        }
    };
}

#endif // !TREASURY_TURBO_HTTP_CLIENT_MOCK_HPP
