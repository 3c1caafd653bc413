/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */
#ifndef TREASURY_TURBO_HTTP_CLIENT_HPP
#define TREASURY_TURBO_HTTP_CLIENT_HPP

#include <chrono>
#include <memory>
#include <string>
#include <tt/json.hpp>

namespace treasury_turbo::http {
    struct client {
        virtual ~client() =default;

        // Returns the response body of a successful (HTTP 200) response, otherwise throws upstream_error
        std::string post(const std::string &url, const std::string &body, const std::chrono::milliseconds timeout)
        {
            return _post_impl(url, body, timeout);
        }

        json::value post_json(const std::string &url, const json::value &req, const std::chrono::milliseconds timeout)
        {
            const auto resp = post(url, json::serialize(req), timeout);
            try {
                return json::parse(resp);
            } catch (const std::exception &ex) {
                throw upstream_error(fmt::format("POST {} returned malformed json", url), ex);
            }
        }
    private:
        virtual std::string _post_impl(const std::string &url, const std::string &body, std::chrono::milliseconds timeout) =0;
    };

    // Plain-HTTP client: https endpoints have to be reached through a local TLS-terminating proxy
    struct client_beast: client {
        static client_beast &get()
        {
            static client_beast c {};
            return c;
        }

        client_beast();
        ~client_beast() override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;

        std::string _post_impl(const std::string &url, const std::string &body, std::chrono::milliseconds timeout) override;
    };
}

#endif // !TREASURY_TURBO_HTTP_CLIENT_HPP
