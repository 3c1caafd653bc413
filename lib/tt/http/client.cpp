/* This file is part of Treasury Turbo project: https://github.com/sierkov/treasury-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/treasury-turbo/blob/main/LICENSE */

#include <memory>
#include <optional>
#include <string>
#ifdef __clang__
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#ifndef BOOST_ALLOW_DEPRECATED_HEADERS
#   define BOOST_ALLOW_DEPRECATED_HEADERS
#   define TT_CLEAR_BOOST_DEPRECATED_HEADERS
#endif
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#ifdef TT_CLEAR_BOOST_DEPRECATED_HEADERS
#   undef BOOST_ALLOW_DEPRECATED_HEADERS
#   undef TT_CLEAR_BOOST_DEPRECATED_HEADERS
#endif
#ifdef __clang__
#   pragma GCC diagnostic pop
#endif
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <tt/http/client.hpp>
#include <tt/logger.hpp>

namespace treasury_turbo::http {
    namespace beast = boost::beast;
    namespace bhttp = beast::http;
    namespace net = boost::asio;
    using tcp = boost::asio::ip::tcp;

    struct client_beast::impl {
        std::string post(const std::string &url, const std::string &body, const std::chrono::milliseconds timeout)
        {
            const auto parsed = boost::urls::parse_uri(url);
            if (!parsed)
                throw config_error("malformed url {}: {}", url, parsed.error().message());
            const boost::url_view uri = *parsed;
            if (uri.scheme() != "http")
                throw config_error("only http urls are supported but got {}", url);
            net::io_context ioc {};
            auto conn = std::make_shared<connection>(ioc, uri, body, timeout);
            conn->run();
            ioc.run();
            return conn->result(url);
        }
    private:
        // One request per connection, all operations share the per-attempt deadline
        struct connection: std::enable_shared_from_this<connection> {
            connection(net::io_context &ioc, const boost::url_view &uri, const std::string &body, const std::chrono::milliseconds timeout)
                : _resolver { ioc }, _stream { ioc }, _deadline { ioc }, _timeout { timeout },
                    _host { uri.host() }, _port { uri.port().empty() ? std::string { "80" } : std::string { uri.port() } }
            {
                _stream.expires_after(timeout);
                _req.version(11);
                _req.keep_alive(false);
                _req.method(bhttp::verb::post);
                const auto target = uri.encoded_target();
                _req.target(target.empty() ? std::string_view { "/" } : std::string_view { target });
                _req.set(bhttp::field::host, _host);
                _req.set(bhttp::field::user_agent, BOOST_BEAST_VERSION_STRING);
                _req.set(bhttp::field::content_type, "application/json");
                _req.set(bhttp::field::accept, "application/json");
                _req.body() = body;
                _req.prepare_payload();
            }

            void run()
            {
                // the stream's own expiry does not cover name resolution
                _deadline.expires_after(_timeout);
                _deadline.async_wait([self = shared_from_this()](const beast::error_code &ec) {
                    if (ec)
                        return;
                    self->_fail(fmt::format("no response within {} ms", self->_timeout.count()));
                    self->_resolver.cancel();
                    self->_stream.cancel();
                });
                logger::trace("http: resolving {}:{}", _host, _port);
                _resolver.async_resolve(_host, _port, beast::bind_front_handler(&connection::_on_resolve, shared_from_this()));
            }

            std::string result(const std::string &url)
            {
                if (_error)
                    throw upstream_error("POST {} failed: {}", url, *_error);
                if (!_http_parser || !_http_parser->is_done())
                    throw upstream_error("POST {} did not complete", url);
                const auto &res = _http_parser->get();
                if (res.result_int() != 200)
                    throw upstream_error("POST {} failed: bad http status: {}", url, res.result_int());
                return res.body();
            }
        private:
            tcp::resolver _resolver;
            beast::tcp_stream _stream;
            net::steady_timer _deadline;
            std::chrono::milliseconds _timeout;
            std::string _host;
            std::string _port;
            beast::flat_buffer _buffer {};
            bhttp::request<bhttp::string_body> _req {};
            std::optional<bhttp::response_parser<bhttp::string_body>> _http_parser {};
            std::optional<std::string> _error {};

            // the first failure wins, the ones caused by cancellation follow it
            void _fail(std::string msg)
            {
                if (!_error)
                    _error.emplace(std::move(msg));
                _deadline.cancel();
            }

            void _on_resolve(beast::error_code ec, tcp::resolver::results_type results)
            {
                if (ec) {
                    _fail(fmt::format("async_resolve failed: {}", ec.message()));
                    return;
                }
                _stream.async_connect(results, beast::bind_front_handler(&connection::_on_connect, shared_from_this()));
            }

            void _on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
            {
                if (ec) {
                    _fail(fmt::format("async_connect failed: {}", ec.message()));
                    return;
                }
                bhttp::async_write(_stream, _req, beast::bind_front_handler(&connection::_on_write, shared_from_this()));
            }

            void _on_write(beast::error_code ec, std::size_t /*bytes_transferred*/)
            {
                if (ec) {
                    _fail(fmt::format("async_write failed: {}", ec.message()));
                    return;
                }
                _http_parser.emplace();
                _http_parser->body_limit(1 << 26);
                bhttp::async_read(_stream, _buffer, *_http_parser, beast::bind_front_handler(&connection::_on_read, shared_from_this()));
            }

            void _on_read(beast::error_code ec, std::size_t /*bytes_transferred*/)
            {
                if (ec) {
                    _fail(fmt::format("async_read failed: {}", ec.message()));
                    return;
                }
                _deadline.cancel();
                beast::error_code close_ec {};
                _stream.socket().shutdown(tcp::socket::shutdown_both, close_ec);
                if (close_ec && close_ec != beast::errc::not_connected)
                    logger::debug("http: shutdown of the connection to {} failed: {}", _host, close_ec.message());
            }
        };
    };

    client_beast::client_beast(): _impl { std::make_unique<impl>() }
    {
    }

    client_beast::~client_beast() =default;

    std::string client_beast::_post_impl(const std::string &url, const std::string &body, const std::chrono::milliseconds timeout)
    {
        return _impl->post(url, body, timeout);
    }
}
