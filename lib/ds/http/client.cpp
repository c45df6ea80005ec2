/* This file is part of Delegation Scout project
 * Copyright (c) 2025 Delegation Scout developers
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

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
#   define DS_CLEAR_BOOST_DEPRECATED_HEADERS
#endif
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#ifdef DS_CLEAR_BOOST_DEPRECATED_HEADERS
#   undef BOOST_ALLOW_DEPRECATED_HEADERS
#   undef DS_CLEAR_BOOST_DEPRECATED_HEADERS
#endif
#ifdef __clang__
#   pragma GCC diagnostic pop
#endif
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <ds/http/client.hpp>
#include <ds/logger.hpp>

namespace delegation_scout::http {
    namespace beast = boost::beast;
    namespace bhttp = beast::http;
    namespace net = boost::asio;
    namespace ssl = net::ssl;
    using tcp = net::ip::tcp;

    static constexpr size_t max_response_size = 1 << 26;

    template<typename T>
    static std::string to_string(const T &sv)
    {
        return { sv.data(), sv.size() };
    }

    url_parts parse_url(const std::string &url)
    {
        const auto parsed = boost::urls::parse_uri(url);
        if (!parsed)
            throw network_error(fmt::format("invalid URL {}: {}", url, parsed.error().message()));
        const auto &uri = *parsed;
        url_parts res {};
        if (uri.scheme() == "https")
            res.tls = true;
        else if (uri.scheme() != "http")
            throw network_error(fmt::format("only http and https URLs are supported but got {}", url));
        res.host = to_string(uri.encoded_host());
        if (res.host.empty())
            throw network_error(fmt::format("the URL {} has no host", url));
        res.port = uri.has_port() ? to_string(uri.port()) : std::string { res.tls ? "443" : "80" };
        res.target = to_string(uri.encoded_target());
        if (res.target.empty() || res.target.front() != '/')
            res.target.insert(0, "/");
        return res;
    }

    struct connection: std::enable_shared_from_this<connection> {
        connection(net::io_context &ioc, ssl::context &ssl_ctx, const url_parts &url, const std::string &body,
                const std::string_view content_type, const std::chrono::milliseconds timeout)
            : _resolver { ioc }, _url { url }, _timeout { timeout }
        {
            if (_url.tls)
                _tls.emplace(ioc, ssl_ctx);
            else
                _plain.emplace(ioc);
            _req.version(11);
            _req.method(bhttp::verb::post);
            _req.target(_url.target);
            _req.set(bhttp::field::host, _url.host);
            _req.set(bhttp::field::user_agent, BOOST_BEAST_VERSION_STRING);
            _req.set(bhttp::field::content_type, std::string { content_type });
            _req.set(bhttp::field::accept, "application/json");
            _req.keep_alive(false);
            _req.body() = body;
            _req.prepare_payload();
            _parser.body_limit(max_response_size);
        }

        void run()
        {
            logger::trace("{}:{}: resolving", _url.host, _url.port);
            _resolver.async_resolve(_url.host, _url.port, beast::bind_front_handler(&connection::_on_resolve, shared_from_this()));
        }

        response result()
        {
            if (_error)
                throw network_error(fmt::format("HTTP request to {}:{}{} failed: {}", _url.host, _url.port, _url.target, *_error));
            if (!_parser.is_done())
                throw network_error(fmt::format("HTTP request to {}:{}{} has not completed", _url.host, _url.port, _url.target));
            auto &res = _parser.get();
            return response { res.result_int(), std::move(res.body()) };
        }
    private:
        tcp::resolver _resolver;
        const url_parts _url;
        const std::chrono::milliseconds _timeout;
        std::optional<beast::tcp_stream> _plain {};
        std::optional<beast::ssl_stream<beast::tcp_stream>> _tls {};
        beast::flat_buffer _buffer {};
        bhttp::request<bhttp::string_body> _req {};
        bhttp::response_parser<bhttp::string_body> _parser {};
        std::optional<std::string> _error {};

        beast::tcp_stream &_tcp()
        {
            if (_tls)
                return beast::get_lowest_layer(*_tls);
            return *_plain;
        }

        void _fail(const std::string_view op, const beast::error_code &ec)
        {
            _error.emplace(fmt::format("{} failed: {}", op, ec.message()));
            logger::trace("{}:{}: {}", _url.host, _url.port, *_error);
            _tcp().close();
        }

        void _on_resolve(beast::error_code ec, tcp::resolver::results_type results)
        {
            if (ec) {
                _fail("resolve", ec);
                return;
            }
            logger::trace("{}:{}: connecting", _url.host, _url.port);
            _tcp().expires_after(_timeout);
            _tcp().async_connect(results, beast::bind_front_handler(&connection::_on_connect, shared_from_this()));
        }

        void _on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
        {
            if (ec) {
                _fail("connect", ec);
                return;
            }
            if (!_tls) {
                _write();
                return;
            }
            if (!SSL_set_tlsext_host_name(_tls->native_handle(), _url.host.c_str())) {
                _fail("SNI setup", beast::error_code { static_cast<int>(::ERR_get_error()), net::error::get_ssl_category() });
                return;
            }
            _tls->set_verify_callback(ssl::host_name_verification(_url.host));
            _tcp().expires_after(_timeout);
            _tls->async_handshake(ssl::stream_base::client, beast::bind_front_handler(&connection::_on_handshake, shared_from_this()));
        }

        void _on_handshake(beast::error_code ec)
        {
            if (ec) {
                _fail("TLS handshake", ec);
                return;
            }
            _write();
        }

        void _write()
        {
            logger::trace("{}:{}: sending {} bytes to {}", _url.host, _url.port, _req.body().size(), _url.target);
            _tcp().expires_after(_timeout);
            if (_tls)
                bhttp::async_write(*_tls, _req, beast::bind_front_handler(&connection::_on_write, shared_from_this()));
            else
                bhttp::async_write(*_plain, _req, beast::bind_front_handler(&connection::_on_write, shared_from_this()));
        }

        void _on_write(beast::error_code ec, std::size_t /*bytes_transferred*/)
        {
            if (ec) {
                _fail("write", ec);
                return;
            }
            _tcp().expires_after(_timeout);
            if (_tls)
                bhttp::async_read(*_tls, _buffer, _parser, beast::bind_front_handler(&connection::_on_read, shared_from_this()));
            else
                bhttp::async_read(*_plain, _buffer, _parser, beast::bind_front_handler(&connection::_on_read, shared_from_this()));
        }

        void _on_read(beast::error_code ec, std::size_t bytes_transferred)
        {
            if (ec) {
                _fail("read", ec);
                return;
            }
            logger::trace("{}:{}: received {} bytes with HTTP status {}", _url.host, _url.port, bytes_transferred, _parser.get().result_int());
            _tcp().close();
        }
    };

    client::client(const std::chrono::milliseconds timeout): _timeout { timeout }
    {
    }

    response client::post(const std::string &url, const std::string &body, const std::string_view content_type) const
    {
        try {
            const auto parts = parse_url(url);
            net::io_context ioc {};
            ssl::context ssl_ctx { ssl::context::tls_client };
            if (parts.tls) {
                ssl_ctx.set_default_verify_paths();
                ssl_ctx.set_verify_mode(ssl::verify_peer);
            }
            const auto conn = std::make_shared<connection>(ioc, ssl_ctx, parts, body, content_type, _timeout);
            conn->run();
            ioc.run();
            return conn->result();
        } catch (const error &) {
            throw;
        } catch (const std::exception &ex) {
            throw network_error(fmt::format("HTTP POST to {} failed", url), ex);
        }
    }
}
