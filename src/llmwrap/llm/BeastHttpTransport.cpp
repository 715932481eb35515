//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastHttpTransport.cpp
// Purpose: HTTP/HTTPS client transport using Boost.Beast (TLS 1.2+ with peer verification for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "llmwrap/llm/BeastHttpTransport.hpp"

namespace llmwrap {
namespace llm {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isRetryableStatus(int status) {
    return status == 429 || (status >= 500 && status <= 599);
}
} // namespace

std::optional<std::string> HttpResponse::Header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

class BeastHttpTransport::Impl {
public:
    BeastHttpTransport::Options opts;
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    ssl::context sslCtx{ssl::context::tls_client};
    bool caInitOk{true};

    explicit Impl(const BeastHttpTransport::Options& o) : opts(o) {
        ::SSL_CTX_set_min_proto_version(sslCtx.native_handle(), TLS1_2_VERSION);
        try {
            if (!opts.caFile.empty()) {
                sslCtx.load_verify_file(opts.caFile);
            } else {
                sslCtx.set_default_verify_paths();
            }
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPS: failed to initialize CA store: {}", e.what());
            caInitOk = false;
        }
        sslCtx.set_verify_mode(ssl::verify_peer);

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("HTTP transport io thread terminated: {}", e.what());
            }
        });
    }

    ~Impl() {
        workGuard.reset();
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    // ------------------------------------------------------------------------------------------------------
    // URL parsing helpers (very small, adequate for https://host[:port]/path)
    // ------------------------------------------------------------------------------------------------------
    struct UrlParts {
        std::string scheme;
        std::string host;
        std::string port;
        std::string path;
    };

    static UrlParts parseUrl(const std::string& url) {
        UrlParts parts;
        std::size_t pos = 0;

        std::size_t schemeEnd = url.find("://");
        if (schemeEnd != std::string::npos) {
            parts.scheme = toLower(url.substr(0, schemeEnd));
            pos = schemeEnd + 3;
        } else {
            parts.scheme = std::string("http");
        }

        std::size_t slash = url.find('/', pos);
        std::string hostPort;
        if (slash == std::string::npos) {
            hostPort = url.substr(pos);
            parts.path = std::string("/");
        } else {
            hostPort = url.substr(pos, slash - pos);
            parts.path = url.substr(slash);
        }

        std::size_t colon = hostPort.find(':');
        if (colon == std::string::npos) {
            parts.host = hostPort;
            parts.port = (parts.scheme == "https") ? std::string("443") : std::string("80");
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
        }
        return parts;
    }

    static HttpResponse toResponse(http::response<http::string_body>& res) {
        HttpResponse out;
        out.status = static_cast<int>(res.result_int());
        out.reason = std::string(res.reason());
        for (const auto& field : res) {
            out.headers[toLower(std::string(field.name_string()))] = std::string(field.value());
        }
        out.body = std::move(res.body());
        return out;
    }

    http::request<http::string_body> buildRequest(const UrlParts& u, const HttpRequest& request) const {
        http::verb verb = http::string_to_verb(request.method);
        if (verb == http::verb::unknown) {
            throw TransportError("Unsupported HTTP method: " + request.method);
        }
        http::request<http::string_body> req{verb, u.path, 11};
        const bool defaultPort = (u.scheme == "https" && u.port == "443") || (u.scheme == "http" && u.port == "80");
        req.set(http::field::host, defaultPort ? u.host : u.host + ":" + u.port);
        req.set(http::field::connection, "close");
        for (const auto& [name, value] : request.headers) {
            req.set(name, value);
        }
        req.body() = request.body;
        req.prepare_payload();
        return req;
    }

    // Coroutine: perform one exchange and return the response
    net::awaitable<HttpResponse> coSend(const UrlParts u, const HttpRequest request) {
        auto req = buildRequest(u, request);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);

        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        if (u.scheme == "https") {
            if (!caInitOk) {
                throw TransportError("HTTPS: CA initialization failed");
            }
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                throw TransportError("HTTPS: failed to set SNI hostname");
            }
            (void)::SSL_set1_host(stream.native_handle(), u.host.c_str());
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            stream.next_layer().expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            // Connection: close was requested; skip the TLS close_notify round trip
            boost::system::error_code ec;
            stream.next_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            stream.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        co_return toResponse(res);
    }

    void backoff(unsigned int attempt) const {
        std::this_thread::sleep_for(std::chrono::milliseconds(opts.retryBackoffMs * (attempt + 1)));
    }
};

BeastHttpTransport::BeastHttpTransport()
    : pImpl(std::make_unique<Impl>(Options{})) {}

BeastHttpTransport::BeastHttpTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

BeastHttpTransport::~BeastHttpTransport() = default;

HttpResponse BeastHttpTransport::Send(const HttpRequest& request) {
    FUNC_SCOPE();
    const Impl::UrlParts u = Impl::parseUrl(request.url);
    if (u.host.empty() || (u.scheme != "http" && u.scheme != "https")) {
        throw TransportError("Invalid URL: " + request.url);
    }

    std::string lastError;
    const unsigned int attempts = pImpl->opts.maxRetries + 1;
    for (unsigned int attempt = 0; attempt < attempts; ++attempt) {
        const bool lastAttempt = (attempt + 1 == attempts);
        try {
            auto fut = net::co_spawn(pImpl->ioc, pImpl->coSend(u, request), net::use_future);
            HttpResponse res = fut.get();
            if (!isRetryableStatus(res.status) || lastAttempt) {
                return res;
            }
            LOG_WARN("HTTP {} {}{} returned {}; retrying (attempt {}/{})",
                     request.method, u.host, u.path, res.status, attempt + 1, attempts);
        } catch (const TransportError&) {
            throw;
        } catch (const std::exception& e) {
            lastError = e.what();
            if (lastAttempt) {
                break;
            }
            LOG_WARN("HTTP {} {}{} failed: {}; retrying (attempt {}/{})",
                     request.method, u.host, u.path, lastError, attempt + 1, attempts);
        }
        pImpl->backoff(attempt);
    }
    throw TransportError("HTTP request to " + u.host + " failed after " + std::to_string(attempts) +
                         " attempt(s): " + lastError);
}

} // namespace llm
} // namespace llmwrap
