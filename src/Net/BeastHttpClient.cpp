#include "Net/BeastHttpClient.h"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <array>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "Errors.h"
#include "Net/UrlParts.h"

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {
    constexpr int MAX_REDIRECTS = 5;
    constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;

    using Clock = std::chrono::steady_clock;

    // Drives the io_context until the queued operation finishes. On deadline
    // the operation is cancelled, drained and reported as a timeout.
    void run_until(asio::io_context& ioc, Clock::time_point deadline, const std::function<void()>& cancel,
                   const std::string& what) {
        ioc.restart();
        auto remaining = deadline - Clock::now();
        if (remaining > Clock::duration::zero()) {
            ioc.run_for(std::chrono::duration_cast<std::chrono::nanoseconds>(remaining));
        }
        if (!ioc.stopped()) {
            cancel();
            ioc.restart();
            ioc.run();
            throw TimeoutError("HttpClient: timed out during " + what);
        }
    }

    // Each step gets the per-step timeout, clipped to the optional cap on the
    // whole exchange.
    class Deadline {
      public:
        explicit Deadline(const HttpRequest& request) : m_step(request.timeout) {
            if (request.total_timeout) {
                m_total = Clock::now() + *request.total_timeout;
            }
        }

        Clock::time_point nextStep() const {
            const auto step = Clock::now() + m_step;
            return m_total ? std::min(step, *m_total) : step;
        }

      private:
        std::chrono::milliseconds m_step;
        std::optional<Clock::time_point> m_total;
    };

    struct Exchange {
        int status = 0;
        std::string location; // set for redirects
    };

    template <typename Stream>
    Exchange send_and_stream(asio::io_context& ioc,
                             Stream& stream,
                             const UrlParts& url,
                             const HttpRequest& request,
                             const std::string& user_agent,
                             const Deadline& deadline,
                             const HttpDataCallback& on_data) {
        auto& lowest = beast::get_lowest_layer(stream);
        auto cancel = [&lowest] { lowest.cancel(); };
        beast::error_code ec;

        http::request<http::empty_body> req{http::verb::get, url.target, 11};
        req.set(http::field::host, url.host);
        req.set(http::field::user_agent, user_agent);
        req.set(http::field::accept, "*/*");
        if (request.range_start) {
            req.set(http::field::range, "bytes=" + std::to_string(*request.range_start) + "-");
        }

        http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
        run_until(ioc, deadline.nextStep(), cancel, "request write");
        if (ec) {
            throw NetworkError(0, "HttpClient: write failed for " + request.url + ": " + ec.message());
        }

        beast::flat_buffer buffer;
        http::response_parser<http::buffer_body> parser;
        parser.body_limit(boost::none);

        http::async_read_header(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) { ec = e; });
        run_until(ioc, deadline.nextStep(), cancel, "response header");
        if (ec) {
            throw NetworkError(0, "HttpClient: no response from " + url.host + ": " + ec.message());
        }

        Exchange result;
        result.status = parser.get().result_int();
        if (result.status >= 300 && result.status < 400) {
            auto it = parser.get().find(http::field::location);
            if (it != parser.get().end()) {
                result.location = std::string(it->value());
            }
            return result;
        }
        if (result.status < 200 || result.status >= 300) {
            return result;
        }

        std::array<char, READ_BUFFER_SIZE> chunk{};
        while (!parser.is_done()) {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();
            // read_some completes as soon as any body bytes arrived, so the step
            // timeout measures silence on the connection.
            http::async_read_some(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) { ec = e; });
            run_until(ioc, deadline.nextStep(), cancel, "response body");
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                throw NetworkError(0, "HttpClient: body read failed for " + request.url + ": " + ec.message());
            }
            const std::size_t got = chunk.size() - parser.get().body().size;
            if (got > 0 && !on_data(chunk.data(), got)) {
                spdlog::debug("HttpClient: transfer of {} aborted by consumer", request.url);
                break;
            }
        }
        return result;
    }

    std::string resolve_location(const UrlParts& base, const std::string& location) {
        if (location.find("://") != std::string::npos) {
            return location;
        }
        std::string origin = base.scheme + "://" + base.host;
        const bool default_port = (base.isTls() && base.port == "443") || (!base.isTls() && base.port == "80");
        if (!default_port) {
            origin += ":" + base.port;
        }
        if (!location.empty() && location.front() == '/') {
            return origin + location;
        }
        auto dir = base.target.substr(0, base.target.rfind('/') + 1);
        return origin + dir + location;
    }
} // namespace

struct BeastHttpClient::Impl {
    std::string user_agent;
    ssl::context tls{ssl::context::tls_client};

    explicit Impl(std::string agent) : user_agent(std::move(agent)) {
        tls.set_default_verify_paths();
        tls.set_verify_mode(ssl::verify_peer);
    }

    Exchange fetchOnce(const std::string& url_text,
                       const HttpRequest& request,
                       const Deadline& deadline,
                       const HttpDataCallback& on_data) {
        auto url = parse_url(url_text);
        if (!url) {
            throw NetworkError(0, "HttpClient: unsupported URL " + url_text);
        }

        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::error_code ec;
        tcp::resolver::results_type endpoints;
        resolver.async_resolve(url->host, url->port, [&](beast::error_code e, tcp::resolver::results_type r) {
            ec = e;
            endpoints = std::move(r);
        });
        run_until(ioc, deadline.nextStep(), [&resolver] { resolver.cancel(); }, "name resolution");
        if (ec) {
            throw NetworkError(0, "HttpClient: cannot resolve " + url->host + ": " + ec.message());
        }

        if (!url->isTls()) {
            beast::tcp_stream stream(ioc);
            stream.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
            run_until(ioc, deadline.nextStep(), [&stream] { stream.cancel(); }, "connect");
            if (ec) {
                throw NetworkError(0, "HttpClient: connect to " + url->host + " failed: " + ec.message());
            }
            auto result = send_and_stream(ioc, stream, *url, request, user_agent, deadline, on_data);
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return finish(*url, result);
        }

        beast::ssl_stream<beast::tcp_stream> stream(ioc, tls);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
            throw NetworkError(0, "HttpClient: cannot set SNI host " + url->host);
        }
        stream.set_verify_callback(ssl::host_name_verification(url->host));

        auto& lowest = beast::get_lowest_layer(stream);
        lowest.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        run_until(ioc, deadline.nextStep(), [&lowest] { lowest.cancel(); }, "connect");
        if (ec) {
            throw NetworkError(0, "HttpClient: connect to " + url->host + " failed: " + ec.message());
        }
        stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
        run_until(ioc, deadline.nextStep(), [&lowest] { lowest.cancel(); }, "TLS handshake");
        if (ec) {
            throw NetworkError(0, "HttpClient: TLS handshake with " + url->host + " failed: " + ec.message());
        }
        auto result = send_and_stream(ioc, stream, *url, request, user_agent, deadline, on_data);
        // Servers commonly drop TLS without close_notify, so shutdown errors are ignored.
        lowest.close();
        return finish(*url, result);
    }

    Exchange finish(const UrlParts& url, Exchange result) {
        if (!result.location.empty()) {
            result.location = resolve_location(url, result.location);
        }
        return result;
    }
};

BeastHttpClient::BeastHttpClient(std::string user_agent) : m_impl(std::make_unique<Impl>(std::move(user_agent))) {}

BeastHttpClient::~BeastHttpClient() = default;

int BeastHttpClient::get(const HttpRequest& request, const HttpDataCallback& on_data) {
    const Deadline deadline(request);
    std::string url = request.url;

    for (int hop = 0; hop <= MAX_REDIRECTS; ++hop) {
        auto result = m_impl->fetchOnce(url, request, deadline, on_data);
        if (result.location.empty()) {
            spdlog::debug("HttpClient: GET {} -> {}", url, result.status);
            return result.status;
        }
        spdlog::debug("HttpClient: {} redirected to {}", url, result.location);
        url = result.location;
    }
    throw NetworkError(0, "HttpClient: too many redirects for " + request.url);
}
