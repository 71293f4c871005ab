//
// Created by gregorian-rayne on 1/15/26.
//

#include "sdkir/loader/http_transport.hpp"
#include "sdkir/utils/string_utils.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <cstdint>
#include <regex>
#include <string>
#include <utility>

namespace sdkir::loader {

    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    namespace beast = boost::beast;
    namespace http = boost::beast::http;
    using tcp = boost::asio::ip::tcp;

    namespace {
        constexpr std::uint64_t MAX_BODY_BYTES = 64ull * 1024 * 1024;
        constexpr const char* USER_AGENT = "sdkir/" BOOST_BEAST_VERSION_STRING;

        struct RawResponse {
            unsigned status = 0;
            std::string location;
            std::string body;
        };

        /**
         * Starts one asynchronous operation and runs the context until it
         * completes. The stream's expiry turns a stalled step into
         * beast::error::timeout.
         */
        template <typename Initiate>
        beast::error_code run_step(net::io_context& ioc, Initiate&& initiate) {
            beast::error_code result = net::error::operation_aborted;
            initiate([&result](const beast::error_code& ec, auto&&...) { result = ec; });
            ioc.restart();
            ioc.run();
            return result;
        }

        Error transport_error(const beast::error_code& ec, const std::string& what, const std::string& url) {
            if (ec == beast::error::timeout) {
                return Error::fetch_error("Request timed out", url);
            }
            return Error::fetch_error(what + ": " + ec.message(), url);
        }

        bool is_redirect(const unsigned status) {
            return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
        }

        std::string origin(const UrlParts& parts) {
            std::string result = parts.https ? "https://" : "http://";
            result += parts.host;
            if (parts.port != (parts.https ? "443" : "80")) {
                result += ":" + parts.port;
            }
            return result;
        }

        template <typename Stream>
        Result<RawResponse, Error> exchange(
            net::io_context& ioc,
            Stream& stream,
            http::request<http::empty_body>& req,
            const std::string& url
        ) {
            auto ec = run_step(ioc, [&](auto&& handler) {
                http::async_write(stream, req, std::forward<decltype(handler)>(handler));
            });
            if (ec) {
                return Result<RawResponse, Error>::failure(transport_error(ec, "Failed to send request", url));
            }

            beast::flat_buffer buffer;
            http::response_parser<http::string_body> parser;
            parser.body_limit(MAX_BODY_BYTES);
            ec = run_step(ioc, [&](auto&& handler) {
                http::async_read(stream, buffer, parser, std::forward<decltype(handler)>(handler));
            });
            if (ec) {
                return Result<RawResponse, Error>::failure(transport_error(ec, "Failed to read response", url));
            }

            auto response = parser.release();
            RawResponse raw;
            raw.status = response.result_int();
            if (const auto it = response.find(http::field::location); it != response.end()) {
                raw.location = std::string(it->value());
            }
            raw.body = std::move(response.body());
            return Result<RawResponse, Error>::success(std::move(raw));
        }

        Result<RawResponse, Error> request(
            const UrlParts& parts,
            const std::string& url,
            const std::chrono::milliseconds timeout
        ) {
            net::io_context ioc;
            tcp::resolver resolver(ioc);

            beast::error_code ec;
            const auto endpoints = resolver.resolve(parts.host, parts.port, ec);
            if (ec) {
                return Result<RawResponse, Error>::failure(
                    Error::fetch_error("Failed to resolve " + parts.host + ": " + ec.message(), url)
                );
            }

            http::request<http::empty_body> req{http::verb::get, parts.target, 11};
            req.set(http::field::host, parts.host);
            req.set(http::field::user_agent, USER_AGENT);
            req.set(http::field::accept, "application/json, application/yaml, text/yaml, */*");

            if (!parts.https) {
                beast::tcp_stream stream(ioc);
                stream.expires_after(timeout);

                ec = run_step(ioc, [&](auto&& handler) {
                    stream.async_connect(endpoints, std::forward<decltype(handler)>(handler));
                });
                if (ec) {
                    return Result<RawResponse, Error>::failure(transport_error(ec, "Failed to connect", url));
                }

                auto response = exchange(ioc, stream, req, url);

                // The peer may already have closed the connection.
                beast::error_code ignored;
                stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
                return response;
            }

            ssl::context ctx{ssl::context::tls_client};
            ctx.set_default_verify_paths(ec);
            if (ec) {
                return Result<RawResponse, Error>::failure(
                    Error::fetch_error("Failed to load CA certificates: " + ec.message(), url)
                );
            }
            ctx.set_verify_mode(ssl::verify_peer);

            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
            stream.set_verify_callback(ssl::host_name_verification(parts.host));
            if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
                return Result<RawResponse, Error>::failure(
                    Error::fetch_error("Failed to set TLS server name", url)
                );
            }

            beast::get_lowest_layer(stream).expires_after(timeout);

            ec = run_step(ioc, [&](auto&& handler) {
                beast::get_lowest_layer(stream).async_connect(endpoints, std::forward<decltype(handler)>(handler));
            });
            if (ec) {
                return Result<RawResponse, Error>::failure(transport_error(ec, "Failed to connect", url));
            }

            ec = run_step(ioc, [&](auto&& handler) {
                stream.async_handshake(ssl::stream_base::client, std::forward<decltype(handler)>(handler));
            });
            if (ec) {
                return Result<RawResponse, Error>::failure(transport_error(ec, "TLS handshake failed", url));
            }

            auto response = exchange(ioc, stream, req, url);

            // Servers routinely drop the connection without a close_notify.
            const auto ignored = run_step(ioc, [&](auto&& handler) {
                stream.async_shutdown(std::forward<decltype(handler)>(handler));
            });
            (void)ignored;
            return response;
        }
    }

    Result<UrlParts, Error> parse_url(const std::string& url) {
        static const std::regex URL_PATTERN(R"(^([Hh][Tt][Tt][Pp][Ss]?)://([^/:?#]+)(?::(\d+))?([/?][^#]*)?(#.*)?$)");

        std::smatch match;
        if (!std::regex_match(url, match, URL_PATTERN)) {
            return Result<UrlParts, Error>::failure(Error::invalid_argument("Not an http(s) URL", url));
        }

        UrlParts parts;
        parts.https = string_utils::to_lower(match[1].str()) == "https";
        parts.host = match[2].str();
        parts.port = match[3].matched ? match[3].str() : (parts.https ? "443" : "80");

        const std::string target = match[4].str();
        if (target.empty()) {
            parts.target = "/";
        } else if (target.front() == '?') {
            parts.target = "/" + target;
        } else {
            parts.target = target;
        }
        return Result<UrlParts, Error>::success(std::move(parts));
    }

    std::string resolve_location(const UrlParts& base, const std::string& location) {
        const std::string lowered = string_utils::to_lower(location);
        if (string_utils::starts_with(lowered, "http://") || string_utils::starts_with(lowered, "https://")) {
            return location;
        }
        if (string_utils::starts_with(location, "//")) {
            return (base.https ? "https:" : "http:") + location;
        }
        if (string_utils::starts_with(location, "/")) {
            return origin(base) + location;
        }

        std::string directory = base.target.substr(0, base.target.find('?'));
        directory = directory.substr(0, directory.rfind('/') + 1);
        return origin(base) + directory + location;
    }

    Result<void, Error> check_status(const unsigned status, const std::string& url) {
        if (status >= 200 && status < 300) {
            return Result<void, Error>::success();
        }
        if (status == 404 || status == 410) {
            return Result<void, Error>::failure(Error::not_found("Remote document not found", url));
        }
        return Result<void, Error>::failure(Error::fetch_error("HTTP " + std::to_string(status), url));
    }

    BeastTransport::BeastTransport(const std::chrono::milliseconds timeout, const unsigned max_redirects)
        : timeout_(timeout)
        , max_redirects_(max_redirects) {}

    Result<std::string, Error> BeastTransport::get(const std::string& url) {
        std::string current = url;

        for (unsigned hops = 0;; ++hops) {
            auto parts = parse_url(current);
            if (parts.is_err()) {
                return Result<std::string, Error>::failure(parts.error());
            }

            auto response = request(parts.value(), current, timeout_);
            if (response.is_err()) {
                return Result<std::string, Error>::failure(response.error());
            }

            RawResponse& raw = response.value();
            if (is_redirect(raw.status) && !raw.location.empty()) {
                if (hops >= max_redirects_) {
                    return Result<std::string, Error>::failure(Error::fetch_error("Too many redirects", url));
                }
                current = resolve_location(parts.value(), raw.location);
                continue;
            }

            if (auto status = check_status(raw.status, current); status.is_err()) {
                return Result<std::string, Error>::failure(status.error());
            }
            return Result<std::string, Error>::success(std::move(raw.body));
        }
    }

}  // namespace sdkir::loader
