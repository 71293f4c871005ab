//
// Created by gregorian-rayne on 1/22/26.
//

#include "sdkir/loader/http_transport.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace sdkir::loader
{
    namespace net = boost::asio;
    using tcp = boost::asio::ip::tcp;

    namespace {
        std::string http_response(const std::string& status_line, const std::string& body,
                                  const std::string& extra_headers = "") {
            return "HTTP/1.1 " + status_line + "\r\n"
                   "Content-Length: " + std::to_string(body.size()) + "\r\n"
                   "Connection: close\r\n" + extra_headers + "\r\n" + body;
        }

        /**
         * Answers one connection per canned response, in order.
         */
        class CannedServer {
        public:
            explicit CannedServer(std::vector<std::string> responses)
                : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
                , port_(acceptor_.local_endpoint().port()) {
                thread_ = std::thread([this, responses = std::move(responses)] {
                    for (const auto& response : responses) {
                        boost::system::error_code ec;
                        tcp::socket socket(ioc_);
                        acceptor_.accept(socket, ec);
                        if (ec) return;

                        net::streambuf request;
                        net::read_until(socket, request, "\r\n\r\n", ec);
                        net::write(socket, net::buffer(response), ec);
                        socket.shutdown(tcp::socket::shutdown_both, ec);
                    }
                });
            }

            ~CannedServer() {
                thread_.join();
            }

            [[nodiscard]] std::string url(const std::string& path) const {
                return "http://127.0.0.1:" + std::to_string(port_) + path;
            }

        private:
            net::io_context ioc_;
            tcp::acceptor acceptor_;
            unsigned short port_;
            std::thread thread_;
        };
    }

    // ========================================================================
    // URL handling
    // ========================================================================

    TEST(HttpTransportTest, ParseHttpsUrlDefaultsPort) {
        const auto parts = parse_url("https://example.com/specs/api.yaml");

        ASSERT_TRUE(parts.is_ok());
        EXPECT_TRUE(parts.value().https);
        EXPECT_EQ(parts.value().host, "example.com");
        EXPECT_EQ(parts.value().port, "443");
        EXPECT_EQ(parts.value().target, "/specs/api.yaml");
    }

    TEST(HttpTransportTest, ParseHttpUrlWithPortAndQuery) {
        const auto parts = parse_url("HTTP://localhost:8080/api?format=json#/components");

        ASSERT_TRUE(parts.is_ok());
        EXPECT_FALSE(parts.value().https);
        EXPECT_EQ(parts.value().host, "localhost");
        EXPECT_EQ(parts.value().port, "8080");
        EXPECT_EQ(parts.value().target, "/api?format=json");
    }

    TEST(HttpTransportTest, ParseUrlWithoutPathTargetsRoot) {
        EXPECT_EQ(parse_url("http://example.com").value().target, "/");
        EXPECT_EQ(parse_url("http://example.com?v=1").value().target, "/?v=1");
    }

    TEST(HttpTransportTest, ParseRejectsNonHttpUrl) {
        for (const auto* url : {"ftp://example.com/a.yaml", "example.com/a.yaml", "https://", "file:///tmp/a.json"}) {
            const auto parts = parse_url(url);
            ASSERT_TRUE(parts.is_err()) << url;
            EXPECT_EQ(parts.error().code(), ErrorCode::InvalidArgument);
        }
    }

    TEST(HttpTransportTest, ResolveLocationForms) {
        const auto base = parse_url("https://example.com:8443/specs/v1/api.yaml?x=1").value();

        EXPECT_EQ(resolve_location(base, "http://other.org/a.yaml"), "http://other.org/a.yaml");
        EXPECT_EQ(resolve_location(base, "//cdn.example.com/a.yaml"), "https://cdn.example.com/a.yaml");
        EXPECT_EQ(resolve_location(base, "/moved/api.yaml"), "https://example.com:8443/moved/api.yaml");
        EXPECT_EQ(resolve_location(base, "common.yaml"), "https://example.com:8443/specs/v1/common.yaml");
    }

    TEST(HttpTransportTest, StatusMapping) {
        EXPECT_TRUE(check_status(200, "u").is_ok());
        EXPECT_TRUE(check_status(204, "u").is_ok());

        const auto missing = check_status(404, "https://example.com/x.yaml");
        ASSERT_TRUE(missing.is_err());
        EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);
        EXPECT_EQ(missing.error().context().value(), "https://example.com/x.yaml");

        EXPECT_EQ(check_status(410, "u").error().code(), ErrorCode::NotFound);

        const auto failed = check_status(503, "u");
        ASSERT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().code(), ErrorCode::FetchError);
        EXPECT_EQ(failed.error().message(), "HTTP 503");
    }

    // ========================================================================
    // Requests against a local server
    // ========================================================================

    TEST(HttpTransportTest, ReturnsBodyOnSuccess) {
        CannedServer server({http_response("200 OK", R"({"openapi": "3.0.0"})")});
        BeastTransport transport(std::chrono::milliseconds(5000));

        const auto body = transport.get(server.url("/api.json"));

        ASSERT_TRUE(body.is_ok()) << body.error().message();
        EXPECT_EQ(body.value(), R"({"openapi": "3.0.0"})");
    }

    TEST(HttpTransportTest, NotFoundStatusMapsToNotFound) {
        CannedServer server({http_response("404 Not Found", "missing")});
        BeastTransport transport(std::chrono::milliseconds(5000));

        const auto body = transport.get(server.url("/gone.yaml"));

        ASSERT_TRUE(body.is_err());
        EXPECT_EQ(body.error().code(), ErrorCode::NotFound);
    }

    TEST(HttpTransportTest, ServerErrorMapsToFetchError) {
        CannedServer server({http_response("500 Internal Server Error", "")});
        BeastTransport transport(std::chrono::milliseconds(5000));

        const auto body = transport.get(server.url("/api.yaml"));

        ASSERT_TRUE(body.is_err());
        EXPECT_EQ(body.error().code(), ErrorCode::FetchError);
        EXPECT_EQ(body.error().message(), "HTTP 500");
    }

    TEST(HttpTransportTest, FollowsRedirect) {
        CannedServer server({
            http_response("302 Found", "", "Location: /moved.yaml\r\n"),
            http_response("200 OK", "openapi: 3.1.0\n")
        });
        BeastTransport transport(std::chrono::milliseconds(5000));

        const auto body = transport.get(server.url("/api.yaml"));

        ASSERT_TRUE(body.is_ok()) << body.error().message();
        EXPECT_EQ(body.value(), "openapi: 3.1.0\n");
    }

    TEST(HttpTransportTest, RedirectLimitIsEnforced) {
        CannedServer server({http_response("301 Moved Permanently", "", "Location: /loop.yaml\r\n")});
        BeastTransport transport(std::chrono::milliseconds(5000), 0);

        const auto body = transport.get(server.url("/loop.yaml"));

        ASSERT_TRUE(body.is_err());
        EXPECT_EQ(body.error().code(), ErrorCode::FetchError);
        EXPECT_EQ(body.error().message(), "Too many redirects");
    }

    TEST(HttpTransportTest, SilentServerTimesOut) {
        net::io_context ioc;
        // Connections complete in the listen backlog but are never answered.
        tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        const auto port = acceptor.local_endpoint().port();
        BeastTransport transport(std::chrono::milliseconds(200));

        const auto body = transport.get("http://127.0.0.1:" + std::to_string(port) + "/api.yaml");

        ASSERT_TRUE(body.is_err());
        EXPECT_EQ(body.error().code(), ErrorCode::FetchError);
        EXPECT_EQ(body.error().message(), "Request timed out");
    }

    TEST(HttpTransportTest, RefusedConnectionIsFetchError) {
        unsigned short port = 0;
        {
            net::io_context ioc;
            tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
            port = acceptor.local_endpoint().port();
        }
        BeastTransport transport(std::chrono::milliseconds(2000));

        const auto body = transport.get("http://127.0.0.1:" + std::to_string(port) + "/api.yaml");

        ASSERT_TRUE(body.is_err());
        EXPECT_EQ(body.error().code(), ErrorCode::FetchError);
    }

    TEST(HttpTransportTest, InvalidUrlIsRejectedBeforeConnecting) {
        BeastTransport transport;

        const auto body = transport.get("ftp://example.com/api.yaml");

        ASSERT_TRUE(body.is_err());
        EXPECT_EQ(body.error().code(), ErrorCode::InvalidArgument);
    }

}
