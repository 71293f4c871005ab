//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef SDKIR_HTTP_TRANSPORT_HPP
#define SDKIR_HTTP_TRANSPORT_HPP

/**
 * @file http_transport.hpp
 * @brief HTTP(S) GET for external documents.
 *
 * The default transport is a synchronous Boost.Beast client. TLS peers are
 * verified against the system trust store; redirects are followed up to a
 * fixed number of hops. A single deadline covers connect, handshake, write
 * and read.
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"

#include <chrono>
#include <string>

namespace sdkir::loader {

    /**
     * Retrieves the raw body of a URL.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        /**
         * @return The response body; NotFound for HTTP 404 and 410,
         *         FetchError for network failures, timeouts and other
         *         non-success statuses.
         */
        [[nodiscard]] virtual Result<std::string, Error> get(const std::string& url) = 0;
    };

    struct UrlParts {
        bool https = false;
        std::string host;
        std::string port;
        std::string target = "/";
    };

    /**
     * Splits an http(s) URL into host, port and request target. The port
     * defaults to 80 or 443; a fragment is dropped.
     *
     * @return InvalidArgument for anything that is not an http(s) URL.
     */
    [[nodiscard]] Result<UrlParts, Error> parse_url(const std::string& url);

    /**
     * Resolves a Location header against the URL that produced it.
     */
    [[nodiscard]] std::string resolve_location(const UrlParts& base, const std::string& location);

    /**
     * Maps a final (non-redirect) HTTP status to success or an error.
     */
    [[nodiscard]] Result<void, Error> check_status(unsigned status, const std::string& url);

    class BeastTransport final : public Transport {
    public:
        static constexpr unsigned DEFAULT_MAX_REDIRECTS = 5;

        explicit BeastTransport(
            std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
            unsigned max_redirects = DEFAULT_MAX_REDIRECTS
        );

        [[nodiscard]] Result<std::string, Error> get(const std::string& url) override;

    private:
        std::chrono::milliseconds timeout_;
        unsigned max_redirects_;
    };

}  // namespace sdkir::loader

#endif //SDKIR_HTTP_TRANSPORT_HPP
