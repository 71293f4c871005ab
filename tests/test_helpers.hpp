//
// Created by gregorian-rayne on 1/22/26.
//

#ifndef SDKIR_TEST_HELPERS_HPP
#define SDKIR_TEST_HELPERS_HPP

/**
 * @file test_helpers.hpp
 * @brief In-memory fetchers and transports shared by the test suites.
 */

#include "sdkir/loader/document_fetcher.hpp"
#include "sdkir/loader/http_cache.hpp"

#include <map>
#include <mutex>
#include <string>

namespace sdkir::test {

    /**
     * Serves documents from a map and counts fetches per locator.
     */
    class MemoryFetcher final : public loader::IDocumentFetcher {
    public:
        void add(const std::string& locator, json document) {
            std::lock_guard lock(mutex_);
            documents_[locator] = std::move(document);
        }

        [[nodiscard]] Result<json, Error> fetch(const std::string& locator) override {
            std::lock_guard lock(mutex_);
            ++fetch_counts_[locator];
            const auto it = documents_.find(locator);
            if (it == documents_.end()) {
                return Result<json, Error>::failure(Error::not_found("File not found", locator));
            }
            return Result<json, Error>::success(it->second);
        }

        [[nodiscard]] int fetch_count(const std::string& locator) const {
            std::lock_guard lock(mutex_);
            const auto it = fetch_counts_.find(locator);
            return it == fetch_counts_.end() ? 0 : it->second;
        }

        [[nodiscard]] int total_fetches() const {
            std::lock_guard lock(mutex_);
            int total = 0;
            for (const auto& [locator, count] : fetch_counts_) {
                total += count;
            }
            return total;
        }

    private:
        mutable std::mutex mutex_;
        std::map<std::string, json> documents_;
        std::map<std::string, int> fetch_counts_;
    };

    /**
     * Answers GET requests from a map of URL to body.
     */
    class FakeTransport final : public loader::Transport {
    public:
        void respond(const std::string& url, std::string body) {
            bodies_[url] = std::move(body);
        }

        [[nodiscard]] Result<std::string, Error> get(const std::string& url) override {
            ++requests;
            const auto it = bodies_.find(url);
            if (it == bodies_.end()) {
                return Result<std::string, Error>::failure(Error::not_found("HTTP 404", url));
            }
            return Result<std::string, Error>::success(it->second);
        }

        int requests = 0;

    private:
        std::map<std::string, std::string> bodies_;
    };

}  // namespace sdkir::test

#endif //SDKIR_TEST_HELPERS_HPP
