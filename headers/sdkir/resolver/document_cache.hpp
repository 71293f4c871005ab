//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef SDKIR_DOCUMENT_CACHE_HPP
#define SDKIR_DOCUMENT_CACHE_HPP

/**
 * @file document_cache.hpp
 * @brief Per-pass store of external documents with at-most-once fetching.
 *
 * Each locator owns one shared future. The first caller for a locator
 * fetches it; concurrent and later callers wait on the same future, so a
 * document is never fetched twice during one resolution pass. Failed
 * fetches stay cached and are reported to every caller.
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"
#include "sdkir/types.hpp"
#include "sdkir/loader/document_fetcher.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sdkir::resolver {

    class DocumentCache {
    public:
        using Document = std::shared_ptr<const json>;
        using Entry = std::shared_future<Result<Document, Error>>;

        explicit DocumentCache(std::shared_ptr<loader::IDocumentFetcher> fetcher);

        DocumentCache(const DocumentCache&) = delete;
        DocumentCache& operator=(const DocumentCache&) = delete;

        /**
         * Returns the document for a locator, fetching it on first use.
         */
        [[nodiscard]] Result<Document, Error> get(const std::string& locator);

        /**
         * Fetches several documents concurrently and waits for all of them.
         *
         * @param threads Worker count, 0 for hardware concurrency.
         */
        void prefetch(const std::vector<std::string>& locators, unsigned int threads);

        [[nodiscard]] std::size_t size() const;

    private:
        Entry entry_for(const std::string& locator);
        Result<Document, Error> load(const std::string& locator) const;

        std::shared_ptr<loader::IDocumentFetcher> fetcher_;
        mutable std::mutex mutex_;
        std::map<std::string, Entry> entries_;
    };

}  // namespace sdkir::resolver

#endif //SDKIR_DOCUMENT_CACHE_HPP
