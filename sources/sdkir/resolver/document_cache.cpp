//
// Created by gregorian-rayne on 1/16/26.
//

#include "sdkir/resolver/document_cache.hpp"
#include "sdkir/utils/parallel.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace sdkir::resolver {

    DocumentCache::DocumentCache(std::shared_ptr<loader::IDocumentFetcher> fetcher)
        : fetcher_(std::move(fetcher)) {}

    Result<DocumentCache::Document, Error> DocumentCache::get(const std::string& locator) {
        return entry_for(locator).get();
    }

    DocumentCache::Entry DocumentCache::entry_for(const std::string& locator) {
        std::promise<Result<Document, Error>> promise;
        Entry entry;
        {
            std::lock_guard lock(mutex_);
            if (const auto it = entries_.find(locator); it != entries_.end()) {
                return it->second;
            }
            entry = promise.get_future().share();
            entries_.emplace(locator, entry);
        }

        // Fetch outside the lock; other callers block on the future.
        promise.set_value(load(locator));
        return entry;
    }

    Result<DocumentCache::Document, Error> DocumentCache::load(const std::string& locator) const {
        if (!fetcher_) {
            return Result<Document, Error>::failure(
                Error::internal_error("No document fetcher configured", locator)
            );
        }

        try {
            auto fetched = fetcher_->fetch(locator);
            if (fetched.is_err()) {
                return Result<Document, Error>::failure(fetched.error());
            }
            return Result<Document, Error>::success(
                std::make_shared<const json>(std::move(fetched).value())
            );
        } catch (const std::exception& e) {
            return Result<Document, Error>::failure(
                Error::internal_error("Document fetch failed: " + std::string(e.what()), locator)
            );
        }
    }

    void DocumentCache::prefetch(const std::vector<std::string>& locators, const unsigned int threads) {
        if (locators.empty()) {
            return;
        }

        const auto requested = threads == 0 ? parallel::hardware_concurrency() : threads;
        const auto workers = static_cast<unsigned int>(
            std::min<std::size_t>(requested, locators.size())
        );

        parallel::ThreadPool pool(workers);
        std::vector<std::future<Entry>> pending;
        pending.reserve(locators.size());

        for (const auto& locator : locators) {
            pending.push_back(pool.submit([this, &locator] {
                return entry_for(locator);
            }));
        }

        // Results stay in the cache; errors surface when the reference is resolved.
        for (auto& future : pending) {
            future.wait();
        }
    }

    std::size_t DocumentCache::size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

}  // namespace sdkir::resolver
