//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef SDKIR_HTTP_CACHE_HPP
#define SDKIR_HTTP_CACHE_HPP

/**
 * @file http_cache.hpp
 * @brief On-disk cache of documents downloaded from URLs.
 *
 * Each URL maps to "<cache_dir>/<sha256(url)>.json" holding
 * {"url": ..., "content": ...}, where content is the decoded document.
 * Downloads go through a Transport (see http_transport.hpp).
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"
#include "sdkir/types.hpp"
#include "sdkir/loader/http_transport.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace sdkir::loader {

    namespace fs = std::filesystem;

    class HttpCache {
    public:
        HttpCache(fs::path cache_dir, std::shared_ptr<Transport> transport);

        /**
         * Cache file for a URL.
         */
        [[nodiscard]] fs::path cache_path(const std::string& url) const;

        /**
         * Returns the decoded document for a URL. A cache hit is returned
         * without touching the network unless force is set; a miss is
         * downloaded, decoded as JSON or YAML and stored.
         */
        [[nodiscard]] Result<json, Error> fetch(const std::string& url, bool force = false);

        /**
         * Removes every cached document.
         *
         * @return Number of files removed, or IoError.
         */
        Result<std::size_t, Error> clear();

        /**
         * Removes the cached document of one URL, if any.
         *
         * @return Whether a file was removed, or IoError.
         */
        Result<bool, Error> clear_url(const std::string& url);

        [[nodiscard]] const fs::path& directory() const noexcept { return cache_dir_; }

    private:
        Result<json, Error> read_entry(const fs::path& path, const std::string& url) const;

        fs::path cache_dir_;
        std::shared_ptr<Transport> transport_;
    };

}  // namespace sdkir::loader

#endif //SDKIR_HTTP_CACHE_HPP
