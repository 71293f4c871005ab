//
// Created by gregorian-rayne on 1/15/26.
//

#include "sdkir/loader/http_cache.hpp"
#include "sdkir/loader/document_fetcher.hpp"
#include "sdkir/utils/hash_utils.hpp"
#include "sdkir/utils/json_utils.hpp"

#include <string>
#include <utility>
#include <vector>

namespace sdkir::loader {

    HttpCache::HttpCache(fs::path cache_dir, std::shared_ptr<Transport> transport)
        : cache_dir_(std::move(cache_dir))
        , transport_(std::move(transport)) {}

    fs::path HttpCache::cache_path(const std::string& url) const {
        return cache_dir_ / (hash_utils::sha256_hex(url) + ".json");
    }

    Result<json, Error> HttpCache::read_entry(const fs::path& path, const std::string& url) const {
        auto entry = json_utils::read_file(path);
        if (entry.is_err()) {
            return entry;
        }
        const json& data = entry.value();
        if (!data.is_object() || !data.contains("content")) {
            return Result<json, Error>::failure(
                Error::parse_error("Malformed cache entry", path.string())
            );
        }
        if (json_utils::get_string(data, "url") != url) {
            return Result<json, Error>::failure(
                Error::parse_error("Cache entry belongs to another URL", path.string())
            );
        }
        return Result<json, Error>::success(data["content"]);
    }

    Result<json, Error> HttpCache::fetch(const std::string& url, const bool force) {
        const fs::path path = cache_path(url);

        if (std::error_code ec; !force && fs::exists(path, ec)) {
            // A damaged entry is replaced by a fresh download.
            if (auto cached = read_entry(path, url); cached.is_ok()) {
                return cached;
            }
        }

        if (!transport_) {
            return Result<json, Error>::failure(
                Error::internal_error("No transport configured for URL fetches", url)
            );
        }

        auto body = transport_->get(url);
        if (body.is_err()) {
            return Result<json, Error>::failure(body.error());
        }

        auto content = parse_document(body.value(), DocumentFormat::Auto);
        if (content.is_err()) {
            return Result<json, Error>::failure(content.error().with_context(url));
        }

        json entry = json::object();
        entry["url"] = url;
        entry["content"] = content.value();
        if (auto written = json_utils::write_file(path, entry); written.is_err()) {
            return Result<json, Error>::failure(written.error());
        }

        return content;
    }

    Result<std::size_t, Error> HttpCache::clear() {
        std::error_code ec;
        if (!fs::is_directory(cache_dir_, ec)) {
            return Result<std::size_t, Error>::success(0);
        }

        std::vector<fs::path> entries;
        for (fs::directory_iterator it(cache_dir_, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->path().extension() == ".json" && it->is_regular_file(ec)) {
                entries.push_back(it->path());
            }
        }
        if (ec) {
            return Result<std::size_t, Error>::failure(
                Error::io_error("Failed to list cache directory: " + ec.message(), cache_dir_.string())
            );
        }

        for (const auto& entry : entries) {
            if (fs::remove(entry, ec); ec) {
                return Result<std::size_t, Error>::failure(
                    Error::io_error("Failed to remove cache file: " + ec.message(), entry.string())
                );
            }
        }

        return Result<std::size_t, Error>::success(entries.size());
    }

    Result<bool, Error> HttpCache::clear_url(const std::string& url) {
        const fs::path path = cache_path(url);
        std::error_code ec;
        const bool removed = fs::remove(path, ec);
        if (ec) {
            return Result<bool, Error>::failure(
                Error::io_error("Failed to remove cache file: " + ec.message(), path.string())
            );
        }
        return Result<bool, Error>::success(removed);
    }

}  // namespace sdkir::loader
