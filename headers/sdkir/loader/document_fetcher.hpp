//
// Created by gregorian-rayne on 1/15/26.
//

#ifndef SDKIR_DOCUMENT_FETCHER_HPP
#define SDKIR_DOCUMENT_FETCHER_HPP

/**
 * @file document_fetcher.hpp
 * @brief Loading of API description documents from files and URLs.
 *
 * A locator is either an http(s) URL or a file system path. Fetchers
 * return the decoded document tree; format detection (JSON or YAML)
 * happens here and nowhere else.
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"
#include "sdkir/types.hpp"
#include "sdkir/loader/http_cache.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace sdkir::loader {

    namespace fs = std::filesystem;

    enum class DocumentFormat {
        Json,
        Yaml,
        Auto    // JSON first, YAML on failure
    };

    /**
     * True for http:// and https:// locators.
     */
    [[nodiscard]] bool is_url(std::string_view locator) noexcept;

    /**
     * Format implied by a file extension (.json, .yaml, .yml).
     */
    [[nodiscard]] DocumentFormat format_for_path(const fs::path& path);

    /**
     * Decodes document text in the given format.
     */
    [[nodiscard]] Result<json, Error> parse_document(std::string_view content, DocumentFormat format);

    /**
     * Directory against which relative file references of a source are
     * resolved: the parent directory of a file, or the current working
     * directory for a URL.
     */
    [[nodiscard]] fs::path base_directory_for(std::string_view source);

    /**
     * Resolves a document locator to its decoded content. Implementations
     * must be safe to call from several threads at once.
     */
    class IDocumentFetcher {
    public:
        virtual ~IDocumentFetcher() = default;

        /**
         * @param locator Absolute file path or URL.
         * @return The document, NotFound for a missing file, FetchError for
         *         an unreachable URL, or ParseError for undecodable content.
         */
        [[nodiscard]] virtual Result<json, Error> fetch(const std::string& locator) = 0;
    };

    class FileDocumentFetcher final : public IDocumentFetcher {
    public:
        [[nodiscard]] Result<json, Error> fetch(const std::string& locator) override;
    };

    class UrlDocumentFetcher final : public IDocumentFetcher {
    public:
        explicit UrlDocumentFetcher(std::shared_ptr<HttpCache> cache);

        [[nodiscard]] Result<json, Error> fetch(const std::string& locator) override;

    private:
        std::shared_ptr<HttpCache> cache_;
    };

    /**
     * Routes URLs to the URL fetcher and everything else to the file
     * fetcher.
     */
    class DefaultDocumentFetcher final : public IDocumentFetcher {
    public:
        explicit DefaultDocumentFetcher(std::shared_ptr<HttpCache> cache);

        [[nodiscard]] Result<json, Error> fetch(const std::string& locator) override;

    private:
        FileDocumentFetcher files_;
        UrlDocumentFetcher urls_;
    };

}  // namespace sdkir::loader

#endif //SDKIR_DOCUMENT_FETCHER_HPP
