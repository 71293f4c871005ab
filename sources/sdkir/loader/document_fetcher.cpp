//
// Created by gregorian-rayne on 1/15/26.
//

#include "sdkir/loader/document_fetcher.hpp"
#include "sdkir/utils/file_utils.hpp"
#include "sdkir/utils/json_utils.hpp"
#include "sdkir/utils/string_utils.hpp"
#include "sdkir/utils/yaml_utils.hpp"

#include <utility>

namespace sdkir::loader {

    bool is_url(const std::string_view locator) noexcept {
        return string_utils::starts_with(locator, "http://") ||
               string_utils::starts_with(locator, "https://");
    }

    DocumentFormat format_for_path(const fs::path& path) {
        const std::string extension = string_utils::to_lower(path.extension().string());
        if (extension == ".json") {
            return DocumentFormat::Json;
        }
        if (extension == ".yaml" || extension == ".yml") {
            return DocumentFormat::Yaml;
        }
        return DocumentFormat::Auto;
    }

    Result<json, Error> parse_document(const std::string_view content, const DocumentFormat format) {
        switch (format) {
            case DocumentFormat::Json:
                return json_utils::parse(content);
            case DocumentFormat::Yaml:
                return yaml_utils::parse(content);
            case DocumentFormat::Auto:
                break;
        }

        if (auto as_json = json_utils::parse(content); as_json.is_ok()) {
            return as_json;
        }
        return yaml_utils::parse(content);
    }

    fs::path base_directory_for(const std::string_view source) {
        std::error_code ec;
        if (is_url(source)) {
            fs::path cwd = fs::current_path(ec);
            return ec ? fs::path(".") : cwd;
        }

        const fs::path absolute = fs::absolute(fs::path(source), ec);
        return ec ? fs::path(source).parent_path() : absolute.parent_path();
    }

    Result<json, Error> FileDocumentFetcher::fetch(const std::string& locator) {
        const fs::path path(locator);

        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<json, Error>::failure(content.error());
        }

        return parse_document(content.value(), format_for_path(path)).map_error([&](Error error) {
            return error.with_context(locator);
        });
    }

    UrlDocumentFetcher::UrlDocumentFetcher(std::shared_ptr<HttpCache> cache)
        : cache_(std::move(cache)) {}

    Result<json, Error> UrlDocumentFetcher::fetch(const std::string& locator) {
        if (!cache_) {
            return Result<json, Error>::failure(
                Error::internal_error("URL fetcher has no cache", locator)
            );
        }
        return cache_->fetch(locator);
    }

    DefaultDocumentFetcher::DefaultDocumentFetcher(std::shared_ptr<HttpCache> cache)
        : urls_(std::move(cache)) {}

    Result<json, Error> DefaultDocumentFetcher::fetch(const std::string& locator) {
        if (is_url(locator)) {
            return urls_.fetch(locator);
        }
        return files_.fetch(locator);
    }

}  // namespace sdkir::loader
