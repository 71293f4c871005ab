//
// Created by gregorian-rayne on 1/19/26.
//

#ifndef SDKIR_PIPELINE_HPP
#define SDKIR_PIPELINE_HPP

/**
 * @file pipeline.hpp
 * @brief One-call entry point: load, validate, resolve, build the IR.
 *
 * Example:
 * @code
 *     auto output = sdkir::pipeline::run("openapi.yaml");
 *     if (output.is_ok()) {
 *         for (const auto& resource : output.value().ir.resources) { ... }
 *     }
 * @endcode
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"
#include "sdkir/types.hpp"
#include "sdkir/config/config.hpp"
#include "sdkir/loader/document_fetcher.hpp"
#include "sdkir/loader/http_cache.hpp"

#include <memory>
#include <string>

namespace sdkir::pipeline {

    struct PipelineOptions {
        config::Config config = config::Config::defaults();
        /// Fetcher for the source and its external references; when null a
        /// DefaultDocumentFetcher over the configured URL cache is used.
        std::shared_ptr<loader::IDocumentFetcher> fetcher;
    };

    struct PipelineOutput {
        json raw;
        json resolved;
        ApiIR ir;
    };

    /**
     * URL cache in the configured directory, downloading over HTTP(S) with
     * the configured timeout.
     */
    [[nodiscard]] std::shared_ptr<loader::HttpCache> make_cache(const config::Config& config);

    [[nodiscard]] std::shared_ptr<loader::IDocumentFetcher> default_fetcher(const config::Config& config);

    /**
     * Loads a document from a file path or URL.
     */
    [[nodiscard]] Result<json, Error> load(const std::string& source, loader::IDocumentFetcher& fetcher);

    /**
     * Resolves a loaded document. Relative file references are looked up
     * next to the source file, or in the working directory for URLs.
     */
    [[nodiscard]] Result<json, Error> resolve(
        const std::string& source,
        const json& raw,
        const PipelineOptions& options
    );

    /**
     * Runs every stage. The first failing stage ends the run; no partial
     * output is returned.
     */
    [[nodiscard]] Result<PipelineOutput, Error> run(
        const std::string& source,
        const PipelineOptions& options = {}
    );

}  // namespace sdkir::pipeline

#endif //SDKIR_PIPELINE_HPP
