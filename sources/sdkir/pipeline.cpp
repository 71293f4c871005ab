//
// Created by gregorian-rayne on 1/19/26.
//

#include "sdkir/pipeline.hpp"
#include "sdkir/ir/ir_builder.hpp"
#include "sdkir/resolver/reference_resolver.hpp"
#include "sdkir/spec/spec_validator.hpp"

#include <chrono>
#include <utility>

namespace sdkir::pipeline {

    namespace {
        std::shared_ptr<loader::IDocumentFetcher> fetcher_for(const PipelineOptions& options) {
            return options.fetcher ? options.fetcher : default_fetcher(options.config);
        }
    }

    std::shared_ptr<loader::HttpCache> make_cache(const config::Config& config) {
        auto transport = std::make_shared<loader::BeastTransport>(
            std::chrono::milliseconds(config.resolver.fetch_timeout_ms)
        );
        return std::make_shared<loader::HttpCache>(config.cache_directory(), std::move(transport));
    }

    std::shared_ptr<loader::IDocumentFetcher> default_fetcher(const config::Config& config) {
        return std::make_shared<loader::DefaultDocumentFetcher>(make_cache(config));
    }

    Result<json, Error> load(const std::string& source, loader::IDocumentFetcher& fetcher) {
        if (source.empty()) {
            return Result<json, Error>::failure(
                Error::invalid_argument("No specification source given")
            );
        }
        return fetcher.fetch(source);
    }

    Result<json, Error> resolve(const std::string& source, const json& raw, const PipelineOptions& options) {
        resolver::ResolverOptions resolver_options;
        resolver_options.base_directory = loader::base_directory_for(source);
        resolver_options.prefetch = options.config.resolver.prefetch;
        resolver_options.prefetch_threads = options.config.resolver.prefetch_threads;

        const resolver::ReferenceResolver reference_resolver(fetcher_for(options), std::move(resolver_options));
        return reference_resolver.resolve(raw);
    }

    Result<PipelineOutput, Error> run(const std::string& source, const PipelineOptions& options) {
        PipelineOptions effective = options;
        effective.fetcher = fetcher_for(options);

        auto raw = load(source, *effective.fetcher);
        if (raw.is_err()) {
            return Result<PipelineOutput, Error>::failure(raw.error());
        }

        if (auto valid = spec::validate_spec(raw.value()); valid.is_err()) {
            return Result<PipelineOutput, Error>::failure(valid.error().with_context(source));
        }

        auto resolved = resolve(source, raw.value(), effective);
        if (resolved.is_err()) {
            return Result<PipelineOutput, Error>::failure(resolved.error());
        }

        auto built = ir::build(raw.value(), resolved.value(), effective.config);
        if (built.is_err()) {
            return Result<PipelineOutput, Error>::failure(built.error());
        }

        return Result<PipelineOutput, Error>::success(PipelineOutput{
            std::move(raw).value(),
            std::move(resolved).value(),
            std::move(built).value()
        });
    }

}  // namespace sdkir::pipeline
