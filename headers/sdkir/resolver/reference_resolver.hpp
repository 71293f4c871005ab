//
// Created by gregorian-rayne on 1/16/26.
//

#ifndef SDKIR_REFERENCE_RESOLVER_HPP
#define SDKIR_REFERENCE_RESOLVER_HPP

/**
 * @file reference_resolver.hpp
 * @brief Replaces every "$ref" in a document with the content it names.
 *
 * Resolution is a depth-first walk. Each resolved reference is memoized
 * for the rest of the pass, and a reference met again while it is still
 * being resolved becomes {"$circular_ref": "<reference>"}. External
 * documents are loaded through an IDocumentFetcher, at most once each.
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"
#include "sdkir/types.hpp"
#include "sdkir/loader/document_fetcher.hpp"
#include "sdkir/resolver/reference.hpp"

#include <filesystem>
#include <memory>
#include <set>

namespace sdkir::resolver {

    namespace fs = std::filesystem;

    struct ResolverOptions {
        /// Directory for relative file references; empty = working directory.
        fs::path base_directory;
        /// Fetch the root's external documents concurrently before the walk.
        bool prefetch = true;
        unsigned int prefetch_threads = 0;
    };

    /**
     * Resolves documents against one fetcher and one set of options.
     *
     * Every resolve() call starts from an empty memo and document cache.
     * An instance may be reused for several documents one after another
     * but must not run two resolutions at the same time.
     */
    class ReferenceResolver {
    public:
        explicit ReferenceResolver(
            std::shared_ptr<loader::IDocumentFetcher> fetcher,
            ResolverOptions options = {}
        );

        /**
         * @return The document with references replaced, or the first
         *         ReferenceError, NotFound or FetchError encountered.
         */
        [[nodiscard]] Result<json, Error> resolve(const json& document) const;

        /**
         * Every distinct reference in a document, without resolving any.
         */
        [[nodiscard]] static std::set<Reference> extract_all_references(const json& document);

        [[nodiscard]] const ResolverOptions& options() const noexcept { return options_; }

    private:
        std::shared_ptr<loader::IDocumentFetcher> fetcher_;
        ResolverOptions options_;
    };

}  // namespace sdkir::resolver

#endif //SDKIR_REFERENCE_RESOLVER_HPP
