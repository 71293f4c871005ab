//
// Created by gregorian-rayne on 1/16/26.
//

#include "sdkir/resolver/reference_resolver.hpp"
#include "sdkir/resolver/document_cache.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace sdkir::resolver {

    namespace {

        /**
         * The document a node was read from. Local references inside an
         * external document resolve against that document.
         */
        struct DocumentScope {
            std::string locator;                 // empty for the root document
            DocumentCache::Document holder;      // keeps external documents alive
            const json* document = nullptr;
        };

        /**
         * Pops the reference pushed for the current frame, whether the
         * frame returns a value or an error.
         */
        class InProgressGuard {
        public:
            InProgressGuard(std::vector<std::string>& stack, std::string key)
                : stack_(stack) {
                stack_.push_back(std::move(key));
            }

            ~InProgressGuard() {
                stack_.pop_back();
            }

            InProgressGuard(const InProgressGuard&) = delete;
            InProgressGuard& operator=(const InProgressGuard&) = delete;

        private:
            std::vector<std::string>& stack_;
        };

        class ResolutionPass {
        public:
            ResolutionPass(
                const json& root,
                std::shared_ptr<loader::IDocumentFetcher> fetcher,
                fs::path base_directory
            )
                : root_(root)
                , documents_(std::move(fetcher))
                , base_directory_(std::move(base_directory)) {}

            Result<json, Error> run() {
                std::vector<std::string> in_progress;
                const DocumentScope scope{"", nullptr, &root_};
                return resolve_node(root_, scope, in_progress);
            }

            void prefetch(const unsigned int threads) {
                std::set<std::string> distinct;
                for (const auto& ref : ReferenceResolver::extract_all_references(root_)) {
                    if (!ref.is_local()) {
                        distinct.insert(locate(ref.document));
                    }
                }
                const std::vector<std::string> locators(distinct.begin(), distinct.end());
                documents_.prefetch(locators, threads);
            }

        private:
            Result<json, Error> resolve_node(
                const json& node,
                const DocumentScope& scope,
                std::vector<std::string>& in_progress
            ) {
                if (node.is_object()) {
                    if (const auto ref = node.find(REF_KEY); ref != node.end() && ref->is_string()) {
                        return resolve_reference(ref->get<std::string>(), scope, in_progress);
                    }

                    json result = json::object();
                    for (auto it = node.begin(); it != node.end(); ++it) {
                        auto child = resolve_node(it.value(), scope, in_progress);
                        if (child.is_err()) {
                            return child;
                        }
                        result[it.key()] = std::move(child).value();
                    }
                    return Result<json, Error>::success(std::move(result));
                }

                if (node.is_array()) {
                    json result = json::array();
                    for (const auto& item : node) {
                        auto child = resolve_node(item, scope, in_progress);
                        if (child.is_err()) {
                            return child;
                        }
                        result.push_back(std::move(child).value());
                    }
                    return Result<json, Error>::success(std::move(result));
                }

                return Result<json, Error>::success(node);
            }

            Result<json, Error> resolve_reference(
                const std::string& raw,
                const DocumentScope& scope,
                std::vector<std::string>& in_progress
            ) {
                const Reference ref = Reference::parse(raw);
                const std::string locator = ref.is_local() ? scope.locator : locate(ref.document);
                const std::string key = locator + "#" + ref.pointer;

                if (std::ranges::find(in_progress, key) != in_progress.end()) {
                    return Result<json, Error>::success(circular_marker(raw));
                }
                if (const auto it = memo_.find(key); it != memo_.end()) {
                    return Result<json, Error>::success(it->second);
                }

                InProgressGuard guard(in_progress, key);

                DocumentScope target_scope{locator, scope.holder, scope.document};
                if (locator.empty()) {
                    target_scope.holder = nullptr;
                    target_scope.document = &root_;
                } else if (locator != scope.locator) {
                    auto document = documents_.get(locator);
                    if (document.is_err()) {
                        return Result<json, Error>::failure(document.error().with_context("$ref " + raw));
                    }
                    target_scope.holder = document.value();
                    target_scope.document = target_scope.holder.get();
                }

                auto target = navigate(*target_scope.document, ref.pointer, raw);
                if (target.is_err()) {
                    return Result<json, Error>::failure(target.error());
                }

                auto resolved = resolve_node(*target.value(), target_scope, in_progress);
                if (resolved.is_err()) {
                    return resolved;
                }

                memo_.emplace(key, resolved.value());
                return resolved;
            }

            std::string locate(const std::string& document) const {
                if (loader::is_url(document)) {
                    return document;
                }
                const fs::path path(document);
                if (path.is_absolute()) {
                    return path.lexically_normal().string();
                }
                return (base_directory_ / path).lexically_normal().string();
            }

            const json& root_;
            DocumentCache documents_;
            fs::path base_directory_;
            std::map<std::string, json> memo_;
        };

        void collect_references(const json& node, std::set<Reference>& refs) {
            if (node.is_object()) {
                if (const auto ref = node.find(REF_KEY); ref != node.end() && ref->is_string()) {
                    refs.insert(Reference::parse(ref->get<std::string>()));
                }
                for (const auto& value : node) {
                    collect_references(value, refs);
                }
            } else if (node.is_array()) {
                for (const auto& item : node) {
                    collect_references(item, refs);
                }
            }
        }

    }  // namespace

    ReferenceResolver::ReferenceResolver(
        std::shared_ptr<loader::IDocumentFetcher> fetcher,
        ResolverOptions options
    )
        : fetcher_(std::move(fetcher))
        , options_(std::move(options)) {}

    Result<json, Error> ReferenceResolver::resolve(const json& document) const {
        fs::path base = options_.base_directory;
        if (base.empty()) {
            std::error_code ec;
            base = fs::current_path(ec);
            if (ec) {
                return Result<json, Error>::failure(
                    Error::io_error("Cannot determine working directory: " + ec.message())
                );
            }
        }

        ResolutionPass pass(document, fetcher_, std::move(base));
        if (options_.prefetch) {
            pass.prefetch(options_.prefetch_threads);
        }
        return pass.run();
    }

    std::set<Reference> ReferenceResolver::extract_all_references(const json& document) {
        std::set<Reference> refs;
        collect_references(document, refs);
        return refs;
    }

}  // namespace sdkir::resolver
