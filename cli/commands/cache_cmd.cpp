//
// Created by gregorian-rayne on 1/21/26.
//

#include "sdkir/cli/commands/command.hpp"

#include "sdkir/pipeline.hpp"

#include <iostream>

namespace sdkir::cli {

    /**
     * Cache command - inspects and clears the downloaded-document cache.
     */
    class CacheCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "cache";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Manage the cache of downloaded documents";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sdkir cache <clear|path|fetch> [OPTIONS]\n"
                   "\n"
                   "Examples:\n"
                   "  sdkir cache path\n"
                   "  sdkir cache clear\n"
                   "  sdkir cache clear --url https://example.com/openapi.json\n"
                   "  sdkir cache fetch --force https://example.com/openapi.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"config", 'c', "Configuration file", false, true, "", "FILE"},
                {"url", 'u', "Only clear the entry of this URL", false, true, "", "URL"},
                {"force", 'f', "Download again even when cached", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            const auto& positional = args.positional();
            if (positional.empty()) {
                return "Missing action. Use 'sdkir cache <clear|path|fetch>'";
            }
            const std::string& action = positional.front();
            if (action == "fetch") {
                if (positional.size() != 2) {
                    return "Expected one URL. Use 'sdkir cache fetch <url>'";
                }
            } else if (action == "clear" || action == "path") {
                if (positional.size() != 1) {
                    return "Unexpected argument: " + positional[1];
                }
            } else {
                return "Unknown cache action: " + action;
            }
            return Command::validate(args);
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_flags(args);

            auto config = load_config(args);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }

            const auto cache = pipeline::make_cache(config.value());
            const std::string& action = args.positional().front();

            if (action == "path") {
                std::cout << cache->directory().string() << "\n";
                return 0;
            }

            if (action == "fetch") {
                const std::string& url = args.positional()[1];
                print_verbose("Fetching " + url);
                auto document = cache->fetch(url, args.get_flag("force"));
                if (document.is_err()) {
                    print_error(document.error().to_string());
                    return 1;
                }
                print("Cached " + url + " at " + cache->cache_path(url).string());
                return 0;
            }

            if (const auto url = args.get("url")) {
                auto removed = cache->clear_url(*url);
                if (removed.is_err()) {
                    print_error(removed.error().to_string());
                    return 1;
                }
                print(removed.value() ? "Removed cached " + *url : "No cache entry for " + *url);
                return 0;
            }

            auto removed = cache->clear();
            if (removed.is_err()) {
                print_error(removed.error().to_string());
                return 1;
            }
            print("Removed " + std::to_string(removed.value()) + " cached document(s) from "
                  + cache->directory().string());
            return 0;
        }
    };

    namespace {
        struct CacheCommandRegistrar {
            CacheCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<CacheCommand>()
                );
            }
        } cache_registrar;
    }

}  // namespace sdkir::cli
