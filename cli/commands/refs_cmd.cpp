//
// Created by gregorian-rayne on 1/21/26.
//

#include "sdkir/cli/commands/command.hpp"
#include "sdkir/cli/formatter.hpp"

#include "sdkir/pipeline.hpp"
#include "sdkir/resolver/reference_resolver.hpp"

#include <iostream>

namespace sdkir::cli {

    /**
     * Refs command - lists the distinct references of a document.
     */
    class RefsCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "refs";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List the references an OpenAPI document contains";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sdkir refs [OPTIONS] <spec>\n"
                   "\n"
                   "Examples:\n"
                   "  sdkir refs openapi.yaml\n"
                   "  sdkir refs --external-only --json openapi.yaml";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"config", 'c', "Configuration file", false, true, "", "FILE"},
                {"external-only", 'e', "Only list references into other documents", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one document. Use 'sdkir refs <spec>'";
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

            const auto fetcher = pipeline::default_fetcher(config.value());
            auto document = pipeline::load(args.positional().front(), *fetcher);
            if (document.is_err()) {
                print_error(document.error().to_string());
                return 1;
            }

            const bool external_only = args.get_flag("external-only");
            std::vector<resolver::Reference> references;
            for (const auto& reference : resolver::ReferenceResolver::extract_all_references(document.value())) {
                if (!external_only || !reference.is_local()) {
                    references.push_back(reference);
                }
            }

            if (is_json()) {
                json out = json::array();
                for (const auto& reference : references) {
                    out.push_back({
                        {"ref", reference.raw},
                        {"document", reference.document},
                        {"pointer", reference.pointer}
                    });
                }
                std::cout << out.dump(2) << "\n";
                return 0;
            }

            if (references.empty()) {
                print("No references found");
                return 0;
            }

            Table table({
                {"Reference", 60, false, std::nullopt},
                {"Kind", 0, false, std::string(colors::DIM)},
            });
            for (const auto& reference : references) {
                const char* kind = reference.is_local() ? "local" : reference.is_url() ? "url" : "file";
                table.add_row({reference.raw, kind});
            }
            if (!is_quiet()) {
                table.render(std::cout);
                std::cout << "\n" << format_count(references.size()) << " reference(s)\n";
            }
            return 0;
        }
    };

    namespace {
        struct RefsCommandRegistrar {
            RefsCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<RefsCommand>()
                );
            }
        } refs_registrar;
    }

}  // namespace sdkir::cli
