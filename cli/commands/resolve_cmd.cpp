//
// Created by gregorian-rayne on 1/20/26.
//

#include "sdkir/cli/commands/command.hpp"

#include "sdkir/pipeline.hpp"
#include "sdkir/spec/spec_validator.hpp"
#include "sdkir/utils/json_utils.hpp"

#include <iostream>

namespace sdkir::cli {

    /**
     * Resolve command - writes a document with every $ref inlined.
     */
    class ResolveCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "resolve";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Inline every reference of an OpenAPI document";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sdkir resolve [OPTIONS] <spec>\n"
                   "\n"
                   "Examples:\n"
                   "  sdkir resolve openapi.yaml > resolved.json\n"
                   "  sdkir resolve --output resolved.json --no-validate partial.yaml";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"output", 'o', "Write the resolved document to FILE", false, true, "", "FILE"},
                {"config", 'c', "Configuration file", false, true, "", "FILE"},
                {"indent", 0, "Indentation of the JSON output (-1 for compact)", false, true, "2", "N"},
                {"no-validate", 0, "Skip the OpenAPI structure check", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one document. Use 'sdkir resolve <spec>'";
            }
            if (!args.get_int("indent")) {
                return "Option --indent expects an integer";
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

            pipeline::PipelineOptions options;
            options.config = std::move(config).value();
            options.fetcher = pipeline::default_fetcher(options.config);

            const std::string& source = args.positional().front();
            auto raw = pipeline::load(source, *options.fetcher);
            if (raw.is_err()) {
                print_error(raw.error().to_string());
                return 1;
            }

            if (!args.get_flag("no-validate")) {
                if (auto valid = spec::validate_spec(raw.value()); valid.is_err()) {
                    print_error(valid.error().with_context(source).to_string());
                    return 1;
                }
            }

            auto resolved = pipeline::resolve(source, raw.value(), options);
            if (resolved.is_err()) {
                print_error(resolved.error().to_string());
                return 1;
            }

            const int indent = args.get_int("indent").value_or(2);
            if (const auto path = args.get("output")) {
                if (auto written = json_utils::write_file(*path, resolved.value(), indent); written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                print("Resolved document written to " + *path);
                return 0;
            }

            std::cout << json_utils::to_string(resolved.value(), indent) << "\n";
            return 0;
        }
    };

    namespace {
        struct ResolveCommandRegistrar {
            ResolveCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ResolveCommand>()
                );
            }
        } resolve_registrar;
    }

}  // namespace sdkir::cli
