//
// Created by gregorian-rayne on 1/20/26.
//

#include "sdkir/cli/commands/command.hpp"
#include "sdkir/cli/formatter.hpp"

#include "sdkir/sdkir.hpp"
#include "sdkir/analyzers/namespace_analyzer.hpp"
#include "sdkir/utils/json_utils.hpp"

#include <iostream>

namespace sdkir::cli {

    /**
     * Analyze command - builds the SDK IR for a document.
     */
    class AnalyzeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "analyze";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Analyze an OpenAPI document and build the SDK intermediate representation";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sdkir analyze [OPTIONS] <spec>\n"
                   "\n"
                   "Examples:\n"
                   "  sdkir analyze openapi.yaml\n"
                   "  sdkir analyze --json --output ir.json https://example.com/openapi.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"output", 'o', "Write the IR as JSON to FILE", false, true, "", "FILE"},
                {"config", 'c', "Configuration file", false, true, "", "FILE"},
                {"no-color", 0, "Disable colored output", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one document. Use 'sdkir analyze <spec>'";
            }
            return Command::validate(args);
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_flags(args);
            if (args.get_flag("no-color")) {
                colors::set_enabled(false);
            }

            auto config = load_config(args);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }

            const std::string& source = args.positional().front();
            print_verbose("Analyzing " + source);

            pipeline::PipelineOptions options;
            options.config = std::move(config).value();

            auto output = pipeline::run(source, options);
            if (output.is_err()) {
                print_error(output.error().to_string());
                return 1;
            }

            const ApiIR& ir = output.value().ir;
            const json document = ir::to_json(ir);

            if (const auto path = args.get("output")) {
                if (auto written = json_utils::write_file(*path, document); written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                print_verbose("IR written to " + *path);
            }

            if (is_json()) {
                std::cout << document.dump(2) << "\n";
                return 0;
            }

            print_summary(ir);
            if (is_verbose()) {
                print_path_groups(output.value().resolved);
            }
            report_diagnostics(ir);
            return 0;
        }

    private:
        void print_summary(const ApiIR& ir) const {
            if (is_quiet()) {
                return;
            }

            std::cout << ir.metadata.title << " " << ir.metadata.version << "\n";
            if (!ir.base_url.empty()) {
                std::cout << "Base URL: " << ir.base_url << "\n";
            }
            std::cout << "\n";

            Table resources({
                {"Resource", 0, false, std::nullopt},
                {"Class", 0, false, std::string(colors::CYAN)},
                {"Prefix", 0, false, std::nullopt},
                {"Operations", 0, true, std::nullopt},
                {"Nested", 0, true, std::nullopt},
            });
            std::size_t operation_count = 0;
            for (const auto& resource : ir.resources) {
                operation_count += resource.operations.size();
                resources.add_row({
                    resource.name,
                    resource.class_name,
                    resource.path_prefix.value_or(""),
                    format_count(resource.operations.size()),
                    format_count(resource.nested_groups.size())
                });
            }
            resources.render(std::cout);
            std::cout << "\n";

            if (is_verbose()) {
                Table operations({
                    {"Resource", 0, false, std::nullopt},
                    {"Method", 0, false, std::nullopt},
                    {"Path", 50, false, std::nullopt},
                    {"Name", 0, false, std::string(colors::GREEN)},
                    {"Tier", 0, false, std::nullopt},
                });
                for (const auto& resource : ir.resources) {
                    for (const auto& operation : resource.operations) {
                        operations.add_row({
                            resource.name,
                            to_string(operation->method),
                            operation->path,
                            operation->name,
                            to_string(operation->naming_tier)
                        });
                    }
                    operations.add_separator();
                }
                operations.render(std::cout);
                std::cout << "\n";
            }

            std::cout << "Resources:    " << format_count(ir.resources.size()) << "\n";
            std::cout << "Operations:   " << format_count(operation_count) << "\n";
            std::cout << "Compositions: " << format_count(ir.compositions.size()) << "\n";

            std::cout << "Namespaces:   ";
            if (ir.namespaces.empty()) {
                std::cout << "(none)";
            }
            for (std::size_t i = 0; i < ir.namespaces.size(); ++i) {
                if (i > 0) std::cout << ", ";
                std::cout << ir.namespaces[i].name;
            }
            std::cout << "\n";

            std::cout << "Naming:       request=" << ir.naming.request
                      << " response=" << ir.naming.response
                      << " parameter=" << ir.naming.parameter << "\n";
        }

        void print_path_groups(const json& resolved) const {
            std::vector<std::string> paths;
            if (const json* items = json_utils::get_object(resolved, "paths")) {
                for (auto it = items->begin(); it != items->end(); ++it) {
                    paths.push_back(it.key());
                }
            }

            std::cout << "\nPaths by namespace:\n";
            for (const auto& group : analyzers::namespaces::group_paths_by_namespace(paths)) {
                std::cout << "  " << group.name << " (" << group.paths.size() << ")\n";
                for (const auto& path : group.paths) {
                    print_debug("    " + path);
                }
            }
        }

        void report_diagnostics(const ApiIR& ir) const {
            for (const auto& diagnostic : ir.diagnostics) {
                std::string line = diagnostic.message;
                if (!diagnostic.location.empty()) {
                    line += " [" + diagnostic.location + "]";
                }
                if (diagnostic.severity == Severity::Warning) {
                    print_warning(line);
                } else {
                    print_info(line);
                }
            }
        }
    };

    namespace {
        struct AnalyzeCommandRegistrar {
            AnalyzeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AnalyzeCommand>()
                );
            }
        } analyze_registrar;
    }

}  // namespace sdkir::cli
