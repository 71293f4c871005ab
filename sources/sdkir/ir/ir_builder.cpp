//
// Created by gregorian-rayne on 1/19/26.
//

#include "sdkir/ir/ir_builder.hpp"
#include "sdkir/analyzers/composition_analyzer.hpp"
#include "sdkir/analyzers/endpoint_analyzer.hpp"
#include "sdkir/analyzers/namespace_analyzer.hpp"
#include "sdkir/analyzers/naming_analyzer.hpp"
#include "sdkir/analyzers/nested_detector.hpp"
#include "sdkir/spec/spec_validator.hpp"
#include "sdkir/utils/case_utils.hpp"
#include "sdkir/utils/json_utils.hpp"
#include "sdkir/utils/string_utils.hpp"

#include <algorithm>
#include <set>
#include <vector>

namespace sdkir::ir {

    namespace {

        Resource build_resource(const OperationGroup& group, const config::Config& config) {
            Resource resource;
            resource.name = group.name;
            resource.class_name = case_utils::sanitize_class_name(group.name);
            resource.operations = group.operations;

            const auto paths = analyzers::endpoint::operation_paths(group.operations);
            resource.path_prefix = analyzers::endpoint::detect_path_prefix(paths);

            auto [required, param_name] = analyzers::endpoint::requires_resource_id(paths);
            resource.requires_id = required;
            resource.id_param_name = std::move(param_name);

            const analyzers::nested::NestedOptions nested_options{
                config.nested.extension_key,
                config.nested.min_operations
            };
            for (auto& nested : analyzers::nested::detect_nested_resources(group.operations, nested_options)) {
                if (analyzers::nested::should_create_nested_resource(nested.operations.size(),
                                                                     nested_options.min_operations)) {
                    resource.nested_groups.push_back(std::move(nested));
                }
            }

            return resource;
        }

        bool contains_segment(const Resource& resource, const std::string& token) {
            return std::ranges::any_of(resource.operations, [&](const OperationPtr& operation) {
                const auto segments = string_utils::path_segments(operation->path);
                return std::ranges::find(segments, std::string_view(token)) != segments.end();
            });
        }

        void report_ambiguous_names(const std::vector<Resource>& resources, std::vector<Diagnostic>& diagnostics) {
            std::set<const Operation*> reported;
            for (const auto& resource : resources) {
                for (const auto& operation : resource.operations) {
                    if (operation->naming_tier != NamingTier::MethodShape || !reported.insert(operation.get()).second) {
                        continue;
                    }
                    diagnostics.push_back(Diagnostic{
                        Severity::Warning,
                        DiagnosticKind::Ambiguity,
                        "Operation name '" + operation->name + "' inferred from HTTP method and response shape",
                        std::string(to_string(operation->method)) + " " + operation->path
                    });
                }
            }
        }

        const json* component_schemas(const json& document) {
            const json* components = json_utils::get_object(document, "components");
            return components ? json_utils::get_object(*components, "schemas") : nullptr;
        }

        std::vector<SchemaComposition> collect_compositions(const json& raw, const json& resolved) {
            std::vector<SchemaComposition> compositions;

            const json* raw_schemas = component_schemas(raw);
            const json* resolved_schemas = component_schemas(resolved);
            if (raw_schemas == nullptr && resolved_schemas == nullptr) {
                return compositions;
            }

            // Resolved entries are consulted for schemas that are compositions
            // only after their own reference is followed.
            const json& names = raw_schemas ? *raw_schemas : *resolved_schemas;
            for (auto it = names.begin(); it != names.end(); ++it) {
                const json* resolved_schema = nullptr;
                if (resolved_schemas != nullptr) {
                    if (const auto found = resolved_schemas->find(it.key()); found != resolved_schemas->end()) {
                        resolved_schema = &*found;
                    }
                }

                auto composition = analyzers::composition::analyze(it.value());
                if (!composition && resolved_schema != nullptr) {
                    composition = analyzers::composition::analyze(*resolved_schema);
                }
                if (!composition) {
                    continue;
                }

                SchemaComposition entry{it.key(), std::move(*composition), std::nullopt};

                if (entry.composition.kind == CompositionKind::AllOf) {
                    const json& source = resolved_schema != nullptr ? *resolved_schema : it.value();
                    if (const json* members = json_utils::get_array(source, "allOf")) {
                        entry.merged = analyzers::composition::merge_all_of(
                            std::vector<json>(members->begin(), members->end())
                        );
                    }
                }

                compositions.push_back(std::move(entry));
            }

            return compositions;
        }

        json optional_to_json(const std::optional<std::string>& value) {
            return value ? json(*value) : json(nullptr);
        }

        json operation_refs(const OperationList& operations) {
            json refs = json::array();
            for (const auto& operation : operations) {
                refs.push_back(std::string(to_string(operation->method)) + " " + operation->path);
            }
            return refs;
        }

        json composition_to_json(const SchemaComposition& entry) {
            json out = json::object();
            out["schema_name"] = entry.schema_name;
            out["kind"] = to_string(entry.composition.kind);

            json members = json::array();
            for (const auto& member : entry.composition.members) {
                json item = json::object();
                if (member.is_reference()) {
                    item["ref"] = member.schema_name();
                } else {
                    item["inline"] = member.schema();
                }
                members.push_back(std::move(item));
            }
            out["members"] = std::move(members);

            if (const auto& discriminator = entry.composition.discriminator) {
                json mapping = json::object();
                for (const auto& [value, schema] : discriminator->mapping) {
                    mapping[value] = schema;
                }
                out["discriminator"] = {
                    {"property_name", discriminator->property_name},
                    {"mapping", std::move(mapping)}
                };
            } else {
                out["discriminator"] = nullptr;
            }

            if (entry.merged) {
                out["merged"] = *entry.merged;
            }
            return out;
        }

    }  // namespace

    Result<ApiIR, Error> build(const json& raw, const json& resolved, const config::Config& config) {
        if (!resolved.is_object()) {
            return Result<ApiIR, Error>::failure(
                Error::structural_error("Specification root must be an object")
            );
        }

        ApiIR ir;
        ir.metadata = spec::extract_metadata(resolved);
        ir.base_url = spec::get_base_url(resolved);

        for (const auto& group : analyzers::endpoint::group_by_tags(resolved)) {
            ir.resources.push_back(build_resource(group, config));
        }

        ir.namespaces = analyzers::namespaces::detect_namespaces(resolved);
        const bool namespace_detected = !ir.namespaces.empty();
        if (!namespace_detected && !config.namespaces.default_name.empty()) {
            Namespace fallback;
            fallback.name = config.namespaces.default_name;
            fallback.path_prefix = "/" + fallback.name;
            for (const auto& resource : ir.resources) {
                fallback.resources.push_back(resource.name);
            }
            ir.namespaces.push_back(std::move(fallback));
        } else {
            for (auto& ns : ir.namespaces) {
                for (const auto& resource : ir.resources) {
                    if (contains_segment(resource, ns.name)) {
                        ns.resources.push_back(resource.name);
                    }
                }
            }
        }

        ir.compositions = collect_compositions(raw, resolved);
        ir.naming = analyzers::naming::analyze_conventions(resolved);

        if (config.naming.report_ambiguity) {
            report_ambiguous_names(ir.resources, ir.diagnostics);

            if (!namespace_detected) {
                ir.diagnostics.push_back(Diagnostic{
                    ir.namespaces.empty() ? Severity::Warning : Severity::Info,
                    DiagnosticKind::Ambiguity,
                    ir.namespaces.empty()
                        ? std::string("No version or stage namespace detected")
                        : "No version or stage namespace detected, using '" + ir.namespaces.front().name + "'",
                    "paths"
                });
            }
        }

        return Result<ApiIR, Error>::success(std::move(ir));
    }

    json to_json(const Operation& operation) {
        json out = json::object();
        out["path"] = operation.path;
        out["method"] = to_string(operation.method);
        out["operation_id"] = optional_to_json(operation.operation_id);
        out["tags"] = operation.tags;
        out["name"] = operation.name;
        out["identifier"] = operation.identifier;
        out["naming_tier"] = to_string(operation.naming_tier);
        return out;
    }

    json to_json(const ApiIR& ir) {
        json out = json::object();

        out["metadata"] = {
            {"title", ir.metadata.title},
            {"version", ir.metadata.version},
            {"description", ir.metadata.description},
            {"license", optional_to_json(ir.metadata.license)},
            {"contact", ir.metadata.contact},
            {"servers", ir.metadata.servers}
        };
        out["base_url"] = ir.base_url;

        json namespaces = json::array();
        for (const auto& ns : ir.namespaces) {
            namespaces.push_back({
                {"name", ns.name},
                {"path_prefix", ns.path_prefix},
                {"resources", ns.resources}
            });
        }
        out["namespaces"] = std::move(namespaces);

        json resources = json::array();
        for (const auto& resource : ir.resources) {
            json item = json::object();
            item["name"] = resource.name;
            item["class_name"] = resource.class_name;
            item["path_prefix"] = optional_to_json(resource.path_prefix);
            item["requires_id"] = resource.requires_id;
            item["id_param_name"] = optional_to_json(resource.id_param_name);

            json operations = json::array();
            for (const auto& operation : resource.operations) {
                operations.push_back(to_json(*operation));
            }
            item["operations"] = std::move(operations);

            json nested = json::array();
            for (const auto& group : resource.nested_groups) {
                nested.push_back({
                    {"name", group.name},
                    {"property_name", group.property_name},
                    {"operations", operation_refs(group.operations)}
                });
            }
            item["nested_groups"] = std::move(nested);

            resources.push_back(std::move(item));
        }
        out["resources"] = std::move(resources);

        json compositions = json::array();
        for (const auto& entry : ir.compositions) {
            compositions.push_back(composition_to_json(entry));
        }
        out["compositions"] = std::move(compositions);

        out["naming"] = {
            {"request", ir.naming.request},
            {"response", ir.naming.response},
            {"parameter", ir.naming.parameter}
        };

        json diagnostics = json::array();
        for (const auto& diagnostic : ir.diagnostics) {
            diagnostics.push_back({
                {"severity", to_string(diagnostic.severity)},
                {"kind", to_string(diagnostic.kind)},
                {"message", diagnostic.message},
                {"location", diagnostic.location}
            });
        }
        out["diagnostics"] = std::move(diagnostics);

        return out;
    }

}  // namespace sdkir::ir
