//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef SDKIR_TYPES_HPP
#define SDKIR_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures of the SDK intermediate representation.
 *
 * Types are organized into categories:
 *
 * - Documents: json (insertion-ordered tree), HttpMethod
 * - Operations: Operation, OperationGroup, NamingTier
 * - Resources: Resource, Namespace, PathGroup
 * - Schemas: Composition, CompositionMember, Discriminator
 * - Reporting: Diagnostic, ApiMetadata, NamingConventions, ApiIR
 *
 * All IR entities are built once per analysis pass and are read-only
 * afterwards. Operations are shared between resources through
 * OperationPtr; no resource owns an operation exclusively.
 */

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <variant>
#include <utility>

namespace sdkir {

    /**
     * Parsed document tree. Object keys keep their declaration order so
     * that grouping and namespace detection follow the order of the source
     * document.
     */
    using json = nlohmann::ordered_json;

    // ============================================================================
    // HTTP
    // ============================================================================

    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options
    };

    /**
     * The seven operation keys of a path item, in scan order.
     */
    inline constexpr HttpMethod ALL_HTTP_METHODS[] = {
        HttpMethod::Get,
        HttpMethod::Post,
        HttpMethod::Put,
        HttpMethod::Patch,
        HttpMethod::Delete,
        HttpMethod::Head,
        HttpMethod::Options
    };

    /**
     * Upper-case method name ("GET").
     */
    inline const char* to_string(HttpMethod method) noexcept {
        switch (method) {
            case HttpMethod::Get:     return "GET";
            case HttpMethod::Post:    return "POST";
            case HttpMethod::Put:     return "PUT";
            case HttpMethod::Patch:   return "PATCH";
            case HttpMethod::Delete:  return "DELETE";
            case HttpMethod::Head:    return "HEAD";
            case HttpMethod::Options: return "OPTIONS";
        }
        return "GET";
    }

    /**
     * Lower-case method name, as used for path item keys ("get").
     */
    inline const char* path_item_key(HttpMethod method) noexcept {
        switch (method) {
            case HttpMethod::Get:     return "get";
            case HttpMethod::Post:    return "post";
            case HttpMethod::Put:     return "put";
            case HttpMethod::Patch:   return "patch";
            case HttpMethod::Delete:  return "delete";
            case HttpMethod::Head:    return "head";
            case HttpMethod::Options: return "options";
        }
        return "get";
    }

    // ============================================================================
    // Operations
    // ============================================================================

    /**
     * Which rule of the operation naming scheme produced a name.
     */
    enum class NamingTier {
        DeclaredId,   // cleaned operationId is a simple verb
        RpcAction,    // trailing path segment is an action word
        MethodShape   // HTTP method and response shape
    };

    inline const char* to_string(NamingTier tier) noexcept {
        switch (tier) {
            case NamingTier::DeclaredId:  return "declared-id";
            case NamingTier::RpcAction:   return "rpc-action";
            case NamingTier::MethodShape: return "method-shape";
        }
        return "method-shape";
    }

    /**
     * A single API operation. Identity is (path, method).
     */
    struct Operation {
        std::string path;
        HttpMethod method = HttpMethod::Get;
        std::optional<std::string> operation_id;
        std::vector<std::string> tags;
        json responses = json::object();

        /// Inferred method name and the tier that produced it.
        std::string name;
        NamingTier naming_tier = NamingTier::MethodShape;

        /// Sanitized identifier for the inferred name.
        std::string identifier;

        /// The operation object as it appears in the resolved document
        /// (extension fields included).
        json definition = json::object();

        [[nodiscard]] bool same_identity(const Operation& other) const noexcept {
            return path == other.path && method == other.method;
        }
    };

    using OperationPtr = std::shared_ptr<const Operation>;
    using OperationList = std::vector<OperationPtr>;

    /**
     * Named list of operations. Used for tag groups and nested groups;
     * a vector of groups keeps first-seen order.
     */
    struct OperationGroup {
        std::string name;
        OperationList operations;
    };

    using OperationGroups = std::vector<OperationGroup>;

    /**
     * Returns the group with the given name, appending an empty one when
     * it does not exist yet.
     */
    inline OperationGroup& group_for(OperationGroups& groups, const std::string& name) {
        for (auto& group : groups) {
            if (group.name == name) {
                return group;
            }
        }
        groups.push_back(OperationGroup{name, {}});
        return groups.back();
    }

    // ============================================================================
    // Resources and Namespaces
    // ============================================================================

    /**
     * A nested sub-resource accessor on a parent resource.
     */
    struct NestedGroup {
        std::string name;
        std::string property_name;
        OperationList operations;
    };

    struct Resource {
        std::string name;
        std::string class_name;
        std::optional<std::string> path_prefix;
        bool requires_id = false;
        std::optional<std::string> id_param_name;
        OperationList operations;
        std::vector<NestedGroup> nested_groups;
    };

    /**
     * A version or release-stage grouping of paths ("v1", "beta").
     * Resources are associated by name, not owned.
     */
    struct Namespace {
        std::string name;
        std::string path_prefix;
        std::vector<std::string> resources;
    };

    struct PathGroup {
        std::string name;
        std::vector<std::string> paths;
    };

    // ============================================================================
    // Schema Composition
    // ============================================================================

    enum class CompositionKind {
        AllOf,
        OneOf,
        AnyOf
    };

    /**
     * Keyword of the composition kind ("allOf").
     */
    inline const char* to_string(CompositionKind kind) noexcept {
        switch (kind) {
            case CompositionKind::AllOf: return "allOf";
            case CompositionKind::OneOf: return "oneOf";
            case CompositionKind::AnyOf: return "anyOf";
        }
        return "allOf";
    }

    /**
     * One member of a composition: either the bare name of a referenced
     * schema, or an inline schema that still needs a synthesized name.
     */
    class CompositionMember {
    public:
        static CompositionMember reference(std::string schema_name) {
            return CompositionMember(std::move(schema_name));
        }

        static CompositionMember inline_schema(json schema) {
            return CompositionMember(std::move(schema));
        }

        [[nodiscard]] bool is_reference() const noexcept {
            return std::holds_alternative<std::string>(value_);
        }

        [[nodiscard]] const std::string& schema_name() const {
            return std::get<std::string>(value_);
        }

        [[nodiscard]] const json& schema() const {
            return std::get<json>(value_);
        }

        bool operator==(const CompositionMember& other) const {
            return value_ == other.value_;
        }

    private:
        explicit CompositionMember(std::string name) : value_(std::in_place_index<0>, std::move(name)) {}
        explicit CompositionMember(json schema) : value_(std::in_place_index<1>, std::move(schema)) {}

        std::variant<std::string, json> value_;
    };

    struct Discriminator {
        std::string property_name = "type";
        std::map<std::string, std::string> mapping;
    };

    struct Composition {
        CompositionKind kind = CompositionKind::AllOf;
        std::vector<CompositionMember> members;
        std::optional<Discriminator> discriminator;
    };

    /**
     * A composition declared under components.schemas.
     */
    struct SchemaComposition {
        std::string schema_name;
        Composition composition;
        /// Flattened product type, present for allOf only.
        std::optional<json> merged;
    };

    // ============================================================================
    // Reporting
    // ============================================================================

    enum class Severity {
        Info,
        Warning
    };

    enum class DiagnosticKind {
        Ambiguity
    };

    inline const char* to_string(Severity severity) noexcept {
        switch (severity) {
            case Severity::Info:    return "info";
            case Severity::Warning: return "warning";
        }
        return "info";
    }

    inline const char* to_string(DiagnosticKind kind) noexcept {
        switch (kind) {
            case DiagnosticKind::Ambiguity: return "ambiguity";
        }
        return "ambiguity";
    }

    /**
     * Non-fatal finding attached to the IR. The location is a path and
     * method ("GET /users") or a schema name.
     */
    struct Diagnostic {
        Severity severity = Severity::Warning;
        DiagnosticKind kind = DiagnosticKind::Ambiguity;
        std::string message;
        std::string location;
    };

    struct ApiMetadata {
        std::string title;
        std::string version;
        std::string description;
        std::optional<std::string> license;
        json contact = json::object();
        std::vector<std::string> servers;
    };

    struct NamingConventions {
        std::string request = "snake_case";
        std::string response = "camelCase";
        std::string parameter = "camelCase";
    };

    /**
     * The complete intermediate representation of one API description.
     */
    struct ApiIR {
        ApiMetadata metadata;
        std::string base_url;
        std::vector<Resource> resources;
        std::vector<Namespace> namespaces;
        std::vector<SchemaComposition> compositions;
        NamingConventions naming;
        std::vector<Diagnostic> diagnostics;

        [[nodiscard]] const Resource* find_resource(std::string_view name) const {
            for (const auto& resource : resources) {
                if (resource.name == name) {
                    return &resource;
                }
            }
            return nullptr;
        }
    };

}  // namespace sdkir

#endif //SDKIR_TYPES_HPP
