//
// Created by gregorian-rayne on 1/17/26.
//

#include "sdkir/analyzers/composition_analyzer.hpp"
#include "sdkir/resolver/reference.hpp"
#include "sdkir/utils/json_utils.hpp"

#include <algorithm>
#include <array>

namespace sdkir::analyzers::composition {

    namespace {

        constexpr std::array KIND_PRIORITY = {
            CompositionKind::AllOf,
            CompositionKind::OneOf,
            CompositionKind::AnyOf
        };

        CompositionMember make_member(const json& schema) {
            if (schema.is_object()) {
                for (const char* key : {resolver::REF_KEY, resolver::CIRCULAR_REF_KEY}) {
                    if (const auto it = schema.find(key); it != schema.end() && it->is_string()) {
                        return CompositionMember::reference(
                            schema_name_from_ref(it->get_ref<const std::string&>())
                        );
                    }
                }
            }
            return CompositionMember::inline_schema(schema);
        }

    }  // namespace

    const char* keyword(const CompositionKind kind) noexcept {
        return to_string(kind);
    }

    std::optional<CompositionKind> composition_kind(const json& schema) {
        if (!schema.is_object()) {
            return std::nullopt;
        }
        for (const auto kind : KIND_PRIORITY) {
            const json* members = json_utils::get_array(schema, keyword(kind));
            if (members != nullptr && !members->empty()) {
                return kind;
            }
        }
        return std::nullopt;
    }

    bool is_composition(const json& schema) {
        return composition_kind(schema).has_value();
    }

    std::string schema_name_from_ref(const std::string_view ref) {
        const auto slash = ref.rfind('/');
        return std::string(slash == std::string_view::npos ? ref : ref.substr(slash + 1));
    }

    Discriminator extract_discriminator(const json& discriminator) {
        Discriminator result;
        result.property_name = json_utils::get_string(discriminator, "propertyName", "type");

        if (const json* mapping = json_utils::get_object(discriminator, "mapping")) {
            for (auto it = mapping->begin(); it != mapping->end(); ++it) {
                result.mapping[it.key()] = it->is_string()
                    ? it->get<std::string>()
                    : json_utils::to_string(*it);
            }
        }
        return result;
    }

    std::optional<Composition> analyze(const json& schema) {
        const auto kind = composition_kind(schema);
        if (!kind) {
            return std::nullopt;
        }

        Composition composition;
        composition.kind = *kind;

        for (const auto& member : schema[keyword(*kind)]) {
            composition.members.push_back(make_member(member));
        }

        if (const json* discriminator = json_utils::get_object(schema, "discriminator")) {
            composition.discriminator = extract_discriminator(*discriminator);
        }

        return composition;
    }

    json merge_all_of(const std::vector<json>& members) {
        json merged = json::object();
        merged["type"] = "object";
        merged["properties"] = json::object();
        merged["required"] = json::array();

        for (const auto& member : members) {
            if (!member.is_object()) {
                continue;
            }

            if (const json* properties = json_utils::get_object(member, "properties")) {
                merged["properties"].update(*properties);
            }

            if (const json* required = json_utils::get_array(member, "required")) {
                for (const auto& name : *required) {
                    merged["required"].push_back(name);
                }
            }

            for (const char* key : {"description", "title"}) {
                if (member.contains(key) && !merged.contains(key)) {
                    merged[key] = member[key];
                }
            }
        }

        json unique = json::array();
        for (const auto& name : merged["required"]) {
            if (std::find(unique.begin(), unique.end(), name) == unique.end()) {
                unique.push_back(name);
            }
        }
        merged["required"] = std::move(unique);

        return merged;
    }

}  // namespace sdkir::analyzers::composition
