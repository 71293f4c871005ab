//
// Created by gregorian-rayne on 1/16/26.
//

#include "sdkir/resolver/reference.hpp"
#include "sdkir/loader/document_fetcher.hpp"
#include "sdkir/utils/string_utils.hpp"

#include <charconv>

namespace sdkir::resolver {

    Reference Reference::parse(const std::string_view text) {
        Reference ref;
        ref.raw = std::string(text);

        if (const auto hash = text.find('#'); hash != std::string_view::npos) {
            ref.document = std::string(text.substr(0, hash));
            ref.pointer = std::string(text.substr(hash + 1));
        } else {
            ref.document = std::string(text);
        }
        return ref;
    }

    bool Reference::is_url() const noexcept {
        return loader::is_url(document);
    }

    std::string unescape_segment(const std::string_view segment) {
        return string_utils::replace_all(string_utils::replace_all(segment, "~1", "/"), "~0", "~");
    }

    Result<const json*, Error> navigate(
        const json& document,
        std::string_view pointer,
        const std::string& reference
    ) {
        if (pointer.empty() || pointer == "/") {
            return Result<const json*, Error>::success(&document);
        }
        if (pointer.front() == '/') {
            pointer.remove_prefix(1);
        }

        const json* current = &document;
        for (const auto raw_segment : string_utils::split(pointer, '/')) {
            const std::string segment = unescape_segment(raw_segment);

            if (current->is_object()) {
                const auto it = current->find(segment);
                if (it == current->end()) {
                    return Result<const json*, Error>::failure(
                        Error::reference_error("Key '" + segment + "' not found",
                                               "pointer " + std::string(pointer) + " in " + reference)
                    );
                }
                current = &*it;
            } else if (current->is_array()) {
                std::size_t index = 0;
                const auto* first = segment.data();
                const auto* last = segment.data() + segment.size();
                const auto [end, ec] = std::from_chars(first, last, index);
                if (segment.empty() || ec != std::errc{} || end != last) {
                    return Result<const json*, Error>::failure(
                        Error::reference_error("Array index '" + segment + "' is not an integer",
                                               "pointer " + std::string(pointer) + " in " + reference)
                    );
                }
                if (index >= current->size()) {
                    return Result<const json*, Error>::failure(
                        Error::reference_error("Array index " + segment + " out of range",
                                               "pointer " + std::string(pointer) + " in " + reference)
                    );
                }
                current = &(*current)[index];
            } else {
                return Result<const json*, Error>::failure(
                    Error::reference_error("Invalid reference path",
                                           "pointer " + std::string(pointer) + " in " + reference)
                );
            }
        }

        return Result<const json*, Error>::success(current);
    }

    json circular_marker(const std::string& reference) {
        json marker = json::object();
        marker[CIRCULAR_REF_KEY] = reference;
        return marker;
    }

    bool is_circular_marker(const json& node) {
        return node.is_object() && node.contains(CIRCULAR_REF_KEY);
    }

}  // namespace sdkir::resolver
