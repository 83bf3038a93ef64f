#pragma once

#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pgmcp {

    // One tool invocation's caller-supplied arguments: string keys to any JSON value.
    using raw_arguments = glz::generic::object_t;

    inline const glz::generic* find_field(const raw_arguments& args, std::string_view key) {
        if (auto it = args.find(key); it != args.end()) {
            return &it->second;
        }
        return nullptr;
    }

    // Value of `key` when present and a string; any other JSON type reads as absent.
    inline std::optional<std::string_view> string_field(const raw_arguments& args, std::string_view key) {
        auto* field = find_field(args, key);
        if (field == nullptr || !field->is_string()) {
            return std::nullopt;
        }
        return std::string_view{field->get<std::string>()};
    }

    // Parses a JSON object; anything else (including malformed text) yields std::nullopt.
    inline std::optional<raw_arguments> parse_arguments(std::string_view text) {
        glz::generic doc{};
        std::string buffer{text};
        if (auto ec = glz::read_json(doc, buffer)) {
            return std::nullopt;
        }
        if (!doc.is_object()) {
            return std::nullopt;
        }
        return std::move(doc.get_object());
    }

}  // namespace pgmcp
