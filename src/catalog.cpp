#include "pgmcp/catalog.hpp"

#include "pgmcp/utils.hpp"

#include <algorithm>

namespace pgmcp::catalog {

    std::string_view logical_tool_name(std::string_view name) {
        if (name.starts_with(wire_prefix)) {
            return name.substr(wire_prefix.size());
        }
        return name;
    }

    std::optional<std::string> wire_tool_name(std::string_view name) {
        auto logical = logical_tool_name(name);
        if (std::ranges::find(tool_names, logical) == tool_names.end()) {
            return std::nullopt;
        }
        std::string wire{wire_prefix};
        wire.append(logical);
        return wire;
    }

    void patch_arguments(std::string_view logical_name, raw_arguments& args) {
        if (logical_tool_name(logical_name) != "execute_sql"sv) {
            return;
        }
        auto sql = string_field(args, "sql"sv);
        if (sql && utils::contains_case_insensitive(*sql, "create database"sv)) {
            args["transactional"] = false;
        }
    }

}  // namespace pgmcp::catalog
