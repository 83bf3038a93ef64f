#pragma once

#include "types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace pgmcp::catalog {

    using namespace std::string_view_literals;

    inline constexpr auto wire_prefix = "pg_"sv;

    // Logical tool names exposed by the PostgreSQL MCP server; on the wire each carries `wire_prefix`.
    inline constexpr std::array tool_names{
            "analyze_database"sv,
            "manage_functions"sv,
            "manage_rls"sv,
            "debug_database"sv,
            "manage_schema"sv,
            "export_table_data"sv,
            "import_table_data"sv,
            "copy_between_databases"sv,
            "monitor_database"sv,
            "get_setup_instructions"sv,
            "manage_triggers"sv,
            "manage_indexes"sv,
            "manage_query"sv,
            "manage_users"sv,
            "manage_constraints"sv,
            "execute_query"sv,
            "execute_mutation"sv,
            "execute_sql"sv,
            "manage_comments"sv,
    };

    // Accepts `manage_users` or `pg_manage_users`; std::nullopt when neither names a known tool.
    std::optional<std::string> wire_tool_name(std::string_view name);

    // `pg_manage_users` -> `manage_users`; names without the prefix are returned unchanged.
    std::string_view logical_tool_name(std::string_view name);

    // CREATE DATABASE cannot run inside a transaction block, so execute_sql gets transactional=false.
    void patch_arguments(std::string_view logical_name, raw_arguments& args);

}  // namespace pgmcp::catalog
