#include "utils.hpp"

namespace pgmcp::test {
    using namespace std::string_view_literals;

    TEST_CASE("003: catalog lists every server tool once", "[003][catalog]") {
        CHECK(catalog::tool_names.size() == 19U);

        std::vector<std::string_view> sorted{catalog::tool_names.begin(), catalog::tool_names.end()};
        std::ranges::sort(sorted);
        CHECK(std::ranges::adjacent_find(sorted) == sorted.end());

        for (auto name : catalog::tool_names) {
            CHECK_FALSE(name.starts_with(catalog::wire_prefix));
        }
    }

    TEST_CASE("003: wire names accept logical and prefixed spellings", "[003][catalog]") {
        CHECK(catalog::wire_tool_name("manage_users"sv) == std::optional<std::string>{"pg_manage_users"});
        CHECK(catalog::wire_tool_name("pg_manage_users"sv) == std::optional<std::string>{"pg_manage_users"});
        CHECK(catalog::wire_tool_name("execute_sql"sv) == std::optional<std::string>{"pg_execute_sql"});
        CHECK_FALSE(catalog::wire_tool_name("drop_everything"sv));
        CHECK_FALSE(catalog::wire_tool_name("pg_"sv));
        CHECK_FALSE(catalog::wire_tool_name(""sv));

        CHECK(catalog::logical_tool_name("pg_manage_rls"sv) == "manage_rls"sv);
        CHECK(catalog::logical_tool_name("manage_rls"sv) == "manage_rls"sv);
    }

    TEST_CASE("003: create database runs outside a transaction", "[003][catalog]") {
        SECTION("execute_sql with create database") {
            auto args = detail::args_of(R"({"sql":"create database demo"})");
            catalog::patch_arguments("pg_execute_sql"sv, args);
            auto* flag = find_field(args, "transactional"sv);
            REQUIRE(flag != nullptr);
            REQUIRE(flag->is_boolean());
            CHECK_FALSE(flag->get<bool>());
        }

        SECTION("other statements are left alone") {
            auto args = detail::args_of(R"({"sql":"SELECT 1"})");
            catalog::patch_arguments("execute_sql"sv, args);
            CHECK(find_field(args, "transactional"sv) == nullptr);
        }

        SECTION("other tools are left alone") {
            auto args = detail::args_of(R"({"sql":"CREATE DATABASE demo"})");
            catalog::patch_arguments("execute_query"sv, args);
            CHECK(find_field(args, "transactional"sv) == nullptr);
        }
    }

}  // namespace pgmcp::test
