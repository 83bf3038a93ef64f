#include "utils.hpp"

namespace pgmcp::test {
    using namespace std::string_view_literals;

    namespace detail {
        static env_lookup lookup_from(env_entries entries) {
            return [entries = std::move(entries)](std::string_view name) -> std::optional<std::string> {
                for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
                    if (it->first == name) {
                        return it->second;
                    }
                }
                return std::nullopt;
            };
        }
    }  // namespace detail

    TEST_CASE("001: output and color mode parsing", "[001][config]") {
        output_mode out_mode = output_mode::text;
        color_mode clr_mode = color_mode::automatic;

        REQUIRE(try_parse_output_mode("JSON"sv, out_mode));
        CHECK(out_mode == output_mode::json);
        REQUIRE(try_parse_output_mode("text"sv, out_mode));
        CHECK(out_mode == output_mode::text);
        CHECK_FALSE(try_parse_output_mode("table"sv, out_mode));
        CHECK(out_mode == output_mode::text);

        REQUIRE(try_parse_color_mode("never"sv, clr_mode));
        CHECK(clr_mode == color_mode::never);
        REQUIRE(try_parse_color_mode("Auto"sv, clr_mode));
        CHECK(clr_mode == color_mode::automatic);
        CHECK_FALSE(try_parse_color_mode("sometimes"sv, clr_mode));

        CHECK(to_string(output_mode::json) == "json"sv);
        CHECK(to_string(color_mode::always) == "always"sv);
    }

    TEST_CASE("001: defaults match the reference deployment", "[001][config]") {
        client_config cfg{};
        CHECK(cfg.connection.user == "postgres");
        CHECK(cfg.connection.password == "mysecretpassword");
        CHECK(cfg.connection.host == "localhost");
        CHECK(cfg.connection.port == "5432");
        CHECK(cfg.connection.default_database == "postgres");
        CHECK(cfg.server_command == std::vector<std::string>{"node", "build/index.js"});
        CHECK_FALSE(cfg.working_dir);
        CHECK(cfg.call_timeout_ms == 10'000);
        CHECK(cfg.max_discarded_lines == 0U);
    }

    TEST_CASE("001: env file parsing", "[001][config][env]") {
        std::istringstream in{
                "# database settings\n"
                "\n"
                "PG_USER=admin\n"
                "export PG_HOST = db.internal\n"
                "PG_PASSWORD=\"s3cret word\"\n"
                "DB_NAME='analytics'\n"
                "not a pair\n"
                "=orphan\n"
                "PG_USER=override\n"};

        auto entries = parse_env_file(in);
        REQUIRE(entries.size() == 5U);
        CHECK(entries[0] == std::pair<std::string, std::string>{"PG_USER", "admin"});
        CHECK(entries[1] == std::pair<std::string, std::string>{"PG_HOST", "db.internal"});
        CHECK(entries[2] == std::pair<std::string, std::string>{"PG_PASSWORD", "s3cret word"});
        CHECK(entries[3] == std::pair<std::string, std::string>{"DB_NAME", "analytics"});
        CHECK(entries[4] == std::pair<std::string, std::string>{"PG_USER", "override"});
    }

    TEST_CASE("001: missing env file yields no entries", "[001][config][env]") {
        detail::temp_dir temp{"pgmcp_env_missing"};
        CHECK(read_env_file(temp.path / "absent.env").empty());

        detail::write_file(temp.path / "present.env", "PG_PORT=6543\n");
        auto entries = read_env_file(temp.path / "present.env");
        REQUIRE(entries.size() == 1U);
        CHECK(entries[0].second == "6543");
    }

    TEST_CASE("001: apply_environment overrides connection and server settings", "[001][config][env]") {
        client_config cfg{};
        apply_environment(
                cfg,
                detail::lookup_from({
                        {"PG_USER", "admin"},
                        {"PG_PASSWORD", ""},
                        {"PG_HOST", "db.internal"},
                        {"PG_PORT", "6543"},
                        {"DB_NAME", "analytics"},
                        {"PGMCP_SERVER_COMMAND", "  node   /opt/pg-mcp/build/index.js "},
                        {"PGMCP_SERVER_CWD", "/opt/pg-mcp"},
                        {"PGMCP_TIMEOUT_MS", "2500"},
                }));

        CHECK(cfg.connection.user == "admin");
        CHECK(cfg.connection.password.empty());
        CHECK(cfg.connection.host == "db.internal");
        CHECK(cfg.connection.port == "6543");
        CHECK(cfg.connection.default_database == "analytics");
        CHECK(cfg.server_command == std::vector<std::string>{"node", "/opt/pg-mcp/build/index.js"});
        REQUIRE(cfg.working_dir);
        CHECK(*cfg.working_dir == "/opt/pg-mcp");
        CHECK(cfg.call_timeout_ms == 2500);
    }

    TEST_CASE("001: blank values keep defaults", "[001][config][env]") {
        client_config cfg{};
        apply_environment(cfg, detail::lookup_from({{"PG_USER", "  "}, {"DB_NAME", ""}, {"PG_PORT", ""}}));
        CHECK(cfg.connection.user == "postgres");
        CHECK(cfg.connection.default_database == "postgres");
        CHECK(cfg.connection.port == "5432");
    }

    TEST_CASE("001: malformed numeric settings are rejected", "[001][config][env]") {
        SECTION("port out of range") {
            client_config cfg{};
            CHECK_THROWS_AS(apply_environment(cfg, detail::lookup_from({{"PG_PORT", "70000"}})), config_error);
        }

        SECTION("port not a number") {
            client_config cfg{};
            CHECK_THROWS_AS(apply_environment(cfg, detail::lookup_from({{"PG_PORT", "postgres"}})), config_error);
        }

        SECTION("timeout must be positive") {
            client_config cfg{};
            CHECK_THROWS_AS(apply_environment(cfg, detail::lookup_from({{"PGMCP_TIMEOUT_MS", "0"}})), config_error);
            CHECK_THROWS_AS(
                    apply_environment(cfg, detail::lookup_from({{"PGMCP_TIMEOUT_MS", "10s"}})), config_error);
        }
    }

    TEST_CASE("001: process environment wins over file entries", "[001][config][env]") {
        REQUIRE(::setenv("PGMCP_TEST_LAYERED", "from-process", 1) == 0);
        auto lookup = layered_env({
                {"PGMCP_TEST_LAYERED", "from-file"},
                {"PGMCP_TEST_FILE_ONLY", "first"},
                {"PGMCP_TEST_FILE_ONLY", "second"},
        });

        CHECK(lookup("PGMCP_TEST_LAYERED"sv) == std::optional<std::string>{"from-process"});
        CHECK(lookup("PGMCP_TEST_FILE_ONLY"sv) == std::optional<std::string>{"second"});
        CHECK_FALSE(lookup("PGMCP_TEST_ABSENT"sv));

        REQUIRE(::unsetenv("PGMCP_TEST_LAYERED") == 0);
    }

}  // namespace pgmcp::test
