#pragma once

#include "utils.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pgmcp {

    using namespace std::string_view_literals;

    /*
     * pgmcp Config Options
     *
     * Connection template (environment: PG_USER, PG_PASSWORD, PG_HOST, PG_PORT, DB_NAME)
     * - user/password/host/port: substituted into every connection string sent to the server.
     * - default_database: database used when the call arguments carry no usable hint.
     *
     * Server process
     * - server_command: interpreter and entry script of the MCP server (PGMCP_SERVER_COMMAND,
     *   whitespace separated).
     * - working_dir: working directory for the server (PGMCP_SERVER_CWD).
     * - initialize_on_spawn: run the MCP initialize handshake after each spawn.
     *
     * Call behaviour
     * - call_timeout_ms: default bound on one request/response cycle (PGMCP_TIMEOUT_MS).
     * - shutdown_grace_ms: wait after SIGTERM before SIGKILL.
     * - poll_backoff_ms: longest single wait between read attempts.
     * - max_discarded_lines: non-matching lines tolerated per call, 0 for no cap.
     *
     * Executable only
     * - env_file: dotenv file merged under the process environment.
     * - history_file/history_enabled: REPL history.
     * - color/output: terminal color and result rendering.
     * - quiet/verbose: coarse output verbosity.
     * - print_config: print resolved config and exit.
     */

    enum class output_mode { text, json };
    enum class color_mode { automatic, always, never };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::text:
                return "text"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "text"sv;
    }

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "text"sv)) {
            out = output_mode::text;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    struct connection_config {
        std::string user{"postgres"};
        std::string password{"mysecretpassword"};
        std::string host{"localhost"};
        std::string port{"5432"};
        std::string default_database{"postgres"};
    };

    struct client_config {
        connection_config connection{};

        std::vector<std::string> server_command{"node", "build/index.js"};
        std::optional<std::filesystem::path> working_dir{};
        bool initialize_on_spawn{false};

        int call_timeout_ms{10'000};
        int shutdown_grace_ms{5'000};
        int poll_backoff_ms{50};
        std::size_t max_discarded_lines{0};
    };

    struct startup_config {
        client_config client{};

        std::filesystem::path env_file{".env"};
        std::filesystem::path history_file{".pgmcp_history"};
        bool history_enabled{true};
        color_mode color{color_mode::automatic};
        output_mode output{output_mode::text};
        bool quiet{false};
        bool verbose{false};
        bool print_config{false};
    };

    using env_entries = std::vector<std::pair<std::string, std::string>>;
    using env_lookup = std::function<std::optional<std::string>(std::string_view)>;

    // KEY=VALUE lines; blank lines and '#' comments skipped, "export " prefix and matching quotes stripped.
    env_entries parse_env_file(std::istream& in);
    env_entries read_env_file(const std::filesystem::path& path);

    std::optional<std::string> process_env(std::string_view name);

    // Process environment first, then the file entries.
    env_lookup layered_env(env_entries file_entries);

    // Throws config_error on malformed numeric values.
    void apply_environment(client_config& cfg, const env_lookup& lookup);

}  // namespace pgmcp
