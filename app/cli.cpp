#include "cli.hpp"

#include "../src/editor.hpp"

#include <CLI/CLI.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pgmcp::cli {

    namespace detail {

        using namespace std::string_view_literals;

        struct tool_definition {
            std::string name{};
            std::string description{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        static std::chrono::milliseconds call_timeout(const startup_config& cfg) {
            return std::chrono::milliseconds{cfg.client.call_timeout_ms};
        }

        static void print_config(const startup_config& cfg, std::ostream& os) {
            const auto& conn = cfg.client.connection;
            os << "user=" << conn.user << '\n';
            os << "password=" << (conn.password.empty() ? "<empty>" : "<set>") << '\n';
            os << "host=" << conn.host << '\n';
            os << "port=" << conn.port << '\n';
            os << "database=" << conn.default_database << '\n';
            os << "server=" << utils::join_with_separator(cfg.client.server_command, " ") << '\n';
            os << "cwd=" << (cfg.client.working_dir ? cfg.client.working_dir->string() : "<inherit>") << '\n';
            os << "timeout_ms=" << cfg.client.call_timeout_ms << '\n';
            os << "initialize=" << (cfg.client.initialize_on_spawn ? "true" : "false") << '\n';
            os << "env_file=" << cfg.env_file.string() << '\n';
            os << "output=" << to_string(cfg.output) << '\n';
            os << "color=" << to_string(cfg.color) << '\n';
        }

        static void print_response(const response& resp, output_mode mode, std::ostream& out, std::ostream& err) {
            if (mode == output_mode::json) {
                out << resp.line << '\n';
                return;
            }
            if (resp.is_error()) {
                err << "server error: " << error_message(resp) << '\n';
                return;
            }

            auto texts = text_content(resp);
            if (texts.empty()) {
                out << (resp.result ? resp.result->str : std::string{"(no result)"}) << '\n';
                return;
            }
            for (const auto& text : texts) {
                out << text << '\n';
            }
        }

        static int execute_tool(
                mcp_client& client,
                const startup_config& cfg,
                std::string_view tool,
                std::string_view arguments_json,
                std::ostream& out,
                std::ostream& err) {
            auto wire_name = catalog::wire_tool_name(tool);
            if (!wire_name) {
                err << "unknown tool: " << tool << " (see :tools)\n";
                return 2;
            }

            auto json_text = utils::trim_view(arguments_json);
            auto args = parse_arguments(json_text.empty() ? "{}"sv : json_text);
            if (!args) {
                err << "arguments must be a JSON object: " << json_text << '\n';
                return 2;
            }
            catalog::patch_arguments(tool, *args);

            if (cfg.verbose) {
                err << "calling " << *wire_name << " on database "
                    << resolve_database_name(*args, cfg.client.connection.default_database) << '\n';
            }

            try {
                auto resp = client.call(*wire_name, std::move(*args), call_timeout(cfg));
                print_response(resp, cfg.output, out, err);
                return resp.is_error() || tool_reported_error(resp) ? 1 : 0;
            } catch (const mcp_error& e) {
                err << "error: " << e.what() << '\n';
                return 1;
            }
        }

        static int list_tools(mcp_client& client, const startup_config& cfg, std::ostream& out, std::ostream& err) {
            try {
                auto resp = client.list_tools(call_timeout(cfg));
                if (cfg.output == output_mode::json) {
                    out << resp.line << '\n';
                    return resp.is_error() ? 1 : 0;
                }
                if (resp.is_error()) {
                    err << "server error: " << error_message(resp) << '\n';
                    return 1;
                }

                if (!resp.result) {
                    err << "tools/list returned no result\n";
                    return 1;
                }

                tools_list_result result{};
                if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(result, resp.result->str)) {
                    err << "unexpected tools/list result: " << resp.result->str << '\n';
                    return 1;
                }
                for (const auto& tool : result.tools) {
                    out << tool.name;
                    if (!tool.description.empty()) {
                        out << " - " << tool.description;
                    }
                    out << '\n';
                }
                return 0;
            } catch (const mcp_error& e) {
                err << "error: " << e.what() << '\n';
                return 1;
            }
        }

        static bool apply_set_command(
                startup_config& cfg, std::unique_ptr<mcp_client>& client, std::string_view assignment, std::ostream& err) {
            auto eq = assignment.find('=');
            if (eq == std::string_view::npos) {
                err << "invalid :set, expected key=value\n";
                return false;
            }

            auto key = utils::trim_view(assignment.substr(0, eq));
            auto value = utils::trim_view(assignment.substr(eq + 1U));
            if (key.empty() || value.empty()) {
                err << "invalid :set, key and value must be non-empty\n";
                return false;
            }

            if (key == "db"sv || key == "database"sv) {
                cfg.client.connection.default_database = std::string{value};
                // the client copies its config; replacing it also restarts the server
                client = std::make_unique<mcp_client>(cfg.client);
                return true;
            }

            if (key == "timeout"sv) {
                auto ms = utils::parse_arithmetic<int>(value);
                if (!ms || *ms <= 0) {
                    err << "invalid timeout: " << value << " (expected milliseconds > 0)\n";
                    return false;
                }
                cfg.client.call_timeout_ms = *ms;
                return true;
            }

            if (key == "output"sv) {
                if (!try_parse_output_mode(value, cfg.output)) {
                    err << "invalid output: " << value << " (expected text|json)\n";
                    return false;
                }
                return true;
            }

            err << "unknown :set key: " << key << '\n';
            return false;
        }

        static void print_help(std::ostream& os) {
            os << "usage:\n";
            os << "  <tool> [json-arguments]\n";
            os << "commands:\n";
            os << "  :help\n";
            os << "  :tools\n";
            os << "  :list\n";
            os << "  :show config\n";
            os << "  :set <key>=<value>\n";
            os << "  :restart\n";
            os << "  :quit\n";
            os << "examples:\n";
            os << "  manage_users {\"operation\":\"list\"}\n";
            os << "  execute_sql {\"sql\":\"CREATE DATABASE demo\"}\n";
            os << "  :set db=analytics\n";
            os << "  :set timeout=30000\n";
        }

        static void print_tools(std::ostream& os) {
            for (auto name : catalog::tool_names) {
                os << "  " << name << " -> " << catalog::wire_prefix << name << '\n';
            }
        }

        static void process_command(
                std::string_view cmd, startup_config& cfg, std::unique_ptr<mcp_client>& client, bool& should_quit) {
            if (cmd == ":quit"sv || cmd == ":q"sv) {
                should_quit = true;
                return;
            }
            if (cmd == ":help"sv) {
                print_help(std::cout);
                return;
            }
            if (cmd == ":tools"sv) {
                print_tools(std::cout);
                return;
            }
            if (cmd == ":list"sv) {
                (void)list_tools(*client, cfg, std::cout, std::cerr);
                return;
            }
            if (cmd == ":show config"sv || cmd == ":show"sv) {
                print_config(cfg, std::cout);
                return;
            }
            if (cmd == ":restart"sv) {
                client->close();
                std::cout << "server stopped, the next call starts a new one\n";
                return;
            }
            if (cmd.starts_with(":set "sv)) {
                auto assignment = utils::trim_view(cmd.substr(5U));
                if (apply_set_command(cfg, client, assignment, std::cerr)) {
                    std::cout << "updated " << assignment << '\n';
                }
                return;
            }
            std::cerr << "unknown command: " << cmd << '\n';
        }

    }  // namespace detail

    int run_call(const startup_config& cfg, const invocation& inv) {
        mcp_client client{cfg.client};
        return detail::execute_tool(client, cfg, *inv.tool, inv.arguments_json, std::cout, std::cerr);
    }

    int run_list_tools(const startup_config& cfg) {
        mcp_client client{cfg.client};
        return detail::list_tools(client, cfg, std::cout, std::cerr);
    }

    int run_repl(startup_config& cfg) {
        line_editor editor{cfg};
        auto client = std::make_unique<mcp_client>(cfg.client);
        bool should_quit = false;

        if (!cfg.quiet) {
            std::cout << "pgmcp repl\n";
            std::cout << "type :help for commands\n";
        }

        while (!should_quit) {
            auto line = editor.read_line("pgmcp> ");
            if (!line) {
                std::cout << '\n';
                break;
            }

            auto cmd = utils::trim_view(*line);
            if (cmd.empty()) {
                continue;
            }

            if (cmd.starts_with(':')) {
                detail::process_command(cmd, cfg, client, should_quit);
                continue;
            }

            auto split = cmd.find_first_of(" \t");
            auto tool = cmd.substr(0, split);
            auto rest = split == std::string_view::npos ? std::string_view{} : cmd.substr(split + 1U);
            (void)detail::execute_tool(*client, cfg, tool, rest, std::cout, std::cerr);
        }

        return 0;
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, invocation& inv) {
        CLI::App app{"pgmcp"};

        bool show_version = false;
        bool init_flag = false;
        bool no_history = false;
        bool no_color = false;
        int timeout_arg = 0;
        std::string tool_arg{};
        std::string server_cmd_arg{};
        std::string cwd_arg{};
        std::string db_arg{};
        std::string env_file_arg{cfg.env_file.string()};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string color_arg{std::string{to_string(cfg.color)}};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--server-cmd", server_cmd_arg, "MCP server command line (default: node build/index.js)");
        app.add_option("--cwd", cwd_arg, "Working directory for the MCP server");
        app.add_option("--timeout", timeout_arg, "Per-call timeout in milliseconds");
        app.add_option("--db", db_arg, "Database used when the arguments name none");
        app.add_option("--env-file", env_file_arg, "dotenv file with PG_* settings");
        app.add_flag("--init", init_flag, "Run the MCP initialize handshake after starting the server");
        app.add_flag("--list-tools", inv.list_tools, "Print the server's tools and exit");
        app.add_option("--output", output_arg, "Output mode: text|json");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", no_color, "Force color mode to never");
        app.add_flag("--no-history", no_history, "Do not persist REPL history");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");
        app.add_option("tool", tool_arg, "Tool to call, e.g. manage_users or pg_manage_users");
        app.add_option("args", inv.arguments_json, "Tool arguments as a JSON object");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "pgmcp 0.1.0\n";
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        cfg.env_file = env_file_arg;
        try {
            apply_environment(cfg.client, layered_env(read_env_file(cfg.env_file)));
        } catch (const config_error& e) {
            std::cerr << e.what() << '\n';
            return std::optional<int>{2};
        }

        if (!server_cmd_arg.empty()) {
            cfg.client.server_command = utils::split_whitespace(server_cmd_arg);
        }
        if (cfg.client.server_command.empty()) {
            std::cerr << "empty server command\n";
            return std::optional<int>{2};
        }
        if (!cwd_arg.empty()) {
            cfg.client.working_dir = std::filesystem::path{cwd_arg};
        }
        if (app.get_option("--timeout")->count() > 0U) {
            if (timeout_arg <= 0) {
                std::cerr << "invalid --timeout value: " << timeout_arg << " (expected milliseconds > 0)\n";
                return std::optional<int>{2};
            }
            cfg.client.call_timeout_ms = timeout_arg;
        }
        if (auto db = utils::trim_view(db_arg); !db.empty()) {
            cfg.client.connection.default_database = std::string{db};
        }
        if (init_flag) {
            cfg.client.initialize_on_spawn = true;
        }
        if (no_history) {
            cfg.history_enabled = false;
        }

        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected text|json)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{2};
        }
        if (no_color) {
            cfg.color = color_mode::never;
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (!tool_arg.empty()) {
            inv.tool = tool_arg;
        }

        return std::nullopt;
    }

}  // namespace pgmcp::cli
