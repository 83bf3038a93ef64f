#include "pgmcp/config.hpp"

#include "pgmcp/errors.hpp"

#include <cstdlib>
#include <fstream>

using namespace pgmcp::literals;

namespace pgmcp {

    namespace detail {

        static std::string_view strip_quotes(std::string_view value) {
            if (value.size() >= 2U) {
                auto front = value.front();
                if ((front == '"' || front == '\'') && value.back() == front) {
                    return value.substr(1U, value.size() - 2U);
                }
            }
            return value;
        }

        static int parse_positive_ms(std::string_view name, std::string_view text) {
            auto value = utils::parse_arithmetic<int>(utils::trim_view(text));
            if (!value || *value <= 0) {
                throw config_error{"invalid {}: `{}` (expected a positive integer of milliseconds)"_format(name, text)};
            }
            return *value;
        }

        static std::optional<std::string> non_empty(const env_lookup& lookup, std::string_view name) {
            auto value = lookup(name);
            if (!value) {
                return std::nullopt;
            }
            auto trimmed = utils::trim_view(*value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string{trimmed};
        }

    }  // namespace detail

    env_entries parse_env_file(std::istream& in) {
        env_entries entries{};
        std::string line{};
        while (std::getline(in, line)) {
            auto view = utils::trim_view(line);
            if (view.empty() || view.front() == '#') {
                continue;
            }
            if (view.starts_with("export "sv)) {
                view = utils::trim_view(view.substr(7U));
            }

            auto eq = view.find('=');
            if (eq == std::string_view::npos) {
                continue;
            }

            auto key = utils::trim_view(view.substr(0, eq));
            auto value = detail::strip_quotes(utils::trim_view(view.substr(eq + 1U)));
            if (key.empty()) {
                continue;
            }
            entries.emplace_back(std::string{key}, std::string{value});
        }
        return entries;
    }

    env_entries read_env_file(const std::filesystem::path& path) {
        std::ifstream in{path};
        if (!in) {
            return {};
        }
        return parse_env_file(in);
    }

    std::optional<std::string> process_env(std::string_view name) {
        std::string key{name};
        if (const char* value = std::getenv(key.c_str())) {
            return std::string{value};
        }
        return std::nullopt;
    }

    env_lookup layered_env(env_entries file_entries) {
        return [entries = std::move(file_entries)](std::string_view name) -> std::optional<std::string> {
            if (auto value = process_env(name)) {
                return value;
            }
            // later duplicates win, as when the file is sourced
            for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
                if (it->first == name) {
                    return it->second;
                }
            }
            return std::nullopt;
        };
    }

    void apply_environment(client_config& cfg, const env_lookup& lookup) {
        auto& conn = cfg.connection;
        if (auto v = detail::non_empty(lookup, "PG_USER"sv)) {
            conn.user = *v;
        }
        if (auto v = lookup("PG_PASSWORD"sv)) {
            conn.password = *v;
        }
        if (auto v = detail::non_empty(lookup, "PG_HOST"sv)) {
            conn.host = *v;
        }
        if (auto v = detail::non_empty(lookup, "PG_PORT"sv)) {
            if (!utils::parse_arithmetic<unsigned short>(*v)) {
                throw config_error{"invalid PG_PORT: `{}`"_format(*v)};
            }
            conn.port = *v;
        }
        if (auto v = detail::non_empty(lookup, "DB_NAME"sv)) {
            conn.default_database = *v;
        }

        if (auto v = detail::non_empty(lookup, "PGMCP_SERVER_COMMAND"sv)) {
            cfg.server_command = utils::split_whitespace(*v);
        }
        if (auto v = detail::non_empty(lookup, "PGMCP_SERVER_CWD"sv)) {
            cfg.working_dir = std::filesystem::path{*v};
        }
        if (auto v = detail::non_empty(lookup, "PGMCP_TIMEOUT_MS"sv)) {
            cfg.call_timeout_ms = detail::parse_positive_ms("PGMCP_TIMEOUT_MS"sv, *v);
        }
    }

}  // namespace pgmcp
