#include "pgmcp/resolver.hpp"

using namespace pgmcp::literals;

namespace pgmcp {

    namespace detail {

        // bytes of multi-byte UTF-8 sequences count as identifier characters, so `café` stays whole
        static constexpr bool is_ident_char(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-' ||
                   static_cast<unsigned char>(c) >= 0x80;
        }

        static constexpr std::string_view leading_identifier(std::string_view text) {
            size_t n = 0;
            while (n < text.size() && is_ident_char(text[n])) {
                ++n;
            }
            return text.substr(0, n);
        }

        std::optional<std::string_view> created_database(std::string_view sql) {
            static constexpr auto phrase = "create database"sv;

            for (auto pos = utils::find_case_insensitive(sql, phrase); pos != std::string_view::npos;
                 pos = utils::find_case_insensitive(sql, phrase, pos + 1U)) {
                auto rest = sql.substr(pos + phrase.size());

                size_t gap = 0;
                while (gap < rest.size() && utils::is_space(rest[gap])) {
                    ++gap;
                }
                if (gap == 0) {
                    continue;
                }

                if (auto ident = leading_identifier(rest.substr(gap)); !ident.empty()) {
                    return ident;
                }
            }
            return std::nullopt;
        }

        std::optional<std::string_view> dbname_parameter(std::string_view connection_string) {
            static constexpr auto key = "dbname="sv;

            for (auto pos = connection_string.find(key); pos != std::string_view::npos;
                 pos = connection_string.find(key, pos + 1U)) {
                if (auto ident = leading_identifier(connection_string.substr(pos + key.size())); !ident.empty()) {
                    return ident;
                }
            }
            return std::nullopt;
        }

    }  // namespace detail

    std::string connection_target::uri() const {
        return "{}{}:{}@{}:{}/{}"_format(connection_uri_scheme, user, password, host, port, database);
    }

    std::string resolve_database_name(const raw_arguments& args, std::string_view default_database) {
        if (auto sql = string_field(args, "sql"sv)) {
            if (auto created = detail::created_database(*sql)) {
                return std::string{*created};
            }
        }

        if (auto conn = string_field(args, "connectionString"sv)) {
            if (auto dbname = detail::dbname_parameter(*conn)) {
                return std::string{*dbname};
            }

            auto trimmed = utils::trim_view(*conn);
            if (!trimmed.empty() && !trimmed.starts_with(connection_uri_scheme)) {
                return std::string{trimmed};
            }
        }

        return std::string{default_database};
    }

    connection_target resolve_connection(const raw_arguments& args, const connection_config& cfg) {
        return connection_target{
                .host = cfg.host,
                .port = cfg.port,
                .user = cfg.user,
                .password = cfg.password,
                .database = resolve_database_name(args, cfg.default_database),
        };
    }

}  // namespace pgmcp
