#include "pgmcp/client.hpp"

#include "pgmcp/errors.hpp"
#include "pgmcp/resolver.hpp"
#include "pgmcp/utils.hpp"

#include <utility>

using namespace pgmcp::literals;

namespace pgmcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct tool_call_params {
            std::string name{};
            raw_arguments arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object("name", &T::name, "arguments", &T::arguments);
            };
        };

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{};
            raw_arguments capabilities{};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "clientInfo",
                        &T::clientInfo);
            };
        };

        struct text_content_item {
            std::string type{};
            std::string text{};
            struct glaze {
                using T = text_content_item;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content_item> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        static constexpr auto tolerant = glz::opts{.error_on_unknown_keys = false};

        template <typename T>
        static glz::raw_json to_raw(const T& value) {
            std::string out{};
            if (auto ec = glz::write_json(value, out)) {
                throw protocol_error{"failed to encode request params: {}"_format(glz::format_error(ec, out))};
            }
            return glz::raw_json{std::move(out)};
        }

        static std::optional<tool_call_result> read_tool_result(const response& resp) {
            if (!resp.result) {
                return std::nullopt;
            }
            tool_call_result result{};
            if (auto ec = glz::read<tolerant>(result, resp.result->str)) {
                return std::nullopt;
            }
            return result;
        }

    }  // namespace detail

    mcp_client::mcp_client(client_config cfg)
            : cfg_{std::move(cfg)},
              supervisor_{process_options{
                      .command = cfg_.server_command,
                      .working_dir = cfg_.working_dir,
                      .shutdown_grace = std::chrono::milliseconds{cfg_.shutdown_grace_ms},
              }},
              channel_{channel_options{
                      .poll_backoff = std::chrono::milliseconds{cfg_.poll_backoff_ms},
                      .max_discarded_lines = cfg_.max_discarded_lines,
              }} {}

    response mcp_client::call(std::string_view tool_name, raw_arguments arguments, std::chrono::milliseconds timeout) {
        std::lock_guard lock{call_mutex_};

        // caller-supplied connection strings are hints only; the server always gets ours
        auto target = resolve_connection(arguments, cfg_.connection);
        arguments["connectionString"] = target.uri();
        debug_log("`", tool_name, "` targets database ", target.database);

        prepare_server(timeout);

        detail::tool_call_params params{.name = std::string{tool_name}, .arguments = std::move(arguments)};
        return round_trip("tools/call", detail::to_raw(params), tool_name, timeout);
    }

    response mcp_client::call(std::string_view tool_name, raw_arguments arguments) {
        return call(tool_name, std::move(arguments), std::chrono::milliseconds{cfg_.call_timeout_ms});
    }

    response mcp_client::list_tools(std::chrono::milliseconds timeout) {
        std::lock_guard lock{call_mutex_};
        prepare_server(timeout);
        return round_trip("tools/list", glz::raw_json{"{}"}, "tools/list", timeout);
    }

    void mcp_client::close() {
        std::lock_guard lock{call_mutex_};
        supervisor_.shutdown();
        channel_.reset();
    }

    std::int64_t mcp_client::last_request_id() const {
        std::lock_guard lock{call_mutex_};
        return next_id_ - 1;
    }

    std::size_t mcp_client::spawn_count() const {
        std::lock_guard lock{call_mutex_};
        return supervisor_.spawn_count();
    }

    void mcp_client::prepare_server(std::chrono::milliseconds timeout) {
        if (!supervisor_.ensure_running()) {
            return;
        }
        channel_.reset();

        if (!cfg_.initialize_on_spawn) {
            return;
        }

        detail::initialize_params params{
                .protocolVersion = std::string{mcp_protocol_version},
                .capabilities = {},
                .clientInfo = detail::client_info{.name = "pgmcp", .version = "0.1.0"},
        };
        auto resp = round_trip("initialize", detail::to_raw(params), "initialize", timeout);
        if (resp.is_error()) {
            throw protocol_error{"server rejected initialize: {}"_format(error_message(resp))};
        }

        try {
            channel_.notify(supervisor_.stdin_fd(), "notifications/initialized");
        } catch (const stream_closed_error&) {
            supervisor_.mark_output_closed();
            throw;
        }
    }

    response mcp_client::round_trip(
            std::string_view method, glz::raw_json params, std::string_view label, std::chrono::milliseconds timeout) {
        rpc_request request{};
        request.id = next_id_++;
        request.method = method;
        request.params = std::move(params);

        try {
            auto resp = channel_.send_and_wait(
                    supervisor_.stdin_fd(), supervisor_.stdout_fd(), supervisor_.stderr_fd(), request, label, timeout);
            if (auto diag = supervisor_.drain_diagnostics(); !diag.empty()) {
                debug_log("server stderr: ", diag);
            }
            return resp;
        } catch (const stream_closed_error&) {
            // the next ensure_running() replaces this child
            supervisor_.mark_output_closed();
            throw;
        }
    }

    std::vector<std::string> text_content(const response& resp) {
        std::vector<std::string> out{};
        if (auto result = detail::read_tool_result(resp)) {
            for (auto& item : result->content) {
                if (item.type == "text"sv) {
                    out.push_back(std::move(item.text));
                }
            }
        }
        return out;
    }

    bool tool_reported_error(const response& resp) {
        auto result = detail::read_tool_result(resp);
        return result && result->isError;
    }

    std::string error_message(const response& resp) {
        if (!resp.error) {
            return {};
        }
        auto code = static_cast<int>(resp.error->code);
        if (resp.error->message.empty()) {
            return "error code {}"_format(code);
        }
        return "{} (code {})"_format(resp.error->message, code);
    }

}  // namespace pgmcp
