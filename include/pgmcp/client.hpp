#pragma once

#include "channel.hpp"
#include "config.hpp"
#include "process.hpp"
#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace pgmcp {

    inline constexpr auto mcp_protocol_version = "2024-11-05"sv;

    /*
     * Client for one MCP server child. Every call resolves the target database from the arguments,
     * overwrites `connectionString` with the resolved URI, makes sure the server is alive and then
     * waits for the response carrying its id. One call is in flight at a time; concurrent callers
     * queue on the call mutex.
     */
    class mcp_client {
      public:
        explicit mcp_client(client_config cfg);
        ~mcp_client() = default;

        mcp_client(const mcp_client&) = delete;
        mcp_client& operator=(const mcp_client&) = delete;

        response call(std::string_view tool_name, raw_arguments arguments, std::chrono::milliseconds timeout);
        response call(std::string_view tool_name, raw_arguments arguments);

        response list_tools(std::chrono::milliseconds timeout);

        // Stops the server; the next call spawns a new one.
        void close();

        std::int64_t last_request_id() const;
        std::size_t spawn_count() const;
        const client_config& config() const noexcept { return cfg_; }

      private:
        void prepare_server(std::chrono::milliseconds timeout);
        response round_trip(std::string_view method, glz::raw_json params, std::string_view label,
                            std::chrono::milliseconds timeout);

        client_config cfg_{};
        mutable std::mutex call_mutex_{};
        process_supervisor supervisor_;
        call_channel channel_;
        std::int64_t next_id_{1};
    };

    // `text` entries of an MCP tool result's `content` array; empty if the result has another shape.
    std::vector<std::string> text_content(const response& resp);

    // Whether the tool result sets `isError`.
    bool tool_reported_error(const response& resp);

    // `error.message` and `error.code` of a JSON-RPC error response; empty without an error.
    std::string error_message(const response& resp);

}  // namespace pgmcp
