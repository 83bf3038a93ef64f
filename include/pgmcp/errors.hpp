#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace pgmcp {

    // Base for every transport failure raised by the client.
    struct mcp_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // The child could not be started: bad executable, permissions, working directory, pipe/fork failure.
    class spawn_error : public mcp_error {
      public:
        spawn_error(std::vector<std::string> command, int error_code, const std::string& message);

        const std::vector<std::string>& command() const noexcept { return command_; }
        int error_code() const noexcept { return error_code_; }

      private:
        std::vector<std::string> command_{};
        int error_code_{};
    };

    // No matching response before the deadline. The child is left running.
    class timeout_error : public mcp_error {
      public:
        timeout_error(std::string tool_name, std::chrono::milliseconds elapsed);

        const std::string& tool_name() const noexcept { return tool_name_; }
        std::chrono::milliseconds elapsed() const noexcept { return elapsed_; }

      private:
        std::string tool_name_{};
        std::chrono::milliseconds elapsed_{};
    };

    // The child's output ended (or its input refused writes) before a matching response arrived.
    class stream_closed_error : public mcp_error {
      public:
        stream_closed_error(std::string tool_name, std::int64_t request_id);

        const std::string& tool_name() const noexcept { return tool_name_; }
        std::int64_t request_id() const noexcept { return request_id_; }

      private:
        std::string tool_name_{};
        std::int64_t request_id_{};
    };

    // Request could not be encoded, or the child exceeded the discarded-line cap.
    struct protocol_error : mcp_error {
        using mcp_error::mcp_error;
    };

    struct config_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

}  // namespace pgmcp
