#include "pgmcp/errors.hpp"

#include "pgmcp/utils.hpp"

#include <utility>

using namespace pgmcp::literals;

namespace pgmcp {

    spawn_error::spawn_error(std::vector<std::string> command, int error_code, const std::string& message)
            : mcp_error{"failed to spawn `{}`: {}"_format(utils::join_with_separator(command, " "), message)},
              command_{std::move(command)},
              error_code_{error_code} {}

    timeout_error::timeout_error(std::string tool_name, std::chrono::milliseconds elapsed)
            : mcp_error{"no response to `{}` after {}ms"_format(tool_name, elapsed.count())},
              tool_name_{std::move(tool_name)},
              elapsed_{elapsed} {}

    stream_closed_error::stream_closed_error(std::string tool_name, std::int64_t request_id)
            : mcp_error{"server output closed before response to `{}` (id {})"_format(tool_name, request_id)},
              tool_name_{std::move(tool_name)},
              request_id_{request_id} {}

}  // namespace pgmcp
