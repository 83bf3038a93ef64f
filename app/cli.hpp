#pragma once

#include "pgmcp.hpp"

#include <optional>
#include <string>

namespace pgmcp::cli {

    // Positional part of the command line: `pgmcp <tool> [json]`.
    struct invocation {
        std::optional<std::string> tool{};
        std::string arguments_json{"{}"};
        bool list_tools{false};
    };

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, invocation& inv);
    int run_call(const startup_config& cfg, const invocation& inv);
    int run_list_tools(const startup_config& cfg);
    int run_repl(startup_config& cfg);

}  // namespace pgmcp::cli
