#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        pgmcp::startup_config cfg{};
        pgmcp::cli::invocation inv{};
        if (auto cli_result = pgmcp::cli::parse_cli(argc, argv, cfg, inv)) {
            return *cli_result;
        }

        if (inv.list_tools) {
            return pgmcp::cli::run_list_tools(cfg);
        }
        if (inv.tool) {
            return pgmcp::cli::run_call(cfg, inv);
        }
        return pgmcp::cli::run_repl(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
