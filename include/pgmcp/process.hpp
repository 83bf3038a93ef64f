#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pgmcp {

    struct process_options {
        std::vector<std::string> command{};
        std::optional<std::filesystem::path> working_dir{};
        std::chrono::milliseconds shutdown_grace{5'000};
    };

    struct child_process {
        pid_t pid{-1};
        int stdin_fd{-1};
        int stdout_fd{-1};
        int stderr_fd{-1};
        bool output_closed{false};
    };

    /*
     * Owns at most one MCP server child. stdin/stdout are pipes carrying the protocol; stderr is a
     * separate pipe drained for diagnostics only. The destructor performs `shutdown()`.
     */
    class process_supervisor {
      public:
        explicit process_supervisor(process_options opts);
        ~process_supervisor();

        process_supervisor(const process_supervisor&) = delete;
        process_supervisor& operator=(const process_supervisor&) = delete;

        // Spawns when there is no child, it exited, or its output was seen closed. Returns true if a
        // new child was started. Throws spawn_error.
        bool ensure_running();

        // Close stdin, SIGTERM, wait up to the grace period, then SIGKILL. Never throws.
        void shutdown() noexcept;

        // Reaps the child if it has exited.
        bool running();

        // Marks the current child unusable; the next ensure_running() replaces it.
        void mark_output_closed() noexcept { child_.output_closed = true; }

        // Whatever the child has written to stderr so far, without blocking.
        std::string drain_diagnostics();

        pid_t pid() const noexcept { return child_.pid; }
        int stdin_fd() const noexcept { return child_.stdin_fd; }
        int stdout_fd() const noexcept { return child_.stdout_fd; }
        int stderr_fd() const noexcept { return child_.stderr_fd; }
        std::size_t spawn_count() const noexcept { return spawn_count_; }
        const process_options& options() const noexcept { return opts_; }

      private:
        void spawn();

        process_options opts_{};
        child_process child_{};
        std::size_t spawn_count_{0};
    };

}  // namespace pgmcp
