#include "pgmcp/process.hpp"

#include "pgmcp/errors.hpp"
#include "pgmcp/utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>

using namespace pgmcp::literals;

namespace pgmcp {

    namespace detail {

        static void close_fd(int& fd) noexcept {
            if (fd >= 0) {
                ::close(fd);
            }
            fd = -1;
        }

        static void close_pipe(int (&fds)[2]) noexcept {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }

        static bool open_pipe(int (&fds)[2]) noexcept {
            if (::pipe(fds) != 0) {
                return false;
            }
            return ::fcntl(fds[0], F_SETFD, FD_CLOEXEC) == 0 && ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) == 0;
        }

        // Writes to a dead child must surface as EPIPE rather than terminate the client.
        static void ignore_sigpipe() {
            static const bool ignored = [] {
                ::signal(SIGPIPE, SIG_IGN);
                return true;
            }();
            (void)ignored;
        }

        enum class spawn_stage : int { chdir = 1, exec = 2 };

        struct spawn_failure {
            spawn_stage stage{};
            int error{};
        };

        [[noreturn]] static void child_fail(int status_fd, spawn_stage stage, int err) {
            spawn_failure failure{.stage = stage, .error = err};
            auto remaining = sizeof(failure);
            auto* p = reinterpret_cast<const char*>(&failure);
            while (remaining > 0) {
                auto n = ::write(status_fd, p, remaining);
                if (n <= 0) {
                    break;
                }
                p += n;
                remaining -= static_cast<size_t>(n);
            }
            _exit(127);
        }

        static std::string drain_fd_nonblocking(int fd) {
            std::string buf{};
            if (fd < 0) {
                return buf;
            }
            char chunk[4096]{};
            for (;;) {
                pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
                if (::poll(&pfd, 1, 0) <= 0) {
                    break;
                }
                auto n = ::read(fd, chunk, sizeof(chunk));
                if (n <= 0) {
                    break;
                }
                buf.append(chunk, static_cast<size_t>(n));
            }
            return buf;
        }

    }  // namespace detail

    process_supervisor::process_supervisor(process_options opts) : opts_{std::move(opts)} {}

    process_supervisor::~process_supervisor() {
        shutdown();
    }

    bool process_supervisor::ensure_running() {
        if (child_.pid > 0 && !child_.output_closed && running()) {
            return false;
        }

        if (child_.pid > 0 || child_.stdin_fd >= 0 || child_.stdout_fd >= 0) {
            debug_log("server process unusable (pid ", child_.pid, "), respawning");
            shutdown();
        }

        spawn();
        return true;
    }

    bool process_supervisor::running() {
        if (child_.pid <= 0) {
            return false;
        }

        int status = 0;
        auto ret = ::waitpid(child_.pid, &status, WNOHANG);
        if (ret == 0) {
            return true;
        }
        if (ret < 0 && errno == EINTR) {
            return true;
        }

        if (ret == child_.pid) {
            if (WIFEXITED(status)) {
                debug_log("server process ", child_.pid, " exited with status ", WEXITSTATUS(status));
            }
            else if (WIFSIGNALED(status)) {
                debug_log("server process ", child_.pid, " killed by signal ", WTERMSIG(status));
            }
        }
        child_.pid = -1;
        return false;
    }

    void process_supervisor::spawn() {
        if (opts_.command.empty()) {
            throw spawn_error{opts_.command, EINVAL, "no server command configured"};
        }

        detail::ignore_sigpipe();

        int in_pipe[2]{-1, -1};
        int out_pipe[2]{-1, -1};
        int err_pipe[2]{-1, -1};
        int status_pipe[2]{-1, -1};

        auto close_all = [&]() noexcept {
            detail::close_pipe(in_pipe);
            detail::close_pipe(out_pipe);
            detail::close_pipe(err_pipe);
            detail::close_pipe(status_pipe);
        };

        // every end is close-on-exec; the child only keeps what dup2 puts on 0, 1 and 2
        if (!detail::open_pipe(in_pipe) || !detail::open_pipe(out_pipe) || !detail::open_pipe(err_pipe) ||
            !detail::open_pipe(status_pipe)) {
            int err = errno;
            close_all();
            throw spawn_error{opts_.command, err, "pipe() failed: {}"_format(std::strerror(err))};
        }

        // built before fork; the child only makes async-signal-safe calls
        std::vector<char*> argv{};
        argv.reserve(opts_.command.size() + 1);
        for (auto& arg : opts_.command) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        std::string cwd{};
        if (opts_.working_dir) {
            cwd = opts_.working_dir->string();
        }

        auto pid = ::fork();
        if (pid < 0) {
            int err = errno;
            close_all();
            throw spawn_error{opts_.command, err, "fork() failed: {}"_format(std::strerror(err))};
        }

        if (pid == 0) {
            ::dup2(in_pipe[0], STDIN_FILENO);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
            ::signal(SIGPIPE, SIG_DFL);

            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
                detail::child_fail(status_pipe[1], detail::spawn_stage::chdir, errno);
            }
            ::execvp(argv[0], argv.data());
            detail::child_fail(status_pipe[1], detail::spawn_stage::exec, errno);
        }

        // parent
        detail::close_fd(in_pipe[0]);
        detail::close_fd(out_pipe[1]);
        detail::close_fd(err_pipe[1]);
        detail::close_fd(status_pipe[1]);

        // EOF on the status pipe means exec succeeded (close-on-exec)
        detail::spawn_failure failure{};
        ssize_t n = 0;
        do {
            n = ::read(status_pipe[0], &failure, sizeof(failure));
        } while (n < 0 && errno == EINTR);
        detail::close_fd(status_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(failure))) {
            while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
            close_all();
            if (failure.stage == detail::spawn_stage::chdir) {
                throw spawn_error{
                        opts_.command,
                        failure.error,
                        "working directory {}: {}"_format(cwd, std::strerror(failure.error))};
            }
            throw spawn_error{opts_.command, failure.error, std::strerror(failure.error)};
        }

        child_ = child_process{
                .pid = pid,
                .stdin_fd = in_pipe[1],
                .stdout_fd = out_pipe[0],
                .stderr_fd = err_pipe[0],
                .output_closed = false,
        };
        ++spawn_count_;

        debug_log("spawned server process ", pid, ": ", utils::join_with_separator(opts_.command, " "));
    }

    void process_supervisor::shutdown() noexcept {
        detail::close_fd(child_.stdin_fd);

        if (child_.pid > 0) {
            auto pid = child_.pid;
            ::kill(pid, SIGTERM);

            bool reaped = false;
            auto deadline = std::chrono::steady_clock::now() + opts_.shutdown_grace;
            for (;;) {
                auto ret = ::waitpid(pid, nullptr, WNOHANG);
                if (ret == pid || (ret < 0 && errno != EINTR)) {
                    reaped = true;
                    break;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }

            if (!reaped) {
                debug_log("server process ", pid, " ignored SIGTERM, killing");
                ::kill(pid, SIGKILL);
                while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
            }
        }

        if (auto diag = detail::drain_fd_nonblocking(child_.stderr_fd); !diag.empty()) {
            debug_log("server stderr: ", diag);
        }

        detail::close_fd(child_.stdout_fd);
        detail::close_fd(child_.stderr_fd);
        child_ = child_process{};
    }

    std::string process_supervisor::drain_diagnostics() {
        return detail::drain_fd_nonblocking(child_.stderr_fd);
    }

}  // namespace pgmcp
