#pragma once

#include "pgmcp.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace pgmcp::test::detail {

    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    inline std::string read_file(const fs::path& p) {
        std::ifstream in{p};
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline fs::path write_script(const fs::path& dir, std::string_view name, std::string_view body) {
        auto path = dir / name;
        write_file(path, body);
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
        return path;
    }

    inline raw_arguments args_of(std::string_view json) {
        auto args = parse_arguments(json);
        REQUIRE(args);
        return std::move(*args);
    }

    /*
     * Fake MCP server. Requests are appended to the log file given as $1 (if any); each start appends
     * a line to the file given as $2 (if any). Tool behaviour:
     *   pg_fail  -> JSON-RPC error response
     *   slow     -> answers after one second
     *   noisy    -> log chatter, a stale id and a notification before the answer
     *   crash    -> exits without answering
     *   chatty   -> writes 128KiB to stderr before answering
     *   anything else -> text content holding the request line verbatim
     */
    inline constexpr auto responder_script = R"(#!/bin/sh
log="$1"
if [ -n "$2" ]; then
  echo started >> "$2"
fi
while IFS= read -r line; do
  if [ -n "$log" ]; then
    printf '%s\n' "$line" >> "$log"
  fi
  id=$(printf '%s\n' "$line" | sed -n 's/.*"id":\([0-9][0-9]*\)[,}].*/\1/p')
  if [ -z "$id" ]; then
    continue
  fi
  case "$line" in
    *'"method":"initialize"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"protocolVersion":"2024-11-05","capabilities":{},"serverInfo":{"name":"fake","version":"1"}}}\n' "$id"
      ;;
    *'"method":"tools/list"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"tools":[{"name":"pg_manage_users","description":"Manage users"},{"name":"pg_execute_sql"}]}}\n' "$id"
      ;;
    *'"name":"pg_fail"'*)
      printf '{"jsonrpc":"2.0","id":%s,"error":{"code":-32601,"message":"Unknown tool"}}\n' "$id"
      ;;
    *'"name":"slow"'*)
      sleep 1
      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"slow"}]}}\n' "$id"
      ;;
    *'"name":"noisy"'*)
      echo "server starting"
      echo '{"jsonrpc":"2.0","id":0,"result":{}}'
      echo '{"jsonrpc":"2.0","method":"notifications/message","params":{}}'
      echo '[1,2,3]'
      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"quiet now"}]}}\n' "$id"
      ;;
    *'"name":"chatty"'*)
      yes 'checkpoint starting: time' | head -c 131072 >&2
      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"done talking"}]}}\n' "$id"
      ;;
    *'"name":"crash"'*)
      echo "going down" >&2
      exit 3
      ;;
    *)
      esc=$(printf '%s' "$line" | sed 's/\\/\\\\/g; s/"/\\"/g')
      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"%s"}]}}\n' "$id" "$esc"
      ;;
  esac
done
)";

    // Reports whether another request was already waiting on stdin while one was being served.
    inline constexpr auto overlap_script = R"(#!/bin/bash
while IFS= read -r line; do
  id=$(printf '%s\n' "$line" | sed -n 's/.*"id":\([0-9][0-9]*\)[,}].*/\1/p')
  if [ -z "$id" ]; then
    continue
  fi
  sleep 0.05
  if read -t 0; then
    state=overlap
  else
    state=clean
  fi
  printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"%s"}]}}\n' "$id" "$state"
done
)";

    inline client_config script_config(const fs::path& script, std::optional<fs::path> log = std::nullopt) {
        client_config cfg{};
        cfg.server_command = {"/bin/sh", script.string()};
        if (log) {
            cfg.server_command.push_back(log->string());
        }
        cfg.call_timeout_ms = 5'000;
        cfg.shutdown_grace_ms = 500;
        cfg.poll_backoff_ms = 10;
        return cfg;
    }

    // Blocking pipe pair owned by a test; [0] read end, [1] write end.
    struct test_pipe {
        int fds[2]{-1, -1};

        test_pipe() { REQUIRE(::pipe(fds) == 0); }

        ~test_pipe() {
            close_read();
            close_write();
        }

        test_pipe(const test_pipe&) = delete;
        test_pipe& operator=(const test_pipe&) = delete;

        int read_end() const { return fds[0]; }
        int write_end() const { return fds[1]; }

        void close_read() {
            if (fds[0] >= 0) {
                ::close(fds[0]);
            }
            fds[0] = -1;
        }

        void close_write() {
            if (fds[1] >= 0) {
                ::close(fds[1]);
            }
            fds[1] = -1;
        }

        void write(std::string_view data) {
            auto n = ::write(fds[1], data.data(), data.size());
            REQUIRE(n == static_cast<ssize_t>(data.size()));
        }

        // Whatever is currently buffered, without blocking.
        std::string drain() {
            std::string out{};
            char chunk[4096]{};
            for (;;) {
                pollfd pfd{.fd = fds[0], .events = POLLIN, .revents = 0};
                if (::poll(&pfd, 1, 0) <= 0) {
                    break;
                }
                auto n = ::read(fds[0], chunk, sizeof(chunk));
                if (n <= 0) {
                    break;
                }
                out.append(chunk, static_cast<size_t>(n));
            }
            return out;
        }
    };

    inline bool pid_alive(pid_t pid) {
        return pid > 0 && ::kill(pid, 0) == 0;
    }

}  // namespace pgmcp::test::detail
