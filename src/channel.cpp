#include "pgmcp/channel.hpp"

#include "pgmcp/errors.hpp"
#include "pgmcp/utils.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>
#include <variant>

using namespace pgmcp::literals;

namespace pgmcp {

    namespace detail {

        // a notification carries no id, not even a null one
        struct notification {
            std::string jsonrpc{"2.0"};
            std::string method{};
            struct glaze {
                using T = notification;
                static constexpr auto value = glz::object("jsonrpc", &T::jsonrpc, "method", &T::method);
            };
        };

        static constexpr size_t log_preview_bytes = 200;

        static std::string_view preview(std::string_view line) {
            return line.substr(0, std::min(line.size(), log_preview_bytes));
        }

        static std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        }

        // `error` objects the typed read rejects, e.g. one whose `data` is not a string
        static std::optional<response> read_loose_error(std::string& buffer) {
            glz::generic doc{};
            if (auto ec = glz::read_json(doc, buffer); ec || !doc.is_object()) {
                return std::nullopt;
            }
            auto& obj = doc.get_object();
            auto id = obj.find("id");
            auto err = obj.find("error");
            if (id == obj.end() || !id->second.is_number() || err == obj.end() || !err->second.is_object()) {
                return std::nullopt;
            }
            auto number = id->second.get<double>();
            if (number != static_cast<double>(static_cast<std::int64_t>(number))) {
                return std::nullopt;
            }

            glz::rpc::error error{};
            auto& body = err->second.get_object();
            if (auto code = body.find("code"); code != body.end() && code->second.is_number()) {
                error.code = static_cast<glz::rpc::error_e>(static_cast<int>(code->second.get<double>()));
            }
            if (auto message = body.find("message"); message != body.end() && message->second.is_string()) {
                error.message = message->second.get<std::string>();
            }
            return response{
                    .id = static_cast<std::int64_t>(number),
                    .result = std::nullopt,
                    .error = std::move(error),
                    .line = std::move(buffer),
            };
        }

    }  // namespace detail

    std::string encode_request(const rpc_request& request) {
        std::string out{};
        if (auto ec = glz::write_json(request, out)) {
            throw protocol_error{"failed to encode `{}` request: {}"_format(request.method, glz::format_error(ec, out))};
        }
        out.push_back('\n');
        return out;
    }

    std::optional<response> parse_response_line(std::string_view line) {
        auto trimmed = utils::trim_view(line);
        if (trimmed.empty() || trimmed.front() != '{') {
            return std::nullopt;
        }

        std::string buffer{trimmed};
        glz::rpc::response_t<glz::raw_json> envelope{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(envelope, buffer)) {
            return detail::read_loose_error(buffer);
        }
        auto* id = std::get_if<std::int64_t>(&envelope.id);
        if (id == nullptr) {
            return std::nullopt;
        }

        return response{
                .id = *id,
                .result = std::move(envelope.result),
                .error = std::move(envelope.error),
                .line = std::move(buffer),
        };
    }

    call_channel::call_channel(channel_options opts) : opts_{opts} {
        if (opts_.poll_backoff <= std::chrono::milliseconds::zero()) {
            opts_.poll_backoff = std::chrono::milliseconds{1};
        }
    }

    void call_channel::write_line(int in_fd, std::string_view line, std::string_view label, std::int64_t id) {
        size_t offset = 0;
        while (offset < line.size()) {
            auto n = ::write(in_fd, line.data() + offset, line.size() - offset);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EPIPE) {
                    throw stream_closed_error{std::string{label}, id};
                }
                throw mcp_error{"write to server failed: {}"_format(std::strerror(errno))};
            }
            offset += static_cast<size_t>(n);
        }
    }

    std::optional<std::string> call_channel::take_line() {
        auto pos = buffer_.find('\n');
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    }

    void call_channel::discard(std::string_view line, std::size_t& discarded_this_call, std::string_view label) {
        if (utils::trim_view(line).empty()) {
            return;
        }
        ++discarded_this_call;
        ++discarded_total_;
        debug_log("discarding server line: ", detail::preview(line));

        if (opts_.max_discarded_lines > 0 && discarded_this_call > opts_.max_discarded_lines) {
            throw protocol_error{
                    "server emitted more than {} unmatched lines while waiting for `{}`"_format(
                            opts_.max_discarded_lines, label)};
        }
    }

    void call_channel::drain_stderr(int& err_fd) {
        char chunk[4096]{};
        auto n = ::read(err_fd, chunk, sizeof(chunk));
        if (n > 0) {
            debug_log("server stderr: ", std::string_view{chunk, static_cast<size_t>(n)});
            return;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            return;
        }
        // closed or unreadable; stop polling it for this call
        err_fd = -1;
    }

    response call_channel::send_and_wait(
            int in_fd,
            int out_fd,
            int err_fd,
            const rpc_request& request,
            std::string_view label,
            std::chrono::milliseconds timeout) {
        auto* request_id = std::get_if<std::int64_t>(&request.id);
        if (request_id == nullptr) {
            throw protocol_error{"`{}` request has no integer id to wait for"_format(request.method)};
        }
        auto id = *request_id;

        auto line = encode_request(request);
        debug_log("-> ", detail::preview(line));
        write_line(in_fd, line, label, id);

        auto start = std::chrono::steady_clock::now();
        auto deadline = start + timeout;
        std::size_t discarded = 0;

        for (;;) {
            while (auto next = take_line()) {
                if (auto resp = parse_response_line(*next); resp && resp->id == id) {
                    debug_log("<- ", detail::preview(resp->line));
                    return std::move(*resp);
                }
                discard(*next, discarded, label);
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
            if (remaining <= std::chrono::milliseconds::zero()) {
                throw timeout_error{std::string{label}, detail::elapsed_since(start)};
            }

            // poll() skips negative descriptors
            auto slice = std::min(remaining, opts_.poll_backoff);
            pollfd pfds[2]{
                    {.fd = out_fd, .events = POLLIN, .revents = 0},
                    {.fd = err_fd, .events = POLLIN, .revents = 0},
            };
            int ret = ::poll(pfds, 2, static_cast<int>(std::max<std::int64_t>(slice.count(), 1)));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw mcp_error{"poll on server output failed: {}"_format(std::strerror(errno))};
            }
            if (ret == 0) {
                continue;
            }
            if (err_fd >= 0 && pfds[1].revents != 0) {
                drain_stderr(err_fd);
            }
            if (pfds[0].revents == 0) {
                continue;
            }

            char chunk[4096]{};
            auto n = ::read(out_fd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                throw stream_closed_error{std::string{label}, id};
            }
            if (n == 0) {
                // an unterminated final line still counts
                if (!buffer_.empty()) {
                    auto tail = std::exchange(buffer_, {});
                    if (auto resp = parse_response_line(tail); resp && resp->id == id) {
                        return std::move(*resp);
                    }
                    discard(tail, discarded, label);
                }
                throw stream_closed_error{std::string{label}, id};
            }
            buffer_.append(chunk, static_cast<size_t>(n));
        }
    }

    void call_channel::notify(int in_fd, std::string_view method) {
        detail::notification note{.method = std::string{method}};
        std::string line{};
        if (auto ec = glz::write_json(note, line)) {
            throw protocol_error{"failed to encode `{}` notification: {}"_format(method, glz::format_error(ec, line))};
        }
        line.push_back('\n');
        debug_log("-> ", detail::preview(line));
        write_line(in_fd, line, method, 0);
    }

}  // namespace pgmcp
