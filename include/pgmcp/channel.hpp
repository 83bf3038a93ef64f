#pragma once

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pgmcp {

    // Only integer ids are awaited; `method` must outlive the round trip.
    using rpc_request = glz::rpc::request_t<glz::raw_json>;

    struct response {
        std::int64_t id{};
        std::optional<glz::raw_json> result{};
        std::optional<glz::rpc::error> error{};
        std::string line{};

        bool is_error() const noexcept { return error.has_value(); }
    };

    struct channel_options {
        std::chrono::milliseconds poll_backoff{50};
        std::size_t max_discarded_lines{0};
    };

    /*
     * One request/response round trip over newline-delimited JSON. Lines that are not JSON objects
     * with an integer id, or whose id differs from the outstanding request, are dropped. Bytes read
     * past the matching line stay buffered for the next round trip.
     */
    class call_channel {
      public:
        explicit call_channel(channel_options opts = {});

        // `err_fd` is the server's stderr, read and logged while waiting so a chatty server never blocks on
        // a full pipe; pass -1 if there is none. Throws timeout_error, stream_closed_error, protocol_error.
        response send_and_wait(
                int in_fd,
                int out_fd,
                int err_fd,
                const rpc_request& request,
                std::string_view label,
                std::chrono::milliseconds timeout);

        // Writes `{"jsonrpc":"2.0","method":...}` and returns immediately.
        void notify(int in_fd, std::string_view method);

        // Forget buffered bytes, e.g. after the server was replaced.
        void reset() noexcept { buffer_.clear(); }

        std::size_t discarded_lines() const noexcept { return discarded_total_; }

      private:
        void write_line(int in_fd, std::string_view line, std::string_view label, std::int64_t id);
        std::optional<std::string> take_line();
        void discard(std::string_view line, std::size_t& discarded_this_call, std::string_view label);
        void drain_stderr(int& err_fd);

        channel_options opts_{};
        std::string buffer_{};
        std::size_t discarded_total_{0};
    };

    // Serialized request followed by a single '\n'. Throws protocol_error.
    std::string encode_request(const rpc_request& request);

    // std::nullopt unless `line` is a JSON object carrying an integer "id".
    std::optional<response> parse_response_line(std::string_view line);

}  // namespace pgmcp
