#pragma once

#include "config.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace httplib {
    class Client;
}

namespace hostlink::bridge {

    using namespace std::string_view_literals;

    enum class transport_failure : uint8_t {
        connection_refused,
        connection_reset,
        broken_pipe,
        timeout,
        other,
    };

    inline constexpr std::string_view to_string(transport_failure failure) {
        switch (failure) {
            case transport_failure::connection_refused:
                return "connection refused"sv;
            case transport_failure::connection_reset:
                return "connection reset"sv;
            case transport_failure::broken_pipe:
                return "broken pipe"sv;
            case transport_failure::timeout:
                return "timeout"sv;
            case transport_failure::other:
                return "transport error"sv;
        }
        return "transport error"sv;
    }

    struct http_result {
        int status{0};
        std::string body{};
        std::optional<transport_failure> failure{};
        std::string detail{};
    };

    using query_params = std::vector<std::pair<std::string, std::string>>;

    class http_transport {
      public:
        virtual ~http_transport() = default;
        virtual http_result get(std::string_view path, const query_params& params) = 0;
    };

    // Blocking GET against the loopback listener.
    class httplib_transport final : public http_transport {
      public:
        explicit httplib_transport(const bridge_config& cfg);
        ~httplib_transport() override;

        http_result get(std::string_view path, const query_params& params) override;

      private:
        std::unique_ptr<httplib::Client> client_;
    };

    enum class failure_kind : uint8_t {
        host_unavailable,
        host_restarting,
        test_start_failed,
        invalid_response,
    };

    struct failure_info {
        std::string_view error_type{};
        std::string_view instructions{};
        bool retryable{false};
    };

    failure_info describe(failure_kind kind);

    // Refused -> unavailable (not retryable); reset, broken pipe, timeout -> restarting (retryable).
    failure_kind classify(transport_failure failure);

    class tool_error : public std::runtime_error {
      public:
        tool_error(failure_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        failure_kind kind() const { return kind_; }

      private:
        failure_kind kind_;
    };

    struct compile_error_line {
        std::string file{};
        int line{};
        std::string message{};
    };

    std::string format_compile_result(const std::vector<compile_error_line>& errors);

    // Cuts at a UTF-8 boundary so that text plus the truncation message fits the limit.
    std::string truncate_text(std::string text, const settings_snapshot& settings);

    /*
     * Line-delimited JSON-RPC session over stdio.
     *
     * Each input line is parsed on its own; a malformed line gets a parse
     * error and the session continues. Tool calls are synchronous: trigger
     * over HTTP, then poll a status endpoint until a terminal state or the
     * caller's timeout.
     */
    class session {
      public:
        explicit session(http_transport& transport, bridge_config cfg = {});

        // Response line for `line`, or nothing for notifications and blank lines.
        std::optional<std::string> handle_line(std::string_view line);

        int run(std::istream& in, std::ostream& out);

      private:
        http_transport& transport_;
        bridge_config cfg_;
    };

    int run_bridge(const bridge_config& cfg);

}  // namespace hostlink::bridge
