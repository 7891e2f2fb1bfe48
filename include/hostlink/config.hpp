#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace hostlink {

    using namespace std::string_view_literals;
    using namespace std::chrono_literals;

    inline constexpr int default_port = 17932;
    inline constexpr std::string_view loopback_address = "127.0.0.1"sv;
    inline constexpr std::string_view version_string = "0.1.0"sv;

    namespace endpoints {
        inline constexpr auto compile_and_wait = "/compile-and-wait"sv;
        inline constexpr auto compile_status = "/compile-status"sv;
        inline constexpr auto run_tests = "/run-tests"sv;
        inline constexpr auto test_status = "/test-status"sv;
        inline constexpr auto refresh_assets = "/refresh-assets"sv;
        inline constexpr auto editor_status = "/editor-status"sv;
        inline constexpr auto mcp_settings = "/mcp-settings"sv;
        inline constexpr auto cancel_tests = "/cancel-tests"sv;
    }  // namespace endpoints

    /*
     * Host-owned settings (read-mostly; cached by the network side)
     *
     * - response_character_limit: Maximum characters of tool text the bridge emits.
     * - enable_truncation: Cut oversized tool text instead of sending it whole.
     * - truncation_message: Suffix appended to truncated text.
     * - debug_logs: Enable verbose_log output for request handlers.
     * - port: Loopback port the listener binds.
     */
    struct settings_snapshot {
        int response_character_limit{25'000};
        bool enable_truncation{true};
        std::string truncation_message{"\n\n... (response truncated due to length limit)"};
        bool debug_logs{false};
        int port{default_port};

        bool operator==(const settings_snapshot&) const = default;
    };

    inline constexpr int min_response_character_limit = 1'000;
    inline constexpr std::size_t max_truncation_message_length = 500U;

    inline settings_snapshot validate_settings(settings_snapshot s) {
        if (s.response_character_limit < min_response_character_limit) {
            s.response_character_limit = min_response_character_limit;
        }
        if (s.truncation_message.size() > max_truncation_message_length) {
            s.truncation_message.resize(max_truncation_message_length);
        }
        if (s.port < 1024 || s.port > 65535) {
            s.port = default_port;
        }
        return s;
    }

    /*
     * Listener and host-tick coordination
     *
     * - port: Loopback port to bind; 0 picks a free port.
     * - poll_interval: Sleep between samples in every network-side wait loop.
     * - compile_start_timeout: Bound on waiting for a requested compile to be observed.
     * - refresh_wait_timeout: Bound on waiting for an active refresh before compile/test start.
     * - settings_load_timeout: Bound on the one-shot settings load on first access.
     * - settings_refresh_interval: Period of settings reloads driven from the host tick.
     * - shutdown_timeout: Bound on joining the listener thread.
     * - verbose: Keep verbose logging on regardless of the debug_logs setting.
     */
    struct server_config {
        std::string bind_address{loopback_address};
        int port{default_port};
        std::chrono::milliseconds poll_interval{50ms};
        std::chrono::milliseconds compile_start_timeout{5s};
        std::chrono::milliseconds refresh_wait_timeout{30s};
        std::chrono::milliseconds settings_load_timeout{2s};
        std::chrono::milliseconds settings_refresh_interval{5s};
        std::chrono::milliseconds shutdown_timeout{1s};
        bool verbose{false};
    };

    /*
     * Bridge adapter (stdio JSON-RPC -> loopback HTTP)
     *
     * - host/port: Where the listener is expected.
     * - request_timeout: Per-request connect/read/write budget.
     * - status_poll_interval: Sleep between successful status polls.
     * - failed_poll_backoff: Sleep after a poll that failed in transport.
     * - run_start_timeout: Bound on observing a new run id after triggering tests.
     * - refresh_timeout: Bound on observing refresh completion.
     * - default_compile_timeout/default_test_timeout: Tool defaults when the caller omits `timeout`.
     * - default_test_mode: Tool default when the caller omits `test_mode`.
     */
    struct bridge_config {
        std::string host{loopback_address};
        int port{default_port};
        std::chrono::milliseconds request_timeout{15s};
        std::chrono::milliseconds status_poll_interval{1s};
        std::chrono::milliseconds failed_poll_backoff{2s};
        std::chrono::milliseconds run_start_timeout{10s};
        std::chrono::milliseconds refresh_timeout{30s};
        std::chrono::seconds default_compile_timeout{30s};
        std::chrono::seconds default_test_timeout{60s};
        std::string default_test_mode{"PlayMode"};
    };

}  // namespace hostlink
