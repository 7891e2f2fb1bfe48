#pragma once

#include <glaze/glaze.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// JSON bodies exchanged between the listener and the bridge.
namespace hostlink::internal {

    struct status_body {
        std::string status{};
        std::string message{};
    };

    struct compile_error_body {
        std::string file{};
        int line{};
        std::string message{};
    };

    struct compile_status_body {
        std::string status{};
        bool is_compiling{false};
        std::string last_compile_time{};
        std::vector<compile_error_body> errors{};
    };

    struct test_result_body {
        std::string name{};
        std::string outcome{};
        std::string message{};
        double duration{};
    };

    struct test_results_body {
        int total_tests{};
        int passed_tests{};
        int failed_tests{};
        int skipped_tests{};
        double duration{};
        std::vector<test_result_body> results{};
    };

    struct test_status_body {
        std::string status{};
        bool is_running{false};
        std::string last_test_time{};
        std::optional<test_results_body> test_results{};
        std::optional<std::string> test_run_id{};
        bool has_error{false};
        std::string error_message{};
        std::size_t completed_tests{0};
    };

    struct editor_status_body {
        bool is_compiling{false};
        bool is_running_tests{false};
        bool is_playing{false};
        bool is_refreshing{false};
    };

    struct settings_body {
        int response_character_limit{};
        bool enable_truncation{};
        std::string truncation_message{};
    };

    struct cancel_body {
        std::string status{};
        std::string message{};
        std::optional<std::string> guid{};
    };

    // Host-side settings file
    struct persisted_settings {
        int schema_version{1};
        int response_character_limit{25'000};
        bool enable_truncation{true};
        std::string truncation_message{"\n\n... (response truncated due to length limit)"};
        bool enable_debug_logs{false};
        int server_port{17932};
    };

}  // namespace hostlink::internal

namespace glz {

    template <>
    struct meta<hostlink::internal::status_body> {
        using T = hostlink::internal::status_body;
        static constexpr auto value = object("status", &T::status, "message", &T::message);
    };

    template <>
    struct meta<hostlink::internal::compile_error_body> {
        using T = hostlink::internal::compile_error_body;
        static constexpr auto value = object("file", &T::file, "line", &T::line, "message", &T::message);
    };

    template <>
    struct meta<hostlink::internal::compile_status_body> {
        using T = hostlink::internal::compile_status_body;
        static constexpr auto value =
                object("status",
                       &T::status,
                       "isCompiling",
                       &T::is_compiling,
                       "lastCompileTime",
                       &T::last_compile_time,
                       "errors",
                       &T::errors);
    };

    template <>
    struct meta<hostlink::internal::test_result_body> {
        using T = hostlink::internal::test_result_body;
        static constexpr auto value =
                object("name", &T::name, "outcome", &T::outcome, "message", &T::message, "duration", &T::duration);
    };

    template <>
    struct meta<hostlink::internal::test_results_body> {
        using T = hostlink::internal::test_results_body;
        static constexpr auto value =
                object("totalTests",
                       &T::total_tests,
                       "passedTests",
                       &T::passed_tests,
                       "failedTests",
                       &T::failed_tests,
                       "skippedTests",
                       &T::skipped_tests,
                       "duration",
                       &T::duration,
                       "results",
                       &T::results);
    };

    template <>
    struct meta<hostlink::internal::test_status_body> {
        using T = hostlink::internal::test_status_body;
        static constexpr auto value =
                object("status",
                       &T::status,
                       "isRunning",
                       &T::is_running,
                       "lastTestTime",
                       &T::last_test_time,
                       "testResults",
                       &T::test_results,
                       "testRunId",
                       &T::test_run_id,
                       "hasError",
                       &T::has_error,
                       "errorMessage",
                       &T::error_message,
                       "completedTests",
                       &T::completed_tests);
    };

    template <>
    struct meta<hostlink::internal::editor_status_body> {
        using T = hostlink::internal::editor_status_body;
        static constexpr auto value =
                object("isCompiling",
                       &T::is_compiling,
                       "isRunningTests",
                       &T::is_running_tests,
                       "isPlaying",
                       &T::is_playing,
                       "isRefreshing",
                       &T::is_refreshing);
    };

    template <>
    struct meta<hostlink::internal::settings_body> {
        using T = hostlink::internal::settings_body;
        static constexpr auto value =
                object("responseCharacterLimit",
                       &T::response_character_limit,
                       "enableTruncation",
                       &T::enable_truncation,
                       "truncationMessage",
                       &T::truncation_message);
    };

    template <>
    struct meta<hostlink::internal::cancel_body> {
        using T = hostlink::internal::cancel_body;
        static constexpr auto value = object("status", &T::status, "message", &T::message, "guid", &T::guid);
    };

    template <>
    struct meta<hostlink::internal::persisted_settings> {
        using T = hostlink::internal::persisted_settings;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "response_character_limit",
                       &T::response_character_limit,
                       "enable_truncation",
                       &T::enable_truncation,
                       "truncation_message",
                       &T::truncation_message,
                       "enable_debug_logs",
                       &T::enable_debug_logs,
                       "server_port",
                       &T::server_port);
    };

}  // namespace glz
