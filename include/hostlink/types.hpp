#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostlink {

    using namespace std::string_view_literals;

    using wall_clock = std::chrono::system_clock;

    enum class test_mode : uint8_t {
        edit_mode,
        play_mode,
    };

    inline constexpr std::string_view to_string(test_mode mode) {
        switch (mode) {
            case test_mode::edit_mode:
                return "EditMode"sv;
            case test_mode::play_mode:
                return "PlayMode"sv;
        }
        return "EditMode"sv;
    }

    inline constexpr bool try_parse_test_mode(std::string_view text, test_mode& out) {
        if (utils::str_case_eq(text, "EditMode"sv) || utils::str_case_eq(text, "edit"sv)) {
            out = test_mode::edit_mode;
            return true;
        }
        if (utils::str_case_eq(text, "PlayMode"sv) || utils::str_case_eq(text, "play"sv)) {
            out = test_mode::play_mode;
            return true;
        }
        return false;
    }

    enum class test_outcome : uint8_t {
        passed,
        failed,
        skipped,
        inconclusive,
    };

    inline constexpr std::string_view to_string(test_outcome outcome) {
        switch (outcome) {
            case test_outcome::passed:
                return "Passed"sv;
            case test_outcome::failed:
                return "Failed"sv;
            case test_outcome::skipped:
                return "Skipped"sv;
            case test_outcome::inconclusive:
                return "Inconclusive"sv;
        }
        return "Inconclusive"sv;
    }

    inline constexpr bool try_parse_test_outcome(std::string_view text, test_outcome& out) {
        if (utils::str_case_eq(text, "Passed"sv)) {
            out = test_outcome::passed;
            return true;
        }
        if (utils::str_case_eq(text, "Failed"sv)) {
            out = test_outcome::failed;
            return true;
        }
        if (utils::str_case_eq(text, "Skipped"sv)) {
            out = test_outcome::skipped;
            return true;
        }
        if (utils::str_case_eq(text, "Inconclusive"sv)) {
            out = test_outcome::inconclusive;
            return true;
        }
        return false;
    }

    struct compile_error {
        std::string file{};
        int line{};
        std::string message{};

        bool operator==(const compile_error&) const = default;
    };

    struct compile_status {
        bool compiling{false};
        std::optional<wall_clock::time_point> last_compile_time{};
        std::vector<compile_error> errors{};
    };

    struct test_result {
        std::string name{};
        test_outcome outcome{test_outcome::inconclusive};
        std::string message{};
        double duration{};
    };

    struct test_summary {
        int total_tests{};
        int passed_tests{};
        int failed_tests{};
        int skipped_tests{};
        double duration{};
        std::vector<test_result> results{};
    };

    struct test_run_status {
        bool running{false};
        // last id the host reported; kept after the run ends
        std::optional<std::string> run_id{};
        // set once the host has started the admitted run, cleared when it ends
        std::optional<std::string> active_run_id{};
        std::size_t completed_tests{0};
        std::optional<test_summary> results{};
        std::optional<wall_clock::time_point> last_test_time{};
        bool has_error{false};
        std::string error_message{};
    };

    // Which tests a run executes. Both lists may be set; an empty filter runs everything.
    struct test_filter {
        test_mode mode{test_mode::edit_mode};
        std::vector<std::string> names{};
        std::optional<std::string> group_pattern{};
    };

    enum class node_kind : uint8_t {
        assembly,
        suite,
        test,
    };

    // Result tree reported by the host when a run finishes.
    struct test_node {
        std::string name{};
        node_kind kind{node_kind::test};
        test_outcome outcome{test_outcome::inconclusive};
        std::string message{};
        double duration{};
        std::vector<test_node> children{};
    };

    // Depth-first flattening; only `test` leaves contribute results.
    std::vector<test_result> flatten_results(const test_node& root);

    test_summary summarize(std::vector<test_result> results, double duration);

    // "yyyy-MM-dd HH:mm:ss" (UTC), empty when never set
    std::string format_timestamp(const std::optional<wall_clock::time_point>& tp);

}  // namespace hostlink
