#include "utils.hpp"

#include "hostlink/format.hpp"

#include <format>

namespace hostlink::test {

    TEST_CASE("001: settings validation clamps out-of-range values", "[001][config]") {
        settings_snapshot defaults{};
        CHECK(validate_settings(defaults) == defaults);

        settings_snapshot s{};
        s.response_character_limit = 10;
        s.truncation_message = std::string(900, 'x');
        s.port = 80;

        auto v = validate_settings(s);
        CHECK(v.response_character_limit == min_response_character_limit);
        CHECK(v.truncation_message.size() == max_truncation_message_length);
        CHECK(v.port == default_port);

        s.port = 70000;
        CHECK(validate_settings(s).port == default_port);
        s.port = 20000;
        CHECK(validate_settings(s).port == 20000);
    }

    TEST_CASE("001: config defaults", "[001][config]") {
        server_config server{};
        CHECK(server.bind_address == "127.0.0.1");
        CHECK(server.port == 17932);
        CHECK(server.poll_interval == 50ms);
        CHECK(server.compile_start_timeout == 5s);
        CHECK(server.refresh_wait_timeout == 30s);

        bridge_config bridge{};
        CHECK(bridge.default_compile_timeout == 30s);
        CHECK(bridge.default_test_timeout == 60s);
        CHECK(bridge.default_test_mode == "PlayMode");
        CHECK(bridge.run_start_timeout == 10s);

        settings_snapshot settings{};
        CHECK(settings.response_character_limit == 25'000);
        CHECK(settings.enable_truncation);
        CHECK_FALSE(settings.debug_logs);
    }

    TEST_CASE("001: test mode and outcome parsing", "[001][config]") {
        test_mode mode{};
        REQUIRE(try_parse_test_mode("PlayMode"sv, mode));
        CHECK(mode == test_mode::play_mode);
        REQUIRE(try_parse_test_mode("editmode"sv, mode));
        CHECK(mode == test_mode::edit_mode);
        CHECK_FALSE(try_parse_test_mode("RuntimeMode"sv, mode));
        CHECK(mode == test_mode::edit_mode);

        test_outcome outcome{};
        REQUIRE(try_parse_test_outcome("failed"sv, outcome));
        CHECK(outcome == test_outcome::failed);
        CHECK_FALSE(try_parse_test_outcome("Errored"sv, outcome));

        CHECK(std::format("{}", test_mode::play_mode) == "PlayMode");
        CHECK(std::format("{}|{}", test_outcome::passed, test_outcome::inconclusive) == "Passed|Inconclusive");
    }

    TEST_CASE("001: string helpers", "[001][utils]") {
        CHECK(utils::split_nonempty("A.One| A.Two ||A.Three"sv, '|') ==
              std::vector<std::string>{"A.One", "A.Two", "A.Three"});
        CHECK(utils::split_nonempty(""sv, '|').empty());

        CHECK(utils::parse_bool("TRUE"sv, false));
        CHECK(utils::parse_bool("1"sv, false));
        CHECK_FALSE(utils::parse_bool("no"sv, true));
        CHECK(utils::parse_bool("maybe"sv, true));
        CHECK_FALSE(utils::parse_bool(""sv, false));

        CHECK(utils::join_with_separator({"a", "b"}, ", ") == "a, b");
        CHECK(utils::parse_arithmetic<int>("42"sv) == 42);
        CHECK_FALSE(utils::parse_arithmetic<int>("4x"sv));
    }

    TEST_CASE("001: wait_until honours its timeout", "[001][utils]") {
        auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(utils::wait_until([] { return false; }, 30ms, 5ms));
        CHECK(std::chrono::steady_clock::now() - start >= 30ms);

        int calls = 0;
        CHECK(utils::wait_until([&] { return ++calls == 3; }, 1s, 1ms));
        CHECK(calls == 3);
    }

}  // namespace hostlink::test
