#include "utils.hpp"

#include "hostlink/cli.hpp"

#include <vector>

namespace hostlink::test {

    namespace detail {
        std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }
    }  // namespace detail

    TEST_CASE("013: parse_cli accepts bridge options", "[013][cli]") {
        cli::startup_config cfg{};
        std::vector<std::string> args{
                "hostlink", "--verbose", "bridge", "--host", "127.0.0.2", "--port", "18001", "--request-timeout-ms", "2500"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.mode == cli::command::bridge);
        CHECK(cfg.bridge.host == "127.0.0.2");
        CHECK(cfg.bridge.port == 18'001);
        CHECK(cfg.bridge.request_timeout == 2'500ms);
        CHECK(cfg.verbose);
        CHECK(cfg.server.verbose);
    }

    TEST_CASE("013: parse_cli accepts host options", "[013][cli]") {
        cli::startup_config cfg{};
        std::vector<std::string> args{
                "hostlink",
                "host",
                "--port",
                "0",
                "--compile-cmd",
                "make -C build",
                "--test-cmd",
                "./build/tests --tap",
                "--refresh-cmd",
                "touch .stamp",
                "--settings",
                "/tmp/hostlink_tests/settings.json",
                "--tick-ms",
                "10"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.mode == cli::command::host);
        REQUIRE(cfg.port);
        CHECK(*cfg.port == 0);
        CHECK(cfg.host.compile_command == "make -C build");
        CHECK(cfg.host.test_command == "./build/tests --tap");
        CHECK(cfg.host.refresh_command == "touch .stamp");
        CHECK(cfg.host.settings_path == "/tmp/hostlink_tests/settings.json");
        CHECK(cfg.tick_interval == 10ms);
        CHECK(cfg.server.poll_interval == 10ms);
    }

    TEST_CASE("013: host port defaults to the settings file", "[013][cli]") {
        cli::startup_config cfg{};
        std::vector<std::string> args{"hostlink", "host"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK_FALSE(cfg.port);
        CHECK(cfg.tick_interval == 50ms);
    }

    TEST_CASE("013: parse_cli rejects invalid options", "[013][cli]") {
        SECTION("bridge port out of range") {
            cli::startup_config cfg{};
            std::vector<std::string> args{"hostlink", "bridge", "--port", "70000"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result != 0);
        }

        SECTION("unknown subcommand") {
            cli::startup_config cfg{};
            std::vector<std::string> args{"hostlink", "serve"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result != 0);
        }

        SECTION("no subcommand") {
            cli::startup_config cfg{};
            std::vector<std::string> args{"hostlink"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }
    }

    TEST_CASE("013: parse_cli handles one-shot exits", "[013][cli]") {
        SECTION("version") {
            cli::startup_config cfg{};
            std::vector<std::string> args{"hostlink", "--version"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 0);
        }

        SECTION("print config") {
            cli::startup_config cfg{};
            std::vector<std::string> args{"hostlink", "--print-config", "bridge", "--port", "18002"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 0);
            CHECK(cfg.print_config);
        }
    }

    TEST_CASE("013: print_config lists the resolved values", "[013][cli]") {
        cli::startup_config cfg{};
        cfg.mode = cli::command::host;
        cfg.host.compile_command = "make";

        std::ostringstream os{};
        cli::print_config(cfg, os);
        auto text = os.str();
        CHECK(text.find("mode=host\n") != std::string::npos);
        CHECK(text.find("port=<from settings>\n") != std::string::npos);
        CHECK(text.find("compile_cmd=make\n") != std::string::npos);
        CHECK(text.find("test_cmd=<unset>\n") != std::string::npos);
        CHECK(text.find("verbose=false\n") != std::string::npos);
    }

}  // namespace hostlink::test
