#include "hostlink/cli.hpp"

#include "hostlink/bridge.hpp"
#include "hostlink/server.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace hostlink::cli {

    namespace detail {

        static std::atomic<bool> stop_requested{false};

        static void handle_stop_signal(int) {
            stop_requested.store(true);
        }

        static std::string or_unset(const std::string& value) {
            return value.empty() ? std::string{"<unset>"} : value;
        }

    }  // namespace detail

    void print_config(const startup_config& cfg, std::ostream& os) {
        os << "mode=" << to_string(cfg.mode) << '\n';
        if (cfg.mode == command::bridge) {
            os << "host=" << cfg.bridge.host << '\n';
            os << "port=" << cfg.bridge.port << '\n';
            os << "request_timeout_ms=" << cfg.bridge.request_timeout.count() << '\n';
            os << "default_test_mode=" << cfg.bridge.default_test_mode << '\n';
        }
        else if (cfg.mode == command::host) {
            os << "bind_address=" << cfg.server.bind_address << '\n';
            os << "port=" << (cfg.port ? std::to_string(*cfg.port) : std::string{"<from settings>"}) << '\n';
            os << "compile_cmd=" << detail::or_unset(cfg.host.compile_command) << '\n';
            os << "test_cmd=" << detail::or_unset(cfg.host.test_command) << '\n';
            os << "refresh_cmd=" << detail::or_unset(cfg.host.refresh_command) << '\n';
            os << "settings=" << cfg.host.settings_path.string() << '\n';
            os << "tick_ms=" << cfg.tick_interval.count() << '\n';
        }
        os << "verbose=" << (cfg.verbose ? "true" : "false") << '\n';
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"hostlink: drive a single-threaded host over loopback HTTP and stdio JSON-RPC"};
        app.require_subcommand(0, 1);

        bool show_version = false;
        app.add_flag("--version", show_version, "Print version and exit");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        auto* bridge_cmd = app.add_subcommand("bridge", "Run the stdio JSON-RPC bridge until EOF");
        int bridge_port = cfg.bridge.port;
        int64_t request_timeout_ms = cfg.bridge.request_timeout.count();
        bridge_cmd->add_option("--host", cfg.bridge.host, "Listener address");
        bridge_cmd->add_option("--port", bridge_port, "Listener port")->check(CLI::Range(1, 65535));
        bridge_cmd->add_option("--request-timeout-ms", request_timeout_ms, "Per-request timeout")
                ->check(CLI::PositiveNumber);

        auto* host_cmd = app.add_subcommand("host", "Run the listener with shell-command host operations");
        int host_port = -1;
        int64_t tick_ms = cfg.tick_interval.count();
        std::string settings_arg{cfg.host.settings_path.string()};
        host_cmd->add_option("--port", host_port, "Listener port (default: from settings)")
                ->check(CLI::Range(0, 65535));
        host_cmd->add_option("--compile-cmd", cfg.host.compile_command, "Shell command that compiles");
        host_cmd->add_option("--test-cmd", cfg.host.test_command, "Shell command that runs tests and prints TAP");
        host_cmd->add_option("--refresh-cmd", cfg.host.refresh_command, "Shell command that refreshes assets");
        host_cmd->add_option("--settings", settings_arg, "Settings file");
        host_cmd->add_option("--tick-ms", tick_ms, "Host tick interval")->check(CLI::PositiveNumber);

        // global flags may also follow the subcommand
        bridge_cmd->fallthrough();
        host_cmd->fallthrough();

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "hostlink " << version_string << '\n';
            return std::optional<int>{0};
        }

        if (bridge_cmd->parsed()) {
            cfg.mode = command::bridge;
            cfg.bridge.port = bridge_port;
            cfg.bridge.request_timeout = std::chrono::milliseconds{request_timeout_ms};
        }
        else if (host_cmd->parsed()) {
            cfg.mode = command::host;
            if (host_port >= 0) {
                cfg.port = host_port;
            }
            cfg.host.settings_path = settings_arg;
            cfg.tick_interval = std::chrono::milliseconds{tick_ms};
            cfg.server.poll_interval = std::min(cfg.server.poll_interval, cfg.tick_interval);
        }
        cfg.server.verbose = cfg.verbose;

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (cfg.mode == command::none) {
            std::cerr << app.help();
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

    int run_host(startup_config& cfg) {
        process_host host{cfg.host};

        if (cfg.port) {
            cfg.server.port = *cfg.port;
        }
        else {
            // the listener is not up yet, so reading settings here does not race the tick
            cfg.server.port = validate_settings(host.load_settings()).port;
        }

        server_context ctx{host, cfg.server};
        http_listener listener{ctx};
        auto port = listener.start();
        std::cerr << "[hostlink] listening on http://" << cfg.server.bind_address << ':' << port << '\n';

        detail::stop_requested.store(false);
        std::signal(SIGINT, detail::handle_stop_signal);
        std::signal(SIGTERM, detail::handle_stop_signal);

        while (!detail::stop_requested.load()) {
            ctx.tick();
            std::this_thread::sleep_for(cfg.tick_interval);
        }

        verbose_log{"shutting down"};
        listener.stop();
        return 0;
    }

}  // namespace hostlink::cli
