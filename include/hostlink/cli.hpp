#pragma once

#include "config.hpp"
#include "process_host.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>

namespace hostlink::cli {

    enum class command : uint8_t {
        none,
        bridge,
        host,
    };

    inline constexpr std::string_view to_string(command c) {
        switch (c) {
            case command::none:
                return "none"sv;
            case command::bridge:
                return "bridge"sv;
            case command::host:
                return "host"sv;
        }
        return "none"sv;
    }

    /*
     * Resolved command line
     *
     * - port: Explicit --port; when absent the host reads it from its settings file.
     * - tick_interval: Sleep between host ticks in `host` mode.
     */
    struct startup_config {
        command mode{command::none};
        bridge_config bridge{};
        server_config server{};
        process_host_config host{};
        std::optional<int> port{};
        std::chrono::milliseconds tick_interval{50ms};
        bool verbose{false};
        bool print_config{false};
    };

    // Exit code when the command line is fully handled (help, version, errors); nullopt to continue.
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    void print_config(const startup_config& cfg, std::ostream& os);

    // Runs the listener with the process host, ticking on the calling thread until SIGINT/SIGTERM.
    int run_host(startup_config& cfg);

}  // namespace hostlink::cli
