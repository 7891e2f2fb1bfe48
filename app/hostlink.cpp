#include "hostlink/bridge.hpp"
#include "hostlink/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        hostlink::cli::startup_config cfg{};
        if (auto cli_result = hostlink::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }
        hostlink::set_verbose_logging(cfg.verbose);

        if (cfg.mode == hostlink::cli::command::bridge) {
            return hostlink::bridge::run_bridge(cfg.bridge);
        }
        return hostlink::cli::run_host(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
