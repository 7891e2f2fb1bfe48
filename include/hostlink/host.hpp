#pragma once

#include "config.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hostlink {

    // Test-lifecycle events delivered by the host on its tick.
    struct run_started {
        std::optional<std::string> run_id{};
    };

    struct test_finished {
        test_result result{};
    };

    // Terminal events name their run when the host knows it; a mismatch with the active run is ignored.
    struct run_finished {
        test_node root{};
        std::optional<std::string> run_id{};
    };

    // Best effort: hosts may never deliver this for some failure classes.
    struct run_error {
        std::string message{};
        std::optional<std::string> run_id{};
    };

    using test_event = std::variant<run_started, test_finished, run_finished, run_error>;

    class host_events {
      public:
        virtual ~host_events() = default;

        virtual void compile_started() = 0;
        virtual void compile_finished(std::vector<compile_error> errors) = 0;
        virtual void on_test_event(const test_event& event) = 0;
    };

    // Option set that keeps in-memory state alive across a runtime-mode run.
    struct reload_options {
        bool override_enabled{false};
        bool skip_domain_reload{false};
        bool skip_scene_reload{false};

        bool operator==(const reload_options&) const = default;
    };

    /*
     * The embedding environment's compiler, test runner and asset indexer.
     *
     * Every member except `cancel_test_run` is called from the host tick only.
     * `poll` is where the adapter delivers its callbacks into `events`.
     */
    class host_adapter {
      public:
        virtual ~host_adapter() = default;

        virtual void request_compile() = 0;
        virtual bool is_compiling() const = 0;

        // Returns the id of the run it started; throws if the run could not start.
        virtual std::string execute_tests(const test_filter& filter) = 0;

        // Advisory, callable from any thread.
        virtual bool cancel_test_run(std::string_view run_id) = 0;

        virtual void refresh_assets(bool force) = 0;
        virtual bool is_updating() const = 0;

        virtual bool is_playing() const = 0;

        virtual reload_options current_reload_options() const = 0;
        virtual void apply_reload_options(const reload_options& options) = 0;

        virtual settings_snapshot load_settings() = 0;

        virtual void poll(host_events& events) = 0;
    };

}  // namespace hostlink
