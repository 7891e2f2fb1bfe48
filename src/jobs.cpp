#include "hostlink/jobs.hpp"

#include "hostlink/format.hpp"

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

using namespace hostlink::literals;

namespace hostlink {

    // ── compile ─────────────────────────────────────────────────────────

    compile_status compile_job::snapshot() const {
        std::lock_guard lock{mutex_};
        return status_;
    }

    bool compile_job::is_compiling() const {
        std::lock_guard lock{mutex_};
        return status_.compiling;
    }

    std::optional<wall_clock::time_point> compile_job::last_compile_time() const {
        std::lock_guard lock{mutex_};
        return status_.last_compile_time;
    }

    void compile_job::on_started() {
        std::lock_guard lock{mutex_};
        status_.compiling = true;
    }

    void compile_job::on_finished(std::vector<compile_error> errors, wall_clock::time_point now) {
        std::lock_guard lock{mutex_};
        status_.errors = std::move(errors);
        status_.last_compile_time = now;
        status_.compiling = false;
    }

    void compile_job::on_request_failed(std::string_view what, wall_clock::time_point now) {
        std::vector<compile_error> errors{};
        errors.push_back(compile_error{.file = "", .line = 0, .message = "Failed to request compilation: {}"_format(what)});
        on_finished(std::move(errors), now);
    }

    // ── tests ───────────────────────────────────────────────────────────

    bool test_job::try_begin() {
        std::lock_guard lock{mutex_};
        if (status_.running) {
            return false;
        }
        status_.running = true;
        status_.active_run_id.reset();
        return true;
    }

    test_run_status test_job::snapshot() const {
        std::lock_guard lock{mutex_};
        return status_;
    }

    bool test_job::is_running() const {
        std::lock_guard lock{mutex_};
        return status_.running;
    }

    std::optional<std::string> test_job::current_run_id() const {
        std::lock_guard lock{mutex_};
        return status_.active_run_id;
    }

    bool test_job::accepts_terminal(const std::optional<std::string>& run_id) const {
        std::lock_guard lock{mutex_};
        if (!status_.running || !status_.active_run_id) {
            return false;
        }
        return !run_id || *run_id == *status_.active_run_id;
    }

    void test_job::restore_reload_options(host_adapter& host) {
        std::optional<reload_options> saved{};
        {
            std::lock_guard lock{mutex_};
            saved.swap(saved_reload_);
        }
        if (!saved) {
            return;
        }
        try {
            host.apply_reload_options(*saved);
            verbose_log{"restored reload options after runtime-mode test run"};
        } catch (const std::exception& e) {
            warn_log{"failed to restore reload options: ", e.what()};
        }
    }

    void test_job::start(host_adapter& host, const test_filter& filter) {
        {
            std::lock_guard lock{mutex_};
            status_.results.reset();
            status_.has_error = false;
            status_.error_message.clear();
            status_.completed_tests = 0;
        }

        try {
            if (filter.mode == test_mode::play_mode) {
                auto original = host.current_reload_options();
                {
                    std::lock_guard lock{mutex_};
                    saved_reload_ = original;
                }
                host.apply_reload_options(
                        reload_options{.override_enabled = true, .skip_domain_reload = true, .skip_scene_reload = true});
                verbose_log{"overriding reload options for runtime-mode test run"};
            }

            auto run_id = host.execute_tests(filter);
            verbose_log{"started test run ", run_id, " (", to_string(filter.mode), ")"};

            std::lock_guard lock{mutex_};
            status_.run_id = run_id;
            status_.active_run_id = std::move(run_id);
        } catch (const std::exception& e) {
            warn_log{"failed to start test execution: ", e.what()};
            restore_reload_options(host);

            // no callback will ever arrive for a run that never started
            std::vector<test_result> results{};
            results.push_back(
                    test_result{
                            .name = "TestExecution",
                            .outcome = test_outcome::failed,
                            .message = e.what(),
                            .duration = 0.0});

            std::lock_guard lock{mutex_};
            status_.results = summarize(std::move(results), 0.0);
            status_.has_error = true;
            status_.error_message = "Test execution failed to start: {}"_format(e.what());
            status_.last_test_time = wall_clock::now();
            status_.running = false;
        }
    }

    void test_job::handle(host_adapter& host, const test_event& event) {
        std::visit(
                [&]<typename E>(const E& ev) {
                    if constexpr (std::is_same_v<E, run_started>) {
                        std::lock_guard lock{mutex_};
                        if (ev.run_id && !status_.run_id) {
                            status_.run_id = ev.run_id;
                        }
                        debug_log{"test run started"};
                    }
                    else if constexpr (std::is_same_v<E, test_finished>) {
                        std::lock_guard lock{mutex_};
                        if (status_.running) {
                            ++status_.completed_tests;
                        }
                        debug_log{"test finished: ", ev.result.name, " ", to_string(ev.result.outcome)};
                    }
                    else if constexpr (std::is_same_v<E, run_finished>) {
                        if (!accepts_terminal(ev.run_id)) {
                            debug_log{"ignoring run-finished for a run that is not active"};
                            return;
                        }
                        auto summary = summarize(flatten_results(ev.root), ev.root.duration);
                        verbose_log{
                                "test run finished: ",
                                summary.total_tests,
                                " total, ",
                                summary.failed_tests,
                                " failed"};
                        {
                            std::lock_guard lock{mutex_};
                            status_.results = std::move(summary);
                            status_.last_test_time = wall_clock::now();
                        }
                        restore_reload_options(host);

                        // results are visible before Idle is
                        std::lock_guard lock{mutex_};
                        status_.active_run_id.reset();
                        status_.running = false;
                    }
                    else if constexpr (std::is_same_v<E, run_error>) {
                        if (!accepts_terminal(ev.run_id)) {
                            debug_log{"ignoring run error for a run that is not active: ", ev.message};
                            return;
                        }
                        warn_log{"test run error: ", ev.message};
                        restore_reload_options(host);

                        std::lock_guard lock{mutex_};
                        status_.has_error = true;
                        status_.error_message = ev.message;
                        status_.last_test_time = wall_clock::now();
                        status_.active_run_id.reset();
                        status_.running = false;
                    }
                },
                event);
    }

    // ── refresh ─────────────────────────────────────────────────────────

    bool refresh_job::try_begin() {
        std::lock_guard lock{mutex_};
        if (in_progress_) {
            return false;
        }
        in_progress_ = true;
        return true;
    }

    bool refresh_job::in_progress() const {
        std::lock_guard lock{mutex_};
        return in_progress_;
    }

    void refresh_job::finish() {
        std::lock_guard lock{mutex_};
        in_progress_ = false;
    }

    // ── settings ────────────────────────────────────────────────────────

    std::optional<settings_snapshot> settings_cache::get() const {
        std::lock_guard lock{mutex_};
        return settings_;
    }

    void settings_cache::store(const settings_snapshot& settings, std::chrono::steady_clock::time_point now) {
        std::lock_guard lock{mutex_};
        settings_ = settings;
        loaded_at_ = now;
        load_requested_ = false;
    }

    bool settings_cache::due(std::chrono::steady_clock::time_point now, std::chrono::milliseconds interval) const {
        std::lock_guard lock{mutex_};
        return !settings_ || now - loaded_at_ >= interval;
    }

    bool settings_cache::claim_load_request() {
        std::lock_guard lock{mutex_};
        if (load_requested_) {
            return false;
        }
        load_requested_ = true;
        return true;
    }

}  // namespace hostlink
