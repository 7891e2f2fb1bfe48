#include "hostlink/server.hpp"

#include "hostlink/format.hpp"

#include <algorithm>
#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace hostlink {

    server_context::server_context(host_adapter& host, server_config cfg) : host_{host}, cfg_{std::move(cfg)} {}

    void server_context::tick() {
        for (auto& action : queue_.take_all()) {
            execute(action);
        }

        try {
            host_.poll(*this);
        } catch (const std::exception& e) {
            warn_log{"host poll failed: ", e.what()};
        }

        run_monitors();
        sample_host();

        if (settings_.due(std::chrono::steady_clock::now(), cfg_.settings_refresh_interval)) {
            reload_settings();
        }
    }

    void server_context::execute(const queued_action& action) {
        debug_log{"executing queued action: ", action_name(action)};

        std::visit(
                [&]<typename A>(const A& act) {
                    if constexpr (std::is_same_v<A, compile_request>) {
                        try {
                            host_.request_compile();
                        } catch (const std::exception& e) {
                            warn_log{"failed to request compilation: ", e.what()};
                            compile_.on_request_failed(e.what());
                        }
                    }
                    else if constexpr (std::is_same_v<A, test_start>) {
                        tests_.start(host_, act.filter);
                    }
                    else if constexpr (std::is_same_v<A, refresh_request>) {
                        try {
                            host_.refresh_assets(act.force);
                            monitors_.push_back([this] {
                                if (host_.is_updating()) {
                                    return false;
                                }
                                refresh_.finish();
                                verbose_log{"asset refresh finished"};
                                return true;
                            });
                        } catch (const std::exception& e) {
                            warn_log{"asset refresh failed: ", e.what()};
                            refresh_.finish();
                        }
                    }
                    else if constexpr (std::is_same_v<A, settings_load>) {
                        reload_settings();
                    }
                },
                action);
    }

    void server_context::run_monitors() {
        std::erase_if(monitors_, [](monitor& m) {
            try {
                return m();
            } catch (const std::exception& e) {
                warn_log{"tick monitor failed, removing it: ", e.what()};
                return true;
            }
        });
        monitor_count_.store(monitors_.size());
    }

    void server_context::sample_host() {
        try {
            host_compiling_.store(host_.is_compiling());
            host_playing_.store(host_.is_playing());
        } catch (const std::exception& e) {
            warn_log{"failed to sample host state: ", e.what()};
        }
    }

    void server_context::reload_settings() {
        try {
            auto loaded = validate_settings(host_.load_settings());
            set_verbose_logging(loaded.debug_logs || cfg_.verbose);
            settings_.store(loaded, std::chrono::steady_clock::now());
        } catch (const std::exception& e) {
            warn_log{"failed to load settings, using defaults: ", e.what()};
            settings_.store(settings_snapshot{}, std::chrono::steady_clock::now());
        }
    }

    host_flags server_context::flags() const {
        return host_flags{.compiling = host_compiling_.load(), .playing = host_playing_.load()};
    }

    std::size_t server_context::monitor_count() const {
        return monitor_count_.load();
    }

    settings_snapshot server_context::current_settings(const std::atomic<bool>* stopping) {
        if (auto cached = settings_.get()) {
            return *cached;
        }

        if (settings_.claim_load_request()) {
            queue_.push(settings_load{});
        }

        utils::wait_until(
                [&] { return settings_.get().has_value() || (stopping && stopping->load()); },
                cfg_.settings_load_timeout,
                cfg_.poll_interval);

        if (auto cached = settings_.get()) {
            return *cached;
        }
        debug_log{"settings not loaded yet, answering with defaults"};
        return settings_snapshot{};
    }

    bool server_context::request_cancel(std::string_view run_id) {
        try {
            return host_.cancel_test_run(run_id);
        } catch (const std::exception& e) {
            warn_log{"cancel request for ", run_id, " failed: ", e.what()};
            return false;
        }
    }

    // ── host callbacks ──────────────────────────────────────────────────

    void server_context::compile_started() {
        verbose_log{"compilation started"};
        compile_.on_started();
    }

    void server_context::compile_finished(std::vector<compile_error> errors) {
        verbose_log{"compilation finished with ", errors.size(), " error(s)"};
        compile_.on_finished(std::move(errors));
    }

    void server_context::on_test_event(const test_event& event) {
        tests_.handle(host_, event);
    }

}  // namespace hostlink
