#pragma once

#include "hostlink/actions.hpp"
#include "hostlink/bridge.hpp"
#include "hostlink/config.hpp"
#include "hostlink/host.hpp"
#include "hostlink/jobs.hpp"
#include "hostlink/process_host.hpp"
#include "hostlink/server.hpp"
#include "hostlink/types.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/types.hpp"

extern "C" {
#include <unistd.h>
}

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace hostlink::test {

    using namespace std::string_view_literals;
    using namespace std::chrono_literals;

    inline server_config fast_server_config() {
        server_config cfg{};
        cfg.port = 0;
        cfg.poll_interval = 5ms;
        cfg.compile_start_timeout = 500ms;
        cfg.refresh_wait_timeout = 2s;
        cfg.settings_load_timeout = 1s;
        cfg.shutdown_timeout = 1s;
        return cfg;
    }

    inline bridge_config fast_bridge_config() {
        bridge_config cfg{};
        cfg.request_timeout = 2s;
        cfg.status_poll_interval = 5ms;
        cfg.failed_poll_backoff = 10ms;
        cfg.run_start_timeout = 1s;
        cfg.refresh_timeout = 2s;
        return cfg;
    }

    /*
     * Scripted in-memory host.
     *
     * Host calls are recorded; callbacks are queued by the script and
     * delivered on the next poll(), i.e. on the tick like a real host.
     */
    class fake_host final : public host_adapter {
      public:
        using callback = std::function<void(host_events&)>;

        // compile: started on the next poll, finished on the one after
        bool auto_compile{true};
        std::vector<compile_error> compile_errors{};
        std::optional<std::string> compile_failure{};

        std::optional<std::string> execute_failure{};
        bool cancel_result{true};

        std::optional<std::string> refresh_failure{};

        settings_snapshot settings{};
        std::optional<std::string> settings_failure{};

        void request_compile() override {
            std::lock_guard lock{mutex_};
            ++compile_calls_;
            if (compile_failure) {
                throw std::runtime_error(*compile_failure);
            }
            if (!auto_compile) {
                return;
            }
            pending_.push_back([this](host_events& ev) {
                compiling_.store(true);
                ev.compile_started();
            });
            pending_.push_back([this, errors = compile_errors](host_events& ev) {
                compiling_.store(false);
                ev.compile_finished(errors);
            });
        }

        bool is_compiling() const override { return compiling_.load(); }

        std::string execute_tests(const test_filter& filter) override {
            std::lock_guard lock{mutex_};
            filters_.push_back(filter);
            reload_during_run_.push_back(reload_);
            if (execute_failure) {
                throw std::runtime_error(*execute_failure);
            }
            auto id = "run-" + std::to_string(++run_counter_);
            last_run_id_ = id;
            pending_.push_back([id](host_events& ev) { ev.on_test_event(run_started{.run_id = id}); });
            return id;
        }

        bool cancel_test_run(std::string_view run_id) override {
            std::lock_guard lock{mutex_};
            cancelled_.emplace_back(run_id);
            return cancel_result && run_id == last_run_id_;
        }

        void refresh_assets(bool force) override {
            std::lock_guard lock{mutex_};
            refresh_forces_.push_back(force);
            if (refresh_failure) {
                throw std::runtime_error(*refresh_failure);
            }
            updating_.store(true);
        }

        bool is_updating() const override { return updating_.load(); }
        bool is_playing() const override { return playing_.load(); }

        reload_options current_reload_options() const override {
            std::lock_guard lock{mutex_};
            return reload_;
        }

        void apply_reload_options(const reload_options& options) override {
            std::lock_guard lock{mutex_};
            reload_ = options;
        }

        settings_snapshot load_settings() override {
            std::lock_guard lock{mutex_};
            ++settings_loads_;
            if (settings_failure) {
                throw std::runtime_error(*settings_failure);
            }
            return settings;
        }

        void poll(host_events& events) override {
            callback next{};
            {
                std::lock_guard lock{mutex_};
                if (pending_.empty()) {
                    return;
                }
                next = std::move(pending_.front());
                pending_.pop_front();
            }
            next(events);
        }

        // ── script helpers (any thread) ─────────────────────────────────

        void schedule(callback cb) {
            std::lock_guard lock{mutex_};
            pending_.push_back(std::move(cb));
        }

        void finish_run(test_node root, std::optional<std::string> run_id = std::nullopt) {
            schedule([root = std::move(root), run_id = std::move(run_id)](host_events& ev) {
                for (const auto& r : flatten_results(root)) {
                    ev.on_test_event(test_finished{.result = r});
                }
                ev.on_test_event(run_finished{.root = root, .run_id = run_id});
            });
        }

        void fail_run(std::string message, std::optional<std::string> run_id = std::nullopt) {
            schedule([message = std::move(message), run_id = std::move(run_id)](host_events& ev) {
                ev.on_test_event(run_error{.message = message, .run_id = run_id});
            });
        }

        void finish_refresh() { updating_.store(false); }
        void set_playing(bool playing) { playing_.store(playing); }

        int compile_calls() const {
            std::lock_guard lock{mutex_};
            return compile_calls_;
        }
        std::vector<test_filter> filters() const {
            std::lock_guard lock{mutex_};
            return filters_;
        }
        std::vector<reload_options> reload_during_run() const {
            std::lock_guard lock{mutex_};
            return reload_during_run_;
        }
        std::vector<std::string> cancelled() const {
            std::lock_guard lock{mutex_};
            return cancelled_;
        }
        std::vector<bool> refresh_forces() const {
            std::lock_guard lock{mutex_};
            return refresh_forces_;
        }
        int settings_loads() const {
            std::lock_guard lock{mutex_};
            return settings_loads_;
        }
        std::string last_run_id() const {
            std::lock_guard lock{mutex_};
            return last_run_id_;
        }

      private:
        mutable std::mutex mutex_;
        std::deque<callback> pending_{};
        reload_options reload_{};
        std::atomic<bool> compiling_{false};
        std::atomic<bool> updating_{false};
        std::atomic<bool> playing_{false};

        int compile_calls_{0};
        int run_counter_{0};
        int settings_loads_{0};
        std::string last_run_id_{};
        std::vector<test_filter> filters_{};
        std::vector<reload_options> reload_during_run_{};
        std::vector<std::string> cancelled_{};
        std::vector<bool> refresh_forces_{};
    };

    // Ticks a server_context on its own thread, standing in for the host's update loop.
    class host_loop {
      public:
        explicit host_loop(server_context& ctx, std::chrono::milliseconds interval = 5ms)
                : thread_{[&ctx, interval, this] {
                      while (!stop_.load()) {
                          ctx.tick();
                          std::this_thread::sleep_for(interval);
                      }
                  }} {}

        ~host_loop() {
            stop_.store(true);
            thread_.join();
        }

        host_loop(const host_loop&) = delete;
        host_loop& operator=(const host_loop&) = delete;

      private:
        std::atomic<bool> stop_{false};
        std::thread thread_;
    };

    // Bridge transport answered by a test-provided function.
    class fake_transport final : public bridge::http_transport {
      public:
        using handler = std::function<bridge::http_result(std::string_view, const bridge::query_params&)>;

        explicit fake_transport(handler h) : handler_{std::move(h)} {}

        bridge::http_result get(std::string_view path, const bridge::query_params& params) override {
            {
                std::lock_guard lock{mutex_};
                calls_.emplace_back(path);
            }
            return handler_(path, params);
        }

        std::vector<std::string> calls() const {
            std::lock_guard lock{mutex_};
            return calls_;
        }

        static bridge::http_result ok(std::string body) {
            return bridge::http_result{.status = 200, .body = std::move(body), .failure = std::nullopt, .detail = {}};
        }

        static bridge::http_result failed(bridge::transport_failure failure) {
            return bridge::http_result{.status = 0, .body = {}, .failure = failure, .detail = {}};
        }

      private:
        handler handler_;
        mutable std::mutex mutex_;
        std::vector<std::string> calls_{};
    };

    // Bridge transport that calls the router in-process.
    class direct_transport final : public bridge::http_transport {
      public:
        explicit direct_transport(server_context& ctx) : ctx_{ctx} {}

        bridge::http_result get(std::string_view path, const bridge::query_params& params) override {
            http_request request{.method = "GET", .path = std::string{path}, .params = {}};
            for (const auto& [k, v] : params) {
                request.params.emplace(k, v);
            }
            auto response = route(ctx_, request);
            return bridge::http_result{.status = response.status, .body = std::move(response.body), .failure = {}, .detail = {}};
        }

      private:
        server_context& ctx_;
    };

    inline http_response get(server_context& ctx, std::string_view path, std::map<std::string, std::string> params = {}) {
        return route(ctx, http_request{.method = "GET", .path = std::string{path}, .params = std::move(params)});
    }

    template <typename T>
    T parse_body(const std::string& body) {
        T value{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, body);
        INFO(body);
        REQUIRE_FALSE(ec);
        return value;
    }

    template <typename Pred>
    bool eventually(Pred&& pred, std::chrono::milliseconds timeout = 3s) {
        return utils::wait_until(std::forward<Pred>(pred), timeout, 5ms);
    }

    inline test_node make_tree(std::vector<std::pair<std::string, test_outcome>> tests) {
        test_node suite{.name = "Suite", .kind = node_kind::suite};
        for (auto& [name, outcome] : tests) {
            suite.children.push_back(
                    test_node{
                            .name = std::move(name),
                            .kind = node_kind::test,
                            .outcome = outcome,
                            .message = outcome == test_outcome::failed ? "expected 1 but was 2" : "",
                            .duration = 0.01});
        }
        test_node root{.name = "Tests.dll", .kind = node_kind::assembly, .duration = 0.5};
        root.children.push_back(std::move(suite));
        return root;
    }

    // Decoded JSON-RPC response line; result and error data stay raw.
    struct rpc_error_view {
        int code{};
        std::string message{};
        std::optional<glz::raw_json> data{};
        struct glaze {
            using T = rpc_error_view;
            static constexpr auto value = glz::object(&T::code, &T::message, &T::data);
        };
    };

    struct rpc_reply {
        std::string jsonrpc{};
        glz::raw_json id{};
        std::optional<glz::raw_json> result{};
        std::optional<rpc_error_view> error{};
        struct glaze {
            using T = rpc_reply;
            static constexpr auto value = glz::object(&T::jsonrpc, &T::id, &T::result, &T::error);
        };
    };

    struct text_reply {
        struct item {
            std::string type{};
            std::string text{};
        };
        std::vector<item> content{};
        bool isError{false};
    };

    struct tool_error_view {
        std::string errorType{};
        std::string instructions{};
        bool retryable{false};
    };

    inline rpc_reply parse_reply(const std::optional<std::string>& line) {
        REQUIRE(line.has_value());
        return parse_body<rpc_reply>(*line);
    }

    inline std::string tool_call_line(int id, std::string_view tool, std::string_view arguments = "{}") {
        return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":"tools/call","params":{"name":")" +
               std::string{tool} + R"(","arguments":)" + std::string{arguments} + "}}";
    }

    // Text of a successful tool call; fails the test on a JSON-RPC error.
    inline std::string tool_text(bridge::session& s, std::string_view tool, std::string_view arguments = "{}") {
        auto reply = parse_reply(s.handle_line(tool_call_line(1, tool, arguments)));
        if (reply.error) {
            FAIL("tool call failed: " << reply.error->message);
        }
        REQUIRE(reply.result);
        auto result = parse_body<text_reply>(reply.result->str);
        REQUIRE(result.content.size() == 1U);
        CHECK(result.content[0].type == "text");
        return result.content[0].text;
    }

    namespace detail {
        namespace fs = std::filesystem;

        struct temp_dir {
            fs::path path{};

            explicit temp_dir(std::string_view prefix) {
                auto now = std::chrono::system_clock::now().time_since_epoch().count();
                std::ostringstream dir_name{};
                dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
                path = fs::temp_directory_path() / dir_name.str();
                fs::create_directories(path);
            }

            ~temp_dir() {
                std::error_code ec{};
                fs::remove_all(path, ec);
            }

            temp_dir(const temp_dir&) = delete;
            temp_dir& operator=(const temp_dir&) = delete;
        };

        inline void write_file(const fs::path& p, std::string_view content) {
            std::ofstream out{p};
            REQUIRE(out.good());
            out << content;
        }
    }  // namespace detail

}  // namespace hostlink::test
