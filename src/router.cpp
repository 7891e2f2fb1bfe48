#include "hostlink/server.hpp"

#include "hostlink/format.hpp"

#include "internal/types.hpp"

#include <glaze/glaze.hpp>

#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

using namespace hostlink::literals;

namespace hostlink {

    std::optional<std::string> http_request::param(std::string_view key) const {
        if (auto it = params.find(std::string{key}); it != params.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    namespace detail {

        static constexpr auto test_already_running =
                "Tests are already running. Please wait for current test run to complete."sv;
        static constexpr auto refresh_already_running =
                "Asset refresh already in progress. Please wait for current refresh to complete."sv;

        template <typename T>
        static std::string to_json(const T& value) {
            std::string json{};
            auto ec = glz::write_json(value, json);
            if (ec) {
                throw std::runtime_error("failed to serialize response body");
            }
            return json;
        }

        static http_response reply(std::string_view status, std::string_view message, int code = 200) {
            return {.status = code,
                    .body = to_json(internal::status_body{.status = std::string{status}, .message = std::string{message}})};
        }

        static bool interrupted(const std::atomic<bool>* stopping) {
            return stopping && stopping->load();
        }

        // Compile and test start must not overlap an asset refresh.
        static void await_refresh_idle(server_context& ctx, const std::atomic<bool>* stopping) {
            if (!ctx.refresh().in_progress()) {
                return;
            }
            verbose_log{"waiting for asset refresh to finish"};
            utils::wait_until(
                    [&] { return !ctx.refresh().in_progress() || interrupted(stopping); },
                    ctx.config().refresh_wait_timeout,
                    ctx.config().poll_interval);
            if (ctx.refresh().in_progress() && !interrupted(stopping)) {
                warn_log{"asset refresh still in progress after ", ctx.config().refresh_wait_timeout.count(), "ms"};
            }
        }

        static http_response handle_compile_and_wait(server_context& ctx, const std::atomic<bool>* stopping) {
            auto request_time = wall_clock::now();
            ctx.queue().push(compile_request{});

            await_refresh_idle(ctx, stopping);

            enum class observed { none, started, completed };
            auto seen = observed::none;
            utils::wait_until(
                    [&] {
                        if (ctx.compile().is_compiling() || ctx.flags().compiling) {
                            seen = observed::started;
                        }
                        else if (auto last = ctx.compile().last_compile_time(); last && *last > request_time) {
                            // finished before a tick could observe it running
                            seen = observed::completed;
                        }
                        return seen != observed::none || interrupted(stopping);
                    },
                    ctx.config().compile_start_timeout,
                    ctx.config().poll_interval);

            switch (seen) {
                case observed::started:
                    return reply("ok", "Compilation started.");
                case observed::completed:
                    return reply("ok", "Compilation completed quickly.");
                case observed::none:
                    break;
            }
            return reply("warning", "Compilation may not have started.");
        }

        static http_response handle_compile_status(server_context& ctx) {
            auto snapshot = ctx.compile().snapshot();
            bool compiling = snapshot.compiling || ctx.flags().compiling;

            internal::compile_status_body body{};
            body.status = compiling ? "compiling" : "idle";
            body.is_compiling = compiling;
            body.last_compile_time = format_timestamp(snapshot.last_compile_time);
            body.errors.reserve(snapshot.errors.size());
            for (auto& err : snapshot.errors) {
                body.errors.push_back(
                        internal::compile_error_body{
                                .file = std::move(err.file), .line = err.line, .message = std::move(err.message)});
            }
            return {.status = 200, .body = to_json(body)};
        }

        static http_response handle_run_tests(
                server_context& ctx, const http_request& request, const std::atomic<bool>* stopping) {
            test_filter filter{};
            auto mode = request.param("mode").value_or(std::string{to_string(test_mode::edit_mode)});
            if (!try_parse_test_mode(mode, filter.mode)) {
                return reply("error", "Invalid test mode: {} (expected EditMode|PlayMode)"_format(mode));
            }
            if (auto names = request.param("filter")) {
                filter.names = utils::split_nonempty(*names, '|');
            }
            if (auto pattern = request.param("filter_regex"); pattern && !pattern->empty()) {
                filter.group_pattern = std::move(*pattern);
            }

            await_refresh_idle(ctx, stopping);
            if (interrupted(stopping)) {
                return reply("warning", "Server is shutting down; test run not started.");
            }

            if (!ctx.tests().try_begin()) {
                verbose_log{"rejecting run-tests: a run is already active"};
                return reply("warning", test_already_running);
            }
            ctx.queue().push(test_start{.filter = std::move(filter)});

            return reply("ok", "Test execution started.");
        }

        static http_response handle_test_status(server_context& ctx) {
            auto snapshot = ctx.tests().snapshot();

            internal::test_status_body body{};
            body.status = snapshot.running ? "running" : "idle";
            body.is_running = snapshot.running;
            body.last_test_time = format_timestamp(snapshot.last_test_time);
            body.test_run_id = std::move(snapshot.run_id);
            body.has_error = snapshot.has_error;
            body.error_message = std::move(snapshot.error_message);
            body.completed_tests = snapshot.completed_tests;

            if (snapshot.results) {
                auto& summary = *snapshot.results;
                internal::test_results_body results{
                        .total_tests = summary.total_tests,
                        .passed_tests = summary.passed_tests,
                        .failed_tests = summary.failed_tests,
                        .skipped_tests = summary.skipped_tests,
                        .duration = summary.duration,
                        .results = {}};
                results.results.reserve(summary.results.size());
                for (auto& r : summary.results) {
                    results.results.push_back(
                            internal::test_result_body{
                                    .name = std::move(r.name),
                                    .outcome = std::string{to_string(r.outcome)},
                                    .message = std::move(r.message),
                                    .duration = r.duration});
                }
                body.test_results = std::move(results);
            }
            return {.status = 200, .body = to_json(body)};
        }

        static http_response handle_refresh_assets(server_context& ctx, const http_request& request) {
            bool force = utils::parse_bool(request.param("force").value_or("false"), false);

            if (!ctx.refresh().try_begin()) {
                verbose_log{"rejecting refresh-assets: a refresh is already active"};
                return reply("warning", refresh_already_running);
            }
            ctx.queue().push(refresh_request{.force = force});

            return reply("ok", force ? "Asset database refresh started (force update)." : "Asset database refresh started.");
        }

        static http_response handle_editor_status(server_context& ctx) {
            auto flags = ctx.flags();
            internal::editor_status_body body{
                    .is_compiling = ctx.compile().is_compiling() || flags.compiling,
                    .is_running_tests = ctx.tests().is_running(),
                    .is_playing = flags.playing,
                    .is_refreshing = ctx.refresh().in_progress()};
            return {.status = 200, .body = to_json(body)};
        }

        static http_response handle_mcp_settings(server_context& ctx, const std::atomic<bool>* stopping) {
            auto settings = ctx.current_settings(stopping);
            internal::settings_body body{
                    .response_character_limit = settings.response_character_limit,
                    .enable_truncation = settings.enable_truncation,
                    .truncation_message = std::move(settings.truncation_message)};
            return {.status = 200, .body = to_json(body)};
        }

        static http_response handle_cancel_tests(server_context& ctx, const http_request& request) {
            auto snapshot = ctx.tests().snapshot();

            std::optional<std::string> target = request.param("guid");
            if (target && target->empty()) {
                target.reset();
            }
            bool awaiting_start = false;
            if (!target) {
                awaiting_start = snapshot.running && !snapshot.active_run_id;
                target = snapshot.running ? snapshot.active_run_id : snapshot.run_id;
            }

            internal::cancel_body body{};
            body.guid = target;

            if (awaiting_start) {
                body.status = "error";
                body.message = "Test run has not started yet.";
            }
            else if (!target) {
                body.status = "error";
                body.message = "No test run to cancel: no guid given and no test run has been started.";
            }
            else if (!snapshot.running) {
                body.status = "error";
                body.message = "No test run is currently active.";
            }
            else if (ctx.request_cancel(*target)) {
                body.status = "ok";
                body.message = "Test run cancellation requested for ID: {}"_format(*target);
            }
            else {
                body.status = "error";
                body.message = "Failed to cancel test run with ID: {}"_format(*target);
            }
            return {.status = 200, .body = to_json(body)};
        }

    }  // namespace detail

    http_response route(server_context& ctx, const http_request& request, const std::atomic<bool>* stopping) {
        verbose_log{request.method, " ", request.path};

        if (request.method == "OPTIONS"sv) {
            return {.status = 204, .body = {}};
        }

        const std::string_view path{request.path};
        if (path == endpoints::compile_and_wait) {
            return detail::handle_compile_and_wait(ctx, stopping);
        }
        if (path == endpoints::compile_status) {
            return detail::handle_compile_status(ctx);
        }
        if (path == endpoints::run_tests) {
            return detail::handle_run_tests(ctx, request, stopping);
        }
        if (path == endpoints::test_status) {
            return detail::handle_test_status(ctx);
        }
        if (path == endpoints::refresh_assets) {
            return detail::handle_refresh_assets(ctx, request);
        }
        if (path == endpoints::editor_status) {
            return detail::handle_editor_status(ctx);
        }
        if (path == endpoints::mcp_settings) {
            return detail::handle_mcp_settings(ctx, stopping);
        }
        if (path == endpoints::cancel_tests) {
            return detail::handle_cancel_tests(ctx, request);
        }
        return detail::reply("error", "Not Found", 404);
    }

}  // namespace hostlink
