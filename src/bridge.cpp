#include "hostlink/bridge.hpp"

#include "hostlink/format.hpp"
#include "hostlink/types.hpp"

#include "internal/types.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <algorithm>
#include <array>
#include <csignal>
#include <iostream>
#include <thread>

using namespace hostlink::literals;

namespace hostlink::bridge {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct initialize_params {
            std::optional<std::string> protocolVersion{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value = glz::object("protocolVersion", &T::protocolVersion);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct tools_capability {
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        // Structured data of a -32603 tool failure.
        struct tool_error_data {
            std::string errorType{};
            std::string instructions{};
            bool retryable{false};
            struct glaze {
                using T = tool_error_data;
                static constexpr auto value =
                        glz::object("errorType", &T::errorType, "instructions", &T::instructions, "retryable", &T::retryable);
            };
        };

        // ── Tool arguments ──────────────────────────────────────────────

        struct compile_args {
            std::optional<double> timeout{};
            struct glaze {
                using T = compile_args;
                static constexpr auto value = glz::object(&T::timeout);
            };
        };

        struct run_tests_args {
            std::optional<std::string> test_mode{};
            std::optional<std::string> test_filter{};
            std::optional<std::string> test_filter_regex{};
            std::optional<double> timeout{};
            struct glaze {
                using T = run_tests_args;
                static constexpr auto value =
                        glz::object(&T::test_mode, &T::test_filter, &T::test_filter_regex, &T::timeout);
            };
        };

        struct refresh_args {
            std::optional<bool> force{};
            struct glaze {
                using T = refresh_args;
                static constexpr auto value = glz::object(&T::force);
            };
        };

        struct cancel_args {
            std::optional<std::string> test_run_guid{};
            struct glaze {
                using T = cancel_args;
                static constexpr auto value = glz::object(&T::test_run_guid);
            };
        };

        // ── Tool catalog ────────────────────────────────────────────────

        struct tool_entry {
            std::string_view name;
            std::string_view description;
            std::string_view input_schema;
        };

        static constexpr auto no_arguments_schema = R"json({"type":"object","properties":{},"required":[]})json"sv;

        static constexpr std::array tool_catalog{
                tool_entry{
                        "compile_and_wait"sv,
                        "Request the host to compile and wait for completion. Returns the compile errors, if any."sv,
                        R"json({"type":"object","properties":{"timeout":{"type":"number","description":"Timeout in seconds (default: 30)","default":30}},"required":[]})json"sv},
                tool_entry{
                        "run_tests"sv,
                        "Run tests on the host and wait for the results. Filters narrow the run to specific tests."sv,
                        R"json({"type":"object","properties":{"test_mode":{"type":"string","enum":["EditMode","PlayMode"],"description":"Test mode to run (default: PlayMode)","default":"PlayMode"},"test_filter":{"type":"string","description":"Full test names separated by '|'"},"test_filter_regex":{"type":"string","description":"Pattern selecting test groups by name"},"timeout":{"type":"number","description":"Timeout in seconds (default: 60)","default":60}},"required":[]})json"sv},
                tool_entry{
                        "refresh_assets"sv,
                        "Refresh the host's asset database and wait until it is done. Use force=true after file "
                        "deletions so removed files are dropped from the index (ForceUpdate)."sv,
                        R"json({"type":"object","properties":{"force":{"type":"boolean","description":"Force a full update; use after deletions (default: false)","default":false}},"required":[]})json"sv},
                tool_entry{
                        "editor_status"sv,
                        "Get the host's current compile, test, play and refresh state."sv,
                        no_arguments_schema},
                tool_entry{
                        "compile_status"sv,
                        "Get the compile state, last compile time and errors without triggering a compile."sv,
                        no_arguments_schema},
                tool_entry{
                        "test_status"sv,
                        "Get the test run state and the results of the most recent run without starting one."sv,
                        no_arguments_schema},
                tool_entry{
                        "cancel_tests"sv,
                        "Request cancellation of a running test run. Cancellation is advisory; poll test_status to "
                        "observe the outcome."sv,
                        R"json({"type":"object","properties":{"test_run_guid":{"type":"string","description":"Run id to cancel (default: the current run)"}},"required":[]})json"sv},
        };

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id,
                glz::rpc::error_e code,
                const std::string& message,
                std::optional<glz::raw_json> data = std::nullopt) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::move(data), message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_tool_error_response(const glz::rpc::id_t& id, const tool_error& err) {
            auto info = describe(err.kind());
            tool_error_data data{
                    .errorType = std::string{info.error_type},
                    .instructions = std::string{info.instructions},
                    .retryable = info.retryable};
            std::string data_json{};
            (void)glz::write_json(data, data_json);
            return make_error_response(
                    id,
                    glz::rpc::error_e::internal,
                    "Tool execution failed: {}"_format(err.what()),
                    glz::raw_json{data_json});
        }

        // Missing or null arguments read as an empty object.
        template <typename T>
        static T parse_arguments(const glz::raw_json& raw, std::string_view tool) {
            T args{};
            auto text = utils::trim_view(raw.str);
            if (text.empty() || text == "null"sv) {
                return args;
            }
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, raw.str);
            if (ec) {
                throw std::invalid_argument("Failed to parse {} arguments"_format(tool));
            }
            return args;
        }

        // ── HTTP helpers ────────────────────────────────────────────────

        using steady = std::chrono::steady_clock;

        static std::chrono::milliseconds seconds_arg(std::optional<double> value, std::chrono::seconds fallback) {
            if (!value || !(*value > 0.0)) {
                return fallback;
            }
            // one day is far past any wait a tool performs
            constexpr double max_seconds = 86400.0;
            return std::chrono::milliseconds{static_cast<int64_t>(std::min(*value, max_seconds) * 1000.0)};
        }

        static tool_error transport_error(std::string_view path, const http_result& res) {
            auto failure = res.failure.value_or(transport_failure::other);
            return tool_error{
                    classify(failure),
                    "request to {} failed: {}{}"_format(
                            path, to_string(failure), res.detail.empty() ? std::string{} : " ({})"_format(res.detail))};
        }

        // Trigger requests: a transport failure or non-2xx status is a tool failure.
        static std::string fetch(http_transport& transport, std::string_view path, const query_params& params = {}) {
            auto res = transport.get(path, params);
            if (res.failure) {
                throw transport_error(path, res);
            }
            if (res.status < 200 || res.status >= 300) {
                throw tool_error{
                        failure_kind::invalid_response, "{} answered HTTP {}: {}"_format(path, res.status, res.body)};
            }
            return res.body;
        }

        template <typename T>
        static T decode(std::string_view path, const std::string& body) {
            T value{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, body);
            if (ec) {
                throw tool_error{failure_kind::invalid_response, "unreadable response from {}: {}"_format(path, body)};
            }
            return value;
        }

        /*
         * Polls `path` until `done` accepts a decoded body or `timeout` elapses.
         *
         * Transport failures while polling are expected (the host may be
         * reloading) and are retried after the back-off; the last one is
         * rethrown only if no poll ever succeeded before the deadline.
         */
        template <typename Body, typename Done>
        static std::optional<Body> poll_until(
                http_transport& transport,
                const bridge_config& cfg,
                std::string_view path,
                std::chrono::milliseconds timeout,
                Done&& done) {
            auto deadline = steady::now() + timeout;
            std::optional<http_result> last_failure{};
            bool any_success = false;

            for (;;) {
                auto res = transport.get(path, {});
                if (res.failure) {
                    verbose_log{"poll of ", path, " failed (", to_string(*res.failure), "); retrying"};
                    last_failure = std::move(res);
                    if (steady::now() + cfg.failed_poll_backoff >= deadline) {
                        break;
                    }
                    std::this_thread::sleep_for(cfg.failed_poll_backoff);
                    continue;
                }

                any_success = true;
                if (res.status >= 200 && res.status < 300) {
                    auto body = decode<Body>(path, res.body);
                    if (done(body)) {
                        return body;
                    }
                }

                if (steady::now() >= deadline) {
                    break;
                }
                std::this_thread::sleep_for(cfg.status_poll_interval);
            }

            if (!any_success && last_failure) {
                throw transport_error(path, *last_failure);
            }
            return std::nullopt;
        }

        static settings_snapshot fetch_settings(http_transport& transport) {
            auto res = transport.get(endpoints::mcp_settings, {});
            settings_snapshot settings{};
            if (res.failure || res.status != 200) {
                return settings;
            }
            internal::settings_body body{};
            if (glz::read<glz::opts{.error_on_unknown_keys = false}>(body, res.body)) {
                return settings;
            }
            settings.response_character_limit = body.response_character_limit;
            settings.enable_truncation = body.enable_truncation;
            settings.truncation_message = std::move(body.truncation_message);
            return validate_settings(std::move(settings));
        }

        // ── Result formatting ───────────────────────────────────────────

        static std::string format_test_results(const internal::test_status_body& status) {
            std::string text{};
            if (status.has_error && !status.error_message.empty()) {
                text += "Test execution reported an error: {}\n\n"_format(status.error_message);
            }
            if (!status.test_results) {
                text += "Test execution completed but no results available.";
                return text;
            }

            const auto& r = *status.test_results;
            text += "Test Results:\nTotal: {}, Passed: {}, Failed: {}, Skipped: {}\nDuration: {}s\n\n"_format(
                    r.total_tests, r.passed_tests, r.failed_tests, r.skipped_tests, r.duration);

            bool header = false;
            for (const auto& result : r.results) {
                test_outcome outcome{};
                if (!try_parse_test_outcome(result.outcome, outcome) || outcome != test_outcome::failed) {
                    continue;
                }
                if (!header) {
                    text += "Failed Tests:\n";
                    header = true;
                }
                text += "- {}: {}\n"_format(result.name, result.message);
            }
            return text;
        }

        // ── Tools ───────────────────────────────────────────────────────

        static std::string call_compile_and_wait(
                http_transport& transport, const bridge_config& cfg, const compile_args& args) {
            auto timeout = seconds_arg(args.timeout, cfg.default_compile_timeout);

            auto trigger = decode<internal::status_body>(
                    endpoints::compile_and_wait, fetch(transport, endpoints::compile_and_wait));
            verbose_log{"compile trigger: ", trigger.status, " - ", trigger.message};

            auto final_status = poll_until<internal::compile_status_body>(
                    transport, cfg, endpoints::compile_status, timeout, [](const internal::compile_status_body& body) {
                        return body.status == "idle"sv;
                    });
            if (!final_status) {
                return "Warning: compilation did not finish within {} seconds. Use compile_status to check on it."_format(
                        std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
            }

            std::vector<compile_error_line> errors{};
            errors.reserve(final_status->errors.size());
            for (auto& err : final_status->errors) {
                errors.push_back(
                        compile_error_line{.file = std::move(err.file), .line = err.line, .message = std::move(err.message)});
            }
            return format_compile_result(errors);
        }

        static std::string call_run_tests(
                http_transport& transport, const bridge_config& cfg, const run_tests_args& args) {
            auto timeout = seconds_arg(args.timeout, cfg.default_test_timeout);

            test_mode mode{};
            auto mode_text = args.test_mode.value_or(cfg.default_test_mode);
            if (!try_parse_test_mode(mode_text, mode)) {
                throw std::invalid_argument("Invalid test_mode: {} (expected EditMode or PlayMode)"_format(mode_text));
            }

            auto before = decode<internal::test_status_body>(
                    endpoints::test_status, fetch(transport, endpoints::test_status));

            query_params params{{"mode", std::string{to_string(mode)}}};
            if (args.test_filter && !args.test_filter->empty()) {
                params.emplace_back("filter", *args.test_filter);
            }
            if (args.test_filter_regex && !args.test_filter_regex->empty()) {
                params.emplace_back("filter_regex", *args.test_filter_regex);
            }

            auto trigger = decode<internal::status_body>(endpoints::run_tests, fetch(transport, endpoints::run_tests, params));
            if (trigger.status != "ok"sv) {
                return trigger.message;
            }

            // a start failure leaves the run id alone but stamps a new lastTestTime
            std::optional<std::string> start_error{};
            auto started = poll_until<internal::test_status_body>(
                    transport, cfg, endpoints::test_status, cfg.run_start_timeout, [&](const internal::test_status_body& s) {
                        if (s.test_run_id && s.test_run_id != before.test_run_id) {
                            return true;
                        }
                        if (!s.is_running && s.has_error && s.last_test_time != before.last_test_time) {
                            start_error = s.error_message;
                            return true;
                        }
                        return false;
                    });
            if (start_error) {
                throw tool_error{failure_kind::test_start_failed, *start_error};
            }
            if (!started) {
                return "Warning: the test run was accepted but has not started within {} seconds. "
                       "Use test_status to check on it."_format(
                               std::chrono::duration_cast<std::chrono::seconds>(cfg.run_start_timeout).count());
            }

            auto run_id = *started->test_run_id;
            verbose_log{"test run ", run_id, " started"};

            auto finished = poll_until<internal::test_status_body>(
                    transport, cfg, endpoints::test_status, timeout, [&](const internal::test_status_body& s) {
                        return s.test_run_id == run_id && !s.is_running;
                    });
            if (!finished) {
                return "Warning: test run {} did not finish within {} seconds. Use test_status to check on it."_format(
                        run_id, std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
            }
            return format_test_results(*finished);
        }

        static std::string call_refresh_assets(
                http_transport& transport, const bridge_config& cfg, const refresh_args& args) {
            bool force = args.force.value_or(false);

            auto trigger = decode<internal::status_body>(
                    endpoints::refresh_assets,
                    fetch(transport, endpoints::refresh_assets, {{"force", force ? "true" : "false"}}));
            if (trigger.status != "ok"sv) {
                return trigger.message;
            }

            auto done = poll_until<internal::editor_status_body>(
                    transport, cfg, endpoints::editor_status, cfg.refresh_timeout, [](const internal::editor_status_body& s) {
                        return !s.is_refreshing;
                    });
            if (!done) {
                return "Warning: asset refresh did not finish within {} seconds. Use editor_status to check on it."_format(
                        std::chrono::duration_cast<std::chrono::seconds>(cfg.refresh_timeout).count());
            }
            return force ? "Asset database refreshed (force update)." : "Asset database refreshed.";
        }

        static std::string call_cancel_tests(http_transport& transport, const cancel_args& args) {
            query_params params{};
            if (args.test_run_guid && !args.test_run_guid->empty()) {
                params.emplace_back("guid", *args.test_run_guid);
            }
            return fetch(transport, endpoints::cancel_tests, params);
        }

        static std::string call_tool(
                http_transport& transport, const bridge_config& cfg, const std::string& name, const glz::raw_json& raw) {
            if (name == "compile_and_wait"sv) {
                return call_compile_and_wait(transport, cfg, parse_arguments<compile_args>(raw, name));
            }
            if (name == "run_tests"sv) {
                return call_run_tests(transport, cfg, parse_arguments<run_tests_args>(raw, name));
            }
            if (name == "refresh_assets"sv) {
                return call_refresh_assets(transport, cfg, parse_arguments<refresh_args>(raw, name));
            }
            if (name == "editor_status"sv) {
                return fetch(transport, endpoints::editor_status);
            }
            if (name == "compile_status"sv) {
                return fetch(transport, endpoints::compile_status);
            }
            if (name == "test_status"sv) {
                return fetch(transport, endpoints::test_status);
            }
            if (name == "cancel_tests"sv) {
                return call_cancel_tests(transport, parse_arguments<cancel_args>(raw, name));
            }
            throw std::invalid_argument("Unknown tool: {}"_format(name));
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_params params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            if (ec || !params.protocolVersion || params.protocolVersion->empty()) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Invalid params: protocolVersion is required");
            }

            initialize_result result{};
            result.protocolVersion = "2024-11-05";
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = "hostlink", .version = std::string{version_string}};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            for (const auto& tool : tool_catalog) {
                result.tools.push_back(
                        tool_definition{
                                .name = std::string{tool.name},
                                .description = std::string{tool.description},
                                .inputSchema = glz::raw_json{tool.input_schema},
                        });
            }
            return make_response(id, std::move(result));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id,
                glz::raw_json_view raw_params,
                http_transport& transport,
                const bridge_config& cfg) {
            tool_call_params params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }

            std::string text{};
            try {
                text = call_tool(transport, cfg, params.name, params.arguments);
            } catch (const tool_error& e) {
                warn_log{params.name, " failed (", describe(e.kind()).error_type, "): ", e.what()};
                return make_tool_error_response(id, e);
            } catch (const std::invalid_argument& e) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, e.what());
            } catch (const std::exception& e) {
                warn_log{params.name, " failed: ", e.what()};
                return make_error_response(
                        id, glz::rpc::error_e::internal, "Tool execution failed: {}"_format(e.what()));
            }

            tool_call_result result{};
            result.content.push_back(text_content{.text = truncate_text(std::move(text), fetch_settings(transport))});
            return make_response(id, std::move(result));
        }

    }  // namespace detail

    std::string format_compile_result(const std::vector<compile_error_line>& errors) {
        if (errors.empty()) {
            return "Compilation completed successfully with no errors.";
        }
        std::vector<std::string> lines{};
        lines.reserve(errors.size());
        for (const auto& err : errors) {
            lines.push_back("{}:{} - {}"_format(err.file, err.line, err.message));
        }
        return "Compilation completed with errors:\n{}"_format(utils::join_with_separator(lines, "\n"));
    }

    std::string truncate_text(std::string text, const settings_snapshot& settings) {
        auto limit = static_cast<size_t>(std::max(settings.response_character_limit, 0));
        if (!settings.enable_truncation || text.size() <= limit) {
            return text;
        }

        const auto& suffix = settings.truncation_message;
        size_t keep = limit > suffix.size() ? limit - suffix.size() : 0U;
        // never split a multi-byte sequence
        while (keep > 0 && (static_cast<unsigned char>(text[keep]) & 0xC0U) == 0x80U) {
            --keep;
        }
        text.resize(keep);
        text += suffix;
        return text;
    }

    session::session(http_transport& transport, bridge_config cfg) : transport_{transport}, cfg_{std::move(cfg)} {}

    std::optional<std::string> session::handle_line(std::string_view line) {
        if (utils::trim_view(line).empty()) {
            return std::nullopt;
        }

        // request.params views into this buffer
        std::string buffer{line};
        glz::rpc::generic_request_t request{};
        auto ec = glz::read_json(request, buffer);
        if (ec) {
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);
        debug_log{"bridge request: ", request.method};

        if (request.method == "initialize"sv) {
            return detail::handle_initialize(request.id, request.params);
        }
        if (request.method == "notifications/initialized"sv) {
            return std::nullopt;
        }
        if (request.method == "tools/list"sv) {
            return detail::handle_tools_list(request.id);
        }
        if (request.method == "tools/call"sv) {
            return detail::handle_tools_call(request.id, request.params, transport_, cfg_);
        }
        if (is_notification) {
            return std::nullopt;
        }
        return detail::make_error_response(
                request.id,
                glz::rpc::error_e::method_not_found,
                "Method not found: {}"_format(std::string{request.method}));
    }

    int session::run(std::istream& in, std::ostream& out) {
        std::string line{};
        while (std::getline(in, line)) {
            if (auto response = handle_line(line)) {
                out << *response << '\n';
                out.flush();
            }
        }
        return 0;
    }

    int run_bridge(const bridge_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);

        verbose_log{"bridge forwarding to http://", cfg.host, ":", cfg.port};
        httplib_transport transport{cfg};
        session s{transport, cfg};
        return s.run(std::cin, std::cout);
    }

}  // namespace hostlink::bridge
