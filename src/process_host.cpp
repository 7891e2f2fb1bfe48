#include "hostlink/process_host.hpp"

#include "hostlink/format.hpp"

#include "internal/subprocess.hpp"
#include "internal/types.hpp"

#include <glaze/glaze.hpp>

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace hostlink::literals;
namespace fs = std::filesystem;

namespace hostlink {

    namespace detail {

        static std::vector<std::string_view> split_lines(std::string_view text) {
            std::vector<std::string_view> lines{};
            while (!text.empty()) {
                auto eol = text.find('\n');
                auto line = text.substr(0, eol);
                if (!line.empty() && line.back() == '\r') {
                    line.remove_suffix(1);
                }
                lines.push_back(line);
                if (eol == std::string_view::npos) {
                    break;
                }
                text.remove_prefix(eol + 1);
            }
            return lines;
        }

        static bool all_digits(std::string_view s) {
            return !s.empty() && std::ranges::all_of(s, [](char c) { return c >= '0' && c <= '9'; });
        }

        // "<sev>: message" or "<sev> CODE: message", where sev is error or fatal error
        static std::optional<std::string> error_message_after(std::string_view rest) {
            rest = utils::trim_view(rest);
            if (rest.starts_with("fatal "sv)) {
                rest.remove_prefix(6);
            }
            if (!rest.starts_with("error"sv)) {
                return std::nullopt;
            }
            rest.remove_prefix(5);
            auto colon = rest.find(':');
            if (colon == std::string_view::npos) {
                return std::nullopt;
            }
            // anything between "error" and ':' must be a diagnostic code, e.g. " CS1002"
            auto code = utils::trim_view(rest.substr(0, colon));
            if (code.find(' ') != std::string_view::npos) {
                return std::nullopt;
            }
            return std::string{utils::trim_view(rest.substr(colon + 1))};
        }

        // path:line[:col]: [fatal ]error: message
        static std::optional<compile_error> parse_gnu_diagnostic(std::string_view line) {
            size_t search = 0;
            while (true) {
                auto colon = line.find(':', search);
                if (colon == std::string_view::npos || colon == 0) {
                    return std::nullopt;
                }
                auto after = line.substr(colon + 1);
                auto line_end = after.find(':');
                if (line_end != std::string_view::npos && all_digits(after.substr(0, line_end))) {
                    auto file = line.substr(0, colon);
                    auto line_no = utils::parse_arithmetic<int>(after.substr(0, line_end)).value_or(0);
                    auto rest = after.substr(line_end + 1);

                    auto col_end = rest.find(':');
                    if (col_end != std::string_view::npos && all_digits(rest.substr(0, col_end))) {
                        rest = rest.substr(col_end + 1);
                    }
                    if (auto message = error_message_after(rest)) {
                        return compile_error{.file = std::string{file}, .line = line_no, .message = std::move(*message)};
                    }
                    return std::nullopt;
                }
                // drive letters and other colons in the path
                search = colon + 1;
            }
        }

        // path(line[,col]): error CODE: message
        static std::optional<compile_error> parse_msbuild_diagnostic(std::string_view line) {
            auto close = line.find("):"sv);
            if (close == std::string_view::npos) {
                return std::nullopt;
            }
            auto open = line.rfind('(', close);
            if (open == std::string_view::npos || open == 0) {
                return std::nullopt;
            }
            auto location = line.substr(open + 1, close - open - 1);
            auto line_text = location.substr(0, location.find(','));
            auto line_no = utils::parse_arithmetic<int>(line_text);
            if (!line_no) {
                return std::nullopt;
            }
            if (auto message = error_message_after(line.substr(close + 2))) {
                return compile_error{
                        .file = std::string{utils::trim_view(line.substr(0, open))},
                        .line = *line_no,
                        .message = std::move(*message)};
            }
            return std::nullopt;
        }

        struct tap_line {
            bool ok{false};
            std::string name{};
            std::optional<std::string> directive{};
            std::string directive_reason{};
        };

        // "ok 3 - name # SKIP reason", "not ok 4 name"
        static std::optional<tap_line> parse_tap_line(std::string_view line) {
            tap_line out{};
            if (line.starts_with("not ok"sv)) {
                line.remove_prefix(6);
            }
            else if (line.starts_with("ok"sv)) {
                out.ok = true;
                line.remove_prefix(2);
            }
            else {
                return std::nullopt;
            }
            if (!line.empty() && line.front() != ' ') {
                return std::nullopt;
            }
            line = utils::trim_view(line);

            auto num_end = line.find_first_not_of("0123456789");
            line = utils::trim_view(line.substr(num_end == std::string_view::npos ? line.size() : num_end));
            if (line.starts_with('-')) {
                line = utils::trim_view(line.substr(1));
            }

            if (auto hash = line.find(" # "sv); hash != std::string_view::npos) {
                auto directive = utils::trim_view(line.substr(hash + 3));
                line = utils::trim_view(line.substr(0, hash));
                auto word_end = directive.find(' ');
                auto word = directive.substr(0, word_end);
                if (utils::str_case_eq(word, "SKIP"sv) || utils::str_case_eq(word, "TODO"sv)) {
                    out.directive = std::string{word};
                    std::ranges::transform(*out.directive, out.directive->begin(), [](char c) {
                        return static_cast<char>(c >= 'a' && c <= 'z' ? c - ('a' - 'A') : c);
                    });
                    if (word_end != std::string_view::npos) {
                        out.directive_reason = std::string{utils::trim_view(directive.substr(word_end))};
                    }
                }
            }
            out.name = line.empty() ? "(unnamed)" : std::string{line};
            return out;
        }

        static std::string make_run_id(std::uint64_t counter) {
            auto now = std::chrono::system_clock::now();
            auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
            auto timestamp_ms = static_cast<long long>(epoch_ms % 1000LL);
            auto timestamp_s = std::chrono::system_clock::to_time_t(now);

            std::tm utc_tm{};
            gmtime_r(&timestamp_s, &utc_tm);

            std::ostringstream os{};
            os << "run_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%S");
            os << '_' << std::setw(3) << std::setfill('0') << timestamp_ms;
            os << "_pid" << static_cast<long>(::getpid()) << '_' << counter;
            return os.str();
        }

        static std::string tail(std::string_view text, size_t max_chars) {
            text = utils::trim_view(text);
            if (text.size() > max_chars) {
                text.remove_prefix(text.size() - max_chars);
            }
            return std::string{text};
        }

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

    }  // namespace detail

    std::vector<compile_error> parse_compile_diagnostics(std::string_view output) {
        std::vector<compile_error> errors{};
        for (auto line : detail::split_lines(output)) {
            if (auto err = detail::parse_msbuild_diagnostic(line)) {
                errors.push_back(std::move(*err));
            }
            else if (auto gnu = detail::parse_gnu_diagnostic(line)) {
                errors.push_back(std::move(*gnu));
            }
        }
        return errors;
    }

    test_node parse_tap_results(std::string_view output, std::string assembly_name, double duration) {
        test_node root{.name = std::move(assembly_name), .kind = node_kind::assembly, .duration = duration};
        test_node* last_failed = nullptr;

        auto suite_for = [&](std::string_view suite_name) -> test_node& {
            for (auto& suite : root.children) {
                if (suite.name == suite_name) {
                    return suite;
                }
            }
            root.children.push_back(
                    test_node{.name = std::string{suite_name}, .kind = node_kind::suite, .outcome = test_outcome::passed});
            return root.children.back();
        };

        for (auto line : detail::split_lines(output)) {
            if (line.starts_with('#')) {
                // diagnostics belong to the preceding failure
                if (last_failed) {
                    auto diag = utils::trim_view(line.substr(1));
                    if (!diag.empty()) {
                        if (!last_failed->message.empty()) {
                            last_failed->message += '\n';
                        }
                        last_failed->message += diag;
                    }
                }
                continue;
            }

            auto parsed = detail::parse_tap_line(utils::trim_view(line));
            if (!parsed) {
                continue;
            }

            test_node leaf{.name = parsed->name, .kind = node_kind::test};
            if (parsed->directive == "SKIP"sv) {
                leaf.outcome = test_outcome::skipped;
                leaf.message = parsed->directive_reason;
            }
            else if (parsed->directive == "TODO"sv) {
                leaf.outcome = test_outcome::inconclusive;
                leaf.message = parsed->directive_reason;
            }
            else {
                leaf.outcome = parsed->ok ? test_outcome::passed : test_outcome::failed;
            }

            auto dot = leaf.name.rfind('.');
            auto suite_name = dot == std::string::npos ? std::string_view{root.name}
                                                       : std::string_view{leaf.name}.substr(0, dot);
            auto& suite = suite_for(suite_name);
            if (leaf.outcome == test_outcome::failed) {
                suite.outcome = test_outcome::failed;
                root.outcome = test_outcome::failed;
            }
            suite.children.push_back(std::move(leaf));

            // diagnostics attach only to the most recent result line
            last_failed = suite.children.back().outcome == test_outcome::failed ? &suite.children.back() : nullptr;
        }

        if (root.outcome != test_outcome::failed && !root.children.empty()) {
            root.outcome = test_outcome::passed;
        }
        return root;
    }

    settings_snapshot read_settings_file(const fs::path& path) {
        internal::persisted_settings data{};
        auto json = detail::read_text_file(path);
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(data, json);
        if (ec) {
            throw std::runtime_error("failed to parse json file {}"_format(path.string()));
        }

        constexpr int supported_schema_version = 1;
        if (data.schema_version > supported_schema_version) {
            throw std::runtime_error(
                    "unsupported schema_version in {}: {} > {}"_format(
                            path.string(), data.schema_version, supported_schema_version));
        }

        return settings_snapshot{
                .response_character_limit = data.response_character_limit,
                .enable_truncation = data.enable_truncation,
                .truncation_message = std::move(data.truncation_message),
                .debug_logs = data.enable_debug_logs,
                .port = data.server_port};
    }

    void write_settings_file(const settings_snapshot& settings, const fs::path& path) {
        internal::persisted_settings data{
                .schema_version = 1,
                .response_character_limit = settings.response_character_limit,
                .enable_truncation = settings.enable_truncation,
                .truncation_message = settings.truncation_message,
                .enable_debug_logs = settings.debug_logs,
                .server_port = settings.port};

        std::string json{};
        auto ec = glz::write_json(data, json);
        if (ec) {
            throw std::runtime_error("failed to serialize json for {}"_format(path.string()));
        }

        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out{path};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        out << json << '\n';
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(path.string()));
        }
    }

    // ── process_host ────────────────────────────────────────────────────

    process_host::process_host(process_host_config cfg) : cfg_{std::move(cfg)} {}

    process_host::~process_host() = default;

    void process_host::request_compile() {
        if (cfg_.compile_command.empty()) {
            throw std::runtime_error("no compile command configured");
        }
        if (compile_child_) {
            debug_log{"compile already running; ignoring request"};
            return;
        }
        compile_child_ = internal::subprocess::spawn_shell(cfg_.compile_command, {});
        compile_announced_ = false;
        verbose_log{"spawned compile command (pid ", compile_child_->pid, ")"};
    }

    bool process_host::is_compiling() const {
        return compile_child_ != nullptr;
    }

    std::string process_host::execute_tests(const test_filter& filter) {
        if (cfg_.test_command.empty()) {
            throw std::runtime_error("no test command configured");
        }

        std::lock_guard lock{test_mutex_};
        if (test_child_) {
            throw std::runtime_error("test run {} is still active"_format(test_run_id_));
        }

        auto run_id = detail::make_run_id(++run_counter_);
        internal::subprocess::environment env{
                {"HOSTLINK_TEST_MODE", std::string{to_string(filter.mode)}},
                {"HOSTLINK_TEST_NAMES", utils::join_with_separator(filter.names, "|")},
                {"HOSTLINK_TEST_GROUP", filter.group_pattern.value_or("")},
                {"HOSTLINK_TEST_RUN_ID", run_id}};

        test_child_ = internal::subprocess::spawn_shell(cfg_.test_command, env);
        test_run_id_ = run_id;
        test_announced_ = false;
        verbose_log{"spawned test command for run ", run_id, " (pid ", test_child_->pid, ")"};
        return run_id;
    }

    bool process_host::cancel_test_run(std::string_view run_id) {
        std::lock_guard lock{test_mutex_};
        if (!test_child_ || run_id != test_run_id_) {
            return false;
        }
        verbose_log{"terminating test run ", run_id};
        return internal::subprocess::terminate(*test_child_, SIGTERM);
    }

    void process_host::refresh_assets(bool force) {
        if (cfg_.refresh_command.empty()) {
            debug_log{"no refresh command configured; refresh is a no-op"};
            return;
        }
        if (refresh_child_) {
            debug_log{"refresh already running; ignoring request"};
            return;
        }
        refresh_child_ = internal::subprocess::spawn_shell(
                cfg_.refresh_command, {{"HOSTLINK_REFRESH_FORCE", force ? "1" : "0"}});
        verbose_log{"spawned refresh command (pid ", refresh_child_->pid, ")"};
    }

    bool process_host::is_updating() const {
        return refresh_child_ != nullptr;
    }

    settings_snapshot process_host::load_settings() {
        if (!fs::exists(cfg_.settings_path)) {
            settings_snapshot defaults{};
            write_settings_file(defaults, cfg_.settings_path);
            verbose_log{"wrote default settings to ", cfg_.settings_path.string()};
            return defaults;
        }
        return read_settings_file(cfg_.settings_path);
    }

    void process_host::poll(host_events& events) {
        poll_compile(events);
        poll_tests(events);
        poll_refresh();
    }

    void process_host::poll_compile(host_events& events) {
        if (!compile_child_) {
            return;
        }
        if (!compile_announced_) {
            compile_announced_ = true;
            events.compile_started();
        }
        if (!internal::subprocess::try_reap(*compile_child_)) {
            return;
        }

        auto child = std::move(compile_child_);
        auto errors = parse_compile_diagnostics(child->output);
        auto exit_code = child->exit_code.value_or(1);
        if (errors.empty() && exit_code != 0) {
            errors.push_back(
                    compile_error{
                            .file = "",
                            .line = 0,
                            .message = "compile command exited with code {}: {}"_format(
                                    exit_code, detail::tail(child->output, 400))});
        }
        events.compile_finished(std::move(errors));
    }

    void process_host::poll_tests(host_events& events) {
        std::unique_ptr<detail::child_process> done{};
        std::string run_id{};
        bool announce = false;
        {
            std::lock_guard lock{test_mutex_};
            if (!test_child_) {
                return;
            }
            if (!test_announced_) {
                test_announced_ = true;
                announce = true;
            }
            run_id = test_run_id_;
            if (internal::subprocess::try_reap(*test_child_)) {
                done = std::move(test_child_);
                test_run_id_.clear();
            }
        }

        if (announce) {
            events.on_test_event(run_started{.run_id = run_id});
        }
        if (!done) {
            return;
        }

        auto exit_code = done->exit_code.value_or(1);
        auto root = parse_tap_results(done->output, "hostlink-tests", internal::subprocess::elapsed_seconds(*done));
        auto results = flatten_results(root);

        if (results.empty() && exit_code != 0) {
            events.on_test_event(
                    run_error{
                            .message = "test command for run {} exited with code {}: {}"_format(
                                    run_id, exit_code, detail::tail(done->output, 400)),
                            .run_id = run_id});
            return;
        }

        for (auto& result : results) {
            events.on_test_event(test_finished{.result = std::move(result)});
        }
        events.on_test_event(run_finished{.root = std::move(root), .run_id = run_id});
    }

    void process_host::poll_refresh() {
        if (!refresh_child_ || !internal::subprocess::try_reap(*refresh_child_)) {
            return;
        }
        auto child = std::move(refresh_child_);
        if (auto code = child->exit_code.value_or(1); code != 0) {
            warn_log{"refresh command exited with code ", code, ": ", detail::tail(child->output, 200)};
        }
    }

}  // namespace hostlink
