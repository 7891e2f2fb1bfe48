#pragma once

#include "host.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostlink {

    /*
     * Process-backed host adapter
     *
     * - compile_command: Shell command run on every compile request; errors are
     *   read from gcc/clang-style and msbuild-style diagnostics in its output.
     * - test_command: Shell command that prints TAP; the filter is passed in
     *   HOSTLINK_TEST_MODE, HOSTLINK_TEST_NAMES and HOSTLINK_TEST_GROUP.
     * - refresh_command: Shell command run on refresh; HOSTLINK_REFRESH_FORCE is 0 or 1.
     * - settings_path: JSON settings file; written with defaults when missing.
     */
    struct process_host_config {
        std::string compile_command{};
        std::string test_command{};
        std::string refresh_command{};
        std::filesystem::path settings_path{".hostlink/settings.json"};
    };

    std::vector<compile_error> parse_compile_diagnostics(std::string_view output);

    // TAP -> assembly/suite/test tree; suites group names by their text up to the last '.'.
    test_node parse_tap_results(std::string_view output, std::string assembly_name, double duration);

    settings_snapshot read_settings_file(const std::filesystem::path& path);
    void write_settings_file(const settings_snapshot& settings, const std::filesystem::path& path);

    namespace detail {
        struct child_process;
    }

    class process_host final : public host_adapter {
      public:
        explicit process_host(process_host_config cfg);
        ~process_host() override;

        process_host(const process_host&) = delete;
        process_host& operator=(const process_host&) = delete;

        void request_compile() override;
        bool is_compiling() const override;

        std::string execute_tests(const test_filter& filter) override;
        bool cancel_test_run(std::string_view run_id) override;

        void refresh_assets(bool force) override;
        bool is_updating() const override;

        bool is_playing() const override { return false; }

        reload_options current_reload_options() const override { return reload_; }
        void apply_reload_options(const reload_options& options) override { reload_ = options; }

        settings_snapshot load_settings() override;

        void poll(host_events& events) override;

      private:
        void poll_compile(host_events& events);
        void poll_tests(host_events& events);
        void poll_refresh();

        process_host_config cfg_;
        reload_options reload_{};

        std::unique_ptr<detail::child_process> compile_child_{};
        bool compile_announced_{false};

        // cancel_test_run() reads these from the listener thread
        mutable std::mutex test_mutex_;
        std::unique_ptr<detail::child_process> test_child_{};
        std::string test_run_id_{};
        bool test_announced_{false};

        std::unique_ptr<detail::child_process> refresh_child_{};

        std::uint64_t run_counter_{0};
    };

}  // namespace hostlink
