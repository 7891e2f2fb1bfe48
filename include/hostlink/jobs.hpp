#pragma once

#include "config.hpp"
#include "host.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostlink {

    /*
     * Job state machines.
     *
     * Each job owns one narrow lock, held only while reading, copying or
     * modifying its fields. Network-side callers only check-and-set busy flags
     * and take value snapshots; every other mutation happens on the host tick.
     */

    class compile_job {
      public:
        compile_status snapshot() const;
        bool is_compiling() const;
        std::optional<wall_clock::time_point> last_compile_time() const;

        // host tick
        void on_started();
        void on_finished(std::vector<compile_error> errors, wall_clock::time_point now = wall_clock::now());
        void on_request_failed(std::string_view what, wall_clock::time_point now = wall_clock::now());

      private:
        mutable std::mutex mutex_;
        compile_status status_{};
    };

    class test_job {
      public:
        // Marks the job running unless it already is; the only way a run is admitted.
        bool try_begin();

        test_run_status snapshot() const;
        bool is_running() const;
        // Id of the run the host is executing now; empty while admitted but not yet started.
        std::optional<std::string> current_run_id() const;

        // host tick
        void start(host_adapter& host, const test_filter& filter);
        void handle(host_adapter& host, const test_event& event);

      private:
        void restore_reload_options(host_adapter& host);
        bool accepts_terminal(const std::optional<std::string>& run_id) const;

        mutable std::mutex mutex_;
        test_run_status status_{};
        std::optional<reload_options> saved_reload_{};
    };

    class refresh_job {
      public:
        bool try_begin();
        bool in_progress() const;

        // host tick
        void finish();

      private:
        mutable std::mutex mutex_;
        bool in_progress_{false};
    };

    class settings_cache {
      public:
        std::optional<settings_snapshot> get() const;

        // host tick
        void store(const settings_snapshot& settings, std::chrono::steady_clock::time_point now);
        bool due(std::chrono::steady_clock::time_point now, std::chrono::milliseconds interval) const;

        // True for the first caller only, until the next store().
        bool claim_load_request();

      private:
        mutable std::mutex mutex_;
        std::optional<settings_snapshot> settings_{};
        std::chrono::steady_clock::time_point loaded_at_{};
        bool load_requested_{false};
    };

}  // namespace hostlink
