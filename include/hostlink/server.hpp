#pragma once

#include "actions.hpp"
#include "config.hpp"
#include "host.hpp"
#include "jobs.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace httplib {
    class Server;
}

namespace hostlink {

    struct host_flags {
        bool compiling{false};
        bool playing{false};
    };

    /*
     * Everything the listener thread and the host tick share.
     *
     * One instance per hosted listener; tests create as many as they like.
     * The network side only enqueues actions and reads snapshots; all host
     * calls and all job mutations other than busy check-and-set happen in
     * tick().
     */
    class server_context final : public host_events {
      public:
        explicit server_context(host_adapter& host, server_config cfg = {});

        // One host tick: drain the action queue, deliver host callbacks, run monitors.
        void tick();

        const server_config& config() const { return cfg_; }
        action_queue& queue() { return queue_; }

        compile_job& compile() { return compile_; }
        test_job& tests() { return tests_; }
        refresh_job& refresh() { return refresh_; }
        settings_cache& settings() { return settings_; }

        host_flags flags() const;
        std::size_t monitor_count() const;

        // Cached settings; on first access loads them through the queue (bounded wait).
        // The wait ends early once `stopping` is set.
        settings_snapshot current_settings(const std::atomic<bool>* stopping = nullptr);

        // Forwards to the host's cancel primitive; advisory.
        bool request_cancel(std::string_view run_id);

        // host_events
        void compile_started() override;
        void compile_finished(std::vector<compile_error> errors) override;
        void on_test_event(const test_event& event) override;

      private:
        using monitor = std::function<bool()>;

        void execute(const queued_action& action);
        void run_monitors();
        void sample_host();
        void reload_settings();

        host_adapter& host_;
        server_config cfg_;
        action_queue queue_{};
        compile_job compile_{};
        test_job tests_{};
        refresh_job refresh_{};
        settings_cache settings_{};

        // host tick only
        std::vector<monitor> monitors_{};

        std::atomic<bool> host_compiling_{false};
        std::atomic<bool> host_playing_{false};
        std::atomic<std::size_t> monitor_count_{0};
    };

    struct http_request {
        std::string method{"GET"};
        std::string path{};
        std::map<std::string, std::string> params{};

        std::optional<std::string> param(std::string_view key) const;
    };

    struct http_response {
        int status{200};
        std::string body{};
    };

    // Maps path + query to one of the eight operations; unmatched paths get 404.
    // Handler waits give up as soon as `stopping` is set.
    http_response route(server_context& ctx, const http_request& request, const std::atomic<bool>* stopping = nullptr);

    /*
     * Loopback HTTP listener on a background thread.
     *
     * Requests are handled one at a time, in arrival order. start() is
     * idempotent: it fully stops any previous listener before binding again.
     */
    class http_listener {
      public:
        explicit http_listener(server_context& ctx);
        ~http_listener();

        http_listener(const http_listener&) = delete;
        http_listener& operator=(const http_listener&) = delete;

        // Returns the bound port; throws std::runtime_error if the port cannot be bound.
        int start();
        void stop();

        bool running() const;
        int port() const { return port_; }

      private:
        server_context& ctx_;
        std::shared_ptr<httplib::Server> server_{};
        std::shared_ptr<std::atomic<bool>> finished_{};
        std::shared_ptr<std::atomic<bool>> stopping_{};
        std::thread thread_{};
        int port_{-1};
    };

}  // namespace hostlink
