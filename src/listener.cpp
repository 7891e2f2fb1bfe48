#include "hostlink/server.hpp"

#include "hostlink/format.hpp"

#include <httplib.h>

#include <exception>
#include <stdexcept>
#include <utility>

using namespace hostlink::literals;

namespace hostlink {

    namespace detail {

        static void add_cors_headers(httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
        }

        static http_request to_request(const httplib::Request& req) {
            http_request out{.method = req.method, .path = req.path, .params = {}};
            // first occurrence of a repeated key wins
            for (const auto& [key, value] : req.params) {
                out.params.emplace(key, value);
            }
            return out;
        }

    }  // namespace detail

    http_listener::http_listener(server_context& ctx) : ctx_{ctx} {}

    http_listener::~http_listener() {
        stop();
    }

    bool http_listener::running() const {
        return server_ && finished_ && !finished_->load();
    }

    int http_listener::start() {
        // restart always tears the previous listener down first
        stop();

        auto server = std::make_shared<httplib::Server>();
        auto stopping = std::make_shared<std::atomic<bool>>(false);

        // one worker: requests are handled serially in arrival order
        server->new_task_queue = [] { return new httplib::ThreadPool(1); };
        server->set_keep_alive_max_count(1);

        auto handler = [&ctx = ctx_, stopping](const httplib::Request& req, httplib::Response& res) {
            detail::add_cors_headers(res);
            try {
                auto response = route(ctx, detail::to_request(req), stopping.get());
                res.status = response.status;
                if (!response.body.empty()) {
                    res.set_content(response.body, "application/json");
                }
            } catch (const std::exception& e) {
                if (!stopping->load()) {
                    warn_log{"request ", req.method, " ", req.path, " failed: ", e.what()};
                }
                res.status = 500;
                res.set_content(R"({"status":"error","message":"Internal server error"})", "application/json");
            }
        };

        server->Get(".*", handler);
        server->Post(".*", handler);
        server->Options(".*", handler);

        const auto& cfg = ctx_.config();
        int bound = -1;
        if (cfg.port == 0) {
            bound = server->bind_to_any_port(cfg.bind_address);
        }
        else if (server->bind_to_port(cfg.bind_address, cfg.port)) {
            bound = cfg.port;
        }
        if (bound < 0) {
            throw std::runtime_error("failed to bind {}:{}"_format(cfg.bind_address, cfg.port));
        }

        auto finished = std::make_shared<std::atomic<bool>>(false);
        thread_ = std::thread([server, finished, stopping] {
            try {
                if (!server->listen_after_bind() && !stopping->load()) {
                    warn_log{"listener exited unexpectedly"};
                }
            } catch (const std::exception& e) {
                if (!stopping->load()) {
                    warn_log{"listener failed: ", e.what()};
                }
            }
            finished->store(true);
        });

        server_ = std::move(server);
        finished_ = std::move(finished);
        stopping_ = std::move(stopping);
        port_ = bound;

        verbose_log{"listening on http://", cfg.bind_address, ":", port_};
        return port_;
    }

    void http_listener::stop() {
        if (!server_) {
            return;
        }

        stopping_->store(true);
        server_->stop();

        // handler waits observe the stopping flag, so the worker pool drains promptly
        auto finished = finished_;
        bool prompt = utils::wait_until([&] { return finished->load(); }, ctx_.config().shutdown_timeout, 10ms);
        if (!prompt) {
            warn_log{"listener thread did not exit within ", ctx_.config().shutdown_timeout.count(), "ms; waiting for it"};
        }
        if (thread_.joinable()) {
            thread_.join();
        }

        verbose_log{"listener on port ", port_, " stopped"};
        server_.reset();
        finished_.reset();
        stopping_.reset();
        port_ = -1;
    }

}  // namespace hostlink
