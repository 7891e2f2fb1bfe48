#include "hostlink/bridge.hpp"

#include "hostlink/format.hpp"

#include <httplib.h>

#include <chrono>

using namespace hostlink::literals;

namespace hostlink::bridge {

    namespace detail {
        static transport_failure to_failure(httplib::Error err) {
            switch (err) {
                case httplib::Error::Connection:
                    return transport_failure::connection_refused;
                case httplib::Error::Read:
                    return transport_failure::connection_reset;
                case httplib::Error::Write:
                    return transport_failure::broken_pipe;
                case httplib::Error::ConnectionTimeout:
                    return transport_failure::timeout;
                default:
                    return transport_failure::other;
            }
        }
    }  // namespace detail

    httplib_transport::httplib_transport(const bridge_config& cfg)
            : client_{std::make_unique<httplib::Client>(cfg.host, cfg.port)} {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(cfg.request_timeout);
        auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(cfg.request_timeout - secs);
        client_->set_connection_timeout(secs.count(), usecs.count());
        client_->set_read_timeout(secs.count(), usecs.count());
        client_->set_write_timeout(secs.count(), usecs.count());
        client_->set_keep_alive(false);
    }

    httplib_transport::~httplib_transport() = default;

    http_result httplib_transport::get(std::string_view path, const query_params& params) {
        httplib::Params query{};
        for (const auto& [key, value] : params) {
            query.emplace(key, value);
        }

        auto res = client_->Get(std::string{path}, query, httplib::Headers{});
        if (!res) {
            auto err = res.error();
            return http_result{
                    .status = 0, .body = {}, .failure = detail::to_failure(err), .detail = httplib::to_string(err)};
        }
        return http_result{.status = res->status, .body = res->body, .failure = std::nullopt, .detail = {}};
    }

    failure_kind classify(transport_failure failure) {
        switch (failure) {
            case transport_failure::connection_refused:
                return failure_kind::host_unavailable;
            case transport_failure::connection_reset:
            case transport_failure::broken_pipe:
            case transport_failure::timeout:
                return failure_kind::host_restarting;
            case transport_failure::other:
                break;
        }
        return failure_kind::host_unavailable;
    }

    failure_info describe(failure_kind kind) {
        switch (kind) {
            case failure_kind::host_unavailable:
                return {.error_type = "host_unavailable"sv,
                        .instructions = "The host is not running or its listener is not reachable. Start the host "
                                        "and make sure the configured port matches, then try again."sv,
                        .retryable = false};
            case failure_kind::host_restarting:
                return {.error_type = "host_restarting"sv,
                        .instructions = "The host dropped the connection, most likely while reloading after a "
                                        "compile. Wait a few seconds and retry the same call."sv,
                        .retryable = true};
            case failure_kind::test_start_failed:
                return {.error_type = "test_start_failed"sv,
                        .instructions = "The host accepted the request but no test run started. Check the host for "
                                        "compile errors, then retry."sv,
                        .retryable = true};
            case failure_kind::invalid_response:
                return {.error_type = "invalid_response"sv,
                        .instructions = "The host answered with a body that could not be understood. Make sure the "
                                        "host and bridge versions match."sv,
                        .retryable = false};
        }
        return {.error_type = "unknown"sv, .instructions = {}, .retryable = false};
    }

}  // namespace hostlink::bridge
