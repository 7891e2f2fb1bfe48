#include "utils.hpp"

namespace hostlink::test {

    namespace detail {
        static internal::status_body refresh(server_context& ctx, std::map<std::string, std::string> params = {}) {
            return parse_body<internal::status_body>(get(ctx, endpoints::refresh_assets, std::move(params)).body);
        }

        static internal::editor_status_body editor_status(server_context& ctx) {
            return parse_body<internal::editor_status_body>(get(ctx, endpoints::editor_status).body);
        }
    }  // namespace detail

    TEST_CASE("007: refresh is single-flight", "[007][refresh]") {
        fake_host host{};
        server_context ctx{host, fast_server_config()};

        auto first = detail::refresh(ctx);
        CHECK(first.status == "ok");
        CHECK(first.message == "Asset database refresh started.");

        auto second = detail::refresh(ctx);
        CHECK(second.status == "warning");
        CHECK(second.message == "Asset refresh already in progress. Please wait for current refresh to complete.");

        ctx.tick();
        CHECK(host.refresh_forces().size() == 1U);
        CHECK(ctx.monitor_count() == 1U);
    }

    TEST_CASE("007: refresh completes when the host stops updating", "[007][refresh]") {
        fake_host host{};
        server_context ctx{host, fast_server_config()};

        REQUIRE(detail::refresh(ctx).status == "ok");
        ctx.tick();
        ctx.tick();
        CHECK(detail::editor_status(ctx).is_refreshing);

        host.finish_refresh();
        ctx.tick();
        CHECK_FALSE(detail::editor_status(ctx).is_refreshing);
        CHECK(ctx.monitor_count() == 0U);

        CHECK(detail::refresh(ctx).status == "ok");
    }

    TEST_CASE("007: force is forwarded to the host", "[007][refresh]") {
        fake_host host{};
        server_context ctx{host, fast_server_config()};

        auto res = detail::refresh(ctx, {{"force", "true"}});
        CHECK(res.message == "Asset database refresh started (force update).");
        ctx.tick();
        host.finish_refresh();
        ctx.tick();

        REQUIRE(detail::refresh(ctx, {{"force", "no"}}).status == "ok");
        ctx.tick();

        CHECK(host.refresh_forces() == std::vector<bool>{true, false});
    }

    TEST_CASE("007: a refresh the host rejects does not stay busy", "[007][refresh]") {
        fake_host host{};
        host.refresh_failure = "database locked";
        server_context ctx{host, fast_server_config()};

        REQUIRE(detail::refresh(ctx).status == "ok");
        ctx.tick();

        CHECK_FALSE(ctx.refresh().in_progress());
        CHECK(ctx.monitor_count() == 0U);
    }

    TEST_CASE("007: test start waits for an active refresh", "[007][refresh][tests]") {
        fake_host host{};
        server_context ctx{host, fast_server_config()};
        host_loop loop{ctx};

        REQUIRE(detail::refresh(ctx).status == "ok");
        REQUIRE(eventually([&] { return ctx.monitor_count() == 1U; }));

        std::thread finisher{[&] {
            std::this_thread::sleep_for(50ms);
            host.finish_refresh();
        }};

        auto started = parse_body<internal::status_body>(get(ctx, endpoints::run_tests).body);
        finisher.join();

        CHECK(started.status == "ok");
        CHECK_FALSE(ctx.refresh().in_progress());
    }

    TEST_CASE("007: editor status reports every busy flag", "[007][status]") {
        fake_host host{};
        host.auto_compile = false;
        server_context ctx{host, fast_server_config()};

        auto idle = detail::editor_status(ctx);
        CHECK_FALSE(idle.is_compiling);
        CHECK_FALSE(idle.is_running_tests);
        CHECK_FALSE(idle.is_playing);
        CHECK_FALSE(idle.is_refreshing);

        host.set_playing(true);
        ctx.tick();
        REQUIRE(parse_body<internal::status_body>(get(ctx, endpoints::run_tests).body).status == "ok");

        auto busy = detail::editor_status(ctx);
        CHECK(busy.is_playing);
        CHECK(busy.is_running_tests);
        CHECK_FALSE(busy.is_compiling);
    }

}  // namespace hostlink::test
