#include "utils.hpp"

namespace hostlink::test {

    TEST_CASE("004: compile status before any trigger is idle with no errors", "[004][compile]") {
        fake_host host{};
        server_context ctx{host, fast_server_config()};

        auto res = get(ctx, endpoints::compile_status);
        CHECK(res.status == 200);
        auto body = parse_body<internal::compile_status_body>(res.body);
        CHECK(body.status == "idle");
        CHECK_FALSE(body.is_compiling);
        CHECK(body.last_compile_time.empty());
        CHECK(body.errors.empty());
    }

    TEST_CASE("004: compile job transitions replace errors and timestamp together", "[004][compile]") {
        compile_job job{};
        job.on_started();
        CHECK(job.is_compiling());
        CHECK_FALSE(job.last_compile_time());

        auto t1 = wall_clock::now();
        job.on_finished({compile_error{.file = "a.cs", .line = 3, .message = "x"}}, t1);
        auto snap = job.snapshot();
        CHECK_FALSE(snap.compiling);
        CHECK(snap.last_compile_time == t1);
        REQUIRE(snap.errors.size() == 1U);

        // snapshots are copies
        snap.errors.clear();
        CHECK(job.snapshot().errors.size() == 1U);

        job.on_started();
        job.on_finished({}, t1 + 1s);
        CHECK(job.snapshot().errors.empty());
        CHECK(job.last_compile_time() == t1 + 1s);
    }

    TEST_CASE("004: compile-and-wait reports a started compile and its single error", "[004][compile]") {
        fake_host host{};
        host.compile_errors = {compile_error{.file = "Assets/Player.cs", .line = 12, .message = "; expected"}};
        server_context ctx{host, fast_server_config()};
        host_loop loop{ctx};

        auto res = get(ctx, endpoints::compile_and_wait);
        auto body = parse_body<internal::status_body>(res.body);
        CHECK(body.status == "ok");
        CHECK((body.message == "Compilation started." || body.message == "Compilation completed quickly."));

        REQUIRE(eventually([&] {
            return parse_body<internal::compile_status_body>(get(ctx, endpoints::compile_status).body).status == "idle" &&
                   ctx.compile().last_compile_time().has_value();
        }));

        auto status = parse_body<internal::compile_status_body>(get(ctx, endpoints::compile_status).body);
        REQUIRE(status.errors.size() == 1U);
        CHECK_FALSE(status.errors[0].file.empty());
        CHECK_FALSE(status.errors[0].message.empty());
        CHECK(status.errors[0].line == 12);
        CHECK_FALSE(status.last_compile_time.empty());
    }

    TEST_CASE("004: compile too fast to observe reports completed quickly", "[004][compile]") {
        fake_host host{};
        host.auto_compile = false;
        server_context ctx{host, fast_server_config()};

        // finishes within the request's own tick, never observed as compiling
        std::thread tick_thread{[&] {
            utils::wait_until([&] { return !ctx.queue().empty(); }, 2s, 1ms);
            ctx.tick();
            ctx.compile_finished({});
        }};

        auto body = parse_body<internal::status_body>(get(ctx, endpoints::compile_and_wait).body);
        tick_thread.join();
        CHECK(body.status == "ok");
        CHECK(body.message == "Compilation completed quickly.");
    }

    TEST_CASE("004: compile that never starts yields a warning", "[004][compile]") {
        fake_host host{};
        host.auto_compile = false;
        server_context ctx{host, fast_server_config()};
        host_loop loop{ctx};

        auto body = parse_body<internal::status_body>(get(ctx, endpoints::compile_and_wait).body);
        CHECK(body.status == "warning");
        CHECK(body.message == "Compilation may not have started.");
        CHECK(host.compile_calls() == 1);
    }

    TEST_CASE("004: a throwing compile request records a synthetic error", "[004][compile]") {
        fake_host host{};
        host.compile_failure = "editor is busy";
        server_context ctx{host, fast_server_config()};
        host_loop loop{ctx};

        auto body = parse_body<internal::status_body>(get(ctx, endpoints::compile_and_wait).body);
        CHECK(body.status == "ok");
        CHECK(body.message == "Compilation completed quickly.");

        auto status = parse_body<internal::compile_status_body>(get(ctx, endpoints::compile_status).body);
        CHECK(status.status == "idle");
        REQUIRE(status.errors.size() == 1U);
        CHECK(status.errors[0].message.find("editor is busy") != std::string::npos);
    }

    TEST_CASE("004: compile waits for an active refresh before polling", "[004][compile][refresh]") {
        fake_host host{};
        server_context ctx{host, fast_server_config()};
        host_loop loop{ctx};

        auto refresh = parse_body<internal::status_body>(get(ctx, endpoints::refresh_assets).body);
        REQUIRE(refresh.status == "ok");
        REQUIRE(eventually([&] { return host.is_updating(); }));

        auto start = std::chrono::steady_clock::now();
        std::thread finisher{[&] {
            std::this_thread::sleep_for(100ms);
            host.finish_refresh();
        }};

        auto body = parse_body<internal::status_body>(get(ctx, endpoints::compile_and_wait).body);
        finisher.join();

        CHECK(std::chrono::steady_clock::now() - start >= 100ms);
        CHECK(body.status == "ok");
        CHECK_FALSE(ctx.refresh().in_progress());
    }

}  // namespace hostlink::test
