#pragma once

#include "types.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string_view>
#include <variant>
#include <vector>

namespace hostlink {

    struct compile_request {};

    struct test_start {
        test_filter filter{};
    };

    struct refresh_request {
        bool force{false};
    };

    struct settings_load {};

    // Host-only commands; executed exactly once, in FIFO order, on the host tick.
    using queued_action = std::variant<compile_request, test_start, refresh_request, settings_load>;

    inline constexpr std::string_view action_name(const queued_action& action) {
        struct visitor {
            constexpr std::string_view operator()(const compile_request&) const { return "compile"sv; }
            constexpr std::string_view operator()(const test_start&) const { return "test_start"sv; }
            constexpr std::string_view operator()(const refresh_request&) const { return "refresh"sv; }
            constexpr std::string_view operator()(const settings_load&) const { return "settings_load"sv; }
        };
        return std::visit(visitor{}, action);
    }

    class action_queue {
      public:
        void push(queued_action action);

        // Removes and returns everything queued so far, oldest first.
        std::vector<queued_action> take_all();

        std::vector<queued_action> snapshot() const;
        std::size_t size() const;
        bool empty() const { return size() == 0U; }

      private:
        mutable std::mutex mutex_;
        std::deque<queued_action> pending_;
    };

}  // namespace hostlink
