#include "hostlink/types.hpp"

#include "hostlink/format.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace hostlink {

    namespace detail {
        static void collect_results(const test_node& node, std::vector<test_result>& out) {
            if (node.kind != node_kind::test) {
                for (const auto& child : node.children) {
                    collect_results(child, out);
                }
                return;
            }
            out.push_back(
                    test_result{
                            .name = node.name,
                            .outcome = node.outcome,
                            .message = node.message,
                            .duration = node.duration});
        }
    }  // namespace detail

    std::vector<test_result> flatten_results(const test_node& root) {
        std::vector<test_result> out{};
        detail::collect_results(root, out);
        return out;
    }

    test_summary summarize(std::vector<test_result> results, double duration) {
        auto count = [&](test_outcome outcome) {
            return static_cast<int>(
                    std::ranges::count_if(results, [&](const test_result& r) { return r.outcome == outcome; }));
        };

        test_summary summary{};
        summary.passed_tests = count(test_outcome::passed);
        summary.failed_tests = count(test_outcome::failed);
        // inconclusive counts as skipped: passed + failed + skipped == total
        summary.skipped_tests = count(test_outcome::skipped) + count(test_outcome::inconclusive);
        summary.total_tests = static_cast<int>(results.size());
        summary.duration = duration;
        summary.results = std::move(results);
        return summary;
    }

    std::string format_timestamp(const std::optional<wall_clock::time_point>& tp) {
        if (!tp) {
            return {};
        }
        return std::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::floor<std::chrono::seconds>(*tp));
    }

}  // namespace hostlink
