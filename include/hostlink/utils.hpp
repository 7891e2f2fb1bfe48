#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <charconv>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace hostlink {

    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

// Debug logger; no-op on release builds
#ifndef NDEBUG
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace detail {
        inline std::atomic<bool>& verbose_flag() {
            static std::atomic<bool> flag{false};
            return flag;
        }
    }  // namespace detail

    inline void set_verbose_logging(bool enabled) {
        detail::verbose_flag().store(enabled, std::memory_order_relaxed);
    }

    inline bool verbose_logging() {
        return detail::verbose_flag().load(std::memory_order_relaxed);
    }

    // Runtime-gated logger, toggled by settings or --verbose
    template <typename... Args>
    struct verbose_log {
        explicit verbose_log(Args&&... args) {
            if (!verbose_logging()) {
                return;
            }
            std::cerr << "[hostlink] ";
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };

    template <typename... Args>
    verbose_log(Args&&...) -> verbose_log<Args...>;

    template <typename... Args>
    struct warn_log {
        explicit warn_log(Args&&... args) {
            std::cerr << "[hostlink] warning: ";
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };

    template <typename... Args>
    warn_log(Args&&...) -> warn_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        // Empty pieces are dropped; "a||b" yields {"a", "b"}.
        inline std::vector<std::string> split_nonempty(std::string_view value, char separator) {
            std::vector<std::string> out{};
            for (auto piece : value | std::views::split(separator)) {
                auto sv = trim_view(std::string_view{piece.begin(), piece.end()});
                if (!sv.empty()) {
                    out.emplace_back(sv);
                }
            }
            return out;
        }

        inline bool parse_bool(std::string_view text, bool fallback) {
            if (str_case_eq(text, "true") || text == "1" || str_case_eq(text, "yes")) {
                return true;
            }
            if (str_case_eq(text, "false") || text == "0" || str_case_eq(text, "no")) {
                return false;
            }
            return fallback;
        }

        // Polls `pred` every `interval` until it holds or `timeout` elapses.
        template <typename Pred>
        bool wait_until(Pred&& pred, std::chrono::milliseconds timeout, std::chrono::milliseconds interval) {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            for (;;) {
                if (pred()) {
                    return true;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    return false;
                }
                std::this_thread::sleep_for(interval);
            }
        }

    }  // namespace utils

}  // namespace hostlink
