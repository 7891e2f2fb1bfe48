#pragma once

#include "hostlink/format.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern char** environ;

namespace hostlink::detail {

    // A shell child whose stdout and stderr share one non-blocking pipe.
    struct child_process {
        pid_t pid{-1};
        int output_fd{-1};
        std::string output{};
        std::optional<int> exit_code{};
        std::chrono::steady_clock::time_point started_at{};

        child_process() = default;
        child_process(const child_process&) = delete;
        child_process& operator=(const child_process&) = delete;

        ~child_process() {
            if (pid > 0) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, nullptr, 0);
            }
            if (output_fd >= 0) {
                ::close(output_fd);
            }
        }

        bool alive() const { return pid > 0; }
    };

}  // namespace hostlink::detail

namespace hostlink::internal::subprocess {

    using namespace hostlink::literals;

    using environment = std::vector<std::pair<std::string, std::string>>;

    // Builds "KEY=VALUE" entries before fork(); the child only calls async-signal-safe functions.
    inline std::vector<std::string> merged_environment(const environment& overrides) {
        std::vector<std::string> entries{};
        for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
            std::string_view entry{*env};
            auto eq = entry.find('=');
            auto key = entry.substr(0, eq);
            bool overridden = false;
            for (const auto& [k, v] : overrides) {
                if (k == key) {
                    overridden = true;
                    break;
                }
            }
            if (!overridden) {
                entries.emplace_back(entry);
            }
        }
        for (const auto& [k, v] : overrides) {
            entries.push_back("{}={}"_format(k, v));
        }
        return entries;
    }

    inline std::unique_ptr<detail::child_process> spawn_shell(const std::string& command, const environment& env) {
        int out_pipe[2]{};
        if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
            throw std::runtime_error("pipe() failed: {}"_format(std::strerror(errno)));
        }

        auto env_entries = merged_environment(env);
        std::vector<char*> envp{};
        envp.reserve(env_entries.size() + 1);
        for (auto& entry : env_entries) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);

        std::string shell{"/bin/sh"};
        std::string flag{"-c"};
        std::string cmd{command};
        char* argv[] = {shell.data(), flag.data(), cmd.data(), nullptr};

        auto pid = ::fork();
        if (pid < 0) {
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
            throw std::runtime_error("fork() failed: {}"_format(std::strerror(errno)));
        }

        if (pid == 0) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(out_pipe[1], STDERR_FILENO);
            ::execve(argv[0], argv, envp.data());
            _exit(127);
        }

        ::close(out_pipe[1]);
        int flags = ::fcntl(out_pipe[0], F_GETFL, 0);
        ::fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);

        auto child = std::make_unique<detail::child_process>();
        child->pid = pid;
        child->output_fd = out_pipe[0];
        child->started_at = std::chrono::steady_clock::now();
        return child;
    }

    inline void drain(detail::child_process& child) {
        if (child.output_fd < 0) {
            return;
        }
        char chunk[4096]{};
        for (;;) {
            auto n = ::read(child.output_fd, chunk, sizeof(chunk));
            if (n > 0) {
                child.output.append(chunk, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
    }

    // True once the child has exited; collects the rest of its output and its exit code.
    inline bool try_reap(detail::child_process& child) {
        if (child.pid <= 0) {
            return true;
        }

        drain(child);

        int status = 0;
        auto ret = ::waitpid(child.pid, &status, WNOHANG);
        if (ret == 0) {
            return false;
        }

        if (ret < 0) {
            child.exit_code = 1;
        }
        else if (WIFEXITED(status)) {
            child.exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            child.exit_code = 128 + WTERMSIG(status);
        }
        else {
            child.exit_code = 1;
        }
        child.pid = -1;

        drain(child);
        ::close(child.output_fd);
        child.output_fd = -1;
        return true;
    }

    inline bool terminate(detail::child_process& child, int sig = SIGTERM) {
        if (child.pid <= 0) {
            return false;
        }
        return ::kill(child.pid, sig) == 0;
    }

    inline double elapsed_seconds(const detail::child_process& child) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - child.started_at).count();
    }

}  // namespace hostlink::internal::subprocess
