#include "sandbox/isolated_worker.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace codeact::sandbox {
namespace {

using codeact::utils::LogLevel;

bool WriteAll(int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const auto n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

// Reads whatever is available without blocking. Returns false once EOF is seen.
bool Drain(int fd, std::string& target) {
    char buffer[65536];
    while (true) {
        const auto n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            target.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return true;
    }
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

IsolatedWorker::IsolatedWorker(ForkHooks hooks, std::chrono::milliseconds kill_grace)
    : hooks_(std::move(hooks))
    , kill_grace_(kill_grace) {}

WorkerOutcome IsolatedWorker::Run(const Body& body, std::chrono::milliseconds timeout) const {
    WorkerOutcome outcome{};
    int channel[2];
    if (::pipe(channel) < 0) {
        outcome.error = std::string("Failed to create pipe: ") + std::strerror(errno);
        return outcome;
    }

    std::fflush(nullptr);
    if (hooks_.before_fork) {
        hooks_.before_fork();
    }
    const pid_t pid = ::fork();
    if (pid < 0) {
        const int fork_errno = errno;
        if (hooks_.after_fork_parent) {
            hooks_.after_fork_parent();
        }
        ::close(channel[0]);
        ::close(channel[1]);
        outcome.error = std::string("Failed to fork worker: ") + std::strerror(fork_errno);
        return outcome;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::close(channel[0]);
        if (hooks_.after_fork_child) {
            hooks_.after_fork_child();
        }
        int code = 0;
        try {
            if (!WriteAll(channel[1], body())) {
                code = 3;
            }
        } catch (const std::exception& ex) {
            std::fprintf(stderr, "[worker] body failed: %s\n", ex.what());
            code = 2;
        }
        ::close(channel[1]);
        ::_exit(code);
    }

    ::setpgid(pid, pid);
    outcome.pid = pid;
    if (hooks_.after_fork_parent) {
        hooks_.after_fork_parent();
    }
    ::close(channel[1]);
    ::fcntl(channel[0], F_SETFL, O_NONBLOCK);
    codeact::utils::Log(LogLevel::kDebug, "worker", "started", {{"pid", std::to_string(pid)}});

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    bool finished = false;
    bool open = true;
    while (std::chrono::steady_clock::now() < deadline) {
        if (open) {
            open = Drain(channel[0], outcome.payload);
        }
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            finished = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            break;
        }
        if (open) {
            pollfd ready{channel[0], POLLIN, 0};
            ::poll(&ready, 1, 10);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    if (!finished) {
        outcome.timed_out = true;
        ::kill(-pid, SIGTERM);
        const auto grace_deadline = std::chrono::steady_clock::now() + kill_grace_;
        while (std::chrono::steady_clock::now() < grace_deadline) {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0 && errno != EINTR) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (!finished) {
            ::kill(-pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
        }
        ::kill(-pid, SIGKILL);
        ::close(channel[0]);
        outcome.payload.clear();
        outcome.exit_code = DecodeStatus(status);
        codeact::utils::Log(LogLevel::kWarn, "worker", "timed out, worker reclaimed",
                            {{"pid", std::to_string(pid)},
                             {"timeout_ms", std::to_string(timeout.count())}});
        return outcome;
    }

    if (open) {
        Drain(channel[0], outcome.payload);
    }
    // Stragglers spawned by the worker share its process group.
    ::kill(-pid, SIGKILL);
    ::close(channel[0]);
    outcome.completed = true;
    outcome.exit_code = DecodeStatus(status);
    codeact::utils::Log(LogLevel::kDebug, "worker", "finished",
                        {{"pid", std::to_string(pid)},
                         {"exit", std::to_string(outcome.exit_code)},
                         {"bytes", std::to_string(outcome.payload.size())}});
    return outcome;
}

}  // namespace codeact::sandbox
