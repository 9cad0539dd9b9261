#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace codeact::sandbox {

struct WorkerOutcome {
    bool completed = false;
    bool timed_out = false;
    int exit_code = -1;
    // Worker pid; already reaped by the time Run() returns.
    int pid = -1;
    std::string payload;
    std::string error;
};

// Lets an embedding runtime prepare for fork() and repair its state afterwards.
struct ForkHooks {
    std::function<void()> before_fork;
    std::function<void()> after_fork_parent;
    std::function<void()> after_fork_child;
};

// Runs a body in a forked child and returns the bytes it produced.
// The child is always reaped; on timeout its whole process group is
// terminated (SIGTERM, then SIGKILL after a grace period).
class IsolatedWorker {
public:
    using Body = std::function<std::string()>;

    explicit IsolatedWorker(ForkHooks hooks = {},
                            std::chrono::milliseconds kill_grace = std::chrono::seconds(2));

    WorkerOutcome Run(const Body& body, std::chrono::milliseconds timeout) const;

private:
    ForkHooks hooks_;
    std::chrono::milliseconds kill_grace_;
};

}  // namespace codeact::sandbox
