#pragma once

#include <stacy/result.hpp>
#include <map>
#include <string>
#include <vector>

#include <sys/types.h>

namespace stacy {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// True when `program` resolves to an executable, either as a path or
// through a PATH search
bool program_available(const std::string& program);

// Full path of `program` found on PATH, empty when absent
std::string find_in_path(const std::string& program);

// ---------------------------------------------------------------------------
// Long-running children (interpreter runs)
// ---------------------------------------------------------------------------

struct SpawnOptions {
    std::vector<std::string> args;
    std::string working_dir;
    std::map<std::string, std::string> env;  // set on top of the inherited environment
    bool new_process_group = true;           // child leads its own group
    bool discard_output = true;              // stdout/stderr to /dev/null
};

// How a child ended
struct ExitStatus {
    int exit_code = 0;   // valid when signal == 0
    int signal = 0;      // terminating signal, 0 when exited normally
};

// Owns a spawned child. Destruction kills and reaps a child that is still
// running so no zombie or orphaned group outlives the handle.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& o) noexcept;
    ChildProcess& operator=(ChildProcess&& o) noexcept;

    static Result<ChildProcess> spawn(const SpawnOptions& opts);

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !reaped_; }

    // Non-blocking reap. True once the child has exited; `out` filled then.
    Result<bool> try_wait(ExitStatus& out);

    // Blocking reap
    Result<ExitStatus> wait();

    // Signal the child's process group (or the child alone when it does
    // not lead a group)
    void signal(int sig);

private:
    pid_t pid_ = -1;
    bool group_ = false;
    bool reaped_ = false;
    ExitStatus status_;
};

} // namespace stacy
