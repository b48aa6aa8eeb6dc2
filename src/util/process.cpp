#include <stacy/process.hpp>
#include <stacy/log.hpp>

#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace stacy {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return StacyError{StacyError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return StacyError{StacyError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return StacyError{StacyError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return StacyError{StacyError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    char buf[4096];
    auto start = std::chrono::steady_clock::now();

    auto drain = [&]() {
        ssize_t n;
        while ((n = read(stdout_pipe[0], buf, sizeof(buf))) > 0) {
            out_buf.append(buf, static_cast<size_t>(n));
        }
        while ((n = read(stderr_pipe[0], buf, sizeof(buf))) > 0) {
            err_buf.append(buf, static_cast<size_t>(n));
        }
    };

    for (;;) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return StacyError{StacyError::IO,
                "command '" + args[0] + "' timed out after " +
                std::to_string(timeout_seconds) + "s"};
        }

        drain();

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain();
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0 && errno != EINTR) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return StacyError{StacyError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);
    }
}

static bool is_executable(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string find_in_path(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return is_executable(program) ? program : "";
    }
    const char* path = std::getenv("PATH");
    if (!path) return "";
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
        size_t colon = p.find(':', start);
        std::string dir = p.substr(start, colon == std::string::npos
                                          ? std::string::npos : colon - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        if (is_executable(candidate)) return candidate;
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return "";
}

bool program_available(const std::string& program) {
    return !find_in_path(program).empty();
}

// ---------------------------------------------------------------------------
// ChildProcess
// ---------------------------------------------------------------------------

ChildProcess::~ChildProcess() {
    if (running()) {
        signal(SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
}

ChildProcess::ChildProcess(ChildProcess&& o) noexcept
    : pid_(o.pid_), group_(o.group_), reaped_(o.reaped_), status_(o.status_) {
    o.pid_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& o) noexcept {
    if (this != &o) {
        if (running()) {
            signal(SIGKILL);
            int status = 0;
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        }
        pid_ = o.pid_;
        group_ = o.group_;
        reaped_ = o.reaped_;
        status_ = o.status_;
        o.pid_ = -1;
    }
    return *this;
}

Result<ChildProcess> ChildProcess::spawn(const SpawnOptions& opts) {
    if (opts.args.empty()) {
        return StacyError{StacyError::InvalidArg, "spawn: empty args"};
    }

    // Everything the child needs is prepared before fork; only
    // async-signal-safe calls happen in the child.
    std::string program = find_in_path(opts.args[0]);
    if (program.empty()) {
        return StacyError{StacyError::Environment,
            "executable not found: " + opts.args[0]};
    }

    std::vector<const char*> argv;
    argv.reserve(opts.args.size() + 1);
    for (const auto& a : opts.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_store;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string k = entry.substr(0, eq);
        if (opts.env.count(k)) continue;
        env_store.push_back(std::move(entry));
    }
    for (const auto& [k, v] : opts.env) env_store.push_back(k + "=" + v);
    std::vector<const char*> envp;
    envp.reserve(env_store.size() + 1);
    for (const auto& e : env_store) envp.push_back(e.c_str());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        return StacyError{StacyError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        if (opts.new_process_group) setpgid(0, 0);

        // Restore default dispositions the parent may have changed
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        ::signal(SIGPIPE, SIG_DFL);

        if (opts.discard_output) {
            int devnull = open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO) close(devnull);
            }
        }

        if (!opts.working_dir.empty() && chdir(opts.working_dir.c_str()) != 0) {
            _exit(127);
        }

        execve(program.c_str(), const_cast<char* const*>(argv.data()),
               const_cast<char* const*>(envp.data()));
        _exit(127);
    }

    // Set the group from the parent too so a signal sent right after
    // spawn cannot race the child's own setpgid
    if (opts.new_process_group) setpgid(pid, pid);

    log::debug("spawned pid %d: %s", static_cast<int>(pid), program.c_str());

    ChildProcess child;
    child.pid_ = pid;
    child.group_ = opts.new_process_group;
    return Result<ChildProcess>::ok(std::move(child));
}

static ExitStatus decode_status(int status) {
    ExitStatus st;
    if (WIFSIGNALED(status)) {
        st.signal = WTERMSIG(status);
        st.exit_code = 128 + st.signal;
    } else if (WIFEXITED(status)) {
        st.exit_code = WEXITSTATUS(status);
    }
    return st;
}

Result<bool> ChildProcess::try_wait(ExitStatus& out) {
    if (pid_ <= 0) {
        return StacyError{StacyError::Internal, "try_wait on an empty process handle"};
    }
    if (reaped_) {
        out = status_;
        return Result<bool>::ok(true);
    }
    int status = 0;
    pid_t w = waitpid(pid_, &status, WNOHANG);
    if (w == 0 || (w < 0 && errno == EINTR)) return Result<bool>::ok(false);
    if (w < 0) {
        return StacyError{StacyError::IO,
            std::string("waitpid failed: ") + strerror(errno)};
    }
    reaped_ = true;
    status_ = decode_status(status);
    out = status_;
    return Result<bool>::ok(true);
}

Result<ExitStatus> ChildProcess::wait() {
    if (pid_ <= 0) {
        return StacyError{StacyError::Internal, "wait on an empty process handle"};
    }
    if (!reaped_) {
        int status = 0;
        pid_t w;
        while ((w = waitpid(pid_, &status, 0)) < 0 && errno == EINTR) {}
        if (w < 0) {
            return StacyError{StacyError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }
        reaped_ = true;
        status_ = decode_status(status);
    }
    return Result<ExitStatus>::ok(status_);
}

void ChildProcess::signal(int sig) {
    if (!running()) return;
    if (group_) {
        ::kill(-pid_, sig);
    } else {
        ::kill(pid_, sig);
    }
}

} // namespace stacy
