#pragma once

#include <stacy/isolation.hpp>
#include <stacy/log_parser.hpp>
#include <stacy/result.hpp>

#include <map>
#include <string>

namespace stacy {

enum class OutputMode {
    Quiet,     // nothing on the console
    Verbose,   // log tee'd to stderr while the script runs
    Profile,   // `set rmsg on`: timing after every command
    Trace,     // `set trace on`: program execution trace
};

const char* output_mode_name(OutputMode m);
Result<OutputMode> parse_output_mode(const std::string& s);

struct ExecutionRequest {
    std::string id;               // identity in batch results; defaults to the script
    std::string script;           // path, relative to working_dir unless absolute
    std::string inline_code;      // run this body instead of `script` when non-empty
    std::string working_dir;      // empty: current directory
    OutputMode mode = OutputMode::Quiet;
    std::map<std::string, std::string> args;   // exported as STACY_ARG_<KEY>
    IsolationPath isolation;
    int timeout_seconds = 0;      // 0: none
    std::string log_dir;          // move the log here after the run when set

    const std::string& key() const { return id.empty() ? script : id; }
};

struct RunnerOptions {
    std::string interpreter;      // resolved binary path
    int kill_grace_seconds = 5;   // SIGTERM -> SIGKILL delay
    size_t tail_lines = TailWindow::kDefaultLines;
};

// Runs one request: spawn `<stata> -b -q do <file>`, wait, classify the
// log. Script failures come back as a DetectionResult; only tool-level
// problems (missing interpreter or script, no log) are errors.
class ScriptRunner {
public:
    explicit ScriptRunner(RunnerOptions options);

    Result<DetectionResult> run(const ExecutionRequest& req) const;

    const RunnerOptions& options() const { return options_; }

private:
    RunnerOptions options_;
};

// STACY_ARG_<KEY> with the key upper-cased and non-alphanumerics as '_'
std::string script_arg_env_name(const std::string& key);

} // namespace stacy
