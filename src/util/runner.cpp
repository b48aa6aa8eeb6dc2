#include <stacy/runner.hpp>
#include <stacy/log.hpp>
#include <stacy/process.hpp>
#include <stacy/signal.hpp>

#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>

#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace stacy {

const char* output_mode_name(OutputMode m) {
    switch (m) {
        case OutputMode::Quiet:   return "quiet";
        case OutputMode::Verbose: return "verbose";
        case OutputMode::Profile: return "profile";
        case OutputMode::Trace:   return "trace";
    }
    return "quiet";
}

Result<OutputMode> parse_output_mode(const std::string& s) {
    if (s == "quiet") return Result<OutputMode>::ok(OutputMode::Quiet);
    if (s == "verbose") return Result<OutputMode>::ok(OutputMode::Verbose);
    if (s == "profile") return Result<OutputMode>::ok(OutputMode::Profile);
    if (s == "trace") return Result<OutputMode>::ok(OutputMode::Trace);
    return StacyError{StacyError::InvalidArg,
        "unknown output mode '" + s + "'", "expected quiet, verbose, profile or trace"};
}

std::string script_arg_env_name(const std::string& key) {
    std::string out = "STACY_ARG_";
    for (char c : key) {
        unsigned char u = static_cast<unsigned char>(c);
        out += std::isalnum(u) ? static_cast<char>(std::toupper(u)) : '_';
    }
    return out;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

// Generated .do file removed on scope exit
struct TempDoFile {
    fs::path path;

    ~TempDoFile() {
        if (!path.empty()) {
            std::error_code ec;
            fs::remove(path, ec);
        }
    }
};

// Follows a growing log and echoes complete lines
class LogTee {
public:
    explicit LogTee(fs::path path) : path_(std::move(path)) {}

    void poll() {
        if (!in_) {
            std::error_code ec;
            if (!fs::exists(path_, ec)) return;
            in_.emplace(path_, std::ios::binary);
            if (!*in_) {
                in_.reset();
                return;
            }
        }
        in_->clear();
        in_->seekg(offset_);
        char buf[4096];
        while (in_->read(buf, sizeof(buf)) || in_->gcount() > 0) {
            auto n = in_->gcount();
            offset_ += n;
            pending_.append(buf, static_cast<size_t>(n));
            if (in_->eof()) break;
        }
        size_t start = 0;
        size_t nl;
        while ((nl = pending_.find('\n', start)) != std::string::npos) {
            std::string line = pending_.substr(start, nl - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            log::raw(line);
            start = nl + 1;
        }
        pending_.erase(0, start);
    }

    void finish() {
        poll();
        if (!pending_.empty()) {
            log::raw(pending_);
            pending_.clear();
        }
    }

private:
    fs::path path_;
    std::optional<std::ifstream> in_;
    std::streamoff offset_ = 0;
    std::string pending_;
};

std::string unique_suffix() {
    static std::atomic<unsigned> counter{0};
    return std::to_string(getpid()) + "_" + std::to_string(counter.fetch_add(1));
}

Status write_file(const fs::path& p, const std::string& body) {
    std::ofstream out(p, std::ios::trunc);
    if (!out) {
        return StacyError{StacyError::IO, "cannot write " + p.string()};
    }
    out << body;
    out.close();
    if (!out) {
        return StacyError{StacyError::IO, "failed writing " + p.string()};
    }
    return ok_status();
}

Status move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::create_directories(to.parent_path(), ec);
    if (ec) {
        return StacyError{StacyError::IO,
            "cannot create log directory " + to.parent_path().string() + ": " + ec.message()};
    }
    fs::rename(from, to, ec);
    if (ec) {
        // Different filesystem
        fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return StacyError{StacyError::IO,
                "cannot move log to " + to.string() + ": " + ec.message()};
        }
        fs::remove(from, ec);
    }
    return ok_status();
}

} // namespace

// ---------------------------------------------------------------------------
// ScriptRunner
// ---------------------------------------------------------------------------

ScriptRunner::ScriptRunner(RunnerOptions options) : options_(std::move(options)) {}

Result<DetectionResult> ScriptRunner::run(const ExecutionRequest& req) const {
    STACY_TRY(cancellation_point());

    if (options_.interpreter.empty()) {
        return StacyError{StacyError::Environment, "no Stata interpreter configured"};
    }

    std::error_code ec;
    fs::path work = req.working_dir.empty() ? fs::current_path(ec) : fs::path(req.working_dir);
    if (!fs::is_directory(work, ec)) {
        return StacyError{StacyError::NotFound,
            "working directory not found: " + work.string()};
    }

    // The file handed to the interpreter, and the stem the log is named after
    TempDoFile inline_file;
    fs::path script;
    if (!req.inline_code.empty()) {
        inline_file.path = work / ("_stacy_inline_" + unique_suffix() + ".do");
        STACY_TRY(write_file(inline_file.path, req.inline_code + "\n"));
        script = inline_file.path;
    } else {
        if (req.script.empty()) {
            return StacyError{StacyError::InvalidArg, "no script or inline code to run"};
        }
        script = fs::path(req.script);
        if (script.is_relative()) script = work / script;
        if (!fs::is_regular_file(script, ec)) {
            return StacyError{StacyError::NotFound,
                "script not found: " + req.script};
        }
    }
    std::string stem = script.stem().string();

    TempDoFile wrapper;
    fs::path invoked = script;
    if (req.mode == OutputMode::Profile || req.mode == OutputMode::Trace) {
        wrapper.path = work / ("_stacy_" + std::string(output_mode_name(req.mode)) + "_" +
                               unique_suffix() + ".do");
        std::string body = req.mode == OutputMode::Profile ? "set rmsg on\n" : "set trace on\n";
        body += "do \"" + script.string() + "\"\n";
        STACY_TRY(write_file(wrapper.path, body));
        invoked = wrapper.path;
    }

    // Batch mode writes <stem>.log into the working directory
    fs::path produced_log = work / (invoked.stem().string() + ".log");
    fs::path log_path = work / (stem + ".log");
    fs::remove(produced_log, ec);
    if (log_path != produced_log) fs::remove(log_path, ec);

    SpawnOptions spawn;
    spawn.args = {options_.interpreter, "-b", "-q", "do", invoked.string()};
    spawn.working_dir = work.string();
    spawn.env = req.isolation.to_env();
    for (const auto& [k, v] : req.args) spawn.env[script_arg_env_name(k)] = v;

    log::debug("running %s in %s (S_ADO=%s)", invoked.string().c_str(),
               work.string().c_str(), req.isolation.s_ado().c_str());

    auto start = std::chrono::steady_clock::now();
    auto child = ChildProcess::spawn(spawn);
    if (child.is_err()) {
        auto e = std::move(child).error();
        e.code = StacyError::Environment;
        return e;
    }

    std::optional<LogTee> tee;
    if (req.mode == OutputMode::Verbose) tee.emplace(produced_log);

    using clock = std::chrono::steady_clock;
    std::optional<clock::time_point> term_sent;
    bool killed_by_us = false;
    ExitStatus status;

    for (;;) {
        auto done = child.value().try_wait(status);
        if (done.is_err()) return std::move(done).error();
        if (done.value()) break;

        if (tee) tee->poll();

        auto now = clock::now();
        bool timed_out = req.timeout_seconds > 0 &&
            now - start >= std::chrono::seconds(req.timeout_seconds);
        if ((timed_out || is_cancelled()) && !term_sent) {
            log::warn("%s: %s, stopping the interpreter", req.key().c_str(),
                      timed_out ? "timed out" : "cancelled");
            child.value().signal(SIGTERM);
            term_sent = now;
            killed_by_us = true;
        } else if (term_sent &&
                   now - *term_sent >= std::chrono::seconds(options_.kill_grace_seconds)) {
            child.value().signal(SIGKILL);
        }

        usleep(5000);
    }

    // The group may still hold grandchildren after the leader exits
    if (killed_by_us) ::kill(-child.value().pid(), SIGKILL);

    double duration = std::chrono::duration<double>(clock::now() - start).count();
    if (tee) tee->finish();

    bool have_log = fs::exists(produced_log, ec);

    if (status.signal == 0 && status.exit_code == 127 && !have_log) {
        return StacyError{StacyError::Environment,
            "interpreter failed to launch: " + options_.interpreter};
    }

    if (have_log && produced_log != log_path) {
        STACY_TRY(move_file(produced_log, log_path));
    }
    if (!req.log_dir.empty() && have_log) {
        fs::path dir = fs::path(req.log_dir);
        if (dir.is_relative()) dir = work / dir;
        fs::path dest = dir / log_path.filename();
        STACY_TRY(move_file(log_path, dest));
        log_path = dest;
    }

    if (status.signal != 0 || killed_by_us) {
        int sig = status.signal != 0 ? status.signal : SIGTERM;
        return Result<DetectionResult>::ok(
            DetectionResult::from_signal(sig, duration, have_log ? log_path.string() : ""));
    }

    if (!have_log) {
        return StacyError{StacyError::Internal,
            "interpreter exited without writing " + produced_log.string(),
            "check that the interpreter runs in batch mode"};
    }

    LogParser parser;
    auto parsed = parser.parse_file(log_path.string(), options_.tail_lines);
    if (parsed.is_err()) return std::move(parsed).error();
    DetectionResult result = std::move(parsed).value();
    result.duration_secs = duration;
    return Result<DetectionResult>::ok(std::move(result));
}

} // namespace stacy
