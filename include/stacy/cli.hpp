#pragma once

#include <stacy/result.hpp>
#include <stacy/runner.hpp>
#include <stacy/source.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace stacy::cli {

// Flags accepted by every command
struct GlobalOptions {
    bool json = false;                       // --format json
    std::optional<std::string> engine;       // --engine <path>
    bool offline = false;
    std::optional<int> jobs;                 // -j / --jobs
    std::optional<int> timeout_seconds;      // --timeout
    std::optional<std::string> directory;    // -C <dir>
    std::optional<std::string> log_level;    // --log-level, -q sets "error"
};

struct InitCmd {
    std::string dir = ".";
    std::string name;                        // empty: directory name
    bool force = false;
};

struct RunCmd {
    std::vector<std::string> scripts;
    std::string code;                        // -c: inline body
    bool parallel = false;
    OutputMode mode = OutputMode::Quiet;
    std::map<std::string, std::string> args; // --arg KEY=VALUE
};

struct DepsCmd {
    std::string script;
    bool flat = false;
};

struct LockCmd {
    bool check = false;
};

struct InstallCmd {
    std::set<DependencyGroup> groups;        // empty: every group
};

struct AddCmd {
    std::vector<std::string> names;
    std::string source = "ssc";
    std::string version;                     // constraint
    DependencyGroup group = DependencyGroup::Default;
};

struct RemoveCmd {
    std::vector<std::string> names;
};

struct UpdateCmd {
    std::vector<std::string> names;          // empty: every package
};

struct OutdatedCmd {};

struct TaskCmd {
    std::string name;
    bool list = false;
    std::map<std::string, std::string> args;
};

struct TestCmd {
    std::vector<std::string> filters;
    bool sequential = false;
};

struct BenchCmd {
    std::string script;
    size_t runs = 10;
    size_t warmup = 1;
};

struct EnvCmd {};
struct DoctorCmd {};

struct ExplainCmd {
    int code = 0;
};

struct CacheListCmd {};

struct CacheCleanCmd {
    int older_than_days = 30;
    bool force = false;
};

struct HelpCmd {
    std::string topic;
};

struct VersionCmd {};

using Command = std::variant<
    InitCmd, RunCmd, DepsCmd, LockCmd, InstallCmd, AddCmd, RemoveCmd,
    UpdateCmd, OutdatedCmd, TaskCmd, TestCmd, BenchCmd, EnvCmd, DoctorCmd,
    ExplainCmd, CacheListCmd, CacheCleanCmd, HelpCmd, VersionCmd>;

struct Invocation {
    GlobalOptions global;
    Command command;
};

// argv without the program name. Unknown flags and missing values are
// InvalidArg errors.
Result<Invocation> parse_args(const std::vector<std::string>& args);

std::string usage();
std::string command_usage(const std::string& command);

} // namespace stacy::cli
