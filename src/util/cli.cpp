#include <stacy/cli.hpp>
#include <stacy/log.hpp>

#include <cstdlib>
#include <sstream>

namespace stacy::cli {

namespace {

StacyError bad_arg(const std::string& msg, const std::string& command = "") {
    std::string hint = command.empty() ? "run 'stacy help' for usage"
                                       : "run 'stacy help " + command + "' for usage";
    return StacyError{StacyError::InvalidArg, msg, hint};
}

// Walks argv, handling "--flag value" and "--flag=value" forms
class ArgCursor {
public:
    ArgCursor(std::vector<std::string> args, std::string command)
        : args_(std::move(args)), command_(std::move(command)) {}

    bool done() const { return pos_ >= args_.size(); }
    const std::string& peek() const { return args_[pos_]; }
    std::string next() { return args_[pos_++]; }
    const std::string& command() const { return command_; }

    bool flag(const std::string& current, std::initializer_list<const char*> names) {
        for (const char* n : names) {
            if (current == n) return true;
        }
        return false;
    }

    // True when `current` is one of `names`; the value is taken from
    // "=value" or the following argument
    Result<bool> value(const std::string& current,
                       std::initializer_list<const char*> names,
                       std::string& out) {
        for (const char* n : names) {
            std::string name(n);
            if (current == name) {
                if (done()) return bad_arg(name + " needs a value", command_);
                out = next();
                return Result<bool>::ok(true);
            }
            if (current.size() > name.size() + 1 &&
                current.compare(0, name.size() + 1, name + "=") == 0) {
                out = current.substr(name.size() + 1);
                return Result<bool>::ok(true);
            }
        }
        return Result<bool>::ok(false);
    }

private:
    std::vector<std::string> args_;
    std::string command_;
    size_t pos_ = 0;
};

Result<int> parse_int(const std::string& s, const std::string& what, int min_value) {
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || v < min_value || v > 1000000) {
        return bad_arg("invalid " + what + ": '" + s + "'");
    }
    return Result<int>::ok(static_cast<int>(v));
}

bool is_flag(const std::string& s) {
    return s.size() > 1 && s[0] == '-';
}

Status parse_key_value(const std::string& kv, std::map<std::string, std::string>& out) {
    auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0) {
        return bad_arg("expected KEY=VALUE, got '" + kv + "'");
    }
    out[kv.substr(0, eq)] = kv.substr(eq + 1);
    return ok_status();
}

#define STACY_TRY_VALUE(var, expr) \
    auto var##_r = (expr); \
    if (var##_r.is_err()) return std::move(var##_r).error(); \
    bool var = var##_r.value()

StacyError unexpected(const ArgCursor& c, const std::string& arg) {
    if (is_flag(arg)) return bad_arg("unknown flag '" + arg + "'", c.command());
    return bad_arg("unexpected argument '" + arg + "'", c.command());
}

// ---------------------------------------------------------------------------
// Per-command parsers
// ---------------------------------------------------------------------------

Result<Command> parse_init(ArgCursor& c) {
    InitCmd cmd;
    bool have_dir = false;
    while (!c.done()) {
        std::string a = c.next();
        STACY_TRY_VALUE(named, c.value(a, {"--name"}, cmd.name));
        if (named) continue;
        if (c.flag(a, {"--force", "-f"})) { cmd.force = true; continue; }
        if (is_flag(a) || have_dir) return unexpected(c, a);
        cmd.dir = a;
        have_dir = true;
    }
    return Result<Command>::ok(Command{cmd});
}

Result<Command> parse_run(ArgCursor& c) {
    RunCmd cmd;
    while (!c.done()) {
        std::string a = c.next();
        std::string v;
        STACY_TRY_VALUE(code, c.value(a, {"-c", "--code"}, cmd.code));
        if (code) continue;
        STACY_TRY_VALUE(arg, c.value(a, {"--arg"}, v));
        if (arg) {
            STACY_TRY(parse_key_value(v, cmd.args));
            continue;
        }
        STACY_TRY_VALUE(mode, c.value(a, {"--mode"}, v));
        if (mode) {
            auto m = parse_output_mode(v);
            if (m.is_err()) return std::move(m).error();
            cmd.mode = m.value();
            continue;
        }
        if (c.flag(a, {"--parallel", "-P"})) { cmd.parallel = true; continue; }
        if (c.flag(a, {"--verbose"})) { cmd.mode = OutputMode::Verbose; continue; }
        if (c.flag(a, {"--profile"})) { cmd.mode = OutputMode::Profile; continue; }
        if (c.flag(a, {"--trace"})) { cmd.mode = OutputMode::Trace; continue; }
        if (is_flag(a)) return unexpected(c, a);
        cmd.scripts.push_back(a);
    }
    if (cmd.scripts.empty() && cmd.code.empty()) {
        return bad_arg("run needs a script or -c <code>", "run");
    }
    if (!cmd.scripts.empty() && !cmd.code.empty()) {
        return bad_arg("pass either scripts or -c <code>, not both", "run");
    }
    return Result<Command>::ok(Command{cmd});
}

Result<Command> parse_deps(ArgCursor& c) {
    DepsCmd cmd;
    while (!c.done()) {
        std::string a = c.next();
        if (c.flag(a, {"--flat"})) { cmd.flat = true; continue; }
        if (c.flag(a, {"--tree"})) { cmd.flat = false; continue; }
        if (is_flag(a) || !cmd.script.empty()) return unexpected(c, a);
        cmd.script = a;
    }
    if (cmd.script.empty()) return bad_arg("deps needs a script", "deps");
    return Result<Command>::ok(Command{cmd});
}

Result<Command> parse_lock(ArgCursor& c) {
    LockCmd cmd;
    while (!c.done()) {
        std::string a = c.next();
        if (c.flag(a, {"--check"})) { cmd.check = true; continue; }
        return unexpected(c, a);
    }
    return Result<Command>::ok(Command{cmd});
}

Result<Command> parse_install(ArgCursor& c) {
    InstallCmd cmd;
    while (!c.done()) {
        std::string a = c.next();
        std::string v;
        STACY_TRY_VALUE(group, c.value(a, {"--group", "-g"}, v));
        if (group) {
            auto g = parse_group(v);
            if (g.is_err()) return std::move(g).error();
            cmd.groups.insert(g.value());
            continue;
        }
        if (c.flag(a, {"--no-dev"})) {
            cmd.groups.insert(DependencyGroup::Default);
            cmd.groups.insert(DependencyGroup::Test);
            continue;
        }
        return unexpected(c, a);
    }
    return Result<Command>::ok(Command{cmd});
}

Result<Command> parse_add(ArgCursor& c) {
    AddCmd cmd;
    while (!c.done()) {
        std::string a = c.next();
        std::string v;
        STACY_TRY_VALUE(source, c.value(a, {"--source", "-s"}, cmd.source));
        if (source) continue;
        STACY_TRY_VALUE(version, c.value(a, {"--version"}, cmd.version));
        if (version) continue;
        STACY_TRY_VALUE(group, c.value(a, {"--group", "-g"}, v));
        if (group) {
            auto g = parse_group(v);
            if (g.is_err()) return std::move(g).error();
            cmd.group = g.value();
            continue;
        }
        if (c.flag(a, {"--dev"})) { cmd.group = DependencyGroup::Dev; continue; }
        if (c.flag(a, {"--test"})) { cmd.group = DependencyGroup::Test; continue; }
        if (is_flag(a)) return unexpected(c, a);
        cmd.names.push_back(a);
    }
    if (cmd.names.empty()) return bad_arg("add needs at least one package name", "add");
    return Result<Command>::ok(Command{cmd});
}

Status parse_names(ArgCursor& c, std::vector<std::string>& names) {
    while (!c.done()) {
        std::string a = c.next();
        if (is_flag(a)) return unexpected(c, a);
        names.push_back(a);
    }
    return ok_status();
}

Result<Command> parse_task(ArgCursor& c) {
    TaskCmd cmd;
    while (!c.done()) {
        std::string a = c.next();
        std::string v;
        if (c.flag(a, {"--list", "-l"})) { cmd.list = true; continue; }
        STACY_TRY_VALUE(arg, c.value(a, {"--arg"}, v));
        if (arg) {
            STACY_TRY(parse_key_value(v, cmd.args));
            continue;
        }
        if (is_flag(a) || !cmd.name.empty()) return unexpected(c, a);
        cmd.name = a;
    }
    if (cmd.name.empty() && !cmd.list) return bad_arg("task needs a name or --list", "task");
    return Result<Command>::ok(Command{cmd});
}

Result<Command> parse_test(ArgCursor& c) {
    TestCmd cmd;
    while (!c.done()) {
        std::string a = c.next();
        if (c.flag(a, {"--sequential"})) { cmd.sequential = true; continue; }
        if (is_flag(a)) return unexpected(c, a);
        cmd.filters.push_back(a);
    }
    return Result<Command>::ok(Command{cmd});
}

Result<Command> parse_bench(ArgCursor& c) {
    BenchCmd cmd;
    while (!c.done()) {
        std::string a = c.next();
        std::string v;
        STACY_TRY_VALUE(runs, c.value(a, {"-n", "--runs"}, v));
        if (runs) {
            auto n = parse_int(v, "run count", 1);
            if (n.is_err()) return std::move(n).error();
            cmd.runs = static_cast<size_t>(n.value());
            continue;
        }
        STACY_TRY_VALUE(warmup, c.value(a, {"-w", "--warmup"}, v));
        if (warmup) {
            auto n = parse_int(v, "warm-up count", 0);
            if (n.is_err()) return std::move(n).error();
            cmd.warmup = static_cast<size_t>(n.value());
            continue;
        }
        if (is_flag(a) || !cmd.script.empty()) return unexpected(c, a);
        cmd.script = a;
    }
    if (cmd.script.empty()) return bad_arg("bench needs a script", "bench");
    return Result<Command>::ok(Command{cmd});
}

Result<Command> parse_explain(ArgCursor& c) {
    if (c.done()) return bad_arg("explain needs an error code", "explain");
    std::string a = c.next();
    // Accept "601", "r(601)" and "r(601);"
    std::string digits = a;
    if (digits.rfind("r(", 0) == 0) {
        digits = digits.substr(2);
        auto close = digits.find(')');
        if (close != std::string::npos) digits = digits.substr(0, close);
    }
    auto code = parse_int(digits, "error code", 0);
    if (code.is_err()) return std::move(code).error();
    if (!c.done()) return unexpected(c, c.peek());
    ExplainCmd cmd;
    cmd.code = code.value();
    return Result<Command>::ok(Command{cmd});
}

Result<Command> parse_cache(ArgCursor& c) {
    if (c.done()) return bad_arg("cache needs a subcommand: list, clean", "cache");
    std::string sub = c.next();
    if (sub == "list") {
        if (!c.done()) return unexpected(c, c.peek());
        return Result<Command>::ok(Command{CacheListCmd{}});
    }
    if (sub == "clean") {
        CacheCleanCmd cmd;
        while (!c.done()) {
            std::string a = c.next();
            std::string v;
            STACY_TRY_VALUE(older, c.value(a, {"--older-than"}, v));
            if (older) {
                if (!v.empty() && v.back() == 'd') v.pop_back();
                auto n = parse_int(v, "age in days", 0);
                if (n.is_err()) return std::move(n).error();
                cmd.older_than_days = n.value();
                continue;
            }
            if (c.flag(a, {"--force", "-f"})) { cmd.force = true; continue; }
            return unexpected(c, a);
        }
        return Result<Command>::ok(Command{cmd});
    }
    return bad_arg("unknown cache subcommand '" + sub + "'", "cache");
}

Result<Command> parse_no_args(ArgCursor& c, Command cmd) {
    if (!c.done()) return unexpected(c, c.peek());
    return Result<Command>::ok(std::move(cmd));
}

} // namespace

// ---------------------------------------------------------------------------
// parse_args
// ---------------------------------------------------------------------------

Result<Invocation> parse_args(const std::vector<std::string>& args) {
    Invocation inv;
    std::vector<std::string> rest;

    // Global flags may appear anywhere before "--"
    ArgCursor g(args, "");
    while (!g.done()) {
        std::string a = g.next();
        std::string v;
        if (a == "--") {
            while (!g.done()) rest.push_back(g.next());
            break;
        }
        STACY_TRY_VALUE(format, g.value(a, {"--format"}, v));
        if (format) {
            if (v == "json") inv.global.json = true;
            else if (v == "human" || v == "text") inv.global.json = false;
            else return bad_arg("unknown format '" + v + "'", "");
            continue;
        }
        if (a == "--json") { inv.global.json = true; continue; }
        if (a == "--offline") { inv.global.offline = true; continue; }
        if (a == "-q" || a == "--quiet") { inv.global.log_level = "error"; continue; }
        STACY_TRY_VALUE(level, g.value(a, {"--log-level"}, v));
        if (level) {
            log::Level lvl;
            if (!log::parse_level(v, lvl)) return bad_arg("unknown log level '" + v + "'");
            inv.global.log_level = v;
            continue;
        }
        std::string engine;
        STACY_TRY_VALUE(eng, g.value(a, {"--engine"}, engine));
        if (eng) { inv.global.engine = engine; continue; }
        std::string dir;
        STACY_TRY_VALUE(cdir, g.value(a, {"-C", "--directory"}, dir));
        if (cdir) { inv.global.directory = dir; continue; }
        STACY_TRY_VALUE(jobs, g.value(a, {"-j", "--jobs"}, v));
        if (!jobs && a.size() > 2 && a.compare(0, 2, "-j") == 0) v = a.substr(2);
        if (jobs || (a.size() > 2 && a.compare(0, 2, "-j") == 0)) {
            auto n = parse_int(v, "job count", 1);
            if (n.is_err()) return std::move(n).error();
            inv.global.jobs = n.value();
            continue;
        }
        STACY_TRY_VALUE(timeout, g.value(a, {"--timeout"}, v));
        if (timeout) {
            auto n = parse_int(v, "timeout", 0);
            if (n.is_err()) return std::move(n).error();
            inv.global.timeout_seconds = n.value();
            continue;
        }
        rest.push_back(a);
    }

    if (rest.empty()) {
        inv.command = HelpCmd{};
        return Result<Invocation>::ok(std::move(inv));
    }

    std::string name = rest.front();
    rest.erase(rest.begin());
    ArgCursor c(rest, name);

    Result<Command> cmd = bad_arg("unknown command '" + name + "'");
    if (name == "init") cmd = parse_init(c);
    else if (name == "run") cmd = parse_run(c);
    else if (name == "deps") cmd = parse_deps(c);
    else if (name == "lock") cmd = parse_lock(c);
    else if (name == "install") cmd = parse_install(c);
    else if (name == "add") cmd = parse_add(c);
    else if (name == "remove") {
        RemoveCmd r;
        auto st = parse_names(c, r.names);
        if (st.is_err()) return std::move(st).error();
        if (r.names.empty()) return bad_arg("remove needs at least one package name", "remove");
        cmd = Result<Command>::ok(Command{r});
    } else if (name == "update") {
        UpdateCmd u;
        auto st = parse_names(c, u.names);
        if (st.is_err()) return std::move(st).error();
        cmd = Result<Command>::ok(Command{u});
    }
    else if (name == "outdated") cmd = parse_no_args(c, OutdatedCmd{});
    else if (name == "task") cmd = parse_task(c);
    else if (name == "test") cmd = parse_test(c);
    else if (name == "bench") cmd = parse_bench(c);
    else if (name == "env") cmd = parse_no_args(c, EnvCmd{});
    else if (name == "doctor") cmd = parse_no_args(c, DoctorCmd{});
    else if (name == "explain") cmd = parse_explain(c);
    else if (name == "cache") cmd = parse_cache(c);
    else if (name == "version" || name == "--version" || name == "-V") {
        cmd = parse_no_args(c, VersionCmd{});
    } else if (name == "help" || name == "--help" || name == "-h") {
        HelpCmd h;
        if (!c.done()) h.topic = c.next();
        cmd = Result<Command>::ok(Command{h});
    }

    if (cmd.is_err()) return std::move(cmd).error();
    inv.command = std::move(cmd).value();
    return Result<Invocation>::ok(std::move(inv));
}

#undef STACY_TRY_VALUE

// ---------------------------------------------------------------------------
// Usage text
// ---------------------------------------------------------------------------

std::string usage() {
    return
        "stacy: reproducible Stata projects\n"
        "\n"
        "usage: stacy [global flags] <command> [args]\n"
        "\n"
        "commands:\n"
        "  init [dir]            create stacy.toml\n"
        "  run <script>...       run scripts with error detection\n"
        "  deps <script>         show the script dependency tree\n"
        "  lock [--check]        write stacy.lock, or verify it\n"
        "  install               fetch every locked package into the cache\n"
        "  add <name>...         declare, install and lock packages\n"
        "  remove <name>...      drop packages and relock\n"
        "  update [name...]      re-resolve packages ignoring the lock\n"
        "  outdated              compare locked and latest versions\n"
        "  task <name>           run a task from [scripts]\n"
        "  test [filter...]      run test scripts\n"
        "  bench <script>        time repeated runs\n"
        "  env                   show interpreter, cache and search path\n"
        "  doctor                check the environment\n"
        "  explain <code>        describe a Stata r() code\n"
        "  cache list|clean      inspect or prune the package cache\n"
        "\n"
        "global flags:\n"
        "  --format json         machine-readable output on stdout\n"
        "  --engine <path>       Stata binary to use\n"
        "  --offline             never touch the network\n"
        "  -j, --jobs <n>        parallel workers\n"
        "  --timeout <secs>      per-script timeout\n"
        "  -C <dir>              run as if started in <dir>\n"
        "  --log-level <level>   trace, debug, info, warn, error, off\n"
        "  -q, --quiet           only log errors\n";
}

std::string command_usage(const std::string& command) {
    static const std::map<std::string, std::string> texts = {
        {"init", "usage: stacy init [dir] [--name <name>] [--force]\n"},
        {"run", "usage: stacy run <script>... [--parallel] [--verbose|--profile|--trace]\n"
                "       stacy run -c <code>\n"
                "       [--arg KEY=VALUE]...\n"},
        {"deps", "usage: stacy deps <script> [--flat]\n"},
        {"lock", "usage: stacy lock [--check]\n"},
        {"install", "usage: stacy install [--group <dependencies|dev|test>]... [--no-dev]\n"},
        {"add", "usage: stacy add <name>... [--source <ssc|github:user/repo[@ref]|local:dir|net:url>]\n"
                "       [--version <constraint>] [--dev|--test|--group <group>]\n"},
        {"remove", "usage: stacy remove <name>...\n"},
        {"update", "usage: stacy update [name...]\n"},
        {"outdated", "usage: stacy outdated\n"},
        {"task", "usage: stacy task <name> [--arg KEY=VALUE]...\n"
                 "       stacy task --list\n"},
        {"test", "usage: stacy test [filter...] [--sequential]\n"},
        {"bench", "usage: stacy bench <script> [-n <runs>] [-w <warmup>]\n"},
        {"env", "usage: stacy env\n"},
        {"doctor", "usage: stacy doctor\n"},
        {"explain", "usage: stacy explain <code>\n"},
        {"cache", "usage: stacy cache list\n"
                  "       stacy cache clean [--older-than <days>] [--force]\n"},
    };
    auto it = texts.find(command);
    if (it == texts.end()) return usage();
    return it->second;
}

} // namespace stacy::cli
