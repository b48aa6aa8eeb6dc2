#include <catch2/catch.hpp>
#include <stacy/cli.hpp>

using namespace stacy;
using namespace stacy::cli;

static Invocation parse_ok(const std::vector<std::string>& args) {
    auto r = parse_args(args);
    if (r.is_err()) FAIL(r.error().format());
    return r.value();
}

template<typename T>
static T command_as(const Invocation& inv) {
    REQUIRE(std::holds_alternative<T>(inv.command));
    return std::get<T>(inv.command);
}

// ===== Global flags =====

TEST_CASE("no arguments shows help", "[cli]") {
    auto inv = parse_ok({});
    command_as<HelpCmd>(inv);
}

TEST_CASE("global flags anywhere before --", "[cli]") {
    auto inv = parse_ok({"--format", "json", "run", "main.do", "-j4", "--offline",
                         "--timeout=60", "-C", "/work/project", "--engine", "/opt/stata"});
    REQUIRE(inv.global.json);
    REQUIRE(inv.global.offline);
    REQUIRE(*inv.global.jobs == 4);
    REQUIRE(*inv.global.timeout_seconds == 60);
    REQUIRE(*inv.global.directory == "/work/project");
    REQUIRE(*inv.global.engine == "/opt/stata");
    REQUIRE(command_as<RunCmd>(inv).scripts == std::vector<std::string>{"main.do"});
}

TEST_CASE("log level flags", "[cli]") {
    REQUIRE(*parse_ok({"-q", "lock"}).global.log_level == "error");
    REQUIRE(*parse_ok({"--log-level", "debug", "lock"}).global.log_level == "debug");

    auto bad = parse_args({"--log-level", "loud", "lock"});
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == StacyError::InvalidArg);
}

TEST_CASE("invalid global values", "[cli]") {
    REQUIRE(parse_args({"-j", "0", "test"}).is_err());
    REQUIRE(parse_args({"--jobs"}).is_err());
    REQUIRE(parse_args({"--format", "xml", "env"}).is_err());
}

// ===== Commands =====

TEST_CASE("unknown command and flag", "[cli]") {
    auto cmd = parse_args({"frobnicate"});
    REQUIRE(cmd.is_err());
    REQUIRE(cmd.error().code == StacyError::InvalidArg);
    REQUIRE(cmd.error().exit_code() == 5);

    auto flag = parse_args({"lock", "--chekc"});
    REQUIRE(flag.is_err());
    REQUIRE(flag.error().message.find("--chekc") != std::string::npos);
    REQUIRE(flag.error().hint == "run 'stacy help lock' for usage");
}

TEST_CASE("run command", "[cli]") {
    auto inv = parse_ok({"run", "a.do", "b.do", "--parallel", "--profile",
                         "--arg", "year=2020", "--arg=sample=full"});
    const auto& run = command_as<RunCmd>(inv);
    REQUIRE(run.scripts.size() == 2);
    REQUIRE(run.parallel);
    REQUIRE(run.mode == OutputMode::Profile);
    REQUIRE(run.args.at("year") == "2020");
    REQUIRE(run.args.at("sample") == "full");

    auto code = parse_ok({"run", "-c", "display 1"});
    REQUIRE(command_as<RunCmd>(code).code == "display 1");

    REQUIRE(parse_args({"run"}).is_err());
    REQUIRE(parse_args({"run", "a.do", "-c", "display 1"}).is_err());
    REQUIRE(parse_args({"run", "a.do", "--arg", "novalue"}).is_err());
    REQUIRE(parse_args({"run", "a.do", "--mode", "loud"}).is_err());
}

TEST_CASE("package commands", "[cli]") {
    const auto& add = command_as<AddCmd>(
        parse_ok({"add", "estout", "ftools", "--dev", "--version", ">=20230101"}));
    REQUIRE(add.names == std::vector<std::string>{"estout", "ftools"});
    REQUIRE(add.group == DependencyGroup::Dev);
    REQUIRE(add.version == ">=20230101");
    REQUIRE(add.source == "ssc");

    auto gh = parse_ok({"add", "reghdfe", "--source", "github:sergiocorreia/reghdfe"});
    REQUIRE(command_as<AddCmd>(gh).source == "github:sergiocorreia/reghdfe");

    REQUIRE(command_as<LockCmd>(parse_ok({"lock", "--check"})).check);
    REQUIRE(command_as<InstallCmd>(parse_ok({"install"})).groups.empty());
    REQUIRE(command_as<InstallCmd>(parse_ok({"install", "--no-dev"})).groups.size() == 2);
    REQUIRE(command_as<UpdateCmd>(parse_ok({"update"})).names.empty());
    REQUIRE(command_as<RemoveCmd>(parse_ok({"remove", "estout"})).names.size() == 1);
    REQUIRE(parse_args({"remove"}).is_err());
    REQUIRE(parse_args({"add"}).is_err());
    REQUIRE(parse_args({"install", "--group", "prod"}).is_err());
    command_as<OutdatedCmd>(parse_ok({"outdated"}));
}

TEST_CASE("task test and bench commands", "[cli]") {
    const auto& task = command_as<TaskCmd>(parse_ok({"task", "all", "--arg", "year=2019"}));
    REQUIRE(task.name == "all");
    REQUIRE(task.args.at("year") == "2019");
    REQUIRE(command_as<TaskCmd>(parse_ok({"task", "--list"})).list);
    REQUIRE(parse_args({"task"}).is_err());

    const auto& test = command_as<TestCmd>(parse_ok({"test", "merge", "--sequential"}));
    REQUIRE(test.filters == std::vector<std::string>{"merge"});
    REQUIRE(test.sequential);

    const auto& bench = command_as<BenchCmd>(parse_ok({"bench", "fit.do", "-n", "5", "-w", "0"}));
    REQUIRE(bench.script == "fit.do");
    REQUIRE(bench.runs == 5);
    REQUIRE(bench.warmup == 0);
    REQUIRE(parse_args({"bench", "fit.do", "-n", "0"}).is_err());
}

TEST_CASE("explain accepts status marker forms", "[cli]") {
    REQUIRE(command_as<ExplainCmd>(parse_ok({"explain", "601"})).code == 601);
    REQUIRE(command_as<ExplainCmd>(parse_ok({"explain", "r(198)"})).code == 198);
    REQUIRE(command_as<ExplainCmd>(parse_ok({"explain", "r(111);"})).code == 111);
    REQUIRE(parse_args({"explain", "abc"}).is_err());
    REQUIRE(parse_args({"explain"}).is_err());
}

TEST_CASE("cache subcommands", "[cli]") {
    command_as<CacheListCmd>(parse_ok({"cache", "list"}));

    const auto& clean = command_as<CacheCleanCmd>(
        parse_ok({"cache", "clean", "--older-than", "7d", "--force"}));
    REQUIRE(clean.older_than_days == 7);
    REQUIRE(clean.force);

    REQUIRE(command_as<CacheCleanCmd>(parse_ok({"cache", "clean"})).older_than_days == 30);
    REQUIRE(parse_args({"cache"}).is_err());
    REQUIRE(parse_args({"cache", "purge"}).is_err());
}

TEST_CASE("init, help and version", "[cli]") {
    const auto& init = command_as<InitCmd>(parse_ok({"init", "study", "--name", "wages"}));
    REQUIRE(init.dir == "study");
    REQUIRE(init.name == "wages");

    REQUIRE(command_as<HelpCmd>(parse_ok({"help", "run"})).topic == "run");
    command_as<VersionCmd>(parse_ok({"--version"}));
    command_as<DoctorCmd>(parse_ok({"doctor"}));
    command_as<EnvCmd>(parse_ok({"env"}));
    REQUIRE(parse_args({"env", "extra"}).is_err());
}

TEST_CASE("usage text", "[cli]") {
    REQUIRE(usage().find("cache list|clean") != std::string::npos);
    REQUIRE(command_usage("bench").rfind("usage: stacy bench", 0) == 0);
    REQUIRE(command_usage("nope") == usage());
}
