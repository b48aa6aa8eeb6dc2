#include <catch2/catch.hpp>
#include <stacy/report.hpp>

#include <algorithm>

using namespace stacy;

// JSON with layout whitespace removed; values checked here hold no spaces
static std::string compact(std::string s) {
    s.erase(std::remove_if(s.begin(), s.end(),
                           [](char c) { return c == ' ' || c == '\n' || c == '\t'; }),
            s.end());
    return s;
}

static bool has(const std::string& json, const std::string& fragment) {
    return compact(json).find(fragment) != std::string::npos;
}

static DetectionResult failed_601() {
    LogParser parser;
    return parser.parse_text(
        ". use survey\n"
        "file survey.dta not found\n"
        "r(601);\n"
        "\n"
        "end of do-file\n"
        "r(601);\n");
}

TEST_CASE("run report", "[report]") {
    auto json = report::run_json("load.do", failed_601());
    REQUIRE(json.front() == '{');
    REQUIRE(json.back() == '}');
    REQUIRE(has(json, "\"script\":\"load.do\""));
    REQUIRE(has(json, "\"success\":false"));
    REQUIRE(has(json, "\"exit_code\":3"));
    REQUIRE(has(json, "\"code\":601"));
    REQUIRE(has(json, "\"doc\":\"helpr(601)\""));
}

TEST_CASE("batch report keeps request order", "[report]") {
    BatchResult batch;
    ScriptOutcome ok;
    ok.key = "b.do";
    ok.result = LogParser().parse_text("end of do-file\n");
    ScriptOutcome bad;
    bad.key = "a.do";
    bad.result = failed_601();
    ScriptOutcome skipped;
    skipped.key = "c.do";
    skipped.skipped = true;
    batch.outcomes = {ok, bad, skipped};
    batch.success_count = 1;
    batch.failed_count = 1;
    batch.skipped_count = 1;

    auto json = report::batch_json(batch);
    REQUIRE(has(json, "\"order\":[\"b.do\",\"a.do\",\"c.do\"]"));
    REQUIRE(has(json, "\"failed_count\":1"));
    REQUIRE(has(json, "\"exit_code\":3"));
    REQUIRE(has(json, "\"skipped\":true"));
}

TEST_CASE("lock check report", "[report]") {
    LockCheck check;
    check.hash_matches = false;
    LockChange c;
    c.kind = LockChange::Kind::Changed;
    c.name = "estout";
    c.reason = "constraint";
    c.locked_version = "20230212";
    check.changes.push_back(c);

    auto json = report::lock_check_json(check);
    REQUIRE(has(json, "\"in_sync\":false"));
    REQUIRE(has(json, "\"kind\":\"changed\""));
    REQUIRE(has(json, "\"reason\":\"constraint\""));
    REQUIRE_FALSE(has(json, "wanted_version"));
}

TEST_CASE("bench report", "[report]") {
    BenchResult bench;
    bench.durations = {1.0, 2.0, 3.0};
    bench.stats = compute_bench_stats(bench.durations);
    bench.warmup_runs = 1;

    auto json = report::bench_json("fit.do", bench);
    REQUIRE(has(json, "\"runs\":3"));
    REQUIRE(has(json, "\"warmup_runs\":1"));
    REQUIRE(has(json, "\"success\":true"));
    REQUIRE_FALSE(has(json, "first_failure"));
}

TEST_CASE("explain report", "[report]") {
    auto json = report::explain_json(classify_error_code(198));
    REQUIRE(has(json, "\"code\":198"));
    REQUIRE(has(json, "\"exit_code\":2"));
    REQUIRE(has(json, "\"known\":true"));
}

TEST_CASE("error report", "[report]") {
    StacyError err{StacyError::NotFound, "script_not_found:x.do", "check_the_path"};
    auto json = report::error_json(err);
    REQUIRE(has(json, "\"success\":false"));
    REQUIRE(has(json, "\"kind\":\"NotFound\""));
    REQUIRE(has(json, "\"hint\":\"check_the_path\""));
    REQUIRE(has(json, "\"exit_code\":3"));
}

TEST_CASE("cache reports", "[report]") {
    CacheEntry e;
    e.name = "estout";
    e.version = "20230212";
    e.size_bytes = 2048;

    auto list = report::cache_list_json({e, e});
    REQUIRE(has(list, "\"count\":2"));
    REQUIRE(has(list, "\"total_bytes\":4096"));

    CleanReport clean;
    clean.removed.push_back(e);
    clean.freed_bytes = 2048;
    auto cj = report::clean_json(clean);
    REQUIRE(has(cj, "\"removed\":[\"estout@20230212\"]"));
    REQUIRE(has(cj, "\"freed_bytes\":2048"));
}

TEST_CASE("outdated report", "[report]") {
    OutdatedEntry e;
    e.name = "estout";
    e.locked = "20230212";
    e.latest = "20240301";
    auto json = report::outdated_json({e});
    REQUIRE(has(json, "\"outdated\":true"));
    REQUIRE(has(json, "\"constrained\":false"));
}

TEST_CASE("init report escapes the manifest path", "[report]") {
    auto json = report::init_json("/tmp/a\"b\\c/stacy.toml");
    REQUIRE(has(json, "\"success\":true"));
    REQUIRE(has(json, "\"manifest\":\"/tmp/a\\\"b\\\\c/stacy.toml\""));
}

TEST_CASE("lock and install reports", "[report]") {
    LockFile lock;
    lock.packages.push_back({"estout", "20230212", "ssc", "d1", "dependencies", "", ""});
    lock.packages.push_back({"reghdfe", "6.12.3", "github:sergiocorreia/reghdfe", "d2",
                             "dependencies", "6.12.3", ""});
    auto locked = report::lock_json(lock);
    REQUIRE(has(locked, "\"packages\":2"));
    REQUIRE(has(locked, "\"name\":\"reghdfe\""));
    REQUIRE(has(locked, "\"source\":\"github:sergiocorreia/reghdfe\""));

    ResolvedPackage p;
    p.name = "estout";
    p.version = "20230212";
    p.path = "/cache/packages/estout/20230212";
    auto installed = report::install_json({p});
    REQUIRE(has(installed, "\"installed\":1"));
    REQUIRE(has(installed, "\"path\":\"/cache/packages/estout/20230212\""));

    auto none = report::install_json({});
    REQUIRE(has(none, "\"installed\":0"));
    REQUIRE(has(none, "\"packages\":[]"));
}

TEST_CASE("change report lists the packages", "[report]") {
    auto json = report::change_json("removed", {"estout", "odd\"name"});
    REQUIRE(has(json, "\"success\":true"));
    REQUIRE(has(json, "\"removed\":2"));
    REQUIRE(has(json, "\"estout\""));
    REQUIRE(has(json, "\"odd\\\"name\""));
}
