#include <catch2/catch.hpp>
#include <stacy/orchestrator.hpp>
#include <stacy/signal.hpp>
#include "fake_stata.hpp"

#include <chrono>
#include <csignal>
#include <set>
#include <thread>

using namespace stacy;
using stacy::testing::FakeStata;
using stacy::testing::kMissingFileDo;
using stacy::testing::kPassingDo;

// ===== Bench statistics =====

TEST_CASE("bench statistics of an odd count", "[orchestrator]") {
    auto s = compute_bench_stats({3.0, 1.0, 2.0});
    REQUIRE(s.runs == 3);
    REQUIRE(s.min == Approx(1.0));
    REQUIRE(s.max == Approx(3.0));
    REQUIRE(s.mean == Approx(2.0));
    REQUIRE(s.median == Approx(2.0));
    REQUIRE(s.stddev == Approx(0.816496580927726));
}

TEST_CASE("bench median of an even count", "[orchestrator]") {
    auto s = compute_bench_stats({4.0, 1.0, 3.0, 2.0});
    REQUIRE(s.median == Approx(2.5));
    REQUIRE(s.mean == Approx(2.5));
}

TEST_CASE("bench statistics of nothing", "[orchestrator]") {
    auto s = compute_bench_stats({});
    REQUIRE(s.runs == 0);
    REQUIRE(s.mean == 0.0);
}

// ===== Sequential =====

TEST_CASE("sequential run stops at the first failure", "[orchestrator]") {
    FakeStata fake;
    fake.td.write_file("a.do", kPassingDo);
    fake.td.write_file("b.do", kMissingFileDo);
    fake.td.write_file("c.do", kPassingDo);
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    std::vector<std::string> seen;
    orch.set_on_complete([&](const ScriptOutcome& o) { seen.push_back(o.key); });

    auto batch = orch.run_sequential(
        {fake.request("a.do"), fake.request("b.do"), fake.request("c.do")});

    REQUIRE(batch.outcomes.size() == 3);
    REQUIRE(batch.outcomes[0].succeeded());
    REQUIRE_FALSE(batch.outcomes[1].succeeded());
    REQUIRE(batch.outcomes[2].skipped);
    REQUIRE(batch.success_count == 1);
    REQUIRE(batch.failed_count == 1);
    REQUIRE(batch.skipped_count == 1);
    REQUIRE_FALSE(batch.success());
    REQUIRE(batch.exit_code() == 3);
    REQUIRE(seen == std::vector<std::string>{"a.do", "b.do"});
}

TEST_CASE("sequential run of passing scripts", "[orchestrator]") {
    FakeStata fake;
    fake.td.write_file("a.do", kPassingDo);
    fake.td.write_file("b.do", kPassingDo);
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    auto batch = orch.run_sequential({fake.request("a.do"), fake.request("b.do")});
    REQUIRE(batch.success());
    REQUIRE(batch.exit_code() == 0);
    REQUIRE(batch.find("b.do") != nullptr);
    REQUIRE(batch.find("z.do") == nullptr);
}

TEST_CASE("tool-level failure counts as a failed script", "[orchestrator]") {
    FakeStata fake;
    fake.td.write_file("a.do", kPassingDo);
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    auto batch = orch.run_sequential({fake.request("missing.do"), fake.request("a.do")});
    REQUIRE(batch.outcomes[0].error.has_value());
    REQUIRE(batch.outcomes[0].error->code == StacyError::NotFound);
    REQUIRE(batch.outcomes[1].skipped);
    REQUIRE(batch.exit_code() == 3);
}

// ===== Parallel =====

TEST_CASE("parallel run continues past a failure", "[orchestrator]") {
    FakeStata fake;
    std::vector<ExecutionRequest> reqs;
    for (int i = 1; i <= 5; i++) {
        std::string name = "s" + std::to_string(i) + ".do";
        fake.td.write_file(name, i == 3 ? kMissingFileDo : kPassingDo);
        reqs.push_back(fake.request(name));
    }
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    std::set<std::string> seen;
    orch.set_on_complete([&](const ScriptOutcome& o) { seen.insert(o.key); });

    auto batch = orch.run_parallel(reqs, 4);

    REQUIRE(batch.outcomes.size() == 5);
    for (size_t i = 0; i < 5; i++) {
        REQUIRE(batch.outcomes[i].key == reqs[i].script);
        REQUIRE_FALSE(batch.outcomes[i].skipped);
    }
    REQUIRE(batch.success_count == 4);
    REQUIRE(batch.failed_count == 1);
    REQUIRE_FALSE(batch.outcomes[2].succeeded());
    REQUIRE(batch.outcomes[2].result->primary_error()->code.code == 601);
    REQUIRE(batch.exit_code() == 3);
    REQUIRE(seen.size() == 5);
}

TEST_CASE("parallel run with one worker", "[orchestrator]") {
    FakeStata fake;
    fake.td.write_file("a.do", kMissingFileDo);
    fake.td.write_file("b.do", kPassingDo);
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    auto batch = orch.run_parallel({fake.request("a.do"), fake.request("b.do")}, 1);
    REQUIRE(batch.failed_count == 1);
    REQUIRE(batch.success_count == 1);
}

TEST_CASE("cancelled parallel run leaves requests unstarted", "[orchestrator]") {
    FakeStata fake;
    fake.td.write_file("a.do", kPassingDo);
    fake.td.write_file("b.do", kPassingDo);
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    notify_cancel();
    auto batch = orch.run_parallel({fake.request("a.do"), fake.request("b.do")}, 2);
    reset_cancelled();

    REQUIRE(batch.cancelled);
    REQUIRE(batch.skipped_count == 2);
    REQUIRE(batch.exit_code() == 128 + SIGINT);
}

// Raises the cancellation flag after `delay` and clears it on destruction
struct DelayedCancel {
    std::thread thread;

    explicit DelayedCancel(std::chrono::milliseconds delay)
        : thread([delay]() {
              std::this_thread::sleep_for(delay);
              notify_cancel();
          }) {}
    ~DelayedCancel() {
        if (thread.joinable()) thread.join();
        reset_cancelled();
    }
};

TEST_CASE("cancelling a running parallel batch stops its interpreters", "[orchestrator]") {
    FakeStata fake;
    std::vector<ExecutionRequest> reqs;
    for (const char* name : {"s1.do", "s2.do", "s3.do", "s4.do"}) {
        fake.td.write_file(name, std::string("* sleep\n") + kPassingDo);
        reqs.push_back(fake.request(name));
    }
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    auto start = std::chrono::steady_clock::now();
    BatchResult batch;
    {
        DelayedCancel cancel(std::chrono::milliseconds(500));
        batch = orch.run_parallel(reqs, 2);
    }
    double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    REQUIRE(batch.cancelled);
    REQUIRE(elapsed < 10.0);
    REQUIRE(batch.outcomes.size() == 4);

    size_t killed = 0;
    for (const auto& o : batch.outcomes) {
        INFO(o.key);
        if (o.skipped) continue;
        REQUIRE(o.result);
        REQUIRE(o.result->signal == SIGTERM);
        REQUIRE_FALSE(o.result->success);
        killed++;
    }
    REQUIRE(killed == 2);
    REQUIRE(batch.skipped_count == 2);
    REQUIRE(batch.failed_count == 2);
    REQUIRE(batch.exit_code() == 128 + SIGTERM);
}

TEST_CASE("empty batch", "[orchestrator]") {
    FakeStata fake;
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    auto batch = orch.run_parallel({}, 4);
    REQUIRE(batch.outcomes.empty());
    REQUIRE(batch.success());
}

// ===== Benchmark =====

TEST_CASE("benchmark measures every run", "[orchestrator]") {
    FakeStata fake;
    fake.td.write_file("fit.do", kPassingDo);
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    auto r = orch.benchmark(fake.request("fit.do"), 1, 3);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().success());
    REQUIRE(r.value().warmup_runs == 1);
    REQUIRE(r.value().durations.size() == 3);
    REQUIRE(r.value().stats.runs == 3);
    REQUIRE(r.value().stats.min <= r.value().stats.max);
}

TEST_CASE("benchmark of a failing script", "[orchestrator]") {
    FakeStata fake;
    fake.td.write_file("fit.do", kMissingFileDo);
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    auto r = orch.benchmark(fake.request("fit.do"), 0, 2);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().success());
    REQUIRE(r.value().failed_runs == 2);
    REQUIRE(r.value().first_failure.has_value());
}

TEST_CASE("cancelling a benchmark stops after the running iteration", "[orchestrator]") {
    FakeStata fake;
    fake.td.write_file("slow.do", std::string("* sleep\n") + kPassingDo);
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    auto start = std::chrono::steady_clock::now();
    Result<BenchResult> r = StacyError{StacyError::Internal, "not run"};
    {
        DelayedCancel cancel(std::chrono::milliseconds(500));
        r = orch.benchmark(fake.request("slow.do"), 0, 3);
    }
    double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    REQUIRE(r.is_ok());
    const BenchResult& bench = r.value();
    REQUIRE(bench.cancelled);
    REQUIRE_FALSE(bench.success());
    REQUIRE(bench.durations.size() == 1);
    REQUIRE(bench.first_failure);
    REQUIRE(bench.first_failure->signal == SIGTERM);
    REQUIRE(elapsed < 10.0);
}

TEST_CASE("benchmark argument and tool errors", "[orchestrator]") {
    FakeStata fake;
    ScriptRunner runner(fake.options());
    Orchestrator orch(runner);

    auto zero = orch.benchmark(fake.request("fit.do"), 0, 0);
    REQUIRE(zero.is_err());
    REQUIRE(zero.error().code == StacyError::InvalidArg);

    auto missing = orch.benchmark(fake.request("fit.do"), 0, 1);
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == StacyError::NotFound);
}
