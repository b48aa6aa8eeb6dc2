#include <stacy/orchestrator.hpp>
#include <stacy/log.hpp>
#include <stacy/signal.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>

namespace stacy {

int ScriptOutcome::exit_code() const {
    if (result) return result->exit_code;
    if (error) return error->exit_code();
    return 0;
}

const ScriptOutcome* BatchResult::find(const std::string& key) const {
    for (const auto& o : outcomes) {
        if (o.key == key) return &o;
    }
    return nullptr;
}

int BatchResult::exit_code() const {
    for (const auto& o : outcomes) {
        if (o.skipped) continue;
        if (!o.succeeded()) return o.exit_code();
    }
    if (cancelled) return 128 + (cancel_signal() ? cancel_signal() : 2);
    return 0;
}

static void tally(BatchResult& batch) {
    batch.success_count = batch.failed_count = batch.skipped_count = 0;
    for (const auto& o : batch.outcomes) {
        if (o.skipped) batch.skipped_count++;
        else if (o.succeeded()) batch.success_count++;
        else batch.failed_count++;
    }
}

BenchStats compute_bench_stats(std::vector<double> durations) {
    BenchStats s;
    s.runs = durations.size();
    if (durations.empty()) return s;

    std::sort(durations.begin(), durations.end());
    s.min = durations.front();
    s.max = durations.back();

    double sum = 0.0;
    for (double d : durations) sum += d;
    s.mean = sum / static_cast<double>(durations.size());

    size_t n = durations.size();
    s.median = n % 2 == 1 ? durations[n / 2]
                          : (durations[n / 2 - 1] + durations[n / 2]) / 2.0;

    double sq = 0.0;
    for (double d : durations) sq += (d - s.mean) * (d - s.mean);
    s.stddev = std::sqrt(sq / static_cast<double>(n));
    return s;
}

// ---------------------------------------------------------------------------
// JobSlots
// ---------------------------------------------------------------------------

void JobSlots::acquire() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return free_ > 0; });
    free_--;
}

void JobSlots::release() {
    {
        std::lock_guard<std::mutex> guard(mu_);
        free_++;
    }
    cv_.notify_one();
}

// ---------------------------------------------------------------------------
// Orchestrator
// ---------------------------------------------------------------------------

ScriptOutcome Orchestrator::run_one(const ExecutionRequest& req) const {
    ScriptOutcome o;
    o.key = req.key();
    JobSlots::Guard slot(slots_);
    if (slots_ && is_cancelled()) {
        o.skipped = true;
        return o;
    }
    auto r = runner_.run(req);
    if (r.is_ok()) {
        o.result = std::move(r).value();
    } else if (r.error().code == StacyError::Cancelled) {
        o.skipped = true;
    } else {
        o.error = std::move(r).error();
    }
    return o;
}

void Orchestrator::notify(const ScriptOutcome& o) {
    if (!on_complete_) return;
    std::lock_guard<std::mutex> guard(shared_notify_mu_ ? *shared_notify_mu_ : notify_mu_);
    on_complete_(o);
}

BatchResult Orchestrator::run_sequential(const std::vector<ExecutionRequest>& requests) {
    BatchResult batch;
    auto start = std::chrono::steady_clock::now();
    bool stop = false;

    for (const auto& req : requests) {
        if (stop || is_cancelled()) {
            ScriptOutcome skipped;
            skipped.key = req.key();
            skipped.skipped = true;
            batch.outcomes.push_back(std::move(skipped));
            continue;
        }
        ScriptOutcome o = run_one(req);
        notify(o);
        if (!o.succeeded()) {
            if (!o.skipped) {
                log::debug("%s failed, skipping the remaining scripts", o.key.c_str());
            }
            stop = true;
        }
        batch.outcomes.push_back(std::move(o));
    }

    batch.cancelled = is_cancelled();
    batch.duration_secs = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    tally(batch);
    return batch;
}

BatchResult Orchestrator::run_parallel(const std::vector<ExecutionRequest>& requests,
                                       size_t jobs) {
    BatchResult batch;
    batch.outcomes.resize(requests.size());
    auto start = std::chrono::steady_clock::now();

    // Each slot is written by exactly one worker
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= requests.size()) return;
            if (is_cancelled()) {
                batch.outcomes[i].key = requests[i].key();
                batch.outcomes[i].skipped = true;
                continue;
            }
            log::ScopedTag tag(requests[i].key());
            batch.outcomes[i] = run_one(requests[i]);
            notify(batch.outcomes[i]);
        }
    };

    size_t workers = std::max<size_t>(1, std::min(jobs, requests.size()));
    log::debug("running %zu scripts on %zu workers", requests.size(), workers);
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t i = 0; i < workers; i++) pool.emplace_back(worker);
    for (auto& t : pool) {
        if (t.joinable()) t.join();
    }

    batch.cancelled = is_cancelled();
    batch.duration_secs = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    tally(batch);
    return batch;
}

Result<BenchResult> Orchestrator::benchmark(const ExecutionRequest& request,
                                            size_t warmup, size_t runs) {
    if (runs == 0) {
        return StacyError{StacyError::InvalidArg, "benchmark needs at least one measured run"};
    }

    BenchResult bench;
    for (size_t i = 0; i < warmup; i++) {
        if (is_cancelled()) {
            bench.cancelled = true;
            return Result<BenchResult>::ok(std::move(bench));
        }
        auto r = runner_.run(request);
        if (r.is_err()) {
            if (r.error().code == StacyError::Cancelled) {
                bench.cancelled = true;
                return Result<BenchResult>::ok(std::move(bench));
            }
            return std::move(r).error();
        }
        bench.warmup_runs++;
        if (!r.value().success) {
            log::warn("warm-up run %zu failed (exit %d)", i + 1, r.value().exit_code);
        }
    }

    for (size_t i = 0; i < runs; i++) {
        if (is_cancelled()) {
            bench.cancelled = true;
            break;
        }
        auto r = runner_.run(request);
        if (r.is_err()) {
            if (r.error().code == StacyError::Cancelled) {
                bench.cancelled = true;
                break;
            }
            return std::move(r).error();
        }
        const DetectionResult& d = r.value();
        bench.durations.push_back(d.duration_secs);
        if (!d.success) {
            bench.failed_runs++;
            if (!bench.first_failure) bench.first_failure = d;
        }
        log::debug("run %zu/%zu: %.3fs", i + 1, runs, d.duration_secs);
    }

    bench.stats = compute_bench_stats(bench.durations);
    return Result<BenchResult>::ok(std::move(bench));
}

} // namespace stacy
