#pragma once

#include <stacy/runner.hpp>
#include <stacy/result.hpp>

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stacy {

// What happened to one request of a batch
struct ScriptOutcome {
    std::string key;
    std::optional<DetectionResult> result;   // set when the script ran
    std::optional<StacyError> error;         // tool-level failure for this request
    bool skipped = false;                    // never started (fail-fast or cancellation)

    bool succeeded() const { return result && result->success; }
    int exit_code() const;
};

struct BatchResult {
    std::vector<ScriptOutcome> outcomes;     // request order
    size_t success_count = 0;
    size_t failed_count = 0;
    size_t skipped_count = 0;
    bool cancelled = false;
    double duration_secs = 0.0;

    bool success() const { return failed_count == 0 && skipped_count == 0 && !cancelled; }
    const ScriptOutcome* find(const std::string& key) const;

    // Exit code of the first failure in request order, 0 on success
    int exit_code() const;
};

struct BenchStats {
    size_t runs = 0;
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    double stddev = 0.0;     // population
};

// Statistics of wall-clock durations; an even count takes the mean of the
// two middle values as the median
BenchStats compute_bench_stats(std::vector<double> durations);

struct BenchResult {
    BenchStats stats;
    std::vector<double> durations;           // measured runs only
    size_t warmup_runs = 0;
    size_t failed_runs = 0;
    std::optional<DetectionResult> first_failure;
    bool cancelled = false;

    bool success() const { return failed_runs == 0 && !cancelled; }
};

using OutcomeCallback = std::function<void(const ScriptOutcome&)>;

// Counting semaphore bounding how many interpreters run at once across
// every orchestrator that shares it
class JobSlots {
public:
    explicit JobSlots(size_t slots) : free_(slots == 0 ? 1 : slots) {}

    void acquire();
    void release();

    class Guard {
    public:
        explicit Guard(JobSlots* slots) : slots_(slots) { if (slots_) slots_->acquire(); }
        ~Guard() { if (slots_) slots_->release(); }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
    private:
        JobSlots* slots_;
    };

private:
    std::mutex mu_;
    std::condition_variable cv_;
    size_t free_;
};

class Orchestrator {
public:
    explicit Orchestrator(const ScriptRunner& runner) : runner_(runner) {}

    // Strict request order; stops at the first failure and marks the rest
    // skipped
    BatchResult run_sequential(const std::vector<ExecutionRequest>& requests);

    // Bounded pool of `jobs` workers. Every request runs regardless of
    // other failures; only cancellation leaves requests unstarted.
    BatchResult run_parallel(const std::vector<ExecutionRequest>& requests, size_t jobs);

    // `warmup` discarded runs, then `runs` measured ones. A tool-level
    // failure aborts; a failing script only marks the benchmark failed.
    Result<BenchResult> benchmark(const ExecutionRequest& request,
                                  size_t warmup, size_t runs);

    // Called once per finished request, serialized across workers
    void set_on_complete(OutcomeCallback cb) { on_complete_ = std::move(cb); }

    // Draw interpreter slots from `slots` and serialize callbacks on
    // `notify_mu` instead of this orchestrator's own. Both must outlive it.
    void share_limits(JobSlots* slots, std::mutex* notify_mu) {
        slots_ = slots;
        shared_notify_mu_ = notify_mu;
    }

private:
    ScriptOutcome run_one(const ExecutionRequest& req) const;
    void notify(const ScriptOutcome& o);

    const ScriptRunner& runner_;
    OutcomeCallback on_complete_;
    std::mutex notify_mu_;
    JobSlots* slots_ = nullptr;
    std::mutex* shared_notify_mu_ = nullptr;
};

} // namespace stacy
