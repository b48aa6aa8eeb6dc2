#pragma once

#include <stacy/manifest.hpp>
#include <stacy/orchestrator.hpp>
#include <stacy/result.hpp>
#include <stacy/runner.hpp>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace stacy {

// Expanded form of a task: scripts at the leaves, sequences and parallel
// groups above them
struct TaskNode {
    enum class Kind { Script, Sequence, Parallel };

    std::string name;        // task name, or the script path for a bare step
    Kind kind = Kind::Script;
    std::string script;
    std::map<std::string, std::string> args;
    std::vector<TaskNode> children;

    // Leaf scripts in execution order
    std::vector<const TaskNode*> scripts() const;
};

// The [scripts] table, validated on construction: every step names a known
// task or a `.do` file, and no task reaches itself
class TaskGraph {
public:
    static Result<TaskGraph> build(const std::map<std::string, TaskDef>& tasks);

    bool has_task(const std::string& name) const { return tasks_.count(name) > 0; }
    const TaskDef* find(const std::string& name) const;
    const std::map<std::string, TaskDef>& tasks() const { return tasks_; }

    Result<TaskNode> plan(const std::string& name) const;

    // Up to three task names close to `name`, for "did you mean"
    std::vector<std::string> similar(const std::string& name) const;

private:
    std::map<std::string, TaskDef> tasks_;

    TaskNode expand(const std::string& step) const;
};

// True when a step refers to a script file rather than a task
bool is_script_step(const std::string& step);

// Test scripts under `root`: test_*.do and *_test.do anywhere, plus every
// .do file below tests/ or test/. Hidden directories are skipped. With
// filters, only scripts whose stem contains one of them. Sorted by path.
Result<std::vector<std::string>> discover_tests(const std::string& root,
                                                const std::vector<std::string>& filters = {});

// Runs a planned task. Sequences stop at the first failure; parallel groups
// always run every member.
class TaskExecutor {
public:
    // `base` supplies working directory, isolation, mode, timeout and log dir
    // `jobs` bounds concurrent interpreters across all nested parallel groups
    TaskExecutor(const ScriptRunner& runner, ExecutionRequest base, size_t jobs)
        : runner_(runner), base_(std::move(base)), jobs_(jobs), slots_(jobs) {}

    BatchResult execute(const TaskNode& node);

    void set_on_complete(OutcomeCallback cb) { on_complete_ = std::move(cb); }

private:
    ExecutionRequest request_for(const TaskNode& leaf) const;
    void run_node(const TaskNode& node, BatchResult& out);

    const ScriptRunner& runner_;
    ExecutionRequest base_;
    size_t jobs_;
    OutcomeCallback on_complete_;
    JobSlots slots_;
    std::mutex notify_mu_;
};

} // namespace stacy
