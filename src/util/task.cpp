#include <stacy/task.hpp>
#include <stacy/graph.hpp>
#include <stacy/log.hpp>
#include <stacy/signal.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <thread>

namespace fs = std::filesystem;

namespace stacy {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

size_t edit_distance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); j++) prev[j] = j;
    for (size_t i = 1; i <= a.size(); i++) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); j++) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

void merge_into(BatchResult& out, BatchResult&& part) {
    for (auto& o : part.outcomes) out.outcomes.push_back(std::move(o));
    out.success_count += part.success_count;
    out.failed_count += part.failed_count;
    out.skipped_count += part.skipped_count;
    out.cancelled = out.cancelled || part.cancelled;
}

void mark_skipped(const TaskNode& node, BatchResult& out) {
    for (const TaskNode* leaf : node.scripts()) {
        ScriptOutcome o;
        o.key = leaf->name;
        o.skipped = true;
        out.outcomes.push_back(std::move(o));
        out.skipped_count++;
    }
}

} // namespace

bool is_script_step(const std::string& step) {
    return ends_with(lowercase(step), ".do");
}

std::vector<const TaskNode*> TaskNode::scripts() const {
    std::vector<const TaskNode*> out;
    if (kind == Kind::Script) {
        out.push_back(this);
        return out;
    }
    for (const auto& c : children) {
        auto sub = c.scripts();
        out.insert(out.end(), sub.begin(), sub.end());
    }
    return out;
}

// ---------------------------------------------------------------------------
// TaskGraph
// ---------------------------------------------------------------------------

Result<TaskGraph> TaskGraph::build(const std::map<std::string, TaskDef>& tasks) {
    GraphMap<> graph;
    for (const auto& [name, def] : tasks) {
        graph.add_node(name);
        for (const auto& step : def.steps) {
            if (tasks.count(step)) {
                graph.add_edge(name, step);
                continue;
            }
            if (is_script_step(step)) continue;
            return StacyError{StacyError::Config,
                "task '" + name + "' references unknown task '" + step + "'",
                "steps are task names or paths ending in .do"};
        }
    }

    for (const auto& [name, def] : tasks) {
        (void)def;
        auto cycle = graph.find_cycle(name);
        if (cycle.empty()) continue;
        std::string path;
        for (size_t i = 0; i < cycle.size(); i++) {
            if (i) path += " -> ";
            path += cycle[i];
        }
        return StacyError{StacyError::Cycle, "circular task reference: " + path};
    }

    TaskGraph g;
    g.tasks_ = tasks;
    return Result<TaskGraph>::ok(std::move(g));
}

const TaskDef* TaskGraph::find(const std::string& name) const {
    auto it = tasks_.find(name);
    return it == tasks_.end() ? nullptr : &it->second;
}

TaskNode TaskGraph::expand(const std::string& step) const {
    TaskNode node;
    node.name = step;
    const TaskDef* def = find(step);
    if (!def) {
        node.kind = TaskNode::Kind::Script;
        node.script = step;
        return node;
    }
    switch (def->kind) {
    case TaskDef::Kind::Script:
        node.kind = TaskNode::Kind::Script;
        node.script = def->script;
        node.args = def->args;
        break;
    case TaskDef::Kind::Sequence:
    case TaskDef::Kind::Parallel:
        node.kind = def->kind == TaskDef::Kind::Sequence ? TaskNode::Kind::Sequence
                                                         : TaskNode::Kind::Parallel;
        for (const auto& s : def->steps) node.children.push_back(expand(s));
        break;
    }
    return node;
}

Result<TaskNode> TaskGraph::plan(const std::string& name) const {
    if (!has_task(name)) {
        std::string hint;
        auto near = similar(name);
        if (!near.empty()) {
            hint = "did you mean '" + near.front() + "'?";
        } else {
            hint = "run 'stacy task --list' to see the defined tasks";
        }
        return StacyError{StacyError::NotFound, "unknown task '" + name + "'", hint};
    }
    return Result<TaskNode>::ok(expand(name));
}

std::vector<std::string> TaskGraph::similar(const std::string& name) const {
    std::string want = lowercase(name);
    std::vector<std::pair<size_t, std::string>> scored;
    for (const auto& [task, def] : tasks_) {
        (void)def;
        std::string have = lowercase(task);
        size_t d = edit_distance(have, want);
        bool contains = !want.empty() &&
            (have.find(want) != std::string::npos || want.find(have) != std::string::npos);
        if (d <= 2 || contains) scored.emplace_back(contains ? 0 : d, task);
    }
    std::sort(scored.begin(), scored.end());
    std::vector<std::string> out;
    for (size_t i = 0; i < scored.size() && i < 3; i++) out.push_back(scored[i].second);
    return out;
}

// ---------------------------------------------------------------------------
// Test discovery
// ---------------------------------------------------------------------------

Result<std::vector<std::string>> discover_tests(const std::string& root,
                                                const std::vector<std::string>& filters) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return StacyError{StacyError::NotFound, "not a directory: " + root};
    }

    std::set<std::string> found;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return StacyError{StacyError::IO, "cannot scan " + root + ": " + ec.message()};

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) return StacyError{StacyError::IO, "cannot scan " + root + ": " + ec.message()};
        const fs::path& p = it->path();
        std::string fname = p.filename().string();
        if (!fname.empty() && fname[0] == '.') {
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec) || lowercase(p.extension().string()) != ".do") continue;

        std::string stem = p.stem().string();
        bool named = stem.rfind("test_", 0) == 0 ||
                     (stem.size() > 5 && ends_with(stem, "_test"));
        bool in_test_dir = false;
        for (const auto& part : fs::relative(p, root, ec).parent_path()) {
            if (part == "tests" || part == "test") in_test_dir = true;
        }
        if (!named && !in_test_dir) continue;

        if (!filters.empty()) {
            bool hit = false;
            for (const auto& f : filters) {
                if (stem.find(f) != std::string::npos) hit = true;
            }
            if (!hit) continue;
        }
        found.insert(p.string());
    }
    return Result<std::vector<std::string>>::ok({found.begin(), found.end()});
}

// ---------------------------------------------------------------------------
// TaskExecutor
// ---------------------------------------------------------------------------

ExecutionRequest TaskExecutor::request_for(const TaskNode& leaf) const {
    ExecutionRequest req = base_;
    req.id = leaf.name;
    req.script = leaf.script;
    req.inline_code.clear();
    for (const auto& [k, v] : leaf.args) req.args[k] = v;
    return req;
}

BatchResult TaskExecutor::execute(const TaskNode& node) {
    BatchResult out;
    auto start = std::chrono::steady_clock::now();
    run_node(node, out);
    out.cancelled = out.cancelled || is_cancelled();
    out.duration_secs = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    return out;
}

void TaskExecutor::run_node(const TaskNode& node, BatchResult& out) {
    Orchestrator orch(runner_);
    orch.share_limits(&slots_, &notify_mu_);
    if (on_complete_) orch.set_on_complete(on_complete_);

    switch (node.kind) {
    case TaskNode::Kind::Script: {
        log::info("task %s: %s", node.name.c_str(), node.script.c_str());
        merge_into(out, orch.run_sequential({request_for(node)}));
        return;
    }
    case TaskNode::Kind::Sequence: {
        bool stop = false;
        for (const auto& child : node.children) {
            if (stop || is_cancelled()) {
                mark_skipped(child, out);
                continue;
            }
            size_t failed_before = out.failed_count;
            size_t skipped_before = out.skipped_count;
            run_node(child, out);
            if (out.failed_count != failed_before || out.skipped_count != skipped_before) {
                stop = true;
            }
        }
        return;
    }
    case TaskNode::Kind::Parallel: {
        bool leaves_only = std::all_of(node.children.begin(), node.children.end(),
            [](const TaskNode& c) { return c.kind == TaskNode::Kind::Script; });
        if (leaves_only) {
            std::vector<ExecutionRequest> reqs;
            for (const auto& c : node.children) reqs.push_back(request_for(c));
            log::info("task %s: %zu scripts in parallel", node.name.c_str(), reqs.size());
            merge_into(out, orch.run_parallel(reqs, jobs_));
            return;
        }

        // Composite members each get a thread; results keep declaration order
        std::vector<BatchResult> parts(node.children.size());
        std::vector<std::thread> threads;
        threads.reserve(node.children.size());
        for (size_t i = 0; i < node.children.size(); i++) {
            threads.emplace_back([this, &node, &parts, i]() {
                run_node(node.children[i], parts[i]);
            });
        }
        for (auto& t : threads) t.join();
        for (auto& p : parts) merge_into(out, std::move(p));
        return;
    }
    }
}

} // namespace stacy
