#include <stacy/report.hpp>
#include <tomlplusplus/toml.hpp>

#include <sstream>

namespace stacy {
namespace report {

namespace {

std::string render(const toml::table& tbl) {
    std::ostringstream ss;
    ss << toml::json_formatter{tbl};
    return ss.str();
}

int64_t i64(size_t n) { return static_cast<int64_t>(n); }

toml::table error_entry(const ErrorOccurrence& e) {
    toml::table t;
    t.insert("code", int64_t{e.code.code});
    t.insert("name", e.code.name);
    t.insert("category", std::string(category_name(e.code.category)));
    t.insert("doc", e.code.doc_ref());
    t.insert("line", i64(e.line));
    t.insert("context", e.context);
    return t;
}

toml::table detection_table(const DetectionResult& r) {
    toml::table t;
    t.insert("success", r.success);
    t.insert("exit_code", int64_t{r.exit_code});
    t.insert("duration_secs", r.duration_secs);
    t.insert("log_file", r.log_path);
    t.insert("incomplete", r.incomplete);
    if (r.signal != 0) t.insert("signal", int64_t{r.signal});
    toml::array errors;
    for (const auto& e : r.errors) errors.push_back(error_entry(e));
    t.insert("errors", std::move(errors));
    return t;
}

toml::table error_table(const StacyError& err) {
    toml::table t;
    t.insert("kind", std::string(StacyError::code_name(err.code)));
    t.insert("message", err.message);
    if (!err.hint.empty()) t.insert("hint", err.hint);
    t.insert("exit_code", int64_t{err.exit_code()});
    return t;
}

toml::table outcome_table(const ScriptOutcome& o) {
    toml::table t;
    if (o.result) {
        t = detection_table(*o.result);
    } else {
        t.insert("success", false);
        t.insert("exit_code", int64_t{o.exit_code()});
    }
    t.insert("skipped", o.skipped);
    if (o.error) t.insert("error", error_table(*o.error));
    return t;
}

toml::table stats_table(const BenchStats& s) {
    toml::table t;
    t.insert("runs", i64(s.runs));
    t.insert("mean_secs", s.mean);
    t.insert("median_secs", s.median);
    t.insert("min_secs", s.min);
    t.insert("max_secs", s.max);
    t.insert("stddev_secs", s.stddev);
    return t;
}

toml::table entry_table(const CacheEntry& e) {
    toml::table t;
    t.insert("name", e.name);
    t.insert("version", e.version);
    t.insert("path", e.path);
    t.insert("digest", e.digest);
    t.insert("size_bytes", e.size_bytes);
    t.insert("last_access", e.last_access);
    return t;
}

} // namespace

std::string run_json(const std::string& script, const DetectionResult& r) {
    toml::table t = detection_table(r);
    t.insert("script", script);
    return render(t);
}

std::string batch_json(const BatchResult& batch) {
    toml::table t;
    t.insert("success", batch.success());
    t.insert("exit_code", int64_t{batch.exit_code()});
    t.insert("duration_secs", batch.duration_secs);
    t.insert("success_count", i64(batch.success_count));
    t.insert("failed_count", i64(batch.failed_count));
    t.insert("skipped_count", i64(batch.skipped_count));
    t.insert("cancelled", batch.cancelled);

    toml::table scripts;
    toml::array order;
    for (const auto& o : batch.outcomes) {
        scripts.insert_or_assign(o.key, outcome_table(o));
        order.push_back(o.key);
    }
    t.insert("scripts", std::move(scripts));
    t.insert("order", std::move(order));
    return render(t);
}

std::string bench_json(const std::string& script, const BenchResult& bench) {
    toml::table t;
    t.insert("script", script);
    t.insert("success", bench.success());
    t.insert("warmup_runs", i64(bench.warmup_runs));
    t.insert("failed_runs", i64(bench.failed_runs));
    t.insert("cancelled", bench.cancelled);
    t.insert("stats", stats_table(bench.stats));
    toml::array durations;
    for (double d : bench.durations) durations.push_back(d);
    t.insert("durations_secs", std::move(durations));
    if (bench.first_failure) t.insert("first_failure", detection_table(*bench.first_failure));
    return render(t);
}

std::string lock_check_json(const LockCheck& check) {
    toml::table t;
    t.insert("in_sync", check.in_sync());
    t.insert("hash_matches", check.hash_matches);
    t.insert("locked_hash", check.locked_hash);
    t.insert("manifest_hash", check.manifest_hash);
    toml::array changes;
    for (const auto& c : check.changes) {
        toml::table ct;
        ct.insert("kind", std::string(change_kind_name(c.kind)));
        ct.insert("name", c.name);
        if (!c.reason.empty()) ct.insert("reason", c.reason);
        if (!c.locked_version.empty()) ct.insert("locked_version", c.locked_version);
        if (!c.wanted_version.empty()) ct.insert("wanted_version", c.wanted_version);
        if (!c.detail.empty()) ct.insert("detail", c.detail);
        changes.push_back(std::move(ct));
    }
    t.insert("changes", std::move(changes));
    return render(t);
}

std::string deps_json(const DependencyAnalysis& a) {
    toml::table t;
    t.insert("root", a.display_path(a.graph.node(a.root).path));
    t.insert("unique_count", i64(a.unique_count()));
    t.insert("has_circular", a.has_circular());
    t.insert("circular_count", i64(a.circular_count()));
    t.insert("missing_count", i64(a.missing.size()));

    toml::array deps;
    for (const auto& d : a.flatten()) {
        toml::table dt;
        dt.insert("path", d.is_package ? d.path : a.display_path(d.path));
        dt.insert("kind", std::string(ref_kind_name(d.kind)));
        dt.insert("depth", i64(d.depth));
        dt.insert("exists", d.exists);
        deps.push_back(std::move(dt));
    }
    t.insert("dependencies", std::move(deps));

    toml::array cycles;
    for (const auto& c : a.cycles) {
        toml::array path;
        for (const auto& p : c) path.push_back(a.display_path(p));
        cycles.push_back(std::move(path));
    }
    t.insert("circular_paths", std::move(cycles));

    toml::array missing;
    for (const auto& m : a.missing) missing.push_back(a.display_path(m));
    t.insert("missing", std::move(missing));

    toml::array packages;
    for (const auto& p : a.packages) packages.push_back(p);
    t.insert("packages", std::move(packages));
    return render(t);
}

std::string clean_json(const CleanReport& report) {
    toml::table t;
    t.insert("removed_count", i64(report.removed.size()));
    t.insert("kept_in_use_count", i64(report.kept_in_use.size()));
    t.insert("remaining", i64(report.remaining));
    t.insert("freed_bytes", report.freed_bytes);
    toml::array removed;
    for (const auto& e : report.removed) removed.push_back(e.key());
    t.insert("removed", std::move(removed));
    toml::array kept;
    for (const auto& e : report.kept_in_use) kept.push_back(e.key());
    t.insert("kept_in_use", std::move(kept));
    return render(t);
}

std::string cache_list_json(const std::vector<CacheEntry>& entries) {
    toml::table t;
    toml::array list;
    int64_t total = 0;
    for (const auto& e : entries) {
        list.push_back(entry_table(e));
        total += e.size_bytes;
    }
    t.insert("count", i64(entries.size()));
    t.insert("total_bytes", total);
    t.insert("entries", std::move(list));
    return render(t);
}

std::string explain_json(const ErrorCode& code) {
    toml::table t;
    t.insert("code", int64_t{code.code});
    t.insert("name", code.name);
    t.insert("category", std::string(category_name(code.category)));
    t.insert("description", code.description);
    t.insert("exit_code", int64_t{static_cast<int>(code.exit_class())});
    t.insert("exit_class", std::string(exit_class_name(code.exit_class())));
    t.insert("doc", code.doc_ref());
    t.insert("known", code.known);
    return render(t);
}

std::string outdated_json(const std::vector<OutdatedEntry>& entries) {
    toml::table t;
    toml::array list;
    for (const auto& e : entries) {
        toml::table et;
        et.insert("name", e.name);
        et.insert("locked", e.locked);
        et.insert("latest", e.latest);
        et.insert("outdated", !e.latest.empty() && e.latest != e.locked);
        et.insert("constrained", e.constrained);
        if (!e.error.empty()) et.insert("error", e.error);
        list.push_back(std::move(et));
    }
    t.insert("packages", std::move(list));
    return render(t);
}

std::string error_json(const StacyError& err) {
    toml::table t;
    t.insert("success", false);
    t.insert("error", error_table(err));
    return render(t);
}

std::string init_json(const std::string& manifest_path) {
    toml::table t;
    t.insert("success", true);
    t.insert("manifest", manifest_path);
    return render(t);
}

std::string lock_json(const LockFile& lock) {
    toml::table t;
    t.insert("success", true);
    t.insert("packages", i64(lock.packages.size()));
    toml::array list;
    for (const auto& p : lock.packages) {
        toml::table pt;
        pt.insert("name", p.name);
        pt.insert("version", p.version);
        pt.insert("source", p.source);
        list.push_back(std::move(pt));
    }
    t.insert("locked", std::move(list));
    return render(t);
}

std::string install_json(const std::vector<ResolvedPackage>& installed) {
    toml::table t;
    t.insert("success", true);
    t.insert("installed", i64(installed.size()));
    toml::array list;
    for (const auto& p : installed) {
        toml::table pt;
        pt.insert("name", p.name);
        pt.insert("version", p.version);
        pt.insert("path", p.path);
        list.push_back(std::move(pt));
    }
    t.insert("packages", std::move(list));
    return render(t);
}

std::string change_json(const std::string& action, const std::vector<std::string>& names) {
    toml::table t;
    t.insert("success", true);
    t.insert(action, i64(names.size()));
    toml::array list;
    for (const auto& n : names) list.push_back(n);
    t.insert("packages", std::move(list));
    return render(t);
}

} // namespace report
} // namespace stacy
