#include <stacy/cache.hpp>
#include <stacy/cli.hpp>
#include <stacy/config.hpp>
#include <stacy/error_codes.hpp>
#include <stacy/fetcher.hpp>
#include <stacy/git.hpp>
#include <stacy/interpreter.hpp>
#include <stacy/isolation.hpp>
#include <stacy/lock_manager.hpp>
#include <stacy/log.hpp>
#include <stacy/orchestrator.hpp>
#include <stacy/process.hpp>
#include <stacy/project.hpp>
#include <stacy/report.hpp>
#include <stacy/resolver.hpp>
#include <stacy/runner.hpp>
#include <stacy/script_deps.hpp>
#include <stacy/signal.hpp>
#include <stacy/task.hpp>
#include <stacy/version.hpp>

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace stacy;

namespace {

// ---------------------------------------------------------------------------
// Shared state for one invocation
// ---------------------------------------------------------------------------

struct Context {
    cli::GlobalOptions global;
    fs::path cwd;
    std::optional<Config> user_config;
    std::optional<Project> project;
    Config config;                       // effective

    // Package machinery, built on first use
    std::unique_ptr<PackageCache> cache;
    CurlFetcher fetcher;
    GitCli git;
    std::unique_ptr<PackageResolver> resolver;
};

Status load_context(Context& ctx, const cli::GlobalOptions& global) {
    ctx.global = global;
    std::error_code ec;
    ctx.cwd = global.directory ? fs::path(*global.directory) : fs::current_path(ec);
    if (ec) return StacyError{StacyError::IO, "cannot determine working directory: " + ec.message()};
    if (!fs::is_directory(ctx.cwd, ec)) {
        return StacyError{StacyError::NotFound, "not a directory: " + ctx.cwd.string()};
    }

    auto user = load_user_config();
    if (user.is_err()) return std::move(user).error();
    ctx.user_config = std::move(user).value();

    auto found = find_manifest(ctx.cwd);
    if (found.is_ok()) {
        auto proj = Project::load(found.value().parent_path());
        if (proj.is_err()) return std::move(proj).error();
        ctx.project = std::move(proj).value();
    } else if (found.error().code != StacyError::NotFound) {
        return std::move(found).error();
    }

    std::optional<Config> project_cfg;
    if (ctx.project) project_cfg = Config::from_run(ctx.project->manifest.run);

    Config cli_cfg;
    cli_cfg.jobs = global.jobs;
    cli_cfg.timeout_seconds = global.timeout_seconds;
    cli_cfg.log_level = global.log_level;
    ctx.config = Config::effective(ctx.user_config, project_cfg, cli_cfg);

    if (ctx.config.log_level) {
        log::Level lvl;
        if (log::parse_level(*ctx.config.log_level, lvl)) {
            log::set_level(lvl);
        } else {
            log::warn("ignoring unknown log level '%s'", ctx.config.log_level->c_str());
        }
    }

    ctx.fetcher.set_offline(global.offline);
    ctx.git.set_offline(global.offline);
    return ok_status();
}

Result<Project*> require_project(Context& ctx) {
    if (!ctx.project) {
        return StacyError{StacyError::NotFound,
            "no stacy.toml found in " + ctx.cwd.string() + " or any parent directory",
            "run 'stacy init' to create a project"};
    }
    return Result<Project*>::ok(&*ctx.project);
}

Result<PackageCache*> open_cache(Context& ctx) {
    if (!ctx.cache) {
        auto cache = std::make_unique<PackageCache>(ctx.config.cache_root());
        STACY_TRY(cache->open());
        ctx.cache = std::move(cache);
    }
    return Result<PackageCache*>::ok(ctx.cache.get());
}

Result<PackageResolver*> open_resolver(Context& ctx) {
    if (!ctx.resolver) {
        auto cache = open_cache(ctx);
        if (cache.is_err()) return std::move(cache).error();
        ResolveOptions opts;
        opts.offline = ctx.global.offline;
        if (ctx.project) opts.project_root = ctx.project->root_dir.string();
        ctx.resolver = std::make_unique<PackageResolver>(*cache.value(), ctx.fetcher,
                                                         ctx.git, opts);
    }
    return Result<PackageResolver*>::ok(ctx.resolver.get());
}

Result<Interpreter> locate_interpreter(const Context& ctx) {
    InterpreterQuery q;
    q.engine = ctx.global.engine;
    if (const char* env = std::getenv("STATA_BINARY")) {
        if (*env) q.env_binary = std::string(env);
    }
    if (ctx.user_config) q.config_binary = ctx.user_config->stata_binary;
    return find_interpreter(q);
}

// Isolation for runs. Outside a project, or with allow_global, the
// interpreter keeps its global locations.
Result<IsolationPath> isolation_for(Context& ctx) {
    if (!ctx.project) return Result<IsolationPath>::ok(IsolationPath({}, true));

    const Manifest& m = ctx.project->manifest;
    bool allow_global = ctx.config.effective_allow_global();
    if (m.packages.empty()) return Result<IsolationPath>::ok(IsolationPath({}, allow_global));

    auto lock = ctx.project->require_lock();
    if (lock.is_err()) {
        if (lock.error().code != StacyError::NotFound) return std::move(lock).error();
        return StacyError{StacyError::Dependency,
            "stacy.toml declares packages but there is no stacy.lock",
            "run 'stacy lock' and 'stacy install'"};
    }
    auto cache = open_cache(ctx);
    if (cache.is_err()) return std::move(cache).error();
    return IsolationPath::from_lock(lock.value(), *cache.value(), all_groups(), allow_global);
}

Result<ScriptRunner> make_runner(const Context& ctx) {
    auto interp = locate_interpreter(ctx);
    if (interp.is_err()) return std::move(interp).error();
    RunnerOptions opts;
    opts.interpreter = interp.value().path;
    return Result<ScriptRunner>::ok(ScriptRunner(opts));
}

ExecutionRequest base_request(const Context& ctx, IsolationPath isolation) {
    ExecutionRequest req;
    req.working_dir = ctx.cwd.string();
    req.isolation = std::move(isolation);
    req.timeout_seconds = ctx.config.effective_timeout();
    if (ctx.config.log_dir) {
        fs::path dir(*ctx.config.log_dir);
        if (ctx.project) dir = ctx.project->resolve(dir);
        req.log_dir = dir.string();
    }
    return req;
}

// ---------------------------------------------------------------------------
// Human-readable output
// ---------------------------------------------------------------------------

void print_detection(const std::string& script, const DetectionResult& r) {
    if (r.success) {
        std::printf("PASS  %s (%.2fs)\n", script.c_str(), r.duration_secs);
        return;
    }
    if (r.signal != 0) {
        std::printf("KILL  %s (signal %d, %.2fs)\n", script.c_str(), r.signal, r.duration_secs);
        return;
    }
    std::printf("FAIL  %s (exit %d, %.2fs)\n", script.c_str(), r.exit_code, r.duration_secs);
    if (r.incomplete) {
        std::printf("      log ended before the do-file completed\n");
    }
    for (const auto& e : r.errors) {
        std::printf("      r(%d) %s [%s]\n", e.code.code, e.code.name.c_str(),
                    e.code.doc_ref().c_str());
        if (!e.context.empty()) {
            std::printf("      %s\n", e.context.c_str());
        }
        if (e.line > 0) std::printf("      at %s:%zu\n", r.log_path.c_str(), e.line);
    }
    if (!r.log_path.empty()) std::printf("      log: %s\n", r.log_path.c_str());
}

void print_outcome(const ScriptOutcome& o) {
    if (o.skipped) {
        std::printf("SKIP  %s\n", o.key.c_str());
    } else if (o.result) {
        print_detection(o.key, *o.result);
    } else if (o.error) {
        std::printf("ERROR %s: %s\n", o.key.c_str(), o.error->message.c_str());
    }
    std::fflush(stdout);
}

void print_batch_summary(const BatchResult& b) {
    std::printf("\n%zu passed, %zu failed, %zu skipped (%.2fs)%s\n",
                b.success_count, b.failed_count, b.skipped_count, b.duration_secs,
                b.cancelled ? ", cancelled" : "");
}

std::string human_bytes(int64_t n) {
    char buf[32];
    if (n >= 1024 * 1024) std::snprintf(buf, sizeof(buf), "%.1f MiB", n / (1024.0 * 1024.0));
    else if (n >= 1024) std::snprintf(buf, sizeof(buf), "%.1f KiB", n / 1024.0);
    else std::snprintf(buf, sizeof(buf), "%lld B", static_cast<long long>(n));
    return buf;
}

std::string format_time(int64_t t) {
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

void print_lock_check(const LockCheck& check) {
    if (check.in_sync()) {
        std::printf("stacy.lock is up to date\n");
        return;
    }
    std::printf("stacy.lock is out of date\n");
    if (!check.hash_matches) {
        std::printf("  manifest hash changed (%.12s -> %.12s)\n",
                    check.locked_hash.c_str(), check.manifest_hash.c_str());
    }
    for (const auto& c : check.changes) {
        std::printf("  %-8s %s", change_kind_name(c.kind), c.name.c_str());
        if (!c.reason.empty()) std::printf(" (%s)", c.reason.c_str());
        if (!c.locked_version.empty() || !c.wanted_version.empty()) {
            std::printf(" %s -> %s",
                        c.locked_version.empty() ? "-" : c.locked_version.c_str(),
                        c.wanted_version.empty() ? "?" : c.wanted_version.c_str());
        }
        if (!c.detail.empty()) std::printf(": %s", c.detail.c_str());
        std::printf("\n");
    }
}

// Lock `manifest`, then write manifest and lockfile together
Result<LockFile> relock(Context& ctx, const Manifest& manifest,
                        const GenerateOptions& opts, bool save_manifest) {
    auto resolver = open_resolver(ctx);
    if (resolver.is_err()) return std::move(resolver).error();
    auto existing = ctx.project->load_lock();
    if (existing.is_err()) return std::move(existing).error();

    LockManager lm(*resolver.value());
    auto lock = lm.generate(manifest, existing.value(), opts);
    if (lock.is_err()) return std::move(lock).error();

    if (save_manifest) {
        STACY_TRY(manifest.save(ctx.project->manifest_path.string()));
        ctx.project->manifest = manifest;
    }
    STACY_TRY(lock.value().save(ctx.project->lock_path().string()));
    return lock;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

struct Dispatcher {
    Context& ctx;

    Result<int> operator()(const cli::InitCmd& cmd) {
        fs::path dir = fs::path(cmd.dir).is_absolute() ? fs::path(cmd.dir) : ctx.cwd / cmd.dir;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) return StacyError{StacyError::IO, "cannot create " + dir.string() + ": " + ec.message()};
        if (has_manifest(dir) && !cmd.force) {
            return StacyError{StacyError::Duplicate,
                "stacy.toml already exists in " + dir.string(),
                "pass --force to overwrite it"};
        }

        Manifest m;
        m.project.name = cmd.name;
        if (m.project.name.empty()) {
            m.project.name = fs::absolute(dir, ec).lexically_normal().filename().string();
            if (m.project.name.empty()) m.project.name = "project";
        }
        STACY_TRY(m.save((dir / kManifestName).string()));
        log::info("created %s", (dir / kManifestName).c_str());
        if (!ctx.global.json) std::printf("Created %s\n", (dir / kManifestName).c_str());
        else std::printf("%s\n", report::init_json((dir / kManifestName).string()).c_str());
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::RunCmd& cmd) {
        auto runner = make_runner(ctx);
        if (runner.is_err()) return std::move(runner).error();
        auto iso = isolation_for(ctx);
        if (iso.is_err()) return std::move(iso).error();

        ExecutionRequest base = base_request(ctx, iso.value());
        base.mode = cmd.mode;
        base.args = cmd.args;

        if (!cmd.code.empty() || cmd.scripts.size() == 1) {
            ExecutionRequest req = base;
            if (!cmd.code.empty()) {
                req.inline_code = cmd.code;
                req.id = "<inline>";
            } else {
                req.script = cmd.scripts.front();
            }
            auto r = runner.value().run(req);
            if (r.is_err()) return std::move(r).error();
            if (ctx.global.json) std::printf("%s\n", report::run_json(req.key(), r.value()).c_str());
            else print_detection(req.key(), r.value());
            return Result<int>::ok(r.value().exit_code);
        }

        std::vector<ExecutionRequest> reqs;
        for (const auto& s : cmd.scripts) {
            ExecutionRequest req = base;
            req.script = s;
            reqs.push_back(std::move(req));
        }

        Orchestrator orch(runner.value());
        if (!ctx.global.json) orch.set_on_complete(print_outcome);
        BatchResult batch = cmd.parallel
            ? orch.run_parallel(reqs, static_cast<size_t>(ctx.config.effective_jobs()))
            : orch.run_sequential(reqs);

        if (ctx.global.json) {
            std::printf("%s\n", report::batch_json(batch).c_str());
        } else {
            for (const auto& o : batch.outcomes) {
                if (o.skipped) print_outcome(o);
            }
            print_batch_summary(batch);
        }
        return Result<int>::ok(batch.exit_code());
    }

    Result<int> operator()(const cli::DepsCmd& cmd) {
        fs::path script = fs::path(cmd.script).is_absolute() ? fs::path(cmd.script)
                                                             : ctx.cwd / cmd.script;
        DependencyAnalyzer analyzer;
        auto analysis = analyzer.analyze(script);
        if (analysis.is_err()) return std::move(analysis).error();
        const DependencyAnalysis& a = analysis.value();

        if (ctx.global.json) {
            std::printf("%s\n", report::deps_json(a).c_str());
            return Result<int>::ok(0);
        }

        if (cmd.flat) {
            for (const auto& d : a.flatten()) {
                std::printf("%s%s%s\n",
                            d.is_package ? d.path.c_str() : a.display_path(d.path).c_str(),
                            d.is_package ? " [package]" : "",
                            d.exists ? "" : " (missing)");
            }
        } else {
            std::printf("%s", a.format_tree().c_str());
        }

        std::printf("\n%zu unique dependencies", a.unique_count());
        if (a.has_circular()) std::printf(", %zu circular", a.circular_count());
        if (a.has_missing()) std::printf(", %zu missing", a.missing.size());
        std::printf("\n");
        for (const auto& c : a.cycles) {
            std::string path;
            for (size_t i = 0; i < c.size(); i++) {
                if (i) path += " -> ";
                path += a.display_path(c[i]);
            }
            std::printf("circular: %s\n", path.c_str());
        }
        for (const auto& m : a.missing) {
            std::printf("missing: %s\n", a.display_path(m).c_str());
        }
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::LockCmd& cmd) {
        auto proj = require_project(ctx);
        if (proj.is_err()) return std::move(proj).error();
        const Manifest& manifest = proj.value()->manifest;

        if (!cmd.check) {
            auto lock = relock(ctx, manifest, {}, false);
            if (lock.is_err()) return std::move(lock).error();
            if (ctx.global.json) {
                std::printf("%s\n", report::lock_json(lock.value()).c_str());
            } else {
                std::printf("Locked %zu package%s\n", lock.value().packages.size(),
                            lock.value().packages.size() == 1 ? "" : "s");
            }
            return Result<int>::ok(0);
        }

        auto existing = proj.value()->load_lock();
        if (existing.is_err()) return std::move(existing).error();
        if (!existing.value()) {
            return StacyError{StacyError::NotFound, "no stacy.lock to check",
                              "run 'stacy lock' first"};
        }

        auto resolver = open_resolver(ctx);
        if (resolver.is_err()) return std::move(resolver).error();
        LockManager lm(*resolver.value());
        auto check = lm.verify(manifest, *existing.value(), !ctx.global.offline);
        if (check.is_err()) return std::move(check).error();

        if (ctx.global.json) std::printf("%s\n", report::lock_check_json(check.value()).c_str());
        else print_lock_check(check.value());
        return Result<int>::ok(check.value().in_sync() ? 0 : 1);
    }

    Result<int> operator()(const cli::InstallCmd& cmd) {
        auto proj = require_project(ctx);
        if (proj.is_err()) return std::move(proj).error();
        auto lock = proj.value()->require_lock();
        if (lock.is_err()) return std::move(lock).error();
        if (!proj.value()->lock_is_current(lock.value())) {
            log::warn("stacy.lock was generated from a different stacy.toml; run 'stacy lock'");
        }

        auto resolver = open_resolver(ctx);
        if (resolver.is_err()) return std::move(resolver).error();
        LockManager lm(*resolver.value());
        auto installed = lm.install(lock.value(), cmd.groups.empty() ? all_groups() : cmd.groups);
        if (installed.is_err()) return std::move(installed).error();

        if (ctx.global.json) {
            std::printf("%s\n", report::install_json(installed.value()).c_str());
        } else {
            for (const auto& p : installed.value()) {
                std::printf("  %s %s\n", p.name.c_str(), p.version.c_str());
            }
            std::printf("Installed %zu package%s\n", installed.value().size(),
                        installed.value().size() == 1 ? "" : "s");
        }
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::AddCmd& cmd) {
        auto proj = require_project(ctx);
        if (proj.is_err()) return std::move(proj).error();

        auto source = PackageSource::parse(cmd.source);
        if (source.is_err()) return std::move(source).error();

        Manifest updated = proj.value()->manifest;
        GenerateOptions opts;
        for (const auto& name : cmd.names) {
            PackageRef ref;
            ref.name = name;
            ref.source = source.value();
            ref.constraint = cmd.version;
            ref.group = cmd.group;
            STACY_TRY(ref.validate());
            STACY_TRY(updated.add_package(ref));
            opts.update.insert(lowercase(name));
        }

        auto lock = relock(ctx, updated, opts, true);
        if (lock.is_err()) return std::move(lock).error();
        for (const auto& name : cmd.names) {
            const LockedPackage* p = lock.value().find(name);
            if (p && !ctx.global.json) {
                std::printf("Added %s %s (%s)\n", p->name.c_str(), p->version.c_str(),
                            group_name(cmd.group));
            }
        }
        if (ctx.global.json) {
            std::printf("%s\n", report::change_json("added", cmd.names).c_str());
        }
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::RemoveCmd& cmd) {
        auto proj = require_project(ctx);
        if (proj.is_err()) return std::move(proj).error();

        Manifest updated = proj.value()->manifest;
        for (const auto& name : cmd.names) {
            if (!updated.remove_package(name)) {
                return StacyError{StacyError::NotFound,
                    "package '" + name + "' is not declared in stacy.toml"};
            }
        }
        auto lock = relock(ctx, updated, {}, true);
        if (lock.is_err()) return std::move(lock).error();
        if (ctx.global.json) std::printf("%s\n", report::change_json("removed", cmd.names).c_str());
        else for (const auto& name : cmd.names) std::printf("Removed %s\n", name.c_str());
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::UpdateCmd& cmd) {
        auto proj = require_project(ctx);
        if (proj.is_err()) return std::move(proj).error();
        const Manifest& manifest = proj.value()->manifest;

        GenerateOptions opts;
        opts.update_all = cmd.names.empty();
        for (const auto& name : cmd.names) {
            if (!manifest.find_package(name)) {
                return StacyError{StacyError::NotFound,
                    "package '" + name + "' is not declared in stacy.toml"};
            }
            opts.update.insert(lowercase(name));
        }

        auto before = proj.value()->load_lock();
        if (before.is_err()) return std::move(before).error();
        auto lock = relock(ctx, manifest, opts, false);
        if (lock.is_err()) return std::move(lock).error();

        std::vector<std::string> changed;
        for (const auto& p : lock.value().packages) {
            const LockedPackage* old = before.value() ? before.value()->find(p.name) : nullptr;
            if (old && old->version == p.version && old->digest == p.digest) continue;
            changed.push_back(p.name);
            if (!ctx.global.json) {
                std::printf("  %s %s -> %s\n", p.name.c_str(),
                            old ? old->version.c_str() : "-", p.version.c_str());
            }
        }
        if (ctx.global.json) {
            std::printf("%s\n", report::change_json("updated", changed).c_str());
        } else {
            std::printf("Updated %zu package%s\n", changed.size(), changed.size() == 1 ? "" : "s");
        }
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::OutdatedCmd&) {
        auto proj = require_project(ctx);
        if (proj.is_err()) return std::move(proj).error();
        auto lock = proj.value()->require_lock();
        if (lock.is_err()) return std::move(lock).error();
        auto resolver = open_resolver(ctx);
        if (resolver.is_err()) return std::move(resolver).error();
        LockManager lm(*resolver.value());
        auto entries = lm.outdated(proj.value()->manifest, lock.value());
        if (entries.is_err()) return std::move(entries).error();

        if (ctx.global.json) {
            std::printf("%s\n", report::outdated_json(entries.value()).c_str());
            return Result<int>::ok(0);
        }
        std::printf("%-20s %-22s %-22s\n", "package", "locked", "latest");
        for (const auto& e : entries.value()) {
            std::string latest = e.error.empty() ? e.latest : "error: " + e.error;
            if (e.constrained) latest += " (outside constraint)";
            std::printf("%-20s %-22s %s\n", e.name.c_str(), e.locked.c_str(), latest.c_str());
        }
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::TaskCmd& cmd) {
        auto proj = require_project(ctx);
        if (proj.is_err()) return std::move(proj).error();
        auto graph = TaskGraph::build(proj.value()->manifest.tasks);
        if (graph.is_err()) return std::move(graph).error();

        if (cmd.list) {
            for (const auto& [name, def] : graph.value().tasks()) {
                std::printf("%-20s %s\n", name.c_str(), def.description.c_str());
            }
            return Result<int>::ok(0);
        }

        auto plan = graph.value().plan(cmd.name);
        if (plan.is_err()) return std::move(plan).error();
        auto runner = make_runner(ctx);
        if (runner.is_err()) return std::move(runner).error();
        auto iso = isolation_for(ctx);
        if (iso.is_err()) return std::move(iso).error();

        ExecutionRequest base = base_request(ctx, iso.value());
        base.working_dir = proj.value()->root_dir.string();
        base.args = cmd.args;

        TaskExecutor exec(runner.value(), base, static_cast<size_t>(ctx.config.effective_jobs()));
        if (!ctx.global.json) exec.set_on_complete(print_outcome);
        BatchResult batch = exec.execute(plan.value());

        if (ctx.global.json) {
            std::printf("%s\n", report::batch_json(batch).c_str());
        } else {
            for (const auto& o : batch.outcomes) {
                if (o.skipped) print_outcome(o);
            }
            print_batch_summary(batch);
        }
        return Result<int>::ok(batch.exit_code());
    }

    Result<int> operator()(const cli::TestCmd& cmd) {
        fs::path root = ctx.project ? ctx.project->root_dir : ctx.cwd;
        auto tests = discover_tests(root.string(), cmd.filters);
        if (tests.is_err()) return std::move(tests).error();
        if (tests.value().empty()) {
            log::warn("no test scripts found under %s", root.c_str());
            if (ctx.global.json) std::printf("%s\n", report::batch_json(BatchResult{}).c_str());
            return Result<int>::ok(0);
        }

        auto runner = make_runner(ctx);
        if (runner.is_err()) return std::move(runner).error();
        auto iso = isolation_for(ctx);
        if (iso.is_err()) return std::move(iso).error();

        ExecutionRequest base = base_request(ctx, iso.value());
        std::vector<ExecutionRequest> reqs;
        for (const auto& t : tests.value()) {
            ExecutionRequest req = base;
            req.script = t;
            req.working_dir = fs::path(t).parent_path().string();
            req.id = fs::relative(t, root).string();
            reqs.push_back(std::move(req));
        }

        Orchestrator orch(runner.value());
        if (!ctx.global.json) orch.set_on_complete(print_outcome);
        size_t jobs = cmd.sequential ? 1 : static_cast<size_t>(ctx.config.effective_jobs());
        BatchResult batch = orch.run_parallel(reqs, jobs);

        if (ctx.global.json) std::printf("%s\n", report::batch_json(batch).c_str());
        else print_batch_summary(batch);
        return Result<int>::ok(batch.exit_code());
    }

    Result<int> operator()(const cli::BenchCmd& cmd) {
        auto runner = make_runner(ctx);
        if (runner.is_err()) return std::move(runner).error();
        auto iso = isolation_for(ctx);
        if (iso.is_err()) return std::move(iso).error();

        ExecutionRequest req = base_request(ctx, iso.value());
        req.script = cmd.script;

        Orchestrator orch(runner.value());
        auto bench = orch.benchmark(req, cmd.warmup, cmd.runs);
        if (bench.is_err()) return std::move(bench).error();
        const BenchResult& b = bench.value();

        if (ctx.global.json) {
            std::printf("%s\n", report::bench_json(cmd.script, b).c_str());
        } else {
            const BenchStats& s = b.stats;
            std::printf("%s: %zu runs (%zu warm-up)\n", cmd.script.c_str(), s.runs, b.warmup_runs);
            std::printf("  mean   %8.3fs\n  median %8.3fs\n  min    %8.3fs\n"
                        "  max    %8.3fs\n  stddev %8.3fs\n",
                        s.mean, s.median, s.min, s.max, s.stddev);
            if (b.failed_runs > 0) std::printf("  %zu run(s) failed\n", b.failed_runs);
            if (b.first_failure) print_detection(cmd.script, *b.first_failure);
        }
        if (b.success()) return Result<int>::ok(0);
        if (b.first_failure) return Result<int>::ok(b.first_failure->exit_code);
        return Result<int>::ok(StacyError{StacyError::Cancelled, ""}.exit_code());
    }

    Result<int> operator()(const cli::EnvCmd&) {
        auto interp = locate_interpreter(ctx);
        std::string cache_root = ctx.config.cache_root();
        std::string s_ado = "(unavailable)";
        auto iso = isolation_for(ctx);
        if (iso.is_ok()) s_ado = iso.value().s_ado();
        else log::warn("%s", iso.error().message.c_str());

        std::printf("stacy        %s\n", STACY_VERSION);
        if (interp.is_ok()) {
            std::printf("interpreter  %s (%s)\n", interp.value().path.c_str(),
                        interp.value().found_by.c_str());
        } else {
            std::printf("interpreter  not found\n");
        }
        std::printf("cache        %s\n", cache_root.c_str());
        std::printf("config       %s%s\n", user_config_path().c_str(),
                    ctx.user_config ? "" : " (absent)");
        if (ctx.project) {
            std::printf("project      %s (%s)\n", ctx.project->manifest.project.name.c_str(),
                        ctx.project->root_dir.c_str());
            std::printf("packages     %zu declared\n", ctx.project->manifest.packages.size());
        } else {
            std::printf("project      none\n");
        }
        std::printf("S_ADO        %s\n", s_ado.c_str());
        std::printf("jobs         %d\n", ctx.config.effective_jobs());
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::DoctorCmd&) {
        int code = 0;
        auto check = [](bool ok, const std::string& what, const std::string& detail) {
            std::printf("%s %-14s %s\n", ok ? "[ok]  " : "[fail]", what.c_str(), detail.c_str());
        };

        auto interp = locate_interpreter(ctx);
        if (interp.is_ok()) {
            check(true, "interpreter", interp.value().path + " (" + interp.value().found_by + ")");
        } else {
            check(false, "interpreter", interp.error().message);
            if (!interp.error().hint.empty()) std::printf("       hint: %s\n", interp.error().hint.c_str());
            code = static_cast<int>(ExitClass::Environment);
        }

        auto cache = open_cache(ctx);
        if (cache.is_ok()) {
            check(true, "cache", ctx.config.cache_root());
        } else {
            check(false, "cache", cache.error().message);
            if (code == 0) code = static_cast<int>(ExitClass::Internal);
        }

        auto git = ctx.git.check_version();
        check(git.is_ok(), "git", git.is_ok() ? git.value() : git.error().message);
        bool curl = program_available("curl");
        check(curl, "curl", curl ? find_in_path("curl") : "not found on PATH");

        if (ctx.project) {
            auto lock = ctx.project->load_lock();
            if (lock.is_err()) {
                check(false, "lockfile", lock.error().message);
            } else if (!lock.value()) {
                check(ctx.project->manifest.packages.empty(), "lockfile", "no stacy.lock");
            } else {
                bool fresh = ctx.project->lock_is_current(*lock.value());
                check(fresh, "lockfile", fresh ? "matches stacy.toml"
                                               : "stale, run 'stacy lock'");
            }
        }
        return Result<int>::ok(code);
    }

    Result<int> operator()(const cli::ExplainCmd& cmd) {
        ErrorCode code = classify_error_code(cmd.code);
        if (ctx.global.json) {
            std::printf("%s\n", report::explain_json(code).c_str());
            return Result<int>::ok(0);
        }
        std::printf("r(%d): %s\n", code.code, code.name.c_str());
        std::printf("  category    %s\n", category_name(code.category));
        if (!code.description.empty()) std::printf("  description %s\n", code.description.c_str());
        std::printf("  exit code   %d (%s)\n", static_cast<int>(code.exit_class()),
                    exit_class_name(code.exit_class()));
        std::printf("  docs        %s\n", code.doc_ref().c_str());
        if (!code.known) std::printf("  (not in the code table; classified by range)\n");
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::CacheListCmd&) {
        auto cache = open_cache(ctx);
        if (cache.is_err()) return std::move(cache).error();
        auto entries = cache.value()->list();
        if (entries.is_err()) return std::move(entries).error();

        if (ctx.global.json) {
            std::printf("%s\n", report::cache_list_json(entries.value()).c_str());
            return Result<int>::ok(0);
        }
        int64_t total = 0;
        for (const auto& e : entries.value()) {
            std::printf("%-20s %-22s %10s  %s\n", e.name.c_str(), e.version.c_str(),
                        human_bytes(e.size_bytes).c_str(), format_time(e.last_access).c_str());
            total += e.size_bytes;
        }
        std::printf("%zu entries, %s in %s\n", entries.value().size(),
                    human_bytes(total).c_str(), cache.value()->root().c_str());
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::CacheCleanCmd& cmd) {
        auto cache = open_cache(ctx);
        if (cache.is_err()) return std::move(cache).error();

        std::set<std::string> in_use;
        if (ctx.project) {
            auto lock = ctx.project->load_lock();
            if (lock.is_err()) return std::move(lock).error();
            if (lock.value()) in_use = lock.value()->cache_keys();
        }

        int64_t max_age = static_cast<int64_t>(cmd.older_than_days) * 24 * 60 * 60;
        auto report = cache.value()->clean(max_age, in_use, cmd.force);
        if (report.is_err()) return std::move(report).error();
        const CleanReport& r = report.value();

        if (ctx.global.json) {
            std::printf("%s\n", report::clean_json(r).c_str());
            return Result<int>::ok(0);
        }
        for (const auto& e : r.removed) std::printf("removed  %s\n", e.key().c_str());
        for (const auto& e : r.kept_in_use) std::printf("kept     %s (in stacy.lock)\n", e.key().c_str());
        std::printf("Removed %zu entries (%s), %zu remaining\n", r.removed.size(),
                    human_bytes(r.freed_bytes).c_str(), r.remaining);
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::HelpCmd& cmd) {
        std::printf("%s", cmd.topic.empty() ? cli::usage().c_str()
                                            : cli::command_usage(cmd.topic).c_str());
        return Result<int>::ok(0);
    }

    Result<int> operator()(const cli::VersionCmd&) {
        std::printf("stacy %s\n", STACY_VERSION);
        return Result<int>::ok(0);
    }
};

int report_error(const StacyError& err, bool json) {
    if (json) std::printf("%s\n", report::error_json(err).c_str());
    std::fprintf(stderr, "%s\n", err.format().c_str());
    return err.exit_code();
}

} // namespace

int main(int argc, char** argv) {
    install_signal_handlers();

    std::vector<std::string> args(argv + 1, argv + argc);
    auto inv = cli::parse_args(args);
    if (inv.is_err()) return report_error(inv.error(), false);

    // Only help and version work without loading configuration
    const cli::Command& command = inv.value().command;
    if (std::holds_alternative<cli::HelpCmd>(command) ||
        std::holds_alternative<cli::VersionCmd>(command)) {
        Context bare;
        Dispatcher d{bare};
        auto r = std::visit(d, command);
        return r.is_ok() ? r.value() : report_error(r.error(), false);
    }

    Context ctx;
    auto loaded = load_context(ctx, inv.value().global);
    if (loaded.is_err()) return report_error(loaded.error(), inv.value().global.json);

    Dispatcher d{ctx};
    auto result = std::visit(d, command);
    if (result.is_err()) return report_error(result.error(), ctx.global.json);
    return result.value();
}
