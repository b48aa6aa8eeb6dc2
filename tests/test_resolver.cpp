#include <catch2/catch.hpp>
#include <stacy/lock_manager.hpp>
#include <stacy/resolver.hpp>
#include "test_helpers.hpp"

using namespace stacy;
using stacy::testing::TempDir;
namespace fs = std::filesystem;

static const std::string kEstoutDir = std::string(kSscBaseUrl) + "/e/";
static const std::string kMirrorDir = std::string(kSscMirrorUrl) + "/e/";

static std::string estout_pkg(const std::string& date) {
    return "v 3\n"
           "d 'ESTOUT': module to make regression tables\n"
           "d Distribution-Date: " + date + "\n"
           "f estout.ado\n"
           "f estout.sthlp\n";
}

static void serve_estout(StaticFetcher& f, const std::string& dir,
                         const std::string& date = "20230212",
                         const std::string& body = "program define estout\nend\n") {
    f.add(dir + "estout.pkg", estout_pkg(date));
    f.add(dir + "estout.ado", body);
    f.add(dir + "estout.sthlp", "{smcl}\n");
}

static PackageRef ssc_ref(const std::string& name, const std::string& constraint = "") {
    PackageRef ref;
    ref.name = name;
    ref.constraint = constraint;
    return ref;
}

// Cache, fetcher and resolver over a scratch directory
struct Fixture {
    TempDir td{"stacy_resolve_test"};
    PackageCache cache{(td.path / "cache").string()};
    StaticFetcher fetcher;
    GitCli git;
    ResolveOptions options;

    Fixture() {
        options.project_root = td.path.string();
        options.today = "20240601";
        REQUIRE(cache.open().is_ok());
    }

    PackageResolver resolver() { return PackageResolver(cache, fetcher, git, options); }
};

// ===== Index sources =====

TEST_CASE("resolve an index package", "[resolver]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    auto resolver = fx.resolver();

    auto r = resolver.resolve(ssc_ref("estout"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().version == "20230212");
    REQUIRE(r.value().digest.size() == 64);
    REQUIRE(fs::exists(fs::path(r.value().path) / "estout.ado"));
    REQUIRE(fs::exists(fs::path(r.value().path) / "estout.pkg"));

    auto locked = r.value().to_locked();
    REQUIRE(locked.source == "ssc");
    REQUIRE(locked.group == "dependencies");
}

TEST_CASE("index constraint not satisfied", "[resolver]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    auto resolver = fx.resolver();

    auto r = resolver.resolve(ssc_ref("estout", ">=20240101"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::Version);
}

TEST_CASE("unreachable index falls back to the mirror", "[resolver]") {
    Fixture fx;
    fx.fetcher.set_unreachable(kSscBaseUrl);
    serve_estout(fx.fetcher, kMirrorDir);
    auto resolver = fx.resolver();

    auto r = resolver.resolve(ssc_ref("estout"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().version == "20230212");
}

TEST_CASE("package missing from every index", "[resolver]") {
    Fixture fx;
    auto resolver = fx.resolver();

    auto r = resolver.resolve(ssc_ref("nosuchpkg"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::Dependency);
}

TEST_CASE("every index unreachable is a network error", "[resolver]") {
    Fixture fx;
    fx.fetcher.set_unreachable("http");
    auto resolver = fx.resolver();

    auto r = resolver.resolve(ssc_ref("estout"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::Network);
}

TEST_CASE("descriptor without a date uses today", "[resolver]") {
    Fixture fx;
    fx.fetcher.add(kEstoutDir + "estout.pkg", "d 'ESTOUT': tables\nf estout.ado\n");
    fx.fetcher.add(kEstoutDir + "estout.ado", "program define estout\nend\n");
    auto resolver = fx.resolver();

    auto r = resolver.resolve(ssc_ref("estout"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().version == "20240601");
}

TEST_CASE("offline resolution of an uncached package", "[resolver]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    fx.options.offline = true;
    auto resolver = fx.resolver();

    auto r = resolver.resolve(ssc_ref("estout"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::Network);
    REQUIRE(fx.fetcher.request_count() == 0);
}

TEST_CASE("lock hint reuses the cached entry", "[resolver]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    auto resolver = fx.resolver();

    auto first = resolver.resolve(ssc_ref("estout"));
    REQUIRE(first.is_ok());
    auto locked = first.value().to_locked();
    int requests = fx.fetcher.request_count();

    auto again = resolver.resolve(ssc_ref("estout"), &locked);
    REQUIRE(again.is_ok());
    REQUIRE(again.value().digest == locked.digest);
    REQUIRE(fx.fetcher.request_count() == requests);
}

// ===== Local sources =====

TEST_CASE("resolve a local package", "[resolver]") {
    Fixture fx;
    fx.td.write_file("vendor/mytools/mytools.ado", "program define mytools\nend\n");
    fx.td.write_file("vendor/mytools/mytools.sthlp", "{smcl}\n");
    fx.td.write_file("vendor/mytools/README.md", "not a package file\n");
    auto resolver = fx.resolver();

    PackageRef ref;
    ref.name = "mytools";
    ref.source = PackageSource::parse("local:vendor/mytools").value();

    auto r = resolver.resolve(ref);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().version.rfind("local-", 0) == 0);
    REQUIRE(fs::exists(fs::path(r.value().path) / "mytools.ado"));
    REQUIRE_FALSE(fs::exists(fs::path(r.value().path) / "README.md"));
    REQUIRE(fx.fetcher.request_count() == 0);
}

TEST_CASE("collect files named by a descriptor", "[resolver]") {
    TempDir td("stacy_collect_test");
    td.write_file("src/mycmd.pkg", "d 'MYCMD': does things\nf mycmd.ado\nf mycmd.sthlp\n");
    td.write_file("src/mycmd.ado", "program define mycmd\nend\n");
    td.write_file("src/mycmd.sthlp", "{smcl}\n");
    td.write_file("src/other.ado", "program define other\nend\n");

    auto files = collect_package_files(td.path.string(), "mycmd");
    REQUIRE(files.is_ok());
    REQUIRE(files.value().count("mycmd.ado") == 1);
    REQUIRE(files.value().count("mycmd.pkg") == 1);
    REQUIRE(files.value().count("other.ado") == 0);
}

TEST_CASE("descriptor listing a missing file", "[resolver]") {
    TempDir td("stacy_collect_test");
    td.write_file("mycmd.pkg", "d 'MYCMD': does things\nf mycmd.ado\n");

    auto files = collect_package_files(td.path.string(), "mycmd");
    REQUIRE(files.is_err());
    REQUIRE(files.error().code == StacyError::NotFound);
}

TEST_CASE("directory without package files", "[resolver]") {
    TempDir td("stacy_collect_test");
    td.write_file("notes.txt", "nothing here\n");

    auto files = collect_package_files(td.path.string(), "mycmd");
    REQUIRE(files.is_err());
    REQUIRE(files.error().code == StacyError::Dependency);
}

// ===== Install from a lockfile =====

TEST_CASE("install a locked package into an empty cache", "[resolver]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    LockedPackage locked;
    {
        auto resolver = fx.resolver();
        locked = resolver.resolve(ssc_ref("estout")).value().to_locked();
    }

    PackageCache fresh((fx.td.path / "fresh").string());
    REQUIRE(fresh.open().is_ok());
    PackageResolver resolver(fresh, fx.fetcher, fx.git, fx.options);

    auto r = resolver.install(locked);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().digest == locked.digest);
    REQUIRE(r.value().version == "20230212");
}

TEST_CASE("install detects upstream drift", "[resolver]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    LockedPackage locked;
    {
        auto resolver = fx.resolver();
        locked = resolver.resolve(ssc_ref("estout")).value().to_locked();
    }

    PackageCache fresh((fx.td.path / "fresh").string());
    REQUIRE(fresh.open().is_ok());
    PackageResolver resolver(fresh, fx.fetcher, fx.git, fx.options);

    SECTION("new distribution date") {
        serve_estout(fx.fetcher, kEstoutDir, "20240301");
        auto r = resolver.install(locked);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == StacyError::Checksum);
    }

    SECTION("same date, different content") {
        serve_estout(fx.fetcher, kEstoutDir, "20230212", "program define estout\n* edited\nend\n");
        auto r = resolver.install(locked);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == StacyError::Checksum);
    }
}

TEST_CASE("install rejects a malformed lockfile source", "[resolver]") {
    Fixture fx;
    auto resolver = fx.resolver();
    LockedPackage locked{"estout", "20230212", "cran", "d", "dependencies", "", ""};

    auto r = resolver.install(locked);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.rfind("lockfile entry 'estout': ", 0) == 0);
}

// ===== Repository sources =====

// Repository under `dir` with one commit tagged 1.2.0; returns its source string
static std::string make_tagged_repo(TempDir& td, const std::string& dir) {
    td.write_file(dir + "/mypkg.ado", "program define mypkg\nend\n");
    td.write_file(dir + "/mypkg.sthlp", "{smcl}\n");
    std::string path = (td.path / dir).string();

    auto git = [&](std::vector<std::string> args) {
        std::vector<std::string> argv{"git", "-C", path,
                                      "-c", "user.name=stacy",
                                      "-c", "user.email=stacy@example.com",
                                      "-c", "commit.gpgsign=false"};
        argv.insert(argv.end(), args.begin(), args.end());
        auto r = run_command(argv, "", 60);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().exit_code == 0);
    };
    git({"init", "--quiet"});
    git({"add", "."});
    git({"commit", "--quiet", "-m", "initial"});
    git({"tag", "1.2.0"});
    return "git:file://" + path;
}

TEST_CASE("relock a tagged repository package on a cold cache", "[resolver]") {
    if (!program_available("git")) {
        WARN("git is not installed");
        return;
    }
    Fixture fx;
    PackageRef ref;
    ref.name = "mypkg";
    ref.source = PackageSource::parse(make_tagged_repo(fx.td, "upstream")).value();
    ref.constraint = "^1.0";

    LockedPackage locked;
    {
        auto resolver = fx.resolver();
        auto first = resolver.resolve(ref);
        REQUIRE(first.is_ok());
        REQUIRE(first.value().version == "1.2.0");
        locked = first.value().to_locked();
    }
    REQUIRE(locked.commit.size() == 40);

    PackageCache cold((fx.td.path / "cold").string());
    REQUIRE(cold.open().is_ok());
    PackageResolver resolver(cold, fx.fetcher, fx.git, fx.options);

    auto again = resolver.resolve(ref, &locked);
    REQUIRE(again.is_ok());
    REQUIRE(again.value().version == "1.2.0");
    REQUIRE(again.value().commit == locked.commit);
    REQUIRE(again.value().digest == locked.digest);
}

// ===== LockManager =====

static Manifest manifest_of(const std::string& toml) {
    auto m = Manifest::parse(toml);
    REQUIRE(m.is_ok());
    return m.value();
}

TEST_CASE("generate a lockfile", "[lock_manager]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    auto resolver = fx.resolver();
    LockManager lm(resolver);

    auto manifest = manifest_of("[packages.dependencies]\nestout = \"ssc\"\n");
    auto lf = lm.generate(manifest, std::nullopt);
    REQUIRE(lf.is_ok());
    REQUIRE(lf.value().manifest_hash == manifest.dependency_hash());
    REQUIRE(lf.value().packages.size() == 1);
    REQUIRE(lf.value().packages[0].version == "20230212");
}

TEST_CASE("generate reports the failing package", "[lock_manager]") {
    Fixture fx;
    auto resolver = fx.resolver();
    LockManager lm(resolver);

    auto lf = lm.generate(manifest_of("[packages.dependencies]\nnosuchpkg = \"ssc\"\n"),
                          std::nullopt);
    REQUIRE(lf.is_err());
    REQUIRE(lf.error().message.rfind("resolving 'nosuchpkg': ", 0) == 0);
}

TEST_CASE("install names the package that failed", "[lock_manager]") {
    Fixture fx;
    auto resolver = fx.resolver();
    LockManager lm(resolver);

    LockFile lf;
    lf.packages.push_back({"estout", "20230212", "ssc", "d1", "dependencies", "", ""});
    auto r = lm.install(lf, all_groups());
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.rfind("installing 'estout': ", 0) == 0);
}

TEST_CASE("lock check detects a tightened constraint", "[lock_manager]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    auto resolver = fx.resolver();
    LockManager lm(resolver);

    auto manifest = manifest_of("[packages.dependencies]\nestout = \"ssc\"\n");
    auto lf = lm.generate(manifest, std::nullopt).value();

    auto same = lm.verify(manifest, lf);
    REQUIRE(same.is_ok());
    REQUIRE(same.value().in_sync());

    auto tightened = manifest_of(
        "[packages.dependencies]\nestout = { source = \"ssc\", version = \">=20240101\" }\n");
    auto check = lm.verify(tightened, lf);
    REQUIRE(check.is_ok());
    REQUIRE_FALSE(check.value().in_sync());
    REQUIRE_FALSE(check.value().hash_matches);
    REQUIRE(check.value().changes.size() == 1);
    REQUIRE(check.value().changes[0].kind == LockChange::Kind::Changed);
    REQUIRE(check.value().changes[0].reason == "constraint");
    REQUIRE(check.value().changes[0].locked_version == "20230212");
}

TEST_CASE("lock check reports added and removed packages", "[lock_manager]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    auto resolver = fx.resolver();
    LockManager lm(resolver);

    auto lf = lm.generate(manifest_of("[packages.dependencies]\nestout = \"ssc\"\n"),
                          std::nullopt).value();

    auto other = manifest_of("[packages.dependencies]\nftools = \"ssc\"\n");
    auto check = lm.verify(other, lf).value();
    REQUIRE(check.changes.size() == 2);
    REQUIRE(check.changes[0].kind == LockChange::Kind::Added);
    REQUIRE(check.changes[0].name == "ftools");
    REQUIRE(check.changes[1].kind == LockChange::Kind::Removed);
    REQUIRE(check.changes[1].name == "estout");
}

TEST_CASE("regenerating keeps locked versions unless updated", "[lock_manager]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    auto resolver = fx.resolver();
    LockManager lm(resolver);

    auto manifest = manifest_of("[packages.dependencies]\nestout = \"ssc\"\n");
    auto first = lm.generate(manifest, std::nullopt).value();

    serve_estout(fx.fetcher, kEstoutDir, "20240301");

    auto kept = lm.generate(manifest, first).value();
    REQUIRE(kept.find("estout")->version == "20230212");

    GenerateOptions opts;
    opts.update.insert("ESTOUT");
    auto updated = lm.generate(manifest, first, opts).value();
    REQUIRE(updated.find("estout")->version == "20240301");
}

TEST_CASE("install selected groups", "[lock_manager]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    fx.td.write_file("vendor/mytools/mytools.ado", "program define mytools\nend\n");
    auto resolver = fx.resolver();
    LockManager lm(resolver);

    auto manifest = manifest_of(
        "[packages.dependencies]\nestout = \"ssc\"\n"
        "[packages.dev]\nmytools = \"local:vendor/mytools\"\n");
    auto lf = lm.generate(manifest, std::nullopt).value();
    REQUIRE(lf.packages.size() == 2);

    auto only_default = lm.install(lf, {DependencyGroup::Default});
    REQUIRE(only_default.is_ok());
    REQUIRE(only_default.value().size() == 1);
    REQUIRE(only_default.value()[0].name == "estout");

    auto all = lm.install(lf, all_groups());
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 2);
}

TEST_CASE("outdated lists newer upstream versions", "[lock_manager]") {
    Fixture fx;
    serve_estout(fx.fetcher, kEstoutDir);
    auto resolver = fx.resolver();
    LockManager lm(resolver);

    auto manifest = manifest_of(
        "[packages.dependencies]\nestout = { source = \"ssc\", version = \"<20240101\" }\n");
    auto lf = lm.generate(manifest, std::nullopt).value();

    REQUIRE(lm.outdated(manifest, lf).value().empty());

    serve_estout(fx.fetcher, kEstoutDir, "20240301");
    auto out = lm.outdated(manifest, lf);
    REQUIRE(out.is_ok());
    REQUIRE(out.value().size() == 1);
    REQUIRE(out.value()[0].locked == "20230212");
    REQUIRE(out.value()[0].latest == "20240301");
    REQUIRE(out.value()[0].constrained);
}
