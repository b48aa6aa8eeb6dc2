#include <catch2/catch.hpp>
#include <stacy/project.hpp>
#include "test_helpers.hpp"

using namespace stacy;
using stacy::testing::TempDir;
namespace fs = std::filesystem;

static const char* kManifest =
    "[project]\nname = \"demo\"\n\n[packages.dependencies]\nestout = \"ssc\"\n";

TEST_CASE("find manifest in the start directory", "[project]") {
    TempDir td("stacy_project_test");
    td.write_file("stacy.toml", kManifest);

    auto r = find_manifest(td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().filename() == "stacy.toml");
    REQUIRE(has_manifest(td.path));
}

TEST_CASE("discover walks up from a subdirectory", "[project]") {
    TempDir td("stacy_project_test");
    td.write_file("stacy.toml", kManifest);
    td.write_file("code/analysis/main.do", "display 1\n");

    auto r = Project::discover(td.path / "code" / "analysis");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().manifest.project.name == "demo");
    REQUIRE(r.value().root_dir == fs::canonical(td.path));
    REQUIRE(r.value().lock_path() == fs::canonical(td.path) / "stacy.lock");
}

TEST_CASE("no manifest anywhere", "[project]") {
    TempDir td("stacy_project_test");
    fs::create_directories(td.path / "empty");
    REQUIRE_FALSE(has_manifest(td.path / "empty"));

    auto r = Project::load(td.path / "empty");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::NotFound);
}

TEST_CASE("lockfile is optional", "[project]") {
    TempDir td("stacy_project_test");
    td.write_file("stacy.toml", kManifest);
    auto proj = Project::load(td.path).value();

    auto none = proj.load_lock();
    REQUIRE(none.is_ok());
    REQUIRE_FALSE(none.value().has_value());

    td.write_file("stacy.lock",
        "version = 1\n\n[[package]]\nname = \"estout\"\nversion = \"20230212\"\n"
        "source = \"ssc\"\ndigest = \"d\"\n");
    auto some = proj.load_lock();
    REQUIRE(some.is_ok());
    REQUIRE(some.value()->packages.size() == 1);
}

TEST_CASE("malformed lockfile is an error", "[project]") {
    TempDir td("stacy_project_test");
    td.write_file("stacy.toml", kManifest);
    td.write_file("stacy.lock", "version = [\n");
    auto proj = Project::load(td.path).value();

    auto r = proj.load_lock();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::Parse);
}

TEST_CASE("require lock and currency", "[project]") {
    TempDir td("stacy_project_test");
    td.write_file("stacy.toml", kManifest);
    auto proj = Project::load(td.path).value();

    auto missing = proj.require_lock();
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == StacyError::NotFound);
    REQUIRE(missing.error().hint.find("stacy lock") != std::string::npos);

    LockFile lock;
    lock.manifest_hash = proj.manifest.dependency_hash();
    REQUIRE(lock.save(proj.lock_path().string()).is_ok());

    auto r = proj.require_lock();
    REQUIRE(r.is_ok());
    REQUIRE(proj.lock_is_current(r.value()));

    lock.manifest_hash = "stale";
    REQUIRE_FALSE(proj.lock_is_current(lock));
}

TEST_CASE("relative paths resolve from the root", "[project]") {
    TempDir td("stacy_project_test");
    td.write_file("stacy.toml", kManifest);
    auto proj = Project::load(td.path).value();

    REQUIRE(proj.resolve("logs") == proj.root_dir / "logs");
    REQUIRE(proj.resolve("/var/tmp") == fs::path("/var/tmp"));
}
