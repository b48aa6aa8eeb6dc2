#include <catch2/catch.hpp>
#include <stacy/lockfile.hpp>
#include "test_helpers.hpp"

using namespace stacy;
using stacy::testing::TempDir;
namespace fs = std::filesystem;

static const char* kLock = R"TOML(
version = 1
stacy_version = "0.1.0"
manifest_hash = "abc123"

[[package]]
name = "reghdfe"
version = "6.12.3"
source = "github:sergiocorreia/reghdfe@6.12.3"
digest = "d2"
group = "dependencies"
ref = "6.12.3"
commit = "0123456789abcdef0123456789abcdef01234567"

[[package]]
name = "estout"
version = "20230212"
source = "ssc"
digest = "d1"
)TOML";

// ===== Parse =====

TEST_CASE("parse lockfile", "[lockfile]") {
    auto r = LockFile::parse(kLock);
    REQUIRE(r.is_ok());
    const LockFile& lf = r.value();

    REQUIRE(lf.format_version == 1);
    REQUIRE(lf.stacy_version == "0.1.0");
    REQUIRE(lf.manifest_hash == "abc123");
    REQUIRE(lf.packages.size() == 2);

    // Sorted by name on load
    REQUIRE(lf.packages[0].name == "estout");
    REQUIRE(lf.packages[0].group == "dependencies");
    REQUIRE(lf.packages[0].commit.empty());
    REQUIRE(lf.packages[1].name == "reghdfe");
    REQUIRE(lf.packages[1].commit.size() == 40);
}

TEST_CASE("empty lockfile has no packages", "[lockfile]") {
    auto r = LockFile::parse("version = 1\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().packages.empty());
}

TEST_CASE("unknown lockfile format version", "[lockfile]") {
    auto r = LockFile::parse("version = 7\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::Version);
}

TEST_CASE("malformed lockfile", "[lockfile]") {
    auto r = LockFile::parse("version = [\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::Parse);
}

TEST_CASE("package entry missing a digest", "[lockfile]") {
    auto r = LockFile::parse(R"(
[[package]]
name = "estout"
version = "20230212"
source = "ssc"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::Parse);
}

TEST_CASE("duplicate package entries", "[lockfile]") {
    auto r = LockFile::parse(R"(
[[package]]
name = "estout"
version = "1"
source = "ssc"
digest = "a"

[[package]]
name = "ESTOUT"
version = "2"
source = "ssc"
digest = "b"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::Duplicate);
}

TEST_CASE("load nonexistent lockfile", "[lockfile]") {
    auto r = LockFile::load("/nonexistent/stacy.lock");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::NotFound);
}

// ===== Save =====

TEST_CASE("save then load", "[lockfile]") {
    TempDir td("stacy_lockfile_test");
    auto lf = LockFile::parse(kLock).value();
    std::string path = (td.path / "stacy.lock").string();

    REQUIRE(lf.save(path).is_ok());
    REQUIRE_FALSE(fs::exists(path + ".tmp"));

    auto back = LockFile::load(path);
    REQUIRE(back.is_ok());
    REQUIRE(back.value().to_toml() == lf.to_toml());
    REQUIRE(back.value().find("reghdfe")->ref == "6.12.3");
}

TEST_CASE("serialization is deterministic", "[lockfile]") {
    LockFile a;
    a.stacy_version = "0.1.0";
    a.manifest_hash = "h";
    LockedPackage x{"zeta", "1", "ssc", "dz", "dependencies", "", ""};
    LockedPackage y{"alpha", "2", "ssc", "da", "dev", "", ""};
    a.packages = {x, y};

    LockFile b = a;
    b.packages = {y, x};

    std::string text = a.to_toml();
    REQUIRE(text == b.to_toml());
    REQUIRE(text.find("alpha") < text.find("zeta"));
    REQUIRE(text.find("ref =") == std::string::npos);
    REQUIRE(text.rfind("# This file is auto-generated", 0) == 0);
}

// ===== Queries =====

TEST_CASE("find is case-insensitive", "[lockfile]") {
    auto lf = LockFile::parse(kLock).value();
    REQUIRE(lf.find("EstOut") != nullptr);
    REQUIRE(lf.find("missing") == nullptr);
}

TEST_CASE("cache keys use lowercase names", "[lockfile]") {
    LockFile lf;
    lf.packages.push_back({"ESTOUT", "20230212", "ssc", "d", "dependencies", "", ""});
    auto keys = lf.cache_keys();
    REQUIRE(keys.size() == 1);
    REQUIRE(*keys.begin() == "estout@20230212");
}
