#include <catch2/catch.hpp>
#include <stacy/source.hpp>

using namespace stacy;

// ===== Source descriptors =====

TEST_CASE("ssc and empty sources are the index", "[source]") {
    for (const char* spec : {"ssc", ""}) {
        auto r = PackageSource::parse(spec);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().kind == SourceKind::Index);
        REQUIRE(r.value().to_string() == "ssc");
    }
}

TEST_CASE("github source with and without ref", "[source]") {
    auto plain = PackageSource::parse("github:sergiocorreia/reghdfe");
    REQUIRE(plain.is_ok());
    REQUIRE(plain.value().kind == SourceKind::Repository);
    REQUIRE(plain.value().github == "sergiocorreia/reghdfe");
    REQUIRE(plain.value().clone_url() == "https://github.com/sergiocorreia/reghdfe.git");
    REQUIRE_FALSE(plain.value().ref.has_value());

    auto pinned = PackageSource::parse("github:sergiocorreia/reghdfe@6.12.3");
    REQUIRE(pinned.is_ok());
    REQUIRE(pinned.value().ref.has_value());
    REQUIRE(*pinned.value().ref == "6.12.3");
    REQUIRE(pinned.value().to_string() == "github:sergiocorreia/reghdfe@6.12.3");
    REQUIRE(pinned.value().same_origin(plain.value()));
}

TEST_CASE("invalid github sources", "[source]") {
    REQUIRE(PackageSource::parse("github:reghdfe").is_err());
    REQUIRE(PackageSource::parse("github:/repo").is_err());
    REQUIRE(PackageSource::parse("github:user/").is_err());
    REQUIRE(PackageSource::parse("github:a/b/c").is_err());
    REQUIRE(PackageSource::parse("github:user/repo@").is_err());
}

TEST_CASE("git source with fragment ref", "[source]") {
    auto r = PackageSource::parse("git:/srv/repos/mypkg.git#v2.0");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind == SourceKind::Repository);
    REQUIRE(r.value().url == "/srv/repos/mypkg.git");
    REQUIRE(*r.value().ref == "v2.0");
    REQUIRE(r.value().to_string() == "git:/srv/repos/mypkg.git#v2.0");
}

TEST_CASE("local and net sources", "[source]") {
    auto local = PackageSource::parse("local:vendor/mytools");
    REQUIRE(local.is_ok());
    REQUIRE(local.value().kind == SourceKind::Local);
    REQUIRE(local.value().path == "vendor/mytools");

    auto net = PackageSource::parse("net:https://example.org/stata/");
    REQUIRE(net.is_ok());
    REQUIRE(net.value().kind == SourceKind::Net);
    REQUIRE(net.value().url == "https://example.org/stata");
    REQUIRE(net.value().to_string() == "net:https://example.org/stata");

    REQUIRE(PackageSource::parse("local:").is_err());
    REQUIRE(PackageSource::parse("net:").is_err());
}

TEST_CASE("unknown source kind", "[source]") {
    auto r = PackageSource::parse("cran:ggplot2");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StacyError::Manifest);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("different kinds never share an origin", "[source]") {
    auto ssc = PackageSource::parse("ssc").value();
    auto net = PackageSource::parse("net:http://fmwww.bc.edu/repec/bocode").value();
    REQUIRE_FALSE(ssc.same_origin(net));
}

// ===== Groups and names =====

TEST_CASE("dependency groups", "[source]") {
    REQUIRE(parse_group("dependencies").value() == DependencyGroup::Default);
    REQUIRE(parse_group("").value() == DependencyGroup::Default);
    REQUIRE(parse_group("dev").value() == DependencyGroup::Dev);
    REQUIRE(parse_group("test").value() == DependencyGroup::Test);
    REQUIRE(parse_group("docs").is_err());
    REQUIRE(std::string(group_name(DependencyGroup::Dev)) == "dev");
}

TEST_CASE("package names follow Stata command rules", "[source]") {
    REQUIRE(is_valid_package_name("estout"));
    REQUIRE(is_valid_package_name("_gwtmean"));
    REQUIRE(is_valid_package_name("ftools2"));
    REQUIRE_FALSE(is_valid_package_name(""));
    REQUIRE_FALSE(is_valid_package_name("2sls"));
    REQUIRE_FALSE(is_valid_package_name("my-pkg"));
    REQUIRE_FALSE(is_valid_package_name(std::string(33, 'a')));
    REQUIRE(lowercase("RegHDFE") == "reghdfe");
}

TEST_CASE("package ref validation", "[source]") {
    PackageRef ref;
    ref.name = "estout";
    REQUIRE(ref.validate().is_ok());

    ref.constraint = ">=20230101";
    REQUIRE(ref.validate().is_ok());

    ref.constraint = "*";
    REQUIRE(ref.validate().is_ok());

    ref.constraint = ">=banana";
    REQUIRE(ref.validate().is_err());

    ref.constraint.clear();
    ref.name = "bad name";
    REQUIRE(ref.validate().error().code == StacyError::Manifest);
}
