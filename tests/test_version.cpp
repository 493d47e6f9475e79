#include <catch2/catch.hpp>
#include <pinion/version.hpp>

#include <algorithm>

using namespace pinion;

static VersionSpecifier spec(const std::string& s) {
    auto r = VersionSpecifier::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

static ConstraintSet constraints(const std::vector<std::string>& specs, bool pre = false) {
    auto r = ConstraintSet::parse(specs, pre);
    REQUIRE(r.is_ok());
    return r.value();
}

static const std::vector<std::string> kAvailable = {"0.1.2", "0.1.3", "0.1.4a1"};

// ===== VersionSpecifier parsing =====

TEST_CASE("parse plain version defaults to exact", "[version]") {
    auto v = spec("1.2.3");
    REQUIRE(v.major == 1);
    REQUIRE(v.minor == 2);
    REQUIRE(v.patch == 3);
    REQUIRE(v.matcher == Matcher::Exact);
    REQUIRE_FALSE(v.prerelease);
    REQUIRE(v.to_string() == "=1.2.3");
    REQUIRE(v.to_version_string() == "1.2.3");
}

TEST_CASE("parse matchers", "[version]") {
    REQUIRE(spec(">=0.1.2").matcher == Matcher::GreaterEq);
    REQUIRE(spec("<=0.1.2").matcher == Matcher::LessEq);
    REQUIRE(spec(">0.1.2").matcher == Matcher::Greater);
    REQUIRE(spec("<0.1.5").matcher == Matcher::Less);
    REQUIRE(spec("=0.1.2").matcher == Matcher::Exact);
    REQUIRE(spec("<0.1.5").to_string() == "<0.1.5");
}

TEST_CASE("parse prerelease with and without dash", "[version]") {
    auto undashed = spec("0.1.4a1");
    REQUIRE(undashed.prerelease == std::string("a1"));

    auto dashed = spec("1.0.0-rc.1+build.5");
    REQUIRE(dashed.prerelease == std::string("rc.1"));
    REQUIRE(dashed.build == std::string("build.5"));
    REQUIRE(dashed.to_version_string() == "1.0.0-rc.1+build.5");
}

TEST_CASE("version parse errors", "[version]") {
    REQUIRE(VersionSpecifier::parse("").is_err());
    REQUIRE(VersionSpecifier::parse("1").is_err());
    REQUIRE(VersionSpecifier::parse("1.2").is_err());
    REQUIRE(VersionSpecifier::parse("abc").is_err());
    REQUIRE(VersionSpecifier::parse("1.2.3-").is_err());
    REQUIRE(VersionSpecifier::parse("1.2.3+").is_err());
    REQUIRE(VersionSpecifier::parse("1.2.3-a..b").is_err());
    REQUIRE(VersionSpecifier::parse("~1.2.3").is_err());
    REQUIRE(VersionSpecifier::parse("1.2.3").error().code == PinionError::Version);
}

// ===== Ordering =====

TEST_CASE("release sorts after its prereleases", "[version]") {
    REQUIRE(spec("0.1.4a1") < spec("0.1.4"));
    REQUIRE(spec("0.1.3") < spec("0.1.4a1"));
    REQUIRE(spec("1.0.0-alpha") < spec("1.0.0-beta"));
}

TEST_CASE("prereleases compare naturally", "[version]") {
    REQUIRE(spec("1.0.0a2") < spec("1.0.0a10"));
    REQUIRE(spec("1.0.0-rc.2") < spec("1.0.0-rc.11"));
    REQUIRE(spec("1.0.0-1") < spec("1.0.0-alpha"));
}

TEST_CASE("build metadata does not affect ordering", "[version]") {
    REQUIRE(spec("1.0.0+a").compare(spec("1.0.0+b")) == 0);
    REQUIRE(spec("1.0.0+a") != spec("1.0.0+b"));
}

// ===== Satisfaction =====

TEST_CASE("strict upper bound excludes prereleases of the bound", "[version]") {
    auto bound = spec("<0.1.4");
    REQUIRE_FALSE(bound.satisfied_by(spec("0.1.4a1"), MatchMode::Strict));
    REQUIRE(bound.satisfied_by(spec("0.1.4a1"), MatchMode::Permissive));
    REQUIRE(bound.satisfied_by(spec("0.1.3"), MatchMode::Strict));

    // A prerelease bound compares plainly
    REQUIRE(spec("<0.1.4b1").satisfied_by(spec("0.1.4a1"), MatchMode::Strict));
}

// ===== ConstraintSet =====

TEST_CASE("merge concatenates and keeps the prerelease opt-in", "[constraints]") {
    auto a = constraints({">0.1.2"});
    auto b = constraints({"<0.1.5"}, true);
    auto ab = ConstraintSet::merge(a, b);
    REQUIRE(ab.to_string() == "['>0.1.2', '<0.1.5']");
    REQUIRE(ab.allow_prerelease);
    REQUIRE(ConstraintSet::merge(b, a).allow_prerelease);
}

TEST_CASE("resolve picks the highest satisfying release", "[constraints]") {
    auto set = constraints({">0.1.2", "<0.1.5"});
    auto r = resolve_version(set, kAvailable, false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "0.1.3");
}

TEST_CASE("resolve is independent of declaration order", "[constraints]") {
    auto a = constraints({">=0.1.2"});
    auto b = constraints({"<0.1.4"});
    auto ab = resolve_version(ConstraintSet::merge(a, b), kAvailable, false);
    auto ba = resolve_version(ConstraintSet::merge(b, a), kAvailable, false);
    REQUIRE(ab.value() == ba.value());
}

TEST_CASE("conflicting exact versions name every option", "[constraints]") {
    auto set = constraints({"=0.1.2", "=0.1.3"});
    auto r = resolve_version(set, kAvailable, false);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinionError::VersionConflict);
    REQUIRE(r.error().message ==
            "Could not find a satisfactory version from options: ['=0.1.2', '=0.1.3']\n"
            "  Available versions: ['0.1.2', '0.1.3', '0.1.4a1']");
}

TEST_CASE("prereleases need an opt-in", "[constraints]") {
    auto set = constraints({">0.1.3"});
    REQUIRE(resolve_version(set, kAvailable, false).is_err());

    auto opted = resolve_version(set, kAvailable, true);
    REQUIRE(opted.is_ok());
    REQUIRE(opted.value() == "0.1.4a1");
}

TEST_CASE("an exact prerelease request needs no opt-in", "[constraints]") {
    auto set = constraints({"=0.1.4a1"});
    auto r = resolve_version(set, kAvailable, false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "0.1.4a1");
}

TEST_CASE("latest uses plain order comparison", "[constraints]") {
    auto set = constraints({">0.1.0", "<0.1.4"}, true);
    REQUIRE(resolve_version(set, kAvailable, true).value() == "0.1.3");
    REQUIRE(latest_version(set, kAvailable, true).value() == "0.1.4a1");
    REQUIRE(latest_version(set, kAvailable, false).value() == "0.1.3");
}

TEST_CASE("resolve returns the available text verbatim", "[constraints]") {
    auto set = constraints({">=1.0.0"});
    auto r = resolve_version(set, {"1.0.0", "v2", "1.1.0+meta"}, false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "1.1.0+meta");
}

TEST_CASE("nothing available is a conflict", "[constraints]") {
    auto r = resolve_version(constraints({">=0.0.0"}), {}, true);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("Available versions: []") != std::string::npos);
}

TEST_CASE("quote_list renders python-style lists", "[constraints]") {
    REQUIRE(quote_list({}) == "[]");
    REQUIRE(quote_list({"a", "b"}) == "['a', 'b']");
}
