#pragma once

#include <pinion/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pinion {

enum class Matcher {
    Exact,       // =1.2.3 (also the default when no matcher is written)
    Less,        // <1.2.3
    LessEq,      // <=1.2.3
    Greater,     // >1.2.3
    GreaterEq,   // >=1.2.3
};

const char* matcher_symbol(Matcher m);

// Strict: a "<X.Y.Z" bound without a prerelease also rejects prereleases
// of X.Y.Z itself. Permissive: every bound is a plain order comparison.
enum class MatchMode { Strict, Permissive };

// [matcher]MAJOR.MINOR.PATCH[[-]PRERELEASE][+BUILD], e.g. ">=0.1.2",
// "0.1.4a1", "1.0.0-rc.1+build.5"
struct VersionSpecifier {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::optional<std::string> prerelease;
    std::optional<std::string> build;
    Matcher matcher = Matcher::Exact;

    static Result<VersionSpecifier> parse(const std::string& s);

    std::string to_string() const;          // "=0.1.2"
    std::string to_version_string() const;  // "0.1.2"

    bool is_prerelease() const { return prerelease.has_value(); }

    // Total order on (major, minor, patch, prerelease). Matcher and build
    // are ignored. Returns <0, 0 or >0.
    int compare(const VersionSpecifier& o) const;

    // Does `candidate` satisfy this specifier used as a constraint?
    bool satisfied_by(const VersionSpecifier& candidate,
                      MatchMode mode = MatchMode::Strict) const;

    bool operator==(const VersionSpecifier& o) const;
    bool operator!=(const VersionSpecifier& o) const;
    bool operator<(const VersionSpecifier& o) const;
};

// Ordered constraint list for one logical package. Order is declaration
// order and only shows up in diagnostics.
struct ConstraintSet {
    std::vector<VersionSpecifier> constraints;
    bool allow_prerelease = false;

    static Result<ConstraintSet> parse(const std::vector<std::string>& specs,
                                       bool allow_prerelease = false);

    // Concatenation; prerelease opt-in is sticky once any side sets it
    static ConstraintSet merge(const ConstraintSet& a, const ConstraintSet& b);

    bool empty() const { return constraints.empty(); }

    // True if some constraint is "=X.Y.Z<prerelease>"
    bool requests_exact_prerelease() const;

    bool satisfied_by(const VersionSpecifier& v,
                      MatchMode mode = MatchMode::Strict) const;

    // "['=0.1.2', '<0.1.5']"
    std::string to_string() const;

    bool operator==(const ConstraintSet& o) const;
    bool operator!=(const ConstraintSet& o) const { return !(*this == o); }
};

// Highest available version that satisfies every constraint. Prereleases
// are considered only when allowed or when one was requested exactly.
// The returned string is the available entry verbatim.
Result<std::string> resolve_version(const ConstraintSet& set,
                                    const std::vector<std::string>& available,
                                    bool allow_prerelease);

// Same as resolve_version() but matching in Permissive mode.
Result<std::string> latest_version(const ConstraintSet& set,
                                   const std::vector<std::string>& available,
                                   bool allow_prerelease);

// "['0.1.2', '0.1.3']"
std::string quote_list(const std::vector<std::string>& items);

} // namespace pinion
