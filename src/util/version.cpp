#include <pinion/version.hpp>
#include <pinion/log.hpp>

#include <algorithm>
#include <cctype>

namespace pinion {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

// Reads a run of digits starting at pos into out
static bool read_number(const std::string& s, size_t& pos, int& out) {
    size_t start = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
    size_t len = pos - start;
    if (len == 0 || len > 9) return false;
    out = std::stoi(s.substr(start, len));
    return true;
}

static std::vector<std::string> split_dots(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = s.find('.', start);
        parts.push_back(s.substr(start, dot == std::string::npos ? std::string::npos
                                                                 : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

// Dot-separated identifiers of [0-9A-Za-z-]
static bool valid_identifiers(const std::string& s) {
    for (const auto& part : split_dots(s)) {
        if (part.empty()) return false;
        for (char c : part) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
        }
    }
    return true;
}

static int cmp_int(long long a, long long b) {
    return a < b ? -1 : (a > b ? 1 : 0);
}

// Natural comparison inside one identifier: digit runs compare numerically,
// everything else lexically ("a2" < "a10").
static int natural_compare(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        bool da = std::isdigit(static_cast<unsigned char>(a[i])) != 0;
        bool db = std::isdigit(static_cast<unsigned char>(b[j])) != 0;
        if (da && db) {
            size_t si = i;
            size_t sj = j;
            while (i < a.size() && std::isdigit(static_cast<unsigned char>(a[i]))) ++i;
            while (j < b.size() && std::isdigit(static_cast<unsigned char>(b[j]))) ++j;
            std::string ra = a.substr(si, i - si);
            std::string rb = b.substr(sj, j - sj);
            ra.erase(0, std::min(ra.find_first_not_of('0'), ra.size() - 1));
            rb.erase(0, std::min(rb.find_first_not_of('0'), rb.size() - 1));
            if (ra.size() != rb.size()) return ra.size() < rb.size() ? -1 : 1;
            int c = ra.compare(rb);
            if (c != 0) return c < 0 ? -1 : 1;
        } else {
            if (a[i] != b[j]) return a[i] < b[j] ? -1 : 1;
            ++i;
            ++j;
        }
    }
    return cmp_int(static_cast<long long>(a.size() - i),
                   static_cast<long long>(b.size() - j));
}

static int compare_prerelease(const std::string& a, const std::string& b) {
    auto pa = split_dots(a);
    auto pb = split_dots(b);
    for (size_t k = 0; k < pa.size() && k < pb.size(); ++k) {
        bool na = is_digits(pa[k]);
        bool nb = is_digits(pb[k]);
        int c = 0;
        if (na && nb) {
            c = natural_compare(pa[k], pb[k]);
        } else if (na) {
            c = -1;   // numeric identifiers sort first
        } else if (nb) {
            c = 1;
        } else {
            c = natural_compare(pa[k], pb[k]);
        }
        if (c != 0) return c;
    }
    return cmp_int(static_cast<long long>(pa.size()),
                   static_cast<long long>(pb.size()));
}

const char* matcher_symbol(Matcher m) {
    switch (m) {
        case Matcher::Exact:     return "=";
        case Matcher::Less:      return "<";
        case Matcher::LessEq:    return "<=";
        case Matcher::Greater:   return ">";
        case Matcher::GreaterEq: return ">=";
    }
    return "=";
}

// ---------------------------------------------------------------------------
// VersionSpecifier
// ---------------------------------------------------------------------------

Result<VersionSpecifier> VersionSpecifier::parse(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) {
        return PinionError{PinionError::Version, "empty version string"};
    }

    VersionSpecifier v;
    size_t pos = 0;

    if (s.compare(0, 2, ">=") == 0) {
        v.matcher = Matcher::GreaterEq;
        pos = 2;
    } else if (s.compare(0, 2, "<=") == 0) {
        v.matcher = Matcher::LessEq;
        pos = 2;
    } else if (s[0] == '>') {
        v.matcher = Matcher::Greater;
        pos = 1;
    } else if (s[0] == '<') {
        v.matcher = Matcher::Less;
        pos = 1;
    } else if (s[0] == '=') {
        v.matcher = Matcher::Exact;
        pos = 1;
    }
    while (pos < s.size() && s[pos] == ' ') ++pos;

    const char* format_hint = "expected format: [matcher]major.minor.patch[-prerelease][+build]";

    if (!read_number(s, pos, v.major) || pos >= s.size() || s[pos] != '.') {
        return PinionError{PinionError::Version,
            "invalid version '" + raw + "'", format_hint};
    }
    ++pos;
    if (!read_number(s, pos, v.minor) || pos >= s.size() || s[pos] != '.') {
        return PinionError{PinionError::Version,
            "invalid version '" + raw + "'", format_hint};
    }
    ++pos;
    if (!read_number(s, pos, v.patch)) {
        return PinionError{PinionError::Version,
            "invalid patch version in '" + raw + "'", format_hint};
    }

    std::string rest = s.substr(pos);
    std::string pre;
    std::string build;
    bool dashed = false;

    size_t plus = rest.find('+');
    if (plus != std::string::npos) {
        build = rest.substr(plus + 1);
        rest = rest.substr(0, plus);
        if (build.empty() || !valid_identifiers(build)) {
            return PinionError{PinionError::Version,
                "invalid build metadata in '" + raw + "'"};
        }
        v.build = build;
    }

    if (!rest.empty() && rest[0] == '-') {
        dashed = true;
        rest = rest.substr(1);
    }
    if (!rest.empty()) {
        if (!valid_identifiers(rest)) {
            return PinionError{PinionError::Version,
                "invalid prerelease '" + rest + "' in '" + raw + "'"};
        }
        v.prerelease = rest;
    } else if (dashed) {
        return PinionError{PinionError::Version,
            "empty prerelease after '-' in '" + raw + "'"};
    }

    return Result<VersionSpecifier>::ok(std::move(v));
}

std::string VersionSpecifier::to_version_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (prerelease) s += "-" + *prerelease;
    if (build) s += "+" + *build;
    return s;
}

std::string VersionSpecifier::to_string() const {
    return matcher_symbol(matcher) + to_version_string();
}

int VersionSpecifier::compare(const VersionSpecifier& o) const {
    if (major != o.major) return cmp_int(major, o.major);
    if (minor != o.minor) return cmp_int(minor, o.minor);
    if (patch != o.patch) return cmp_int(patch, o.patch);

    // A release sorts after any of its prereleases
    if (!prerelease && !o.prerelease) return 0;
    if (!prerelease) return 1;
    if (!o.prerelease) return -1;
    return compare_prerelease(*prerelease, *o.prerelease);
}

bool VersionSpecifier::satisfied_by(const VersionSpecifier& candidate,
                                    MatchMode mode) const {
    int c = candidate.compare(*this);
    switch (matcher) {
    case Matcher::Exact:
        return c == 0;
    case Matcher::Greater:
        return c > 0;
    case Matcher::GreaterEq:
        return c >= 0;
    case Matcher::LessEq:
        return c <= 0;
    case Matcher::Less:
        if (mode == MatchMode::Strict && !prerelease && candidate.prerelease &&
            candidate.major == major && candidate.minor == minor &&
            candidate.patch == patch) {
            return false;
        }
        return c < 0;
    }
    return false;
}

bool VersionSpecifier::operator==(const VersionSpecifier& o) const {
    return major == o.major && minor == o.minor && patch == o.patch &&
           prerelease == o.prerelease && build == o.build &&
           matcher == o.matcher;
}

bool VersionSpecifier::operator!=(const VersionSpecifier& o) const {
    return !(*this == o);
}

bool VersionSpecifier::operator<(const VersionSpecifier& o) const {
    return compare(o) < 0;
}

// ---------------------------------------------------------------------------
// ConstraintSet
// ---------------------------------------------------------------------------

Result<ConstraintSet> ConstraintSet::parse(const std::vector<std::string>& specs,
                                           bool allow_prerelease) {
    ConstraintSet set;
    set.allow_prerelease = allow_prerelease;
    for (const auto& spec : specs) {
        auto v = VersionSpecifier::parse(spec);
        if (v.is_err()) return std::move(v).error();
        set.constraints.push_back(std::move(v).value());
    }
    return Result<ConstraintSet>::ok(std::move(set));
}

ConstraintSet ConstraintSet::merge(const ConstraintSet& a, const ConstraintSet& b) {
    ConstraintSet out = a;
    out.constraints.insert(out.constraints.end(),
                           b.constraints.begin(), b.constraints.end());
    out.allow_prerelease = a.allow_prerelease || b.allow_prerelease;
    return out;
}

bool ConstraintSet::requests_exact_prerelease() const {
    return std::any_of(constraints.begin(), constraints.end(),
        [](const VersionSpecifier& c) {
            return c.matcher == Matcher::Exact && c.is_prerelease();
        });
}

bool ConstraintSet::satisfied_by(const VersionSpecifier& v, MatchMode mode) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionSpecifier& c) { return c.satisfied_by(v, mode); });
}

std::string ConstraintSet::to_string() const {
    std::string s = "[";
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += "'" + constraints[i].to_string() + "'";
    }
    return s + "]";
}

bool ConstraintSet::operator==(const ConstraintSet& o) const {
    return constraints == o.constraints && allow_prerelease == o.allow_prerelease;
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

std::string quote_list(const std::vector<std::string>& items) {
    std::string s = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) s += ", ";
        s += "'" + items[i] + "'";
    }
    return s + "]";
}

static Result<std::string> pick_version(const ConstraintSet& set,
                                        const std::vector<std::string>& available,
                                        bool allow_prerelease,
                                        MatchMode mode) {
    bool include_prerelease = allow_prerelease || set.requests_exact_prerelease();

    const std::string* best_text = nullptr;
    VersionSpecifier best;

    for (const auto& text : available) {
        auto parsed = VersionSpecifier::parse(text);
        if (parsed.is_err() || parsed.value().matcher != Matcher::Exact) {
            log::debug("skipping unparseable available version '%s'", text.c_str());
            continue;
        }
        const auto& v = parsed.value();
        if (v.is_prerelease() && !include_prerelease) continue;
        if (!set.satisfied_by(v, mode)) continue;
        if (!best_text || best.compare(v) < 0) {
            best = v;
            best_text = &text;
        }
    }

    if (!best_text) {
        return PinionError{PinionError::VersionConflict,
            "Could not find a satisfactory version from options: " +
            set.to_string() + "\n  Available versions: " +
            quote_list(available)};
    }
    return Result<std::string>::ok(*best_text);
}

Result<std::string> resolve_version(const ConstraintSet& set,
                                    const std::vector<std::string>& available,
                                    bool allow_prerelease) {
    return pick_version(set, available, allow_prerelease, MatchMode::Strict);
}

Result<std::string> latest_version(const ConstraintSet& set,
                                   const std::vector<std::string>& available,
                                   bool allow_prerelease) {
    return pick_version(set, available, allow_prerelease, MatchMode::Permissive);
}

} // namespace pinion
