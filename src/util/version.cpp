#include <stacy/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace stacy {

// Split "1.2.3" into at most 3 non-negative integers
static bool parse_components(const std::string& s, int out[3], int& count) {
    count = 0;
    size_t pos = 0;
    while (true) {
        if (count == 3) return false;
        size_t dot = s.find('.', pos);
        std::string part = s.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (part.empty() || part.size() > 9) return false;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        out[count++] = std::stoi(part);
        if (dot == std::string::npos) return true;
        pos = dot + 1;
    }
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return StacyError{StacyError::Version, "empty version string"};
    }

    std::string body = s;
    if (body[0] == 'v' || body[0] == 'V') body.erase(0, 1);

    Version v;
    size_t dash = body.find('-');
    if (dash != std::string::npos) {
        v.label = body.substr(dash + 1);
        body = body.substr(0, dash);
        if (v.label.empty()) {
            return StacyError{StacyError::Version,
                "empty label after '-' in '" + s + "'"};
        }
    }

    int parts[3] = {0, 0, 0};
    if (!parse_components(body, parts, v.components)) {
        return StacyError{StacyError::Version,
            "invalid version '" + s + "'",
            "expected 1 to 3 numeric components, e.g. 2.1.0 or 20240115"};
    }
    v.major = parts[0];
    v.minor = parts[1];
    v.micro = parts[2];
    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major);
    if (components >= 2) s += "." + std::to_string(minor);
    if (components >= 3) s += "." + std::to_string(micro);
    if (!label.empty()) s += "-" + label;
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor &&
           micro == o.micro && label == o.label;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (micro != o.micro) return micro < o.micro;
    // Pre-release sorts before release
    if (label.empty() != o.label.empty()) return !label.empty();
    return label < o.label;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    std::string body = s;
    if (!body.empty() && (body[0] == 'v' || body[0] == 'V')) body.erase(0, 1);

    int parts[3] = {0, -1, -1};
    int count = 0;
    if (body.empty() || !parse_components(body, parts, count)) {
        return StacyError{StacyError::Version,
            "invalid version '" + s + "' in constraint"};
    }
    PartialVersion pv;
    pv.major = parts[0];
    pv.minor = count >= 2 ? parts[1] : -1;
    pv.micro = count >= 3 ? parts[2] : -1;
    return Result<PartialVersion>::ok(pv);
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor >= 0) {
        s += "." + std::to_string(minor);
        if (micro >= 0) s += "." + std::to_string(micro);
    }
    return s;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

bool VersionConstraint::matches(const Version& v) const {
    Version req;
    req.major = version.major;
    req.minor = version.minor >= 0 ? version.minor : 0;
    req.micro = version.micro >= 0 ? version.micro : 0;

    if (!v.label.empty() && op != ConstraintOp::Exact) return false;

    switch (op) {
    case ConstraintOp::Exact:
        // "=1.2" pins only the components that were written
        if (v.major != version.major) return false;
        if (version.minor >= 0 && v.minor != version.minor) return false;
        if (version.micro >= 0 && v.micro != version.micro) return false;
        return v.label.empty();

    case ConstraintOp::Caret:
        // ^X.Y.Z: same leftmost non-zero component
        if (v < req) return false;
        if (req.major > 0) return v.major == req.major;
        if (req.minor > 0) return v.major == 0 && v.minor == req.minor;
        return v.major == 0 && v.minor == 0 && v.micro == req.micro;

    case ConstraintOp::Tilde:
        if (v < req) return false;
        if (version.minor < 0) return v.major == req.major;
        return v.major == req.major && v.minor == req.minor;

    case ConstraintOp::GreaterEq: return v >= req;
    case ConstraintOp::Greater:   return v > req;
    case ConstraintOp::LessEq:    return v <= req;
    case ConstraintOp::Less:      return v < req;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    const char* prefix = "";
    switch (op) {
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::Caret:     prefix = "^"; break;
    case ConstraintOp::Tilde:     prefix = "~"; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    }
    return prefix + version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static Result<VersionConstraint> parse_single_constraint(const std::string& raw) {
    std::string s = raw;
    s.erase(std::remove(s.begin(), s.end(), ' '), s.end());

    struct OpToken { const char* text; ConstraintOp op; };
    static const OpToken ops[] = {
        {">=", ConstraintOp::GreaterEq}, {"<=", ConstraintOp::LessEq},
        {">",  ConstraintOp::Greater},   {"<",  ConstraintOp::Less},
        {"^",  ConstraintOp::Caret},     {"~",  ConstraintOp::Tilde},
        {"==", ConstraintOp::Exact},     {"=",  ConstraintOp::Exact},
    };

    VersionConstraint vc;
    vc.op = ConstraintOp::Caret;  // bare version
    for (const auto& t : ops) {
        size_t n = std::char_traits<char>::length(t.text);
        if (s.compare(0, n, t.text) == 0) {
            vc.op = t.op;
            s.erase(0, n);
            break;
        }
    }

    if (s.empty()) {
        return StacyError{StacyError::Version,
            "missing version in constraint '" + raw + "'"};
    }

    auto pv = PartialVersion::parse(s);
    if (pv.is_err()) return std::move(pv).error();
    vc.version = pv.value();
    return Result<VersionConstraint>::ok(vc);
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    VersionReq req;
    std::istringstream stream(s);
    std::string token;

    while (std::getline(stream, token, ',')) {
        if (token.find_first_not_of(' ') == std::string::npos) continue;
        auto c = parse_single_constraint(token);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(std::move(c).value());
    }

    if (req.constraints.empty()) {
        return StacyError{StacyError::Version,
            "no constraints in version requirement '" + s + "'"};
    }
    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.matches(v); });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

bool version_satisfies(const std::string& version, const std::string& req) {
    if (req.empty() || req == "*") return true;
    auto r = VersionReq::parse(req);
    auto v = Version::parse(version);
    if (r.is_err() || v.is_err()) return false;
    return r.value().matches(v.value());
}

} // namespace stacy
