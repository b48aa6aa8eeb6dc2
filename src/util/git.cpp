#include <stacy/git.hpp>
#include <stacy/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>
#include <sstream>

namespace stacy {

namespace {

const std::string kTagsPrefix = "refs/tags/";
const std::string kHeadsPrefix = "refs/heads/";
const std::string kPeeled = "^{}";

bool consume_prefix(std::string& s, const std::string& prefix) {
    if (s.compare(0, prefix.size(), prefix) != 0) return false;
    s.erase(0, prefix.size());
    return true;
}

std::string chomp(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

} // namespace

// ---------------------------------------------------------------------------
// Ref parsing and selection
// ---------------------------------------------------------------------------

std::string strip_v_prefix(const std::string& tag) {
    if (!tag.empty() && (tag[0] == 'v' || tag[0] == 'V')) return tag.substr(1);
    return tag;
}

bool looks_like_sha(const std::string& s) {
    if (s.size() < 7 || s.size() > 40) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

std::string commit_version(const std::string& label, const std::string& commit) {
    return label + "-" + commit.substr(0, 7);
}

RemoteRefs parse_ls_remote(const std::string& output) {
    RemoteRefs refs;
    std::set<std::string> peeled;   // tags whose commit came from a ^{} line
    std::istringstream in(output);
    std::string line;

    while (std::getline(in, line)) {
        line = chomp(line);
        auto tab = line.find('\t');
        if (tab == std::string::npos) continue;
        std::string sha = line.substr(0, tab);
        std::string name = line.substr(tab + 1);

        if (name == "HEAD") {
            refs.head = sha;
        } else if (consume_prefix(name, kHeadsPrefix)) {
            refs.branches[name] = sha;
        } else if (consume_prefix(name, kTagsPrefix)) {
            bool deref = name.size() > kPeeled.size() &&
                         name.compare(name.size() - kPeeled.size(), kPeeled.size(), kPeeled) == 0;
            if (deref) {
                name.resize(name.size() - kPeeled.size());
                refs.all_tags[name] = sha;
                peeled.insert(name);
            } else if (!peeled.count(name)) {
                refs.all_tags[name] = sha;
            }
        }
    }

    for (const auto& [name, sha] : refs.all_tags) {
        auto v = Version::parse(strip_v_prefix(name));
        if (v.is_ok()) refs.tags.push_back(RemoteTag{name, sha, std::move(v).value()});
    }
    std::sort(refs.tags.begin(), refs.tags.end(),
              [](const RemoteTag& a, const RemoteTag& b) { return a.version > b.version; });
    return refs;
}

Result<RemoteTag> resolve_version_from_tags(const std::vector<RemoteTag>& tags,
                                             const VersionReq& req) {
    auto it = std::find_if(tags.begin(), tags.end(),
                           [&](const RemoteTag& t) { return req.matches(t.version); });
    if (it == tags.end()) {
        return StacyError{StacyError::Version,
            "no tag matches version requirement '" + req.to_string() + "'"};
    }
    return Result<RemoteTag>::ok(*it);
}

Result<RefSelection> select_ref(const RemoteRefs& refs,
                                const std::optional<std::string>& ref,
                                const std::string& constraint) {
    RefSelection sel;

    if (ref) {
        const std::string& r = *ref;
        sel.ref = r;
        if (auto t = refs.all_tags.find(r); t != refs.all_tags.end()) {
            sel.commit = t->second;
            std::string bare = strip_v_prefix(r);
            sel.version = Version::parse(bare).is_ok() ? bare : r;
        } else if (auto b = refs.branches.find(r); b != refs.branches.end()) {
            sel.commit = b->second;
            sel.version = commit_version(r, sel.commit);
        } else if (looks_like_sha(r)) {
            sel.commit = r;
        } else {
            return StacyError{StacyError::Dependency, "ref '" + r + "' not found"};
        }
        return Result<RefSelection>::ok(std::move(sel));
    }

    if (!constraint.empty() && constraint != "*") {
        auto req = VersionReq::parse(constraint);
        if (req.is_err()) return std::move(req).error();
        auto best = resolve_version_from_tags(refs.tags, req.value());
        if (best.is_err()) {
            return StacyError{StacyError::Version,
                              "no tag satisfies '" + constraint + "'"};
        }
        sel.commit = best.value().commit;
        sel.ref = best.value().name;
        sel.version = strip_v_prefix(best.value().name);
        return Result<RefSelection>::ok(std::move(sel));
    }

    if (refs.head.empty()) {
        return StacyError{StacyError::Dependency, "no default branch advertised"};
    }
    sel.commit = refs.head;
    sel.version = commit_version("HEAD", sel.commit);
    return Result<RefSelection>::ok(std::move(sel));
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<CommandResult> GitCli::git(const std::vector<std::string>& args) {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    auto r = run_command(argv, "", timeout_seconds_);
    if (r.is_ok() && r.value().exit_code == 127) {
        return StacyError{StacyError::Environment, "git is not installed",
                          "install git >= 2.20"};
    }
    return r;
}

Status GitCli::require_online(const char* what) const {
    if (!offline_) return ok_status();
    return StacyError{StacyError::Network,
        std::string("cannot ") + what + " in offline mode", "run without --offline"};
}

Result<std::string> GitCli::check_version() {
    auto r = git({"--version"});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return StacyError{StacyError::Environment, "git --version failed",
                          "install git >= 2.20"};
    }

    std::string out = chomp(r.value().stdout_str);
    const std::string marker = "git version ";
    auto pos = out.find(marker);
    int major = 0, minor = 0;
    if (pos == std::string::npos ||
        std::sscanf(out.c_str() + pos + marker.size(), "%d.%d", &major, &minor) != 2) {
        return StacyError{StacyError::Parse, "unexpected git --version output: " + out};
    }
    std::string ver = out.substr(pos + marker.size());
    if (major < 2 || (major == 2 && minor < 20)) {
        return StacyError{StacyError::Environment, "git " + ver + " is too old",
                          "upgrade to git >= 2.20"};
    }
    return Result<std::string>::ok(std::move(ver));
}

Result<std::string> GitCli::ls_remote(const std::string& url) {
    STACY_TRY(require_online("list remote refs"));
    log::debug("git ls-remote %s", url.c_str());
    auto r = git({"ls-remote", url});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return StacyError{StacyError::Network,
            "git ls-remote " + url + " failed: " + chomp(r.value().stderr_str)};
    }
    return Result<std::string>::ok(std::move(r.value().stdout_str));
}

Status GitCli::clone(const std::string& url, const std::string& dest) {
    STACY_TRY(require_online("clone"));
    log::debug("git clone %s %s", url.c_str(), dest.c_str());
    auto r = git({"clone", "--quiet", url, dest});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return StacyError{StacyError::Network,
            "git clone " + url + " failed: " + chomp(r.value().stderr_str)};
    }
    return ok_status();
}

Status GitCli::checkout(const std::string& repo, const std::string& commit) {
    auto r = git({"-C", repo, "checkout", "--quiet", "--detach", commit});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return StacyError{StacyError::NotFound,
            "commit " + commit + " is not in the repository: " + chomp(r.value().stderr_str)};
    }
    return ok_status();
}

Result<std::string> GitCli::rev_parse(const std::string& repo, const std::string& rev) {
    auto r = git({"-C", repo, "rev-parse", "--verify", rev + "^{commit}"});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return StacyError{StacyError::NotFound,
            "cannot resolve '" + rev + "': " + chomp(r.value().stderr_str)};
    }
    return Result<std::string>::ok(chomp(r.value().stdout_str));
}

} // namespace stacy
