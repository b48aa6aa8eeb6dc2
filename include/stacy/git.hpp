#pragma once

#include <stacy/process.hpp>
#include <stacy/result.hpp>
#include <stacy/version.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stacy {

struct RemoteTag {
    std::string name;      // as advertised, e.g. "v6.12.3"
    std::string commit;    // peeled for annotated tags
    Version version;
};

// Refs advertised by `git ls-remote <url>`
struct RemoteRefs {
    std::string head;                              // empty when not advertised
    std::map<std::string, std::string> branches;   // name -> commit
    std::vector<RemoteTag> tags;                   // version-like tags, highest first
    std::map<std::string, std::string> all_tags;   // every tag -> commit
};

RemoteRefs parse_ls_remote(const std::string& output);

// Highest tag satisfying `req`; Version error when none does
Result<RemoteTag> resolve_version_from_tags(const std::vector<RemoteTag>& tags,
                                             const VersionReq& req);

// What a repository package resolves to before it is cloned
struct RefSelection {
    std::string commit;    // as given for a bare SHA, else a full hash
    std::string ref;       // tag, branch or SHA named by the source; empty for the tip
    std::string version;   // empty when it must come from the checked-out commit
};

// Pick the commit for a GitHub or git source. An explicit ref wins (tag,
// then branch, then SHA); otherwise a non-trivial constraint selects the
// highest matching tag; otherwise the default branch tip.
Result<RefSelection> select_ref(const RemoteRefs& refs,
                                const std::optional<std::string>& ref,
                                const std::string& constraint);

std::string strip_v_prefix(const std::string& tag);
bool looks_like_sha(const std::string& s);

// "<label>-<first 7 of commit>", e.g. "develop-2222222"
std::string commit_version(const std::string& label, const std::string& commit);

// git CLI driven through run_command
class GitCli {
public:
    // "2.43.0"; Environment error when git is missing or older than 2.20
    Result<std::string> check_version();

    Result<std::string> ls_remote(const std::string& url);
    Status clone(const std::string& url, const std::string& dest);
    Status checkout(const std::string& repo, const std::string& commit);

    // Full hash of `rev` inside a work tree
    Result<std::string> rev_parse(const std::string& repo, const std::string& rev);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    void set_offline(bool offline) { offline_ = offline; }
    bool is_offline() const { return offline_; }

private:
    Result<CommandResult> git(const std::vector<std::string>& args);
    Status require_online(const char* what) const;

    int timeout_seconds_ = 120;
    bool offline_ = false;
};

} // namespace stacy
