#include <stacy/fetcher.hpp>
#include <stacy/log.hpp>
#include <stacy/process.hpp>

namespace stacy {

Result<std::string> CurlFetcher::fetch(const std::string& url) {
    if (offline_) {
        return StacyError{StacyError::Network,
            "cannot download " + url + " in offline mode", "run without --offline"};
    }

    log::debug("GET %s", url.c_str());
    // -f turns HTTP errors into exit 22 instead of saving the error page
    auto r = run_command({"curl", "-fsSL", "--retry", "2",
                          "--connect-timeout", "15",
                          "--max-time", std::to_string(timeout_seconds_), url},
                         "", timeout_seconds_ + 5);
    if (r.is_err()) {
        return StacyError{StacyError::Network, r.error().message};
    }

    auto& cmd = r.value();
    switch (cmd.exit_code) {
        case 0:
            return Result<std::string>::ok(std::move(cmd.stdout_str));
        case 22:
            return StacyError{StacyError::NotFound, "not found: " + url};
        case 127:
            return StacyError{StacyError::Environment,
                "curl is not installed", "install curl to download packages"};
        default:
            // 6 resolve, 7 connect, 28 timeout, 35 TLS and the rest
            return StacyError{StacyError::Network,
                "download failed (curl exit " + std::to_string(cmd.exit_code) +
                ") for " + url + (cmd.stderr_str.empty() ? "" : ": " + cmd.stderr_str)};
    }
}

Result<std::string> StaticFetcher::fetch(const std::string& url) {
    requests_++;
    for (const auto& prefix : unreachable_) {
        if (url.compare(0, prefix.size(), prefix) == 0) {
            return StacyError{StacyError::Network, "host unreachable: " + url};
        }
    }
    auto it = bodies_.find(url);
    if (it == bodies_.end()) {
        return StacyError{StacyError::NotFound, "not found: " + url};
    }
    return Result<std::string>::ok(it->second);
}

} // namespace stacy
