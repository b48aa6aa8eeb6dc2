#pragma once

#include <stacy/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace stacy {

// Retrieves a URL's body. A missing resource is a NotFound error, an
// unreachable host a Network error, so callers can choose a fallback.
class Fetcher {
public:
    virtual ~Fetcher() = default;
    virtual Result<std::string> fetch(const std::string& url) = 0;
};

// HTTP(S) through the curl command line tool
class CurlFetcher : public Fetcher {
public:
    Result<std::string> fetch(const std::string& url) override;

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    void set_offline(bool offline) { offline_ = offline; }

private:
    int timeout_seconds_ = 60;
    bool offline_ = false;
};

// In-memory responses keyed by URL; unknown URLs are NotFound, URLs with
// a prefix in `unreachable` fail with a Network error
class StaticFetcher : public Fetcher {
public:
    void add(const std::string& url, std::string body) { bodies_[url] = std::move(body); }
    void set_unreachable(const std::string& prefix) { unreachable_.push_back(prefix); }
    Result<std::string> fetch(const std::string& url) override;

    int request_count() const { return requests_; }

private:
    std::map<std::string, std::string> bodies_;
    std::vector<std::string> unreachable_;
    int requests_ = 0;
};

} // namespace stacy
