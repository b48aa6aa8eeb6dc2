#include <stacy/config.hpp>
#include <stacy/cache.hpp>
#include <tomlplusplus/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace stacy {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StacyError{StacyError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;
    if (auto v = doc["stata_binary"].value<std::string>()) cfg.stata_binary = *v;
    if (auto v = doc["cache_dir"].value<std::string>()) cfg.cache_dir = *v;
    if (auto v = doc["log_level"].value<std::string>()) cfg.log_level = *v;
    if (auto v = doc["log_dir"].value<std::string>()) cfg.log_dir = *v;
    if (auto v = doc["jobs"].value<int64_t>()) {
        if (*v < 1) {
            return StacyError{StacyError::Config, "config: jobs must be at least 1"};
        }
        cfg.jobs = static_cast<int>(*v);
    }
    if (auto v = doc["timeout_seconds"].value<int64_t>()) {
        if (*v < 0) {
            return StacyError{StacyError::Config,
                "config: timeout_seconds must not be negative"};
        }
        cfg.timeout_seconds = static_cast<int>(*v);
    }
    if (auto v = doc["allow_global"].value<bool>()) cfg.allow_global = *v;

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StacyError{StacyError::IO, "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) r.error().file = path;
    return r;
}

Config Config::from_env() {
    Config cfg;
    auto get = [](const char* name) -> std::optional<std::string> {
        const char* v = std::getenv(name);
        if (v && *v) return std::string(v);
        return std::nullopt;
    };
    cfg.stata_binary = get("STATA_BINARY");
    cfg.cache_dir = get("STACY_CACHE_DIR");
    cfg.log_level = get("STACY_LOG");
    return cfg;
}

Config Config::from_run(const RunSettings& run) {
    Config cfg;
    cfg.log_dir = run.log_dir;
    cfg.jobs = run.jobs;
    cfg.timeout_seconds = run.timeout_seconds;
    cfg.allow_global = run.allow_global;
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.stata_binary) stata_binary = other.stata_binary;
    if (other.cache_dir) cache_dir = other.cache_dir;
    if (other.log_level) log_level = other.log_level;
    if (other.log_dir) log_dir = other.log_dir;
    if (other.jobs) jobs = other.jobs;
    if (other.timeout_seconds) timeout_seconds = other.timeout_seconds;
    if (other.allow_global) allow_global = other.allow_global;
}

Config Config::effective(const std::optional<Config>& user,
                         const std::optional<Config>& project,
                         const std::optional<Config>& cli) {
    Config result;
    if (user.has_value()) result.merge(user.value());
    result.merge(from_env());
    if (project.has_value()) result.merge(project.value());
    if (cli.has_value()) result.merge(cli.value());
    return result;
}

std::string Config::cache_root() const {
    if (cache_dir) return *cache_dir;
    return PackageCache::default_root();
}

int Config::effective_jobs() const {
    if (jobs) return *jobs;
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<int>(n);
}

int Config::effective_timeout() const {
    return timeout_seconds.value_or(0);
}

std::string user_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) return std::string(xdg) + "/stacy/config.toml";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/stacy/config.toml";
}

Result<std::optional<Config>> load_user_config() {
    std::string path = user_config_path();
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

} // namespace stacy
