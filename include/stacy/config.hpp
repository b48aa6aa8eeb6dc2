#pragma once

#include <stacy/manifest.hpp>
#include <stacy/result.hpp>
#include <optional>
#include <string>

namespace stacy {

// Layered configuration: defaults < user config < environment <
// project [run] < command line. Unset fields defer to lower layers.
struct Config {
    std::optional<std::string> stata_binary;
    std::optional<std::string> cache_dir;
    std::optional<std::string> log_level;
    std::optional<std::string> log_dir;
    std::optional<int> jobs;
    std::optional<int> timeout_seconds;
    std::optional<bool> allow_global;

    // User config file (~/.config/stacy/config.toml)
    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // STATA_BINARY, STACY_CACHE_DIR, STACY_LOG
    static Config from_env();

    // Project [run] section
    static Config from_run(const RunSettings& run);

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& user,
                            const std::optional<Config>& project,
                            const std::optional<Config>& cli);

    // Resolved values
    std::string cache_root() const;
    int effective_jobs() const;           // hardware concurrency when unset
    int effective_timeout() const;        // 0: no timeout
    bool effective_allow_global() const { return allow_global.value_or(false); }
};

// $XDG_CONFIG_HOME/stacy/config.toml, else ~/.config/stacy/config.toml
std::string user_config_path();

// User config when the file exists; parse errors propagate
Result<std::optional<Config>> load_user_config();

} // namespace stacy
