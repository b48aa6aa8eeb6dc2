#pragma once

#include <stacy/cache.hpp>
#include <stacy/error.hpp>
#include <stacy/error_codes.hpp>
#include <stacy/lockfile.hpp>
#include <stacy/lock_manager.hpp>
#include <stacy/log_parser.hpp>
#include <stacy/orchestrator.hpp>
#include <stacy/script_deps.hpp>

#include <string>
#include <vector>

namespace stacy {
namespace report {

// Machine-readable payloads for --format json. Each function returns one
// JSON object without a trailing newline.

std::string run_json(const std::string& script, const DetectionResult& r);
std::string batch_json(const BatchResult& batch);
std::string bench_json(const std::string& script, const BenchResult& bench);
std::string lock_check_json(const LockCheck& check);
std::string deps_json(const DependencyAnalysis& analysis);
std::string clean_json(const CleanReport& report);
std::string cache_list_json(const std::vector<CacheEntry>& entries);
std::string explain_json(const ErrorCode& code);
std::string outdated_json(const std::vector<OutdatedEntry>& entries);
std::string error_json(const StacyError& err);

// Project commands
std::string init_json(const std::string& manifest_path);
std::string lock_json(const LockFile& lock);
std::string install_json(const std::vector<ResolvedPackage>& installed);

// `action` is the count key ("added", "removed", "updated"); `names` lists
// the packages it touched
std::string change_json(const std::string& action, const std::vector<std::string>& names);

} // namespace report
} // namespace stacy
