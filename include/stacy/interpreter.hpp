#pragma once

#include <stacy/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stacy {

struct Interpreter {
    std::string path;
    std::string found_by;    // "--engine", "STATA_BINARY", "config", "install location", "PATH"
};

struct InterpreterQuery {
    std::optional<std::string> engine;           // --engine
    std::optional<std::string> env_binary;       // STATA_BINARY
    std::optional<std::string> config_binary;    // user config stata_binary
    std::vector<std::string> install_locations = default_install_locations();
    std::vector<std::string> path_names = {"stata-mp", "stata-se", "stata-be", "stata"};

    static std::vector<std::string> default_install_locations();
};

// First hit in order: engine, env, config, install locations, PATH. An
// explicit setting that does not point to an executable is an error
// rather than a reason to keep searching.
Result<Interpreter> find_interpreter(const InterpreterQuery& query);

} // namespace stacy
