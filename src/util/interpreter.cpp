#include <stacy/interpreter.hpp>
#include <stacy/log.hpp>
#include <stacy/process.hpp>

namespace stacy {

std::vector<std::string> InterpreterQuery::default_install_locations() {
    std::vector<std::string> out;
#ifdef __APPLE__
    for (const char* app : {"StataNow", "Stata"}) {
        out.push_back(std::string("/Applications/") + app + "/StataMP.app/Contents/MacOS/stata-mp");
        out.push_back(std::string("/Applications/") + app + "/StataSE.app/Contents/MacOS/stata-se");
        out.push_back(std::string("/Applications/") + app + "/StataBE.app/Contents/MacOS/stata-be");
    }
#endif
    for (const char* ver : {"19", "18", "17", "16", ""}) {
        for (const char* ed : {"stata-mp", "stata-se", "stata-be"}) {
            out.push_back(std::string("/usr/local/stata") + ver + "/" + ed);
        }
    }
    return out;
}

static Result<Interpreter> explicit_binary(const std::string& path, const char* origin) {
    std::string resolved = find_in_path(path);
    if (resolved.empty()) {
        return StacyError{StacyError::Environment,
            std::string("Stata binary from ") + origin + " not found or not executable: " + path};
    }
    log::debug("interpreter %s (from %s)", resolved.c_str(), origin);
    return Result<Interpreter>::ok(Interpreter{resolved, origin});
}

Result<Interpreter> find_interpreter(const InterpreterQuery& query) {
    if (query.engine) return explicit_binary(*query.engine, "--engine");
    if (query.env_binary) return explicit_binary(*query.env_binary, "STATA_BINARY");
    if (query.config_binary) return explicit_binary(*query.config_binary, "config");

    for (const auto& loc : query.install_locations) {
        if (!find_in_path(loc).empty()) {
            log::debug("interpreter %s (install location)", loc.c_str());
            return Result<Interpreter>::ok(Interpreter{loc, "install location"});
        }
    }
    for (const auto& name : query.path_names) {
        std::string found = find_in_path(name);
        if (!found.empty()) {
            log::debug("interpreter %s (PATH)", found.c_str());
            return Result<Interpreter>::ok(Interpreter{found, "PATH"});
        }
    }

    return StacyError{StacyError::Environment,
        "Stata binary not found",
        "install Stata, set STATA_BINARY, set stata_binary in " 
        "~/.config/stacy/config.toml, or pass --engine"};
}

} // namespace stacy
