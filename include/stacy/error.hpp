#pragma once

#include <string>

namespace stacy {

// Tool-level failure. Script-level failures are never reported through this
// type; they live in a DetectionResult.
struct StacyError {
    enum Code {
        IO,
        Parse,
        Version,
        Dependency,
        Config,
        Manifest,
        Checksum,
        Network,
        NotFound,
        Duplicate,
        Cycle,
        InvalidArg,
        Environment,
        Internal,
        Cancelled
    };

    Code code = Internal;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    StacyError() = default;
    StacyError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    StacyError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    StacyError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;

    // Process exit code for this failure (3 file, 5 internal, 10 environment)
    int exit_code() const;

    static const char* code_name(Code c);
};

} // namespace stacy
