#pragma once

#include <string>
#include <vector>

namespace stacy {

// Stable process exit codes. Never renumber.
enum class ExitClass : int {
    Success     = 0,
    StataError  = 1,   // any other interpreter r() code
    Syntax      = 2,
    File        = 3,
    Memory      = 4,
    Internal    = 5,   // the tool itself failed
    Environment = 10,  // interpreter missing, config invalid
};

enum class ErrorCategory {
    General,
    Syntax,
    Reserved,
    StoredResult,
    Statistical,
    Matrix,
    FileIO,
    OperatingSystem,
    System,
    Memory,
    SystemLimits,
    NonError,
    Mata,
    ClassSystem,
    Python,
    SystemFailure,
};

struct ErrorCode {
    int code = 0;
    std::string name;
    ErrorCategory category = ErrorCategory::General;
    std::string description;
    bool known = false;   // false when synthesized from the range fallback

    // "help r(601)"
    std::string doc_ref() const;
    ExitClass exit_class() const;
};

// Table lookup only; nullptr when the code is not listed.
const ErrorCode* find_error_code(int code);

// Table entry, or an entry synthesized from the code's range.
ErrorCode classify_error_code(int code);

ErrorCategory category_for_range(int code);
const char* category_name(ErrorCategory cat);
ExitClass exit_class_for(ErrorCategory cat);
const char* exit_class_name(ExitClass cls);

// All listed codes, sorted ascending
const std::vector<ErrorCode>& error_code_table();

// Conventional shell status for a process killed by `sig`
inline int signal_exit_code(int sig) { return 128 + sig; }

} // namespace stacy
