#include <stacy/error_codes.hpp>
#include <algorithm>

namespace stacy {

namespace {

using C = ErrorCategory;

struct Entry {
    int code;
    const char* name;
    ErrorCategory category;
    const char* description;
};

// Sorted by code. Category normally follows the code's range; entries that
// belong elsewhere (Mata file and memory errors) say so explicitly.
const Entry kTable[] = {
    // ---- General ----
    {1,    "you pressed Break", C::General, "Execution was interrupted by the user or a Break request"},
    {2,    "connection timed out", C::General, "A network or remote operation did not respond in time"},
    {3,    "no dataset in use", C::General, "The command requires data in memory and none is loaded"},
    {4,    "no; dataset in memory has changed since last saved", C::General, "Loading or clearing would discard unsaved changes; use clear"},
    {5,    "not sorted", C::General, "The data must be sorted by the requested variables first"},
    {6,    "confirm failed", C::General, "The object tested by confirm does not exist or has the wrong type"},
    {7,    "found where expected", C::General, "A value of the wrong kind was found where another was expected"},
    {9,    "assertion is false", C::General, "An assert statement evaluated to false for at least one observation"},
    {18,   "you must start with an empty dataset", C::General, "The command only works when no data are in memory"},

    // ---- Syntax / command ----
    {100,  "varlist required", C::Syntax, "A variable list or other required element was not supplied"},
    {101,  "varlist not allowed", C::Syntax, "A variable list, weight, if or in qualifier is not allowed here"},
    {102,  "too few variables specified", C::Syntax, "The command needs more variables than were given"},
    {103,  "too many variables specified", C::Syntax, "The command accepts fewer variables than were given"},
    {104,  "nothing to input", C::Syntax, "input was called without anything to read"},
    {106,  "variable type mismatch", C::Syntax, "A variable has a different storage type than the operation requires"},
    {107,  "not possible with numeric variable", C::Syntax, "A string variable was required"},
    {108,  "not possible with string variable", C::Syntax, "A numeric variable was required"},
    {109,  "type mismatch", C::Syntax, "An expression mixes string and numeric values"},
    {110,  "already defined", C::Syntax, "A variable, label or other name already exists"},
    {111,  "not found", C::Syntax, "A variable, observation or other named object does not exist"},
    {119,  "statement out of context", C::Syntax, "A command was used where it is not allowed"},
    {120,  "invalid %format", C::Syntax, "A display format specification is malformed"},
    {121,  "invalid numlist", C::Syntax, "A number list could not be parsed"},
    {122,  "invalid numlist has too few elements", C::Syntax, "The number list is shorter than required"},
    {123,  "invalid numlist has too many elements", C::Syntax, "The number list is longer than allowed"},
    {124,  "invalid numlist has elements out of order", C::Syntax, "The number list must be ascending"},
    {125,  "invalid numlist has elements outside of allowed range", C::Syntax, "A number list element is out of range"},
    {126,  "invalid numlist has noninteger elements", C::Syntax, "The number list must contain integers"},
    {127,  "invalid numlist has missing values", C::Syntax, "The number list contains a missing value"},
    {130,  "expression too long", C::Syntax, "An expression exceeds the parser's length limit"},
    {131,  "not possible with test", C::Syntax, "The requested hypothesis cannot be tested"},
    {132,  "too many '(' or '['", C::Syntax, "Parentheses or brackets are unbalanced"},
    {133,  "unknown function", C::Syntax, "An expression calls a function that does not exist"},
    {134,  "too many values", C::Syntax, "Too many distinct values for the operation"},
    {135,  "not possible with weighted data", C::Syntax, "The command does not support weights"},
    {137,  "list too long", C::Syntax, "A list argument exceeds the allowed length"},
    {140,  "repeated categorical variable in term", C::Syntax, "A categorical variable appears twice in an interaction"},
    {141,  "repeated term", C::Syntax, "The same term was specified more than once"},
    {145,  "term contains more than 8 variables", C::Syntax, "An interaction term has too many variables"},
    {146,  "too many variables or values", C::Syntax, "The model is too large for the current limits"},
    {148,  "too few categories", C::Syntax, "The variable has fewer categories than required"},
    {149,  "too many categories", C::Syntax, "The variable has more categories than allowed"},
    {151,  "non r-class program may not set r()", C::Syntax, "Only r-class programs may return r() results"},
    {152,  "non e-class program may not set e()", C::Syntax, "Only e-class programs may post e() results"},
    {153,  "non s-class program may not set s()", C::Syntax, "Only s-class programs may return s() results"},
    {161,  "ado-file has commands outside of program define", C::Syntax, "An ado-file contains commands outside its program block"},
    {162,  "ado-file does not define command", C::Syntax, "The ado-file does not define the program it is named after"},
    {170,  "unable to chdir", C::Syntax, "The working directory could not be changed"},
    {175,  "factor level out of range", C::Syntax, "A factor-variable level is negative or too large"},
    {180,  "invalid attempt to modify label", C::Syntax, "The value label cannot be modified this way"},
    {181,  "may not label strings", C::Syntax, "Value labels apply only to numeric variables"},
    {182,  "not labeled", C::Syntax, "The variable has no value label attached"},
    {184,  "options may not be combined", C::Syntax, "Two mutually exclusive options were specified"},
    {190,  "request may not be combined with by", C::Syntax, "The command does not support the by prefix"},
    {191,  "request may not be combined with by() option", C::Syntax, "The command does not support the by() option"},
    {196,  "could not restore sort order because variables were dropped", C::Syntax, "Variables used for the original sort order no longer exist"},
    {197,  "invalid syntax", C::Syntax, "Syntax parsing of a program argument failed"},
    {198,  "invalid syntax", C::Syntax, "The command line could not be parsed"},
    {199,  "unrecognized command", C::Syntax, "The command is not built in and no ado-file defines it"},

    // ---- Previously stored result ----
    {301,  "last estimates not found", C::StoredResult, "A postestimation command ran without a preceding estimation"},
    {302,  "last test results not found", C::StoredResult, "No test results are available to reuse"},
    {303,  "equation not found", C::StoredResult, "The named equation is not part of the current estimates"},
    {304,  "ml model not found", C::StoredResult, "No ml model has been defined"},
    {310,  "not possible because object(s) in use", C::StoredResult, "The object is in use and cannot be modified"},
    {321,  "requested action not valid after most recent estimation command", C::StoredResult, "The postestimation command does not apply to the last model"},
    {322,  "estimation results inconsistent", C::StoredResult, "Something that should be true of the estimation results is not"},
    {399,  "may not drop constant", C::StoredResult, "The constant term cannot be dropped here"},

    // ---- Statistical problems ----
    {401,  "may not use noninteger frequency weights", C::Statistical, "Frequency weights must be integers"},
    {402,  "negative weights encountered", C::Statistical, "Weights must not be negative"},
    {404,  "not possible with pweighted data", C::Statistical, "The command does not support sampling weights"},
    {406,  "not possible with analytic weights", C::Statistical, "The command does not support analytic weights"},
    {407,  "weights must be the same for all observations in a group", C::Statistical, "Weights vary within a group"},
    {409,  "no variance", C::Statistical, "A variable has no variation"},
    {411,  "nonpositive values encountered", C::Statistical, "A variable that must be positive contains zero or negative values"},
    {412,  "redundant or inconsistent constraints", C::Statistical, "The constraints cannot be applied together"},
    {416,  "missing values encountered", C::Statistical, "The operation does not allow missing values"},
    {430,  "convergence not achieved", C::Statistical, "The iterative estimator did not converge"},
    {450,  "variable is not a 0/1 variable", C::Statistical, "A binary outcome was required"},
    {451,  "invalid values for time variable", C::Statistical, "The time variable contains invalid values"},
    {452,  "invalid values for factor variable", C::Statistical, "The factor variable contains invalid values"},
    {459,  "something that should be true of your data is not", C::Statistical, "A data assumption required by the command failed"},
    {470,  "observation numbers out of range", C::Statistical, "An observation index is outside the dataset"},
    {480,  "starting values invalid", C::Statistical, "Initial values are invalid or regressors have missing values"},
    {491,  "could not find feasible values", C::Statistical, "The optimizer could not find feasible starting values"},
    {498,  "program-specific error", C::Statistical, "A program reported a problem with its own message"},

    // ---- Matrix manipulation ----
    {501,  "matrix operation not found", C::Matrix, "The matrix expression uses an unknown operation"},
    {503,  "conformability error", C::Matrix, "Matrix dimensions do not conform"},
    {504,  "matrix has missing values", C::Matrix, "The matrix contains missing values"},
    {505,  "matrix not symmetric", C::Matrix, "A symmetric matrix was required"},
    {506,  "matrix not positive definite", C::Matrix, "A positive definite matrix was required"},
    {507,  "name conflict", C::Matrix, "The matrix name is already in use"},
    {508,  "matrix has zero values", C::Matrix, "The matrix contains zeros where they are not allowed"},
    {509,  "matrix operators that return matrices not allowed in this context", C::Matrix, "A matrix-valued expression appeared where a scalar was expected"},

    // ---- File I/O ----
    {601,  "file not found", C::FileIO, "The named file does not exist"},
    {602,  "file already exists", C::FileIO, "The file exists; specify replace to overwrite it"},
    {603,  "file could not be opened", C::FileIO, "The file exists but could not be opened"},
    {604,  "log file already open", C::FileIO, "A log with that name is already open"},
    {606,  "no log file open", C::FileIO, "There is no log to close or suspend"},
    {607,  "no cmdlog file open", C::FileIO, "There is no command log to close"},
    {608,  "file is read-only; cannot be modified or erased", C::FileIO, "The operating system marks the file read-only"},
    {609,  "file cannot be read", C::FileIO, "The file could not be read"},
    {610,  "file not Stata format", C::FileIO, "The file is not a Stata dataset"},
    {611,  "record too long", C::FileIO, "An input record exceeds the allowed length"},
    {612,  "unexpected end of file", C::FileIO, "The file ended before the data were complete"},
    {613,  "file does not contain dictionary", C::FileIO, "infile expected a dictionary"},
    {614,  "dictionary invalid", C::FileIO, "The dictionary could not be parsed"},
    {616,  "wrong number of values in checksum file", C::FileIO, "The checksum file is malformed"},
    {621,  "already preserved", C::FileIO, "preserve was called twice"},
    {622,  "nothing to restore", C::FileIO, "restore was called without preserve"},
    {631,  "host not found", C::FileIO, "The remote host name could not be resolved"},
    {632,  "web filename not supported in this context", C::FileIO, "A URL was given where only local files are allowed"},
    {633,  "may not write files over Internet", C::FileIO, "Remote files are read-only"},
    {639,  "file transmission error (checksums do not match)", C::FileIO, "A downloaded file failed its checksum"},
    {640,  "package file too long", C::FileIO, "The .pkg file exceeds the allowed size"},
    {641,  "package file invalid", C::FileIO, "The .pkg file could not be parsed"},
    {651,  "may not seek past end of file", C::FileIO, "A file seek went beyond the end"},
    {660,  "proxy host not found", C::FileIO, "The configured proxy could not be resolved"},
    {662,  "proxy server refused request to send", C::FileIO, "The proxy rejected the request"},
    {663,  "remote connection to proxy failed", C::FileIO, "Could not connect through the proxy"},
    {669,  "invalid URL", C::FileIO, "The URL is malformed"},
    {670,  "invalid network port number", C::FileIO, "The URL names an invalid port"},
    {671,  "unknown network protocol", C::FileIO, "Only http and https are supported"},
    {672,  "server refused to send file", C::FileIO, "The server rejected the request"},
    {673,  "authorization required by server", C::FileIO, "The server requires credentials"},
    {674,  "unexpected response from server", C::FileIO, "The server reply could not be understood"},
    {675,  "server reported server error", C::FileIO, "The server returned an internal error"},
    {676,  "server refused request to send", C::FileIO, "The server refused the transfer"},
    {677,  "remote connection failed", C::FileIO, "The connection to the server failed"},
    {678,  "could not open local network socket", C::FileIO, "A local socket could not be created"},
    {679,  "unexpected web error", C::FileIO, "An unclassified network error occurred"},
    {681,  "too many open files", C::FileIO, "The per-process open file limit was reached"},
    {682,  "could not connect to ODBC data source name", C::FileIO, "The ODBC DSN is unavailable"},
    {691,  "I/O error", C::FileIO, "The operating system reported an I/O error"},
    {692,  "file I/O error on read", C::FileIO, "Reading from the file failed"},
    {693,  "file I/O error on write", C::FileIO, "Writing to the file failed"},
    {699,  "insufficient disk space", C::FileIO, "The disk is full"},

    // ---- Operating system ----
    {700,  "unknown operating system error", C::OperatingSystem, "The operating system reported an unclassified error"},
    {702,  "op. sys. refused to start new process", C::OperatingSystem, "A shell or child process could not be started"},
    {703,  "op. sys. refused to open pipe", C::OperatingSystem, "A pipe to a child process could not be opened"},

    // ---- Memory / resources ----
    {900,  "no room to add more variables", C::Memory, "The variable limit or memory was exhausted"},
    {901,  "no room to add more observations", C::Memory, "Memory for additional observations is exhausted"},
    {902,  "no room to add more variables because of width", C::Memory, "The dataset width limit was reached"},
    {903,  "no room to promote variable", C::Memory, "Not enough memory to change a variable's storage type"},
    {908,  "matsize too small", C::Memory, "The model needs a larger matsize"},
    {909,  "op. sys. refused to provide memory", C::Memory, "A memory allocation failed"},
    {910,  "value too small", C::Memory, "A memory setting is below its minimum"},
    {912,  "value too large", C::Memory, "A memory setting is above its maximum"},
    {913,  "op. sys. refused to provide sufficient memory", C::Memory, "The requested memory could not be allocated"},
    {914,  "op. sys. refused to allow Stata to open a temporary file", C::Memory, "Temporary storage is unavailable"},
    {920,  "too many macros", C::Memory, "The macro table is full"},
    {950,  "insufficient memory", C::Memory, "Not enough memory to complete the operation"},

    // ---- System limits ----
    {1000, "system limit exceeded", C::SystemLimits, "An internal limit was exceeded"},
    {1001, "too many values", C::SystemLimits, "Too many distinct values for the operation"},
    {1002, "too many by variables", C::SystemLimits, "The by list is too long"},
    {1003, "too many sort variables", C::SystemLimits, "The sort key is too long"},
    {1400, "numerical overflow", C::SystemLimits, "A computation overflowed"},

    // ---- Non-errors ----
    {2000, "no observations", C::NonError, "The command found no observations to use"},
    {2001, "insufficient observations", C::NonError, "Too few observations for the command"},

    // ---- Mata run-time ----
    {3000, "Mata run-time error", C::Mata, "Mata stopped with an unclassified error"},
    {3001, "incorrect number of arguments", C::Mata, "A function was called with the wrong number of arguments"},
    {3010, "attempt to dereference NULL pointer", C::Mata, "A NULL pointer was dereferenced"},
    {3011, "invalid lval", C::Mata, "The left-hand side of an assignment is invalid"},
    {3012, "undefined function", C::Mata, "The function is not defined"},
    {3200, "conformability error", C::Mata, "Matrix dimensions do not conform"},
    {3201, "vector required", C::Mata, "A vector was required"},
    {3202, "row vector required", C::Mata, "A row vector was required"},
    {3203, "column vector required", C::Mata, "A column vector was required"},
    {3204, "matrix found where scalar required", C::Mata, "A scalar was required"},
    {3205, "square matrix required", C::Mata, "A square matrix was required"},
    {3250, "type mismatch", C::Mata, "The value has the wrong element type"},
    {3251, "nonnumeric found where numeric required", C::Mata, "A numeric value was required"},
    {3253, "nonreal found where real required", C::Mata, "A real value was required"},
    {3254, "nonstring found where string required", C::Mata, "A string value was required"},
    {3257, "nonpointer found where pointer required", C::Mata, "A pointer was required"},
    {3300, "argument out of range", C::Mata, "An argument is outside its valid range"},
    {3301, "subscript invalid", C::Mata, "A subscript is out of bounds"},
    {3302, "invalid %fmt", C::Mata, "A format specification is invalid"},
    {3351, "argument has missing values", C::Mata, "An argument contains missing values"},
    {3352, "singular matrix", C::Mata, "The matrix is singular"},
    {3353, "matrix not positive definite", C::Mata, "A positive definite matrix was required"},
    {3360, "failure to converge", C::Mata, "An iterative routine did not converge"},
    {3492, "resulting string too long", C::Mata, "A string result exceeds the maximum length"},
    {3499, "not found", C::Mata, "A named object does not exist"},
    {3500, "invalid Stata variable name", C::Mata, "The name is not a valid variable name"},
    {3598, "Stata returned error", C::Mata, "A Stata command executed from Mata failed"},
    {3601, "invalid file handle", C::FileIO, "The file handle is not open"},
    {3602, "invalid filename", C::FileIO, "The file name is invalid"},
    {3603, "invalid file mode", C::FileIO, "The file open mode is invalid"},
    {3611, "too many open files", C::FileIO, "The open file limit was reached"},
    {3621, "attempt to write read-only file", C::FileIO, "The file was opened read-only"},
    {3622, "attempt to read write-only file", C::FileIO, "The file was opened write-only"},
    {3698, "file seek error", C::FileIO, "A file seek failed"},
    {3900, "out of memory", C::Memory, "Mata could not allocate memory"},
    {3930, "error in LAPACK routine", C::Mata, "A linear algebra routine failed"},
    {3998, "stack overflow", C::Mata, "Recursion exceeded the stack"},
    {3999, "system assertion failed", C::Mata, "An internal Mata assertion failed"},

    // ---- Class system ----
    {4000, "class system error", C::ClassSystem, "The class system reported an error"},
    {4018, "class not found", C::ClassSystem, "The named class is not defined"},

    // ---- Python ----
    {7100, "Python error", C::Python, "Embedded Python raised an exception"},
    {7102, "Python initialization failed", C::Python, "The Python environment could not be initialized"},

    // ---- System failure ----
    {9000, "system failure", C::SystemFailure, "The interpreter detected an internal failure"},
};

std::vector<ErrorCode> build_table() {
    std::vector<ErrorCode> out;
    out.reserve(sizeof(kTable) / sizeof(kTable[0]));
    for (const auto& e : kTable) {
        ErrorCode ec;
        ec.code = e.code;
        ec.name = e.name;
        ec.category = e.category;
        ec.description = e.description;
        ec.known = true;
        out.push_back(std::move(ec));
    }
    std::sort(out.begin(), out.end(),
              [](const ErrorCode& a, const ErrorCode& b) { return a.code < b.code; });
    return out;
}

} // namespace

const std::vector<ErrorCode>& error_code_table() {
    static const std::vector<ErrorCode> table = build_table();
    return table;
}

std::string ErrorCode::doc_ref() const {
    return "help r(" + std::to_string(code) + ")";
}

ExitClass ErrorCode::exit_class() const {
    return exit_class_for(category);
}

const ErrorCode* find_error_code(int code) {
    const auto& table = error_code_table();
    auto it = std::lower_bound(table.begin(), table.end(), code,
        [](const ErrorCode& e, int c) { return e.code < c; });
    if (it == table.end() || it->code != code) return nullptr;
    return &*it;
}

ErrorCode classify_error_code(int code) {
    if (const ErrorCode* known = find_error_code(code)) {
        return *known;
    }
    ErrorCode ec;
    ec.code = code;
    ec.category = category_for_range(code);
    ec.name = std::string(category_name(ec.category)) + " error";
    ec.description = "r(" + std::to_string(code) + ") is not in the error table; "
                     "classified by range";
    ec.known = false;
    return ec;
}

ErrorCategory category_for_range(int code) {
    if (code >= 1 && code <= 99)       return ErrorCategory::General;
    if (code >= 100 && code <= 199)    return ErrorCategory::Syntax;
    if (code >= 200 && code <= 299)    return ErrorCategory::Reserved;
    if (code >= 300 && code <= 399)    return ErrorCategory::StoredResult;
    if (code >= 400 && code <= 499)    return ErrorCategory::Statistical;
    if (code >= 500 && code <= 599)    return ErrorCategory::Matrix;
    if (code >= 600 && code <= 699)    return ErrorCategory::FileIO;
    if (code >= 700 && code <= 799)    return ErrorCategory::OperatingSystem;
    if (code >= 800 && code <= 899)    return ErrorCategory::System;
    if (code >= 900 && code <= 999)    return ErrorCategory::Memory;
    if (code >= 1000 && code <= 1999)  return ErrorCategory::SystemLimits;
    if (code >= 2000 && code <= 2999)  return ErrorCategory::NonError;
    if (code >= 3000 && code <= 3999)  return ErrorCategory::Mata;
    if (code >= 4000 && code <= 4999)  return ErrorCategory::ClassSystem;
    if (code >= 7100 && code <= 7199)  return ErrorCategory::Python;
    if (code >= 9000 && code <= 9999)  return ErrorCategory::SystemFailure;
    return ErrorCategory::General;
}

const char* category_name(ErrorCategory cat) {
    switch (cat) {
        case ErrorCategory::General:         return "General";
        case ErrorCategory::Syntax:          return "Syntax/Command";
        case ErrorCategory::Reserved:        return "Reserved";
        case ErrorCategory::StoredResult:    return "Previously stored result";
        case ErrorCategory::Statistical:     return "Statistical problems";
        case ErrorCategory::Matrix:          return "Matrix manipulation";
        case ErrorCategory::FileIO:          return "File I/O";
        case ErrorCategory::OperatingSystem: return "Operating system";
        case ErrorCategory::System:          return "System";
        case ErrorCategory::Memory:          return "Memory/Resources";
        case ErrorCategory::SystemLimits:    return "System limits";
        case ErrorCategory::NonError:        return "Non-errors";
        case ErrorCategory::Mata:            return "Mata run-time";
        case ErrorCategory::ClassSystem:     return "Class system";
        case ErrorCategory::Python:          return "Python run-time";
        case ErrorCategory::SystemFailure:   return "System failure";
    }
    return "General";
}

ExitClass exit_class_for(ErrorCategory cat) {
    switch (cat) {
        case ErrorCategory::Syntax: return ExitClass::Syntax;
        case ErrorCategory::FileIO: return ExitClass::File;
        case ErrorCategory::Memory: return ExitClass::Memory;
        case ErrorCategory::System: return ExitClass::Environment;
        default:                    return ExitClass::StataError;
    }
}

const char* exit_class_name(ExitClass cls) {
    switch (cls) {
        case ExitClass::Success:     return "success";
        case ExitClass::StataError:  return "stata-error";
        case ExitClass::Syntax:      return "syntax";
        case ExitClass::File:        return "file";
        case ExitClass::Memory:      return "memory";
        case ExitClass::Internal:    return "internal";
        case ExitClass::Environment: return "environment";
    }
    return "unknown";
}

} // namespace stacy
