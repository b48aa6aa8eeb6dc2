#include <stacy/error.hpp>
#include <stacy/error_codes.hpp>

namespace stacy {

const char* StacyError::code_name(Code c) {
    switch (c) {
        case IO:          return "IO";
        case Parse:       return "Parse";
        case Version:     return "Version";
        case Dependency:  return "Dependency";
        case Config:      return "Config";
        case Manifest:    return "Manifest";
        case Checksum:    return "Checksum";
        case Network:     return "Network";
        case NotFound:    return "NotFound";
        case Duplicate:   return "Duplicate";
        case Cycle:       return "Cycle";
        case InvalidArg:  return "InvalidArg";
        case Environment: return "Environment";
        case Internal:    return "Internal";
        case Cancelled:   return "Cancelled";
    }
    return "Unknown";
}

int StacyError::exit_code() const {
    switch (code) {
        case Environment:
        case Config:
            return static_cast<int>(ExitClass::Environment);
        case NotFound:
            return static_cast<int>(ExitClass::File);
        case Cancelled:
            return 128 + 2;  // SIGINT convention
        default:
            return static_cast<int>(ExitClass::Internal);
    }
}

std::string StacyError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace stacy
