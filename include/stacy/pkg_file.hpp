#pragma once

#include <stacy/result.hpp>
#include <string>
#include <vector>

namespace stacy {

enum class PkgFileType { Ado, Help, MataLib, Mata, Dialog, Scheme, Style, Other };

PkgFileType pkg_file_type(const std::string& filename);

struct PkgFileEntry {
    std::string name;        // as written, relative to the .pkg location
    PkgFileType type = PkgFileType::Other;
};

// Stata package descriptor (.pkg). Each line starts with a one-letter
// directive: d description, f/F file, h help file, v version of the
// descriptor format, p/e/g ignored, * comment.
struct PkgDescriptor {
    std::string name;
    std::string title;
    std::string author;
    std::string distribution_date;   // yyyymmdd, empty when absent
    std::vector<std::string> description;
    std::vector<PkgFileEntry> files;

    static Result<PkgDescriptor> parse(const std::string& content,
                                       const std::string& name);
};

// True for the file extensions Stata installs as part of a package
bool is_stata_package_file(const std::string& filename);

} // namespace stacy
