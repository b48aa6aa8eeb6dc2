#include <stacy/pkg_file.hpp>
#include <stacy/source.hpp>
#include <stacy/log.hpp>
#include <algorithm>
#include <sstream>

namespace stacy {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static std::string extension(const std::string& filename) {
    auto slash = filename.find_last_of('/');
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
    return lowercase(filename.substr(dot + 1));
}

static bool strip_prefix(std::string& s, const char* prefix) {
    std::string p(prefix);
    if (s.compare(0, p.size(), p) != 0) return false;
    s = trim(s.substr(p.size()));
    return true;
}

PkgFileType pkg_file_type(const std::string& filename) {
    std::string ext = extension(filename);
    if (ext == "ado") return PkgFileType::Ado;
    if (ext == "sthlp" || ext == "hlp") return PkgFileType::Help;
    if (ext == "mlib") return PkgFileType::MataLib;
    if (ext == "mata" || ext == "mo") return PkgFileType::Mata;
    if (ext == "dlg") return PkgFileType::Dialog;
    if (ext == "scheme") return PkgFileType::Scheme;
    if (ext == "style") return PkgFileType::Style;
    return PkgFileType::Other;
}

bool is_stata_package_file(const std::string& filename) {
    static const char* const kExts[] = {
        "ado", "sthlp", "hlp", "mata", "mo", "mlib", "dlg", "class",
        "scheme", "style", "ihlp", "do", "pkg",
    };
    std::string ext = extension(filename);
    return std::any_of(std::begin(kExts), std::end(kExts),
                       [&](const char* e) { return ext == e; });
}

Result<PkgDescriptor> PkgDescriptor::parse(const std::string& content,
                                           const std::string& name) {
    PkgDescriptor pkg;
    pkg.name = name;

    std::istringstream in(content);
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        char directive = line[0];
        std::string rest = trim(line.substr(1));

        switch (directive) {
            case 'd': case 'D': {
                if (strip_prefix(rest, "Distribution-Date:")) {
                    pkg.distribution_date = rest;
                } else if (strip_prefix(rest, "Authors:") || strip_prefix(rest, "Author:")) {
                    pkg.author = rest;
                } else if (!rest.empty()) {
                    if (pkg.title.empty()) {
                        // 'NAME': title
                        pkg.title = rest;
                        if (rest[0] == '\'') {
                            auto close = rest.find('\'', 1);
                            if (close != std::string::npos) {
                                std::string after = trim(rest.substr(close + 1));
                                if (!after.empty() && after[0] == ':') {
                                    pkg.title = trim(after.substr(1));
                                }
                            }
                        }
                    }
                    pkg.description.push_back(rest);
                }
                break;
            }
            case 'f': case 'F': {
                if (!rest.empty()) {
                    pkg.files.push_back({rest, pkg_file_type(rest)});
                }
                break;
            }
            case 'h': case 'H': {
                if (!rest.empty()) {
                    if (rest.find('.') == std::string::npos) rest += ".sthlp";
                    pkg.files.push_back({rest, PkgFileType::Help});
                }
                break;
            }
            case '*': case 'v': case 'V': case 'p': case 'P':
            case 'e': case 'E': case 'g': case 'G':
                break;
            default:
                log::debug("%s.pkg: ignoring directive '%c'", name.c_str(), directive);
                break;
        }
    }

    if (pkg.files.empty()) {
        return StacyError{StacyError::Parse,
            "package descriptor " + name + ".pkg lists no files"};
    }

    return Result<PkgDescriptor>::ok(std::move(pkg));
}

} // namespace stacy
