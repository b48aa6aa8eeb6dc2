#include <stacy/manifest.hpp>
#include <stacy/sha256.hpp>
#include <tomlplusplus/toml.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace stacy {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string scalar_to_string(const toml::node& v) {
    if (auto s = v.value<std::string>()) return *s;
    if (v.is_boolean()) return *v.value<bool>() ? "true" : "false";
    if (v.is_integer()) return std::to_string(*v.value<int64_t>());
    if (v.is_floating_point()) {
        std::ostringstream ss;
        ss << *v.value<double>();
        return ss.str();
    }
    return {};
}

static std::vector<std::string> string_array(const toml::array& arr) {
    std::vector<std::string> out;
    for (const auto& elem : arr) {
        if (auto s = elem.value<std::string>()) out.push_back(*s);
    }
    return out;
}

static Result<PackageRef> parse_package(const std::string& name,
                                        const toml::node& node,
                                        DependencyGroup group) {
    PackageRef ref;
    ref.name = name;
    ref.group = group;

    std::string source_spec;
    if (auto s = node.value<std::string>()) {
        source_spec = *s;
    } else if (auto tbl = node.as_table()) {
        if (auto v = (*tbl)["source"].value<std::string>()) source_spec = *v;
        if (auto v = (*tbl)["version"].value<std::string>()) ref.constraint = *v;
    } else {
        return StacyError{StacyError::Manifest,
            "package '" + name + "' must be a source string or a table",
            "e.g. " + name + " = \"ssc\" or " + name +
            " = { source = \"ssc\", version = \">=20230101\" }"};
    }

    auto src = PackageSource::parse(source_spec);
    if (src.is_err()) {
        return std::move(src).context("package '" + name + "'").error();
    }
    ref.source = std::move(src).value();

    auto status = ref.validate();
    if (status.is_err()) return std::move(status).error();

    return Result<PackageRef>::ok(std::move(ref));
}

static Result<TaskDef> parse_task(const std::string& name, const toml::node& node) {
    TaskDef task;
    task.name = name;

    if (auto s = node.value<std::string>()) {
        task.kind = TaskDef::Kind::Script;
        task.script = *s;
    } else if (auto arr = node.as_array()) {
        task.kind = TaskDef::Kind::Sequence;
        task.steps = string_array(*arr);
    } else if (auto tbl = node.as_table()) {
        if (auto v = (*tbl)["description"].value<std::string>()) task.description = *v;

        if (auto par = (*tbl)["parallel"].as_array()) {
            task.kind = TaskDef::Kind::Parallel;
            task.steps = string_array(*par);
        } else if (auto seq = (*tbl)["sequence"].as_array()) {
            task.kind = TaskDef::Kind::Sequence;
            task.steps = string_array(*seq);
        } else if (auto script = (*tbl)["script"].value<std::string>()) {
            task.kind = TaskDef::Kind::Script;
            task.script = *script;
            if (auto args = (*tbl)["args"].as_table()) {
                for (const auto& [k, v] : *args) {
                    task.args[std::string(k.str())] = scalar_to_string(v);
                }
            }
        } else {
            return StacyError{StacyError::Manifest,
                "task '" + name + "' needs one of: script, parallel, sequence"};
        }
    } else {
        return StacyError{StacyError::Manifest,
            "task '" + name + "' must be a string, an array or a table"};
    }

    if (task.kind == TaskDef::Kind::Script && task.script.empty()) {
        return StacyError{StacyError::Manifest,
            "task '" + name + "' has an empty script path"};
    }
    if (task.kind != TaskDef::Kind::Script && task.steps.empty()) {
        return StacyError{StacyError::Manifest,
            "task '" + name + "' has no steps"};
    }
    return Result<TaskDef>::ok(std::move(task));
}

// TOML basic string with escapes, as toml++ writes it
static std::string quote(const std::string& s) {
    std::ostringstream ss;
    ss << toml::value<std::string>(s);
    return ss.str();
}

static std::string key(const std::string& k) {
    bool bare = !k.empty();
    for (char c : k) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            bare = false;
            break;
        }
    }
    return bare ? k : quote(k);
}

// ---------------------------------------------------------------------------
// Manifest::parse
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StacyError{StacyError::Parse,
            std::string("TOML parse error: ") + std::string(e.description()),
            "", "stacy.toml",
            static_cast<int>(e.source().begin.line)};
    }

    Manifest m;

    // [project] section
    if (auto proj = doc["project"].as_table()) {
        if (auto v = (*proj)["name"].value<std::string>()) m.project.name = *v;
        if (auto v = (*proj)["description"].value<std::string>()) m.project.description = *v;
        if (auto v = (*proj)["url"].value<std::string>()) m.project.url = *v;
        if (auto arr = (*proj)["authors"].as_array()) {
            m.project.authors = string_array(*arr);
        }
    }

    // [packages.<group>] sections
    if (auto pkgs = doc["packages"].as_table()) {
        for (const auto& [gkey, gval] : *pkgs) {
            std::string gname(gkey.str());
            auto group = parse_group(gname);
            if (group.is_err()) {
                return StacyError{StacyError::Manifest,
                    "unknown package group [packages." + gname + "]",
                    "expected [packages.dependencies], [packages.dev] or [packages.test]"};
            }
            auto gtbl = gval.as_table();
            if (!gtbl) {
                return StacyError{StacyError::Manifest,
                    "[packages." + gname + "] must be a table"};
            }
            for (const auto& [pkey, pval] : *gtbl) {
                auto ref = parse_package(std::string(pkey.str()), pval, group.value());
                if (ref.is_err()) return std::move(ref).error();
                if (m.find_package(ref.value().name)) {
                    return StacyError{StacyError::Duplicate,
                        "package '" + ref.value().name + "' is declared more than once",
                        "a package belongs to exactly one group"};
                }
                m.packages.push_back(std::move(ref).value());
            }
        }
    }

    // [scripts] section
    if (auto scripts = doc["scripts"].as_table()) {
        for (const auto& [k, v] : *scripts) {
            auto task = parse_task(std::string(k.str()), v);
            if (task.is_err()) return std::move(task).error();
            m.tasks[task.value().name] = std::move(task).value();
        }
    }

    // [run] section
    if (auto run = doc["run"].as_table()) {
        if (auto v = (*run)["log_dir"].value<std::string>()) m.run.log_dir = *v;
        if (auto v = (*run)["jobs"].value<int64_t>()) {
            if (*v < 1) {
                return StacyError{StacyError::Manifest, "[run] jobs must be at least 1"};
            }
            m.run.jobs = static_cast<int>(*v);
        }
        if (auto v = (*run)["timeout_seconds"].value<int64_t>()) {
            if (*v < 0) {
                return StacyError{StacyError::Manifest,
                    "[run] timeout_seconds must not be negative"};
            }
            m.run.timeout_seconds = static_cast<int>(*v);
        }
        if (auto v = (*run)["allow_global"].value<bool>()) m.run.allow_global = *v;
    }

    return Result<Manifest>::ok(std::move(m));
}

Result<Manifest> Manifest::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return StacyError{StacyError::NotFound,
            "cannot open manifest: " + path,
            "run 'stacy init' or create stacy.toml in the project root"};
    }
    std::stringstream buf;
    buf << in.rdbuf();
    auto r = parse(buf.str());
    if (r.is_err()) r.error().file = path;
    return r;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string Manifest::to_toml() const {
    std::ostringstream out;

    out << "[project]\n";
    out << "name = " << quote(project.name) << "\n";
    if (!project.description.empty())
        out << "description = " << quote(project.description) << "\n";
    if (!project.url.empty())
        out << "url = " << quote(project.url) << "\n";
    if (!project.authors.empty()) {
        out << "authors = [";
        for (size_t i = 0; i < project.authors.size(); i++) {
            if (i) out << ", ";
            out << quote(project.authors[i]);
        }
        out << "]\n";
    }

    for (auto g : {DependencyGroup::Default, DependencyGroup::Dev, DependencyGroup::Test}) {
        auto refs = packages_in(g);
        if (refs.empty()) continue;
        out << "\n[packages." << group_name(g) << "]\n";
        for (const auto* r : refs) {
            out << key(r->name) << " = ";
            if (r->constraint.empty()) {
                out << quote(r->source.to_string()) << "\n";
            } else {
                out << "{ source = " << quote(r->source.to_string())
                    << ", version = " << quote(r->constraint) << " }\n";
            }
        }
    }

    if (!tasks.empty()) {
        out << "\n[scripts]\n";
        for (const auto& [name, t] : tasks) {
            out << key(name) << " = ";
            auto steps = [&](const char* field) {
                std::ostringstream s;
                if (field) s << field << " = ";
                s << "[";
                for (size_t i = 0; i < t.steps.size(); i++) {
                    if (i) s << ", ";
                    s << quote(t.steps[i]);
                }
                s << "]";
                return s.str();
            };
            switch (t.kind) {
                case TaskDef::Kind::Script:
                    if (t.args.empty() && t.description.empty()) {
                        out << quote(t.script);
                    } else {
                        out << "{ script = " << quote(t.script);
                        if (!t.args.empty()) {
                            out << ", args = {";
                            bool first = true;
                            for (const auto& [k, v] : t.args) {
                                out << (first ? " " : ", ") << key(k) << " = " << quote(v);
                                first = false;
                            }
                            out << " }";
                        }
                        if (!t.description.empty())
                            out << ", description = " << quote(t.description);
                        out << " }";
                    }
                    break;
                case TaskDef::Kind::Sequence:
                    if (t.description.empty()) {
                        out << steps(nullptr);
                    } else {
                        out << "{ " << steps("sequence")
                            << ", description = " << quote(t.description) << " }";
                    }
                    break;
                case TaskDef::Kind::Parallel:
                    out << "{ " << steps("parallel");
                    if (!t.description.empty())
                        out << ", description = " << quote(t.description);
                    out << " }";
                    break;
            }
            out << "\n";
        }
    }

    if (run.log_dir || run.jobs || run.timeout_seconds || run.allow_global) {
        out << "\n[run]\n";
        if (run.log_dir) out << "log_dir = " << quote(*run.log_dir) << "\n";
        if (run.jobs) out << "jobs = " << *run.jobs << "\n";
        if (run.timeout_seconds) out << "timeout_seconds = " << *run.timeout_seconds << "\n";
        if (run.allow_global) out << "allow_global = " << (*run.allow_global ? "true" : "false") << "\n";
    }

    return out.str();
}

Status Manifest::save(const std::string& path) const {
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return StacyError{StacyError::IO, "cannot write manifest: " + path};
        }
        out << to_toml();
        if (!out.good()) {
            return StacyError{StacyError::IO, "failed writing manifest: " + path};
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        return StacyError{StacyError::IO, "cannot replace manifest: " + path};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Queries and edits
// ---------------------------------------------------------------------------

const PackageRef* Manifest::find_package(const std::string& name) const {
    std::string lc = lowercase(name);
    for (const auto& p : packages) {
        if (lowercase(p.name) == lc) return &p;
    }
    return nullptr;
}

std::vector<const PackageRef*> Manifest::packages_in(DependencyGroup g) const {
    std::vector<const PackageRef*> out;
    for (const auto& p : packages) {
        if (p.group == g) out.push_back(&p);
    }
    return out;
}

Status Manifest::add_package(PackageRef ref) {
    STACY_TRY(ref.validate());
    std::string lc = lowercase(ref.name);
    for (auto& p : packages) {
        if (lowercase(p.name) == lc) {
            p = std::move(ref);
            return ok_status();
        }
    }
    packages.push_back(std::move(ref));
    return ok_status();
}

bool Manifest::remove_package(const std::string& name) {
    std::string lc = lowercase(name);
    auto it = std::remove_if(packages.begin(), packages.end(),
        [&](const PackageRef& p) { return lowercase(p.name) == lc; });
    if (it == packages.end()) return false;
    packages.erase(it, packages.end());
    return true;
}

std::string Manifest::dependency_hash() const {
    std::vector<std::string> lines;
    lines.reserve(packages.size());
    for (const auto& p : packages) {
        lines.push_back(std::string(group_name(p.group)) + ":" + lowercase(p.name) +
                        "=" + p.source.to_string() + "@" + p.constraint);
    }
    std::sort(lines.begin(), lines.end());

    SHA256 h;
    for (const auto& l : lines) {
        h.update(l);
        h.update("\n");
    }
    return h.finalize_hex();
}

} // namespace stacy
