#include <stacy/lock_manager.hpp>
#include <stacy/log.hpp>
#include <stacy/version.hpp>

namespace stacy {

std::set<DependencyGroup> all_groups() {
    return {DependencyGroup::Default, DependencyGroup::Dev, DependencyGroup::Test};
}

Result<LockFile> LockManager::generate(const Manifest& manifest,
                                       const std::optional<LockFile>& existing,
                                       const GenerateOptions& options) {
    std::set<std::string> update;
    for (const auto& n : options.update) update.insert(lowercase(n));

    LockFile lf;
    lf.stacy_version = STACY_VERSION;
    lf.manifest_hash = manifest.dependency_hash();

    for (const auto& ref : manifest.packages) {
        const LockedPackage* hint = nullptr;
        if (existing && !options.update_all && !update.count(lowercase(ref.name))) {
            hint = existing->find(ref.name);
        }
        auto pkg = resolver_.resolve(ref, hint);
        if (pkg.is_err()) {
            return std::move(pkg).context("resolving '" + ref.name + "'").error();
        }
        log::info("locked %s@%s", ref.name.c_str(), pkg.value().version.c_str());
        lf.packages.push_back(pkg.value().to_locked());
    }

    lf.sort();
    return Result<LockFile>::ok(std::move(lf));
}

Result<LockCheck> LockManager::verify(const Manifest& manifest, const LockFile& lock,
                                      bool probe_changes) {
    LockCheck check;
    check.manifest_hash = manifest.dependency_hash();
    check.locked_hash = lock.manifest_hash;
    check.hash_matches = check.manifest_hash == check.locked_hash;

    auto probe = [&](const PackageRef& ref, LockChange& change) {
        if (!probe_changes) return;
        auto r = resolver_.probe(ref);
        if (r.is_ok()) {
            change.wanted_version = r.value().version;
        } else {
            change.detail = r.error().message;
        }
    };

    for (const auto& ref : manifest.packages) {
        const LockedPackage* locked = lock.find(ref.name);
        if (!locked) {
            LockChange c;
            c.kind = LockChange::Kind::Added;
            c.name = ref.name;
            c.detail = "declared in stacy.toml but not locked";
            probe(ref, c);
            check.changes.push_back(std::move(c));
            continue;
        }

        LockChange c;
        c.kind = LockChange::Kind::Changed;
        c.name = ref.name;
        c.locked_version = locked->version;

        std::string source = ref.source.to_string();
        if (locked->source != source) {
            c.reason = "source";
            c.detail = "locked from " + locked->source + ", declared " + source;
        } else if (!version_satisfies(locked->version, ref.constraint)) {
            c.reason = "constraint";
            c.detail = "locked " + locked->version + " does not satisfy '" +
                       ref.constraint + "'";
        } else if (locked->group != group_name(ref.group)) {
            c.reason = "group";
            c.detail = "locked in " + locked->group + ", declared in " +
                       std::string(group_name(ref.group));
        } else {
            // The hint satisfies the declaration, so the manifest resolves to it
            continue;
        }
        if (c.reason != "group") probe(ref, c);
        check.changes.push_back(std::move(c));
    }

    for (const auto& locked : lock.packages) {
        if (!manifest.find_package(locked.name)) {
            LockChange c;
            c.kind = LockChange::Kind::Removed;
            c.name = locked.name;
            c.locked_version = locked.version;
            c.detail = "locked but no longer declared";
            check.changes.push_back(std::move(c));
        }
    }

    return Result<LockCheck>::ok(std::move(check));
}

Result<std::vector<ResolvedPackage>> LockManager::install(
    const LockFile& lock, const std::set<DependencyGroup>& groups)
{
    std::vector<ResolvedPackage> out;
    for (const auto& locked : lock.packages) {
        auto group = parse_group(locked.group);
        if (group.is_err()) return std::move(group).error();
        if (!groups.count(group.value())) continue;

        auto pkg = resolver_.install(locked);
        if (pkg.is_err()) {
            return std::move(pkg).context("installing '" + locked.name + "'").error();
        }
        out.push_back(std::move(pkg).value());
    }
    return Result<std::vector<ResolvedPackage>>::ok(std::move(out));
}

Result<std::vector<OutdatedEntry>> LockManager::outdated(const Manifest& manifest,
                                                         const LockFile& lock) {
    std::vector<OutdatedEntry> out;
    for (const auto& ref : manifest.packages) {
        const LockedPackage* locked = lock.find(ref.name);
        if (!locked) continue;

        PackageRef latest_ref = ref;
        latest_ref.constraint.clear();
        if (latest_ref.source.kind == SourceKind::Repository) {
            // Newest tag, or the default tip when the repository has none
            latest_ref.source.ref.reset();
            latest_ref.constraint = ">=0";
        }

        auto latest = resolver_.probe(latest_ref);
        if (latest.is_err() && latest_ref.source.kind == SourceKind::Repository &&
            latest.error().code == StacyError::Version) {
            latest_ref.constraint.clear();
            latest = resolver_.probe(latest_ref);
        }

        OutdatedEntry e;
        e.name = ref.name;
        e.locked = locked->version;
        if (latest.is_err()) {
            e.error = latest.error().message;
            out.push_back(std::move(e));
            continue;
        }
        e.latest = latest.value().version;
        if (e.latest == e.locked) continue;
        e.constrained = !version_satisfies(e.latest, ref.constraint);
        out.push_back(std::move(e));
    }
    return Result<std::vector<OutdatedEntry>>::ok(std::move(out));
}

} // namespace stacy
