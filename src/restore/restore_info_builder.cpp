#include <restorenom/restore/restore_info_builder.hpp>
#include <restorenom/log.hpp>
#include <restorenom/path.hpp>
#include <algorithm>

namespace restorenom {

// ---------------------------------------------------------------------------
// Item conversion
// ---------------------------------------------------------------------------

ReferenceItems make_references(const ItemList& items) {
    ReferenceItems refs;
    for (const auto& [name, metadata] : items) {
        refs.insert(name, ReferenceItem{name, metadata});
    }
    return refs;
}

std::string project_file_full_path(const std::string& reference,
                                   const PropertyBag& metadata,
                                   const ProjectContext& project) {
    if (const std::string* defining_dir = metadata.find(property::DefiningProjectDirectory)) {
        std::string base = path::trim_trailing_separators(*defining_dir);
        // An empty directory stands for the separator root
        if (base.empty()) base = std::string(1, path::preferred_separator(project.directory));
        return path::make_rooted(base, reference);
    }
    return project.make_rooted(reference);
}

ReferenceItems make_project_references(const ItemList& items,
                                       const ProjectContext& project) {
    ReferenceItems refs;
    for (const auto& [name, metadata] : items) {
        PropertyBag properties = metadata;
        properties.insert_or_assign(property::ProjectFileFullPath,
                                    project_file_full_path(name, metadata, project));
        refs.insert(name, ReferenceItem{name, std::move(properties)});
    }
    return refs;
}

std::string target_framework_of(const ProjectUpdate& update,
                                const PropertyBag& restore_properties) {
    const std::string* tfm = update.configuration.dimensions.find(property::TargetFramework);
    if (!tfm) {
        tfm = restore_properties.find(property::TargetFramework);
    }
    return tfm ? *tfm : std::string();
}

// ---------------------------------------------------------------------------
// build_restore_info
// ---------------------------------------------------------------------------

static Result<TargetFrameworkInfo> make_target_framework(const std::string& moniker,
                                                         const ProjectUpdate& update,
                                                         const PropertyBag& restore_properties,
                                                         const ProjectContext& project) {
    auto project_refs = update.require_change(schema::ProjectReference);
    RESTORENOM_TRY(project_refs);

    auto package_refs = update.require_change(schema::PackageReference);
    RESTORENOM_TRY(package_refs);

    TargetFrameworkInfo tfm;
    tfm.target_framework_moniker = moniker;
    tfm.project_references = make_project_references(project_refs.value()->after.items, project);
    tfm.package_references = make_references(package_refs.value()->after.items);
    tfm.properties = restore_properties;
    return Result<TargetFrameworkInfo>::ok(std::move(tfm));
}

Result<std::optional<ProjectRestoreInfo>> build_restore_info(
    const std::vector<ProjectUpdate>& updates,
    const ProjectContext& project)
{
    using BuildResult = Result<std::optional<ProjectRestoreInfo>>;

    bool any_changes = std::any_of(updates.begin(), updates.end(),
        [](const ProjectUpdate& u) { return u.any_changes(); });
    if (!any_changes) {
        log::debug("%s: no restore changes in %zu update(s)",
                   project.full_path.c_str(), updates.size());
        return BuildResult::ok(std::nullopt);
    }

    std::optional<std::string> extensions_path;
    std::optional<std::string> original_target_frameworks;
    TargetFrameworks target_frameworks;
    ReferenceItems tool_references;

    for (const auto& update : updates) {
        auto restore = update.require_change(schema::NuGetRestore);
        RESTORENOM_TRY(restore);
        const PropertyBag& restore_properties = restore.value()->after.properties;

        if (!extensions_path) {
            extensions_path = restore_properties.try_get(property::MSBuildProjectExtensionsPath);
        }
        if (!original_target_frameworks) {
            original_target_frameworks = restore_properties.try_get(property::TargetFrameworks);
        }

        std::string moniker = target_framework_of(update, restore_properties);
        if (moniker.empty()) {
            log::warn("unable to find TargetFramework property for configuration '%s'",
                      update.configuration.name.c_str());
        } else if (target_frameworks.contains(moniker)) {
            log::debug("%s: target framework '%s' already recorded, ignoring configuration '%s'",
                       project.full_path.c_str(), moniker.c_str(),
                       update.configuration.name.c_str());
        } else {
            auto tfm = make_target_framework(moniker, update, restore_properties, project);
            RESTORENOM_TRY(tfm);
            target_frameworks.insert(moniker, std::move(tfm).value());
        }

        auto tools = update.require_change(schema::DotNetCliToolReference);
        RESTORENOM_TRY(tools);
        for (const auto& [name, metadata] : tools.value()->after.items) {
            tool_references.insert(name, ReferenceItem{name, metadata});
        }
    }

    if (target_frameworks.empty()) {
        log::debug("%s: no target framework found, nothing to nominate",
                   project.full_path.c_str());
        return BuildResult::ok(std::nullopt);
    }

    ProjectRestoreInfo info;
    info.base_intermediate_path = extensions_path.value_or(std::string());
    info.original_target_frameworks = original_target_frameworks.value_or(std::string());
    info.target_frameworks = std::move(target_frameworks);
    info.tool_references = std::move(tool_references);

    log::debug("%s: nominating restore for %zu target framework(s)",
               project.full_path.c_str(), info.target_frameworks.size());
    if (log::get_level() <= log::Debug) {
        log::debug("%s", describe(info).c_str());
    }
    return BuildResult::ok(std::move(info));
}

} // namespace restorenom
