#pragma once

#include <restorenom/result.hpp>
#include <restorenom/project.hpp>
#include <restorenom/restore/project_update.hpp>
#include <restorenom/restore/restore_info.hpp>
#include <optional>
#include <string>
#include <vector>

namespace restorenom {

// Merges the updates of all configurations of one project into a single
// restore info.
//
// Updates are folded in order and the first one wins: the first update
// defining MSBuildProjectExtensionsPath / TargetFrameworks supplies those
// values, and the first update for a target framework supplies its
// references and properties. Later updates for the same framework are
// dropped without comparing their content. Tool references are merged
// across all updates by name.
//
// Returns an empty optional, meaning no restore should be nominated, when
// none of the updates has a difference or when no update yields a target
// framework moniker. Fails with a Contract error when an update lacks one of
// the restore schemas.
Result<std::optional<ProjectRestoreInfo>> build_restore_info(
    const std::vector<ProjectUpdate>& updates,
    const ProjectContext& project);

// TargetFramework dimension of the configuration, else the TargetFramework
// restore property, else ""
std::string target_framework_of(const ProjectUpdate& update,
                                const PropertyBag& restore_properties);

ReferenceItems make_references(const ItemList& items);

// make_references plus a ProjectFileFullPath property on every item
ReferenceItems make_project_references(const ItemList& items,
                                       const ProjectContext& project);

// Roots a project reference against its DefiningProjectDirectory metadata,
// or against the referencing project's directory if it has none
std::string project_file_full_path(const std::string& reference,
                                   const PropertyBag& metadata,
                                   const ProjectContext& project);

} // namespace restorenom
