#include <restorenom/restore/project_update.hpp>

namespace restorenom {

// ---------------------------------------------------------------------------
// ProjectChangeDiff
// ---------------------------------------------------------------------------

bool ProjectChangeDiff::any_changes() const {
    return !added_items.empty() || !removed_items.empty() ||
           !changed_items.empty() || !changed_properties.empty();
}

ProjectChangeDiff ProjectChangeDiff::compute(const ProjectSnapshot& before,
                                             const ProjectSnapshot& after) {
    ProjectChangeDiff diff;

    for (const auto& [name, value] : after.properties) {
        const std::string* old = before.properties.find(name);
        if (!old || *old != value) {
            diff.changed_properties.push_back(name);
        }
    }
    for (const auto& [name, value] : before.properties) {
        if (!after.properties.contains(name)) {
            diff.changed_properties.push_back(name);
        }
    }

    for (const auto& [name, metadata] : after.items) {
        const PropertyBag* old = before.items.find(name);
        if (!old) {
            diff.added_items.push_back(name);
        } else if (*old != metadata) {
            diff.changed_items.push_back(name);
        }
    }
    for (const auto& [name, metadata] : before.items) {
        if (!after.items.contains(name)) {
            diff.removed_items.push_back(name);
        }
    }

    return diff;
}

// ---------------------------------------------------------------------------
// ProjectChangeDescription
// ---------------------------------------------------------------------------

ProjectChangeDescription ProjectChangeDescription::between(ProjectSnapshot before,
                                                           ProjectSnapshot after) {
    ProjectChangeDescription change;
    change.difference = ProjectChangeDiff::compute(before, after);
    change.before = std::move(before);
    change.after = std::move(after);
    return change;
}

// ---------------------------------------------------------------------------
// ProjectUpdate
// ---------------------------------------------------------------------------

bool ProjectUpdate::any_changes() const {
    for (const auto& [name, change] : changes) {
        if (change.difference.any_changes()) return true;
    }
    return false;
}

Result<const ProjectChangeDescription*> ProjectUpdate::require_change(
    const std::string& schema_name) const
{
    const ProjectChangeDescription* change = changes.find(schema_name);
    if (!change) {
        return RestoreError{RestoreError::Contract,
            "update for configuration '" + configuration.name +
            "' has no '" + schema_name + "' change",
            "the project subscription must supply every restore rule"};
    }
    return Result<const ProjectChangeDescription*>::ok(change);
}

} // namespace restorenom
