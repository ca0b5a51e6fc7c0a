#pragma once

#include <restorenom/result.hpp>
#include <restorenom/ordered_map.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace restorenom {

// Schema names of the changes a restore update always carries
namespace schema {
inline const std::string NuGetRestore = "NuGetRestore";
inline const std::string ProjectReference = "ProjectReference";
inline const std::string PackageReference = "PackageReference";
inline const std::string DotNetCliToolReference = "DotNetCliToolReference";
} // namespace schema

// Restore-relevant property and metadata names
namespace property {
inline const std::string MSBuildProjectExtensionsPath = "MSBuildProjectExtensionsPath";
inline const std::string TargetFrameworks = "TargetFrameworks";
inline const std::string TargetFramework = "TargetFramework";
inline const std::string DefiningProjectDirectory = "DefiningProjectDirectory";
inline const std::string ProjectFileFullPath = "ProjectFileFullPath";
} // namespace property

// item name -> item metadata
using ItemList = OrderedMap<PropertyBag>;

// One side (before or after) of an evaluated rule
struct ProjectSnapshot {
    PropertyBag properties;
    ItemList items;

    bool operator==(const ProjectSnapshot& other) const {
        return properties == other.properties && items == other.items;
    }
    bool operator!=(const ProjectSnapshot& other) const { return !(*this == other); }
};

struct ProjectChangeDiff {
    std::vector<std::string> added_items;
    std::vector<std::string> removed_items;
    std::vector<std::string> changed_items;       // metadata differs
    std::vector<std::string> changed_properties;  // added, removed or new value

    bool any_changes() const;

    // Names are reported in after-order, then before-order for removals
    static ProjectChangeDiff compute(const ProjectSnapshot& before,
                                     const ProjectSnapshot& after);
};

struct ProjectChangeDescription {
    ProjectSnapshot before;
    ProjectSnapshot after;
    ProjectChangeDiff difference;

    // Difference computed from the two snapshots
    static ProjectChangeDescription between(ProjectSnapshot before, ProjectSnapshot after);
};

struct ProjectConfiguration {
    std::string name;        // e.g. "Debug|AnyCPU|net6.0"
    PropertyBag dimensions;  // e.g. TargetFramework = net6.0
};

// A versioned snapshot of one project configuration's restore rules
struct ProjectUpdate {
    uint64_t version = 0;
    ProjectConfiguration configuration;
    OrderedMap<ProjectChangeDescription> changes;  // keyed by schema name

    // True if any change, of any schema, has a difference
    bool any_changes() const;

    // Contract error if the upstream subscription did not supply the schema
    Result<const ProjectChangeDescription*> require_change(const std::string& schema_name) const;
};

} // namespace restorenom
