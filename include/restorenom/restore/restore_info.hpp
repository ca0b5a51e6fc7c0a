#pragma once

#include <restorenom/ordered_map.hpp>
#include <string>

namespace restorenom {

// A project, package or tool reference as handed to the restore engine
struct ReferenceItem {
    std::string name;        // project path or package id
    PropertyBag properties;  // item metadata

    bool operator==(const ReferenceItem& other) const {
        return name == other.name && properties == other.properties;
    }
    bool operator!=(const ReferenceItem& other) const { return !(*this == other); }
};

// Keyed by item name; first item with a given name wins
using ReferenceItems = OrderedMap<ReferenceItem>;

struct TargetFrameworkInfo {
    std::string target_framework_moniker;  // e.g. "net7.0"
    ReferenceItems project_references;     // carry ProjectFileFullPath
    ReferenceItems package_references;
    PropertyBag properties;

    bool operator==(const TargetFrameworkInfo& other) const {
        return target_framework_moniker == other.target_framework_moniker &&
               project_references == other.project_references &&
               package_references == other.package_references &&
               properties == other.properties;
    }
    bool operator!=(const TargetFrameworkInfo& other) const { return !(*this == other); }
};

// Keyed by moniker, in first-seen order
using TargetFrameworks = OrderedMap<TargetFrameworkInfo>;

// Consolidated restore data for one project, nominated to the restore engine
struct ProjectRestoreInfo {
    // Holds MSBuildProjectExtensionsPath; the restore engine reads its
    // generated props/targets from there rather than from
    // BaseIntermediateOutputPath, which is often set too late.
    std::string base_intermediate_path;
    std::string original_target_frameworks;  // unsplit, e.g. "net6.0;net7.0"
    TargetFrameworks target_frameworks;
    ReferenceItems tool_references;          // project-wide

    bool operator==(const ProjectRestoreInfo& other) const {
        return base_intermediate_path == other.base_intermediate_path &&
               original_target_frameworks == other.original_target_frameworks &&
               target_frameworks == other.target_frameworks &&
               tool_references == other.tool_references;
    }
    bool operator!=(const ProjectRestoreInfo& other) const { return !(*this == other); }
};

// Indented, human-readable dump
std::string describe(const ProjectRestoreInfo& info);

// TOML document; references are arrays so their order survives. Property
// bags are written as TOML tables, which list their keys sorted by name, so
// property insertion order is not preserved.
std::string to_toml(const ProjectRestoreInfo& info);

} // namespace restorenom
