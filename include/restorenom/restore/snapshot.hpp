#pragma once

#include <restorenom/result.hpp>
#include <restorenom/project.hpp>
#include <restorenom/restore/project_update.hpp>
#include <string>
#include <vector>

namespace restorenom {

// A recorded batch of project updates, as written in an update snapshot
// TOML file:
//
//   [project]
//   path = "/src/App/App.csproj"
//
//   [[updates]]
//   version = 4
//   configuration = "Debug|AnyCPU|net6.0"
//   dimensions = { TargetFramework = "net6.0" }
//
//     [[updates.changes]]
//     schema = "PackageReference"
//     after.items = [ { name = "Newtonsoft.Json", metadata = { Version = "13.0.1" } } ]
//
// Each change may have `before` and `after` tables holding `properties`
// (a table) and `items` (an array, kept in file order). TOML tables do not
// keep key order, so properties and dimensions are loaded sorted by name.
// The difference of a change is computed from the two sides.
struct UpdateSnapshot {
    ProjectContext project;
    std::vector<ProjectUpdate> updates;

    static Result<UpdateSnapshot> parse(const std::string& toml_str);
    static Result<UpdateSnapshot> load(const std::string& path);
};

} // namespace restorenom
