#pragma once

#include <restorenom/result.hpp>
#include <string>

namespace restorenom {

// The project being restored. Immutable once created.
struct ProjectContext {
    std::string full_path;  // rooted path of the project file
    std::string directory;  // directory containing the project file

    // Fails with InvalidArg unless project_path is a rooted file path
    static Result<ProjectContext> from_path(const std::string& project_path);

    // Roots a path relative to the project directory
    std::string make_rooted(const std::string& relative_path) const;
};

} // namespace restorenom
