#include <restorenom/project.hpp>
#include <restorenom/path.hpp>

namespace restorenom {

Result<ProjectContext> ProjectContext::from_path(const std::string& project_path) {
    if (project_path.empty()) {
        return RestoreError{RestoreError::InvalidArg, "project path is empty"};
    }
    if (!path::is_rooted(project_path)) {
        return RestoreError{RestoreError::InvalidArg,
            "project path is not rooted: " + project_path,
            "give the full path of the project file"};
    }

    std::string full = path::normalize(project_path);
    std::string dir = path::parent_directory(full);
    if (dir == full) {
        return RestoreError{RestoreError::InvalidArg,
            "project path names a root, not a project file: " + project_path};
    }

    ProjectContext ctx;
    ctx.full_path = std::move(full);
    ctx.directory = std::move(dir);
    return Result<ProjectContext>::ok(std::move(ctx));
}

std::string ProjectContext::make_rooted(const std::string& relative_path) const {
    return path::make_rooted(directory, relative_path);
}

} // namespace restorenom
