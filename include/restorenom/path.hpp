#pragma once

#include <string>

// Lexical path helpers for MSBuild-style paths. Both '/' and '\' are
// separators regardless of host platform, and "C:\" drive roots are
// recognized on every platform. Nothing here touches the filesystem.
namespace restorenom::path {

bool is_separator(char c);

// "/x", "\x", "\\server\share", "C:\x", "C:/x"
bool is_rooted(const std::string& p);

// Separator style of p: the first separator it contains, '/' if none
char preferred_separator(const std::string& p);

// Strips trailing separators, except the one completing a root ("/", "C:\")
std::string trim_trailing_separators(const std::string& p);

// Collapses "." and ".." and repeated separators; ".." never climbs above
// the root of a rooted path. Output uses the separator style of p.
std::string normalize(const std::string& p);

// Rooted paths are only normalized; otherwise path is appended to base_dir.
// An empty base_dir leaves p relative.
// The output follows base_dir's separator style.
std::string make_rooted(const std::string& base_dir, const std::string& p);

// Directory portion of a file path ("" if there is none)
std::string parent_directory(const std::string& p);

} // namespace restorenom::path
