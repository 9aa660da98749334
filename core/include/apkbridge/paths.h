#pragma once
#include <filesystem>
#include <string>

namespace apkbridge {

// Absolute path with symlinks and "."/".." resolved for the part that exists.
// Two spellings of the same file map to the same string.
std::string canonical_path(const std::string& p);

// True if p resolves to root or something below it.
bool is_path_under(const std::filesystem::path& p, const std::filesystem::path& root);

// Resolve `rel` against `root` and confirm the result stays inside root,
// following symlinks for every existing component. Throws ToolError:
// InvalidArguments for an empty path, PathTraversal when it escapes.
// The check does not depend on whether the target exists.
std::filesystem::path resolve_inside(const std::filesystem::path& root, const std::string& rel);

// p relative to root with '/' separators.
std::string relative_generic(const std::filesystem::path& p, const std::filesystem::path& root);

} // namespace apkbridge
