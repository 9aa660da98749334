#include "apkbridge/paths.h"
#include "apkbridge/json_util.h"
#include "apkbridge/types.h"

namespace apkbridge {

namespace fs = std::filesystem;

std::string canonical_path(const std::string& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(p), ec);
    if (ec) return fs::path(p).lexically_normal().string();
    fs::path canon = fs::weakly_canonical(abs, ec);
    if (ec) return abs.lexically_normal().string();
    std::string s = canon.string();
    // "dir/" and "dir" are one workspace
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

bool is_path_under(const fs::path& p, const fs::path& root) {
    std::error_code ec;
    auto rp = fs::weakly_canonical(p, ec);
    if (ec) return false;
    auto rr = fs::weakly_canonical(root, ec);
    if (ec) return false;
    auto ps = rp.generic_string();
    auto rs = rr.generic_string();
    while (ps.size() > 1 && ps.back() == '/') ps.pop_back();
    while (rs.size() > 1 && rs.back() == '/') rs.pop_back();
    if (ps == rs) return true;
    if (!rs.empty() && rs.back() != '/') rs.push_back('/');
    return ps.rfind(rs, 0) == 0;
}

fs::path resolve_inside(const fs::path& root, const std::string& rel) {
    if (rel.empty()) {
        throw ToolError(ErrorKind::InvalidArguments, "empty relative path",
                        "{\"fields\":[{\"name\":\"relative_path\",\"problem\":\"must not be empty\"}]}");
    }
    fs::path target = root / fs::path(rel);
    if (!is_path_under(target, root)) {
        throw ToolError(ErrorKind::PathTraversal, "path escapes the project directory: " + rel,
                        "{\"relative_path\":" + json_util::json_quote(rel) + "}");
    }
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(target, ec);
    if (ec) {
        throw ToolError(ErrorKind::IoError, "cannot resolve " + rel + ": " + ec.message());
    }
    return resolved;
}

std::string relative_generic(const fs::path& p, const fs::path& root) {
    return p.lexically_relative(root).generic_string();
}

} // namespace apkbridge
