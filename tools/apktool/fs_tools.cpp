#include "apkbridge/json_util.h"
#include "apkbridge/paths.h"
#include "apkbridge/tools.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include <fnmatch.h>
#include <fcntl.h>
#include <unistd.h>

namespace apkbridge {

namespace fs = std::filesystem;

namespace {

const char* b64_table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string b64_encode(const std::string& in) {
    std::string out;
    out.reserve(((in.size() + 2) / 3) * 4);
    size_t i = 0;
    while (i + 2 < in.size()) {
        uint32_t triple = ((uint32_t)(uint8_t)in[i] << 16) | ((uint32_t)(uint8_t)in[i + 1] << 8) |
                          (uint32_t)(uint8_t)in[i + 2];
        out.push_back(b64_table[(triple >> 18) & 0x3F]);
        out.push_back(b64_table[(triple >> 12) & 0x3F]);
        out.push_back(b64_table[(triple >> 6) & 0x3F]);
        out.push_back(b64_table[triple & 0x3F]);
        i += 3;
    }
    size_t rem = in.size() - i;
    if (rem == 1) {
        uint32_t triple = (uint32_t)(uint8_t)in[i] << 16;
        out.push_back(b64_table[(triple >> 18) & 0x3F]);
        out.push_back(b64_table[(triple >> 12) & 0x3F]);
        out += "==";
    } else if (rem == 2) {
        uint32_t triple = ((uint32_t)(uint8_t)in[i] << 16) | ((uint32_t)(uint8_t)in[i + 1] << 8);
        out.push_back(b64_table[(triple >> 18) & 0x3F]);
        out.push_back(b64_table[(triple >> 12) & 0x3F]);
        out.push_back(b64_table[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

// Length of the longest valid UTF-8 prefix of s.
size_t utf8_valid_prefix(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        unsigned char c = (unsigned char)s[i];
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) len = 4;
        else return i;
        if (i + len > n) return i;
        for (size_t k = 1; k < len; k++) {
            if (((unsigned char)s[i + k] & 0xC0) != 0x80) return i;
        }
        i += len;
    }
    return i;
}

// Text means valid UTF-8 without NUL bytes. A cut multi-byte sequence at
// the end of a truncated read still counts as text.
bool looks_like_text(std::string& buf, bool truncated) {
    if (buf.find('\0') != std::string::npos) return false;
    size_t ok = utf8_valid_prefix(buf);
    if (ok == buf.size()) return true;
    if (truncated && buf.size() - ok < 4) {
        buf.resize(ok);
        return true;
    }
    return false;
}

fs::path project_root(const ToolContext& ctx) {
    return fs::path(ctx.workspace->decode_dir());
}

void check_cancel(const ToolContext& ctx) {
    if (is_cancelled(ctx.cancel)) throw ToolError(ErrorKind::Cancelled, ctx.desc.name + " cancelled by client");
}

// Regular files under dir, relative to root, sorted. Symlinks are skipped so
// nothing outside the project is reached.
std::vector<std::string> walk_files(const ToolContext& ctx, const fs::path& dir, const fs::path& root) {
    std::vector<std::string> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw ToolError(ErrorKind::IoError, "cannot list " + dir.string() + ": " + ec.message());
    }
    size_t seen = 0;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) throw ToolError(ErrorKind::IoError, "cannot list " + dir.string() + ": " + ec.message());
        if ((++seen & 0xFF) == 0) check_cancel(ctx);
        const fs::directory_entry& e = *it;
        std::error_code sec;
        if (e.is_symlink(sec)) continue;
        if (!e.is_regular_file(sec)) continue;
        out.push_back(relative_generic(e.path(), root));
    }
    std::sort(out.begin(), out.end());
    return out;
}

ParamSpec param(const char* name, ParamType t, bool required, const char* desc) {
    ParamSpec p;
    p.name = name;
    p.type = t;
    p.required = required;
    p.description = desc;
    return p;
}

// Files under res/ (or res/<resource_type>/), relative to the project,
// in byte order. Absent res/ yields an empty listing.
std::string tool_list_resources(ToolContext& ctx) {
    const fs::path root = project_root(ctx);
    fs::path dir = root / "res";
    const std::string type = ctx.arg_string("resource_type");
    std::error_code ec;
    if (!type.empty()) {
        dir = resolve_inside(dir, type);
        if (!fs::is_directory(dir, ec)) {
            std::vector<std::string> types;
            for (fs::directory_iterator it(root / "res", ec), end; !ec && it != end; it.increment(ec)) {
                std::error_code dec;
                if (it->is_directory(dec)) types.push_back(it->path().filename().string());
            }
            std::sort(types.begin(), types.end());
            json_util::Doc det(json_object_new_object());
            json_object_object_add(det.root, "resource_type", json_util::new_string(type));
            json_object_object_add(det.root, "available_types", json_util::new_string_array(types));
            throw ToolError(ErrorKind::PathNotFound, "resource type not found: " + type,
                            json_util::to_string(det.root));
        }
    }

    std::vector<std::string> files;
    if (fs::is_directory(dir, ec)) files = walk_files(ctx, dir, root);

    const std::string glob = ctx.arg_string("glob");
    std::vector<std::string> paths;
    bool truncated = false;
    for (const auto& f : files) {
        if (!glob.empty() && ::fnmatch(glob.c_str(), f.c_str(), 0) != 0) continue;
        if (paths.size() >= ctx.config.list_max_entries) {
            truncated = true;
            break;
        }
        paths.push_back(f);
    }

    json_util::Doc res(json_object_new_object());
    json_object_object_add(res.root, "paths", json_util::new_string_array(paths));
    json_object_object_add(res.root, "count", json_object_new_int64((int64_t)paths.size()));
    json_object_object_add(res.root, "truncated", json_object_new_boolean(truncated));
    return json_util::to_string(res.root);
}

std::string tool_read_file(ToolContext& ctx) {
    const fs::path root = project_root(ctx);
    const std::string rel = ctx.arg_string("relative_path");
    const fs::path target = resolve_inside(root, rel);

    std::error_code ec;
    if (!fs::exists(target, ec)) {
        throw ToolError(ErrorKind::PathNotFound, "no such file in project: " + rel,
                        "{\"relative_path\":" + json_util::json_quote(rel) + "}");
    }
    if (!fs::is_regular_file(target, ec)) {
        throw ToolError(ErrorKind::InvalidArguments, "not a regular file: " + rel,
                        "{\"fields\":[{\"name\":\"relative_path\",\"problem\":\"not a regular file\"}]}");
    }

    size_t max_bytes = ctx.config.read_max_bytes;
    int64_t req = ctx.arg_int("max_bytes", 0);
    if (req > 0 && (size_t)req < max_bytes) max_bytes = (size_t)req;

    const uintmax_t size = fs::file_size(target, ec);
    if (ec) throw ToolError(ErrorKind::IoError, "cannot stat " + rel + ": " + ec.message());

    std::ifstream f(target, std::ios::binary);
    if (!f) throw ToolError(ErrorKind::IoError, "cannot open " + rel);
    std::string buf;
    buf.resize((size_t)std::min<uintmax_t>(size, max_bytes));
    f.read(&buf[0], (std::streamsize)buf.size());
    buf.resize((size_t)f.gcount());
    const bool truncated = size > buf.size();

    json_util::Doc res(json_object_new_object());
    json_object_object_add(res.root, "path", json_util::new_string(relative_generic(target, root)));
    if (looks_like_text(buf, truncated)) {
        json_object_object_add(res.root, "content", json_util::new_string(buf));
        json_object_object_add(res.root, "encoding", json_object_new_string("utf-8"));
    } else {
        json_object_object_add(res.root, "content_b64", json_util::new_string(b64_encode(buf)));
        json_object_object_add(res.root, "encoding", json_object_new_string("base64"));
    }
    json_object_object_add(res.root, "bytes", json_object_new_int64((int64_t)buf.size()));
    json_object_object_add(res.root, "size", json_object_new_int64((int64_t)size));
    json_object_object_add(res.root, "truncated", json_object_new_boolean(truncated));
    return json_util::to_string(res.root);
}

// tmp -> fsync -> rename, so readers never see a half-written file.
std::string tool_write_file(ToolContext& ctx) {
    const fs::path root = project_root(ctx);
    const std::string rel = ctx.arg_string("relative_path");
    const std::string content = ctx.arg_string("content");
    const bool mkdirs = ctx.arg_bool("mkdirs", false);
    const bool backup = ctx.arg_bool("create_backup", false);
    const fs::path target = resolve_inside(root, rel);

    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        throw ToolError(ErrorKind::InvalidArguments, "target is a directory: " + rel,
                        "{\"fields\":[{\"name\":\"relative_path\",\"problem\":\"is a directory\"}]}");
    }
    const fs::path parent = target.parent_path();
    if (!fs::is_directory(parent, ec)) {
        if (!mkdirs) {
            throw ToolError(ErrorKind::PathNotFound, "parent directory does not exist: " + relative_generic(parent, root),
                            "{\"relative_path\":" + json_util::json_quote(rel) + "}");
        }
        fs::create_directories(parent, ec);
        if (ec) throw ToolError(ErrorKind::IoError, "cannot create " + parent.string() + ": " + ec.message());
    }

    std::string backup_path;
    if (backup && fs::is_regular_file(target, ec)) {
        backup_path = target.string() + ".bak";
        fs::copy_file(target, backup_path, fs::copy_options::overwrite_existing, ec);
        if (ec) throw ToolError(ErrorKind::IoError, "cannot back up " + rel + ": " + ec.message());
    }

    const std::string tmp_path = target.string() + ".tmp." + std::to_string(std::random_device{}());
    {
        std::ofstream f(tmp_path, std::ios::binary | std::ios::trunc);
        if (!f) throw ToolError(ErrorKind::IoError, "cannot write " + rel);
        f.write(content.data(), (std::streamsize)content.size());
        f.flush();
        if (!f.good()) {
            f.close();
            fs::remove(tmp_path, ec);
            throw ToolError(ErrorKind::IoError, "write failed (I/O error): " + rel);
        }
    }
    int fd = ::open(tmp_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd >= 0) { ::fsync(fd); ::close(fd); }

    std::error_code rename_ec;
    fs::rename(tmp_path, target, rename_ec);
    if (rename_ec) {
        fs::remove(tmp_path, ec);
        throw ToolError(ErrorKind::IoError, "rename failed: " + rename_ec.message());
    }

    json_util::Doc res(json_object_new_object());
    json_object_object_add(res.root, "bytesWritten", json_object_new_int64((int64_t)content.size()));
    json_object_object_add(res.root, "path", json_util::new_string(relative_generic(target, root)));
    if (!backup_path.empty()) {
        json_object_object_add(res.root, "backup_path", json_util::new_string(backup_path));
    }
    return json_util::to_string(res.root);
}

// Literal substring search over files with the given extensions.
std::string tool_search_in_files(ToolContext& ctx) {
    const fs::path root = project_root(ctx);
    const std::string pattern = ctx.arg_string("pattern");
    if (pattern.empty()) {
        throw ToolError(ErrorKind::InvalidArguments, "pattern must not be empty",
                        "{\"fields\":[{\"name\":\"pattern\",\"problem\":\"must not be empty\"}]}");
    }
    std::vector<std::string> exts = ctx.arg_list("extensions");
    if (!ctx.has_arg("extensions")) exts = {".smali", ".xml"};
    const size_t max_results = (size_t)ctx.arg_int("max_results", 100);

    json_object* results = json_object_new_array();
    json_util::Doc res(json_object_new_object());
    json_object_object_add(res.root, "results", results);

    size_t count = 0;
    bool max_reached = false;
    for (const auto& rel : walk_files(ctx, root, root)) {
        bool ext_ok = exts.empty();
        for (const auto& e : exts) {
            if (rel.size() >= e.size() && rel.compare(rel.size() - e.size(), e.size(), e) == 0) {
                ext_ok = true;
                break;
            }
        }
        if (!ext_ok) continue;
        check_cancel(ctx);

        std::ifstream f(root / rel, std::ios::binary);
        if (!f) continue;
        std::string line;
        int64_t line_no = 0;
        int64_t first_line = 0;
        std::string first_text;
        int64_t matches = 0;
        bool binary = false;
        while (std::getline(f, line)) {
            line_no++;
            if (line.find('\0') != std::string::npos) {
                binary = true;
                break;
            }
            if (line.find(pattern) == std::string::npos) continue;
            if (matches++ == 0) {
                first_line = line_no;
                first_text = line.size() > 200 ? line.substr(0, 200) : line;
            }
        }
        if (binary || matches == 0) continue;

        if (count >= max_results) {
            max_reached = true;
            break;
        }
        json_object* m = json_object_new_object();
        json_object_object_add(m, "file", json_util::new_string(rel));
        json_object_object_add(m, "line", json_object_new_int64(first_line));
        json_object_object_add(m, "text", json_util::new_string(first_text));
        json_object_object_add(m, "matches", json_object_new_int64(matches));
        json_object_array_add(results, m);
        count++;
    }

    json_object_object_add(res.root, "count", json_object_new_int64((int64_t)count));
    json_object_object_add(res.root, "max_reached", json_object_new_boolean(max_reached));
    return json_util::to_string(res.root);
}

} // namespace

void register_fs_tools(ToolRegistry& reg) {
    {
        ToolDesc d;
        d.name = "list_resources";
        d.description = "List files under res/ of a decoded project";
        d.params = {
            param("project_dir", ParamType::Path, true, "decoded project directory"),
            param("glob", ParamType::String, false, "fnmatch pattern on the project-relative path"),
            param("resource_type", ParamType::String, false, "restrict to res/<type>, e.g. layout"),
        };
        d.workspace = WorkspaceKey::ProjectDir;
        d.workspace_arg = "project_dir";
        d.lock = LockMode::Shared;
        d.caps = {true, false, false};
        d.handler = tool_list_resources;
        reg.register_tool(std::move(d));
    }
    {
        ToolDesc d;
        d.name = "read_file";
        d.description = "Read a file inside a decoded project";
        ParamSpec max_bytes = param("max_bytes", ParamType::Integer, false, "read at most this many bytes");
        max_bytes.min_int = 1;
        d.params = {
            param("project_dir", ParamType::Path, true, "decoded project directory"),
            param("relative_path", ParamType::String, true, "path inside the project"),
            max_bytes,
        };
        d.workspace = WorkspaceKey::ProjectDir;
        d.workspace_arg = "project_dir";
        d.lock = LockMode::Shared;
        d.caps = {true, false, false};
        d.handler = tool_read_file;
        reg.register_tool(std::move(d));
    }
    {
        ToolDesc d;
        d.name = "write_file";
        d.description = "Replace a file inside a decoded project";
        d.params = {
            param("project_dir", ParamType::Path, true, "decoded project directory"),
            param("relative_path", ParamType::String, true, "path inside the project"),
            param("content", ParamType::String, true, "new file content"),
            param("create_backup", ParamType::Boolean, false, "keep the old file as <name>.bak"),
            param("mkdirs", ParamType::Boolean, false, "create missing parent directories"),
        };
        d.workspace = WorkspaceKey::ProjectDir;
        d.workspace_arg = "project_dir";
        d.lock = LockMode::Exclusive;
        d.caps = {true, false, true};
        d.idempotent = true;
        d.handler = tool_write_file;
        reg.register_tool(std::move(d));
    }
    {
        ToolDesc d;
        d.name = "search_in_files";
        d.description = "Find files containing a literal pattern";
        ParamSpec max_results = param("max_results", ParamType::Integer, false, "default 100");
        max_results.min_int = 1;
        d.params = {
            param("project_dir", ParamType::Path, true, "decoded project directory"),
            param("pattern", ParamType::String, true, "literal text to find"),
            param("extensions", ParamType::StringList, false, "file suffixes, default [.smali, .xml]"),
            max_results,
        };
        d.workspace = WorkspaceKey::ProjectDir;
        d.workspace_arg = "project_dir";
        d.lock = LockMode::Shared;
        d.caps = {true, false, false};
        d.handler = tool_search_in_files;
        reg.register_tool(std::move(d));
    }
}

} // namespace apkbridge
