#include "apkbridge/json_util.h"
#include "apkbridge/paths.h"
#include "apkbridge/tools.h"

#include <filesystem>
#include <string>
#include <vector>

namespace apkbridge {

namespace fs = std::filesystem;

namespace {

void ensure_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw ToolError(ErrorKind::IoError, "cannot create directory " + dir.string() + ": " + ec.message(),
                        "{\"path\":" + json_util::json_quote(dir.string()) + "}");
    }
}

// Output directory checks and the directory claim happen before the
// workspace enters Decoding, so a refused decode leaves the old tree usable.
void prepare_decode_apk(ToolContext& ctx) {
    std::string out = ctx.arg_string("output_dir");
    if (out.empty()) {
        // app.apk -> <workspace_root>/app
        out = (fs::path(ctx.config.workspace_root) / fs::path(ctx.workspace->source_path()).stem()).string();
    }
    out = canonical_path(out);

    std::error_code ec;
    if (!ctx.arg_bool("force", true) && fs::exists(out, ec) && !fs::is_empty(out, ec)) {
        throw ToolError(ErrorKind::InvalidPrecondition,
                        "output directory exists and force is false: " + out,
                        "{\"output_dir\":" + json_util::json_quote(out) + "}");
    }

    ensure_dir(ctx.config.workspace_root);
    ensure_dir(fs::path(out).parent_path());
    ctx.workspaces.claim_decode_dir(ctx.workspace, out);
    ctx.target_dir = out;
}

// apktool d <apk> -o <dir> [-f] [-r] [-s]
std::string tool_decode_apk(ToolContext& ctx) {
    const std::string apk = ctx.workspace->source_path();
    const std::string out = ctx.target_dir;
    const bool force = ctx.arg_bool("force", true);
    std::error_code ec;

    std::vector<std::string> args{"d", apk, "-o", out};
    if (force) args.push_back("-f");
    if (ctx.arg_bool("no_res", false)) args.push_back("-r");
    if (ctx.arg_bool("no_src", false)) args.push_back("-s");

    ProcResult r = ctx.run_process(ctx.apktool_argv(args), ctx.config.workspace_root);

    if (!fs::is_regular_file(fs::path(out) / "apktool.yml", ec)) {
        throw ToolError(ErrorKind::ProcessFailure,
                        "decoder exited 0 but " + out + "/apktool.yml is missing",
                        "{\"exit_code\":0,\"stderr_tail\":" +
                            json_util::json_quote(tail_bytes(r.err, ctx.config.stderr_tail_bytes)) + "}");
    }
    ctx.produced_decode_dir = out;

    json_util::Doc res(json_object_new_object());
    json_object_object_add(res.root, "decode_dir", json_util::new_string(out));
    json_object_object_add(res.root, "source_path", json_util::new_string(apk));
    json_object_object_add(res.root, "duration_ms", json_object_new_int64(r.duration_ms));
    return json_util::to_string(res.root);
}

// apktool b <project> -o <apk> [-d] [-f]
std::string tool_build_apk(ToolContext& ctx) {
    const std::string project = ctx.workspace->decode_dir();

    std::string out = ctx.arg_string("output_apk");
    if (out.empty()) {
        fs::path p(project);
        out = (p / "dist" / (p.filename().string() + ".apk")).string();
    }
    out = canonical_path(out);
    ensure_dir(fs::path(out).parent_path());

    // a stale artifact must not pass for a fresh build
    std::error_code ec;
    fs::remove(out, ec);

    std::vector<std::string> args{"b", project, "-o", out};
    if (ctx.arg_bool("debug", true)) args.push_back("-d");
    if (ctx.arg_bool("force_all", false)) args.push_back("-f");

    ProcResult r = ctx.run_process(ctx.apktool_argv(args), project);

    if (!fs::is_regular_file(out, ec)) {
        throw ToolError(ErrorKind::ProcessFailure, "builder exited 0 but " + out + " was not produced",
                        "{\"exit_code\":0,\"stderr_tail\":" +
                            json_util::json_quote(tail_bytes(r.err, ctx.config.stderr_tail_bytes)) + "}");
    }

    json_util::Doc res(json_object_new_object());
    json_object_object_add(res.root, "output_apk_path", json_util::new_string(out));
    json_object_object_add(res.root, "size", json_object_new_int64((int64_t)fs::file_size(out, ec)));
    json_object_object_add(res.root, "duration_ms", json_object_new_int64(r.duration_ms));
    return json_util::to_string(res.root);
}

std::string tool_check_apktool_version(ToolContext& ctx) {
    ProcResult r = ctx.run_process(ctx.apktool_argv({"--version"}), "");
    std::string v = r.out;
    while (!v.empty() && (v.back() == '\n' || v.back() == '\r' || v.back() == ' ')) v.pop_back();
    size_t first = v.find_first_not_of(" \t\r\n");
    v = first == std::string::npos ? std::string() : v.substr(first);

    json_util::Doc res(json_object_new_object());
    json_object_object_add(res.root, "version", json_util::new_string(v));
    json_object_object_add(res.root, "command", json_util::new_string_array(ctx.config.apktool_cmd));
    return json_util::to_string(res.root);
}

// Unused name for a backup copy of p: <p>_backup_<unix seconds>[_N].
fs::path backup_name(const fs::path& p) {
    const std::string base = p.string() + "_backup_" + std::to_string(now_ms() / 1000);
    fs::path candidate(base);
    std::error_code ec;
    for (int n = 1; fs::exists(candidate, ec); ++n) candidate = base + "_" + std::to_string(n);
    return candidate;
}

// Removes apktool's build/ and dist/ output under the project, copying each
// aside first unless backup is false.
std::string tool_clean_project(ToolContext& ctx) {
    const fs::path project(ctx.workspace->decode_dir());
    const bool backup = ctx.arg_bool("backup", true);

    json_util::Doc res(json_object_new_object());
    json_object* backed_up = json_object_new_array();
    json_object_object_add(res.root, "backed_up", backed_up);

    std::vector<std::string> cleaned;
    for (const char* name : {"build", "dist"}) {
        fs::path p = project / name;
        std::error_code ec;
        if (!fs::exists(p, ec)) continue;
        if (backup) {
            const fs::path dst = backup_name(p);
            fs::copy(p, dst, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
            if (ec) {
                throw ToolError(ErrorKind::IoError, "cannot back up " + p.string() + ": " + ec.message(),
                                "{\"path\":" + json_util::json_quote(p.string()) +
                                    ",\"backup\":" + json_util::json_quote(dst.string()) + "}");
            }
            json_object* entry = json_object_new_object();
            json_object_object_add(entry, "original", json_util::new_string(p.string()));
            json_object_object_add(entry, "backup", json_util::new_string(dst.string()));
            json_object_array_add(backed_up, entry);
        }
        fs::remove_all(p, ec);
        if (ec) {
            throw ToolError(ErrorKind::IoError, "cannot remove " + p.string() + ": " + ec.message(),
                            "{\"path\":" + json_util::json_quote(p.string()) + "}");
        }
        cleaned.push_back(name);
    }

    json_object_object_add(res.root, "cleaned", json_util::new_string_array(cleaned));
    return json_util::to_string(res.root);
}

// Deletes a project directory. Without force the directory must look like
// an apktool project; the workspace root and its ancestors are never deleted.
std::string tool_delete_project(ToolContext& ctx) {
    const std::string dir = canonical_path(ctx.arg_string("project_dir"));
    const std::string details = "{\"project_dir\":" + json_util::json_quote(dir) + "}";

    if (is_path_under(ctx.config.workspace_root, dir)) {
        throw ToolError(ErrorKind::InvalidPrecondition,
                        "refusing to delete the workspace root or a directory containing it: " + dir, details);
    }
    std::error_code ec;
    if (!ctx.arg_bool("force", false) && !fs::is_regular_file(fs::path(dir) / "apktool.yml", ec)) {
        throw ToolError(ErrorKind::InvalidPrecondition,
                        "not an apktool project (no apktool.yml); pass force to delete anyway: " + dir, details);
    }

    const auto removed = fs::remove_all(dir, ec);
    if (ec) {
        throw ToolError(ErrorKind::IoError, "cannot delete " + dir + ": " + ec.message(), details);
    }

    json_util::Doc res(json_object_new_object());
    json_object_object_add(res.root, "deleted", json_util::new_string(dir));
    json_object_object_add(res.root, "source_path", json_util::new_string(ctx.workspace->source_path()));
    json_object_object_add(res.root, "entries_removed", json_object_new_int64((int64_t)removed));
    return json_util::to_string(res.root);
}

ParamSpec param(const char* name, ParamType t, bool required, const char* desc) {
    ParamSpec p;
    p.name = name;
    p.type = t;
    p.required = required;
    p.description = desc;
    return p;
}

ParamSpec timeout_param() {
    ParamSpec p = param("timeout_ms", ParamType::Integer, false,
                        "shorter deadline for this call (never longer than the configured one)");
    p.min_int = 1;
    return p;
}

} // namespace

void register_apktool_tools(ToolRegistry& reg) {
    {
        ToolDesc d;
        d.name = "decode_apk";
        d.description = "Decode an APK into a project directory";
        d.params = {
            param("apk_path", ParamType::Path, true, "APK file to decode"),
            param("output_dir", ParamType::Path, false, "defaults to <workspace>/<apk name>"),
            param("force", ParamType::Boolean, false, "replace an existing output directory (default true)"),
            param("no_res", ParamType::Boolean, false, "do not decode resources"),
            param("no_src", ParamType::Boolean, false, "do not disassemble dex"),
            timeout_param(),
        };
        d.workspace = WorkspaceKey::SourceApk;
        d.workspace_arg = "apk_path";
        d.lock = LockMode::Exclusive;
        d.effect = StateEffect::Decode;
        d.timeout_class = TimeoutClass::Heavy;
        d.caps = {true, true, true};
        d.idempotent = true;
        d.prepare = prepare_decode_apk;
        d.handler = tool_decode_apk;
        reg.register_tool(std::move(d));
    }
    {
        ToolDesc d;
        d.name = "build_apk";
        d.description = "Rebuild an APK from a decoded project";
        d.params = {
            param("project_dir", ParamType::Path, true, "decoded project directory"),
            param("output_apk", ParamType::Path, false, "defaults to <project>/dist/<project name>.apk"),
            param("debug", ParamType::Boolean, false, "build with debug info (default true)"),
            param("force_all", ParamType::Boolean, false, "rebuild everything"),
            timeout_param(),
        };
        d.workspace = WorkspaceKey::ProjectDir;
        d.workspace_arg = "project_dir";
        d.lock = LockMode::Exclusive;
        d.effect = StateEffect::Build;
        d.timeout_class = TimeoutClass::Heavy;
        d.caps = {true, true, true};
        d.idempotent = false;
        d.handler = tool_build_apk;
        reg.register_tool(std::move(d));
    }
    {
        ToolDesc d;
        d.name = "clean_project";
        d.description = "Remove build/ and dist/ from a decoded project";
        d.params = {
            param("project_dir", ParamType::Path, true, "decoded project directory"),
            param("backup", ParamType::Boolean, false, "copy build/ and dist/ aside before removing (default true)"),
        };
        d.workspace = WorkspaceKey::ProjectDir;
        d.workspace_arg = "project_dir";
        d.lock = LockMode::Exclusive;
        d.caps = {true, false, true};
        d.idempotent = true;
        d.handler = tool_clean_project;
        reg.register_tool(std::move(d));
    }
    {
        ToolDesc d;
        d.name = "delete_project";
        d.description = "Delete a project directory and reset its workspace";
        d.params = {
            param("project_dir", ParamType::Path, true, "project directory to delete"),
            param("force", ParamType::Boolean, false, "delete even without apktool.yml"),
        };
        d.workspace = WorkspaceKey::ProjectDir;
        d.workspace_arg = "project_dir";
        d.lock = LockMode::Exclusive;
        d.effect = StateEffect::Reset;
        d.caps = {true, false, true};
        d.idempotent = false;
        d.handler = tool_delete_project;
        reg.register_tool(std::move(d));
    }
    {
        ToolDesc d;
        d.name = "check_apktool_version";
        d.description = "Report the version of the configured apktool";
        d.timeout_class = TimeoutClass::Metadata;
        d.caps = {false, true, false};
        d.handler = tool_check_apktool_version;
        reg.register_tool(std::move(d));
    }
}

} // namespace apkbridge
