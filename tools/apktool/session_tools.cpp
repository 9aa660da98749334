#include "apkbridge/json_util.h"
#include "apkbridge/paths.h"
#include "apkbridge/tools.h"

#include <algorithm>
#include <filesystem>
#include <string>

namespace apkbridge {

namespace fs = std::filesystem;

namespace {

json_object* info_object(const WorkspaceInfo& info) {
    json_util::Doc d = json_util::parse(workspace_info_to_json(info));
    return d ? d.release() : json_object_new_object();
}

// The designated wait tool: takes no lease, may block up to max_wait_ms
// for an in-flight decode/build to finish.
std::string tool_workspace_status(ToolContext& ctx) {
    const std::string path = ctx.arg_string("path");
    std::error_code ec;
    std::shared_ptr<Workspace> ws;
    if (fs::is_directory(path, ec)) {
        ws = ctx.workspaces.find_by_project_dir(path);
    } else if ((ws = ctx.workspaces.find(path))) {
        // known APK, possibly deleted since
    } else if (fs::is_regular_file(path, ec)) {
        ws = ctx.workspaces.get_or_create(path);
    } else {
        throw ToolError(ErrorKind::PathNotFound, "no such APK or project: " + path,
                        "{\"path\":" + json_util::json_quote(path) + "}");
    }

    int64_t wait = ctx.arg_int("wait_ms", 0);
    if (wait > ctx.config.max_wait_ms) wait = ctx.config.max_wait_ms;
    const bool idle = ws->wait_idle((int)wait);

    json_util::Doc res(info_object(ws->snapshot()));
    json_object_object_add(res.root, "idle", json_object_new_boolean(idle));
    return json_util::to_string(res.root);
}

std::string tool_list_workspaces(ToolContext& ctx) {
    json_util::Doc res(json_object_new_object());

    json_object* wss = json_object_new_array();
    for (const auto& info : ctx.workspaces.list()) json_object_array_add(wss, info_object(info));
    json_object_object_add(res.root, "workspaces", wss);

    // apktool projects on disk, whether or not this process touched them
    std::vector<fs::path> dirs;
    std::error_code ec;
    const fs::path root(ctx.config.workspace_root);
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code dec;
        if (it->is_directory(dec)) dirs.push_back(it->path());
    }
    std::sort(dirs.begin(), dirs.end());

    json_object* projects = json_object_new_array();
    for (const auto& dir : dirs) {
        std::error_code fec;
        const bool has_yml = fs::is_regular_file(dir / "apktool.yml", fec);
        const bool has_manifest = fs::is_regular_file(dir / "AndroidManifest.xml", fec);
        if (!has_yml && !has_manifest) continue;
        json_object* p = json_object_new_object();
        json_object_object_add(p, "name", json_util::new_string(dir.filename().string()));
        json_object_object_add(p, "path", json_util::new_string(canonical_path(dir.string())));
        json_object_object_add(p, "has_apktool_yml", json_object_new_boolean(has_yml));
        json_object_object_add(p, "has_manifest", json_object_new_boolean(has_manifest));
        json_object_array_add(projects, p);
    }
    json_object_object_add(res.root, "projects", projects);
    json_object_object_add(res.root, "workspace_root", json_util::new_string(ctx.config.workspace_root));
    return json_util::to_string(res.root);
}

} // namespace

void register_session_tools(ToolRegistry& reg) {
    {
        ToolDesc d;
        d.name = "workspace_status";
        d.description = "Snapshot of one workspace, optionally waiting for it to go idle";
        ParamSpec path;
        path.name = "path";
        path.type = ParamType::Path;
        path.required = true;
        path.description = "APK path or decoded project directory";
        ParamSpec wait;
        wait.name = "wait_ms";
        wait.type = ParamType::Integer;
        wait.description = "block up to this long (capped by APKBRIDGE_MAX_WAIT_MS)";
        d.params = {path, wait};
        d.caps = {true, false, false};
        d.handler = tool_workspace_status;
        reg.register_tool(std::move(d));
    }
    {
        ToolDesc d;
        d.name = "list_workspaces";
        d.description = "Known workspaces and the projects under the workspace root";
        d.caps = {true, false, false};
        d.handler = tool_list_workspaces;
        reg.register_tool(std::move(d));
    }
}

} // namespace apkbridge
