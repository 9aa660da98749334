#pragma once
#include "config.h"
#include "proc.h"
#include "registry.h"
#include "workspace.h"

#include <json-c/json.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace apkbridge {

// Everything a handler may touch during one call. Built by the dispatcher
// after validation and (for scoped tools) after the lease is held.
struct ToolContext {
    const ToolDesc& desc;
    json_object* args;                  // borrowed, already validated
    const BridgeConfig& config;
    WorkspaceRegistry& workspaces;
    const ToolRegistry& registry;
    std::shared_ptr<Workspace> workspace; // null for unscoped tools
    CancelToken cancel;

    // Set by a prepare step for the handler (decode output directory).
    std::string target_dir;

    // Outputs the dispatcher applies to the workspace afterwards.
    std::optional<std::string> produced_decode_dir;
    std::optional<ProcSummary> last_invocation;

    ToolContext(const ToolDesc& d, json_object* a, const BridgeConfig& c,
                WorkspaceRegistry& w, const ToolRegistry& r)
        : desc(d), args(a), config(c), workspaces(w), registry(r) {}

    std::string arg_string(const char* key, const std::string& defv = "") const;
    bool arg_bool(const char* key, bool defv) const;
    int64_t arg_int(const char* key, int64_t defv) const;
    std::vector<std::string> arg_list(const char* key) const;
    bool has_arg(const char* key) const;

    // Class timeout for this tool, shortened (never extended) by a
    // timeout_ms argument.
    int effective_timeout_ms() const;

    // Run the external tool and map every non-success outcome to ToolError:
    // Unavailable -> ToolUnavailable, Timeout -> Timeout, Cancelled ->
    // Cancelled, nonzero exit -> ProcessFailure{exit_code, stderr_tail}.
    // Records last_invocation either way.
    ProcResult run_process(const std::vector<std::string>& argv, const std::string& cwd);

    // config.apktool_cmd followed by args.
    std::vector<std::string> apktool_argv(const std::vector<std::string>& args) const;
};

// Registers the built-in tool set; throws ToolError(DuplicateTool) if called twice.
void register_builtin_tools(ToolRegistry& reg);

// Tool groups (tools/apktool/*.cpp).
void register_apktool_tools(ToolRegistry& reg);
void register_fs_tools(ToolRegistry& reg);
void register_session_tools(ToolRegistry& reg);

} // namespace apkbridge
