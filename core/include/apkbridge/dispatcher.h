#pragma once
#include "config.h"
#include "log.h"
#include "proc.h"
#include "registry.h"
#include "types.h"
#include "workspace.h"

#include <optional>
#include <string>

namespace apkbridge {

struct ToolCall {
    std::string id;              // echoed back; may be empty
    std::string tool;
    std::string arguments_json;  // JSON object text; empty means {}
};

struct ToolResponse {
    bool ok{false};
    std::string result_json;     // ok
    ErrorKind kind{ErrorKind::InvalidArguments}; // !ok
    std::string message;
    std::string details_json;    // optional JSON object
    int64_t duration_ms{0};

    // {"id"?, "status":"ok","result":{...}} or
    // {"id"?, "status":"error","kind":..,"message":..,"details"?:{...}}
    std::string to_json(const std::string& id = "") const;

    static ToolResponse success(std::string result_json);
    static ToolResponse failure(const ToolError& e);
};

// Resolves, validates, leases, runs and normalizes one call.
// Thread-safe: the stdio session calls dispatch() from one thread per call.
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& tools, WorkspaceRegistry& workspaces,
               const BridgeConfig& config, EventLog* events = nullptr)
        : tools_(tools), workspaces_(workspaces), config_(config), events_(events) {}

    // Never throws ToolError; every failure becomes an error response.
    ToolResponse dispatch(const ToolCall& call, const CancelToken& cancel = nullptr);

    const ToolRegistry& tools() const { return tools_; }
    WorkspaceRegistry& workspaces() { return workspaces_; }
    const BridgeConfig& config() const { return config_; }

private:
    std::string execute(const ToolCall& call, const CancelToken& cancel,
                        std::shared_ptr<Workspace>* touched);
    void log_call(const ToolCall& call, const ToolResponse& resp, const Workspace* ws);

    const ToolRegistry& tools_;
    WorkspaceRegistry& workspaces_;
    const BridgeConfig& config_;
    EventLog* events_;
};

} // namespace apkbridge
