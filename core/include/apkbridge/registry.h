#pragma once
#include "types.h"

#include <json-c/json.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace apkbridge {

struct ToolContext;

enum class ParamType {
    String,
    Path,       // non-empty string naming a filesystem location
    Boolean,
    Integer,
    Enum,       // string restricted to ParamSpec::enum_values
    StringList,
};

const char* param_type_to_str(ParamType t);

struct ParamSpec {
    std::string name;
    ParamType type{ParamType::String};
    bool required{false};
    std::vector<std::string> enum_values;
    long long min_int{0};           // Integer only
    std::string description;
};

enum class LockMode { None, Shared, Exclusive };

// Which argument identifies the workspace of a scoped call.
enum class WorkspaceKey {
    None,
    SourceApk,   // canonical APK path
    ProjectDir,  // decoded project directory
};

// How a successful call moves the workspace. Reset returns it to Unopened
// (the project directory is gone).
enum class StateEffect { None, Decode, Build, Reset };

enum class TimeoutClass { Metadata, Heavy };

struct Capabilities {
    bool reads_fs{false};
    bool invokes_process{false};
    bool mutates_workspace{false};
};

const char* lock_mode_to_str(LockMode m);
const char* state_effect_to_str(StateEffect e);
const char* timeout_class_to_str(TimeoutClass c);

// Handlers return the result object as JSON text and throw ToolError.
using ToolFn = std::function<std::string(ToolContext& ctx)>;
// Checks that must pass before the workspace state changes. Runs under the
// lease; a throw refuses the call and leaves the workspace as it was.
using PrepareFn = std::function<void(ToolContext& ctx)>;

struct ToolDesc {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;

    WorkspaceKey workspace{WorkspaceKey::None};
    std::string workspace_arg;      // argument carrying the key
    LockMode lock{LockMode::None};
    StateEffect effect{StateEffect::None};
    TimeoutClass timeout_class{TimeoutClass::Metadata};
    Capabilities caps;
    bool idempotent{true};

    PrepareFn prepare;  // optional
    ToolFn handler;

    bool workspace_scoped() const { return workspace != WorkspaceKey::None; }
    const ParamSpec* param(const std::string& n) const;
};

// JSON descriptor for tool listings (no handler).
std::string tool_desc_to_json(const ToolDesc& d);

// Name -> descriptor map. Populated at startup, then frozen; lookups on a
// frozen registry take no lock.
class ToolRegistry {
public:
    // Throws ToolError(DuplicateTool) on a reused name, and
    // ToolError(InvalidPrecondition) once frozen or for a malformed descriptor.
    void register_tool(ToolDesc d);

    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

    // Throws ToolError(ToolNotFound).
    const ToolDesc& resolve(const std::string& name) const;

    // Checks args (a JSON object, or null for "no arguments") against the
    // descriptor. Throws ToolError(InvalidArguments) whose details.fields
    // lists every offending field.
    void validate(const ToolDesc& d, json_object* args) const;

    // Sorted by name.
    std::vector<const ToolDesc*> all() const;
    size_t size() const { return tools_.size(); }

private:
    std::map<std::string, ToolDesc> tools_;
    bool frozen_{false};
};

} // namespace apkbridge
