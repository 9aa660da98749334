#include "apkbridge/registry.h"
#include "apkbridge/json_util.h"

#include <algorithm>

namespace apkbridge {

const char* param_type_to_str(ParamType t) {
    switch (t) {
        case ParamType::String: return "string";
        case ParamType::Path: return "path";
        case ParamType::Boolean: return "boolean";
        case ParamType::Integer: return "integer";
        case ParamType::Enum: return "enum";
        case ParamType::StringList: return "string_list";
    }
    return "string";
}

const char* lock_mode_to_str(LockMode m) {
    switch (m) {
        case LockMode::None: return "none";
        case LockMode::Shared: return "shared";
        case LockMode::Exclusive: return "exclusive";
    }
    return "none";
}

const char* state_effect_to_str(StateEffect e) {
    switch (e) {
        case StateEffect::None: return "none";
        case StateEffect::Decode: return "decode";
        case StateEffect::Build: return "build";
        case StateEffect::Reset: return "reset";
    }
    return "none";
}

const char* timeout_class_to_str(TimeoutClass c) {
    return c == TimeoutClass::Heavy ? "heavy" : "metadata";
}

const ParamSpec* ToolDesc::param(const std::string& n) const {
    for (const auto& p : params) {
        if (p.name == n) return &p;
    }
    return nullptr;
}

std::string tool_desc_to_json(const ToolDesc& d) {
    json_util::Doc doc(json_object_new_object());
    json_object* o = doc.root;
    json_object_object_add(o, "name", json_util::new_string(d.name));
    json_object_object_add(o, "description", json_util::new_string(d.description));

    json_object* params = json_object_new_array();
    for (const auto& p : d.params) {
        json_object* po = json_object_new_object();
        json_object_object_add(po, "name", json_util::new_string(p.name));
        json_object_object_add(po, "type", json_object_new_string(param_type_to_str(p.type)));
        json_object_object_add(po, "required", json_object_new_boolean(p.required));
        if (p.type == ParamType::Enum) {
            json_object_object_add(po, "values", json_util::new_string_array(p.enum_values));
        }
        if (!p.description.empty()) {
            json_object_object_add(po, "description", json_util::new_string(p.description));
        }
        json_object_array_add(params, po);
    }
    json_object_object_add(o, "params", params);

    json_object_object_add(o, "workspace_scoped", json_object_new_boolean(d.workspace_scoped()));
    json_object_object_add(o, "lock", json_object_new_string(lock_mode_to_str(d.lock)));
    json_object_object_add(o, "state_effect", json_object_new_string(state_effect_to_str(d.effect)));
    json_object_object_add(o, "timeout_class", json_object_new_string(timeout_class_to_str(d.timeout_class)));

    json_object* caps = json_object_new_object();
    json_object_object_add(caps, "reads_fs", json_object_new_boolean(d.caps.reads_fs));
    json_object_object_add(caps, "invokes_process", json_object_new_boolean(d.caps.invokes_process));
    json_object_object_add(caps, "mutates_workspace", json_object_new_boolean(d.caps.mutates_workspace));
    json_object_object_add(o, "capabilities", caps);
    json_object_object_add(o, "idempotent", json_object_new_boolean(d.idempotent));
    return json_util::to_string(o);
}

void ToolRegistry::register_tool(ToolDesc d) {
    if (frozen_) {
        throw ToolError(ErrorKind::InvalidPrecondition, "tool registry is frozen: " + d.name);
    }
    if (d.name.empty() || !d.handler) {
        throw ToolError(ErrorKind::InvalidPrecondition, "tool descriptor needs a name and a handler");
    }
    if (d.workspace_scoped() && !d.param(d.workspace_arg)) {
        throw ToolError(ErrorKind::InvalidPrecondition,
                        "tool " + d.name + ": workspace argument '" + d.workspace_arg + "' is not a parameter");
    }
    if (tools_.count(d.name)) {
        throw ToolError(ErrorKind::DuplicateTool, "duplicate tool: " + d.name,
                        "{\"name\":" + json_util::json_quote(d.name) + "}");
    }
    std::string key = d.name;
    tools_.emplace(std::move(key), std::move(d));
}

const ToolDesc& ToolRegistry::resolve(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw ToolError(ErrorKind::ToolNotFound, "unknown tool: " + name,
                        "{\"name\":" + json_util::json_quote(name) + "}");
    }
    return it->second;
}

namespace {

struct FieldProblem {
    std::string name;
    std::string problem;
};

std::string check_value(const ParamSpec& p, json_object* v) {
    switch (p.type) {
        case ParamType::String:
            if (!json_object_is_type(v, json_type_string)) return "expected string";
            return "";
        case ParamType::Path:
            if (!json_object_is_type(v, json_type_string)) return "expected path string";
            if (json_object_get_string_len(v) == 0) return "path must not be empty";
            return "";
        case ParamType::Boolean:
            if (!json_object_is_type(v, json_type_boolean)) return "expected boolean";
            return "";
        case ParamType::Integer:
            if (!json_object_is_type(v, json_type_int)) return "expected integer";
            if (json_object_get_int64(v) < p.min_int) {
                return "must be >= " + std::to_string(p.min_int);
            }
            return "";
        case ParamType::Enum: {
            if (!json_object_is_type(v, json_type_string)) return "expected string";
            std::string s = json_object_get_string(v);
            if (std::find(p.enum_values.begin(), p.enum_values.end(), s) == p.enum_values.end()) {
                std::string allowed;
                for (const auto& e : p.enum_values) {
                    if (!allowed.empty()) allowed += ", ";
                    allowed += e;
                }
                return "must be one of: " + allowed;
            }
            return "";
        }
        case ParamType::StringList: {
            if (!json_object_is_type(v, json_type_array)) return "expected array of strings";
            const size_t n = json_object_array_length(v);
            for (size_t i = 0; i < n; i++) {
                if (!json_object_is_type(json_object_array_get_idx(v, i), json_type_string)) {
                    return "element " + std::to_string(i) + " is not a string";
                }
            }
            return "";
        }
    }
    return "";
}

} // namespace

void ToolRegistry::validate(const ToolDesc& d, json_object* args) const {
    std::vector<FieldProblem> problems;

    if (args && !json_object_is_type(args, json_type_object)) {
        throw ToolError(ErrorKind::InvalidArguments, "arguments must be a JSON object",
                        "{\"fields\":[{\"name\":\"arguments\",\"problem\":\"expected object\"}]}");
    }

    for (const auto& p : d.params) {
        json_object* v = json_util::get(args, p.name.c_str());
        // an explicit null counts as absent
        if (!v) {
            if (p.required) problems.push_back({p.name, "required"});
            continue;
        }
        std::string why = check_value(p, v);
        if (!why.empty()) problems.push_back({p.name, why});
    }

    if (args) {
        std::vector<std::string> unknown;
        json_object_object_foreach(args, key, val) {
            (void)val;
            if (!d.param(key)) unknown.emplace_back(key);
        }
        std::sort(unknown.begin(), unknown.end());
        for (const auto& k : unknown) problems.push_back({k, "unknown argument"});
    }

    if (problems.empty()) return;

    json_util::Doc details(json_object_new_object());
    json_object* fields = json_object_new_array();
    std::string msg = "invalid arguments for " + d.name + ":";
    for (const auto& fp : problems) {
        json_object* f = json_object_new_object();
        json_object_object_add(f, "name", json_util::new_string(fp.name));
        json_object_object_add(f, "problem", json_util::new_string(fp.problem));
        json_object_array_add(fields, f);
        msg += " " + fp.name + " (" + fp.problem + ")";
    }
    json_object_object_add(details.root, "fields", fields);
    throw ToolError(ErrorKind::InvalidArguments, msg, json_util::to_string(details.root));
}

std::vector<const ToolDesc*> ToolRegistry::all() const {
    std::vector<const ToolDesc*> res;
    res.reserve(tools_.size());
    for (const auto& kv : tools_) res.push_back(&kv.second);
    return res;
}

} // namespace apkbridge
