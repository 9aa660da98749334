#include "apkbridge/dispatcher.h"
#include "apkbridge/json_util.h"
#include "apkbridge/tools.h"

#include <filesystem>
#include <iostream>

namespace apkbridge {

namespace fs = std::filesystem;

ToolResponse ToolResponse::success(std::string result_json) {
    ToolResponse r;
    r.ok = true;
    r.result_json = std::move(result_json);
    return r;
}

ToolResponse ToolResponse::failure(const ToolError& e) {
    ToolResponse r;
    r.ok = false;
    r.kind = e.kind();
    r.message = e.what();
    r.details_json = e.details_json();
    return r;
}

std::string ToolResponse::to_json(const std::string& id) const {
    json_util::Doc doc(json_object_new_object());
    json_object* o = doc.root;
    if (!id.empty()) json_object_object_add(o, "id", json_util::new_string(id));
    if (ok) {
        json_object_object_add(o, "status", json_object_new_string("ok"));
        json_util::Doc res = json_util::parse(result_json.empty() ? "{}" : result_json);
        json_object_object_add(o, "result", res ? res.release() : json_util::new_string(result_json));
    } else {
        json_object_object_add(o, "status", json_object_new_string("error"));
        json_object_object_add(o, "kind", json_object_new_string(error_kind_to_str(kind)));
        json_object_object_add(o, "message", json_util::new_string(message));
        if (!details_json.empty()) {
            json_util::Doc det = json_util::parse(details_json);
            if (det) json_object_object_add(o, "details", det.release());
        }
    }
    return json_util::to_string(o);
}

namespace {

// Handler-side failures that are not ToolError still need a kind.
ToolError as_tool_error(const std::exception& e) {
    if (auto* te = dynamic_cast<const ToolError*>(&e)) return *te;
    if (auto* fe = dynamic_cast<const fs::filesystem_error*>(&e)) {
        std::string details = "{\"path\":" + json_util::json_quote(fe->path1().string()) +
                              ",\"errno\":" + std::to_string(fe->code().value()) + "}";
        if (fe->code() == std::errc::no_such_file_or_directory) {
            return ToolError(ErrorKind::PathNotFound, fe->what(), details);
        }
        return ToolError(ErrorKind::IoError, fe->what(), details);
    }
    return ToolError(ErrorKind::IoError, std::string("internal error: ") + e.what());
}

} // namespace

std::string Dispatcher::execute(const ToolCall& call, const CancelToken& cancel,
                                std::shared_ptr<Workspace>* touched) {
    const ToolDesc& d = tools_.resolve(call.tool);

    json_util::Doc args;
    if (!call.arguments_json.empty()) {
        args = json_util::parse(call.arguments_json);
        if (!args) {
            throw ToolError(ErrorKind::InvalidArguments, "arguments are not valid JSON",
                            "{\"fields\":[{\"name\":\"arguments\",\"problem\":\"malformed JSON\"}]}");
        }
    }
    tools_.validate(d, args.root);

    if (is_cancelled(cancel)) throw ToolError(ErrorKind::Cancelled, "cancelled before start");

    ToolContext ctx(d, args.root, config_, workspaces_, tools_);
    ctx.cancel = cancel;

    if (!d.workspace_scoped()) return d.handler(ctx);

    const std::string key = ctx.arg_string(d.workspace_arg.c_str());
    std::shared_ptr<Workspace> ws;
    if (d.workspace == WorkspaceKey::SourceApk) {
        // checked before the workspace exists so a bad path leaves nothing behind
        std::error_code ec;
        if (!fs::is_regular_file(key, ec)) {
            throw ToolError(ErrorKind::PathNotFound, "APK file not found: " + key,
                            "{\"path\":" + json_util::json_quote(key) + "}");
        }
        ws = workspaces_.get_or_create(key);
    } else {
        ws = workspaces_.find_by_project_dir(key);
    }
    *touched = ws;
    ctx.workspace = ws;

    if (d.lock == LockMode::None) return d.handler(ctx);

    const LeaseMode mode = d.lock == LockMode::Exclusive ? LeaseMode::Exclusive : LeaseMode::Shared;
    return workspaces_.with_lock(ws, mode, 0, [&](Workspace& w) -> std::string {
        if (d.prepare) d.prepare(ctx);

        switch (d.effect) {
            case StateEffect::Decode:
                w.transition(WorkspaceState::Decoding);
                break;
            case StateEffect::Build:
                if (!w.can_build()) {
                    throw ToolError(ErrorKind::InvalidPrecondition,
                                    std::string("no completed decode to build from (state ") +
                                        workspace_state_to_str(w.state()) + ")",
                                    "{\"state\":\"" + std::string(workspace_state_to_str(w.state())) + "\"}");
                }
                w.transition(WorkspaceState::Building);
                break;
            case StateEffect::Reset:
                // the exclusive lease already rules out an in-flight decode or build
                break;
            case StateEffect::None:
                if (!w.has_decode()) {
                    throw ToolError(ErrorKind::InvalidPrecondition,
                                    std::string("project has no completed decode (state ") +
                                        workspace_state_to_str(w.state()) + ")",
                                    "{\"state\":\"" + std::string(workspace_state_to_str(w.state())) + "\"}");
                }
                break;
        }

        std::string result;
        try {
            result = d.handler(ctx);
            if (d.effect == StateEffect::Decode && !ctx.produced_decode_dir) {
                throw ToolError(ErrorKind::ProcessFailure, "decode finished without a project directory");
            }
        } catch (const std::exception& ex) {
            ToolError te = as_tool_error(ex);
            if (ctx.last_invocation) w.record_invocation(*ctx.last_invocation);
            if (d.effect == StateEffect::Decode || d.effect == StateEffect::Build) {
                w.transition(WorkspaceState::Failed);
            }
            w.record_error(te.kind(), te.what());
            throw te;
        }

        if (ctx.last_invocation) w.record_invocation(*ctx.last_invocation);
        switch (d.effect) {
            case StateEffect::Decode:
                w.mark_decoded(*ctx.produced_decode_dir);
                break;
            case StateEffect::Build:
                w.transition(WorkspaceState::Built);
                w.clear_error();
                break;
            case StateEffect::Reset:
                workspaces_.reset(ws);
                break;
            case StateEffect::None:
                w.clear_error();
                break;
        }
        return result;
    });
}

ToolResponse Dispatcher::dispatch(const ToolCall& call, const CancelToken& cancel) {
    const int64_t t0 = now_ms();
    std::shared_ptr<Workspace> ws;
    ToolResponse resp;
    try {
        resp = ToolResponse::success(execute(call, cancel, &ws));
    } catch (const std::exception& e) {
        resp = ToolResponse::failure(as_tool_error(e));
    }
    resp.duration_ms = now_ms() - t0;
    log_call(call, resp, ws.get());
    return resp;
}

void Dispatcher::log_call(const ToolCall& call, const ToolResponse& resp, const Workspace* ws) {
    std::string state = ws ? workspace_state_to_str(ws->state()) : "";
    if (!resp.ok) {
        std::cerr << "[dispatch] " << call.tool << (call.id.empty() ? "" : " id=" + call.id)
                  << " -> " << error_kind_to_str(resp.kind) << ": " << resp.message << "\n";
    }
    if (!events_ || !events_->is_open()) return;

    json_util::Doc p(json_object_new_object());
    json_object_object_add(p.root, "id", json_util::new_string(call.id));
    json_object_object_add(p.root, "tool", json_util::new_string(call.tool));
    json_object_object_add(p.root, "status", json_object_new_string(resp.ok ? "ok" : "error"));
    if (!resp.ok) json_object_object_add(p.root, "kind", json_object_new_string(error_kind_to_str(resp.kind)));
    json_object_object_add(p.root, "duration_ms", json_object_new_int64(resp.duration_ms));
    if (ws) {
        json_object_object_add(p.root, "workspace", json_util::new_string(ws->source_path()));
        json_object_object_add(p.root, "state", json_util::new_string(state));
    }
    events_->event("tool_call", json_util::to_string(p.root));
}

} // namespace apkbridge
