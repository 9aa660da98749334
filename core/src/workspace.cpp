#include "apkbridge/workspace.h"
#include "apkbridge/json_util.h"
#include "apkbridge/paths.h"

#include <algorithm>
#include <chrono>
#include <filesystem>

namespace apkbridge {

namespace fs = std::filesystem;

bool is_legal_transition(WorkspaceState from, WorkspaceState to) {
    using S = WorkspaceState;
    switch (to) {
        case S::Decoding:
            return from == S::Unopened || from == S::Decoded || from == S::Built || from == S::Failed;
        case S::Decoded:
            return from == S::Decoding;
        case S::Building:
            return from == S::Decoded || from == S::Built || from == S::Failed;
        case S::Built:
            return from == S::Building;
        case S::Failed:
            return from == S::Decoding || from == S::Building;
        case S::Unopened:
            return false;
    }
    return false;
}

Workspace::Workspace(std::string source_path)
    : source_path_(std::move(source_path)), updated_at_ms_(now_ms()) {}

WorkspaceInfo Workspace::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    WorkspaceInfo info;
    info.source_path = source_path_;
    info.decode_dir = decode_dir_;
    info.state = state_;
    info.decoded = decoded_;
    info.last_error_kind = last_error_kind_;
    info.last_error = last_error_;
    info.updated_at_ms = updated_at_ms_;
    info.last_invocation = last_invocation_;
    info.writer_active = writer_;
    info.readers = readers_;
    return info;
}

WorkspaceState Workspace::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::string Workspace::decode_dir() const {
    std::lock_guard<std::mutex> lk(mu_);
    return decode_dir_;
}

bool Workspace::has_decode() const {
    std::lock_guard<std::mutex> lk(mu_);
    return decoded_ && !decode_dir_.empty() && state_ != WorkspaceState::Decoding;
}

bool Workspace::can_build() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (!decoded_ || decode_dir_.empty()) return false;
    return state_ == WorkspaceState::Decoded || state_ == WorkspaceState::Built ||
           state_ == WorkspaceState::Failed;
}

void Workspace::set_state_locked(WorkspaceState next) {
    state_ = next;
    updated_at_ms_ = now_ms();
}

void Workspace::transition(WorkspaceState next) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        bool legal = is_legal_transition(state_, next);
        // A failed decode leaves nothing to build from.
        if (legal && next == WorkspaceState::Building && !decoded_) legal = false;
        if (!legal) {
            std::string details = "{\"from\":\"" + std::string(workspace_state_to_str(state_)) +
                                  "\",\"to\":\"" + workspace_state_to_str(next) + "\"}";
            throw ToolError(ErrorKind::InvalidPrecondition,
                            std::string("illegal workspace transition ") +
                                workspace_state_to_str(state_) + " -> " + workspace_state_to_str(next),
                            details);
        }
        if (next == WorkspaceState::Decoding) decoded_ = false;
        set_state_locked(next);
    }
    cv_.notify_all();
}

void Workspace::mark_decoded(const std::string& dir) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != WorkspaceState::Decoding) {
            throw ToolError(ErrorKind::InvalidPrecondition,
                            std::string("mark_decoded outside Decoding (state ") +
                                workspace_state_to_str(state_) + ")");
        }
        decode_dir_ = dir;
        decoded_ = true;
        last_error_kind_.reset();
        last_error_.clear();
        set_state_locked(WorkspaceState::Decoded);
    }
    cv_.notify_all();
}

void Workspace::reset() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        decode_dir_.clear();
        decoded_ = false;
        last_error_kind_.reset();
        last_error_.clear();
        set_state_locked(WorkspaceState::Unopened);
    }
    cv_.notify_all();
}

void Workspace::record_error(ErrorKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lk(mu_);
    last_error_kind_ = kind;
    last_error_ = message;
    updated_at_ms_ = now_ms();
}

void Workspace::clear_error() {
    std::lock_guard<std::mutex> lk(mu_);
    last_error_kind_.reset();
    last_error_.clear();
}

void Workspace::record_invocation(ProcSummary summary) {
    std::lock_guard<std::mutex> lk(mu_);
    last_invocation_ = std::move(summary);
    updated_at_ms_ = now_ms();
}

bool Workspace::wait_idle(int wait_ms) const {
    std::unique_lock<std::mutex> lk(mu_);
    auto idle = [&] { return !writer_ && !is_in_flight(state_); };
    if (idle()) return true;
    if (wait_ms <= 0) return false;
    return cv_.wait_for(lk, std::chrono::milliseconds(wait_ms), idle);
}

std::string workspace_info_to_json(const WorkspaceInfo& info) {
    json_util::Doc doc(json_object_new_object());
    json_object* o = doc.root;
    json_object_object_add(o, "source_path", json_util::new_string(info.source_path));
    json_object_object_add(o, "decode_dir",
                           info.decode_dir.empty() ? nullptr : json_util::new_string(info.decode_dir));
    json_object_object_add(o, "state", json_object_new_string(workspace_state_to_str(info.state)));
    json_object_object_add(o, "decoded", json_object_new_boolean(info.decoded));
    json_object_object_add(o, "busy", json_object_new_boolean(info.writer_active || is_in_flight(info.state)));
    json_object_object_add(o, "readers", json_object_new_int(info.readers));
    json_object_object_add(o, "updated_at_ms", json_object_new_int64(info.updated_at_ms));
    if (info.last_error_kind) {
        json_object* err = json_object_new_object();
        json_object_object_add(err, "kind", json_object_new_string(error_kind_to_str(*info.last_error_kind)));
        json_object_object_add(err, "message", json_util::new_string(info.last_error));
        json_object_object_add(o, "last_error", err);
    } else {
        json_object_object_add(o, "last_error", nullptr);
    }
    if (info.last_invocation) {
        const ProcSummary& p = *info.last_invocation;
        json_object* inv = json_object_new_object();
        json_object_object_add(inv, "argv", json_util::new_string_array(p.argv));
        json_object_object_add(inv, "outcome", json_util::new_string(p.outcome));
        json_object_object_add(inv, "exit_code", json_object_new_int(p.exit_code));
        json_object_object_add(inv, "duration_ms", json_object_new_int64(p.duration_ms));
        json_object_object_add(o, "last_invocation", inv);
    }
    return json_util::to_string(o);
}

// --- WorkspaceRegistry ---

std::shared_ptr<Workspace> WorkspaceRegistry::get_or_create(const std::string& source_path) {
    const std::string key = canonical_path(source_path);
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_source_.find(key);
    if (it != by_source_.end()) return it->second;
    auto ws = std::make_shared<Workspace>(key);
    by_source_.emplace(key, ws);
    return ws;
}

std::shared_ptr<Workspace> WorkspaceRegistry::find(const std::string& source_path) const {
    const std::string key = canonical_path(source_path);
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_source_.find(key);
    return it == by_source_.end() ? nullptr : it->second;
}

std::shared_ptr<Workspace> WorkspaceRegistry::find_by_project_dir(const std::string& project_dir) {
    const std::string key = canonical_path(project_dir);
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_dir_.find(key);
    if (it != by_dir_.end()) return it->second;

    std::error_code ec;
    if (!fs::is_directory(key, ec)) {
        throw ToolError(ErrorKind::PathNotFound, "project directory not found: " + project_dir,
                        "{\"path\":" + json_util::json_quote(project_dir) + "}");
    }
    auto sit = by_source_.find(key);
    if (sit != by_source_.end()) return sit->second;

    // Project decoded outside this server (or by a previous run).
    auto ws = std::make_shared<Workspace>(key);
    if (fs::is_regular_file(fs::path(key) / "apktool.yml", ec)) {
        ws->decode_dir_ = key;
        ws->decoded_ = true;
        ws->state_ = WorkspaceState::Decoded;
        by_dir_.emplace(key, ws);
    }
    by_source_.emplace(key, ws);
    return ws;
}

void WorkspaceRegistry::claim_decode_dir(const std::shared_ptr<Workspace>& ws, const std::string& dir) {
    const std::string key = canonical_path(dir);
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_dir_.find(key);
    if (it != by_dir_.end() && it->second != ws) {
        const Workspace& owner = *it->second;
        std::lock_guard<std::mutex> olk(owner.mu_);
        if (owner.writer_ || owner.readers_ > 0) {
            throw ToolError(ErrorKind::ConcurrentOperationConflict,
                            "output directory in use by " + owner.source_path_,
                            "{\"output_dir\":" + json_util::json_quote(key) +
                                ",\"owner\":" + json_util::json_quote(owner.source_path_) + "}");
        }
    }
    // A workspace decodes into one directory at a time.
    for (auto d = by_dir_.begin(); d != by_dir_.end();) {
        if (d->second == ws && d->first != key) d = by_dir_.erase(d);
        else ++d;
    }
    by_dir_[key] = ws;
}

void WorkspaceRegistry::reset(const std::shared_ptr<Workspace>& ws) {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto d = by_dir_.begin(); d != by_dir_.end();) {
        if (d->second == ws) d = by_dir_.erase(d);
        else ++d;
    }
    ws->reset();
}

std::vector<WorkspaceInfo> WorkspaceRegistry::list() const {
    std::vector<std::shared_ptr<Workspace>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        all.reserve(by_source_.size());
        for (const auto& kv : by_source_) all.push_back(kv.second);
    }
    std::vector<WorkspaceInfo> out;
    out.reserve(all.size());
    for (const auto& ws : all) out.push_back(ws->snapshot());
    std::sort(out.begin(), out.end(),
              [](const WorkspaceInfo& a, const WorkspaceInfo& b) { return a.source_path < b.source_path; });
    return out;
}

size_t WorkspaceRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return by_source_.size();
}

} // namespace apkbridge
