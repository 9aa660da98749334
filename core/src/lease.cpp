#include "apkbridge/lease.h"
#include "apkbridge/json_util.h"
#include "apkbridge/workspace.h"

#include <chrono>

namespace apkbridge {

const char* lease_mode_to_str(LeaseMode m) {
    return m == LeaseMode::Exclusive ? "exclusive" : "shared";
}

static bool grantable(LeaseMode mode, bool writer, int readers) {
    if (writer) return false;
    if (mode == LeaseMode::Exclusive && readers > 0) return false;
    return true;
}

WorkspaceLease WorkspaceLease::acquire(std::shared_ptr<Workspace> ws, LeaseMode mode, int wait_ms) {
    if (!ws) throw ToolError(ErrorKind::InvalidPrecondition, "lease on a null workspace");

    std::unique_lock<std::mutex> lk(ws->mu_);
    auto ready = [&] { return grantable(mode, ws->writer_, ws->readers_); };
    bool ok = ready();
    if (!ok && wait_ms > 0) {
        ok = ws->cv_.wait_for(lk, std::chrono::milliseconds(wait_ms), ready);
    }
    if (!ok) {
        std::string details = "{\"source_path\":" + json_util::json_quote(ws->source_path_) +
                              ",\"state\":\"" + workspace_state_to_str(ws->state_) + "\"" +
                              ",\"requested\":\"" + lease_mode_to_str(mode) + "\"}";
        throw ToolError(ErrorKind::ConcurrentOperationConflict,
                        std::string("workspace busy (") + workspace_state_to_str(ws->state_) +
                            "): " + ws->source_path_,
                        details);
    }
    if (mode == LeaseMode::Exclusive) ws->writer_ = true;
    else ws->readers_++;
    lk.unlock();
    return WorkspaceLease(std::move(ws), mode);
}

WorkspaceLease::WorkspaceLease(WorkspaceLease&& other) noexcept
    : ws_(std::move(other.ws_)), mode_(other.mode_) {
    other.ws_.reset();
}

WorkspaceLease& WorkspaceLease::operator=(WorkspaceLease&& other) noexcept {
    if (this != &other) {
        release();
        ws_ = std::move(other.ws_);
        mode_ = other.mode_;
        other.ws_.reset();
    }
    return *this;
}

WorkspaceLease::~WorkspaceLease() { release(); }

void WorkspaceLease::release() noexcept {
    if (!ws_) return;
    {
        std::lock_guard<std::mutex> lk(ws_->mu_);
        if (mode_ == LeaseMode::Exclusive) ws_->writer_ = false;
        else if (ws_->readers_ > 0) ws_->readers_--;
    }
    ws_->cv_.notify_all();
    ws_.reset();
}

} // namespace apkbridge
