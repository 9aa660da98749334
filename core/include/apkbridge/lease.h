#pragma once

// Workspace leases: scoped access rights on one workspace.
//
//   - Exclusive: a mutating call (decode, build, write). At most one, and
//     only while no shared lease is held.
//   - Shared: a read inside the decoded tree. Any number may coexist, but
//     none while an exclusive lease is held.
//
// Acquisition never queues by default: a conflicting request fails with
// ConcurrentOperationConflict. Callers that are allowed to wait pass a
// bounded wait_ms.

#include <memory>

namespace apkbridge {

class Workspace;

enum class LeaseMode { Shared, Exclusive };

const char* lease_mode_to_str(LeaseMode m);

class WorkspaceLease {
public:
    // Throws ToolError(ConcurrentOperationConflict) if the lease cannot be
    // granted within wait_ms (0 = fail fast).
    static WorkspaceLease acquire(std::shared_ptr<Workspace> ws, LeaseMode mode, int wait_ms = 0);

    WorkspaceLease(WorkspaceLease&& other) noexcept;
    WorkspaceLease& operator=(WorkspaceLease&& other) noexcept;
    WorkspaceLease(const WorkspaceLease&) = delete;
    WorkspaceLease& operator=(const WorkspaceLease&) = delete;
    ~WorkspaceLease();

    void release() noexcept;

    bool held() const { return ws_ != nullptr; }
    LeaseMode mode() const { return mode_; }
    Workspace& workspace() const { return *ws_; }

private:
    WorkspaceLease(std::shared_ptr<Workspace> ws, LeaseMode mode)
        : ws_(std::move(ws)), mode_(mode) {}

    std::shared_ptr<Workspace> ws_;
    LeaseMode mode_{LeaseMode::Shared};
};

} // namespace apkbridge
