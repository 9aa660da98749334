#pragma once
#include "lease.h"
#include "types.h"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace apkbridge {

// Summary of the most recent external-process invocation on a workspace.
struct ProcSummary {
    std::vector<std::string> argv;
    std::string outcome;       // proc_outcome_to_str()
    int exit_code{-1};
    int64_t duration_ms{0};
};

// Point-in-time copy of a workspace record.
struct WorkspaceInfo {
    std::string source_path;
    std::string decode_dir;            // empty until a decode has succeeded
    WorkspaceState state{WorkspaceState::Unopened};
    bool decoded{false};               // decode_dir holds a complete decode
    std::optional<ErrorKind> last_error_kind;
    std::string last_error;
    int64_t updated_at_ms{0};
    std::optional<ProcSummary> last_invocation;
    bool writer_active{false};
    int readers{0};
};

std::string workspace_info_to_json(const WorkspaceInfo& info);

bool is_legal_transition(WorkspaceState from, WorkspaceState to);

class Workspace {
public:
    explicit Workspace(std::string source_path);

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::string& source_path() const { return source_path_; }

    WorkspaceInfo snapshot() const;
    WorkspaceState state() const;
    std::string decode_dir() const;

    // A completed decode exists and nothing is rewriting it.
    bool has_decode() const;
    // Decoded, Built, or Failed with a usable decode.
    bool can_build() const;

    // Move to `next` along a legal edge; throws ToolError(InvalidPrecondition).
    // Entering Decoding invalidates the previous decode.
    void transition(WorkspaceState next);

    // Decoding -> Decoded with the tree now at dir.
    void mark_decoded(const std::string& dir);

    // Back to Unopened with no decode and no error.
    void reset();

    void record_error(ErrorKind kind, const std::string& message);
    void clear_error();
    void record_invocation(ProcSummary summary);

    // Block until no mutating call is in flight, at most wait_ms.
    // Returns true if the workspace is idle on return.
    bool wait_idle(int wait_ms) const;

private:
    friend class WorkspaceLease;
    friend class WorkspaceRegistry;

    void set_state_locked(WorkspaceState next);

    const std::string source_path_;

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    bool writer_{false};
    int readers_{0};

    WorkspaceState state_{WorkspaceState::Unopened};
    std::string decode_dir_;
    bool decoded_{false};
    std::optional<ErrorKind> last_error_kind_;
    std::string last_error_;
    int64_t updated_at_ms_{0};
    std::optional<ProcSummary> last_invocation_;
};

// Process-lifetime map from canonical APK path to its workspace. Grows
// monotonically; the registry mutex only guards the maps, each workspace
// carries its own lock so unrelated APKs never serialize.
class WorkspaceRegistry {
public:
    // Canonicalizes source_path; creates the workspace Unopened on first use.
    std::shared_ptr<Workspace> get_or_create(const std::string& source_path);

    // Existing workspace for a source path, or nullptr.
    std::shared_ptr<Workspace> find(const std::string& source_path) const;

    // Workspace that owns (or is decoding into) project_dir. An unknown
    // directory holding apktool.yml is adopted as Decoded; any other existing
    // directory becomes an Unopened workspace keyed by itself.
    // Throws ToolError(PathNotFound) if the directory does not exist.
    std::shared_ptr<Workspace> find_by_project_dir(const std::string& project_dir);

    // Route project_dir lookups to ws before a decode writes there.
    // Throws ToolError(ConcurrentOperationConflict) if another busy
    // workspace currently owns the directory.
    void claim_decode_dir(const std::shared_ptr<Workspace>& ws, const std::string& dir);

    void transition(Workspace& ws, WorkspaceState next) { ws.transition(next); }

    // The project directory of ws was deleted: forget its directory routes
    // and return it to Unopened. The source-path entry stays.
    void reset(const std::shared_ptr<Workspace>& ws);

    // Run fn(Workspace&) under a lease on the workspace for source_path;
    // the lease is released on every exit path.
    template <class Fn>
    auto with_lock(const std::string& source_path, LeaseMode mode, int wait_ms, Fn&& fn) {
        return with_lock(get_or_create(source_path), mode, wait_ms, std::forward<Fn>(fn));
    }

    template <class Fn>
    auto with_lock(std::shared_ptr<Workspace> ws, LeaseMode mode, int wait_ms, Fn&& fn) {
        WorkspaceLease lease = WorkspaceLease::acquire(ws, mode, wait_ms);
        return fn(*ws);
    }

    std::vector<WorkspaceInfo> list() const;
    size_t size() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<Workspace>> by_source_;
    std::unordered_map<std::string, std::shared_ptr<Workspace>> by_dir_;
};

} // namespace apkbridge
