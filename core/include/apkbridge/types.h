#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace apkbridge {

// Stable error taxonomy reported to clients as the "kind" field.
enum class ErrorKind {
    ToolNotFound,
    DuplicateTool,
    InvalidArguments,
    InvalidPrecondition,
    ConcurrentOperationConflict,
    ToolUnavailable,
    ProcessFailure,
    Timeout,
    PathNotFound,
    PathTraversal,
    Cancelled,
    IoError,
};

const char* error_kind_to_str(ErrorKind k);
std::optional<ErrorKind> error_kind_from_str(const std::string& s);

// Lifecycle of one APK under management.
enum class WorkspaceState {
    Unopened,
    Decoding,
    Decoded,
    Building,
    Built,
    Failed,
};

const char* workspace_state_to_str(WorkspaceState s);

// Decoding/Building: a mutating call owns the workspace.
inline bool is_in_flight(WorkspaceState s) {
    return s == WorkspaceState::Decoding || s == WorkspaceState::Building;
}

// Typed failure raised by registries, handlers and the dispatcher.
// details_json is a JSON object (or empty) attached to the error response.
class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind, const std::string& message, std::string details_json = "")
        : std::runtime_error(message), kind_(kind), details_json_(std::move(details_json)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& details_json() const noexcept { return details_json_; }

private:
    ErrorKind kind_;
    std::string details_json_;
};

int64_t now_ms();

} // namespace apkbridge
