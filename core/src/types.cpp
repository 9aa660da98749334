#include "apkbridge/types.h"

#include <chrono>

namespace apkbridge {

const char* error_kind_to_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::ToolNotFound: return "ToolNotFound";
        case ErrorKind::DuplicateTool: return "DuplicateTool";
        case ErrorKind::InvalidArguments: return "InvalidArguments";
        case ErrorKind::InvalidPrecondition: return "InvalidPrecondition";
        case ErrorKind::ConcurrentOperationConflict: return "ConcurrentOperationConflict";
        case ErrorKind::ToolUnavailable: return "ToolUnavailable";
        case ErrorKind::ProcessFailure: return "ProcessFailure";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::PathNotFound: return "PathNotFound";
        case ErrorKind::PathTraversal: return "PathTraversal";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::IoError: return "IoError";
    }
    return "IoError";
}

std::optional<ErrorKind> error_kind_from_str(const std::string& s) {
    static const ErrorKind all[] = {
        ErrorKind::ToolNotFound, ErrorKind::DuplicateTool, ErrorKind::InvalidArguments,
        ErrorKind::InvalidPrecondition, ErrorKind::ConcurrentOperationConflict,
        ErrorKind::ToolUnavailable, ErrorKind::ProcessFailure, ErrorKind::Timeout,
        ErrorKind::PathNotFound, ErrorKind::PathTraversal, ErrorKind::Cancelled,
        ErrorKind::IoError,
    };
    for (ErrorKind k : all) {
        if (s == error_kind_to_str(k)) return k;
    }
    return std::nullopt;
}

const char* workspace_state_to_str(WorkspaceState s) {
    switch (s) {
        case WorkspaceState::Unopened: return "Unopened";
        case WorkspaceState::Decoding: return "Decoding";
        case WorkspaceState::Decoded:  return "Decoded";
        case WorkspaceState::Building: return "Building";
        case WorkspaceState::Built:    return "Built";
        case WorkspaceState::Failed:   return "Failed";
    }
    return "Unopened";
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace apkbridge
