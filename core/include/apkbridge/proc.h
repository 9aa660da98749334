#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace apkbridge {

// Shared flag set by the transport when the client stops waiting.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

CancelToken make_cancel_token();

inline bool is_cancelled(const CancelToken& t) {
    return t && t->load();
}

struct ProcLimits {
    int timeout_ms{30000};          // <= 0 disables the deadline
    int kill_grace_ms{2000};        // SIGTERM -> SIGKILL escalation delay
    size_t output_cap_bytes{256 * 1024}; // per stream

    bool no_new_privs{true};
};

enum class ProcOutcome {
    Exited,      // ran to completion; see exit_code
    Timeout,     // killed after timeout_ms
    Cancelled,   // killed because the cancel token fired
    Unavailable, // executable missing or not executable
    RunnerError, // pipe/fork/chdir failure on our side
};

const char* proc_outcome_to_str(ProcOutcome o);

struct ProcResult {
    ProcOutcome outcome{ProcOutcome::RunnerError};
    int exit_code{-1};
    int term_signal{0};
    std::string out;
    std::string err;
    bool out_truncated{false};
    bool err_truncated{false};
    int64_t duration_ms{0};
    std::string error; // runner-side reason, not child stderr

    bool ok() const { return outcome == ProcOutcome::Exited && exit_code == 0; }
};

// Run argv (argv[0] resolved through PATH unless it contains '/') in cwd,
// capturing stdout and stderr separately into bounded buffers. Blocks until
// the child exits, the timeout elapses or `cancel` is set; the latter two
// terminate the whole process group (SIGTERM, then SIGKILL after the grace
// period). Returns true if the process started.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      const CancelToken& cancel,
                      ProcResult* res);

// Locate an executable the way execvp would. Returns the resolved path.
std::optional<std::string> find_executable(const std::string& name);

// Last n bytes of s (whole string if shorter).
std::string tail_bytes(const std::string& s, size_t n);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace apkbridge
