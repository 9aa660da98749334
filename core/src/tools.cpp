#include "apkbridge/tools.h"
#include "apkbridge/json_util.h"

#include <algorithm>

namespace apkbridge {

std::string ToolContext::arg_string(const char* key, const std::string& defv) const {
    return json_util::get_string(args, key).value_or(defv);
}

bool ToolContext::arg_bool(const char* key, bool defv) const {
    return json_util::get_bool(args, key).value_or(defv);
}

int64_t ToolContext::arg_int(const char* key, int64_t defv) const {
    return json_util::get_int(args, key).value_or(defv);
}

std::vector<std::string> ToolContext::arg_list(const char* key) const {
    return json_util::get_string_array(args, key);
}

bool ToolContext::has_arg(const char* key) const {
    return json_util::get(args, key) != nullptr;
}

int ToolContext::effective_timeout_ms() const {
    int base = desc.timeout_class == TimeoutClass::Heavy ? config.heavy_timeout_ms
                                                         : config.metadata_timeout_ms;
    int64_t req = arg_int("timeout_ms", 0);
    if (req > 0 && (base <= 0 || req < base)) return (int)req;
    return base;
}

std::vector<std::string> ToolContext::apktool_argv(const std::vector<std::string>& args) const {
    std::vector<std::string> argv = config.apktool_cmd;
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

ProcResult ToolContext::run_process(const std::vector<std::string>& argv, const std::string& cwd) {
    ProcLimits lim;
    lim.timeout_ms = effective_timeout_ms();
    lim.kill_grace_ms = config.kill_grace_ms;
    lim.output_cap_bytes = config.output_cap_bytes;

    ProcResult r;
    (void)proc_run_capture(argv, cwd, lim, cancel, &r);

    ProcSummary sum;
    sum.argv = argv;
    sum.outcome = proc_outcome_to_str(r.outcome);
    sum.exit_code = r.exit_code;
    sum.duration_ms = r.duration_ms;
    last_invocation = sum;

    const std::string exe = argv.empty() ? std::string() : argv[0];
    const std::string stderr_tail = tail_bytes(r.err, config.stderr_tail_bytes);

    switch (r.outcome) {
        case ProcOutcome::Unavailable:
            throw ToolError(ErrorKind::ToolUnavailable,
                            "external tool not available: " + exe + (r.error.empty() ? "" : " (" + r.error + ")"),
                            "{\"executable\":" + json_util::json_quote(exe) + "}");
        case ProcOutcome::Timeout:
            throw ToolError(ErrorKind::Timeout,
                            exe + " timed out after " + std::to_string(lim.timeout_ms) + " ms",
                            "{\"timeout_ms\":" + std::to_string(lim.timeout_ms) +
                                ",\"stderr_tail\":" + json_util::json_quote(stderr_tail) + "}");
        case ProcOutcome::Cancelled:
            throw ToolError(ErrorKind::Cancelled, exe + " cancelled by client",
                            "{\"duration_ms\":" + std::to_string(r.duration_ms) + "}");
        case ProcOutcome::RunnerError:
            // pipe, fork or chdir trouble on our side; the tool never ran
            throw ToolError(ErrorKind::IoError, "cannot run " + exe + ": " + r.error,
                            "{\"executable\":" + json_util::json_quote(exe) +
                                ",\"cwd\":" + json_util::json_quote(cwd) + "}");
        case ProcOutcome::Exited:
            break;
    }

    if (r.exit_code != 0) {
        std::string msg = exe + " exited with code " + std::to_string(r.exit_code);
        if (r.term_signal) msg = exe + " killed by signal " + std::to_string(r.term_signal);
        // last stderr line is usually apktool's own summary
        std::string last = stderr_tail;
        while (!last.empty() && (last.back() == '\n' || last.back() == '\r')) last.pop_back();
        size_t nl = last.rfind('\n');
        if (nl != std::string::npos) last = last.substr(nl + 1);
        if (!last.empty()) msg += ": " + last;
        throw ToolError(ErrorKind::ProcessFailure, msg,
                        "{\"exit_code\":" + std::to_string(r.exit_code) +
                            ",\"term_signal\":" + std::to_string(r.term_signal) +
                            ",\"stderr_tail\":" + json_util::json_quote(stderr_tail) + "}");
    }
    return r;
}

void register_builtin_tools(ToolRegistry& reg) {
    register_apktool_tools(reg);
    register_fs_tools(reg);
    register_session_tools(reg);
}

} // namespace apkbridge
