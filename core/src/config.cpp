#include "apkbridge/config.h"
#include "apkbridge/proc.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace apkbridge {

Profile detect_profile() {
    const char* env = std::getenv("APKBRIDGE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("APKBRIDGE_HEAVY_TIMEOUT_MS",    "600000", NO_OVERWRITE);
            setenv("APKBRIDGE_METADATA_TIMEOUT_MS", "30000",  NO_OVERWRITE);
            setenv("APKBRIDGE_OUTPUT_CAP_BYTES",    "262144", NO_OVERWRITE);
            setenv("APKBRIDGE_MAX_WAIT_MS",         "10000",  NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("APKBRIDGE_HEAVY_TIMEOUT_MS",    "300000", NO_OVERWRITE);
            setenv("APKBRIDGE_METADATA_TIMEOUT_MS", "15000",  NO_OVERWRITE);
            setenv("APKBRIDGE_OUTPUT_CAP_BYTES",    "65536",  NO_OVERWRITE);
            setenv("APKBRIDGE_MAX_WAIT_MS",         "5000",   NO_OVERWRITE);
            setenv("APKBRIDGE_KILL_GRACE_MS",       "1000",   NO_OVERWRITE);
            break;
    }
}

long long getenv_ll(const char* name, long long defv) {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    size_t used = 0;
    long long out = 0;
    try {
        out = std::stoll(v, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + ": not an integer: " + v);
    }
    if (used != std::string(v).size()) {
        throw std::runtime_error(std::string(name) + ": not an integer: " + v);
    }
    return out;
}

static std::string default_workspace_root() {
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / "apktool_workspace").string();
    }
    return (std::filesystem::temp_directory_path() / "apktool_workspace").string();
}

static long long require_positive(const char* name, long long v) {
    if (v <= 0) throw std::runtime_error(std::string(name) + " must be positive");
    return v;
}

// Millisecond settings are ints downstream; a wrapped value would disable the deadline.
static int require_int(const char* name, long long v) {
    if (v > INT_MAX || v < INT_MIN) {
        throw std::runtime_error(std::string(name) + " out of range: " + std::to_string(v));
    }
    return static_cast<int>(v);
}

BridgeConfig load_config_from_env() {
    BridgeConfig cfg;

    const char* ws = std::getenv("APKBRIDGE_WORKSPACE");
    cfg.workspace_root = (ws && *ws) ? std::string(ws) : default_workspace_root();

    if (const char* bin = std::getenv("APKBRIDGE_APKTOOL_BIN")) {
        auto toks = split_argv_quoted(bin);
        if (toks.empty()) throw std::runtime_error("APKBRIDGE_APKTOOL_BIN: cannot parse command: " + std::string(bin));
        cfg.apktool_cmd = std::move(toks);
    }

    cfg.heavy_timeout_ms = require_int("APKBRIDGE_HEAVY_TIMEOUT_MS", require_positive("APKBRIDGE_HEAVY_TIMEOUT_MS",
        getenv_ll("APKBRIDGE_HEAVY_TIMEOUT_MS", cfg.heavy_timeout_ms)));
    cfg.metadata_timeout_ms = require_int("APKBRIDGE_METADATA_TIMEOUT_MS", require_positive("APKBRIDGE_METADATA_TIMEOUT_MS",
        getenv_ll("APKBRIDGE_METADATA_TIMEOUT_MS", cfg.metadata_timeout_ms)));
    cfg.kill_grace_ms = require_int("APKBRIDGE_KILL_GRACE_MS",
        getenv_ll("APKBRIDGE_KILL_GRACE_MS", cfg.kill_grace_ms));
    cfg.output_cap_bytes = (size_t)require_positive("APKBRIDGE_OUTPUT_CAP_BYTES",
        getenv_ll("APKBRIDGE_OUTPUT_CAP_BYTES", (long long)cfg.output_cap_bytes));
    cfg.stderr_tail_bytes = (size_t)require_positive("APKBRIDGE_STDERR_TAIL_BYTES",
        getenv_ll("APKBRIDGE_STDERR_TAIL_BYTES", (long long)cfg.stderr_tail_bytes));
    cfg.read_max_bytes = (size_t)require_positive("APKBRIDGE_READ_MAX_BYTES",
        getenv_ll("APKBRIDGE_READ_MAX_BYTES", (long long)cfg.read_max_bytes));
    cfg.max_wait_ms = require_int("APKBRIDGE_MAX_WAIT_MS",
        getenv_ll("APKBRIDGE_MAX_WAIT_MS", cfg.max_wait_ms));
    cfg.list_max_entries = (size_t)require_positive("APKBRIDGE_LIST_MAX_ENTRIES",
        getenv_ll("APKBRIDGE_LIST_MAX_ENTRIES", (long long)cfg.list_max_entries));

    if (cfg.kill_grace_ms < 0) cfg.kill_grace_ms = 0;
    if (cfg.max_wait_ms < 0) cfg.max_wait_ms = 0;

    if (const char* log = std::getenv("APKBRIDGE_EVENT_LOG")) cfg.event_log_path = log;
    return cfg;
}

} // namespace apkbridge
