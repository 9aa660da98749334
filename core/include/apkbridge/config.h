#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace apkbridge {

enum class Profile { DEV, PROD };

// Detect profile from APKBRIDGE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: generous timeouts and output caps
// PROD: tighter timeouts, smaller caps, shorter waits
void apply_profile_defaults(Profile p);

struct BridgeConfig {
    std::string workspace_root;                 // default decode destination
    std::vector<std::string> apktool_cmd{"apktool"}; // argv prefix, e.g. {"java","-jar","apktool.jar"}

    int heavy_timeout_ms{300000};    // decode / build
    int metadata_timeout_ms{30000};  // version probe and similar
    int kill_grace_ms{2000};
    size_t output_cap_bytes{256 * 1024};
    size_t stderr_tail_bytes{4096};
    size_t read_max_bytes{1024 * 1024};
    int max_wait_ms{10000};
    size_t list_max_entries{10000};

    std::string event_log_path;      // empty: event log disabled
};

// Read APKBRIDGE_* variables on top of the built-in defaults.
// Throws std::runtime_error on malformed values.
BridgeConfig load_config_from_env();

// Parse an integer env var; defv when unset. Throws on garbage.
long long getenv_ll(const char* name, long long defv);

} // namespace apkbridge
