#include "test_common.h"
#include "apkbridge/config.h"

#include <cstdlib>
#include <stdexcept>

static const char* kVars[] = {
    "APKBRIDGE_PROFILE", "APKBRIDGE_WORKSPACE", "APKBRIDGE_APKTOOL_BIN", "APKBRIDGE_HEAVY_TIMEOUT_MS",
    "APKBRIDGE_METADATA_TIMEOUT_MS", "APKBRIDGE_KILL_GRACE_MS", "APKBRIDGE_OUTPUT_CAP_BYTES",
    "APKBRIDGE_STDERR_TAIL_BYTES", "APKBRIDGE_READ_MAX_BYTES", "APKBRIDGE_MAX_WAIT_MS",
    "APKBRIDGE_LIST_MAX_ENTRIES", "APKBRIDGE_EVENT_LOG",
};

static void clear_env() {
    for (const char* v : kVars) unsetenv(v);
}

int main() {
    clear_env();

    // Test 1: Default profile is DEV
    auto p = apkbridge::detect_profile();
    expect_true(p == apkbridge::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("APKBRIDGE_PROFILE", "prod", 1);
    expect_true(apkbridge::detect_profile() == apkbridge::Profile::PROD, "should detect PROD");
    setenv("APKBRIDGE_PROFILE", "PRODUCTION", 1);
    expect_true(apkbridge::detect_profile() == apkbridge::Profile::PROD, "should detect PRODUCTION");

    // Test 3: Apply defaults (won't override existing)
    setenv("APKBRIDGE_HEAVY_TIMEOUT_MS", "42", 1);
    apkbridge::apply_profile_defaults(apkbridge::Profile::PROD);
    std::string val = std::getenv("APKBRIDGE_HEAVY_TIMEOUT_MS") ? std::getenv("APKBRIDGE_HEAVY_TIMEOUT_MS") : "";
    expect_true(val == "42", "should NOT override pre-existing env var");

    // Test 4: Apply sets missing vars
    val = std::getenv("APKBRIDGE_METADATA_TIMEOUT_MS") ? std::getenv("APKBRIDGE_METADATA_TIMEOUT_MS") : "";
    expect_true(val == "15000", "PROD metadata timeout");
    clear_env();
    apkbridge::apply_profile_defaults(apkbridge::Profile::DEV);
    val = std::getenv("APKBRIDGE_HEAVY_TIMEOUT_MS") ? std::getenv("APKBRIDGE_HEAVY_TIMEOUT_MS") : "";
    expect_true(val == "600000", "DEV heavy timeout");

    // Test 5: Profile name
    expect_true(std::string(apkbridge::profile_name(apkbridge::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(apkbridge::profile_name(apkbridge::Profile::PROD)) == "prod", "prod name");

    // Test 6: load_config_from_env
    clear_env();
    setenv("HOME", "/home/tester", 1);
    {
        auto cfg = apkbridge::load_config_from_env();
        expect_true(cfg.workspace_root == "/home/tester/apktool_workspace", "default workspace: " + cfg.workspace_root);
        expect_true(cfg.apktool_cmd.size() == 1 && cfg.apktool_cmd[0] == "apktool", "default apktool");
        expect_eq_ll(cfg.stderr_tail_bytes, 4096, "default tail");
        expect_true(cfg.event_log_path.empty(), "event log off by default");
    }
    setenv("APKBRIDGE_WORKSPACE", "/srv/apk", 1);
    setenv("APKBRIDGE_APKTOOL_BIN", "java -jar \"/opt/apk tool/apktool.jar\"", 1);
    setenv("APKBRIDGE_HEAVY_TIMEOUT_MS", "1234", 1);
    setenv("APKBRIDGE_EVENT_LOG", "/tmp/events.jsonl", 1);
    {
        auto cfg = apkbridge::load_config_from_env();
        expect_true(cfg.workspace_root == "/srv/apk", "workspace override");
        expect_eq_ll((long long)cfg.apktool_cmd.size(), 3, "apktool argv prefix");
        expect_true(cfg.apktool_cmd[2] == "/opt/apk tool/apktool.jar", "quoted jar path");
        expect_eq_ll(cfg.heavy_timeout_ms, 1234, "heavy timeout override");
        expect_true(cfg.event_log_path == "/tmp/events.jsonl", "event log path");
    }

    // Test 7: malformed values are rejected
    setenv("APKBRIDGE_HEAVY_TIMEOUT_MS", "12ms", 1);
    try {
        (void)apkbridge::load_config_from_env();
        die("garbage integer should throw");
    } catch (const std::runtime_error&) {
    }
    setenv("APKBRIDGE_HEAVY_TIMEOUT_MS", "0", 1);
    try {
        (void)apkbridge::load_config_from_env();
        die("zero timeout should throw");
    } catch (const std::runtime_error&) {
    }
    // a value past INT_MAX must not wrap into "no deadline"
    setenv("APKBRIDGE_HEAVY_TIMEOUT_MS", "3000000000", 1);
    try {
        (void)apkbridge::load_config_from_env();
        die("oversized timeout should throw");
    } catch (const std::runtime_error&) {
    }
    setenv("APKBRIDGE_HEAVY_TIMEOUT_MS", "2147483647", 1);
    expect_eq_ll(apkbridge::load_config_from_env().heavy_timeout_ms, 2147483647LL, "INT_MAX timeout accepted");
    setenv("APKBRIDGE_KILL_GRACE_MS", "99999999999", 1);
    try {
        (void)apkbridge::load_config_from_env();
        die("oversized kill grace should throw");
    } catch (const std::runtime_error&) {
    }

    clear_env();
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
