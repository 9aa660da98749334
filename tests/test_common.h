#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

inline void die(const std::string& msg) {
    std::cerr << "TEST FAIL: " << msg << std::endl;
    std::exit(1);
}

inline void expect_true(bool cond, const std::string& msg) {
    if (!cond) die(msg);
}

inline void expect_eq_ll(long long a, long long b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=" + std::to_string(a) + ", want=" + std::to_string(b) + ")");
    }
}

inline void expect_eq_str(const std::string& a, const std::string& b, const std::string& msg) {
    if (a != b) die(msg + " (got=\"" + a + "\", want=\"" + b + "\")");
}

// Fresh directory under TMPDIR; removed by the caller if it cares.
inline std::filesystem::path make_temp_dir(const std::string& tag) {
    std::filesystem::path base = std::filesystem::temp_directory_path();
    std::string tmpl = (base / ("apkbridge_" + tag + "_XXXXXX")).string();
    if (!::mkdtemp(&tmpl[0])) die("mkdtemp failed for " + tag);
    return std::filesystem::path(tmpl);
}

inline void write_text(const std::filesystem::path& p, const std::string& content) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) die("cannot write " + p.string());
    f << content;
}

inline std::string read_text(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Stand-in for apktool. Decode writes a small project with apktool.yml,
// build writes the output APK. Switches (environment):
//   FAKE_APKTOOL_FAIL=1   print an error to stderr and exit 1
//   FAKE_APKTOOL_NOOP=1   exit 0 without producing anything
//   FAKE_APKTOOL_SLEEP=N  sleep N seconds first
//   FAKE_APKTOOL_SPAM=1   write ~1 MB to stderr first
inline std::string write_fake_apktool(const std::filesystem::path& dir) {
    const std::filesystem::path p = dir / "fake-apktool";
    write_text(p,
        "#!/bin/sh\n"
        "mode=\"$1\"\n"
        "if [ \"$mode\" = \"--version\" ]; then echo \"2.9.3-fake\"; exit 0; fi\n"
        "if [ -n \"$FAKE_APKTOOL_SLEEP\" ]; then sleep \"$FAKE_APKTOOL_SLEEP\"; fi\n"
        "if [ -n \"$FAKE_APKTOOL_SPAM\" ]; then\n"
        "  i=0\n"
        "  while [ $i -lt 16384 ]; do\n"
        "    echo \"I: spam line $i aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa\" >&2\n"
        "    i=$((i+1))\n"
        "  done\n"
        "fi\n"
        "if [ -n \"$FAKE_APKTOOL_FAIL\" ]; then\n"
        "  echo \"I: Using Apktool 2.9.3-fake\" >&2\n"
        "  echo \"brut.androlib.AndrolibException: fake failure\" >&2\n"
        "  exit 1\n"
        "fi\n"
        "if [ -n \"$FAKE_APKTOOL_NOOP\" ]; then exit 0; fi\n"
        "src=\"$2\"\n"
        "shift 2\n"
        "out=\"\"\n"
        "while [ $# -gt 0 ]; do\n"
        "  case \"$1\" in\n"
        "    -o) out=\"$2\"; shift 2 ;;\n"
        "    *) shift ;;\n"
        "  esac\n"
        "done\n"
        "case \"$mode\" in\n"
        "  d)\n"
        "    [ -f \"$src\" ] || { echo \"Input file ($src) was not found\" >&2; exit 1; }\n"
        "    rm -rf \"$out\"\n"
        "    mkdir -p \"$out/res/values\" \"$out/res/layout\" \"$out/smali/com/example\"\n"
        "    echo \"version: 2.9.3\" > \"$out/apktool.yml\"\n"
        "    echo '<manifest package=\"com.example.demo\"/>' > \"$out/AndroidManifest.xml\"\n"
        "    echo '<resources><string name=\"app_name\">Demo</string></resources>' > \"$out/res/values/strings.xml\"\n"
        "    echo '<LinearLayout/>' > \"$out/res/layout/main.xml\"\n"
        "    echo '<LinearLayout android:id=\"@+id/detail\"/>' > \"$out/res/layout/detail.xml\"\n"
        "    echo '.class public Lcom/example/Main;' > \"$out/smali/com/example/Main.smali\"\n"
        "    echo 'Decoded'\n"
        "    exit 0 ;;\n"
        "  b)\n"
        "    [ -f \"$src/apktool.yml\" ] || { echo \"$src is not an apktool project\" >&2; exit 1; }\n"
        "    mkdir -p \"$(dirname \"$out\")\"\n"
        "    echo 'PK fake apk' > \"$out\"\n"
        "    exit 0 ;;\n"
        "esac\n"
        "echo \"unknown command: $mode\" >&2\n"
        "exit 2\n");
    ::chmod(p.c_str(), 0755);
    return p.string();
}

// A file that passes for an APK as far as the bridge is concerned.
inline std::string write_fake_apk(const std::filesystem::path& dir, const std::string& name) {
    const std::filesystem::path p = dir / name;
    write_text(p, "PK\x03\x04 not really a zip");
    return p.string();
}
