#include "apkbridge/config.h"
#include "apkbridge/dispatcher.h"
#include "apkbridge/log.h"
#include "apkbridge/registry.h"
#include "apkbridge/session.h"
#include "apkbridge/tools.h"
#include "apkbridge/workspace.h"

#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace apkbridge;

namespace {

struct Runtime {
    BridgeConfig config;
    ToolRegistry tools;
    WorkspaceRegistry workspaces;
    std::unique_ptr<EventLog> events;
};

// Startup failures (bad config, duplicate tool) exit with code 2.
bool setup(Runtime& rt) {
    Profile prof = detect_profile();
    apply_profile_defaults(prof);
    try {
        rt.config = load_config_from_env();
    } catch (const std::exception& e) {
        std::cerr << "[setup] configuration error: " << e.what() << "\n";
        return false;
    }
    try {
        register_builtin_tools(rt.tools);
    } catch (const ToolError& e) {
        std::cerr << "[setup] " << error_kind_to_str(e.kind()) << ": " << e.what() << "\n";
        return false;
    }
    rt.tools.freeze();

    if (!rt.config.event_log_path.empty()) {
        rt.events = std::make_unique<EventLog>(rt.config.event_log_path);
        if (!rt.events->is_open()) {
            std::cerr << "[setup] WARNING: cannot open event log " << rt.config.event_log_path << "\n";
        }
    }
    std::cerr << "[setup] profile=" << profile_name(prof)
              << " workspace=" << rt.config.workspace_root
              << " apktool=" << rt.config.apktool_cmd.front()
              << " tools=" << rt.tools.size() << "\n";
    return true;
}

int cmd_serve(Runtime& rt) {
    Dispatcher dispatcher(rt.tools, rt.workspaces, rt.config, rt.events.get());
    StdioSession session(dispatcher, std::cin, std::cout);
    std::cerr << "[serve] ready (NDJSON on stdin/stdout)\n";
    int n = session.run();
    std::cerr << "[serve] shutdown after " << n << " call(s)\n";
    return 0;
}

int cmd_call(Runtime& rt, int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: apkbridge call <tool> [arguments_json]\n";
        return 2;
    }
    ToolCall call;
    call.tool = argv[2];
    call.arguments_json = argc > 3 ? argv[3] : "";
    Dispatcher dispatcher(rt.tools, rt.workspaces, rt.config, rt.events.get());
    ToolResponse resp = dispatcher.dispatch(call);
    std::cout << resp.to_json() << "\n";
    return resp.ok ? 0 : 1;
}

int cmd_tools(Runtime& rt) {
    std::cout << "[";
    bool first = true;
    for (const ToolDesc* d : rt.tools.all()) {
        if (!first) std::cout << ",";
        first = false;
        std::cout << "\n  " << tool_desc_to_json(*d);
    }
    std::cout << "\n]\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "apkbridge <serve|call|tools> ...\n"
                     "  serve                      NDJSON tool calls on stdin/stdout\n"
                     "  call <tool> [args_json]    run one tool call and print the response\n"
                     "  tools                      print tool descriptors\n";
        return 2;
    }
    // a client that hangs up must not kill in-flight cleanup
    std::signal(SIGPIPE, SIG_IGN);

    Runtime rt;
    if (!setup(rt)) return 2;

    const std::string cmd = argv[1];
    if (cmd == "serve") return cmd_serve(rt);
    if (cmd == "call") return cmd_call(rt, argc, argv);
    if (cmd == "tools") return cmd_tools(rt);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
