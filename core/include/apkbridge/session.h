#pragma once
#include "dispatcher.h"

#include <atomic>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace apkbridge {

// Newline-delimited JSON over a pair of streams.
//
// Inbound frames:
//   {"id":"7","tool":"decode_apk","arguments":{...}}   one tool call
//   {"cancel":"7"}                                      cancel call 7
//   {"list_tools":true}                                 descriptor listing
// An empty line stops reading and lets in-flight calls finish; EOF cancels
// them. Each call runs on its own thread and produces exactly one response
// line; lines are written whole under a mutex.
class StdioSession {
public:
    StdioSession(Dispatcher& dispatcher, std::istream& in, std::ostream& out)
        : dispatcher_(dispatcher), in_(in), out_(out) {}
    ~StdioSession();

    StdioSession(const StdioSession&) = delete;
    StdioSession& operator=(const StdioSession&) = delete;

    // Serve until EOF or an empty line. Returns the number of tool calls started.
    int run();

    // One inbound frame.
    void handle_line(const std::string& line);

    // Fire every in-flight cancel token.
    void cancel_all();
    // Wait for every started call to respond.
    void join_all();

    size_t in_flight() const;

private:
    struct Worker {
        std::thread th;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void start_call(std::string id, std::string tool, std::string args_json);
    void write_line(const std::string& line);
    void reap();

    Dispatcher& dispatcher_;
    std::istream& in_;
    std::ostream& out_;

    std::mutex out_mu_;
    mutable std::mutex calls_mu_;
    std::unordered_map<std::string, CancelToken> inflight_;
    std::vector<Worker> workers_;
    uint64_t anon_seq_{0};
    int started_{0};
};

} // namespace apkbridge
