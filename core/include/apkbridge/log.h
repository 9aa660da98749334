#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace apkbridge {

// Append-only JSONL record of dispatched calls. One canonical (sorted-key)
// line per event; safe to share across dispatch threads.
class EventLog {
public:
    explicit EventLog(const std::string& path);

    bool is_open() const { return out_.is_open(); }
    const std::string& path() const { return path_; }

    // payload_json must be a JSON object; anything else is stored as a string.
    void event(const std::string& name, const std::string& payload_json);

    uint64_t seq() const;

private:
    std::string path_;
    std::ofstream out_;
    mutable std::mutex mu_;
    uint64_t seq_{0};
};

// Sorted-key serialization, used for deterministic log lines.
std::string canonicalize_json(const std::string& raw);

} // namespace apkbridge
