#include "apkbridge/session.h"
#include "apkbridge/json_util.h"

#include <iostream>

namespace apkbridge {

StdioSession::~StdioSession() {
    cancel_all();
    join_all();
}

int StdioSession::run() {
    std::string line;
    bool eof = true;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            eof = false; // graceful shutdown
            break;
        }
        handle_line(line);
        reap();
    }
    if (eof) {
        size_t n = in_flight();
        if (n) std::cerr << "[serve] input closed, cancelling " << n << " in-flight call(s)\n";
        cancel_all();
    }
    join_all();
    return started_;
}

void StdioSession::handle_line(const std::string& line) {
    json_util::Doc req = json_util::parse(line);
    if (!req || !json_object_is_type(req.root, json_type_object)) {
        ToolResponse r = ToolResponse::failure(
            ToolError(ErrorKind::InvalidArguments, "frame is not a JSON object"));
        write_line(r.to_json());
        return;
    }

    // ids may arrive as numbers; they are echoed back as strings
    std::string id;
    if (json_object* v = json_util::get(req.root, "id")) {
        id = json_object_is_type(v, json_type_string) ? json_object_get_string(v)
                                                      : json_util::to_string(v);
    }

    if (json_object* c = json_util::get(req.root, "cancel")) {
        std::string target = json_object_is_type(c, json_type_string) ? json_object_get_string(c)
                                                                      : json_util::to_string(c);
        bool found = false;
        {
            std::lock_guard<std::mutex> lk(calls_mu_);
            auto it = inflight_.find(target);
            if (it != inflight_.end()) {
                it->second->store(true);
                found = true;
            }
        }
        write_line("{\"cancel\":" + json_util::json_quote(target) + ",\"found\":" + (found ? "true" : "false") + "}");
        return;
    }

    if (json_util::get_bool(req.root, "list_tools").value_or(false)) {
        std::string arr = "[";
        bool first = true;
        for (const ToolDesc* d : dispatcher_.tools().all()) {
            if (!first) arr += ",";
            first = false;
            arr += tool_desc_to_json(*d);
        }
        arr += "]";
        write_line(ToolResponse::success("{\"tools\":" + arr + "}").to_json(id));
        return;
    }

    auto tool = json_util::get_string(req.root, "tool");
    if (!tool || tool->empty()) {
        ToolResponse r = ToolResponse::failure(ToolError(
            ErrorKind::InvalidArguments, "frame has no tool name",
            "{\"fields\":[{\"name\":\"tool\",\"problem\":\"required\"}]}"));
        write_line(r.to_json(id));
        return;
    }

    std::string args_json;
    if (json_object* a = json_util::get(req.root, "arguments")) args_json = json_util::to_string(a);

    {
        std::lock_guard<std::mutex> lk(calls_mu_);
        if (!id.empty() && inflight_.count(id)) {
            ToolResponse r = ToolResponse::failure(ToolError(
                ErrorKind::InvalidArguments, "call id already in flight: " + id,
                "{\"fields\":[{\"name\":\"id\",\"problem\":\"duplicate in-flight id\"}]}"));
            write_line(r.to_json(id));
            return;
        }
    }
    start_call(std::move(id), std::move(*tool), std::move(args_json));
}

void StdioSession::start_call(std::string id, std::string tool, std::string args_json) {
    CancelToken token = make_cancel_token();
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::string key = id;
    std::lock_guard<std::mutex> lk(calls_mu_);
    if (key.empty()) key = "\x01anon-" + std::to_string(++anon_seq_);
    inflight_.emplace(key, token);
    started_++;

    Worker w;
    w.done = done;
    w.th = std::thread([this, id, key, tool, args_json, token, done]() {
        ToolCall call{id, tool, args_json};
        ToolResponse resp = dispatcher_.dispatch(call, token);
        write_line(resp.to_json(id));
        {
            std::lock_guard<std::mutex> l2(calls_mu_);
            inflight_.erase(key);
        }
        done->store(true);
    });
    workers_.push_back(std::move(w));
}

void StdioSession::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(out_mu_);
    out_ << line << "\n";
    out_.flush();
}

void StdioSession::reap() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lk(calls_mu_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w.th.joinable()) w.th.join();
    }
}

void StdioSession::cancel_all() {
    std::lock_guard<std::mutex> lk(calls_mu_);
    for (auto& kv : inflight_) kv.second->store(true);
}

void StdioSession::join_all() {
    std::vector<Worker> all;
    {
        std::lock_guard<std::mutex> lk(calls_mu_);
        all.swap(workers_);
    }
    for (auto& w : all) {
        if (w.th.joinable()) w.th.join();
    }
}

size_t StdioSession::in_flight() const {
    std::lock_guard<std::mutex> lk(calls_mu_);
    return inflight_.size();
}

} // namespace apkbridge
