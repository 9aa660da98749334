#include "apkbridge/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <poll.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace apkbridge {

namespace {

// Keeps the first and last halves of a stream once it outgrows the cap.
class BoundedCapture {
public:
    explicit BoundedCapture(size_t cap) : head_cap_(cap - cap / 2), tail_cap_(cap / 2) {}

    void append(const char* p, size_t n) {
        if (head_.size() < head_cap_) {
            size_t take = std::min(n, head_cap_ - head_.size());
            head_.append(p, take);
            p += take;
            n -= take;
        }
        if (n == 0) return;
        if (tail_cap_ == 0) {
            dropped_ += n;
            return;
        }
        tail_.append(p, n);
        if (tail_.size() > tail_cap_) {
            size_t excess = tail_.size() - tail_cap_;
            tail_.erase(0, excess);
            dropped_ += excess;
        }
    }

    bool truncated() const { return dropped_ > 0; }

    std::string str() const {
        if (dropped_ == 0) return head_ + tail_;
        return head_ + "\n...[truncated " + std::to_string(dropped_) + " bytes]...\n" + tail_;
    }

private:
    size_t head_cap_;
    size_t tail_cap_;
    std::string head_;
    std::string tail_;
    size_t dropped_{0};
};

// Child -> parent report written on the close-on-exec pipe when setup fails.
struct SpawnFailure {
    int stage; // 1 = chdir, 2 = exec
    int err;
};

void set_nonblock_cloexec(int fd, bool nonblock) {
    int fl = fcntl(fd, F_GETFD, 0);
    if (fl >= 0) (void)fcntl(fd, F_SETFD, fl | FD_CLOEXEC);
    if (nonblock) {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Read whatever is available on fd. Returns false once the write side is closed.
bool drain_fd(int fd, BoundedCapture& cap) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            cap.append(buf, (size_t)n);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

CancelToken make_cancel_token() {
    return std::make_shared<std::atomic<bool>>(false);
}

const char* proc_outcome_to_str(ProcOutcome o) {
    switch (o) {
        case ProcOutcome::Exited:      return "exited";
        case ProcOutcome::Timeout:     return "timeout";
        case ProcOutcome::Cancelled:   return "cancelled";
        case ProcOutcome::Unavailable: return "unavailable";
        case ProcOutcome::RunnerError: return "runner_error";
    }
    return "runner_error";
}

std::string tail_bytes(const std::string& s, size_t n) {
    if (s.size() <= n) return s;
    return s.substr(s.size() - n);
}

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have_token = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            have_token = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

std::optional<std::string> find_executable(const std::string& name) {
    namespace fs = std::filesystem;
    if (name.empty()) return std::nullopt;

    auto usable = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (usable(name)) return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        fs::path cand = fs::path(dir) / name;
        if (usable(cand)) return cand.string();
        start = end + 1;
    }
    return std::nullopt;
}

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      const CancelToken& cancel,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    auto exe = find_executable(argv[0]);
    if (!exe) {
        res->outcome = ProcOutcome::Unavailable;
        res->error = "executable not found or not executable: " + argv[0];
        return false;
    }
    if (!cwd.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(cwd, ec)) {
            res->error = "working directory does not exist: " + cwd;
            return false;
        }
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int spawn_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe(spawn_pipe) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, spawn_pipe}) { close_fd(p[0]); close_fd(p[1]); }
        return false;
    }
    set_nonblock_cloexec(out_pipe[0], true);
    set_nonblock_cloexec(err_pipe[0], true);
    set_nonblock_cloexec(spawn_pipe[0], false);
    set_nonblock_cloexec(spawn_pipe[1], false);

    // Everything the child touches is prepared before fork.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    const std::string exe_path = *exe;
    const int keep_fd = spawn_pipe[1];

    // scrub loader variables; built here because the child may not allocate
    std::vector<std::string> env_store;
    for (char** e = environ; e && *e; e++) {
        std::string kv = *e;
        if (kv.rfind("LD_PRELOAD=", 0) == 0 || kv.rfind("LD_LIBRARY_PATH=", 0) == 0) continue;
        env_store.push_back(std::move(kv));
    }
    std::vector<char*> cenv;
    cenv.reserve(env_store.size() + 1);
    for (auto& s : env_store) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, spawn_pipe}) { close_fd(p[0]); close_fd(p[1]); }
        return false;
    }

    if (pid == 0) {
        // child
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // own process group so termination reaches the JVM the wrapper spawns
        (void)setpgid(0, 0);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != keep_fd) (void)close(fd);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            SpawnFailure f{1, errno};
            (void)!write(keep_fd, &f, sizeof(f));
            _exit(127);
        }

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        execve(exe_path.c_str(), cargv.data(), cenv.data());
        SpawnFailure f{2, errno};
        (void)!write(keep_fd, &f, sizeof(f));
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(spawn_pipe[1]);

    // The spawn pipe closes on a successful exec; a payload means setup failed.
    SpawnFailure sf{0, 0};
    ssize_t sn;
    do {
        sn = read(spawn_pipe[0], &sf, sizeof(sf));
    } while (sn < 0 && errno == EINTR);
    close_fd(spawn_pipe[0]);

    if (sn == (ssize_t)sizeof(sf)) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        if (sf.stage == 2) {
            res->outcome = ProcOutcome::Unavailable;
            res->error = "cannot execute " + exe_path + ": " + std::strerror(sf.err);
        } else {
            res->error = "chdir(" + cwd + ") failed: " + std::strerror(sf.err);
        }
        return false;
    }

    BoundedCapture out_cap(lim.output_cap_bytes);
    BoundedCapture err_cap(lim.output_cap_bytes);
    bool out_open = true;
    bool err_open = true;

    auto pump = [&](int wait_ms) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) { fds[nfds].fd = out_pipe[0]; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }
        if (err_open) { fds[nfds].fd = err_pipe[0]; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }
        if (nfds == 0) {
            ::usleep((useconds_t)wait_ms * 1000);
            return;
        }
        int pr = poll(fds, nfds, wait_ms);
        if (pr < 0 && errno != EINTR) return;
        if (out_open) out_open = drain_fd(out_pipe[0], out_cap);
        if (err_open) err_open = drain_fd(err_pipe[0], err_cap);
    };

    auto elapsed_ms = [&]() -> int64_t {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    int status = 0;
    bool exited = false;
    ProcOutcome forced = ProcOutcome::Exited;

    while (true) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            exited = true;
            break;
        }

        if (is_cancelled(cancel)) {
            forced = ProcOutcome::Cancelled;
            break;
        }
        int64_t el = elapsed_ms();
        if (lim.timeout_ms > 0 && el >= lim.timeout_ms) {
            forced = ProcOutcome::Timeout;
            break;
        }

        int slice = 50;
        if (lim.timeout_ms > 0) {
            int64_t remaining = lim.timeout_ms - el;
            if (remaining < slice) slice = std::max<int>(1, (int)remaining);
        }
        pump(slice);
    }

    if (!exited) {
        // graceful first, then the whole group is killed
        (void)kill(-pid, SIGTERM);
        (void)kill(pid, SIGTERM);
        auto term_at = std::chrono::steady_clock::now();
        while (true) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                exited = true;
                break;
            }
            int64_t waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - term_at).count();
            if (waited >= lim.kill_grace_ms) break;
            pump(20);
        }
        // leftover group members (e.g. the JVM under a wrapper script) go too
        (void)kill(-pid, SIGKILL);
        if (!exited) {
            (void)kill(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
        }
    }

    // drain anything still buffered; grandchildren may keep the pipes open
    if (out_open) (void)drain_fd(out_pipe[0], out_cap);
    if (err_open) (void)drain_fd(err_pipe[0], err_cap);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    res->duration_ms = elapsed_ms();
    res->out = out_cap.str();
    res->err = err_cap.str();
    res->out_truncated = out_cap.truncated();
    res->err_truncated = err_cap.truncated();
    res->outcome = forced;

    if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->term_signal = WTERMSIG(status);
        res->exit_code = 128 + res->term_signal;
    } else {
        res->exit_code = 128;
    }
    return true;
}

} // namespace apkbridge
