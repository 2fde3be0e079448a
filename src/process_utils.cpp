#include "process_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace procutil {

static std::atomic<int> g_live_children{0};

int live_children() { return g_live_children.load(); }

namespace {

struct FdGuard {
    int fd = -1;
    FdGuard() = default;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    void reset() {
        if (fd >= 0)
            ::close(fd);
        fd = -1;
    }
};

struct Pipe {
    FdGuard r;
    FdGuard w;
    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0)
            return false;
        r.fd = fds[0];
        w.fd = fds[1];
        return true;
    }
};

// Read everything currently available. Returns false once EOF is reached.
bool drain(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            return false;
        if (errno == EINTR)
            continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

ChildProcess::ChildProcess(pid_t pid) : pid_(pid) {
    if (pid_ > 0)
        ++g_live_children;
}

ChildProcess::~ChildProcess() {
    if (running())
        terminate(std::chrono::milliseconds(200));
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), status_(other.status_) {
    other.pid_ = -1;
    other.reaped_ = false;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        if (running())
            terminate(std::chrono::milliseconds(200));
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        status_ = other.status_;
        other.pid_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

void ChildProcess::mark_reaped(int status) {
    if (reaped_)
        return;
    reaped_ = true;
    status_ = status;
    --g_live_children;
}

bool ChildProcess::try_wait() {
    if (!running())
        return true;
    int st = 0;
    pid_t r = ::waitpid(pid_, &st, WNOHANG);
    if (r == pid_) {
        mark_reaped(st);
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        mark_reaped(0);
        return true;
    }
    return false;
}

void ChildProcess::wait() {
    if (!running())
        return;
    int st = 0;
    while (true) {
        pid_t r = ::waitpid(pid_, &st, 0);
        if (r == pid_) {
            mark_reaped(st);
            return;
        }
        if (r < 0 && errno == EINTR)
            continue;
        mark_reaped(0);
        return;
    }
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (!running())
        return;
    ::kill(-pid_, SIGTERM);
    auto until = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < until) {
        // Peek without reaping so the process group id stays reserved.
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
            info.si_pid == pid_)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    // Also takes down helpers (ssh, credential managers) left in the group.
    ::kill(-pid_, SIGKILL);
    wait();
}

ProcessResult run_process(const ProcessSpec& spec, const std::atomic<bool>* cancel) {
    ProcessResult res;
    if (spec.argv.empty()) {
        res.error = "empty command";
        return res;
    }
    if (cancel && cancel->load()) {
        res.cancelled = true;
        return res;
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> env_store;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        std::string key = kv.substr(0, kv.find('='));
        if (!spec.env.count(key))
            env_store.push_back(std::move(kv));
    }
    for (const auto& [k, v] : spec.env)
        env_store.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& s : env_store)
        envp.push_back(s.data());
    envp.push_back(nullptr);
    std::vector<std::string> arg_store = spec.argv;
    std::vector<char*> args;
    for (auto& a : arg_store)
        args.push_back(a.data());
    args.push_back(nullptr);
    const std::string cwd = spec.cwd.string();

    FdGuard devnull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    Pipe out_pipe;
    Pipe err_pipe;
    Pipe exec_pipe;
    if (devnull.fd < 0 || !out_pipe.open() || !err_pipe.open() || !exec_pipe.open()) {
        res.error = std::string("pipe setup failed: ") + std::strerror(errno);
        return res;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        res.error = std::string("fork failed: ") + std::strerror(errno);
        return res;
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(devnull.fd, STDIN_FILENO);
        ::dup2(out_pipe.w.fd, STDOUT_FILENO);
        ::dup2(err_pipe.w.fd, STDERR_FILENO);
        int report[2] = {0, 0};
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            report[0] = 1;
            report[1] = errno;
            ssize_t ignored = ::write(exec_pipe.w.fd, report, sizeof(report));
            (void)ignored;
            ::_exit(127);
        }
        ::execvpe(args[0], args.data(), envp.data());
        report[0] = 2;
        report[1] = errno;
        ssize_t ignored = ::write(exec_pipe.w.fd, report, sizeof(report));
        (void)ignored;
        ::_exit(127);
    }

    ChildProcess child(pid);
    ::setpgid(pid, pid); // may fail with EACCES once the child has exec'd
    out_pipe.w.reset();
    err_pipe.w.reset();
    exec_pipe.w.reset();

    int report[2] = {0, 0};
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe.r.fd, report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(report))) {
        child.wait();
        res.error = (report[0] == 1 ? "cannot enter " + cwd : "cannot execute " + spec.argv[0]) +
                    ": " + std::strerror(report[1]);
        return res;
    }
    res.started = true;

    ::fcntl(out_pipe.r.fd, F_SETFL, ::fcntl(out_pipe.r.fd, F_GETFL, 0) | O_NONBLOCK);
    ::fcntl(err_pipe.r.fd, F_SETFL, ::fcntl(err_pipe.r.fd, F_GETFL, 0) | O_NONBLOCK);

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = spec.timeout.count() > 0
                              ? start + spec.timeout
                              : std::chrono::steady_clock::time_point::max();
    bool out_open = true;
    bool err_open = true;
    while (true) {
        if (cancel && cancel->load()) {
            res.cancelled = true;
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            res.timed_out = true;
            break;
        }
        auto wait_ms = std::chrono::milliseconds(50);
        if (deadline != std::chrono::steady_clock::time_point::max()) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            wait_ms = std::min(wait_ms, left + std::chrono::milliseconds(1));
        }
        if (out_open || err_open) {
            pollfd fds[2];
            nfds_t count = 0;
            if (out_open)
                fds[count++] = pollfd{out_pipe.r.fd, POLLIN, 0};
            if (err_open)
                fds[count++] = pollfd{err_pipe.r.fd, POLLIN, 0};
            int pr = ::poll(fds, count, static_cast<int>(wait_ms.count()));
            if (pr < 0 && errno != EINTR) {
                res.error = std::string("poll failed: ") + std::strerror(errno);
                res.cancelled = true;
                break;
            }
            if (out_open)
                out_open = drain(out_pipe.r.fd, res.out);
            if (err_open)
                err_open = drain(err_pipe.r.fd, res.err);
        } else {
            std::this_thread::sleep_for(std::min(wait_ms, std::chrono::milliseconds(10)));
        }
        if (child.try_wait()) {
            // Pick up anything written just before exit.
            if (out_open)
                drain(out_pipe.r.fd, res.out);
            if (err_open)
                drain(err_pipe.r.fd, res.err);
            break;
        }
    }

    if (res.cancelled || res.timed_out)
        child.terminate(spec.kill_grace);
    else
        child.wait();

    int st = child.status();
    if (WIFEXITED(st)) {
        res.exit_code = WEXITSTATUS(st);
    } else if (WIFSIGNALED(st)) {
        res.term_signal = WTERMSIG(st);
        res.exit_code = 128 + res.term_signal;
    }
    return res;
}

} // namespace procutil
