/*
 * Process chain runner implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/exec/process.hpp>
#include <webwright/exec/result.hpp>
#include <webwright/util/log.hpp>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace webwright {
namespace {

using Clock = std::chrono::steady_clock;

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : m_fd(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    FdGuard(FdGuard&& o) noexcept : m_fd(o.m_fd) { o.m_fd = -1; }
    FdGuard& operator=(FdGuard&& o) noexcept {
        if (this != &o) { reset(); m_fd = o.m_fd; o.m_fd = -1; }
        return *this;
    }
    int get() const { return m_fd; }
    void reset(int fd = -1) { if (m_fd >= 0) ::close(m_fd); m_fd = fd; }
    explicit operator bool() const { return m_fd >= 0; }
private:
    int m_fd;
};

struct Pipe {
    FdGuard read;
    FdGuard write;
};

bool make_pipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    p.read.reset(fds[0]);
    p.write.reset(fds[1]);
    return true;
}

// Gives the controlling terminal to the chain's process group and takes it
// back on destruction.
class TerminalHandoff {
public:
    TerminalHandoff(bool enabled, pid_t pgid) {
        if (!enabled || pgid <= 0 || !::isatty(STDIN_FILENO)) return;
        m_old_ttou = std::signal(SIGTTOU, SIG_IGN);
        if (::tcsetpgrp(STDIN_FILENO, pgid) != 0) {
            log::debug(std::string("tcsetpgrp: ") + std::strerror(errno));
            std::signal(SIGTTOU, m_old_ttou);
            return;
        }
        m_active = true;
        // a stage may have hit the tty before the handoff
        ::kill(-pgid, SIGCONT);
    }
    ~TerminalHandoff() {
        if (!m_active) return;
        if (::tcsetpgrp(STDIN_FILENO, ::getpgrp()) != 0) log::debug(std::string("tcsetpgrp restore: ") + std::strerror(errno));
        std::signal(SIGTTOU, m_old_ttou);
    }
    TerminalHandoff(const TerminalHandoff&) = delete;
    TerminalHandoff& operator=(const TerminalHandoff&) = delete;
private:
    bool m_active = false;
    void (*m_old_ttou)(int) = SIG_DFL;
};

// Child side only: async-signal-safe calls from here on.
[[noreturn]] void child_fail(int report_fd) {
    int e = errno;
    ssize_t w = ::write(report_fd, &e, sizeof e);
    (void)w;
    ::_exit(e == ENOENT ? kExitNotFound : kExitLaunchFailure);
}

void child_redirect(int from, int to, int report_fd) {
    if (from == to) {
        if (::fcntl(to, F_SETFD, 0) != 0) child_fail(report_fd);
        return;
    }
    if (::dup2(from, to) < 0) child_fail(report_fd);
}

int decode_status(int st) {
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return 1;
}

std::string describe_timeout(std::chrono::milliseconds t) {
    if (t.count() % 1000 == 0) return "Command timed out after " + std::to_string(t.count() / 1000) + " seconds\n";
    return "Command timed out after " + std::to_string(t.count()) + " ms\n";
}

struct Stream {
    FdGuard fd;
    std::string* sink;
};

// Reads whatever is available. Closes the stream on EOF or error.
void drain(Stream& s) {
    char buf[4096];
    while (s.fd) {
        ssize_t r = ::read(s.fd.get(), buf, sizeof buf);
        if (r > 0) { s.sink->append(buf, static_cast<size_t>(r)); continue; }
        if (r < 0 && errno == EINTR) continue;
        if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        s.fd.reset();
    }
}

} // namespace

ProcessOutcome run_chain(const std::vector<std::vector<std::string>>& stages, const ProcessOptions& opts) {
    ProcessOutcome res;
    const size_t n = stages.size();
    if (n == 0) return res;

    // everything the children touch is built before fork
    std::vector<std::vector<char*>> argvs(n);
    for (size_t i = 0; i < n; ++i) {
        for (auto& a : stages[i]) argvs[i].push_back(const_cast<char*>(a.c_str()));
        argvs[i].push_back(nullptr);
    }
    std::vector<char*> envp;
    for (auto& e : opts.env) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);
    const char* cwd = opts.cwd.empty() ? nullptr : opts.cwd.c_str();

    auto launch_error = [&](const std::string& what, int err) {
        res.launch_failed = true;
        res.exit_code = err == ENOENT ? kExitNotFound : kExitLaunchFailure;
        res.err += "webwright: " + what + ": " + std::strerror(err) + "\n";
    };

    std::vector<Pipe> links(n - 1);
    std::vector<Pipe> errs(n);
    std::vector<Pipe> reports(n);
    Pipe out;
    bool pipes_ok = make_pipe(out);
    for (auto& p : links) pipes_ok = pipes_ok && make_pipe(p);
    for (auto& p : errs) pipes_ok = pipes_ok && make_pipe(p);
    for (auto& p : reports) pipes_ok = pipes_ok && make_pipe(p);
    if (!pipes_ok) { launch_error("pipe", errno); return res; }
    FdGuard devnull;
    if (!opts.inherit_stdin) {
        devnull.reset(::open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (!devnull) { launch_error("/dev/null", errno); return res; }
    }

    std::vector<pid_t> pids;
    pid_t pgid = 0;
    for (size_t i = 0; i < n; ++i) {
        pid_t pid = ::fork();
        if (pid < 0) { launch_error("fork", errno); break; }
        if (pid == 0) {
            int report = reports[i].write.get();
            ::setpgid(0, pgid);
            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGQUIT, SIG_DFL);
            std::signal(SIGPIPE, SIG_DFL);
            std::signal(SIGTTIN, SIG_DFL);
            std::signal(SIGTTOU, SIG_DFL);
            std::signal(SIGTSTP, SIG_IGN); // no job control: a stopped stage would hang the chain
            int in_fd = i > 0 ? links[i-1].read.get() : devnull.get();
            if (in_fd >= 0) child_redirect(in_fd, STDIN_FILENO, report);
            child_redirect(i + 1 < n ? links[i].write.get() : out.write.get(), STDOUT_FILENO, report);
            child_redirect(errs[i].write.get(), STDERR_FILENO, report);
            if (cwd && ::chdir(cwd) != 0) child_fail(report);
            ::execve(argvs[i][0], argvs[i].data(), envp.data());
            child_fail(report);
        }
        if (pgid == 0) pgid = pid;
        ::setpgid(pid, pgid); // also done by the child, whichever runs first
        pids.push_back(pid);
    }
    const bool fork_failed = pids.size() < n;

    // parent keeps only the read ends it consumes
    for (auto& l : links) { l.read.reset(); l.write.reset(); }
    out.write.reset();
    for (auto& e : errs) e.write.reset();
    for (auto& r : reports) r.write.reset();
    devnull.reset();

    TerminalHandoff tty(opts.foreground_terminal && !pids.empty(), pgid);

    for (size_t i = 0; i < pids.size(); ++i) {
        int child_errno = 0;
        ssize_t r;
        do { r = ::read(reports[i].read.get(), &child_errno, sizeof child_errno); } while (r < 0 && errno == EINTR);
        if (r == static_cast<ssize_t>(sizeof child_errno)) launch_error("cannot launch '" + stages[i][0] + "'", child_errno);
        reports[i].read.reset();
    }

    std::vector<std::string> err_bufs(n);
    std::vector<Stream> streams;
    streams.push_back({std::move(out.read), &res.out});
    for (size_t i = 0; i < n; ++i) streams.push_back({std::move(errs[i].read), &err_bufs[i]});
    for (auto& s : streams) {
        int flags = ::fcntl(s.fd.get(), F_GETFL);
        if (flags < 0 || ::fcntl(s.fd.get(), F_SETFL, flags | O_NONBLOCK) != 0) log::warn(std::string("fcntl: ") + std::strerror(errno));
    }

    std::vector<int> statuses(pids.size(), 0);
    std::vector<bool> reaped(pids.size(), false);
    auto reap = [&](int flags) {
        for (size_t i = 0; i < pids.size(); ++i) {
            if (reaped[i]) continue;
            int st = 0;
            pid_t r;
            do { r = ::waitpid(pids[i], &st, flags); } while (r < 0 && errno == EINTR);
            if (r == pids[i]) { reaped[i] = true; statuses[i] = st; }
            else if (r < 0) { reaped[i] = true; log::debug(std::string("waitpid: ") + std::strerror(errno)); }
        }
    };
    auto all_reaped = [&] { return std::all_of(reaped.begin(), reaped.end(), [](bool b) { return b; }); };

    const auto deadline = Clock::now() + opts.timeout;
    bool terminate = fork_failed;
    while (!terminate) {
        reap(WNOHANG);
        if (all_reaped()) {
            // descendants may still hold the pipes open; take what is buffered
            for (auto& s : streams) { drain(s); s.fd.reset(); }
            break;
        }
        if (opts.cancel && opts.cancel->load()) { res.interrupted = true; terminate = true; break; }
        auto now = Clock::now();
        if (now >= deadline) { res.timed_out = true; terminate = true; break; }
        auto slice = std::min<Clock::duration>(std::chrono::milliseconds(50), deadline - now);
        int slice_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(slice).count()) + 1;

        std::vector<pollfd> pfds;
        std::vector<Stream*> polled;
        for (auto& s : streams) {
            if (!s.fd) continue;
            pfds.push_back({s.fd.get(), POLLIN, 0});
            polled.push_back(&s);
        }
        int pr = ::poll(pfds.data(), pfds.size(), slice_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            log::error(std::string("poll: ") + std::strerror(errno));
            terminate = true;
            break;
        }
        for (size_t k = 0; k < pfds.size(); ++k) {
            if (pfds[k].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) drain(*polled[k]);
        }
    }

    if (terminate && pgid > 0) {
        ::kill(-pgid, SIGTERM);
        auto grace = Clock::now() + std::chrono::milliseconds(200);
        while (!all_reaped() && Clock::now() < grace) {
            reap(WNOHANG);
            ::poll(nullptr, 0, 10);
        }
        if (!all_reaped()) ::kill(-pgid, SIGKILL);
    }
    reap(0);
    for (auto& s : streams) { drain(s); s.fd.reset(); }

    std::string stage_err;
    for (auto& e : err_bufs) stage_err += e;
    res.err = stage_err + res.err;
    if (!res.launch_failed && !pids.empty()) res.exit_code = decode_status(statuses.back());
    if (res.timed_out) { res.exit_code = kExitTimeout; res.err += describe_timeout(opts.timeout); }
    else if (res.interrupted) { res.exit_code = kExitInterrupted; res.err += "Interrupted\n"; }
    return res;
}

ProcessOutcome run_shell_pipeline(const std::string& shell, const std::vector<std::string>& stages, const ProcessOptions& opts) {
    std::vector<std::vector<std::string>> argvs;
    argvs.reserve(stages.size());
    for (auto& s : stages) argvs.push_back({shell, "-c", s});
    return run_chain(argvs, opts);
}

} // namespace webwright
