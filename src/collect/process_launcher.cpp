#include "diagpack/collect/process_launcher.hpp"

#include "diagpack/io/fd.hpp"
#include "diagpack/util/logger.hpp"
#include "diagpack/util/result.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace diagpack {

namespace {

using Clock = std::chrono::steady_clock;

Result MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const int e = errno;
        return Result::Fail(e, std::string("pipe2 failed: ") + std::strerror(e));
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return Result::Ok();
}

int WaitStatusToExitCode(int wstatus) {
    if (WIFEXITED(wstatus))
        return WEXITSTATUS(wstatus);
    if (WIFSIGNALED(wstatus))
        return 128 + WTERMSIG(wstatus);
    return -1;
}

void KillGroup(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

int BlockingWait(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return -1;
    }
    return WaitStatusToExitCode(status);
}

// Reaps the child; kills it if it is still alive at the deadline.
int WaitUntil(pid_t pid, Clock::time_point deadline, bool& timed_out) {
    while (true) {
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid)
            return WaitStatusToExitCode(status);
        if (r < 0 && errno != EINTR)
            return -1;
        if (Clock::now() >= deadline) {
            timed_out = true;
            KillGroup(pid);
            return BlockingWait(pid);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace

std::string PosixProcessLauncher::ResolveExecutable(const std::string& name) {
    if (name.empty())
        return {};
    if (name.find('/') != std::string::npos)
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string();

    const char* path_env = std::getenv("PATH");
    const std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos)
            end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty())
            dir = ".";
        const std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0)
            return candidate;
        start = end + 1;
    }
    return {};
}

std::expected<ProcessOutput, std::string> PosixProcessLauncher::Run(
    const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const {
    if (argv.empty())
        return std::unexpected("empty command line");

    const std::string exe = ResolveExecutable(argv[0]);
    if (exe.empty())
        return std::unexpected("executable not found: " + argv[0]);

    // Everything the child touches is prepared before fork().
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    Fd out_r, out_w, status_r, status_w;
    if (auto r = MakePipe(out_r, out_w); !r.is_ok())
        return std::unexpected(r.msg);
    if (auto r = MakePipe(status_r, status_w); !r.is_ok())
        return std::unexpected(r.msg);

    Fd dev_null;
    if (auto r = Fd::Open("/dev/null", O_RDONLY, 0, dev_null); !r.is_ok())
        return std::unexpected(r.msg);

    const auto deadline = Clock::now() + timeout;

    const pid_t pid = ::fork();
    if (pid < 0)
        return std::unexpected(std::string("fork failed: ") + std::strerror(errno));

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(dev_null.Get(), STDIN_FILENO);
        ::dup2(out_w.Get(), STDOUT_FILENO);
        ::dup2(out_w.Get(), STDERR_FILENO);
        ::execv(exe.c_str(), cargv.data());
        const int e = errno;
        (void)!::write(status_w.Get(), &e, sizeof(e));
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    out_w.Close();
    status_w.Close();
    dev_null.Close();

    // The status pipe is close-on-exec: EOF means execv() succeeded.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_r.Get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        (void)BlockingWait(pid);
        return std::unexpected("cannot execute " + exe + ": " + std::strerror(child_errno));
    }

    ProcessOutput result;
    std::array<char, 16 * 1024> buf{};
    bool reaped = false;

    while (true) {
        if (!reaped) {
            int status = 0;
            const pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                reaped = true;
                result.exit_code = WaitStatusToExitCode(status);
            }
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            result.timed_out = !reaped;
            break;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

        // Once the child is gone only what is already buffered is read.
        pollfd pfd{};
        pfd.fd = out_r.Get();
        pfd.events = POLLIN;
        const int wait_ms = reaped ? 0 : static_cast<int>(std::min<long long>(remaining + 1, 100));
        const int pr = ::poll(&pfd, 1, wait_ms);
        if (pr < 0) {
            if (errno == EINTR)
                continue;
            const int e = errno;
            if (!reaped) {
                KillGroup(pid);
                (void)BlockingWait(pid);
            }
            return std::unexpected(std::string("poll failed: ") + std::strerror(e));
        }
        if (pr == 0) {
            if (reaped)
                break;
            continue;
        }

        const ssize_t got = ::read(out_r.Get(), buf.data(), buf.size());
        if (got > 0) {
            const size_t room = max_output_bytes_ > result.output.size()
                                    ? max_output_bytes_ - result.output.size()
                                    : 0;
            const size_t keep = std::min(room, static_cast<size_t>(got));
            result.output.append(buf.data(), keep);
            if (keep < static_cast<size_t>(got))
                result.truncated = true;
            continue;
        }
        if (got < 0 && errno == EINTR)
            continue;
        break;  // EOF or read error
    }

    if (result.timed_out) {
        KillGroup(pid);
        result.exit_code = BlockingWait(pid);
    } else if (!reaped) {
        result.exit_code = WaitUntil(pid, deadline, result.timed_out);
    }

    LogDebug("%s exited with %d%s (%zu bytes of output%s)",
             argv[0].c_str(),
             result.exit_code,
             result.timed_out ? " after timeout" : "",
             result.output.size(),
             result.truncated ? ", truncated" : "");
    return result;
}

std::shared_ptr<const IProcessLauncher> DefaultProcessLauncher() {
    static const std::shared_ptr<const IProcessLauncher> kDefault =
        std::make_shared<PosixProcessLauncher>();
    return kDefault;
}

} // namespace diagpack
