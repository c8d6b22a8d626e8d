#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <linux/close_range.h>
#include <math.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "limits.hpp"

namespace pysandbox::runguard {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 65536;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// how long output of an exited child is still collected
const chrono::milliseconds drain_timeout(500);

// poll interval when the kernel has no pidfd_open
const int status_poll_ms = 20;

// bytes of the end of each stream kept past the output limit
const size_t TAIL_SIZE = 1024;

template <typename... Args>
[[noreturn]] static void error(int err, const char *format, Args &&... args) {
    throw sandbox_error(fmt::format("{}: {}", fmt::format(fmt::runtime(format), forward<Args>(args)...), strerror(err)));
}

static void close_fd(int &fd) {
    if (fd < 0) return;
    int ret = close(fd);
    fd = -1;
    if (ret != 0 && errno != EINTR) error(errno, "closing pipe");
}

static void close_quietly(int &fd) {
    if (fd >= 0 && close(fd) != 0)
        PLOG(WARNING) << "closing fd " << fd;
    fd = -1;
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

/**
 * @brief report a failed step of the child and exit
 * One write below PIPE_BUF is atomic, the supervisor reads errno and the
 * step name from the error pipe.
 */
[[noreturn]] static void die(int error_fd, const char *step) {
    char record[128];
    int err = errno;
    size_t len = min(strlen(step), sizeof(record) - sizeof(err));
    memcpy(record, &err, sizeof(err));
    memcpy(record + sizeof(err), step, len);
    if (write(error_fd, record, sizeof(err) + len) < 0) _exit(126);
    _exit(127);
}

static bool mark_cloexec_from(int lowfd) {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, lowfd, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return true;
#endif
    struct rlimit lim;
    int maxfd = 1024;
    if (getrlimit(RLIMIT_NOFILE, &lim) == 0 && lim.rlim_cur != RLIM_INFINITY)
        maxfd = (int)min<rlim_t>(lim.rlim_cur, 65536);
    for (int fd = lowfd; fd < maxfd; ++fd) {
        int flags = fcntl(fd, F_GETFD);
        if (flags == -1) continue;
        if (fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) return false;
    }
    return true;
}

/**
 * @brief body of the forked child, only async-signal-safe calls
 */
[[noreturn]] static void run_child(const runguard_options &opt, int child_pipefd[3][2], int error_fd,
                                   char *const argv[], char *const envp[], const seccomp_program *program) {
    struct sigaction sigact;
    sigset_t emptymask;
    if (sigemptyset(&emptymask) != 0) die(error_fd, "sigemptyset");
    if (sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0) die(error_fd, "sigprocmask");

    // dispositions the supervisor may have changed survive execve
    sigact.sa_handler = SIG_DFL;
    sigact.sa_flags = 0;
    sigact.sa_mask = emptymask;
    for (int sig : {SIGPIPE, SIGXCPU, SIGXFSZ, SIGINT, SIGTERM, SIGHUP})
        if (sigaction(sig, &sigact, nullptr) != 0) die(error_fd, "sigaction");

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1) die(error_fd, "setsid");

    if (dup2(child_pipefd[STDIN_FILENO][PIPE_OUT], STDIN_FILENO) < 0) die(error_fd, "redirecting stdin");
    if (dup2(child_pipefd[STDOUT_FILENO][PIPE_IN], STDOUT_FILENO) < 0) die(error_fd, "redirecting stdout");
    if (dup2(child_pipefd[STDERR_FILENO][PIPE_IN], STDERR_FILENO) < 0) die(error_fd, "redirecting stderr");

    // descriptors of the supervisor and of concurrent executions
    if (!mark_cloexec_from(STDERR_FILENO + 1)) die(error_fd, "marking descriptors close-on-exec");

    if (chdir(opt.work_dir.c_str()) != 0) die(error_fd, "chdir to the working directory");

    if (const char *step = set_restrictions(opt)) die(error_fd, step);

    if (opt.new_network_namespace && unshare(CLONE_NEWNET) != 0) die(error_fd, "unshare(CLONE_NEWNET)");

    if (program) {
        if (const char *step = set_seccomp(*program)) die(error_fd, step);
    }

    execve(argv[0], argv, envp);
    die(error_fd, "execve");
}

/**
 * @brief kill the process group, first graciously, then hard
 */
static void terminate(pid_t pgid, const char *reason) {
    LOG(WARNING) << reason << ": aborting command";

    /* Don't report an already exited process as error. */
    LOG(INFO) << "sending SIGTERM";
    if (kill(-pgid, SIGTERM) != 0 && errno != ESRCH) {
        error(errno, "sending SIGTERM to command");
    }

    // nanosleep does not interfere with signals
    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL";
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH) {
        error(errno, "sending SIGKILL to command");
    }
}

static void pump_pipe(const runguard_options &opt, int i, int &fd, string &captured, string &tail, size_t &data_read,
                      size_t &data_passed) {
    char buf[BUF_SIZE];
    ssize_t nread;

    if (opt.stream_size >= 0 && data_passed == (size_t)opt.stream_size) {
        // at the output limit: discard, but still count what was consumed
        nread = read(fd, buf, BUF_SIZE);
    } else {
        size_t to_read = BUF_SIZE;
        if (opt.stream_size >= 0) {
            to_read = min<size_t>(BUF_SIZE, opt.stream_size - data_passed);
        }

        nread = read(fd, buf, to_read);
        if (nread > 0) {
            captured.append(buf, nread);
            data_passed += nread;

            if (opt.stream_size >= 0 && data_passed == (size_t)opt.stream_size) {
                LOG(INFO) << "child fd " << i << " limit reached";
            }
        }
    }

    if (nread == -1) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        error(errno, "copying data fd {}", i);
    }
    if (nread == 0) {
        /* EOF detected: close fd and indicate this with -1 */
        close_fd(fd);
        return;
    }
    data_read += nread;

    tail.append(buf, nread);
    if (tail.size() > TAIL_SIZE) tail.erase(0, tail.size() - TAIL_SIZE);
}

static void feed_stdin(int &fd, const string &data, size_t &offset) {
    // a write to a pipe closed by the child raises SIGPIPE in this thread,
    // keep it blocked and consume it
    sigset_t sigpipe_mask, old_mask;
    sigemptyset(&sigpipe_mask);
    sigaddset(&sigpipe_mask, SIGPIPE);
    int rc = pthread_sigmask(SIG_BLOCK, &sigpipe_mask, &old_mask);
    if (rc != 0) error(rc, "blocking SIGPIPE");

    size_t to_write = min<size_t>(BUF_SIZE, data.size() - offset);
    ssize_t nwritten = write(fd, data.data() + offset, to_write);
    int err = errno;
    if (nwritten == -1 && err == EPIPE) {
        struct timespec zero = {0, 0};
        if (sigtimedwait(&sigpipe_mask, nullptr, &zero) == -1 && errno != EAGAIN)
            PLOG(WARNING) << "consuming SIGPIPE";
    }

    rc = pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
    if (rc != 0) error(rc, "restoring signal mask");

    if (nwritten == -1) {
        if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK) return;
        if (err == EPIPE) {
            // the child closed its stdin, the rest is dropped
            LOG(INFO) << "child closed stdin after " << offset << " bytes";
            close_fd(fd);
            return;
        }
        error(err, "writing stdin of child");
    }

    offset += nwritten;
    if (offset == data.size()) close_fd(fd);
}

static void drain_pipes(const runguard_options &opt, int child_pipefd[3][2], string data[3], string tails[3],
                        size_t data_read[3], size_t data_passed[3]) {
    auto until = chrono::steady_clock::now() + drain_timeout;
    while (child_pipefd[STDOUT_FILENO][PIPE_OUT] >= 0 || child_pipefd[STDERR_FILENO][PIPE_OUT] >= 0) {
        auto remaining = chrono::duration_cast<chrono::milliseconds>(until - chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            LOG(WARNING) << "output pipes still open after the child was reaped, dropping the rest";
            break;
        }

        struct pollfd fds[2];
        int idx[2], nfds = 0;
        for (int i = STDOUT_FILENO; i <= STDERR_FILENO; i++) {
            if (child_pipefd[i][PIPE_OUT] >= 0) {
                fds[nfds] = {child_pipefd[i][PIPE_OUT], POLLIN, 0};
                idx[nfds++] = i;
            }
        }

        int r = poll(fds, nfds, (int)remaining);
        if (r == -1) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }
        for (int k = 0; k < nfds; k++) {
            if (fds[k].revents) {
                int i = idx[k];
                pump_pipe(opt, i, child_pipefd[i][PIPE_OUT], data[i], tails[i], data_read[i], data_passed[i]);
            }
        }
    }
}

run_metadata runit(const runguard_options &opt, const cancellation_token *cancel) {
    if (opt.command.empty()) throw sandbox_error("no command to run");

    // everything that allocates happens before fork
    optional<seccomp_program> program;
    if (opt.use_seccomp) program = build_seccomp_filter();

    vector<char *> argv, envp;
    for (auto &arg : opt.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (auto &entry : opt.env) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int error_pipe[2] = {-1, -1};
    int pidfd = -1;
    defer {
        for (auto &pipe : child_pipefd) {
            close_quietly(pipe[PIPE_IN]);
            close_quietly(pipe[PIPE_OUT]);
        }
        close_quietly(error_pipe[PIPE_IN]);
        close_quietly(error_pipe[PIPE_OUT]);
        close_quietly(pidfd);
    };

    /* Setup pipes connecting to child stdin/stdout/stderr streams. */
    for (int i = 0; i <= 2; i++) {
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    }
    if (pipe2(error_pipe, O_CLOEXEC) != 0) error(errno, "creating error pipe");

    auto starttime = chrono::steady_clock::now();

    pid_t child_pid = fork();
    if (child_pid == -1) error(errno, "unable to fork");
    if (child_pid == 0) {
        run_child(opt, child_pipefd, error_pipe[PIPE_IN], argv.data(), envp.data(), program ? &*program : nullptr);
    }

    // watchdog
    bool reaped = false;
    defer {
        if (reaped) return;
        /* Make sure that all children are killed before leaving */
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH) PLOG(ERROR) << "unable to kill process group";
        if (kill(child_pid, SIGKILL) != 0 && errno != ESRCH) PLOG(ERROR) << "unable to kill child";
        while (waitpid(child_pid, nullptr, 0) < 0 && errno == EINTR) {
        }
    };

    /* Close unused file descriptors */
    close_fd(child_pipefd[STDIN_FILENO][PIPE_OUT]);
    close_fd(child_pipefd[STDOUT_FILENO][PIPE_IN]);
    close_fd(child_pipefd[STDERR_FILENO][PIPE_IN]);
    close_fd(error_pipe[PIPE_IN]);

    {
        /* EOF on the error pipe means execve succeeded */
        char record[128];
        size_t got = 0;
        while (got < sizeof(record)) {
            ssize_t n = read(error_pipe[PIPE_OUT], record + got, sizeof(record) - got);
            if (n == -1 && errno == EINTR) continue;
            if (n == -1) error(errno, "reading child start status");
            if (n == 0) break;
            got += n;
        }
        close_fd(error_pipe[PIPE_OUT]);

        if (got > 0) {
            int err = 0;
            string step;
            if (got >= sizeof(err)) {
                memcpy(&err, record, sizeof(err));
                step.assign(record + sizeof(err), got - sizeof(err));
            }
            error(err, "unable to start command {} ({})", opt.command[0], step);
        }
    }

    LOG(INFO) << "started command " << opt.command[0] << " as pid " << child_pid;

#ifdef SYS_pidfd_open
    pidfd = (int)syscall(SYS_pidfd_open, child_pid, 0);
#endif
    if (pidfd < 0) LOG_FIRST_N(INFO, 1) << "pidfd_open unavailable, polling the child status";

    set_nonblocking(child_pipefd[STDOUT_FILENO][PIPE_OUT]);
    set_nonblocking(child_pipefd[STDERR_FILENO][PIPE_OUT]);

    const string empty_stdin;
    const string &stdin_data = opt.stdin_data ? *opt.stdin_data : empty_stdin;
    size_t stdin_offset = 0;
    if (stdin_data.empty()) {
        close_fd(child_pipefd[STDIN_FILENO][PIPE_IN]);
    } else {
        set_nonblocking(child_pipefd[STDIN_FILENO][PIPE_IN]);
    }

    auto deadline = starttime + chrono::duration_cast<chrono::steady_clock::duration>(
                                    chrono::duration<double>(opt.use_wall_limit ? opt.wall_limit.hard : 0));
    if (opt.use_wall_limit)
        LOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.hard);

    run_metadata meta;
    string data[3], tails[3];
    size_t data_read[3] = {0, 0, 0};
    size_t data_passed[3] = {0, 0, 0};
    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    bool exited = false;

    while (!exited && !meta.terminated) {
        enum { OUT, ERR, IN, PID, CANCEL };
        struct pollfd fds[5];
        int slot[5] = {-1, -1, -1, -1, -1};
        int nfds = 0;
        auto add = [&](int which, int fd, short events) {
            if (fd < 0) return;
            fds[nfds] = {fd, events, 0};
            slot[which] = nfds++;
        };
        add(OUT, child_pipefd[STDOUT_FILENO][PIPE_OUT], POLLIN);
        add(ERR, child_pipefd[STDERR_FILENO][PIPE_OUT], POLLIN);
        add(IN, child_pipefd[STDIN_FILENO][PIPE_IN], POLLOUT);
        add(PID, pidfd, POLLIN);
        if (cancel) add(CANCEL, cancel->fd(), POLLIN);

        int timeout = -1;
        if (opt.use_wall_limit) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
            timeout = (int)max<int64_t>(0, remaining + 1);
        }
        if (pidfd < 0) timeout = timeout < 0 ? status_poll_ms : min(timeout, status_poll_ms);

        int r = poll(fds, nfds, timeout);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");

        for (int which : {OUT, ERR}) {
            int i = which == OUT ? STDOUT_FILENO : STDERR_FILENO;
            if (r > 0 && slot[which] >= 0 && fds[slot[which]].revents)
                pump_pipe(opt, i, child_pipefd[i][PIPE_OUT], data[i], tails[i], data_read[i], data_passed[i]);
        }
        if (r > 0 && slot[IN] >= 0 && fds[slot[IN]].revents)
            feed_stdin(child_pipefd[STDIN_FILENO][PIPE_IN], stdin_data, stdin_offset);

        if (r > 0 && slot[PID] >= 0 && fds[slot[PID]].revents) {
            pid_t pid;
            while ((pid = wait4(child_pid, &status, 0, &usage)) < 0 && errno == EINTR) {
            }
            if (pid < 0) error(errno, "waiting on child");
            exited = true;
        } else if (pidfd < 0) {
            pid_t pid = wait4(child_pid, &status, WNOHANG, &usage);
            if (pid < 0 && errno != EINTR) error(errno, "waiting on child");
            exited = pid == child_pid;
        }
        if (exited) break;

        if (cancel && cancel->is_cancelled()) {
            meta.cancelled = true;
            meta.terminated = true;
            terminate(child_pid, "execution cancelled");
        } else if (opt.use_wall_limit && chrono::steady_clock::now() >= deadline) {
            meta.wall_limit_exceeded = true;
            meta.terminated = true;
            terminate(child_pid, "timelimit exceeded (hard wall time)");
        }
    }

    if (!exited) {
        pid_t pid;
        while ((pid = wait4(child_pid, &status, 0, &usage)) < 0 && errno == EINTR) {
        }
        if (pid < 0) error(errno, "waiting on child");
    }
    reaped = true;
    auto endtime = chrono::steady_clock::now();

    // no grandchild may outlive the command
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        PLOG(WARNING) << "unable to kill the remaining process group";

    close_quietly(child_pipefd[STDIN_FILENO][PIPE_IN]);
    drain_pipes(opt, child_pipefd, data, tails, data_read, data_passed);

    if (WIFEXITED(status)) {
        meta.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        int sig = WTERMSIG(status);
        meta.signal = sig;
        meta.exitcode = sig + 128;
        switch (sig) {
            case SIGXCPU:
                meta.cpu_limit_exceeded = true;
                LOG(WARNING) << "Time Limit Exceeded (hard limit)";
                break;
            default:
                LOG(WARNING) << "Command terminated with signal (" << sig << ", " << strsignal(sig) << ")";
                break;
        }
    } else {
        throw sandbox_error(fmt::format("unknown status: {:x}", status));
    }

    meta.wall_time = chrono::duration<double>(endtime - starttime).count();
    meta.user_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec * 1E-6;
    meta.sys_time = usage.ru_stime.tv_sec + usage.ru_stime.tv_usec * 1E-6;
    meta.memory_bytes = (int64_t)usage.ru_maxrss * 1024;

    LOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}", meta.wall_time, meta.user_time, meta.sys_time);
    LOG(INFO) << "total memory used: " << meta.memory_bytes / 1024 << "kB";

    if (opt.use_cpu_limit && meta.user_time + meta.sys_time >= opt.cpu_limit.soft) {
        meta.cpu_limit_exceeded = true;
        LOG(WARNING) << "Time Limit Exceeded (soft cpu time)";
    }

    meta.stdout_data = move(data[STDOUT_FILENO]);
    meta.stderr_data = move(data[STDERR_FILENO]);
    meta.stderr_tail = move(tails[STDERR_FILENO]);
    meta.stdin_bytes = stdin_offset;
    meta.stdout_bytes = data_read[STDOUT_FILENO];
    meta.stderr_bytes = data_read[STDERR_FILENO];
    meta.stdout_truncated = data_passed[STDOUT_FILENO] < data_read[STDOUT_FILENO];
    meta.stderr_truncated = data_passed[STDERR_FILENO] < data_read[STDERR_FILENO];
    return meta;
}

}  // namespace pysandbox::runguard
