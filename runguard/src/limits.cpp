#include "limits.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <linux/seccomp.h>
#include <math.h>
#include <seccomp.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace pysandbox::runguard {
using namespace std;

// syscalls that fail with EACCES inside the sandbox
static const int denied_syscalls[] = {
    // network
    SCMP_SYS(socket), SCMP_SYS(socketpair), SCMP_SYS(connect), SCMP_SYS(bind),
    SCMP_SYS(listen), SCMP_SYS(accept), SCMP_SYS(accept4), SCMP_SYS(sendto),
    SCMP_SYS(sendmsg), SCMP_SYS(sendmmsg),
    // other processes
    SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
    // leaving the process group would escape the final group kill
    SCMP_SYS(setsid), SCMP_SYS(setpgid),
    // namespaces and mounts
    SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(unshare), SCMP_SYS(setns),
    SCMP_SYS(pivot_root), SCMP_SYS(chroot),
    // kernel facilities
    SCMP_SYS(keyctl), SCMP_SYS(add_key), SCMP_SYS(request_key), SCMP_SYS(bpf),
    SCMP_SYS(perf_event_open), SCMP_SYS(userfaultfd), SCMP_SYS(open_by_handle_at),
    SCMP_SYS(name_to_handle_at), SCMP_SYS(init_module), SCMP_SYS(finit_module),
    SCMP_SYS(delete_module), SCMP_SYS(kexec_load), SCMP_SYS(reboot),
    SCMP_SYS(swapon), SCMP_SYS(swapoff)};

seccomp_program build_seccomp_filter() {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) throw sandbox_error("seccomp_init failed");
    defer { seccomp_release(ctx); };

    for (int syscall : denied_syscalls) {
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), syscall, 0);
        if (rc < 0)
            throw sandbox_error(fmt::format("seccomp_rule_add({}): {}", syscall, strerror(-rc)));
    }

    // kill(0, sig) targets the child's own process group, anything else
    // could reach the supervisor running under the same uid
    int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(kill), 1, SCMP_A0(SCMP_CMP_NE, 0));
    if (rc < 0) throw sandbox_error(fmt::format("seccomp_rule_add(kill): {}", strerror(-rc)));

    // export as raw BPF through a memory file, the child only needs prctl
    int fd = memfd_create("seccomp filter", MFD_CLOEXEC);
    if (fd < 0) throw sandbox_error(fmt::format("memfd_create: {}", strerror(errno)));
    defer { close(fd); };

    rc = seccomp_export_bpf(ctx, fd);
    if (rc < 0) throw sandbox_error(fmt::format("seccomp_export_bpf: {}", strerror(-rc)));

    off_t size = lseek(fd, 0, SEEK_END);
    if (size < 0 || size % sizeof(struct sock_filter) != 0)
        throw sandbox_error("seccomp filter export has unexpected size");
    if (lseek(fd, 0, SEEK_SET) < 0)
        throw sandbox_error(fmt::format("lseek: {}", strerror(errno)));

    seccomp_program program;
    program.filter.resize(size / sizeof(struct sock_filter));
    char *buf = reinterpret_cast<char *>(program.filter.data());
    for (off_t done = 0; done < size;) {
        ssize_t n = read(fd, buf + done, size - done);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) throw sandbox_error(fmt::format("reading seccomp filter: {}", n < 0 ? strerror(errno) : "short read"));
        done += n;
    }

    DLOG(INFO) << "seccomp filter compiled to " << program.filter.size() << " instructions";
    return program;
}

static bool set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) == 0;
}

const char *set_restrictions(const runguard_options &opt) {
    if (opt.use_cpu_limit) {
        // SIGXCPU at the soft limit marks a CPU timeout, SIGKILL one second later ends a program ignoring it
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        if (!set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1)) return "setrlimit(RLIMIT_CPU)";
    }

    if (opt.memory_limit > 0 && !set_rlimit(RLIMIT_AS, opt.memory_limit, opt.memory_limit))
        return "setrlimit(RLIMIT_AS)";
    if (opt.file_limit > 0 && !set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit))
        return "setrlimit(RLIMIT_FSIZE)";
    if (opt.nofile > 0 && !set_rlimit(RLIMIT_NOFILE, opt.nofile, opt.nofile))
        return "setrlimit(RLIMIT_NOFILE)";
    if (opt.nproc > 0 && !set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc))
        return "setrlimit(RLIMIT_NPROC)";
    if (opt.no_core_dumps && !set_rlimit(RLIMIT_CORE, 0, 0))
        return "setrlimit(RLIMIT_CORE)";
    return nullptr;
}

const char *set_seccomp(const seccomp_program &program) {
    struct sock_fprog prog;
    prog.len = (unsigned short)program.filter.size();
    prog.filter = const_cast<struct sock_filter *>(program.filter.data());

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) return "prctl(PR_SET_NO_NEW_PRIVS)";
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) != 0) return "prctl(PR_SET_SECCOMP)";
    return nullptr;
}

}  // namespace pysandbox::runguard
