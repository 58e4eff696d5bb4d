#include "process/run.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

extern char **environ;

namespace atst {
using namespace std;

// 每次 poll 最多等待 10ms，然后检查子进程是否已经退出
static constexpr chrono::milliseconds POLL_SLICE(10);

// 进程组被杀死后，最多等待这么久来读取管道中剩余的输出
static constexpr chrono::milliseconds DRAIN_TIMEOUT(200);

static constexpr size_t BUFFER_SIZE = 65536;

const char *get_display_message(termination how) {
    switch (how) {
        case termination::EXITED: return "exited";
        case termination::SIGNALED: return "signaled";
        case termination::TIMED_OUT: return "timed out";
    }
    return "unknown";
}

bool execution_result::exited() const {
    return how == termination::EXITED;
}

bool execution_result::signaled() const {
    return how == termination::SIGNALED;
}

bool execution_result::timed_out() const {
    return how == termination::TIMED_OUT;
}

static void ignore_sigpipe() {
    // 子进程提前关闭标准输入时，向管道写入会触发 SIGPIPE，父进程不能因此退出
    static const bool ignored = [] {
        signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)ignored;
}

static void make_pipe(int fd[2]) {
    if (pipe2(fd, O_CLOEXEC) != 0)
        throw environment_error(string("unable to create pipe: ") + strerror(errno));
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        throw environment_error(string("unable to set pipe non-blocking: ") + strerror(errno));
}

/**
 * @brief 读取管道中当前可读的全部数据
 * 超出 limit 的部分读出后直接丢弃，以免子进程因为管道写满而阻塞
 * @param fd 管道的读端，读到 EOF 时会被关闭
 */
static void read_available(int &fd, string &output, bool &truncated, long long limit) {
    char buffer[BUFFER_SIZE];
    while (fd >= 0) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            long long room = limit < 0 ? (long long)n : max(0LL, limit - (long long)output.size());
            if ((long long)n > room) {
                output.append(buffer, room);
                truncated = true;
            } else {
                output.append(buffer, n);
            }
        } else if (n == 0) {
            close_fd(fd);
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        } else {
            LOG(WARNING) << "Error reading from child pipe: " << strerror(errno);
            close_fd(fd);
        }
    }
}

/**
 * @brief 向子进程的标准输入写入尽可能多的数据
 * 子进程不读取标准输入或者提前退出都是允许的，此时直接关闭管道
 */
static void write_available(int &fd, const string &input, size_t &offset) {
    while (fd >= 0 && offset < input.size()) {
        ssize_t n = write(fd, input.data() + offset, input.size() - offset);
        if (n >= 0) {
            offset += n;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else {
            // EPIPE：子进程已经关闭了标准输入
            close_fd(fd);
        }
    }
    if (offset >= input.size()) close_fd(fd);
}

static void kill_process_group(pid_t pgid) {
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
        throw environment_error(fmt::format("unable to kill process group {}: {}", pgid, strerror(errno)));
}

static int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw environment_error(fmt::format("unable to wait for process {}: {}", pid, strerror(errno)));
    }
    return status;
}

static vector<string> build_environment(const map<string, string> &extra) {
    vector<string> result;
    for (char **e = environ; e && *e; ++e) {
        string entry(*e);
        string key = entry.substr(0, entry.find('='));
        if (!extra.count(key)) result.push_back(move(entry));
    }
    for (auto &[key, value] : extra)
        result.push_back(key + "=" + value);
    return result;
}

execution_result run_process(const run_options &opt) {
    if (opt.command.empty())
        throw internal_error("empty command");

    ignore_sigpipe();

    auto executable = find_executable(opt.command[0]);
    if (!executable)
        throw spawn_error(opt.command[0], ENOENT);

    LOG(INFO) << "Running " << join_command(opt.command);

    // 子进程中只能调用异步信号安全的函数，所以 argv 和环境变量都要在 fork 之前准备好
    string path = executable->string();
    vector<char *> argv;
    for (auto &arg : opt.command)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    vector<string> env_strings = build_environment(opt.env);
    vector<char *> envp;
    for (auto &entry : env_strings)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    string cwd = opt.working_directory.string();

    int stdin_pipe[2] = {-1, -1}, stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, error_pipe[2] = {-1, -1};
    int *pipes[] = {stdin_pipe, stdout_pipe, stderr_pipe, error_pipe};
    defer {
        for (int *p : pipes) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };
    make_pipe(stdin_pipe);
    make_pipe(stdout_pipe);
    make_pipe(stderr_pipe);
    make_pipe(error_pipe);

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0)
        throw environment_error(string("unable to fork: ") + strerror(errno));

    if (pid == 0) {  // 子进程
        setpgid(0, 0);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        if (cwd.empty() || chdir(cwd.c_str()) == 0)
            execve(path.c_str(), argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = write(error_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // 父进程也设置一次进程组，避免子进程还没来得及 setpgid 时就需要杀死进程组
    setpgid(pid, pid);

    bool reaped = false;
    int wstatus = 0;
    defer {
        if (!reaped) {
            kill(-pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    };

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(error_pipe[1]);

    // exec 成功时 error_pipe 因为 O_CLOEXEC 被关闭，读到 EOF
    int exec_errno = 0;
    ssize_t n;
    while ((n = read(error_pipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR)
        ;
    if (n == sizeof(exec_errno)) {
        wait_child(pid);
        reaped = true;
        throw spawn_error(opt.command[0], exec_errno);
    }

    int &in_fd = stdin_pipe[1];
    int &out_fd = stdout_pipe[0];
    int &err_fd = stderr_pipe[0];
    set_nonblocking(in_fd);
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    const string input = opt.stdin_content.value_or("");
    size_t input_offset = 0;
    if (input.empty()) close_fd(in_fd);

    execution_result result;
    bool timed_out = false;
    auto deadline = chrono::steady_clock::now() + opt.timeout;

    while (true) {
        // WNOWAIT 不回收子进程，僵尸进程占用着进程号，杀死进程组之前进程组号不会被其他 worker 复用
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
            if (errno != EINTR)
                throw environment_error(fmt::format("unable to wait for process {}: {}", pid, strerror(errno)));
        } else if (info.si_pid == pid) {
            break;
        }

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        auto slice = min(POLL_SLICE, chrono::duration_cast<chrono::milliseconds>(deadline - now) + chrono::milliseconds(1));

        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (in_fd >= 0) fds[nfds++] = {in_fd, POLLOUT, 0};
        if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};

        int ready = poll(fds, nfds, (int)slice.count());
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw environment_error(string("poll failed: ") + strerror(errno));
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == in_fd)
                write_available(in_fd, input, input_offset);
            else if (fds[i].fd == out_fd)
                read_available(out_fd, result.out, result.out_truncated, opt.stream_size);
            else if (fds[i].fd == err_fd)
                read_available(err_fd, result.err, result.err_truncated, opt.stream_size);
        }
    }

    // 子进程退出后，它 fork 出的子孙进程可能还在运行并占用管道
    kill_process_group(pid);
    wstatus = wait_child(pid);
    reaped = true;
    result.wall_time = timer.seconds();
    close_fd(in_fd);

    auto drain_deadline = chrono::steady_clock::now() + DRAIN_TIMEOUT;
    while ((out_fd >= 0 || err_fd >= 0) && chrono::steady_clock::now() < drain_deadline) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};
        int ready = poll(fds, nfds, (int)POLL_SLICE.count());
        if (ready < 0 && errno != EINTR)
            throw environment_error(string("poll failed: ") + strerror(errno));
        read_available(out_fd, result.out, result.out_truncated, opt.stream_size);
        read_available(err_fd, result.err, result.err_truncated, opt.stream_size);
    }
    if (out_fd >= 0 || err_fd >= 0)
        LOG(WARNING) << "Output pipes of " << opt.command[0] << " still open after the process group was killed";

    if (timed_out) {
        result.how = termination::TIMED_OUT;
        LOG(WARNING) << join_command(opt.command) << " timed out after " << opt.timeout.count() << "ms";
    } else if (WIFEXITED(wstatus)) {
        result.how = termination::EXITED;
        result.exitcode = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        result.how = termination::SIGNALED;
        result.signal = WTERMSIG(wstatus);
        LOG(WARNING) << join_command(opt.command) << " terminated with signal " << result.signal;
    } else {
        throw internal_error("unexpected wait status of " + opt.command[0]);
    }

    return result;
}

}  // namespace atst
