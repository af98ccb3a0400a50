#include "sandbox/process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <fstream>
#include <system_error>
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "config.hpp"

extern char **environ;

namespace codejudge {
using namespace std;

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static vector<string> build_environment(const process_options &options) {
    map<string, string> merged;
    if (options.inherit_env) {
        for (char **env = environ; env && *env; ++env) {
            string entry(*env);
            size_t eq = entry.find('=');
            if (eq == string::npos) continue;
            merged[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    for (auto &[key, value] : options.env)
        merged[key] = value;

    vector<string> result;
    for (auto &[key, value] : merged)
        result.push_back(key + "=" + value);
    return result;
}

/**
 * @brief 子进程中 fork 之后、exec 之前的准备工作
 * 只能调用 async-signal-safe 的函数，失败时把 errno 写入 exec_fd 并退出
 */
[[noreturn]] static void exec_child(const process_options &options, char **argv, char **envp,
                                    int out_fd, int err_fd, int exec_fd) {
    auto fail = [exec_fd]() {
        int err = errno;
        ssize_t ignored = write(exec_fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    };

    // 避免子进程被终止，要求父进程处理中断信号
    signal(SIGINT, SIG_IGN);
    signal(SIGPIPE, SIG_DFL);
    if (setpgid(0, 0) < 0) fail();

    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd < 0) fail();
    if (dup2(null_fd, STDIN_FILENO) < 0) fail();
    if (dup2(out_fd, STDOUT_FILENO) < 0) fail();
    if (dup2(err_fd, STDERR_FILENO) < 0) fail();

    if (!options.work_dir.empty() && chdir(options.work_dir.c_str()) < 0) fail();

    if (options.cpu_limit_seconds > 0) {
        struct rlimit lim;
        lim.rlim_cur = options.cpu_limit_seconds;
        lim.rlim_max = options.cpu_limit_seconds + 1;
        if (setrlimit(RLIMIT_CPU, &lim) < 0) fail();
    }
    if (options.data_limit_bytes > 0) {
        struct rlimit lim;
        lim.rlim_cur = lim.rlim_max = options.data_limit_bytes;
        if (setrlimit(RLIMIT_DATA, &lim) < 0) fail();
    }

    execvpe(argv[0], argv, envp);
    fail();
    _exit(127);
}

/**
 * @brief 读取管道中当前可读的全部内容
 * @param keep_tail 超出 limit 时保留末尾而不是开头，缓冲区最多增长到 2 * limit 再裁剪
 * @return 若管道已关闭返回 false
 */
static bool drain_pipe(int fd, string &buffer, size_t limit, bool keep_tail, bool &truncated) {
    char chunk[65536];
    while (true) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            if (keep_tail) {
                buffer.append(chunk, n);
                if (buffer.size() > 2 * limit) {
                    buffer.erase(0, buffer.size() - limit);
                    truncated = true;
                }
            } else {
                size_t keep = buffer.size() < limit ? min((size_t)n, limit - buffer.size()) : 0;
                buffer.append(chunk, keep);
                if (keep < (size_t)n) truncated = true;
            }
        } else if (n == 0) {
            return false;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        } else {
            return false;
        }
    }
}

process_result run_process(const process_options &options) {
    if (options.argv.empty())
        throw invalid_argument("Command should not be empty");

    vector<string> env_strings = build_environment(options);
    vector<char *> argv, envp;
    for (auto &arg : options.argv) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (auto &entry : env_strings) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    if (DEBUG) LOG(INFO) << "Spawning process: " << boost::algorithm::join(options.argv, " ");

    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
    defer {
        for (int *fds : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };
    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 || pipe2(exec_pipe, O_CLOEXEC) < 0)
        throw system_error(errno, system_category(), "Unable to create pipes");

    process_result result;
    elapsed_time timer;

    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "Unable to fork");
        case 0:  // 子进程
            exec_child(options, argv.data(), envp.data(), out_pipe[1], err_pipe[1], exec_pipe[1]);
        default:  // 父进程
            break;
    }

    result.pid = pid;
    int status = 0;
    bool exited = false;
    // 等待过程中抛出异常时，仍然要结束整个进程组并回收子进程
    defer {
        if (!exited) {
            kill(-pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                ;
        }
    };
    setpgid(pid, pid);  // 与子进程中的 setpgid 竞争，保证 kill(-pid) 一定有效
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == sizeof(exec_errno)) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
        exited = true;
        throw system_error(exec_errno, system_category(), "Unable to execute " + options.argv[0]);
    }

    fcntl(out_pipe[0], F_SETFL, fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    bool out_open = true, err_open = true;
    while (true) {
        if (!exited) {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == pid) {
                exited = true;
            } else if (ret < 0 && errno != EINTR) {
                throw system_error(errno, system_category(), "Unable to wait for process");
            }
        }

        if (!exited && options.deadline && chrono::steady_clock::now() >= *options.deadline) {
            LOG(WARNING) << "Process " << pid << " (" << options.argv[0] << ") exceeded its deadline, killing process group";
            kill(-pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                ;
            exited = true;
            result.timed_out = true;
        }

        if (exited) {
            // 选手程序可能留下了持有管道的后台进程
            kill(-pid, SIGKILL);
            if (out_open) drain_pipe(out_pipe[0], result.stdout_text, options.output_limit, true, result.truncated);
            if (err_open) drain_pipe(err_pipe[0], result.stderr_text, options.output_limit, false, result.truncated);
            break;
        }

        int timeout_ms = 100;
        if (options.deadline) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(*options.deadline - chrono::steady_clock::now()).count();
            timeout_ms = (int)max<long long>(0, min<long long>(timeout_ms, remaining));
        }

        struct pollfd fds[2];
        int nfds = 0;
        if (out_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
        if (err_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};
        if (nfds == 0) {
            // 两个管道都已关闭，只需要等待进程结束
            usleep(timeout_ms * 1000);
            continue;
        }
        int ready = poll(fds, nfds, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "Unable to poll process output");
        }
        for (int i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out_pipe[0])
                out_open = drain_pipe(out_pipe[0], result.stdout_text, options.output_limit, true, result.truncated);
            else
                err_open = drain_pipe(err_pipe[0], result.stderr_text, options.output_limit, false, result.truncated);
        }
    }

    if (result.stdout_text.size() > options.output_limit) {
        result.stdout_text.erase(0, result.stdout_text.size() - options.output_limit);
        result.truncated = true;
    }

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exitcode = 128 + result.signal;
    }
    result.wall_time_ms = timer.milliseconds();

    if (result.truncated)
        LOG(WARNING) << "Output of process " << pid << " (" << options.argv[0] << ") exceeded " << options.output_limit << " bytes and was truncated";
    return result;
}

bool is_process_alive(pid_t pid) {
    ifstream fin("/proc/" + to_string(pid) + "/stat");
    if (!fin) return false;
    string stat;
    getline(fin, stat);
    // 格式为 "pid (comm) state ..."，comm 中可能含有空格和括号
    size_t pos = stat.rfind(')');
    if (pos == string::npos || pos + 2 >= stat.size()) return false;
    char state = stat[pos + 2];
    return state != 'Z' && state != 'X';
}

}  // namespace codejudge
