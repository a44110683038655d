#include "runner/spawner.hpp"
#include "runner/runner_error.h"
#include "common/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

using namespace std::chrono_literals;

namespace {

constexpr std::size_t kMaxLineBytes = 1024 * 1024;
constexpr auto        kPollInterval = 10ms;

struct ChildProcess {
    pid_t pid   = -1;
    int   outFd = -1;
};

// 子进程通过 close-on-exec 管道回报 exec / chdir 失败
struct LaunchFailure {
    int stage = 0;      // 0 = chdir, 1 = exec
    int err   = 0;
};

// 保证任何路径上都执行 Job::close()
class JobCloser {
public:
    explicit JobCloser(std::shared_ptr<Job> job) : job_(std::move(job)) {}
    ~JobCloser()
    {
        try {
            job_->close();
        } catch (const std::exception& e) {
            spdlog::error("Spawner: job {} close failed: {}", job_->id(), e.what());
        }
    }

    JobCloser(const JobCloser&)            = delete;
    JobCloser& operator=(const JobCloser&) = delete;

private:
    std::shared_ptr<Job> job_;
};

std::string format_duration(std::chrono::milliseconds d)
{
    auto ms = d.count();
    if (ms < 1000) return fmt::format("{}ms", ms);

    std::string out;
    auto h = ms / 3600000;
    auto m = (ms % 3600000) / 60000;
    auto s = (ms % 60000) / 1000;
    auto frac = ms % 1000;
    if (h > 0) out += fmt::format("{}h", h);
    if (h > 0 || m > 0) out += fmt::format("{}m", m);
    if (frac == 0) out += fmt::format("{}s", s);
    else           out += fmt::format("{}.{:03}s", s, frac);
    return out;
}

Event error_event(const std::string& message)
{
    nlohmann::json payload;
    payload["error"] = message;
    // 错误信息可能带有进程输出里的非法 UTF-8
    auto text = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return Event{EventKind::Error, std::move(text), SysClock::now()};
}

int decode_status(int status)
{
    if (WIFEXITED(status))   return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void close_fd(int& fd)
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// ------------------------------------------------------------------
// 细节 1：fork + exec，stdout / stderr 合并到同一个管道
ChildProcess launch(const Command& cmd, const std::string& workDir)
{
    if (cmd.exe.empty()) throw LaunchError("empty command");

    // argv 必须在 fork 之前准备好，子进程里只做 async-signal-safe 的调用
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(cmd.exe.c_str()));
    for (const auto& s : cmd.args) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    int outPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        throw LaunchError(fmt::format("pipe: {}", std::strerror(errno)));
    }
    int errPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        throw LaunchError(fmt::format("pipe: {}", std::strerror(err)));
    }

    // 服务进程屏蔽了 SIGINT / SIGTERM 并忽略 SIGPIPE，子进程需要恢复默认
    sigset_t emptyMask;
    sigemptyset(&emptyMask);
    struct sigaction defaultAction{};
    defaultAction.sa_handler = SIG_DFL;
    sigemptyset(&defaultAction.sa_mask);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) ::close(fd);
        throw LaunchError(fmt::format("fork: {}", std::strerror(err)));
    }

    if (pid == 0) {              // ---------- 子进程 ----------
        ::setpgid(0, 0);         // 自成进程组，kill(-pid) 连同孙进程一起结束
        ::sigprocmask(SIG_SETMASK, &emptyMask, nullptr);
        ::sigaction(SIGPIPE, &defaultAction, nullptr);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(outPipe[1], STDERR_FILENO);

        LaunchFailure failure;
        if (!workDir.empty() && ::chdir(workDir.c_str()) != 0) {
            failure = LaunchFailure{0, errno};
        } else {
            ::execvp(argv[0], argv.data());
            // execvp 只有失败才会返回
            failure = LaunchFailure{1, errno};
        }
        ssize_t n = ::write(errPipe[1], &failure, sizeof(failure));
        (void)n;
        ::_exit(127);
    }

    // ---------- 父进程 ----------
    ::setpgid(pid, pid);         // 与子进程里的调用互为兜底，exec 之后失败无影响
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    LaunchFailure failure;
    ssize_t n;
    do {
        n = ::read(errPipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::close(errPipe[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        ::close(outPipe[0]);
        if (failure.stage == 0) {
            throw LaunchError(fmt::format("chdir {}: {}", workDir, std::strerror(failure.err)));
        }
        throw LaunchError(fmt::format("exec {}: {}", cmd.exe, std::strerror(failure.err)));
    }

    return ChildProcess{pid, outPipe[0]};
}

// ------------------------------------------------------------------
// 细节 2：读线程——按行切分，交给连接器解析后写入作业
void handle_line(Job& job, const IConnector& connector, const std::string& line)
{
    try {
        auto ev = connector.parseLine(line);
        if (!ev) return;
        spdlog::info("Spawner: job {} {} event: {}",
                     job.id(), to_string(ev->kind), logger::truncate(ev->payload));
        job.appendEvent(std::move(*ev));
    } catch (const ParseError& e) {
        spdlog::warn("Spawner: job {} skipped line ({}): {}",
                     job.id(), e.what(), logger::truncate(line));
    } catch (const std::exception& e) {
        // 单行出错只丢这一行，读线程继续排空管道
        spdlog::warn("Spawner: job {} failed to handle line ({}): {}",
                     job.id(), e.what(), logger::truncate(line));
    }
}

void read_output(int fd, Job& job, const IConnector& connector, std::string& readError)
{
    std::string line;
    bool        truncating = false;
    char        buf[8192];

    try {
        while (true) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                readError = std::strerror(errno);
                spdlog::error("Spawner: job {} error reading output: {}", job.id(), readError);
                break;
            }
            if (n == 0) break;

            const char* p   = buf;
            const char* end = buf + n;
            while (p < end) {
                const char* nl = static_cast<const char*>(std::memchr(p, '\n', end - p));
                const char* chunkEnd = nl ? nl : end;

                if (!truncating) {
                    std::size_t room  = kMaxLineBytes - line.size();
                    std::size_t chunk = static_cast<std::size_t>(chunkEnd - p);
                    if (chunk > room) {
                        line.append(p, room);
                        truncating = true;
                        spdlog::warn("Spawner: job {} output line exceeds {} bytes, truncated",
                                     job.id(), kMaxLineBytes);
                    } else {
                        line.append(p, chunk);
                    }
                }

                if (!nl) break;
                handle_line(job, connector, line);
                line.clear();
                truncating = false;
                p = nl + 1;
            }
        }
        if (!line.empty()) handle_line(job, connector, line);
    } catch (const std::exception& e) {
        readError = e.what();
        spdlog::error("Spawner: job {} output reader failed: {}", job.id(), readError);
    }
}

// 子进程已退出时返回 true；WNOWAIT 保留僵尸进程，pid 在回收前不会被复用
bool has_exited(pid_t pid)
{
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno != EINTR;
    }
    return info.si_pid != 0;
}

// 子进程的收尾：杀进程组、回收、等读线程、关管道；只执行一次
// 监督流程中途抛异常时由析构完成，读线程不会以 joinable 状态被销毁
class ChildReaper {
public:
    ChildReaper(Job& job, ChildProcess& child, std::thread& reader)
        : job_(job), child_(child), reader_(reader) {}

    ~ChildReaper()
    {
        try {
            reap();
        } catch (const std::exception& e) {
            spdlog::error("Spawner: job {} cleanup of pid {} failed: {}", job_.id(), child_.pid, e.what());
        }
    }

    ChildReaper(const ChildReaper&)            = delete;
    ChildReaper& operator=(const ChildReaper&) = delete;

    // 返回 waitpid 的原始状态
    int reap()
    {
        if (reaped_) return status_;
        reaped_ = true;

        // 回收前杀掉整个进程组：超时 / 取消时是子进程本身，正常退出时是残留的孙进程，
        // 否则它们持有的管道写端会让读线程一直等不到 EOF
        ::kill(-child_.pid, SIGKILL);
        job_.detachProcess();

        while (::waitpid(child_.pid, &status_, 0) < 0 && errno == EINTR) {}
        if (reader_.joinable()) reader_.join();
        close_fd(child_.outFd);
        return status_;
    }

private:
    Job&          job_;
    ChildProcess& child_;
    std::thread&  reader_;
    bool          reaped_ = false;
    int           status_ = 0;
};

} // namespace

Spawner::Spawner(Options opt)
    : opt_(opt)
{
}

Spawner::~Spawner()
{
    shutdown();
}

void Spawner::spawn(std::shared_ptr<Job> job,
                    std::shared_ptr<IConnector> connector,
                    std::optional<std::chrono::milliseconds> timeout)
{
    if (!job || !connector) throw std::invalid_argument("Spawner: job and connector required");

    std::lock_guard lg(mtx_);
    if (shutdown_) throw std::runtime_error("spawner is shut down");

    reapFinished();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    auto tout     = timeout.value_or(opt_.defaultTimeout);

    std::thread th([this, job, connector, tout, finished]() {
        supervise(job, connector, tout);
        finished->store(true, std::memory_order_release);
    });
    tasks_.push_back(Task{job, finished, std::move(th)});
}

// ------------------------------------------------------------------
// 细节 3：监督线程——等待退出 / 超时 / 取消，推进状态机
void Spawner::supervise(std::shared_ptr<Job> job,
                        std::shared_ptr<IConnector> connector,
                        std::chrono::milliseconds timeout)
{
    JobCloser closer(job);
    const auto started = std::chrono::steady_clock::now();

    try {
        Command cmd = connector->buildCommand(job->prompt());

        if (!job->markRunning()) {
            spdlog::info("Spawner: job {} stopped before launch", job->id());
            job->appendEvent(error_event("process stopped"));
            return;
        }

        ChildProcess child;
        try {
            child = launch(cmd, job->workDir());
        } catch (const LaunchError& e) {
            std::string msg = fmt::format("failed to start command: {}", e.what());
            spdlog::error("Spawner: job {} {}", job->id(), msg);
            job->appendEvent(error_event(msg));
            job->finish(JobStatus::Failed, Result{1, std::nullopt, msg});
            return;
        }

        spdlog::info("Spawner: job {} started pid {}: {} ({} args), workDir='{}'",
                     job->id(), child.pid, cmd.exe, cmd.args.size(), job->workDir());
        job->attachProcess(child.pid);

        std::string readError;
        std::thread reader;
        ChildReaper reaper(*job, child, reader);
        reader = std::thread([&job, &connector, &readError, fd = child.outFd]() {
            read_output(fd, *job, *connector, readError);
        });

        enum class Cause { Exited, Cancelled, Timeout };
        Cause cause = Cause::Exited;
        const auto  deadline = started + timeout;
        const auto& token    = job->cancelToken();
        while (true) {
            if (has_exited(child.pid))                            { cause = Cause::Exited;    break; }
            if (token.cancelled())                                { cause = Cause::Cancelled; break; }
            if (std::chrono::steady_clock::now() >= deadline)     { cause = Cause::Timeout;   break; }
            token.waitFor(kPollInterval);
        }

        int status = reaper.reap();
        int exitCode = decode_status(status);
        switch (cause) {
        case Cause::Cancelled: {
            std::string msg = "process stopped";
            job->appendEvent(error_event(msg));
            job->finish(JobStatus::Stopped, Result{-1, std::nullopt, msg});
            break;
        }
        case Cause::Timeout: {
            std::string msg = fmt::format("process timed out after {}", format_duration(timeout));
            spdlog::warn("Spawner: job {} pid {} killed on timeout", job->id(), child.pid);
            job->appendEvent(error_event(msg));
            job->finish(JobStatus::Stopped, Result{-1, std::nullopt, msg});
            break;
        }
        case Cause::Exited:
            if (exitCode == 0 && readError.empty()) {
                job->finish(JobStatus::Completed, Result{0, std::nullopt, std::nullopt});
            } else if (exitCode == 0) {
                std::string msg = fmt::format("error reading output: {}", readError);
                job->appendEvent(error_event(msg));
                job->finish(JobStatus::Failed, Result{1, std::nullopt, msg});
            } else {
                std::string msg = fmt::format("process exited with code {}", exitCode);
                job->appendEvent(error_event(msg));
                job->finish(JobStatus::Failed, Result{exitCode, std::nullopt, msg});
            }
            break;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        auto result = job->result();
        spdlog::info("Spawner: job {} finished: status={}, exit_code={}, duration={}",
                     job->id(), to_string(job->status()),
                     result ? result->exitCode : exitCode, format_duration(elapsed));
    } catch (const std::exception& e) {
        spdlog::error("Spawner: job {} supervision failed: {}", job->id(), e.what());
        job->appendEvent(error_event(e.what()));
        job->finish(JobStatus::Failed, Result{1, std::nullopt, std::string(e.what())});
    }
}

void Spawner::reapFinished()
{
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->finished->load(std::memory_order_acquire)) {
            if (it->thread.joinable()) it->thread.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

// ------------------------------------------------------------------
// 细节 4：优雅关闭
void Spawner::shutdown()
{
    std::vector<Task> tasks;
    {
        std::lock_guard lg(mtx_);
        if (shutdown_ && tasks_.empty()) return;
        shutdown_ = true;
        tasks.swap(tasks_);
    }

    if (!tasks.empty()) {
        spdlog::info("Spawner: shutting down, stopping {} job(s)", tasks.size());
    }
    for (auto& task : tasks) task.job->stop();
    for (auto& task : tasks) {
        if (task.thread.joinable()) task.thread.join();
    }
}

std::size_t Spawner::active() const
{
    std::lock_guard lg(mtx_);
    std::size_t n = 0;
    for (const auto& task : tasks_) {
        if (!task.finished->load(std::memory_order_acquire)) ++n;
    }
    return n;
}
