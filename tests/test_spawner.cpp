#include <gtest/gtest.h>
#include <cerrno>
#include <chrono>
#include <pthread.h>
#include <signal.h>
#include <stdexcept>
#include <thread>

#include "connector/command_connector.hpp"
#include "connector/connector_utils.hpp"
#include "runner/runner_error.h"
#include "runner/spawner.hpp"

using namespace std::chrono_literals;

namespace {

// prompt 即 shell 脚本；原样把每行作为 output 事件，BAD 开头的行抛 ParseError，BOOM 开头的行抛其他异常
class ScriptConnector : public IConnector {
public:
    bool init(const std::string&, const ConnectorConfig&) override { return true; }
    std::string name() const override { return "script"; }
    bool isAvailable() const override { return true; }

    Command buildCommand(const std::string& prompt) const override
    {
        return Command{exe, {"-c", prompt}};
    }

    std::optional<Event> parseLine(std::string_view line) const override
    {
        if (line.empty()) return std::nullopt;
        if (line.rfind("BAD", 0) == 0) throw ParseError("unparsable line");
        if (line.rfind("BOOM", 0) == 0) throw std::runtime_error("connector failure");
        return Event{EventKind::Output, std::string(line), SysClock::now()};
    }

    std::string exe = "/bin/sh";
};

std::shared_ptr<IConnector> sh_connector()
{
    auto c = std::make_shared<CommandConnector>();
    ConnectorConfig cfg;
    cfg.command = "/bin/sh";
    cfg.args    = {"-c", "{prompt}"};
    c->init("sh", cfg);
    return c;
}

std::shared_ptr<Job> make_job(const std::string& prompt, const std::string& workDir = "")
{
    return std::make_shared<Job>("job", "sh", prompt, workDir, Job::Options{256, 64, 10min});
}

bool wait_closed(const std::shared_ptr<Job>& job, std::chrono::milliseconds timeout = 10s)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!job->closed() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    return job->closed();
}

std::size_t count_kind(const std::vector<Event>& events, EventKind kind)
{
    std::size_t n = 0;
    for (const auto& ev : events) {
        if (ev.kind == kind) ++n;
    }
    return n;
}

} // namespace

TEST(Spawner, CompletedJobWithResultLine) {
    Spawner spawner({});
    auto job = make_job(R"(printf '{"type":"result","answer":42}\n\n'; exit 0)");
    spawner.spawn(job, sh_connector());
    ASSERT_TRUE(wait_closed(job));

    EXPECT_EQ(job->status(), JobStatus::Completed);
    EXPECT_TRUE(job->completedAt().has_value());
    auto result = job->result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_FALSE(result->errorMessage.has_value());
    ASSERT_TRUE(result->output.has_value());
    EXPECT_EQ(*result->output, R"({"type":"result","answer":42})");

    auto events = job->history();
    EXPECT_EQ(count_kind(events, EventKind::Result), 1u);
    EXPECT_EQ(count_kind(events, EventKind::Output), 0u);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, EventKind::Done);

    auto cached = job->cachedResultPayload();
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(*cached, R"({"type":"result","answer":42})");
}

TEST(Spawner, NonZeroExitFailsWithErrorEvent) {
    Spawner spawner({});
    auto job = make_job("echo hi; echo oops >&2; exit 3");
    spawner.spawn(job, sh_connector());
    ASSERT_TRUE(wait_closed(job));

    EXPECT_EQ(job->status(), JobStatus::Failed);
    ASSERT_TRUE(job->result().has_value());
    EXPECT_EQ(job->result()->exitCode, 3);
    EXPECT_TRUE(job->result()->errorMessage.has_value());

    auto events = job->history();
    ASSERT_GE(events.size(), 4u);
    // stdout 与 stderr 合并到同一个流
    EXPECT_EQ(events[0].payload, R"({"text":"hi"})");
    EXPECT_EQ(events[1].payload, R"({"text":"oops"})");
    EXPECT_EQ(events[events.size() - 2].kind, EventKind::Error);
    EXPECT_EQ(events.back().kind, EventKind::Done);
}

TEST(Spawner, SignalExitCodeIs128PlusSignal) {
    Spawner spawner({});
    auto job = make_job("kill -TERM $$");
    spawner.spawn(job, sh_connector());
    ASSERT_TRUE(wait_closed(job));
    EXPECT_EQ(job->status(), JobStatus::Failed);
    EXPECT_EQ(job->result()->exitCode, 128 + SIGTERM);
}

TEST(Spawner, LaunchFailureIsRecordedNotThrown) {
    Spawner spawner({});
    auto connector = std::make_shared<ScriptConnector>();
    connector->exe = "/nonexistent/cli-tool";
    auto job = make_job("true");
    spawner.spawn(job, connector);
    ASSERT_TRUE(wait_closed(job));

    EXPECT_EQ(job->status(), JobStatus::Failed);
    auto result = job->result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 1);
    ASSERT_TRUE(result->errorMessage.has_value());
    EXPECT_EQ(result->errorMessage->rfind("failed to start command:", 0), 0u);

    auto events = job->history();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, EventKind::Error);
    EXPECT_EQ(events[1].kind, EventKind::Done);
}

TEST(Spawner, BadWorkDirIsLaunchFailure) {
    Spawner spawner({});
    auto job = make_job("true", "/nonexistent/work/dir");
    spawner.spawn(job, sh_connector());
    ASSERT_TRUE(wait_closed(job));
    EXPECT_EQ(job->status(), JobStatus::Failed);
    ASSERT_TRUE(job->result()->errorMessage.has_value());
    EXPECT_NE(job->result()->errorMessage->find("chdir"), std::string::npos);
}

TEST(Spawner, WorkDirAppliedInChild) {
    Spawner spawner({});
    auto job = make_job("pwd", "/");
    spawner.spawn(job, sh_connector());
    ASSERT_TRUE(wait_closed(job));
    EXPECT_EQ(job->status(), JobStatus::Completed);
    auto events = job->history();
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[0].payload, R"({"text":"/"})");
}

TEST(Spawner, StopKillsRunningProcess) {
    Spawner spawner({});
    auto job = make_job("echo started; sleep 30");
    auto sub = job->subscribe("watcher");
    spawner.spawn(job, sh_connector());

    Event ev;
    ASSERT_EQ(sub.channel->popFor(ev, 5s), Job::EventChannel::PopStatus::Ok);
    EXPECT_EQ(ev.kind, EventKind::Output);
    pid_t pid = job->pid();
    ASSERT_GT(pid, 0);

    auto start = std::chrono::steady_clock::now();
    job->stop();
    EXPECT_EQ(job->status(), JobStatus::Stopped);
    ASSERT_TRUE(wait_closed(job));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    std::vector<Event> rest;
    while (sub.channel->popFor(ev, 100ms) == Job::EventChannel::PopStatus::Ok) rest.push_back(ev);
    ASSERT_GE(rest.size(), 2u);
    EXPECT_EQ(rest[rest.size() - 2].kind, EventKind::Error);
    EXPECT_EQ(rest.back().kind, EventKind::Done);

    // 进程已被回收
    EXPECT_EQ(::kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
    EXPECT_EQ(job->pid(), -1);
    EXPECT_EQ(job->result()->exitCode, -1);
    EXPECT_EQ(job->status(), JobStatus::Stopped);
}

TEST(Spawner, TimeoutStopsJob) {
    Spawner spawner({});
    auto job = make_job("sleep 30");
    auto start = std::chrono::steady_clock::now();
    spawner.spawn(job, sh_connector(), 200ms);
    ASSERT_TRUE(wait_closed(job));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    EXPECT_EQ(job->status(), JobStatus::Stopped);
    ASSERT_TRUE(job->result().has_value());
    EXPECT_EQ(job->result()->exitCode, -1);
    EXPECT_EQ(job->result()->errorMessage, std::optional<std::string>("process timed out after 200ms"));
}

TEST(Spawner, BackgroundGrandchildDoesNotHangJob) {
    Spawner spawner({});
    auto job = make_job("sleep 30 & echo bg; exit 0");
    auto start = std::chrono::steady_clock::now();
    spawner.spawn(job, sh_connector());
    ASSERT_TRUE(wait_closed(job));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(job->status(), JobStatus::Completed);
}

TEST(Spawner, ParseErrorSkipsLine) {
    Spawner spawner({});
    auto job = make_job("echo BAD line; echo good");
    spawner.spawn(job, std::make_shared<ScriptConnector>());
    ASSERT_TRUE(wait_closed(job));
    EXPECT_EQ(job->status(), JobStatus::Completed);

    auto events = job->history();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].payload, "good");
}

TEST(Spawner, ConnectorExceptionSkipsLineAndKeepsReading) {
    Spawner spawner({});
    auto job = make_job("echo first; echo BOOM; echo last");
    spawner.spawn(job, std::make_shared<ScriptConnector>());
    ASSERT_TRUE(wait_closed(job));
    EXPECT_EQ(job->status(), JobStatus::Completed);

    auto events = job->history();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].payload, "first");
    EXPECT_EQ(events[1].payload, "last");
    EXPECT_EQ(events[2].kind, EventKind::Done);
}

TEST(Spawner, InvalidUtf8LineDoesNotStopReader) {
    Spawner spawner({});
    auto job = make_job(R"(printf 'before\ncaf\351\nafter\n')");
    spawner.spawn(job, sh_connector());
    ASSERT_TRUE(wait_closed(job));
    EXPECT_EQ(job->status(), JobStatus::Completed);

    auto events = job->history();
    ASSERT_EQ(count_kind(events, EventKind::Output), 3u);
    EXPECT_EQ(events[0].payload, R"({"text":"before"})");
    EXPECT_EQ(events[1].payload, "{\"text\":\"caf\xEF\xBF\xBD\"}");
    EXPECT_EQ(events[2].payload, R"({"text":"after"})");
    EXPECT_EQ(events.back().kind, EventKind::Done);
}

TEST(Spawner, ChildSignalsResetFromServerMask) {
    // 与服务主线程相同：屏蔽 SIGINT / SIGTERM，忽略 SIGPIPE；监督线程继承这些设置
    sigset_t blocked, saved;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    ASSERT_EQ(::pthread_sigmask(SIG_BLOCK, &blocked, &saved), 0);
    auto savedPipe = ::signal(SIGPIPE, SIG_IGN);

    std::shared_ptr<Job> killed, piped;
    {
        Spawner spawner({});
        killed = make_job("kill -TERM $$; echo survived");
        piped  = make_job("yes | head -n 1; echo done");
        spawner.spawn(killed, sh_connector());
        spawner.spawn(piped, sh_connector());
        wait_closed(killed);
        wait_closed(piped);
    }

    ::signal(SIGPIPE, savedPipe);
    ::pthread_sigmask(SIG_SETMASK, &saved, nullptr);

    ASSERT_TRUE(killed->closed());
    EXPECT_EQ(killed->status(), JobStatus::Failed);
    EXPECT_EQ(killed->result()->exitCode, 128 + SIGTERM);
    for (const auto& ev : killed->history()) {
        EXPECT_EQ(ev.payload.find("survived"), std::string::npos);
    }

    ASSERT_TRUE(piped->closed());
    EXPECT_EQ(piped->status(), JobStatus::Completed);
    auto events = piped->history();
    ASSERT_EQ(count_kind(events, EventKind::Output), 2u);
    EXPECT_EQ(events[0].payload, R"({"text":"y"})");
    EXPECT_EQ(events[1].payload, R"({"text":"done"})");
}

TEST(Spawner, LongLinesAreTruncated) {
    Spawner spawner({});
    auto job = make_job("head -c 1500000 /dev/zero | tr '\\0' 'a'; echo; echo tail");
    spawner.spawn(job, std::make_shared<ScriptConnector>());
    ASSERT_TRUE(wait_closed(job));
    EXPECT_EQ(job->status(), JobStatus::Completed);

    auto events = job->history();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].payload.size(), 1024u * 1024u);
    EXPECT_EQ(events[1].payload, "tail");
}

TEST(Spawner, StopBeforeLaunchNeverStartsProcess) {
    Spawner spawner({});
    auto job = make_job("echo should-not-run");
    job->stop();
    spawner.spawn(job, sh_connector());
    ASSERT_TRUE(wait_closed(job));

    EXPECT_EQ(job->status(), JobStatus::Stopped);
    auto events = job->history();
    EXPECT_EQ(count_kind(events, EventKind::Output), 0u);
    EXPECT_EQ(events.back().kind, EventKind::Done);
}

TEST(Spawner, ShutdownStopsRunningJobs) {
    Spawner spawner({});
    auto a = make_job("sleep 30");
    auto b = make_job("sleep 30");
    spawner.spawn(a, sh_connector());
    spawner.spawn(b, sh_connector());

    auto start = std::chrono::steady_clock::now();
    spawner.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    EXPECT_TRUE(a->closed());
    EXPECT_TRUE(b->closed());
    EXPECT_EQ(a->status(), JobStatus::Stopped);
    EXPECT_EQ(spawner.active(), 0u);
    EXPECT_THROW(spawner.spawn(make_job("true"), sh_connector()), std::runtime_error);
}

TEST(Spawner, FinishedTasksAreReaped) {
    Spawner spawner({});
    auto a = make_job("true");
    spawner.spawn(a, sh_connector());
    ASSERT_TRUE(wait_closed(a));

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (spawner.active() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(spawner.active(), 0u);
}
