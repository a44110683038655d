#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <sys/types.h>

#include "common/bounded_channel.hpp"
#include "runner/ring_buffer.hpp"
#include "runner/runner_type.h"

// 协作式取消：stop() 只负责置位并唤醒，真正的 kill 由 Spawner 完成
class CancelToken {
public:
    void cancel()
    {
        {
            std::lock_guard lg(mtx_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const
    {
        std::lock_guard lg(mtx_);
        return cancelled_;
    }

    // 返回 true 表示在超时前被取消
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const
    {
        std::unique_lock lk(mtx_);
        return cv_.wait_for(lk, timeout, [this] { return cancelled_; });
    }

private:
    mutable std::mutex              mtx_;
    mutable std::condition_variable cv_;
    bool                            cancelled_ = false;
};

class Job : public std::enable_shared_from_this<Job> {
public:
    using EventChannel = BoundedChannel<Event>;

    struct Subscription {
        std::shared_ptr<EventChannel> channel;
        std::function<void()>         unsubscribe;
    };

    struct Options {
        std::size_t               bufferSize       = 8192;
        std::size_t               subscriberBuffer = 100;
        std::chrono::milliseconds resultCacheTtl   = std::chrono::minutes(10);
    };

    // 状态快照，给 HTTP 层序列化用
    struct Snapshot {
        std::string            id;
        std::string            connector;
        std::string            prompt;
        std::string            workDir;
        JobStatus              status;
        SysTime                startedAt;
        std::optional<SysTime> completedAt;
        std::optional<Result>  result;
    };

    Job(std::string id, std::string connector, std::string prompt,
        std::string workDir, Options opt);
    ~Job();

    Job(const Job&)            = delete;
    Job& operator=(const Job&) = delete;

    const std::string& id()        const { return id_; }
    const std::string& connector() const { return connector_; }
    const std::string& prompt()    const { return prompt_; }
    const std::string& workDir()   const { return workDir_; }
    SysTime            startedAt() const { return startedAt_; }

    JobStatus              status()      const;
    std::optional<SysTime> completedAt() const;
    bool                   isTerminal()  const;
    Snapshot               snapshot()    const;

    // 写入环形缓冲区并非阻塞地分发给所有订阅者；result 事件额外写入结果缓存
    void appendEvent(Event event);

    // 先调用 history() 回放，再消费返回的通道；两步之间不是原子的
    Subscription subscribe(const std::string& subscriberId);
    void unsubscribe(const std::string& subscriberId);
    std::size_t subscriberCount() const;

    std::vector<Event> history() const;

    std::optional<Result> result() const;

    // 惰性判断过期，不需要额外的定时器
    std::optional<std::string> cachedResultPayload(SysTime now = SysClock::now()) const;
    // 结果缓存的原始内容（含过期时间），供 Registry 淘汰作业时转存
    std::optional<std::pair<std::string, SysTime>> resultCacheEntry() const;

    // 幂等：置取消标记，kill 进程组，非终止状态下转入 stopped
    void stop();

    // ---------------- 以下由 Spawner 调用 ----------------

    // pending -> running；已被 stop 时返回 false
    bool markRunning();

    // 进入终止状态；已经是终止状态时返回 false 且不做任何修改
    bool finish(JobStatus terminal, Result result, SysTime now = SysClock::now());

    // 发布 done 事件，关闭全部订阅通道，释放进程句柄；只生效一次
    void close();
    bool closed() const;

    void attachProcess(pid_t pid);
    void detachProcess();
    pid_t pid() const;

    const CancelToken& cancelToken() const { return cancel_; }

private:
    struct ResultCache {
        std::string payload;
        SysTime     expiresAt;
    };

    const std::string id_;
    const std::string connector_;
    const std::string prompt_;
    const std::string workDir_;
    const SysTime     startedAt_;
    const Options     opt_;

    mutable std::mutex mtx_;
    JobStatus                  status_ = JobStatus::Pending;
    std::optional<SysTime>     completedAt_;
    std::optional<Result>      result_;
    std::optional<ResultCache> resultCache_;
    std::optional<std::string> lastResultPayload_;
    pid_t                      pid_    = -1;
    bool                       closed_ = false;

    RingBuffer<Event>                                              events_;
    std::unordered_map<std::string, std::shared_ptr<EventChannel>> subscribers_;

    CancelToken cancel_;
};
