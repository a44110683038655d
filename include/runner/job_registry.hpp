// job_registry.hpp
#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "runner/job.hpp"

class TimerScheduler;

class JobRegistry {
public:
    struct Options {
        std::size_t               maxConcurrent = 10;
        std::chrono::milliseconds cleanupDelay  = std::chrono::minutes(5);
        Job::Options              job;
    };

    explicit JobRegistry(Options opt);
    ~JobRegistry();

    // 禁止拷贝
    JobRegistry(const JobRegistry&)            = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // 准入检查与插入在同一把锁内完成；超过上限抛 AdmissionError
    std::shared_ptr<Job> create(const std::string& connector,
                                const std::string& prompt,
                                const std::string& workDir);

    // 不存在时抛 NotFoundError
    std::shared_ptr<Job> get(const std::string& id) const;
    std::vector<std::shared_ptr<Job>> list() const;

    // 幂等；不存在时抛 NotFoundError
    void stop(const std::string& id);

    // 仅允许删除终止状态的作业，否则抛 ConflictError
    void remove(const std::string& id);

    // 非终止状态（pending / running）的作业数
    std::size_t count() const;
    std::size_t size() const;

    // 先查作业自身的缓存，作业被清理后再查转存表
    std::optional<std::string> cachedResult(const std::string& id,
                                            SysTime now = SysClock::now()) const;

    // 清理完成时间早于 now - cleanupDelay 的终止作业，返回清理数量
    std::size_t sweep(SysTime now = SysClock::now());

    // 以 cleanupDelay 为周期挂到调度器上
    void startCleanup(TimerScheduler& scheduler);
    void stopCleanup();

    const Options& options() const { return opt_; }

private:
    struct RetainedResult {
        std::string payload;
        SysTime     expiresAt;
    };

    static std::string generateId();

    const Options opt_;

    mutable std::shared_mutex                             mtx_;
    std::unordered_map<std::string, std::shared_ptr<Job>> jobs_;        // key = job id
    std::unordered_map<std::string, RetainedResult>       retained_;    // 已清理作业的结果缓存

    TimerScheduler* scheduler_    = nullptr;
    std::size_t     cleanupTimer_ = 0;
};
