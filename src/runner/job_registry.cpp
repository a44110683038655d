// job_registry.cpp
#include "runner/job_registry.hpp"
#include "runner/runner_error.h"
#include "common/timer_scheduler.hpp"

#include <mutex>
#include <random>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

JobRegistry::JobRegistry(Options opt)
    : opt_(opt)
{
    spdlog::debug("JobRegistry: max_concurrent={}, cleanup_delay={}ms",
                  opt_.maxConcurrent, opt_.cleanupDelay.count());
}

JobRegistry::~JobRegistry()
{
    stopCleanup();
}

std::string JobRegistry::generateId()
{
    // UUID v4
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(hi >> 32),
                       static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                       static_cast<uint32_t>(hi & 0xFFFF),
                       static_cast<uint32_t>(lo >> 48),
                       lo & 0xFFFFFFFFFFFFULL);
}

std::shared_ptr<Job> JobRegistry::create(const std::string& connector,
                                         const std::string& prompt,
                                         const std::string& workDir)
{
    std::shared_ptr<Job> job;
    {
        std::unique_lock lg(mtx_);

        std::size_t active = 0;
        for (const auto& [id, j] : jobs_) {
            if (!j->isTerminal()) ++active;
        }
        if (active >= opt_.maxConcurrent) {
            spdlog::warn("JobRegistry: max concurrent jobs reached ({}/{})",
                         active, opt_.maxConcurrent);
            throw AdmissionError("too many concurrent jobs");
        }

        std::string id;
        do {
            id = generateId();
        } while (jobs_.count(id));

        job = std::make_shared<Job>(id, connector, prompt, workDir, opt_.job);
        jobs_.emplace(id, job);
    }
    spdlog::info("JobRegistry: job {} created, connector={}, workDir='{}'",
                 job->id(), connector, workDir);
    return job;
}

std::shared_ptr<Job> JobRegistry::get(const std::string& id) const
{
    std::shared_lock lg(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) throw NotFoundError("process not found");
    return it->second;
}

std::vector<std::shared_ptr<Job>> JobRegistry::list() const
{
    std::shared_lock lg(mtx_);
    std::vector<std::shared_ptr<Job>> out;
    out.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) out.push_back(job);
    return out;
}

void JobRegistry::stop(const std::string& id)
{
    auto job = get(id);     // 锁外调用 Job::stop，避免两把锁嵌套
    job->stop();
    spdlog::info("JobRegistry: job {} stop requested", id);
}

void JobRegistry::remove(const std::string& id)
{
    std::unique_lock lg(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) throw NotFoundError("process not found");

    auto status = it->second->status();
    if (!is_terminal(status)) {
        spdlog::warn("JobRegistry: cannot remove active job {} ({})", id, to_string(status));
        throw ConflictError("cannot remove active process");
    }
    jobs_.erase(it);
    spdlog::info("JobRegistry: job {} removed", id);
}

std::size_t JobRegistry::count() const
{
    std::shared_lock lg(mtx_);
    std::size_t active = 0;
    for (const auto& [id, job] : jobs_) {
        if (!job->isTerminal()) ++active;
    }
    return active;
}

std::size_t JobRegistry::size() const
{
    std::shared_lock lg(mtx_);
    return jobs_.size();
}

std::optional<std::string> JobRegistry::cachedResult(const std::string& id, SysTime now) const
{
    std::shared_lock lg(mtx_);
    if (auto it = jobs_.find(id); it != jobs_.end()) {
        return it->second->cachedResultPayload(now);
    }
    auto it = retained_.find(id);
    if (it == retained_.end() || now >= it->second.expiresAt) return std::nullopt;
    return it->second.payload;
}

std::size_t JobRegistry::sweep(SysTime now)
{
    std::size_t removed = 0;
    std::unique_lock lg(mtx_);

    for (auto it = jobs_.begin(); it != jobs_.end();) {
        const auto& job = it->second;
        // completedAt 在作业自己的锁内读取，只有终止状态才有值
        auto completedAt = job->completedAt();
        if (!completedAt || now - *completedAt < opt_.cleanupDelay) {
            ++it;
            continue;
        }

        if (auto cache = job->resultCacheEntry(); cache && now < cache->second) {
            retained_[it->first] = RetainedResult{cache->first, cache->second};
        }
        spdlog::debug("JobRegistry: job {} ({}) cleaned up", it->first, to_string(job->status()));
        it = jobs_.erase(it);
        ++removed;
    }

    for (auto it = retained_.begin(); it != retained_.end();) {
        if (now >= it->second.expiresAt) it = retained_.erase(it);
        else ++it;
    }

    if (removed > 0) {
        spdlog::info("JobRegistry: cleanup removed {} job(s), {} remaining", removed, jobs_.size());
    }
    return removed;
}

void JobRegistry::startCleanup(TimerScheduler& scheduler)
{
    stopCleanup();
    scheduler_    = &scheduler;
    cleanupTimer_ = scheduler.registerRepeatingTimer(
        "registry-cleanup",
        std::chrono::duration_cast<TimerScheduler::Duration>(opt_.cleanupDelay),
        [this]() { sweep(); });
    spdlog::info("JobRegistry: cleanup started, interval {}ms", opt_.cleanupDelay.count());
}

void JobRegistry::stopCleanup()
{
    if (scheduler_ == nullptr) return;
    scheduler_->cancelTimer(cleanupTimer_);
    scheduler_ = nullptr;
}
