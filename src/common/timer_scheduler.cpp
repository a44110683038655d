#include "common/timer_scheduler.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

TimerScheduler::TimerScheduler(std::size_t numWorkers)
{
    if (numWorkers == 0) numWorkers = 1;
    for (std::size_t i = 0; i < numWorkers; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }
    scheduler_ = std::thread([this] { schedulerLoop(); });
}

TimerScheduler::~TimerScheduler()
{
    shutdown();
}

void TimerScheduler::shutdown()
{
    {
        std::lock_guard lg(mtx_);
        if (stopped_ && !scheduler_.joinable()) return;
        stopped_ = true;
        if (!ready_.empty()) {
            spdlog::debug("TimerScheduler: dropping {} queued task(s) on shutdown", ready_.size());
        }
        ready_.clear();
    }
    dueCv_.notify_all();
    readyCv_.notify_all();
    idleCv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    if (scheduler_.joinable()) scheduler_.join();
}

std::size_t TimerScheduler::registerTimer(std::string name, Duration delay, Task task)
{
    return addTimer(std::move(name), delay, std::move(task), false);
}

std::size_t TimerScheduler::registerRepeatingTimer(std::string name, Duration interval, Task task)
{
    if (interval.count() <= 0) {
        throw std::invalid_argument("TimerScheduler: repeating interval must be positive");
    }
    return addTimer(std::move(name), interval, std::move(task), true);
}

std::size_t TimerScheduler::addTimer(std::string name, Duration interval, Task task, bool repeat)
{
    std::size_t id;
    {
        std::lock_guard lg(mtx_);
        if (stopped_) throw std::runtime_error("TimerScheduler: already shut down");
        id = nextId_++;
        timers_.emplace(id, Timer{std::move(name), interval, std::move(task), repeat});
        due_.push(Due{Clock::now() + interval, id});
    }
    dueCv_.notify_one();
    return id;
}

bool TimerScheduler::cancelTimer(std::size_t id)
{
    std::unique_lock lk(mtx_);
    auto it = timers_.find(id);
    if (it == timers_.end()) return false;

    // 在任务自身里取消时不能等自己
    const auto self = std::this_thread::get_id();
    idleCv_.wait(lk, [&] {
        auto cur = timers_.find(id);
        return stopped_ || cur == timers_.end() ||
               cur->second.runner == std::thread::id() || cur->second.runner == self;
    });

    auto cur = timers_.find(id);
    if (cur == timers_.end()) return false;
    spdlog::debug("TimerScheduler: timer '{}' cancelled", cur->second.name);
    timers_.erase(cur);
    return true;
}

std::size_t TimerScheduler::pending() const
{
    std::lock_guard lg(mtx_);
    return timers_.size();
}

void TimerScheduler::schedulerLoop()
{
    std::unique_lock lk(mtx_);
    while (!stopped_) {
        if (due_.empty()) {
            dueCv_.wait(lk, [this] { return stopped_ || !due_.empty(); });
            continue;
        }

        auto next = due_.top();
        if (next.at > Clock::now()) {
            dueCv_.wait_until(lk, next.at);
            continue;
        }
        due_.pop();

        auto it = timers_.find(next.id);
        if (it == timers_.end()) continue;      // 已取消

        auto& timer = it->second;
        if (timer.repeat) {
            due_.push(Due{Clock::now() + timer.interval, next.id});
        }
        if (timer.queued) {
            spdlog::debug("TimerScheduler: '{}' still running, tick skipped", timer.name);
            continue;
        }
        timer.queued = true;
        ready_.push_back(next.id);
        readyCv_.notify_one();
    }
}

void TimerScheduler::workerLoop()
{
    std::unique_lock lk(mtx_);
    while (true) {
        readyCv_.wait(lk, [this] { return stopped_ || !ready_.empty(); });
        if (stopped_) break;

        auto id = ready_.front();
        ready_.pop_front();

        auto it = timers_.find(id);
        if (it == timers_.end()) continue;
        it->second.runner = std::this_thread::get_id();
        Task        task  = it->second.task;
        std::string name  = it->second.name;

        lk.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("TimerScheduler: task '{}' failed: {}", name, e.what());
        }
        lk.lock();

        auto cur = timers_.find(id);
        if (cur != timers_.end()) {
            cur->second.runner = std::thread::id();
            cur->second.queued = false;
            if (!cur->second.repeat) timers_.erase(cur);
        }
        idleCv_.notify_all();
    }
}
