#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// 一个调度线程按到期时间出队，若干工作线程执行任务
// 重复任务上一次还没执行完时跳过本轮，同一个任务不会并发执行
class TimerScheduler {
public:
    using Task      = std::function<void()>;
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::milliseconds;

    explicit TimerScheduler(std::size_t numWorkers = 1);
    ~TimerScheduler();

    TimerScheduler(const TimerScheduler&)            = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    // 丢弃未执行的任务并等待所有线程退出；可重复调用
    void shutdown();

    std::size_t registerTimer(std::string name, Duration delay, Task task);
    std::size_t registerRepeatingTimer(std::string name, Duration interval, Task task);

    // 取消后不会再执行；若该任务正在其他线程上执行，等它结束再返回
    bool cancelTimer(std::size_t id);

    // 尚未取消的定时器数量
    std::size_t pending() const;

private:
    struct Timer {
        std::string name;
        Duration    interval;
        Task        task;
        bool        repeat  = false;
        bool        queued  = false;      // 已进入执行队列或正在执行
        std::thread::id runner;           // 正在执行它的工作线程
    };

    struct Due {
        TimePoint   at;
        std::size_t id;

        bool operator<(const Due& other) const { return at > other.at; }
    };

    std::size_t addTimer(std::string name, Duration interval, Task task, bool repeat);

    void schedulerLoop();
    void workerLoop();

    mutable std::mutex      mtx_;
    std::condition_variable dueCv_;        // 调度线程：新任务或关闭
    std::condition_variable readyCv_;      // 工作线程：执行队列非空或关闭
    std::condition_variable idleCv_;       // cancelTimer：等待正在执行的任务结束

    std::unordered_map<std::size_t, Timer> timers_;
    std::priority_queue<Due>               due_;
    std::deque<std::size_t>                ready_;
    std::size_t                            nextId_  = 1;
    bool                                   stopped_ = false;

    std::vector<std::thread> workers_;
    std::thread              scheduler_;
};
