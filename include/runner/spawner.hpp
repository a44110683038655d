#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "connector/iconnector.h"
#include "runner/job.hpp"

// 每个作业一个监督线程：fork/exec 外部命令，逐行读取输出交给连接器解析，
// 等待退出 / 超时 / 取消，最终把作业推进到终止状态并 close()
class Spawner {
public:
    struct Options {
        std::chrono::milliseconds defaultTimeout = std::chrono::minutes(30);
    };

    explicit Spawner(Options opt);
    ~Spawner();

    Spawner(const Spawner&)            = delete;
    Spawner& operator=(const Spawner&) = delete;

    // 启动监督线程后立即返回；shutdown 之后或线程创建失败时抛 std::runtime_error
    void spawn(std::shared_ptr<Job> job,
               std::shared_ptr<IConnector> connector,
               std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // 停止所有运行中的作业并等待监督线程退出
    void shutdown();

    // 尚未结束的监督线程数
    std::size_t active() const;

private:
    struct Task {
        std::shared_ptr<Job>               job;
        std::shared_ptr<std::atomic<bool>> finished;
        std::thread                        thread;
    };

    void supervise(std::shared_ptr<Job> job,
                   std::shared_ptr<IConnector> connector,
                   std::chrono::milliseconds timeout);

    // 调用方持有 mtx_
    void reapFinished();

    const Options opt_;

    mutable std::mutex mtx_;
    std::vector<Task>  tasks_;
    bool               shutdown_ = false;
};
