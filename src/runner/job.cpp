#include "runner/job.hpp"

#include <signal.h>
#include <spdlog/spdlog.h>

Job::Job(std::string id, std::string connector, std::string prompt,
         std::string workDir, Options opt)
    : id_(std::move(id)),
      connector_(std::move(connector)),
      prompt_(std::move(prompt)),
      workDir_(std::move(workDir)),
      startedAt_(SysClock::now()),
      opt_(opt),
      events_(opt.bufferSize)
{
}

Job::~Job()
{
    // 正常路径下 close() 已经清空；这里兜底唤醒仍在等待的读者
    for (auto& [sid, ch] : subscribers_) ch->close();
}

JobStatus Job::status() const
{
    std::lock_guard lg(mtx_);
    return status_;
}

std::optional<SysTime> Job::completedAt() const
{
    std::lock_guard lg(mtx_);
    return completedAt_;
}

bool Job::isTerminal() const
{
    std::lock_guard lg(mtx_);
    return is_terminal(status_);
}

Job::Snapshot Job::snapshot() const
{
    std::lock_guard lg(mtx_);
    return Snapshot{id_, connector_, prompt_, workDir_, status_,
                    startedAt_, completedAt_, result_};
}

void Job::appendEvent(Event event)
{
    std::lock_guard lg(mtx_);
    if (closed_) {
        spdlog::debug("Job: {} already closed, {} event ignored", id_, to_string(event.kind));
        return;
    }

    if (event.kind == EventKind::Result) {
        // 同一作业里多次 result 以最后一次为准
        resultCache_       = ResultCache{event.payload, event.timestamp + opt_.resultCacheTtl};
        lastResultPayload_ = event.payload;
    }

    events_.push(event);

    for (auto& [sid, ch] : subscribers_) {
        if (!ch->tryPush(event)) {
            spdlog::debug("Job: {} subscriber {} is full, {} event dropped",
                          id_, sid, to_string(event.kind));
        }
    }
}

Job::Subscription Job::subscribe(const std::string& subscriberId)
{
    auto ch = std::make_shared<EventChannel>(opt_.subscriberBuffer);
    {
        std::lock_guard lg(mtx_);
        if (closed_) {
            // 作业已结束，读者直接看到流结束
            ch->close();
        } else {
            auto it = subscribers_.find(subscriberId);
            if (it != subscribers_.end()) it->second->close();
            subscribers_[subscriberId] = ch;
        }
    }

    std::weak_ptr<Job> weak = weak_from_this();
    return Subscription{
        ch,
        [weak, subscriberId]() {
            if (auto job = weak.lock()) job->unsubscribe(subscriberId);
        }
    };
}

void Job::unsubscribe(const std::string& subscriberId)
{
    std::lock_guard lg(mtx_);
    auto it = subscribers_.find(subscriberId);
    if (it == subscribers_.end()) return;
    it->second->close();
    subscribers_.erase(it);
}

std::size_t Job::subscriberCount() const
{
    std::lock_guard lg(mtx_);
    return subscribers_.size();
}

std::vector<Event> Job::history() const
{
    return events_.snapshot();
}

std::optional<Result> Job::result() const
{
    std::lock_guard lg(mtx_);
    return result_;
}

std::optional<std::string> Job::cachedResultPayload(SysTime now) const
{
    std::lock_guard lg(mtx_);
    if (!resultCache_ || now >= resultCache_->expiresAt) return std::nullopt;
    return resultCache_->payload;
}

std::optional<std::pair<std::string, SysTime>> Job::resultCacheEntry() const
{
    std::lock_guard lg(mtx_);
    if (!resultCache_) return std::nullopt;
    return std::make_pair(resultCache_->payload, resultCache_->expiresAt);
}

void Job::stop()
{
    cancel_.cancel();

    std::lock_guard lg(mtx_);
    if (pid_ > 0) {
        // 子进程自成进程组，连同孙进程一起杀掉
        ::kill(-pid_, SIGKILL);
    }
    if (!is_terminal(status_)) {
        status_      = JobStatus::Stopped;
        completedAt_ = SysClock::now();
        result_      = Result{-1, lastResultPayload_, std::string("process stopped")};
        spdlog::info("Job: {} stopped", id_);
    }
}

bool Job::markRunning()
{
    std::lock_guard lg(mtx_);
    if (status_ != JobStatus::Pending) return false;
    status_ = JobStatus::Running;
    return true;
}

bool Job::finish(JobStatus terminal, Result result, SysTime now)
{
    if (!is_terminal(terminal)) {
        throw std::invalid_argument("Job::finish requires a terminal status");
    }

    std::lock_guard lg(mtx_);
    if (is_terminal(status_)) return false;

    if (!result.output && lastResultPayload_) {
        result.output = lastResultPayload_;
    }
    status_      = terminal;
    completedAt_ = now;
    result_      = std::move(result);
    return true;
}

void Job::close()
{
    std::lock_guard lg(mtx_);
    if (closed_) return;
    closed_ = true;

    if (!is_terminal(status_)) {
        spdlog::warn("Job: {} closed while {}, marking failed", id_, to_string(status_));
        status_      = JobStatus::Failed;
        completedAt_ = SysClock::now();
        result_      = Result{1, std::nullopt, std::string("job closed before completion")};
    }

    nlohmann::json done;
    done["processId"] = id_;
    done["status"]    = to_string(status_);
    done["result"]    = result_ ? to_json(*result_) : nlohmann::json(nullptr);

    auto text = done.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    Event ev{EventKind::Done, std::move(text), SysClock::now()};
    events_.push(ev);

    // done 事件无视容量限制，保证持续读取的订阅者一定能看到
    for (auto& [sid, ch] : subscribers_) {
        ch->forcePush(ev);
        ch->close();
    }
    subscribers_.clear();

    pid_ = -1;
}

bool Job::closed() const
{
    std::lock_guard lg(mtx_);
    return closed_;
}

void Job::attachProcess(pid_t pid)
{
    std::lock_guard lg(mtx_);
    pid_ = pid;
}

void Job::detachProcess()
{
    std::lock_guard lg(mtx_);
    pid_ = -1;
}

pid_t Job::pid() const
{
    std::lock_guard lg(mtx_);
    return pid_;
}
