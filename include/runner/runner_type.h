#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

using SysClock  = std::chrono::system_clock;
using SysTime   = SysClock::time_point;

enum class EventKind {
    Output,     // 工具的普通输出
    Result,     // 工具给出的最终结果，额外写入结果缓存
    Error,
    Done        // 终止事件，之后订阅通道关闭
};

enum class JobStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Stopped
};

struct Event {
    EventKind   kind{EventKind::Output};
    std::string payload;            // 原样保存，通常是一行 JSON
    SysTime     timestamp{SysClock::now()};
};

struct Result {
    int                        exitCode{0};
    std::optional<std::string> output;
    std::optional<std::string> errorMessage;
};

const char* to_string(EventKind kind);
const char* to_string(JobStatus status);

inline bool is_terminal(JobStatus status)
{
    return status == JobStatus::Completed ||
           status == JobStatus::Failed    ||
           status == JobStatus::Stopped;
}

// RFC 3339，UTC，毫秒精度
std::string format_time(SysTime tp);

// payload 能解析为 JSON 就按 JSON 嵌入，否则按字符串嵌入
nlohmann::json payload_to_json(std::string_view payload);

nlohmann::json to_json(const Result& result);

// {"type": kind, "data": payload, "timestamp": ts}
nlohmann::json to_json(const Event& event);
