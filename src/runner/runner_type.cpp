#include "runner/runner_type.h"
#include <date/date.h>

const char* to_string(EventKind kind)
{
    switch (kind) {
        case EventKind::Output: return "output";
        case EventKind::Result: return "result";
        case EventKind::Error:  return "error";
        case EventKind::Done:   return "done";
    }
    return "unknown";
}

const char* to_string(JobStatus status)
{
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Stopped:   return "stopped";
    }
    return "unknown";
}

std::string format_time(SysTime tp)
{
    return date::format("%FT%TZ", date::floor<std::chrono::milliseconds>(tp));
}

nlohmann::json payload_to_json(std::string_view payload)
{
    auto parsed = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return std::string(payload);
    }
    return parsed;
}

nlohmann::json to_json(const Result& result)
{
    nlohmann::json j;
    j["exitCode"] = result.exitCode;
    if (result.output) {
        j["output"] = payload_to_json(*result.output);
    }
    if (result.errorMessage) {
        j["error"] = *result.errorMessage;
    }
    return j;
}

nlohmann::json to_json(const Event& event)
{
    nlohmann::json j;
    j["type"]      = to_string(event.kind);
    j["data"]      = payload_to_json(event.payload);
    j["timestamp"] = format_time(event.timestamp);
    return j;
}
