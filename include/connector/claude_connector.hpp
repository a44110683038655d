#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include "connector/iconnector.h"

// claude CLI：<command> <args...> -p <prompt>，每行输出一个 JSON 对象
class ClaudeConnector : public IConnector {
public:
    bool init(const std::string& name, const ConnectorConfig& config) override;

    std::string name() const override { return name_; }
    bool        isAvailable() const override;

    Command buildCommand(const std::string& prompt) const override;
    std::optional<Event> parseLine(std::string_view line) const override;

private:
    std::string     name_ = "claude";
    ConnectorConfig config_;
};
