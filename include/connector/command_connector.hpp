#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include "connector/iconnector.h"

#define COMMAND_PROMPT_PLACEHOLDER "{prompt}"

// 通用命令行工具：参数中的 {prompt} 被替换为 prompt；没有占位符时追加到最后
// JSON 行按 type 字段分类，纯文本行包装为 {"text": line}
class CommandConnector : public IConnector {
public:
    bool init(const std::string& name, const ConnectorConfig& config) override;

    std::string name() const override { return name_; }
    bool        isAvailable() const override;

    Command buildCommand(const std::string& prompt) const override;
    std::optional<Event> parseLine(std::string_view line) const override;

private:
    std::string     name_;
    ConnectorConfig config_;
};
