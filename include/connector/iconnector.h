// iconnector.h
#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "connector/connector_type.h"
#include "runner/runner_type.h"

class IConnector {
public:
    virtual ~IConnector() = default;

    // 生命周期：返回 false 表示配置不可用
    virtual bool init(const std::string& name, const ConnectorConfig& config) = 0;

    virtual std::string name() const        = 0;
    virtual bool        isAvailable() const = 0;

    virtual Command buildCommand(const std::string& prompt) const = 0;

    // 需要丢弃的行（空行、无法识别的格式）返回 nullopt；不对畸形输入抛异常
    virtual std::optional<Event> parseLine(std::string_view line) const = 0;
};
