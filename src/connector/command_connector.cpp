#include "connector/command_connector.hpp"
#include "connector/connector_utils.hpp"
#include "runner/runner_error.h"

#include <spdlog/spdlog.h>

bool CommandConnector::init(const std::string& name, const ConnectorConfig& config)
{
    if (name.empty() || config.command.empty()) {
        spdlog::warn("CommandConnector: '{}' has no command configured", name);
        return false;
    }
    name_   = name;
    config_ = config;
    return true;
}

bool CommandConnector::isAvailable() const
{
    return config_.available &&
           connector_utils::resolve_executable(config_.command).has_value();
}

Command CommandConnector::buildCommand(const std::string& prompt) const
{
    static const std::string placeholder = COMMAND_PROMPT_PLACEHOLDER;

    Command cmd{config_.command, {}};
    bool substituted = false;
    for (auto arg : config_.args) {
        std::size_t pos = 0;
        while ((pos = arg.find(placeholder, pos)) != std::string::npos) {
            arg.replace(pos, placeholder.size(), prompt);
            pos += prompt.size();
            substituted = true;
        }
        cmd.args.push_back(std::move(arg));
    }
    if (!substituted) cmd.args.push_back(prompt);
    return cmd;
}

std::optional<Event> CommandConnector::parseLine(std::string_view line) const
{
    auto text = connector_utils::trim(line);
    if (text.empty()) return std::nullopt;

    try {
        if (auto obj = connector_utils::parse_json_object(text)) {
            return Event{connector_utils::classify(*obj), std::string(text), SysClock::now()};
        }
    } catch (const ParseError&) {
        // 看起来像 JSON 但解析失败，按普通文本处理
    }

    nlohmann::json payload;
    payload["text"] = std::string(text);
    // 非 UTF-8 输出（Latin-1、被截断的多字节字符）替换为 U+FFFD，不抛异常
    auto json = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return Event{EventKind::Output, std::move(json), SysClock::now()};
}
