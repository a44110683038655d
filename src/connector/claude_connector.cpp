#include "connector/claude_connector.hpp"
#include "connector/connector_utils.hpp"
#include "common/logger.hpp"
#include "runner/runner_error.h"

#include <spdlog/spdlog.h>

bool ClaudeConnector::init(const std::string& name, const ConnectorConfig& config)
{
    if (name.empty()) return false;
    name_   = name;
    config_ = config;
    if (config_.command.empty()) config_.command = "claude";
    return true;
}

bool ClaudeConnector::isAvailable() const
{
    return config_.available &&
           connector_utils::resolve_executable(config_.command).has_value();
}

Command ClaudeConnector::buildCommand(const std::string& prompt) const
{
    Command cmd{config_.command, config_.args};
    cmd.args.push_back("-p");
    cmd.args.push_back(prompt);
    return cmd;
}

std::optional<Event> ClaudeConnector::parseLine(std::string_view line) const
{
    std::optional<nlohmann::json> obj;
    try {
        obj = connector_utils::parse_json_object(line);
    } catch (const ParseError& e) {
        spdlog::debug("ClaudeConnector: {} skipped: {}", e.what(), logger::truncate(std::string(line)));
        return std::nullopt;
    }
    if (!obj) return std::nullopt;

    return Event{connector_utils::classify(*obj),
                 std::string(connector_utils::trim(line)),
                 SysClock::now()};
}
