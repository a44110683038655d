// connector_registry.cpp
#include "connector/connector_registry.hpp"
#include "connector/claude_connector.hpp"
#include "connector/command_connector.hpp"

#include <algorithm>
#include <mutex>
#include <spdlog/spdlog.h>

ConnectorRegistry::ConnectorRegistry()
{
    registerConnector<ClaudeConnector>(CONNECTOR_TYPE_CLAUDE);
    registerConnector<CommandConnector>(CONNECTOR_TYPE_COMMAND);
}

void ConnectorRegistry::setupFromConfig(const Config& config,
                                        const std::vector<ConnectorEntry>& entries)
{
    for (const auto& entry : entries) {
        ConnectorConfig cc;
        cc.command   = config.getString(entry.config, "command",
                                        entry.type == CONNECTOR_TYPE_CLAUDE ? "claude" : "");
        cc.available = config.getBool(entry.config, "available", true);
        if (config.has(entry.config, "args")) {
            cc.args = config.getArray<std::string>(entry.config, "args");
        }

        auto connector = create(entry.type, entry.name, cc);
        if (!connector) continue;

        spdlog::info("ConnectorRegistry: {} ({}) registered, command={}, available={}",
                     entry.name, entry.type, cc.command, connector->isAvailable());
        add(std::move(connector));
    }
}

std::unique_ptr<IConnector> ConnectorRegistry::create(const std::string& type,
                                                      const std::string& name,
                                                      const ConnectorConfig& config) const
{
    Factory factory;
    {
        std::shared_lock lg(mtx_);
        auto it = factories_.find(type);
        if (it == factories_.end()) {
            spdlog::warn("ConnectorRegistry: unknown connector type '{}' for {}", type, name);
            return nullptr;
        }
        factory = it->second;
    }

    auto impl = factory();
    if (!impl->init(name, config)) {
        spdlog::warn("ConnectorRegistry: failed to init connector {} ({})", name, type);
        return nullptr;
    }
    return impl;
}

void ConnectorRegistry::add(std::shared_ptr<IConnector> connector)
{
    if (!connector) return;
    auto name = connector->name();
    std::unique_lock lg(mtx_);
    connectors_[name] = std::move(connector);
}

std::shared_ptr<IConnector> ConnectorRegistry::get(const std::string& name) const
{
    std::shared_ptr<IConnector> connector;
    {
        std::shared_lock lg(mtx_);
        auto it = connectors_.find(name);
        if (it == connectors_.end()) {
            throw ConnectorError("unknown connector: " + name);
        }
        connector = it->second;
    }
    if (!connector->isAvailable()) {
        throw ConnectorError("connector not available: " + name);
    }
    return connector;
}

std::vector<std::string> ConnectorRegistry::available() const
{
    std::shared_lock lg(mtx_);
    std::vector<std::string> out;
    for (const auto& [name, connector] : connectors_) {
        if (connector->isAvailable()) out.push_back(name);
    }
    return out;
}

std::vector<std::string> ConnectorRegistry::list() const
{
    std::shared_lock lg(mtx_);
    std::vector<std::string> out;
    for (const auto& [name, _] : connectors_) out.push_back(name);
    return out;
}

std::vector<std::string> ConnectorRegistry::types() const
{
    std::shared_lock lg(mtx_);
    std::vector<std::string> out;
    for (const auto& [type, _] : factories_) out.push_back(type);
    std::sort(out.begin(), out.end());
    return out;
}
