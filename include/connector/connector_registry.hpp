// connector_registry.hpp
#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/config.hpp"
#include "common/options.hpp"
#include "connector/iconnector.h"

class ConnectorRegistry {
public:
    // 内置类型 ClaudeConnector / CommandConnector 在构造时登记
    ConnectorRegistry();

    ConnectorRegistry(const ConnectorRegistry&)            = delete;
    ConnectorRegistry& operator=(const ConnectorRegistry&) = delete;

    // 注册模板：把任意类型 T 登记到 type 名下
    template <typename T>
    void registerConnector(std::string type)
    {
        std::unique_lock lg(mtx_);
        factories_[std::move(type)] = []() -> std::unique_ptr<IConnector> {
            return std::make_unique<T>();
        };
    }

    // 按 connectors_config.connectors 逐个实例化；配置段缺失时使用默认值
    void setupFromConfig(const Config& config, const std::vector<ConnectorEntry>& entries);

    // 根据类型名 + 配置生成一个已初始化的连接器；失败返回 nullptr
    std::unique_ptr<IConnector> create(const std::string& type,
                                       const std::string& name,
                                       const ConnectorConfig& config) const;

    // 以 name() 为键加入，重名时覆盖
    void add(std::shared_ptr<IConnector> connector);

    // 未知或不可用时抛 ConnectorError
    std::shared_ptr<IConnector> get(const std::string& name) const;

    std::vector<std::string> available() const;
    std::vector<std::string> list() const;
    std::vector<std::string> types() const;

private:
    using Factory = std::function<std::unique_ptr<IConnector>()>;

    mutable std::shared_mutex                          mtx_;
    std::unordered_map<std::string, Factory>           factories_;    // key = type
    std::map<std::string, std::shared_ptr<IConnector>> connectors_;   // key = name
};
