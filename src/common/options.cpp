#include "common/options.hpp"
#include <stdexcept>

namespace {

std::size_t positive(const Config& config, const std::string& parent,
                     const std::string& key, std::size_t def)
{
    int v = config.getInt(parent, key, static_cast<int>(def));
    if (v <= 0) {
        throw std::runtime_error("Config: [" + parent + "][" + key + "] must be positive");
    }
    return static_cast<std::size_t>(v);
}

} // namespace

AppOptions AppOptions::load(const Config& config)
{
    AppOptions opt;

    opt.server.host         = config.getString("server", "host", opt.server.host);
    opt.server.port         = config.getInt("server", "port", opt.server.port);
    opt.server.readTimeout  = config.getDuration("server", "read_timeout", opt.server.readTimeout);
    opt.server.writeTimeout = config.getDuration("server", "write_timeout", opt.server.writeTimeout);
    opt.server.maxBodyBytes = positive(config, "server", "max_body_bytes", opt.server.maxBodyBytes);
    if (opt.server.port < 0 || opt.server.port > 65535) {
        throw std::runtime_error("Config: [server][port] out of range");
    }

    opt.process.defaultTimeout   = config.getDuration("process", "default_timeout", opt.process.defaultTimeout);
    opt.process.maxConcurrent    = positive(config, "process", "max_concurrent", opt.process.maxConcurrent);
    opt.process.cleanupDelay     = config.getDuration("process", "cleanup_delay", opt.process.cleanupDelay);
    opt.process.bufferSize       = positive(config, "process", "buffer_size", opt.process.bufferSize);
    opt.process.subscriberBuffer = positive(config, "process", "subscriber_buffer", opt.process.subscriberBuffer);
    opt.process.resultCacheTtl   = config.getDuration("process", "result_cache_ttl", opt.process.resultCacheTtl);
    if (opt.process.defaultTimeout.count() <= 0 || opt.process.cleanupDelay.count() <= 0) {
        throw std::runtime_error("Config: process timeouts must be positive");
    }

    opt.logging.level  = config.getString("logging", "level", opt.logging.level);
    opt.logging.format = config.getString("logging", "format", opt.logging.format);

    if (config.has("connectors_config", "connectors")) {
        opt.connectors = config.getArray<ConnectorEntry>("connectors_config", "connectors",
            [](const YAML::Node& node) {
                ConnectorEntry c;
                c.name   = node["name"].as<std::string>();
                c.type   = node["type"].as<std::string>();
                c.config = node["config"].as<std::string>();
                return c;
            });
    } else {
        opt.connectors.push_back({"claude", "ClaudeConnector", "claude_config"});
    }

    spdlog::debug("Config: server {}:{}, max_concurrent={}, buffer_size={}, {} connector(s)",
                  opt.server.host, opt.server.port, opt.process.maxConcurrent,
                  opt.process.bufferSize, opt.connectors.size());
    return opt;
}
