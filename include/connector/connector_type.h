#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#define CONNECTOR_TYPE_CLAUDE  "ClaudeConnector"
#define CONNECTOR_TYPE_COMMAND "CommandConnector"

// 一次调用外部工具的完整命令行；工作目录由 Spawner 在子进程里设置
struct Command {
    std::string              exe;
    std::vector<std::string> args;
};

// 每个连接器在配置文件里的独立配置段
struct ConnectorConfig {
    std::string              command;
    std::vector<std::string> args;
    bool                     available = true;
};

// 未知或不可用的连接器，HTTP 层翻译为 400
class ConnectorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
