#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

struct HttpRequest {
    std::string method;
    std::string path;                                        // 已做百分号解码，不含查询串
    std::string version;
    std::unordered_map<std::string, std::string> query;
    std::unordered_map<std::string, std::string> headers;   // 键统一小写
    std::unordered_map<std::string, std::string> params;    // 路由里 :name 段的取值
    std::string body;
    std::string remoteAddr;

    std::string header(const std::string& name) const;
    std::string param(const std::string& name) const;
};

// 绑定到单个连接的应答接口；普通应答只能发送一次，事件流可以反复 write
class HttpResponder {
public:
    virtual ~HttpResponder() = default;

    virtual void send(int status, const std::string& contentType, const std::string& body) = 0;

    void json(int status, const nlohmann::json& body)
    {
        send(status, "application/json; charset=utf-8",
             body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    // 发送 text/event-stream 响应头；失败（对端已断开）返回 false
    virtual bool beginEventStream() = 0;
    // 返回 false 表示对端已断开或发送超时
    virtual bool write(const std::string& chunk) = 0;

    virtual bool peerClosed()           = 0;
    virtual bool serverStopping() const = 0;

    // 已发送的状态码，尚未发送时为 0
    virtual int status() const = 0;
};

using HttpHandler = std::function<void(const HttpRequest&, HttpResponder&)>;

const char* status_text(int status);
