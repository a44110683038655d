#pragma once
#include <stdexcept>
#include <string>

// 请求期错误：由 HTTP 层翻译为状态码
class AdmissionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConflictError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// 作业内部错误：只在 Spawner 内部抛出，最终写进 Job 的 Result
class LaunchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// 连接器解析单行失败，跳过该行
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
