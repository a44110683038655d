#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>

namespace logger {

namespace {

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// %* : 消息体按 JSON 字符串输出（带引号、转义，非法 UTF-8 替换为 U+FFFD）
class json_message_flag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override
    {
        nlohmann::json text = std::string(msg.payload.data(), msg.payload.size());
        auto quoted = text.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        dest.append(quoted.data(), quoted.data() + quoted.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override
    {
        return std::make_unique<json_message_flag>();
    }
};

} // namespace

spdlog::level::level_enum parse_level(const std::string& level)
{
    const static auto log_level_map = std::map<std::string, spdlog::level::level_enum>{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };
    auto it = log_level_map.find(to_lower(level));
    if (it == log_level_map.end()) {
        return spdlog::level::info;     // 默认 info 级别
    }
    return it->second;
}

std::unique_ptr<spdlog::formatter> make_formatter(const std::string& format)
{
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    if (to_lower(format) == "json") {
        formatter->add_flag<json_message_flag>('*').set_pattern(
            R"({"time":"%Y-%m-%dT%H:%M:%S.%e%z","level":"%l","thread":%t,"msg":%*})");
    } else {
        formatter->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
    }
    return formatter;
}

void init(const std::string& level, const std::string& format)
{
    spdlog::set_level(parse_level(level));
    spdlog::set_formatter(make_formatter(format));
}

std::string truncate(const std::string& text, std::size_t limit)
{
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "... (truncated)";
}

} // namespace logger
