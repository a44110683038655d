#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

#include "runner/runner_type.h"

namespace connector_utils
{
    // 绝对/相对路径直接检查 X_OK，否则沿 PATH 查找
    std::optional<std::string> resolve_executable(const std::string& command);

    // 去掉首尾空白（含 \r）
    std::string_view trim(std::string_view line);

    // 非 JSON 行返回 nullopt；以 '{' 开头但解析失败时抛 ParseError
    std::optional<nlohmann::json> parse_json_object(std::string_view line);

    // 按 JSON 行的 type 字段区分 result / output
    EventKind classify(const nlohmann::json& obj);
} // namespace connector_utils
