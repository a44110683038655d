#include "api/sse.hpp"

#include <fmt/core.h>

namespace sse {

std::string format_event(const Event& event)
{
    auto data = to_json(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return fmt::format("event: {}\ndata: {}\n\n", to_string(event.kind), data);
}

std::string format_comment(const std::string& text)
{
    // 注释里不能出现换行，否则后半段会被当成字段
    std::string line = text;
    for (auto& c : line) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return fmt::format(": {}\n\n", line);
}

} // namespace sse
