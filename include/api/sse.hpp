#pragma once
#include <string>
#include "runner/runner_type.h"

namespace sse {

// event: <kind>\ndata: {"type":kind,"data":payload,"timestamp":ts}\n\n
std::string format_event(const Event& event);

// 注释行，客户端忽略，用来保活
std::string format_comment(const std::string& text);

} // namespace sse
