#include "connector/connector_utils.hpp"
#include "runner/runner_error.h"

#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace connector_utils
{
    static bool is_executable_file(const std::string& path)
    {
        struct stat st{};
        if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
        return ::access(path.c_str(), X_OK) == 0;
    }

    std::optional<std::string> resolve_executable(const std::string& command)
    {
        if (command.empty()) return std::nullopt;

        if (command.find('/') != std::string::npos) {
            if (is_executable_file(command)) return command;
            return std::nullopt;
        }

        const char* env = std::getenv("PATH");
        std::string path = env ? env : "/usr/local/bin:/usr/bin:/bin";
        std::size_t start = 0;
        while (start <= path.size()) {
            auto end = path.find(':', start);
            if (end == std::string::npos) end = path.size();
            std::string dir = path.substr(start, end - start);
            if (dir.empty()) dir = ".";
            std::string candidate = dir + "/" + command;
            if (is_executable_file(candidate)) return candidate;
            start = end + 1;
        }
        return std::nullopt;
    }

    std::string_view trim(std::string_view line)
    {
        const char* ws = " \t\r\n";
        auto first = line.find_first_not_of(ws);
        if (first == std::string_view::npos) return {};
        auto last = line.find_last_not_of(ws);
        return line.substr(first, last - first + 1);
    }

    std::optional<nlohmann::json> parse_json_object(std::string_view line)
    {
        auto text = trim(line);
        if (text.empty() || text.front() != '{') return std::nullopt;

        auto obj = nlohmann::json::parse(text, nullptr, false);
        if (obj.is_discarded() || !obj.is_object()) {
            throw ParseError("malformed JSON line");
        }
        return obj;
    }

    EventKind classify(const nlohmann::json& obj)
    {
        auto it = obj.find("type");
        if (it != obj.end() && it->is_string() && it->get<std::string>() == "result") {
            return EventKind::Result;
        }
        return EventKind::Output;
    }
} // namespace connector_utils
