#include "common/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace {

template <typename T>
T convert(const std::string& parentKey, const std::string& key, const std::string& raw)
{
    try {
        return YAML::Node(raw).as<T>();
    } catch (const YAML::Exception& e) {
        spdlog::error("Config: error decoding [{}][{}] = '{}': {}", parentKey, key, raw, e.what());
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "][" + key + "]");
    }
}

[[noreturn]] void missing(const std::string& parentKey, const std::string& key)
{
    spdlog::error("Config: missing key [{}][{}]", parentKey, key);
    throw std::runtime_error("Config: missing or bad type for [" +
                             parentKey + "][" + key + "]");
}

} // namespace

Config::Config(const std::string& filePath)
{
    try {
        root_ = YAML::LoadFile(filePath);
        spdlog::info("Config: loaded configuration from {}", filePath);
    } catch (const YAML::BadFile& e) {
        spdlog::error("Config: failed to load configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot open file: " + filePath);
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: failed to parse configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot parse file: " + filePath);
    }
}

Config Config::fromString(const std::string& yamlText)
{
    Config c;
    try {
        c.root_ = YAML::Load(yamlText);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error(std::string("Config: cannot parse yaml: ") + e.what());
    }
    return c;
}

Config Config::empty()
{
    return Config();
}

std::string Config::envName(const std::string& parentKey, const std::string& key)
{
    std::string name = "CLI_RUNNER_" + parentKey + "_" + key;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
        return std::isalnum(ch) ? static_cast<char>(std::toupper(ch)) : '_';
    });
    return name;
}

bool Config::has(const std::string& parentKey) const
{
    if (!root_.IsMap()) return false;
    const auto section = root_[parentKey];
    return section.IsDefined() && !section.IsNull();
}

bool Config::has(const std::string& parentKey, const std::string& key) const
{
    if (!has(parentKey)) return false;
    const auto section = root_[parentKey];
    if (!section.IsMap()) return false;
    const auto value = section[key];
    return value.IsDefined() && !value.IsNull();
}

std::optional<std::string> Config::lookup(const std::string& parentKey,
                                          const std::string& key) const
{
    if (const char* env = std::getenv(envName(parentKey, key).c_str()); env != nullptr) {
        return std::string(env);
    }
    if (!has(parentKey, key)) return std::nullopt;

    const auto value = root_[parentKey][key];
    if (!value.IsScalar()) {
        spdlog::error("Config: [{}][{}] is not a scalar", parentKey, key);
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "][" + key + "]");
    }
    return value.Scalar();
}

int Config::getInt(const std::string& parentKey,
                   const std::string& key) const
{
    auto raw = lookup(parentKey, key);
    if (!raw) missing(parentKey, key);
    return convert<int>(parentKey, key, *raw);
}

double Config::getDouble(const std::string& parentKey,
                         const std::string& key) const
{
    auto raw = lookup(parentKey, key);
    if (!raw) missing(parentKey, key);
    return convert<double>(parentKey, key, *raw);
}

bool Config::getBool(const std::string& parentKey,
                     const std::string& key) const
{
    auto raw = lookup(parentKey, key);
    if (!raw) missing(parentKey, key);
    return convert<bool>(parentKey, key, *raw);
}

std::string Config::getString(const std::string& parentKey,
                              const std::string& key) const
{
    auto raw = lookup(parentKey, key);
    if (!raw) missing(parentKey, key);
    return *raw;
}

std::chrono::milliseconds Config::getDuration(const std::string& parentKey,
                                              const std::string& key) const
{
    auto raw = lookup(parentKey, key);
    if (!raw) missing(parentKey, key);
    try {
        return parseDuration(*raw);
    } catch (const std::logic_error& e) {
        spdlog::error("Config: error decoding duration [{}][{}]: {}", parentKey, key, e.what());
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "][" + key + "]");
    }
}

int Config::getInt(const std::string& parentKey,
                   const std::string& key, int def) const
{
    auto raw = lookup(parentKey, key);
    return raw ? convert<int>(parentKey, key, *raw) : def;
}

bool Config::getBool(const std::string& parentKey,
                     const std::string& key, bool def) const
{
    auto raw = lookup(parentKey, key);
    return raw ? convert<bool>(parentKey, key, *raw) : def;
}

std::string Config::getString(const std::string& parentKey,
                              const std::string& key, const std::string& def) const
{
    auto raw = lookup(parentKey, key);
    return raw ? *raw : def;
}

std::chrono::milliseconds Config::getDuration(const std::string& parentKey,
                                              const std::string& key,
                                              std::chrono::milliseconds def) const
{
    if (!lookup(parentKey, key)) return def;
    return getDuration(parentKey, key);
}

std::chrono::milliseconds Config::parseDuration(const std::string& text)
{
    using namespace std::chrono;

    if (text.empty()) throw std::invalid_argument("empty duration");

    // 纯数字按毫秒处理
    if (std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
        return milliseconds(std::stoll(text));
    }

    milliseconds total{0};
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t start = pos;
        while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.'))
            ++pos;
        if (start == pos) throw std::invalid_argument("bad duration: " + text);
        double value = std::stod(text.substr(start, pos - start));

        std::size_t unitStart = pos;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos])))
            ++pos;
        std::string unit = text.substr(unitStart, pos - unitStart);

        double factor = 0;
        if (unit == "ms")      factor = 1;
        else if (unit == "s")  factor = 1000;
        else if (unit == "m")  factor = 60 * 1000;
        else if (unit == "h")  factor = 60 * 60 * 1000;
        else throw std::invalid_argument("bad duration unit in: " + text);

        total += milliseconds(static_cast<long long>(value * factor));
    }
    return total;
}

// 常见模板实例化
template std::vector<int>    Config::getArray<int>    (const std::string&, const std::string&) const;
template std::vector<double> Config::getArray<double> (const std::string&, const std::string&) const;
template std::vector<std::string> Config::getArray<std::string>(const std::string&, const std::string&) const;
