#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class Config {
public:
    // 从文件加载
    explicit Config(const std::string& filePath);

    // 从 YAML 文本加载（测试 / 内嵌默认配置）
    static Config fromString(const std::string& yamlText);

    // 空配置，全部使用默认值
    static Config empty();

    // 基本类型读取，缺失或类型错误时抛出 std::runtime_error
    int         getInt   (const std::string& parentKey,
                          const std::string& key) const;
    double      getDouble(const std::string& parentKey,
                          const std::string& key) const;
    bool        getBool  (const std::string& parentKey,
                          const std::string& key) const;
    std::string getString(const std::string& parentKey,
                          const std::string& key) const;
    std::chrono::milliseconds getDuration(const std::string& parentKey,
                                          const std::string& key) const;

    // 带默认值的读取：键不存在时返回 def，存在但类型错误仍然抛异常
    int         getInt   (const std::string& parentKey,
                          const std::string& key, int def) const;
    bool        getBool  (const std::string& parentKey,
                          const std::string& key, bool def) const;
    std::string getString(const std::string& parentKey,
                          const std::string& key, const std::string& def) const;
    std::chrono::milliseconds getDuration(const std::string& parentKey,
                                          const std::string& key,
                                          std::chrono::milliseconds def) const;

    bool has(const std::string& parentKey, const std::string& key) const;
    bool has(const std::string& parentKey) const;

    // 数组读取
    template<typename T>
    std::vector<T> getArray(const std::string& parentKey,
                            const std::string& key) const
    {
        try {
            return root_[parentKey][key].as<std::vector<T>>();
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Config: missing or bad type for [" +
                                    parentKey + "][" + key + "]");
        }
    }

    template <typename T>
    std::vector<T> getArray(const std::string& parentKey,
                            const std::string& key,
                            std::function<T(const YAML::Node&)> decoder) const
    {
        try {
            std::vector<T> out;
            const auto& list = root_[parentKey][key];
            if (!list.IsSequence())
                throw YAML::Exception(YAML::Mark::null_mark(),
                                    "not a sequence");

            out.reserve(list.size());
            for (const auto& node : list)
                out.push_back(decoder(node));
            return out;
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Config: missing or bad array [" +
                                    parentKey + "][" + key + "]");
        }
    }

    // "500ms" / "30s" / "5m" / "1h30m" / 纯数字（毫秒）
    static std::chrono::milliseconds parseDuration(const std::string& text);

    // CLI_RUNNER_<SECTION>_<KEY>
    static std::string envName(const std::string& parentKey, const std::string& key);

private:
    Config() = default;

    // 环境变量优先，其次 YAML 标量
    std::optional<std::string> lookup(const std::string& parentKey,
                                      const std::string& key) const;

    YAML::Node root_;
};
