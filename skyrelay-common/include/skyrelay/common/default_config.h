#pragma once

#if __has_include(<jsoncpp/json/json.h>)
#include <jsoncpp/json/json.h>  // Ubuntu
#else
#include <json/json.h>  // CentOS
#endif
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "skyrelay/common/types.h"

namespace skyrelay {

/**
 * @brief Flat view over a planner or cost config file. Nested maps become
 * dotted keys ("planner.n_instances", "egress.aws.internet"). Sequences are
 * not supported and fail the load.
 *
 * The typed getters never fail: a missing key, or a value that does not
 * convert, leaves default_value in *val (the latter with a warning).
 */
class DefaultConfig {
   public:
    enum class Format {
        UNKNOWN,
        YAML,
        JSON,
    };

    /**
     * @brief Parses the file set by SetPath, replacing any previous content.
     * The format follows the extension: .yaml/.yml or .json.
     * @return CONFIG_LOAD_FAIL if the path is unset, the extension is not
     * recognised, or the file cannot be parsed
     */
    tl::expected<void, ErrorCode> Load();

    void GetInt32(const std::string& key, int32_t* val,
                  int32_t default_value = 0) const;
    void GetUInt32(const std::string& key, uint32_t* val,
                   uint32_t default_value = 0) const;
    void GetInt64(const std::string& key, int64_t* val,
                  int64_t default_value = 0) const;
    void GetUInt64(const std::string& key, uint64_t* val,
                   uint64_t default_value = 0) const;
    void GetDouble(const std::string& key, double* val,
                   double default_value = 0.0) const;
    void GetFloat(const std::string& key, float* val,
                  float default_value = 0.0f) const;
    void GetBool(const std::string& key, bool* val,
                 bool default_value = false) const;
    void GetString(const std::string& key, std::string* val,
                   const std::string& default_value = "") const;

    // Sorted keys under "prefix.", with that head stripped.
    std::vector<std::string> ListKeys(const std::string& prefix) const;

    bool Contains(const std::string& key) const {
        return entries_.count(key) > 0;
    }

    void SetPath(const std::string& path) { path_ = path; }

    Format format() const { return format_; }

   private:
    // Exactly one side is set, matching format_.
    struct Entry {
        YAML::Node yaml;
        Json::Value json;
    };

    void flatten(const YAML::Node& node, const std::string& key);
    void flatten(const Json::Value& node, const std::string& key);
    void parseYaml();
    void parseJson();

    template <typename T, typename YamlFn, typename JsonFn>
    void lookup(const std::string& key, T* val, const T& default_value,
                YamlFn from_yaml, JsonFn from_json) const;

    std::string path_;
    Format format_ = Format::UNKNOWN;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace skyrelay
