#include "skyrelay/common/default_config.h"

#if __has_include(<jsoncpp/json/reader.h>)
#include <jsoncpp/json/reader.h>
#include <jsoncpp/json/value.h>  // Ubuntu
#else
#include <json/reader.h>
#include <json/value.h>  // CentOS
#endif

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace skyrelay {

namespace {

bool HasSuffix(const std::string& path, const std::string& ext) {
    return path.size() >= ext.size() &&
           path.compare(path.size() - ext.size(), ext.size(), ext) == 0;
}

std::string JoinKey(const std::string& head, const std::string& name) {
    return head.empty() ? name : head + "." + name;
}

}  // namespace

tl::expected<void, ErrorCode> DefaultConfig::Load() {
    if (path_.empty()) {
        LOG(ERROR) << "DefaultConfig::Load: error=path_not_set";
        return tl::make_unexpected(ErrorCode::CONFIG_LOAD_FAIL);
    }
    entries_.clear();
    format_ = Format::UNKNOWN;
    try {
        if (HasSuffix(path_, ".yaml") || HasSuffix(path_, ".yml")) {
            format_ = Format::YAML;
            parseYaml();
        } else if (HasSuffix(path_, ".json")) {
            format_ = Format::JSON;
            parseJson();
        } else {
            LOG(ERROR) << "DefaultConfig::Load: path=" << path_
                       << ", error=unsupported_config_file_format";
            return tl::make_unexpected(ErrorCode::CONFIG_LOAD_FAIL);
        }
    } catch (const std::exception& e) {
        entries_.clear();
        format_ = Format::UNKNOWN;
        LOG(ERROR) << "DefaultConfig::Load: path=" << path_
                   << ", error=" << e.what();
        return tl::make_unexpected(ErrorCode::CONFIG_LOAD_FAIL);
    }
    VLOG(1) << "Loaded " << entries_.size() << " config keys from " << path_;
    return {};
}

void DefaultConfig::parseYaml() { flatten(YAML::LoadFile(path_), ""); }

void DefaultConfig::parseJson() {
    std::ifstream in(path_);
    if (!in) {
        throw std::runtime_error("cannot open " + path_);
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw std::runtime_error("invalid json: " + errors);
    }
    flatten(root, "");
}

void DefaultConfig::flatten(const YAML::Node& node, const std::string& key) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return;
        case YAML::NodeType::Scalar:
            entries_[key] = Entry{node, Json::Value()};
            return;
        case YAML::NodeType::Map:
            for (const auto& child : node) {
                flatten(child.second,
                        JoinKey(key, child.first.as<std::string>()));
            }
            return;
        case YAML::NodeType::Sequence:
            break;
    }
    throw std::runtime_error("sequence not supported at key " + key);
}

void DefaultConfig::flatten(const Json::Value& node, const std::string& key) {
    if (node.isArray()) {
        throw std::runtime_error("array not supported at key " + key);
    }
    if (!node.isObject()) {
        entries_[key] = Entry{YAML::Node(), node};
        return;
    }
    for (const auto& name : node.getMemberNames()) {
        flatten(node[name], JoinKey(key, name));
    }
}

template <typename T, typename YamlFn, typename JsonFn>
void DefaultConfig::lookup(const std::string& key, T* val,
                           const T& default_value, YamlFn from_yaml,
                           JsonFn from_json) const {
    *val = default_value;
    auto it = entries_.find(key);
    if (it == entries_.end()) return;
    try {
        if (format_ == Format::YAML) {
            *val = from_yaml(it->second.yaml);
        } else if (format_ == Format::JSON) {
            *val = from_json(it->second.json);
        }
    } catch (const std::exception& e) {
        LOG(WARNING) << "DefaultConfig: key=" << key << ", error=" << e.what()
                     << ", using default";
        *val = default_value;
    }
}

void DefaultConfig::GetInt32(const std::string& key, int32_t* val,
                             int32_t default_value) const {
    lookup(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<int32_t>(); },
        [](const Json::Value& v) { return v.asInt(); });
}

void DefaultConfig::GetUInt32(const std::string& key, uint32_t* val,
                              uint32_t default_value) const {
    lookup(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<uint32_t>(); },
        [](const Json::Value& v) { return v.asUInt(); });
}

void DefaultConfig::GetInt64(const std::string& key, int64_t* val,
                             int64_t default_value) const {
    lookup(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<int64_t>(); },
        [](const Json::Value& v) { return static_cast<int64_t>(v.asInt64()); });
}

void DefaultConfig::GetUInt64(const std::string& key, uint64_t* val,
                              uint64_t default_value) const {
    lookup(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<uint64_t>(); },
        [](const Json::Value& v) {
            return static_cast<uint64_t>(v.asUInt64());
        });
}

void DefaultConfig::GetDouble(const std::string& key, double* val,
                              double default_value) const {
    lookup(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<double>(); },
        [](const Json::Value& v) { return v.asDouble(); });
}

void DefaultConfig::GetFloat(const std::string& key, float* val,
                             float default_value) const {
    lookup(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<float>(); },
        [](const Json::Value& v) { return v.asFloat(); });
}

void DefaultConfig::GetBool(const std::string& key, bool* val,
                            bool default_value) const {
    lookup(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<bool>(); },
        [](const Json::Value& v) { return v.asBool(); });
}

void DefaultConfig::GetString(const std::string& key, std::string* val,
                              const std::string& default_value) const {
    lookup(
        key, val, default_value,
        [](const YAML::Node& n) { return n.as<std::string>(); },
        [](const Json::Value& v) { return v.asString(); });
}

std::vector<std::string> DefaultConfig::ListKeys(
    const std::string& prefix) const {
    const std::string head = prefix.empty() ? "" : prefix + ".";
    std::vector<std::string> keys;
    for (const auto& [key, entry] : entries_) {
        if (key.size() > head.size() && key.compare(0, head.size(), head) == 0) {
            keys.push_back(key.substr(head.size()));
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}  // namespace skyrelay
