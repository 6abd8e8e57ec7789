// Copyright 2025 KVCache.AI
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "skyrelay/planner/planner_config.h"

#include <glog/logging.h>

#include <unordered_map>

#include "skyrelay/common/environ.h"

namespace skyrelay {

const std::string& toString(PlannerType type) {
    static const std::unordered_map<PlannerType, std::string> kNames = {
        {PlannerType::UNICAST_DIRECT, "unicast_direct"},
        {PlannerType::MULTICAST_DIRECT, "multicast_direct"},
        {PlannerType::UNICAST_ILP, "unicast_ilp"},
        {PlannerType::MULTICAST_ILP, "multicast_ilp"},
        {PlannerType::MULTICAST_MDST, "multicast_mdst"},
        {PlannerType::MULTICAST_STEINER, "multicast_steiner"},
    };
    return kNames.at(type);
}

tl::expected<PlannerType, ErrorCode> ParsePlannerType(const std::string& name) {
    static const std::unordered_map<std::string, PlannerType> kTypes = {
        {"unicast_direct", PlannerType::UNICAST_DIRECT},
        {"multicast_direct", PlannerType::MULTICAST_DIRECT},
        {"unicast_ilp", PlannerType::UNICAST_ILP},
        {"multicast_ilp", PlannerType::MULTICAST_ILP},
        {"multicast_mdst", PlannerType::MULTICAST_MDST},
        {"multicast_steiner", PlannerType::MULTICAST_STEINER},
    };
    auto it = kTypes.find(name);
    if (it == kTypes.end()) {
        LOG(ERROR) << "ParsePlannerType: name=" << name
                   << ", error=unknown_planner_type";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    return it->second;
}

std::ostream& operator<<(std::ostream& os, PlannerType type) {
    return os << toString(type);
}

tl::expected<PlannerConfig, ErrorCode> PlannerConfig::FromEnviron() {
    PlannerConfig config;
    const auto& env = Environ::Get();
    if (!env.GetPlannerType().empty()) {
        auto type = ParsePlannerType(env.GetPlannerType());
        if (!type) return tl::make_unexpected(type.error());
        config.planner_type = type.value();
    }
    if (env.GetNumInstances() > 0) config.n_instances = env.GetNumInstances();
    if (env.GetNumConnections() > 0) {
        config.n_connections = env.GetNumConnections();
    }
    return config;
}

tl::expected<PlannerConfig, ErrorCode> PlannerConfig::LoadFromConfig(
    const DefaultConfig& config, const PlannerConfig& base) {
    PlannerConfig result = base;
    if (config.Contains("planner.type")) {
        std::string name;
        config.GetString("planner.type", &name);
        auto type = ParsePlannerType(name);
        if (!type) return tl::make_unexpected(type.error());
        result.planner_type = type.value();
    }
    config.GetInt32("planner.n_instances", &result.n_instances,
                    base.n_instances);
    config.GetInt32("planner.n_connections", &result.n_connections,
                    base.n_connections);
    config.GetDouble("planner.required_throughput_gbits",
                     &result.required_throughput_gbits,
                     base.required_throughput_gbits);
    return result;
}

tl::expected<void, ErrorCode> PlannerConfig::Validate() const {
    if (n_instances <= 0 || n_connections <= 0) {
        LOG(ERROR) << "PlannerConfig: n_instances=" << n_instances
                   << ", n_connections=" << n_connections
                   << ", error=non_positive_count";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    const bool capacity_aware = planner_type == PlannerType::UNICAST_ILP ||
                                planner_type == PlannerType::MULTICAST_ILP;
    if (capacity_aware && required_throughput_gbits <= 0.0) {
        LOG(ERROR) << "PlannerConfig: planner=" << planner_type
                   << ", required_throughput_gbits="
                   << required_throughput_gbits
                   << ", error=non_positive_throughput";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    return {};
}

}  // namespace skyrelay
