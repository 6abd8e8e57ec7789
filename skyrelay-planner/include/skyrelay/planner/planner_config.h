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

#ifndef SKYRELAY_PLANNER_PLANNER_CONFIG_H
#define SKYRELAY_PLANNER_PLANNER_CONFIG_H

#include <ostream>
#include <string>

#include "skyrelay/common/default_config.h"
#include "skyrelay/common/types.h"

namespace skyrelay {

enum class PlannerType {
    UNICAST_DIRECT,
    MULTICAST_DIRECT,
    UNICAST_ILP,
    MULTICAST_ILP,
    MULTICAST_MDST,
    MULTICAST_STEINER,
};

// "unicast_direct", "multicast_direct", "unicast_ilp", "multicast_ilp",
// "multicast_mdst", "multicast_steiner"
const std::string& toString(PlannerType type);

tl::expected<PlannerType, ErrorCode> ParsePlannerType(const std::string& name);

std::ostream& operator<<(std::ostream& os, PlannerType type);

struct PlannerConfig {
    PlannerType planner_type = PlannerType::UNICAST_DIRECT;
    int32_t n_instances = 1;
    int32_t n_connections = 32;
    // Only read by the ILP strategies.
    double required_throughput_gbits = 0.0;

    // Defaults overridden by SKYRELAY_PLANNER, SKYRELAY_N_INSTANCES and
    // SKYRELAY_N_CONNECTIONS when set.
    static tl::expected<PlannerConfig, ErrorCode> FromEnviron();

    /**
     * @brief Reads planner.type, planner.n_instances, planner.n_connections
     *        and planner.required_throughput_gbits, starting from base for
     *        any key the config leaves out.
     */
    static tl::expected<PlannerConfig, ErrorCode> LoadFromConfig(
        const DefaultConfig& config, const PlannerConfig& base);

    // INVALID_PARAMS unless counts are positive, and the throughput target
    // too for the ILP strategies.
    tl::expected<void, ErrorCode> Validate() const;
};

}  // namespace skyrelay

#endif  // SKYRELAY_PLANNER_PLANNER_CONFIG_H
