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

#ifndef SKYRELAY_PLANNER_TOPOLOGY_PLAN_H
#define SKYRELAY_PLANNER_TOPOLOGY_PLAN_H

#include <map>
#include <string>
#include <vector>

#include "skyrelay/planner/gateway_program.h"

namespace skyrelay {

struct Gateway {
    GatewayId gateway_id;
    RegionTag region_tag;
};

/**
 * @brief Output of a planner: the regions taking part in a transfer, the
 *        gateways provisioned in each, the program each region runs and the
 *        estimated cost per GB.
 *
 * Built by a single Planner::Plan call through AddGateway,
 * SetGatewayProgram and AddCostPerGb, then treated as immutable.
 */
class TopologyPlan {
   public:
    TopologyPlan(RegionTag src_region_tag,
                 const std::vector<RegionTag>& dest_region_tags);

    const RegionTag& src_region_tag() const { return src_region_tag_; }

    // Distinct, in first-seen order.
    const std::vector<RegionTag>& dest_region_tags() const {
        return dest_region_tags_;
    }

    double cost_per_gb() const { return cost_per_gb_; }

    /**
     * @brief Provisions a new gateway in a region. Ids are
     *        "<region_tag>/<n>", n counting up across the whole plan, and
     *        are never reused. The reference is invalidated by the next
     *        AddGateway call for the same region.
     */
    const Gateway& AddGateway(const RegionTag& region_tag);

    // Replaces any program previously set for the region.
    void SetGatewayProgram(const RegionTag& region_tag, GatewayProgram program);

    void AddCostPerGb(double cost) { cost_per_gb_ += cost; }

    // Gateways of a region in provisioning order; empty if none.
    const std::vector<Gateway>& GetRegionGateways(
        const RegionTag& region_tag) const;

    std::vector<Gateway> GetGateways() const;

    const Gateway* FindGateway(const GatewayId& gateway_id) const;

    const GatewayProgram* GetGatewayProgram(const RegionTag& region_tag) const;

    // Every region holding a gateway or a program, sorted.
    std::vector<RegionTag> GetRegions() const;

    /**
     * @brief Checks every plan invariant: each program region has at least
     *        one gateway, each program is structurally valid, and each Send
     *        targets a provisioned gateway in the region it names.
     * @return INVALID_PLAN on the first violation found
     */
    tl::expected<void, ErrorCode> Validate() const;

    /**
     * @brief Document consumed by the gateways of one region:
     *        {"region_tag", "gateway_ids", "program"}.
     * @return GATEWAY_NOT_FOUND if the region has no gateway
     */
    tl::expected<Json::Value, ErrorCode> GetRegionDocument(
        const RegionTag& region_tag) const;

    Json::Value toJson() const;

    std::string toString() const;

   private:
    RegionTag src_region_tag_;
    std::vector<RegionTag> dest_region_tags_;
    std::map<RegionTag, std::vector<Gateway>> gateways_;
    std::map<RegionTag, GatewayProgram> gateway_programs_;
    double cost_per_gb_ = 0.0;
    uint64_t next_gateway_index_ = 0;
};

}  // namespace skyrelay

#endif  // SKYRELAY_PLANNER_TOPOLOGY_PLAN_H
