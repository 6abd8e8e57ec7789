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

#include "skyrelay/planner/topology_plan.h"

#include <fmt/format.h>
#include <glog/logging.h>

#include <algorithm>
#include <set>

namespace skyrelay {

TopologyPlan::TopologyPlan(RegionTag src_region_tag,
                           const std::vector<RegionTag>& dest_region_tags)
    : src_region_tag_(std::move(src_region_tag)) {
    for (const auto& tag : dest_region_tags) {
        if (std::find(dest_region_tags_.begin(), dest_region_tags_.end(),
                      tag) == dest_region_tags_.end()) {
            dest_region_tags_.push_back(tag);
        }
    }
}

const Gateway& TopologyPlan::AddGateway(const RegionTag& region_tag) {
    auto& region_gateways = gateways_[region_tag];
    region_gateways.push_back(Gateway{
        fmt::format("{}/{}", region_tag, next_gateway_index_++), region_tag});
    return region_gateways.back();
}

void TopologyPlan::SetGatewayProgram(const RegionTag& region_tag,
                                     GatewayProgram program) {
    gateway_programs_[region_tag] = std::move(program);
}

const std::vector<Gateway>& TopologyPlan::GetRegionGateways(
    const RegionTag& region_tag) const {
    static const std::vector<Gateway> kEmpty;
    auto it = gateways_.find(region_tag);
    return it == gateways_.end() ? kEmpty : it->second;
}

std::vector<Gateway> TopologyPlan::GetGateways() const {
    std::vector<Gateway> result;
    for (const auto& entry : gateways_) {
        result.insert(result.end(), entry.second.begin(), entry.second.end());
    }
    return result;
}

const Gateway* TopologyPlan::FindGateway(const GatewayId& gateway_id) const {
    for (const auto& entry : gateways_) {
        for (const auto& gateway : entry.second) {
            if (gateway.gateway_id == gateway_id) return &gateway;
        }
    }
    return nullptr;
}

const GatewayProgram* TopologyPlan::GetGatewayProgram(
    const RegionTag& region_tag) const {
    auto it = gateway_programs_.find(region_tag);
    return it == gateway_programs_.end() ? nullptr : &it->second;
}

std::vector<RegionTag> TopologyPlan::GetRegions() const {
    std::set<RegionTag> regions;
    for (const auto& entry : gateways_) regions.insert(entry.first);
    for (const auto& entry : gateway_programs_) regions.insert(entry.first);
    return {regions.begin(), regions.end()};
}

tl::expected<void, ErrorCode> TopologyPlan::Validate() const {
    for (const auto& [region_tag, program] : gateway_programs_) {
        if (GetRegionGateways(region_tag).empty()) {
            LOG(ERROR) << "Validate: region=" << region_tag
                       << ", error=program_without_gateway";
            return tl::make_unexpected(ErrorCode::INVALID_PLAN);
        }
        auto result = program.Validate();
        if (!result) {
            LOG(ERROR) << "Validate: region=" << region_tag
                       << ", error=invalid_program";
            return result;
        }
        for (const auto& op : program.GetOperators()) {
            const auto* send = op.as<SendOp>();
            if (!send) continue;
            const Gateway* target = FindGateway(send->target_gateway_id);
            if (!target || target->region_tag != send->region) {
                LOG(ERROR) << "Validate: region=" << region_tag
                           << ", send=" << op.id
                           << ", target=" << send->target_gateway_id
                           << ", error=unknown_send_target";
                return tl::make_unexpected(ErrorCode::INVALID_PLAN);
            }
        }
    }
    return {};
}

tl::expected<Json::Value, ErrorCode> TopologyPlan::GetRegionDocument(
    const RegionTag& region_tag) const {
    const auto& region_gateways = GetRegionGateways(region_tag);
    if (region_gateways.empty()) {
        LOG(ERROR) << "GetRegionDocument: region=" << region_tag
                   << ", error=no_gateway_in_region";
        return tl::make_unexpected(ErrorCode::GATEWAY_NOT_FOUND);
    }
    Json::Value document(Json::objectValue);
    document["region_tag"] = region_tag;
    Json::Value gateway_ids(Json::arrayValue);
    for (const auto& gateway : region_gateways) {
        gateway_ids.append(gateway.gateway_id);
    }
    document["gateway_ids"] = gateway_ids;
    const GatewayProgram* program = GetGatewayProgram(region_tag);
    document["program"] =
        program ? program->toJson() : Json::Value(Json::arrayValue);
    return document;
}

Json::Value TopologyPlan::toJson() const {
    Json::Value value(Json::objectValue);
    value["src_region_tag"] = src_region_tag_;
    Json::Value dest(Json::arrayValue);
    for (const auto& tag : dest_region_tags_) {
        dest.append(tag);
    }
    value["dest_region_tags"] = dest;
    value["cost_per_gb"] = cost_per_gb_;
    Json::Value regions(Json::arrayValue);
    for (const auto& region_tag : GetRegions()) {
        auto document = GetRegionDocument(region_tag);
        if (document) regions.append(document.value());
    }
    value["regions"] = regions;
    return value;
}

std::string TopologyPlan::toString() const {
    return toJson().toStyledString();
}

}  // namespace skyrelay
