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

#include "skyrelay/planner/transfer_cost.h"

#include <glog/logging.h>

namespace skyrelay {

EgressPriceTable::EgressPriceTable()
    : provider_rates_{{"aws", {0.02, 0.09}},
                      {"gcp", {0.08, 0.12}},
                      {"azure", {0.02, 0.0875}},
                      {"local", {0.0, 0.0}}} {}

tl::expected<double, ErrorCode> EgressPriceTable::GetTransferCost(
    const RegionTag& src, const RegionTag& dst) const {
    auto src_parts = ParseRegionTag(src);
    auto dst_parts = ParseRegionTag(dst);
    if (!src_parts || !dst_parts) {
        LOG(ERROR) << "GetTransferCost: src=" << src << ", dst=" << dst
                   << ", error=malformed_region_tag";
        return tl::make_unexpected(ErrorCode::INVALID_REGION_TAG);
    }
    if (src == dst) return 0.0;

    auto pair_it = pair_costs_.find({src, dst});
    if (pair_it != pair_costs_.end()) return pair_it->second;

    auto rate_it = provider_rates_.find(src_parts->provider);
    if (rate_it == provider_rates_.end()) {
        LOG(ERROR) << "GetTransferCost: src=" << src
                   << ", provider=" << src_parts->provider
                   << ", error=unknown_provider";
        return tl::make_unexpected(ErrorCode::INVALID_REGION_TAG);
    }
    const bool same_provider = src_parts->provider == dst_parts->provider;
    const std::optional<double>& rate = same_provider
                                            ? rate_it->second.inter_region
                                            : rate_it->second.internet;
    if (!rate.has_value()) {
        LOG(ERROR) << "GetTransferCost: src=" << src << ", dst=" << dst
                   << ", rate=" << (same_provider ? "inter_region" : "internet")
                   << ", error=rate_not_configured";
        return tl::make_unexpected(ErrorCode::COST_LOOKUP_FAIL);
    }
    return rate.value();
}

tl::expected<void, ErrorCode> EgressPriceTable::LoadFromConfig(
    const DefaultConfig& config) {
    std::map<std::string, EgressRate> rates = provider_rates_;
    for (const auto& key : config.ListKeys("egress")) {
        auto dot = key.find('.');
        if (dot == std::string::npos) {
            LOG(WARNING) << "LoadFromConfig: key=egress." << key
                         << ", ignored";
            continue;
        }
        const std::string provider = key.substr(0, dot);
        const std::string field = key.substr(dot + 1);
        double value = 0.0;
        config.GetDouble("egress." + key, &value, -1.0);
        if (value < 0.0) {
            LOG(ERROR) << "LoadFromConfig: key=egress." << key
                       << ", error=invalid_price";
            return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
        }
        auto& rate = rates[provider];
        if (field == "inter_region") {
            rate.inter_region = value;
        } else if (field == "internet") {
            rate.internet = value;
        } else {
            LOG(WARNING) << "LoadFromConfig: key=egress." << key
                         << ", ignored";
        }
    }

    std::map<std::pair<RegionTag, RegionTag>, double> pairs = pair_costs_;
    for (const auto& key : config.ListKeys("pairs")) {
        // Region tags carry no '.', so the key splits unambiguously.
        auto dot = key.find('.');
        const RegionTag src = key.substr(0, dot);
        const RegionTag dst =
            dot == std::string::npos ? "" : key.substr(dot + 1);
        if (!ParseRegionTag(src) || !ParseRegionTag(dst)) {
            LOG(ERROR) << "LoadFromConfig: key=pairs." << key
                       << ", error=malformed_region_tag";
            return tl::make_unexpected(ErrorCode::INVALID_REGION_TAG);
        }
        double value = 0.0;
        config.GetDouble("pairs." + key, &value, -1.0);
        if (value < 0.0) {
            LOG(ERROR) << "LoadFromConfig: key=pairs." << key
                       << ", error=invalid_price";
            return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
        }
        pairs[{src, dst}] = value;
    }

    provider_rates_ = std::move(rates);
    pair_costs_ = std::move(pairs);
    VLOG(1) << "LoadFromConfig: providers=" << provider_rates_.size()
            << ", pair_overrides=" << pair_costs_.size();
    return {};
}

}  // namespace skyrelay
