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

#ifndef SKYRELAY_PLANNER_TRANSFER_COST_H
#define SKYRELAY_PLANNER_TRANSFER_COST_H

#include <map>
#include <optional>
#include <string>
#include <utility>

#include "skyrelay/common/default_config.h"
#include "skyrelay/common/types.h"

namespace skyrelay {

/**
 * @brief Estimated egress price, in dollars per gigabyte, of moving data
 *        from one region to another. Implementations must be pure lookups.
 */
class TransferCostModel {
   public:
    virtual ~TransferCostModel() = default;

    virtual tl::expected<double, ErrorCode> GetTransferCost(
        const RegionTag& src, const RegionTag& dst) const = 0;
};

// Either rate may be left unpriced; looking it up is COST_LOOKUP_FAIL.
struct EgressRate {
    std::optional<double> inter_region;  // same provider, different region
    std::optional<double> internet;      // leaving the provider
};

/**
 * @brief Price table keyed by provider, with explicit per-pair overrides.
 *
 * Lookup order: identical tags cost nothing; then a pair override; then the
 * source provider's inter-region rate if both ends share the provider, its
 * internet rate otherwise. A malformed tag or unknown provider is
 * INVALID_REGION_TAG; a known provider without the needed rate is
 * COST_LOOKUP_FAIL.
 */
class EgressPriceTable : public TransferCostModel {
   public:
    // Populated with the built-in aws, gcp, azure and local rates.
    EgressPriceTable();

    tl::expected<double, ErrorCode> GetTransferCost(
        const RegionTag& src, const RegionTag& dst) const override;

    void SetProviderRate(const std::string& provider, EgressRate rate) {
        provider_rates_[provider] = rate;
    }

    void SetPairCost(const RegionTag& src, const RegionTag& dst,
                     double cost_per_gb) {
        pair_costs_[{src, dst}] = cost_per_gb;
    }

    /**
     * @brief Overlays rates from a loaded config:
     *   egress.<provider>.inter_region, egress.<provider>.internet,
     *   pairs.<src_tag>.<dst_tag>
     * @return INVALID_REGION_TAG for a malformed pair key, INVALID_PARAMS
     *         for a negative price
     */
    tl::expected<void, ErrorCode> LoadFromConfig(const DefaultConfig& config);

   private:
    std::map<std::string, EgressRate> provider_rates_;
    std::map<std::pair<RegionTag, RegionTag>, double> pair_costs_;
};

}  // namespace skyrelay

#endif  // SKYRELAY_PLANNER_TRANSFER_COST_H
