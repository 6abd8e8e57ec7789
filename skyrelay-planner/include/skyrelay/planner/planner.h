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

#ifndef SKYRELAY_PLANNER_PLANNER_H
#define SKYRELAY_PLANNER_PLANNER_H

#include <memory>
#include <vector>

#include "skyrelay/planner/planner_config.h"
#include "skyrelay/planner/topology_plan.h"
#include "skyrelay/planner/transfer_cost.h"
#include "skyrelay/planner/transfer_job.h"

namespace skyrelay {

/**
 * @brief Abstract interface for a topology planning strategy, responsible
 *        for turning a batch of transfer jobs into one TopologyPlan.
 *
 * A planner holds only its configuration and is safe to call concurrently
 * with disjoint job lists. Plan either returns a complete plan that passed
 * TopologyPlan::Validate, or an error and nothing else.
 */
class Planner {
   public:
    virtual ~Planner() = default;

    /**
     * @brief Plans a transfer.
     * @param jobs Non-empty; job i is planned as partition i
     * @return tl::expected<TopologyPlan, ErrorCode>
     *         - INVALID_PARAMS for an empty job list
     *         - PRECONDITION_VIOLATED when the jobs break the strategy's
     *           structural assumptions
     *         - NOT_IMPLEMENTED for strategies without an algorithm yet
     *         - any error of the cost model, unchanged
     */
    virtual tl::expected<TopologyPlan, ErrorCode> Plan(
        const std::vector<TransferJob>& jobs) const = 0;

    virtual PlannerType type() const = 0;
};

/**
 * @brief Single destination region. Every source gateway may send any
 *        partition to any destination gateway: Read -> MuxOr -> one Send
 *        per destination gateway; Receive -> Write on the other side.
 */
class UnicastDirectPlanner : public Planner {
   public:
    UnicastDirectPlanner(int32_t n_instances, int32_t n_connections,
                         std::shared_ptr<const TransferCostModel> cost_model);

    tl::expected<TopologyPlan, ErrorCode> Plan(
        const std::vector<TransferJob>& jobs) const override;

    PlannerType type() const override { return PlannerType::UNICAST_DIRECT; }

   private:
    const int32_t n_instances_;
    const int32_t n_connections_;
    const std::shared_ptr<const TransferCostModel> cost_model_;
};

/**
 * @brief One source region replicated to several destination regions:
 *        Read -> MuxAnd -> per destination region a MuxOr -> one Send per
 *        gateway of that region.
 */
class MulticastDirectPlanner : public Planner {
   public:
    MulticastDirectPlanner(int32_t n_instances, int32_t n_connections,
                           std::shared_ptr<const TransferCostModel> cost_model);

    tl::expected<TopologyPlan, ErrorCode> Plan(
        const std::vector<TransferJob>& jobs) const override;

    PlannerType type() const override { return PlannerType::MULTICAST_DIRECT; }

   private:
    const int32_t n_instances_;
    const int32_t n_connections_;
    const std::shared_ptr<const TransferCostModel> cost_model_;
};

// Capacity-aware strategy solving for a throughput target. No solver yet.
class UnicastILPPlanner : public Planner {
   public:
    UnicastILPPlanner(int32_t n_instances, int32_t n_connections,
                      double required_throughput_gbits)
        : n_instances_(n_instances),
          n_connections_(n_connections),
          required_throughput_gbits_(required_throughput_gbits) {}

    tl::expected<TopologyPlan, ErrorCode> Plan(
        const std::vector<TransferJob>& jobs) const override;

    PlannerType type() const override { return PlannerType::UNICAST_ILP; }

    double required_throughput_gbits() const {
        return required_throughput_gbits_;
    }

   private:
    const int32_t n_instances_;
    const int32_t n_connections_;
    const double required_throughput_gbits_;
};

class MulticastILPPlanner : public Planner {
   public:
    MulticastILPPlanner(int32_t n_instances, int32_t n_connections,
                        double required_throughput_gbits)
        : n_instances_(n_instances),
          n_connections_(n_connections),
          required_throughput_gbits_(required_throughput_gbits) {}

    tl::expected<TopologyPlan, ErrorCode> Plan(
        const std::vector<TransferJob>& jobs) const override;

    PlannerType type() const override { return PlannerType::MULTICAST_ILP; }

    double required_throughput_gbits() const {
        return required_throughput_gbits_;
    }

   private:
    const int32_t n_instances_;
    const int32_t n_connections_;
    const double required_throughput_gbits_;
};

// Minimum-degree spanning tree over the destination regions. No solver yet.
class MulticastMDSTPlanner : public Planner {
   public:
    MulticastMDSTPlanner(int32_t n_instances, int32_t n_connections)
        : n_instances_(n_instances), n_connections_(n_connections) {}

    tl::expected<TopologyPlan, ErrorCode> Plan(
        const std::vector<TransferJob>& jobs) const override;

    PlannerType type() const override { return PlannerType::MULTICAST_MDST; }

   private:
    const int32_t n_instances_;
    const int32_t n_connections_;
};

// Steiner tree through relay regions. No solver yet.
class MulticastSteinerTreePlanner : public Planner {
   public:
    MulticastSteinerTreePlanner(int32_t n_instances, int32_t n_connections)
        : n_instances_(n_instances), n_connections_(n_connections) {}

    tl::expected<TopologyPlan, ErrorCode> Plan(
        const std::vector<TransferJob>& jobs) const override;

    PlannerType type() const override {
        return PlannerType::MULTICAST_STEINER;
    }

   private:
    const int32_t n_instances_;
    const int32_t n_connections_;
};

/**
 * @brief Validates the configuration and builds the matching strategy.
 * @return INVALID_PARAMS for an invalid config or a null cost model
 */
tl::expected<std::unique_ptr<Planner>, ErrorCode> CreatePlanner(
    const PlannerConfig& config,
    std::shared_ptr<const TransferCostModel> cost_model);

}  // namespace skyrelay

#endif  // SKYRELAY_PLANNER_PLANNER_H
