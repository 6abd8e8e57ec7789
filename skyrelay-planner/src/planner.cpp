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

#include "skyrelay/planner/planner.h"

#include <glog/logging.h>

#include <map>
#include <set>

namespace skyrelay {

namespace {

tl::expected<void, ErrorCode> CheckCounts(PlannerType type,
                                          int32_t n_instances,
                                          int32_t n_connections) {
    if (n_instances <= 0 || n_connections <= 0) {
        LOG(ERROR) << "Plan: planner=" << type
                   << ", n_instances=" << n_instances
                   << ", n_connections=" << n_connections
                   << ", error=counts_must_be_positive";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    return {};
}

tl::expected<void, ErrorCode> CheckPlannable(
    PlannerType type, int32_t n_instances, int32_t n_connections,
    const std::vector<TransferJob>& jobs,
    const std::shared_ptr<const TransferCostModel>& cost_model) {
    auto counts = CheckCounts(type, n_instances, n_connections);
    if (!counts) return counts;
    if (jobs.empty()) {
        LOG(ERROR) << "Plan: error=empty_job_list";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    if (!cost_model) {
        LOG(ERROR) << "Plan: error=missing_cost_model";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    return {};
}

// Root of one partition in the source program.
tl::expected<OperatorId, ErrorCode> AddRead(GatewayProgram& program,
                                            const TransferJob& job,
                                            PartitionId partition_id,
                                            uint32_t n_connections) {
    return program.AddOperator(
        ReadObjectStoreOp{job.src().bucket, job.src().region_tag,
                          n_connections},
        partition_id);
}

// One Send per gateway of the target region, under a MuxOr.
tl::expected<void, ErrorCode> AddSendFanout(
    GatewayProgram& program, PartitionId partition_id, OperatorId parent,
    const std::vector<Gateway>& targets, uint32_t n_connections) {
    auto mux_or = program.AddOperator(MuxOrOp{}, partition_id, parent);
    if (!mux_or) return tl::make_unexpected(mux_or.error());
    for (const auto& gateway : targets) {
        auto send = program.AddOperator(
            SendOp{gateway.gateway_id, gateway.region_tag, n_connections},
            partition_id, mux_or.value());
        if (!send) return tl::make_unexpected(send.error());
    }
    return {};
}

tl::expected<void, ErrorCode> AddReceiveWrite(
    GatewayProgram& program, PartitionId partition_id,
    const ObjectStoreEndpoint& dst, const std::string& dst_prefix,
    uint32_t n_connections) {
    auto receive = program.AddOperator(ReceiveOp{}, partition_id);
    if (!receive) return tl::make_unexpected(receive.error());
    auto write = program.AddOperator(
        WriteObjectStoreOp{dst.bucket, dst.region_tag, n_connections,
                           dst_prefix},
        partition_id, receive.value());
    if (!write) return tl::make_unexpected(write.error());
    return {};
}

tl::expected<TopologyPlan, ErrorCode> FinishPlan(TopologyPlan plan,
                                                 PlannerType type) {
    auto valid = plan.Validate();
    if (!valid) {
        LOG(ERROR) << "Plan: planner=" << type << ", error=invalid_plan";
        return tl::make_unexpected(valid.error());
    }
    LOG(INFO) << "Planned transfer: planner=" << type
              << ", src=" << plan.src_region_tag()
              << ", regions=" << plan.GetRegions().size()
              << ", gateways=" << plan.GetGateways().size()
              << ", cost_per_gb=" << plan.cost_per_gb();
    return plan;
}

tl::expected<TopologyPlan, ErrorCode> NotImplemented(
    PlannerType type, int32_t n_instances, int32_t n_connections,
    const std::vector<TransferJob>& jobs) {
    auto counts = CheckCounts(type, n_instances, n_connections);
    if (!counts) return tl::make_unexpected(counts.error());
    LOG(ERROR) << "Plan: planner=" << type << ", n_instances=" << n_instances
               << ", n_connections=" << n_connections
               << ", jobs=" << jobs.size()
               << ", error=unimplemented_planning_strategy";
    return tl::make_unexpected(ErrorCode::NOT_IMPLEMENTED);
}

}  // namespace

UnicastDirectPlanner::UnicastDirectPlanner(
    int32_t n_instances, int32_t n_connections,
    std::shared_ptr<const TransferCostModel> cost_model)
    : n_instances_(n_instances),
      n_connections_(n_connections),
      cost_model_(std::move(cost_model)) {}

tl::expected<TopologyPlan, ErrorCode> UnicastDirectPlanner::Plan(
    const std::vector<TransferJob>& jobs) const {
    auto plannable =
        CheckPlannable(type(), n_instances_, n_connections_, jobs, cost_model_);
    if (!plannable) return tl::make_unexpected(plannable.error());

    for (const auto& job : jobs) {
        if (job.dsts().size() != 1) {
            LOG(ERROR) << "Plan: src=" << job.src()
                       << ", destinations=" << job.dsts().size()
                       << ", error=direct planner supports single "
                          "destination per job";
            return tl::make_unexpected(ErrorCode::PRECONDITION_VIOLATED);
        }
    }
    const RegionTag& src_region = jobs.front().src().region_tag;
    const RegionTag& dst_region = jobs.front().dsts().front().region_tag;
    for (const auto& job : jobs) {
        if (job.src().region_tag != src_region ||
            job.dsts().front().region_tag != dst_region) {
            LOG(ERROR) << "Plan: src=" << job.src().region_tag
                       << ", dst=" << job.dsts().front().region_tag
                       << ", expected_src=" << src_region
                       << ", expected_dst=" << dst_region
                       << ", error=jobs must share source/destination region";
            return tl::make_unexpected(ErrorCode::PRECONDITION_VIOLATED);
        }
    }
    if (src_region == dst_region) {
        LOG(ERROR) << "Plan: region=" << src_region
                   << ", error=destination_region_equals_source_region";
        return tl::make_unexpected(ErrorCode::PRECONDITION_VIOLATED);
    }
    auto cost = cost_model_->GetTransferCost(src_region, dst_region);
    if (!cost) return tl::make_unexpected(cost.error());

    TopologyPlan plan(src_region, {dst_region});
    for (int32_t i = 0; i < n_instances_; ++i) {
        plan.AddGateway(src_region);
        plan.AddGateway(dst_region);
    }
    const std::vector<Gateway> dst_gateways =
        plan.GetRegionGateways(dst_region);
    const auto n_connections = static_cast<uint32_t>(n_connections_);

    GatewayProgram src_program;
    GatewayProgram dst_program;
    for (size_t index = 0; index < jobs.size(); ++index) {
        const TransferJob& job = jobs[index];
        const auto partition_id = static_cast<PartitionId>(index);

        auto read = AddRead(src_program, job, partition_id, n_connections);
        if (!read) return tl::make_unexpected(read.error());
        auto fanout = AddSendFanout(src_program, partition_id, read.value(),
                                    dst_gateways, n_connections);
        if (!fanout) return tl::make_unexpected(fanout.error());

        auto written =
            AddReceiveWrite(dst_program, partition_id, job.dsts().front(),
                            job.dst_prefixes().front(), n_connections);
        if (!written) return tl::make_unexpected(written.error());

        plan.AddCostPerGb(cost.value());
    }
    plan.SetGatewayProgram(src_region, std::move(src_program));
    plan.SetGatewayProgram(dst_region, std::move(dst_program));
    return FinishPlan(std::move(plan), type());
}

MulticastDirectPlanner::MulticastDirectPlanner(
    int32_t n_instances, int32_t n_connections,
    std::shared_ptr<const TransferCostModel> cost_model)
    : n_instances_(n_instances),
      n_connections_(n_connections),
      cost_model_(std::move(cost_model)) {}

tl::expected<TopologyPlan, ErrorCode> MulticastDirectPlanner::Plan(
    const std::vector<TransferJob>& jobs) const {
    auto plannable =
        CheckPlannable(type(), n_instances_, n_connections_, jobs, cost_model_);
    if (!plannable) return tl::make_unexpected(plannable.error());

    const RegionTag& src_region = jobs.front().src().region_tag;
    const std::vector<RegionTag> dst_regions = jobs.front().dst_region_tags();
    for (const auto& job : jobs) {
        if (job.src().region_tag != src_region ||
            job.dst_region_tags() != dst_regions) {
            LOG(ERROR) << "Plan: src=" << job.src().region_tag
                       << ", expected_src=" << src_region
                       << ", error=jobs must share source/destination region";
            return tl::make_unexpected(ErrorCode::PRECONDITION_VIOLATED);
        }
    }
    std::set<RegionTag> seen;
    std::map<RegionTag, double> costs;
    for (const auto& dst_region : dst_regions) {
        if (dst_region == src_region || !seen.insert(dst_region).second) {
            LOG(ERROR) << "Plan: src=" << src_region
                       << ", dst=" << dst_region
                       << ", error=destination_region_not_distinct";
            return tl::make_unexpected(ErrorCode::PRECONDITION_VIOLATED);
        }
        auto cost = cost_model_->GetTransferCost(src_region, dst_region);
        if (!cost) return tl::make_unexpected(cost.error());
        costs[dst_region] = cost.value();
    }

    TopologyPlan plan(src_region, dst_regions);
    for (int32_t i = 0; i < n_instances_; ++i) {
        plan.AddGateway(src_region);
        for (const auto& dst_region : dst_regions) {
            plan.AddGateway(dst_region);
        }
    }
    const auto n_connections = static_cast<uint32_t>(n_connections_);

    GatewayProgram src_program;
    std::map<RegionTag, GatewayProgram> dst_programs;
    for (size_t index = 0; index < jobs.size(); ++index) {
        const TransferJob& job = jobs[index];
        const auto partition_id = static_cast<PartitionId>(index);

        auto read = AddRead(src_program, job, partition_id, n_connections);
        if (!read) return tl::make_unexpected(read.error());
        auto mux_and =
            src_program.AddOperator(MuxAndOp{}, partition_id, read.value());
        if (!mux_and) return tl::make_unexpected(mux_and.error());

        for (size_t i = 0; i < job.dsts().size(); ++i) {
            const ObjectStoreEndpoint& dst = job.dsts()[i];
            auto fanout = AddSendFanout(src_program, partition_id,
                                        mux_and.value(),
                                        plan.GetRegionGateways(dst.region_tag),
                                        n_connections);
            if (!fanout) return tl::make_unexpected(fanout.error());

            auto written =
                AddReceiveWrite(dst_programs[dst.region_tag], partition_id,
                                dst, job.dst_prefixes()[i], n_connections);
            if (!written) return tl::make_unexpected(written.error());

            // Summed per job and destination, shared region pairs included.
            plan.AddCostPerGb(costs[dst.region_tag]);
        }
    }
    plan.SetGatewayProgram(src_region, std::move(src_program));
    for (auto& [region, program] : dst_programs) {
        plan.SetGatewayProgram(region, std::move(program));
    }
    return FinishPlan(std::move(plan), type());
}

tl::expected<TopologyPlan, ErrorCode> UnicastILPPlanner::Plan(
    const std::vector<TransferJob>& jobs) const {
    return NotImplemented(type(), n_instances_, n_connections_, jobs);
}

tl::expected<TopologyPlan, ErrorCode> MulticastILPPlanner::Plan(
    const std::vector<TransferJob>& jobs) const {
    return NotImplemented(type(), n_instances_, n_connections_, jobs);
}

tl::expected<TopologyPlan, ErrorCode> MulticastMDSTPlanner::Plan(
    const std::vector<TransferJob>& jobs) const {
    return NotImplemented(type(), n_instances_, n_connections_, jobs);
}

tl::expected<TopologyPlan, ErrorCode> MulticastSteinerTreePlanner::Plan(
    const std::vector<TransferJob>& jobs) const {
    return NotImplemented(type(), n_instances_, n_connections_, jobs);
}

tl::expected<std::unique_ptr<Planner>, ErrorCode> CreatePlanner(
    const PlannerConfig& config,
    std::shared_ptr<const TransferCostModel> cost_model) {
    auto valid = config.Validate();
    if (!valid) return tl::make_unexpected(valid.error());
    if (!cost_model) {
        LOG(ERROR) << "CreatePlanner: planner=" << config.planner_type
                   << ", error=missing_cost_model";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }

    std::unique_ptr<Planner> planner;
    switch (config.planner_type) {
        case PlannerType::UNICAST_DIRECT:
            planner = std::make_unique<UnicastDirectPlanner>(
                config.n_instances, config.n_connections,
                std::move(cost_model));
            break;
        case PlannerType::MULTICAST_DIRECT:
            planner = std::make_unique<MulticastDirectPlanner>(
                config.n_instances, config.n_connections,
                std::move(cost_model));
            break;
        case PlannerType::UNICAST_ILP:
            planner = std::make_unique<UnicastILPPlanner>(
                config.n_instances, config.n_connections,
                config.required_throughput_gbits);
            break;
        case PlannerType::MULTICAST_ILP:
            planner = std::make_unique<MulticastILPPlanner>(
                config.n_instances, config.n_connections,
                config.required_throughput_gbits);
            break;
        case PlannerType::MULTICAST_MDST:
            planner = std::make_unique<MulticastMDSTPlanner>(
                config.n_instances, config.n_connections);
            break;
        case PlannerType::MULTICAST_STEINER:
            planner = std::make_unique<MulticastSteinerTreePlanner>(
                config.n_instances, config.n_connections);
            break;
    }
    if (!planner) return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    VLOG(1) << "CreatePlanner: planner=" << config.planner_type
            << ", n_instances=" << config.n_instances
            << ", n_connections=" << config.n_connections;
    return planner;
}

}  // namespace skyrelay
