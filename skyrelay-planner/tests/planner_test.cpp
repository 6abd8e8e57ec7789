#include "skyrelay/planner/planner.h"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <map>
#include <set>

namespace skyrelay {

// Fixed per-pair prices; anything else is a lookup failure.
class FakeCostModel : public TransferCostModel {
   public:
    void Set(const RegionTag& src, const RegionTag& dst, double cost) {
        costs_[{src, dst}] = cost;
    }

    tl::expected<double, ErrorCode> GetTransferCost(
        const RegionTag& src, const RegionTag& dst) const override {
        auto it = costs_.find({src, dst});
        if (it == costs_.end()) {
            return tl::make_unexpected(ErrorCode::COST_LOOKUP_FAIL);
        }
        return it->second;
    }

   private:
    std::map<std::pair<RegionTag, RegionTag>, double> costs_;
};

class PlannerTest : public ::testing::Test {
   protected:
    static constexpr const char* kUsEast = "aws:us-east-1";
    static constexpr const char* kUsWest = "aws:us-west-2";
    static constexpr const char* kEuWest = "aws:eu-west-1";
    static constexpr const char* kApSouth = "aws:ap-south-1";

    void SetUp() override {
        costs_ = std::make_shared<FakeCostModel>();
        costs_->Set(kUsEast, kUsWest, 0.02);
        costs_->Set(kUsEast, kEuWest, 0.03);
        costs_->Set(kUsEast, kApSouth, 0.05);
    }

    static TransferJob Job(const RegionTag& src, const std::string& bucket,
                           std::vector<ObjectStoreEndpoint> dsts,
                           std::vector<std::string> dst_prefixes = {}) {
        return TransferJob::Create({src, bucket}, "data/", std::move(dsts),
                                   std::move(dst_prefixes))
            .value();
    }

    // Children of an operator, as operators.
    static std::vector<const Operator*> Children(const GatewayProgram& program,
                                                 const Operator& op) {
        std::vector<const Operator*> result;
        for (auto child : op.children) {
            result.push_back(program.GetOperator(child));
        }
        return result;
    }

    std::shared_ptr<FakeCostModel> costs_;
};

TEST_F(PlannerTest, UnicastSingleJobTwoInstances) {
    UnicastDirectPlanner planner(2, 4, costs_);
    auto plan = planner.Plan({Job(kUsEast, "bucketA", {{kUsWest, "bucketB"}})});
    ASSERT_TRUE(plan.has_value());

    EXPECT_EQ(plan->GetRegionGateways(kUsEast).size(), 2u);
    EXPECT_EQ(plan->GetRegionGateways(kUsWest).size(), 2u);
    EXPECT_EQ(plan->src_region_tag(), kUsEast);
    EXPECT_EQ(plan->dest_region_tags(), std::vector<RegionTag>{kUsWest});

    const GatewayProgram* src_program = plan->GetGatewayProgram(kUsEast);
    ASSERT_NE(src_program, nullptr);
    EXPECT_EQ(src_program->GetPartitions(), std::vector<PartitionId>{0});
    auto roots = src_program->GetRoots(0);
    ASSERT_EQ(roots.size(), 1u);
    const Operator* read = src_program->GetOperator(roots[0]);
    ASSERT_NE(read->as<ReadObjectStoreOp>(), nullptr);
    EXPECT_EQ(read->as<ReadObjectStoreOp>()->num_connections, 4u);
    EXPECT_EQ(read->as<ReadObjectStoreOp>()->bucket_name, "bucketA");

    auto read_children = Children(*src_program, *read);
    ASSERT_EQ(read_children.size(), 1u);
    EXPECT_EQ(read_children[0]->type(), OperatorType::MUX_OR);

    std::set<GatewayId> targets;
    for (const Operator* send : Children(*src_program, *read_children[0])) {
        ASSERT_NE(send->as<SendOp>(), nullptr);
        EXPECT_EQ(send->as<SendOp>()->region, kUsWest);
        EXPECT_EQ(send->as<SendOp>()->num_connections, 4u);
        targets.insert(send->as<SendOp>()->target_gateway_id);
    }
    std::set<GatewayId> dst_gateways;
    for (const auto& gateway : plan->GetRegionGateways(kUsWest)) {
        dst_gateways.insert(gateway.gateway_id);
    }
    EXPECT_EQ(targets, dst_gateways);

    EXPECT_DOUBLE_EQ(plan->cost_per_gb(), 0.02);
}

TEST_F(PlannerTest, UnicastDestinationProgramReceivesAndWrites) {
    UnicastDirectPlanner planner(1, 8, costs_);
    auto plan = planner.Plan(
        {Job(kUsEast, "bucketA", {{kUsWest, "bucketB"}}, {"copy/"})});
    ASSERT_TRUE(plan.has_value());

    const GatewayProgram* dst_program = plan->GetGatewayProgram(kUsWest);
    ASSERT_NE(dst_program, nullptr);
    auto roots = dst_program->GetRoots(0);
    ASSERT_EQ(roots.size(), 1u);
    const Operator* receive = dst_program->GetOperator(roots[0]);
    EXPECT_EQ(receive->type(), OperatorType::RECEIVE);
    auto children = Children(*dst_program, *receive);
    ASSERT_EQ(children.size(), 1u);
    const auto* write = children[0]->as<WriteObjectStoreOp>();
    ASSERT_NE(write, nullptr);
    EXPECT_EQ(write->bucket_name, "bucketB");
    EXPECT_EQ(write->bucket_region, kUsWest);
    EXPECT_EQ(write->num_connections, 8u);
    EXPECT_EQ(write->key_prefix, std::optional<std::string>("copy/"));
}

TEST_F(PlannerTest, UnicastPartitionPerJobAndCostIndependentOfInstances) {
    std::vector<TransferJob> jobs = {
        Job(kUsEast, "a", {{kUsWest, "x"}}),
        Job(kUsEast, "b", {{kUsWest, "y"}}),
        Job(kUsEast, "a", {{kUsWest, "x"}}),  // equal to the first job
    };
    auto small = UnicastDirectPlanner(1, 4, costs_).Plan(jobs);
    auto large = UnicastDirectPlanner(3, 4, costs_).Plan(jobs);
    ASSERT_TRUE(small.has_value());
    ASSERT_TRUE(large.has_value());

    EXPECT_EQ(large->GetGatewayProgram(kUsEast)->GetPartitions(),
              (std::vector<PartitionId>{0, 1, 2}));
    EXPECT_EQ(large->GetGatewayProgram(kUsWest)->GetPartitions(),
              (std::vector<PartitionId>{0, 1, 2}));
    EXPECT_DOUBLE_EQ(small->cost_per_gb(), 3 * 0.02);
    EXPECT_DOUBLE_EQ(large->cost_per_gb(), small->cost_per_gb());

    // Every MuxOr fans out to each of the 3 destination gateways once.
    for (const auto& op : large->GetGatewayProgram(kUsEast)->GetOperators()) {
        if (op.type() != OperatorType::MUX_OR) continue;
        std::set<GatewayId> targets;
        for (const Operator* send :
             Children(*large->GetGatewayProgram(kUsEast), op)) {
            targets.insert(send->as<SendOp>()->target_gateway_id);
        }
        EXPECT_EQ(targets.size(), 3u);
        EXPECT_EQ(op.children.size(), 3u);
    }
}

TEST_F(PlannerTest, UnicastRejectsMultipleDestinations) {
    UnicastDirectPlanner planner(1, 4, costs_);
    auto plan = planner.Plan(
        {Job(kUsEast, "a", {{kUsWest, "x"}, {kEuWest, "y"}})});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error(), ErrorCode::PRECONDITION_VIOLATED);
}

TEST_F(PlannerTest, UnicastRejectsMixedRegions) {
    UnicastDirectPlanner planner(1, 4, costs_);
    auto plan = planner.Plan({Job(kUsEast, "a", {{kUsWest, "x"}}),
                              Job(kUsEast, "b", {{kEuWest, "y"}})});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error(), ErrorCode::PRECONDITION_VIOLATED);

    plan = planner.Plan({Job(kUsEast, "a", {{kUsWest, "x"}}),
                         Job(kEuWest, "b", {{kUsWest, "y"}})});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error(), ErrorCode::PRECONDITION_VIOLATED);
}

TEST_F(PlannerTest, UnicastRejectsSameSourceAndDestinationRegion) {
    UnicastDirectPlanner planner(1, 4, costs_);
    auto plan = planner.Plan({Job(kUsEast, "a", {{kUsEast, "b"}})});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error(), ErrorCode::PRECONDITION_VIOLATED);
}

TEST_F(PlannerTest, EmptyJobListIsInvalid) {
    EXPECT_EQ(UnicastDirectPlanner(1, 4, costs_).Plan({}).error(),
              ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(MulticastDirectPlanner(1, 4, costs_).Plan({}).error(),
              ErrorCode::INVALID_PARAMS);
}

TEST_F(PlannerTest, NonPositiveCountsAreInvalid) {
    std::vector<TransferJob> jobs = {Job(kUsEast, "a", {{kUsWest, "x"}})};
    EXPECT_EQ(UnicastDirectPlanner(2, -1, costs_).Plan(jobs).error(),
              ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(UnicastDirectPlanner(0, 4, costs_).Plan(jobs).error(),
              ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(MulticastDirectPlanner(2, 0, costs_).Plan(jobs).error(),
              ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(MulticastDirectPlanner(-3, 4, costs_).Plan(jobs).error(),
              ErrorCode::INVALID_PARAMS);
    // Count errors win over the missing solver.
    EXPECT_EQ(MulticastMDSTPlanner(0, 4).Plan(jobs).error(),
              ErrorCode::INVALID_PARAMS);
}

TEST_F(PlannerTest, CostLookupFailurePropagates) {
    const RegionTag unpriced = "gcp:us-central1";
    auto plan = UnicastDirectPlanner(1, 4, costs_)
                    .Plan({Job(kUsEast, "a", {{unpriced, "x"}})});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error(), ErrorCode::COST_LOOKUP_FAIL);

    plan = MulticastDirectPlanner(1, 4, costs_)
               .Plan({Job(kUsEast, "a", {{kUsWest, "x"}, {unpriced, "y"}})});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error(), ErrorCode::COST_LOOKUP_FAIL);
}

TEST_F(PlannerTest, MulticastCostSummedPerJobAndDestination) {
    MulticastDirectPlanner planner(1, 4, costs_);
    std::vector<ObjectStoreEndpoint> dsts = {{kEuWest, "eu"},
                                             {kApSouth, "ap"}};
    auto plan =
        planner.Plan({Job(kUsEast, "a", dsts), Job(kUsEast, "b", dsts)});
    ASSERT_TRUE(plan.has_value());
    EXPECT_DOUBLE_EQ(plan->cost_per_gb(), 2 * (0.03 + 0.05));
}

TEST_F(PlannerTest, MulticastReplicatesToEveryRegion) {
    MulticastDirectPlanner planner(2, 4, costs_);
    std::vector<ObjectStoreEndpoint> dsts = {
        {kUsWest, "w"}, {kEuWest, "e"}, {kApSouth, "p"}};
    auto plan =
        planner.Plan({Job(kUsEast, "a", dsts), Job(kUsEast, "b", dsts)});
    ASSERT_TRUE(plan.has_value());

    // Gateways are provisioned once per region, not once per job.
    for (const RegionTag& region : {kUsEast, kUsWest, kEuWest, kApSouth}) {
        EXPECT_EQ(plan->GetRegionGateways(region).size(), 2u) << region;
    }
    EXPECT_EQ(plan->dest_region_tags(),
              (std::vector<RegionTag>{kUsWest, kEuWest, kApSouth}));

    const GatewayProgram* src_program = plan->GetGatewayProgram(kUsEast);
    ASSERT_NE(src_program, nullptr);
    for (PartitionId partition : {0, 1}) {
        auto roots = src_program->GetRoots(partition);
        ASSERT_EQ(roots.size(), 1u);
        auto read_children =
            Children(*src_program, *src_program->GetOperator(roots[0]));
        ASSERT_EQ(read_children.size(), 1u);
        ASSERT_EQ(read_children[0]->type(), OperatorType::MUX_AND);

        auto mux_ors = Children(*src_program, *read_children[0]);
        ASSERT_EQ(mux_ors.size(), 3u);
        std::set<RegionTag> reached;
        for (const Operator* mux_or : mux_ors) {
            ASSERT_EQ(mux_or->type(), OperatorType::MUX_OR);
            auto sends = Children(*src_program, *mux_or);
            ASSERT_EQ(sends.size(), 2u);
            const RegionTag& region = sends[0]->as<SendOp>()->region;
            reached.insert(region);
            std::set<GatewayId> targets;
            for (const Operator* send : sends) {
                EXPECT_EQ(send->as<SendOp>()->region, region);
                targets.insert(send->as<SendOp>()->target_gateway_id);
            }
            std::set<GatewayId> expected;
            for (const auto& gateway : plan->GetRegionGateways(region)) {
                expected.insert(gateway.gateway_id);
            }
            EXPECT_EQ(targets, expected);
        }
        EXPECT_EQ(reached, (std::set<RegionTag>{kUsWest, kEuWest, kApSouth}));
    }
}

TEST_F(PlannerTest, MulticastDestinationProgramsUsePerDestinationPrefix) {
    MulticastDirectPlanner planner(1, 4, costs_);
    auto plan = planner.Plan({Job(kUsEast, "a",
                                  {{kEuWest, "eu"}, {kApSouth, "ap"}},
                                  {"eu-copy/", "ap-copy/"})});
    ASSERT_TRUE(plan.has_value());

    const GatewayProgram* eu = plan->GetGatewayProgram(kEuWest);
    ASSERT_NE(eu, nullptr);
    ASSERT_EQ(eu->size(), 2u);
    const auto* write = eu->GetOperator(1)->as<WriteObjectStoreOp>();
    ASSERT_NE(write, nullptr);
    EXPECT_EQ(write->bucket_name, "eu");
    EXPECT_EQ(write->key_prefix, std::optional<std::string>("eu-copy/"));

    const GatewayProgram* ap = plan->GetGatewayProgram(kApSouth);
    ASSERT_NE(ap, nullptr);
    write = ap->GetOperator(1)->as<WriteObjectStoreOp>();
    ASSERT_NE(write, nullptr);
    EXPECT_EQ(write->key_prefix, std::optional<std::string>("ap-copy/"));
}

TEST_F(PlannerTest, MulticastRejectsDifferentDestinationSets) {
    MulticastDirectPlanner planner(1, 4, costs_);
    auto plan = planner.Plan(
        {Job(kUsEast, "a", {{kEuWest, "e"}, {kApSouth, "p"}}),
         Job(kUsEast, "b", {{kApSouth, "p"}, {kEuWest, "e"}})});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error(), ErrorCode::PRECONDITION_VIOLATED);
}

TEST_F(PlannerTest, MulticastRejectsRepeatedRegionInJob) {
    MulticastDirectPlanner planner(1, 4, costs_);
    auto plan =
        planner.Plan({Job(kUsEast, "a", {{kEuWest, "e1"}, {kEuWest, "e2"}})});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error(), ErrorCode::PRECONDITION_VIOLATED);

    plan = planner.Plan({Job(kUsEast, "a", {{kUsEast, "same"}})});
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error(), ErrorCode::PRECONDITION_VIOLATED);
}

TEST_F(PlannerTest, PlansPassValidationAndIsolatePartitions) {
    std::vector<ObjectStoreEndpoint> dsts = {{kEuWest, "e"}, {kApSouth, "p"}};
    auto plan = MulticastDirectPlanner(3, 2, costs_)
                    .Plan({Job(kUsEast, "a", dsts), Job(kUsEast, "b", dsts),
                           Job(kUsEast, "c", dsts)});
    ASSERT_TRUE(plan.has_value());
    EXPECT_TRUE(plan->Validate().has_value());

    for (const auto& region : plan->GetRegions()) {
        const GatewayProgram* program = plan->GetGatewayProgram(region);
        ASSERT_NE(program, nullptr);
        for (const auto& op : program->GetOperators()) {
            for (auto child : op.children) {
                EXPECT_EQ(program->GetOperator(child)->partition_id,
                          op.partition_id);
            }
        }
    }
}

TEST_F(PlannerTest, UnimplementedStrategies) {
    std::vector<TransferJob> jobs = {Job(kUsEast, "a", {{kUsWest, "x"}})};
    std::vector<std::unique_ptr<Planner>> planners;
    planners.push_back(std::make_unique<UnicastILPPlanner>(1, 4, 10.0));
    planners.push_back(std::make_unique<MulticastILPPlanner>(1, 4, 10.0));
    planners.push_back(std::make_unique<MulticastMDSTPlanner>(1, 4));
    planners.push_back(std::make_unique<MulticastSteinerTreePlanner>(1, 4));
    for (const auto& planner : planners) {
        auto plan = planner->Plan(jobs);
        ASSERT_FALSE(plan.has_value()) << planner->type();
        EXPECT_EQ(plan.error(), ErrorCode::NOT_IMPLEMENTED) << planner->type();
    }
}

TEST_F(PlannerTest, CreatePlannerBuildsRequestedStrategy) {
    for (PlannerType type :
         {PlannerType::UNICAST_DIRECT, PlannerType::MULTICAST_DIRECT,
          PlannerType::UNICAST_ILP, PlannerType::MULTICAST_ILP,
          PlannerType::MULTICAST_MDST, PlannerType::MULTICAST_STEINER}) {
        PlannerConfig config;
        config.planner_type = type;
        config.required_throughput_gbits = 5.0;
        auto planner = CreatePlanner(config, costs_);
        ASSERT_TRUE(planner.has_value()) << type;
        EXPECT_EQ(planner.value()->type(), type);
    }
}

TEST_F(PlannerTest, CreatePlannerRejectsInvalidConfig) {
    PlannerConfig config;
    config.n_instances = 0;
    EXPECT_EQ(CreatePlanner(config, costs_).error(), ErrorCode::INVALID_PARAMS);

    config = PlannerConfig{};
    config.n_connections = -1;
    EXPECT_EQ(CreatePlanner(config, costs_).error(), ErrorCode::INVALID_PARAMS);

    config = PlannerConfig{};
    config.planner_type = PlannerType::UNICAST_ILP;
    EXPECT_EQ(CreatePlanner(config, costs_).error(), ErrorCode::INVALID_PARAMS);

    EXPECT_EQ(CreatePlanner(PlannerConfig{}, nullptr).error(),
              ErrorCode::INVALID_PARAMS);
}

}  // namespace skyrelay

int main(int argc, char **argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
