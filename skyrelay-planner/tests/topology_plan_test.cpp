#include "skyrelay/planner/topology_plan.h"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <set>

namespace skyrelay {

class TopologyPlanTest : public ::testing::Test {
   protected:
    static constexpr const char* kSrc = "aws:us-east-1";
    static constexpr const char* kDst = "aws:us-west-2";
    static constexpr const char* kOther = "aws:eu-west-1";

    void SetUp() override {
        google::InitGoogleLogging("TopologyPlanTest");
        FLAGS_logtostderr = 1;
    }

    void TearDown() override { google::ShutdownGoogleLogging(); }

    // Read -> Send towards target in target_region.
    static GatewayProgram SendingProgram(const GatewayId& target,
                                         const RegionTag& target_region) {
        GatewayProgram program;
        auto read =
            program.AddOperator(ReadObjectStoreOp{"bucketA", kSrc, 4}, 0);
        EXPECT_TRUE(read.has_value());
        EXPECT_TRUE(program
                        .AddOperator(SendOp{target, target_region, 4}, 0,
                                     read.value())
                        .has_value());
        return program;
    }

    static GatewayProgram WritingProgram() {
        GatewayProgram program;
        auto receive = program.AddOperator(ReceiveOp{}, 0);
        EXPECT_TRUE(receive.has_value());
        EXPECT_TRUE(program
                        .AddOperator(WriteObjectStoreOp{"bucketB", kDst, 4,
                                                        std::nullopt},
                                     0, receive.value())
                        .has_value());
        return program;
    }
};

TEST_F(TopologyPlanTest, DestinationRegionsAreDeduplicated) {
    TopologyPlan plan(kSrc, {kDst, kOther, kDst});
    EXPECT_EQ(plan.src_region_tag(), kSrc);
    EXPECT_EQ(plan.dest_region_tags(),
              (std::vector<RegionTag>{kDst, kOther}));
    EXPECT_DOUBLE_EQ(plan.cost_per_gb(), 0.0);
}

TEST_F(TopologyPlanTest, GatewayIdsCountUpAcrossRegions) {
    TopologyPlan plan(kSrc, {kDst});
    std::set<GatewayId> ids;
    ids.insert(plan.AddGateway(kSrc).gateway_id);
    ids.insert(plan.AddGateway(kDst).gateway_id);
    ids.insert(plan.AddGateway(kSrc).gateway_id);
    EXPECT_EQ(ids.size(), 3u);

    const auto& src_gateways = plan.GetRegionGateways(kSrc);
    ASSERT_EQ(src_gateways.size(), 2u);
    EXPECT_EQ(src_gateways[0].gateway_id, "aws:us-east-1/0");
    EXPECT_EQ(src_gateways[1].gateway_id, "aws:us-east-1/2");
    EXPECT_EQ(plan.GetRegionGateways(kDst)[0].gateway_id, "aws:us-west-2/1");
    EXPECT_TRUE(plan.GetRegionGateways(kOther).empty());

    const Gateway* found = plan.FindGateway("aws:us-west-2/1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->region_tag, kDst);
    EXPECT_EQ(plan.FindGateway("aws:us-west-2/7"), nullptr);
    EXPECT_EQ(plan.GetGateways().size(), 3u);
}

TEST_F(TopologyPlanTest, ValidPlan) {
    TopologyPlan plan(kSrc, {kDst});
    plan.AddGateway(kSrc);
    const GatewayId target = plan.AddGateway(kDst).gateway_id;
    plan.SetGatewayProgram(kSrc, SendingProgram(target, kDst));
    plan.SetGatewayProgram(kDst, WritingProgram());
    EXPECT_TRUE(plan.Validate().has_value());
    EXPECT_EQ(plan.GetRegions(), (std::vector<RegionTag>{kSrc, kDst}));
}

TEST_F(TopologyPlanTest, ProgramWithoutGatewayIsInvalid) {
    TopologyPlan plan(kSrc, {kDst});
    const GatewayId target = plan.AddGateway(kDst).gateway_id;
    plan.SetGatewayProgram(kSrc, SendingProgram(target, kDst));
    plan.SetGatewayProgram(kDst, WritingProgram());
    EXPECT_EQ(plan.Validate().error(), ErrorCode::INVALID_PLAN);
}

TEST_F(TopologyPlanTest, SendToMissingGatewayIsInvalid) {
    TopologyPlan plan(kSrc, {kDst});
    plan.AddGateway(kSrc);
    plan.AddGateway(kDst);
    plan.SetGatewayProgram(kSrc, SendingProgram("aws:us-west-2/99", kDst));
    EXPECT_EQ(plan.Validate().error(), ErrorCode::INVALID_PLAN);
}

TEST_F(TopologyPlanTest, SendWithWrongRegionIsInvalid) {
    TopologyPlan plan(kSrc, {kDst});
    plan.AddGateway(kSrc);
    const GatewayId target = plan.AddGateway(kDst).gateway_id;
    plan.SetGatewayProgram(kSrc, SendingProgram(target, kOther));
    EXPECT_EQ(plan.Validate().error(), ErrorCode::INVALID_PLAN);
}

TEST_F(TopologyPlanTest, RegionDocument) {
    TopologyPlan plan(kSrc, {kDst});
    plan.AddGateway(kSrc);
    plan.AddGateway(kDst);
    plan.AddGateway(kDst);
    plan.SetGatewayProgram(kDst, WritingProgram());

    auto document = plan.GetRegionDocument(kDst);
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ((*document)["region_tag"].asString(), kDst);
    const Json::Value& ids = (*document)["gateway_ids"];
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0].asString(), "aws:us-west-2/1");
    EXPECT_EQ(ids[1].asString(), "aws:us-west-2/2");
    const Json::Value& program = (*document)["program"];
    ASSERT_TRUE(program.isArray());
    ASSERT_EQ(program.size(), 2u);
    EXPECT_EQ(program[0]["op_type"].asString(), "receive");

    // A region with gateways but no program gets an empty program.
    auto src_document = plan.GetRegionDocument(kSrc);
    ASSERT_TRUE(src_document.has_value());
    EXPECT_TRUE((*src_document)["program"].isArray());
    EXPECT_EQ((*src_document)["program"].size(), 0u);

    EXPECT_EQ(plan.GetRegionDocument(kOther).error(),
              ErrorCode::GATEWAY_NOT_FOUND);
}

TEST_F(TopologyPlanTest, PlanJson) {
    TopologyPlan plan(kSrc, {kDst, kDst});
    plan.AddGateway(kSrc);
    const GatewayId target = plan.AddGateway(kDst).gateway_id;
    plan.SetGatewayProgram(kSrc, SendingProgram(target, kDst));
    plan.SetGatewayProgram(kDst, WritingProgram());
    plan.AddCostPerGb(0.02);
    plan.AddCostPerGb(0.03);

    Json::Value value = plan.toJson();
    EXPECT_EQ(value["src_region_tag"].asString(), kSrc);
    ASSERT_EQ(value["dest_region_tags"].size(), 1u);
    EXPECT_EQ(value["dest_region_tags"][0].asString(), kDst);
    EXPECT_DOUBLE_EQ(value["cost_per_gb"].asDouble(), 0.05);
    const Json::Value& regions = value["regions"];
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0]["region_tag"].asString(), kSrc);
    EXPECT_EQ(regions[1]["region_tag"].asString(), kDst);
    EXPECT_FALSE(plan.toString().empty());
}

}  // namespace skyrelay

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
