#include "skyrelay/planner/transfer_cost.h"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace skyrelay {

class TransferCostTest : public ::testing::Test {
   protected:
    void SetUp() override {
        google::InitGoogleLogging("TransferCostTest");
        FLAGS_logtostderr = 1;
        const std::string name =
            ::testing::UnitTest::GetInstance()->current_test_info()->name();
        dir_ = std::filesystem::temp_directory_path() /
               ("skyrelay_cost_test_" + name);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
        google::ShutdownGoogleLogging();
    }

    DefaultConfig LoadConfig(const std::string& body) {
        auto path = (dir_ / "config.yaml").string();
        {
            std::ofstream out(path);
            out << body;
        }
        DefaultConfig config;
        config.SetPath(path);
        EXPECT_TRUE(config.Load().has_value());
        return config;
    }

    std::filesystem::path dir_;
};

TEST_F(TransferCostTest, BuiltInRates) {
    EgressPriceTable table;
    EXPECT_DOUBLE_EQ(table.GetTransferCost("aws:us-east-1", "aws:us-west-2")
                         .value(),
                     0.02);
    EXPECT_DOUBLE_EQ(table.GetTransferCost("aws:us-east-1", "gcp:us-central1")
                         .value(),
                     0.09);
    EXPECT_DOUBLE_EQ(table.GetTransferCost("gcp:us-central1", "gcp:us-east1")
                         .value(),
                     0.08);
    EXPECT_DOUBLE_EQ(table.GetTransferCost("azure:westus", "aws:us-east-1")
                         .value(),
                     0.0875);
    EXPECT_DOUBLE_EQ(table.GetTransferCost("local:a", "local:b").value(), 0.0);
    EXPECT_DOUBLE_EQ(table.GetTransferCost("gcp:us-central1", "gcp:us-central1")
                         .value(),
                     0.0);
}

TEST_F(TransferCostTest, PairOverrideWins) {
    EgressPriceTable table;
    table.SetPairCost("aws:us-east-1", "aws:us-west-2", 0.01);
    table.SetProviderRate("aws", {0.03, 0.1});
    EXPECT_DOUBLE_EQ(table.GetTransferCost("aws:us-east-1", "aws:us-west-2")
                         .value(),
                     0.01);
    // Overrides are directional.
    EXPECT_DOUBLE_EQ(table.GetTransferCost("aws:us-west-2", "aws:us-east-1")
                         .value(),
                     0.03);
}

TEST_F(TransferCostTest, RejectsUnknownTags) {
    EgressPriceTable table;
    EXPECT_EQ(table.GetTransferCost("nowhere", "aws:us-east-1").error(),
              ErrorCode::INVALID_REGION_TAG);
    EXPECT_EQ(table.GetTransferCost("ibm:us-south", "aws:us-east-1").error(),
              ErrorCode::INVALID_REGION_TAG);
}

TEST_F(TransferCostTest, LoadFromConfig) {
    EgressPriceTable table;
    auto config = LoadConfig(
        "egress:\n"
        "  gcp:\n"
        "    inter_region: 0.01\n"
        "pairs:\n"
        "  \"aws:us-east-1\":\n"
        "    \"gcp:us-central1\": 0.05\n");
    ASSERT_TRUE(table.LoadFromConfig(config).has_value());
    EXPECT_DOUBLE_EQ(table.GetTransferCost("gcp:a", "gcp:b").value(), 0.01);
    // Untouched fields keep their built-in value.
    EXPECT_DOUBLE_EQ(table.GetTransferCost("gcp:a", "aws:b").value(), 0.12);
    EXPECT_DOUBLE_EQ(table.GetTransferCost("aws:us-east-1", "gcp:us-central1")
                         .value(),
                     0.05);
}

TEST_F(TransferCostTest, UnpricedRateIsLookupFailure) {
    EgressPriceTable table;
    auto config = LoadConfig(
        "egress:\n"
        "  oci:\n"
        "    internet: 0.0085\n");
    ASSERT_TRUE(table.LoadFromConfig(config).has_value());
    EXPECT_DOUBLE_EQ(table.GetTransferCost("oci:a", "aws:b").value(), 0.0085);
    EXPECT_EQ(table.GetTransferCost("oci:a", "oci:b").error(),
              ErrorCode::COST_LOOKUP_FAIL);

    table.SetProviderRate("ibm", EgressRate{0.01, std::nullopt});
    EXPECT_DOUBLE_EQ(table.GetTransferCost("ibm:a", "ibm:b").value(), 0.01);
    EXPECT_EQ(table.GetTransferCost("ibm:a", "gcp:b").error(),
              ErrorCode::COST_LOOKUP_FAIL);
    // A pair override still wins over the missing rate.
    table.SetPairCost("ibm:a", "gcp:b", 0.2);
    EXPECT_DOUBLE_EQ(table.GetTransferCost("ibm:a", "gcp:b").value(), 0.2);
}

TEST_F(TransferCostTest, LoadFromConfigIsAllOrNothing) {
    EgressPriceTable table;
    auto config = LoadConfig(
        "egress:\n"
        "  aws:\n"
        "    inter_region: 0.5\n"
        "  gcp:\n"
        "    internet: -1\n");
    EXPECT_EQ(table.LoadFromConfig(config).error(), ErrorCode::INVALID_PARAMS);
    EXPECT_DOUBLE_EQ(table.GetTransferCost("aws:a", "aws:b").value(), 0.02);

    auto bad_pair = LoadConfig(
        "pairs:\n"
        "  bogus:\n"
        "    \"aws:us-east-1\": 0.05\n");
    EXPECT_EQ(table.LoadFromConfig(bad_pair).error(),
              ErrorCode::INVALID_REGION_TAG);
}

}  // namespace skyrelay

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
