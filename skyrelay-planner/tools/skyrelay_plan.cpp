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

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "skyrelay/common/default_config.h"
#include "skyrelay/common/environ.h"
#include "skyrelay/objstore/object_store_factory.h"
#include "skyrelay/planner/planner.h"

#ifdef HAVE_AWS_SDK
#include "skyrelay/objstore/s3_interface.h"
#endif

DEFINE_string(jobs, "", "YAML file listing the transfer jobs to plan");
DEFINE_string(config, "",
              "Planner config file (.yaml or .json) with planner.* keys");
DEFINE_string(planner, "unicast_direct",
              "Planner: unicast_direct|multicast_direct|unicast_ilp|"
              "multicast_ilp|multicast_mdst|multicast_steiner");
DEFINE_int32(n_instances, 1, "Gateway instances per region");
DEFINE_int32(n_connections, 32, "Parallel connections per link");
DEFINE_double(required_throughput_gbits, 0.0,
              "Aggregate throughput target, read by ILP planners");
DEFINE_string(cost_config, "",
              "Egress price overrides (.yaml or .json) with egress.* and "
              "pairs.* keys");
DEFINE_string(output_dir, "",
              "If set, write one <region_tag>.json gateway document per "
              "region into this directory");
DEFINE_bool(verify_buckets, false,
            "Check that every source and destination bucket exists before "
            "planning");
DEFINE_string(local_root, "/tmp/skyrelay",
              "Root directory backing local:<name> object stores");

using namespace skyrelay;

namespace {

void InitLogging(const char* argv0) {
    const auto& env = Environ::Get();
    if (env.GetLogLevel() == "WARNING") {
        FLAGS_minloglevel = google::GLOG_WARNING;
    } else if (env.GetLogLevel() == "ERROR") {
        FLAGS_minloglevel = google::GLOG_ERROR;
    } else {
        FLAGS_minloglevel = google::GLOG_INFO;
    }
    if (env.GetLogDir().empty()) {
        FLAGS_logtostderr = 1;
    } else {
        FLAGS_log_dir = env.GetLogDir();
    }
    google::InitGoogleLogging(argv0);
}

bool IsSet(const char* flag) {
    return !gflags::GetCommandLineFlagInfoOrDie(flag).is_default;
}

// Defaults, then SKYRELAY_* variables, then --config, then explicit flags.
tl::expected<PlannerConfig, ErrorCode> ResolvePlannerConfig() {
    auto config = PlannerConfig::FromEnviron();
    if (!config) return config;

    if (!FLAGS_config.empty()) {
        DefaultConfig file;
        file.SetPath(FLAGS_config);
        auto loaded = file.Load();
        if (!loaded) return tl::make_unexpected(loaded.error());
        config = PlannerConfig::LoadFromConfig(file, config.value());
        if (!config) return config;
    }

    if (IsSet("planner")) {
        auto type = ParsePlannerType(FLAGS_planner);
        if (!type) return tl::make_unexpected(type.error());
        config->planner_type = type.value();
    }
    if (IsSet("n_instances")) config->n_instances = FLAGS_n_instances;
    if (IsSet("n_connections")) config->n_connections = FLAGS_n_connections;
    if (IsSet("required_throughput_gbits")) {
        config->required_throughput_gbits = FLAGS_required_throughput_gbits;
    }
    return config;
}

tl::expected<std::shared_ptr<const TransferCostModel>, ErrorCode>
LoadCostModel() {
    auto table = std::make_shared<EgressPriceTable>();
    const std::string path = FLAGS_cost_config.empty()
                                 ? Environ::Get().GetCostConfig()
                                 : FLAGS_cost_config;
    if (!path.empty()) {
        DefaultConfig file;
        file.SetPath(path);
        auto loaded = file.Load();
        if (!loaded) return tl::make_unexpected(loaded.error());
        auto applied = table->LoadFromConfig(file);
        if (!applied) return tl::make_unexpected(applied.error());
    }
    return std::shared_ptr<const TransferCostModel>(std::move(table));
}

tl::expected<void, ErrorCode> VerifyBucket(const ObjectStoreEndpoint& ep) {
    auto store = CreateObjectStore(ep, FLAGS_local_root);
    if (!store) return tl::make_unexpected(store.error());
    auto exists = store.value()->BucketExists();
    if (!exists) return tl::make_unexpected(exists.error());
    if (!exists.value()) {
        LOG(ERROR) << "VerifyBucket: endpoint=" << ep
                   << ", error=bucket_not_found";
        return tl::make_unexpected(ErrorCode::BUCKET_NOT_FOUND);
    }
    return {};
}

tl::expected<void, ErrorCode> VerifyBuckets(
    const std::vector<TransferJob>& jobs) {
    for (const auto& job : jobs) {
        auto result = VerifyBucket(job.src());
        if (!result) return result;
        for (const auto& dst : job.dsts()) {
            result = VerifyBucket(dst);
            if (!result) return result;
        }
    }
    return {};
}

tl::expected<void, ErrorCode> WriteRegionDocuments(const TopologyPlan& plan,
                                                   const std::string& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        LOG(ERROR) << "WriteRegionDocuments: dir=" << dir
                   << ", error=" << ec.message();
        return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
    }
    for (const auto& region_tag : plan.GetRegions()) {
        auto document = plan.GetRegionDocument(region_tag);
        if (!document) return tl::make_unexpected(document.error());
        const auto path =
            std::filesystem::path(dir) / (region_tag + ".json");
        std::ofstream out(path);
        out << document->toStyledString();
        if (!out) {
            LOG(ERROR) << "WriteRegionDocuments: path=" << path
                       << ", error=write_failed";
            return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
        }
        LOG(INFO) << "Wrote gateway document " << path;
    }
    return {};
}

tl::expected<TopologyPlan, ErrorCode> Run() {
    if (FLAGS_jobs.empty()) {
        LOG(ERROR) << "--jobs is required";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    auto jobs = LoadTransferJobs(FLAGS_jobs);
    if (!jobs) return tl::make_unexpected(jobs.error());

    if (FLAGS_verify_buckets) {
        auto verified = VerifyBuckets(jobs.value());
        if (!verified) return tl::make_unexpected(verified.error());
    }

    auto config = ResolvePlannerConfig();
    if (!config) return tl::make_unexpected(config.error());
    auto cost_model = LoadCostModel();
    if (!cost_model) return tl::make_unexpected(cost_model.error());

    auto planner = CreatePlanner(config.value(), cost_model.value());
    if (!planner) return tl::make_unexpected(planner.error());
    auto plan = planner.value()->Plan(jobs.value());
    if (!plan) return plan;

    if (!FLAGS_output_dir.empty()) {
        auto written = WriteRegionDocuments(plan.value(), FLAGS_output_dir);
        if (!written) return tl::make_unexpected(written.error());
    }
    return plan;
}

}  // namespace

int main(int argc, char** argv) {
    gflags::SetUsageMessage(
        "Plans a relay topology for a batch of object-store transfer jobs");
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    InitLogging(argv[0]);

#ifdef HAVE_AWS_SDK
    if (FLAGS_verify_buckets) S3Interface::InitAPI();
#endif
    auto plan = Run();
#ifdef HAVE_AWS_SDK
    if (FLAGS_verify_buckets) S3Interface::ShutdownAPI();
#endif

    if (!plan) {
        LOG(ERROR) << "Planning failed: " << plan.error();
        google::ShutdownGoogleLogging();
        return 1;
    }
    std::cout << plan->toString();
    google::ShutdownGoogleLogging();
    return 0;
}
