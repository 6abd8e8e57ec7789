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

#include "skyrelay/planner/transfer_job.h"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <unordered_map>

namespace skyrelay {

namespace {

tl::expected<void, ErrorCode> CheckEndpoint(const ObjectStoreEndpoint& ep) {
    if (ep.bucket.empty()) {
        LOG(ERROR) << "TransferJob: region=" << ep.region_tag
                   << ", error=empty_bucket_name";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    auto parts = ParseRegionTag(ep.region_tag);
    if (!parts) {
        LOG(ERROR) << "TransferJob: region=" << ep.region_tag
                   << ", error=malformed_region_tag";
        return tl::make_unexpected(parts.error());
    }
    return {};
}

struct YamlEndpoint {
    ObjectStoreEndpoint endpoint;
    std::string prefix;
};

tl::expected<YamlEndpoint, ErrorCode> ReadEndpoint(const YAML::Node& node) {
    if (!node.IsMap() || !node["region"] || !node["bucket"]) {
        LOG(ERROR) << "LoadTransferJobs: endpoint needs region and bucket";
        return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
    }
    YamlEndpoint result;
    result.endpoint.region_tag = node["region"].as<std::string>();
    result.endpoint.bucket = node["bucket"].as<std::string>();
    if (node["prefix"]) result.prefix = node["prefix"].as<std::string>();
    return result;
}

}  // namespace

tl::expected<TransferJob, ErrorCode> TransferJob::Create(
    ObjectStoreEndpoint src, std::string src_prefix,
    std::vector<ObjectStoreEndpoint> dsts,
    std::vector<std::string> dst_prefixes) {
    if (dsts.empty()) {
        LOG(ERROR) << "TransferJob: src=" << src
                   << ", error=no_destination";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    if (dst_prefixes.empty()) {
        dst_prefixes.assign(dsts.size(), src_prefix);
    } else if (dst_prefixes.size() != dsts.size()) {
        LOG(ERROR) << "TransferJob: src=" << src
                   << ", destinations=" << dsts.size()
                   << ", prefixes=" << dst_prefixes.size()
                   << ", error=prefix_count_mismatch";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    auto checked = CheckEndpoint(src);
    if (!checked) return tl::make_unexpected(checked.error());
    for (const auto& dst : dsts) {
        checked = CheckEndpoint(dst);
        if (!checked) return tl::make_unexpected(checked.error());
    }

    TransferJob job;
    job.src_ = std::move(src);
    job.src_prefix_ = std::move(src_prefix);
    job.dsts_ = std::move(dsts);
    job.dst_prefixes_ = std::move(dst_prefixes);
    return job;
}

std::vector<RegionTag> TransferJob::dst_region_tags() const {
    std::vector<RegionTag> tags;
    tags.reserve(dsts_.size());
    for (const auto& dst : dsts_) {
        tags.push_back(dst.region_tag);
    }
    return tags;
}

tl::expected<std::vector<TransferJob>, ErrorCode> LoadTransferJobs(
    const std::string& yaml_path) {
    if (!std::filesystem::exists(yaml_path)) {
        LOG(ERROR) << "LoadTransferJobs: path=" << yaml_path
                   << ", error=file_not_found";
        return tl::make_unexpected(ErrorCode::FILE_NOT_FOUND);
    }

    std::vector<TransferJob> jobs;
    try {
        YAML::Node root = YAML::LoadFile(yaml_path);
        if (!root.IsSequence()) {
            LOG(ERROR) << "LoadTransferJobs: path=" << yaml_path
                       << ", error=top_level_not_a_list";
            return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
        }
        for (const auto& node : root) {
            if (!node["src"] || !node["dst"] || !node["dst"].IsSequence()) {
                LOG(ERROR) << "LoadTransferJobs: path=" << yaml_path
                           << ", error=job_needs_src_and_dst_list";
                return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
            }
            auto src = ReadEndpoint(node["src"]);
            if (!src) return tl::make_unexpected(src.error());

            std::vector<ObjectStoreEndpoint> dsts;
            std::vector<std::string> dst_prefixes;
            for (const auto& dst_node : node["dst"]) {
                auto dst = ReadEndpoint(dst_node);
                if (!dst) return tl::make_unexpected(dst.error());
                dsts.push_back(dst->endpoint);
                dst_prefixes.push_back(dst_node["prefix"] ? dst->prefix
                                                          : src->prefix);
            }
            auto job = TransferJob::Create(src->endpoint, src->prefix,
                                           std::move(dsts),
                                           std::move(dst_prefixes));
            if (!job) return tl::make_unexpected(job.error());
            jobs.push_back(std::move(job.value()));
        }
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "LoadTransferJobs: path=" << yaml_path
                   << ", error=" << e.what();
        return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
    }
    LOG(INFO) << "Loaded " << jobs.size() << " transfer jobs from "
              << yaml_path;
    return jobs;
}

tl::expected<ObjectStorePath, ErrorCode> ParseObjectStorePath(
    const std::string& path) {
    static const std::unordered_map<std::string, std::string> kSchemes = {
        {"s3", "aws"}, {"gs", "gcp"}, {"azure", "azure"}, {"local", "local"}};

    auto scheme_end = path.find("://");
    if (scheme_end == std::string::npos) {
        LOG(ERROR) << "ParseObjectStorePath: path=" << path
                   << ", error=missing_scheme";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    auto it = kSchemes.find(path.substr(0, scheme_end));
    if (it == kSchemes.end()) {
        LOG(ERROR) << "ParseObjectStorePath: path=" << path
                   << ", error=unknown_scheme";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }

    std::string rest = path.substr(scheme_end + 3);
    auto slash = rest.find('/');
    ObjectStorePath result;
    result.provider = it->second;
    result.bucket = rest.substr(0, slash);
    result.key = slash == std::string::npos ? "" : rest.substr(slash + 1);
    if (result.bucket.empty()) {
        LOG(ERROR) << "ParseObjectStorePath: path=" << path
                   << ", error=missing_bucket";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    return result;
}

}  // namespace skyrelay
