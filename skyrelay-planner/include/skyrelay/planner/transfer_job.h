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

#ifndef SKYRELAY_PLANNER_TRANSFER_JOB_H
#define SKYRELAY_PLANNER_TRANSFER_JOB_H

#include <string>
#include <vector>

#include "skyrelay/common/types.h"

namespace skyrelay {

/**
 * @brief One logical copy: a source bucket and prefix, and one or more
 *        destination buckets, each with its own key prefix.
 */
class TransferJob {
   public:
    /**
     * @brief Builds a job.
     * @param dst_prefixes Either empty, in which case every destination
     *        reuses src_prefix, or one prefix per destination
     * @return INVALID_PARAMS if there is no destination, the prefix list
     *         length does not match, or a bucket name is empty;
     *         INVALID_REGION_TAG if an endpoint's region tag is malformed
     */
    static tl::expected<TransferJob, ErrorCode> Create(
        ObjectStoreEndpoint src, std::string src_prefix,
        std::vector<ObjectStoreEndpoint> dsts,
        std::vector<std::string> dst_prefixes = {});

    const ObjectStoreEndpoint& src() const { return src_; }

    const std::string& src_prefix() const { return src_prefix_; }

    const std::vector<ObjectStoreEndpoint>& dsts() const { return dsts_; }

    const std::vector<std::string>& dst_prefixes() const {
        return dst_prefixes_;
    }

    std::vector<RegionTag> dst_region_tags() const;

   private:
    TransferJob() = default;

    ObjectStoreEndpoint src_;
    std::string src_prefix_;
    std::vector<ObjectStoreEndpoint> dsts_;
    std::vector<std::string> dst_prefixes_;
};

/**
 * @brief Reads a YAML list of jobs:
 *   - src: {region: "aws:us-east-1", bucket: "a", prefix: "data/"}
 *     dst:
 *       - {region: "aws:us-west-2", bucket: "b", prefix: "copy/"}
 * @return FILE_NOT_FOUND, MALFORMED_DOCUMENT, or any TransferJob::Create
 *         error
 */
tl::expected<std::vector<TransferJob>, ErrorCode> LoadTransferJobs(
    const std::string& yaml_path);

struct ObjectStorePath {
    std::string provider;
    std::string bucket;
    std::string key;
};

/**
 * @brief Splits "<scheme>://<bucket>/<key>". Schemes s3, gs, azure and
 *        local map to providers aws, gcp, azure and local.
 * @return INVALID_PARAMS on unknown scheme or missing bucket
 */
tl::expected<ObjectStorePath, ErrorCode> ParseObjectStorePath(
    const std::string& path);

}  // namespace skyrelay

#endif  // SKYRELAY_PLANNER_TRANSFER_JOB_H
