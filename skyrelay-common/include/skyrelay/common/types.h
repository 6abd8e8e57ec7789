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

#ifndef SKYRELAY_COMMON_TYPES_H
#define SKYRELAY_COMMON_TYPES_H

#include <cstdint>
#include <ostream>
#include <string>
#include <ylt/util/tl/expected.hpp>

namespace skyrelay {

// A provider-qualified cloud region, e.g. "aws:us-east-1".
using RegionTag = std::string;
using GatewayId = std::string;
using PartitionId = int32_t;

static constexpr char kRegionTagDelimiter = ':';

/**
 * @brief Error codes for various operations in the system
 */
enum class ErrorCode : int32_t {
    OK = 0,               ///< Operation successful.
    INTERNAL_ERROR = -1,  ///< Internal error occurred.

    // Planning errors (Range: -100 to -199)
    PRECONDITION_VIOLATED = -100,  ///< Jobs violate the planner's assumptions.
    NOT_IMPLEMENTED = -101,        ///< Planning strategy not implemented.
    INVALID_PLAN = -102,           ///< Produced plan failed validation.

    // Gateway program errors (Range: -200 to -299)
    OPERATOR_NOT_FOUND = -200,  ///< Operator handle not in the program.
    INVALID_OPERATOR = -201,    ///< Operator breaks the tree structure.
    GATEWAY_NOT_FOUND = -202,   ///< Gateway id not provisioned in the plan.

    // Cost errors (Range: -300 to -399)
    INVALID_REGION_TAG = -300,  ///< Region tag malformed or unknown provider.
    COST_LOOKUP_FAIL = -301,    ///< Transfer cost could not be determined.

    // Parameter errors (Range: -600 to -699)
    INVALID_PARAMS = -600,  ///< Invalid parameters.

    // Object errors (Range: -700 to -799)
    OBJECT_NOT_FOUND = -704,  ///< Object not found.

    // Transfer errors (Range: -800 to -899)
    TRANSFER_FAIL = -800,  ///< Transport level failure.

    // Document errors (Range: -900 to -999)
    MALFORMED_DOCUMENT = -900,  ///< Plan or program document is malformed.
    CONFIG_LOAD_FAIL = -901,    ///< Configuration file could not be loaded.

    // FILE errors (Range: -1100 to -1199)
    FILE_NOT_FOUND = -1100,   ///< File not found.
    FILE_OPEN_FAIL = -1101,   ///< Error opening file.
    FILE_READ_FAIL = -1102,   ///< Error reading file.
    FILE_WRITE_FAIL = -1103,  ///< Error writing file.

    BUCKET_NOT_FOUND = -1200,       ///< Bucket not found.
    BUCKET_ALREADY_EXISTS = -1201,  ///< Bucket already exists.
};

int32_t toInt(ErrorCode errorCode) noexcept;
ErrorCode fromInt(int32_t errorCode) noexcept;

const std::string& toString(ErrorCode errorCode) noexcept;

inline std::ostream& operator<<(std::ostream& os,
                                const ErrorCode& errorCode) noexcept {
    return os << toString(errorCode);
}

/**
 * @brief A region tag split into its provider and region parts
 */
struct RegionTagParts {
    std::string provider;
    std::string region;
};

/**
 * @brief Splits "<provider>:<region>".
 * @return INVALID_REGION_TAG if the delimiter is missing or either part is
 *         empty.
 */
tl::expected<RegionTagParts, ErrorCode> ParseRegionTag(const RegionTag& tag);

RegionTag MakeRegionTag(const std::string& provider, const std::string& region);

/**
 * @brief Location of a bucket, as seen by the planner: the region it lives
 *        in and its name.
 */
struct ObjectStoreEndpoint {
    RegionTag region_tag;
    std::string bucket;

    bool operator==(const ObjectStoreEndpoint& other) const {
        return region_tag == other.region_tag && bucket == other.bucket;
    }
    bool operator!=(const ObjectStoreEndpoint& other) const {
        return !(*this == other);
    }
};

inline std::ostream& operator<<(std::ostream& os,
                                const ObjectStoreEndpoint& endpoint) {
    return os << endpoint.region_tag << "/" << endpoint.bucket;
}

}  // namespace skyrelay

#endif  // SKYRELAY_COMMON_TYPES_H
