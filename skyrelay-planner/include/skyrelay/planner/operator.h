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

#ifndef SKYRELAY_PLANNER_OPERATOR_H
#define SKYRELAY_PLANNER_OPERATOR_H

#if __has_include(<jsoncpp/json/json.h>)
#include <jsoncpp/json/json.h>  // Ubuntu
#else
#include <json/json.h>  // CentOS
#endif

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "skyrelay/common/types.h"

namespace skyrelay {

using OperatorId = uint32_t;

struct ReadObjectStoreOp {
    std::string bucket_name;
    RegionTag bucket_region;
    uint32_t num_connections = 0;
};

struct WriteObjectStoreOp {
    std::string bucket_name;
    RegionTag bucket_region;
    uint32_t num_connections = 0;
    // Rewrites the object key namespace at this destination.
    std::optional<std::string> key_prefix;
};

struct SendOp {
    GatewayId target_gateway_id;
    RegionTag region;  // region of the target gateway
    uint32_t num_connections = 0;
};

// Accepts any inbound connection for its partition.
struct ReceiveOp {};

// Replicates the partition's stream to every child.
struct MuxAndOp {};

// Delivers the partition's stream to exactly one child, picked by the
// gateway runtime.
struct MuxOrOp {};

// Alternative order must match OperatorType.
using OperatorPayload = std::variant<ReadObjectStoreOp, WriteObjectStoreOp,
                                     SendOp, ReceiveOp, MuxAndOp, MuxOrOp>;

enum class OperatorType : uint8_t {
    READ_OBJECT_STORE = 0,
    WRITE_OBJECT_STORE = 1,
    SEND = 2,
    RECEIVE = 3,
    MUX_AND = 4,
    MUX_OR = 5,
};

std::string_view toString(OperatorType type);

tl::expected<OperatorType, ErrorCode> ParseOperatorType(std::string_view name);

inline std::ostream& operator<<(std::ostream& os, OperatorType type) {
    return os << toString(type);
}

inline OperatorType GetOperatorType(const OperatorPayload& payload) {
    return static_cast<OperatorType>(payload.index());
}

// Roots of a partition tree.
inline bool IsSourceOperator(OperatorType type) {
    return type == OperatorType::READ_OBJECT_STORE ||
           type == OperatorType::RECEIVE;
}

// Leaves of a partition tree.
inline bool IsSinkOperator(OperatorType type) {
    return type == OperatorType::SEND ||
           type == OperatorType::WRITE_OBJECT_STORE;
}

/**
 * @brief One node of a gateway program. Nodes live in the program's arena
 *        and refer to each other by id only.
 */
struct Operator {
    OperatorId id = 0;
    PartitionId partition_id = 0;
    std::optional<OperatorId> parent;
    std::vector<OperatorId> children;
    OperatorPayload payload;

    OperatorType type() const { return GetOperatorType(payload); }

    template <typename T>
    const T* as() const {
        return std::get_if<T>(&payload);
    }

    // Variant fields only; tree links are added by the program.
    Json::Value toJson() const;
};

/**
 * @brief Rebuilds a payload from the "op_type" and variant fields of a
 *        serialized operator.
 * @return MALFORMED_DOCUMENT on unknown op type or missing fields
 */
tl::expected<OperatorPayload, ErrorCode> OperatorPayloadFromJson(
    const Json::Value& value);

}  // namespace skyrelay

#endif  // SKYRELAY_PLANNER_OPERATOR_H
