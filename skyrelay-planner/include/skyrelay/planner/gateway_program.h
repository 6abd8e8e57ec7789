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

#ifndef SKYRELAY_PLANNER_GATEWAY_PROGRAM_H
#define SKYRELAY_PLANNER_GATEWAY_PROGRAM_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "skyrelay/planner/operator.h"

namespace skyrelay {

/**
 * @brief The dataflow program executed by every gateway of one region.
 *
 * A forest of operator trees, one or more trees per partition. Operators
 * are stored in a flat arena indexed by OperatorId; tree edges are id lists.
 * Structural rules are enforced when an operator is added:
 * - a root is always a ReadObjectStore or Receive operator, and those never
 *   take a parent;
 * - Send and WriteObjectStore operators never take children;
 * - a parent must already exist and belong to the same partition.
 */
class GatewayProgram {
   public:
    GatewayProgram() = default;

    /**
     * @brief Adds an operator to the program.
     * @param payload Variant-specific fields of the operator
     * @param partition_id Partition the operator belongs to
     * @param parent Parent operator, or nullopt for a tree root
     * @return The new operator's id, OPERATOR_NOT_FOUND if the parent does
     *         not exist, INVALID_OPERATOR if the addition breaks a
     *         structural rule
     */
    tl::expected<OperatorId, ErrorCode> AddOperator(
        OperatorPayload payload, PartitionId partition_id,
        std::optional<OperatorId> parent = std::nullopt);

    const Operator* GetOperator(OperatorId id) const;

    // Ascending partition ids.
    std::vector<PartitionId> GetPartitions() const;

    // Operators of a partition in insertion order; empty if unknown.
    const std::vector<OperatorId>& GetPartitionOperators(
        PartitionId partition_id) const;

    std::vector<OperatorId> GetRoots(PartitionId partition_id) const;

    const std::vector<Operator>& GetOperators() const { return operators_; }

    size_t size() const { return operators_.size(); }

    bool empty() const { return operators_.empty(); }

    /**
     * @brief Checks that every tree is complete: non-sink operators have at
     *        least one child, sinks are leaves, and MuxOr children are
     *        equivalent targets: Sends towards one region with distinct
     *        gateways, or Writes to one bucket.
     * @return INVALID_PLAN on the first violation found
     */
    tl::expected<void, ErrorCode> Validate() const;

    Json::Value toJson() const;

    std::string toString() const;

    /**
     * @brief Rebuilds a program from the array produced by toJson().
     * Operators may appear in any order but ids must be dense from 0.
     * @return MALFORMED_DOCUMENT on any inconsistency
     */
    static tl::expected<GatewayProgram, ErrorCode> FromJson(
        const Json::Value& value);

   private:
    std::vector<Operator> operators_;
    std::map<PartitionId, std::vector<OperatorId>> partitions_;
};

}  // namespace skyrelay

#endif  // SKYRELAY_PLANNER_GATEWAY_PROGRAM_H
