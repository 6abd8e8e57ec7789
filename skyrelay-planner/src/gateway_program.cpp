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

#include "skyrelay/planner/gateway_program.h"

#include <glog/logging.h>

#include <algorithm>
#include <set>
#include <unordered_map>

namespace skyrelay {

tl::expected<OperatorId, ErrorCode> GatewayProgram::AddOperator(
    OperatorPayload payload, PartitionId partition_id,
    std::optional<OperatorId> parent) {
    const OperatorType type = GetOperatorType(payload);
    if (!parent.has_value()) {
        if (!IsSourceOperator(type)) {
            LOG(ERROR) << "AddOperator: op_type=" << type
                       << ", partition_id=" << partition_id
                       << ", error=root_must_be_read_or_receive";
            return tl::make_unexpected(ErrorCode::INVALID_OPERATOR);
        }
    } else {
        if (*parent >= operators_.size()) {
            LOG(ERROR) << "AddOperator: parent=" << *parent
                       << ", error=parent_not_found";
            return tl::make_unexpected(ErrorCode::OPERATOR_NOT_FOUND);
        }
        const Operator& parent_op = operators_[*parent];
        if (IsSourceOperator(type)) {
            LOG(ERROR) << "AddOperator: op_type=" << type
                       << ", parent=" << *parent
                       << ", error=source_operator_cannot_have_parent";
            return tl::make_unexpected(ErrorCode::INVALID_OPERATOR);
        }
        if (IsSinkOperator(parent_op.type())) {
            LOG(ERROR) << "AddOperator: parent=" << *parent
                       << ", parent_type=" << parent_op.type()
                       << ", error=sink_operator_cannot_have_children";
            return tl::make_unexpected(ErrorCode::INVALID_OPERATOR);
        }
        if (parent_op.partition_id != partition_id) {
            LOG(ERROR) << "AddOperator: parent=" << *parent
                       << ", parent_partition=" << parent_op.partition_id
                       << ", partition_id=" << partition_id
                       << ", error=cross_partition_edge";
            return tl::make_unexpected(ErrorCode::INVALID_OPERATOR);
        }
    }

    const OperatorId id = static_cast<OperatorId>(operators_.size());
    Operator op;
    op.id = id;
    op.partition_id = partition_id;
    op.parent = parent;
    op.payload = std::move(payload);
    operators_.push_back(std::move(op));
    if (parent.has_value()) {
        operators_[*parent].children.push_back(id);
    }
    partitions_[partition_id].push_back(id);

    VLOG(1) << "AddOperator: id=" << id << ", op_type=" << type
            << ", partition_id=" << partition_id << ", parent="
            << (parent.has_value() ? std::to_string(*parent) : "none");
    return id;
}

const Operator* GatewayProgram::GetOperator(OperatorId id) const {
    if (id >= operators_.size()) return nullptr;
    return &operators_[id];
}

std::vector<PartitionId> GatewayProgram::GetPartitions() const {
    std::vector<PartitionId> result;
    result.reserve(partitions_.size());
    for (const auto& entry : partitions_) {
        result.push_back(entry.first);
    }
    return result;
}

const std::vector<OperatorId>& GatewayProgram::GetPartitionOperators(
    PartitionId partition_id) const {
    static const std::vector<OperatorId> kEmpty;
    auto it = partitions_.find(partition_id);
    return it == partitions_.end() ? kEmpty : it->second;
}

std::vector<OperatorId> GatewayProgram::GetRoots(
    PartitionId partition_id) const {
    std::vector<OperatorId> roots;
    for (auto id : GetPartitionOperators(partition_id)) {
        if (!operators_[id].parent.has_value()) roots.push_back(id);
    }
    return roots;
}

tl::expected<void, ErrorCode> GatewayProgram::Validate() const {
    for (const auto& op : operators_) {
        const OperatorType type = op.type();
        if (IsSinkOperator(type)) {
            if (!op.children.empty()) {
                LOG(ERROR) << "Validate: id=" << op.id << ", op_type=" << type
                           << ", error=sink_with_children";
                return tl::make_unexpected(ErrorCode::INVALID_PLAN);
            }
            continue;
        }
        if (op.children.empty()) {
            LOG(ERROR) << "Validate: id=" << op.id << ", op_type=" << type
                       << ", error=dangling_operator_without_children";
            return tl::make_unexpected(ErrorCode::INVALID_PLAN);
        }
        for (auto child : op.children) {
            if (child >= operators_.size() ||
                operators_[child].partition_id != op.partition_id ||
                operators_[child].parent != op.id) {
                LOG(ERROR) << "Validate: id=" << op.id << ", child=" << child
                           << ", error=inconsistent_edge";
                return tl::make_unexpected(ErrorCode::INVALID_PLAN);
            }
        }
        if (type != OperatorType::MUX_OR) continue;

        // Every branch of a MuxOr must be an equivalent delivery target.
        const Operator& first = operators_[op.children.front()];
        std::set<GatewayId> targets;
        for (auto child : op.children) {
            const Operator& branch = operators_[child];
            bool equivalent = false;
            if (const auto* send = branch.as<SendOp>()) {
                const auto* first_send = first.as<SendOp>();
                equivalent = first_send && first_send->region == send->region &&
                             targets.insert(send->target_gateway_id).second;
            } else if (const auto* write = branch.as<WriteObjectStoreOp>()) {
                const auto* first_write = first.as<WriteObjectStoreOp>();
                equivalent = first_write &&
                             first_write->bucket_name == write->bucket_name &&
                             first_write->bucket_region == write->bucket_region;
            }
            if (!equivalent) {
                LOG(ERROR) << "Validate: mux_or=" << op.id
                           << ", child=" << child
                           << ", error=non_equivalent_mux_or_branch";
                return tl::make_unexpected(ErrorCode::INVALID_PLAN);
            }
        }
    }
    return {};
}

Json::Value GatewayProgram::toJson() const {
    Json::Value program(Json::arrayValue);
    for (const auto& op : operators_) {
        Json::Value value = op.toJson();
        value["id"] = op.id;
        value["partition_id"] = op.partition_id;
        Json::Value children(Json::arrayValue);
        for (auto child : op.children) {
            children.append(child);
        }
        value["children"] = children;
        program.append(value);
    }
    return program;
}

std::string GatewayProgram::toString() const {
    return toJson().toStyledString();
}

tl::expected<GatewayProgram, ErrorCode> GatewayProgram::FromJson(
    const Json::Value& value) {
    if (!value.isArray()) {
        LOG(ERROR) << "GatewayProgram::FromJson: program is not an array";
        return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
    }

    const size_t count = value.size();
    std::vector<const Json::Value*> by_id(count, nullptr);
    for (const auto& entry : value) {
        if (!entry.isObject() || !entry["id"].isUInt() ||
            !entry["partition_id"].isInt() || !entry["children"].isArray()) {
            LOG(ERROR) << "GatewayProgram::FromJson: malformed operator entry";
            return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
        }
        auto id = entry["id"].asUInt();
        if (id >= count || by_id[id] != nullptr) {
            LOG(ERROR) << "GatewayProgram::FromJson: id=" << id
                       << ", error=ids_not_dense_or_duplicated";
            return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
        }
        by_id[id] = &entry;
    }

    // Children always follow their parent in id order.
    std::unordered_map<OperatorId, OperatorId> parent_of;
    for (OperatorId id = 0; id < count; ++id) {
        for (const auto& child : (*by_id[id])["children"]) {
            if (!child.isUInt() || child.asUInt() >= count ||
                child.asUInt() <= id ||
                !parent_of.emplace(child.asUInt(), id).second) {
                LOG(ERROR) << "GatewayProgram::FromJson: id=" << id
                           << ", error=invalid_child_reference";
                return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
            }
        }
    }

    GatewayProgram program;
    for (OperatorId id = 0; id < count; ++id) {
        const Json::Value& entry = *by_id[id];
        auto payload = OperatorPayloadFromJson(entry);
        if (!payload) {
            return tl::make_unexpected(payload.error());
        }
        std::optional<OperatorId> parent;
        auto it = parent_of.find(id);
        if (it != parent_of.end()) parent = it->second;
        auto added = program.AddOperator(std::move(payload.value()),
                                         entry["partition_id"].asInt(), parent);
        if (!added || added.value() != id) {
            LOG(ERROR) << "GatewayProgram::FromJson: id=" << id
                       << ", error=structural_violation";
            return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
        }
    }
    return program;
}

}  // namespace skyrelay
