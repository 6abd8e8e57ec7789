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

#include "skyrelay/planner/operator.h"

#include <glog/logging.h>

#include <array>

namespace skyrelay {

namespace {

constexpr std::array<std::string_view, 6> kOperatorTypeNames = {
    "read_object_store", "write_object_store", "send",
    "receive",           "mux_and",            "mux_or"};

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

bool HasString(const Json::Value& value, const char* key) {
    return value.isMember(key) && value[key].isString();
}

bool HasUInt(const Json::Value& value, const char* key) {
    return value.isMember(key) && value[key].isUInt();
}

}  // namespace

std::string_view toString(OperatorType type) {
    auto index = static_cast<size_t>(type);
    if (index >= kOperatorTypeNames.size()) return "unknown";
    return kOperatorTypeNames[index];
}

tl::expected<OperatorType, ErrorCode> ParseOperatorType(std::string_view name) {
    for (size_t i = 0; i < kOperatorTypeNames.size(); ++i) {
        if (kOperatorTypeNames[i] == name) {
            return static_cast<OperatorType>(i);
        }
    }
    return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
}

Json::Value Operator::toJson() const {
    Json::Value value(Json::objectValue);
    value["op_type"] = std::string(toString(type()));
    std::visit(overloaded{
                   [&](const ReadObjectStoreOp& op) {
                       value["bucket_name"] = op.bucket_name;
                       value["bucket_region"] = op.bucket_region;
                       value["num_connections"] = op.num_connections;
                   },
                   [&](const WriteObjectStoreOp& op) {
                       value["bucket_name"] = op.bucket_name;
                       value["bucket_region"] = op.bucket_region;
                       value["num_connections"] = op.num_connections;
                       if (op.key_prefix) {
                           value["key_prefix"] = *op.key_prefix;
                       }
                   },
                   [&](const SendOp& op) {
                       value["target_gateway_id"] = op.target_gateway_id;
                       value["region"] = op.region;
                       value["num_connections"] = op.num_connections;
                   },
                   [](const ReceiveOp&) {},
                   [](const MuxAndOp&) {},
                   [](const MuxOrOp&) {},
               },
               payload);
    return value;
}

tl::expected<OperatorPayload, ErrorCode> OperatorPayloadFromJson(
    const Json::Value& value) {
    if (!value.isObject() || !HasString(value, "op_type")) {
        LOG(ERROR) << "OperatorPayloadFromJson: missing op_type";
        return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
    }
    auto type = ParseOperatorType(value["op_type"].asString());
    if (!type) {
        LOG(ERROR) << "OperatorPayloadFromJson: unknown op_type="
                   << value["op_type"].asString();
        return tl::make_unexpected(type.error());
    }

    switch (type.value()) {
        case OperatorType::READ_OBJECT_STORE:
        case OperatorType::WRITE_OBJECT_STORE: {
            if (!HasString(value, "bucket_name") ||
                !HasString(value, "bucket_region") ||
                !HasUInt(value, "num_connections")) {
                break;
            }
            if (type.value() == OperatorType::READ_OBJECT_STORE) {
                return ReadObjectStoreOp{value["bucket_name"].asString(),
                                         value["bucket_region"].asString(),
                                         value["num_connections"].asUInt()};
            }
            WriteObjectStoreOp op{value["bucket_name"].asString(),
                                  value["bucket_region"].asString(),
                                  value["num_connections"].asUInt(),
                                  std::nullopt};
            if (value.isMember("key_prefix")) {
                if (!value["key_prefix"].isString()) break;
                op.key_prefix = value["key_prefix"].asString();
            }
            return op;
        }
        case OperatorType::SEND:
            if (!HasString(value, "target_gateway_id") ||
                !HasString(value, "region") ||
                !HasUInt(value, "num_connections")) {
                break;
            }
            return SendOp{value["target_gateway_id"].asString(),
                          value["region"].asString(),
                          value["num_connections"].asUInt()};
        case OperatorType::RECEIVE:
            return ReceiveOp{};
        case OperatorType::MUX_AND:
            return MuxAndOp{};
        case OperatorType::MUX_OR:
            return MuxOrOp{};
    }
    LOG(ERROR) << "OperatorPayloadFromJson: missing fields for op_type="
               << value["op_type"].asString();
    return tl::make_unexpected(ErrorCode::MALFORMED_DOCUMENT);
}

}  // namespace skyrelay
