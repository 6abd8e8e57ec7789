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

#include "skyrelay/common/types.h"

#include <unordered_map>

namespace skyrelay {

const std::string& toString(ErrorCode errorCode) noexcept {
    static const std::unordered_map<ErrorCode, std::string> errorCodeMap = {
        {ErrorCode::OK, "OK"},
        {ErrorCode::INTERNAL_ERROR, "INTERNAL_ERROR"},
        {ErrorCode::PRECONDITION_VIOLATED, "PRECONDITION_VIOLATED"},
        {ErrorCode::NOT_IMPLEMENTED, "NOT_IMPLEMENTED"},
        {ErrorCode::INVALID_PLAN, "INVALID_PLAN"},
        {ErrorCode::OPERATOR_NOT_FOUND, "OPERATOR_NOT_FOUND"},
        {ErrorCode::INVALID_OPERATOR, "INVALID_OPERATOR"},
        {ErrorCode::GATEWAY_NOT_FOUND, "GATEWAY_NOT_FOUND"},
        {ErrorCode::INVALID_REGION_TAG, "INVALID_REGION_TAG"},
        {ErrorCode::COST_LOOKUP_FAIL, "COST_LOOKUP_FAIL"},
        {ErrorCode::INVALID_PARAMS, "INVALID_PARAMS"},
        {ErrorCode::OBJECT_NOT_FOUND, "OBJECT_NOT_FOUND"},
        {ErrorCode::TRANSFER_FAIL, "TRANSFER_FAIL"},
        {ErrorCode::MALFORMED_DOCUMENT, "MALFORMED_DOCUMENT"},
        {ErrorCode::CONFIG_LOAD_FAIL, "CONFIG_LOAD_FAIL"},
        {ErrorCode::FILE_NOT_FOUND, "FILE_NOT_FOUND"},
        {ErrorCode::FILE_OPEN_FAIL, "FILE_OPEN_FAIL"},
        {ErrorCode::FILE_READ_FAIL, "FILE_READ_FAIL"},
        {ErrorCode::FILE_WRITE_FAIL, "FILE_WRITE_FAIL"},
        {ErrorCode::BUCKET_NOT_FOUND, "BUCKET_NOT_FOUND"},
        {ErrorCode::BUCKET_ALREADY_EXISTS, "BUCKET_ALREADY_EXISTS"}};

    auto it = errorCodeMap.find(errorCode);
    static const std::string unknownError = "UNKNOWN_ERROR";
    return (it != errorCodeMap.end()) ? it->second : unknownError;
}

int32_t toInt(ErrorCode errorCode) noexcept {
    return static_cast<int32_t>(errorCode);
}

ErrorCode fromInt(int32_t errorCode) noexcept {
    return static_cast<ErrorCode>(errorCode);
}

tl::expected<RegionTagParts, ErrorCode> ParseRegionTag(const RegionTag& tag) {
    auto pos = tag.find(kRegionTagDelimiter);
    if (pos == std::string::npos || pos == 0 || pos + 1 >= tag.size()) {
        return tl::make_unexpected(ErrorCode::INVALID_REGION_TAG);
    }
    return RegionTagParts{tag.substr(0, pos), tag.substr(pos + 1)};
}

RegionTag MakeRegionTag(const std::string& provider,
                        const std::string& region) {
    return provider + kRegionTagDelimiter + region;
}

}  // namespace skyrelay
