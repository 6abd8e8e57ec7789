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

#include "skyrelay/objstore/object_store_interface.h"

#include <glog/logging.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace skyrelay {

tl::expected<void, ErrorCode> CheckPartNumber(int32_t part_number) {
    if (part_number < kMinPartNumber || part_number > kMaxPartNumber) {
        LOG(ERROR) << "UploadPart: part_number=" << part_number
                   << ", error=part_number_out_of_range";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    return {};
}

bool RangeWithin(uint64_t offset, uint64_t count, uint64_t size) {
    return offset <= size && count <= size - offset;
}

void SortUploadParts(std::vector<UploadPartResult>* parts) {
    std::sort(parts->begin(), parts->end(),
              [](const UploadPartResult& a, const UploadPartResult& b) {
                  return a.part_number < b.part_number;
              });
}

tl::expected<void, ErrorCode> WriteFileRange(const std::string& file_path,
                                             uint64_t offset,
                                             const std::string& data) {
    if (!std::filesystem::exists(file_path)) {
        std::ofstream create(file_path, std::ios::binary);
        if (!create) {
            LOG(ERROR) << "WriteFileRange: path=" << file_path
                       << ", error=create_failed";
            return tl::make_unexpected(ErrorCode::FILE_OPEN_FAIL);
        }
    }
    std::fstream file(file_path,
                      std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        LOG(ERROR) << "WriteFileRange: path=" << file_path
                   << ", error=open_failed";
        return tl::make_unexpected(ErrorCode::FILE_OPEN_FAIL);
    }
    file.seekp(static_cast<std::streamoff>(offset));
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        LOG(ERROR) << "WriteFileRange: path=" << file_path
                   << ", offset=" << offset << ", size=" << data.size()
                   << ", error=write_failed";
        return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
    }
    return {};
}

tl::expected<std::string, ErrorCode> ReadFileRange(
    const std::string& file_path, uint64_t offset, uint64_t count) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        LOG(ERROR) << "ReadFileRange: path=" << file_path
                   << ", error=open_failed";
        return tl::make_unexpected(ErrorCode::FILE_OPEN_FAIL);
    }
    std::error_code ec;
    const uint64_t size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        LOG(ERROR) << "ReadFileRange: path=" << file_path
                   << ", error=" << ec.message();
        return tl::make_unexpected(ErrorCode::FILE_READ_FAIL);
    }
    if (!RangeWithin(offset, count, size)) {
        LOG(ERROR) << "ReadFileRange: path=" << file_path
                   << ", offset=" << offset << ", count=" << count
                   << ", size=" << size << ", error=range_out_of_bounds";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    std::string data(count, '\0');
    file.seekg(static_cast<std::streamoff>(offset));
    file.read(data.data(), static_cast<std::streamsize>(count));
    if (static_cast<uint64_t>(file.gcount()) != count) {
        LOG(ERROR) << "ReadFileRange: path=" << file_path
                   << ", offset=" << offset << ", expected=" << count
                   << ", actual=" << file.gcount() << ", error=short_read";
        return tl::make_unexpected(ErrorCode::FILE_READ_FAIL);
    }
    return data;
}

}  // namespace skyrelay
