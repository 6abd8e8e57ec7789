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

#ifndef SKYRELAY_OBJSTORE_OBJECT_STORE_INTERFACE_H
#define SKYRELAY_OBJSTORE_OBJECT_STORE_INTERFACE_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "skyrelay/common/types.h"

namespace skyrelay {

// S3 caps DeleteObjects at 1000 keys per request.
static constexpr size_t kMaxDeleteBatch = 1000;
static constexpr int32_t kMinPartNumber = 1;
static constexpr int32_t kMaxPartNumber = 10000;

struct ObjectStoreObject {
    std::string provider;  // "s3", "local"
    std::string bucket;
    std::string key;
    uint64_t size = 0;
    std::string last_modified;

    std::string full_path() const {
        return provider + "://" + bucket + "/" + key;
    }
};

struct UploadPartResult {
    int32_t part_number = 0;
    std::string etag;
};

// INVALID_PARAMS outside kMinPartNumber..kMaxPartNumber.
tl::expected<void, ErrorCode> CheckPartNumber(int32_t part_number);

// Orders parts by part number, as multipart completion requires.
void SortUploadParts(std::vector<UploadPartResult>* parts);

// Writes data at offset in a local file, creating the file if missing and
// keeping the bytes outside the range.
tl::expected<void, ErrorCode> WriteFileRange(const std::string& file_path,
                                             uint64_t offset,
                                             const std::string& data);

// True when [offset, offset + count) lies inside [0, size). Never overflows.
bool RangeWithin(uint64_t offset, uint64_t count, uint64_t size);

// Reads [offset, offset + count) of a local file. INVALID_PARAMS when the
// range runs past the end of the file.
tl::expected<std::string, ErrorCode> ReadFileRange(
    const std::string& file_path, uint64_t offset, uint64_t count);

/**
 * @brief Pull-style enumeration of the objects under a prefix. Pages are
 *        fetched on demand.
 */
class ObjectLister {
   public:
    virtual ~ObjectLister() = default;

    /**
     * @return true and fills out when an object was produced, false once
     *         the enumeration is exhausted
     */
    virtual tl::expected<bool, ErrorCode> Next(ObjectStoreObject* out) = 0;
};

/**
 * @brief One bucket of a cloud (or local) object store. Implementations
 *        report missing buckets and objects as BUCKET_NOT_FOUND and
 *        OBJECT_NOT_FOUND, distinct from TRANSFER_FAIL.
 */
class ObjectStoreInterface {
   public:
    virtual ~ObjectStoreInterface() = default;

    virtual RegionTag GetRegionTag() const = 0;

    virtual const std::string& GetBucketName() const = 0;

    ObjectStoreEndpoint Endpoint() const {
        return ObjectStoreEndpoint{GetRegionTag(), GetBucketName()};
    }

    virtual tl::expected<bool, ErrorCode> BucketExists() = 0;

    // No-op if the bucket already exists.
    virtual tl::expected<void, ErrorCode> CreateBucket() = 0;

    virtual tl::expected<bool, ErrorCode> Exists(const std::string& key) = 0;

    virtual tl::expected<uint64_t, ErrorCode> GetObjectSize(
        const std::string& key) = 0;

    // Each call starts a fresh enumeration.
    virtual std::unique_ptr<ObjectLister> ListObjects(
        const std::string& prefix) = 0;

    // Issued in batches of at most kMaxDeleteBatch keys.
    virtual tl::expected<void, ErrorCode> DeleteObjects(
        const std::vector<std::string>& keys) = 0;

    /**
     * @brief Copies an object, or the byte range [offset, offset + count)
     *        of it, into a local file. A ranged download lands at the same
     *        offset in the file, which is created if missing, so parallel
     *        ranges can fill one file.
     */
    virtual tl::expected<void, ErrorCode> DownloadObject(
        const std::string& key, const std::string& file_path,
        std::optional<uint64_t> offset = std::nullopt,
        std::optional<uint64_t> count = std::nullopt) = 0;

    virtual tl::expected<void, ErrorCode> UploadObject(
        const std::string& file_path, const std::string& key) = 0;

    virtual tl::expected<std::string, ErrorCode> InitiateMultipartUpload(
        const std::string& key, const std::string& content_type) = 0;

    /**
     * @brief Uploads [offset, offset + count) of a local file as one part.
     * @return INVALID_PARAMS if part_number is outside 1..10000
     */
    virtual tl::expected<UploadPartResult, ErrorCode> UploadPart(
        const std::string& file_path, const std::string& key,
        const std::string& upload_id, uint64_t offset, uint64_t count,
        int32_t part_number) = 0;

    // Parts may be passed in any order.
    virtual tl::expected<void, ErrorCode> FinalizeMultipartUpload(
        const std::string& key, const std::string& upload_id,
        std::vector<UploadPartResult> parts) = 0;
};

}  // namespace skyrelay

#endif  // SKYRELAY_OBJSTORE_OBJECT_STORE_INTERFACE_H
