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

#ifndef SKYRELAY_OBJSTORE_LOCAL_OBJECT_STORE_H
#define SKYRELAY_OBJSTORE_LOCAL_OBJECT_STORE_H

#include <filesystem>
#include <mutex>
#include <unordered_map>

#include "skyrelay/objstore/object_store_interface.h"

namespace skyrelay {

/**
 * @brief Directory-backed object store: objects live at
 *        <root>/<bucket>/<key>, in-flight multipart uploads under
 *        <root>/.multipart/<upload_id>/. Region tag is "local:<name>".
 *        last_modified is left empty in listings.
 */
class LocalObjectStore : public ObjectStoreInterface {
   public:
    LocalObjectStore(std::string root, std::string bucket_name,
                     std::string region_name = "default");

    RegionTag GetRegionTag() const override {
        return MakeRegionTag("local", region_name_);
    }

    const std::string& GetBucketName() const override { return bucket_name_; }

    tl::expected<bool, ErrorCode> BucketExists() override;

    tl::expected<void, ErrorCode> CreateBucket() override;

    tl::expected<bool, ErrorCode> Exists(const std::string& key) override;

    tl::expected<uint64_t, ErrorCode> GetObjectSize(
        const std::string& key) override;

    std::unique_ptr<ObjectLister> ListObjects(
        const std::string& prefix) override;

    tl::expected<void, ErrorCode> DeleteObjects(
        const std::vector<std::string>& keys) override;

    tl::expected<void, ErrorCode> DownloadObject(
        const std::string& key, const std::string& file_path,
        std::optional<uint64_t> offset = std::nullopt,
        std::optional<uint64_t> count = std::nullopt) override;

    tl::expected<void, ErrorCode> UploadObject(const std::string& file_path,
                                               const std::string& key) override;

    tl::expected<std::string, ErrorCode> InitiateMultipartUpload(
        const std::string& key, const std::string& content_type) override;

    tl::expected<UploadPartResult, ErrorCode> UploadPart(
        const std::string& file_path, const std::string& key,
        const std::string& upload_id, uint64_t offset, uint64_t count,
        int32_t part_number) override;

    tl::expected<void, ErrorCode> FinalizeMultipartUpload(
        const std::string& key, const std::string& upload_id,
        std::vector<UploadPartResult> parts) override;

   private:
    std::filesystem::path BucketPath() const { return root_ / bucket_name_; }

    std::filesystem::path ObjectPath(const std::string& key) const {
        return BucketPath() / key;
    }

    std::filesystem::path StagingPath(const std::string& upload_id) const {
        return root_ / ".multipart" / upload_id;
    }

    // INVALID_PARAMS for an empty, absolute or ".."-bearing key, then
    // BUCKET_NOT_FOUND unless the bucket directory exists.
    tl::expected<void, ErrorCode> CheckKey(const std::string& key) const;

    const std::filesystem::path root_;
    const std::string bucket_name_;
    const std::string region_name_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::string> uploads_;  // id -> key
};

}  // namespace skyrelay

#endif  // SKYRELAY_OBJSTORE_LOCAL_OBJECT_STORE_H
