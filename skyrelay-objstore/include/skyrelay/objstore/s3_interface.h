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

#ifndef SKYRELAY_OBJSTORE_S3_INTERFACE_H
#define SKYRELAY_OBJSTORE_S3_INTERFACE_H

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>

#include <string>

#include "skyrelay/objstore/object_store_interface.h"

namespace skyrelay {

/**
 * @brief One S3 bucket. Client options come from the environment, read
 *        once by InitAPI: AWS_S3_ENDPOINT, AWS_ACCESS_KEY_ID,
 *        AWS_SECRET_ACCESS_KEY, AWS_USE_VIRTUAL_ADDRESSING,
 *        AWS_CONNECT_TIMEOUT_MS, AWS_REQUEST_TIMEOUT_MS.
 *
 * InitAPI must run before the first S3Interface is built and ShutdownAPI
 * after the last one is gone.
 */
class S3Interface : public ObjectStoreInterface {
   public:
    static void InitAPI();

    static void ShutdownAPI();

   private:
    static bool aws_initialized_;
    static Aws::SDKOptions options_;

   public:
    S3Interface(std::string aws_region, std::string bucket_name);

    RegionTag GetRegionTag() const override {
        return MakeRegionTag("aws", aws_region_);
    }

    const std::string& GetBucketName() const override { return bucket_name_; }

    const std::string& GetConnectionInfo() const { return connection_info_; }

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
    const std::string aws_region_;
    const std::string bucket_name_;
    std::string connection_info_;
    Aws::S3::S3Client s3_client_;
};

}  // namespace skyrelay

#endif  // SKYRELAY_OBJSTORE_S3_INTERFACE_H
