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

#include "skyrelay/objstore/s3_interface.h"

#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/utils/DateTime.h>
#include <aws/s3/model/BucketLocationConstraint.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CreateBucketConfiguration.h>
#include <aws/s3/model/CreateBucketRequest.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/Delete.h>
#include <aws/s3/model/DeleteObjectsRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/ObjectIdentifier.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>
#include <fmt/format.h>
#include <glog/logging.h>

#include <cstdlib>
#include <sstream>

namespace skyrelay {

namespace {

constexpr int64_t kDefaultS3ConnectTimeoutMs = 10000;
constexpr int64_t kDefaultS3RequestTimeoutMs = 30000;
constexpr int kListPageSize = 1000;

struct S3Env {
    std::string endpoint;
    std::string access_key;
    std::string secret_key;
    bool use_virtual_addressing = true;
    int64_t connect_timeout_ms = kDefaultS3ConnectTimeoutMs;
    int64_t request_timeout_ms = kDefaultS3RequestTimeoutMs;
};

S3Env s3_env;

void AssignStringFromEnv(const char* env_name, std::string& target) {
    const char* env_value = std::getenv(env_name);
    target = (env_value && *env_value) ? env_value : "";
}

void AssignBoolFromEnv(const char* env_name, bool& target) {
    const char* env_value = std::getenv(env_name);
    if (!env_value || !*env_value) return;
    const std::string value(env_value);
    if (value == "1" || value == "true" || value == "TRUE") {
        target = true;
    } else if (value == "0" || value == "false" || value == "FALSE") {
        target = false;
    } else {
        LOG(WARNING) << "Invalid " << env_name << " value: " << value;
    }
}

void AssignTimeoutFromEnv(const char* env_name, int64_t default_value,
                          int64_t& target) {
    target = default_value;
    const char* env_value = std::getenv(env_name);
    if (!env_value || !*env_value) return;
    char* end = nullptr;
    const long long parsed = std::strtoll(env_value, &end, 10);
    if (end && *end == '\0' && parsed > 0) {
        target = parsed;
        return;
    }
    LOG(WARNING) << "Invalid " << env_name << " value: " << env_value;
}

// Missing keys and buckets are told apart from transport failures.
template <typename Outcome>
ErrorCode ToErrorCode(const Outcome& outcome) {
    switch (outcome.GetError().GetErrorType()) {
        case Aws::S3::S3Errors::NO_SUCH_KEY:
        case Aws::S3::S3Errors::RESOURCE_NOT_FOUND:
            return ErrorCode::OBJECT_NOT_FOUND;
        case Aws::S3::S3Errors::NO_SUCH_BUCKET:
            return ErrorCode::BUCKET_NOT_FOUND;
        case Aws::S3::S3Errors::BUCKET_ALREADY_EXISTS:
            return ErrorCode::BUCKET_ALREADY_EXISTS;
        default:
            return ErrorCode::TRANSFER_FAIL;
    }
}

template <typename Outcome>
tl::unexpected<ErrorCode> Fail(const char* op, const std::string& bucket,
                               const std::string& key,
                               const Outcome& outcome) {
    const ErrorCode code = ToErrorCode(outcome);
    LOG(ERROR) << op << ": bucket=" << bucket << ", key=" << key
               << ", error_code=" << code
               << ", error=" << outcome.GetError().GetMessage();
    return tl::make_unexpected(code);
}

bool IsNotFound(ErrorCode code) {
    return code == ErrorCode::OBJECT_NOT_FOUND ||
           code == ErrorCode::BUCKET_NOT_FOUND;
}

class S3ObjectLister : public ObjectLister {
   public:
    // The client must outlive the lister.
    S3ObjectLister(Aws::S3::S3Client& client, std::string bucket,
                   std::string prefix)
        : client_(client),
          bucket_(std::move(bucket)),
          prefix_(std::move(prefix)) {}

    tl::expected<bool, ErrorCode> Next(ObjectStoreObject* out) override {
        while (index_ >= page_.size()) {
            if (done_) return false;
            auto fetched = FetchPage();
            if (!fetched) return tl::make_unexpected(fetched.error());
        }
        const auto& object = page_[index_++];
        out->provider = "s3";
        out->bucket = bucket_;
        out->key = object.GetKey();
        out->size = static_cast<uint64_t>(object.GetSize());
        out->last_modified = object.GetLastModified().ToGmtString(
            Aws::Utils::DateFormat::ISO_8601);
        return true;
    }

   private:
    tl::expected<void, ErrorCode> FetchPage() {
        Aws::S3::Model::ListObjectsV2Request request;
        request.SetBucket(bucket_);
        request.SetPrefix(prefix_);
        request.SetMaxKeys(kListPageSize);
        if (!continuation_token_.empty()) {
            request.SetContinuationToken(continuation_token_);
        }
        auto outcome = client_.ListObjectsV2(request);
        if (!outcome.IsSuccess()) {
            return Fail("ListObjects", bucket_, prefix_, outcome);
        }
        const auto& result = outcome.GetResult();
        page_ = result.GetContents();
        index_ = 0;
        if (result.GetIsTruncated()) {
            continuation_token_ = result.GetNextContinuationToken();
        } else {
            done_ = true;
        }
        return {};
    }

    Aws::S3::S3Client& client_;
    const std::string bucket_;
    const std::string prefix_;
    Aws::Vector<Aws::S3::Model::Object> page_;
    size_t index_ = 0;
    Aws::String continuation_token_;
    bool done_ = false;
};

}  // namespace

bool S3Interface::aws_initialized_ = false;
Aws::SDKOptions S3Interface::options_;

void S3Interface::InitAPI() {
    options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Error;
    Aws::InitAPI(options_);
    aws_initialized_ = true;

    AssignStringFromEnv("AWS_S3_ENDPOINT", s3_env.endpoint);
    AssignStringFromEnv("AWS_ACCESS_KEY_ID", s3_env.access_key);
    AssignStringFromEnv("AWS_SECRET_ACCESS_KEY", s3_env.secret_key);
    AssignBoolFromEnv("AWS_USE_VIRTUAL_ADDRESSING",
                      s3_env.use_virtual_addressing);
    AssignTimeoutFromEnv("AWS_CONNECT_TIMEOUT_MS", kDefaultS3ConnectTimeoutMs,
                         s3_env.connect_timeout_ms);
    AssignTimeoutFromEnv("AWS_REQUEST_TIMEOUT_MS", kDefaultS3RequestTimeoutMs,
                         s3_env.request_timeout_ms);
}

void S3Interface::ShutdownAPI() {
    if (aws_initialized_) {
        Aws::ShutdownAPI(options_);
        aws_initialized_ = false;
    }
}

S3Interface::S3Interface(std::string aws_region, std::string bucket_name)
    : aws_region_(std::move(aws_region)), bucket_name_(std::move(bucket_name)) {
    Aws::Client::ClientConfiguration config;
    config.region = aws_region_;
    config.connectTimeoutMs = s3_env.connect_timeout_ms;
    config.requestTimeoutMs = s3_env.request_timeout_ms;
    if (!s3_env.endpoint.empty()) {
        config.endpointOverride = s3_env.endpoint;
    }

    connection_info_ = fmt::format(
        "S3 client config: region={} endpoint={} bucket={} "
        "connectTimeoutMs={} requestTimeoutMs={} credentials={} "
        "useVirtualAddressing={}",
        aws_region_,
        config.endpointOverride.empty() ? "unset" : config.endpointOverride,
        bucket_name_, config.connectTimeoutMs, config.requestTimeoutMs,
        s3_env.access_key.empty() ? "default_chain" : "env",
        s3_env.use_virtual_addressing ? "true" : "false");
    VLOG(1) << connection_info_;

    if (s3_env.access_key.empty()) {
        s3_client_ = Aws::S3::S3Client(
            config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
            s3_env.use_virtual_addressing);
    } else {
        Aws::Auth::AWSCredentials credentials(s3_env.access_key,
                                              s3_env.secret_key);
        s3_client_ = Aws::S3::S3Client(
            credentials, config,
            Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
            s3_env.use_virtual_addressing);
    }
}

tl::expected<bool, ErrorCode> S3Interface::BucketExists() {
    Aws::S3::Model::HeadBucketRequest request;
    request.SetBucket(bucket_name_);
    auto outcome = s3_client_.HeadBucket(request);
    if (outcome.IsSuccess()) return true;
    if (IsNotFound(ToErrorCode(outcome))) return false;
    return Fail("BucketExists", bucket_name_, "", outcome);
}

tl::expected<void, ErrorCode> S3Interface::CreateBucket() {
    auto exists = BucketExists();
    if (!exists) return tl::make_unexpected(exists.error());
    if (exists.value()) return {};

    Aws::S3::Model::CreateBucketRequest request;
    request.SetBucket(bucket_name_);
    // us-east-1 rejects an explicit location constraint.
    if (aws_region_ != "us-east-1") {
        Aws::S3::Model::CreateBucketConfiguration bucket_config;
        bucket_config.SetLocationConstraint(
            Aws::S3::Model::BucketLocationConstraintMapper::
                GetBucketLocationConstraintForName(aws_region_));
        request.SetCreateBucketConfiguration(bucket_config);
    }
    auto outcome = s3_client_.CreateBucket(request);
    if (!outcome.IsSuccess()) {
        // Lost a creation race against ourselves.
        if (outcome.GetError().GetErrorType() ==
            Aws::S3::S3Errors::BUCKET_ALREADY_OWNED_BY_YOU) {
            return {};
        }
        return Fail("CreateBucket", bucket_name_, "", outcome);
    }
    LOG(INFO) << "Created bucket " << bucket_name_ << " in " << aws_region_;
    return {};
}

tl::expected<bool, ErrorCode> S3Interface::Exists(const std::string& key) {
    auto size = GetObjectSize(key);
    if (size) return true;
    if (size.error() == ErrorCode::OBJECT_NOT_FOUND) return false;
    return tl::make_unexpected(size.error());
}

tl::expected<uint64_t, ErrorCode> S3Interface::GetObjectSize(
    const std::string& key) {
    if (key.empty()) return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(bucket_name_);
    request.SetKey(key);
    auto outcome = s3_client_.HeadObject(request);
    if (!outcome.IsSuccess()) {
        return Fail("GetObjectSize", bucket_name_, key, outcome);
    }
    return static_cast<uint64_t>(outcome.GetResult().GetContentLength());
}

std::unique_ptr<ObjectLister> S3Interface::ListObjects(
    const std::string& prefix) {
    return std::make_unique<S3ObjectLister>(s3_client_, bucket_name_, prefix);
}

tl::expected<void, ErrorCode> S3Interface::DeleteObjects(
    const std::vector<std::string>& keys) {
    for (size_t i = 0; i < keys.size(); i += kMaxDeleteBatch) {
        const size_t end = std::min(i + kMaxDeleteBatch, keys.size());
        Aws::Vector<Aws::S3::Model::ObjectIdentifier> objects;
        for (size_t j = i; j < end; ++j) {
            Aws::S3::Model::ObjectIdentifier obj_id;
            obj_id.SetKey(keys[j]);
            objects.push_back(std::move(obj_id));
        }
        Aws::S3::Model::Delete delete_config;
        delete_config.SetObjects(objects);

        Aws::S3::Model::DeleteObjectsRequest request;
        request.SetBucket(bucket_name_);
        request.SetDelete(delete_config);
        auto outcome = s3_client_.DeleteObjects(request);
        if (!outcome.IsSuccess()) {
            return Fail("DeleteObjects", bucket_name_, keys[i], outcome);
        }
        const auto& errors = outcome.GetResult().GetErrors();
        if (!errors.empty()) {
            for (const auto& error : errors) {
                LOG(ERROR) << "DeleteObjects: bucket=" << bucket_name_
                           << ", key=" << error.GetKey()
                           << ", code=" << error.GetCode()
                           << ", error=" << error.GetMessage();
            }
            return tl::make_unexpected(ErrorCode::TRANSFER_FAIL);
        }
    }
    return {};
}

tl::expected<void, ErrorCode> S3Interface::DownloadObject(
    const std::string& key, const std::string& file_path,
    std::optional<uint64_t> offset, std::optional<uint64_t> count) {
    if (key.empty()) return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    const bool ranged = offset.has_value() && count.has_value();
    if (ranged && *count == 0) {
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }

    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(bucket_name_);
    request.SetKey(key);
    if (ranged) {
        request.SetRange(
            fmt::format("bytes={}-{}", *offset, *offset + *count - 1));
    }
    auto outcome = s3_client_.GetObject(request);
    if (!outcome.IsSuccess()) {
        return Fail("DownloadObject", bucket_name_, key, outcome);
    }
    auto& body = outcome.GetResult().GetBody();

    if (ranged) {
        std::ostringstream data;
        data << body.rdbuf();
        return WriteFileRange(file_path, *offset, data.str());
    }
    Aws::OFStream file_stream(file_path.c_str(),
                              std::ios_base::out | std::ios_base::binary);
    if (!file_stream.is_open()) {
        LOG(ERROR) << "DownloadObject: path=" << file_path
                   << ", error=open_failed";
        return tl::make_unexpected(ErrorCode::FILE_OPEN_FAIL);
    }
    file_stream << body.rdbuf();
    if (file_stream.fail()) {
        LOG(ERROR) << "DownloadObject: path=" << file_path
                   << ", error=write_failed";
        return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
    }
    return {};
}

tl::expected<void, ErrorCode> S3Interface::UploadObject(
    const std::string& file_path, const std::string& key) {
    if (key.empty()) return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    auto input_data = Aws::MakeShared<Aws::FStream>(
        "PutObjectInputStream", file_path.c_str(),
        std::ios_base::in | std::ios_base::binary);
    if (!input_data->is_open()) {
        LOG(ERROR) << "UploadObject: path=" << file_path
                   << ", error=open_failed";
        return tl::make_unexpected(ErrorCode::FILE_OPEN_FAIL);
    }
    Aws::S3::Model::PutObjectRequest request;
    request.SetBucket(bucket_name_);
    request.SetKey(key);
    request.SetBody(input_data);
    auto outcome = s3_client_.PutObject(request);
    if (!outcome.IsSuccess()) {
        return Fail("UploadObject", bucket_name_, key, outcome);
    }
    return {};
}

tl::expected<std::string, ErrorCode> S3Interface::InitiateMultipartUpload(
    const std::string& key, const std::string& content_type) {
    if (key.empty()) return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    Aws::S3::Model::CreateMultipartUploadRequest request;
    request.SetBucket(bucket_name_);
    request.SetKey(key);
    if (!content_type.empty()) request.SetContentType(content_type);
    auto outcome = s3_client_.CreateMultipartUpload(request);
    if (!outcome.IsSuccess()) {
        return Fail("InitiateMultipartUpload", bucket_name_, key, outcome);
    }
    return std::string(outcome.GetResult().GetUploadId());
}

tl::expected<UploadPartResult, ErrorCode> S3Interface::UploadPart(
    const std::string& file_path, const std::string& key,
    const std::string& upload_id, uint64_t offset, uint64_t count,
    int32_t part_number) {
    auto valid = CheckPartNumber(part_number);
    if (!valid) return tl::make_unexpected(valid.error());
    if (key.empty()) return tl::make_unexpected(ErrorCode::INVALID_PARAMS);

    auto data = ReadFileRange(file_path, offset, count);
    if (!data) return tl::make_unexpected(data.error());

    Aws::S3::Model::UploadPartRequest request;
    request.SetBucket(bucket_name_);
    request.SetKey(key);
    request.SetUploadId(upload_id);
    request.SetPartNumber(part_number);
    request.SetContentLength(static_cast<long long>(count));
    auto stream = Aws::MakeShared<Aws::StringStream>("UploadPart");
    stream->write(data->data(), static_cast<std::streamsize>(data->size()));
    request.SetBody(stream);

    auto outcome = s3_client_.UploadPart(request);
    if (!outcome.IsSuccess()) {
        return Fail("UploadPart", bucket_name_, key, outcome);
    }
    return UploadPartResult{part_number,
                            std::string(outcome.GetResult().GetETag())};
}

tl::expected<void, ErrorCode> S3Interface::FinalizeMultipartUpload(
    const std::string& key, const std::string& upload_id,
    std::vector<UploadPartResult> parts) {
    if (key.empty()) return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    SortUploadParts(&parts);

    Aws::S3::Model::CompletedMultipartUpload completed_upload;
    for (const auto& part : parts) {
        Aws::S3::Model::CompletedPart completed;
        completed.SetPartNumber(part.part_number);
        completed.SetETag(part.etag);
        completed_upload.AddParts(std::move(completed));
    }
    Aws::S3::Model::CompleteMultipartUploadRequest request;
    request.SetBucket(bucket_name_);
    request.SetKey(key);
    request.SetUploadId(upload_id);
    request.SetMultipartUpload(completed_upload);
    auto outcome = s3_client_.CompleteMultipartUpload(request);
    if (!outcome.IsSuccess()) {
        return Fail("FinalizeMultipartUpload", bucket_name_, key, outcome);
    }
    return {};
}

}  // namespace skyrelay
