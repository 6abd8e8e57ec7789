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

#include "skyrelay/objstore/local_object_store.h"

#include <fmt/format.h>
#include <glog/logging.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <functional>

namespace fs = std::filesystem;

namespace skyrelay {

namespace {

class LocalObjectLister : public ObjectLister {
   public:
    LocalObjectLister(fs::path bucket_path, std::string bucket_name,
                      std::string prefix)
        : bucket_path_(std::move(bucket_path)),
          bucket_name_(std::move(bucket_name)),
          prefix_(std::move(prefix)) {}

    tl::expected<bool, ErrorCode> Next(ObjectStoreObject* out) override {
        std::error_code ec;
        if (!started_) {
            started_ = true;
            if (!fs::is_directory(bucket_path_, ec)) {
                LOG(ERROR) << "ListObjects: bucket=" << bucket_name_
                           << ", error=bucket_not_found";
                return tl::make_unexpected(ErrorCode::BUCKET_NOT_FOUND);
            }
            it_ = fs::recursive_directory_iterator(bucket_path_, ec);
            if (ec) {
                LOG(ERROR) << "ListObjects: bucket=" << bucket_name_
                           << ", error=" << ec.message();
                return tl::make_unexpected(ErrorCode::FILE_READ_FAIL);
            }
        }
        for (; it_ != fs::recursive_directory_iterator(); it_.increment(ec)) {
            if (ec) {
                LOG(ERROR) << "ListObjects: bucket=" << bucket_name_
                           << ", error=" << ec.message();
                return tl::make_unexpected(ErrorCode::FILE_READ_FAIL);
            }
            if (!it_->is_regular_file()) continue;
            std::string key =
                fs::relative(it_->path(), bucket_path_).generic_string();
            if (key.compare(0, prefix_.size(), prefix_) != 0) continue;

            out->provider = "local";
            out->bucket = bucket_name_;
            out->key = std::move(key);
            out->size = it_->file_size(ec);
            out->last_modified.clear();
            it_.increment(ec);
            return true;
        }
        return false;
    }

   private:
    const fs::path bucket_path_;
    const std::string bucket_name_;
    const std::string prefix_;
    bool started_ = false;
    fs::recursive_directory_iterator it_;
};

std::string ComputeETag(const std::string& data) {
    return fmt::format("{:016x}", std::hash<std::string>{}(data));
}

}  // namespace

LocalObjectStore::LocalObjectStore(std::string root, std::string bucket_name,
                                   std::string region_name)
    : root_(std::move(root)),
      bucket_name_(std::move(bucket_name)),
      region_name_(std::move(region_name)) {}

tl::expected<void, ErrorCode> LocalObjectStore::CheckKey(
    const std::string& key) const {
    if (key.empty()) {
        LOG(ERROR) << "LocalObjectStore: bucket=" << bucket_name_
                   << ", error=empty_object_key";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    // Keys stay inside the bucket directory.
    const fs::path relative(key);
    bool escapes = relative.has_root_path();
    for (const auto& part : relative) {
        if (part == "..") escapes = true;
    }
    if (escapes) {
        LOG(ERROR) << "LocalObjectStore: bucket=" << bucket_name_
                   << ", key=" << key << ", error=key_escapes_bucket";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    std::error_code ec;
    if (!fs::is_directory(BucketPath(), ec)) {
        LOG(ERROR) << "LocalObjectStore: bucket=" << bucket_name_
                   << ", error=bucket_not_found";
        return tl::make_unexpected(ErrorCode::BUCKET_NOT_FOUND);
    }
    return {};
}

tl::expected<bool, ErrorCode> LocalObjectStore::BucketExists() {
    std::error_code ec;
    return fs::is_directory(BucketPath(), ec);
}

tl::expected<void, ErrorCode> LocalObjectStore::CreateBucket() {
    std::error_code ec;
    fs::create_directories(BucketPath(), ec);
    if (ec) {
        LOG(ERROR) << "CreateBucket: path=" << BucketPath()
                   << ", error=" << ec.message();
        return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
    }
    return {};
}

tl::expected<bool, ErrorCode> LocalObjectStore::Exists(
    const std::string& key) {
    auto checked = CheckKey(key);
    if (!checked) return tl::make_unexpected(checked.error());
    std::error_code ec;
    return fs::is_regular_file(ObjectPath(key), ec);
}

tl::expected<uint64_t, ErrorCode> LocalObjectStore::GetObjectSize(
    const std::string& key) {
    auto checked = CheckKey(key);
    if (!checked) return tl::make_unexpected(checked.error());
    std::error_code ec;
    auto size = fs::file_size(ObjectPath(key), ec);
    if (ec) {
        LOG(ERROR) << "GetObjectSize: bucket=" << bucket_name_
                   << ", key=" << key << ", error=object_not_found";
        return tl::make_unexpected(ErrorCode::OBJECT_NOT_FOUND);
    }
    return static_cast<uint64_t>(size);
}

std::unique_ptr<ObjectLister> LocalObjectStore::ListObjects(
    const std::string& prefix) {
    return std::make_unique<LocalObjectLister>(BucketPath(), bucket_name_,
                                               prefix);
}

tl::expected<void, ErrorCode> LocalObjectStore::DeleteObjects(
    const std::vector<std::string>& keys) {
    for (size_t i = 0; i < keys.size(); i += kMaxDeleteBatch) {
        const size_t end = std::min(i + kMaxDeleteBatch, keys.size());
        for (size_t j = i; j < end; ++j) {
            auto checked = CheckKey(keys[j]);
            if (!checked) return checked;
            std::error_code ec;
            // Deleting a missing key succeeds, as on S3.
            fs::remove(ObjectPath(keys[j]), ec);
            if (ec) {
                LOG(ERROR) << "DeleteObjects: bucket=" << bucket_name_
                           << ", key=" << keys[j] << ", error=" << ec.message();
                return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
            }
        }
        VLOG(1) << "DeleteObjects: bucket=" << bucket_name_
                << ", batch_size=" << end - i;
    }
    return {};
}

tl::expected<void, ErrorCode> LocalObjectStore::DownloadObject(
    const std::string& key, const std::string& file_path,
    std::optional<uint64_t> offset, std::optional<uint64_t> count) {
    auto size = GetObjectSize(key);
    if (!size) return tl::make_unexpected(size.error());

    if (!offset.has_value() || !count.has_value()) {
        std::error_code ec;
        fs::copy_file(ObjectPath(key), file_path,
                      fs::copy_options::overwrite_existing, ec);
        if (ec) {
            LOG(ERROR) << "DownloadObject: key=" << key
                       << ", path=" << file_path << ", error=" << ec.message();
            return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
        }
        return {};
    }
    if (!RangeWithin(*offset, *count, size.value())) {
        LOG(ERROR) << "DownloadObject: key=" << key << ", offset=" << *offset
                   << ", count=" << *count << ", size=" << size.value()
                   << ", error=range_out_of_bounds";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    auto data = ReadFileRange(ObjectPath(key).string(), *offset, *count);
    if (!data) return tl::make_unexpected(data.error());
    return WriteFileRange(file_path, *offset, data.value());
}

tl::expected<void, ErrorCode> LocalObjectStore::UploadObject(
    const std::string& file_path, const std::string& key) {
    auto checked = CheckKey(key);
    if (!checked) return checked;
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        LOG(ERROR) << "UploadObject: path=" << file_path
                   << ", error=file_not_found";
        return tl::make_unexpected(ErrorCode::FILE_NOT_FOUND);
    }
    const fs::path target = ObjectPath(key);
    fs::create_directories(target.parent_path(), ec);
    if (!ec) {
        fs::copy_file(file_path, target, fs::copy_options::overwrite_existing,
                      ec);
    }
    if (ec) {
        LOG(ERROR) << "UploadObject: key=" << key << ", path=" << file_path
                   << ", error=" << ec.message();
        return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
    }
    return {};
}

tl::expected<std::string, ErrorCode> LocalObjectStore::InitiateMultipartUpload(
    const std::string& key, const std::string& content_type) {
    auto checked = CheckKey(key);
    if (!checked) return tl::make_unexpected(checked.error());

    boost::uuids::random_generator gen;
    const std::string upload_id = boost::uuids::to_string(gen());
    std::error_code ec;
    fs::create_directories(StagingPath(upload_id), ec);
    if (ec) {
        LOG(ERROR) << "InitiateMultipartUpload: key=" << key
                   << ", error=" << ec.message();
        return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        uploads_[upload_id] = key;
    }
    VLOG(1) << "InitiateMultipartUpload: key=" << key
            << ", content_type=" << content_type
            << ", upload_id=" << upload_id;
    return upload_id;
}

tl::expected<UploadPartResult, ErrorCode> LocalObjectStore::UploadPart(
    const std::string& file_path, const std::string& key,
    const std::string& upload_id, uint64_t offset, uint64_t count,
    int32_t part_number) {
    auto valid = CheckPartNumber(part_number);
    if (!valid) return tl::make_unexpected(valid.error());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end() || it->second != key) {
            LOG(ERROR) << "UploadPart: key=" << key
                       << ", upload_id=" << upload_id
                       << ", error=unknown_upload";
            return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
        }
    }
    auto data = ReadFileRange(file_path, offset, count);
    if (!data) return tl::make_unexpected(data.error());

    const fs::path part_path =
        StagingPath(upload_id) / std::to_string(part_number);
    std::ofstream part(part_path, std::ios::binary | std::ios::trunc);
    part.write(data->data(), static_cast<std::streamsize>(data->size()));
    if (!part) {
        LOG(ERROR) << "UploadPart: path=" << part_path
                   << ", error=write_failed";
        return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
    }
    return UploadPartResult{part_number, ComputeETag(data.value())};
}

tl::expected<void, ErrorCode> LocalObjectStore::FinalizeMultipartUpload(
    const std::string& key, const std::string& upload_id,
    std::vector<UploadPartResult> parts) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end() || it->second != key) {
            LOG(ERROR) << "FinalizeMultipartUpload: key=" << key
                       << ", upload_id=" << upload_id
                       << ", error=unknown_upload";
            return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
        }
    }
    SortUploadParts(&parts);

    std::string contents;
    for (const auto& part : parts) {
        const fs::path part_path =
            StagingPath(upload_id) / std::to_string(part.part_number);
        std::error_code ec;
        const auto size = fs::file_size(part_path, ec);
        if (ec) {
            LOG(ERROR) << "FinalizeMultipartUpload: key=" << key
                       << ", part_number=" << part.part_number
                       << ", error=part_not_uploaded";
            return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
        }
        auto data = ReadFileRange(part_path.string(), 0, size);
        if (!data) return tl::make_unexpected(data.error());
        if (ComputeETag(data.value()) != part.etag) {
            LOG(ERROR) << "FinalizeMultipartUpload: key=" << key
                       << ", part_number=" << part.part_number
                       << ", error=etag_mismatch";
            return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
        }
        contents += data.value();
    }

    const fs::path target = ObjectPath(key);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (ec || !out) {
        LOG(ERROR) << "FinalizeMultipartUpload: key=" << key
                   << ", error=write_failed";
        return tl::make_unexpected(ErrorCode::FILE_WRITE_FAIL);
    }
    out.close();

    fs::remove_all(StagingPath(upload_id), ec);
    if (ec) {
        LOG(WARNING) << "FinalizeMultipartUpload: upload_id=" << upload_id
                     << ", staging cleanup failed: " << ec.message();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    uploads_.erase(upload_id);
    return {};
}

}  // namespace skyrelay
