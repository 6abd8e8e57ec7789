#include "skyrelay/objstore/local_object_store.h"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>

#include "skyrelay/objstore/object_store_factory.h"

namespace fs = std::filesystem;

namespace skyrelay {

class LocalObjectStoreTest : public ::testing::Test {
   protected:
    void SetUp() override {
        google::InitGoogleLogging("LocalObjectStoreTest");
        FLAGS_logtostderr = 1;
        const std::string name =
            ::testing::UnitTest::GetInstance()->current_test_info()->name();
        root_ = fs::temp_directory_path() / ("skyrelay_objstore_test_" + name);
        fs::remove_all(root_);
        fs::create_directories(root_ / "scratch");
        store_ = std::make_unique<LocalObjectStore>(root_.string(), "bucket",
                                                    "test");
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(root_);
        google::ShutdownGoogleLogging();
    }

    std::string Scratch(const std::string& name) const {
        return (root_ / "scratch" / name).string();
    }

    std::string WriteScratch(const std::string& name,
                             const std::string& body) const {
        auto path = Scratch(name);
        std::ofstream out(path, std::ios::binary);
        out << body;
        return path;
    }

    static std::string ReadAll(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    }

    std::set<std::string> ListKeys(const std::string& prefix) {
        std::set<std::string> keys;
        auto lister = store_->ListObjects(prefix);
        ObjectStoreObject object;
        while (true) {
            auto more = lister->Next(&object);
            EXPECT_TRUE(more.has_value());
            if (!more.has_value() || !more.value()) break;
            EXPECT_EQ(object.bucket, "bucket");
            keys.insert(object.key);
        }
        return keys;
    }

    fs::path root_;
    std::unique_ptr<LocalObjectStore> store_;
};

TEST_F(LocalObjectStoreTest, BucketLifecycle) {
    EXPECT_EQ(store_->GetRegionTag(), "local:test");
    EXPECT_EQ(store_->Endpoint(),
              (ObjectStoreEndpoint{"local:test", "bucket"}));
    EXPECT_FALSE(store_->BucketExists().value());
    ASSERT_TRUE(store_->CreateBucket().has_value());
    EXPECT_TRUE(store_->BucketExists().value());
    // Creating again is a no-op.
    EXPECT_TRUE(store_->CreateBucket().has_value());
}

TEST_F(LocalObjectStoreTest, MissingBucketOrObject) {
    EXPECT_EQ(store_->Exists("k").error(), ErrorCode::BUCKET_NOT_FOUND);
    EXPECT_EQ(store_->UploadObject(WriteScratch("f", "x"), "k").error(),
              ErrorCode::BUCKET_NOT_FOUND);
    ObjectStoreObject object;
    EXPECT_EQ(store_->ListObjects("")->Next(&object).error(),
              ErrorCode::BUCKET_NOT_FOUND);

    ASSERT_TRUE(store_->CreateBucket().has_value());
    EXPECT_FALSE(store_->Exists("k").value());
    EXPECT_EQ(store_->GetObjectSize("k").error(), ErrorCode::OBJECT_NOT_FOUND);
    EXPECT_EQ(store_->DownloadObject("k", Scratch("out")).error(),
              ErrorCode::OBJECT_NOT_FOUND);
    EXPECT_EQ(store_->Exists("").error(), ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(store_->UploadObject(Scratch("absent"), "k").error(),
              ErrorCode::FILE_NOT_FOUND);
}

TEST_F(LocalObjectStoreTest, UploadAndDownload) {
    ASSERT_TRUE(store_->CreateBucket().has_value());
    const std::string body = "0123456789abcdef";
    ASSERT_TRUE(
        store_->UploadObject(WriteScratch("src", body), "dir/obj").has_value());
    EXPECT_TRUE(store_->Exists("dir/obj").value());
    EXPECT_EQ(store_->GetObjectSize("dir/obj").value(), body.size());

    ASSERT_TRUE(store_->DownloadObject("dir/obj", Scratch("full")).has_value());
    EXPECT_EQ(ReadAll(Scratch("full")), body);
}

TEST_F(LocalObjectStoreTest, RangedDownloadLandsAtOffset) {
    ASSERT_TRUE(store_->CreateBucket().has_value());
    const std::string body = "0123456789abcdef";
    ASSERT_TRUE(
        store_->UploadObject(WriteScratch("src", body), "obj").has_value());

    // Two chunks fetched out of order reassemble the object.
    const std::string out = Scratch("chunked");
    ASSERT_TRUE(store_->DownloadObject("obj", out, 8, 8).has_value());
    ASSERT_TRUE(store_->DownloadObject("obj", out, 0, 8).has_value());
    EXPECT_EQ(ReadAll(out), body);

    EXPECT_EQ(store_->DownloadObject("obj", out, 10, 10).error(),
              ErrorCode::INVALID_PARAMS);
}

TEST_F(LocalObjectStoreTest, HugeRangesAreRejected) {
    ASSERT_TRUE(store_->CreateBucket().has_value());
    auto src = WriteScratch("src", "0123456789");
    ASSERT_TRUE(store_->UploadObject(src, "obj").has_value());

    // offset + count wraps to zero.
    EXPECT_EQ(store_->DownloadObject("obj", Scratch("out"), 1, UINT64_MAX)
                  .error(),
              ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(store_->DownloadObject("obj", Scratch("out"), UINT64_MAX, 2)
                  .error(),
              ErrorCode::INVALID_PARAMS);

    auto upload_id = store_->InitiateMultipartUpload("big", "").value();
    EXPECT_EQ(
        store_->UploadPart(src, "big", upload_id, 1, UINT64_MAX, 1).error(),
        ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(store_->UploadPart(src, "big", upload_id, 8, 4, 1).error(),
              ErrorCode::INVALID_PARAMS);
    EXPECT_TRUE(store_->UploadPart(src, "big", upload_id, 8, 2, 1).has_value());
}

TEST_F(LocalObjectStoreTest, KeysCannotEscapeBucket) {
    ASSERT_TRUE(store_->CreateBucket().has_value());
    auto src = WriteScratch("src", "data");
    for (const char* key : {"../other/escaped", "a/../../escaped", "/etc/x"}) {
        EXPECT_EQ(store_->UploadObject(src, key).error(),
                  ErrorCode::INVALID_PARAMS)
            << key;
        EXPECT_EQ(store_->Exists(key).error(), ErrorCode::INVALID_PARAMS)
            << key;
        EXPECT_EQ(store_->InitiateMultipartUpload(key, "").error(),
                  ErrorCode::INVALID_PARAMS)
            << key;
    }
    EXPECT_FALSE(fs::exists(root_ / "other"));
    EXPECT_FALSE(fs::exists(root_ / "escaped"));
    // Dots inside a name are fine.
    EXPECT_TRUE(store_->UploadObject(src, "a/..b/c..").has_value());
}

TEST_F(LocalObjectStoreTest, ListByPrefixAndDelete) {
    ASSERT_TRUE(store_->CreateBucket().has_value());
    auto src = WriteScratch("src", "data");
    for (const char* key : {"logs/a", "logs/b", "logs/nested/c", "other"}) {
        ASSERT_TRUE(store_->UploadObject(src, key).has_value()) << key;
    }
    EXPECT_EQ(ListKeys("logs/"),
              (std::set<std::string>{"logs/a", "logs/b", "logs/nested/c"}));
    EXPECT_EQ(ListKeys("").size(), 4u);
    EXPECT_TRUE(ListKeys("missing/").empty());

    ASSERT_TRUE(store_->DeleteObjects({"logs/a", "other", "never-existed"})
                    .has_value());
    EXPECT_EQ(ListKeys(""),
              (std::set<std::string>{"logs/b", "logs/nested/c"}));
}

TEST_F(LocalObjectStoreTest, DeleteManyKeysAcrossBatches) {
    ASSERT_TRUE(store_->CreateBucket().has_value());
    auto src = WriteScratch("src", "x");
    std::vector<std::string> keys;
    for (size_t i = 0; i < kMaxDeleteBatch + 5; ++i) {
        keys.push_back("k" + std::to_string(i));
    }
    for (size_t i = 0; i < keys.size(); i += 200) {
        ASSERT_TRUE(store_->UploadObject(src, keys[i]).has_value());
    }
    ASSERT_TRUE(store_->DeleteObjects(keys).has_value());
    EXPECT_TRUE(ListKeys("").empty());
}

TEST_F(LocalObjectStoreTest, MultipartUploadAcceptsPartsInAnyOrder) {
    ASSERT_TRUE(store_->CreateBucket().has_value());
    const std::string body = "aaaabbbbcc";
    auto src = WriteScratch("src", body);

    auto upload_id =
        store_->InitiateMultipartUpload("big", "application/octet-stream");
    ASSERT_TRUE(upload_id.has_value());

    std::vector<UploadPartResult> parts;
    auto part3 = store_->UploadPart(src, "big", upload_id.value(), 8, 2, 3);
    auto part1 = store_->UploadPart(src, "big", upload_id.value(), 0, 4, 1);
    auto part2 = store_->UploadPart(src, "big", upload_id.value(), 4, 4, 2);
    ASSERT_TRUE(part1.has_value() && part2.has_value() && part3.has_value());
    EXPECT_EQ(part3->part_number, 3);
    parts = {part3.value(), part1.value(), part2.value()};

    ASSERT_TRUE(store_->FinalizeMultipartUpload("big", upload_id.value(), parts)
                    .has_value());
    ASSERT_TRUE(store_->DownloadObject("big", Scratch("out")).has_value());
    EXPECT_EQ(ReadAll(Scratch("out")), body);
    EXPECT_FALSE(fs::exists(root_ / ".multipart" / upload_id.value()));

    // The upload id is consumed by completion.
    EXPECT_EQ(store_->FinalizeMultipartUpload("big", upload_id.value(), parts)
                  .error(),
              ErrorCode::INVALID_PARAMS);
}

TEST_F(LocalObjectStoreTest, MultipartUploadRejectsBadParts) {
    ASSERT_TRUE(store_->CreateBucket().has_value());
    auto src = WriteScratch("src", "aaaabbbb");
    auto upload_id = store_->InitiateMultipartUpload("big", "").value();

    EXPECT_EQ(store_->UploadPart(src, "big", upload_id, 0, 4, 0).error(),
              ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(
        store_->UploadPart(src, "big", upload_id, 0, 4, kMaxPartNumber + 1)
            .error(),
        ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(store_->UploadPart(src, "other", upload_id, 0, 4, 1).error(),
              ErrorCode::INVALID_PARAMS);
    EXPECT_EQ(store_->UploadPart(src, "big", "no-such-upload", 0, 4, 1).error(),
              ErrorCode::INVALID_PARAMS);

    auto part = store_->UploadPart(src, "big", upload_id, 0, 4, 1).value();
    part.etag = "tampered";
    EXPECT_EQ(store_->FinalizeMultipartUpload("big", upload_id, {part}).error(),
              ErrorCode::INVALID_PARAMS);
    EXPECT_FALSE(store_->Exists("big").value());
}

TEST_F(LocalObjectStoreTest, FactoryOpensLocalStores) {
    auto store = CreateObjectStore({"local:test", "bucket"}, root_.string());
    ASSERT_TRUE(store.has_value());
    EXPECT_EQ(store.value()->GetRegionTag(), "local:test");
    EXPECT_EQ(store.value()->GetBucketName(), "bucket");

    EXPECT_EQ(CreateObjectStore({"gcp:us-central1", "b"}, root_.string())
                  .error(),
              ErrorCode::NOT_IMPLEMENTED);
    EXPECT_EQ(CreateObjectStore({"nowhere", "b"}, root_.string()).error(),
              ErrorCode::INVALID_REGION_TAG);
}

TEST_F(LocalObjectStoreTest, PartNumberHelpers) {
    EXPECT_TRUE(CheckPartNumber(kMinPartNumber).has_value());
    EXPECT_TRUE(CheckPartNumber(kMaxPartNumber).has_value());
    EXPECT_EQ(CheckPartNumber(-1).error(), ErrorCode::INVALID_PARAMS);

    std::vector<UploadPartResult> parts = {{3, "c"}, {1, "a"}, {2, "b"}};
    SortUploadParts(&parts);
    EXPECT_EQ(parts[0].etag, "a");
    EXPECT_EQ(parts[2].etag, "c");
}

}  // namespace skyrelay

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
