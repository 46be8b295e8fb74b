#include "delivery-fixture.h"
#include "lsink/delivery/checksum.h"

using namespace lsink;
using namespace lsink::delivery;
using lsink::test::FakeRemoteStore;

namespace fs = boost::filesystem;

class UploaderTest : public lsink::test::DeliveryTest
{
};

TEST_F(UploaderTest, SuccessDeletesLocalAndCountsBytes)
{
    auto local = write_file("a/events.pb.zst", "0123456789");
    auto result = uploader_->upload(local, "gs://b/raw/a/events.pb.zst");

    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.error);
    EXPECT_EQ(result.bytes, 10u);
    EXPECT_EQ(result.local_md5, result.remote_md5);
    EXPECT_EQ(*result.local_md5, md5_base64("0123456789"));
    EXPECT_TRUE(store_->has("gs://b/raw/a/events.pb.zst"));
    EXPECT_FALSE(fs::exists(local));
    EXPECT_TRUE(log_->read_all().empty());

    auto stats = uploader_->get_stats();
    EXPECT_EQ(stats.total_uploads, 1u);
    EXPECT_EQ(stats.successful_uploads, 1u);
    EXPECT_EQ(stats.failed_uploads, 0u);
    EXPECT_EQ(stats.total_bytes_uploaded, 10u);
}

TEST_F(UploaderTest, HashMismatchIsDeadLettered)
{
    store_->set_mode(FakeRemoteStore::Mode::CORRUPT);
    auto local = write_file("x.parquet", "data");
    auto result = uploader_->upload(local, "gs://b/raw/x.parquet");

    EXPECT_FALSE(result.ok);
    ASSERT_TRUE(result.error);
    EXPECT_NE(result.error->find("Hash mismatch"), std::string::npos);
    EXPECT_FALSE(fs::exists(local));

    auto entries = log_->read_all();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].local_path, local);
    EXPECT_EQ(entries[0].remote_path, "gs://b/raw/x.parquet");
    EXPECT_EQ(entries[0].error, *result.error);
    EXPECT_GT(entries[0].timestamp_millis, 0);

    EXPECT_EQ(uploader_->get_stats().failed_uploads, 1u);
}

TEST_F(UploaderTest, MissingRemoteHashIsAFailure)
{
    store_->set_mode(FakeRemoteStore::Mode::NO_HASH);
    auto result =
        uploader_->upload(write_file("y.pb.zst", "abc"), "gs://b/raw/y.pb.zst");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(
        result.error.value_or("").find("Could not retrieve remote hash"),
        std::string::npos);
    EXPECT_EQ(log_->read_all().size(), 1u);
}

TEST_F(UploaderTest, CopyFailureAndTimeoutAreCaptured)
{
    store_->set_mode(FakeRemoteStore::Mode::COPY_FAILS);
    auto first = uploader_->upload(write_file("1.pb.zst", "1"), "gs://b/raw/1.pb.zst");
    store_->set_mode(FakeRemoteStore::Mode::TIMEOUT);
    auto second =
        uploader_->upload(write_file("2.pb.zst", "2"), "gs://b/raw/2.pb.zst");

    EXPECT_FALSE(first.ok);
    EXPECT_NE(first.error.value_or("").find("403"), std::string::npos);
    EXPECT_FALSE(second.ok);
    EXPECT_NE(second.error.value_or("").find("timed out"), std::string::npos);

    EXPECT_EQ(log_->read_all().size(), 2u);
    EXPECT_FALSE(fs::exists(dir_ / "1.pb.zst"));
    EXPECT_FALSE(fs::exists(dir_ / "2.pb.zst"));
}

TEST_F(UploaderTest, MissingLocalFileIsReported)
{
    auto result =
        uploader_->upload((dir_ / "gone.pb.zst").string(), "gs://b/raw/gone.pb.zst");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(
        result.error.value_or("").find("Local file not found"),
        std::string::npos);
    EXPECT_EQ(store_->copies(), 0u);
    EXPECT_EQ(uploader_->get_stats().total_uploads, 1u);
}

TEST_F(UploaderTest, UnrecordableFailureStillDeletesLocalFile)
{
    // A directory where the log file should be cannot be appended to
    fs::create_directories(dir_ / "blocked.jsonl");
    auto blocked_log =
        std::make_shared<DeadLetterLog>((dir_ / "blocked.jsonl").string());
    Uploader uploader(store_, blocked_log);

    store_->set_mode(FakeRemoteStore::Mode::COPY_FAILS);
    auto local = write_file("lost.pb.zst", "lost");
    auto result = uploader.upload(local, "gs://b/raw/lost.pb.zst");

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(fs::exists(local));
    EXPECT_EQ(uploader.get_stats().failed_uploads, 1u);
}

TEST_F(UploaderTest, TransferLeavesLocalFileAndStatsAlone)
{
    auto local = write_file("t.pb.zst", "t");
    auto result = uploader_->transfer(local, "gs://b/raw/t.pb.zst");
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(fs::exists(local));
    EXPECT_EQ(uploader_->get_stats().total_uploads, 0u);
}
