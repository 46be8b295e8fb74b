#include "delivery-fixture.h"
#include "lsink/delivery/delivering-executor.h"
#include "lsink/encoder/chunked-reader.h"
#include "lsink/encoder/encode-executor.h"
#include "lsink/delivery/filesystem-remote-store.h"
#include "lsink/pool/worker-pool.h"

using namespace lsink;
using namespace lsink::delivery;
using lsink::common::Record;
using lsink::common::RecordKind;
using lsink::test::FakeRemoteStore;

namespace fs = boost::filesystem;

namespace {

pool::Job
encode_job(const std::string& path, const std::string& remote, size_t count)
{
    std::vector<Record> records;
    for (size_t i = 0; i < count; ++i)
        records.push_back(Record{{"event_id", "e" + std::to_string(i)}});

    pool::Job job;
    job.kind = pool::JobKind::ENCODE;
    job.record_kind = RecordKind::EVENTS;
    job.output_path = path;
    job.records = common::make_batch(std::move(records));
    job.config.chunk_size = 10;
    job.remote_path = remote;
    return job;
}

}  // namespace

class DeliveringExecutorTest : public lsink::test::DeliveryTest
{
};

TEST_F(DeliveringExecutorTest, WrittenFilesAreDeliveredAndRemoved)
{
    auto bucket_root = dir_ / "bucket";
    auto store = std::make_shared<FilesystemRemoteStore>(bucket_root.string());
    auto uploader = std::make_shared<Uploader>(store, log_);
    auto executor = std::make_shared<DeliveringExecutor>(
        std::make_shared<encoder::EncodeExecutor>(), uploader);

    pool::PoolOptions options;
    options.max_workers = 2;
    pool::WorkerPool workers(executor, options);

    std::vector<std::future<pool::JobResult>> futures;
    for (int i = 0; i < 4; ++i)
    {
        std::string name = "events-" + std::to_string(i) + ".pb.zst";
        futures.push_back(workers.submit(encode_job(
            (dir_ / "scratch" / name).string(), "gs://b/raw/" + name, 25)));
    }
    for (auto& f : futures)
    {
        auto result = f.get();
        ASSERT_TRUE(result.delivery);
        EXPECT_TRUE(result.delivery->ok);
        EXPECT_FALSE(fs::exists(result.output_path));
        EXPECT_EQ(
            encoder::count_records(
                store->resolve(result.delivery->remote_path).string(),
                RecordKind::EVENTS),
            25u);
    }
    workers.shutdown();

    EXPECT_EQ(uploader->get_stats().successful_uploads, 4u);
    EXPECT_TRUE(log_->read_all().empty());
}

TEST_F(DeliveringExecutorTest, DeliveryFailureDoesNotFailTheJob)
{
    store_->set_mode(FakeRemoteStore::Mode::CORRUPT);
    DeliveringExecutor executor(
        std::make_shared<encoder::EncodeExecutor>(), uploader_);

    auto result = executor.execute(encode_job(
        (dir_ / "x.pb.zst").string(), "gs://b/raw/x.pb.zst", 3));

    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(result.delivery);
    EXPECT_FALSE(result.delivery->ok);
    EXPECT_FALSE(fs::exists(dir_ / "x.pb.zst"));
    EXPECT_EQ(log_->read_all().size(), 1u);
}

TEST_F(DeliveringExecutorTest, JobsWithoutRemotePathStayLocal)
{
    DeliveringExecutor executor(
        std::make_shared<encoder::EncodeExecutor>(), uploader_);
    auto job = encode_job((dir_ / "local.pb.zst").string(), "", 3);
    job.remote_path.reset();

    auto result = executor.execute(job);
    EXPECT_FALSE(result.delivery);
    EXPECT_TRUE(fs::exists(dir_ / "local.pb.zst"));
    EXPECT_EQ(store_->copies(), 0u);
}
