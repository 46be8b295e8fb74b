#include "lsink/common/errors.h"
#include "lsink/encoder/chunked-reader.h"
#include "lsink/encoder/encode-executor.h"
#include "lsink/pool/worker-pool.h"

#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace lsink;
using lsink::common::Record;
using lsink::common::RecordKind;

namespace {

common::RecordBatch
make_batch(const std::string& prefix, size_t count)
{
    std::vector<Record> records;
    records.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        Record r;
        r.set("event_id", prefix + "-" + std::to_string(i));
        r.set("event_type", std::string("created"));
        records.push_back(std::move(r));
    }
    return common::make_batch(std::move(records));
}

}  // namespace

class EncodeExecutorTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        test_dir_ = boost::filesystem::temp_directory_path() /
            boost::filesystem::unique_path("encode_exec_%%%%%%");
        boost::filesystem::create_directories(test_dir_);
    }

    void
    TearDown() override
    {
        boost::filesystem::remove_all(test_dir_);
    }

    pool::Job
    job(const std::string& name, common::RecordBatch records) const
    {
        pool::Job j;
        j.kind = pool::JobKind::ENCODE;
        j.record_kind = RecordKind::EVENTS;
        j.output_path = (test_dir_ / "nested" / "dir" / name).string();
        j.records = std::move(records);
        j.config.chunk_size = 1000;
        j.config.compression_level = 1;
        return j;
    }

    boost::filesystem::path test_dir_;
};

TEST_F(EncodeExecutorTest, ThreeJobsOnTwoWorkers)
{
    auto executor = std::make_shared<encoder::EncodeExecutor>();
    pool::PoolOptions options;
    options.name = "encode";
    options.max_workers = 2;
    pool::WorkerPool workers(executor, options);

    std::vector<std::future<pool::JobResult>> futures;
    for (int i = 0; i < 3; ++i)
    {
        std::string name = "events-" + std::to_string(i) + ".pb.zst";
        futures.push_back(
            workers.submit(job(name, make_batch("j" + std::to_string(i), 2500))));
    }

    for (int i = 0; i < 3; ++i)
    {
        auto result = futures[i].get();
        EXPECT_TRUE(result.ok);
        EXPECT_EQ(result.record_count, 2500u);
        EXPECT_EQ(result.chunks_written, 3u);
        EXPECT_EQ(
            encoder::count_records(result.output_path, RecordKind::EVENTS),
            2500u);
    }
    workers.shutdown();

    auto stats = workers.get_stats();
    EXPECT_EQ(stats.total_jobs, 3u);
    EXPECT_EQ(stats.completed_jobs, 3u);
    EXPECT_EQ(stats.failed_jobs, 0u);
    EXPECT_EQ(stats.total_records, 7500u);
    EXPECT_LE(stats.peak_active, 2u);

    size_t files = 0;
    for (auto& entry : boost::filesystem::directory_iterator(
             test_dir_ / "nested" / "dir"))
    {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 3u);
}

TEST_F(EncodeExecutorTest, RejectsContractsAndWrongKind)
{
    encoder::EncodeExecutor executor;

    auto contracts = job("c.pb.zst", make_batch("c", 1));
    contracts.record_kind = RecordKind::CONTRACTS;
    EXPECT_THROW(executor.execute(contracts), InvalidJobError);

    auto materialize = job("m.pb.zst", make_batch("m", 1));
    materialize.kind = pool::JobKind::MATERIALIZE;
    EXPECT_THROW(executor.execute(materialize), InvalidJobError);
}

TEST_F(EncodeExecutorTest, ReportsSkippedRecords)
{
    std::vector<Record> records = {
        Record{{"event_id", std::string("a")}},
        Record{{"event_type", std::string("no-id")}},
        Record{{"event_id", std::string("b")}}};

    encoder::EncodeExecutor executor;
    auto result =
        executor.execute(job("s.pb.zst", common::make_batch(std::move(records))));
    EXPECT_EQ(result.record_count, 2u);
    EXPECT_EQ(result.records_skipped, 1u);
    EXPECT_GT(result.original_bytes, 0u);
    EXPECT_EQ(
        result.bytes_written, boost::filesystem::file_size(result.output_path));
}
