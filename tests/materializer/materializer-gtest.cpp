#include "lsink/common/errors.h"
#include "lsink/materializer/columnar-schema.h"
#include "lsink/materializer/materialize-executor.h"
#include "lsink/materializer/materializer.h"
#include "lsink/pool/worker-pool.h"

#include <boost/filesystem.hpp>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace lsink;
using namespace lsink::materializer;
using lsink::common::JsonText;
using lsink::common::Record;
using lsink::common::RecordKind;
using lsink::common::StringList;
using lsink::common::Timestamp;

namespace {

std::vector<Record>
make_events(size_t count)
{
    std::vector<Record> records;
    records.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        Record r;
        r.set("event_id", "ev-" + std::to_string(i));
        r.set("event_type", std::string("created"));
        r.set("effective_at", Timestamp{1709622489123});
        r.set("migration_id", int64_t{3});
        r.set("signatories", StringList{"alice"});
        r.set("consuming", false);
        r.set("raw_event", JsonText{R"({"n":)" + std::to_string(i) + "}"});
        r.set("not_a_column", std::string("ignored"));
        records.push_back(std::move(r));
    }
    return records;
}

// Drops the tail of the converted table to simulate a short write
class TruncatingMaterializer : public Materializer
{
public:
    explicit TruncatingMaterializer(int64_t keep) : keep_(keep)
    {
    }

protected:
    std::shared_ptr<arrow::Table>
    read_staging(const std::string& staging_path, const TableSpec& spec)
        override
    {
        return Materializer::read_staging(staging_path, spec)->Slice(0, keep_);
    }

private:
    int64_t keep_;
};

}  // namespace

class MaterializerTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        test_dir_ = boost::filesystem::temp_directory_path() /
            boost::filesystem::unique_path("materializer_%%%%%%");
        boost::filesystem::create_directories(test_dir_);
    }

    void
    TearDown() override
    {
        boost::filesystem::remove_all(test_dir_);
    }

    std::string
    path(const std::string& name) const
    {
        return (test_dir_ / name).string();
    }

    size_t
    file_count() const
    {
        size_t n = 0;
        for (boost::filesystem::recursive_directory_iterator it(test_dir_), end;
             it != end;
             ++it)
        {
            if (boost::filesystem::is_regular_file(it->path()))
                ++n;
        }
        return n;
    }

    boost::filesystem::path test_dir_;
};

TEST_F(MaterializerTest, WritesValidatedParquet)
{
    Materializer materializer;
    auto result = materializer.materialize(
        path("day/events.parquet"), RecordKind::EVENTS, make_events(250), {});

    EXPECT_TRUE(result.file_written);
    EXPECT_EQ(result.rows_written, 250u);
    EXPECT_GT(result.bytes_written, 0u);
    EXPECT_TRUE(result.validation.valid);
    EXPECT_EQ(result.validation.row_count, 250);
    EXPECT_TRUE(result.validation.issues.empty());

    EXPECT_TRUE(boost::filesystem::exists(path("day/events.parquet")));
    EXPECT_FALSE(boost::filesystem::exists(
        Materializer::staging_path_for(path("day/events.parquet"))));
    EXPECT_EQ(file_count(), 1u);
}

TEST_F(MaterializerTest, SmallRowGroupsStillValidate)
{
    MaterializeOptions options;
    options.row_group_size = 7;
    options.compression_level = 3;

    Materializer materializer;
    auto result = materializer.materialize(
        path("u.parquet"),
        RecordKind::UPDATES,
        {Record{
             {"update_id", std::string("u1")},
             {"update_type", std::string("transaction")},
             {"event_count", int64_t{4}},
             {"offset", std::string("17")},
             {"update_data", JsonText{R"({"k":1})"}}},
         Record{
             {"update_id", std::string("u2")},
             {"update_type", std::string("reassignment")},
             {"update_data", JsonText{"{}"}}}},
        options);

    EXPECT_TRUE(result.validation.valid);
    EXPECT_EQ(result.rows_written, 2u);
}

TEST_F(MaterializerTest, PayloadSampleSpansRowGroups)
{
    // Leading rows have no payload; the 10th row of the sample does
    auto records = make_events(30);
    for (size_t i = 0; i < 9; ++i)
        records[i].set("raw_event", std::monostate{});

    MaterializeOptions options;
    options.row_group_size = 4;

    Materializer materializer;
    auto result = materializer.materialize(
        path("groups.parquet"), RecordKind::EVENTS, records, options);

    EXPECT_EQ(result.validation.row_count, 30);
    EXPECT_TRUE(result.validation.valid);
    EXPECT_TRUE(result.validation.issues.empty());
}

TEST_F(MaterializerTest, PayloadSampleStopsAtOneHundredRows)
{
    auto records = make_events(150);
    for (size_t i = 0; i < 100; ++i)
        records[i].set("raw_event", std::monostate{});

    MaterializeOptions options;
    options.row_group_size = 16;

    Materializer materializer;
    auto result = materializer.materialize(
        path("late.parquet"), RecordKind::EVENTS, records, options);

    EXPECT_EQ(result.validation.row_count, 150);
    EXPECT_FALSE(result.validation.valid);
    ASSERT_EQ(result.validation.issues.size(), 1u);
    EXPECT_NE(
        result.validation.issues[0].find("null in the first 100 rows"),
        std::string::npos);
}

TEST_F(MaterializerTest, ShortWriteIsReportedNotFatal)
{
    TruncatingMaterializer materializer(90);
    auto result = materializer.materialize(
        path("short.parquet"), RecordKind::EVENTS, make_events(100), {});

    EXPECT_TRUE(result.file_written);
    EXPECT_EQ(result.rows_written, 90u);
    EXPECT_FALSE(result.validation.valid);
    EXPECT_EQ(result.validation.row_count, 90);
    ASSERT_EQ(result.validation.issues.size(), 1u);
    EXPECT_NE(
        result.validation.issues[0].find("Row count mismatch"),
        std::string::npos);
    EXPECT_TRUE(boost::filesystem::exists(path("short.parquet")));
    EXPECT_FALSE(boost::filesystem::exists(
        Materializer::staging_path_for(path("short.parquet"))));
}

TEST_F(MaterializerTest, FailPolicyRaisesAndRemovesOutput)
{
    MaterializeOptions options;
    options.policy = common::ValidationPolicy::FAIL;

    TruncatingMaterializer materializer(90);
    EXPECT_THROW(
        materializer.materialize(
            path("fail.parquet"), RecordKind::EVENTS, make_events(100), options),
        ValidationFailedError);
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(MaterializerTest, NullPayloadSampleIsAnIssue)
{
    std::vector<Record> records;
    for (int i = 0; i < 5; ++i)
    {
        records.push_back(Record{
            {"contract_id", "c" + std::to_string(i)},
            {"template_id", std::string("pkg:Mod:Ent")}});
    }

    Materializer materializer;
    auto result = materializer.materialize(
        path("contracts.parquet"), RecordKind::CONTRACTS, records, {});

    EXPECT_FALSE(result.validation.valid);
    ASSERT_EQ(result.validation.issues.size(), 1u);
    EXPECT_NE(result.validation.issues[0].find("payload"), std::string::npos);
}

TEST_F(MaterializerTest, EmptyInputWritesNoFile)
{
    Materializer materializer;
    auto result =
        materializer.materialize(path("none.parquet"), RecordKind::EVENTS, {}, {});

    EXPECT_FALSE(result.file_written);
    EXPECT_EQ(result.rows_written, 0u);
    EXPECT_EQ(file_count(), 0u);
}

TEST_F(MaterializerTest, ValidateReportsUnreadableFile)
{
    {
        std::ofstream out(path("junk.parquet"));
        out << "not parquet";
    }
    auto report = Materializer::validate(
        path("junk.parquet"), table_spec(RecordKind::EVENTS), 1);
    EXPECT_FALSE(report.valid);
    ASSERT_FALSE(report.issues.empty());
    EXPECT_NE(
        report.issues[0].find("Validation read failed"), std::string::npos);
}

TEST_F(MaterializerTest, ExecutorFeedsValidationIntoPoolStats)
{
    auto executor = std::make_shared<MaterializeExecutor>(
        common::ValidationPolicy::RECORD,
        std::make_shared<TruncatingMaterializer>(90));

    pool::PoolOptions options;
    options.name = "parquet";
    options.max_workers = 2;
    pool::WorkerPool workers(executor, options);

    pool::Job job;
    job.kind = pool::JobKind::MATERIALIZE;
    job.record_kind = RecordKind::EVENTS;
    job.output_path = path("pooled.parquet");
    job.records = common::make_batch(make_events(100));

    auto result = workers.submit(std::move(job)).get();
    workers.shutdown();

    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(result.validation);
    EXPECT_FALSE(result.validation->valid);

    auto stats = workers.get_stats();
    EXPECT_EQ(stats.completed_jobs, 1u);
    EXPECT_EQ(stats.failed_jobs, 0u);
    EXPECT_EQ(stats.validated_files, 1u);
    EXPECT_EQ(stats.validation_failures, 1u);
    EXPECT_FALSE(stats.validation_issues.empty());
}

TEST(ColumnarSchema, StageRowCoercesAndDropsUnknownFields)
{
    Record r;
    r.set("update_id", int64_t{9});
    r.set("event_count", std::string("12"));
    r.set("offset", std::string("not a number"));
    r.set("root_event_ids", StringList{"a"});
    r.set("update_data", JsonText{R"({"x":[1]})"});
    r.set("extra", std::string("dropped"));

    auto row = stage_row(r, table_spec(RecordKind::UPDATES));
    EXPECT_EQ(row.at("update_id").as_string(), "9");
    EXPECT_EQ(row.at("event_count").as_int64(), 12);
    EXPECT_FALSE(row.contains("offset"));
    EXPECT_EQ(row.at("root_event_ids").as_array().size(), 1u);
    EXPECT_EQ(row.at("update_data").as_string(), R"({"x":[1]})");
    EXPECT_FALSE(row.contains("extra"));
}

TEST(ColumnarSchema, SchemasAreNullableAndCarryRequiredColumns)
{
    for (auto kind :
         {RecordKind::EVENTS, RecordKind::UPDATES, RecordKind::CONTRACTS})
    {
        const auto& spec = table_spec(kind);
        auto schema = arrow_schema(spec);
        for (const auto& field : schema->fields())
        {
            EXPECT_TRUE(field->nullable()) << field->name();
        }
        for (const auto& required : spec.required)
        {
            EXPECT_NE(schema->GetFieldByName(required), nullptr) << required;
        }
    }
    EXPECT_EQ(arrow_schema(table_spec(RecordKind::UPDATES))
                  ->GetFieldByName("event_count")
                  ->type()
                  ->id(),
              arrow::Type::INT32);
}
