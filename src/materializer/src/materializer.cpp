#include "lsink/materializer/materializer.h"
#include "lsink/common/errors.h"

#include <algorithm>
#include <arrow/io/file.h>
#include <arrow/json/api.h>
#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>
#include <parquet/schema.h>

namespace fs = boost::filesystem;

#define LSINK_THROW_IF_NOT_OK(expr, what)                          \
    do                                                             \
    {                                                              \
        ::arrow::Status _s = (expr);                               \
        if (!_s.ok())                                              \
        {                                                          \
            throw ::lsink::MaterializeError(                       \
                std::string(what) + ": " + _s.ToString());         \
        }                                                          \
    } while (0)

namespace lsink::materializer {

namespace {

constexpr int64_t PAYLOAD_SAMPLE_ROWS = 100;

// Rows larger than one block cannot be parsed
constexpr int32_t JSON_BLOCK_SIZE = 16 << 20;

void
remove_quietly(const std::string& path, const char* what)
{
    boost::system::error_code ec;
    fs::remove(path, ec);
    if (ec)
    {
        PLOGW(
            Materializer::get_log_partition(),
            "Could not remove ",
            what,
            " ",
            path,
            ": ",
            ec.message());
    }
}

// Removes the staging file when the materialize call leaves scope
class StagingFile
{
public:
    explicit StagingFile(std::string path) : path_(std::move(path))
    {
    }

    ~StagingFile()
    {
        remove_quietly(path_, "staging file");
    }

    StagingFile(const StagingFile&) = delete;
    StagingFile&
    operator=(const StagingFile&) = delete;

    const std::string&
    path() const
    {
        return path_;
    }

private:
    std::string path_;
};

// Reorder to the schema and add all-null columns the reader did not emit
std::shared_ptr<arrow::Table>
conform(
    const std::shared_ptr<arrow::Table>& table,
    const std::shared_ptr<arrow::Schema>& schema)
{
    std::vector<std::shared_ptr<arrow::ChunkedArray>> columns;
    columns.reserve(schema->num_fields());
    for (const auto& field : schema->fields())
    {
        auto column = table->GetColumnByName(field->name());
        if (!column)
        {
            auto nulls =
                arrow::MakeArrayOfNull(field->type(), table->num_rows());
            if (!nulls.ok())
            {
                throw MaterializeError(
                    "Cannot build null column " + field->name() + ": " +
                    nulls.status().ToString());
            }
            column = std::make_shared<arrow::ChunkedArray>(*nulls);
        }
        columns.push_back(std::move(column));
    }
    return arrow::Table::Make(schema, columns, table->num_rows());
}

}  // namespace

LogPartition&
Materializer::get_log_partition()
{
    static LogPartition partition("MATERIALIZE", LogLevel::INHERIT);
    return partition;
}

std::string
Materializer::staging_path_for(const std::string& output_path)
{
    fs::path p(output_path);
    return (p.parent_path() / (p.stem().string() + ".staging.jsonl")).string();
}

MaterializeResult
Materializer::materialize(
    const std::string& output_path,
    common::RecordKind kind,
    const std::vector<common::Record>& records,
    const MaterializeOptions& options)
{
    MaterializeResult result;
    if (records.empty())
    {
        OLOGD("No records for ", output_path, ", nothing written");
        return result;
    }
    if (options.row_group_size == 0)
    {
        throw MaterializeError("Row group size must be positive");
    }

    const TableSpec& spec = table_spec(kind);

    fs::path parent = fs::path(output_path).parent_path();
    if (!parent.empty())
    {
        boost::system::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
        {
            throw MaterializeError(
                "Failed to create directory " + parent.string() + ": " +
                ec.message());
        }
    }

    std::shared_ptr<arrow::Table> table;
    {
        StagingFile staging(staging_path_for(output_path));
        try
        {
            result.staged_bytes = stage(staging.path(), spec, records);
            table = read_staging(staging.path(), spec);
            write_parquet(*table, output_path, options);
        }
        catch (const LedgerSinkError&)
        {
            remove_quietly(output_path, "partial output");
            throw;
        }
        catch (const std::exception& e)
        {
            remove_quietly(output_path, "partial output");
            throw MaterializeError(
                "Failed to materialize " + output_path + ": " + e.what());
        }
    }

    result.file_written = true;
    result.rows_written = static_cast<uint64_t>(table->num_rows());
    boost::system::error_code ec;
    auto size = fs::file_size(output_path, ec);
    result.bytes_written = ec ? 0 : size;

    result.validation =
        validate(output_path, spec, static_cast<int64_t>(records.size()));

    if (!result.validation.valid)
    {
        for (const auto& issue : result.validation.issues)
        {
            OLOGW("Validation issue in ", output_path, ": ", issue);
        }
        if (options.policy == common::ValidationPolicy::FAIL)
        {
            remove_quietly(output_path, "invalid output");
            throw ValidationFailedError(
                "Validation failed for " + output_path + ": " +
                result.validation.issues.front());
        }
    }

    OLOGD(
        "Wrote ",
        result.rows_written,
        " ",
        common::to_string(kind),
        " rows to ",
        output_path,
        " (",
        result.bytes_written,
        " bytes)");
    return result;
}

uint64_t
Materializer::stage(
    const std::string& staging_path,
    const TableSpec& spec,
    const std::vector<common::Record>& records)
{
    errno = 0;
    std::ofstream out(staging_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        throw MaterializeError(
            "Failed to open staging file " + staging_path + ": " +
            std::strerror(errno));
    }

    uint64_t bytes = 0;
    for (const auto& record : records)
    {
        std::string line = boost::json::serialize(stage_row(record, spec));
        line.push_back('\n');
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        bytes += line.size();
    }
    out.flush();
    if (!out.good())
    {
        throw MaterializeError(
            "Failed to write staging file " + staging_path + ": " +
            std::strerror(errno));
    }
    return bytes;
}

std::shared_ptr<arrow::Table>
Materializer::read_staging(const std::string& staging_path, const TableSpec& spec)
{
    auto input = arrow::io::ReadableFile::Open(staging_path);
    LSINK_THROW_IF_NOT_OK(input.status(), "Cannot open " + staging_path);

    auto schema = arrow_schema(spec);

    auto read_options = arrow::json::ReadOptions::Defaults();
    read_options.use_threads = false;
    read_options.block_size = JSON_BLOCK_SIZE;

    auto parse_options = arrow::json::ParseOptions::Defaults();
    parse_options.explicit_schema = schema;
    parse_options.unexpected_field_behavior =
        arrow::json::UnexpectedFieldBehavior::Ignore;

    auto reader = arrow::json::TableReader::Make(
        arrow::default_memory_pool(), *input, read_options, parse_options);
    LSINK_THROW_IF_NOT_OK(reader.status(), "Cannot create JSON reader");

    auto table = (*reader)->Read();
    LSINK_THROW_IF_NOT_OK(table.status(), "Cannot convert " + staging_path);

    return conform(*table, schema);
}

void
Materializer::write_parquet(
    const arrow::Table& table,
    const std::string& output_path,
    const MaterializeOptions& options)
{
    auto outfile = arrow::io::FileOutputStream::Open(output_path);
    LSINK_THROW_IF_NOT_OK(
        outfile.status(), "Cannot create output file " + output_path);

    auto writer_props =
        parquet::WriterProperties::Builder()
            .compression(parquet::Compression::ZSTD)
            ->compression_level(options.compression_level)
            ->max_row_group_length(static_cast<int64_t>(options.row_group_size))
            ->build();

    auto arrow_props =
        parquet::ArrowWriterProperties::Builder().store_schema()->build();

    LSINK_THROW_IF_NOT_OK(
        parquet::arrow::WriteTable(
            table,
            arrow::default_memory_pool(),
            *outfile,
            static_cast<int64_t>(options.row_group_size),
            writer_props,
            arrow_props),
        "WriteTable " + output_path);

    // The footer is written on close
    LSINK_THROW_IF_NOT_OK((*outfile)->Close(), "Close " + output_path);
}

pool::ValidationReport
Materializer::validate(
    const std::string& path,
    const TableSpec& spec,
    int64_t expected_rows)
{
    pool::ValidationReport report;
    try
    {
        std::unique_ptr<parquet::arrow::FileReader> reader;
        auto status = parquet::arrow::FileReader::Make(
            arrow::default_memory_pool(),
            parquet::ParquetFileReader::OpenFile(path),
            &reader);
        if (!status.ok())
        {
            report.valid = false;
            report.issues.push_back(
                "Validation read failed: " + status.ToString());
            return report;
        }

        // Row count and schema come from the footer; no row data is read
        auto metadata = reader->parquet_reader()->metadata();
        report.row_count = metadata->num_rows();
        if (report.row_count != expected_rows)
        {
            report.issues.push_back(
                "Row count mismatch: expected " +
                std::to_string(expected_rows) + ", got " +
                std::to_string(report.row_count));
        }

        std::shared_ptr<arrow::Schema> schema;
        status = reader->GetSchema(&schema);
        if (!status.ok())
        {
            report.valid = false;
            report.issues.push_back(
                "Validation schema read failed: " + status.ToString());
            return report;
        }
        for (const auto& column : spec.required)
        {
            if (!schema->GetFieldByName(column))
            {
                report.issues.push_back("Missing required column: " + column);
            }
        }

        int leaf = metadata->schema()->ColumnIndex(spec.payload_column);
        if (report.row_count > 0 && leaf >= 0)
        {
            // Only the payload column, one row group at a time, until the
            // sample is full
            int64_t sample = std::min(report.row_count, PAYLOAD_SAMPLE_ROWS);
            int64_t sampled = 0;
            int64_t nulls = 0;
            for (int group = 0;
                 group < metadata->num_row_groups() && sampled < sample;
                 ++group)
            {
                std::shared_ptr<arrow::Table> slice;
                status = reader->ReadRowGroup(group, {leaf}, &slice);
                if (!status.ok())
                {
                    report.valid = false;
                    report.issues.push_back(
                        "Validation read failed: " + status.ToString());
                    return report;
                }
                int64_t take = std::min(slice->num_rows(), sample - sampled);
                nulls += slice->column(0)->Slice(0, take)->null_count();
                sampled += take;
            }
            if (sampled > 0 && nulls == sampled)
            {
                report.issues.push_back(
                    "Column " + spec.payload_column + " is null in the first " +
                    std::to_string(sampled) + " rows");
            }
        }
    }
    catch (const parquet::ParquetException& e)
    {
        report.issues.push_back(std::string("Validation read failed: ") + e.what());
    }

    report.valid = report.issues.empty();
    return report;
}

}  // namespace lsink::materializer
