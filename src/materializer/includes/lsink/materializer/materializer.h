#pragma once

#include "lsink/common/record.h"
#include "lsink/common/tuning.h"
#include "lsink/core/logger.h"
#include "lsink/materializer/columnar-schema.h"
#include "lsink/pool/job.h"

#include <arrow/api.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lsink::materializer {

struct MaterializeOptions
{
    /** zstd level */
    int compression_level = 1;

    /** Rows per row group */
    size_t row_group_size = 100000;

    common::ValidationPolicy policy = common::ValidationPolicy::RECORD;
};

struct MaterializeResult
{
    bool file_written = false;
    uint64_t rows_written = 0;
    uint64_t bytes_written = 0;   // parquet file size
    uint64_t staged_bytes = 0;    // staging JSON-lines size
    pool::ValidationReport validation;
};

/**
 * Writes record sets to Parquet files.
 *
 * Records are staged row-wise as JSON lines beside the output, converted
 * with Arrow's JSON reader against the kind's explicit schema, written with
 * ZSTD compression and then re-read for validation. The staging file is
 * removed on every path.
 */
class Materializer
{
public:
    virtual ~Materializer() = default;

    /**
     * Materialize `records` into `output_path`. An empty record set writes
     * no file and returns a zero result.
     *
     * @throws MaterializeError when staging, conversion or writing fails
     * @throws ValidationFailedError when validation fails under the `fail`
     * policy (the output file is removed first)
     */
    MaterializeResult
    materialize(
        const std::string& output_path,
        common::RecordKind kind,
        const std::vector<common::Record>& records,
        const MaterializeOptions& options);

    /**
     * Check a written file: row count, required columns and a non-null
     * payload within the first 100 rows. Read errors become issues.
     */
    static pool::ValidationReport
    validate(
        const std::string& path,
        const TableSpec& spec,
        int64_t expected_rows);

    // "<dir>/<stem>.staging.jsonl" for "<dir>/<stem>.<ext>"
    static std::string
    staging_path_for(const std::string& output_path);

    static LogPartition&
    get_log_partition();

protected:
    // Convert the staged JSON lines into a table with the table's schema
    virtual std::shared_ptr<arrow::Table>
    read_staging(const std::string& staging_path, const TableSpec& spec);

    virtual void
    write_parquet(
        const arrow::Table& table,
        const std::string& output_path,
        const MaterializeOptions& options);

private:
    uint64_t
    stage(
        const std::string& staging_path,
        const TableSpec& spec,
        const std::vector<common::Record>& records);
};

}  // namespace lsink::materializer
