#pragma once

#include "lsink/common/record.h"
#include "lsink/common/upload-result.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lsink::pool {

enum class JobKind { ENCODE, MATERIALIZE };

struct JobConfig
{
    /** Records per binary frame */
    size_t chunk_size = 2000;

    /** zstd level for frames and parquet */
    int compression_level = 1;

    /** Rows per parquet row group */
    size_t row_group_size = 100000;
};

/**
 * One unit of pool work: write `records` to `output_path`. When
 * `remote_path` is set and the executor delivers, the file is uploaded from
 * the same worker after it is written.
 */
struct Job
{
    JobKind kind = JobKind::ENCODE;
    common::RecordKind record_kind = common::RecordKind::EVENTS;
    std::string output_path;
    common::RecordBatch records;
    JobConfig config;
    std::optional<std::string> remote_path;
};

// Post-write validation findings. Data, not an exception.
struct ValidationReport
{
    bool valid = true;
    int64_t row_count = 0;
    std::vector<std::string> issues;
};

struct JobResult
{
    bool ok = true;
    std::string output_path;
    uint64_t record_count = 0;
    uint64_t bytes_written = 0;
    uint64_t original_bytes = 0;
    uint64_t chunks_written = 0;
    uint64_t records_skipped = 0;
    std::optional<ValidationReport> validation;
    std::optional<common::UploadResult> delivery;
};

std::string_view
to_string(JobKind kind);

}  // namespace lsink::pool
