#pragma once

#include "lsink/common/partition-path.h"
#include "lsink/common/record.h"
#include "lsink/core/logger.h"
#include "lsink/pool/job.h"
#include "lsink/pool/worker-pool.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace lsink::ingest {

enum class OutputFormat { BINARY, PARQUET };

std::string_view
to_string(OutputFormat format);

std::optional<OutputFormat>
parse_output_format(std::string_view text);

struct IngestOptions
{
    OutputFormat format = OutputFormat::BINARY;

    /** A partition buffer is flushed once it holds this many rows */
    size_t max_rows_per_file = 5000;

    /** A partition buffer older than this is flushed by the timer */
    std::chrono::milliseconds flush_interval{30000};

    /** Local root, files land under <scratch>/<partition>/ */
    std::string scratch_dir = "/tmp/ledger_raw";

    /** When set, jobs carry a remote path under this bucket */
    std::optional<std::string> bucket;

    pool::JobConfig job_config;
};

struct IngestStats
{
    uint64_t records_buffered = 0;
    uint64_t files_submitted = 0;
    uint64_t files_completed = 0;
    uint64_t files_failed = 0;
    uint64_t records_written = 0;
    uint64_t uploads_failed = 0;
};

/**
 * Buffers record batches per (record kind, partition) and turns full or
 * stale buffers into pool jobs.
 *
 * Binary output goes to the encode pool; Parquet output, and contracts in
 * either format, go to the materialize pool. Record order within a buffer
 * is the order records were handed in. Thread safe.
 *
 * close() must be called before the pools shut down: it stops the timer,
 * flushes every buffer and waits for the submitted jobs.
 */
class IngestWriter
{
public:
    using Clock = std::chrono::steady_clock;

    IngestWriter(
        pool::WorkerPool& encode_pool,
        pool::WorkerPool& materialize_pool,
        IngestOptions options);
    ~IngestWriter();

    IngestWriter(const IngestWriter&) = delete;
    IngestWriter&
    operator=(const IngestWriter&) = delete;

    /**
     * Add records of one kind. Each record goes to the buffer of its own
     * partition; buffers reaching max_rows_per_file are flushed at once.
     */
    void
    buffer(common::RecordKind kind, std::vector<common::Record> records);

    // Flush every non-empty buffer; returns the number of jobs submitted
    size_t
    flush_all();

    // Flush buffers whose first record arrived more than flush_interval ago
    size_t
    flush_due(Clock::time_point now);

    // Run flush_due periodically on a background thread until close()
    void
    start_timer();

    // Wait for every submitted job and fold its outcome into the stats
    void
    wait_pending();

    // Stop the timer, flush everything and wait for it. Idempotent.
    void
    close();

    IngestStats
    get_stats() const;

    size_t
    buffered_rows() const;

    static LogPartition&
    get_log_partition();

private:
    using BufferKey = std::pair<common::RecordKind, common::PartitionKey>;

    struct Buffer
    {
        std::vector<common::Record> records;
        Clock::time_point first_arrival;
    };

    struct Pending
    {
        std::string output_path;
        std::future<pool::JobResult> future;
    };

    // Submit `records` as one job. Caller holds mutex_.
    void
    submit_locked(
        const BufferKey& key,
        std::vector<common::Record> records);

    void
    collect(Pending& pending);

    void
    timer_loop();

    pool::WorkerPool& encode_pool_;
    pool::WorkerPool& materialize_pool_;
    IngestOptions options_;
    common::FileNamer namer_;

    mutable std::mutex mutex_;
    std::map<BufferKey, Buffer> buffers_;
    std::vector<Pending> pending_;
    IngestStats stats_;

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    std::thread timer_;
    bool stopping_ = false;
    bool closed_ = false;
};

}  // namespace lsink::ingest
