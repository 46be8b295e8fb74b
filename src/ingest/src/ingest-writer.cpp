#include "lsink/ingest/ingest-writer.h"
#include "lsink/common/errors.h"
#include "lsink/common/utils.h"
#include "lsink/delivery/remote-path.h"

#include <algorithm>

namespace lsink::ingest {

namespace {

constexpr std::chrono::milliseconds MIN_TIMER_PERIOD{5};
constexpr std::chrono::milliseconds MAX_TIMER_PERIOD{1000};

}  // namespace

std::string_view
to_string(OutputFormat format)
{
    return format == OutputFormat::PARQUET ? "parquet" : "binary";
}

std::optional<OutputFormat>
parse_output_format(std::string_view text)
{
    if (text == "binary")
        return OutputFormat::BINARY;
    if (text == "parquet")
        return OutputFormat::PARQUET;
    return std::nullopt;
}

LogPartition&
IngestWriter::get_log_partition()
{
    static LogPartition partition("INGEST", LogLevel::INHERIT);
    return partition;
}

IngestWriter::IngestWriter(
    pool::WorkerPool& encode_pool,
    pool::WorkerPool& materialize_pool,
    IngestOptions options)
    : encode_pool_(encode_pool)
    , materialize_pool_(materialize_pool)
    , options_(std::move(options))
{
    if (options_.max_rows_per_file == 0)
    {
        throw ConfigError("max_rows_per_file must be positive");
    }
    if (options_.flush_interval.count() <= 0)
    {
        throw ConfigError("flush_interval must be positive");
    }
}

IngestWriter::~IngestWriter()
{
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        stopping_ = true;
    }
    timer_cv_.notify_all();
    if (timer_.joinable())
        timer_.join();

    if (!closed_)
    {
        auto rows = buffered_rows();
        if (rows > 0)
        {
            OLOGW("Destroyed without close(), ", rows, " buffered rows dropped");
        }
    }
}

void
IngestWriter::buffer(common::RecordKind kind, std::vector<common::Record> records)
{
    if (records.empty())
        return;

    auto now = Clock::now();
    int64_t fallback = common::now_millis();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& record : records)
    {
        BufferKey key{kind, common::partition_for(record, kind, fallback)};
        auto it = buffers_.try_emplace(key).first;
        if (it->second.records.empty())
            it->second.first_arrival = now;
        it->second.records.push_back(std::move(record));
        ++stats_.records_buffered;

        if (it->second.records.size() >= options_.max_rows_per_file)
        {
            submit_locked(key, std::move(it->second.records));
            buffers_.erase(it);
        }
    }
}

void
IngestWriter::submit_locked(const BufferKey& key, std::vector<common::Record> records)
{
    const auto& [kind, partition] = key;

    bool binary = options_.format == OutputFormat::BINARY &&
        kind != common::RecordKind::CONTRACTS;
    std::string name = namer_.next_name(
        common::to_string(kind), binary ? "pb.zst" : "parquet");

    pool::Job job;
    job.kind = binary ? pool::JobKind::ENCODE : pool::JobKind::MATERIALIZE;
    job.record_kind = kind;
    job.output_path =
        common::partition_file_path(options_.scratch_dir, partition, name);
    job.config = options_.job_config;
    if (options_.bucket)
    {
        job.remote_path = delivery::remote_path_for(
            *options_.bucket, partition.path() + "/" + name);
    }

    size_t rows = records.size();
    job.records = common::make_batch(std::move(records));
    std::string output_path = job.output_path;

    auto& target = binary ? encode_pool_ : materialize_pool_;
    Pending pending{output_path, target.submit(std::move(job))};
    ++stats_.files_submitted;

    OLOGD(
        "Submitted ",
        rows,
        " ",
        common::to_string(kind),
        " rows to ",
        target.name(),
        " as ",
        output_path);

    // Fold finished jobs in as we go so the pending list stays short
    auto ready = std::partition(
        pending_.begin(), pending_.end(), [](Pending& p) {
            return p.future.wait_for(std::chrono::seconds(0)) !=
                std::future_status::ready;
        });
    for (auto it = ready; it != pending_.end(); ++it)
        collect(*it);
    pending_.erase(ready, pending_.end());

    pending_.push_back(std::move(pending));
}

void
IngestWriter::collect(Pending& pending)
{
    try
    {
        auto result = pending.future.get();
        ++stats_.files_completed;
        stats_.records_written += result.record_count;
        if (result.delivery && !result.delivery->ok)
        {
            ++stats_.uploads_failed;
        }
    }
    catch (const std::exception& e)
    {
        ++stats_.files_failed;
        OLOGE("Job for ", pending.output_path, " failed: ", e.what());
    }
}

size_t
IngestWriter::flush_all()
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t submitted = 0;
    for (auto& [key, buf] : buffers_)
    {
        if (buf.records.empty())
            continue;
        submit_locked(key, std::move(buf.records));
        ++submitted;
    }
    buffers_.clear();
    return submitted;
}

size_t
IngestWriter::flush_due(Clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t submitted = 0;
    for (auto it = buffers_.begin(); it != buffers_.end();)
    {
        if (now - it->second.first_arrival >= options_.flush_interval)
        {
            submit_locked(it->first, std::move(it->second.records));
            it = buffers_.erase(it);
            ++submitted;
        }
        else
        {
            ++it;
        }
    }
    if (submitted > 0)
    {
        OLOGD("Interval flush submitted ", submitted, " files");
    }
    return submitted;
}

void
IngestWriter::start_timer()
{
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (timer_.joinable() || stopping_)
        return;
    timer_ = std::thread([this] { timer_loop(); });
}

void
IngestWriter::timer_loop()
{
    auto period = std::clamp(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            options_.flush_interval / 2),
        MIN_TIMER_PERIOD,
        MAX_TIMER_PERIOD);

    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (!stopping_)
    {
        timer_cv_.wait_for(lock, period, [this] { return stopping_; });
        if (stopping_)
            break;
        lock.unlock();
        try
        {
            flush_due(Clock::now());
        }
        catch (const LedgerSinkError& e)
        {
            OLOGE("Interval flush failed: ", e.what());
        }
        lock.lock();
    }
}

void
IngestWriter::wait_pending()
{
    std::vector<Pending> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taken.swap(pending_);
    }
    for (auto& p : taken)
        p.future.wait();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& p : taken)
        collect(p);
}

void
IngestWriter::close()
{
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (closed_)
            return;
        closed_ = true;
        stopping_ = true;
    }
    timer_cv_.notify_all();
    if (timer_.joinable())
        timer_.join();

    size_t flushed = flush_all();
    wait_pending();

    auto stats = get_stats();
    OLOGI(
        "Closed after ",
        stats.files_submitted,
        " files (",
        flushed,
        " on close), ",
        stats.files_failed,
        " failed, ",
        stats.records_written,
        " records written");
}

IngestStats
IngestWriter::get_stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

size_t
IngestWriter::buffered_rows() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t rows = 0;
    for (const auto& [key, buf] : buffers_)
        rows += buf.records.size();
    return rows;
}

}  // namespace lsink::ingest
