#include "lsink/pool/worker-pool.h"
#include "lsink/common/errors.h"

#include <algorithm>
#include <utility>

namespace lsink::pool {

LogPartition&
WorkerPool::get_log_partition()
{
    static LogPartition partition("POOL", LogLevel::INHERIT);
    return partition;
}

WorkerPool::WorkerPool(std::shared_ptr<JobExecutor> executor, PoolOptions options)
    : executor_(std::move(executor))
    , options_(std::move(options))
    , started_(Clock::now())
    , rng_(std::random_device{}())
{
    if (!executor_)
    {
        throw ConfigError("WorkerPool " + options_.name + ": executor is null");
    }
    if (options_.max_workers == 0)
    {
        throw ConfigError(
            "WorkerPool " + options_.name + ": max_workers must be positive");
    }
    if (options_.retry.max_attempts < 1)
    {
        throw ConfigError(
            "WorkerPool " + options_.name + ": max_attempts must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < options_.max_workers; ++i)
    {
        spawn_worker_locked();
    }
    OLOGI(
        "Pool ",
        options_.name,
        " started with ",
        options_.max_workers,
        options_.admission == AdmissionModel::EPHEMERAL ? " ephemeral"
                                                        : " persistent",
        " workers");
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

std::future<JobResult>
WorkerPool::submit(Job job)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_)
    {
        throw PoolShutdownError(
            "Pool " + options_.name + " is shutting down, job rejected");
    }

    auto entry = std::make_unique<Entry>();
    entry->id = ++next_job_id_;
    entry->job = std::move(job);
    entry->submitted = Clock::now();
    auto future = entry->promise.get_future();

    OLOGD(
        "Queued job ",
        entry->id,
        " (",
        to_string(entry->job.kind),
        " ",
        entry->job.output_path,
        ")");

    queue_.push_back(std::move(entry));
    ++stats_.total_jobs;
    report_gauges_locked();
    work_cv_.notify_one();
    return future;
}

void
WorkerPool::spawn_worker_locked()
{
    uint64_t id = ++next_worker_id_;
    workers_.emplace(id, std::thread(&WorkerPool::worker_loop, this, id));
    ++stats_.workers_spawned;
}

void
WorkerPool::promote_due_locked(Clock::time_point now)
{
    bool promoted = false;
    while (!delayed_.empty() && delayed_.front().due <= now)
    {
        std::pop_heap(delayed_.begin(), delayed_.end(), DelayedLater{});
        queue_.push_back(std::move(delayed_.back().entry));
        delayed_.pop_back();
        promoted = true;
    }
    if (promoted)
    {
        work_cv_.notify_all();
    }
}

void
WorkerPool::worker_loop(uint64_t worker_id)
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (true)
    {
        promote_due_locked(Clock::now());

        if (queue_.empty())
        {
            if (stopping_)
            {
                return;
            }
            if (!delayed_.empty())
            {
                work_cv_.wait_until(lock, delayed_.front().due);
            }
            else
            {
                work_cv_.wait(lock);
            }
            continue;
        }

        std::unique_ptr<Entry> entry = std::move(queue_.front());
        queue_.pop_front();
        ++entry->attempts;
        ++active_;
        stats_.peak_active = std::max(stats_.peak_active, active_);
        report_gauges_locked();
        lock.unlock();

        Outcome outcome = Outcome::SUCCEEDED;
        JobResult result;
        std::exception_ptr error;
        std::string message;
        bool transient = false;
        auto attempt_start = Clock::now();

        try
        {
            result = executor_->execute(entry->job);
        }
        catch (const std::exception& e)
        {
            outcome = Outcome::FAILED;
            error = std::current_exception();
            message = e.what();
            transient = is_transient(e);
        }
        catch (...)
        {
            // Non-standard exception: treat the worker as crashed
            outcome = Outcome::CRASHED;
            message = "Worker crashed while running job for " +
                entry->job.output_path;
            error = std::make_exception_ptr(WorkerCrashedError(message));
            transient = true;
        }

        double duration_ms =
            std::chrono::duration<double, std::milli>(
                Clock::now() - attempt_start)
                .count();
        if (options_.metrics)
        {
            options_.metrics->timing(
                options_.name + ".job_duration_ms", duration_ms);
        }

        lock.lock();
        --active_;

        if (outcome == Outcome::SUCCEEDED)
        {
            finish_success_locked(*entry, std::move(result));
        }
        else
        {
            if (outcome == Outcome::CRASHED)
            {
                ++stats_.worker_crashes;
                OLOGE(
                    "Worker ",
                    worker_id,
                    " crashed on job ",
                    entry->id,
                    ", spawning replacement");
            }
            finish_failure_locked(std::move(entry), error, message, transient);
        }

        bool retire = outcome == Outcome::CRASHED ||
            options_.admission == AdmissionModel::EPHEMERAL;

        std::vector<std::thread> to_join;
        if (retire)
        {
            to_join = std::move(retired_);
            retired_.clear();
            auto it = workers_.find(worker_id);
            if (it != workers_.end())
            {
                retired_.push_back(std::move(it->second));
                workers_.erase(it);
            }
            if (!stopping_)
            {
                spawn_worker_locked();
            }
        }

        report_gauges_locked();
        idle_cv_.notify_all();

        if (retire)
        {
            lock.unlock();
            for (auto& t : to_join)
            {
                if (t.joinable())
                    t.join();
            }
            return;
        }
    }
}

void
WorkerPool::finish_success_locked(Entry& entry, JobResult result)
{
    ++stats_.completed_jobs;
    stats_.total_records += result.record_count;
    stats_.total_bytes += result.bytes_written;
    stats_.total_original_bytes += result.original_bytes;

    if (result.validation)
    {
        ++stats_.validated_files;
        if (!result.validation->valid)
        {
            ++stats_.validation_failures;
            for (const auto& issue : result.validation->issues)
            {
                if (stats_.validation_issues.size() >= 10)
                    break;
                stats_.validation_issues.push_back(
                    result.output_path + ": " + issue);
            }
        }
    }

    if (options_.metrics)
    {
        options_.metrics->counter(options_.name + ".jobs_completed", 1);
        options_.metrics->counter(
            options_.name + ".records", result.record_count);
        options_.metrics->counter(
            options_.name + ".bytes", result.bytes_written);
    }

    OLOGD(
        "Job ",
        entry.id,
        " completed: ",
        result.record_count,
        " records, ",
        result.bytes_written,
        " bytes -> ",
        result.output_path);

    entry.promise.set_value(std::move(result));
}

void
WorkerPool::finish_failure_locked(
    std::unique_ptr<Entry> entry,
    std::exception_ptr error,
    const std::string& message,
    bool transient)
{
    const int max_attempts = options_.retry.max_attempts;
    if (transient && entry->attempts < max_attempts)
    {
        ++stats_.retries;
        auto delay = options_.retry.backoff(entry->attempts, rng_);
        OLOGW(
            "Job ",
            entry->id,
            " (",
            entry->job.output_path,
            ") attempt ",
            entry->attempts,
            "/",
            max_attempts,
            " failed: ",
            message,
            "; retrying in ",
            delay.count(),
            "ms");

        delayed_.push_back(
            Delayed{Clock::now() + delay, ++delayed_seq_, std::move(entry)});
        std::push_heap(delayed_.begin(), delayed_.end(), DelayedLater{});
        work_cv_.notify_all();
        return;
    }

    ++stats_.failed_jobs;
    if (options_.metrics)
    {
        options_.metrics->counter(options_.name + ".jobs_failed", 1);
    }
    OLOGE(
        "Job ",
        entry->id,
        " (",
        entry->job.output_path,
        ") failed after ",
        entry->attempts,
        " attempt(s)",
        transient ? "" : " with permanent error",
        ": ",
        message);

    entry->promise.set_exception(error);
}

void
WorkerPool::report_gauges_locked()
{
    if (!options_.metrics)
        return;
    options_.metrics->gauge(
        options_.name + ".active_workers", static_cast<double>(active_));
    options_.metrics->gauge(
        options_.name + ".queued_jobs", static_cast<double>(queue_.size()));
}

void
WorkerPool::drain()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return idle_locked(); });
}

void
WorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
            return;
        accepting_ = false;
    }

    drain();

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        stopped_ = true;
        for (auto& [id, thread] : workers_)
        {
            threads.push_back(std::move(thread));
        }
        workers_.clear();
        for (auto& thread : retired_)
        {
            threads.push_back(std::move(thread));
        }
        retired_.clear();
    }
    work_cv_.notify_all();

    for (auto& thread : threads)
    {
        if (thread.joinable())
            thread.join();
    }

    auto stats = get_stats();
    OLOGI(
        "Pool ",
        options_.name,
        " shut down: ",
        stats.completed_jobs,
        " completed, ",
        stats.failed_jobs,
        " failed, ",
        stats.retries,
        " retries, ",
        stats.worker_crashes,
        " crashes");
}

PoolStats
WorkerPool::get_stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats snapshot = stats_;

    snapshot.active_workers = active_;
    snapshot.queued_jobs = queue_.size();
    snapshot.delayed_jobs = delayed_.size();
    snapshot.available_slots =
        options_.max_workers > active_ ? options_.max_workers - active_ : 0;

    snapshot.elapsed_sec =
        std::chrono::duration<double>(Clock::now() - started_).count();
    snapshot.mb_written =
        static_cast<double>(stats_.total_bytes) / (1024.0 * 1024.0);
    if (snapshot.elapsed_sec > 0)
    {
        snapshot.mb_per_sec = snapshot.mb_written / snapshot.elapsed_sec;
        snapshot.files_per_sec =
            static_cast<double>(stats_.completed_jobs) / snapshot.elapsed_sec;
    }
    return snapshot;
}

}  // namespace lsink::pool
