#pragma once

#include "lsink/common/metrics-sink.h"
#include "lsink/core/logger.h"
#include "lsink/pool/job-executor.h"
#include "lsink/pool/job.h"
#include "lsink/pool/pool-stats.h"
#include "lsink/pool/retry-policy.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace lsink::pool {

enum class AdmissionModel {
    PERSISTENT,  // long-lived workers pull jobs until shutdown
    EPHEMERAL    // a worker retires after one job and is replaced
};

struct PoolOptions
{
    /** Name used in log lines and metric names */
    std::string name = "pool";

    /** Number of worker slots */
    size_t max_workers = 2;

    AdmissionModel admission = AdmissionModel::PERSISTENT;

    RetryPolicy retry;

    /** Optional metrics consumer, not owned. Must outlive the pool. */
    common::MetricsSink* metrics = nullptr;
};

/**
 * Bounded pool of worker threads running jobs through a JobExecutor.
 *
 * Jobs are admitted in FIFO order; at most max_workers run at once. A job
 * failing with a transient error is retried with exponential backoff, up to
 * RetryPolicy::max_attempts. While waiting out its backoff a job holds no
 * slot; it re-enters the back of the queue when due.
 *
 * A worker whose job escapes with an exception not derived from
 * std::exception is considered crashed: the attempt fails with
 * WorkerCrashedError (transient), the worker retires and a replacement is
 * spawned immediately.
 *
 * All pool state is guarded by one mutex and changes only in submit() and in
 * completion handling. Executors run outside the lock.
 */
class WorkerPool
{
public:
    WorkerPool(std::shared_ptr<JobExecutor> executor, PoolOptions options);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool&
    operator=(const WorkerPool&) = delete;

    /**
     * Queue a job. The future carries the result or the final exception.
     * @throws PoolShutdownError once shutdown() has begun
     */
    std::future<JobResult>
    submit(Job job);

    // Block until no job is queued, waiting out a backoff or running
    void
    drain();

    // Drain, then stop and join every worker. Idempotent.
    void
    shutdown();

    PoolStats
    get_stats() const;

    const std::string&
    name() const
    {
        return options_.name;
    }

    static LogPartition&
    get_log_partition();

private:
    using Clock = std::chrono::steady_clock;

    struct Entry
    {
        uint64_t id = 0;
        Job job;
        std::promise<JobResult> promise;
        int attempts = 0;
        Clock::time_point submitted;
    };

    struct Delayed
    {
        Clock::time_point due;
        uint64_t seq = 0;
        std::unique_ptr<Entry> entry;
    };

    // Min-heap on due time, ties in insertion order
    struct DelayedLater
    {
        bool
        operator()(const Delayed& a, const Delayed& b) const
        {
            if (a.due != b.due)
                return a.due > b.due;
            return a.seq > b.seq;
        }
    };

    enum class Outcome { SUCCEEDED, FAILED, CRASHED };

    void
    worker_loop(uint64_t worker_id);

    void
    spawn_worker_locked();

    void
    promote_due_locked(Clock::time_point now);

    void
    finish_success_locked(Entry& entry, JobResult result);

    void
    finish_failure_locked(
        std::unique_ptr<Entry> entry,
        std::exception_ptr error,
        const std::string& message,
        bool transient);

    bool
    idle_locked() const
    {
        return queue_.empty() && delayed_.empty() && active_ == 0;
    }

    void
    report_gauges_locked();

    std::shared_ptr<JobExecutor> executor_;
    PoolOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;

    std::deque<std::unique_ptr<Entry>> queue_;
    std::vector<Delayed> delayed_;
    uint64_t delayed_seq_ = 0;
    uint64_t next_job_id_ = 0;
    size_t active_ = 0;

    std::unordered_map<uint64_t, std::thread> workers_;
    std::vector<std::thread> retired_;
    uint64_t next_worker_id_ = 0;

    bool accepting_ = true;
    bool stopping_ = false;
    bool stopped_ = false;

    PoolStats stats_;
    Clock::time_point started_;
    std::mt19937 rng_;
};

}  // namespace lsink::pool
