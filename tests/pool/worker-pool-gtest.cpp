#include "lsink/common/errors.h"
#include "lsink/pool/worker-pool.h"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace lsink;
using namespace lsink::pool;

namespace {

Job
make_job(const std::string& path, size_t record_count = 1)
{
    std::vector<common::Record> records(record_count);
    for (size_t i = 0; i < record_count; ++i)
    {
        records[i].set("event_id", std::to_string(i));
    }

    Job job;
    job.kind = JobKind::ENCODE;
    job.record_kind = common::RecordKind::EVENTS;
    job.output_path = path;
    job.records = common::make_batch(std::move(records));
    return job;
}

PoolOptions
fast_options(size_t workers)
{
    PoolOptions options;
    options.name = "test";
    options.max_workers = workers;
    options.retry.base_delay = std::chrono::milliseconds(5);
    options.retry.max_delay = std::chrono::milliseconds(20);
    options.retry.jitter = std::chrono::milliseconds(0);
    return options;
}

JobResult
ok_result(const Job& job)
{
    JobResult result;
    result.output_path = job.output_path;
    result.record_count = job.records ? job.records->size() : 0;
    result.bytes_written = 100;
    return result;
}

// Sleeps, tracking how many executions overlap
class SlowExecutor : public JobExecutor
{
public:
    explicit SlowExecutor(std::chrono::milliseconds delay) : delay_(delay)
    {
    }

    JobResult
    execute(const Job& job) override
    {
        int now = ++running_;
        int seen = max_seen_.load();
        while (now > seen && !max_seen_.compare_exchange_weak(seen, now))
        {
        }
        std::this_thread::sleep_for(delay_);
        --running_;
        return ok_result(job);
    }

    int
    max_seen() const
    {
        return max_seen_.load();
    }

private:
    std::chrono::milliseconds delay_;
    std::atomic<int> running_{0};
    std::atomic<int> max_seen_{0};
};

// Records the order jobs start in
class OrderExecutor : public JobExecutor
{
public:
    JobResult
    execute(const Job& job) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.push_back(job.output_path);
        return ok_result(job);
    }

    std::vector<std::string>
    order()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> order_;
};

// Runs a per-path script of behaviours, one entry per attempt
class ScriptedExecutor : public JobExecutor
{
public:
    enum class Step { OK, TRANSIENT, PERMANENT, CRASH, TIMEOUT };

    void
    script(const std::string& path, std::vector<Step> steps)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[path] = std::move(steps);
    }

    int
    calls(const std::string& path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_[path];
    }

    JobResult
    execute(const Job& job) override
    {
        Step step = Step::OK;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            int attempt = calls_[job.output_path]++;
            auto it = scripts_.find(job.output_path);
            if (it != scripts_.end() && attempt < static_cast<int>(it->second.size()))
            {
                step = it->second[attempt];
            }
        }

        switch (step)
        {
            case Step::OK:
                return ok_result(job);
            case Step::TRANSIENT:
                throw std::runtime_error("EBUSY: resource busy or locked");
            case Step::PERMANENT:
                throw InvalidJobError("cannot encode this job");
            case Step::CRASH:
                throw 42;
            case Step::TIMEOUT:
                throw RemoteTimeoutError("copy timed out after 10 ms");
        }
        return ok_result(job);
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<Step>> scripts_;
    std::map<std::string, int> calls_;
};

using Step = ScriptedExecutor::Step;

}  // namespace

TEST(WorkerPool, ConcurrencyNeverExceedsMaxWorkers)
{
    auto executor =
        std::make_shared<SlowExecutor>(std::chrono::milliseconds(15));
    WorkerPool pool(executor, fast_options(3));

    std::vector<std::future<JobResult>> futures;
    for (int i = 0; i < 20; ++i)
    {
        futures.push_back(pool.submit(make_job("job-" + std::to_string(i))));
    }
    for (auto& f : futures)
    {
        EXPECT_TRUE(f.get().ok);
    }
    pool.drain();

    auto stats = pool.get_stats();
    EXPECT_LE(executor->max_seen(), 3);
    EXPECT_LE(stats.peak_active, 3u);
    EXPECT_GE(stats.peak_active, 1u);
    EXPECT_EQ(stats.completed_jobs, 20u);
    EXPECT_EQ(stats.active_workers, 0u);
    EXPECT_EQ(stats.available_slots, 3u);
}

TEST(WorkerPool, AdmitsJobsInSubmissionOrder)
{
    auto executor = std::make_shared<OrderExecutor>();
    WorkerPool pool(executor, fast_options(1));

    std::vector<std::string> expected;
    for (int i = 0; i < 10; ++i)
    {
        expected.push_back("file-" + std::to_string(i));
        pool.submit(make_job(expected.back()));
    }
    pool.drain();

    EXPECT_EQ(executor->order(), expected);
}

TEST(WorkerPool, TransientFailureIsRetriedUntilSuccess)
{
    auto executor = std::make_shared<ScriptedExecutor>();
    executor->script("a", {Step::TRANSIENT, Step::TRANSIENT, Step::OK});
    WorkerPool pool(executor, fast_options(2));

    auto result = pool.submit(make_job("a", 5)).get();
    pool.drain();

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.record_count, 5u);
    EXPECT_EQ(executor->calls("a"), 3);

    auto stats = pool.get_stats();
    EXPECT_EQ(stats.total_jobs, 1u);
    EXPECT_EQ(stats.completed_jobs, 1u);
    EXPECT_EQ(stats.failed_jobs, 0u);
    EXPECT_EQ(stats.retries, 2u);
    EXPECT_EQ(stats.total_records, 5u);
}

TEST(WorkerPool, TransientFailureGivesUpAfterMaxAttempts)
{
    auto executor = std::make_shared<ScriptedExecutor>();
    executor->script(
        "a", {Step::TIMEOUT, Step::TIMEOUT, Step::TIMEOUT, Step::OK});
    WorkerPool pool(executor, fast_options(2));

    auto future = pool.submit(make_job("a"));
    EXPECT_THROW(future.get(), RemoteTimeoutError);
    pool.drain();

    EXPECT_EQ(executor->calls("a"), 3);
    auto stats = pool.get_stats();
    EXPECT_EQ(stats.failed_jobs, 1u);
    EXPECT_EQ(stats.completed_jobs, 0u);
    EXPECT_EQ(stats.retries, 2u);
}

TEST(WorkerPool, PermanentFailureIsNotRetried)
{
    auto executor = std::make_shared<ScriptedExecutor>();
    executor->script("a", {Step::PERMANENT, Step::OK});
    WorkerPool pool(executor, fast_options(2));

    auto future = pool.submit(make_job("a"));
    EXPECT_THROW(future.get(), InvalidJobError);
    pool.drain();

    EXPECT_EQ(executor->calls("a"), 1);
    auto stats = pool.get_stats();
    EXPECT_EQ(stats.retries, 0u);
    EXPECT_EQ(stats.failed_jobs, 1u);
}

TEST(WorkerPool, CrashedWorkerIsReplacedAndJobRetried)
{
    auto executor = std::make_shared<ScriptedExecutor>();
    executor->script("a", {Step::CRASH, Step::OK});
    WorkerPool pool(executor, fast_options(2));

    auto result = pool.submit(make_job("a")).get();
    pool.drain();

    EXPECT_TRUE(result.ok);
    auto stats = pool.get_stats();
    EXPECT_EQ(stats.worker_crashes, 1u);
    EXPECT_EQ(stats.workers_spawned, 3u);
    EXPECT_EQ(stats.retries, 1u);
    EXPECT_EQ(stats.completed_jobs, 1u);

    // Replacement keeps the pool at full strength
    std::vector<std::future<JobResult>> futures;
    for (int i = 0; i < 6; ++i)
        futures.push_back(pool.submit(make_job("b" + std::to_string(i))));
    for (auto& f : futures)
        EXPECT_TRUE(f.get().ok);
}

TEST(WorkerPool, RepeatedCrashesFailWithWorkerCrashedError)
{
    auto executor = std::make_shared<ScriptedExecutor>();
    executor->script("a", {Step::CRASH, Step::CRASH, Step::CRASH});
    WorkerPool pool(executor, fast_options(1));

    auto future = pool.submit(make_job("a"));
    EXPECT_THROW(future.get(), WorkerCrashedError);
    pool.drain();

    auto stats = pool.get_stats();
    EXPECT_EQ(stats.worker_crashes, 3u);
    EXPECT_EQ(stats.workers_spawned, 4u);
    EXPECT_EQ(stats.failed_jobs, 1u);
}

TEST(WorkerPool, EphemeralWorkersRetireAfterEachJob)
{
    auto executor = std::make_shared<OrderExecutor>();
    auto options = fast_options(2);
    options.admission = AdmissionModel::EPHEMERAL;
    WorkerPool pool(executor, options);

    std::vector<std::future<JobResult>> futures;
    for (int i = 0; i < 5; ++i)
        futures.push_back(pool.submit(make_job("e" + std::to_string(i))));
    for (auto& f : futures)
        EXPECT_TRUE(f.get().ok);
    pool.shutdown();

    auto stats = pool.get_stats();
    EXPECT_EQ(stats.completed_jobs, 5u);
    EXPECT_EQ(stats.workers_spawned, 7u);
    EXPECT_EQ(executor->order().size(), 5u);
}

TEST(WorkerPool, StatsConservationAfterDrain)
{
    auto executor = std::make_shared<ScriptedExecutor>();
    for (int i = 0; i < 30; ++i)
    {
        std::string path = "j" + std::to_string(i);
        switch (i % 4)
        {
            case 0:
                executor->script(path, {Step::PERMANENT});
                break;
            case 1:
                executor->script(path, {Step::TRANSIENT, Step::OK});
                break;
            case 2:
                executor->script(
                    path, {Step::TRANSIENT, Step::TRANSIENT, Step::TRANSIENT});
                break;
            default:
                break;
        }
    }
    WorkerPool pool(executor, fast_options(4));

    std::vector<std::future<JobResult>> futures;
    for (int i = 0; i < 30; ++i)
        futures.push_back(pool.submit(make_job("j" + std::to_string(i))));
    pool.drain();

    auto stats = pool.get_stats();
    EXPECT_EQ(stats.total_jobs, 30u);
    EXPECT_EQ(stats.completed_jobs + stats.failed_jobs, stats.total_jobs);
    EXPECT_EQ(stats.failed_jobs, 8u + 7u);
    EXPECT_EQ(stats.queued_jobs, 0u);
    EXPECT_EQ(stats.delayed_jobs, 0u);

    for (auto& f : futures)
    {
        EXPECT_EQ(
            f.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    }
}

TEST(WorkerPool, SubmitAfterShutdownThrows)
{
    auto executor = std::make_shared<OrderExecutor>();
    WorkerPool pool(executor, fast_options(2));
    pool.submit(make_job("before")).get();
    pool.shutdown();

    EXPECT_THROW(pool.submit(make_job("after")), PoolShutdownError);
    // Shutting down twice is harmless
    pool.shutdown();
}

TEST(WorkerPool, ShutdownRunsEveryQueuedJob)
{
    auto executor =
        std::make_shared<SlowExecutor>(std::chrono::milliseconds(5));
    WorkerPool pool(executor, fast_options(2));

    std::vector<std::future<JobResult>> futures;
    for (int i = 0; i < 12; ++i)
        futures.push_back(pool.submit(make_job("q" + std::to_string(i))));
    pool.shutdown();

    for (auto& f : futures)
    {
        ASSERT_EQ(
            f.wait_for(std::chrono::seconds(0)), std::future_status::ready);
        EXPECT_TRUE(f.get().ok);
    }
    EXPECT_EQ(pool.get_stats().completed_jobs, 12u);
}

TEST(WorkerPool, ValidationIssuesAreCountedAndCapped)
{
    class InvalidExecutor : public JobExecutor
    {
    public:
        JobResult
        execute(const Job& job) override
        {
            JobResult result = ok_result(job);
            ValidationReport report;
            report.valid = false;
            report.issues = {"one", "two", "three"};
            result.validation = report;
            return result;
        }
    };

    WorkerPool pool(std::make_shared<InvalidExecutor>(), fast_options(2));
    for (int i = 0; i < 5; ++i)
        pool.submit(make_job("v" + std::to_string(i)));
    pool.drain();

    auto stats = pool.get_stats();
    EXPECT_EQ(stats.validated_files, 5u);
    EXPECT_EQ(stats.validation_failures, 5u);
    EXPECT_EQ(stats.validation_issues.size(), 10u);
}

TEST(WorkerPool, RejectsZeroWorkers)
{
    EXPECT_THROW(
        WorkerPool(std::make_shared<OrderExecutor>(), fast_options(0)),
        ConfigError);
}
