#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lsink::pool {

/**
 * Snapshot of a pool's counters and gauges.
 *
 * Counters change only when a job reaches its final outcome, so a job that
 * was retried counts once and, after drain(),
 * completed_jobs + failed_jobs == total_jobs.
 */
struct PoolStats
{
    uint64_t total_jobs = 0;
    uint64_t completed_jobs = 0;
    uint64_t failed_jobs = 0;
    uint64_t total_records = 0;
    uint64_t total_bytes = 0;
    uint64_t total_original_bytes = 0;
    uint64_t validated_files = 0;
    uint64_t validation_failures = 0;
    std::vector<std::string> validation_issues;  // first 10
    uint64_t workers_spawned = 0;
    uint64_t worker_crashes = 0;
    uint64_t retries = 0;
    size_t peak_active = 0;

    // Gauges
    size_t active_workers = 0;
    size_t queued_jobs = 0;
    size_t delayed_jobs = 0;
    size_t available_slots = 0;
    double elapsed_sec = 0.0;
    double mb_written = 0.0;
    double mb_per_sec = 0.0;
    double files_per_sec = 0.0;
};

}  // namespace lsink::pool
