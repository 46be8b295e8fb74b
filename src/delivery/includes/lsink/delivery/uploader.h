#pragma once

#include "lsink/common/metrics-sink.h"
#include "lsink/common/upload-result.h"
#include "lsink/core/logger.h"
#include "lsink/delivery/dead-letter-log.h"
#include "lsink/delivery/remote-store.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace lsink::delivery {

struct UploadStats
{
    uint64_t total_uploads = 0;
    uint64_t successful_uploads = 0;
    uint64_t failed_uploads = 0;
    uint64_t total_bytes_uploaded = 0;
};

struct UploaderOptions
{
    /** Applied to each remote operation */
    std::chrono::milliseconds timeout{300000};

    common::MetricsSink* metrics = nullptr;
};

/**
 * Delivers local files to a RemoteStore with integrity verification.
 *
 * upload() copies, stats the remote object and compares its MD5 with the
 * local one. A failed delivery is appended to the dead-letter log before the
 * local file is deleted. The local file is deleted on every path, so the
 * scratch directory never accumulates delivered or failed files. Delivery
 * failures are returned, never thrown. Thread safe.
 */
class Uploader
{
public:
    Uploader(
        std::shared_ptr<RemoteStore> store,
        std::shared_ptr<DeadLetterLog> dead_letters,
        UploaderOptions options = {});

    common::UploadResult
    upload(const std::string& local_path, const std::string& remote_path);

    /**
     * Copy and verify only: no dead-letter entry, no local delete, no stats.
     * The reconciler retries through this.
     */
    common::UploadResult
    transfer(const std::string& local_path, const std::string& remote_path);

    UploadStats
    get_stats() const;

    void
    reset_stats();

    const std::shared_ptr<DeadLetterLog>&
    dead_letters() const
    {
        return dead_letters_;
    }

    static LogPartition&
    get_log_partition();

private:
    // A write failure is logged as data loss
    void
    record_dead_letter(const common::UploadResult& result);

    void
    delete_local(const std::string& local_path);

    std::shared_ptr<RemoteStore> store_;
    std::shared_ptr<DeadLetterLog> dead_letters_;
    UploaderOptions options_;

    mutable std::mutex stats_mutex_;
    UploadStats stats_;
};

}  // namespace lsink::delivery
