#pragma once

#include "lsink/core/logger.h"
#include "lsink/delivery/dead-letter-log.h"
#include "lsink/delivery/uploader.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace lsink::delivery {

struct ReconcileResult
{
    size_t total = 0;         // entries read from the log
    size_t unique = 0;        // after collapsing repeated remote paths
    size_t deduplicated = 0;  // entries collapsed away
    size_t retried = 0;       // delivered this pass
    size_t still_failed = 0;  // kept for the next pass
    size_t no_file = 0;       // dropped, local file gone
};

struct DeadLetterStatus
{
    size_t entries = 0;
    size_t files_present = 0;
    size_t files_missing = 0;
    std::vector<DeadLetterEntry> recent;  // last five, oldest first
};

/**
 * Retries dead-letter entries out of band.
 *
 * One pass reads the whole log, keeps only the latest entry per remote
 * path, retries each entry whose local file still exists and rewrites the
 * log atomically with what is still failing. Only one reconciler may run
 * against a log at a time.
 */
class Reconciler
{
public:
    Reconciler(
        std::shared_ptr<Uploader> uploader,
        std::shared_ptr<DeadLetterLog> log);

    ReconcileResult
    run();

    // Report what run() would do without touching files or the log
    ReconcileResult
    dry_run() const;

    DeadLetterStatus
    status() const;

    static LogPartition&
    get_log_partition();

private:
    std::vector<DeadLetterEntry>
    load(ReconcileResult& result) const;

    std::shared_ptr<Uploader> uploader_;
    std::shared_ptr<DeadLetterLog> log_;
};

}  // namespace lsink::delivery
