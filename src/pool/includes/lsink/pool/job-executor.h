#pragma once

#include "lsink/pool/job.h"

namespace lsink::pool {

/**
 * Runs one job inside a worker thread.
 *
 * Implementations are shared by every worker of a pool and must be
 * reentrant. Failures are reported by throwing; the pool classifies the
 * exception as transient or permanent. An exception not derived from
 * std::exception is treated as a worker crash.
 */
class JobExecutor
{
public:
    virtual ~JobExecutor() = default;

    virtual JobResult
    execute(const Job& job) = 0;
};

}  // namespace lsink::pool
