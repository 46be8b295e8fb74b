#pragma once

#include "lsink/pool/job-executor.h"

namespace lsink::encoder {

/**
 * Runs ENCODE jobs: writes the job's records to a chunked binary file at
 * job.output_path, creating parent directories as needed. A partial file
 * left by a failed attempt is removed before the error propagates.
 */
class EncodeExecutor : public pool::JobExecutor
{
public:
    pool::JobResult
    execute(const pool::Job& job) override;
};

}  // namespace lsink::encoder
