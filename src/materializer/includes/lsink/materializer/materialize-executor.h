#pragma once

#include "lsink/common/tuning.h"
#include "lsink/materializer/materializer.h"
#include "lsink/pool/job-executor.h"

#include <memory>

namespace lsink::materializer {

/**
 * Runs MATERIALIZE jobs through a Materializer. The validation policy is
 * fixed per executor; compression and row group size come from the job.
 */
class MaterializeExecutor : public pool::JobExecutor
{
public:
    explicit MaterializeExecutor(
        common::ValidationPolicy policy = common::ValidationPolicy::RECORD,
        std::shared_ptr<Materializer> materializer = nullptr);

    pool::JobResult
    execute(const pool::Job& job) override;

private:
    common::ValidationPolicy policy_;
    std::shared_ptr<Materializer> materializer_;
};

}  // namespace lsink::materializer
