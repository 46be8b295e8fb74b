#pragma once

#include "lsink/delivery/uploader.h"
#include "lsink/pool/job-executor.h"

#include <memory>

namespace lsink::delivery {

/**
 * Decorates another executor with durable upload. After the inner executor
 * writes its file, a job carrying a remote_path is uploaded from the same
 * worker and the outcome is attached to the result. Upload failures do not
 * fail the job: they are in result.delivery and the dead-letter log.
 */
class DeliveringExecutor : public pool::JobExecutor
{
public:
    DeliveringExecutor(
        std::shared_ptr<pool::JobExecutor> inner,
        std::shared_ptr<Uploader> uploader);

    pool::JobResult
    execute(const pool::Job& job) override;

private:
    std::shared_ptr<pool::JobExecutor> inner_;
    std::shared_ptr<Uploader> uploader_;
};

}  // namespace lsink::delivery
