#include "lsink/delivery/delivering-executor.h"
#include "lsink/common/errors.h"

namespace lsink::delivery {

DeliveringExecutor::DeliveringExecutor(
    std::shared_ptr<pool::JobExecutor> inner,
    std::shared_ptr<Uploader> uploader)
    : inner_(std::move(inner)), uploader_(std::move(uploader))
{
    if (!inner_ || !uploader_)
    {
        throw ConfigError("DeliveringExecutor requires an executor and uploader");
    }
}

pool::JobResult
DeliveringExecutor::execute(const pool::Job& job)
{
    auto result = inner_->execute(job);

    // Empty output path: nothing was written (e.g. no records)
    if (job.remote_path && !result.output_path.empty())
    {
        result.delivery = uploader_->upload(result.output_path, *job.remote_path);
    }
    return result;
}

}  // namespace lsink::delivery
