#include "lsink/materializer/materialize-executor.h"
#include "lsink/common/errors.h"

namespace lsink::materializer {

MaterializeExecutor::MaterializeExecutor(
    common::ValidationPolicy policy,
    std::shared_ptr<Materializer> materializer)
    : policy_(policy)
    , materializer_(
          materializer ? std::move(materializer)
                       : std::make_shared<Materializer>())
{
}

pool::JobResult
MaterializeExecutor::execute(const pool::Job& job)
{
    if (job.kind != pool::JobKind::MATERIALIZE)
    {
        throw InvalidJobError(
            "MaterializeExecutor cannot run " +
            std::string(pool::to_string(job.kind)) + " jobs");
    }
    if (!job.records)
    {
        throw InvalidJobError(
            "Materialize job for " + job.output_path + " has no records");
    }
    if (job.output_path.empty())
    {
        throw InvalidJobError("Materialize job has no output path");
    }

    MaterializeOptions options;
    options.compression_level = job.config.compression_level;
    options.row_group_size = job.config.row_group_size;
    options.policy = policy_;

    auto outcome = materializer_->materialize(
        job.output_path, job.record_kind, *job.records, options);

    pool::JobResult result;
    result.ok = true;
    result.output_path = outcome.file_written ? job.output_path : "";
    result.record_count = outcome.rows_written;
    result.bytes_written = outcome.bytes_written;
    result.original_bytes = outcome.staged_bytes;
    if (outcome.file_written)
    {
        result.validation = outcome.validation;
    }
    return result;
}

}  // namespace lsink::materializer
