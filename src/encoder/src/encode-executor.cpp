#include "lsink/encoder/encode-executor.h"
#include "lsink/common/errors.h"
#include "lsink/core/logger.h"
#include "lsink/encoder/chunked-writer.h"

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace lsink::encoder {

namespace {

void
remove_partial(const std::string& path)
{
    boost::system::error_code ec;
    fs::remove(path, ec);
    if (ec)
    {
        LOGW("Could not remove partial file ", path, ": ", ec.message());
    }
}

}  // namespace

pool::JobResult
EncodeExecutor::execute(const pool::Job& job)
{
    if (job.kind != pool::JobKind::ENCODE)
    {
        throw InvalidJobError(
            "EncodeExecutor cannot run " + std::string(pool::to_string(job.kind)) +
            " jobs");
    }
    if (!job.records)
    {
        throw InvalidJobError("Encode job for " + job.output_path + " has no records");
    }
    if (job.output_path.empty())
    {
        throw InvalidJobError("Encode job has no output path");
    }

    fs::path parent = fs::path(job.output_path).parent_path();
    if (!parent.empty())
    {
        boost::system::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
        {
            throw EncoderIoError(
                "Failed to create directory " + parent.string() + ": " +
                ec.message());
        }
    }

    EncodeStats stats;
    try
    {
        stats = encode_to_file(
            job.output_path,
            job.record_kind,
            *job.records,
            job.config.chunk_size,
            job.config.compression_level);
    }
    catch (const EncoderIoError&)
    {
        remove_partial(job.output_path);
        throw;
    }

    pool::JobResult result;
    result.ok = true;
    result.output_path = job.output_path;
    result.record_count = stats.records_written;
    result.records_skipped = stats.records_skipped;
    result.chunks_written = stats.chunks_written;
    result.original_bytes = stats.original_bytes;
    result.bytes_written = stats.compressed_bytes;
    return result;
}

}  // namespace lsink::encoder
