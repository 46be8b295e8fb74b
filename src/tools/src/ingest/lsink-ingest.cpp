#include "lsink/common/errors.h"
#include "lsink/common/metrics-sink.h"
#include "lsink/common/record-json.h"
#include "lsink/core/logger.h"
#include "lsink/delivery/dead-letter-log.h"
#include "lsink/delivery/delivering-executor.h"
#include "lsink/delivery/remote-path.h"
#include "lsink/delivery/uploader.h"
#include "lsink/encoder/encode-executor.h"
#include "lsink/ingest/ingest-writer.h"
#include "lsink/materializer/materialize-executor.h"
#include "lsink/pool/worker-pool.h"
#include "lsink/tools/ingest-arg-options.h"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace lsink;

namespace {

// Records handed to the writer per buffer() call
constexpr size_t READ_BATCH = 1000;

void
print_pool_stats(const pool::PoolStats& stats, const std::string& name)
{
    std::cout << name << " pool:" << std::endl;
    std::cout << "  Jobs: " << stats.completed_jobs << " completed, "
              << stats.failed_jobs << " failed of " << stats.total_jobs
              << std::endl;
    std::cout << "  Records: " << stats.total_records << std::endl;
    std::cout << "  Written: " << std::fixed << std::setprecision(2)
              << stats.mb_written << " MB (" << stats.mb_per_sec << " MB/s)"
              << std::endl;
    if (stats.retries > 0 || stats.worker_crashes > 0)
    {
        std::cout << "  Retries: " << stats.retries
                  << ", worker crashes: " << stats.worker_crashes << std::endl;
    }
    if (stats.validated_files > 0)
    {
        std::cout << "  Validated: " << stats.validated_files << " files, "
                  << stats.validation_failures << " with issues" << std::endl;
        for (const auto& issue : stats.validation_issues)
        {
            std::cout << "    " << issue << std::endl;
        }
    }
}

class Ingestor
{
public:
    explicit Ingestor(tools::IngestCommandLine options)
        : options_(std::move(options))
    {
        const common::Tuning& tuning = options_.tuning;
        if (tuning.bucket && tuning.upload_enabled)
        {
            auto dead_letters =
                std::make_shared<delivery::DeadLetterLog>(tuning.dead_letter_file);
            delivery::UploaderOptions uploader_options;
            uploader_options.timeout =
                std::chrono::milliseconds(tuning.upload_timeout_ms);
            uploader_options.metrics = &metrics_;
            uploader_ = std::make_shared<delivery::Uploader>(
                delivery::make_remote_store(*tuning.bucket),
                std::move(dead_letters),
                uploader_options);
        }
        else if (tuning.bucket)
        {
            LOGW("Uploads disabled, files stay under ", tuning.scratch_dir);
        }
    }

    int
    run()
    {
        const common::Tuning& tuning = options_.tuning;

        std::shared_ptr<pool::JobExecutor> encode_executor =
            std::make_shared<encoder::EncodeExecutor>();
        std::shared_ptr<pool::JobExecutor> materialize_executor =
            std::make_shared<materializer::MaterializeExecutor>(
                tuning.validation_policy);
        if (uploader_)
        {
            encode_executor = std::make_shared<delivery::DeliveringExecutor>(
                encode_executor, uploader_);
            materialize_executor =
                std::make_shared<delivery::DeliveringExecutor>(
                    materialize_executor, uploader_);
        }

        pool::PoolOptions encode_options;
        encode_options.name = "encode";
        encode_options.max_workers = tuning.max_workers;
        encode_options.metrics = &metrics_;
        pool::WorkerPool encode_pool(encode_executor, encode_options);

        pool::PoolOptions materialize_options;
        materialize_options.name = "materialize";
        materialize_options.max_workers = tuning.parquet_workers;
        materialize_options.metrics = &metrics_;
        pool::WorkerPool materialize_pool(
            materialize_executor, materialize_options);

        ingest::IngestOptions ingest_options;
        ingest_options.format = options_.format;
        ingest_options.max_rows_per_file = tuning.max_rows_per_file;
        ingest_options.flush_interval =
            std::chrono::milliseconds(tuning.flush_interval_ms);
        ingest_options.scratch_dir = tuning.scratch_dir;
        if (uploader_)
        {
            ingest_options.bucket = tuning.bucket;
        }
        ingest_options.job_config.chunk_size = tuning.chunk_size;
        ingest_options.job_config.compression_level = tuning.compression_level;
        ingest_options.job_config.row_group_size = tuning.row_group_size;

        LOGI(
            "Ingesting ",
            common::to_string(options_.kind),
            " from ",
            options_.input_file.value_or("stdin"),
            " as ",
            ingest::to_string(options_.format),
            " into ",
            tuning.scratch_dir);

        auto start_time = std::chrono::steady_clock::now();
        ingest::IngestWriter writer(
            encode_pool, materialize_pool, ingest_options);
        writer.start_timer();

        uint64_t lines = 0;
        uint64_t malformed = 0;
        if (options_.input_file)
        {
            std::ifstream in(*options_.input_file);
            if (!in.is_open())
            {
                throw LedgerSinkError(
                    "Cannot open input file: " + *options_.input_file);
            }
            read_into(writer, in, lines, malformed);
        }
        else
        {
            read_into(writer, std::cin, lines, malformed);
        }

        writer.close();
        encode_pool.shutdown();
        materialize_pool.shutdown();

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        ingest::IngestStats stats = writer.get_stats();

        std::cout << "Ingest completed in " << std::fixed
                  << std::setprecision(2) << elapsed.count() / 1000.0
                  << " seconds" << std::endl;
        std::cout << "  Lines read: " << lines << " (" << malformed
                  << " malformed)" << std::endl;
        std::cout << "  Files: " << stats.files_completed << " written, "
                  << stats.files_failed << " failed" << std::endl;
        std::cout << "  Records written: " << stats.records_written
                  << std::endl;
        print_pool_stats(encode_pool.get_stats(), "Encode");
        print_pool_stats(materialize_pool.get_stats(), "Materialize");

        if (uploader_)
        {
            delivery::UploadStats upload = uploader_->get_stats();
            std::cout << "Uploads: " << upload.successful_uploads
                      << " succeeded, " << upload.failed_uploads
                      << " failed, " << upload.total_bytes_uploaded
                      << " bytes" << std::endl;
            if (upload.failed_uploads > 0)
            {
                std::cout << "  Failed uploads recorded in "
                          << uploader_->dead_letters()->path()
                          << ", run lsink-retry-uploads to redeliver"
                          << std::endl;
            }
        }

        return stats.files_failed == 0 ? 0 : 1;
    }

private:
    void
    read_into(
        ingest::IngestWriter& writer,
        std::istream& in,
        uint64_t& lines,
        uint64_t& malformed)
    {
        std::vector<common::Record> batch;
        batch.reserve(READ_BATCH);
        std::string line;
        while (std::getline(in, line))
        {
            ++lines;
            if (line.find_first_not_of(" \t\r") == std::string::npos)
            {
                continue;
            }
            try
            {
                batch.push_back(common::parse_record_line(line));
            }
            catch (const LedgerSinkError& e)
            {
                ++malformed;
                LOGW("Skipping line ", lines, ": ", e.what());
                continue;
            }
            if (batch.size() >= READ_BATCH)
            {
                writer.buffer(options_.kind, std::move(batch));
                batch = {};
                batch.reserve(READ_BATCH);
            }
        }
        if (!batch.empty())
        {
            writer.buffer(options_.kind, std::move(batch));
        }
    }

    tools::IngestCommandLine options_;
    common::LoggingMetricsSink metrics_;
    std::shared_ptr<delivery::Uploader> uploader_;
};

}  // namespace

int
main(int argc, char* argv[])
{
    tools::IngestCommandLine options = tools::parse_ingest_argv(argc, argv);

    if (options.show_help || !options.valid)
    {
        if (!options.valid && options.error_message)
        {
            std::cerr << "Error: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? 0 : 1;
    }

    try
    {
        Logger::set_level(options.tuning.log_level);
        Ingestor ingestor(std::move(options));
        return ingestor.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
