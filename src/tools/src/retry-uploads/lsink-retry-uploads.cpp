#include "lsink/common/errors.h"
#include "lsink/common/utils.h"
#include "lsink/core/logger.h"
#include "lsink/delivery/dead-letter-log.h"
#include "lsink/delivery/reconciler.h"
#include "lsink/delivery/remote-path.h"
#include "lsink/delivery/uploader.h"
#include "lsink/tools/retry-arg-options.h"

#include <chrono>
#include <iostream>
#include <memory>

using namespace lsink;

namespace {

void
print_status(const delivery::DeadLetterStatus& status, const std::string& path)
{
    std::cout << "Dead-letter log: " << path << std::endl;
    std::cout << "  Entries: " << status.entries << std::endl;
    std::cout << "  Local files present: " << status.files_present
              << std::endl;
    std::cout << "  Local files missing: " << status.files_missing
              << std::endl;
    if (!status.recent.empty())
    {
        std::cout << "Most recent failures:" << std::endl;
        for (const auto& entry : status.recent)
        {
            std::cout << "  " << common::format_iso_millis(entry.timestamp_millis)
                      << " " << entry.remote_path << std::endl;
            std::cout << "    " << entry.error << std::endl;
            if (entry.last_retry_millis)
            {
                std::cout << "    last retry "
                          << common::format_iso_millis(*entry.last_retry_millis)
                          << ": " << entry.retry_error.value_or("") << std::endl;
            }
        }
    }
}

void
print_result(const delivery::ReconcileResult& result, bool dry_run)
{
    std::cout << (dry_run ? "Dry run" : "Reconcile") << " summary:" << std::endl;
    std::cout << "  Entries read: " << result.total << std::endl;
    std::cout << "  Unique remote paths: " << result.unique << " ("
              << result.deduplicated << " duplicates collapsed)" << std::endl;
    std::cout << "  " << (dry_run ? "Would retry: " : "Retried: ")
              << result.retried << std::endl;
    if (!dry_run)
    {
        std::cout << "  Still failing: " << result.still_failed << std::endl;
    }
    std::cout << "  Local file missing: " << result.no_file << std::endl;
}

}  // namespace

int
main(int argc, char* argv[])
{
    tools::RetryCommandLine options = tools::parse_retry_argv(argc, argv);

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
        const common::Tuning& tuning = options.tuning;
        Logger::set_level(tuning.log_level);

        auto log = std::make_shared<delivery::DeadLetterLog>(
            tuning.dead_letter_file);

        delivery::UploaderOptions uploader_options;
        uploader_options.timeout =
            std::chrono::milliseconds(tuning.upload_timeout_ms);
        auto uploader = std::make_shared<delivery::Uploader>(
            delivery::make_remote_store(tuning.bucket.value_or("")),
            log,
            uploader_options);

        delivery::Reconciler reconciler(uploader, log);

        if (options.status)
        {
            print_status(reconciler.status(), log->path());
            return 0;
        }

        if (options.dry_run)
        {
            print_result(reconciler.dry_run(), true);
            return 0;
        }

        delivery::ReconcileResult result = reconciler.run();
        print_result(result, false);
        return result.still_failed == 0 ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
