#include "lsink/tools/retry-arg-options.h"
#include "lsink/common/errors.h"

#include <boost/program_options.hpp>
#include <sstream>

namespace po = boost::program_options;

namespace lsink::tools {

RetryCommandLine
parse_retry_argv(int argc, char* argv[])
{
    RetryCommandLine options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "dry-run,n", "Show what would be retried without uploading")(
        "status,s", "Summarize the dead-letter log and exit");

    po::options_description tuning_desc = common::tuning_options_description();
    po::options_description all;
    all.add(desc).add(tuning_desc);

    std::ostringstream help_stream;
    help_stream << "Upload Reconciler" << std::endl
                << "-----------------" << std::endl
                << "Retries uploads recorded in the dead-letter log. Entries"
                << std::endl
                << "whose local file is gone are dropped; entries that fail"
                << std::endl
                << "again stay in the log for the next run." << std::endl
                << std::endl
                << "Usage: " << (argc > 0 ? argv[0] : "lsink-retry-uploads")
                << " [options]" << std::endl
                << all << std::endl
                << "Examples:" << std::endl
                << "  lsink-retry-uploads --status" << std::endl
                << "  lsink-retry-uploads --dry-run" << std::endl
                << "  GCS_BUCKET=my-bucket lsink-retry-uploads" << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all).run(), vm);
        common::store_tuning_environment(tuning_desc, vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        options.dry_run = vm.count("dry-run") > 0;
        options.status = vm.count("status") > 0;
        if (options.dry_run && options.status)
        {
            options.valid = false;
            options.error_message =
                "--dry-run and --status cannot be used together";
            return options;
        }

        options.tuning = common::tuning_from_variables(vm);
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }
    catch (const ConfigError& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }

    return options;
}

}  // namespace lsink::tools
