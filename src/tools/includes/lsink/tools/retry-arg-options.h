#pragma once

#include "lsink/common/tuning.h"

#include <optional>
#include <string>

namespace lsink::tools {

/**
 * Type-safe structure for lsink-retry-uploads command line options
 */
struct RetryCommandLine
{
    /** Report what would be retried, change nothing */
    bool dry_run = false;

    /** Print a summary of the dead-letter log and exit */
    bool status = false;

    common::Tuning tuning;

    bool show_help = false;
    bool valid = true;
    std::optional<std::string> error_message;
    std::string help_text;
};

RetryCommandLine
parse_retry_argv(int argc, char* argv[]);

}  // namespace lsink::tools
