#pragma once

#include "lsink/common/record.h"
#include "lsink/common/tuning.h"
#include "lsink/ingest/ingest-writer.h"

#include <optional>
#include <string>

namespace lsink::tools {

/**
 * Type-safe structure for lsink-ingest command line options
 */
struct IngestCommandLine
{
    /** JSON-lines input, "-" or absent for stdin */
    std::optional<std::string> input_file;

    /** Kind of every record in the input */
    common::RecordKind kind = common::RecordKind::EVENTS;

    ingest::OutputFormat format = ingest::OutputFormat::BINARY;

    common::Tuning tuning;

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse command line arguments, then fill unset tuning options from the
 * environment
 */
IngestCommandLine
parse_ingest_argv(int argc, char* argv[]);

}  // namespace lsink::tools
