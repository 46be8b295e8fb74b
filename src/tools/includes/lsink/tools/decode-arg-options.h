#pragma once

#include "lsink/common/record.h"

#include <optional>
#include <string>

namespace lsink::tools {

struct DecodeCommandLine
{
    /** Chunked binary file to read */
    std::optional<std::string> input_file;

    common::RecordKind kind = common::RecordKind::EVENTS;

    /** Print only frame and record counts */
    bool count_only = false;

    std::string log_level = "warn";

    bool show_help = false;
    bool valid = true;
    std::optional<std::string> error_message;
    std::string help_text;
};

DecodeCommandLine
parse_decode_argv(int argc, char* argv[]);

}  // namespace lsink::tools
