#pragma once

#include <boost/program_options.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lsink::common {

enum class ValidationPolicy {
    RECORD,  // failures reported in the result, job succeeds
    FAIL     // failures raise ValidationFailedError
};

std::string_view
to_string(ValidationPolicy policy);

/**
 * Tuning knobs shared by the tools. Every field can come from the
 * environment or the command line (command line wins).
 */
struct Tuning
{
    /** Encoder pool size */
    size_t max_workers = 2;

    /** Materializer pool size */
    size_t parquet_workers = 2;

    /** Records per binary frame */
    size_t chunk_size = 2000;

    /** zstd level for frames and parquet (1-22) */
    int compression_level = 1;

    /** Rows per parquet row group */
    size_t row_group_size = 100000;

    /** Row-count flush threshold for the ingest writer */
    size_t max_rows_per_file = 5000;

    /** Time-based flush for the ingest writer */
    uint64_t flush_interval_ms = 30000;

    /** Local root for files awaiting delivery */
    std::string scratch_dir = "/tmp/ledger_raw";

    /** Remote bucket; "file://<dir>" selects the filesystem store */
    std::optional<std::string> bucket;

    /** When false, files stay in the scratch directory */
    bool upload_enabled = true;

    /** Timeout applied to each remote operation */
    uint64_t upload_timeout_ms = 300000;

    /** Dead-letter log path, defaults to <scratch>/failed-uploads.jsonl */
    std::string dead_letter_file;

    ValidationPolicy validation_policy = ValidationPolicy::RECORD;

    /** Log level (error, warn, info, debug) */
    std::string log_level = "info";
};

// Hardware threads minus one, at least 2
size_t
default_max_workers();

/**
 * Declare the tuning options. Tools add these to their own description so
 * one variables_map carries both.
 */
boost::program_options::options_description
tuning_options_description();

/**
 * Map an environment variable name to its tuning option name, or "" when
 * the variable is not a tuning input. Used with po::parse_environment.
 */
std::string
tuning_env_mapper(const std::string& env_var);

/**
 * Store tuning values from the process environment. Call after the command
 * line has been stored: po::store never replaces a value already given
 * explicitly, so the command line wins.
 */
void
store_tuning_environment(
    const boost::program_options::options_description& tuning_desc,
    boost::program_options::variables_map& vm);

/**
 * Build and validate a Tuning from parsed options.
 * @throws ConfigError on non-positive sizes, a level above 9, an unknown
 * validation policy or log level
 */
Tuning
tuning_from_variables(const boost::program_options::variables_map& vm);

}  // namespace lsink::common
