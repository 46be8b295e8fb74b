#include "lsink/common/tuning.h"
#include "lsink/common/errors.h"

#include <algorithm>
#include <cctype>
#include <thread>
#include <unordered_map>

namespace po = boost::program_options;
namespace lsink::common {

namespace {

int64_t
positive(const po::variables_map& vm, const char* name)
{
    int64_t value = vm[name].as<int64_t>();
    if (value <= 0)
    {
        throw ConfigError(
            std::string("--") + name + " must be positive (got " +
            std::to_string(value) + ")");
    }
    return value;
}

bool
is_false_text(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), ::tolower);
    return text == "false" || text == "0" || text == "no" || text == "off";
}

}  // namespace

std::string_view
to_string(ValidationPolicy policy)
{
    return policy == ValidationPolicy::FAIL ? "fail" : "record";
}

size_t
default_max_workers()
{
    unsigned hw = std::thread::hardware_concurrency();
    if (hw <= 2)
        return 2;
    return std::max<size_t>(2, hw - 1);
}

po::options_description
tuning_options_description()
{
    po::options_description desc("Tuning options (environment in brackets)");
    desc.add_options()(
        "max-workers",
        po::value<int64_t>(),
        "Encoder pool size [MAX_WORKERS] (default: hardware threads - 1)")(
        "parquet-workers",
        po::value<int64_t>(),
        "Materializer pool size [PARQUET_WORKERS] (default: max workers)")(
        "chunk-size",
        po::value<int64_t>()->default_value(2000),
        "Records per binary frame [CHUNK_SIZE]")(
        "compression-level",
        po::value<int64_t>()->default_value(1),
        "zstd level 1-22 for frames and parquet [ZSTD_LEVEL]")(
        "row-group-size",
        po::value<int64_t>()->default_value(100000),
        "Parquet rows per row group [PARQUET_ROW_GROUP]")(
        "max-rows-per-file",
        po::value<int64_t>()->default_value(5000),
        "Rows buffered before a flush [MAX_ROWS_PER_FILE]")(
        "flush-interval-ms",
        po::value<int64_t>()->default_value(30000),
        "Time-based flush interval [FLUSH_INTERVAL_MS]")(
        "scratch-dir",
        po::value<std::string>()->default_value("/tmp/ledger_raw"),
        "Local directory for files awaiting delivery [SCRATCH_DIR]")(
        "bucket",
        po::value<std::string>(),
        "Remote bucket, or file://<dir> for a local mirror [GCS_BUCKET]")(
        "no-upload",
        po::bool_switch(),
        "Keep files local, skip delivery")(
        "gcs-enabled",
        po::value<std::string>()->default_value("true"),
        "Delivery enabled [GCS_ENABLED]")(
        "upload-timeout-ms",
        po::value<int64_t>()->default_value(300000),
        "Timeout per remote operation [UPLOAD_TIMEOUT_MS]")(
        "dead-letter",
        po::value<std::string>(),
        "Dead-letter log (default: <scratch>/failed-uploads.jsonl) "
        "[DEAD_LETTER_FILE]")(
        "validation-policy",
        po::value<std::string>()->default_value("record"),
        "Parquet validation policy: record or fail [VALIDATION_POLICY]")(
        "log-level,l",
        po::value<std::string>()->default_value("info"),
        "Log level (error, warn, info, debug) [LOG_LEVEL]");
    return desc;
}

std::string
tuning_env_mapper(const std::string& env_var)
{
    static const std::unordered_map<std::string, std::string> env_map = {
        {"MAX_WORKERS", "max-workers"},
        {"PARQUET_WORKERS", "parquet-workers"},
        {"CHUNK_SIZE", "chunk-size"},
        {"ZSTD_LEVEL", "compression-level"},
        {"PARQUET_ROW_GROUP", "row-group-size"},
        {"MAX_ROWS_PER_FILE", "max-rows-per-file"},
        {"FLUSH_INTERVAL_MS", "flush-interval-ms"},
        {"SCRATCH_DIR", "scratch-dir"},
        {"GCS_BUCKET", "bucket"},
        {"GCS_ENABLED", "gcs-enabled"},
        {"UPLOAD_TIMEOUT_MS", "upload-timeout-ms"},
        {"DEAD_LETTER_FILE", "dead-letter"},
        {"VALIDATION_POLICY", "validation-policy"},
        {"LOG_LEVEL", "log-level"}};

    auto it = env_map.find(env_var);
    return it == env_map.end() ? std::string() : it->second;
}

void
store_tuning_environment(
    const po::options_description& tuning_desc,
    po::variables_map& vm)
{
    try
    {
        po::store(po::parse_environment(tuning_desc, tuning_env_mapper), vm);
    }
    catch (const po::error& e)
    {
        throw ConfigError(std::string("Invalid environment value: ") + e.what());
    }
}

Tuning
tuning_from_variables(const po::variables_map& vm)
{
    Tuning tuning;

    tuning.max_workers = vm.count("max-workers")
        ? static_cast<size_t>(positive(vm, "max-workers"))
        : default_max_workers();
    tuning.parquet_workers = vm.count("parquet-workers")
        ? static_cast<size_t>(positive(vm, "parquet-workers"))
        : tuning.max_workers;

    tuning.chunk_size = static_cast<size_t>(positive(vm, "chunk-size"));
    tuning.row_group_size = static_cast<size_t>(positive(vm, "row-group-size"));
    tuning.max_rows_per_file =
        static_cast<size_t>(positive(vm, "max-rows-per-file"));
    tuning.flush_interval_ms =
        static_cast<uint64_t>(positive(vm, "flush-interval-ms"));
    tuning.upload_timeout_ms =
        static_cast<uint64_t>(positive(vm, "upload-timeout-ms"));

    int64_t level = vm["compression-level"].as<int64_t>();
    if (level < 1 || level > 22)
    {
        throw ConfigError(
            "--compression-level must be between 1 and 22 (got " +
            std::to_string(level) + ")");
    }
    tuning.compression_level = static_cast<int>(level);

    tuning.scratch_dir = vm["scratch-dir"].as<std::string>();
    if (tuning.scratch_dir.empty())
    {
        throw ConfigError("--scratch-dir must not be empty");
    }

    if (vm.count("bucket") && !vm["bucket"].as<std::string>().empty())
    {
        tuning.bucket = vm["bucket"].as<std::string>();
    }

    tuning.upload_enabled = !is_false_text(vm["gcs-enabled"].as<std::string>());
    if (vm.count("no-upload") && vm["no-upload"].as<bool>())
    {
        tuning.upload_enabled = false;
    }

    tuning.dead_letter_file = vm.count("dead-letter")
        ? vm["dead-letter"].as<std::string>()
        : tuning.scratch_dir + "/failed-uploads.jsonl";

    const auto& policy = vm["validation-policy"].as<std::string>();
    if (policy == "record")
    {
        tuning.validation_policy = ValidationPolicy::RECORD;
    }
    else if (policy == "fail")
    {
        tuning.validation_policy = ValidationPolicy::FAIL;
    }
    else
    {
        throw ConfigError(
            "--validation-policy must be record or fail (got " + policy + ")");
    }

    tuning.log_level = vm["log-level"].as<std::string>();
    static const char* levels[] = {
        "none", "error", "warn", "warning", "info", "debug"};
    if (std::find(std::begin(levels), std::end(levels), tuning.log_level) ==
        std::end(levels))
    {
        throw ConfigError("--log-level must be one of error, warn, info, debug");
    }

    return tuning;
}

}  // namespace lsink::common
