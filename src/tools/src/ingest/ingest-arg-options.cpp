#include "lsink/tools/ingest-arg-options.h"
#include "lsink/common/errors.h"

#include <boost/program_options.hpp>
#include <sstream>

namespace po = boost::program_options;

namespace lsink::tools {

IngestCommandLine
parse_ingest_argv(int argc, char* argv[])
{
    IngestCommandLine options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "input-file",
        po::value<std::string>(),
        "JSON-lines record file (default: stdin)")(
        "kind,k",
        po::value<std::string>()->default_value("events"),
        "Record kind: events, updates or contracts")(
        "format,f",
        po::value<std::string>()->default_value("binary"),
        "Output format: binary (.pb.zst) or parquet");

    po::options_description tuning_desc = common::tuning_options_description();
    po::options_description all;
    all.add(desc).add(tuning_desc);

    po::positional_options_description pos_desc;
    pos_desc.add("input-file", 1);

    std::ostringstream help_stream;
    help_stream
        << "Ledger Ingest" << std::endl
        << "-------------" << std::endl
        << "Buffers JSON-lines ledger records by partition and writes them as"
        << std::endl
        << "chunked binary or Parquet files, uploading each file when a bucket"
        << std::endl
        << "is configured." << std::endl
        << std::endl
        << "Usage: " << (argc > 0 ? argv[0] : "lsink-ingest")
        << " [options] [input.jsonl]" << std::endl
        << all << std::endl
        << "Examples:" << std::endl
        << "  lsink-ingest --kind updates updates.jsonl" << std::endl
        << "  GCS_BUCKET=my-bucket lsink-ingest -f parquet < events.jsonl"
        << std::endl
        << "  lsink-ingest --bucket file:///data/mirror --no-upload events.jsonl"
        << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(pos_desc)
                .run(),
            vm);
        common::store_tuning_environment(tuning_desc, vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("input-file") && vm["input-file"].as<std::string>() != "-")
        {
            options.input_file = vm["input-file"].as<std::string>();
        }

        auto kind = common::parse_record_kind(vm["kind"].as<std::string>());
        if (!kind)
        {
            options.valid = false;
            options.error_message =
                "Unknown record kind: " + vm["kind"].as<std::string>();
            return options;
        }
        options.kind = *kind;

        auto format = ingest::parse_output_format(vm["format"].as<std::string>());
        if (!format)
        {
            options.valid = false;
            options.error_message =
                "Unknown output format: " + vm["format"].as<std::string>();
            return options;
        }
        options.format = *format;

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
