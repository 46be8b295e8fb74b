#include "lsink/tools/decode-arg-options.h"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <sstream>

namespace po = boost::program_options;

namespace lsink::tools {

namespace {

// "updates-..." files hold updates, everything else events
common::RecordKind
kind_from_file_name(const std::string& path)
{
    std::string name = boost::filesystem::path(path).filename().string();
    return name.rfind("updates", 0) == 0 ? common::RecordKind::UPDATES
                                         : common::RecordKind::EVENTS;
}

}  // namespace

DecodeCommandLine
parse_decode_argv(int argc, char* argv[])
{
    DecodeCommandLine options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "input-file",
        po::value<std::string>(),
        "Chunked binary file (.pb.zst)")(
        "kind,k",
        po::value<std::string>(),
        "Record kind: events or updates (default: from the file name)")(
        "count,c", "Print frame and record counts only")(
        "log-level",
        po::value<std::string>()->default_value("warn"),
        "Log level (error, warn, info, debug)");

    po::positional_options_description pos_desc;
    pos_desc.add("input-file", 1);

    std::ostringstream help_stream;
    help_stream << "Ledger Decode" << std::endl
                << "-------------" << std::endl
                << "Prints the records of a chunked binary file as JSON lines."
                << std::endl
                << std::endl
                << "Usage: " << (argc > 0 ? argv[0] : "lsink-decode")
                << " [options] <input.pb.zst>" << std::endl
                << desc << std::endl
                << "Examples:" << std::endl
                << "  lsink-decode events-000001.pb.zst" << std::endl
                << "  lsink-decode --count --kind updates batch.pb.zst"
                << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(pos_desc)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (!vm.count("input-file"))
        {
            options.valid = false;
            options.error_message = "Input file is required";
            return options;
        }
        options.input_file = vm["input-file"].as<std::string>();

        if (vm.count("kind"))
        {
            auto kind = common::parse_record_kind(vm["kind"].as<std::string>());
            if (!kind || *kind == common::RecordKind::CONTRACTS)
            {
                options.valid = false;
                options.error_message =
                    "Binary files hold events or updates, not " +
                    vm["kind"].as<std::string>();
                return options;
            }
            options.kind = *kind;
        }
        else
        {
            options.kind = kind_from_file_name(*options.input_file);
        }

        options.count_only = vm.count("count") > 0;
        options.log_level = vm["log-level"].as<std::string>();
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }

    return options;
}

}  // namespace lsink::tools
