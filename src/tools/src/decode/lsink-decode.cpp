#include "ledger.pb.h"
#include "lsink/common/errors.h"
#include "lsink/core/logger.h"
#include "lsink/encoder/chunked-reader.h"
#include "lsink/tools/decode-arg-options.h"

#include <google/protobuf/util/json_util.h>
#include <iostream>
#include <string>

using namespace lsink;

namespace {

void
print_json(const google::protobuf::Message& message)
{
    google::protobuf::util::JsonPrintOptions print_options;
    print_options.preserve_proto_field_names = true;

    std::string json;
    auto status =
        google::protobuf::util::MessageToJsonString(message, &json, print_options);
    if (!status.ok())
    {
        throw LedgerSinkError(
            "Cannot render record as JSON: " + status.ToString());
    }
    std::cout << json << '\n';
}

template <typename Batch, typename Items>
uint64_t
decode(encoder::ChunkedReader& reader, bool count_only, Items items)
{
    uint64_t records = 0;
    Batch batch;
    while (reader.next(batch))
    {
        const auto& list = items(batch);
        records += static_cast<uint64_t>(list.size());
        if (!count_only)
        {
            for (const auto& item : list)
            {
                print_json(item);
            }
        }
    }
    return records;
}

}  // namespace

int
main(int argc, char* argv[])
{
    tools::DecodeCommandLine options = tools::parse_decode_argv(argc, argv);

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
        if (!Logger::set_level(options.log_level))
        {
            std::cerr << "Unknown log level: " << options.log_level
                      << std::endl;
            return 1;
        }

        encoder::ChunkedReader reader(*options.input_file);
        uint64_t records = 0;
        if (options.kind == common::RecordKind::UPDATES)
        {
            records = decode<ledger::UpdateBatch>(
                reader,
                options.count_only,
                [](const ledger::UpdateBatch& b) -> const auto& {
                    return b.updates();
                });
        }
        else
        {
            records = decode<ledger::EventBatch>(
                reader,
                options.count_only,
                [](const ledger::EventBatch& b) -> const auto& {
                    return b.events();
                });
        }

        if (options.count_only)
        {
            std::cout << "Frames: " << reader.frames_read() << std::endl;
            std::cout << "Records: " << records << std::endl;
        }
        else
        {
            std::cout.flush();
        }
        LOGI(
            "Decoded ",
            records,
            " ",
            common::to_string(options.kind),
            " from ",
            reader.frames_read(),
            " frames");
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
