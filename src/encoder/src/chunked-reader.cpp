#include "lsink/encoder/chunked-reader.h"
#include "lsink/common/errors.h"
#include "lsink/common/utils.h"
#include "lsink/encoder/frame-codec.h"

#include <cerrno>
#include <cstring>

namespace lsink::encoder {

ChunkedReader::ChunkedReader(const std::string& path)
    : path_(path), in_(path, std::ios::binary)
{
    if (!in_.is_open())
    {
        throw EncoderIoError(
            "Failed to open input file " + path_ + ": " +
            std::strerror(errno));
    }
    in_.seekg(0, std::ios::end);
    std::streamoff size = in_.tellg();
    in_.seekg(0, std::ios::beg);
    if (size < 0 || !in_.good())
    {
        throw EncoderIoError("Failed to determine size of " + path_);
    }
    file_size_ = static_cast<uint64_t>(size);
}

bool
ChunkedReader::next_payload(std::string& payload)
{
    uint8_t prefix[FRAME_PREFIX_SIZE];
    in_.read(reinterpret_cast<char*>(prefix), sizeof(prefix));
    std::streamsize got = in_.gcount();
    if (got == 0 && in_.eof())
    {
        return false;
    }
    if (got != static_cast<std::streamsize>(sizeof(prefix)))
    {
        throw CorruptFrameError(
            "Truncated frame prefix after frame " +
            std::to_string(frames_read_) + " in " + path_);
    }

    uint32_t length = common::get_uint32_be(prefix);
    uint64_t offset = static_cast<uint64_t>(in_.tellg());
    uint64_t available = offset < file_size_ ? file_size_ - offset : 0;
    if (length > available)
    {
        throw CorruptFrameError(
            "Truncated frame payload in frame " +
            std::to_string(frames_read_) + " of " + path_ + ": expected " +
            std::to_string(length) + " bytes, " + std::to_string(available) +
            " left in file");
    }

    std::string compressed(length, '\0');
    in_.read(compressed.data(), static_cast<std::streamsize>(length));
    if (in_.gcount() != static_cast<std::streamsize>(length))
    {
        throw CorruptFrameError(
            "Truncated frame payload in frame " +
            std::to_string(frames_read_) + " of " + path_ + ": expected " +
            std::to_string(length) + " bytes, got " +
            std::to_string(in_.gcount()));
    }

    payload = decompress_payload(compressed);
    ++frames_read_;
    return true;
}

bool
ChunkedReader::next(ledger::EventBatch& batch)
{
    std::string payload;
    if (!next_payload(payload))
        return false;
    if (!batch.ParseFromString(payload))
    {
        throw CorruptFrameError(
            "Frame " + std::to_string(frames_read_ - 1) + " of " + path_ +
            " is not an EventBatch");
    }
    return true;
}

bool
ChunkedReader::next(ledger::UpdateBatch& batch)
{
    std::string payload;
    if (!next_payload(payload))
        return false;
    if (!batch.ParseFromString(payload))
    {
        throw CorruptFrameError(
            "Frame " + std::to_string(frames_read_ - 1) + " of " + path_ +
            " is not an UpdateBatch");
    }
    return true;
}

std::vector<ledger::Event>
read_all_events(const std::string& path)
{
    std::vector<ledger::Event> events;
    ChunkedReader reader(path);
    ledger::EventBatch batch;
    while (reader.next(batch))
    {
        for (auto& event : *batch.mutable_events())
            events.push_back(std::move(event));
        batch.Clear();
    }
    return events;
}

std::vector<ledger::Update>
read_all_updates(const std::string& path)
{
    std::vector<ledger::Update> updates;
    ChunkedReader reader(path);
    ledger::UpdateBatch batch;
    while (reader.next(batch))
    {
        for (auto& update : *batch.mutable_updates())
            updates.push_back(std::move(update));
        batch.Clear();
    }
    return updates;
}

uint64_t
count_records(const std::string& path, common::RecordKind kind)
{
    uint64_t total = 0;
    ChunkedReader reader(path);
    if (kind == common::RecordKind::UPDATES)
    {
        ledger::UpdateBatch batch;
        while (reader.next(batch))
            total += static_cast<uint64_t>(batch.updates_size());
    }
    else if (kind == common::RecordKind::EVENTS)
    {
        ledger::EventBatch batch;
        while (reader.next(batch))
            total += static_cast<uint64_t>(batch.events_size());
    }
    else
    {
        throw InvalidJobError("Contracts have no binary encoding");
    }
    return total;
}

}  // namespace lsink::encoder
