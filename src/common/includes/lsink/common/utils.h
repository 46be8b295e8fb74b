#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lsink::common {

/**
 * Format a Unix timestamp in milliseconds as ISO-8601 UTC with milliseconds
 * (e.g. "2024-03-05T07:08:09.123Z")
 */
std::string
format_iso_millis(int64_t unix_millis);

/**
 * Parse an ISO-8601 timestamp into Unix milliseconds.
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS", optional fractional seconds
 * of any precision (truncated to millis), and a trailing "Z" or +HH:MM /
 * -HH:MM offset. A space is accepted in place of the 'T'.
 *
 * @return std::nullopt when the text is not a timestamp
 */
std::optional<int64_t>
parse_iso_millis(std::string_view text);

// Current wall clock as Unix milliseconds
int64_t
now_millis();

/**
 * Write uint32_t to buffer in big-endian format (platform-independent)
 * @param buffer Output buffer (must have at least 4 bytes available)
 * @param value Value to write
 */
inline void
put_uint32_be(uint8_t* buffer, uint32_t value)
{
    buffer[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    buffer[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buffer[3] = static_cast<uint8_t>(value & 0xFF);
}

/**
 * Read uint32_t from buffer in big-endian format (platform-independent)
 * @param buffer Input buffer (must have at least 4 bytes available)
 * @return The uint32_t value
 */
inline uint32_t
get_uint32_be(const uint8_t* buffer)
{
    return (static_cast<uint32_t>(buffer[0]) << 24) |
        (static_cast<uint32_t>(buffer[1]) << 16) |
        (static_cast<uint32_t>(buffer[2]) << 8) |
        static_cast<uint32_t>(buffer[3]);
}

}  // namespace lsink::common
