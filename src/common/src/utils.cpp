#include "lsink/common/utils.h"
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace lsink::common {

namespace {

// Read exactly `width` digits starting at `pos`
bool
read_digits(std::string_view text, size_t& pos, size_t width, int& out)
{
    if (pos + width > text.size())
        return false;
    int value = 0;
    for (size_t i = 0; i < width; ++i)
    {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
        value = value * 10 + (c - '0');
    }
    pos += width;
    out = value;
    return true;
}

bool
expect(std::string_view text, size_t& pos, char c)
{
    if (pos >= text.size() || text[pos] != c)
        return false;
    ++pos;
    return true;
}

}  // namespace

std::string
format_iso_millis(int64_t unix_millis)
{
    int64_t secs = unix_millis / 1000;
    int64_t ms = unix_millis % 1000;
    if (ms < 0)
    {
        ms += 1000;
        secs -= 1;
    }

    time_t t = static_cast<time_t>(secs);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    char buf[40];
    std::snprintf(
        buf,
        sizeof(buf),
        "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm_utc.tm_year + 1900,
        tm_utc.tm_mon + 1,
        tm_utc.tm_mday,
        tm_utc.tm_hour,
        tm_utc.tm_min,
        tm_utc.tm_sec,
        static_cast<int>(ms));
    return buf;
}

std::optional<int64_t>
parse_iso_millis(std::string_view text)
{
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0, millis = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day))
    {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31)
        return std::nullopt;

    int offset_minutes = 0;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' '))
    {
        ++pos;
        if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, minute))
        {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':')
        {
            ++pos;
            if (!read_digits(text, pos, 2, second))
                return std::nullopt;
        }
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            int scale = 100;
            size_t digits = 0;
            while (pos < text.size() &&
                   std::isdigit(static_cast<unsigned char>(text[pos])))
            {
                if (scale > 0)
                {
                    millis += (text[pos] - '0') * scale;
                    scale /= 10;
                }
                ++pos;
                ++digits;
            }
            if (digits == 0)
                return std::nullopt;
        }
        if (pos < text.size())
        {
            char zone = text[pos];
            if (zone == 'Z' || zone == 'z')
            {
                ++pos;
            }
            else if (zone == '+' || zone == '-')
            {
                ++pos;
                int oh = 0, om = 0;
                if (!read_digits(text, pos, 2, oh))
                    return std::nullopt;
                expect(text, pos, ':');
                if (!read_digits(text, pos, 2, om))
                    return std::nullopt;
                offset_minutes = (oh * 60 + om) * (zone == '+' ? 1 : -1);
            }
        }
    }

    if (pos != text.size())
        return std::nullopt;
    if (hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    std::tm tm_utc{};
    tm_utc.tm_year = year - 1900;
    tm_utc.tm_mon = month - 1;
    tm_utc.tm_mday = day;
    tm_utc.tm_hour = hour;
    tm_utc.tm_min = minute;
    tm_utc.tm_sec = second;
    time_t secs = timegm(&tm_utc);

    return static_cast<int64_t>(secs) * 1000 + millis -
        static_cast<int64_t>(offset_minutes) * 60 * 1000;
}

int64_t
now_millis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace lsink::common
