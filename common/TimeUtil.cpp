#include "TimeUtil.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace netwatch::common
{
    Timestamp Now()
    {
        auto now = std::chrono::system_clock::now();
        return std::chrono::time_point_cast<std::chrono::microseconds>(now);
    }

    std::string FormatTimestamp(Timestamp ts)
    {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
        long long seconds = micros / 1000000;
        long long fraction = micros % 1000000;
        if (fraction < 0)
        {
            fraction += 1000000;
            seconds -= 1;
        }

        std::time_t t = static_cast<std::time_t>(seconds);
        std::tm utc{};
        gmtime_r(&t, &utc);

        char buf[48];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                      utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                      utc.tm_hour, utc.tm_min, utc.tm_sec, fraction);
        return buf;
    }

    std::optional<Timestamp> ParseTimestamp(const std::string& text)
    {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        int consumed = 0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                        &year, &month, &day, &hour, &minute, &second, &consumed) != 6)
            return std::nullopt;

        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
            return std::nullopt;

        size_t pos = static_cast<size_t>(consumed);
        long long micros = 0;
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            int digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
            {
                if (digits < 6)
                {
                    micros = micros * 10 + (text[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (digits == 0)
                return std::nullopt;
            for (; digits < 6; ++digits)
                micros *= 10;
        }

        long offset_seconds = 0;
        if (pos < text.size())
        {
            char sign = text[pos];
            if (sign == 'Z' && pos + 1 == text.size())
            {
                pos = text.size();
            }
            else if (sign == '+' || sign == '-')
            {
                int off_h = 0, off_m = 0;
                if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &off_h, &off_m) != 2 || text.size() != pos + 6)
                    return std::nullopt;
                offset_seconds = off_h * 3600L + off_m * 60L;
                if (sign == '-')
                    offset_seconds = -offset_seconds;
            }
            else
            {
                return std::nullopt;
            }
        }

        std::tm utc{};
        utc.tm_year = year - 1900;
        utc.tm_mon = month - 1;
        utc.tm_mday = day;
        utc.tm_hour = hour;
        utc.tm_min = minute;
        utc.tm_sec = second;
        std::time_t t = timegm(&utc);

        auto since_epoch = std::chrono::seconds(static_cast<long long>(t) - offset_seconds) +
                           std::chrono::microseconds(micros);
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(since_epoch));
    }
}
