#pragma once
#include <chrono>
#include <ctime>

class DosTime
{
public:
    static unsigned int Now()
    {
        auto now = std::chrono::system_clock::now();
        return FromTimeT(std::chrono::system_clock::to_time_t(now));
    }

    /// @brief Convert a timestamp to MS-DOS format, date in the high word, time in the low word
    /// @param tt Timestamp, dates before 1980 are clamped to 1980-01-01 00:00:00
    /// and dates after 2107 to 2107-12-31 23:59:58
    static unsigned int FromTimeT(const std::time_t tt)
    {
        const tm* local_tm_ptr = localtime(&tt);
        // Out of range for the C library
        if (local_tm_ptr == nullptr)
        {
            return (127u << 25) | (12u << 21) | (31u << 16) | (23u << 11) | (59u << 5) | 29u;
        }
        const tm local_tm = *local_tm_ptr;

        int year = local_tm.tm_year + 1900;
        int month = local_tm.tm_mon + 1;
        int day = local_tm.tm_mday;
        int hour = local_tm.tm_hour;
        int min = local_tm.tm_min;
        int sec = local_tm.tm_sec;

        if (year < 1980)
        {
            year = 1980;
            month = 1;
            day = 1;
            hour = 0;
            min = 0;
            sec = 0;
        }
        else if (year > 2107)
        {
            year = 2107;
            month = 12;
            day = 31;
            hour = 23;
            min = 59;
            sec = 58;
        }

        return (static_cast<unsigned int>(year - 1980) << 25)
            | (static_cast<unsigned int>(month) << 21)
            | (static_cast<unsigned int>(day) << 16)
            | (static_cast<unsigned int>(hour) << 11)
            | (static_cast<unsigned int>(min) << 5)
            | (static_cast<unsigned int>(sec) >> 1);
    }
};
