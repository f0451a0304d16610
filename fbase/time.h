// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIME_H_1739462058712340958
#define TIME_H_1739462058712340958

#include <ctime>
#include <string>


namespace fbase
{
struct TimeComp //replaces std::tm and SYSTEMTIME
{
    int year   = 0; //seemingly no year restrictions
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getLocalTime(time_t utc = std::time(nullptr)); //convert time_t (UTC) to local time components, returns TimeComp() on error

const char formatTimeTag[] = "%H:%M:%S";
const char formatIsoDateTimeTag[] = "%Y-%m-%d %H:%M:%S";

//format as specified by "std::strftime", returns empty string on failure
std::string formatTime(const char* format, const TimeComp& tc);








//############################ implementation ##############################
inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc{};
    if (!::localtime_r(&utc, &ctc)) //thread-safe version of localtime()
        return TimeComp();

    return
    {
        .year   = ctc.tm_year + 1900,
        .month  = ctc.tm_mon + 1,
        .day    = ctc.tm_mday,
        .hour   = ctc.tm_hour,
        .minute = ctc.tm_min,
        .second = ctc.tm_sec,
    };
}


inline
std::string formatTime(const char* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return std::string();

    std::tm ctc{};
    ctc.tm_year  = tc.year - 1900;
    ctc.tm_mon   = tc.month - 1;
    ctc.tm_mday  = tc.day;
    ctc.tm_hour  = tc.hour;
    ctc.tm_min   = tc.minute;
    ctc.tm_sec   = tc.second;
    ctc.tm_isdst = -1;

    char buffer[256] = {};
    const size_t charsWritten = std::strftime(buffer, sizeof(buffer), format, &ctc);
    return std::string(buffer, charsWritten);
}
}

#endif //TIME_H_1739462058712340958
