// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIME_H_8457092814324342453627
#define TIME_H_8457092814324342453627

#include <ctime>
#include <utility>
#include "zstring.h"


namespace zen
{
struct TimeComp //replaces std::tm
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getUtcTime(time_t utc); //convert time_t (UTC) to UTC time components, returns TimeComp() on error
TimeComp getUtcTime(); //utc = std::time()
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc); //convert UTC time components to time_t (UTC)

TimeComp getLocalTime(time_t utc); //convert time_t (UTC) to local time components, returns TimeComp() on error
TimeComp getLocalTime(); //utc = std::time()

/* format (current) date and time; example:
            formatTime("%Y|%m|%d");      -> "2011|10|29"
            formatTime(formatIsoTimeTag); -> "17:55:34"         */
std::string formatTime(const char* format, const TimeComp& tc = getLocalTime()); //format as specified by "std::strftime", returns empty string on error

const char* const formatIsoDateTag     = "%Y-%m-%d";          //e.g. 2001-08-23
const char* const formatIsoTimeTag     = "%H:%M:%S";          //e.g. 14:55:02
const char* const formatIsoDateTimeTag = "%Y-%m-%d %H:%M:%S"; //e.g. 2001-08-23 14:55:02

//example: parseTime("%Y-%m-%d %H:%M:%S",  "2001-08-23 14:55:02");
TimeComp parseTime(std::string_view format, std::string_view str); //similar to ::strptime(); returns TimeComp() on error

//RFC 3339/ISO 8601 UTC timestamp with optional fractional seconds: e.g. "2018-09-29T08:39:12.053Z"
std::pair<time_t, bool /*success*/> parseIsoUtcTime(std::string_view str);

//format: [-][[d.]HH:]MM:SS    e.g. -1.23:45:67
std::string formatTimeSpan(int64_t timeInSec);









//############################ implementation ##############################
namespace impl
{
inline
std::tm toClibTimeComponents(const TimeComp& tc)
{
    assert(1 <= tc.month  && tc.month  <= 12 &&
           1 <= tc.day    && tc.day    <= 31 &&
           0 <= tc.hour   && tc.hour   <= 23 &&
           0 <= tc.minute && tc.minute <= 59 &&
           0 <= tc.second && tc.second <= 61);
    std::tm ctc = {};
    ctc.tm_sec   = tc.second;      //0-60 (including leap second)
    ctc.tm_min   = tc.minute;      //0-59
    ctc.tm_hour  = tc.hour;        //0-23
    ctc.tm_mday  = tc.day;         //1-31
    ctc.tm_mon   = tc.month - 1;   //0-11
    ctc.tm_year  = tc.year - 1900; //years since 1900
    ctc.tm_isdst = -1;             //< 0 if the information is not available
    return ctc;
}


inline
TimeComp toZenTimeComponents(const std::tm& ctc)
{
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
}


inline
TimeComp getUtcTime(time_t utc)
{
    std::tm ctc = {};
    if (::gmtime_r(&utc, &ctc) == nullptr) //Linux: apparently NO limits
        return TimeComp();

    return impl::toZenTimeComponents(ctc);
}


inline
TimeComp getUtcTime()
{
    const time_t utc = std::time(nullptr); //returns -1 on error
    if (utc == -1)
        return TimeComp();

    return getUtcTime(utc);
}


inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc = {};
    if (::localtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    return impl::toZenTimeComponents(ctc);
}


inline
TimeComp getLocalTime()
{
    const time_t utc = std::time(nullptr); //returns -1 on error
    if (utc == -1)
        return TimeComp();

    return getLocalTime(utc);
}


inline
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc)
{
    if (tc == TimeComp())
        return {};

    std::tm ctc = impl::toClibTimeComponents(tc);
    ctc.tm_isdst = 0; //unused by timegm(), but take no chances

    const time_t utc = ::timegm(&ctc);
    if (utc == -1)
        return {};

    return {utc, true};
}


inline
std::string formatTime(const char* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return std::string();

    std::tm ctc = impl::toClibTimeComponents(tc);
    std::mktime(&ctc); //std::strftime() needs all elements of "struct tm" filled, e.g. tm_wday, tm_yday

    std::string buf(256, '\0');
    const size_t charsWritten = std::strftime(buf.data(), buf.size(), format, &ctc);
    buf.resize(charsWritten);
    return buf;
}


inline
TimeComp parseTime(std::string_view format, std::string_view str)
{
    auto itStr = str.begin();

    auto extractNumber = [&](int& result, size_t digitCount)
    {
        if (static_cast<size_t>(str.end() - itStr) < digitCount)
            return false;

        if (!std::all_of(itStr, itStr + digitCount, isDigit))
            return false;

        result = stringTo<int>(makeStringView(itStr, itStr + digitCount));
        itStr += digitCount;
        return true;
    };

    TimeComp output;

    for (auto itFmt = format.begin(); itFmt != format.end(); ++itFmt)
    {
        const char fmt = *itFmt;

        if (fmt == '%')
        {
            ++itFmt;
            if (itFmt == format.end())
                return TimeComp();

            switch (*itFmt)
            {
                case 'Y':
                    if (!extractNumber(output.year, 4))
                        return TimeComp();
                    break;
                case 'm':
                    if (!extractNumber(output.month, 2))
                        return TimeComp();
                    break;
                case 'd':
                    if (!extractNumber(output.day, 2))
                        return TimeComp();
                    break;
                case 'H':
                    if (!extractNumber(output.hour, 2))
                        return TimeComp();
                    break;
                case 'M':
                    if (!extractNumber(output.minute, 2))
                        return TimeComp();
                    break;
                case 'S':
                    if (!extractNumber(output.second, 2))
                        return TimeComp();
                    break;
                default:
                    return TimeComp();
            }
        }
        else
        {
            if (itStr == str.end() || *itStr != fmt)
                return TimeComp();
            ++itStr;
        }
    }

    if (itStr != str.end())
        return TimeComp();

    if (output.month < 1 || output.month > 12 ||
        output.day   < 1 || output.day   > 31 ||
        output.hour > 23 || output.minute > 59 || output.second > 60)
        return TimeComp();

    return output;
}


inline
std::pair<time_t, bool /*success*/> parseIsoUtcTime(std::string_view str)
{
    //'Z' means "UTC": S3 doesn't use the time-zone offset postfix
    if (!endsWith(str, 'Z'))
        return {};
    str.remove_suffix(1);

    const std::string_view timeNoFraction = beforeLast(str, '.', IfNotFoundReturn::all);

    if (timeNoFraction.size() != str.size()) //fraction must be digits only
    {
        const std::string_view fraction = str.substr(timeNoFraction.size() + 1);
        if (fraction.empty() || !std::all_of(fraction.begin(), fraction.end(), isDigit))
            return {};
    }

    const TimeComp tc = parseTime("%Y-%m-%dT%H:%M:%S", timeNoFraction);
    if (tc == TimeComp())
        return {};

    return utcToTimeT(tc); //round down fractional seconds like local file times
}


inline
std::string formatTimeSpan(int64_t timeInSec)
{
    std::string timespanStr;

    if (timeInSec < 0)
    {
        timeInSec = -timeInSec;
        timespanStr = '-';
    }

    const int secsPerDay = 24 * 3600;
    const int64_t days = timeInSec / secsPerDay;
    if (days > 0)
    {
        timeInSec -= days * secsPerDay;
        timespanStr += numberTo<std::string>(days) + '.';
    }

    //format time span as if absolute UTC time
    const TimeComp& tc = getUtcTime(static_cast<time_t>(timeInSec)); //returns TimeComp() on error
    timespanStr += formatTime(formatIsoTimeTag, tc); //returns empty string on error

    return timespanStr;
}
}

#endif //TIME_H_8457092814324342453627
