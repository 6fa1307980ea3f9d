// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TIME_H_1928374650192837
#define TIME_H_1928374650192837

#include <ctime>
#include "zstring.h"


namespace rz
{
/*  format examples:
            formatTime(formatDateTag)      -> "2011-10-29"
            formatTime(formatTimeTag)      -> "17:55:34"
            formatTime(formatFileNameTag)  -> "2011-10-29 175534"    */
Zstring formatTime(const char* format, time_t utcTime = std::time(nullptr)); //format as specified by "std::strftime", returns empty string on error

const char* const formatDateTag     = "%Y-%m-%d";
const char* const formatTimeTag     = "%H:%M:%S";
const char* const formatFileNameTag = "%Y-%m-%d %H%M%S"; //no colons: usable as part of a file name






//######################## implementation ##########################
inline
Zstring formatTime(const char* format, time_t utcTime)
{
    std::tm ctc = {};
    if (!::localtime_r(&utcTime, &ctc)) //thread-safe, unlike std::localtime()
        return Zstring();

    char buffer[256] = {};
    const size_t charsWritten = std::strftime(buffer, sizeof(buffer), format, &ctc);
    return Zstring(buffer, charsWritten); //0 on error
}
}

#endif //TIME_H_1928374650192837
