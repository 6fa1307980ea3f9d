// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef EXTRA_LOG_H_9102837465019283
#define EXTRA_LOG_H_9102837465019283

#include "error_log.h"
#include "thread.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors
    - destructors                                                 */

namespace rz
{
namespace impl
{
inline Protected<ErrorLog>& getExtraLog()
{
    static Protected<ErrorLog> extraLog;
    return extraLog;
}
}


inline
ErrorLog fetchExtraLog()
{
    return impl::getExtraLog().access([](ErrorLog& log) { return std::exchange(log, ErrorLog()); });
}


inline
void logExtraError(const std::string& msg) //nothrow!
{
    impl::getExtraLog().access([&](ErrorLog& log) { logMsg(log, msg, MSG_TYPE_ERROR); });
}
}

#endif //EXTRA_LOG_H_9102837465019283
