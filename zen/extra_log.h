// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_601673246392441846218957402563
#define EXTRA_LOG_H_601673246392441846218957402563

#include <iostream>
#include "error_log.h"
#include "thread.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - cleanup errors while an exception is in flight
    - failure to remove a temporary file                     */

namespace zen
{
namespace impl
{
inline
Protected<ErrorLog>& getExtraLog()
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


//report outstanding entries before shutdown
inline
void flushExtraLog(std::ostream& os)
{
    for (const LogEntry& entry : fetchExtraLog())
        os << formatMessage(entry);
}
}

#endif //EXTRA_LOG_H_601673246392441846218957402563
