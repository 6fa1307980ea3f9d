// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef RETURN_CODES_H_4758392019283746
#define RETURN_CODES_H_4758392019283746

#include <cassert>
#include <string>


namespace rpl
{
enum ReplicaReturnCode //as returned after process exit
{
    RPL_RC_SUCCESS = 0,
    RPL_RC_WARNING,
    RPL_RC_ERROR,
    RPL_RC_ABORTED,
    RPL_RC_EXCEPTION,
};


inline
void raiseReturnCode(ReplicaReturnCode& rc, ReplicaReturnCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class CopyResult
{
    finishedSuccess,
    finishedWarning,
    finishedError,
    aborted,
};


inline
ReplicaReturnCode mapToReturnCode(CopyResult copyStatus)
{
    switch (copyStatus)
    {
        case CopyResult::finishedSuccess:
            return RPL_RC_SUCCESS;
        case CopyResult::finishedWarning:
            return RPL_RC_WARNING;
        case CopyResult::finishedError:
            return RPL_RC_ERROR;
        case CopyResult::aborted:
            return RPL_RC_ABORTED;
    }
    assert(false);
    return RPL_RC_ABORTED;
}


inline
std::string getFinalStatusLabel(CopyResult finalStatus)
{
    switch (finalStatus)
    {
        case CopyResult::finishedSuccess:
            return "Completed successfully";
        case CopyResult::finishedWarning:
            return "Completed with warnings";
        case CopyResult::finishedError:
            return "Completed with errors";
        case CopyResult::aborted:
            return "Stopped";
    }
    assert(false);
    return std::string();
}
}

#endif //RETURN_CODES_H_4758392019283746
