// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef RETURN_CODES_H_6129384756102938
#define RETURN_CODES_H_6129384756102938

#include <cassert>
#include <string>


namespace s3m
{
enum S3mReturnCode //as returned after process exit
{
    S3M_RC_SUCCESS   = 0,
    S3M_RC_ERROR     = 2,
    S3M_RC_ABORTED   = 3,
    S3M_RC_EXCEPTION = 4,
};


inline
void raiseReturnCode(S3mReturnCode& rc, S3mReturnCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class SyncResult
{
    finishedSuccess,
    finishedError,
    aborted,
};


inline
S3mReturnCode mapToReturnCode(SyncResult syncStatus)
{
    switch (syncStatus)
    {
        case SyncResult::finishedSuccess:
            return S3M_RC_SUCCESS;
        case SyncResult::finishedError:
            return S3M_RC_ERROR;
        case SyncResult::aborted:
            return S3M_RC_ABORTED;
    }
    assert(false);
    return S3M_RC_ABORTED;
}


inline
std::string getFinalStatusLabel(SyncResult finalStatus)
{
    switch (finalStatus)
    {
        case SyncResult::finishedSuccess:
            return "Completed successfully";
        case SyncResult::finishedError:
            return "Completed with errors";
        case SyncResult::aborted:
            return "Stopped";
    }
    assert(false);
    return std::string();
}
}

#endif //RETURN_CODES_H_6129384756102938
