// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "sync_statistics.h"

using namespace zen;
using namespace s3m;


void SyncStatistics::addTransfer(int64_t bytes)
{
    stats_.access([&](StatisticsSnapshot& st)
    {
        st.bytesTransferred += bytes;
        ++st.filesTransferred;
    });
}


void SyncStatistics::addDeletion()
{
    stats_.access([](StatisticsSnapshot& st) { ++st.filesDeleted; });
}


StatisticsSnapshot SyncStatistics::getSnapshot()
{
    return stats_.access([](const StatisticsSnapshot& st) { return st; });
}
