// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef DIFF_FILTER_H_0298347502983475
#define DIFF_FILTER_H_0298347502983475

#include "file_enum.h"


namespace s3m
{
/*  compare source against target by relative name:
        - target is read completely before the first action is reported
        - single-entry source vs single-entry target: compared with each other, independent of their names
        - update: target missing, size differs, or source strictly newer
        - remove: target not matched by any source entry (only if "deleteExtraneous")
        - target enumeration error: report this error only, no actions at all
        - source enumeration error: report and continue
        - stop requested: report nothing more, in particular no removals         */
void diffFileSets(EnumStream& source, EnumStream& target, bool deleteExtraneous, const std::stop_token& stopToken,
                  const std::function<void(DiffItem&& item)>& onItem /*throw X*/); //throw X

bool needsUpdate(const FileEntry& source, const FileEntry& target);
}

#endif //DIFF_FILTER_H_0298347502983475
