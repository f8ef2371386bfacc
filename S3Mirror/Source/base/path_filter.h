// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef PATH_FILTER_H_8257802758427583
#define PATH_FILTER_H_8257802758427583

#include <regex>
#include <vector>
#include <zen/file_error.h>


namespace s3m
{
/*  Semantics of NameFilter:
    - applied to the *relative* item name on both source and destination side
    - no patterns: everything passes
    - otherwise an item passes if at least one pattern matches (search, not full match)   */
class NameFilter
{
public:
    NameFilter() {}
    explicit NameFilter(const std::vector<std::string>& patterns); //throw FileError

    bool passFileFilter(const Zstring& relFilePath) const;

    bool isNull() const { return patterns_.empty(); }

private:
    std::vector<std::regex> patterns_;
};
}

#endif //PATH_FILTER_H_8257802758427583
