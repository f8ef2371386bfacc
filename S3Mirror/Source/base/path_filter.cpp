// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "path_filter.h"

using namespace zen;
using namespace s3m;


NameFilter::NameFilter(const std::vector<std::string>& patterns) //throw FileError
{
    for (const std::string& pattern : patterns)
        try
        {
            patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize); //throw std::regex_error
        }
        catch (const std::regex_error& e)
        {
            throw FileError(replaceCpy("Invalid filter pattern %x.", "%x", fmtPath(pattern)), e.what());
        }
}


bool NameFilter::passFileFilter(const Zstring& relFilePath) const
{
    if (patterns_.empty())
        return true;

    return std::any_of(patterns_.begin(), patterns_.end(), [&](const std::regex& re) { return std::regex_search(relFilePath, re); });
}
