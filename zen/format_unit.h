// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FORMAT_UNIT_H_4827105938471620
#define FORMAT_UNIT_H_4827105938471620

#include <string>
#include <cstdint>


namespace zen
{
const int bytesPerKilo = 1000;

std::string formatFilesizeShort(int64_t filesize); //e.g. "1.23 MB"

std::string formatThreeDigitPrecision(double value); //format with fixed number of digits (unless value is too large)

std::string formatNumber(int64_t n); //integer number including thousands separator of the current locale
}

#endif //FORMAT_UNIT_H_4827105938471620
