// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "format_unit.h"
#include <cmath>
#include "string_tools.h"

using namespace zen;


std::string zen::formatThreeDigitPrecision(double value)
{
    //print three digits: 0,01 | 0,11 | 1,11 | 11,1 | 111
    if (std::abs(value) < 9.995) //9.999 must not be formatted as "10.00"
        return printNumber("%.2f", value);
    if (std::abs(value) < 99.95) //99.99 must not be formatted as "100.0"
        return printNumber("%.1f", value);

    return formatNumber(std::llround(value));
}


std::string zen::formatFilesizeShort(int64_t size)
{
    if (std::abs(size) <= 999)
        return numberTo<std::string>(size) + (std::abs(size) == 1 ? " byte" : " bytes");

    double sizeInUnit = static_cast<double>(size);

    auto formatUnit = [&](const char* unitTxt) { return formatThreeDigitPrecision(sizeInUnit) + ' ' + unitTxt; };

    for (const char* unitTxt : {"KB", "MB", "GB", "TB"})
    {
        sizeInUnit /= bytesPerKilo;
        if (std::abs(sizeInUnit) < 999.5)
            return formatUnit(unitTxt);
    }

    sizeInUnit /= bytesPerKilo;
    return formatUnit("PB");
}


std::string zen::formatNumber(int64_t n)
{
    static_assert(sizeof(long long int) == sizeof(n));
    return printNumber("%'lld", static_cast<long long int>(n)); //considers grouping (')
}
