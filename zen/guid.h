// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef GUID_H_80425780237502345
#define GUID_H_80425780237502345

#include <stdexcept>
#include <unistd.h> //getentropy
#include "sys_error.h"


namespace zen
{
inline
std::string generateGUID() //creates a 16-byte GUID
{
    std::string guid(16, '\0');

    if (::getentropy(guid.data(), guid.size()) != 0) //"The maximum permitted value for the length argument is 256"
        throw std::runtime_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Failed to generate GUID." + "\n\n" +
                                 formatSystemError("getentropy", errno));
    return guid;
}


inline
std::string generateShortId() //8 hex digits: unique enough for temporary file names
{
    std::string output;
    for (const char c : generateGUID().substr(0, 4))
    {
        const auto [high, low] = hexify(static_cast<unsigned char>(c), false /*upperCase*/);
        output += high;
        output += low;
    }
    return output;
}
}

#endif //GUID_H_80425780237502345
