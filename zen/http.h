// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HTTP_H_879083425703425702
#define HTTP_H_879083425703425702

#include "sys_error.h"


namespace zen
{
std::string formatHttpError(int httpStatus);

//percent-encode everything except RFC 3986 unreserved characters: A-Z a-z 0-9 - _ . ~
//"encodeSlash == false" keeps '/' as is, e.g. for URL paths
std::string uriEncode(const std::string_view str, bool encodeSlash);
std::string uriDecode(const std::string_view str);
}

#endif //HTTP_H_879083425703425702
