// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include "sys_error.h"


namespace zen
{
//init OpenSSL before use!
void openSslInit();
void openSslTearDown();

//raw digest bytes:
std::string getSha256(const std::string_view message); //throw SysError
std::string hmacSha256(const std::string_view key, const std::string_view message); //throw SysError

std::string getSha256Hex(const std::string_view message); //throw SysError; lower-case hex

std::string formatAsHexString(const std::string_view blob); //lower-case hex
}

#endif //OPEN_SSL_H_801974580936508934568792347506
