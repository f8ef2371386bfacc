// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "mime.h"
#include <magic.h>

using namespace zen;
using namespace s3m;


namespace
{
std::string getLastMagicError(magic_t cookie)
{
    const char* errorMsg = ::magic_error(cookie); //null if no error
    return errorMsg ? errorMsg : "";
}
}


LibMagicSniffer::LibMagicSniffer() //throw SysError
{
    cookie_ = ::magic_open(MAGIC_MIME_TYPE | MAGIC_SYMLINK | MAGIC_ERROR);
    if (!cookie_)
        THROW_LAST_SYS_ERROR("magic_open");
    ZEN_ON_SCOPE_FAIL(::magic_close(cookie_));

    if (::magic_load(cookie_, nullptr /*default database*/) != 0)
        throw SysError(formatSystemError("magic_load", numberTo<std::string>(::magic_errno(cookie_)), getLastMagicError(cookie_)));
}


LibMagicSniffer::~LibMagicSniffer()
{
    ::magic_close(cookie_);
}


std::string LibMagicSniffer::detectMimeType(const Zstring& filePath) //throw SysError
{
    std::lock_guard dummy(lockCookie_);

    const char* mimeType = ::magic_file(cookie_, filePath.c_str());
    if (!mimeType)
        throw SysError(formatSystemError("magic_file", numberTo<std::string>(::magic_errno(cookie_)), getLastMagicError(cookie_)));

    return mimeType;
}
