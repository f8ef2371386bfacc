// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_PATH_H_3984678473567247567
#define FILE_PATH_H_3984678473567247567

#include <optional>
#include "zstring.h"


namespace zen
{
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no value for root or relative item name
inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

Zstring appendSeparator(Zstring path); //support rvalue references!

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//collapse "." and "..", remove duplicate separators; expects absolute path
Zstring normalizePath(const Zstring& absPath);

std::optional<Zstring> getEnvironmentVar(const Zstring& name);
}

#endif //FILE_PATH_H_3984678473567247567
