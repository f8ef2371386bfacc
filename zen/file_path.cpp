// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_path.h"
#include <cstdlib>

using namespace zen;


std::optional<Zstring> zen::getParentFolderPath(const Zstring& itemPath)
{
    if (!startsWith(itemPath, FILE_NAME_SEPARATOR))
        return std::nullopt;

    Zstring path = itemPath;
    while (path.size() > 1 && endsWith(path, FILE_NAME_SEPARATOR))
        path.pop_back();

    if (path == Zstr("/"))
        return std::nullopt;

    Zstring parentPath = beforeLast(path, FILE_NAME_SEPARATOR, IfNotFoundReturn::none);
    if (parentPath.empty())
        return Zstring(Zstr("/"));
    return parentPath;
}


Zstring zen::appendSeparator(Zstring path) //support rvalue references!
{
    if (!endsWith(path, FILE_NAME_SEPARATOR))
        path += FILE_NAME_SEPARATOR;
    return path; //returning a by-value parameter => RVO if possible, r-value otherwise!
}


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    assert(!startsWith(relPath, FILE_NAME_SEPARATOR));

    if (relPath.empty())
        return basePath;

    if (basePath.empty())
        return relPath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;

    return basePath + FILE_NAME_SEPARATOR + relPath;
}


Zstring zen::normalizePath(const Zstring& absPath)
{
    assert(startsWith(absPath, FILE_NAME_SEPARATOR));

    std::vector<Zstring> components;
    for (const Zstring& comp : split(absPath, FILE_NAME_SEPARATOR, SplitOnEmpty::skip))
        if (comp == Zstr("."))
            ;
        else if (comp == Zstr(".."))
        {
            if (!components.empty())
                components.pop_back();
        }
        else
            components.push_back(comp);

    Zstring output;
    for (const Zstring& comp : components)
        output += FILE_NAME_SEPARATOR + comp;

    if (output.empty())
        output = FILE_NAME_SEPARATOR;
    return output;
}


std::optional<Zstring> zen::getEnvironmentVar(const Zstring& name)
{
    const char* buffer = ::getenv(name.c_str()); //no extended error reporting
    if (!buffer)
        return {};

    Zstring value(buffer);

    //remove leading, trailing double-quotes
    if (startsWith(value, Zstr('"')) &&
        endsWith  (value, Zstr('"')) &&
        value.length() >= 2)
        value = value.substr(1, value.size() - 2);

    return value;
}
