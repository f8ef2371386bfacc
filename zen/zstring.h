// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ZSTRING_H_73425873425789
#define ZSTRING_H_73425873425789

#include "string_tools.h"


//Zstring: native string for file paths (Linux: UTF-8)
using Zchar = char;
#define Zstr(x) x
const Zchar FILE_NAME_SEPARATOR = '/';

using Zstring = std::string;

//object store keys use '/' regardless of the local platform
const char KEY_SEPARATOR = '/';

#endif //ZSTRING_H_73425873425789
