// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ZSTRING_H_8743019456271038462
#define ZSTRING_H_8743019456271038462

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include "utf.h"     //


using Zchar = char;
#define Zstr(x) x

//native string for file system paths: UTF-8 on Linux
using Zstring = std::basic_string<Zchar>;
using ZstringView = std::basic_string_view<Zchar>;

const Zchar FILE_NAME_SEPARATOR = '/';


Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//"/a/b.txt" -> "b.txt"
Zstring getItemName(const Zstring& itemPath);

//"/a/b.txt" -> "/a"; "b.txt" -> ""; "/" -> "/"
Zstring getParentPath(const Zstring& itemPath);






//################################# inline implementation ########################################
inline
Zstring appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (basePath.empty())
        return relPath;
    if (relPath.empty())
        return basePath;

    if (fbase::endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;
    return basePath + FILE_NAME_SEPARATOR + relPath;
}


inline
Zstring getItemName(const Zstring& itemPath)
{
    ZstringView path = itemPath;
    while (path.size() > 1 && path.back() == FILE_NAME_SEPARATOR)
        path.remove_suffix(1);

    return fbase::afterLast(Zstring(path), FILE_NAME_SEPARATOR, fbase::IfNotFoundReturn::all);
}


inline
Zstring getParentPath(const Zstring& itemPath)
{
    ZstringView path = itemPath;
    while (path.size() > 1 && path.back() == FILE_NAME_SEPARATOR)
        path.remove_suffix(1);

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == ZstringView::npos)
        return Zstring();
    if (pos == 0)
        return Zstring(1, FILE_NAME_SEPARATOR);
    return Zstring(path.substr(0, pos));
}

//------------------------------------------------------------------------------------------
const wchar_t* const TAB_SPACE = L"    "; //4: the only sensible space count for tabs

#endif //ZSTRING_H_8743019456271038462
