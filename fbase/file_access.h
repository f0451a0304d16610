// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ACCESS_H_3092847561029384756
#define FILE_ACCESS_H_3092847561029384756

#include <optional>
#include "file_error.h"


namespace fbase
{
enum class ItemType
{
    file,
    folder,
    symlink,
};
//symlinks are not followed
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

void removeFilePlain(const Zstring& filePath); //throw FileError; ERROR if not existing
void createDirectory(const Zstring& dirPath);  //throw FileError, ErrorTargetExisting

//rename() within one file system; fails with ErrorTargetExisting if "pathTo" exists and "replaceExisting" is false
void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting); //throw FileError, ErrorTargetExisting
}

#endif //FILE_ACCESS_H_3092847561029384756
