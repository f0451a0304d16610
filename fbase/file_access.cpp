// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
    #include <sys/stat.h>
    #include <unistd.h>
    #include <cstdio> //rename

using namespace fbase;


namespace
{
ItemType getItemTypeImpl(const struct stat& itemInfo)
{
    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}
}


std::optional<ItemType> fbase::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        const ErrorCode ec = getLastError(); //copy before making other system calls!
        if (ec == ENOENT || ec == ENOTDIR) //ENOTDIR: some parent component is a file
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), formatSystemError("lstat", ec));
    }
    return getItemTypeImpl(itemInfo);
}


void fbase::removeFilePlain(const Zstring& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


void fbase::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

    if (::mkdir(dirPath.c_str(), mode) != 0)
    {
        const int ec = errno; //copy before directly or indirectly making other system calls!
        const std::wstring errorMsg = replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath));
        const std::wstring errorDescr = formatSystemError("mkdir", ec);

        if (ec == EEXIST)
            throw ErrorTargetExisting(errorMsg, errorDescr);
        throw FileError(errorMsg, errorDescr);
    }
}


void fbase::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorTargetExisting
{
    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                                        L"%x", L'\n' + fmtPath(pathFrom)),
                                             L"%y", L'\n' + fmtPath(pathTo));

    //rename() will never fail with EEXIST, but always (atomically) overwrite!
    if (!replaceExisting)
    {
        struct stat sourceInfo = {};
        if (::lstat(pathFrom.c_str(), &sourceInfo) != 0)
            throw FileError(errorMsg, formatSystemError("lstat(source)", errno));

        struct stat targetInfo = {};
        if (::lstat(pathTo.c_str(), &targetInfo) != 0)
        {
            if (errno != ENOENT)
                throw FileError(errorMsg, formatSystemError("lstat(target)", errno));
        }
        else if (sourceInfo.st_dev != targetInfo.st_dev ||
                 sourceInfo.st_ino != targetInfo.st_ino)
            throw ErrorTargetExisting(errorMsg, replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(pathTo))));
    }

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
        THROW_LAST_FILE_ERROR(errorMsg, "rename");
}
