// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include "local_file.h"

using namespace fbase;
using namespace ferry;


LocalFileSource::LocalFileSource(const Zstring& filePath) //throw ErrorLocalFileSystem
{
    try
    {
        fileIn_ = std::make_unique<FileInputPlain>(filePath); //throw FileError
    }
    catch (const FileError& e) { throw ErrorLocalFileSystem(e.toString()); }
}


size_t LocalFileSource::tryRead(void* buffer, size_t bytesToRead) //throw ErrorLocalFileSystem
{
    try
    {
        return fileIn_->tryRead(buffer, bytesToRead); //throw FileError
    }
    catch (const FileError& e) { throw ErrorLocalFileSystem(e.toString()); }
}


//----------------------------------------------------------------------------------------------------

LocalFileSink::LocalFileSink(const Zstring& targetPath) : //throw ErrorLocalFileSystem
    targetPath_(targetPath),
    tmpFilePath_(getPathWithTempName(targetPath))
{
    try
    {
        tmpFile_ = std::make_unique<FileOutputPlain>(tmpFilePath_); //throw FileError, ErrorTargetExisting
    }
    catch (const FileError& e) { throw ErrorLocalFileSystem(e.toString()); }
}


void LocalFileSink::write(const void* buffer, size_t bytesToWrite) //throw ErrorLocalFileSystem
{
    if (!tmpFile_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        const char*       it    = static_cast<const char*>(buffer);
        const char* const itEnd = it + bytesToWrite;
        while (it != itEnd)
            it += tmpFile_->tryWrite(it, itEnd - it); //throw FileError
    }
    catch (const FileError& e) { throw ErrorLocalFileSystem(e.toString()); }
}


void LocalFileSink::finalize() //throw ErrorLocalFileSystem
{
    if (!tmpFile_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        tmpFile_->close(); //throw FileError
        tmpFile_.reset();
        //closed file is not deleted by ~FileOutputPlain() => take over ownership:
        FBASE_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath_); }
        catch (const FileError& e2) { logExtraError(e2.toString()); });

        moveAndRenameItem(tmpFilePath_, targetPath_, true /*replaceExisting*/); //throw FileError, (ErrorTargetExisting)
    }
    catch (const FileError& e) { throw ErrorLocalFileSystem(e.toString()); }
}
