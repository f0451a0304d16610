// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef LOCAL_FILE_H_6620193847561029384
#define LOCAL_FILE_H_6620193847561029384

#include <memory>
#include <fbase/file_io.h>
#include "../ftp/ftp_transfer.h"


namespace ferry
{
//upload source reading a local file sequentially
class LocalFileSource : public TransferSource
{
public:
    explicit LocalFileSource(const Zstring& filePath); //throw ErrorLocalFileSystem

    size_t tryRead(void* buffer, size_t bytesToRead) override; //throw ErrorLocalFileSystem

private:
    std::unique_ptr<fbase::FileInputPlain> fileIn_;
};


/*  download target, transactional:
    - bytes go to a temporary file next to the target
    - finalize() renames it onto the target, replacing an existing file
    - without finalize() the temporary file is deleted and the target stays untouched   */
class LocalFileSink : public TransferSink
{
public:
    explicit LocalFileSink(const Zstring& targetPath); //throw ErrorLocalFileSystem

    void write(const void* buffer, size_t bytesToWrite) override; //throw ErrorLocalFileSystem
    void finalize() override; //throw ErrorLocalFileSystem

    const Zstring& getTempFilePath() const { return tmpFilePath_; }

private:
    const Zstring targetPath_;
    const Zstring tmpFilePath_;
    std::unique_ptr<fbase::FileOutputPlain> tmpFile_;
};
}

#endif //LOCAL_FILE_H_6620193847561029384
