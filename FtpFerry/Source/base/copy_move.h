// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef COPY_MOVE_H_1129384756019283746
#define COPY_MOVE_H_1129384756019283746

#include <functional>
#include "../ftp/ftp_session.h"


namespace ferry
{
//creates a new, logged-in session: called once per logical operation
using SessionFactory = std::function<std::unique_ptr<FtpSession>(const FtpEndpoint& endpoint)>; //throw ErrorFtp*

struct CopyResult
{
    TransferPhase phase = TransferPhase::idle;
    uint64_t bytesTransferred = 0;
    std::wstring targetDisplayPath;
};


/*  copy and move between local file system and FTP server

    - exactly one of source and destination is an "ftp://" URL, otherwise ErrorInvalidOperation
      is thrown before any connection is opened
    - each call uses a fresh session; move() deletes a remote source using a second session
    - the source is deleted only after the server confirmed the copy; a failed deletion leaves
      the completed copy in place: ErrorDeleteAfterCopy                                   */
class CopyMoveCoordinator
{
public:
    explicit CopyMoveCoordinator(const FtpSessionCfg& cfg);
    explicit CopyMoveCoordinator(const SessionFactory& sessionFactory);

    CopyResult copy(const std::string& sourcePath, const std::string& targetPath); //throw ErrorInvalidOperation, ErrorLocalFileSystem, ErrorFtp*

    CopyResult move(const std::string& sourcePath, const std::string& targetPath); //throw ErrorInvalidOperation, ErrorLocalFileSystem, ErrorFtp*, ErrorDeleteAfterCopy

    //single-endpoint operations
    std::string listFolder  (const std::string& folderUrl); //throw ErrorInvalidOperation, ErrorFtp*
    void        createFolder(const std::string& folderUrl); //throw ErrorInvalidOperation, ErrorFtp*
    void        removeFolder(const std::string& folderUrl); //throw ErrorInvalidOperation, ErrorFtp*
    void        removeFile  (const std::string& fileUrl);   //throw ErrorInvalidOperation, ErrorFtp*

private:
    std::unique_ptr<FtpSession> startSession(const FtpEndpoint& endpoint); //throw ErrorFtp*

    const SessionFactory sessionFactory_;
};
}

#endif //COPY_MOVE_H_1129384756019283746
