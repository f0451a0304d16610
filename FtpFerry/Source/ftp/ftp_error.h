// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef FTP_ERROR_H_5092837461029384756
#define FTP_ERROR_H_5092837461029384756

#include <fbase/file_error.h>


namespace ferry
{
//control or data connection could not be established or broke down
DEFINE_NEW_FILE_ERROR(ErrorFtpConnection)
//a connect, read or write on either connection exceeded the configured time-out
DEFINE_NEW_FILE_ERROR(ErrorFtpTimeout)
//local file could not be read, written, renamed or deleted
DEFINE_NEW_FILE_ERROR(ErrorLocalFileSystem)
//both sides of a copy/move are local, or both are remote
DEFINE_NEW_FILE_ERROR(ErrorInvalidOperation)
//move: copy was confirmed by the server, but the source could not be deleted => destination is valid!
DEFINE_NEW_FILE_ERROR(ErrorDeleteAfterCopy)


//errors triggered by an unexpected FTP reply: keep the reply code for the caller
class ErrorFtpReply : public fbase::FileError
{
public:
    ErrorFtpReply(const std::wstring& msg, const std::wstring& details, int replyCode) : FileError(msg, details), replyCode_(replyCode) {}

    int getReplyCode() const { return replyCode_; } //0 if not available, e.g. malformed reply line

private:
    int replyCode_;
};

#define DEFINE_NEW_FTP_REPLY_ERROR(X) struct X : public ferry::ErrorFtpReply { X(const std::wstring& msg, const std::wstring& details, int replyCode) : ErrorFtpReply(msg, details, replyCode) {} };

DEFINE_NEW_FTP_REPLY_ERROR(ErrorFtpAuth)      //USER/PASS rejected
DEFINE_NEW_FTP_REPLY_ERROR(ErrorFtpProtocol)  //unexpected greeting, malformed reply or PASV
DEFINE_NEW_FTP_REPLY_ERROR(ErrorFtpTransfer)  //LIST/RETR/STOR: missing 150/125 or 226
DEFINE_NEW_FTP_REPLY_ERROR(ErrorFtpDirectory) //MKD/RMD
DEFINE_NEW_FTP_REPLY_ERROR(ErrorFtpDelete)    //DELE


//low-level: server reply did not match expectations
struct SysErrorFtpProtocol : public fbase::SysError
{
    SysErrorFtpProtocol(const std::wstring& msg, int replyCode) : SysError(msg), ftpReplyCode(replyCode) {}

    int ftpReplyCode;
};
}

#endif //FTP_ERROR_H_5092837461029384756
