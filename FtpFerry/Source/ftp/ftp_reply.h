// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef FTP_REPLY_H_7302948561092837465
#define FTP_REPLY_H_7302948561092837465

#include <vector>
#include "ftp_error.h"


namespace ferry
{
//one logical reply: one or more lines, only the closing line's code counts
struct FtpReply
{
    int code = 0; //three digits: 100-599
    std::string message; //text of all lines without the status code prefix, joined by '\n'
    std::vector<std::string> lines; //raw lines as received, without CRLF

    bool isPreliminary() const { return code / 100 == 1; }
    bool isFinal() const { return !isPreliminary(); } //a final reply completes the command/reply exchange
};


/*  assemble a reply from single lines:

        220-Welcome           <- continuation: '-' after the code
        220-to the server     <- any text, even with other codes
        220 Ready             <- closing line: same code, no '-'               */
class FtpReplyParser
{
public:
    //return true if the reply is complete
    bool addLine(const std::string& line); //throw SysErrorFtpProtocol

    FtpReply getReply() const { assert(complete_); return reply_; }

private:
    FtpReply reply_;
    bool complete_ = false;
};

//parse one complete reply from a buffer containing CRLF-separated lines
FtpReply parseFtpReply(const std::string& buf); //throw SysErrorFtpProtocol

//"FTP status 550: File unavailable, e.g. file not found, no access."
std::wstring formatFtpStatus(int sc);

//"550 /a.txt: No such file or directory" => shows the server's own text, too
std::wstring formatFtpReply(const FtpReply& reply);
}

#endif //FTP_REPLY_H_7302948561092837465
