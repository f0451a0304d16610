// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include "ftp_reply.h"
#include <optional>

using namespace fbase;
using namespace ferry;


namespace
{
//three leading digits; the 4th char only matters for continuation lines ('-')
std::optional<int> getStatusCode(const std::string_view line)
{
    if (line.size() < 3 ||
        !std::all_of(line.begin(), line.begin() + 3, [](char c) { return isDigit(c); }) ||
        line[0] < '1' || line[0] > '5')
        return std::nullopt;

    return (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
}


bool isContinuationLine(const std::string_view line) { return line.size() > 3 && line[3] == '-'; }


std::string_view getLineText(const std::string_view line) //skip "123 ", "123-" or "123"
{
    if (line.size() > 3 && (line[3] == ' ' || line[3] == '-'))
        return line.substr(4);
    return line.size() > 3 ? line.substr(3) : std::string_view();
}
}


bool FtpReplyParser::addLine(const std::string& line) //throw SysErrorFtpProtocol
{
    if (complete_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    if (reply_.lines.empty()) //first line
    {
        const std::optional<int> code = getStatusCode(line);
        if (!code)
            throw SysErrorFtpProtocol(replaceCpy<std::wstring>(L"Unexpected reply line: \"%x\"", L"%x", utfTo<std::wstring>(line)), 0);

        reply_.code = *code;
        reply_.lines.push_back(line);
        reply_.message = getLineText(line);
        complete_ = !isContinuationLine(line);
        return complete_;
    }

    reply_.lines.push_back(line);

    //closing line: same code, anything but '-' as 4th char
    if (getStatusCode(line) == reply_.code && !isContinuationLine(line))
    {
        reply_.message += '\n';
        reply_.message += getLineText(line);
        complete_ = true;
    }
    else
    {
        reply_.message += '\n';
        reply_.message += isContinuationLine(line) && getStatusCode(line) == reply_.code ? getLineText(line) : std::string_view(line);
    }
    return complete_;
}


FtpReply ferry::parseFtpReply(const std::string& buf) //throw SysErrorFtpProtocol
{
    FtpReplyParser parser;

    for (const std::string& line : splitCpy(replaceCpy(buf, "\r\n", "\n"), '\n', SplitOnEmpty::skip))
        if (parser.addLine(line)) //throw SysErrorFtpProtocol
            return parser.getReply();

    throw SysErrorFtpProtocol(L"Incomplete server reply.", 0);
}


std::wstring ferry::formatFtpStatus(int sc)
{
    const wchar_t* statusText = [&] //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 110: return L"Restart marker reply.";
            case 125: return L"Data connection already open; transfer starting.";
            case 150: return L"File status okay; about to open data connection.";
            case 200: return L"Command okay.";
            case 220: return L"Service ready for new user.";
            case 221: return L"Service closing control connection.";
            case 226: return L"Closing data connection. Requested file action successful.";
            case 227: return L"Entering Passive Mode.";
            case 230: return L"User logged in, proceed.";
            case 250: return L"Requested file action okay, completed.";
            case 257: return L"Pathname created.";
            case 331: return L"User name okay, need password.";

            case 400: return L"The command was not accepted but the error condition is temporary.";
            case 421: return L"Service not available, closing control connection.";
            case 425: return L"Cannot open data connection.";
            case 426: return L"Connection closed; transfer aborted.";
            case 430: return L"Invalid username or password.";
            case 434: return L"Requested host unavailable.";
            case 450: return L"Requested file action not taken.";
            case 451: return L"Local error in processing.";
            case 452: return L"Insufficient storage space in system. File unavailable, e.g. file busy.";

            case 500: return L"Syntax error, command unrecognized or command line too long.";
            case 501: return L"Syntax error in parameters or arguments.";
            case 502: return L"Command not implemented.";
            case 503: return L"Bad sequence of commands.";
            case 504: return L"Command not implemented for that parameter.";
            case 530: return L"User not logged in.";
            case 532: return L"Need account for storing files.";
            case 550: return L"File unavailable, e.g. file not found, no access.";
            case 551: return L"Requested action aborted. Page type unknown.";
            case 552: return L"Requested file action aborted. Exceeded storage allocation.";
            case 553: return L"File name not allowed.";

            default:  return L"";
            //*INDENT-ON*
        }
    }();

    if (std::wstring_view(statusText).empty())
        return trimCpy(replaceCpy<std::wstring>(L"FTP status %x.", L"%x", numberTo<std::wstring>(sc)));
    else
        return trimCpy(replaceCpy<std::wstring>(L"FTP status %x: ", L"%x", numberTo<std::wstring>(sc)) + statusText);
}


std::wstring ferry::formatFtpReply(const FtpReply& reply)
{
    std::wstring output = formatFtpStatus(reply.code);

    const std::wstring serverText = trimCpy(utfTo<std::wstring>(reply.message));
    if (!serverText.empty())
        output += L"\n" + _("Server reply:") + L' ' + serverText;
    return output;
}
