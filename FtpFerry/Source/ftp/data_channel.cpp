// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include "data_channel.h"

using namespace fbase;
using namespace ferry;


DataChannelDescriptor ferry::parsePasvReply(const FtpReply& reply) //throw SysErrorFtpProtocol
{
    if (reply.code != 227)
        throw SysErrorFtpProtocol(_("Passive mode was rejected by the server.") + L' ' + formatFtpReply(reply), reply.code);

    const auto throwMalformed = [&]
    {
        throw SysErrorFtpProtocol(_("Unexpected passive mode address.") + L' ' + formatFtpReply(reply), reply.code);
    };

    //"227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)": the text around the parentheses is not standardized
    const size_t posOpen = reply.message.find('(');
    if (posOpen == std::string::npos)
        throwMalformed();
    const size_t posClose = reply.message.find(')', posOpen);
    if (posClose == std::string::npos)
        throwMalformed();

    const std::vector<std::string> items = splitCpy(reply.message.substr(posOpen + 1, posClose - posOpen - 1), ',', SplitOnEmpty::allow);
    if (items.size() != 6)
        throwMalformed();

    std::vector<int> nums;
    for (const std::string& item : items)
    {
        const std::string numStr = trimCpy(item);
        if (numStr.empty() || numStr.size() > 3 || !std::all_of(numStr.begin(), numStr.end(), [](char c) { return isDigit(c); }))
            throwMalformed();

        const int num = stringTo<int>(numStr);
        if (num > 255)
            throwMalformed();
        nums.push_back(num);
    }

    return
    {
        .ip = numberTo<Zstring>(nums[0]) + '.' + numberTo<Zstring>(nums[1]) + '.' + numberTo<Zstring>(nums[2]) + '.' + numberTo<Zstring>(nums[3]),
        .port = nums[4] * 256 + nums[5],
    };
}


FtpDataConnection::FtpDataConnection(const DataChannelDescriptor& desc, int timeoutSec) : //throw SysError, SysErrorTimeout
    desc_(desc),
    socket_(desc.ip, numberTo<Zstring>(desc.port), timeoutSec) {}


std::unique_ptr<FtpDataConnection> ferry::negotiatePassiveDataChannel(FtpControlChannel& ctrl) //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
{
    const std::wstring errorMsg = replaceCpy(_("Cannot open data connection to %x."), L"%x", ctrl.getServerDisplayName());

    const FtpReply reply = ctrl.sendCommand("PASV"); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    DataChannelDescriptor desc;
    try
    {
        desc = parsePasvReply(reply); //throw SysErrorFtpProtocol
    }
    catch (const SysErrorFtpProtocol& e) { throw ErrorFtpProtocol(errorMsg, e.toString(), e.ftpReplyCode); }

    if (ctrl.getConfig().pasvUseControlHost) //servers behind NAT often report their private address
        desc.ip = ctrl.getPeerAddress(); //throw ErrorFtpConnection

    try
    {
        return std::make_unique<FtpDataConnection>(desc, ctrl.getConfig().timeoutSec); //throw SysError, SysErrorTimeout
    }
    catch (const SysErrorTimeout& e) { throw ErrorFtpTimeout(errorMsg, e.toString()); }
    catch (const SysError&        e) { throw ErrorFtpConnection(errorMsg, e.toString()); }
}
