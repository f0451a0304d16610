// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include "ftp_transfer.h"

using namespace fbase;
using namespace ferry;


namespace
{
template <class Function>
auto runOnDataConnection(const std::wstring& errorMsg, Function fun) //throw ErrorFtpConnection, ErrorFtpTimeout
{
    try
    {
        return fun(); //throw SysError, SysErrorTimeout
    }
    catch (const SysErrorTimeout& e) { throw ErrorFtpTimeout(errorMsg, e.toString()); }
    catch (const SysError&        e) { throw ErrorFtpConnection(errorMsg, e.toString()); }
}


std::wstring fmtRemotePath(const std::string& remotePath) { return fmtPath(utfTo<std::wstring>(remotePath)); }
}


std::wstring ferry::getPhaseLabel(TransferPhase phase)
{
    switch (phase)
    {
        //*INDENT-OFF*
        case TransferPhase::idle:                     return L"idle";
        case TransferPhase::awaitingDataConnection:   return L"awaiting data connection";
        case TransferPhase::awaitingPreliminaryReply: return L"awaiting preliminary reply";
        case TransferPhase::streaming:                return L"streaming";
        case TransferPhase::awaitingFinalReply:       return L"awaiting final reply";
        case TransferPhase::completed:                return L"completed";
        case TransferPhase::failed:                   return L"failed";
        //*INDENT-ON*
    }
    assert(false);
    return std::wstring();
}


template <class StreamFun, class ConfirmFun>
void FtpTransfer::runDataTransfer(const std::string& command, const std::wstring& errorMsg, StreamFun streamData, ConfirmFun onConfirmed) //throw ErrorFtp*, ErrorLocalFileSystem
{
    bytesTransferred_ = 0;
    phase_ = TransferPhase::idle;
    FBASE_ON_SCOPE_FAIL(phase_ = TransferPhase::failed);

    phase_ = TransferPhase::awaitingDataConnection;
    //data connection must be established *before* the server is told to start
    std::unique_ptr<FtpDataConnection> dataConn = negotiatePassiveDataChannel(ctrl_); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    phase_ = TransferPhase::awaitingPreliminaryReply;
    const FtpReply prelimReply = ctrl_.sendCommand(command); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    if (prelimReply.code != 150 && prelimReply.code != 125)
        throw ErrorFtpTransfer(errorMsg, replaceCpy(_("Phase: %x"), L"%x", getPhaseLabel(phase_)) + L"\n" + formatFtpReply(prelimReply), prelimReply.code);

    phase_ = TransferPhase::streaming;
    runOnDataConnection(errorMsg, [&] { streamData(dataConn->get()); }); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorLocalFileSystem
    dataConn.reset();

    phase_ = TransferPhase::awaitingFinalReply;
    const FtpReply finalReply = ctrl_.readNextReply(); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    if (finalReply.code != 226 && finalReply.code != 250) //all bytes may have arrived, still the server reports failure
        throw ErrorFtpTransfer(errorMsg, replaceCpy(_("Phase: %x"), L"%x", getPhaseLabel(phase_)) + L"\n" + formatFtpReply(finalReply), finalReply.code);

    onConfirmed(); //throw ErrorLocalFileSystem
    phase_ = TransferPhase::completed;
}


void FtpTransfer::setBinaryType(const std::wstring& errorMsg) //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
{
    const FtpReply reply = ctrl_.sendCommand("TYPE I"); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    if (reply.code / 100 != 2)
        throw ErrorFtpProtocol(errorMsg, formatFtpReply(reply), reply.code);
}


std::string FtpTransfer::list(const std::string& remotePath) //throw ErrorFtp*
{
    const std::wstring errorMsg = replaceCpy(_("Cannot read directory %x."), L"%x", fmtRemotePath(remotePath));
    const int timeoutSec = ctrl_.getConfig().timeoutSec;

    std::string listing;
    runDataTransfer(remotePath.empty() ? "LIST" : "LIST " + remotePath, errorMsg, [&](SocketType sock)
    {
        std::vector<char> buffer(ctrl_.getConfig().transferBlockSize);
        for (;;)
        {
            const size_t bytesRead = tryReadSocket(sock, buffer.data(), buffer.size(), timeoutSec); //throw SysError, SysErrorTimeout
            if (bytesRead == 0) //server closes the data connection when done
                return;

            listing.append(buffer.data(), bytesRead);
            bytesTransferred_ += bytesRead;
        }
    },
    [] {}); //throw ErrorFtp*
    return listing;
}


void FtpTransfer::retrieve(const std::string& remotePath, TransferSink& sink) //throw ErrorFtp*, ErrorLocalFileSystem
{
    const std::wstring errorMsg = replaceCpy(_("Cannot read file %x."), L"%x", fmtRemotePath(remotePath));
    const int timeoutSec = ctrl_.getConfig().timeoutSec;

    setBinaryType(errorMsg); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    runDataTransfer("RETR " + remotePath, errorMsg, [&](SocketType sock)
    {
        std::vector<char> buffer(ctrl_.getConfig().transferBlockSize);
        for (;;)
        {
            const size_t bytesRead = tryReadSocket(sock, buffer.data(), buffer.size(), timeoutSec); //throw SysError, SysErrorTimeout
            if (bytesRead == 0)
                return;

            sink.write(buffer.data(), bytesRead); //throw ErrorLocalFileSystem
            bytesTransferred_ += bytesRead;
        }
    },
    [&] { sink.finalize(); }); //throw ErrorFtp*, ErrorLocalFileSystem
}


void FtpTransfer::store(TransferSource& source, const std::string& remotePath) //throw ErrorFtp*, ErrorLocalFileSystem
{
    const std::wstring errorMsg = replaceCpy(_("Cannot write file %x."), L"%x", fmtRemotePath(remotePath));
    const int timeoutSec = ctrl_.getConfig().timeoutSec;

    setBinaryType(errorMsg); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    runDataTransfer("STOR " + remotePath, errorMsg, [&](SocketType sock)
    {
        std::vector<char> buffer(ctrl_.getConfig().transferBlockSize);
        for (;;)
        {
            const size_t bytesRead = source.tryRead(buffer.data(), buffer.size()); //throw ErrorLocalFileSystem
            if (bytesRead == 0)
                break;

            writeSocket(sock, buffer.data(), bytesRead, timeoutSec); //throw SysError, SysErrorTimeout
            bytesTransferred_ += bytesRead;
        }
        shutdownSocketSend(sock); //throw SysError; EOF tells the server the upload is complete
    },
    [] {}); //throw ErrorFtp*, ErrorLocalFileSystem
}


void FtpTransfer::createFolder(const std::string& remotePath) //throw ErrorFtpDirectory, ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
{
    const FtpReply reply = ctrl_.sendCommand("MKD " + remotePath); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    if (reply.code != 257)
        throw ErrorFtpDirectory(replaceCpy(_("Cannot create directory %x."), L"%x", fmtRemotePath(remotePath)), formatFtpReply(reply), reply.code);
}


void FtpTransfer::removeFolder(const std::string& remotePath) //throw ErrorFtpDirectory, ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
{
    const FtpReply reply = ctrl_.sendCommand("RMD " + remotePath); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    if (reply.code != 250)
        throw ErrorFtpDirectory(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtRemotePath(remotePath)), formatFtpReply(reply), reply.code);
}


void FtpTransfer::removeFile(const std::string& remotePath) //throw ErrorFtpDelete, ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
{
    const FtpReply reply = ctrl_.sendCommand("DELE " + remotePath); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    if (reply.code != 250)
        throw ErrorFtpDelete(replaceCpy(_("Cannot delete file %x."), L"%x", fmtRemotePath(remotePath)), formatFtpReply(reply), reply.code);
}
