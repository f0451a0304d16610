// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef FTP_TRANSFER_H_3384710293847560192
#define FTP_TRANSFER_H_3384710293847560192

#include "data_channel.h"


namespace ferry
{
//local end of a download
struct TransferSink
{
    virtual ~TransferSink() {}
    virtual void write(const void* buffer, size_t bytesToWrite) = 0; //throw ErrorLocalFileSystem
    //called only after the server confirmed the transfer
    virtual void finalize() = 0; //throw ErrorLocalFileSystem
};


//local end of an upload
struct TransferSource
{
    virtual ~TransferSource() {}
    //may return short, only 0 means EOF!
    virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw ErrorLocalFileSystem
};


enum class TransferPhase
{
    idle,
    awaitingDataConnection,
    awaitingPreliminaryReply,
    streaming,
    awaitingFinalReply,
    completed,
    failed,
};

std::wstring getPhaseLabel(TransferPhase phase);


/*  LIST/RETR/STOR share one sequence:
        1. PASV + connect data connection
        2. send command
        3. preliminary reply: 150 or 125
        4. stream until EOF (download) or source exhausted + half-close (upload)
        5. final reply: 226 or 250

    phase is "completed" only after the control connection confirmed step 5   */
class FtpTransfer
{
public:
    explicit FtpTransfer(FtpControlChannel& ctrl) : ctrl_(ctrl) {}

    std::string list(const std::string& remotePath); //throw ErrorFtp*

    void retrieve(const std::string& remotePath, TransferSink& sink); //throw ErrorFtp*, ErrorLocalFileSystem

    void store(TransferSource& source, const std::string& remotePath); //throw ErrorFtp*, ErrorLocalFileSystem

    void createFolder(const std::string& remotePath); //throw ErrorFtpDirectory, ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    void removeFolder(const std::string& remotePath); //throw ErrorFtpDirectory, ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
    void removeFile  (const std::string& remotePath); //throw ErrorFtpDelete,    ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    TransferPhase getPhase() const { return phase_; } //state of the most recent LIST/RETR/STOR
    uint64_t getBytesTransferred() const { return bytesTransferred_; }

private:
    FtpTransfer           (const FtpTransfer&) = delete;
    FtpTransfer& operator=(const FtpTransfer&) = delete;

    template <class StreamFun, class ConfirmFun>
    void runDataTransfer(const std::string& command, const std::wstring& errorMsg, StreamFun streamData, ConfirmFun onConfirmed); //throw ErrorFtp*, ErrorLocalFileSystem

    void setBinaryType(const std::wstring& errorMsg); //throw ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol

    FtpControlChannel& ctrl_;
    TransferPhase phase_ = TransferPhase::idle;
    uint64_t bytesTransferred_ = 0;
};
}

#endif //FTP_TRANSFER_H_3384710293847560192
