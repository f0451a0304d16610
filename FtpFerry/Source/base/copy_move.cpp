// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include "copy_move.h"
#include "local_file.h"
#include "../ftp/ftp_url.h"

using namespace fbase;
using namespace ferry;


namespace
{
std::wstring getItemDisplayPath(const std::string& itemPath) //throw ErrorInvalidOperation
{
    if (isFtpUrl(itemPath))
        return getDisplayPath(parseFtpUrl(itemPath)); //throw ErrorInvalidOperation; don't show the password
    return utfTo<std::wstring>(itemPath);
}


std::optional<ItemType> getLocalItemType(const Zstring& itemPath) //throw ErrorLocalFileSystem
{
    try
    {
        return getItemTypeIfExists(itemPath); //throw FileError
    }
    catch (const FileError& e) { throw ErrorLocalFileSystem(e.toString()); }
}
}


CopyMoveCoordinator::CopyMoveCoordinator(const FtpSessionCfg& cfg) :
    CopyMoveCoordinator([cfg](const FtpEndpoint& endpoint) { return std::make_unique<FtpSession>(endpoint, cfg); }) {}


CopyMoveCoordinator::CopyMoveCoordinator(const SessionFactory& sessionFactory) :
    sessionFactory_(sessionFactory) {}


std::unique_ptr<FtpSession> CopyMoveCoordinator::startSession(const FtpEndpoint& endpoint) //throw ErrorFtp*
{
    std::unique_ptr<FtpSession> session = sessionFactory_(endpoint); //throw ErrorFtp*
    if (!session)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    return session;
}


CopyResult CopyMoveCoordinator::copy(const std::string& sourcePath, const std::string& targetPath) //throw ErrorInvalidOperation, ErrorLocalFileSystem, ErrorFtp*
{
    const bool sourceRemote = isFtpUrl(sourcePath);
    const bool targetRemote = isFtpUrl(targetPath);

    //decide *before* opening any connection
    if (sourceRemote == targetRemote)
        throw ErrorInvalidOperation(replaceCpy(replaceCpy(_("Cannot copy %x to %y."),
                                                          L"%x", fmtPath(getItemDisplayPath(sourcePath))),
                                               L"%y", fmtPath(getItemDisplayPath(targetPath))),
                                    sourceRemote ?
                                    _("Copying between two FTP locations is not supported.") :
                                    _("Either source or destination must be an FTP URL."));
    if (sourceRemote)
    {
        const FtpEndpoint endpoint = parseFtpUrl(sourcePath); //throw ErrorInvalidOperation
        if (endsWith(endpoint.remotePath, '/'))
            throw ErrorInvalidOperation(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getDisplayPath(endpoint))),
                                        _("Source must be a file."));

        Zstring localPath = targetPath;
        if (getLocalItemType(localPath) == ItemType::folder) //throw ErrorLocalFileSystem
            localPath = appendPath(localPath, getItemName(endpoint.remotePath));

        //create the local file first: fail early before connecting
        LocalFileSink sink(localPath); //throw ErrorLocalFileSystem

        std::unique_ptr<FtpSession> session = startSession(endpoint); //throw ErrorFtp*
        FtpTransfer& transfer = session->getTransfer();

        transfer.retrieve(endpoint.remotePath, sink); //throw ErrorFtp*, ErrorLocalFileSystem

        return {transfer.getPhase(), transfer.getBytesTransferred(), utfTo<std::wstring>(localPath)};
    }
    else
    {
        FtpEndpoint endpoint = parseFtpUrl(targetPath); //throw ErrorInvalidOperation
        if (endsWith(endpoint.remotePath, '/'))
            endpoint.remotePath += getItemName(sourcePath);

        if (getLocalItemType(sourcePath) == ItemType::folder) //throw ErrorLocalFileSystem
            throw ErrorInvalidOperation(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(sourcePath)),
                                        _("Source must be a file."));

        LocalFileSource source(sourcePath); //throw ErrorLocalFileSystem

        std::unique_ptr<FtpSession> session = startSession(endpoint); //throw ErrorFtp*
        FtpTransfer& transfer = session->getTransfer();

        transfer.store(source, endpoint.remotePath); //throw ErrorFtp*, ErrorLocalFileSystem

        return {transfer.getPhase(), transfer.getBytesTransferred(), getDisplayPath(endpoint)};
    }
}


CopyResult CopyMoveCoordinator::move(const std::string& sourcePath, const std::string& targetPath) //throw ErrorInvalidOperation, ErrorLocalFileSystem, ErrorFtp*, ErrorDeleteAfterCopy
{
    const CopyResult result = copy(sourcePath, targetPath); //throw ErrorInvalidOperation, ErrorLocalFileSystem, ErrorFtp*

    if (result.phase != TransferPhase::completed) //copy() throws on failure
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    //the copy is complete and stays in place, no matter what happens below
    try
    {
        if (isFtpUrl(sourcePath))
        {
            const FtpEndpoint endpoint = parseFtpUrl(sourcePath); //throw ErrorInvalidOperation

            std::unique_ptr<FtpSession> session = startSession(endpoint); //throw ErrorFtp*
            session->getTransfer().removeFile(endpoint.remotePath); //throw ErrorFtpDelete, ErrorFtpConnection, ErrorFtpTimeout, ErrorFtpProtocol
        }
        else
            removeFilePlain(sourcePath); //throw FileError
    }
    catch (const FileError& e)
    {
        throw ErrorDeleteAfterCopy(replaceCpy(replaceCpy(_("%x was copied to %y, but the source could not be deleted."),
                                                         L"%x", fmtPath(getItemDisplayPath(sourcePath))),
                                              L"%y", fmtPath(result.targetDisplayPath)), e.toString());
    }
    return result;
}


std::string CopyMoveCoordinator::listFolder(const std::string& folderUrl) //throw ErrorInvalidOperation, ErrorFtp*
{
    const FtpEndpoint endpoint = parseFtpUrl(folderUrl); //throw ErrorInvalidOperation
    std::unique_ptr<FtpSession> session = startSession(endpoint); //throw ErrorFtp*
    return session->getTransfer().list(endpoint.remotePath); //throw ErrorFtp*
}


void CopyMoveCoordinator::createFolder(const std::string& folderUrl) //throw ErrorInvalidOperation, ErrorFtp*
{
    const FtpEndpoint endpoint = parseFtpUrl(folderUrl); //throw ErrorInvalidOperation
    std::unique_ptr<FtpSession> session = startSession(endpoint); //throw ErrorFtp*
    session->getTransfer().createFolder(endpoint.remotePath); //throw ErrorFtp*
}


void CopyMoveCoordinator::removeFolder(const std::string& folderUrl) //throw ErrorInvalidOperation, ErrorFtp*
{
    const FtpEndpoint endpoint = parseFtpUrl(folderUrl); //throw ErrorInvalidOperation
    std::unique_ptr<FtpSession> session = startSession(endpoint); //throw ErrorFtp*
    session->getTransfer().removeFolder(endpoint.remotePath); //throw ErrorFtp*
}


void CopyMoveCoordinator::removeFile(const std::string& fileUrl) //throw ErrorInvalidOperation, ErrorFtp*
{
    const FtpEndpoint endpoint = parseFtpUrl(fileUrl); //throw ErrorInvalidOperation
    std::unique_ptr<FtpSession> session = startSession(endpoint); //throw ErrorFtp*
    session->getTransfer().removeFile(endpoint.remotePath); //throw ErrorFtp*
}
