// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include <algorithm>
#include <filesystem>
#include <cppunit/extensions/HelperMacros.h>
#include <fbase/file_access.h>
#include "base/copy_move.h"
#include "fake_ftp_server.h"

using namespace fbase;
using namespace ferry;


class TestCopyMove : public CPPUNIT_NS::TestFixture
{
    CPPUNIT_TEST_SUITE(TestCopyMove);
    CPPUNIT_TEST(testInvalidCombinations);
    CPPUNIT_TEST(testDownload);
    CPPUNIT_TEST(testDownloadIntoFolder);
    CPPUNIT_TEST(testDownloadFailureKeepsTarget);
    CPPUNIT_TEST(testUpload);
    CPPUNIT_TEST(testUploadIntoFolder);
    CPPUNIT_TEST(testMoveToServer);
    CPPUNIT_TEST(testMoveToServerFailure);
    CPPUNIT_TEST(testMoveFromServer);
    CPPUNIT_TEST(testMoveFromServerFailure);
    CPPUNIT_TEST(testMoveDeleteFailure);
    CPPUNIT_TEST(testSingleEndpointOperations);
    CPPUNIT_TEST_SUITE_END();

public:
    void setUp() override;
    void tearDown() override;

protected:
    void testInvalidCombinations();
    void testDownload();
    void testDownloadIntoFolder();
    void testDownloadFailureKeepsTarget();
    void testUpload();
    void testUploadIntoFolder();
    void testMoveToServer();
    void testMoveToServerFailure();
    void testMoveFromServer();
    void testMoveFromServerFailure();
    void testMoveDeleteFailure();
    void testSingleEndpointOperations();

private:
    Zstring testDir_;
};

CPPUNIT_TEST_SUITE_REGISTRATION(TestCopyMove);


namespace
{
const FtpSessionCfg testCfg{.timeoutSec = 5};
}


void
TestCopyMove::setUp()
{
    testDir_ = getPathWithTempName(appendPath(std::filesystem::temp_directory_path().string(), "FtpFerryTest"));
    createDirectory(testDir_); //throw FileError
}


void
TestCopyMove::tearDown()
{
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
}


void
TestCopyMove::testInvalidCombinations()
{
    FakeFtpServer server;
    server.setFile("/a.txt", "remote");

    const Zstring localFile = appendPath(testDir_, "local.txt");
    setFileContent(localFile, "local", nullptr);

    size_t sessionCount = 0;
    CopyMoveCoordinator coordinator([&](const FtpEndpoint& endpoint)
    {
        ++sessionCount;
        return std::make_unique<FtpSession>(endpoint, testCfg);
    });

    //local -> local
    CPPUNIT_ASSERT_THROW(coordinator.copy(localFile, appendPath(testDir_, "other.txt")), ErrorInvalidOperation);
    CPPUNIT_ASSERT_THROW(coordinator.move(localFile, appendPath(testDir_, "other.txt")), ErrorInvalidOperation);

    //remote -> remote
    CPPUNIT_ASSERT_THROW(coordinator.copy(server.getUrl("/a.txt"), server.getUrl("/b.txt")), ErrorInvalidOperation);
    CPPUNIT_ASSERT_THROW(coordinator.move(server.getUrl("/a.txt"), server.getUrl("/b.txt")), ErrorInvalidOperation);

    //folder as source
    CPPUNIT_ASSERT_THROW(coordinator.copy(testDir_, server.getUrl("/")), ErrorInvalidOperation);
    CPPUNIT_ASSERT_THROW(coordinator.copy(server.getUrl("/pub/"), testDir_), ErrorInvalidOperation);

    //not an FTP URL
    CPPUNIT_ASSERT_THROW(coordinator.listFolder(testDir_), ErrorInvalidOperation);
    CPPUNIT_ASSERT_THROW(coordinator.removeFile(localFile), ErrorInvalidOperation);

    CPPUNIT_ASSERT_EQUAL(size_t(0), sessionCount);
    CPPUNIT_ASSERT_EQUAL(size_t(0), server.getConnectionCount());

    CPPUNIT_ASSERT_EQUAL(std::string("local"), getFileContent(localFile, nullptr));
    CPPUNIT_ASSERT(!itemExists(appendPath(testDir_, "other.txt")));
    CPPUNIT_ASSERT(server.getFile("/a.txt") == "remote");
    CPPUNIT_ASSERT(!server.getFile("/b.txt"));
}


void
TestCopyMove::testDownload()
{
    FakeFtpServer server;
    server.addFolder("/pub");
    server.setFile("/pub/a.txt", "remote content");

    const Zstring targetPath = appendPath(testDir_, "b.txt");

    CopyMoveCoordinator coordinator(testCfg);
    const CopyResult result = coordinator.copy(server.getUrl("/pub/a.txt", "user:pass"), targetPath);

    CPPUNIT_ASSERT(result.phase == TransferPhase::completed);
    CPPUNIT_ASSERT_EQUAL(uint64_t(14), result.bytesTransferred);
    CPPUNIT_ASSERT(result.targetDisplayPath == utfTo<std::wstring>(targetPath));

    CPPUNIT_ASSERT_EQUAL(std::string("remote content"), getFileContent(targetPath, nullptr));
    CPPUNIT_ASSERT(server.getFile("/pub/a.txt") == "remote content");
    CPPUNIT_ASSERT_EQUAL(size_t(1), server.getConnectionCount());

    const std::vector<std::string> log = server.getCommandLog();
    CPPUNIT_ASSERT_EQUAL(std::string("USER user"), log[0]);
    CPPUNIT_ASSERT_EQUAL(std::string("PASS pass"), log[1]);
    CPPUNIT_ASSERT(std::find(log.begin(), log.end(), "RETR /pub/a.txt") != log.end());
}


void
TestCopyMove::testDownloadIntoFolder()
{
    FakeFtpServer server;
    server.setFile("/a.txt", "abc");

    CopyMoveCoordinator coordinator(testCfg);
    const CopyResult result = coordinator.copy(server.getUrl("/a.txt"), testDir_);

    const Zstring targetPath = appendPath(testDir_, "a.txt");
    CPPUNIT_ASSERT(result.targetDisplayPath == utfTo<std::wstring>(targetPath));
    CPPUNIT_ASSERT_EQUAL(std::string("abc"), getFileContent(targetPath, nullptr));
}


void
TestCopyMove::testDownloadFailureKeepsTarget()
{
    FakeFtpServer server;
    server.setFile("/a.txt", "new");
    server.setFinalTransferReply("451 Local error in processing.\r\n");

    const Zstring targetPath = appendPath(testDir_, "a.txt");
    setFileContent(targetPath, "old", nullptr);

    CopyMoveCoordinator coordinator(testCfg);
    CPPUNIT_ASSERT_THROW(coordinator.copy(server.getUrl("/a.txt"), targetPath), ErrorFtpTransfer);

    CPPUNIT_ASSERT_EQUAL(std::string("old"), getFileContent(targetPath, nullptr));
    CPPUNIT_ASSERT_EQUAL(size_t(1), static_cast<size_t>(std::distance(std::filesystem::directory_iterator(testDir_), std::filesystem::directory_iterator())));

    //missing remote file: no partial local file
    CPPUNIT_ASSERT_THROW(coordinator.copy(server.getUrl("/missing.txt"), appendPath(testDir_, "missing.txt")), ErrorFtpTransfer);
    CPPUNIT_ASSERT(!itemExists(appendPath(testDir_, "missing.txt")));
}


void
TestCopyMove::testUpload()
{
    FakeFtpServer server;
    server.addFolder("/pub");

    const Zstring sourcePath = appendPath(testDir_, "source.txt");
    setFileContent(sourcePath, "local content", nullptr);

    CopyMoveCoordinator coordinator(testCfg);
    const CopyResult result = coordinator.copy(sourcePath, server.getUrl("/pub/target.txt"));

    CPPUNIT_ASSERT(result.phase == TransferPhase::completed);
    CPPUNIT_ASSERT_EQUAL(uint64_t(13), result.bytesTransferred);
    CPPUNIT_ASSERT(result.targetDisplayPath == L"ftp://127.0.0.1:" + numberTo<std::wstring>(server.getPort()) + L"/pub/target.txt");

    CPPUNIT_ASSERT(server.getFile("/pub/target.txt") == "local content");
    CPPUNIT_ASSERT(itemExists(sourcePath));
}


void
TestCopyMove::testUploadIntoFolder()
{
    FakeFtpServer server;
    server.addFolder("/pub");

    const Zstring sourcePath = appendPath(testDir_, "source.txt");
    setFileContent(sourcePath, "abc", nullptr);

    CopyMoveCoordinator coordinator(testCfg);
    coordinator.copy(sourcePath, server.getUrl("/pub/"));

    CPPUNIT_ASSERT(server.getFile("/pub/source.txt") == "abc");

    //local errors are reported before connecting
    CPPUNIT_ASSERT_THROW(coordinator.copy(appendPath(testDir_, "missing.txt"), server.getUrl("/pub/")), ErrorLocalFileSystem);
    CPPUNIT_ASSERT_EQUAL(size_t(1), server.getConnectionCount());
}


void
TestCopyMove::testMoveToServer()
{
    FakeFtpServer server;

    const Zstring sourcePath = appendPath(testDir_, "source.txt");
    setFileContent(sourcePath, "abc", nullptr);

    CopyMoveCoordinator coordinator(testCfg);
    const CopyResult result = coordinator.move(sourcePath, server.getUrl("/target.txt"));

    CPPUNIT_ASSERT(result.phase == TransferPhase::completed);
    CPPUNIT_ASSERT(server.getFile("/target.txt") == "abc");
    CPPUNIT_ASSERT(!itemExists(sourcePath));
    CPPUNIT_ASSERT_EQUAL(size_t(1), server.getConnectionCount());
}


void
TestCopyMove::testMoveToServerFailure()
{
    FakeFtpServer server;
    server.setFinalTransferReply("552 Storage allocation exceeded.\r\n");

    const Zstring sourcePath = appendPath(testDir_, "source.txt");
    setFileContent(sourcePath, "abc", nullptr);

    CopyMoveCoordinator coordinator(testCfg);
    try
    {
        coordinator.move(sourcePath, server.getUrl("/target.txt"));
        CPPUNIT_FAIL("ErrorFtpTransfer expected");
    }
    catch (const ErrorFtpTransfer& e)
    {
        CPPUNIT_ASSERT_EQUAL(552, e.getReplyCode());
    }
    //no confirmation, no deletion
    CPPUNIT_ASSERT_EQUAL(std::string("abc"), getFileContent(sourcePath, nullptr));
    CPPUNIT_ASSERT(!server.getFile("/target.txt"));
}


void
TestCopyMove::testMoveFromServer()
{
    FakeFtpServer server;
    server.setCredentials("u", "p");
    server.setFile("/a.txt", "remote content");

    const Zstring targetPath = appendPath(testDir_, "a.txt");

    CopyMoveCoordinator coordinator(testCfg);
    const CopyResult result = coordinator.move(server.getUrl("/a.txt", "u:p"), targetPath);

    CPPUNIT_ASSERT(result.phase == TransferPhase::completed);
    CPPUNIT_ASSERT_EQUAL(std::string("remote content"), getFileContent(targetPath, nullptr));
    CPPUNIT_ASSERT(!server.getFile("/a.txt"));

    //copy and delete each use their own session
    CPPUNIT_ASSERT_EQUAL(size_t(2), server.getConnectionCount());

    const std::vector<std::string> log = server.getCommandLog();
    const auto itRetr = std::find(log.begin(), log.end(), "RETR /a.txt");
    const auto itDele = std::find(log.begin(), log.end(), "DELE /a.txt");
    CPPUNIT_ASSERT(itRetr != log.end());
    CPPUNIT_ASSERT(itDele != log.end());
    CPPUNIT_ASSERT(itRetr < itDele);
    CPPUNIT_ASSERT(std::count(log.begin(), log.end(), "USER u") == 2);
}


void
TestCopyMove::testMoveFromServerFailure()
{
    FakeFtpServer server;
    server.setFile("/a.txt", "remote content");
    server.setFinalTransferReply("451 Local error in processing.\r\n");

    const Zstring targetPath = appendPath(testDir_, "a.txt");

    CopyMoveCoordinator coordinator(testCfg);
    try
    {
        coordinator.move(server.getUrl("/a.txt"), targetPath);
        CPPUNIT_FAIL("ErrorFtpTransfer expected");
    }
    catch (const ErrorFtpTransfer& e)
    {
        CPPUNIT_ASSERT_EQUAL(451, e.getReplyCode());
    }
    //download not confirmed: remote source untouched, no local leftovers
    CPPUNIT_ASSERT(server.getFile("/a.txt") == "remote content");
    CPPUNIT_ASSERT(!itemExists(targetPath));
    CPPUNIT_ASSERT(std::filesystem::is_empty(testDir_));

    const std::vector<std::string> log = server.getCommandLog();
    CPPUNIT_ASSERT(std::find(log.begin(), log.end(), "RETR /a.txt") != log.end());
    CPPUNIT_ASSERT(std::none_of(log.begin(), log.end(), [](const std::string& line) { return startsWith(line, "DELE"); }));
    CPPUNIT_ASSERT_EQUAL(size_t(1), server.getConnectionCount());
}


void
TestCopyMove::testMoveDeleteFailure()
{
    FakeFtpServer server;
    server.setFile("/a.txt", "remote content");
    server.setReplyOverride("DELE", "550 Permission denied.\r\n");

    const Zstring targetPath = appendPath(testDir_, "a.txt");

    CopyMoveCoordinator coordinator(testCfg);
    try
    {
        coordinator.move(server.getUrl("/a.txt"), targetPath);
        CPPUNIT_FAIL("ErrorDeleteAfterCopy expected");
    }
    catch (const ErrorDeleteAfterCopy& e)
    {
        CPPUNIT_ASSERT(contains(e.toString(), L"Permission denied."));
    }
    //no rollback
    CPPUNIT_ASSERT_EQUAL(std::string("remote content"), getFileContent(targetPath, nullptr));
    CPPUNIT_ASSERT(server.getFile("/a.txt") == "remote content");
}


void
TestCopyMove::testSingleEndpointOperations()
{
    FakeFtpServer server;
    server.setFile("/a.txt", "abc");

    CopyMoveCoordinator coordinator(testCfg);

    coordinator.createFolder(server.getUrl("/pub"));
    CPPUNIT_ASSERT(server.folderExists("/pub"));

    CPPUNIT_ASSERT_EQUAL(std::string("drwxr-xr-x 2 ftp ftp 0 Jan 01 00:00 pub\r\n"
                                     "-rw-r--r-- 1 ftp ftp 3 Jan 01 00:00 a.txt\r\n"), coordinator.listFolder(server.getUrl("/")));

    coordinator.removeFolder(server.getUrl("/pub"));
    CPPUNIT_ASSERT(!server.folderExists("/pub"));

    coordinator.removeFile(server.getUrl("/a.txt"));
    CPPUNIT_ASSERT(!server.getFile("/a.txt"));

    CPPUNIT_ASSERT_THROW(coordinator.removeFile(server.getUrl("/a.txt")), ErrorFtpDelete);
    CPPUNIT_ASSERT_THROW(coordinator.removeFolder(server.getUrl("/pub")), ErrorFtpDirectory);
    CPPUNIT_ASSERT_EQUAL(size_t(6), server.getConnectionCount());
}
