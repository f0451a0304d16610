// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include <algorithm>
#include <cstring>
#include <cppunit/extensions/HelperMacros.h>
#include "ftp/ftp_session.h"
#include "fake_ftp_server.h"

using namespace fbase;
using namespace ferry;


class TestFtpTransfer : public CPPUNIT_NS::TestFixture
{
    CPPUNIT_TEST_SUITE(TestFtpTransfer);
    CPPUNIT_TEST(testList);
    CPPUNIT_TEST(testListMissingFolder);
    CPPUNIT_TEST(testStoreRetrieve);
    CPPUNIT_TEST(testRetrieveMissingFile);
    CPPUNIT_TEST(testDataConnectionFirst);
    CPPUNIT_TEST(testDataConnectionMissing);
    CPPUNIT_TEST(testFinalReplyFailure);
    CPPUNIT_TEST(testFinalReply250);
    CPPUNIT_TEST(testStoreRejected);
    CPPUNIT_TEST(testFolderCommands);
    CPPUNIT_TEST(testRemoveFile);
    CPPUNIT_TEST(testPasvTimeout);
    CPPUNIT_TEST(testFinalReplyTimeout);
    CPPUNIT_TEST_SUITE_END();

protected:
    void testList();
    void testListMissingFolder();
    void testStoreRetrieve();
    void testRetrieveMissingFile();
    void testDataConnectionFirst();
    void testDataConnectionMissing();
    void testFinalReplyFailure();
    void testFinalReply250();
    void testStoreRejected();
    void testFolderCommands();
    void testRemoveFile();
    void testPasvTimeout();
    void testFinalReplyTimeout();
};

CPPUNIT_TEST_SUITE_REGISTRATION(TestFtpTransfer);


namespace
{
struct MemorySink : public TransferSink
{
    void write(const void* buffer, size_t bytesToWrite) override { content.append(static_cast<const char*>(buffer), bytesToWrite); }
    void finalize() override { finalized = true; }

    std::string content;
    bool finalized = false;
};


struct MemorySource : public TransferSource
{
    explicit MemorySource(const std::string& data) : content(data) {}

    size_t tryRead(void* buffer, size_t bytesToRead) override
    {
        const size_t bytesRead = std::min(bytesToRead, content.size() - pos);
        std::memcpy(buffer, content.data() + pos, bytesRead);
        pos += bytesRead;
        return bytesRead;
    }

    const std::string content;
    size_t pos = 0;
};


FtpEndpoint getEndpoint(const FakeFtpServer& server) { return {.server = "127.0.0.1", .port = server.getPort()}; }


std::string createTestData(size_t size)
{
    std::string data;
    for (size_t i = 0; i < size; ++i)
        data += static_cast<char>((i * 7 + i / 251) % 256);
    return data;
}
}


void
TestFtpTransfer::testList()
{
    FakeFtpServer server;
    server.addFolder("/pub");
    server.addFolder("/pub/sub");
    server.setFile("/pub/readme.txt", "hello");
    {
        FtpSession session(getEndpoint(server), {.timeoutSec = 5});
        FtpTransfer& transfer = session.getTransfer();
        CPPUNIT_ASSERT(transfer.getPhase() == TransferPhase::idle);

        const std::string listing = transfer.list("/pub");
        CPPUNIT_ASSERT_EQUAL(std::string("drwxr-xr-x 2 ftp ftp 0 Jan 01 00:00 sub\r\n"
                                         "-rw-r--r-- 1 ftp ftp 5 Jan 01 00:00 readme.txt\r\n"), listing);
        CPPUNIT_ASSERT(transfer.getPhase() == TransferPhase::completed);
        CPPUNIT_ASSERT_EQUAL(uint64_t(listing.size()), transfer.getBytesTransferred());
        CPPUNIT_ASSERT(session.getControlChannel().getState() == FtpControlChannel::State::ready);
    }
    const std::vector<std::string> expected
    {
        "USER anonymous",
        "PASS ",
        "PASV",
        "LIST /pub",
        "QUIT",
    };
    CPPUNIT_ASSERT(server.getCommandLog() == expected);
}


void
TestFtpTransfer::testListMissingFolder()
{
    FakeFtpServer server;

    FtpSession session(getEndpoint(server), {.timeoutSec = 5});
    try
    {
        session.getTransfer().list("/missing");
        CPPUNIT_FAIL("ErrorFtpTransfer expected");
    }
    catch (const ErrorFtpTransfer& e)
    {
        CPPUNIT_ASSERT_EQUAL(550, e.getReplyCode());
    }
    CPPUNIT_ASSERT(session.getTransfer().getPhase() == TransferPhase::failed);

    //the control connection is still usable
    CPPUNIT_ASSERT(session.getControlChannel().getState() == FtpControlChannel::State::ready);
    CPPUNIT_ASSERT_EQUAL(std::string(), session.getTransfer().list("/"));
    CPPUNIT_ASSERT(session.getTransfer().getPhase() == TransferPhase::completed);
}


void
TestFtpTransfer::testStoreRetrieve()
{
    FakeFtpServer server;

    for (const size_t size : {size_t(0), size_t(1), size_t(200 * 1024 + 13)})
    {
        const std::string data = createTestData(size);
        const std::string remotePath = "/file_" + std::to_string(size) + ".bin";
        {
            FtpSession session(getEndpoint(server), {.timeoutSec = 5, .transferBlockSize = 4096});
            MemorySource source(data);
            session.getTransfer().store(source, remotePath);

            CPPUNIT_ASSERT(session.getTransfer().getPhase() == TransferPhase::completed);
            CPPUNIT_ASSERT_EQUAL(uint64_t(size), session.getTransfer().getBytesTransferred());
        }
        CPPUNIT_ASSERT(server.getFile(remotePath) == data);
        {
            FtpSession session(getEndpoint(server), {.timeoutSec = 5});
            MemorySink sink;
            session.getTransfer().retrieve(remotePath, sink);

            CPPUNIT_ASSERT(sink.finalized);
            CPPUNIT_ASSERT_EQUAL(size, sink.content.size());
            CPPUNIT_ASSERT(sink.content == data);
            CPPUNIT_ASSERT(session.getTransfer().getPhase() == TransferPhase::completed);
        }
    }

    const std::vector<std::string> log = server.getCommandLog();
    CPPUNIT_ASSERT(std::find(log.begin(), log.end(), "TYPE I") != log.end());
}


void
TestFtpTransfer::testRetrieveMissingFile()
{
    FakeFtpServer server;

    FtpSession session(getEndpoint(server), {.timeoutSec = 5});
    MemorySink sink;
    try
    {
        session.getTransfer().retrieve("/missing.txt", sink);
        CPPUNIT_FAIL("ErrorFtpTransfer expected");
    }
    catch (const ErrorFtpTransfer& e)
    {
        CPPUNIT_ASSERT_EQUAL(550, e.getReplyCode());
        CPPUNIT_ASSERT(contains(e.toString(), L"awaiting preliminary reply"));
    }
    CPPUNIT_ASSERT(!sink.finalized);
    CPPUNIT_ASSERT(sink.content.empty());
    CPPUNIT_ASSERT(session.getTransfer().getPhase() == TransferPhase::failed);
}


void
TestFtpTransfer::testDataConnectionFirst()
{
    //server refuses LIST/RETR/STOR with 425 unless the data connection is already pending
    FakeFtpServer server;
    server.addFolder("/pub");
    {
        FtpSession session(getEndpoint(server), {.timeoutSec = 5});
        FtpTransfer& transfer = session.getTransfer();

        MemorySource source("payload");
        transfer.store(source, "/pub/data.bin");
        CPPUNIT_ASSERT(transfer.getPhase() == TransferPhase::completed);

        MemorySink sink;
        transfer.retrieve("/pub/data.bin", sink);
        CPPUNIT_ASSERT_EQUAL(std::string("payload"), sink.content);

        CPPUNIT_ASSERT(!transfer.list("/pub").empty());
    }
    CPPUNIT_ASSERT(server.getOrderingViolations().empty());

    const std::vector<std::string> log = server.getCommandLog();
    for (const char* command : {"STOR /pub/data.bin", "RETR /pub/data.bin", "LIST /pub"})
        CPPUNIT_ASSERT(std::find(log.begin(), log.end(), command) != log.end());
}


void
TestFtpTransfer::testDataConnectionMissing()
{
    FakeFtpServer server;

    FtpSession session(getEndpoint(server), {.timeoutSec = 5});
    FtpControlChannel& ctrl = session.getControlChannel();

    CPPUNIT_ASSERT_EQUAL(227, ctrl.sendCommand("PASV").code);
    CPPUNIT_ASSERT_EQUAL(425, ctrl.sendCommand("LIST /").code); //no connect() in between

    const std::vector<std::string> expected{"LIST /"};
    CPPUNIT_ASSERT(server.getOrderingViolations() == expected);
}


void
TestFtpTransfer::testFinalReplyFailure()
{
    FakeFtpServer server;
    server.setFile("/a.txt", "all bytes arrive, still no success");
    server.setFinalTransferReply("451 Local error in processing.\r\n");

    FtpSession session(getEndpoint(server), {.timeoutSec = 5});
    MemorySink sink;
    try
    {
        session.getTransfer().retrieve("/a.txt", sink);
        CPPUNIT_FAIL("ErrorFtpTransfer expected");
    }
    catch (const ErrorFtpTransfer& e)
    {
        CPPUNIT_ASSERT_EQUAL(451, e.getReplyCode());
        CPPUNIT_ASSERT(contains(e.toString(), L"awaiting final reply"));
    }
    CPPUNIT_ASSERT_EQUAL(std::string("all bytes arrive, still no success"), sink.content);
    CPPUNIT_ASSERT(!sink.finalized);
    CPPUNIT_ASSERT(session.getTransfer().getPhase() == TransferPhase::failed);

    //upload: server discards the file
    MemorySource source("data");
    CPPUNIT_ASSERT_THROW(session.getTransfer().store(source, "/b.txt"), ErrorFtpTransfer);
    CPPUNIT_ASSERT(!server.getFile("/b.txt"));
}


void
TestFtpTransfer::testFinalReply250()
{
    FakeFtpServer server;
    server.setFile("/a.txt", "abc");
    server.setFinalTransferReply("250 Requested file action okay, completed.\r\n");

    FtpSession session(getEndpoint(server), {.timeoutSec = 5});
    MemorySink sink;
    session.getTransfer().retrieve("/a.txt", sink);
    CPPUNIT_ASSERT(sink.finalized);
    CPPUNIT_ASSERT_EQUAL(std::string("abc"), sink.content);
}


void
TestFtpTransfer::testStoreRejected()
{
    FakeFtpServer server;

    FtpSession session(getEndpoint(server), {.timeoutSec = 5});
    MemorySource source("data");
    try
    {
        session.getTransfer().store(source, "/missing/b.txt");
        CPPUNIT_FAIL("ErrorFtpTransfer expected");
    }
    catch (const ErrorFtpTransfer& e)
    {
        CPPUNIT_ASSERT_EQUAL(553, e.getReplyCode());
    }
    CPPUNIT_ASSERT_EQUAL(size_t(0), source.pos); //nothing was streamed
    CPPUNIT_ASSERT(!server.getFile("/missing/b.txt"));
}


void
TestFtpTransfer::testFolderCommands()
{
    FakeFtpServer server;

    FtpSession session(getEndpoint(server), {.timeoutSec = 5});
    FtpTransfer& transfer = session.getTransfer();

    transfer.createFolder("/new");
    CPPUNIT_ASSERT(server.folderExists("/new"));
    transfer.createFolder("/new/sub");
    CPPUNIT_ASSERT(server.folderExists("/new/sub"));

    try
    {
        transfer.createFolder("/new");
        CPPUNIT_FAIL("ErrorFtpDirectory expected");
    }
    catch (const ErrorFtpDirectory& e)
    {
        CPPUNIT_ASSERT_EQUAL(550, e.getReplyCode());
    }

    try
    {
        transfer.removeFolder("/new"); //not empty
        CPPUNIT_FAIL("ErrorFtpDirectory expected");
    }
    catch (const ErrorFtpDirectory& e)
    {
        CPPUNIT_ASSERT_EQUAL(550, e.getReplyCode());
    }
    CPPUNIT_ASSERT(server.folderExists("/new"));

    transfer.removeFolder("/new/sub");
    transfer.removeFolder("/new");
    CPPUNIT_ASSERT(!server.folderExists("/new"));

    CPPUNIT_ASSERT_THROW(transfer.removeFolder("/new"), ErrorFtpDirectory);

    //MKD and RMD don't touch the data transfer state
    CPPUNIT_ASSERT(transfer.getPhase() == TransferPhase::idle);
}


void
TestFtpTransfer::testRemoveFile()
{
    FakeFtpServer server;
    server.setFile("/a.txt", "abc");

    FtpSession session(getEndpoint(server), {.timeoutSec = 5});
    session.getTransfer().removeFile("/a.txt");
    CPPUNIT_ASSERT(!server.getFile("/a.txt"));

    try
    {
        session.getTransfer().removeFile("/a.txt");
        CPPUNIT_FAIL("ErrorFtpDelete expected");
    }
    catch (const ErrorFtpDelete& e)
    {
        CPPUNIT_ASSERT_EQUAL(550, e.getReplyCode());
    }
}


void
TestFtpTransfer::testPasvTimeout()
{
    FakeFtpServer server;
    server.setReplyOverride("PASV", ""); //never answer

    FtpSession session(getEndpoint(server), {.timeoutSec = 1});
    CPPUNIT_ASSERT_THROW(session.getTransfer().list("/"), ErrorFtpTimeout);
    CPPUNIT_ASSERT(session.getTransfer().getPhase() == TransferPhase::failed);
    CPPUNIT_ASSERT(session.getControlChannel().getState() == FtpControlChannel::State::closed);
}


void
TestFtpTransfer::testFinalReplyTimeout()
{
    FakeFtpServer server;
    server.setFile("/a.txt", "abc");
    server.setFinalTransferReply(""); //data arrives, confirmation never does

    FtpSession session(getEndpoint(server), {.timeoutSec = 1});
    MemorySink sink;
    CPPUNIT_ASSERT_THROW(session.getTransfer().retrieve("/a.txt", sink), ErrorFtpTimeout);
    CPPUNIT_ASSERT(!sink.finalized);
    CPPUNIT_ASSERT(session.getTransfer().getPhase() == TransferPhase::failed);
}
