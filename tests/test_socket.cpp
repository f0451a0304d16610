// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include <climits>
#include <cppunit/extensions/HelperMacros.h>
#include <fbase/socket.h>

using namespace fbase;


class TestSocket : public CPPUNIT_NS::TestFixture
{
    CPPUNIT_TEST_SUITE(TestSocket);
    CPPUNIT_TEST(testPollTimeout);
    CPPUNIT_TEST(testWaitReadableLargeTimeout);
    CPPUNIT_TEST(testWaitTimeout);
    CPPUNIT_TEST_SUITE_END();

public:
    void setUp() override;
    void tearDown() override;

protected:
    void testPollTimeout();
    void testWaitReadableLargeTimeout();
    void testWaitTimeout();

private:
    int sockets_[2] = {invalidSocket, invalidSocket};
};

CPPUNIT_TEST_SUITE_REGISTRATION(TestSocket);


void
TestSocket::setUp()
{
    CPPUNIT_ASSERT_EQUAL(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, sockets_));
}


void
TestSocket::tearDown()
{
    for (int& s : sockets_)
        if (s != invalidSocket)
        {
            closeSocket(s);
            s = invalidSocket;
        }
}


void
TestSocket::testPollTimeout()
{
    CPPUNIT_ASSERT_EQUAL(15000, getPollTimeoutMs(15));
    CPPUNIT_ASSERT_EQUAL(0,     getPollTimeoutMs(0));
    CPPUNIT_ASSERT_EQUAL(0,     getPollTimeoutMs(-1));

    CPPUNIT_ASSERT_EQUAL(2147483000, getPollTimeoutMs(2147483)); //largest value without clamping
    CPPUNIT_ASSERT_EQUAL(INT_MAX, getPollTimeoutMs(2147484));
    CPPUNIT_ASSERT_EQUAL(INT_MAX, getPollTimeoutMs(3000000));
    CPPUNIT_ASSERT_EQUAL(INT_MAX, getPollTimeoutMs(INT_MAX));
}


void
TestSocket::testWaitReadableLargeTimeout()
{
    const char byte = 'x';
    writeSocket(sockets_[1], &byte, 1, 5); //throw SysError, SysErrorTimeout

    //timeoutSec * 1000 would be negative as int => poll() would block forever
    waitForSocket(sockets_[0], SocketWait::read, 3000000); //throw SysError, SysErrorTimeout

    char buf = 0;
    CPPUNIT_ASSERT_EQUAL(size_t(1), tryReadSocket(sockets_[0], &buf, 1)); //throw SysError
    CPPUNIT_ASSERT_EQUAL('x', buf);
}


void
TestSocket::testWaitTimeout()
{
    CPPUNIT_ASSERT_THROW(waitForSocket(sockets_[0], SocketWait::read, 1), SysErrorTimeout);
}
