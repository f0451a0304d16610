// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include <cppunit/extensions/HelperMacros.h>
#include <fbase/zstring.h>
#include <fbase/string_tools.h>

using namespace fbase;


class TestStringTools : public CPPUNIT_NS::TestFixture
{
    CPPUNIT_TEST_SUITE(TestStringTools);
    CPPUNIT_TEST(testSplit);
    CPPUNIT_TEST(testReplace);
    CPPUNIT_TEST(testNumberConversion);
    CPPUNIT_TEST(testPathHelpers);
    CPPUNIT_TEST_SUITE_END();

protected:
    void testSplit();
    void testReplace();
    void testNumberConversion();
    void testPathHelpers();
};

CPPUNIT_TEST_SUITE_REGISTRATION(TestStringTools);


void
TestStringTools::testSplit()
{
    const std::vector<std::string> allowEmpty = splitCpy(std::string("10,0,,1"), ',', SplitOnEmpty::allow);
    CPPUNIT_ASSERT_EQUAL(size_t(4), allowEmpty.size());
    CPPUNIT_ASSERT_EQUAL(std::string(""), allowEmpty[2]);

    const std::vector<std::string> skipEmpty = splitCpy(std::string("a\n\nb\n"), '\n', SplitOnEmpty::skip);
    CPPUNIT_ASSERT_EQUAL(size_t(2), skipEmpty.size());
    CPPUNIT_ASSERT_EQUAL(std::string("b"), skipEmpty[1]);
}


void
TestStringTools::testReplace()
{
    CPPUNIT_ASSERT_EQUAL(std::string("a\nb\n"), replaceCpy(std::string("a\r\nb\r\n"), "\r\n", "\n"));
    CPPUNIT_ASSERT_EQUAL(std::string("unchanged"), replaceCpy(std::string("unchanged"), "%x", "1"));
    CPPUNIT_ASSERT(replaceCpy(std::wstring(L"Cannot read %x."), L"%x", L"\"/pub\"") == L"Cannot read \"/pub\".");

    CPPUNIT_ASSERT_EQUAL(std::string("abc"), trimCpy(std::string(" \t abc \r\n")));
    CPPUNIT_ASSERT(startsWithAsciiNoCase(std::string("FTP://host"), "ftp://"));
    CPPUNIT_ASSERT(!startsWithAsciiNoCase(std::string("ftp:/"), "ftp://"));
}


void
TestStringTools::testNumberConversion()
{
    CPPUNIT_ASSERT_EQUAL(1025, stringTo<int>(std::string("1025")));
    CPPUNIT_ASSERT_EQUAL(0, stringTo<int>(std::string("12ab"))); //error => 0
    CPPUNIT_ASSERT_EQUAL(std::string("-42"), numberTo<std::string>(-42));
    CPPUNIT_ASSERT(numberTo<std::wstring>(257) == L"257");
}


void
TestStringTools::testPathHelpers()
{
    CPPUNIT_ASSERT_EQUAL(Zstring("/tmp/a.txt"), appendPath("/tmp", "a.txt"));
    CPPUNIT_ASSERT_EQUAL(Zstring("/tmp/a.txt"), appendPath("/tmp/", "a.txt"));
    CPPUNIT_ASSERT_EQUAL(Zstring("a.txt"), getItemName("/pub/a.txt"));
    CPPUNIT_ASSERT_EQUAL(Zstring("pub"), getItemName("/pub/"));
    CPPUNIT_ASSERT_EQUAL(Zstring("/pub"), getParentPath("/pub/a.txt"));
    CPPUNIT_ASSERT_EQUAL(Zstring("/"), getParentPath("/a.txt"));
    CPPUNIT_ASSERT_EQUAL(Zstring(""), getParentPath("a.txt"));
}
