// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_5023948721305762381
#define UTF_H_5023948721305762381

#include "string_tools.h"


namespace fbase
{
//convert between UTF-8 std::string and UTF-32 std::wstring (Linux wchar_t) applying conversions only if necessary
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

bool isValidUtf8(std::string_view str); //check for UTF-8 encoding errors









//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;

const CodePoint REPLACEMENT_CHAR = 0xfffd;
const CodePoint CODE_POINT_MAX   = 0x10ffff;
const CodePoint SURROGATE_FIRST  = 0xd800;
const CodePoint SURROGATE_LAST   = 0xdfff;

static_assert(sizeof(wchar_t) == 4);


inline
void codePointToUtf8(CodePoint cp, std::string& output)
{
    //https://en.wikipedia.org/wiki/UTF-8
    if (cp < 0x80)
        output += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        output += static_cast<char>((cp >> 6  ) | 0xc0);
        output += static_cast<char>((cp & 0x3f) | 0x80);
    }
    else if (cp < 0x10000)
    {
        output += static_cast<char>((cp >> 12        ) | 0xe0);
        output += static_cast<char>(((cp >> 6) & 0x3f) | 0x80);
        output += static_cast<char>((cp & 0x3f       ) | 0x80);
    }
    else if (cp <= CODE_POINT_MAX)
    {
        output += static_cast<char>((cp >> 18         ) | 0xf0);
        output += static_cast<char>(((cp >> 12) & 0x3f) | 0x80);
        output += static_cast<char>(((cp >> 6 ) & 0x3f) | 0x80);
        output += static_cast<char>((cp & 0x3f        ) | 0x80);
    }
    else
        codePointToUtf8(REPLACEMENT_CHAR, output);
}


//invalid sequences are reported as REPLACEMENT_CHAR with isValid == false
template <class Function> inline
void utf8ToCodePoint(std::string_view str, Function writeOutput) //"writeOutput" is a binary function taking CodePoint and bool "isValid"
{
    auto it = str.begin();
    while (it != str.end())
    {
        const auto ch = static_cast<unsigned char>(*it++);

        size_t trailCount = 0;
        CodePoint cp = 0;
        if (ch < 0x80)
        {
            writeOutput(ch, true);
            continue;
        }
        else if ((ch >> 5) == 0x6) { trailCount = 1; cp = ch & 0x1f; }
        else if ((ch >> 4) == 0xe) { trailCount = 2; cp = ch & 0x0f; }
        else if ((ch >> 3) == 0x1e) { trailCount = 3; cp = ch & 0x07; }
        else
        {
            writeOutput(REPLACEMENT_CHAR, false);
            continue;
        }

        bool valid = true;
        for (size_t i = 0; i < trailCount; ++i)
        {
            if (it == str.end() || (static_cast<unsigned char>(*it) >> 6) != 0x2)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(*it++) & 0x3f);
        }

        const CodePoint minValue = trailCount == 1 ? 0x80 : trailCount == 2 ? 0x800 : 0x10000; //reject overlong encodings
        if (valid && (cp < minValue || cp > CODE_POINT_MAX || (SURROGATE_FIRST <= cp && cp <= SURROGATE_LAST)))
            valid = false;

        writeOutput(valid ? cp : REPLACEMENT_CHAR, valid);
    }
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    if constexpr (std::is_same_v<typename TargetString::value_type, char>)
    {
        if constexpr (std::is_convertible_v<SourceString, std::string_view>)
            return TargetString(std::string_view(str));
        else
        {
            std::string output;
            for (const wchar_t c : std::wstring_view(str))
                impl::codePointToUtf8(static_cast<impl::CodePoint>(c), output);
            return output;
        }
    }
    else
    {
        static_assert(std::is_same_v<typename TargetString::value_type, wchar_t>);
        if constexpr (std::is_convertible_v<SourceString, std::wstring_view>)
            return TargetString(std::wstring_view(str));
        else
        {
            std::wstring output;
            impl::utf8ToCodePoint(std::string_view(str), [&](impl::CodePoint cp, bool /*isValid*/) { output += static_cast<wchar_t>(cp); });
            return output;
        }
    }
}


inline
bool isValidUtf8(std::string_view str)
{
    bool valid = true;
    impl::utf8ToCodePoint(str, [&](impl::CodePoint /*cp*/, bool isValid) { if (!isValid) valid = false; });
    return valid;
}
}

#endif //UTF_H_5023948721305762381
