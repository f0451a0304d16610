// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_2130879460173643876
#define STRING_TOOLS_H_2130879460173643876

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>


//string helpers working on std::basic_string<char/wchar_t>
namespace fbase
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only!
template <class Char> Char asciiToLower(Char c);

template <class S, class T> bool contains             (const S& str, const T& term);
template <class S, class T> bool startsWith           (const S& str, const T& prefix);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);
template <class S, class T> bool endsWith             (const S& str, const T& postfix);
template <class S, class T> bool equalAsciiNoCase     (const S& lhs, const T& rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class Char> [[nodiscard]] std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe);

template <class S> [[nodiscard]] S trimCpy(S str);
template <class S>            void trim   (S& str);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

//convert arithmetic types <-> string
template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //return 0 on error

std::pair<char, char> hexify(unsigned char c, bool upperCase = true);








//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r'));
}


template <class Char> inline
bool isLineBreak(Char c)
{
    return c == static_cast<Char>('\r') || c == static_cast<Char>('\n');
}


template <class Char> inline
bool isDigit(Char c)
{
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


namespace impl
{
template <class S> using CharOf = typename S::value_type;

template <class Char, class T> inline
std::basic_string_view<Char> viewOf(const T& str)
{
    if constexpr (std::is_same_v<T, Char>)
        return std::basic_string_view<Char>(&str, 1);
    else
        return std::basic_string_view<Char>(str);
}
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return std::basic_string_view<impl::CharOf<S>>(str).find(impl::viewOf<impl::CharOf<S>>(term)) != S::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto strView = std::basic_string_view<impl::CharOf<S>>(str);
    const auto prefView = impl::viewOf<impl::CharOf<S>>(prefix);
    return strView.size() >= prefView.size() && strView.substr(0, prefView.size()) == prefView;
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto strView = std::basic_string_view<impl::CharOf<S>>(str);
    const auto postView = impl::viewOf<impl::CharOf<S>>(postfix);
    return strView.size() >= postView.size() && strView.substr(strView.size() - postView.size()) == postView;
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lhsView = std::basic_string_view<impl::CharOf<S>>(lhs);
    const auto rhsView = impl::viewOf<impl::CharOf<S>>(rhs);
    return lhsView.size() == rhsView.size() &&
           std::equal(lhsView.begin(), lhsView.end(), rhsView.begin(),
    [](auto c1, auto c2) { return asciiToLower(c1) == asciiToLower(c2); });
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto strView = std::basic_string_view<impl::CharOf<S>>(str);
    const auto prefView = impl::viewOf<impl::CharOf<S>>(prefix);
    return strView.size() >= prefView.size() && equalAsciiNoCase(strView.substr(0, prefView.size()), prefView);
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto termView = impl::viewOf<impl::CharOf<S>>(term);
    const size_t pos = str.rfind(termView);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return str.substr(pos + termView.size());
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(impl::viewOf<impl::CharOf<S>>(term));
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return str.substr(0, pos);
}


template <class S, class Char> inline
std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    for (size_t blockStart = 0;;)
    {
        const size_t blockEnd = std::min(str.find(delimiter, blockStart), str.size());

        S block = str.substr(blockStart, blockEnd - blockStart);
        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.push_back(std::move(block));

        if (blockEnd == str.size())
            return output;
        blockStart = blockEnd + 1;
    }
}


template <class S> inline
void trim(S& str)
{
    auto itLast = std::find_if_not(str.rbegin(), str.rend(), [](auto c) { return isWhiteSpace(c); });
    str.erase(itLast.base(), str.end());

    auto itFirst = std::find_if_not(str.begin(), str.end(), [](auto c) { return isWhiteSpace(c); });
    str.erase(str.begin(), itFirst);
}


template <class S> inline
S trimCpy(S str)
{
    trim(str);
    return str;
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = impl::viewOf<impl::CharOf<S>>(oldTerm);
    const auto newView = impl::viewOf<impl::CharOf<S>>(newTerm);
    if (oldView.empty())
        return;

    S output;
    size_t pos = 0;
    for (size_t posFound = str.find(oldView); posFound != S::npos; posFound = str.find(oldView, pos))
    {
        output.append(str, pos, posFound - pos);
        output += newView;
        pos = posFound + oldView.size();
    }
    if (pos == 0)
        return; //nothing found
    output.append(str, pos);
    str.swap(output);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    char buffer[64] = {};
    const auto [ptr, ec] = std::to_chars(std::begin(buffer), std::end(buffer), number);
    if (ec != std::errc())
        return S();
    return S(buffer, ptr); //digits are ASCII => widen char by char
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_arithmetic_v<Num>);
    std::string ascii;
    for (auto c : trimCpy(std::basic_string<impl::CharOf<S>>(str)))
        ascii += static_cast<char>(c);

    const char* first = ascii.c_str();
    if (*first == '+')
        ++first;
    Num number = 0;
    const auto [ptr, ec] = std::from_chars(first, ascii.c_str() + ascii.size(), number);
    if (ec != std::errc() || ptr != ascii.c_str() + ascii.size())
        return 0;
    return number;
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char //input [0, 15], output 0-9, A-F
    {
        if (num <= 9)
            return static_cast<char>('0' + num);

        if (upperCase)
            return static_cast<char>('A' + (num - 10));
        else
            return static_cast<char>('a' + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}
}

#endif //STRING_TOOLS_H_2130879460173643876
