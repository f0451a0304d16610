// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef I18_N_H_6610392847561023845
#define I18_N_H_6610392847561023845

#include <cstdlib>
#include "string_tools.h"


//minimal layer marking user-visible text for translation

#define FBASE_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        fbase::translate(FBASE_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) fbase::translate(FBASE_TRANS_CONCAT_SUB(L, s), FBASE_TRANS_CONCAT_SUB(L, p), n)
//source and translation are required to use %x as number placeholder
//for plural form, which will be substituted automatically!!!

namespace fbase
{
inline
std::wstring translate(const std::wstring& text)
{
    return text; //English only for now
}


//translate plural forms: "%x sec" "%x sec"
template <class T> inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, T n)
{
    static_assert(sizeof(n) <= sizeof(int64_t));
    const auto n64 = static_cast<int64_t>(n);

    return replaceCpy(std::llabs(n64) == 1 ? singular : plural, L"%x", numberTo<std::wstring>(n64));
}
}

#endif //I18_N_H_6610392847561023845
