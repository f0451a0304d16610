// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef LISTING_H_5502918374650192837
#define LISTING_H_5502918374650192837

#include <fbase/sys_error.h>


namespace ferry
{
//LIST output has no defined encoding: pass UTF-8 through, treat anything else as LATIN1
std::string getListingAsUtf8(const std::string& listing); //throw SysError
}

#endif //LISTING_H_5502918374650192837
