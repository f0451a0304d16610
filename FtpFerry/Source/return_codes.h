// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef RETURN_CODES_H_2209384756102938471
#define RETURN_CODES_H_2209384756102938471

#include <fbase/i18n.h>


namespace ferry
{
enum class FerryExitCode //as returned on process exit
{
    success = 0,
    usage,            //bad command line
    error,            //operation failed: connection, login, protocol, transfer, local file system
    invalidOperation, //e.g. copy with both sides local
    deleteAfterCopy,  //move: copy completed, but source was not deleted
    exception,        //unexpected
};
}

#endif //RETURN_CODES_H_2209384756102938471
