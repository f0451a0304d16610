// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef CONFIG_H_8823019475610293847
#define CONFIG_H_8823019475610293847

#include <fbase/file_error.h>
#include "ftp/control_channel.h"


namespace ferry
{
struct GlobalSettings
{
    int timeoutSec = 15;
    bool pasvUseControlHost = false;
    bool verboseLog = false; //print protocol log to stderr
    Zstring protocolLogFilePath; //optional: append protocol log
    size_t transferBlockSize = 64 * 1024;

    bool operator==(const GlobalSettings&) const = default;
};

FtpSessionCfg getSessionConfig(const GlobalSettings& settings, fbase::ErrorLog* protocolLog);

//$XDG_CONFIG_HOME/FtpFerry/GlobalSettings.xml
Zstring getGlobalConfigDefaultPath();

//missing file => default settings; incomplete file => warning message listing unreadable elements
std::pair<GlobalSettings, std::wstring /*warningMsg*/> readGlobalSettings(const Zstring& filePath); //throw FileError
}

#endif //CONFIG_H_8823019475610293847
