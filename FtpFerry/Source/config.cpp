// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include "config.h"
#include <algorithm>
#include <vector>
#include <fbase/file_access.h>
#include <libxml2/xml_wrap.h>

using namespace fbase;
using namespace ferry;


namespace
{
//-------------------------------------------------------------------------------------------------------------------------------
const int XML_FORMAT_GLOBAL_CFG = 1; //2026-10-19
//-------------------------------------------------------------------------------------------------------------------------------

const int TIMEOUT_SEC_MAX = 3600;
const size_t TRANSFER_BLOCK_SIZE_MIN = 4 * 1024;


//text -> user type conversions
bool readText(const std::string& input, std::string& value) { value = input; return true; }

bool readText(const std::string& input, bool& value)
{
    const std::string tmp = trimCpy(input);
    if (tmp == "true")
        value = true;
    else if (tmp == "false")
        value = false;
    else
        return false;
    return true;
}

template <class Num>
std::enable_if_t<std::is_integral_v<Num>, bool> readText(const std::string& input, Num& value)
{
    const std::string tmp = trimCpy(input);
    if (tmp.empty() || !std::all_of(tmp.begin() + (tmp[0] == '-' ? 1 : 0), tmp.end(), [](char c) { return isDigit(c); }))
        return false;
    if (std::is_unsigned_v<Num> && tmp[0] == '-')
        return false;
    value = stringTo<Num>(tmp);
    return true;
}


//read attributes of the root's child elements; unreadable elements keep their default value and are recorded
class SettingsIn
{
public:
    explicit SettingsIn(const xmlNode& root) : root_(root), rootFmt_('<' + getElementName(root) + '>') {}

    template <class T>
    void attribute(const std::string& elementName, const std::string& attrName, T& value)
    {
        const std::string elementFmt = rootFmt_ + " <" + elementName + '>';

        if (const xmlNode* element = getChildElement(root_, elementName))
        {
            const std::optional<std::string> attrText = getAttribute(*element, attrName);
            if (!attrText || !readText(*attrText, value))
                notifyError(elementFmt + " @" + attrName);
        }
        else
            notifyError(elementFmt);
    }

    void notifyError(const std::string& elementFmt)
    {
        if (std::find(failedElements_.begin(), failedElements_.end(), elementFmt) == failedElements_.end())
            failedElements_.push_back(elementFmt);
    }

    std::wstring getErrors() const
    {
        std::wstring msg;
        for (const std::string& elementFmt : failedElements_)
        {
            if (!msg.empty())
                msg += L'\n';
            msg += utfTo<std::wstring>(elementFmt);
        }
        return msg;
    }

private:
    const xmlNode& root_;
    const std::string rootFmt_;
    std::vector<std::string> failedElements_;
};


void readConfig(SettingsIn& in, GlobalSettings& cfg, int formatVer)
{
    in.attribute("Timeout", "Seconds", cfg.timeoutSec);

    in.attribute("PassiveMode", "UseControlHost", cfg.pasvUseControlHost);

    in.attribute("ProtocolLog", "Verbose",  cfg.verboseLog);
    in.attribute("ProtocolLog", "FilePath", cfg.protocolLogFilePath);

    in.attribute("Transfer", "BlockSize", cfg.transferBlockSize);
}
}


FtpSessionCfg ferry::getSessionConfig(const GlobalSettings& settings, ErrorLog* protocolLog)
{
    return
    {
        .timeoutSec         = settings.timeoutSec,
        .pasvUseControlHost = settings.pasvUseControlHost,
        .transferBlockSize  = settings.transferBlockSize,
        .protocolLog        = protocolLog,
    };
}


Zstring ferry::getGlobalConfigDefaultPath()
{
    //XDG layout: $XDG_CONFIG_HOME or ~/.config
    const gchar* cfgDirPath = ::g_get_user_config_dir(); //owned by glib; never null
    return appendPath(appendPath(cfgDirPath, Zstr("FtpFerry")), Zstr("GlobalSettings.xml"));
}


std::pair<GlobalSettings, std::wstring /*warningMsg*/> ferry::readGlobalSettings(const Zstring& filePath) //throw FileError
{
    if (!itemExists(filePath)) //throw FileError
        return {GlobalSettings(), std::wstring()};

    const XmlDocument doc = loadXml(filePath); //throw FileError
    const xmlNode* root = doc.getRoot();

    const std::string cfgType = [&]
    {
        if (root && getElementName(*root) == "FtpFerry")
            if (const std::optional<std::string> type = getAttribute(*root, "XmlType"))
                return *type;
        return std::string();
    }();
    if (cfgType != "GLOBAL")
        throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)));

    int formatVer = 0;
    if (const std::optional<std::string> formatText = getAttribute(*root, "XmlFormat"))
        /*bool success =*/ readText(*formatText, formatVer);

    if (formatVer > XML_FORMAT_GLOBAL_CFG)
        throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)),
                        replaceCpy(_("Unsupported format version %x."), L"%x", numberTo<std::wstring>(formatVer)));
    SettingsIn in(*root);
    GlobalSettings cfg;
    readConfig(in, cfg, formatVer);

    //semantic checks: fall back to defaults like for missing elements
    if (cfg.timeoutSec <= 0 || cfg.timeoutSec > TIMEOUT_SEC_MAX)
    {
        cfg.timeoutSec = GlobalSettings().timeoutSec;
        in.notifyError("<FtpFerry> <Timeout> @Seconds");
    }
    if (cfg.transferBlockSize < TRANSFER_BLOCK_SIZE_MIN)
    {
        cfg.transferBlockSize = GlobalSettings().transferBlockSize;
        in.notifyError("<FtpFerry> <Transfer> @BlockSize");
    }
    const std::wstring errors = in.getErrors();

    std::wstring warningMsg;
    if (!errors.empty())
        warningMsg = replaceCpy(_("Configuration file %x is incomplete. The missing elements have been set to their default values."), L"%x", fmtPath(filePath)) + L"\n\n" +
                     _("The following XML elements could not be read:") + L'\n' + errors;

    return {cfg, warningMsg};
}
