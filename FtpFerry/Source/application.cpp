// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#include <iostream>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include <fbase/file_io.h>
#include "base/copy_move.h"
#include "base/listing.h"
#include "config.h"
#include "return_codes.h"

using namespace fbase;
using namespace ferry;


namespace
{
DEFINE_NEW_FILE_ERROR(ErrorUsage)


struct CommandLine
{
    Zstring command;
    std::vector<Zstring> paths;
    std::optional<int> timeoutSec;
    bool verbose = false;
    Zstring globalCfgPathAlt;
    bool showHelp = false;
};


void showSyntaxHelp()
{
    std::cout << utfTo<std::string>(_("Syntax:") + L"\n\n" +
                                    L"ftpferry [" + _("options") + L"] <" + _("command") + L"> <" + _("arguments") + L">\n\n" +
                                    _("Commands:") + L'\n' +
                                    TAB_SPACE + L"ls    <url>\n" +
                                    TAB_SPACE + L"mkdir <url>\n" +
                                    TAB_SPACE + L"rmdir <url>\n" +
                                    TAB_SPACE + L"rm    <url>\n" +
                                    TAB_SPACE + L"cp    <" + _("source") + L"> <" + _("destination") + L">\n" +
                                    TAB_SPACE + L"mv    <" + _("source") + L"> <" + _("destination") + L">\n\n" +
                                    _("Exactly one of source and destination must be an FTP URL:") + L'\n' +
                                    TAB_SPACE + L"ftp://[user[:password]@]host[:port][/path]\n\n" +
                                    _("Options:") + L'\n' +
                                    TAB_SPACE + L"-v, --verbose         " + _("Print the protocol log.") + L'\n' +
                                    TAB_SPACE + L"--timeout <" + _("seconds") + L">   " + _("Time-out for each network operation.") + L'\n' +
                                    TAB_SPACE + L"--config <" + _("file") + L">       " + _("Path to an alternate GlobalSettings.xml file.") + L'\n' +
                                    TAB_SPACE + L"-h, --help            " + _("Show this help.") + L'\n');
}


void notifyAppError(const std::wstring& msg)
{
    std::cerr << utfTo<std::string>(_("Error") + L": " + msg) + '\n';
}


void printLog(const ErrorLog& log)
{
    for (const LogEntry& entry : log)
        std::cerr << formatMessage(entry);
}


CommandLine parseCommandLine(const std::vector<Zstring>& commandArgs) //throw ErrorUsage
{
    const char* optionVerbose = "--verbose";
    const char* optionTimeout = "--timeout";
    const char* optionConfig  = "--config";

    CommandLine cmdLine;
    std::vector<Zstring> positional;

    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
        if (*it == "-h" || equalAsciiNoCase(*it, "--help"))
            cmdLine.showHelp = true;
        else if (*it == "-v" || equalAsciiNoCase(*it, optionVerbose))
            cmdLine.verbose = true;
        else if (equalAsciiNoCase(*it, optionTimeout))
        {
            if (++it == commandArgs.end())
                throw ErrorUsage(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(optionTimeout)));

            if (it->empty() || it->size() > 6 || !std::all_of(it->begin(), it->end(), [](char c) { return isDigit(c); }) || stringTo<int>(*it) <= 0)
                throw ErrorUsage(replaceCpy(_("Invalid time-out value %x."), L"%x", fmtPath(*it)));
            cmdLine.timeoutSec = stringTo<int>(*it);
        }
        else if (equalAsciiNoCase(*it, optionConfig))
        {
            if (++it == commandArgs.end())
                throw ErrorUsage(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(optionConfig)));
            cmdLine.globalCfgPathAlt = *it;
        }
        else if (startsWith(*it, "--") || (startsWith(*it, '-') && it->size() == 2))
            throw ErrorUsage(replaceCpy(_("Unknown option %x."), L"%x", fmtPath(*it)));
        else
            positional.push_back(*it);

    if (cmdLine.showHelp)
        return cmdLine;

    if (positional.empty())
        throw ErrorUsage(_("No command specified."));

    cmdLine.command = positional[0];
    cmdLine.paths.assign(positional.begin() + 1, positional.end());

    const size_t expectedPaths = [&]() -> size_t
    {
        if (cmdLine.command == "ls" ||
            cmdLine.command == "mkdir" ||
            cmdLine.command == "rmdir" ||
            cmdLine.command == "rm")
            return 1;
        if (cmdLine.command == "cp" ||
            cmdLine.command == "mv")
            return 2;
        throw ErrorUsage(replaceCpy(_("Unknown command %x."), L"%x", fmtPath(cmdLine.command)));
    }();

    if (cmdLine.paths.size() != expectedPaths)
        throw ErrorUsage(replaceCpy(_P("Command %y expects 1 argument.", "Command %y expects %x arguments.", expectedPaths),
                                    L"%y", fmtPath(cmdLine.command)));
    return cmdLine;
}


void runCommand(const CommandLine& cmdLine, CopyMoveCoordinator& coordinator) //throw ErrorInvalidOperation, ErrorLocalFileSystem, ErrorFtp*, ErrorDeleteAfterCopy, SysError
{
    const std::vector<Zstring>& paths = cmdLine.paths;

    if (cmdLine.command == "ls")
        std::cout << getListingAsUtf8(coordinator.listFolder(paths[0])); //throw ErrorInvalidOperation, ErrorFtp*, SysError
    else if (cmdLine.command == "mkdir")
        coordinator.createFolder(paths[0]); //throw ErrorInvalidOperation, ErrorFtp*
    else if (cmdLine.command == "rmdir")
        coordinator.removeFolder(paths[0]); //throw ErrorInvalidOperation, ErrorFtp*
    else if (cmdLine.command == "rm")
        coordinator.removeFile(paths[0]); //throw ErrorInvalidOperation, ErrorFtp*
    else if (cmdLine.command == "cp")
        coordinator.copy(paths[0], paths[1]); //throw ErrorInvalidOperation, ErrorLocalFileSystem, ErrorFtp*
    else if (cmdLine.command == "mv")
        coordinator.move(paths[0], paths[1]); //throw ErrorInvalidOperation, ErrorLocalFileSystem, ErrorFtp*, ErrorDeleteAfterCopy
    else
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


void appendProtocolLog(const ErrorLog& log, const Zstring& filePath) //throw FileError
{
    std::string content;
    if (itemExists(filePath)) //throw FileError
        content = getFileContent(filePath, nullptr /*notifyUnbufferedIO*/); //throw FileError

    for (const LogEntry& entry : log)
        content += formatMessage(entry);

    setFileContent(filePath, content, nullptr /*notifyUnbufferedIO*/); //throw FileError
}


void flushProtocolLog(const ErrorLog& protocolLog, const GlobalSettings& settings) //nothrow
{
    if (settings.verboseLog)
        printLog(protocolLog);

    if (!settings.protocolLogFilePath.empty() && !protocolLog.empty())
        try
        {
            appendProtocolLog(protocolLog, settings.protocolLogFilePath); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


FerryExitCode runApplication(const std::vector<Zstring>& commandArgs) //throw std::exception
{
    CommandLine cmdLine;
    try
    {
        cmdLine = parseCommandLine(commandArgs); //throw ErrorUsage
    }
    catch (const ErrorUsage& e)
    {
        notifyAppError(e.toString() + L"\n\n" + _("Run with --help for the command line syntax."));
        return FerryExitCode::usage;
    }

    if (cmdLine.showHelp)
    {
        showSyntaxHelp();
        return FerryExitCode::success;
    }

    GlobalSettings settings;
    try
    {
        const Zstring globalCfgPath = !cmdLine.globalCfgPathAlt.empty() ? cmdLine.globalCfgPathAlt : getGlobalConfigDefaultPath();

        std::wstring warningMsg;
        std::tie(settings, warningMsg) = readGlobalSettings(globalCfgPath); //throw FileError
        if (!warningMsg.empty())
            std::cerr << utfTo<std::string>(_("Warning") + L": " + warningMsg) + '\n';
    }
    catch (const FileError& e)
    {
        notifyAppError(e.toString());
        return FerryExitCode::error;
    }

    //command line overrides settings file
    if (cmdLine.timeoutSec)
        settings.timeoutSec = *cmdLine.timeoutSec;
    if (cmdLine.verbose)
        settings.verboseLog = true;

    ErrorLog protocolLog;
    FBASE_ON_SCOPE_EXIT(flushProtocolLog(protocolLog, settings));

    CopyMoveCoordinator coordinator(getSessionConfig(settings, &protocolLog));
    try
    {
        runCommand(cmdLine, coordinator); //throw ErrorInvalidOperation, ErrorLocalFileSystem, ErrorFtp*, ErrorDeleteAfterCopy, SysError
        return FerryExitCode::success;
    }
    catch (const ErrorInvalidOperation& e)
    {
        notifyAppError(e.toString());
        return FerryExitCode::invalidOperation;
    }
    catch (const ErrorDeleteAfterCopy& e)
    {
        notifyAppError(e.toString());
        return FerryExitCode::deleteAfterCopy;
    }
    catch (const FileError& e)
    {
        notifyAppError(e.toString());
        return FerryExitCode::error;
    }
    catch (const SysError& e) //listing encoding
    {
        notifyAppError(e.toString());
        return FerryExitCode::error;
    }
}
}


int main(int argc, char* argv[])
{
    initExtraLog([](const ErrorLog& log) { printLog(log); }); //runs during global shutdown: nothrow!

    libcurlInit();
    FBASE_ON_SCOPE_EXIT(libcurlTearDown());

    //remove first argument which is exe path by convention
    const std::vector<Zstring> commandArgs(argv + std::min(argc, 1), argv + argc);

    FerryExitCode rc = FerryExitCode::success;
    try
    {
        rc = runApplication(commandArgs); //throw std::exception
    }
    catch (const std::exception& e)
    {
        notifyAppError(utfTo<std::wstring>(e.what()));
        rc = FerryExitCode::exception;
    }

    //errors during cleanup, e.g. QUIT failing
    printLog(fetchExtraLog());

    return static_cast<int>(rc);
}
