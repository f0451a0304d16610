// *****************************************************************************
// * This file is part of the FtpFerry project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpFerry authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef FAKE_FTP_SERVER_H_6619028374651029384
#define FAKE_FTP_SERVER_H_6619028374651029384

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>


/*  scripted FTP server for tests: 127.0.0.1, ephemeral port, in-memory file tree

    - one control connection at a time, handled by a background thread
    - passive mode only: PASV opens a data listener on 127.0.0.1
    - fault injection: greeting, reply overrides per command, final transfer reply
    - an empty override reply means: don't answer at all                  */
class FakeFtpServer
{
public:
    FakeFtpServer();
    ~FakeFtpServer();

    int getPort() const { return port_; }

    //"ftp://[userInfo@]127.0.0.1:port/path"
    std::string getUrl(const std::string& path, const std::string& userInfo = "") const;

    void setFile(const std::string& path, const std::string& content);
    std::optional<std::string> getFile(const std::string& path) const;

    void addFolder(const std::string& path);
    bool folderExists(const std::string& path) const;

    //by default every user/password is accepted
    void setCredentials(const std::string& user, const std::string& password);
    void setLoginWithoutPassword(bool value);

    void setGreeting(const std::string& greeting); //raw reply lines with CRLF
    void setReplyOverride(const std::string& verb, const std::string& reply); //raw reply lines with CRLF
    void setFinalTransferReply(const std::string& reply); //instead of "226 Transfer complete."

    size_t getConnectionCount() const { return connectionCount_; }
    std::vector<std::string> getCommandLog() const;
    //LIST/RETR/STOR received while no data connection was pending: "<verb> <arg>"
    std::vector<std::string> getOrderingViolations() const;

private:
    FakeFtpServer           (const FakeFtpServer&) = delete;
    FakeFtpServer& operator=(const FakeFtpServer&) = delete;

    struct Session;

    void runServer();
    void handleSession(int ctrlSock);
    void handleCommand(Session& session, const std::string& verb, const std::string& arg);
    void sendData(Session& session, const std::string& bytes);
    void receiveData(Session& session, const std::string& filePath);

    std::optional<std::string> readLine(int sock, std::string& buf);
    std::string getListing(const std::string& folderPath) const;
    bool hasChildren(const std::string& folderPath) const;

    int listenSocket_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> connectionCount_{0};

    mutable std::mutex lockState_;
    std::map<std::string, std::string> files_;
    std::set<std::string> folders_{"/"};
    std::map<std::string, std::string> replyOverrides_;
    std::string greeting_ = "220 FakeFtpServer ready.\r\n";
    std::string finalTransferReply_ = "226 Transfer complete.\r\n";
    std::optional<std::pair<std::string, std::string>> credentials_;
    bool loginWithoutPassword_ = false;
    std::vector<std::string> commandLog_;
    std::vector<std::string> orderingViolations_;

    std::thread serverThread_; //initialize last!
};

#endif //FAKE_FTP_SERVER_H_6619028374651029384
