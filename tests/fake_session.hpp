#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <ssh/remote_session.hpp>

// Shared record of what happened to the fake, outliving the session itself
struct FakeRemote {
    int connect_attempts = 0;
    int close_calls = 0;
    std::map<std::string, std::string> files;
    std::vector<std::string> commands;
    std::vector<int> command_timeouts;
    ConnectionParams last_params;

    // Behaviour
    std::string connect_error;
    std::string upload_error;
    std::string chmod_error;
    int chmod_status = 0;
    std::string exec_error;
    SSHResult exec_result{0, "", ""};
};

class FakeSession : public RemoteSession {
public:
    explicit FakeSession(FakeRemote& remote) : remote_(remote) {}

    Result<void> upload(const std::string& remote_path, const std::string& content) override {
        if (!remote_.upload_error.empty()) return Result<void>::Err(remote_.upload_error);
        remote_.files[remote_path] = content;
        return Result<void>::Ok();
    }

    Result<SSHResult> exec(const std::string& command, int timeout_secs) override {
        remote_.commands.push_back(command);
        remote_.command_timeouts.push_back(timeout_secs);
        if (command.rfind("chmod", 0) == 0) {
            if (!remote_.chmod_error.empty()) return Result<SSHResult>::Err(remote_.chmod_error);
            return Result<SSHResult>::Ok(SSHResult{remote_.chmod_status, "", ""});
        }
        if (!remote_.exec_error.empty()) return Result<SSHResult>::Err(remote_.exec_error);
        return Result<SSHResult>::Ok(remote_.exec_result);
    }

    void close() override { remote_.close_calls++; }

private:
    FakeRemote& remote_;
};

class FakeConnector : public SessionConnector {
public:
    explicit FakeConnector(FakeRemote& remote) : remote_(remote) {}

    Result<std::unique_ptr<RemoteSession>> connect(const ConnectionParams& params,
                                                   StatusCallback callback) override {
        remote_.connect_attempts++;
        remote_.last_params = params;
        if (callback) callback("fake connect");
        if (!remote_.connect_error.empty()) {
            return Result<std::unique_ptr<RemoteSession>>::Err(remote_.connect_error);
        }
        return Result<std::unique_ptr<RemoteSession>>::Ok(std::make_unique<FakeSession>(remote_));
    }

private:
    FakeRemote& remote_;
};
