#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace photolink::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

// photo_YYYYMMDD_HHMMSS_<sequence>.jpg in local time. Safe to call from any thread.
std::string photo_filename(std::chrono::system_clock::time_point when, int sequence);

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send a photo to the configured peer"; }
    std::string get_usage() const override { return "photolink send <file>"; }
};

class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Wait for a peer and save every photo it sends"; }
    std::string get_usage() const override { return "photolink receive"; }
};

}
