#pragma once

#include "photolink/core/command_handler.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace photolink::core {

// Commands in registration order; the first positional argument picks one.
class CommandRegistry {
public:
    CommandRegistry();

    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);

    // args[0] names the command; an empty list or an unknown name is an error.
    CommandResult dispatch(const std::vector<std::string>& args);

    const CommandHandler* find(const std::string& name) const;
    std::string usage() const;

private:
    std::vector<std::pair<std::string, std::unique_ptr<CommandHandler>>> commands_;
};

}
