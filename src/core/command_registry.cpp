#include "photolink/core/command_registry.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace photolink::core {

CommandRegistry::CommandRegistry() {
    register_command("send", std::make_unique<SendCommandHandler>());
    register_command("receive", std::make_unique<ReceiveCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    auto it = std::find_if(commands_.begin(), commands_.end(),
                           [&](const auto& entry) { return entry.first == name; });
    if (it != commands_.end()) {
        it->second = std::move(handler);
        return;
    }
    commands_.emplace_back(name, std::move(handler));
}

CommandResult CommandRegistry::dispatch(const std::vector<std::string>& args) {
    if (args.empty()) {
        return CommandResult::error("No command given\n" + usage());
    }

    auto it = std::find_if(commands_.begin(), commands_.end(),
                           [&](const auto& entry) { return entry.first == args[0]; });
    if (it == commands_.end()) {
        return CommandResult::error("Unknown command: " + args[0] + "\n" + usage());
    }

    return it->second->execute(args);
}

const CommandHandler* CommandRegistry::find(const std::string& name) const {
    for (const auto& [command, handler] : commands_) {
        if (command == name) {
            return handler.get();
        }
    }
    return nullptr;
}

std::string CommandRegistry::usage() const {
    std::ostringstream out;
    out << "Commands:\n";
    for (const auto& [name, handler] : commands_) {
        out << "  " << std::left << std::setw(10) << name << handler->get_description() << "\n"
            << "  " << std::setw(10) << "" << handler->get_usage() << "\n";
    }
    return out.str();
}

}
