#include "photolink/core/cli.hpp"
#include "photolink/core/config.hpp"
#include <algorithm>
#include <charconv>
#include <iomanip>
#include <iostream>

namespace photolink::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_switch("h", "help", "Show this help message");
    add_switch("v", "version", "Show version information");
    add_switch("", "verbose", "Log at debug level");
    add_option("c", "config", "Configuration file path", {}, "photolink.conf");
    add_option("", "host", "Peer host for the TCP bridge", {"peer.host"});
    add_option("p", "port", "Port to listen on (receive) or connect to (send)", {"listen.port", "peer.service"});
    add_option("d", "device", "RFCOMM serial device, e.g. /dev/rfcomm0", {"peer.device"});
    add_option("o", "output", "Directory for received photos", {"receiver.output_dir"});
}

void CommandLineParser::add_switch(const std::string& short_name, const std::string& long_name,
                                   const std::string& description) {
    options_.push_back(Option{short_name, long_name, description, false, "", {}, std::nullopt});
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, std::vector<std::string> config_keys,
                                   const std::string& default_value) {
    options_.push_back(Option{short_name, long_name, description, true, default_value,
                              std::move(config_keys), std::nullopt});
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    error_.clear();
    for (auto& option : options_) {
        option.value.reset();
    }

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg.starts_with("--")) {
            if (!parse_long(arg, argc, argv, i)) {
                return false;
            }
        } else if (!parse_short_cluster(arg, argc, argv, i)) {
            return false;
        }
    }

    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int argc, char* argv[], int& i) {
    auto eq_pos = arg.find('=');
    std::string name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

    auto* option = find(name);
    if (!option || option->long_name != name) {
        error_ = "Unknown option: --" + name;
        return false;
    }

    if (!option->has_value) {
        if (eq_pos != std::string::npos) {
            error_ = "Option --" + name + " takes no value";
            return false;
        }
        option->value = "true";
    } else if (eq_pos != std::string::npos) {
        option->value = arg.substr(eq_pos + 1);
    } else if (i + 1 < argc) {
        option->value = argv[++i];
    } else {
        error_ = "Option --" + name + " requires a value";
        return false;
    }
    return true;
}

// -vo dir is --verbose --output dir; -p7004 is --port 7004.
bool CommandLineParser::parse_short_cluster(const std::string& arg, int argc, char* argv[], int& i) {
    for (std::size_t j = 1; j < arg.size(); ++j) {
        std::string short_name(1, arg[j]);

        auto it = std::find_if(options_.begin(), options_.end(),
                               [&](const Option& o) { return o.short_name == short_name; });
        if (it == options_.end()) {
            error_ = "Unknown option: -" + short_name;
            return false;
        }

        if (!it->has_value) {
            it->value = "true";
            continue;
        }

        if (j + 1 < arg.size()) {
            it->value = arg.substr(j + 1);
        } else if (i + 1 < argc) {
            it->value = argv[++i];
        } else {
            error_ = "Option -" + short_name + " requires a value";
            return false;
        }
        return true;
    }
    return true;
}

CommandLineParser::Option* CommandLineParser::find(const std::string& name) {
    auto it = std::find_if(options_.begin(), options_.end(), [&](const Option& o) {
        return o.long_name == name || (!o.short_name.empty() && o.short_name == name);
    });
    return it == options_.end() ? nullptr : &*it;
}

const CommandLineParser::Option* CommandLineParser::find(const std::string& name) const {
    return const_cast<CommandLineParser*>(this)->find(name);
}

bool CommandLineParser::has_option(const std::string& name) const {
    auto* option = find(name);
    return option && option->value.has_value();
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto* option = find(name);
    if (!option) {
        return default_value;
    }
    if (option->value) {
        return *option->value;
    }
    return option->default_value.empty() ? default_value : option->default_value;
}

std::optional<int> CommandLineParser::get_int_option(const std::string& name) const {
    auto text = get_option(name);
    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

bool CommandLineParser::apply_to(Config& config) {
    if (has_option("port")) {
        auto port = get_int_option("port");
        if (!port || *port < 0 || *port > 0xFFFF) {
            error_ = "Invalid port '" + get_option("port") + "'";
            return false;
        }
    }

    for (const auto& option : options_) {
        if (!option.value) {
            continue;
        }
        for (const auto& key : option.config_keys) {
            config.set(key, *option.value);
        }
    }
    return true;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& option : options_) {
        std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        flags += "--" + option.long_name + (option.has_value ? " <value>" : "");

        std::cout << "  " << std::left << std::setw(26) << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 1.0.0\n";
    std::cout << "Photo transfer over SPP serial links\n";
}

}
