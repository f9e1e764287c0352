#pragma once

#include <optional>
#include <string>
#include <vector>

namespace photolink::core {

class Config;

// Options come in two flavours: switches (--verbose) and valued options that
// may also be bound to one or more Config keys, so the command line can
// override the file.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_switch(const std::string& short_name, const std::string& long_name, const std::string& description);
    void add_option(const std::string& short_name, const std::string& long_name, const std::string& description,
                    std::vector<std::string> config_keys = {}, const std::string& default_value = "");

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    std::optional<int> get_int_option(const std::string& name) const;

    // Copies every bound option given on the command line into config.
    // Fails without touching config when a value is out of range.
    bool apply_to(Config& config);

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        std::string short_name;
        std::string long_name;
        std::string description;
        bool has_value;
        std::string default_value;
        std::vector<std::string> config_keys;
        std::optional<std::string> value;
    };

    Option* find(const std::string& name);
    const Option* find(const std::string& name) const;

    bool parse_long(const std::string& arg, int argc, char* argv[], int& i);
    bool parse_short_cluster(const std::string& arg, int argc, char* argv[], int& i);

    std::string program_name_;
    std::vector<Option> options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
