#include <iostream>
#include <filesystem>
#include <string>
#include <vector>
#include "photolink/core/logger.hpp"
#include "photolink/core/config.hpp"
#include "photolink/core/cli.hpp"
#include "photolink/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    photolink::core::CommandLineParser parser("photolink");
    photolink::core::CommandRegistry commands;

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        std::cout << "\n" << commands.usage();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = photolink::core::Config::instance();
    config.set_defaults();

    auto config_file = parser.get_option("config");
    if (std::filesystem::exists(config_file) && !config.load_from_file(config_file)) {
        std::cerr << "Warning: could not read " << config_file << "\n";
    }

    // Command line wins over the config file.
    if (!parser.apply_to(config)) {
        std::cerr << "Error: " << parser.get_error() << "\n";
        return 1;
    }

    auto log_level = photolink::core::parse_log_level(config.get_string("log.level", "info"))
        .value_or(photolink::core::LogLevel::Info);
    if (parser.has_option("verbose")) {
        log_level = photolink::core::LogLevel::Debug;
    }
    photolink::core::Logger::initialize(config.get_string("log.file", "photolink.log"), log_level);

    auto result = commands.dispatch(parser.get_positional_args());

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
    } else if (!result.message.empty()) {
        LOG_INFO("{}", result.message);
    }

    photolink::core::Logger::shutdown();
    return result.exit_code;
}
