#include "photolink/core/config.hpp"
#include "photolink/core/logger.hpp"
#include <algorithm>
#include <cctype>

namespace photolink::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        std::string key = eq_pos == std::string::npos ? "" : trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: expected key=value, line ignored", filename, line_number);
            continue;
        }

        values_[key] = trim(line.substr(eq_pos + 1));
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# PhotoLink Configuration\n\n";

    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::chrono::milliseconds Config::get_duration_ms(const std::string& key, std::chrono::milliseconds default_value) const {
    auto value = get_as<long long>(key);
    if (!value || *value < 0) {
        return default_value;
    }
    return std::chrono::milliseconds(*value);
}

std::vector<std::uint16_t> Config::get_port_list(const std::string& key) const {
    std::vector<std::uint16_t> ports;
    auto value = get(key);
    if (!value) return ports;

    std::stringstream ss(*value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;
        try {
            int port = std::stoi(item);
            if (port > 0 && port <= 0xFFFF) {
                ports.push_back(static_cast<std::uint16_t>(port));
            }
        } catch (const std::exception&) {
            // skip entries that are not numbers
        }
    }
    return ports;
}

void Config::set_defaults() {
    values_["log.level"] = "info";
    values_["log.file"] = "photolink.log";
    values_["device.name"] = "photolink";

    values_["peer.host"] = "127.0.0.1";
    values_["peer.service"] = "photolink";
    values_["peer.channels"] = "4,1";
    values_["peer.channel_base_port"] = "7000";
    values_["peer.device"] = "";
    values_["listen.port"] = "7004";

    values_["connect.max_retries"] = "5";
    values_["connect.base_delay_ms"] = "1500";
    values_["connect.step_delay_ms"] = "1000";
    values_["connect.max_delay_ms"] = "10000";

    values_["heartbeat.interval_ms"] = "10000";
    values_["heartbeat.max_missed"] = "3";
    values_["reconnect.initial_delay_ms"] = "1000";
    values_["reconnect.max_delay_ms"] = "30000";

    values_["transfer.chunk_delay_ms"] = "10";
    values_["transfer.retry_delay_ms"] = "100";
    values_["transfer.ack_timeout_ms"] = "5000";
    values_["transfer.timeout_ms"] = "60000";
    values_["receiver.inactivity_timeout_ms"] = "30000";
    values_["receiver.recovery_timeout_ms"] = "10000";
    values_["receiver.output_dir"] = ".";
}

std::string Config::trim(const std::string& str) const {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        end--;
    }

    return std::string(start, end);
}

}
