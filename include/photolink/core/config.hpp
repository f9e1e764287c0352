#pragma once

#include <chrono>
#include <string>
#include <optional>
#include <sstream>
#include <fstream>
#include <map>
#include <vector>
#include <cstdint>

namespace photolink::core {

class Config {
public:
    static Config& instance();

    Config() = default;

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;

        std::istringstream iss(*value);
        T result;
        if (!(iss >> result)) return std::nullopt;
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    // Negative or non-numeric values fall back to default_value.
    std::chrono::milliseconds get_duration_ms(const std::string& key, std::chrono::milliseconds default_value) const;
    std::vector<std::uint16_t> get_port_list(const std::string& key) const;

    bool has(const std::string& key) const { return values_.count(key) > 0; }
    void clear() { values_.clear(); }

    void set_defaults();

private:
    std::string trim(const std::string& str) const;

    std::map<std::string, std::string> values_;
};

}
