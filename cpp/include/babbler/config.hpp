#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include "logging.hpp"

namespace babbler {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);

            load_from_env();

            if (!config_file.empty()) {
                if (std::filesystem::exists(config_file)) {
                    load_from_file(config_file);
                } else {
                    LOG_WARN("Config file not found: ", config_file);
                }
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, long long>) {
                return std::stoll(it->second);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) != 0;
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

    /**
     * Checks the generation settings. Lengths and counts must be positive
     * integers and the scoring constants positive finite numbers. Unknown log levels are reset to "info".
     */
    bool validate() {
        bool valid = true;

        auto positive_integer = [&](const char* key) {
            if (!has(key)) return;
            if (!is_positive_integer(get<std::string>(key))) {
                LOG_ERROR("Invalid value for ", key, ": '", get<std::string>(key), "'");
                valid = false;
            }
        };
        auto positive_real = [&](const char* key) {
            if (!has(key)) return;
            if (!is_positive_real(get<std::string>(key))) {
                LOG_ERROR("Invalid value for ", key, ": '", get<std::string>(key), "'");
                valid = false;
            }
        };

        positive_integer("chain.order");
        positive_integer("generate.sentence_length");
        positive_integer("generate.sample_count");
        positive_integer("generate.threads");
        positive_real("generate.alpha");
        positive_real("generate.beta");

        // 0 selects twice the sentence length
        if (has("generate.max_length")) {
            std::string max_length = get<std::string>("generate.max_length");
            if (max_length != "0" && !is_positive_integer(max_length)) {
                LOG_ERROR("Invalid value for generate.max_length: '", max_length, "'");
                valid = false;
            }
        }

        std::string log_level = get<std::string>("log.level", "info");
        LogLevel parsed;
        if (!parse_log_level(log_level, parsed)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            set("log.level", "info");
        }

        return valid;
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static bool is_positive_integer(const std::string& text) {
        if (text.empty() || text.size() > 15) return false;
        if (!std::all_of(text.begin(), text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return false;
        }
        return std::stoll(text) > 0;
    }

    static bool is_positive_real(const std::string& text) {
        if (text.empty()) return false;
        char* end = nullptr;
        double value = std::strtod(text.c_str(), &end);
        return end && *end == '\0' && std::isfinite(value) && value > 0.0;
    }

    void load_from_env() {
        set_if_env("log.level", "BB_LOG_LEVEL");
        set_if_env("log.file", "BB_LOG_FILE");

        set_if_env("chain.order", "BB_ORDER");
        set_if_env("generate.sentence_length", "BB_SENTENCE_LENGTH");
        set_if_env("generate.max_length", "BB_MAX_LENGTH");
        set_if_env("generate.alpha", "BB_ALPHA");
        set_if_env("generate.beta", "BB_BETA");
        set_if_env("generate.sample_count", "BB_SAMPLE_COUNT");
        set_if_env("generate.threads", "BB_THREADS");
    }

    void set_if_env(const std::string& key, const std::string& env_var) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = trim(line.substr(0, equals_pos));
                std::string value = trim(line.substr(equals_pos + 1));

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    static std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
        return s;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Load configuration and apply the logging settings it carries
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    LogLevel level = LogLevel::INFO;
    if (parse_log_level(config.get<std::string>("log.level", "info"), level)) {
        set_log_level(level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream;
        if (log_stream.is_open()) log_stream.close();
        log_stream.open(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace babbler
