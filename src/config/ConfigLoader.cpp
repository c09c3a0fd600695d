#include "ConfigLoader.hpp"

#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>

#include "../utils/Utils.hpp"

namespace {
    using Setter = std::function<bool(AppConfig&, const std::string&)>;

    // Accepts value when it parses and satisfies valid; the setter stores it.
    Setter intSetting(std::function<bool(int)> valid, std::function<void(AppConfig&, int)> store) {
        return [valid, store](AppConfig& config, const std::string& value) {
            auto val = Utils::stringToInt(value);
            if (!val || !valid(*val)) {
                return false;
            }
            store(config, *val);
            return true;
        };
    }

    const std::map<std::string, Setter>& settings() {
        static const std::map<std::string, Setter> table = {
            {"use_redis", [](AppConfig& c, const std::string& v) {
                if (v != "0" && v != "1") return false;
                c.use_redis = (v == "1");
                return true;
            }},
            {"redis_connection", [](AppConfig& c, const std::string& v) {
                c.redis_connection = v;
                return !v.empty();
            }},
            {"key_namespace", [](AppConfig& c, const std::string& v) {
                c.key_namespace = v;
                return true;
            }},
            {"lock_wait_timeout", intSetting([](int v) { return v >= 0; },
                                             [](AppConfig& c, int v) { c.lock_wait_timeout_in_millis = v; })},
            {"lock_expiry", intSetting([](int v) { return v > 0; },
                                       [](AppConfig& c, int v) { c.lock_expiry_in_millis = v; })},
            {"log_level", [](AppConfig& c, const std::string& v) {
                try {
                    c.log_level = Utils::stringToLogLevel(v);
                    return true;
                } catch (const std::invalid_argument&) {
                    return false;
                }
            }},
            {"metrics_batch_size", intSetting([](int v) { return v >= 0; },
                                              [](AppConfig& c, int v) { c.metrics_batch_size = v; })},
            {"metrics_send_interval", intSetting([](int v) { return v > 0; },
                                                 [](AppConfig& c, int v) { c.metrics_send_interval_in_millis = v; })},
        };
        return table;
    }
}

std::vector<std::string> ConfigLoader::defaultSearchPaths() {
    return {"tagcache.config", "../tagcache.config", "/etc/tagcache/tagcache.config"};
}

AppConfig ConfigLoader::load(const std::map<std::string, std::string>& overrides,
                             const std::vector<std::string>& search_paths) {
    AppConfig config;

    bool config_found = false;
    for (const auto& path : search_paths) {
        std::ifstream file(path);
        if (file.is_open()) {
            std::cout << "Reading configuration from " << path << "..." << std::endl;
            readStream(file, config, path);
            config_found = true;
            break;
        }
    }
    if (!config_found) {
        std::cerr << "Warning: No tagcache.config found. Using defaults and command-line arguments." << std::endl;
    }

    for (const auto& [key, value] : overrides) {
        apply(config, key, value);
    }
    return config;
}

void ConfigLoader::readStream(std::istream& in, AppConfig& config, const std::string& source) {
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        line = Utils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto kv = Utils::splitKeyValue(line);
        if (!kv) {
            std::cerr << "Warning: " << source << ":" << line_number << ": expected key=value" << std::endl;
            continue;
        }
        const std::string key = Utils::trim(kv->first);
        if (!apply(config, key, Utils::trim(kv->second))) {
            std::cerr << "Warning: " << source << ":" << line_number << ": unknown key '" << key << "'" << std::endl;
        }
    }
}

bool ConfigLoader::apply(AppConfig& config, const std::string& key, const std::string& value) {
    auto it = settings().find(key);
    if (it == settings().end()) {
        return false;
    }
    // Work on a copy so a rejected value leaves the previous one in place
    AppConfig candidate = config;
    if (it->second(candidate, value)) {
        config = candidate;
    } else {
        std::cerr << "Warning: Invalid value for " << key << ": '" << value << "'" << std::endl;
    }
    return true;
}
