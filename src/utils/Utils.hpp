#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"

class Utils {
public:
    // "DEBUG" | "INFO" | "WARNING" | "CERROR"
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        static const std::map<std::string, LogUtils::LogLevel> levels = {
            {"DEBUG", LogUtils::LogLevel::DEBUG},
            {"INFO", LogUtils::LogLevel::INFO},
            {"WARNING", LogUtils::LogLevel::WARN},
            {"CERROR", LogUtils::LogLevel::CERROR},
        };
        auto it = levels.find(level);
        if (it == levels.end()) {
            throw std::invalid_argument("Invalid log level: " + level);
        }
        return it->second;
    }

    // Whole-string decimal integer, nullopt otherwise
    static std::optional<int> stringToInt(const std::string& str) {
        int val = 0;
        const char* end = str.data() + str.size();
        auto [ptr, ec] = std::from_chars(str.data(), end, val);
        if (str.empty() || ec != std::errc() || ptr != end) {
            return std::nullopt;
        }
        return val;
    }

    static std::string trim(const std::string& str) {
        auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        auto begin = std::find_if_not(str.begin(), str.end(), is_space);
        auto end = std::find_if_not(str.rbegin(), std::string::const_reverse_iterator(begin), is_space).base();
        return std::string(begin, end);
    }

    static std::string toLower(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return str;
    }

    // "a, b,,c" -> {"a", "b", "c"}
    static std::vector<std::string> splitList(const std::string& str, char delimiter = ',') {
        std::vector<std::string> items;
        std::stringstream ss(str);
        std::string item;
        while (std::getline(ss, item, delimiter)) {
            item = trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    // Splits "key=value" on the first '='; the value may itself contain '='.
    static std::optional<std::pair<std::string, std::string>> splitKeyValue(const std::string& text) {
        size_t eq = text.find('=');
        if (eq == std::string::npos || eq == 0) {
            return std::nullopt;
        }
        return std::make_pair(text.substr(0, eq), text.substr(eq + 1));
    }

    // Command-line key=value arguments. Any malformed argument rejects the whole list.
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> parsed;
        for (const std::string& arg : args) {
            auto kv = splitKeyValue(arg);
            if (!kv) {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected key=value." << std::endl;
                return std::nullopt;
            }
            parsed[kv->first] = kv->second;
        }
        return parsed;
    }

    // Parses an RFC 3339 UTC timestamp ("2025-01-01T12:00:00Z", optional
    // fractional seconds kept to the millisecond) into a system_clock time point.
    // Throws std::runtime_error on malformed input.
    static std::chrono::system_clock::time_point parseUTCTime(const std::string& timestamp) {
        std::tm tm{};
        std::istringstream ss(timestamp);
        ss >> std::get_time(&tm, Constants::TIME_FORMAT);
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse date/time part: '" + timestamp + "'");
        }

        std::chrono::milliseconds fraction{0};
        if (ss.peek() == '.') {
            ss.get();
            std::string digits;
            while (std::isdigit(ss.peek())) {
                digits.push_back(static_cast<char>(ss.get()));
            }
            if (digits.empty()) {
                throw std::runtime_error("Missing digits after '.': '" + timestamp + "'");
            }
            digits.resize(3, '0');
            fraction = std::chrono::milliseconds(std::stoi(digits));
        }

        std::string rest;
        std::getline(ss, rest);
        if (rest != "Z") {
            throw std::runtime_error("Expected a trailing 'Z' (UTC) in '" + timestamp + "'");
        }

        const std::time_t seconds = timegm(&tm);
        if (seconds == static_cast<std::time_t>(-1)) {
            throw std::runtime_error("Timestamp out of range: '" + timestamp + "'");
        }
        return std::chrono::system_clock::from_time_t(seconds) + fraction;
    }
};

#endif // UTILS_HPP
