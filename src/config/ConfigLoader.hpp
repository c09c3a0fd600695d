#ifndef CONFIGLOADER_HPP
#define CONFIGLOADER_HPP

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "AppConfig.hpp"

// Builds the AppConfig: defaults, then the first tagcache.config found, then
// command-line overrides. Runs before the logger exists, so problems are
// reported on stderr and the offending setting keeps its previous value.
class ConfigLoader {
public:
    static std::vector<std::string> defaultSearchPaths();

    static AppConfig load(const std::map<std::string, std::string>& overrides,
                          const std::vector<std::string>& search_paths = defaultSearchPaths());

    // "key = value" lines; '#' starts a comment line.
    static void readStream(std::istream& in, AppConfig& config, const std::string& source);

    // Returns false for keys that are not settings (e.g. CLI command arguments).
    static bool apply(AppConfig& config, const std::string& key, const std::string& value);
};

#endif // CONFIGLOADER_HPP
