#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/AppConfig.hpp"
#include "config/ConfigLoader.hpp"
#include "core/CacheErrors.hpp"
#include "core/TaggedCache.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "store/InMemoryEntryStore.hpp"
#include "store/RedisEntryStore.hpp"
#include "utils/Utils.hpp"

namespace {
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_USAGE = 1;
    constexpr int EXIT_MISS = 2;
    constexpr int EXIT_CACHING_FAILED = 3;

    const char* USAGE =
        "Usage: tagcache_cli command=<put|get|invalidate_item|invalidate_sets|purge|count> [key=value ...]\n"
        "  put              key=K value=V [tags=T1,T2] [sliding_ms=N] [absolute=YYYY-MM-DDTHH:MM:SSZ]\n"
        "  get              key=K\n"
        "  invalidate_item  key=K\n"
        "  invalidate_sets  tags=T1,T2\n"
        "  purge | count\n"
        "Any configuration key (redis_connection, lock_wait_timeout, log_level, ...) may also be given.\n"
        "Exit codes: 0 ok, 1 usage, 2 miss, 3 caching failure reported.";

    std::string argumentOr(const std::map<std::string, std::string>& args, const std::string& key, const std::string& fallback = "") {
        auto it = args.find(key);
        return it == args.end() ? fallback : it->second;
    }
}

// --- Helper Function to Initialize the entry store ---
std::shared_ptr<IEntryStore> initializeStore(const AppConfig& config_, std::shared_ptr<ILogger> logger_) {
    if (config_.use_redis) {
        auto redis_store = std::make_shared<RedisEntryStore>(config_.redis_connection, logger_);
        if (redis_store->isConnected()) {
            logger_->setup("Redis entry store connected successfully.");
        } else {
            logger_->setup("Redis entry store created disconnected; operations will report failures until it is reachable.");
        }
        return redis_store;
    }
    logger_->setup("Creating InMemoryEntryStore (process-local, use_redis=0).");
    return std::make_shared<InMemoryEntryStore>();
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    std::string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (statsd_server_endpoint.empty()) {
        logger_->debug("STATSD_SERVER not set. Creating DummyStatsDClient instance.");
        return DummyStatsDClient::getInstance();
    }

    try {
        StatsDEndpoint endpoint = StatsDEndpoint::parse(statsd_server_endpoint);
        endpoint.batch_size = static_cast<uint64_t>(config.metrics_batch_size);
        endpoint.send_interval_ms = static_cast<uint64_t>(config.metrics_send_interval_in_millis);
        return std::make_shared<StatsDClient>(endpoint, logger_);
    } catch (const std::runtime_error& e) {
        logger_->error(std::string("StatsDClient failed to get created: ") + e.what() + ". Creating DummyStatsDClient instance.");
    }
    return DummyStatsDClient::getInstance();
}

int runCommand(TaggedCache& cache, const std::map<std::string, std::string>& args, std::shared_ptr<ILogger> logger_) {
    const std::string command = argumentOr(args, "command");

    if (command == "put") {
        std::optional<std::chrono::milliseconds> sliding;
        if (args.count("sliding_ms")) {
            auto val = Utils::stringToInt(args.at("sliding_ms"));
            if (!val) {
                logger_->error("Invalid integer for sliding_ms: " + args.at("sliding_ms"));
                return EXIT_USAGE;
            }
            sliding = std::chrono::milliseconds(*val);
        }
        TimePoint absolute = CacheTime::NEVER;
        if (args.count("absolute")) {
            try {
                absolute = Utils::parseUTCTime(args.at("absolute"));
            } catch (const std::runtime_error& e) {
                logger_->error(e.what());
                return EXIT_USAGE;
            }
        }
        cache.putItem(argumentOr(args, "key"), argumentOr(args, "value"),
                      Utils::splitList(argumentOr(args, "tags")), sliding, absolute);
        return EXIT_OK;
    }
    if (command == "get") {
        auto value = cache.getItem(argumentOr(args, "key"));
        if (!value) {
            std::cout << "(miss)" << std::endl;
            return EXIT_MISS;
        }
        std::cout << *value << std::endl;
        return EXIT_OK;
    }
    if (command == "invalidate_item") {
        cache.invalidateItem(argumentOr(args, "key"));
        return EXIT_OK;
    }
    if (command == "invalidate_sets") {
        if (!args.count("tags")) {
            logger_->error("invalidate_sets requires tags=T1,T2");
            return EXIT_USAGE;
        }
        cache.invalidateSets(Utils::splitList(args.at("tags")));
        return EXIT_OK;
    }
    if (command == "purge") {
        cache.purge();
        return EXIT_OK;
    }
    if (command == "count") {
        std::cout << cache.count() << std::endl;
        return EXIT_OK;
    }

    std::cerr << USAGE << std::endl;
    return EXIT_USAGE;
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            // Use a temporary logger instance for early errors before config is loaded
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            std::cerr << USAGE << std::endl;
            return EXIT_USAGE;
        }
        const std::map<std::string, std::string>& startupArguments = *parsedArgsOpt;

        // Load Configuration
        AppConfig config_ = ConfigLoader::load(startupArguments);

        auto console_logger = ConsoleLogger::getInstance(config_.log_level);
        console_logger->setLogLevel(config_.log_level);
        std::shared_ptr<ILogger> logger_ = console_logger;
        logger_->debug(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        std::shared_ptr<IEntryStore> store = initializeStore(config_, logger_);

        TaggedCache cache(store, config_.cacheSettings(), logger_, statsd_client);

        int failures = 0;
        cache.failures().subscribe([&failures](const CachingFailure&) { ++failures; });

        int rc = runCommand(cache, startupArguments, logger_);
        if (failures > 0) {
            logger_->warn(std::to_string(failures) + " caching failure(s) were reported");
            return EXIT_CACHING_FAILED;
        }
        return rc;
    } catch (const ArgumentError& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Invalid argument '" + e.paramName() + "': " + e.what());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return EXIT_USAGE;
    }
}
