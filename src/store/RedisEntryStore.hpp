#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../interfaces/IEntryStore.hpp"

// Forward declarations
struct redisContext;
struct redisReply;
class ILogger;

// Parsed form of "host[:port][,option=value]*".
struct RedisConnectionOptions {
    std::string host = "localhost";
    int port = 6379;
    bool allow_admin = false;
    bool abort_connect = true;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds sync_timeout{5000};
    std::string password;
    int default_database = 0;

    // Throws ArgumentError (param "connectionConfiguration") on malformed input.
    static RedisConnectionOptions parse(const std::string& configuration);
};

class RedisEntryStore : public IEntryStore {
public:
    // With abortConnect=true (the default) a failed first connect throws ConnectivityError.
    RedisEntryStore(const std::string& connection_configuration, std::shared_ptr<ILogger> logger);
    RedisEntryStore(const RedisConnectionOptions& options, std::shared_ptr<ILogger> logger);
    ~RedisEntryStore() override;

    RedisEntryStore(const RedisEntryStore&) = delete;
    RedisEntryStore& operator=(const RedisEntryStore&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;

    void addToSet(const std::string& set_key, const std::string& member) override;
    void removeFromSet(const std::string& set_key, const std::string& member) override;
    std::vector<std::string> setMembers(const std::string& set_key) override;

    // Keyspace sweeps need allowAdmin=true, otherwise StoreError.
    std::vector<std::string> scanKeys(const std::string& prefix) override;
    std::size_t countKeys(const std::string& prefix) override;

    bool lockTake(const std::string& lock_key, const std::string& token, std::chrono::milliseconds expiry) override;
    bool lockRelease(const std::string& lock_key, const std::string& token) override;

    // Check if the store currently holds a live connection to Redis
    bool isConnected() const;
    const RedisConnectionOptions& options() const { return options_; }

private:
    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    void connect();                                   // Caller holds mutex_
    void disconnect();                                // Caller holds mutex_
    ReplyPtr execute(const std::vector<std::string>& args);
    void requireAdmin(const std::string& command) const;

    RedisConnectionOptions options_;
    std::shared_ptr<ILogger> logger_;
    redisContext* redis_context_;
    mutable std::mutex mutex_;
};
