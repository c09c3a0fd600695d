#include <algorithm>
#include <chrono>
#include <iterator>
#include <sstream>
#include <utility>
#include <sys/time.h>

#include <hiredis/hiredis.h>

#include "RedisEntryStore.hpp"
#include "../core/CacheErrors.hpp"
#include "../interfaces/ILogger.hpp"
#include "../utils/Utils.hpp"

namespace {
    const std::string CONFIG_PARAM = "connectionConfiguration";

    // Deletes the lock only while it still carries the caller's token.
    const std::string RELEASE_LOCK_SCRIPT =
        "if redis.call('get', KEYS[1]) == ARGV[1] then "
        "return redis.call('del', KEYS[1]) "
        "else return 0 end";

    constexpr int SCAN_BATCH_SIZE = 1000;

    struct timeval toTimeval(std::chrono::milliseconds ms) {
        struct timeval tv;
        tv.tv_sec = static_cast<long>(ms.count() / 1000);
        tv.tv_usec = static_cast<long>((ms.count() % 1000) * 1000);
        return tv;
    }

    bool parseBool(const std::string& option, const std::string& value) {
        std::string lowered = Utils::toLower(value);
        if (lowered == "true") return true;
        if (lowered == "false") return false;
        throw ArgumentError(CONFIG_PARAM, ArgumentError::Reason::Invalid,
            "Invalid boolean for option '" + option + "': " + value);
    }

    int parseInt(const std::string& option, const std::string& value) {
        if (auto val = Utils::stringToInt(value)) {
            return *val;
        }
        throw ArgumentError(CONFIG_PARAM, ArgumentError::Reason::Invalid,
            "Invalid integer for option '" + option + "': " + value);
    }

    // SCAN MATCH treats these as glob syntax
    std::string escapeGlob(const std::string& prefix) {
        std::string escaped;
        for (char c : prefix) {
            if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
                escaped.push_back('\\');
            }
            escaped.push_back(c);
        }
        return escaped;
    }

    std::string replyString(const redisReply* reply) {
        return std::string(reply->str, reply->len);
    }
}

RedisConnectionOptions RedisConnectionOptions::parse(const std::string& configuration) {
    RedisConnectionOptions options;
    bool endpoint_seen = false;

    std::stringstream ss(configuration);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = Utils::trim(token);
        if (token.empty()) {
            continue;
        }

        size_t delimiterPos = token.find('=');
        if (delimiterPos == std::string::npos) {
            // Endpoint: host[:port]. Only a single endpoint is supported.
            if (endpoint_seen) {
                throw ArgumentError(CONFIG_PARAM, ArgumentError::Reason::Invalid,
                    "Multiple endpoints are not supported: " + configuration);
            }
            endpoint_seen = true;
            size_t colon_pos = token.rfind(':');
            if (colon_pos == std::string::npos) {
                options.host = token;
            } else {
                options.host = token.substr(0, colon_pos);
                options.port = parseInt("port", token.substr(colon_pos + 1));
                if (options.port <= 0 || options.port > 65535) {
                    throw ArgumentError(CONFIG_PARAM, ArgumentError::Reason::Invalid,
                        "Invalid port number in endpoint: " + token);
                }
            }
            if (options.host.empty()) {
                throw ArgumentError(CONFIG_PARAM, ArgumentError::Reason::Invalid,
                    "Empty host in endpoint: " + token);
            }
            continue;
        }

        std::string key = Utils::toLower(Utils::trim(token.substr(0, delimiterPos)));
        std::string value = Utils::trim(token.substr(delimiterPos + 1));

        if (key == "allowadmin") {
            options.allow_admin = parseBool(key, value);
        } else if (key == "abortconnect") {
            options.abort_connect = parseBool(key, value);
        } else if (key == "connecttimeout") {
            options.connect_timeout = std::chrono::milliseconds(parseInt(key, value));
        } else if (key == "synctimeout") {
            options.sync_timeout = std::chrono::milliseconds(parseInt(key, value));
        } else if (key == "password") {
            options.password = value;
        } else if (key == "defaultdatabase") {
            options.default_database = parseInt(key, value);
        } else {
            throw ArgumentError(CONFIG_PARAM, ArgumentError::Reason::Invalid,
                "Unknown connection option: " + key);
        }
    }

    if (!endpoint_seen) {
        throw ArgumentError(CONFIG_PARAM, ArgumentError::Reason::Invalid,
            "No endpoint in connection configuration: '" + configuration + "'");
    }
    return options;
}

void RedisEntryStore::ReplyDeleter::operator()(redisReply* reply) const {
    if (reply) {
        freeReplyObject(reply);
    }
}

RedisEntryStore::RedisEntryStore(const std::string& connection_configuration, std::shared_ptr<ILogger> logger)
    : RedisEntryStore(RedisConnectionOptions::parse(connection_configuration), std::move(logger)) {}

RedisEntryStore::RedisEntryStore(const RedisConnectionOptions& options, std::shared_ptr<ILogger> logger)
    : options_(options), logger_(std::move(logger)), redis_context_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisEntryStore");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        connect();
    } catch (const ConnectivityError& e) {
        if (options_.abort_connect) {
            throw;
        }
        logger_->warn(std::string("Redis unavailable at startup, will retry on demand: ") + e.what());
    }
}

RedisEntryStore::~RedisEntryStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect();
}

void RedisEntryStore::connect() {
    redis_context_ = redisConnectWithTimeout(options_.host.c_str(), options_.port, toTimeval(options_.connect_timeout));
    if (redis_context_ == nullptr || redis_context_->err) {
        std::string error_msg;
        if (redis_context_) {
            error_msg = "Redis connection error (" + options_.host + ":" + std::to_string(options_.port) + "): " +
                        std::string(redis_context_->errstr);
            disconnect();
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg);
        throw ConnectivityError(error_msg);
    }

    if (redisSetTimeout(redis_context_, toTimeval(options_.sync_timeout)) != REDIS_OK) {
        logger_->warn("Could not apply syncTimeout to the Redis connection");
    }

    // AUTH and SELECT run before the context is considered usable
    try {
        if (!options_.password.empty()) {
            ReplyPtr auth(static_cast<redisReply*>(redisCommand(redis_context_, "AUTH %b",
                options_.password.data(), options_.password.size())));
            if (!auth) throw ConnectivityError("Redis AUTH failed: " + std::string(redis_context_->errstr));
            if (auth->type == REDIS_REPLY_ERROR) throw StoreError("Redis AUTH rejected: " + replyString(auth.get()));
        }
        if (options_.default_database != 0) {
            ReplyPtr select(static_cast<redisReply*>(redisCommand(redis_context_, "SELECT %d", options_.default_database)));
            if (!select) throw ConnectivityError("Redis SELECT failed: " + std::string(redis_context_->errstr));
            if (select->type == REDIS_REPLY_ERROR) throw StoreError("Redis SELECT rejected: " + replyString(select.get()));
        }
    } catch (const CacheError&) {
        disconnect();
        throw;
    }

    logger_->debug("Connected to Redis at " + options_.host + ":" + std::to_string(options_.port));
}

void RedisEntryStore::disconnect() {
    if (redis_context_) {
        redisFree(redis_context_);
        redis_context_ = nullptr;
    }
}

RedisEntryStore::ReplyPtr RedisEntryStore::execute(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        connect();
    }

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    ReplyPtr reply(static_cast<redisReply*>(
        redisCommandArgv(redis_context_, static_cast<int>(argv.size()), argv.data(), argvlen.data())));
    if (!reply) {
        // The context is unusable after an I/O error; reconnect on the next command
        std::string error_msg = "Redis " + args.front() + " failed: " + std::string(redis_context_->errstr);
        disconnect();
        throw ConnectivityError(error_msg);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        throw StoreError("Redis " + args.front() + " error: " + replyString(reply.get()));
    }
    return reply;
}

void RedisEntryStore::requireAdmin(const std::string& command) const {
    if (!options_.allow_admin) {
        throw StoreError("This operation is not available unless admin mode is enabled (allowAdmin=true): " + command);
    }
}

std::optional<std::string> RedisEntryStore::get(const std::string& key) {
    ReplyPtr reply = execute({"GET", key});
    if (reply->type == REDIS_REPLY_STRING) {
        return replyString(reply.get());
    }
    return std::nullopt;
}

void RedisEntryStore::set(const std::string& key, const std::string& value) {
    execute({"SET", key, value});
}

bool RedisEntryStore::remove(const std::string& key) {
    ReplyPtr reply = execute({"DEL", key});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisEntryStore::exists(const std::string& key) {
    ReplyPtr reply = execute({"EXISTS", key});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

void RedisEntryStore::addToSet(const std::string& set_key, const std::string& member) {
    execute({"SADD", set_key, member});
}

void RedisEntryStore::removeFromSet(const std::string& set_key, const std::string& member) {
    // Redis deletes the set once its last member is removed
    execute({"SREM", set_key, member});
}

std::vector<std::string> RedisEntryStore::setMembers(const std::string& set_key) {
    ReplyPtr reply = execute({"SMEMBERS", set_key});
    std::vector<std::string> members;
    if (reply->type != REDIS_REPLY_ARRAY) {
        return members;
    }
    members.reserve(reply->elements);
    for (size_t i = 0; i < reply->elements; ++i) {
        members.push_back(replyString(reply->element[i]));
    }
    return members;
}

std::vector<std::string> RedisEntryStore::scanKeys(const std::string& prefix) {
    requireAdmin("SCAN");
    const std::string pattern = escapeGlob(prefix) + "*";
    std::vector<std::string> keys;
    std::string cursor = "0";
    do {
        ReplyPtr reply = execute({"SCAN", cursor, "MATCH", pattern, "COUNT", std::to_string(SCAN_BATCH_SIZE)});
        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
            throw StoreError("Unexpected SCAN reply shape");
        }
        cursor = replyString(reply->element[0]);
        const redisReply* batch = reply->element[1];
        for (size_t i = 0; i < batch->elements; ++i) {
            keys.push_back(replyString(batch->element[i]));
        }
    } while (cursor != "0");
    return keys;
}

std::size_t RedisEntryStore::countKeys(const std::string& prefix) {
    // SCAN may return a key twice across batches
    std::vector<std::string> keys = scanKeys(prefix);
    std::sort(keys.begin(), keys.end());
    return static_cast<std::size_t>(std::distance(keys.begin(), std::unique(keys.begin(), keys.end())));
}

bool RedisEntryStore::lockTake(const std::string& lock_key, const std::string& token, std::chrono::milliseconds expiry) {
    ReplyPtr reply = execute({"SET", lock_key, token, "NX", "PX", std::to_string(expiry.count())});
    return reply->type == REDIS_REPLY_STATUS;
}

bool RedisEntryStore::lockRelease(const std::string& lock_key, const std::string& token) {
    ReplyPtr reply = execute({"EVAL", RELEASE_LOCK_SCRIPT, "1", lock_key, token});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisEntryStore::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_context_ != nullptr;
}
