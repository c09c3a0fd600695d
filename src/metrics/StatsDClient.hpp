#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <cpp-statsd-client/UDPSender.hpp>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Where and how often the cache's counters are flushed.
struct StatsDEndpoint {
    std::string host;
    uint16_t port = 8125;
    uint64_t batch_size = 100;
    uint64_t send_interval_ms = 1000;

    // "<host>:<port>"; throws std::runtime_error when malformed
    static StatsDEndpoint parse(const std::string& address);
};

// Batches StatsD lines over UDP. Metric names come from MetricsDefinitions;
// characters StatsD treats as separators are replaced.
class StatsDClient : public IStatsDClient {
public:
    StatsDClient(const StatsDEndpoint& endpoint, std::shared_ptr<ILogger> logger);
    ~StatsDClient() override;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;

    static std::string sanitize(const std::string& key);

private:
    void send(const std::string& key, const std::string& value, const char* type);

    std::shared_ptr<ILogger> logger_;
    std::unique_ptr<Statsd::UDPSender> udp_sender_;
};
