#include "StatsDClient.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "../utils/Utils.hpp"

StatsDEndpoint StatsDEndpoint::parse(const std::string& address) {
    auto colon_pos = address.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>, got: '" + address + "'");
    }

    StatsDEndpoint endpoint;
    endpoint.host = address.substr(0, colon_pos);
    // UDPSender only takes numeric addresses
    if (endpoint.host == "localhost") {
        endpoint.host = "127.0.0.1";
    }

    auto port = Utils::stringToInt(address.substr(colon_pos + 1));
    if (!port || *port <= 0 || *port > 65535) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + address);
    }
    endpoint.port = static_cast<uint16_t>(*port);
    return endpoint;
}

StatsDClient::StatsDClient(const StatsDEndpoint& endpoint, std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        endpoint.host, endpoint.port, endpoint.batch_size, endpoint.send_interval_ms);
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("Sending metrics to " + endpoint.host + ":" + std::to_string(endpoint.port));
}

StatsDClient::~StatsDClient() {
    // UDPSender flushes pending batches in its destructor
    logger_->debug("StatsDClient shutting down");
}

std::string StatsDClient::sanitize(const std::string& key) {
    std::string clean = key;
    for (char& c : clean) {
        if (c == ':' || c == '|' || c == '@' || c == '\n') {
            c = '_';
        }
    }
    return clean;
}

void StatsDClient::send(const std::string& key, const std::string& value, const char* type) {
    udp_sender_->send(sanitize(key) + ":" + value + "|" + type);
}

void StatsDClient::increment(const std::string& key, int value) {
    send(key, std::to_string(value), "c");
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::ostringstream ss;
    ss << value;
    send(key, ss.str(), "g");
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    send(key, std::to_string(value.count()), "ms");
}

void StatsDClient::set(const std::string& key, const std::string& value) {
    send(key, sanitize(value), "s");
}
