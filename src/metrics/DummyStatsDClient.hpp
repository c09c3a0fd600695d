#pragma once

#include <memory>

#include "../interfaces/IStatsDClient.hpp"

// Used when no STATSD_SERVER is configured; drops everything.
class DummyStatsDClient : public IStatsDClient {
public:
    static std::shared_ptr<DummyStatsDClient> getInstance() {
        static const std::shared_ptr<DummyStatsDClient> instance(new DummyStatsDClient());
        return instance;
    }

    void increment(const std::string&, int = 1) override {}
    void decrement(const std::string&, int = 1) override {}
    void gauge(const std::string&, double) override {}
    void timing(const std::string&, std::chrono::milliseconds) override {}
    void set(const std::string&, const std::string&) override {}

private:
    DummyStatsDClient() = default;
};
