#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

// Thrown synchronously for invalid caller input. Never routed to the failure channel.
class ArgumentError : public std::invalid_argument {
public:
    enum class Reason {
        Empty, // value present but empty (e.g. an empty key)
        Unset, // collection not supplied at all
        Invalid // malformed value
    };

    ArgumentError(const std::string& param_name, Reason reason, const std::string& message)
        : std::invalid_argument(message), param_name_(param_name), reason_(reason) {}

    const std::string& paramName() const { return param_name_; }
    Reason reason() const { return reason_; }

private:
    std::string param_name_;
    Reason reason_;
};

// Base for every failure the cache absorbs and reports instead of throwing.
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Store unreachable, connect failure or transport timeout.
class ConnectivityError : public CacheError {
public:
    using CacheError::CacheError;
};

// Per-key lock not granted within the wait window.
class LockTimeoutError : public CacheError {
public:
    using CacheError::CacheError;
};

// Any other store failure: error replies, undecodable records, missing admin rights.
class StoreError : public CacheError {
public:
    using CacheError::CacheError;
};

#endif // CACHEERRORS_HPP
