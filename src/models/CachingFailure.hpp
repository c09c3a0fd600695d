#ifndef CACHINGFAILURE_HPP
#define CACHINGFAILURE_HPP

#include <exception>
#include <string>

// One failure the cache absorbed instead of throwing.
struct CachingFailure {
    std::string message;      // "Caching failed for <operation>"
    std::exception_ptr cause; // The original ConnectivityError / LockTimeoutError / StoreError

    // what() of the cause, or an empty string when there is none
    std::string causeMessage() const {
        if (!cause) return "";
        try {
            std::rethrow_exception(cause);
        } catch (const std::exception& e) {
            return e.what();
        }
    }

    // True if the cause is (or derives from) E
    template <typename E>
    bool causeIs() const {
        if (!cause) return false;
        try {
            std::rethrow_exception(cause);
        } catch (const E&) {
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
};

#endif // CACHINGFAILURE_HPP
