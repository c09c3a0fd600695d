#ifndef LOCKTOKEN_HPP
#define LOCKTOKEN_HPP

#include <string>

// Proof of holding one key's distributed lock for one critical section.
struct LockToken {
    std::string key;      // Cache key the lock protects
    std::string lock_key; // Store record carrying the lock
    std::string token;    // Holder identity, compared on release
    bool released = false;
};

#endif // LOCKTOKEN_HPP
