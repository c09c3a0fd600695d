#ifndef KEYSPACE_HPP
#define KEYSPACE_HPP

#include <string>

// Maps cache keys and tag names onto namespaced store keys. Lock records live
// under their own prefix so they are never counted as entries or tags.
class KeySpace {
public:
    explicit KeySpace(std::string key_namespace = "tagcache:")
        : entry_prefix_(key_namespace + "entry:"),
          tag_prefix_(key_namespace + "tag:"),
          lock_prefix_(key_namespace + "lock:") {}

    std::string entryKey(const std::string& key) const { return entry_prefix_ + key; }
    std::string tagKey(const std::string& tag) const { return tag_prefix_ + tag; }
    std::string lockKey(const std::string& key) const { return lock_prefix_ + key; }

    const std::string& entryPrefix() const { return entry_prefix_; }
    const std::string& tagPrefix() const { return tag_prefix_; }

    // Inverse of entryKey / tagKey for keys returned by a prefix scan
    std::string keyFromEntryKey(const std::string& entry_key) const { return entry_key.substr(entry_prefix_.size()); }
    std::string tagFromTagKey(const std::string& tag_key) const { return tag_key.substr(tag_prefix_.size()); }

private:
    std::string entry_prefix_;
    std::string tag_prefix_;
    std::string lock_prefix_;
};

#endif // KEYSPACE_HPP
