#ifndef TAGINDEX_HPP
#define TAGINDEX_HPP

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "KeySpace.hpp"
#include "../interfaces/IEntryStore.hpp"

// Inverse index tag -> keys, kept as set records in the shared store.
// Callers hold the lock of the key whose memberships they change.
class TagIndex {
public:
    TagIndex(std::shared_ptr<IEntryStore> store, KeySpace key_space);

    void addKey(const std::set<std::string>& tags, const std::string& key);
    // A tag record that loses its last key is pruned by the store.
    void removeKey(const std::set<std::string>& tags, const std::string& key);
    void removeKey(const std::string& tag, const std::string& key);

    std::vector<std::string> keysFor(const std::string& tag);
    // Names of every tag that currently has a record.
    std::vector<std::string> tags();
    std::size_t tagCount();

private:
    std::shared_ptr<IEntryStore> store_;
    KeySpace key_space_;
};

#endif // TAGINDEX_HPP
