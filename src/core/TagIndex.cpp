#include "TagIndex.hpp"

#include <stdexcept>
#include <utility>

TagIndex::TagIndex(std::shared_ptr<IEntryStore> store, KeySpace key_space)
    : store_(std::move(store)), key_space_(std::move(key_space)) {
    if (!store_) {
        throw std::invalid_argument("Entry store cannot be null for TagIndex");
    }
}

void TagIndex::addKey(const std::set<std::string>& tags, const std::string& key) {
    for (const auto& tag : tags) {
        store_->addToSet(key_space_.tagKey(tag), key);
    }
}

void TagIndex::removeKey(const std::set<std::string>& tags, const std::string& key) {
    for (const auto& tag : tags) {
        removeKey(tag, key);
    }
}

void TagIndex::removeKey(const std::string& tag, const std::string& key) {
    store_->removeFromSet(key_space_.tagKey(tag), key);
}

std::vector<std::string> TagIndex::keysFor(const std::string& tag) {
    return store_->setMembers(key_space_.tagKey(tag));
}

std::vector<std::string> TagIndex::tags() {
    std::vector<std::string> names;
    for (const auto& tag_key : store_->scanKeys(key_space_.tagPrefix())) {
        names.push_back(key_space_.tagFromTagKey(tag_key));
    }
    return names;
}

std::size_t TagIndex::tagCount() {
    return store_->countKeys(key_space_.tagPrefix());
}
