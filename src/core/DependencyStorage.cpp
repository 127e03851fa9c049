#include "core/DependencyStorage.hpp"

#include <algorithm>
#include <utility>

#include "common/Log.hpp"

namespace tinydep::core {

std::optional<std::any> DependencyStorage::find(std::type_index id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::any DependencyStorage::resolve(std::type_index id, const std::string& keyName, const Factory& factory) {
    if (auto cached = find(id)) {
        return std::move(*cached);
    }

    // Built outside the lock: a default may itself read other dependencies.
    std::any seeded = factory();

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.emplace(id, BoundValue{std::move(seeded), keyName});
    if (inserted) {
        LOG_DEBUG("Valor por defecto sembrado para " << keyName << " (entradas=" << entries_.size() << ")");
    }
    // A concurrent first read that won the race keeps its value; everyone returns the stored one.
    return it->second.value;
}

void DependencyStorage::assign(std::type_index id, std::string keyName, std::any value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = entries_[id];
    slot.value = std::move(value);
    slot.keyName = std::move(keyName);
}

bool DependencyStorage::contains(std::type_index id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(id) != entries_.end();
}

std::size_t DependencyStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> DependencyStorage::keyNames() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names.reserve(entries_.size());
        for (const auto& entry : entries_) {
            names.push_back(entry.second.keyName);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

void DependencyStorage::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::shared_ptr<DependencyStorage> DependencyStorage::copy() const {
    auto clone = std::make_shared<DependencyStorage>();
    std::lock_guard<std::mutex> lock(mutex_);
    clone->entries_ = entries_;
    return clone;
}

}  // namespace tinydep::core
