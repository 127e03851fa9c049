#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace tinydep::core {

// Type-erased key -> value map for one scope. Every operation takes the store lock,
// so a store can be shared by all threads running inside the same scope.
class DependencyStorage {
public:
    struct BoundValue {
        std::any value;
        std::string keyName;
    };

    using Factory = std::function<std::any()>;

    DependencyStorage() = default;

    DependencyStorage(const DependencyStorage&) = delete;
    DependencyStorage& operator=(const DependencyStorage&) = delete;

    std::optional<std::any> find(std::type_index id) const;

    // Cached value if present; otherwise seeds the slot with factory() and returns it.
    // Concurrent first reads may both run the factory, but only the first insert is kept.
    std::any resolve(std::type_index id, const std::string& keyName, const Factory& factory);

    void assign(std::type_index id, std::string keyName, std::any value);

    bool contains(std::type_index id) const;
    std::size_t size() const;
    std::vector<std::string> keyNames() const;
    void clear();

    // Independent map with the same entries; values are copied, not deep-cloned.
    std::shared_ptr<DependencyStorage> copy() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, BoundValue> entries_;
};

}  // namespace tinydep::core
