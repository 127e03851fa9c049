#pragma once

#include <any>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#include "core/DefaultPolicy.hpp"
#include "core/DependencyKey.hpp"
#include "core/DependencyStorage.hpp"
#include "core/ScopeStack.hpp"

namespace tinydep::core {

namespace detail {

// Logs and aborts: an entry under a key holding another type means two keys share an identity.
[[noreturn]] void typeMismatch(const std::string& keyName,
                               const std::type_info& expected,
                               const std::type_info& actual);

}  // namespace detail

// Typed view over one store. Copies of the handle share the store; copy() does not.
class DependencyValues {
public:
    explicit DependencyValues(StoragePtr storage);

    // Values of the caller's active scope, or the root store outside any scope.
    static DependencyValues current();
    static DependencyValues root();

    // Drops every cached and assigned root entry.
    static void resetRoot();

    template <typename K>
    typename KeyTraits<K>::Value get() const {
        using Value = typename KeyTraits<K>::Value;
        const std::any erased = storage_->resolve(keyId<K>(), keyName<K>(), [] {
            return std::any(DefaultPolicy<K>::resolve());
        });
        return unwrap<K, Value>(erased);
    }

    template <typename K>
    std::optional<typename KeyTraits<K>::Value> peek() const {
        using Value = typename KeyTraits<K>::Value;
        auto erased = storage_->find(keyId<K>());
        if (!erased) {
            return std::nullopt;
        }
        return unwrap<K, Value>(*erased);
    }

    template <typename K>
    void set(typename KeyTraits<K>::Value value) {
        storage_->assign(keyId<K>(), keyName<K>(), std::any(std::move(value)));
    }

    template <typename K>
    bool contains() const {
        return storage_->contains(keyId<K>());
    }

    std::size_t size() const;
    std::vector<std::string> boundKeys() const;

    DependencyValues copy() const;

    const StoragePtr& storage() const { return storage_; }

private:
    template <typename K, typename Value>
    static Value unwrap(const std::any& erased) {
        if (const auto* typed = std::any_cast<Value>(&erased)) {
            return *typed;
        }
        detail::typeMismatch(keyName<K>(), typeid(Value), erased.type());
    }

    StoragePtr storage_;
};

// Read-current-value: resolves K in the caller's active scope.
template <typename K>
typename KeyTraits<K>::Value current() {
    return DependencyValues::current().get<K>();
}

}  // namespace tinydep::core
