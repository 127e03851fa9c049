#pragma once

#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

#include <boost/core/demangle.hpp>

namespace tinydep::core {

// A key is any type K with:
//   using Value = V;
//   static V productionDefault();
//   static V testDefault();     // optional, falls back to productionDefault()
//   static V previewDefault();  // optional, falls back to productionDefault()
// Identity is the key type itself; nothing is registered at runtime.
namespace detail {

template <typename K, typename = void>
struct HasValueType : std::false_type {};

template <typename K>
struct HasValueType<K, std::void_t<typename K::Value>> : std::true_type {};

template <typename K, typename = void>
struct HasProductionDefault : std::false_type {};

template <typename K>
struct HasProductionDefault<K, std::void_t<decltype(K::productionDefault())>>
    : std::is_convertible<decltype(K::productionDefault()), typename K::Value> {};

template <typename K, typename = void>
struct HasTestDefault : std::false_type {};

template <typename K>
struct HasTestDefault<K, std::void_t<decltype(K::testDefault())>>
    : std::is_convertible<decltype(K::testDefault()), typename K::Value> {};

template <typename K, typename = void>
struct HasPreviewDefault : std::false_type {};

template <typename K>
struct HasPreviewDefault<K, std::void_t<decltype(K::previewDefault())>>
    : std::is_convertible<decltype(K::previewDefault()), typename K::Value> {};

}  // namespace detail

template <typename K>
struct KeyTraits {
    static_assert(detail::HasValueType<K>::value, "dependency key must declare `using Value = ...;`");
    static_assert(std::is_copy_constructible<typename K::Value>::value,
                  "dependency key Value must be copy-constructible");
    static_assert(detail::HasProductionDefault<K>::value,
                  "dependency key must provide `static Value productionDefault()`");

    using Value = typename K::Value;

    static constexpr bool kHasTestDefault = detail::HasTestDefault<K>::value;
    static constexpr bool kHasPreviewDefault = detail::HasPreviewDefault<K>::value;

    static Value productionDefault() { return K::productionDefault(); }

    static Value testDefault() {
        if constexpr (kHasTestDefault) {
            return K::testDefault();
        } else {
            return K::productionDefault();
        }
    }

    static Value previewDefault() {
        if constexpr (kHasPreviewDefault) {
            return K::previewDefault();
        } else {
            return K::productionDefault();
        }
    }
};

template <typename K>
std::type_index keyId() {
    return std::type_index(typeid(K));
}

template <typename K>
std::string keyName() {
    return boost::core::demangle(typeid(K).name());
}

}  // namespace tinydep::core
