#pragma once

#include "core/DependencyValues.hpp"

namespace tinydep::core {

// Read-through field: every access resolves K in the caller's current scope.
//
//   class Billing {
//       Dependency<ClockKey> clock_;
//   public:
//       void closeMonth() { auto now = clock_->now(); }
//   };
template <typename K>
class Dependency {
public:
    using Value = typename KeyTraits<K>::Value;

    Value get() const { return current<K>(); }

    Value operator*() const { return get(); }

    // For pointer-like values (shared_ptr, raw pointers).
    Value operator->() const { return get(); }
};

}  // namespace tinydep::core
