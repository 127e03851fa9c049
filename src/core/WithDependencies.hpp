#pragma once

#include <utility>

#include "core/DependencyValues.hpp"
#include "core/ScopeStack.hpp"

namespace tinydep::core {

// Runs operation with a copy of the current values edited by mutate, then restores the
// previous scope. Whatever operation returns or throws reaches the caller after the pop.
//
//   withDependencies(
//       [](DependencyValues& values) { values.set<ClockKey>(fixedClock); },
//       [] { return billing.closeMonth(); });
template <typename Mutator, typename Operation>
decltype(auto) withDependencies(Mutator&& mutate, Operation&& operation) {
    DependencyValues values = DependencyValues::current().copy();
    std::forward<Mutator>(mutate)(values);
    ScopeStack::Frame frame(values.storage());
    return std::forward<Operation>(operation)();
}

}  // namespace tinydep::core
