#pragma once

#include <future>
#include <thread>
#include <type_traits>
#include <utility>

#include "core/ScopeStack.hpp"

namespace tinydep::core {

// std::async that starts the child with the caller's active scope. Scopes the child
// enters stay in the child.
template <typename F>
auto asyncInScope(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
    return std::async(std::launch::async, bindScope(std::forward<F>(fn)));
}

template <typename F>
std::thread spawnInScope(F&& fn) {
    return std::thread(bindScope(std::forward<F>(fn)));
}

}  // namespace tinydep::core
