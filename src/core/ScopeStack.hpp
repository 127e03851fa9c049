#pragma once

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace tinydep::core {

class DependencyStorage;

using StoragePtr = std::shared_ptr<DependencyStorage>;

// Per-thread stack of active stores. An empty stack means the process root store.
//
// A thread that runs work on behalf of another logical context (a forked thread, an
// Asio handler) adopts that context's snapshot for the duration of the slice and gets
// its own stack back afterwards, so nothing pushed in one context is visible in another.
class ScopeStack {
public:
    class Snapshot {
    public:
        Snapshot() = default;
        explicit Snapshot(StoragePtr store) : store_(std::move(store)) {}

        const StoragePtr& store() const { return store_; }
        bool isRoot() const { return !store_; }

    private:
        StoragePtr store_;
    };

    // Pushes a store on construction and pops it on destruction, also during unwinding.
    class Frame {
    public:
        explicit Frame(StoragePtr store);
        ~Frame();

        Frame(const Frame&) = delete;
        Frame& operator=(const Frame&) = delete;

    private:
        StoragePtr store_;
    };

    // Swaps in a fresh stack seeded with the snapshot; restores the thread's stack on exit.
    class Adopt {
    public:
        explicit Adopt(const Snapshot& snapshot);
        ~Adopt();

        Adopt(const Adopt&) = delete;
        Adopt& operator=(const Adopt&) = delete;

    private:
        std::vector<StoragePtr> saved_;
    };

    static StoragePtr root();
    static StoragePtr active();
    static Snapshot capture();
    static std::size_t depth();
};

// Callable that runs the wrapped function under the snapshot it was created with.
template <typename F>
class ScopeBound {
public:
    ScopeBound(ScopeStack::Snapshot snapshot, F fn) : snapshot_(std::move(snapshot)), fn_(std::move(fn)) {}

    template <typename... Args>
    auto operator()(Args&&... args) -> decltype(std::declval<F&>()(std::forward<Args>(args)...)) {
        ScopeStack::Adopt adopt(snapshot_);
        return fn_(std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto operator()(Args&&... args) const -> decltype(std::declval<const F&>()(std::forward<Args>(args)...)) {
        ScopeStack::Adopt adopt(snapshot_);
        return fn_(std::forward<Args>(args)...);
    }

    const ScopeStack::Snapshot& snapshot() const { return snapshot_; }

private:
    ScopeStack::Snapshot snapshot_;
    F fn_;
};

template <typename F>
ScopeBound<std::decay_t<F>> bindScope(ScopeStack::Snapshot snapshot, F&& fn) {
    return ScopeBound<std::decay_t<F>>(std::move(snapshot), std::forward<F>(fn));
}

// Captures the caller's active scope. When the result is handed to Asio, apply
// bind_executor() on the outside so the handler keeps its associated executor.
template <typename F>
ScopeBound<std::decay_t<F>> bindScope(F&& fn) {
    return bindScope(ScopeStack::capture(), std::forward<F>(fn));
}

}  // namespace tinydep::core
