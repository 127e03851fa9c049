#include "core/ScopeStack.hpp"

#include "common/Log.hpp"
#include "core/DependencyStorage.hpp"

namespace tinydep::core {
namespace {

std::vector<StoragePtr>& frames() {
    thread_local std::vector<StoragePtr> stack;
    return stack;
}

}  // namespace

ScopeStack::Frame::Frame(StoragePtr store) : store_(std::move(store)) {
    auto& stack = frames();
    stack.push_back(store_);
    LOG_DEBUG("Scope push (profundidad=" << stack.size() << ", claves=" << store_->size() << ")");
}

ScopeStack::Frame::~Frame() {
    auto& stack = frames();
    if (stack.empty() || stack.back() != store_) {
        // Only reachable if frames outlive an Adopt they were created under.
        LOG_ERR("Scope pop fuera de orden (profundidad=" << stack.size() << ")");
        return;
    }
    stack.pop_back();
    LOG_DEBUG("Scope pop (profundidad=" << stack.size() << ")");
}

ScopeStack::Adopt::Adopt(const Snapshot& snapshot) : saved_(std::move(frames())) {
    auto& stack = frames();
    stack.clear();
    if (!snapshot.isRoot()) {
        stack.push_back(snapshot.store());
    }
}

ScopeStack::Adopt::~Adopt() { frames() = std::move(saved_); }

StoragePtr ScopeStack::root() {
    static const StoragePtr rootStore = std::make_shared<DependencyStorage>();
    return rootStore;
}

StoragePtr ScopeStack::active() {
    const auto& stack = frames();
    if (stack.empty()) {
        return root();
    }
    return stack.back();
}

ScopeStack::Snapshot ScopeStack::capture() {
    const auto& stack = frames();
    if (stack.empty()) {
        return Snapshot{};
    }
    return Snapshot{stack.back()};
}

std::size_t ScopeStack::depth() { return frames().size(); }

}  // namespace tinydep::core
