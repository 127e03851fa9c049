#pragma once

#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>

#include "core/DependencyValues.hpp"
#include "core/ScopeStack.hpp"

namespace tinydep::core {

// Completion signature of withDependenciesAsync<R>.
template <typename R>
struct ResumeSignature {
    using type = void(std::exception_ptr, R);
};

template <>
struct ResumeSignature<void> {
    using type = void(std::exception_ptr);
};

namespace detail {

void logDuplicateResume(const char* what);

template <typename R>
struct Outcome {
    std::exception_ptr error;
    std::optional<R> value;
};

template <>
struct Outcome<void> {
    std::exception_ptr error;
};

template <typename R>
class ResumeState {
public:
    virtual ~ResumeState() = default;

    bool claim() noexcept { return !completed_.exchange(true, std::memory_order_acq_rel); }

    virtual void complete(Outcome<R> outcome) = 0;

private:
    std::atomic<bool> completed_{false};
};

// Owns the caller's handler and delivers the outcome under the caller's scope.
template <typename R, typename Handler, typename Executor>
class HandlerState final : public ResumeState<R> {
public:
    HandlerState(Handler handler, ScopeStack::Snapshot callerScope, Executor fallback)
        : handler_(std::move(handler)), callerScope_(std::move(callerScope)), fallback_(std::move(fallback)) {}

    void complete(Outcome<R> outcome) override {
        auto executor = boost::asio::get_associated_executor(handler_, fallback_);
        // Posted, never dispatched: the operation's slice has unwound before the caller resumes.
        boost::asio::post(executor,
                          bindScope(callerScope_,
                                    [handler = std::move(handler_), outcome = std::move(outcome)]() mutable {
                                        if constexpr (std::is_void<R>::value) {
                                            handler(outcome.error);
                                        } else if (outcome.error) {
                                            handler(outcome.error, R{});
                                        } else {
                                            handler(outcome.error, std::move(*outcome.value));
                                        }
                                    }));
    }

private:
    Handler handler_;
    ScopeStack::Snapshot callerScope_;
    Executor fallback_;
};

template <typename R, typename F>
class FailOnThrow;

template <typename R>
class ResumeBase {
public:
    explicit ResumeBase(std::shared_ptr<ResumeState<R>> state) : state_(std::move(state)) {}

    // Wraps a continuation of the operation. It runs under the scope active where bind() is
    // called, and an exception it throws completes the operation through fail() instead of
    // escaping into the executor.
    template <typename F>
    ScopeBound<FailOnThrow<R, std::decay_t<F>>> bind(F&& fn) const {
        return bindScope(ScopeStack::capture(), FailOnThrow<R, std::decay_t<F>>(*this, std::forward<F>(fn)));
    }

    // Completes the operation with an error. Ignored once the operation has completed.
    void fail(std::exception_ptr error) const {
        if (!state_->claim()) {
            logDuplicateResume("fail");
            return;
        }
        Outcome<R> outcome{};
        outcome.error = std::move(error);
        state_->complete(std::move(outcome));
    }

protected:
    std::shared_ptr<ResumeState<R>> state_;
};

template <typename R, typename F>
class FailOnThrow {
public:
    FailOnThrow(ResumeBase<R> resume, F fn) : resume_(std::move(resume)), fn_(std::move(fn)) {}

    template <typename... Args>
    void operator()(Args&&... args) {
        try {
            fn_(std::forward<Args>(args)...);
        } catch (...) {
            resume_.fail(std::current_exception());
        }
    }

private:
    ResumeBase<R> resume_;
    F fn_;
};

}  // namespace detail

// Completion side of an asynchronous unit of work. Copyable; the first completion wins.
template <typename R>
class Resume : public detail::ResumeBase<R> {
public:
    using detail::ResumeBase<R>::ResumeBase;

    void operator()(R value) const {
        if (!this->state_->claim()) {
            detail::logDuplicateResume("value");
            return;
        }
        detail::Outcome<R> outcome{};
        outcome.value.emplace(std::move(value));
        this->state_->complete(std::move(outcome));
    }
};

template <>
class Resume<void> : public detail::ResumeBase<void> {
public:
    using detail::ResumeBase<void>::ResumeBase;

    void operator()() const {
        if (!state_->claim()) {
            detail::logDuplicateResume("value");
            return;
        }
        state_->complete(detail::Outcome<void>{});
    }
};

namespace detail {

template <typename R, typename Executor>
class InitiateWithDependencies {
public:
    using executor_type = Executor;

    explicit InitiateWithDependencies(Executor executor) : executor_(std::move(executor)) {}

    executor_type get_executor() const noexcept { return executor_; }

    template <typename Handler, typename Mutator, typename Operation>
    void operator()(Handler&& handler, Mutator&& mutate, Operation&& operation) const {
        using State = HandlerState<R, std::decay_t<Handler>, Executor>;

        // Copy and edit in the caller's context, as the synchronous entry does.
        ScopeStack::Snapshot callerScope = ScopeStack::capture();
        DependencyValues values = DependencyValues::current().copy();
        mutate(values);

        Resume<R> resume(std::make_shared<State>(std::forward<Handler>(handler), std::move(callerScope), executor_));

        boost::asio::post(executor_,
                          bindScope(ScopeStack::Snapshot{values.storage()},
                                    [resume, op = std::forward<Operation>(operation)]() mutable {
                                        try {
                                            op(resume);
                                        } catch (...) {
                                            resume.fail(std::current_exception());
                                        }
                                    }));
    }

private:
    Executor executor_;
};

}  // namespace detail

// Asynchronous override scope. operation(Resume<R>) runs on executor under a copy of the
// caller's values edited by mutate; continuations it schedules through resume.bind() keep
// that scope across every suspension, and no other handler on the same worker sees it.
// The token receives (exception_ptr, R) under the caller's own scope. Failures thrown by
// operation or by a resume.bind() continuation arrive as the exception_ptr; with use_future
// they rethrow from get().
// For R other than void, R must be default-constructible (it fills the value slot on failure).
template <typename R, typename Executor, typename Mutator, typename Operation, typename CompletionToken>
auto withDependenciesAsync(const Executor& executor, Mutator&& mutate, Operation&& operation, CompletionToken&& token) {
    static_assert(std::is_void<R>::value || std::is_default_constructible<R>::value,
                  "withDependenciesAsync result type must be default-constructible");
    return boost::asio::async_initiate<CompletionToken, typename ResumeSignature<R>::type>(
        detail::InitiateWithDependencies<R, Executor>(executor),
        token,
        std::forward<Mutator>(mutate),
        std::forward<Operation>(operation));
}

// Forks fn onto executor with the caller's active scope.
template <typename Executor, typename F>
void postInScope(const Executor& executor, F&& fn) {
    boost::asio::post(executor, bindScope(std::forward<F>(fn)));
}

}  // namespace tinydep::core
