#pragma once
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace arena {

// Shared cancellation flag for one process() call.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

// Runs one suspension point (a generation or tool call).
//
// Unbounded calls run inline; the token is checked before and after, and a
// result that arrives after cancel() is discarded. Bounded calls run on a
// detached worker while the caller polls for completion, the deadline and the
// token. An abandoned worker finishes on its own, side effects included, so fn
// must own everything it touches (shared_ptrs and copies, never references to
// caller state).
template <typename Fn>
auto run_with_deadline(Fn fn, std::chrono::milliseconds timeout,
                       const CancelTokenPtr& token, const std::string& what)
    -> decltype(fn())
{
    using Result = decltype(fn());

    if (token && token->cancelled()) throw CancelledError(what + " cancelled");
    if (timeout.count() <= 0) {
        auto result = fn();
        if (token && token->cancelled()) throw CancelledError(what + " cancelled");
        return result;
    }

    std::packaged_task<Result()> task(std::move(fn));
    auto fut = task.get_future();
    std::thread(std::move(task)).detach();

    const auto slice = std::chrono::milliseconds(10);
    const auto start = std::chrono::steady_clock::now();
    while (fut.wait_for(slice) != std::future_status::ready) {
        if (token && token->cancelled()) {
            throw CancelledError(what + " cancelled");
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() - start >= timeout) {
            throw TimeoutError(what + " timed out after " +
                               std::to_string(timeout.count()) + " ms");
        }
    }
    return fut.get();
}

} // namespace arena
