#pragma once

#include "types.hpp"

#include <future>
#include <optional>
#include <string>

namespace px::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Names the task in pool diagnostics.
    [[nodiscard]] virtual std::string describe() const { return "task"; }

    // Futures are handed out once, before the task is submitted.
    virtual std::optional<std::future<ExpectedFuture>> getFuture() { return std::nullopt; }
};

// A task whose caller waits on its outcome. Subclasses settle the promise
// exactly once, with a value or with the exception they hit.
struct PromisedTask : Task {
    std::promise<ExpectedFuture> promise;

    std::optional<std::future<ExpectedFuture>> getFuture() override { return promise.get_future(); }
};

}
