#pragma once

#include <dgraph_client/client/client.hpp>
#include <dgraph_client/core/log.hpp>
#include <dgraph_client/core/result.hpp>
#include <dgraph_client/txn/transaction.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace dgraph_client {

// ---------------------------------------------------------------------------
// RetryPolicy: exponential backoff with jitter for conflicting transactions.
// ---------------------------------------------------------------------------
struct RetryPolicy {
    int max_retries = 5;
    std::chrono::milliseconds base_delay{100};
    std::chrono::milliseconds max_delay{5000};
    double jitter = 0.1;  // fraction of the delay added at random, 0..1
};

[[nodiscard]] Result<void, Error> ValidateRetryPolicy(const RetryPolicy& policy);

/// Delay before the retry that follows failed attempt `attempt` (0-based):
/// min(base * 2^attempt, max) * (1 + jitter * random_draw), random_draw in [0,1).
[[nodiscard]] std::chrono::milliseconds ComputeBackoff(const RetryPolicy& policy,
                                                       int attempt,
                                                       double random_draw);

using Sleeper = std::function<void(std::chrono::milliseconds)>;
using RandomSource = std::function<double()>;

// ---------------------------------------------------------------------------
// Retrier: re-runs a whole block while it fails with Aborted or Retriable.
// Any other error, and success, returns at once.
// ---------------------------------------------------------------------------
class Retrier {
public:
    explicit Retrier(RetryPolicy policy = {},
                     Sleeper sleeper = DefaultSleeper(),
                     RandomSource random = DefaultRandom());

    [[nodiscard]] const RetryPolicy& Policy() const noexcept { return policy_; }

    /// fn: () -> Result<T, Error>
    template <typename Fn>
    auto Run(Fn&& fn) const -> std::invoke_result_t<Fn&> {
        using R = std::invoke_result_t<Fn&>;
        auto valid = ValidateRetryPolicy(policy_);
        if (valid.IsErr()) {
            return R::Err(std::move(valid).Error());
        }
        const int total = policy_.max_retries + 1;
        for (int attempt = 0;; ++attempt) {
            R result = fn();
            if (result.IsOk() || !result.Error().IsConflict()) {
                return result;
            }
            if (attempt >= policy_.max_retries) {
                LogWarn("retry", "Transaction failed after " +
                                     std::to_string(attempt + 1) + " attempts");
                return result;
            }
            auto delay = ComputeBackoff(policy_, attempt, random_());
            LogDebug("retry", "Transaction aborted (attempt " +
                                  std::to_string(attempt + 1) + "/" +
                                  std::to_string(total) + "), retrying in " +
                                  std::to_string(delay.count()) + "ms");
            sleeper_(delay);
        }
    }

    static Sleeper DefaultSleeper();
    static RandomSource DefaultRandom();

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
    RandomSource random_;
};

template <typename Fn>
auto WithRetry(const RetryPolicy& policy, Fn&& fn) {
    return Retrier(policy).Run(std::forward<Fn>(fn));
}

// ---------------------------------------------------------------------------
// RunTransaction: each attempt opens a fresh transaction, hands it to
// fn(Transaction&) and discards it afterwards. fn is expected to commit.
// Discard failures after an attempt are logged and dropped.
// ---------------------------------------------------------------------------
template <typename Fn>
auto RunTransaction(Client& client, Fn&& fn, const Retrier& retrier,
                    TxnOptions options = {})
    -> std::invoke_result_t<Fn&, Transaction&> {
    using R = std::invoke_result_t<Fn&, Transaction&>;
    return retrier.Run([&]() -> R {
        auto txn = client.NewTxn(options);
        if (txn.IsErr()) {
            return R::Err(std::move(txn).Error());
        }
        auto& handle = txn.Value();
        R result = fn(handle);
        auto discarded = handle.Discard();
        if (discarded.IsErr()) {
            LogDebug("retry", "Discard after attempt failed: " +
                                  discarded.Error().ToString());
        }
        return result;
    });
}

template <typename Fn>
auto RunTransaction(Client& client, Fn&& fn, const RetryPolicy& policy = {},
                    TxnOptions options = {})
    -> std::invoke_result_t<Fn&, Transaction&> {
    return RunTransaction(client, std::forward<Fn>(fn), Retrier(policy), options);
}

/// Same as RunTransaction, over a SharedTransaction.
template <typename Fn>
auto RunSharedTransaction(Client& client, Fn&& fn, const Retrier& retrier,
                          TxnOptions options = {})
    -> std::invoke_result_t<Fn&, SharedTransaction&> {
    using R = std::invoke_result_t<Fn&, SharedTransaction&>;
    return retrier.Run([&]() -> R {
        auto txn = client.NewSharedTxn(options);
        if (txn.IsErr()) {
            return R::Err(std::move(txn).Error());
        }
        auto handle = txn.Value();
        R result = fn(*handle);
        auto discarded = handle->Discard();
        if (discarded.IsErr()) {
            LogDebug("retry", "Discard after attempt failed: " +
                                  discarded.Error().ToString());
        }
        return result;
    });
}

template <typename Fn>
auto RunSharedTransaction(Client& client, Fn&& fn, const RetryPolicy& policy = {},
                          TxnOptions options = {})
    -> std::invoke_result_t<Fn&, SharedTransaction&> {
    return RunSharedTransaction(client, std::forward<Fn>(fn), Retrier(policy), options);
}

} // namespace dgraph_client
