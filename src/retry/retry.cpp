#include <dgraph_client/retry/retry.hpp>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>

namespace dgraph_client {

namespace {

Error MakePolicyError(const std::string& message) {
    return Error{"ValidateRetryPolicy", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

} // anonymous namespace

Result<void, Error> ValidateRetryPolicy(const RetryPolicy& policy) {
    if (policy.max_retries < 0) {
        return Result<void, Error>::Err(MakePolicyError(
            "max_retries must be >= 0, got " + std::to_string(policy.max_retries)));
    }
    if (policy.base_delay.count() < 0) {
        return Result<void, Error>::Err(MakePolicyError(
            "base_delay must be >= 0, got " +
            std::to_string(policy.base_delay.count()) + "ms"));
    }
    if (policy.max_delay.count() < 0) {
        return Result<void, Error>::Err(MakePolicyError(
            "max_delay must be >= 0, got " +
            std::to_string(policy.max_delay.count()) + "ms"));
    }
    if (!(policy.jitter >= 0.0 && policy.jitter <= 1.0)) {
        std::ostringstream oss;
        oss << "jitter must be between 0 and 1, got " << policy.jitter;
        return Result<void, Error>::Err(MakePolicyError(oss.str()));
    }
    return Result<void, Error>::Ok();
}

std::chrono::milliseconds ComputeBackoff(const RetryPolicy& policy, int attempt,
                                         double random_draw) {
    const double base = static_cast<double>(policy.base_delay.count());
    const double cap = static_cast<double>(policy.max_delay.count());
    const double exponential = base * std::pow(2.0, std::max(attempt, 0));
    const double delay = std::min(exponential, cap);
    const double jittered = delay * (1.0 + policy.jitter * random_draw);
    return std::chrono::milliseconds(static_cast<long long>(jittered));
}

// ---------------------------------------------------------------------------
// Retrier
// ---------------------------------------------------------------------------
Retrier::Retrier(RetryPolicy policy, Sleeper sleeper, RandomSource random)
    : policy_(policy), sleeper_(std::move(sleeper)), random_(std::move(random)) {}

Sleeper Retrier::DefaultSleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

RandomSource Retrier::DefaultRandom() {
    return []() {
        static std::mutex mutex;
        static std::mt19937 engine{std::random_device{}()};
        std::lock_guard<std::mutex> lock(mutex);
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(engine);
    };
}

} // namespace dgraph_client
