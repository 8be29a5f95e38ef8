#pragma once

#include <dgraph_client/transport/i_dgraph_stub.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dgraph_client {
namespace testing {

// ---------------------------------------------------------------------------
// MockDgraphStub: hand-written mock for offline unit testing.
//
// Usage:
//   auto stub = std::make_unique<MockDgraphStub>();
//   auto* mock = stub.get();
//   mock->EnqueueQuery(Result<Response, Error>::Ok(MakeResponse(10)));
//   ... hand stub to Client::Create ...
//   CHECK(mock->QueryCallCount() == 1);
//   CHECK(mock->QueryCalls()[0].request.start_ts == 0);
//
// Responses are consumed FIFO. If the queue is empty when a method is called,
// the mock returns a descriptive error rather than crashing. All methods are
// safe to call from several threads.
// ---------------------------------------------------------------------------

// -- Call records -----------------------------------------------------------

struct QueryCall {
    Request request;
    CallOptions options;
};

struct CommitCall {
    TxnContext ctx;
    CallOptions options;
};

struct LoginCall {
    LoginRequest request;
    CallOptions options;
};

struct AlterCall {
    Operation operation;
    CallOptions options;
};

// -- Helpers ----------------------------------------------------------------

inline Response MakeResponse(uint64_t start_ts,
                             std::vector<std::string> keys = {},
                             std::string json = "{}") {
    Response response;
    response.json = std::move(json);
    response.txn.start_ts = start_ts;
    response.txn.keys = std::move(keys);
    return response;
}

inline Error MakeStubError(ErrorCategory category, const std::string& message) {
    return Error{"Mock", "mock:9080", std::nullopt, message, std::nullopt, category};
}

inline Error ExpiredTokenError() {
    return MakeStubError(ErrorCategory::SessionExpired, "Token is expired");
}

inline Error AbortedError() {
    return MakeStubError(ErrorCategory::Aborted, "Transaction has been aborted. Please retry");
}

/// Value of the first metadata entry named key, or "".
inline std::string MetadataValue(const CallOptions& options, const std::string& key) {
    for (const auto& [k, v] : options.metadata) {
        if (k == key) return v;
    }
    return "";
}

// -- Mock class -------------------------------------------------------------

class MockDgraphStub : public IDgraphStub {
public:
    explicit MockDgraphStub(std::string target = "mock:9080")
        : target_(std::move(target)) {}

    // -- Enqueue canned responses -------------------------------------------

    void EnqueueQuery(Result<Response, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        query_responses_.push_back(std::move(response));
    }

    void EnqueueCommit(Result<TxnContext, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        commit_responses_.push_back(std::move(response));
    }

    void EnqueueLogin(Result<Jwt, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        login_responses_.push_back(std::move(response));
    }

    void EnqueueAlter(Result<Payload, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        alter_responses_.push_back(std::move(response));
    }

    void EnqueueVersion(Result<std::string, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        version_responses_.push_back(std::move(response));
    }

    /// Delay applied inside Query, to hold a transaction lock in tests.
    void SetQueryDelay(std::chrono::milliseconds delay) { query_delay_ = delay; }

    /// Delay applied inside Login, to widen refresh races.
    void SetLoginDelay(std::chrono::milliseconds delay) { login_delay_ = delay; }

    // -- Inspect recorded calls ---------------------------------------------

    [[nodiscard]] std::vector<QueryCall> QueryCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return query_calls_;
    }
    [[nodiscard]] size_t QueryCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return query_calls_.size();
    }

    [[nodiscard]] std::vector<CommitCall> CommitCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commit_calls_;
    }
    [[nodiscard]] size_t CommitCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commit_calls_.size();
    }

    [[nodiscard]] std::vector<LoginCall> LoginCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return login_calls_;
    }
    [[nodiscard]] size_t LoginCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return login_calls_.size();
    }

    [[nodiscard]] std::vector<AlterCall> AlterCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return alter_calls_;
    }
    [[nodiscard]] size_t AlterCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return alter_calls_.size();
    }

    [[nodiscard]] size_t VersionCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return version_call_count_;
    }

    [[nodiscard]] bool IsClosed() const noexcept { return closed_.load(); }

    // -- IDgraphStub implementation ------------------------------------------

    Result<Response, Error> Query(const Request& request,
                                  const CallOptions& options) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            query_calls_.push_back({request, options});
        }
        if (query_delay_.count() > 0) {
            std::this_thread::sleep_for(query_delay_);
        }
        return Dequeue(query_responses_, "Query");
    }

    Result<TxnContext, Error> CommitOrAbort(const TxnContext& ctx,
                                            const CallOptions& options) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            commit_calls_.push_back({ctx, options});
        }
        return Dequeue(commit_responses_, "CommitOrAbort");
    }

    Result<Jwt, Error> Login(const LoginRequest& request,
                             const CallOptions& options) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            login_calls_.push_back({request, options});
        }
        if (login_delay_.count() > 0) {
            std::this_thread::sleep_for(login_delay_);
        }
        return Dequeue(login_responses_, "Login");
    }

    Result<Payload, Error> Alter(const Operation& operation,
                                 const CallOptions& options) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            alter_calls_.push_back({operation, options});
        }
        return Dequeue(alter_responses_, "Alter");
    }

    Result<std::string, Error> CheckVersion(const CallOptions& /*options*/) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++version_call_count_;
        }
        return Dequeue(version_responses_, "CheckVersion");
    }

    std::string Target() const override { return target_; }

    void Close() override { closed_.store(true); }

private:
    template <typename T>
    Result<T, Error> Dequeue(std::deque<Result<T, Error>>& queue,
                             const std::string& operation) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue.empty()) {
            return Result<T, Error>::Err(Error{
                operation, target_, std::nullopt,
                "MockDgraphStub: no response enqueued for " + operation,
                std::nullopt, ErrorCategory::Internal});
        }
        auto response = std::move(queue.front());
        queue.pop_front();
        return response;
    }

    std::string target_;
    mutable std::mutex mutex_;
    std::atomic<bool> closed_{false};
    std::chrono::milliseconds query_delay_{0};
    std::chrono::milliseconds login_delay_{0};

    std::deque<Result<Response, Error>> query_responses_;
    std::deque<Result<TxnContext, Error>> commit_responses_;
    std::deque<Result<Jwt, Error>> login_responses_;
    std::deque<Result<Payload, Error>> alter_responses_;
    std::deque<Result<std::string, Error>> version_responses_;

    std::vector<QueryCall> query_calls_;
    std::vector<CommitCall> commit_calls_;
    std::vector<LoginCall> login_calls_;
    std::vector<AlterCall> alter_calls_;
    size_t version_call_count_ = 0;
};

} // namespace testing
} // namespace dgraph_client
