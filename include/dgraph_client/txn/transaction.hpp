#pragma once

#include <dgraph_client/core/result.hpp>
#include <dgraph_client/transport/messages.hpp>
#include <dgraph_client/txn/cancel_token.hpp>
#include <dgraph_client/txn/protocol.hpp>

#include <nlohmann/json.hpp>

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dgraph_client {

class Client;

struct TxnOptions {
    bool read_only = false;
    bool best_effort = false;  // only valid with read_only
};

/// Rejects best_effort without read_only.
[[nodiscard]] Result<void, Error> ValidateTxnOptions(const TxnOptions& options);

// ---------------------------------------------------------------------------
// TxnCore: the transaction state machine shared by Transaction and
// SharedTransaction. Not synchronized; callers provide exclusion.
//
// States: Active -> Committed | Discarded. Once finished, DoRequest and
// Commit fail and Discard is a no-op.
// ---------------------------------------------------------------------------
class TxnCore {
public:
    TxnCore(Client& client, TxnOptions options);

    [[nodiscard]] Result<Response, Error> DoRequest(Request request,
                                                    const CancelToken* cancel);
    [[nodiscard]] Result<void, Error> Commit(const CancelToken* cancel);
    [[nodiscard]] Result<void, Error> Discard(const CancelToken* cancel);

    /// Cleanup discard used on error paths and by destructors. Runs under the
    /// owner's exclusion; failures are logged and dropped.
    void DiscardLocked();

    [[nodiscard]] const TxnContext& Context() const noexcept { return ctx_; }
    [[nodiscard]] bool IsFinished() const noexcept { return finished_; }
    [[nodiscard]] bool IsMutated() const noexcept { return mutated_; }
    [[nodiscard]] bool IsReadOnly() const noexcept { return options_.read_only; }
    [[nodiscard]] bool IsBestEffort() const noexcept { return options_.best_effort; }

private:
    Client* client_;
    TxnOptions options_;
    TxnContext ctx_;
    bool finished_ = false;
    bool mutated_ = false;
};

// ---------------------------------------------------------------------------
// Transaction: blocking handle. Not thread-safe; use one per thread.
//
// Move-only RAII guard: the destructor discards unless the transaction is
// already committed or discarded. The Client must outlive it.
//
// A moved-from Transaction is finished: its operations fail with a
// Transaction error and its accessors report an empty context.
// ---------------------------------------------------------------------------
class Transaction {
public:
    [[nodiscard]] static Result<Transaction, Error> Create(Client& client,
                                                           TxnOptions options);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;

    [[nodiscard]] Result<Response, Error> Query(
        const std::string& query, const Variables& vars = {},
        ResponseFormat format = ResponseFormat::Json);

    [[nodiscard]] Result<Response, Error> QueryWithVars(
        const std::string& query, const nlohmann::json& vars,
        ResponseFormat format = ResponseFormat::Json);

    [[nodiscard]] Result<Response, Error> Mutate(const Mutation& mutation);
    [[nodiscard]] Result<Response, Error> Mutate(const MutationInput& input);

    /// Query plus mutations in one round trip.
    [[nodiscard]] Result<Response, Error> Upsert(
        const std::string& query, std::vector<Mutation> mutations,
        bool commit_now = false, const Variables& vars = {});

    [[nodiscard]] Result<Response, Error> DoRequest(Request request);

    [[nodiscard]] Result<void, Error> Commit();
    [[nodiscard]] Result<void, Error> Discard();

    [[nodiscard]] const TxnContext& Context() const noexcept;
    [[nodiscard]] bool IsFinished() const noexcept { return !core_ || core_->IsFinished(); }
    [[nodiscard]] bool IsMutated() const noexcept { return core_ && core_->IsMutated(); }
    [[nodiscard]] bool IsReadOnly() const noexcept { return core_ && core_->IsReadOnly(); }
    [[nodiscard]] bool IsBestEffort() const noexcept { return core_ && core_->IsBestEffort(); }

private:
    Transaction(Client& client, TxnOptions options);

    std::unique_ptr<TxnCore> core_;
};

// ---------------------------------------------------------------------------
// SharedTransaction: the same state machine behind a non-reentrant mutex,
// for use from several threads or through the *Async methods.
//
// Every public operation takes the lock for its whole duration. Cleanup on
// a failed request runs inside DoRequest with the lock already held, so it
// goes through TxnCore directly and never through the public Discard.
//
// Operations accept a CancelToken, checked before dispatch, after taking
// the lock and after the transport returns. A response that arrived is
// always merged into the context first, so the transaction stays in step
// with the server. A cancelled operation returns ErrorCategory::Cancelled
// and leaves cleanup to the destructor.
// ---------------------------------------------------------------------------
class SharedTransaction : public std::enable_shared_from_this<SharedTransaction> {
public:
    [[nodiscard]] static Result<std::shared_ptr<SharedTransaction>, Error> Create(
        Client& client, TxnOptions options);

    ~SharedTransaction();

    SharedTransaction(const SharedTransaction&) = delete;
    SharedTransaction& operator=(const SharedTransaction&) = delete;

    [[nodiscard]] Result<Response, Error> Query(
        const std::string& query, const Variables& vars = {},
        ResponseFormat format = ResponseFormat::Json,
        const CancelToken& cancel = CancelToken());

    [[nodiscard]] Result<Response, Error> QueryWithVars(
        const std::string& query, const nlohmann::json& vars,
        ResponseFormat format = ResponseFormat::Json,
        const CancelToken& cancel = CancelToken());

    [[nodiscard]] Result<Response, Error> Mutate(
        const Mutation& mutation, const CancelToken& cancel = CancelToken());
    [[nodiscard]] Result<Response, Error> Mutate(
        const MutationInput& input, const CancelToken& cancel = CancelToken());

    [[nodiscard]] Result<Response, Error> Upsert(
        const std::string& query, std::vector<Mutation> mutations,
        bool commit_now = false, const Variables& vars = {},
        const CancelToken& cancel = CancelToken());

    [[nodiscard]] Result<Response, Error> DoRequest(
        Request request, const CancelToken& cancel = CancelToken());

    [[nodiscard]] Result<void, Error> Commit(const CancelToken& cancel = CancelToken());
    [[nodiscard]] Result<void, Error> Discard(const CancelToken& cancel = CancelToken());

    // -- Async: run on a separate thread, keeping this object alive -----------

    [[nodiscard]] std::future<Result<Response, Error>> QueryAsync(
        std::string query, Variables vars = {},
        ResponseFormat format = ResponseFormat::Json,
        CancelToken cancel = CancelToken());

    [[nodiscard]] std::future<Result<Response, Error>> MutateAsync(
        Mutation mutation, CancelToken cancel = CancelToken());

    [[nodiscard]] std::future<Result<void, Error>> CommitAsync(
        CancelToken cancel = CancelToken());

    [[nodiscard]] std::future<Result<void, Error>> DiscardAsync(
        CancelToken cancel = CancelToken());

    // -- Snapshots (taken under the lock) ------------------------------------

    [[nodiscard]] TxnContext Context() const;
    [[nodiscard]] bool IsFinished() const;
    [[nodiscard]] bool IsMutated() const;
    [[nodiscard]] bool IsReadOnly() const;
    [[nodiscard]] bool IsBestEffort() const;

private:
    SharedTransaction(Client& client, TxnOptions options);

    mutable std::mutex mutex_;
    TxnCore core_;
};

} // namespace dgraph_client
