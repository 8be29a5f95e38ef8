#include <dgraph_client/txn/transaction.hpp>

#include <dgraph_client/client/client.hpp>
#include <dgraph_client/core/log.hpp>

#include <algorithm>

namespace dgraph_client {

namespace {

bool IsCancelled(const CancelToken* cancel) {
    return cancel != nullptr && cancel->IsCancelled();
}

Result<Response, Error> ErrResponse(Error error) {
    return Result<Response, Error>::Err(std::move(error));
}

Request BuildMutationRequest(const Mutation& mutation) {
    RequestInput input;
    input.mutations.push_back(mutation);
    return CreateRequest(input, TxnContext{});
}

Request BuildUpsertRequest(const std::string& query,
                           std::vector<Mutation> mutations,
                           bool commit_now, const Variables& vars) {
    RequestInput input;
    input.query = query;
    input.vars = vars;
    input.mutations = std::move(mutations);
    input.commit_now = commit_now;
    return CreateRequest(input, TxnContext{});
}

Error MovedFromError(const std::string& operation) {
    return Error::Transaction(operation, "Transaction has been moved from");
}

Request BuildQueryRequest(const std::string& query, const Variables& vars,
                          ResponseFormat format) {
    RequestInput input;
    input.query = query;
    input.vars = vars;
    input.resp_format = format;
    return CreateRequest(input, TxnContext{});
}

} // anonymous namespace

Result<void, Error> ValidateTxnOptions(const TxnOptions& options) {
    if (options.best_effort && !options.read_only) {
        return Result<void, Error>::Err(Error::Transaction(
            "NewTxn",
            "Best effort transactions are only compatible with read-only transactions"));
    }
    return Result<void, Error>::Ok();
}

// ===========================================================================
// TxnCore
// ===========================================================================
TxnCore::TxnCore(Client& client, TxnOptions options)
    : client_(&client), options_(options) {}

Result<Response, Error> TxnCore::DoRequest(Request request, const CancelToken* cancel) {
    if (finished_) {
        return ErrResponse(Error::Transaction("DoRequest", kFinishedMessage));
    }
    bool has_mutations = !request.mutations.empty();
    if (has_mutations) {
        if (options_.read_only) {
            return ErrResponse(Error::Transaction(
                "DoRequest", "Readonly transaction cannot run mutations"));
        }
        for (const auto& mu : request.mutations) {
            if (!mu.HasJson() && !mu.HasNquads()) {
                return ErrResponse(Error::Transaction(
                    "DoRequest", "Mutation carries no set or delete payload"));
            }
        }
    }
    if (IsCancelled(cancel)) {
        return ErrResponse(Error::Cancelled("DoRequest"));
    }
    if (has_mutations) {
        mutated_ = true;
    }

    request.commit_now = request.commit_now ||
        std::any_of(request.mutations.begin(), request.mutations.end(),
                    [](const Mutation& mu) { return mu.commit_now; });
    request.start_ts = ctx_.start_ts;
    request.hash = ctx_.hash;
    request.read_only = options_.read_only;
    request.best_effort = options_.best_effort;

    auto result = client_->CallWithSessionRefresh<Response>(
        [&request](IDgraphStub& stub, const CallOptions& call) {
            return stub.Query(request, call);
        });

    if (result.IsErr()) {
        auto err = std::move(result).Error();
        if (err.category == ErrorCategory::Cancelled) {
            return ErrResponse(std::move(err));
        }
        if (IsCancelled(cancel)) {
            return ErrResponse(Error::Cancelled("DoRequest"));
        }
        LogDebug("txn", "Request failed, discarding transaction: " + err.ToString());
        DiscardLocked();
        if (err.category == ErrorCategory::Aborted) {
            err.message = kAbortedMessage;
        }
        return ErrResponse(std::move(err));
    }

    auto response = std::move(result).Value();
    if (request.commit_now) {
        finished_ = true;
    }
    // The server has applied the request; keep the context in step with it
    // even if the caller has since cancelled.
    auto merged = MergeContext(ctx_, response.txn);
    if (merged.IsErr()) {
        return ErrResponse(std::move(merged).Error());
    }
    if (IsCancelled(cancel)) {
        return ErrResponse(Error::Cancelled("DoRequest"));
    }
    return Result<Response, Error>::Ok(std::move(response));
}

Result<void, Error> TxnCore::Commit(const CancelToken* cancel) {
    if (options_.read_only) {
        return Result<void, Error>::Err(Error::Transaction(
            "Commit", "Readonly transaction cannot run mutations or be committed"));
    }
    if (finished_) {
        return Result<void, Error>::Err(Error::Transaction("Commit", kFinishedMessage));
    }
    if (IsCancelled(cancel)) {
        return Result<void, Error>::Err(Error::Cancelled("Commit"));
    }

    finished_ = true;
    if (!mutated_) {
        return Result<void, Error>::Ok();
    }

    auto result = client_->CallWithSessionRefresh<TxnContext>(
        [this](IDgraphStub& stub, const CallOptions& call) {
            return stub.CommitOrAbort(ctx_, call);
        });
    if (result.IsErr()) {
        auto err = std::move(result).Error();
        if (err.category == ErrorCategory::Aborted) {
            err.message = kAbortedMessage;
        }
        return Result<void, Error>::Err(std::move(err));
    }
    if (result.Value().aborted) {
        return Result<void, Error>::Err(Error::Aborted("Commit"));
    }
    ctx_.commit_ts = result.Value().commit_ts;
    LogDebug("txn", "Committed start_ts=" + std::to_string(ctx_.start_ts) +
                        " commit_ts=" + std::to_string(ctx_.commit_ts));
    return Result<void, Error>::Ok();
}

Result<void, Error> TxnCore::Discard(const CancelToken* cancel) {
    if (finished_) {
        return Result<void, Error>::Ok();
    }
    if (IsCancelled(cancel)) {
        return Result<void, Error>::Err(Error::Cancelled("Discard"));
    }

    finished_ = true;
    if (!mutated_) {
        return Result<void, Error>::Ok();
    }

    ctx_.aborted = true;
    auto result = client_->CallWithSessionRefresh<TxnContext>(
        [this](IDgraphStub& stub, const CallOptions& call) {
            return stub.CommitOrAbort(ctx_, call);
        });
    if (result.IsErr()) {
        return Result<void, Error>::Err(std::move(result).Error());
    }
    return Result<void, Error>::Ok();
}

void TxnCore::DiscardLocked() {
    auto result = Discard(nullptr);
    if (result.IsErr()) {
        LogDebug("txn", "Discard failed: " + result.Error().ToString());
    }
}

// ===========================================================================
// Transaction
// ===========================================================================
Result<Transaction, Error> Transaction::Create(Client& client, TxnOptions options) {
    auto valid = ValidateTxnOptions(options);
    if (valid.IsErr()) {
        return Result<Transaction, Error>::Err(std::move(valid).Error());
    }
    return Result<Transaction, Error>::Ok(Transaction(client, options));
}

Transaction::Transaction(Client& client, TxnOptions options)
    : core_(std::make_unique<TxnCore>(client, options)) {}

Transaction::~Transaction() {
    if (core_) {
        core_->DiscardLocked();
    }
}

Transaction::Transaction(Transaction&& other) noexcept
    : core_(std::move(other.core_)) {}

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (core_) {
            core_->DiscardLocked();
        }
        core_ = std::move(other.core_);
    }
    return *this;
}

const TxnContext& Transaction::Context() const noexcept {
    static const TxnContext kEmpty;
    return core_ ? core_->Context() : kEmpty;
}

Result<Response, Error> Transaction::Query(const std::string& query,
                                           const Variables& vars,
                                           ResponseFormat format) {
    return DoRequest(BuildQueryRequest(query, vars, format));
}

Result<Response, Error> Transaction::QueryWithVars(const std::string& query,
                                                   const nlohmann::json& vars,
                                                   ResponseFormat format) {
    auto converted = VariablesFromJson(vars);
    if (converted.IsErr()) {
        return ErrResponse(std::move(converted).Error());
    }
    return Query(query, converted.Value(), format);
}

Result<Response, Error> Transaction::Mutate(const Mutation& mutation) {
    return DoRequest(BuildMutationRequest(mutation));
}

Result<Response, Error> Transaction::Mutate(const MutationInput& input) {
    auto mutation = CreateMutation(input);
    if (mutation.IsErr()) {
        return ErrResponse(std::move(mutation).Error());
    }
    return Mutate(mutation.Value());
}

Result<Response, Error> Transaction::Upsert(const std::string& query,
                                            std::vector<Mutation> mutations,
                                            bool commit_now,
                                            const Variables& vars) {
    return DoRequest(BuildUpsertRequest(query, std::move(mutations), commit_now, vars));
}

Result<Response, Error> Transaction::DoRequest(Request request) {
    if (!core_) {
        return ErrResponse(MovedFromError("DoRequest"));
    }
    return core_->DoRequest(std::move(request), nullptr);
}

Result<void, Error> Transaction::Commit() {
    if (!core_) {
        return Result<void, Error>::Err(MovedFromError("Commit"));
    }
    return core_->Commit(nullptr);
}

Result<void, Error> Transaction::Discard() {
    if (!core_) {
        return Result<void, Error>::Ok();
    }
    return core_->Discard(nullptr);
}

// ===========================================================================
// SharedTransaction
// ===========================================================================
Result<std::shared_ptr<SharedTransaction>, Error> SharedTransaction::Create(
    Client& client, TxnOptions options) {
    auto valid = ValidateTxnOptions(options);
    if (valid.IsErr()) {
        return Result<std::shared_ptr<SharedTransaction>, Error>::Err(
            std::move(valid).Error());
    }
    return Result<std::shared_ptr<SharedTransaction>, Error>::Ok(
        std::shared_ptr<SharedTransaction>(new SharedTransaction(client, options)));
}

SharedTransaction::SharedTransaction(Client& client, TxnOptions options)
    : core_(client, options) {}

SharedTransaction::~SharedTransaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    core_.DiscardLocked();
}

Result<Response, Error> SharedTransaction::Query(const std::string& query,
                                                 const Variables& vars,
                                                 ResponseFormat format,
                                                 const CancelToken& cancel) {
    return DoRequest(BuildQueryRequest(query, vars, format), cancel);
}

Result<Response, Error> SharedTransaction::QueryWithVars(const std::string& query,
                                                         const nlohmann::json& vars,
                                                         ResponseFormat format,
                                                         const CancelToken& cancel) {
    auto converted = VariablesFromJson(vars);
    if (converted.IsErr()) {
        return ErrResponse(std::move(converted).Error());
    }
    return Query(query, converted.Value(), format, cancel);
}

Result<Response, Error> SharedTransaction::Mutate(const Mutation& mutation,
                                                  const CancelToken& cancel) {
    return DoRequest(BuildMutationRequest(mutation), cancel);
}

Result<Response, Error> SharedTransaction::Mutate(const MutationInput& input,
                                                  const CancelToken& cancel) {
    auto mutation = CreateMutation(input);
    if (mutation.IsErr()) {
        return ErrResponse(std::move(mutation).Error());
    }
    return Mutate(mutation.Value(), cancel);
}

Result<Response, Error> SharedTransaction::Upsert(const std::string& query,
                                                  std::vector<Mutation> mutations,
                                                  bool commit_now,
                                                  const Variables& vars,
                                                  const CancelToken& cancel) {
    return DoRequest(BuildUpsertRequest(query, std::move(mutations), commit_now, vars),
                     cancel);
}

Result<Response, Error> SharedTransaction::DoRequest(Request request,
                                                     const CancelToken& cancel) {
    if (cancel.IsCancelled()) {
        return ErrResponse(Error::Cancelled("DoRequest"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return core_.DoRequest(std::move(request), &cancel);
}

Result<void, Error> SharedTransaction::Commit(const CancelToken& cancel) {
    if (cancel.IsCancelled()) {
        return Result<void, Error>::Err(Error::Cancelled("Commit"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return core_.Commit(&cancel);
}

Result<void, Error> SharedTransaction::Discard(const CancelToken& cancel) {
    if (cancel.IsCancelled()) {
        return Result<void, Error>::Err(Error::Cancelled("Discard"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return core_.Discard(&cancel);
}

std::future<Result<Response, Error>> SharedTransaction::QueryAsync(
    std::string query, Variables vars, ResponseFormat format, CancelToken cancel) {
    auto self = shared_from_this();
    return std::async(std::launch::async,
                      [self, query = std::move(query), vars = std::move(vars),
                       format, cancel]() {
                          return self->Query(query, vars, format, cancel);
                      });
}

std::future<Result<Response, Error>> SharedTransaction::MutateAsync(
    Mutation mutation, CancelToken cancel) {
    auto self = shared_from_this();
    return std::async(std::launch::async,
                      [self, mutation = std::move(mutation), cancel]() {
                          return self->Mutate(mutation, cancel);
                      });
}

std::future<Result<void, Error>> SharedTransaction::CommitAsync(CancelToken cancel) {
    auto self = shared_from_this();
    return std::async(std::launch::async,
                      [self, cancel]() { return self->Commit(cancel); });
}

std::future<Result<void, Error>> SharedTransaction::DiscardAsync(CancelToken cancel) {
    auto self = shared_from_this();
    return std::async(std::launch::async,
                      [self, cancel]() { return self->Discard(cancel); });
}

TxnContext SharedTransaction::Context() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return core_.Context();
}

bool SharedTransaction::IsFinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return core_.IsFinished();
}

bool SharedTransaction::IsMutated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return core_.IsMutated();
}

bool SharedTransaction::IsReadOnly() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return core_.IsReadOnly();
}

bool SharedTransaction::IsBestEffort() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return core_.IsBestEffort();
}

} // namespace dgraph_client
