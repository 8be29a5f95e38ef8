#pragma once

#include <dgraph_client/core/result.hpp>
#include <dgraph_client/transport/messages.hpp>

#include <string>

namespace dgraph_client {

// ---------------------------------------------------------------------------
// IDgraphStub: abstract request/response channel to one Dgraph alpha.
//
// Transactions and the client facade depend on this interface rather than a
// concrete HTTP client, so they can be tested offline with MockDgraphStub.
//
// Failures come back as Err with the category already classified (session
// expiry, conflict, retriable, connection...). Callers never inspect message
// text. Implementations must be safe to call from several threads at once.
// ---------------------------------------------------------------------------
class IDgraphStub {
public:
    virtual ~IDgraphStub() = default;

    IDgraphStub(const IDgraphStub&) = delete;
    IDgraphStub& operator=(const IDgraphStub&) = delete;
    IDgraphStub(IDgraphStub&&) = delete;
    IDgraphStub& operator=(IDgraphStub&&) = delete;

    /// Run a query, mutation or upsert.
    [[nodiscard]] virtual Result<Response, Error> Query(
        const Request& request, const CallOptions& options) = 0;

    /// Commit, or abort when ctx.aborted is set.
    [[nodiscard]] virtual Result<TxnContext, Error> CommitOrAbort(
        const TxnContext& ctx, const CallOptions& options) = 0;

    [[nodiscard]] virtual Result<Jwt, Error> Login(
        const LoginRequest& request, const CallOptions& options) = 0;

    [[nodiscard]] virtual Result<Payload, Error> Alter(
        const Operation& operation, const CallOptions& options) = 0;

    /// Server version tag, e.g. "v24.0.2".
    [[nodiscard]] virtual Result<std::string, Error> CheckVersion(
        const CallOptions& options) = 0;

    [[nodiscard]] virtual std::string Target() const = 0;

    virtual void Close() = 0;

protected:
    IDgraphStub() = default;
};

} // namespace dgraph_client
