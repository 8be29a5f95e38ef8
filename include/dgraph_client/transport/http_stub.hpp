#pragma once

#include <dgraph_client/core/types.hpp>
#include <dgraph_client/transport/i_dgraph_stub.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace dgraph_client {

// Metadata key carrying the session's access token. The HTTP stub sends it
// as the X-Dgraph-AccessToken header.
inline constexpr const char* kAccessTokenMetadataKey = "accessjwt";

// ---------------------------------------------------------------------------
// HttpStubOptions: connection settings for one alpha.
// ---------------------------------------------------------------------------
struct HttpStubOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{60};
    bool use_https = false;
    bool tls_verify = true;
    std::string api_key;       // sent verbatim as Authorization
    std::string bearer_token;  // sent as "Authorization: Bearer <token>"
};

// ---------------------------------------------------------------------------
// HttpDgraphStub: IDgraphStub over Dgraph's HTTP API using cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header. Each call opens its
// own httplib::Client so concurrent calls with different deadlines do not
// share connection state.
//
// Routes:
//   - Query         POST /query or /mutate (when mutations are present)
//   - CommitOrAbort POST /commit?startTs=N[&abort=true]
//   - Login         POST /login
//   - Alter         POST /alter
//   - CheckVersion  GET  /health
// ---------------------------------------------------------------------------
class HttpDgraphStub : public IDgraphStub {
public:
    explicit HttpDgraphStub(const Endpoint& endpoint,
                            const HttpStubOptions& options = {});
    ~HttpDgraphStub() override;

    [[nodiscard]] Result<Response, Error> Query(
        const Request& request, const CallOptions& options) override;

    [[nodiscard]] Result<TxnContext, Error> CommitOrAbort(
        const TxnContext& ctx, const CallOptions& options) override;

    [[nodiscard]] Result<Jwt, Error> Login(
        const LoginRequest& request, const CallOptions& options) override;

    [[nodiscard]] Result<Payload, Error> Alter(
        const Operation& operation, const CallOptions& options) override;

    [[nodiscard]] Result<std::string, Error> CheckVersion(
        const CallOptions& options) override;

    [[nodiscard]] std::string Target() const override;

    /// Further calls fail with a Connection error.
    void Close() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dgraph_client
