#pragma once

#include <dgraph_client/core/log.hpp>
#include <dgraph_client/core/result.hpp>
#include <dgraph_client/session/session_manager.hpp>
#include <dgraph_client/transport/i_dgraph_stub.hpp>
#include <dgraph_client/txn/transaction.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace dgraph_client {

enum class SelectionPolicy {
    RoundRobin,
    Random,
};

struct ClientOptions {
    SelectionPolicy selection = SelectionPolicy::RoundRobin;
    std::optional<std::chrono::seconds> timeout;  // per call; stub default if unset
    Metadata metadata;                            // sent with every call
};

// ---------------------------------------------------------------------------
// Client: entry point for transactions and admin calls.
//
// Owns one stub per alpha and the session credentials. Stubs are picked per
// request (round-robin or random). Any call that fails with SessionExpired
// is retried exactly once after a single-flight session refresh.
//
// Thread-safe. Transactions hold a reference, so the Client must outlive
// every transaction it creates.
// ---------------------------------------------------------------------------
class Client {
public:
    [[nodiscard]] static Result<std::unique_ptr<Client>, Error> Create(
        std::vector<std::unique_ptr<IDgraphStub>> stubs,
        ClientOptions options = {});

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // -- Session --------------------------------------------------------------

    [[nodiscard]] Result<void, Error> Login(const std::string& user,
                                            const std::string& password);
    [[nodiscard]] Result<void, Error> LoginIntoNamespace(const std::string& user,
                                                         const std::string& password,
                                                         uint64_t namespace_id);

    /// Single-flight refresh; a no-op when the access token has already
    /// moved on from observed_access_token.
    [[nodiscard]] Result<void, Error> RefreshSession(
        const std::string& observed_access_token);

    [[nodiscard]] SessionManager& Credentials() noexcept { return session_; }

    // -- Admin ----------------------------------------------------------------

    [[nodiscard]] Result<Payload, Error> Alter(const Operation& operation);
    [[nodiscard]] Result<std::string, Error> CheckVersion();

    // -- Transactions ---------------------------------------------------------

    [[nodiscard]] Result<Transaction, Error> NewTxn(TxnOptions options = {});
    [[nodiscard]] Result<std::shared_ptr<SharedTransaction>, Error> NewSharedTxn(
        TxnOptions options = {});

    // -- Plumbing used by transactions ----------------------------------------

    [[nodiscard]] IDgraphStub& AnyStub();
    [[nodiscard]] std::size_t StubCount() const noexcept { return stubs_.size(); }

    /// Call options carrying the current access token. Access-token entries
    /// supplied by the caller are dropped.
    [[nodiscard]] CallOptions AddLoginMetadata(Metadata metadata = {}) const;

    /// Run fn(stub, options) once; on SessionExpired refresh the session and
    /// run it exactly once more against the same stub.
    template <typename T, typename Fn>
    Result<T, Error> CallWithSessionRefresh(Fn&& fn) {
        auto& stub = AnyStub();
        auto observed = session_.AccessToken();
        Result<T, Error> result = fn(stub, AddLoginMetadata());
        if (result.IsOk() || result.Error().category != ErrorCategory::SessionExpired) {
            return result;
        }
        LogDebug("client", "Access token expired, refreshing session");
        auto refreshed = RefreshSession(observed);
        if (refreshed.IsErr()) {
            return Result<T, Error>::Err(std::move(refreshed).Error());
        }
        return fn(stub, AddLoginMetadata());
    }

    /// Close every stub. Transactions created afterwards fail to connect.
    void Close();

private:
    Client(std::vector<std::unique_ptr<IDgraphStub>> stubs, ClientOptions options);

    CallOptions BaseCallOptions() const;

    std::vector<std::unique_ptr<IDgraphStub>> stubs_;
    ClientOptions options_;
    SessionManager session_;
    std::atomic<std::size_t> next_stub_{0};
    std::mutex random_mutex_;  // guards rng_
    std::mt19937 rng_;
};

} // namespace dgraph_client
