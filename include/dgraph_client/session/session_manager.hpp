#pragma once

#include <dgraph_client/core/result.hpp>
#include <dgraph_client/transport/i_dgraph_stub.hpp>

#include <cstdint>
#include <mutex>
#include <string>

namespace dgraph_client {

// ---------------------------------------------------------------------------
// Session: the token pair issued by /login. Replaced as a whole, never
// edited in place.
// ---------------------------------------------------------------------------
struct Session {
    std::string access_token;
    std::string refresh_token;
};

// ---------------------------------------------------------------------------
// SessionManager: owns the client's credentials.
//
// Refresh is single-flight: concurrent callers that saw the same expired
// token queue on refresh_mutex_, and only the first one exchanges the
// refresh token. The rest see a changed access token and return at once.
// ---------------------------------------------------------------------------
class SessionManager {
public:
    SessionManager() = default;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    [[nodiscard]] Result<void, Error> Login(IDgraphStub& stub,
                                            const std::string& user,
                                            const std::string& password,
                                            uint64_t namespace_id,
                                            const CallOptions& options = {});

    /// Exchange the refresh token for a new pair, unless the access token
    /// no longer equals observed_access_token.
    [[nodiscard]] Result<void, Error> Refresh(IDgraphStub& stub,
                                              const std::string& observed_access_token,
                                              const CallOptions& options = {});

    [[nodiscard]] std::string AccessToken() const;
    [[nodiscard]] Session Current() const;
    void Set(Session session);
    void Clear();

    /// Persist the token pair as JSON, readable by the owner only.
    [[nodiscard]] Result<void, Error> SaveToFile(const std::string& path) const;
    [[nodiscard]] Result<void, Error> LoadFromFile(const std::string& path);

private:
    Result<void, Error> Exchange(IDgraphStub& stub, const LoginRequest& request,
                                 const CallOptions& options);

    mutable std::mutex mutex_;  // guards session_
    std::mutex refresh_mutex_;
    Session session_;
};

} // namespace dgraph_client
