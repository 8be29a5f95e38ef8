#include <dgraph_client/session/session_manager.hpp>

#include <dgraph_client/core/log.hpp>

#include <nlohmann/json.hpp>

#include <fstream>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace dgraph_client {

namespace {

Error MakeSessionError(const std::string& operation,
                       const std::string& endpoint,
                       const std::string& message,
                       ErrorCategory category = ErrorCategory::Authentication) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt, category};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Login / Refresh
// ---------------------------------------------------------------------------
Result<void, Error> SessionManager::Login(IDgraphStub& stub,
                                          const std::string& user,
                                          const std::string& password,
                                          uint64_t namespace_id,
                                          const CallOptions& options) {
    LoginRequest request;
    request.userid = user;
    request.password = password;
    request.namespace_id = namespace_id;

    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);
    LogInfo("session", "Logging in as " + user + " (namespace " +
                           std::to_string(namespace_id) + ")");
    return Exchange(stub, request, options);
}

Result<void, Error> SessionManager::Refresh(IDgraphStub& stub,
                                            const std::string& observed_access_token,
                                            const CallOptions& options) {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    auto current = Current();
    if (current.access_token != observed_access_token) {
        LogDebug("session", "Session already refreshed by a concurrent caller");
        return Result<void, Error>::Ok();
    }
    if (current.refresh_token.empty()) {
        return Result<void, Error>::Err(MakeSessionError(
            "RefreshSession", stub.Target(), "refresh jwt should not be empty"));
    }

    LoginRequest request;
    request.refresh_token = current.refresh_token;
    LogDebug("session", "Refreshing access token");
    auto result = Exchange(stub, request, options);
    if (result.IsErr()) {
        auto err = std::move(result).Error();
        // An expired refresh token cannot be refreshed again.
        if (err.category == ErrorCategory::SessionExpired) {
            err.category = ErrorCategory::Authentication;
        }
        return Result<void, Error>::Err(std::move(err));
    }
    return result;
}

Result<void, Error> SessionManager::Exchange(IDgraphStub& stub,
                                             const LoginRequest& request,
                                             const CallOptions& options) {
    auto jwt = stub.Login(request, options);
    if (jwt.IsErr()) {
        return Result<void, Error>::Err(std::move(jwt).Error());
    }
    auto tokens = std::move(jwt).Value();
    if (tokens.access_jwt.empty()) {
        return Result<void, Error>::Err(MakeSessionError(
            "Login", stub.Target(), "Login response did not contain access_jwt"));
    }
    Set(Session{std::move(tokens.access_jwt), std::move(tokens.refresh_jwt)});
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
std::string SessionManager::AccessToken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.access_token;
}

Session SessionManager::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void SessionManager::Set(Session session) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = std::move(session);
}

void SessionManager::Clear() {
    Set(Session{});
}

// ---------------------------------------------------------------------------
// SaveToFile / LoadFromFile
// ---------------------------------------------------------------------------
Result<void, Error> SessionManager::SaveToFile(const std::string& path) const {
    auto session = Current();
    nlohmann::json j;
    j["access_jwt"] = session.access_token;
    j["refresh_jwt"] = session.refresh_token;

    std::ofstream ofs(path);
    if (!ofs) {
        return Result<void, Error>::Err(MakeSessionError(
            "SaveSession", path, "Failed to open file for writing",
            ErrorCategory::Internal));
    }
    ofs << j.dump(2);
#ifndef _WIN32
    // Owner read/write only (chmod 600).
    chmod(path.c_str(), S_IRUSR | S_IWUSR);
#endif
    return Result<void, Error>::Ok();
}

Result<void, Error> SessionManager::LoadFromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Result<void, Error>::Err(MakeSessionError(
            "LoadSession", path, "Failed to open session file",
            ErrorCategory::Internal));
    }

    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return Result<void, Error>::Err(MakeSessionError(
            "LoadSession", path, "Malformed JSON: " + std::string(e.what()),
            ErrorCategory::Internal));
    }

    Session session;
    if (j.contains("access_jwt") && j["access_jwt"].is_string()) {
        session.access_token = j["access_jwt"].get<std::string>();
    }
    if (j.contains("refresh_jwt") && j["refresh_jwt"].is_string()) {
        session.refresh_token = j["refresh_jwt"].get<std::string>();
    }
    Set(std::move(session));
    return Result<void, Error>::Ok();
}

} // namespace dgraph_client
