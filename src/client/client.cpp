#include <dgraph_client/client/client.hpp>

#include <algorithm>
#include <cctype>

namespace dgraph_client {

namespace {

bool IEquals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool IsAccessTokenKey(const std::string& key) {
    return IEquals(key, "accessjwt") || IEquals(key, "x-dgraph-accesstoken");
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Result<std::unique_ptr<Client>, Error> Client::Create(
    std::vector<std::unique_ptr<IDgraphStub>> stubs, ClientOptions options) {
    if (stubs.empty()) {
        return Result<std::unique_ptr<Client>, Error>::Err(Error{
            "Client", "", std::nullopt, "No clients provided", std::nullopt,
            ErrorCategory::Config});
    }
    if (std::any_of(stubs.begin(), stubs.end(),
                    [](const auto& stub) { return stub == nullptr; })) {
        return Result<std::unique_ptr<Client>, Error>::Err(Error{
            "Client", "", std::nullopt, "Null stub in client list", std::nullopt,
            ErrorCategory::Config});
    }
    return Result<std::unique_ptr<Client>, Error>::Ok(std::unique_ptr<Client>(
        new Client(std::move(stubs), std::move(options))));
}

Client::Client(std::vector<std::unique_ptr<IDgraphStub>> stubs, ClientOptions options)
    : stubs_(std::move(stubs)),
      options_(std::move(options)),
      rng_(std::random_device{}()) {}

Client::~Client() = default;

// ---------------------------------------------------------------------------
// Stub selection and metadata
// ---------------------------------------------------------------------------
IDgraphStub& Client::AnyStub() {
    if (options_.selection == SelectionPolicy::Random && stubs_.size() > 1) {
        std::lock_guard<std::mutex> lock(random_mutex_);
        std::uniform_int_distribution<std::size_t> pick(0, stubs_.size() - 1);
        return *stubs_[pick(rng_)];
    }
    return *stubs_[next_stub_.fetch_add(1) % stubs_.size()];
}

CallOptions Client::BaseCallOptions() const {
    CallOptions call;
    for (const auto& entry : options_.metadata) {
        if (!IsAccessTokenKey(entry.first)) {
            call.metadata.push_back(entry);
        }
    }
    call.timeout = options_.timeout;
    return call;
}

CallOptions Client::AddLoginMetadata(Metadata metadata) const {
    auto call = BaseCallOptions();
    for (auto& entry : metadata) {
        if (!IsAccessTokenKey(entry.first)) {
            call.metadata.push_back(std::move(entry));
        }
    }
    auto token = session_.AccessToken();
    if (!token.empty()) {
        call.metadata.emplace_back("accessjwt", std::move(token));
    }
    return call;
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------
Result<void, Error> Client::Login(const std::string& user, const std::string& password) {
    return LoginIntoNamespace(user, password, 0);
}

Result<void, Error> Client::LoginIntoNamespace(const std::string& user,
                                               const std::string& password,
                                               uint64_t namespace_id) {
    return session_.Login(AnyStub(), user, password, namespace_id, BaseCallOptions());
}

Result<void, Error> Client::RefreshSession(const std::string& observed_access_token) {
    return session_.Refresh(AnyStub(), observed_access_token, BaseCallOptions());
}

// ---------------------------------------------------------------------------
// Admin
// ---------------------------------------------------------------------------
Result<Payload, Error> Client::Alter(const Operation& operation) {
    LogInfo("client", "Alter");
    return CallWithSessionRefresh<Payload>(
        [&operation](IDgraphStub& stub, const CallOptions& call) {
            return stub.Alter(operation, call);
        });
}

Result<std::string, Error> Client::CheckVersion() {
    return CallWithSessionRefresh<std::string>(
        [](IDgraphStub& stub, const CallOptions& call) {
            return stub.CheckVersion(call);
        });
}

// ---------------------------------------------------------------------------
// Transactions
// ---------------------------------------------------------------------------
Result<Transaction, Error> Client::NewTxn(TxnOptions options) {
    return Transaction::Create(*this, options);
}

Result<std::shared_ptr<SharedTransaction>, Error> Client::NewSharedTxn(TxnOptions options) {
    return SharedTransaction::Create(*this, options);
}

void Client::Close() {
    for (auto& stub : stubs_) {
        stub->Close();
    }
}

} // namespace dgraph_client
