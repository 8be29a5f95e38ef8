#include <catch2/catch_test_macros.hpp>

#include <dgraph_client/client/client.hpp>
#include <dgraph_client/retry/retry.hpp>
#include <dgraph_client/txn/transaction.hpp>
#include "../../test/mocks/fake_dgraph.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace dgraph_client;
using namespace dgraph_client::testing;
using nlohmann::json;

namespace {

struct FakeClient {
    std::unique_ptr<Client> client;
    FakeDgraph* fake = nullptr;
};

FakeClient MakeFakeClient() {
    auto stub = std::make_unique<FakeDgraph>();
    auto* raw = stub.get();
    std::vector<std::unique_ptr<IDgraphStub>> stubs;
    stubs.push_back(std::move(stub));
    auto client = Client::Create(std::move(stubs));
    REQUIRE(client.IsOk());
    return FakeClient{std::move(client).Value(), raw};
}

Transaction NewTxn(Client& client, TxnOptions options = {}) {
    auto txn = client.NewTxn(options);
    REQUIRE(txn.IsOk());
    return std::move(txn).Value();
}

Mutation Set(const std::string& key, const std::string& value) {
    Mutation mu;
    mu.set_json = json{{key, value}}.dump();
    return mu;
}

// Value of key as read by the "get" query, or null.
json Read(Transaction& txn, const std::string& key) {
    auto r = txn.Query("get " + key);
    REQUIRE(r.IsOk());
    return json::parse(r.Value().json)[key];
}

Retrier NoSleepRetrier(int max_retries = 5) {
    RetryPolicy policy;
    policy.max_retries = max_retries;
    return Retrier(policy, [](std::chrono::milliseconds) {}, []() { return 0.0; });
}

} // anonymous namespace

// ===========================================================================
// Commit and discard
// ===========================================================================

TEST_CASE("Scenario: committed write is visible to a later transaction", "[txn][scenario]") {
    auto fc = MakeFakeClient();
    {
        auto txn = NewTxn(*fc.client);
        REQUIRE(txn.Mutate(Set("name", "alice")).IsOk());
        REQUIRE(txn.Commit().IsOk());
        CHECK(txn.Context().commit_ts > txn.Context().start_ts);
    }
    CHECK(fc.fake->CommittedValue("name") == std::optional<std::string>("alice"));

    auto reader = NewTxn(*fc.client, TxnOptions{true, false});
    CHECK(Read(reader, "name") == "alice");
}

TEST_CASE("Scenario: a transaction reads its own writes", "[txn][scenario]") {
    auto fc = MakeFakeClient();
    auto txn = NewTxn(*fc.client);
    REQUIRE(txn.Mutate(Set("color", "blue")).IsOk());
    CHECK(Read(txn, "color") == "blue");
    CHECK_FALSE(fc.fake->CommittedValue("color").has_value());
    REQUIRE(txn.Commit().IsOk());
}

TEST_CASE("Scenario: discarded write is never visible", "[txn][scenario]") {
    auto fc = MakeFakeClient();
    auto txn = NewTxn(*fc.client);
    REQUIRE(txn.Mutate(Set("name", "bob")).IsOk());
    REQUIRE(txn.Discard().IsOk());

    CHECK_FALSE(fc.fake->CommittedValue("name").has_value());
    CHECK(fc.fake->AbortCallCount() == 1);
    CHECK(fc.fake->PendingCount() == 0);

    auto reader = NewTxn(*fc.client, TxnOptions{true, false});
    CHECK(Read(reader, "name").is_null());
}

TEST_CASE("Scenario: abandoned transaction is aborted by its destructor", "[txn][scenario]") {
    auto fc = MakeFakeClient();
    {
        auto txn = NewTxn(*fc.client);
        REQUIRE(txn.Mutate(Set("name", "carol")).IsOk());
        CHECK(fc.fake->PendingCount() == 1);
    }
    CHECK(fc.fake->PendingCount() == 0);
    CHECK(fc.fake->AbortCallCount() == 1);
    CHECK_FALSE(fc.fake->CommittedValue("name").has_value());
}

TEST_CASE("Scenario: commit_now mutation commits in one round trip", "[txn][scenario]") {
    auto fc = MakeFakeClient();
    auto txn = NewTxn(*fc.client);
    auto mu = Set("name", "dave");
    mu.commit_now = true;
    REQUIRE(txn.Mutate(mu).IsOk());

    CHECK(txn.IsFinished());
    CHECK(fc.fake->CommitCallCount() == 0);
    CHECK(fc.fake->CommittedValue("name") == std::optional<std::string>("dave"));
}

// ===========================================================================
// Isolation and conflicts
// ===========================================================================

TEST_CASE("Scenario: read-only transaction keeps its snapshot", "[txn][scenario]") {
    auto fc = MakeFakeClient();
    {
        auto seed = NewTxn(*fc.client);
        REQUIRE(seed.Mutate(Set("x", "1")).IsOk());
        REQUIRE(seed.Commit().IsOk());
    }

    auto reader = NewTxn(*fc.client, TxnOptions{true, false});
    CHECK(Read(reader, "x") == "1");

    {
        auto writer = NewTxn(*fc.client);
        REQUIRE(writer.Mutate(Set("x", "2")).IsOk());
        REQUIRE(writer.Commit().IsOk());
    }

    CHECK(Read(reader, "x") == "1");
    auto fresh = NewTxn(*fc.client, TxnOptions{true, false});
    CHECK(Read(fresh, "x") == "2");
}

TEST_CASE("Scenario: second of two conflicting writers is aborted", "[txn][scenario]") {
    auto fc = MakeFakeClient();
    {
        auto seed = NewTxn(*fc.client);
        REQUIRE(seed.Mutate(Set("balance", "0")).IsOk());
        REQUIRE(seed.Commit().IsOk());
    }

    auto first = NewTxn(*fc.client);
    auto second = NewTxn(*fc.client);
    CHECK(Read(first, "balance") == "0");
    CHECK(Read(second, "balance") == "0");
    REQUIRE(first.Mutate(Set("balance", "10")).IsOk());
    REQUIRE(second.Mutate(Set("balance", "20")).IsOk());

    REQUIRE(first.Commit().IsOk());
    auto r = second.Commit();
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Aborted);
    CHECK(r.Error().message == kAbortedMessage);
    CHECK(r.Error().IsConflict());
    CHECK(second.IsFinished());

    auto third = NewTxn(*fc.client, TxnOptions{true, false});
    CHECK(Read(third, "balance") == "10");
}

TEST_CASE("Scenario: writers on disjoint keys both commit", "[txn][scenario]") {
    auto fc = MakeFakeClient();
    auto first = NewTxn(*fc.client);
    auto second = NewTxn(*fc.client);
    REQUIRE(first.Mutate(Set("a", "1")).IsOk());
    REQUIRE(second.Mutate(Set("b", "2")).IsOk());
    CHECK(first.Commit().IsOk());
    CHECK(second.Commit().IsOk());
}

TEST_CASE("Scenario: RunTransaction retries a conflict to success", "[txn][scenario][retry]") {
    auto fc = MakeFakeClient();
    int attempts = 0;

    auto result = RunTransaction(
        *fc.client,
        [&](Transaction& txn) -> Result<void, Error> {
            ++attempts;
            auto read = txn.Query("get counter");
            if (read.IsErr()) {
                return Result<void, Error>::Err(std::move(read).Error());
            }
            auto value = json::parse(read.Value().json)["counter"];
            int current = value.is_null() ? 0 : std::stoi(value.get<std::string>());

            if (attempts == 1) {
                // Another writer commits the same key before this attempt does.
                auto other = NewTxn(*fc.client);
                REQUIRE(other.Mutate(Set("counter", "100")).IsOk());
                REQUIRE(other.Commit().IsOk());
            }

            auto written = txn.Mutate(Set("counter", std::to_string(current + 1)));
            if (written.IsErr()) {
                return Result<void, Error>::Err(std::move(written).Error());
            }
            return txn.Commit();
        },
        NoSleepRetrier());

    REQUIRE(result.IsOk());
    CHECK(attempts == 2);
    CHECK(fc.fake->CommittedValue("counter") == std::optional<std::string>("101"));
}

TEST_CASE("Scenario: RunSharedTransaction commits through the shared handle", "[txn][scenario][retry]") {
    auto fc = MakeFakeClient();
    auto result = RunSharedTransaction(
        *fc.client,
        [](SharedTransaction& txn) -> Result<void, Error> {
            auto written = txn.Mutate(Set("shared", "yes"));
            if (written.IsErr()) {
                return Result<void, Error>::Err(std::move(written).Error());
            }
            return txn.Commit();
        },
        NoSleepRetrier());
    REQUIRE(result.IsOk());
    CHECK(fc.fake->CommittedValue("shared") == std::optional<std::string>("yes"));
}

// ===========================================================================
// Sessions
// ===========================================================================

TEST_CASE("Scenario: expired access token is refreshed transparently", "[txn][scenario][session]") {
    auto fc = MakeFakeClient();
    fc.fake->RequireLogin();
    REQUIRE(fc.client->Login("groot", "password").IsOk());
    CHECK(fc.fake->LoginCallCount() == 1);

    auto txn = NewTxn(*fc.client);
    REQUIRE(txn.Mutate(Set("k", "v")).IsOk());

    fc.fake->ExpireAccessToken();
    REQUIRE(txn.Commit().IsOk());

    CHECK(fc.fake->LoginCallCount() == 2);
    CHECK(fc.client->Credentials().AccessToken() == "access-2");
    CHECK(fc.fake->CommittedValue("k") == std::optional<std::string>("v"));
}

TEST_CASE("Scenario: calls without a login are rejected", "[txn][scenario][session]") {
    auto fc = MakeFakeClient();
    fc.fake->RequireLogin();

    auto txn = NewTxn(*fc.client);
    auto r = txn.Query("get k");
    REQUIRE(r.IsErr());
    // No refresh token to fall back on.
    CHECK(r.Error().category == ErrorCategory::Authentication);
}

TEST_CASE("Scenario: wrong password fails login", "[txn][scenario][session]") {
    auto fc = MakeFakeClient();
    auto r = fc.client->Login("groot", "wrong");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Authentication);
    CHECK(fc.client->Credentials().AccessToken().empty());
}

// ===========================================================================
// Cluster
// ===========================================================================

TEST_CASE("Scenario: transaction spans stubs sharing one cluster", "[txn][scenario]") {
    auto first = std::make_unique<FakeDgraph>("alpha1:9080");
    auto second = std::make_unique<FakeDgraph>("alpha2:9080", first->SharedStore());
    auto* fake = first.get();
    std::vector<std::unique_ptr<IDgraphStub>> stubs;
    stubs.push_back(std::move(first));
    stubs.push_back(std::move(second));
    auto client = Client::Create(std::move(stubs));
    REQUIRE(client.IsOk());

    auto txn = NewTxn(*client.Value());
    REQUIRE(txn.Mutate(Set("a", "1")).IsOk());
    REQUIRE(txn.Mutate(Set("b", "2")).IsOk());
    REQUIRE(txn.Commit().IsOk());

    CHECK(fake->CommittedValue("a") == std::optional<std::string>("1"));
    CHECK(fake->CommittedValue("b") == std::optional<std::string>("2"));
}

TEST_CASE("Scenario: drop all clears committed data", "[txn][scenario]") {
    auto fc = MakeFakeClient();
    {
        auto txn = NewTxn(*fc.client);
        REQUIRE(txn.Mutate(Set("gone", "soon")).IsOk());
        REQUIRE(txn.Commit().IsOk());
    }
    Operation op;
    op.drop_all = true;
    REQUIRE(fc.client->Alter(op).IsOk());
    CHECK_FALSE(fc.fake->CommittedValue("gone").has_value());
}
