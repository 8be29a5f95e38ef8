#pragma once

#include <dgraph_client/core/types.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dgraph_client {

// ---------------------------------------------------------------------------
// TxnContext: the server's view of a transaction. start_ts is fixed by the
// first response; keys and preds only grow.
// ---------------------------------------------------------------------------
struct TxnContext {
    uint64_t start_ts = 0;
    uint64_t commit_ts = 0;
    bool aborted = false;
    std::vector<std::string> keys;
    std::vector<std::string> preds;
    std::string hash;

    bool operator==(const TxnContext& other) const {
        return start_ts == other.start_ts && commit_ts == other.commit_ts &&
               aborted == other.aborted && keys == other.keys &&
               preds == other.preds && hash == other.hash;
    }
    bool operator!=(const TxnContext& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// Mutation: serialized payloads. JSON payloads hold serialized documents,
// N-Quad payloads hold raw triples.
// ---------------------------------------------------------------------------
struct Mutation {
    std::string set_json;
    std::string delete_json;
    std::string set_nquads;
    std::string del_nquads;
    std::string cond;
    bool commit_now = false;

    [[nodiscard]] bool HasJson() const { return !set_json.empty() || !delete_json.empty(); }
    [[nodiscard]] bool HasNquads() const { return !set_nquads.empty() || !del_nquads.empty(); }
};

using Variables = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// Request: one query, mutation or upsert round trip.
// ---------------------------------------------------------------------------
struct Request {
    std::string query;
    Variables vars;
    std::vector<Mutation> mutations;
    bool commit_now = false;
    uint64_t start_ts = 0;
    std::string hash;
    ResponseFormat resp_format = ResponseFormat::Json;
    bool read_only = false;
    bool best_effort = false;
};

struct Latency {
    uint64_t parsing_ns = 0;
    uint64_t processing_ns = 0;
    uint64_t encoding_ns = 0;
    uint64_t assign_timestamp_ns = 0;
    uint64_t total_ns = 0;
};

// ---------------------------------------------------------------------------
// Response: result payload (json or rdf, per the request's format), uids
// assigned to blank nodes, latency and the updated transaction context.
// ---------------------------------------------------------------------------
struct Response {
    std::string json;
    std::string rdf;
    std::map<std::string, std::string> uids;
    Latency latency;
    std::map<std::string, uint64_t> metrics;
    TxnContext txn;
};

struct LoginRequest {
    std::string userid;
    std::string password;
    uint64_t namespace_id = 0;
    std::string refresh_token;
};

struct Jwt {
    std::string access_jwt;
    std::string refresh_jwt;
};

// ---------------------------------------------------------------------------
// Operation: schema change or drop, passed through to the server.
// ---------------------------------------------------------------------------
enum class DropOp {
    None,
    All,
    Data,
    Attr,
    Type,
};

struct Operation {
    std::string schema;
    bool drop_all = false;
    std::string drop_attr;
    DropOp drop_op = DropOp::None;
    std::string drop_value;
    bool run_in_background = false;
};

struct Payload {
    std::string data;
};

// ---------------------------------------------------------------------------
// CallOptions: per-call metadata (headers) and deadline.
// ---------------------------------------------------------------------------
using Metadata = std::vector<std::pair<std::string, std::string>>;

struct CallOptions {
    Metadata metadata;
    std::optional<std::chrono::seconds> timeout;
};

} // namespace dgraph_client
