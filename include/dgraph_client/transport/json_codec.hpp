#pragma once

#include <dgraph_client/core/result.hpp>
#include <dgraph_client/transport/messages.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace dgraph_client {

// ---------------------------------------------------------------------------
// JSON codec for Dgraph's HTTP API. Pure functions; no I/O.
//
// Decoders classify server-reported errors ({"errors":[...]}) into the
// ErrorCategory taxonomy so nothing above the transport reads message text.
// ---------------------------------------------------------------------------

struct EncodedBody {
    std::string body;
    std::string content_type;
};

// -- Requests ---------------------------------------------------------------

/// {"query": ..., "variables": {...}}
[[nodiscard]] std::string EncodeQueryBody(const Request& request);

/// JSON mutations become {"query"?, "variables"?, "mutations": [...]} sent as
/// application/json. N-Quad mutations become an RDF block (or an upsert
/// block when a query is present) sent as application/rdf. Mixing the two
/// forms in one request is rejected.
[[nodiscard]] Result<EncodedBody, Error> EncodeMutationBody(const Request& request);

/// {"keys": [...], "preds": [...]}
[[nodiscard]] std::string EncodeCommitBody(const TxnContext& ctx);

[[nodiscard]] std::string EncodeLoginBody(const LoginRequest& request);

/// Schema text as application/dql, or a JSON drop operation.
[[nodiscard]] EncodedBody EncodeAlterBody(const Operation& operation);

// -- Responses --------------------------------------------------------------

[[nodiscard]] TxnContext DecodeTxnContext(const nlohmann::json& txn);

[[nodiscard]] Result<Response, Error> DecodeResponse(
    std::string_view body, ResponseFormat format,
    const std::string& operation, const std::string& endpoint);

[[nodiscard]] Result<TxnContext, Error> DecodeCommitResponse(
    std::string_view body, const TxnContext& sent,
    const std::string& endpoint);

[[nodiscard]] Result<Jwt, Error> DecodeLoginResponse(
    std::string_view body, const std::string& endpoint);

[[nodiscard]] Result<Payload, Error> DecodeAlterResponse(
    std::string_view body, const std::string& endpoint);

/// /health returns either an object or an array of instance objects.
[[nodiscard]] Result<std::string, Error> DecodeHealthVersion(
    std::string_view body, const std::string& endpoint);

} // namespace dgraph_client
