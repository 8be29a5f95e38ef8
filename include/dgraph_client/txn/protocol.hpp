#pragma once

#include <dgraph_client/core/result.hpp>
#include <dgraph_client/transport/messages.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dgraph_client {

// ---------------------------------------------------------------------------
// Protocol adapter: builds request envelopes and merges the server's
// transaction context. Pure functions, no I/O.
// ---------------------------------------------------------------------------

struct MutationInput {
    std::optional<nlohmann::json> set_obj;
    std::optional<nlohmann::json> del_obj;
    std::string set_nquads;
    std::string del_nquads;
    std::string cond;
    bool commit_now = false;
};

/// Serializes set_obj/del_obj. At least one payload is required, and the
/// JSON and N-Quad forms cannot be combined.
[[nodiscard]] Result<Mutation, Error> CreateMutation(const MutationInput& input);

struct RequestInput {
    std::string query;
    Variables vars;
    std::vector<Mutation> mutations;
    bool commit_now = false;
    ResponseFormat resp_format = ResponseFormat::Json;
};

/// Stamps start_ts and hash from ctx. commit_now is set if the input or any
/// mutation asks for it.
[[nodiscard]] Request CreateRequest(const RequestInput& input, const TxnContext& ctx);

/// Accepts a JSON object whose values are all strings. null yields no vars.
[[nodiscard]] Result<Variables, Error> VariablesFromJson(const nlohmann::json& vars);

/// Folds a response's context into the local one. start_ts is adopted once;
/// keys and preds are appended without duplicates.
[[nodiscard]] Result<void, Error> MergeContext(TxnContext& local,
                                               const TxnContext& incoming);

/// "json" or "rdf", case-insensitive.
[[nodiscard]] Result<ResponseFormat, Error> ParseResponseFormat(std::string_view name);

} // namespace dgraph_client
