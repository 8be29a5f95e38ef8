#include <dgraph_client/txn/protocol.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace dgraph_client {

namespace {

void AppendUnique(std::vector<std::string>& target,
                  const std::vector<std::string>& incoming) {
    std::unordered_set<std::string> seen(target.begin(), target.end());
    for (const auto& item : incoming) {
        if (seen.insert(item).second) {
            target.push_back(item);
        }
    }
}

} // anonymous namespace

Result<Mutation, Error> CreateMutation(const MutationInput& input) {
    const bool has_json = input.set_obj.has_value() || input.del_obj.has_value();
    const bool has_nquads = !input.set_nquads.empty() || !input.del_nquads.empty();

    if (!has_json && !has_nquads) {
        return Result<Mutation, Error>::Err(Error::Transaction(
            "CreateMutation",
            "Mutation must set at least one of set_obj, del_obj, set_nquads or del_nquads"));
    }
    if (has_json && has_nquads) {
        return Result<Mutation, Error>::Err(Error::Transaction(
            "CreateMutation",
            "JSON and N-Quad payloads cannot be combined in one mutation"));
    }

    Mutation mu;
    if (input.set_obj.has_value()) {
        mu.set_json = input.set_obj->dump();
    }
    if (input.del_obj.has_value()) {
        mu.delete_json = input.del_obj->dump();
    }
    mu.set_nquads = input.set_nquads;
    mu.del_nquads = input.del_nquads;
    mu.cond = input.cond;
    mu.commit_now = input.commit_now;
    return Result<Mutation, Error>::Ok(std::move(mu));
}

Request CreateRequest(const RequestInput& input, const TxnContext& ctx) {
    Request request;
    request.query = input.query;
    request.vars = input.vars;
    request.mutations = input.mutations;
    request.resp_format = input.resp_format;
    request.start_ts = ctx.start_ts;
    request.hash = ctx.hash;
    request.commit_now = input.commit_now ||
        std::any_of(input.mutations.begin(), input.mutations.end(),
                    [](const Mutation& mu) { return mu.commit_now; });
    return request;
}

Result<Variables, Error> VariablesFromJson(const nlohmann::json& vars) {
    if (vars.is_null()) {
        return Result<Variables, Error>::Ok(Variables{});
    }
    const auto bad = Error::Transaction(
        "VariablesFromJson", "Values and keys in variable map must be strings");
    if (!vars.is_object()) {
        return Result<Variables, Error>::Err(bad);
    }
    Variables out;
    for (const auto& [key, value] : vars.items()) {
        if (!value.is_string()) {
            return Result<Variables, Error>::Err(bad);
        }
        out[key] = value.get<std::string>();
    }
    return Result<Variables, Error>::Ok(std::move(out));
}

Result<void, Error> MergeContext(TxnContext& local, const TxnContext& incoming) {
    if (incoming.start_ts == 0) {
        return Result<void, Error>::Ok();
    }
    if (local.start_ts == 0) {
        local.start_ts = incoming.start_ts;
    } else if (local.start_ts != incoming.start_ts) {
        return Result<void, Error>::Err(
            Error::Transaction("MergeContext", "StartTs mismatch"));
    }
    if (!incoming.hash.empty()) {
        local.hash = incoming.hash;
    }
    AppendUnique(local.keys, incoming.keys);
    AppendUnique(local.preds, incoming.preds);
    return Result<void, Error>::Ok();
}

Result<ResponseFormat, Error> ParseResponseFormat(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "json") return Result<ResponseFormat, Error>::Ok(ResponseFormat::Json);
    if (lower == "rdf") return Result<ResponseFormat, Error>::Ok(ResponseFormat::Rdf);
    return Result<ResponseFormat, Error>::Err(Error::Transaction(
        "ParseResponseFormat", "Response format should be either RDF or JSON"));
}

} // namespace dgraph_client
