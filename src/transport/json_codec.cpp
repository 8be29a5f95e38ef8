#include <dgraph_client/transport/json_codec.hpp>

#include <sstream>

namespace dgraph_client {

namespace {

using nlohmann::json;

// Parse a body, mapping malformed JSON to an Internal error.
Result<json, Error> ParseBody(std::string_view body,
                              const std::string& operation,
                              const std::string& endpoint) {
    auto j = json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded()) {
        return Result<json, Error>::Err(Error{
            operation, endpoint, std::nullopt,
            "Malformed JSON in server response", std::nullopt,
            ErrorCategory::Internal});
    }
    return Result<json, Error>::Ok(std::move(j));
}

// Returns the classified error if the body carries {"errors":[...]}.
std::optional<Error> ServerErrorFrom(const json& j,
                                     const std::string& operation,
                                     const std::string& endpoint) {
    if (!j.is_object() || !j.contains("errors")) return std::nullopt;
    const auto& errors = j["errors"];
    if (!errors.is_array() || errors.empty()) return std::nullopt;

    const auto& first = errors[0];
    if (!first.is_object()) {
        return Error{operation, endpoint, std::nullopt,
                     "Malformed error entry in server response", std::nullopt,
                     ErrorCategory::Internal};
    }
    std::string message = "Unknown server error";
    if (first.contains("message")) {
        if (!first["message"].is_string()) {
            return Error{operation, endpoint, std::nullopt,
                         "Malformed error entry in server response", std::nullopt,
                         ErrorCategory::Internal};
        }
        message = first["message"].get<std::string>();
    }
    std::optional<std::string> code;
    if (first.contains("extensions") && first["extensions"].is_object()) {
        const auto& ext = first["extensions"];
        if (ext.contains("code") && ext["code"].is_string()) {
            code = ext["code"].get<std::string>();
        }
    }
    auto category = ClassifyServerError(message, std::nullopt);
    return Error{operation, endpoint, std::nullopt, std::move(message),
                 std::move(code), category};
}

uint64_t U64(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return 0;
    const auto& v = obj[key];
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer()) {
        auto signed_value = v.get<int64_t>();
        return signed_value < 0 ? 0 : static_cast<uint64_t>(signed_value);
    }
    if (v.is_string()) {
        try {
            return std::stoull(v.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

std::string String(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string()) return {};
    return obj[key].get<std::string>();
}

std::vector<std::string> StringArray(const json& obj, const char* key) {
    std::vector<std::string> out;
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_array()) return out;
    for (const auto& item : obj[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

Result<json, Error> ParseMutationJson(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return Result<json, Error>::Err(Error::Transaction(
            "EncodeMutation", "Mutation payload is not valid JSON"));
    }
    return Result<json, Error>::Ok(std::move(j));
}

void AppendRdfSection(std::ostringstream& out, const char* verb,
                      const std::string& nquads) {
    if (nquads.empty()) return;
    out << "    " << verb << " {\n" << nquads << "\n    }\n";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Request encoding
// ---------------------------------------------------------------------------
std::string EncodeQueryBody(const Request& request) {
    json body;
    body["query"] = request.query;
    if (!request.vars.empty()) {
        body["variables"] = request.vars;
    }
    return body.dump();
}

Result<EncodedBody, Error> EncodeMutationBody(const Request& request) {
    bool any_json = false;
    bool any_nquads = false;
    for (const auto& mu : request.mutations) {
        any_json = any_json || mu.HasJson();
        any_nquads = any_nquads || mu.HasNquads();
    }
    if (any_json && any_nquads) {
        return Result<EncodedBody, Error>::Err(Error::Transaction(
            "EncodeMutation",
            "JSON and N-Quad mutations cannot be combined in one request"));
    }

    if (!any_nquads) {
        json body;
        if (!request.query.empty()) {
            body["query"] = request.query;
        }
        if (!request.vars.empty()) {
            body["variables"] = request.vars;
        }
        body["mutations"] = json::array();
        for (const auto& mu : request.mutations) {
            json m = json::object();
            if (!mu.set_json.empty()) {
                auto parsed = ParseMutationJson(mu.set_json);
                if (parsed.IsErr()) {
                    return Result<EncodedBody, Error>::Err(std::move(parsed).Error());
                }
                m["set"] = std::move(parsed).Value();
            }
            if (!mu.delete_json.empty()) {
                auto parsed = ParseMutationJson(mu.delete_json);
                if (parsed.IsErr()) {
                    return Result<EncodedBody, Error>::Err(std::move(parsed).Error());
                }
                m["delete"] = std::move(parsed).Value();
            }
            if (!mu.cond.empty()) {
                m["cond"] = mu.cond;
            }
            body["mutations"].push_back(std::move(m));
        }
        return Result<EncodedBody, Error>::Ok(
            EncodedBody{body.dump(), "application/json"});
    }

    if (!request.vars.empty()) {
        return Result<EncodedBody, Error>::Err(Error::Transaction(
            "EncodeMutation",
            "Query variables are not supported with N-Quad mutations"));
    }

    std::ostringstream out;
    if (request.query.empty()) {
        out << "{\n";
        for (const auto& mu : request.mutations) {
            AppendRdfSection(out, "set", mu.set_nquads);
            AppendRdfSection(out, "delete", mu.del_nquads);
        }
        out << "}\n";
    } else {
        out << "upsert {\n  query " << request.query << "\n";
        for (const auto& mu : request.mutations) {
            out << "  mutation";
            if (!mu.cond.empty()) {
                out << " " << mu.cond;
            }
            out << " {\n";
            AppendRdfSection(out, "set", mu.set_nquads);
            AppendRdfSection(out, "delete", mu.del_nquads);
            out << "  }\n";
        }
        out << "}\n";
    }
    return Result<EncodedBody, Error>::Ok(EncodedBody{out.str(), "application/rdf"});
}

std::string EncodeCommitBody(const TxnContext& ctx) {
    json body;
    body["keys"] = ctx.keys;
    body["preds"] = ctx.preds;
    return body.dump();
}

std::string EncodeLoginBody(const LoginRequest& request) {
    json body;
    if (!request.refresh_token.empty()) {
        body["refresh_token"] = request.refresh_token;
    } else {
        body["userid"] = request.userid;
        body["password"] = request.password;
        body["namespace"] = request.namespace_id;
    }
    return body.dump();
}

EncodedBody EncodeAlterBody(const Operation& operation) {
    json body;
    if (operation.drop_all) {
        body["drop_all"] = true;
    } else if (!operation.drop_attr.empty()) {
        body["drop_attr"] = operation.drop_attr;
    } else if (operation.drop_op != DropOp::None) {
        switch (operation.drop_op) {
            case DropOp::All:  body["drop_op"] = "ALL"; break;
            case DropOp::Data: body["drop_op"] = "DATA"; break;
            case DropOp::Attr: body["drop_op"] = "ATTR"; break;
            case DropOp::Type: body["drop_op"] = "TYPE"; break;
            case DropOp::None: break;
        }
        if (!operation.drop_value.empty()) {
            body["drop_value"] = operation.drop_value;
        }
    } else {
        return EncodedBody{operation.schema, "application/dql"};
    }
    return EncodedBody{body.dump(), "application/json"};
}

// ---------------------------------------------------------------------------
// Response decoding
// ---------------------------------------------------------------------------
TxnContext DecodeTxnContext(const json& txn) {
    TxnContext ctx;
    if (!txn.is_object()) return ctx;
    ctx.start_ts = U64(txn, "start_ts");
    ctx.commit_ts = U64(txn, "commit_ts");
    ctx.aborted = txn.contains("aborted") && txn["aborted"].is_boolean() &&
                  txn["aborted"].get<bool>();
    ctx.keys = StringArray(txn, "keys");
    ctx.preds = StringArray(txn, "preds");
    ctx.hash = String(txn, "hash");
    return ctx;
}

Result<Response, Error> DecodeResponse(std::string_view body,
                                       ResponseFormat format,
                                       const std::string& operation,
                                       const std::string& endpoint) {
    auto parsed = ParseBody(body, operation, endpoint);
    if (parsed.IsErr()) {
        return Result<Response, Error>::Err(std::move(parsed).Error());
    }
    const auto& j = parsed.Value();
    if (auto err = ServerErrorFrom(j, operation, endpoint)) {
        return Result<Response, Error>::Err(std::move(*err));
    }

    Response response;
    if (j.contains("data")) {
        const auto& data = j["data"];
        if (format == ResponseFormat::Rdf && data.is_string()) {
            response.rdf = data.get<std::string>();
        } else {
            if (data.is_object() && data.contains("uids") && data["uids"].is_object()) {
                for (const auto& [blank, uid] : data["uids"].items()) {
                    if (uid.is_string()) response.uids[blank] = uid.get<std::string>();
                }
            }
            response.json = data.dump();
        }
    }

    if (j.contains("extensions") && j["extensions"].is_object()) {
        const auto& ext = j["extensions"];
        if (ext.contains("txn")) {
            response.txn = DecodeTxnContext(ext["txn"]);
        }
        if (ext.contains("server_latency")) {
            const auto& lat = ext["server_latency"];
            response.latency.parsing_ns = U64(lat, "parsing_ns");
            response.latency.processing_ns = U64(lat, "processing_ns");
            response.latency.encoding_ns = U64(lat, "encoding_ns");
            response.latency.assign_timestamp_ns = U64(lat, "assign_timestamp_ns");
            response.latency.total_ns = U64(lat, "total_ns");
        }
        if (ext.contains("metrics") && ext["metrics"].is_object()) {
            const auto& metrics = ext["metrics"];
            if (metrics.contains("num_uids") && metrics["num_uids"].is_object()) {
                for (const auto& [name, count] : metrics["num_uids"].items()) {
                    if (count.is_number()) {
                        response.metrics[name] = count.get<uint64_t>();
                    }
                }
            }
        }
    }
    return Result<Response, Error>::Ok(std::move(response));
}

Result<TxnContext, Error> DecodeCommitResponse(std::string_view body,
                                               const TxnContext& sent,
                                               const std::string& endpoint) {
    auto parsed = ParseBody(body, "CommitOrAbort", endpoint);
    if (parsed.IsErr()) {
        return Result<TxnContext, Error>::Err(std::move(parsed).Error());
    }
    const auto& j = parsed.Value();
    if (auto err = ServerErrorFrom(j, "CommitOrAbort", endpoint)) {
        return Result<TxnContext, Error>::Err(std::move(*err));
    }

    TxnContext ctx = sent;
    if (j.contains("extensions") && j["extensions"].is_object() &&
        j["extensions"].contains("txn")) {
        auto returned = DecodeTxnContext(j["extensions"]["txn"]);
        if (returned.start_ts != 0) ctx.start_ts = returned.start_ts;
        ctx.commit_ts = returned.commit_ts;
        ctx.aborted = ctx.aborted || returned.aborted;
    }
    return Result<TxnContext, Error>::Ok(std::move(ctx));
}

Result<Jwt, Error> DecodeLoginResponse(std::string_view body,
                                       const std::string& endpoint) {
    auto parsed = ParseBody(body, "Login", endpoint);
    if (parsed.IsErr()) {
        return Result<Jwt, Error>::Err(std::move(parsed).Error());
    }
    const auto& j = parsed.Value();
    if (auto err = ServerErrorFrom(j, "Login", endpoint)) {
        // A rejected login is a credential problem unless the server said
        // otherwise (unavailable, retry...).
        if (err->category == ErrorCategory::Server) {
            err->category = ErrorCategory::Authentication;
        }
        return Result<Jwt, Error>::Err(std::move(*err));
    }

    Jwt jwt;
    if (j.contains("data")) {
        jwt.access_jwt = String(j["data"], "accessJWT");
        jwt.refresh_jwt = String(j["data"], "refreshJWT");
    }
    return Result<Jwt, Error>::Ok(std::move(jwt));
}

Result<Payload, Error> DecodeAlterResponse(std::string_view body,
                                           const std::string& endpoint) {
    auto parsed = ParseBody(body, "Alter", endpoint);
    if (parsed.IsErr()) {
        return Result<Payload, Error>::Err(std::move(parsed).Error());
    }
    const auto& j = parsed.Value();
    if (auto err = ServerErrorFrom(j, "Alter", endpoint)) {
        return Result<Payload, Error>::Err(std::move(*err));
    }
    Payload payload;
    if (j.contains("data")) {
        payload.data = j["data"].dump();
    }
    return Result<Payload, Error>::Ok(std::move(payload));
}

Result<std::string, Error> DecodeHealthVersion(std::string_view body,
                                               const std::string& endpoint) {
    auto parsed = ParseBody(body, "CheckVersion", endpoint);
    if (parsed.IsErr()) {
        return Result<std::string, Error>::Err(std::move(parsed).Error());
    }
    const auto& j = parsed.Value();
    const json* instance = &j;
    if (j.is_array()) {
        if (j.empty()) {
            instance = nullptr;
        } else {
            instance = &j[0];
        }
    }
    if (instance == nullptr || !instance->is_object() ||
        !instance->contains("version") || !(*instance)["version"].is_string()) {
        return Result<std::string, Error>::Err(Error{
            "CheckVersion", endpoint, std::nullopt,
            "Health response did not contain a version", std::nullopt,
            ErrorCategory::Internal});
    }
    return Result<std::string, Error>::Ok((*instance)["version"].get<std::string>());
}

} // namespace dgraph_client
