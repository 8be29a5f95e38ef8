#include <dgraph_client/transport/http_stub.hpp>

#include <dgraph_client/core/log.hpp>
#include <dgraph_client/core/url.hpp>
#include <dgraph_client/transport/json_codec.hpp>

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <utility>
#include <vector>

namespace dgraph_client {

namespace {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool IsSensitiveHeader(std::string_view key) {
    auto lower_key = ToLower(key);
    return lower_key == "cookie" ||
           lower_key == "authorization" ||
           lower_key == "x-dgraph-accesstoken";
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  > " + k + ": <redacted>");
        } else {
            LogDebug("http", "  > " + k + ": " + v);
        }
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: endpoint, options and the POST/GET helpers.
// ---------------------------------------------------------------------------
struct HttpDgraphStub::Impl {
    Endpoint endpoint;
    HttpStubOptions options;
    std::string base_url;
    std::atomic<bool> closed{false};

    Impl(const Endpoint& ep, const HttpStubOptions& opts)
        : endpoint(ep), options(opts) {
        base_url = (opts.use_https ? "https://" : "http://") + ep.Value();
    }

    std::unique_ptr<httplib::Client> MakeClient(const CallOptions& call) const {
        auto client = std::make_unique<httplib::Client>(base_url);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(call.timeout.value_or(options.read_timeout));
        client->set_write_timeout(call.timeout.value_or(options.read_timeout));
        if (options.use_https && !options.tls_verify) {
            client->enable_server_certificate_verification(false);
        }
        return client;
    }

    httplib::Headers BuildHeaders(const CallOptions& call) const {
        httplib::Headers hdrs;
        hdrs.emplace("Accept", "application/json");
        if (!options.api_key.empty()) {
            hdrs.emplace("Authorization", options.api_key);
        } else if (!options.bearer_token.empty()) {
            hdrs.emplace("Authorization", "Bearer " + options.bearer_token);
        }
        for (const auto& [key, value] : call.metadata) {
            if (ToLower(key) == kAccessTokenMetadataKey) {
                hdrs.emplace("X-Dgraph-AccessToken", value);
            } else {
                hdrs.emplace(key, value);
            }
        }
        return hdrs;
    }

    Error ClosedError(const std::string& operation) const {
        return Error{operation, endpoint.Value(), std::nullopt,
                     "Stub has been closed", std::nullopt,
                     ErrorCategory::Connection};
    }

    // POST and return the raw body of a 2xx response.
    Result<std::string, Error> DoPost(const std::string& operation,
                                      const std::string& path,
                                      const QueryParams& params,
                                      const std::string& body,
                                      const std::string& content_type,
                                      const CallOptions& call) const {
        if (closed.load()) {
            return Result<std::string, Error>::Err(ClosedError(operation));
        }
        auto target = path + BuildQueryString(params);
        auto hdrs = BuildHeaders(call);
        LogInfo("http", "POST " + target);
        LogRequestHeaders(hdrs);

        auto client = MakeClient(call);
        auto res = client->Post(target, hdrs, body, content_type);
        return Finish(operation, std::move(res));
    }

    Result<std::string, Error> DoGet(const std::string& operation,
                                     const std::string& path,
                                     const CallOptions& call) const {
        if (closed.load()) {
            return Result<std::string, Error>::Err(ClosedError(operation));
        }
        auto hdrs = BuildHeaders(call);
        LogInfo("http", "GET " + path);
        LogRequestHeaders(hdrs);

        auto client = MakeClient(call);
        auto res = client->Get(path, hdrs);
        return Finish(operation, std::move(res));
    }

    Result<std::string, Error> Finish(const std::string& operation,
                                      httplib::Result res) const {
        if (!res) {
            const auto http_error = res.error();
            return Result<std::string, Error>::Err(Error{
                operation, endpoint.Value(), std::nullopt,
                "HTTP request failed: " + httplib::to_string(http_error),
                std::nullopt, CategoryFromHttpTransportError(http_error)});
        }
        LogResponse(res->status, res->body);
        if (res->status < 200 || res->status >= 300) {
            return Result<std::string, Error>::Err(Error::FromHttpStatus(
                operation, endpoint.Value(), res->status, res->body));
        }
        return Result<std::string, Error>::Ok(std::move(res->body));
    }
};

// ---------------------------------------------------------------------------
// HttpDgraphStub
// ---------------------------------------------------------------------------
HttpDgraphStub::HttpDgraphStub(const Endpoint& endpoint,
                               const HttpStubOptions& options)
    : impl_(std::make_unique<Impl>(endpoint, options)) {}

HttpDgraphStub::~HttpDgraphStub() = default;

Result<Response, Error> HttpDgraphStub::Query(const Request& request,
                                              const CallOptions& options) {
    QueryParams params;
    if (request.start_ts != 0) {
        params.emplace_back("startTs", std::to_string(request.start_ts));
    }
    if (!request.hash.empty()) {
        params.emplace_back("hash", request.hash);
    }

    if (request.mutations.empty()) {
        if (request.read_only) params.emplace_back("ro", "true");
        if (request.best_effort) params.emplace_back("be", "true");
        if (request.resp_format == ResponseFormat::Rdf) {
            params.emplace_back("respFormat", "rdf");
        }
        auto body = impl_->DoPost("Query", "/query", params,
                                  EncodeQueryBody(request), "application/json",
                                  options);
        if (body.IsErr()) {
            return Result<Response, Error>::Err(std::move(body).Error());
        }
        return DecodeResponse(body.Value(), request.resp_format, "Query",
                              impl_->endpoint.Value());
    }

    auto encoded = EncodeMutationBody(request);
    if (encoded.IsErr()) {
        return Result<Response, Error>::Err(std::move(encoded).Error());
    }
    if (request.commit_now) {
        params.emplace_back("commitNow", "true");
    }
    auto body = impl_->DoPost("Mutate", "/mutate", params,
                              encoded.Value().body, encoded.Value().content_type,
                              options);
    if (body.IsErr()) {
        return Result<Response, Error>::Err(std::move(body).Error());
    }
    return DecodeResponse(body.Value(), ResponseFormat::Json, "Mutate",
                          impl_->endpoint.Value());
}

Result<TxnContext, Error> HttpDgraphStub::CommitOrAbort(const TxnContext& ctx,
                                                        const CallOptions& options) {
    QueryParams params;
    params.emplace_back("startTs", std::to_string(ctx.start_ts));
    if (!ctx.hash.empty()) {
        params.emplace_back("hash", ctx.hash);
    }
    if (ctx.aborted) {
        params.emplace_back("abort", "true");
    }
    auto body = impl_->DoPost("CommitOrAbort", "/commit", params,
                              EncodeCommitBody(ctx), "application/json", options);
    if (body.IsErr()) {
        return Result<TxnContext, Error>::Err(std::move(body).Error());
    }
    return DecodeCommitResponse(body.Value(), ctx, impl_->endpoint.Value());
}

Result<Jwt, Error> HttpDgraphStub::Login(const LoginRequest& request,
                                         const CallOptions& options) {
    auto body = impl_->DoPost("Login", "/login", {}, EncodeLoginBody(request),
                              "application/json", options);
    if (body.IsErr()) {
        auto err = std::move(body).Error();
        if (err.category == ErrorCategory::Server) {
            err.category = ErrorCategory::Authentication;
        }
        return Result<Jwt, Error>::Err(std::move(err));
    }
    return DecodeLoginResponse(body.Value(), impl_->endpoint.Value());
}

Result<Payload, Error> HttpDgraphStub::Alter(const Operation& operation,
                                             const CallOptions& options) {
    QueryParams params;
    if (operation.run_in_background) {
        params.emplace_back("runInBackground", "true");
    }
    auto encoded = EncodeAlterBody(operation);
    auto body = impl_->DoPost("Alter", "/alter", params, encoded.body,
                              encoded.content_type, options);
    if (body.IsErr()) {
        return Result<Payload, Error>::Err(std::move(body).Error());
    }
    return DecodeAlterResponse(body.Value(), impl_->endpoint.Value());
}

Result<std::string, Error> HttpDgraphStub::CheckVersion(const CallOptions& options) {
    auto body = impl_->DoGet("CheckVersion", "/health", options);
    if (body.IsErr()) {
        return Result<std::string, Error>::Err(std::move(body).Error());
    }
    return DecodeHealthVersion(body.Value(), impl_->endpoint.Value());
}

std::string HttpDgraphStub::Target() const {
    return impl_->endpoint.Value();
}

void HttpDgraphStub::Close() {
    impl_->closed.store(true);
}

} // namespace dgraph_client
