#include <dgraph_client/client/connection_string.hpp>

#include <dgraph_client/core/log.hpp>
#include <dgraph_client/core/url.hpp>
#include <dgraph_client/transport/http_stub.hpp>

namespace dgraph_client {

namespace {

Error MakeConnectionStringError(const std::string& message) {
    return Error{"ParseConnectionString", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

Result<ConnectionString, Error> Fail(const std::string& message) {
    return Result<ConnectionString, Error>::Err(MakeConnectionStringError(message));
}

} // anonymous namespace

Result<ConnectionString, Error> ParseConnectionString(std::string_view text) {
    constexpr std::string_view kScheme = "dgraph://";
    if (text.substr(0, kScheme.size()) != kScheme) {
        return Fail("Invalid connection string: scheme must be 'dgraph'");
    }
    auto rest = text.substr(kScheme.size());

    std::string_view query;
    auto qmark = rest.find('?');
    if (qmark != std::string_view::npos) {
        query = rest.substr(qmark + 1);
        rest = rest.substr(0, qmark);
    }
    if (!rest.empty() && rest.back() == '/') {
        rest.remove_suffix(1);
    }

    // -- user:password@ --
    std::string user;
    std::string password;
    auto at = rest.rfind('@');
    if (at != std::string_view::npos) {
        auto userinfo = rest.substr(0, at);
        rest = rest.substr(at + 1);
        auto colon = userinfo.find(':');
        auto user_part = userinfo.substr(0, colon);
        auto decoded_user = UrlDecode(user_part);
        if (decoded_user.IsErr()) {
            return Fail("Invalid connection string: " + decoded_user.Error());
        }
        user = std::move(decoded_user).Value();
        if (colon != std::string_view::npos) {
            auto decoded_password = UrlDecode(userinfo.substr(colon + 1));
            if (decoded_password.IsErr()) {
                return Fail("Invalid connection string: " + decoded_password.Error());
            }
            password = std::move(decoded_password).Value();
        }
    }

    // -- host:port --
    std::string_view host = rest;
    std::string_view port_text;
    if (!rest.empty() && rest.front() == '[') {
        auto close = rest.find(']');
        if (close == std::string_view::npos) {
            return Fail("Invalid connection string: hostname required");
        }
        host = rest.substr(1, close - 1);
        auto after = rest.substr(close + 1);
        if (!after.empty() && after.front() == ':') {
            port_text = after.substr(1);
        }
    } else {
        auto colon = rest.rfind(':');
        if (colon != std::string_view::npos) {
            host = rest.substr(0, colon);
            port_text = rest.substr(colon + 1);
        }
    }
    if (host.empty()) {
        return Fail("Invalid connection string: hostname required");
    }
    if (port_text.empty()) {
        return Fail("Invalid connection string: port required");
    }
    int port = 0;
    try {
        port = std::stoi(std::string(port_text));
    } catch (const std::exception&) {
        return Fail("Invalid connection string: port must be a number, got '" +
                    std::string(port_text) + "'");
    }
    auto endpoint = Endpoint::Create(host, port);
    if (endpoint.IsErr()) {
        return Fail("Invalid connection string: " + endpoint.Error());
    }

    if (!user.empty() && password.empty()) {
        return Fail("Invalid connection string: password required when username is provided");
    }

    ConnectionString parsed{std::move(endpoint).Value(), std::move(user),
                            std::move(password)};

    // -- params --
    auto params = ParseQueryString(query);
    if (params.IsErr()) {
        return Fail("Invalid connection string: " + params.Error());
    }
    const auto& values = params.Value();

    if (auto it = values.find("sslmode"); it != values.end()) {
        if (it->second == "disable") {
            parsed.use_https = false;
        } else if (it->second == "verify-ca") {
            parsed.use_https = true;
            parsed.tls_verify = true;
        } else if (it->second == "require") {
            return Fail("sslmode=require is not supported, use verify-ca");
        } else {
            return Fail("Invalid sslmode: " + it->second);
        }
    }

    const bool has_api_key = values.count("apikey") > 0;
    const bool has_bearer = values.count("bearertoken") > 0;
    if (has_api_key && has_bearer) {
        return Fail("apikey and bearertoken cannot both be provided");
    }
    if (has_api_key) {
        parsed.api_key = values.at("apikey");
        parsed.use_https = true;
    } else if (has_bearer) {
        parsed.bearer_token = values.at("bearertoken");
        parsed.use_https = true;
    }

    return Result<ConnectionString, Error>::Ok(std::move(parsed));
}

Result<std::unique_ptr<Client>, Error> OpenClient(std::string_view connection_string,
                                                  ClientOptions options) {
    auto parsed = ParseConnectionString(connection_string);
    if (parsed.IsErr()) {
        return Result<std::unique_ptr<Client>, Error>::Err(std::move(parsed).Error());
    }
    const auto& conn = parsed.Value();

    HttpStubOptions stub_options;
    stub_options.use_https = conn.use_https;
    stub_options.tls_verify = conn.tls_verify;
    stub_options.api_key = conn.api_key;
    stub_options.bearer_token = conn.bearer_token;

    std::vector<std::unique_ptr<IDgraphStub>> stubs;
    stubs.push_back(std::make_unique<HttpDgraphStub>(conn.endpoint, stub_options));

    auto client = Client::Create(std::move(stubs), std::move(options));
    if (client.IsErr() || conn.user.empty()) {
        return client;
    }

    LogInfo("client", "Logging in to " + conn.endpoint.Value());
    CallOptions login_options;
    login_options.timeout = kLoginTimeout;
    auto& handle = client.Value();
    auto login = handle->Credentials().Login(handle->AnyStub(), conn.user,
                                             conn.password, 0, login_options);
    if (login.IsErr()) {
        return Result<std::unique_ptr<Client>, Error>::Err(std::move(login).Error());
    }
    return client;
}

} // namespace dgraph_client
