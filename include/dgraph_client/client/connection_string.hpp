#pragma once

#include <dgraph_client/client/client.hpp>
#include <dgraph_client/core/result.hpp>
#include <dgraph_client/core/types.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace dgraph_client {

// ---------------------------------------------------------------------------
// Connection strings:
//
//   dgraph://[user:password@]host:port[?sslmode=disable|verify-ca]
//            [&apikey=KEY | &bearertoken=TOKEN]
//
// User and password are percent-decoded. An API key or bearer token implies
// TLS.
// ---------------------------------------------------------------------------
struct ConnectionString {
    Endpoint endpoint;
    std::string user;
    std::string password;
    bool use_https = false;
    bool tls_verify = true;
    std::string api_key;
    std::string bearer_token;
};

[[nodiscard]] Result<ConnectionString, Error> ParseConnectionString(std::string_view text);

inline constexpr std::chrono::seconds kLoginTimeout{30};

/// Build a single-endpoint Client over HTTP and, when the string carries
/// credentials, log in (bounded by kLoginTimeout).
[[nodiscard]] Result<std::unique_ptr<Client>, Error> OpenClient(
    std::string_view connection_string, ClientOptions options = {});

} // namespace dgraph_client
