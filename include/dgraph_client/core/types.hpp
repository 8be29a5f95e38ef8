#pragma once

#include <dgraph_client/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace dgraph_client {

// ---------------------------------------------------------------------------
// Endpoint: validated "host:port" address of a Dgraph alpha.
//
// Rules:
//   - host is non-empty; IPv6 literals are written in brackets ([::1]:8080)
//   - port is 1..65535
//   - no scheme, path or whitespace
// ---------------------------------------------------------------------------
class Endpoint {
public:
    static Result<Endpoint, std::string> Create(std::string_view address);
    static Result<Endpoint, std::string> Create(std::string_view host, int port);

    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }

    /// "host:port", with brackets kept for IPv6 hosts.
    [[nodiscard]] std::string Value() const;

    bool operator==(const Endpoint& other) const {
        return host_ == other.host_ && port_ == other.port_;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }

private:
    Endpoint(std::string host, uint16_t port)
        : host_(std::move(host)), port_(port) {}
    std::string host_;
    uint16_t port_;
};

// ---------------------------------------------------------------------------
// ResponseFormat: encoding of query results.
// ---------------------------------------------------------------------------
enum class ResponseFormat {
    Json,
    Rdf,
};

[[nodiscard]] const char* ResponseFormatName(ResponseFormat format);

} // namespace dgraph_client
