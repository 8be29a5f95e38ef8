#include <dgraph_client/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace dgraph_client {

namespace {

bool HasWhitespace(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

Result<uint16_t, std::string> ParsePort(std::string_view text) {
    if (text.empty()) {
        return Result<uint16_t, std::string>::Err("Port must not be empty");
    }
    if (text.size() > 5 || !std::all_of(text.begin(), text.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        return Result<uint16_t, std::string>::Err(
            "Port must be a number, got '" + std::string(text) + "'");
    }
    const int port = std::stoi(std::string(text));
    if (port < 1 || port > 65535) {
        return Result<uint16_t, std::string>::Err(
            "Port must be between 1 and 65535, got " + std::to_string(port));
    }
    return Result<uint16_t, std::string>::Ok(static_cast<uint16_t>(port));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Endpoint
// ---------------------------------------------------------------------------
Result<Endpoint, std::string> Endpoint::Create(std::string_view address) {
    if (address.empty()) {
        return Result<Endpoint, std::string>::Err("Endpoint must not be empty");
    }
    if (HasWhitespace(address)) {
        return Result<Endpoint, std::string>::Err(
            "Endpoint must not contain whitespace");
    }
    if (address.find("://") != std::string_view::npos ||
        address.find('/') != std::string_view::npos) {
        return Result<Endpoint, std::string>::Err(
            "Endpoint must be host:port without scheme or path, got '" +
            std::string(address) + "'");
    }

    std::string_view host;
    std::string_view port_text;
    if (address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string_view::npos || close + 1 >= address.size() ||
            address[close + 1] != ':') {
            return Result<Endpoint, std::string>::Err(
                "IPv6 endpoint must have the form [host]:port");
        }
        host = address.substr(1, close - 1);
        port_text = address.substr(close + 2);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string_view::npos) {
            return Result<Endpoint, std::string>::Err(
                "Endpoint must have the form host:port, got '" +
                std::string(address) + "'");
        }
        host = address.substr(0, colon);
        port_text = address.substr(colon + 1);
        if (host.find(':') != std::string_view::npos) {
            return Result<Endpoint, std::string>::Err(
                "IPv6 endpoint must have the form [host]:port");
        }
    }

    auto port = ParsePort(port_text);
    if (port.IsErr()) {
        return Result<Endpoint, std::string>::Err(port.Error());
    }
    return Create(host, port.Value());
}

Result<Endpoint, std::string> Endpoint::Create(std::string_view host, int port) {
    if (host.empty()) {
        return Result<Endpoint, std::string>::Err("Endpoint host must not be empty");
    }
    if (HasWhitespace(host)) {
        return Result<Endpoint, std::string>::Err(
            "Endpoint host must not contain whitespace");
    }
    if (port < 1 || port > 65535) {
        return Result<Endpoint, std::string>::Err(
            "Port must be between 1 and 65535, got " + std::to_string(port));
    }
    return Result<Endpoint, std::string>::Ok(
        Endpoint(std::string(host), static_cast<uint16_t>(port)));
}

std::string Endpoint::Value() const {
    if (host_.find(':') != std::string::npos) {
        return "[" + host_ + "]:" + std::to_string(port_);
    }
    return host_ + ":" + std::to_string(port_);
}

// ---------------------------------------------------------------------------
// ResponseFormat
// ---------------------------------------------------------------------------
const char* ResponseFormatName(ResponseFormat format) {
    switch (format) {
        case ResponseFormat::Json: return "json";
        case ResponseFormat::Rdf:  return "rdf";
    }
    return "json";
}

} // namespace dgraph_client
