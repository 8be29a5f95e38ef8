#include <dgraph_client/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace dgraph_client {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

Result<std::string, std::string> UrlDecode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '%') {
            out += value[i];
            continue;
        }
        if (i + 2 >= value.size()) {
            return Result<std::string, std::string>::Err(
                "Truncated percent escape in '" + std::string(value) + "'");
        }
        const int hi = HexValue(value[i + 1]);
        const int lo = HexValue(value[i + 2]);
        if (hi < 0 || lo < 0) {
            return Result<std::string, std::string>::Err(
                "Invalid percent escape in '" + std::string(value) + "'");
        }
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return Result<std::string, std::string>::Ok(std::move(out));
}

std::string BuildQueryString(
    const std::vector<std::pair<std::string, std::string>>& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        out += out.empty() ? '?' : '&';
        out += UrlEncode(key);
        out += '=';
        out += UrlEncode(value);
    }
    return out;
}

Result<std::map<std::string, std::string>, std::string> ParseQueryString(
    std::string_view query) {
    std::map<std::string, std::string> out;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        auto key = UrlDecode(pair.substr(0, eq));
        if (key.IsErr()) {
            return Result<std::map<std::string, std::string>, std::string>::Err(key.Error());
        }
        std::string value;
        if (eq != std::string_view::npos) {
            auto decoded = UrlDecode(pair.substr(eq + 1));
            if (decoded.IsErr()) {
                return Result<std::map<std::string, std::string>, std::string>::Err(
                    decoded.Error());
            }
            value = std::move(decoded).Value();
        }
        out[std::move(key).Value()] = std::move(value);
    }
    return Result<std::map<std::string, std::string>, std::string>::Ok(std::move(out));
}

} // namespace dgraph_client
