#pragma once

#include <dgraph_client/core/result.hpp>

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dgraph_client {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// Reverse of UrlEncode. '+' is left as is. Fails on truncated or non-hex
// escapes.
Result<std::string, std::string> UrlDecode(std::string_view value);

// Build "?k1=v1&k2=v2" from ordered pairs (values are encoded). Returns an
// empty string for no params.
std::string BuildQueryString(const std::vector<std::pair<std::string, std::string>>& params);

// Split "a=1&b=2" into a map. Keys and values are decoded; a key without
// '=' maps to "".
Result<std::map<std::string, std::string>, std::string> ParseQueryString(
    std::string_view query);

} // namespace dgraph_client
