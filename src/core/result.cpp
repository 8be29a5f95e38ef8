#include <dgraph_client/core/result.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <string_view>

namespace dgraph_client {

namespace {

bool ContainsCi(std::string_view haystack, std::string_view needle) {
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

// Dgraph reports failures as {"errors":[{"message":..,"extensions":{"code":..}}]}.
// Plain-text bodies are used verbatim.
struct ServerErrorBody {
    std::optional<std::string> message;
    std::optional<std::string> code;
};

ServerErrorBody ExtractServerError(const std::string& body) {
    ServerErrorBody out;
    if (body.empty()) return out;

    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        out.message = body;
        return out;
    }
    if (j.is_object() && j.contains("errors") && j["errors"].is_array() &&
        !j["errors"].empty()) {
        const auto& first = j["errors"][0];
        if (first.contains("message") && first["message"].is_string()) {
            out.message = first["message"].get<std::string>();
        }
        if (first.contains("extensions") && first["extensions"].is_object()) {
            const auto& ext = first["extensions"];
            if (ext.contains("code") && ext["code"].is_string()) {
                out.code = ext["code"].get<std::string>();
            }
        }
    }
    return out;
}

} // anonymous namespace

ErrorCategory ClassifyServerError(const std::string& message,
                                  std::optional<int> http_status) {
    if (ContainsCi(message, "Token is expired")) {
        return ErrorCategory::SessionExpired;
    }
    if (ContainsCi(message, "Transaction has been aborted") ||
        message.find("ABORTED") != std::string::npos ||
        http_status == 409) {
        return ErrorCategory::Aborted;
    }
    if (ContainsCi(message, "Please retry") ||
        ContainsCi(message, "not ready to accept requests") ||
        http_status == 429) {
        return ErrorCategory::Retriable;
    }
    if (http_status == 502 || http_status == 503 || http_status == 504) {
        return ErrorCategory::Connection;
    }
    if (http_status == 401 || http_status == 403) {
        return ErrorCategory::Authentication;
    }
    return ErrorCategory::Server;
}

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto server = ExtractServerError(response_body);

    std::string message;
    if (server.message.has_value() && !server.message->empty()) {
        message = *server.message;
    } else {
        switch (status_code) {
            case 400: message = "Bad request"; break;
            case 401: message = "Authentication failed, check credentials or run 'dgraph-cli login'"; break;
            case 403: message = "Forbidden"; break;
            case 404: message = "Not found"; break;
            case 409: message = kAbortedMessage; break;
            case 429: message = "Too many requests, please retry later"; break;
            case 500: message = "Dgraph server internal error"; break;
            case 502:
            case 503:
            case 504: message = "Dgraph server unavailable"; break;
            default:  message = "Unexpected HTTP " + std::to_string(status_code); break;
        }
    }

    auto category = ClassifyServerError(message, status_code);
    return Error{operation, endpoint, status_code, message, server.code, category};
}

std::string Error::ToJson() const {
    nlohmann::json inner;
    inner["category"] = CategoryName();
    inner["operation"] = operation;
    if (!endpoint.empty()) {
        inner["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        inner["http_status"] = *http_status;
    }
    inner["message"] = message;
    if (server_code.has_value() && !server_code->empty()) {
        inner["server_code"] = *server_code;
    }
    inner["exit_code"] = ExitCode();
    nlohmann::json out;
    out["error"] = std::move(inner);
    return out.dump();
}

} // namespace dgraph_client
