#include <cinegraph/core/result.hpp>

#include <nlohmann/json.hpp>

namespace cinegraph {

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            std::optional<std::string> store_error) {
    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Query;
            message = "Bad request";
            break;
        case 401:
            category = ErrorCategory::StoreUnavailable;
            message = "Authentication failed, check the store user and password";
            break;
        case 403:
            category = ErrorCategory::StoreUnavailable;
            message = "Forbidden, the store user lacks read access";
            break;
        case 404:
            // A missing endpoint means a wrong URI or database, not a missing movie.
            category = ErrorCategory::StoreUnavailable;
            message = "Not found, check the store URI and database name";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::Timeout;
            message = "Too many requests, retry later";
            break;
        case 500:
            category = ErrorCategory::StoreUnavailable;
            message = "Store internal error";
            break;
        case 502:
        case 503:
            category = ErrorCategory::StoreUnavailable;
            message = "Store unavailable";
            break;
        case 504:
            category = ErrorCategory::Timeout;
            message = "Store gateway timed out";
            break;
        default:
            category = ErrorCategory::Internal;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, std::move(store_error), category};
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!endpoint.empty()) {
        body["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        body["http_status"] = *http_status;
    }
    body["message"] = message;
    if (store_error.has_value() && !store_error->empty()) {
        body["store_error"] = *store_error;
    }
    body["exit_code"] = ExitCode();
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace cinegraph
