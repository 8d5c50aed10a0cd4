#include <cinegraph/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace cinegraph {

namespace {

Error MakeUriError(std::string_view uri, const std::string& message) {
    return Error{"ParseHttpUri", std::string(uri), std::nullopt, message,
                 std::nullopt, ErrorCategory::InvalidArgument};
}

} // anonymous namespace

std::string UrlEncode(const std::string& value) {
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

std::string HttpEndpoint::BaseUrl() const {
    return (use_https ? "https://" : "http://") + host + ":" + std::to_string(port);
}

Result<HttpEndpoint, Error> ParseHttpUri(std::string_view uri) {
    HttpEndpoint endpoint;
    std::string_view rest;

    const auto scheme_end = uri.find("://");
    if (scheme_end == std::string_view::npos) {
        return Result<HttpEndpoint, Error>::Err(
            MakeUriError(uri, "Store URI must start with http:// or https://"));
    }
    const auto scheme = uri.substr(0, scheme_end);
    if (scheme == "http") {
        endpoint.use_https = false;
        endpoint.port = 7474;
    } else if (scheme == "https") {
        endpoint.use_https = true;
        endpoint.port = 7473;
    } else if (scheme == "bolt" || scheme == "neo4j" || scheme == "bolt+s" ||
               scheme == "neo4j+s") {
        return Result<HttpEndpoint, Error>::Err(MakeUriError(
            uri, "Bolt URIs are not supported, use the HTTP endpoint "
                 "(e.g. http://localhost:7474)"));
    } else {
        return Result<HttpEndpoint, Error>::Err(
            MakeUriError(uri, "Unsupported URI scheme '" + std::string(scheme) + "'"));
    }

    rest = uri.substr(scheme_end + 3);
    if (!rest.empty() && rest.back() == '/') {
        rest.remove_suffix(1);
    }
    if (rest.find('/') != std::string_view::npos) {
        return Result<HttpEndpoint, Error>::Err(
            MakeUriError(uri, "Store URI must not contain a path"));
    }

    const auto colon = rest.rfind(':');
    auto host = rest.substr(0, colon);
    if (colon != std::string_view::npos) {
        const auto port_str = rest.substr(colon + 1);
        if (port_str.empty() || port_str.size() > 5) {
            return Result<HttpEndpoint, Error>::Err(MakeUriError(uri, "Invalid port"));
        }
        unsigned long port = 0;
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return Result<HttpEndpoint, Error>::Err(MakeUriError(uri, "Invalid port"));
            }
            port = port * 10 + static_cast<unsigned long>(c - '0');
        }
        if (port == 0 || port > 65535) {
            return Result<HttpEndpoint, Error>::Err(
                MakeUriError(uri, "Port out of range: " + std::string(port_str)));
        }
        endpoint.port = static_cast<uint16_t>(port);
    }

    if (host.empty()) {
        return Result<HttpEndpoint, Error>::Err(MakeUriError(uri, "Missing host"));
    }
    endpoint.host = std::string(host);
    return Result<HttpEndpoint, Error>::Ok(std::move(endpoint));
}

} // namespace cinegraph
