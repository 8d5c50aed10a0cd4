#pragma once

#include <cinegraph/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace cinegraph {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// ---------------------------------------------------------------------------
// HttpEndpoint - scheme/host/port split of a store URI.
// ---------------------------------------------------------------------------
struct HttpEndpoint {
    std::string host;
    uint16_t port = 7474;
    bool use_https = false;

    /// "http://host:port" form used by httplib::Client and in log lines.
    [[nodiscard]] std::string BaseUrl() const;
};

// Parse "http://host[:port]" or "https://host[:port]". A trailing '/' is
// accepted. Missing ports default to Neo4j's HTTP (7474) / HTTPS (7473) ports.
// Bolt URIs (bolt://, neo4j://) are rejected: the adapter speaks HTTP only.
Result<HttpEndpoint, Error> ParseHttpUri(std::string_view uri);

} // namespace cinegraph
