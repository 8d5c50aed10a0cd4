#include <cinegraph/graph/neo4j_store.hpp>
#include <cinegraph/graph/cypher.hpp>
#include <cinegraph/graph/neo4j_codec.hpp>
#include <cinegraph/graph/session_pool.hpp>
#include <cinegraph/core/log.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>

namespace cinegraph {

namespace {

using Clock = std::chrono::steady_clock;

// httplib reports an expired read timeout and a peer reset mid-response both
// as Error::Read; only the former is a Timeout.
ErrorCategory CategoryFromHttpTransportError(httplib::Error error, bool deadline_passed) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        case httplib::Error::Read:
            return deadline_passed ? ErrorCategory::Timeout : ErrorCategory::StoreUnavailable;
        default:
            return ErrorCategory::StoreUnavailable;
    }
}

// Neo4j answers 401/403 with {"errors":[{"code": ...}]}; surface the code.
std::optional<std::string> ExtractStoreErrorCode(const std::string& body) {
    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
    auto it = doc.find("errors");
    if (it == doc.end() || !it->is_array() || it->empty()) return std::nullopt;
    const auto& first = it->front();
    auto code = first.find("code");
    if (code == first.end() || !code->is_string()) return std::nullopt;
    return code->get<std::string>();
}

void LogResponseBody(int status, const std::string& body) {
    LogDebug("store", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("store", "  < body: " + body);
        } else {
            LogDebug("store", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl - pimpl body holding the endpoint, credentials and client pool.
// ---------------------------------------------------------------------------
struct Neo4jGraphStore::Impl {
    HttpEndpoint endpoint;
    std::string database;
    std::string commit_path;
    Neo4jStoreOptions options;
    SessionPool<httplib::Client> pool;

    Impl(const HttpEndpoint& ep,
         const DatabaseName& db,
         const std::string& user,
         const std::string& password,
         const Neo4jStoreOptions& opts)
        : endpoint(ep),
          database(db.Value()),
          commit_path("/db/" + db.Value() + "/tx/commit"),
          options(opts),
          pool(opts.pool_size, [ep, user, password, opts]() {
              return MakeClient(ep, user, password, opts);
          }) {}

    static Result<std::unique_ptr<httplib::Client>, Error> MakeClient(
        const HttpEndpoint& ep,
        const std::string& user,
        const std::string& password,
        const Neo4jStoreOptions& opts) {
        auto client = std::make_unique<httplib::Client>(ep.BaseUrl());
        if (!client->is_valid()) {
            return Result<std::unique_ptr<httplib::Client>, Error>::Err(Error{
                "ConnectStore", ep.BaseUrl(), std::nullopt,
                "Could not create an HTTP client for the store URI",
                std::nullopt, ErrorCategory::StoreUnavailable});
        }
        client->set_basic_auth(user, password);
        client->set_connection_timeout(opts.connect_timeout);
        client->set_keep_alive(true);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (ep.use_https && opts.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
#endif
        return Result<std::unique_ptr<httplib::Client>, Error>::Ok(std::move(client));
    }

    std::chrono::milliseconds EffectiveTimeout(const QueryOptions& qo) const {
        return qo.timeout.count() > 0 ? qo.timeout : options.default_timeout;
    }

    // Lease a client, POST the statement, decode rows. The lease is returned
    // to the pool when this function exits, whatever the outcome.
    Result<std::vector<Row>, Error> Run(const std::string& operation,
                                        const CypherStatement& statement,
                                        const QueryOptions& qo) {
        using R = Result<std::vector<Row>, Error>;

        const auto timeout = EffectiveTimeout(qo);
        const auto deadline = Clock::now() + timeout;
        const auto acquire_wait = std::min(timeout, options.acquire_timeout);

        auto lease = pool.Acquire(acquire_wait);
        if (lease.IsErr()) {
            auto err = std::move(lease).Error();
            err.endpoint = endpoint.BaseUrl();
            return R::Err(std::move(err));
        }
        auto session = std::move(lease).Value();

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            return R::Err(Error{operation, endpoint.BaseUrl(), std::nullopt,
                                "Deadline of " + std::to_string(timeout.count()) +
                                    "ms elapsed before the request was sent",
                                std::nullopt, ErrorCategory::Timeout});
        }
        session->set_read_timeout(remaining);
        session->set_write_timeout(remaining);

        httplib::Headers headers{{"Accept", "application/json;charset=UTF-8"}};
        LogInfo("store", "POST " + commit_path);
        LogDebug("store", "  cypher: " + statement.text);

        const auto sent_at = Clock::now();
        auto res = session->Post(commit_path, headers,
                                 BuildTransactionRequest(statement),
                                 "application/json");
        if (!res) {
            const auto http_error = res.error();
            const bool deadline_passed = Clock::now() >= sent_at + remaining;
            LogWarn("store", "request failed: " + httplib::to_string(http_error));
            return R::Err(Error{operation, endpoint.BaseUrl(), std::nullopt,
                                "HTTP request failed: " + httplib::to_string(http_error),
                                std::nullopt,
                                CategoryFromHttpTransportError(http_error,
                                                               deadline_passed)});
        }
        LogResponseBody(res->status, res->body);

        if (res->status != 200) {
            auto err = Error::FromHttpStatus(operation, commit_path, res->status,
                                             ExtractStoreErrorCode(res->body));
            LogWarn("store", err.ToString());
            return R::Err(std::move(err));
        }

        auto rows = ParseTransactionResponse(res->body, statement, commit_path);
        if (rows.IsErr()) {
            auto err = std::move(rows).Error();
            if (err.operation == "ExecuteQuery") {
                err.operation = operation;
            }
            LogWarn("store", err.ToString());
            return R::Err(std::move(err));
        }
        LogDebug("store", "  rows: " + std::to_string(rows.Value().size()));
        return rows;
    }
};

Neo4jGraphStore::Neo4jGraphStore(const HttpEndpoint& endpoint,
                                 const DatabaseName& database,
                                 const std::string& user,
                                 const std::string& password,
                                 const Neo4jStoreOptions& options)
    : impl_(std::make_unique<Impl>(endpoint, database, user, password, options)) {
    LogDebug("store", "neo4j store " + Describe() + " (pool " +
                      std::to_string(impl_->pool.Capacity()) + ")");
}

Neo4jGraphStore::~Neo4jGraphStore() = default;

Result<std::vector<Row>, Error> Neo4jGraphStore::Execute(
    const GraphQuery& query,
    const QueryOptions& options) {
    LogDebug("store", "execute " + DescribeQuery(query));
    return impl_->Run("ExecuteQuery", BuildCypher(query), options);
}

Result<void, Error> Neo4jGraphStore::Ping(const QueryOptions& options) {
    auto rows = impl_->Run("Ping", BuildPingCypher(), options);
    if (rows.IsErr()) {
        return Result<void, Error>::Err(std::move(rows).Error());
    }
    if (rows.Value().size() != 1) {
        return Result<void, Error>::Err(Error{
            "Ping", impl_->commit_path, std::nullopt,
            "Unexpected ping response", std::nullopt, ErrorCategory::Query});
    }
    return Result<void, Error>::Ok();
}

std::string Neo4jGraphStore::Describe() const {
    return impl_->endpoint.BaseUrl() + "/db/" + impl_->database;
}

const std::string& Neo4jGraphStore::CommitPath() const {
    return impl_->commit_path;
}

} // namespace cinegraph
