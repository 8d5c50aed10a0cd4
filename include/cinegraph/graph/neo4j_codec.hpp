#pragma once

#include <cinegraph/core/result.hpp>
#include <cinegraph/graph/cypher.hpp>
#include <cinegraph/graph/graph_model.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// Neo4j HTTP transactional API codec (POST /db/<name>/tx/commit).
//
// Request:  {"statements":[{"statement": "...", "parameters": {...}}]}
// Response: {"results":[{"columns":[...],"data":[{"row":[...]}, ...]}],
//            "errors":[{"code": "...", "message": "..."}]}
//
// Pure functions, no I/O. Shared by Neo4jGraphStore and its tests.
// ---------------------------------------------------------------------------

/// Serialize one statement with its parameters as the commit request body.
std::string BuildTransactionRequest(const CypherStatement& statement);

/// Decode a commit response body into rows keyed by column name.
/// Columns listed in statement.node_columns are decoded as Node values.
/// A non-empty "errors" array becomes an Error classified by its code.
[[nodiscard]] Result<std::vector<Row>, Error> ParseTransactionResponse(
    std::string_view body,
    const CypherStatement& statement,
    const std::string& endpoint);

/// Classify a Neo4j status code such as "Neo.ClientError.Security.Unauthorized".
///   *.Security.*          -> StoreUnavailable
///   *Timeout* / *.Timed*  -> Timeout
///   Neo.TransientError.*  -> StoreUnavailable
///   anything else         -> Query
ErrorCategory CategoryFromNeo4jCode(std::string_view code);

} // namespace cinegraph
