#pragma once

#include <cinegraph/graph/graph_query.hpp>

#include <map>
#include <string>

namespace cinegraph {

// ---------------------------------------------------------------------------
// CypherStatement - a parameterized Cypher statement for one GraphQuery.
//
// All user-supplied values travel as parameters; the statement text only
// ever contains relationship type names from the closed Relationship set.
// node_columns maps each column that carries a node map to the label the
// decoder should give it (Neo4j returns map projections without labels).
// ---------------------------------------------------------------------------
struct CypherStatement {
    std::string text;
    std::map<std::string, std::string> parameters;
    std::map<std::string, std::string> node_columns;
};

/// Translate a structured query into the Cypher the Neo4j adapter sends.
CypherStatement BuildCypher(const GraphQuery& query);

/// The statement used by IGraphStore::Ping.
CypherStatement BuildPingCypher();

} // namespace cinegraph
