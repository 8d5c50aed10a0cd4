#pragma once

#include <cinegraph/core/result.hpp>
#include <cinegraph/graph/graph_snapshot.hpp>

#include <string>
#include <string_view>

namespace cinegraph {

// ---------------------------------------------------------------------------
// Graph dataset loader (YAML).
//
//   genres: [Sci-Fi, Drama]          # optional, genres are also collected
//   movies:                          # from each movie's `genres` list
//     - title: Inception
//       year: 2010
//       rating: 8.8                  # optional
//       tagline: "..."               # optional
//       description: "..."           # optional
//       genres: [Sci-Fi, Thriller]
//   people:
//     - name: Leonardo DiCaprio
//       acted_in: [Inception, Titanic]
//       directed: []
//
// Every error is InvalidArgument with operation "LoadGraphDataset".
// ---------------------------------------------------------------------------

/// Load a dataset file from disk.
[[nodiscard]] Result<GraphSnapshot, Error> LoadGraphDataset(std::string_view file_path);

/// Parse a dataset from YAML text (used by tests and LoadGraphDataset).
[[nodiscard]] Result<GraphSnapshot, Error> ParseGraphDataset(std::string_view yaml_text);

} // namespace cinegraph
