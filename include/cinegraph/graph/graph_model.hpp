#pragma once

#include <cinegraph/core/result.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cinegraph {

// ---------------------------------------------------------------------------
// Relationship - typed, directed edges of the movie graph.
//
//   ACTED_IN : Person -> Movie
//   DIRECTED : Person -> Movie
//   IN_GENRE : Movie  -> Genre
// ---------------------------------------------------------------------------
enum class Relationship {
    ActedIn,
    Directed,
    InGenre,
};

/// Store-side relationship type name ("ACTED_IN", "DIRECTED", "IN_GENRE").
const char* RelationshipType(Relationship rel);

/// Label of the node on the non-movie end of the relationship ("Person"/"Genre").
const char* CounterpartLabel(Relationship rel);

/// True when the relationship points from the counterpart into the Movie.
bool PointsIntoMovie(Relationship rel);

// ---------------------------------------------------------------------------
// Node - a node's label plus its scalar attribute bag.
// ---------------------------------------------------------------------------
using PropertyValue = std::variant<std::monostate, int64_t, double, std::string>;

struct Node {
    std::string label;
    std::map<std::string, PropertyValue> properties;

    [[nodiscard]] std::optional<std::string> GetString(const std::string& key) const;
    [[nodiscard]] std::optional<int64_t> GetInt(const std::string& key) const;
    /// Integers widen to double; stores may return 8 for a rating of 8.0.
    [[nodiscard]] std::optional<double> GetDouble(const std::string& key) const;

    bool operator==(const Node& other) const {
        return label == other.label && properties == other.properties;
    }
};

// ---------------------------------------------------------------------------
// Row - one result row: column name -> node, scalar or list of names.
// ---------------------------------------------------------------------------
using StringList = std::vector<std::string>;
using Value = std::variant<std::monostate, int64_t, double, std::string, StringList, Node>;
using Row = std::map<std::string, Value>;

// Typed column accessors. A missing column or a value of the wrong kind is a
// Query error: the store broke the row contract of the query it answered.
[[nodiscard]] Result<const Node*, Error> RowNode(const Row& row, const std::string& column);
[[nodiscard]] Result<int64_t, Error> RowInt(const Row& row, const std::string& column);
/// A null column reads as an empty list (OPTIONAL MATCH with no hits).
[[nodiscard]] Result<StringList, Error> RowStrings(const Row& row, const std::string& column);

// ---------------------------------------------------------------------------
// MovieInfo - the Movie attributes the engine reads and reports.
// ---------------------------------------------------------------------------
struct MovieInfo {
    std::string title;
    std::optional<int> year;
    std::optional<double> rating;
    std::optional<std::string> tagline;
    std::optional<std::string> description;

    bool operator==(const MovieInfo& other) const {
        return title == other.title && year == other.year &&
               rating == other.rating && tagline == other.tagline &&
               description == other.description;
    }
};

/// Build a MovieInfo from a Movie node. Fails when the node has no title.
[[nodiscard]] Result<MovieInfo, Error> MovieFromNode(const Node& node);

/// Inverse of MovieFromNode; absent attributes are left out of the bag.
Node MovieToNode(const MovieInfo& movie);

} // namespace cinegraph
