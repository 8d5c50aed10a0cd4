#include <cinegraph/graph/graph_model.hpp>

namespace cinegraph {

namespace {

Error MakeRowError(const std::string& column, const std::string& message) {
    return Error{"ReadRow", column, std::nullopt, message, std::nullopt,
                 ErrorCategory::Query};
}

const Value* FindColumn(const Row& row, const std::string& column) {
    auto it = row.find(column);
    return it == row.end() ? nullptr : &it->second;
}

} // anonymous namespace

const char* RelationshipType(Relationship rel) {
    switch (rel) {
        case Relationship::ActedIn:  return "ACTED_IN";
        case Relationship::Directed: return "DIRECTED";
        case Relationship::InGenre:  return "IN_GENRE";
    }
    return "";
}

const char* CounterpartLabel(Relationship rel) {
    switch (rel) {
        case Relationship::ActedIn:
        case Relationship::Directed:
            return "Person";
        case Relationship::InGenre:
            return "Genre";
    }
    return "";
}

bool PointsIntoMovie(Relationship rel) {
    return rel != Relationship::InGenre;
}

// ---------------------------------------------------------------------------
// Node
// ---------------------------------------------------------------------------
std::optional<std::string> Node::GetString(const std::string& key) const {
    auto it = properties.find(key);
    if (it == properties.end()) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        return *s;
    }
    return std::nullopt;
}

std::optional<int64_t> Node::GetInt(const std::string& key) const {
    auto it = properties.find(key);
    if (it == properties.end()) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(&it->second)) {
        return *i;
    }
    return std::nullopt;
}

std::optional<double> Node::GetDouble(const std::string& key) const {
    auto it = properties.find(key);
    if (it == properties.end()) return std::nullopt;
    if (const auto* d = std::get_if<double>(&it->second)) {
        return *d;
    }
    if (const auto* i = std::get_if<int64_t>(&it->second)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Row accessors
// ---------------------------------------------------------------------------
Result<const Node*, Error> RowNode(const Row& row, const std::string& column) {
    const auto* value = FindColumn(row, column);
    if (value == nullptr) {
        return Result<const Node*, Error>::Err(
            MakeRowError(column, "Missing column '" + column + "'"));
    }
    const auto* node = std::get_if<Node>(value);
    if (node == nullptr) {
        return Result<const Node*, Error>::Err(
            MakeRowError(column, "Column '" + column + "' is not a node"));
    }
    return Result<const Node*, Error>::Ok(node);
}

Result<int64_t, Error> RowInt(const Row& row, const std::string& column) {
    const auto* value = FindColumn(row, column);
    if (value == nullptr) {
        return Result<int64_t, Error>::Err(
            MakeRowError(column, "Missing column '" + column + "'"));
    }
    const auto* i = std::get_if<int64_t>(value);
    if (i == nullptr) {
        return Result<int64_t, Error>::Err(
            MakeRowError(column, "Column '" + column + "' is not an integer"));
    }
    return Result<int64_t, Error>::Ok(*i);
}

Result<StringList, Error> RowStrings(const Row& row, const std::string& column) {
    const auto* value = FindColumn(row, column);
    if (value == nullptr) {
        return Result<StringList, Error>::Err(
            MakeRowError(column, "Missing column '" + column + "'"));
    }
    if (std::holds_alternative<std::monostate>(*value)) {
        return Result<StringList, Error>::Ok({});
    }
    const auto* list = std::get_if<StringList>(value);
    if (list == nullptr) {
        return Result<StringList, Error>::Err(
            MakeRowError(column, "Column '" + column + "' is not a list of names"));
    }
    return Result<StringList, Error>::Ok(*list);
}

// ---------------------------------------------------------------------------
// MovieInfo <-> Node
// ---------------------------------------------------------------------------
Result<MovieInfo, Error> MovieFromNode(const Node& node) {
    auto title = node.GetString("title");
    if (!title.has_value() || title->empty()) {
        return Result<MovieInfo, Error>::Err(Error{
            "ReadMovie", node.label, std::nullopt,
            "Movie node has no title", std::nullopt, ErrorCategory::Query});
    }

    MovieInfo movie;
    movie.title = std::move(*title);
    if (auto year = node.GetInt("year")) {
        movie.year = static_cast<int>(*year);
    }
    movie.rating = node.GetDouble("rating");
    movie.tagline = node.GetString("tagline");
    movie.description = node.GetString("description");
    return Result<MovieInfo, Error>::Ok(std::move(movie));
}

Node MovieToNode(const MovieInfo& movie) {
    Node node;
    node.label = "Movie";
    node.properties["title"] = movie.title;
    if (movie.year.has_value()) {
        node.properties["year"] = static_cast<int64_t>(*movie.year);
    }
    if (movie.rating.has_value()) {
        node.properties["rating"] = *movie.rating;
    }
    if (movie.tagline.has_value()) {
        node.properties["tagline"] = *movie.tagline;
    }
    if (movie.description.has_value()) {
        node.properties["description"] = *movie.description;
    }
    return node;
}

} // namespace cinegraph
