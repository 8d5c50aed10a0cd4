#include <cinegraph/graph/graph_query.hpp>

#include <type_traits>

namespace cinegraph {

std::string DescribeQuery(const GraphQuery& query) {
    return std::visit([](const auto& q) -> std::string {
        using Q = std::decay_t<decltype(q)>;
        if constexpr (std::is_same_v<Q, OverlapQuery>) {
            return std::string("overlap(") + RelationshipType(q.via) + ", '" +
                   q.anchor_title + "')";
        } else if constexpr (std::is_same_v<Q, MovieLookupQuery>) {
            return "movie('" + q.title + "')";
        } else if constexpr (std::is_same_v<Q, ListMoviesQuery>) {
            return "list-movies";
        } else if constexpr (std::is_same_v<Q, PersonMoviesQuery>) {
            return std::string("person-movies(") + RelationshipType(q.via) +
                   ", '" + q.person_name + "')";
        } else {
            return "statistics";
        }
    }, query);
}

} // namespace cinegraph
