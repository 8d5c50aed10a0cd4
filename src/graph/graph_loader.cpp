#include <cinegraph/graph/graph_loader.hpp>
#include <cinegraph/core/log.hpp>
#include <cinegraph/core/types.hpp>

#include <yaml-cpp/yaml.h>

namespace cinegraph {

namespace {

Error MakeDatasetError(const std::string& message) {
    return Error{"LoadGraphDataset", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidArgument};
}

Result<MovieInfo, Error> ParseYamlMovie(const YAML::Node& node) {
    if (!node.IsMap() || !node["title"]) {
        return Result<MovieInfo, Error>::Err(
            MakeDatasetError("Movie entry missing 'title' field"));
    }
    auto title = MovieTitle::Create(node["title"].as<std::string>());
    if (title.IsErr()) {
        return Result<MovieInfo, Error>::Err(
            MakeDatasetError("Invalid movie title: " + title.Error()));
    }

    MovieInfo movie;
    movie.title = title.Value().Value();
    if (node["year"]) {
        movie.year = node["year"].as<int>();
    }
    if (node["rating"]) {
        movie.rating = node["rating"].as<double>();
    }
    if (node["tagline"]) {
        movie.tagline = node["tagline"].as<std::string>();
    }
    if (node["description"]) {
        movie.description = node["description"].as<std::string>();
    }
    return Result<MovieInfo, Error>::Ok(std::move(movie));
}

Result<void, Error> AddRelations(GraphSnapshot& snapshot,
                                 const std::string& from,
                                 Relationship rel,
                                 const YAML::Node& targets) {
    if (!targets) {
        return Result<void, Error>::Ok();
    }
    if (!targets.IsSequence()) {
        return Result<void, Error>::Err(MakeDatasetError(
            std::string(RelationshipType(rel)) + " list of '" + from +
            "' must be a sequence"));
    }
    for (const auto& target : targets) {
        auto related = snapshot.Relate(from, rel, target.as<std::string>());
        if (related.IsErr()) {
            return Result<void, Error>::Err(MakeDatasetError(related.Error().message));
        }
    }
    return Result<void, Error>::Ok();
}

Result<GraphSnapshot, Error> BuildSnapshot(const YAML::Node& root) {
    using R = Result<GraphSnapshot, Error>;
    GraphSnapshot snapshot;

    if (!root.IsMap()) {
        return R::Err(MakeDatasetError("Dataset root must be a mapping"));
    }

    // -- Genres --
    if (root["genres"]) {
        for (const auto& genre : root["genres"]) {
            auto added = snapshot.AddGenre(genre.as<std::string>());
            if (added.IsErr()) return R::Err(MakeDatasetError(added.Error().message));
        }
    }

    // -- Movies (genres listed per movie are created on first use) --
    if (root["movies"]) {
        for (const auto& node : root["movies"]) {
            auto movie = ParseYamlMovie(node);
            if (movie.IsErr()) return R::Err(std::move(movie).Error());
            const auto title = movie.Value().title;

            auto added = snapshot.AddMovie(std::move(movie).Value());
            if (added.IsErr()) return R::Err(MakeDatasetError(added.Error().message));

            if (node["genres"]) {
                for (const auto& genre : node["genres"]) {
                    auto name = genre.as<std::string>();
                    auto genre_added = snapshot.AddGenre(name);
                    if (genre_added.IsErr()) {
                        return R::Err(MakeDatasetError(genre_added.Error().message));
                    }
                }
            }
            auto related = AddRelations(snapshot, title, Relationship::InGenre,
                                        node["genres"]);
            if (related.IsErr()) return R::Err(std::move(related).Error());
        }
    }

    // -- People --
    if (root["people"]) {
        for (const auto& node : root["people"]) {
            if (!node.IsMap() || !node["name"]) {
                return R::Err(MakeDatasetError("Person entry missing 'name' field"));
            }
            auto name = PersonName::Create(node["name"].as<std::string>());
            if (name.IsErr()) {
                return R::Err(MakeDatasetError("Invalid person name: " + name.Error()));
            }
            const auto& person = name.Value().Value();
            auto added = snapshot.AddPerson(person);
            if (added.IsErr()) return R::Err(MakeDatasetError(added.Error().message));

            auto acted = AddRelations(snapshot, person, Relationship::ActedIn,
                                      node["acted_in"]);
            if (acted.IsErr()) return R::Err(std::move(acted).Error());
            auto directed = AddRelations(snapshot, person, Relationship::Directed,
                                         node["directed"]);
            if (directed.IsErr()) return R::Err(std::move(directed).Error());
        }
    }

    LogInfo("store", "dataset loaded: " + std::to_string(snapshot.MovieCount()) +
                     " movies, " + std::to_string(snapshot.PersonCount()) +
                     " people, " + std::to_string(snapshot.GenreCount()) + " genres");
    return R::Ok(std::move(snapshot));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadGraphDataset
// ---------------------------------------------------------------------------
Result<GraphSnapshot, Error> LoadGraphDataset(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        auto err = MakeDatasetError("Failed to read dataset: " + std::string(e.what()));
        err.endpoint = std::string(file_path);
        return Result<GraphSnapshot, Error>::Err(std::move(err));
    }
    try {
        auto snapshot = BuildSnapshot(root);
        if (snapshot.IsErr()) {
            auto err = std::move(snapshot).Error();
            err.endpoint = std::string(file_path);
            return Result<GraphSnapshot, Error>::Err(std::move(err));
        }
        return snapshot;
    } catch (const YAML::Exception& e) {
        auto err = MakeDatasetError("Invalid dataset value: " + std::string(e.what()));
        err.endpoint = std::string(file_path);
        return Result<GraphSnapshot, Error>::Err(std::move(err));
    }
}

Result<GraphSnapshot, Error> ParseGraphDataset(std::string_view yaml_text) {
    try {
        return BuildSnapshot(YAML::Load(std::string(yaml_text)));
    } catch (const YAML::Exception& e) {
        return Result<GraphSnapshot, Error>::Err(
            MakeDatasetError("Failed to parse dataset: " + std::string(e.what())));
    }
}

} // namespace cinegraph
