#include <cinegraph/cli/command_executor.hpp>
#include <cinegraph/cli/output_formatter.hpp>
#include <cinegraph/core/ansi.hpp>
#include <cinegraph/core/terminal.hpp>
#include <cinegraph/core/types.hpp>

#include <cinegraph/catalog/movie_catalog.hpp>
#include <cinegraph/recommend/recommender.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cinegraph {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

const std::set<std::string> kNewStyleGroups = {
    "recommend", "movie", "person", "graph"};

std::string GetFlag(const CommandArgs& args, const std::string& key,
                    const std::string& default_val = "") {
    auto it = args.flags.find(key);
    return (it != args.flags.end()) ? it->second : default_val;
}

bool HasFlag(const CommandArgs& args, const std::string& key) {
    return args.flags.count(key) > 0;
}

bool JsonMode(const CommandArgs& args) {
    return GetFlag(args, "json") == "true";
}

bool ColorMode(const CommandArgs& args) {
    if (JsonMode(args)) return false;
    if (GetFlag(args, "no-color") == "true") return false;
    if (NoColorEnvSet()) return false;
    if (GetFlag(args, "color") == "true") return true;
    return IsStdoutTty();
}

Error MakeValidationError(const std::string& operation, const std::string& message) {
    return Error::InvalidArgument(operation, message);
}

// Strict integer flag: the whole value must parse.
Result<std::optional<int>, Error> IntFlag(const CommandArgs& args, const std::string& key) {
    using R = Result<std::optional<int>, Error>;
    if (!HasFlag(args, key)) {
        return R::Ok(std::optional<int>{});
    }
    auto text = GetFlag(args, key);
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return R::Ok(std::optional<int>{value});
    } catch (const std::exception&) {
        return R::Err(MakeValidationError(
            "ParseFlags", "--" + key + " expects an integer, got '" + text + "'"));
    }
}

std::string FormatFixed(double value, int digits) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(digits) << value;
    return os.str();
}

std::string FormatYear(const std::optional<int>& year) {
    return year ? std::to_string(*year) : "-";
}

std::string FormatRating(const std::optional<double>& rating) {
    return rating ? FormatFixed(*rating, 1) : "-";
}

std::string Join(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += ", ";
        joined += item;
    }
    return joined;
}

nlohmann::json MovieJson(const MovieInfo& movie) {
    nlohmann::json j;
    j["title"] = movie.title;
    j["year"] = movie.year ? nlohmann::json(*movie.year) : nlohmann::json(nullptr);
    j["rating"] = movie.rating ? nlohmann::json(*movie.rating) : nlohmann::json(nullptr);
    if (movie.tagline) j["tagline"] = *movie.tagline;
    if (movie.description) j["description"] = *movie.description;
    return j;
}

// ---------------------------------------------------------------------------
// StoreContext - the validated config plus the store it selected.
// ---------------------------------------------------------------------------
struct StoreContext {
    AppConfig config;
    std::unique_ptr<IGraphStore> store;

    QueryOptions Options() const {
        QueryOptions options;
        options.timeout = std::chrono::milliseconds(config.timeout_ms);
        return options;
    }
};

Result<StoreContext, Error> OpenStore(const CommandEnvironment& env, const CommandArgs& args) {
    using R = Result<StoreContext, Error>;
    auto config = ConfigFromArgs(args, env.env_lookup);
    if (config.IsErr()) {
        return R::Err(std::move(config).Error());
    }
    auto store = env.store_factory(config.Value());
    if (store.IsErr()) {
        return R::Err(std::move(store).Error());
    }
    StoreContext ctx;
    ctx.config = std::move(config).Value();
    ctx.store = std::move(store).Value();
    return R::Ok(std::move(ctx));
}

// Reports a failed Result and yields its exit code.
template <typename T>
int Fail(const OutputFormatter& fmt, const Result<T, Error>& result) {
    fmt.PrintError(result.Error());
    return result.Error().ExitCode();
}

// ---------------------------------------------------------------------------
// recommend genre|cast|combined
// ---------------------------------------------------------------------------
int HandleRecommend(const CommandEnvironment& env, Strategy strategy,
                    const CommandArgs& args) {
    OutputFormatter fmt(JsonMode(args), ColorMode(args), *env.out, *env.err);

    if (args.positional.empty()) {
        auto err = MakeValidationError(
            "Recommend", std::string("Missing movie title. Usage: cinegraph recommend ") +
                         StrategyName(strategy) + " <title> [--limit N]");
        fmt.PrintError(err);
        return err.ExitCode();
    }

    auto limit = IntFlag(args, "limit");
    if (limit.IsErr()) return Fail(fmt, limit);

    auto ctx = OpenStore(env, args);
    if (ctx.IsErr()) return Fail(fmt, ctx);
    const auto& store = ctx.Value();

    Recommender recommender(*store.store, store.config.ranking);
    RecommendRequest request;
    request.title = args.positional[0];
    request.strategy = strategy;
    request.limit = limit.Value();
    request.timeout = std::chrono::milliseconds(store.config.timeout_ms);

    auto result = recommender.Recommend(request);
    if (result.IsErr()) return Fail(fmt, result);
    const auto& ranked = result.Value();

    if (fmt.IsJsonMode()) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& r : ranked) {
            auto entry = MovieJson(r.movie);
            entry["shared_genre_count"] = r.shared_genre_count;
            entry["shared_actor_count"] = r.shared_actor_count;
            entry["composite_score"] = r.composite_score;
            entry["shared_genres"] = r.shared_genres;
            entry["shared_actors"] = r.shared_actors;
            j.push_back(std::move(entry));
        }
        fmt.PrintJson(j.dump());
        return 0;
    }

    if (ranked.empty()) {
        *env.out << "No recommendations for '" << request.title << "'.\n";
        return 0;
    }

    std::vector<std::string> headers = {"#", "Title", "Year", "Rating", "Genres",
                                        "Actors", "Score"};
    std::vector<std::vector<std::string>> rows;
    for (size_t i = 0; i < ranked.size(); ++i) {
        const auto& r = ranked[i];
        rows.push_back({std::to_string(i + 1), r.movie.title, FormatYear(r.movie.year),
                        FormatRating(r.movie.rating),
                        std::to_string(r.shared_genre_count),
                        std::to_string(r.shared_actor_count),
                        FormatFixed(r.composite_score, 2)});
    }
    fmt.PrintTable(headers, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// movie list
// ---------------------------------------------------------------------------
int HandleMovieList(const CommandEnvironment& env, const CommandArgs& args) {
    OutputFormatter fmt(JsonMode(args), ColorMode(args), *env.out, *env.err);

    auto ctx = OpenStore(env, args);
    if (ctx.IsErr()) return Fail(fmt, ctx);

    auto result = ListMovies(*ctx.Value().store, ctx.Value().Options());
    if (result.IsErr()) return Fail(fmt, result);

    if (fmt.IsJsonMode()) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& m : result.Value()) {
            j.push_back(MovieJson(m));
        }
        fmt.PrintJson(j.dump());
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& m : result.Value()) {
        rows.push_back({m.title, FormatYear(m.year), FormatRating(m.rating)});
    }
    fmt.PrintTable({"Title", "Year", "Rating"}, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// movie show
// ---------------------------------------------------------------------------
int HandleMovieShow(const CommandEnvironment& env, const CommandArgs& args) {
    OutputFormatter fmt(JsonMode(args), ColorMode(args), *env.out, *env.err);

    if (args.positional.empty()) {
        auto err = MakeValidationError(
            "MovieShow", "Missing movie title. Usage: cinegraph movie show <title>");
        fmt.PrintError(err);
        return err.ExitCode();
    }
    auto title = MovieTitle::Create(args.positional[0]);
    if (title.IsErr()) {
        auto err = MakeValidationError("MovieShow", "Invalid title: " + title.Error());
        fmt.PrintError(err);
        return err.ExitCode();
    }

    auto ctx = OpenStore(env, args);
    if (ctx.IsErr()) return Fail(fmt, ctx);
    const auto& store = ctx.Value();

    auto result = GetMovieDetails(*store.store, title.Value().Value(), store.Options());
    if (result.IsErr()) return Fail(fmt, result);
    if (!result.Value().has_value()) {
        Error err{"GetMovieDetails", store.store->Describe(), std::nullopt,
                  "Movie not found: " + title.Value().Value(), std::nullopt,
                  ErrorCategory::NotFound};
        fmt.PrintError(err);
        return err.ExitCode();
    }
    const auto& details = *result.Value();

    if (fmt.IsJsonMode()) {
        auto j = MovieJson(details.movie);
        j["directors"] = details.directors;
        j["cast"] = details.cast;
        j["genres"] = details.genres;
        fmt.PrintJson(j.dump());
        return 0;
    }

    DetailSection summary;
    summary.entries.emplace_back("Year", FormatYear(details.movie.year));
    summary.entries.emplace_back("Rating", FormatRating(details.movie.rating));
    if (details.movie.tagline) {
        summary.entries.emplace_back("Tagline", *details.movie.tagline);
    }
    if (details.movie.description) {
        summary.entries.emplace_back("Description", *details.movie.description);
    }

    auto names = [](const std::string& heading, const std::vector<std::string>& items) {
        DetailSection section;
        section.title = heading;
        for (const auto& item : items) {
            section.entries.emplace_back(item, "");
        }
        return section;
    };

    fmt.PrintDetail(details.movie.title,
                    {summary, names("Directors", details.directors),
                     names("Cast", details.cast), names("Genres", details.genres)});
    return 0;
}

// ---------------------------------------------------------------------------
// person acted / person directed
// ---------------------------------------------------------------------------
int HandlePersonMovies(const CommandEnvironment& env, Relationship via,
                       const CommandArgs& args) {
    OutputFormatter fmt(JsonMode(args), ColorMode(args), *env.out, *env.err);
    const char* action = via == Relationship::Directed ? "directed" : "acted";

    if (args.positional.empty()) {
        auto err = MakeValidationError(
            "PersonMovies", std::string("Missing person name. Usage: cinegraph person ") +
                            action + " <name>");
        fmt.PrintError(err);
        return err.ExitCode();
    }
    auto name = PersonName::Create(args.positional[0]);
    if (name.IsErr()) {
        auto err = MakeValidationError("PersonMovies", "Invalid name: " + name.Error());
        fmt.PrintError(err);
        return err.ExitCode();
    }

    auto ctx = OpenStore(env, args);
    if (ctx.IsErr()) return Fail(fmt, ctx);
    const auto& store = ctx.Value();

    auto result = via == Relationship::Directed
        ? MoviesByDirector(*store.store, name.Value().Value(), store.Options())
        : MoviesByActor(*store.store, name.Value().Value(), store.Options());
    if (result.IsErr()) return Fail(fmt, result);

    if (fmt.IsJsonMode()) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& pm : result.Value()) {
            auto entry = MovieJson(pm.movie);
            entry["genres"] = pm.genres;
            j.push_back(std::move(entry));
        }
        fmt.PrintJson(j.dump());
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& pm : result.Value()) {
        rows.push_back({pm.movie.title, FormatYear(pm.movie.year),
                        FormatRating(pm.movie.rating), Join(pm.genres)});
    }
    fmt.PrintTable({"Title", "Year", "Rating", "Genres"}, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// graph stats
// ---------------------------------------------------------------------------
int HandleGraphStats(const CommandEnvironment& env, const CommandArgs& args) {
    OutputFormatter fmt(JsonMode(args), ColorMode(args), *env.out, *env.err);

    auto ctx = OpenStore(env, args);
    if (ctx.IsErr()) return Fail(fmt, ctx);

    auto result = GetStatistics(*ctx.Value().store, ctx.Value().Options());
    if (result.IsErr()) return Fail(fmt, result);
    const auto& stats = result.Value();

    if (fmt.IsJsonMode()) {
        nlohmann::json j = {{"movies", stats.movies},
                            {"people", stats.people},
                            {"genres", stats.genres},
                            {"relationships", stats.relationships}};
        fmt.PrintJson(j.dump());
        return 0;
    }

    DetailSection counts;
    counts.entries = {{"Movies", std::to_string(stats.movies)},
                      {"People", std::to_string(stats.people)},
                      {"Genres", std::to_string(stats.genres)},
                      {"Relationships", std::to_string(stats.relationships)}};
    fmt.PrintDetail(ctx.Value().store->Describe(), {counts});
    return 0;
}

// ---------------------------------------------------------------------------
// graph ping
// ---------------------------------------------------------------------------
int HandleGraphPing(const CommandEnvironment& env, const CommandArgs& args) {
    OutputFormatter fmt(JsonMode(args), ColorMode(args), *env.out, *env.err);

    auto ctx = OpenStore(env, args);
    if (ctx.IsErr()) return Fail(fmt, ctx);

    auto result = VerifyConnectivity(*ctx.Value().store, ctx.Value().Options());
    if (result.IsErr()) {
        fmt.PrintError(result.Error());
        return result.Error().ExitCode();
    }
    fmt.PrintSuccess("Connected to " + ctx.Value().store->Describe());
    return 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ConfigFromArgs
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ConfigFromArgs(const CommandArgs& args, const EnvLookup& lookup) {
    using R = Result<AppConfig, Error>;

    AppConfig base;
    if (HasFlag(args, "config")) {
        auto yaml = LoadFromYaml(GetFlag(args, "config"));
        if (yaml.IsErr()) {
            return R::Err(std::move(yaml).Error());
        }
        base = std::move(yaml).Value();
    }
    auto config = MergeConfigs(base, LoadFromEnv(lookup));

    if (HasFlag(args, "uri")) config.store.uri = GetFlag(args, "uri");
    if (HasFlag(args, "database")) config.store.database = GetFlag(args, "database");
    if (HasFlag(args, "user")) config.store.user = GetFlag(args, "user");
    if (HasFlag(args, "password")) {
        config.store.password = GetFlag(args, "password");
    } else if (HasFlag(args, "password-env")) {
        config.store.password.clear();
    }
    if (HasFlag(args, "password-env")) config.store.password_env = GetFlag(args, "password-env");
    if (HasFlag(args, "offline")) config.store.offline_dataset = GetFlag(args, "offline");
    if (GetFlag(args, "insecure") == "true") config.store.disable_tls_verify = true;
    if (JsonMode(args)) config.json_output = true;

    auto pool_size = IntFlag(args, "pool-size");
    if (pool_size.IsErr()) return R::Err(std::move(pool_size).Error());
    if (pool_size.Value()) config.store.pool_size = *pool_size.Value();

    auto timeout = IntFlag(args, "timeout");
    if (timeout.IsErr()) return R::Err(std::move(timeout).Error());
    if (timeout.Value()) config.timeout_ms = *timeout.Value();

    auto resolved = ResolvePasswordEnv(std::move(config), lookup);
    if (resolved.IsErr()) {
        return resolved;
    }
    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return R::Err(std::move(valid).Error());
    }
    return resolved;
}

// ---------------------------------------------------------------------------
// PrintTopLevelHelp
// ---------------------------------------------------------------------------
namespace {

struct Ansi {
    std::ostream& out;
    bool color;

    Ansi& Bold(const std::string& s) {
        if (color) out << ansi::kBold;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Dim(const std::string& s) {
        if (color) out << ansi::kDim;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Normal(const std::string& s) {
        out << s;
        return *this;
    }

    Ansi& Nl() {
        out << "\n";
        return *this;
    }
};

// Command display info for column alignment.
struct CmdDisplay {
    std::string left;  // e.g. "  movie show <title>"
    std::string desc;
    std::vector<FlagHelp> flags;
};

// "cinegraph movie show <title> [flags]" -> "movie show <title>"
std::string CommandPart(const CommandInfo& cmd) {
    if (!cmd.help.has_value() || cmd.help->usage.empty()) {
        return cmd.group + " " + cmd.action;
    }
    auto usage = cmd.help->usage;
    const std::string prefix = "cinegraph ";
    if (usage.substr(0, prefix.size()) != prefix) {
        return cmd.group + " " + cmd.action;
    }
    auto rest = usage.substr(prefix.size());
    auto end = std::min(rest.find('['), rest.find("--"));
    if (end != std::string::npos) {
        rest = rest.substr(0, end);
    }
    while (!rest.empty() && rest.back() == ' ') rest.pop_back();
    return rest;
}

} // anonymous namespace (Ansi helper)

void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color) {
    Ansi a{out, color};

    a.Bold("cinegraph").Normal(" - movie recommendations from a knowledge graph").Nl().Nl();
    a.Dim("  Ranks movies that share genres and cast with a reference movie.").Nl();
    a.Dim("  All commands accept --json for machine-readable output.").Nl();

    out << "\n";
    a.Bold("USAGE").Nl();
    out << "  cinegraph [global-flags] <command> [args] [flags]\n";
    out << "  cinegraph -c <config.yaml>                  Run the config's requests\n";

    const std::vector<std::string> group_order = {"recommend", "movie", "person", "graph"};

    size_t max_left = 0;
    std::map<std::string, std::vector<CmdDisplay>> all_displays;
    for (const auto& group : group_order) {
        auto& displays = all_displays[group];
        for (const auto& cmd : router.CommandsForGroup(group)) {
            CmdDisplay d;
            d.left = "  " + CommandPart(cmd);
            d.desc = cmd.description;
            if (cmd.help.has_value()) {
                d.flags = cmd.help->flags;
            }
            max_left = std::max(max_left, d.left.size());
            displays.push_back(std::move(d));
        }
    }
    max_left = std::max(max_left, static_cast<size_t>(36));

    for (const auto& group : group_order) {
        std::string label = group;
        std::transform(label.begin(), label.end(), label.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        out << "\n";
        a.Bold(label);
        auto desc = router.GroupDescription(group);
        if (!desc.empty()) {
            a.Dim(" - " + desc);
        }
        a.Nl();

        for (const auto& d : all_displays[group]) {
            size_t pad = (max_left > d.left.size()) ? (max_left - d.left.size()) : 2;
            out << d.left << std::string(pad, ' ') << d.desc << "\n";
            for (const auto& f : d.flags) {
                std::string flag_line = "      --" + f.name;
                if (!f.placeholder.empty()) flag_line += " " + f.placeholder;
                size_t flag_pad = (max_left > flag_line.size())
                    ? (max_left - flag_line.size()) : 2;
                a.Dim(flag_line + std::string(flag_pad, ' ') + f.description).Nl();
            }
        }
    }

    out << "\n";
    a.Bold("GLOBAL FLAGS").Nl();

    struct GlobalFlag {
        const char* flag;
        const char* desc;
    };

    const GlobalFlag global_flags[] = {
        {"--uri <uri>",              "Neo4j HTTP URI (default: http://localhost:7474)"},
        {"--database <name>",        "Neo4j database (default: neo4j)"},
        {"--user <user>",            "Neo4j username (default: neo4j)"},
        {"--password <pass>",        "Neo4j password"},
        {"--password-env <var>",     "Read the password from an env var"},
        {"--config <file>",          "YAML config file"},
        {"--offline <dataset.yaml>", "Serve queries from a YAML dataset"},
        {"--pool-size <n>",          "Concurrent store sessions (default: 8)"},
        {"--timeout <ms>",           "Per-query timeout (default: 30000)"},
        {"--insecure",               "Skip TLS verification (https URIs)"},
        {"--json",                   "JSON output"},
        {"--color",                  "Force colored output"},
        {"--no-color",               "Disable colored output"},
        {"-v",                       "Verbose logging (INFO level)"},
        {"-vv",                      "Debug logging (DEBUG level)"},
        {"--version",                "Print the version"},
    };

    for (const auto& gf : global_flags) {
        std::string left = std::string("  ") + gf.flag;
        size_t pad = (max_left > left.size()) ? (max_left - left.size()) : 2;
        out << left << std::string(pad, ' ') << gf.desc << "\n";
    }

    out << "\n";
    a.Dim("  Priority: flags > NEO4J_URI/NEO4J_USERNAME/NEO4J_PASSWORD/NEO4J_DATABASE > --config").Nl();

    out << "\n";
    a.Bold("EXIT CODES").Nl();
    out << "  0  Success          1  Usage error         2  Invalid argument\n";
    out << "  3  Not found        4  Store unavailable   5  Timeout\n";
    out << "  6  Query error      99 Internal error\n";

    out << "\n";
    a.Dim("  Use \"cinegraph <command> --help\" for details and examples.").Nl();
}

// ---------------------------------------------------------------------------
// IsNewStyleCommand
// ---------------------------------------------------------------------------
bool IsNewStyleCommand(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "-v" || arg == "-vv") {
            continue;
        }
        if (arg.substr(0, 2) == "--") {
            auto eq = arg.find('=');
            if (eq == std::string_view::npos && !CommandRouter::IsBooleanFlag(arg) &&
                i + 1 < argc &&
                std::string_view{argv[i + 1]}.substr(0, 2) != "--") {
                ++i; // skip the value
            }
            continue;
        }
        return kNewStyleGroups.count(std::string(arg)) > 0;
    }
    return false;
}

// ---------------------------------------------------------------------------
// RegisterAllCommands
// ---------------------------------------------------------------------------
void RegisterAllCommands(CommandRouter& router, CommandEnvironment env) {
    router.SetGroupDescription("recommend", "Recommend movies similar to a reference movie");
    router.SetGroupExamples("recommend", {
        "$ cinegraph recommend \"Inception\"",
        "$ cinegraph recommend genre \"Inception\" --limit 10",
        "$ cinegraph --json recommend cast \"The Matrix\"",
        "$ cinegraph --offline movies.yaml recommend combined \"Heat\"",
    });
    router.SetDefaultAction("recommend", "combined");

    router.SetGroupDescription("movie", "List movies and show one movie's details");
    router.SetGroupExamples("movie", {
        "$ cinegraph movie list",
        "$ cinegraph movie show \"Inception\"",
    });

    router.SetGroupDescription("person", "Movies of an actor or a director");
    router.SetGroupExamples("person", {
        "$ cinegraph person acted \"Leonardo DiCaprio\"",
        "$ cinegraph person directed \"Christopher Nolan\"",
    });

    router.SetGroupDescription("graph", "Graph statistics and connectivity");
    router.SetGroupExamples("graph", {
        "$ cinegraph graph ping",
        "$ cinegraph --json graph stats",
    });

    // -----------------------------------------------------------------------
    // recommend
    // -----------------------------------------------------------------------
    const FlagHelp limit_flag{"limit", "<n>", "Maximum number of recommendations (default: 5)", false};

    {
        CommandHelp help;
        help.usage = "cinegraph recommend genre <title> [flags]";
        help.args_description = "<title>    Exact title of the reference movie";
        help.long_description =
            "Scores candidates by the number of genres they share with the "
            "reference movie.";
        help.flags = {limit_flag};
        help.examples = {"cinegraph recommend genre \"Inception\" --limit 3"};
        router.Register("recommend", "genre", "Rank by shared genres",
                        [env](const CommandArgs& args) {
                            return HandleRecommend(env, Strategy::Genre, args);
                        },
                        std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "cinegraph recommend cast <title> [flags]";
        help.args_description = "<title>    Exact title of the reference movie";
        help.long_description =
            "Scores candidates by the number of actors they share with the "
            "reference movie.";
        help.flags = {limit_flag};
        help.examples = {"cinegraph recommend cast \"Inception\""};
        router.Register("recommend", "cast", "Rank by shared actors",
                        [env](const CommandArgs& args) {
                            return HandleRecommend(env, Strategy::Cast, args);
                        },
                        std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "cinegraph recommend combined <title> [flags]";
        help.args_description = "<title>    Exact title of the reference movie";
        help.long_description =
            "Composite score = shared genres x genre_weight + shared actors x "
            "actor_weight (2 and 3 unless the config's ranking section says "
            "otherwise). Ties go to more shared actors, then to the title.";
        help.flags = {limit_flag};
        help.examples = {
            "cinegraph recommend \"Inception\"",
            "cinegraph --json recommend combined \"Inception\" --limit 10",
        };
        router.Register("recommend", "combined", "Rank by weighted genres and actors",
                        [env](const CommandArgs& args) {
                            return HandleRecommend(env, Strategy::Combined, args);
                        },
                        std::move(help));
    }

    // -----------------------------------------------------------------------
    // movie
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "cinegraph movie list [flags]";
        help.examples = {"cinegraph movie list", "cinegraph --json movie list"};
        router.Register("movie", "list", "List all movies by title",
                        [env](const CommandArgs& args) { return HandleMovieList(env, args); },
                        std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "cinegraph movie show <title> [flags]";
        help.args_description = "<title>    Exact movie title";
        help.long_description = "Exits with code 3 when the movie does not exist.";
        help.examples = {"cinegraph movie show \"Inception\""};
        router.Register("movie", "show", "Show a movie with its directors, cast and genres",
                        [env](const CommandArgs& args) { return HandleMovieShow(env, args); },
                        std::move(help));
    }

    // -----------------------------------------------------------------------
    // person
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "cinegraph person acted <name> [flags]";
        help.args_description = "<name>    Exact person name";
        help.examples = {"cinegraph person acted \"Leonardo DiCaprio\""};
        router.Register("person", "acted", "Movies a person acted in, newest first",
                        [env](const CommandArgs& args) {
                            return HandlePersonMovies(env, Relationship::ActedIn, args);
                        },
                        std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "cinegraph person directed <name> [flags]";
        help.args_description = "<name>    Exact person name";
        help.examples = {"cinegraph person directed \"Christopher Nolan\""};
        router.Register("person", "directed", "Movies a person directed, newest first",
                        [env](const CommandArgs& args) {
                            return HandlePersonMovies(env, Relationship::Directed, args);
                        },
                        std::move(help));
    }

    // -----------------------------------------------------------------------
    // graph
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "cinegraph graph stats [flags]";
        help.examples = {"cinegraph graph stats"};
        router.Register("graph", "stats", "Count movies, people, genres and relationships",
                        [env](const CommandArgs& args) { return HandleGraphStats(env, args); },
                        std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "cinegraph graph ping [flags]";
        help.long_description = "Exits with code 4 when the store cannot be reached.";
        help.examples = {"cinegraph graph ping --uri http://neo4j.internal:7474"};
        router.Register("graph", "ping", "Check connectivity to the store",
                        [env](const CommandArgs& args) { return HandleGraphPing(env, args); },
                        std::move(help));
    }
}

} // namespace cinegraph
