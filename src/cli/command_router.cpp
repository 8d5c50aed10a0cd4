#include <cinegraph/cli/command_router.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <set>

namespace cinegraph {

namespace {

constexpr const char* kProgram = "cinegraph";

bool HasJsonFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

void PrintJsonError(const std::string& message, std::ostream& out) {
    nlohmann::json doc = {{"error", {{"message", message}}}};
    out << doc.dump() << "\n";
}

// Consume one "--flag", "--flag=value" or "--flag value" at argv[i].
// Returns the index of the next unconsumed token.
int ConsumeFlag(int argc, const char* const* argv, int i, CommandArgs& args) {
    std::string_view arg{argv[i]};
    auto eq = arg.find('=');
    if (eq != std::string_view::npos) {
        args.flags[std::string(arg.substr(2, eq - 2))] = std::string(arg.substr(eq + 1));
        return i + 1;
    }
    auto key = std::string(arg.substr(2));
    if (!CommandRouter::IsBooleanFlag(arg) && i + 1 < argc &&
        std::string_view{argv[i + 1]}.substr(0, 2) != "--") {
        args.flags[key] = argv[i + 1];
        return i + 2;
    }
    args.flags[key] = "true";
    return i + 1;
}

} // anonymous namespace

bool CommandRouter::IsBooleanFlag(std::string_view arg) {
    return arg == "--color" || arg == "--no-color" ||
           arg == "--json" || arg == "--help" || arg == "--version" ||
           arg == "--insecure" || arg == "--quiet";
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler,
                             std::optional<CommandHelp> help) {
    CommandInfo info;
    info.group = group;
    info.action = action;
    info.description = description;
    info.handler = std::move(handler);
    info.help = std::move(help);
    commands_[group + ":" + action] = std::move(info);
}

void CommandRouter::SetGroupDescription(const std::string& group,
                                        const std::string& description) {
    group_descriptions_[group] = description;
}

void CommandRouter::SetGroupExamples(const std::string& group,
                                     std::vector<std::string> examples) {
    group_examples_[group] = std::move(examples);
}

void CommandRouter::SetDefaultAction(const std::string& group,
                                     const std::string& action) {
    default_actions_[group] = action;
}

void CommandRouter::ReportError(const std::string& message, bool json_mode,
                                const std::string& group_for_help,
                                std::ostream& err) const {
    if (json_mode) {
        PrintJsonError(message, err);
        return;
    }
    err << "Error: " << message << "\n";
    if (!group_for_help.empty() && HasGroup(group_for_help)) {
        PrintGroupHelp(group_for_help, err);
    } else {
        PrintHelp(err);
    }
}

int CommandRouter::Dispatch(int argc, const char* const* argv) const {
    return Dispatch(argc, argv, std::cout, std::cerr);
}

int CommandRouter::Dispatch(int argc, const char* const* argv,
                            std::ostream& out, std::ostream& err) const {
    bool json_mode = HasJsonFlag(argc, argv);
    auto parsed = Parse(argc, argv);
    if (parsed.IsErr()) {
        ReportError(parsed.Error(), json_mode, "", err);
        return 1;
    }

    auto args = std::move(parsed).Value();
    json_mode = json_mode || args.flags.count("json") > 0;

    // "cinegraph movie" or "cinegraph movie --help"
    if (args.action.empty()) {
        if (!HasGroup(args.group)) {
            ReportError("unknown command group '" + args.group + "'", json_mode, "", err);
            return 1;
        }
        auto def_it = default_actions_.find(args.group);
        if (args.flags.count("help") > 0 || def_it == default_actions_.end()) {
            PrintGroupHelp(args.group, out);
            return 0;
        }
        args.action = def_it->second;
    }

    if (args.action == "--help" || args.action == "-h" || args.action == "help") {
        if (!HasGroup(args.group)) {
            ReportError("unknown command group '" + args.group + "'", json_mode, "", err);
            return 1;
        }
        PrintGroupHelp(args.group, out);
        return 0;
    }

    auto it = commands_.find(args.group + ":" + args.action);

    // Default action fallback: the parsed "action" is really the first argument.
    if (it == commands_.end()) {
        auto def_it = default_actions_.find(args.group);
        if (def_it != default_actions_.end()) {
            args.positional.insert(args.positional.begin(), args.action);
            args.action = def_it->second;
            it = commands_.find(args.group + ":" + args.action);
        }
    }

    if (it == commands_.end()) {
        ReportError("unknown command '" + args.group + " " + args.action + "'",
                    json_mode, args.group, err);
        return 1;
    }

    if (args.flags.count("help") > 0) {
        PrintCommandHelp(args.group, args.action, out);
        return 0;
    }

    return it->second.handler(args);
}

Result<CommandArgs, std::string> CommandRouter::Parse(int argc, const char* const* argv) {
    CommandArgs args;
    int i = 1;

    // Global flags before the group. -v / -vv are handled by main.
    while (i < argc) {
        std::string_view arg{argv[i]};
        if (arg == "-v" || arg == "-vv") {
            ++i;
        } else if (arg.substr(0, 2) == "--") {
            i = ConsumeFlag(argc, argv, i, args);
        } else {
            break;
        }
    }

    if (i >= argc) {
        return Result<CommandArgs, std::string>::Err(
            std::string("Missing command group. Usage: ") + kProgram +
            " <group> <action> [args]");
    }
    args.group = argv[i++];

    if (i < argc && std::string_view{argv[i]}.substr(0, 2) != "--") {
        args.action = argv[i++];
    }

    while (i < argc) {
        std::string_view arg{argv[i]};
        if (arg.substr(0, 2) == "--") {
            i = ConsumeFlag(argc, argv, i, args);
        } else if (arg == "-v" || arg == "-vv") {
            ++i;
        } else {
            args.positional.emplace_back(argv[i]);
            ++i;
        }
    }

    return Result<CommandArgs, std::string>::Ok(std::move(args));
}

std::vector<std::string> CommandRouter::Groups() const {
    std::set<std::string> groups;
    for (const auto& [key, info] : commands_) {
        groups.insert(info.group);
    }
    return {groups.begin(), groups.end()};
}

bool CommandRouter::HasGroup(const std::string& group) const {
    return std::any_of(commands_.begin(), commands_.end(),
                       [&group](const auto& entry) { return entry.second.group == group; });
}

std::vector<CommandInfo> CommandRouter::CommandsForGroup(const std::string& group) const {
    // Keys are "group:action", so map order is already action order.
    std::vector<CommandInfo> result;
    for (const auto& [key, info] : commands_) {
        if (info.group == group) {
            result.push_back(info);
        }
    }
    return result;
}

std::string CommandRouter::GroupDescription(const std::string& group) const {
    auto it = group_descriptions_.find(group);
    return (it != group_descriptions_.end()) ? it->second : "";
}

std::vector<std::string> CommandRouter::GroupExamples(const std::string& group) const {
    auto it = group_examples_.find(group);
    return (it != group_examples_.end()) ? it->second : std::vector<std::string>{};
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "\nUsage: " << kProgram << " <group> <action> [options]\n\n";
    out << "Available commands:\n";
    for (const auto& group : Groups()) {
        out << "\n  " << group << ":\n";
        for (const auto& cmd : CommandsForGroup(group)) {
            out << "    " << cmd.action;
            if (!cmd.description.empty()) {
                out << " - " << cmd.description;
            }
            out << "\n";
        }
    }
    out << "\n";
}

void CommandRouter::PrintGroupHelp(const std::string& group, std::ostream& out) const {
    auto desc = GroupDescription(group);
    out << kProgram << " " << group << " - " << (desc.empty() ? group : desc) << "\n";

    out << "\nActions:\n";
    auto cmds = CommandsForGroup(group);
    size_t width = 0;
    for (const auto& cmd : cmds) {
        width = std::max(width, cmd.action.size());
    }
    for (const auto& cmd : cmds) {
        out << "  " << cmd.action << std::string(width - cmd.action.size() + 6, ' ')
            << cmd.description << "\n";
    }

    auto examples = GroupExamples(group);
    if (!examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : examples) {
            out << "  " << ex << "\n";
        }
    }

    auto def_it = default_actions_.find(group);
    if (def_it != default_actions_.end()) {
        out << "\nShorthand: '" << kProgram << " " << group << " <args>' runs '"
            << kProgram << " " << group << " " << def_it->second << " <args>'.\n";
    }

    out << "\nUse \"" << kProgram << " " << group
        << " <action> --help\" for details on a specific action.\n";
}

void CommandRouter::PrintCommandHelp(const std::string& group,
                                     const std::string& action,
                                     std::ostream& out) const {
    auto it = commands_.find(group + ":" + action);
    if (it == commands_.end()) {
        out << "Error: unknown command '" << group << " " << action << "'\n";
        return;
    }

    const auto& cmd = it->second;
    out << kProgram << " " << group << " " << action << " - " << cmd.description << "\n";
    if (!cmd.help) {
        out << "\nNo detailed help available for this command.\n";
        return;
    }
    const auto& help = *cmd.help;

    if (!help.usage.empty()) {
        out << "\nUsage:\n  " << help.usage << "\n";
    }
    if (!help.args_description.empty()) {
        out << "\nArguments:\n  " << help.args_description << "\n";
    }
    if (!help.flags.empty()) {
        out << "\nFlags:\n";
        std::vector<std::string> labels;
        size_t width = 0;
        for (const auto& f : help.flags) {
            auto label = "--" + f.name + (f.placeholder.empty() ? "" : " " + f.placeholder);
            width = std::max(width, label.size());
            labels.push_back(std::move(label));
        }
        for (size_t i = 0; i < help.flags.size(); ++i) {
            out << "  " << labels[i] << std::string(width - labels[i].size() + 4, ' ')
                << help.flags[i].description
                << (help.flags[i].required ? " (required)" : "") << "\n";
        }
    }
    if (!help.long_description.empty()) {
        out << "\n" << help.long_description << "\n";
    }
    if (!help.examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : help.examples) {
            out << "  " << ex << "\n";
        }
    }
}

} // namespace cinegraph
