#include "app/app.hpp"

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <cstdio>
#include <memory>
#include <system_error>

static constexpr const char *kUsage = R"(<command> [args]

Commands:
  scan                                  Scan the library roots and rebuild the catalog
  list                                  List games (--platform, --search, --sort, --favorites, --recents)
  info <key>                            Show details of a game
  launch <key>                          Launch a game and track its playtime (--emulator, --set-default)
  reveal <key>                          Show a game in the file manager
  favorite <key>                        Toggle a game's favorite state
  set-emulator <key> [name]             Set or clear a game's emulator override
  notes <key> [text]                    Set or clear a game's notes
  tags <key> [tag...]                   Replace a game's tags
  delete <key> --yes                    Permanently delete a game's files from disk
  roots list|add|remove [path]          Manage library roots
  emulators list|add|edit|remove|scan|run [arg]
                                        Manage emulators (--name, --systems, --args)
  defaults list|set|clear [platform]    Manage platform default emulators
  cache clear                           Delete the catalog cache

Keys may be abbreviated to any unique prefix.)";

int main(int argc, char **argv) {
    bool showHelp = false;

    app::CommandLineOptions progOpts{};
    cxxopts::Options options("ludex", "Ludex - game library cataloger and launcher");
    options.custom_help("[options]");
    options.positional_help(kUsage);

    options.add_options()("p,profile", "Path to profile directory", cxxopts::value(progOpts.profilePath));
    options.add_options()("v,verbose", "Print debug logs",
                          cxxopts::value(progOpts.verbose)->default_value("false"));
    options.add_options()("h,help", "Display help text", cxxopts::value(showHelp)->default_value("false"));

    options.add_options("list")("platform", "Only list games of this platform", cxxopts::value(progOpts.platform));
    options.add_options("list")("search", "Only list games whose title contains this text",
                                cxxopts::value(progOpts.search));
    options.add_options("list")("sort", "Sort order: name, size, size-asc or playtime", cxxopts::value(progOpts.sort));
    options.add_options("list")("favorites", "Only list favorite games",
                                cxxopts::value(progOpts.favorites)->default_value("false"));
    options.add_options("list")("recents", "List recently played games, most recent first",
                                cxxopts::value(progOpts.recents)->default_value("false"));

    options.add_options("launch")("emulator", "Emulator to launch with", cxxopts::value(progOpts.emulator));
    options.add_options("launch")("set-default", "Make --emulator the platform default",
                                  cxxopts::value(progOpts.setDefault)->default_value("false"));

    options.add_options("delete")("yes", "Confirm deleting files from disk",
                                  cxxopts::value(progOpts.confirmDelete)->default_value("false"));

    options.add_options("emulators")("name", "Emulator name", cxxopts::value(progOpts.name));
    options.add_options("emulators")("systems", "Comma-separated platforms handled by the emulator",
                                     cxxopts::value(progOpts.systems));
    options.add_options("emulators")("args", "Argument template; %ROM% is replaced by the game path",
                                     cxxopts::value(progOpts.emulatorArgs));

    options.add_options("positional")("command", "Command", cxxopts::value(progOpts.command));
    options.add_options("positional")("arguments", "Command arguments", cxxopts::value(progOpts.args));
    options.parse_positional({"command", "arguments"});

    try {
        auto result = options.parse(argc, argv);
        if (showHelp) {
            fmt::print("{}\n", options.help({"", "list", "launch", "delete", "emulators"}));
            return 0;
        }

        auto app = std::make_unique<app::App>();
        return app->Run(progOpts);
    } catch (const cxxopts::exceptions::exception &e) {
        fmt::print(stderr, "Failed to parse arguments: {}\n", e.what());
        return -1;
    } catch (const std::system_error &e) {
        fmt::print(stderr, "System error: {}\n", e.what());
        return e.code().value();
    } catch (const std::exception &e) {
        fmt::print(stderr, "Unhandled exception: {}\n", e.what());
        return -1;
    }

    return 0;
}
