#pragma once

#include "cmdline_opts.hpp"
#include "profile.hpp"

#include <ludex/config/library_config.hpp>
#include <ludex/library/library.hpp>

#include <optional>
#include <string>

namespace app {

class App {
public:
    App();

    // Runs the command given in the options and returns the process exit code.
    int Run(const CommandLineOptions &options);

private:
    CommandLineOptions m_options;

    Profile m_profile;
    ludex::config::LibraryConfig m_config;

    int CmdScan(ludex::Library &library);
    int CmdList(ludex::Library &library);
    int CmdInfo(ludex::Library &library);
    int CmdLaunch(ludex::Library &library);
    int CmdReveal(ludex::Library &library);
    int CmdFavorite(ludex::Library &library);
    int CmdSetEmulator(ludex::Library &library);
    int CmdNotes(ludex::Library &library);
    int CmdTags(ludex::Library &library);
    int CmdDelete(ludex::Library &library);
    int CmdRoots();
    int CmdEmulators(ludex::Library &library);
    int CmdDefaults();
    int CmdCache(ludex::Library &library);

    // Resolves a full key or a unique key prefix given as the first command argument.
    std::optional<ludex::CatalogEntry> ResolveEntryArg(ludex::Library &library) const;

    // Saves the configuration, reporting failures. Returns the exit code.
    int SaveConfig();
};

} // namespace app
