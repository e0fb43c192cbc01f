#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace app {

struct CommandLineOptions {
    std::filesystem::path profilePath;
    bool verbose;

    std::string command;
    std::vector<std::string> args;

    // list
    std::string platform;
    std::string search;
    std::string sort;
    bool favorites;
    bool recents;

    // launch
    std::string emulator;
    bool setDefault;

    // delete
    bool confirmDelete;

    // emulators add
    std::string name;
    std::vector<std::string> systems;
    std::string emulatorArgs;
};

} // namespace app
