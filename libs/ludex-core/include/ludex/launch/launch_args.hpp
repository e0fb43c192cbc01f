#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ludex::launch {

/// @brief Placeholder replaced by the launch target in emulator argument templates.
inline constexpr std::string_view kROMPlaceholder = "%ROM%";

/// @brief Splits a command line into words.
///
/// On POSIX hosts words are separated by spaces and tabs, double quotes group words and `\` escapes the next
/// character. On Windows the `CommandLineToArgvW` rules apply.
///
/// @param[in] cmdline the command line
/// @param[out] words receives the words
/// @param[out] error receives a description of the problem if the command line cannot be split
/// @return `true` if the command line was split successfully
bool SplitCommandLine(std::string_view cmdline, std::vector<std::string> &words, std::string &error);

/// @brief Builds the argument vector of an emulator invocation.
///
/// Paths are lexically normalized. If the template contains `%ROM%`, each occurrence is replaced by the quoted target
/// path before splitting. Otherwise the template is split as-is and the target appended as the last argument.
///
/// @param[in] executable the emulator executable, becomes `argv[0]`
/// @param[in] argsTemplate the argument template
/// @param[in] target the file to launch
/// @param[out] argv receives the argument vector
/// @param[out] error receives the splitter's message on failure
/// @return `true` if the template could be split
bool BuildLaunchCommand(const std::filesystem::path &executable, std::string_view argsTemplate,
                        const std::filesystem::path &target, std::vector<std::string> &argv, std::string &error);

} // namespace ludex::launch
