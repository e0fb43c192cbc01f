#include <ludex/launch/launch_args.hpp>

#include <ludex/util/string_ops.hpp>

#include <boost/program_options/parsers.hpp>
#include <boost/tokenizer.hpp>

namespace ludex::launch {

#ifndef _WIN32
// Only double quotes group words; apostrophes stay literal
static constexpr const char *kQuoteChars = "\"";
#endif

bool SplitCommandLine(std::string_view cmdline, std::vector<std::string> &words, std::string &error) {
    words.clear();
    try {
#ifdef _WIN32
        words = boost::program_options::split_winmain(std::string{cmdline});
#else
        words = boost::program_options::split_unix(std::string{cmdline}, " \t", kQuoteChars, "\\");
#endif
    } catch (const boost::escaped_list_error &e) {
        error = e.what();
        words.clear();
        return false;
    }
    return true;
}

// Quotes a path so that it survives splitting as a single word.
static std::string QuoteForSplit(std::string_view path) {
    std::string out{};
    out.reserve(path.size() + 2);
    out += '"';
    for (char ch : path) {
#ifndef _WIN32
        if (ch == '"' || ch == '\\') {
            out += '\\';
        }
#endif
        out += ch;
    }
    out += '"';
    return out;
}

bool BuildLaunchCommand(const std::filesystem::path &executable, std::string_view argsTemplate,
                        const std::filesystem::path &target, std::vector<std::string> &argv, std::string &error) {
    const std::string exeStr = util::PathString(executable.lexically_normal());
    const std::string targetStr = util::PathString(target.lexically_normal());

    argv.clear();
    argv.push_back(exeStr);

    if (util::Trim(argsTemplate).empty()) {
        argv.push_back(targetStr);
        return true;
    }

    std::vector<std::string> words{};
    if (argsTemplate.find(kROMPlaceholder) != std::string_view::npos) {
        const std::string quoted = QuoteForSplit(targetStr);
        std::string cmdline{argsTemplate};
        for (size_t pos = cmdline.find(kROMPlaceholder); pos != std::string::npos;
             pos = cmdline.find(kROMPlaceholder, pos + quoted.size())) {
            cmdline.replace(pos, kROMPlaceholder.size(), quoted);
        }
        if (!SplitCommandLine(cmdline, words, error)) {
            argv.clear();
            return false;
        }
        argv.insert(argv.end(), words.begin(), words.end());
    } else {
        if (!SplitCommandLine(argsTemplate, words, error)) {
            argv.clear();
            return false;
        }
        argv.insert(argv.end(), words.begin(), words.end());
        argv.push_back(targetStr);
    }
    return true;
}

} // namespace ludex::launch
