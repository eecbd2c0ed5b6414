#include "options.hpp"
#include <sstream>
#include <stdexcept>

namespace {

bool parse_positive_int(const std::string& text, int& value) {
    if (text.empty()) return false;

    std::size_t pos = 0;
    long parsed = 0;
    try {
        parsed = std::stol(text, &pos);
    } catch (const std::exception&) {
        return false;
    }

    if (pos != text.size() || parsed <= 0 || parsed > 1000000) return false;

    value = static_cast<int>(parsed);
    return true;
}

} // namespace

ParsedOptions parse_options(const std::vector<std::string>& args) {
    ParsedOptions result;
    Options& options = result.options;

    for (std::size_t i = 1; i < args.size(); ++i) {
        std::string arg = args[i];
        std::string value;
        bool has_inline_value = false;

        // --opt=value
        std::size_t eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            has_inline_value = true;
        }

        auto take_value = [&](std::string& out) {
            if (has_inline_value) {
                out = value;
                return true;
            }
            if (i + 1 < args.size()) {
                out = args[++i];
                return true;
            }
            result.error = "option " + arg + " requires a value";
            return false;
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-l" || arg == "--list") {
            options.list = true;
        } else if (arg == "-r" || arg == "--rigorous-spaces") {
            options.rigorous_spaces = true;
        } else if (arg == "-c" || arg == "--corpus") {
            if (!take_value(options.corpus)) return result;
        } else if (arg == "-t" || arg == "--time") {
            std::string text;
            if (!take_value(text)) return result;
            if (!parse_positive_int(text, options.time)) {
                result.error = "invalid time: " + text;
                return result;
            }
        } else if (arg == "-w" || arg == "--width") {
            std::string text;
            if (!take_value(text)) return result;
            if (!parse_positive_int(text, options.width)) {
                result.error = "invalid width: " + text;
                return result;
            }
        } else {
            result.error = "unknown option: " + args[i];
            return result;
        }
    }

    return result;
}

std::string usage_text(const std::string& program) {
    std::ostringstream out;
    out << "usage: " << program << " [-h] [-t SECONDS] [-c CORPUS] [-w COLUMNS] [-l] [-r]\n"
        << "\n"
        << "A certain typing contest site spin-off in CLI.\n"
        << "\n"
        << "options:\n"
        << "  -h, --help             show this help message and exit\n"
        << "  -t, --time SECONDS     how long to play the game for (in seconds, default "
        << Config::DEFAULT_TIME_SECONDS << ")\n"
        << "  -c, --corpus CORPUS    built-in corpus name or path to the word list (default "
        << Config::DEFAULT_CORPUS << ")\n"
        << "  -w, --width COLUMNS    width of the terminal to play in (default "
        << Config::DEFAULT_WIDTH << ")\n"
        << "  -l, --list             lists the built-in corpora\n"
        << "  -r, --rigorous-spaces  treat double space as an error\n";
    return out.str();
}
