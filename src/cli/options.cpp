//! # Command-Line Options
//!
//! Argument parsing, usage and version text.

#include "kite/cli/options.hpp"

#include "kite/log/log.hpp"

#include <string_view>

namespace kite::cli {

auto parse_cli_options(int argc, char* argv[]) -> Result<CliOptions, std::string> {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (log::is_log_option(arg)) {
            continue;
        }

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "--version") {
            options.show_version = true;
        } else if (arg == "-e") {
            if (i + 1 >= argc) {
                return std::string("missing argument for -e");
            }
            options.eval_text = argv[++i];
        } else if (arg.starts_with("--eval=")) {
            options.eval_text = std::string(arg.substr(7));
        } else if (arg.starts_with("--prompt=")) {
            options.prompt = std::string(arg.substr(9));
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "unknown option: " + std::string(arg);
        } else if (options.script_path) {
            return "unexpected argument: " + std::string(arg);
        } else {
            options.script_path = std::string(arg);
        }
    }

    if (options.eval_text && options.script_path) {
        return std::string("cannot combine -e with a script path");
    }

    return options;
}

void print_usage(std::ostream& out) {
    out << "kite " << VERSION << "\n\n";
    out << "Usage: kite [options] [script]\n\n";
    out << "Without a script, starts an interactive session.\n\n";
    out << "Options:\n";
    out << "  -e <text>, --eval=<text>  Evaluate one input and exit\n";
    out << "  --prompt=<text>           Set the interactive prompt\n";
    out << "  --version                 Show version\n";
    out << "  -h, --help                Show this help\n";
    out << "\nLogging:\n";
    out << "  --log-level=<level>       trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<spec>       e.g. parser=trace,*=warn\n";
    out << "  --log-file=<path>         Also write logs to a file\n";
    out << "  --log-format=text|json    Log line format\n";
    out << "  -v, -vv, -vvv, -q         Verbosity shortcuts\n";
}

void print_version(std::ostream& out) {
    out << "kite " << VERSION << "\n";
}

} // namespace kite::cli
