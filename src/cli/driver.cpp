#include "kite/cli/driver.hpp"

#include "kite/cli/options.hpp"
#include "kite/cli/repl.hpp"
#include "kite/log/log.hpp"
#include "kite/runtime/session.hpp"

#include <iostream>

namespace kite::cli {

auto kite_main(int argc, char* argv[]) -> int {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto parsed = parse_cli_options(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n\n";
        print_usage(std::cerr);
        return 2;
    }
    const auto& options = unwrap(parsed);

    if (options.show_help) {
        print_usage(std::cout);
        return 0;
    }
    if (options.show_version) {
        print_version(std::cout);
        return 0;
    }

    runtime::Session session;
    int code = 0;

    if (options.eval_text) {
        KITE_LOG_DEBUG("repl", "Evaluating -e input");
        code = run_eval(session, options.source_name, *options.eval_text, std::cout, std::cerr);
    } else if (options.script_path) {
        KITE_LOG_INFO("repl", "Running script " << *options.script_path);
        code = run_script(session, *options.script_path, std::cerr);
    } else {
        code = run_repl(session, options, std::cin, std::cout, std::cerr);
    }

    log::Logger::instance().flush();
    return code;
}

} // namespace kite::cli
