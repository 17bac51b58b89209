//! # Sessions
//!
//! Pipeline driver: source text to tokens to AST to value.

#include "kite/runtime/session.hpp"

#include "kite/interp/builtins.hpp"
#include "kite/lexer/lexer.hpp"
#include "kite/log/log.hpp"
#include "kite/parser/parser.hpp"

namespace kite::runtime {

Session::Session(SessionOptions options)
    : options_(options), globals_(interpreter_.arena().make_root()) {
    interp::register_builtins(*globals_, *options_.output);
}

auto Session::run(std::string source_name, std::string source_text)
    -> Result<interp::ValuePtr, Error> {
    KITE_LOG_DEBUG("runtime", "Run " << source_name << " (" << source_text.size() << " bytes)");

    auto source = make_rc<const lexer::Source>(std::move(source_name), std::move(source_text));

    lexer::Lexer lexer(source);
    auto tokens = lexer.tokenize();
    if (is_err(tokens)) {
        return unwrap_err(tokens);
    }

    auto ast = parser::parse(std::move(unwrap(tokens)));
    if (is_err(ast)) {
        return unwrap_err(ast);
    }

    interp::Frame frame{.env = globals_, .context = interp::make_program_context()};
    auto result = interpreter_.evaluate(*unwrap(ast), frame);
    if (is_err(result)) {
        KITE_LOG_DEBUG("runtime", "Runtime error: " << unwrap_err(result).message);
        interpreter_.arena().collect({globals_}, {});
        return result;
    }

    interpreter_.arena().collect({globals_}, {unwrap(result)});

    ++run_count_;
    return result;
}

} // namespace kite::runtime
