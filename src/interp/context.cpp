//! # Execution Contexts
//!
//! Context construction and traceback capture.

#include "kite/interp/context.hpp"

namespace kite::interp {

auto make_program_context() -> ContextPtr {
    return make_rc<const Context>(Context{.name = "<program>", .parent = nullptr, .entry = {}});
}

auto make_call_context(std::string name, ContextPtr caller, const lexer::Position& call_site)
    -> ContextPtr {
    return make_rc<const Context>(
        Context{.name = std::move(name), .parent = std::move(caller), .entry = call_site});
}

auto capture_traceback(const ContextPtr& context, const lexer::Position& position)
    -> std::vector<TraceFrame> {
    std::vector<TraceFrame> frames;

    lexer::Position pos = position;
    for (const Context* ctx = context.get(); ctx != nullptr; ctx = ctx->parent.get()) {
        frames.push_back(TraceFrame{.context_name = ctx->name, .position = pos});
        if (ctx->entry) {
            pos = *ctx->entry;
        }
    }

    return frames;
}

auto runtime_error(RuntimeErrorKind kind, std::string message, const SourceSpan& span,
                   const ContextPtr& context) -> Error {
    return Error::runtime(kind, std::move(message), span, capture_traceback(context, span.start));
}

} // namespace kite::interp
