//! # Environments
//!
//! - `get()`: Find a binding here or in any ancestor
//! - `get_local()`: Find a binding only here
//! - `set()`: Bind in this environment
//! - `remove()`: Drop a local binding
//! - `EnvironmentArena::collect()`: Mark from the roots, release the rest

#include "kite/interp/environment.hpp"

#include "kite/log/log.hpp"

#include <unordered_set>

namespace kite::interp {

Environment::Environment(const EnvPtr& parent) : parent_(parent) {}

auto Environment::get(const std::string& name) const -> ValuePtr {
    auto it = symbols_.find(name);
    if (it != symbols_.end()) {
        return it->second;
    }

    for (EnvPtr env = parent_.lock(); env; env = env->parent_.lock()) {
        auto found = env->symbols_.find(name);
        if (found != env->symbols_.end()) {
            return found->second;
        }
    }
    return nullptr;
}

auto Environment::get_local(const std::string& name) const -> ValuePtr {
    auto it = symbols_.find(name);
    if (it != symbols_.end()) {
        return it->second;
    }
    return nullptr;
}

void Environment::set(const std::string& name, ValuePtr value) {
    symbols_[name] = std::move(value);
}

auto Environment::remove(const std::string& name) -> bool {
    return symbols_.erase(name) > 0;
}

// ============================================================================
// Arena
// ============================================================================

auto EnvironmentArena::make_root() -> EnvPtr {
    return environments_.emplace_back(make_rc<Environment>());
}

auto EnvironmentArena::make_child(const EnvPtr& parent) -> EnvPtr {
    return environments_.emplace_back(make_rc<Environment>(parent));
}

namespace {

struct Marker {
    std::unordered_set<const Environment*> marked;
    std::vector<EnvPtr> pending;

    void mark_env(EnvPtr env) {
        if (env && marked.insert(env.get()).second) {
            pending.push_back(std::move(env));
        }
    }

    void mark_value(const Value& value) {
        if (const auto* function = std::get_if<FunctionValue>(&value.kind)) {
            mark_env(function->closure.lock());
        } else if (const auto* list = std::get_if<ListValue>(&value.kind)) {
            for (const auto& element : list->elements) {
                mark_value(*element);
            }
        }
    }

    void drain() {
        while (!pending.empty()) {
            EnvPtr env = std::move(pending.back());
            pending.pop_back();
            mark_env(env->parent());
            for (const auto& [name, value] : env->symbols()) {
                mark_value(*value);
            }
        }
    }
};

} // namespace

auto EnvironmentArena::collect(const std::vector<EnvPtr>& roots,
                               const std::vector<ValuePtr>& values) -> size_t {
    Marker marker;
    for (const auto& root : roots) {
        marker.mark_env(root);
    }
    for (const auto& value : values) {
        if (value) {
            marker.mark_value(*value);
        }
    }
    marker.drain();

    size_t before = environments_.size();
    std::erase_if(environments_,
                  [&](const EnvPtr& env) { return !marker.marked.contains(env.get()); });
    size_t released = before - environments_.size();

    KITE_LOG_TRACE("interp", "Released " << released << " environments, " << environments_.size()
                                         << " live");
    return released;
}

} // namespace kite::interp
