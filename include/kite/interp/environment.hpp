//! # Environments
//!
//! An `Environment` maps names to values for one scope and links to the scope
//! it was created in. Lookup walks outward through the parents; writes always
//! land in the local table.
//!
//! One environment is created per session (the globals) and one per function
//! call, whose parent is the environment the function was defined in.
//!
//! ## Ownership
//!
//! Every environment is owned by an `EnvironmentArena`. Parent links and
//! function closures are weak, so bindings never keep a scope alive and no
//! ownership cycle can form. `EnvironmentArena::collect()` releases the
//! environments that are no longer reachable from a set of roots.

#ifndef KITE_INTERP_ENVIRONMENT_HPP
#define KITE_INTERP_ENVIRONMENT_HPP

#include "kite/common.hpp"
#include "kite/interp/value.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace kite::interp {

class Environment {
public:
    /// Creates a root environment with no parent.
    Environment() = default;

    /// Creates a child environment. `parent` is not owned.
    explicit Environment(const EnvPtr& parent);

    /// Looks a name up here, then in each ancestor. Returns null if unbound.
    [[nodiscard]] auto get(const std::string& name) const -> ValuePtr;

    /// Looks a name up in this environment only.
    [[nodiscard]] auto get_local(const std::string& name) const -> ValuePtr;

    /// Binds `name` in this environment, replacing a local binding if any.
    void set(const std::string& name, ValuePtr value);

    /// Removes a local binding. Returns false if `name` was not bound here.
    auto remove(const std::string& name) -> bool;

    /// Returns the parent environment, or nullptr for the root or a released
    /// parent.
    [[nodiscard]] auto parent() const -> EnvPtr {
        return parent_.lock();
    }

    [[nodiscard]] auto symbols() const -> const std::unordered_map<std::string, ValuePtr>& {
        return symbols_;
    }

private:
    std::unordered_map<std::string, ValuePtr> symbols_;
    WeakEnvPtr parent_;
};

/// Owner of the environments created while evaluating.
class EnvironmentArena {
public:
    EnvironmentArena() = default;
    EnvironmentArena(const EnvironmentArena&) = delete;
    auto operator=(const EnvironmentArena&) -> EnvironmentArena& = delete;

    [[nodiscard]] auto make_root() -> EnvPtr;
    [[nodiscard]] auto make_child(const EnvPtr& parent) -> EnvPtr;

    /// Releases every environment not reachable from `roots` or from the
    /// closures inside `values`. Returns the number released.
    ///
    /// Must not run while an evaluation is in progress.
    auto collect(const std::vector<EnvPtr>& roots, const std::vector<ValuePtr>& values)
        -> size_t;

    /// Number of environments currently owned.
    [[nodiscard]] auto size() const -> size_t {
        return environments_.size();
    }

private:
    std::vector<EnvPtr> environments_;
};

} // namespace kite::interp

#endif // KITE_INTERP_ENVIRONMENT_HPP
