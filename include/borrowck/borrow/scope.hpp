//! # Scope & Binding Table
//!
//! Lexical nesting, binding declarations, declared mutability and region
//! depth. Every phase builds its own table while walking a check unit.
//!
//! ## Layout
//!
//! Scopes live in a flat arena and point at their parent by index; the live
//! scopes always form one chain from the module root to `current_scope()`.
//!
//! ```text
//! scopes_[0]  Module    depth 0   globals
//! scopes_[1]  Function  depth 1   receiver, parameters
//! scopes_[2]  Block     depth 2   function body locals
//! scopes_[3]  Branch    depth 3   `if` arm locals
//! ```
//!
//! ## Shadowing
//!
//! Re-declaring a name creates a new `BindingId`. `lookup` walks the live
//! chain innermost-first and each scope's bindings latest-first, so the
//! newest visible declaration wins. Ids resolved earlier keep naming the old
//! binding.

#ifndef BORROWCK_BORROW_SCOPE_HPP
#define BORROWCK_BORROW_SCOPE_HPP

#include "borrowck/common.hpp"
#include "borrowck/types/type.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace borrowck::borrow {

using ScopeId = uint32_t;
using BindingId = uint32_t;

/// Raised when the tree or the walk breaks an upstream guarantee (an
/// unresolvable name, unbalanced scope exits). Never a user diagnostic.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& message) : std::logic_error(message) {}
};

enum class ScopeKind {
    Module,
    Function,
    Block,
    Branch,
    Loop,
    Closure,
    Unsafe,
};

enum class BindingKind {
    Global,
    Param,
    Receiver,
    Local,
};

[[nodiscard]] auto scope_kind_name(ScopeKind kind) -> const char*;

struct Binding {
    BindingId id;
    std::string name;
    bool is_mut;
    types::TypePtr type;
    ScopeId scope;
    SourceSpan span;
    size_t depth; ///< Region depth, fixed at declaration.
    BindingKind kind;
};

struct Scope {
    ScopeId id;
    std::optional<ScopeId> parent;
    size_t depth;
    ScopeKind kind;
    bool live;
    std::vector<BindingId> bindings;
};

/// Called with the scope being exited, before it is marked dead.
using ExitHook = std::function<void(const Scope&)>;

class ScopeTable {
public:
    /// Creates the table with the live module scope (id 0, depth 0).
    ScopeTable();

    /// Opens a child of the current scope and makes it current.
    auto enter_scope(ScopeKind kind) -> ScopeId;

    /// Closes `id`, which must be the current scope. Runs the exit hooks.
    void exit_scope(ScopeId id);

    /// Declares a binding in the current scope.
    auto declare_binding(std::string name, bool is_mut, types::TypePtr type, SourceSpan span,
                         BindingKind kind = BindingKind::Local) -> BindingId;

    /// Innermost visible binding named `name`.
    [[nodiscard]] auto lookup(std::string_view name) const -> std::optional<BindingId>;

    /// Like `lookup`, but an unresolvable name is an `InvariantViolation`.
    [[nodiscard]] auto resolve(std::string_view name) const -> BindingId;

    [[nodiscard]] auto region_depth(BindingId id) const -> size_t;

    [[nodiscard]] auto binding(BindingId id) const -> const Binding&;
    [[nodiscard]] auto scope(ScopeId id) const -> const Scope&;

    [[nodiscard]] auto current_scope() const -> ScopeId {
        return current_;
    }

    [[nodiscard]] auto current_depth() const -> size_t {
        return scopes_[current_].depth;
    }

    /// Nearest live scope of `kind`, starting at the current scope.
    [[nodiscard]] auto nearest(ScopeKind kind) const -> std::optional<ScopeId>;

    /// True if the current scope or one of its ancestors has `kind`.
    [[nodiscard]] auto within(ScopeKind kind) const -> bool {
        return nearest(kind).has_value();
    }

    /// True if `id` was declared in `scope` or one of its descendants.
    [[nodiscard]] auto declared_within(BindingId id, ScopeId scope) const -> bool;

    void add_exit_hook(ExitHook hook);

    [[nodiscard]] auto binding_count() const -> size_t {
        return bindings_.size();
    }

    [[nodiscard]] auto scope_count() const -> size_t {
        return scopes_.size();
    }

private:
    std::vector<Scope> scopes_;
    std::vector<Binding> bindings_;
    std::vector<ExitHook> exit_hooks_;
    ScopeId current_ = 0;
};

} // namespace borrowck::borrow

#endif // BORROWCK_BORROW_SCOPE_HPP
