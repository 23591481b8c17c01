//! # Scope & Binding Table Implementation

#include "borrowck/borrow/scope.hpp"

namespace borrowck::borrow {

auto scope_kind_name(ScopeKind kind) -> const char* {
    switch (kind) {
    case ScopeKind::Module:
        return "module";
    case ScopeKind::Function:
        return "function";
    case ScopeKind::Block:
        return "block";
    case ScopeKind::Branch:
        return "branch";
    case ScopeKind::Loop:
        return "loop";
    case ScopeKind::Closure:
        return "closure";
    case ScopeKind::Unsafe:
        return "unsafe";
    }
    return "?";
}

ScopeTable::ScopeTable() {
    scopes_.push_back(Scope{
        .id = 0,
        .parent = std::nullopt,
        .depth = 0,
        .kind = ScopeKind::Module,
        .live = true,
        .bindings = {},
    });
}

auto ScopeTable::enter_scope(ScopeKind kind) -> ScopeId {
    auto id = static_cast<ScopeId>(scopes_.size());
    scopes_.push_back(Scope{
        .id = id,
        .parent = current_,
        .depth = scopes_[current_].depth + 1,
        .kind = kind,
        .live = true,
        .bindings = {},
    });
    current_ = id;
    return id;
}

void ScopeTable::exit_scope(ScopeId id) {
    if (id != current_ || id == 0) {
        throw InvariantViolation("exit of scope " + std::to_string(id) +
                                 " while the innermost live scope is " + std::to_string(current_));
    }

    // Hooks may register further hooks; iterate by index over copies.
    for (size_t i = 0; i < exit_hooks_.size(); ++i) {
        auto hook = exit_hooks_[i];
        hook(scopes_[id]);
    }

    scopes_[id].live = false;
    current_ = *scopes_[id].parent;
}

auto ScopeTable::declare_binding(std::string name, bool is_mut, types::TypePtr type,
                                 SourceSpan span, BindingKind kind) -> BindingId {
    auto id = static_cast<BindingId>(bindings_.size());
    bindings_.push_back(Binding{
        .id = id,
        .name = std::move(name),
        .is_mut = is_mut,
        .type = std::move(type),
        .scope = current_,
        .span = span,
        .depth = scopes_[current_].depth,
        .kind = kind,
    });
    scopes_[current_].bindings.push_back(id);
    return id;
}

auto ScopeTable::lookup(std::string_view name) const -> std::optional<BindingId> {
    std::optional<ScopeId> scope = current_;
    while (scope) {
        const auto& bindings = scopes_[*scope].bindings;
        for (auto it = bindings.rbegin(); it != bindings.rend(); ++it) {
            if (bindings_[*it].name == name) {
                return *it;
            }
        }
        scope = scopes_[*scope].parent;
    }
    return std::nullopt;
}

auto ScopeTable::resolve(std::string_view name) const -> BindingId {
    auto id = lookup(name);
    if (!id) {
        throw InvariantViolation("unresolved name `" + std::string(name) + "`");
    }
    return *id;
}

auto ScopeTable::region_depth(BindingId id) const -> size_t {
    return binding(id).depth;
}

auto ScopeTable::binding(BindingId id) const -> const Binding& {
    if (id >= bindings_.size()) {
        throw InvariantViolation("unknown binding id " + std::to_string(id));
    }
    return bindings_[id];
}

auto ScopeTable::scope(ScopeId id) const -> const Scope& {
    if (id >= scopes_.size()) {
        throw InvariantViolation("unknown scope id " + std::to_string(id));
    }
    return scopes_[id];
}

auto ScopeTable::nearest(ScopeKind kind) const -> std::optional<ScopeId> {
    std::optional<ScopeId> scope = current_;
    while (scope) {
        if (scopes_[*scope].kind == kind) {
            return scope;
        }
        scope = scopes_[*scope].parent;
    }
    return std::nullopt;
}

auto ScopeTable::declared_within(BindingId id, ScopeId scope) const -> bool {
    std::optional<ScopeId> s = binding(id).scope;
    while (s) {
        if (*s == scope) {
            return true;
        }
        s = scopes_[*s].parent;
    }
    return false;
}

void ScopeTable::add_exit_hook(ExitHook hook) {
    exit_hooks_.push_back(std::move(hook));
}

} // namespace borrowck::borrow
