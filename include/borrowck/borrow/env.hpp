//! # Module Environment
//!
//! Read-only module data shared by every phase, and the helpers the phase
//! walkers use to open a check unit and resolve expression types.
//!
//! ## Check Units
//!
//! A check unit is one function body: a free function, or a method of an
//! `impl` block. Each phase checks every unit independently; nothing about
//! one unit's walk is visible to another.

#ifndef BORROWCK_BORROW_ENV_HPP
#define BORROWCK_BORROW_ENV_HPP

#include "borrowck/ast/ast.hpp"
#include "borrowck/borrow/scope.hpp"

#include <map>
#include <string>
#include <vector>

namespace borrowck::borrow {

/// One function body to check.
struct CheckUnit {
    const ast::FuncDecl* func = nullptr;
    std::string owner;    ///< Implementing type for methods, empty for free functions.
    std::string contract; ///< Implemented contract, empty for inherent methods.

    /// `Type::method` or `function`.
    [[nodiscard]] auto qualified_name() const -> std::string;
};

/// Every function with a body, in declaration order.
[[nodiscard]] auto collect_units(const ast::Module& module) -> std::vector<CheckUnit>;

/// Module-level declarations visible from every unit.
class ModuleEnv {
public:
    struct Global {
        std::string name;
        types::TypePtr type;
        SourceSpan span;
    };

    [[nodiscard]] static auto from_module(const ast::Module& module) -> ModuleEnv;

    /// Declares every global in the module scope of `scopes`.
    void install_globals(ScopeTable& scopes) const;

    /// Declared type of `type_name.field`, or null if unknown.
    [[nodiscard]] auto field_type(std::string_view type_name, std::string_view field) const
        -> types::TypePtr;

    [[nodiscard]] auto globals() const -> const std::vector<Global>& {
        return globals_;
    }

private:
    std::vector<Global> globals_;
    std::map<std::string, std::vector<ast::StructField>, std::less<>> structs_;
};

/// Installs globals, then opens the unit's function scope (depth 1) and
/// declares the receiver and parameters in it.
auto open_unit(ScopeTable& scopes, const ModuleEnv& env, const CheckUnit& unit) -> ScopeId;

/// Declares the identifiers bound by `pattern` in the current scope.
auto declare_pattern(ScopeTable& scopes, const ast::Pattern& pattern, types::TypePtr type)
    -> std::vector<BindingId>;

/// Resolved type of `expr`: the recorded type, else one derived from the
/// bindings and signatures it refers to. Null when nothing is known.
[[nodiscard]] auto type_of(const ast::Expr& expr, const ScopeTable& scopes, const ModuleEnv& env)
    -> types::TypePtr;

/// Whether a value of `type` may hold a borrow. Unknown types and named
/// types (whose fields may be references) are assumed to.
[[nodiscard]] auto may_carry_borrow(const types::TypePtr& type) -> bool;

} // namespace borrowck::borrow

#endif // BORROWCK_BORROW_ENV_HPP
