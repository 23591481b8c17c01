//! # Lifetime Checker (Phase 4)
//!
//! Proves that no reference outlives the storage it points to, using only
//! lexical region depths.
//!
//! ## Regions
//!
//! Every binding's region is the depth of its declaring scope (module 0,
//! parameters 1, function body 2, +1 per nested scope). A reference's region
//! is the region of its referent. Bindings that hold references remember the
//! set of regions they may point into.
//!
//! ## Rules
//!
//! | Rule          | Condition                                             | Error |
//! |---------------|-------------------------------------------------------|-------|
//! | Return        | returned region deeper than the parameter depth       | B010  |
//! | Construction  | value stored in a binding shallower than its referent | B012  |
//! | Store-through | `*out = ref x` with `x` deeper than `out`'s referent  | B012  |
//! | Block escape  | block tail refers into the block's own scope          | B012  |
//!
//! Returning a reference to a parameter is accepted: parameters live at the
//! parameter depth.

#ifndef BORROWCK_BORROW_LIFETIMES_HPP
#define BORROWCK_BORROW_LIFETIMES_HPP

#include "borrowck/borrow/closure.hpp"
#include "borrowck/borrow/env.hpp"
#include "borrowck/borrow/place.hpp"
#include "borrowck/diag/diagnostic.hpp"
#include "borrowck/types/oracle.hpp"

#include <map>
#include <optional>
#include <vector>

namespace borrowck::borrow {

/// Storage a reference may point into.
struct Region {
    size_t depth;
    std::optional<BindingId> referent; ///< None for storage outside the unit.
};

class LifetimeChecker {
public:
    LifetimeChecker(const ModuleEnv& env, const types::CopyOracle& oracle);

    /// Checks one unit. Throws `InvariantViolation` on malformed input.
    void check(const CheckUnit& unit, diag::DiagnosticSink& sink);

private:
    using Regions = std::vector<Region>;

    /// Walks `expr` in a fresh scope. With `escape_check`, tail regions that
    /// point into the scope are reported and dropped.
    auto walk_scoped(const ast::Expr& expr, ScopeKind kind, bool escape_check) -> Regions;
    void walk_stmt(const ast::Stmt& stmt);
    auto walk_expr(const ast::Expr& expr) -> Regions;
    void walk_assign(const ast::BinaryExpr& assign, SourceSpan span);
    auto walk_args(const std::vector<ast::ExprPtr>& args) -> Regions;
    auto walk_closure(const ast::ClosureExpr& closure, SourceSpan span) -> Regions;

    /// Regions a borrow of `place` points into.
    [[nodiscard]] auto borrow_regions(const Place& place) const -> Regions;

    /// Regions the value of `id` points into.
    [[nodiscard]] auto referents_of(BindingId id) const -> Regions;

    void seed_parameters(ScopeId scope);

    /// Reports B010 for every region deeper than `limit`.
    void check_return(const Regions& regions, size_t limit, SourceSpan span);

    /// Reports B012 for every region declared inside `scope`; returns the rest.
    auto drop_escaping(const Regions& regions, ScopeId scope, SourceSpan span) -> Regions;

    /// Reports B012 for every region deeper than `depth`; returns the rest.
    auto check_store(const Regions& regions, size_t depth, SourceSpan span) -> Regions;

    const ModuleEnv& env_;
    const types::CopyOracle& oracle_;

    // Per-unit state
    ScopeTable scopes_;
    std::map<BindingId, Regions> referents_;
    std::vector<size_t> return_depths_;
    diag::DiagnosticSink* sink_ = nullptr;
};

} // namespace borrowck::borrow

#endif // BORROWCK_BORROW_LIFETIMES_HPP
