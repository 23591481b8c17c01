//! # Immutability Checker (Phase 1)
//!
//! Validates that mutation only happens through mutable bindings, mutable
//! references and mutating methods, and gates raw pointer dereferences
//! behind `unsafe` regions.
//!
//! ## Rules
//!
//! | Construct                         | Requirement                          | Error  |
//! |-----------------------------------|--------------------------------------|--------|
//! | `x = v`, `x += v`                 | `x` declared `mut`                   | B003   |
//! | `*r = v`                          | `r` is a `mut ref`                   | B003   |
//! | `s.f = v`                         | `s` is `mut`, or a `mut ref`         | B003   |
//! | `mut ref x`                       | `x` is `mut`, or a `mut ref`         | B003   |
//! | `v.push!(x)`                      | `v` is `mut`, or a `mut ref`         | B003   |
//! | call of mutating callable         | written with `!`                     | B013   |
//! | `!` on non-mutating callable      | marker removed                       | B014   |
//! | `self` mutation in non-mutating method | method declared mutating        | B015   |
//! | contract implementation           | same `is_mutating` as the contract   | B016   |
//! | raw pointer `*p`                  | inside `unsafe { }`                  | B017   |

#ifndef BORROWCK_BORROW_IMMUTABILITY_HPP
#define BORROWCK_BORROW_IMMUTABILITY_HPP

#include "borrowck/borrow/env.hpp"
#include "borrowck/borrow/place.hpp"
#include "borrowck/diag/diagnostic.hpp"
#include "borrowck/types/oracle.hpp"

namespace borrowck::borrow {

class ImmutabilityChecker {
public:
    ImmutabilityChecker(const ModuleEnv& env, const types::ContractTable& contracts,
                        const CheckerOptions& options);

    /// Checks one unit. Throws `InvariantViolation` on malformed input.
    void check(const CheckUnit& unit, diag::DiagnosticSink& sink);

private:
    /// What kind of mutation a place undergoes; selects the diagnostic.
    enum class Mutation { Assign, BorrowMut, MutatingCall };

    void check_signature();
    void check_scoped(const ast::Expr& expr, ScopeKind kind);
    void check_block_body(const ast::BlockExpr& block);
    void check_stmt(const ast::Stmt& stmt);
    void check_expr(const ast::Expr& expr);
    void check_call(const ast::CallExpr& call, SourceSpan span);
    void check_method_call(const ast::MethodCallExpr& call, SourceSpan span);
    void check_marker(const std::string& callee, const types::FuncSig& sig, bool marker,
                      SourceSpan span);
    void check_deref(const ast::UnaryExpr& unary, SourceSpan span);

    /// Reports if `target` may not be mutated in the given way.
    void check_mutable_place(const ast::Expr& target, Mutation mutation, SourceSpan span,
                             const std::string& method = {});

    /// Whether mutating `target` is allowed, ignoring receiver special cases.
    [[nodiscard]] auto place_is_mutable(const ast::Expr& target, Mutation mutation) const -> bool;

    [[nodiscard]] auto is_raw_pointer_operand(const ast::Expr& operand) const -> bool;

    const ModuleEnv& env_;
    const types::ContractTable& contracts_;
    const CheckerOptions& options_;

    // Per-unit state
    ScopeTable scopes_;
    diag::DiagnosticSink* sink_ = nullptr;
    const CheckUnit* unit_ = nullptr;
};

} // namespace borrowck::borrow

#endif // BORROWCK_BORROW_IMMUTABILITY_HPP
