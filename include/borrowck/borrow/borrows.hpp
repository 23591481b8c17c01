//! # Borrow Checker (Phase 3)
//!
//! Tracks the live borrows of every place and rejects conflicting access.
//!
//! ## Exclusivity
//!
//! | Live borrow \ New access | shared `ref` | `mut ref` | assign / mutating call | move |
//! |--------------------------|--------------|-----------|------------------------|------|
//! | none                     | ok           | ok        | ok                     | ok   |
//! | `Immutable`              | ok           | B007      | B004                   | B002 |
//! | `Mutable`                | B009         | B008      | B004                   | B002 |
//!
//! A conflicting borrow is reported and not recorded, so one mistake yields
//! one diagnostic.
//!
//! ## Borrow End
//!
//! When a borrow stops being live is decided by a `BorrowEndPolicy`. The
//! default `LexicalScopePolicy` keeps a borrow held by a binding alive until
//! the binding's scope exits, and a temporary borrow (an argument or an
//! auto-borrowed receiver) until the end of its statement. Temporaries fed
//! to a call whose result cannot hold a borrow end when the call returns,
//! and a mutating method's receiver borrow starts after its arguments, so
//! `x = f(ref x)` and `v.push!(v.len())` are accepted.

#ifndef BORROWCK_BORROW_BORROWS_HPP
#define BORROWCK_BORROW_BORROWS_HPP

#include "borrowck/borrow/closure.hpp"
#include "borrowck/borrow/env.hpp"
#include "borrowck/borrow/place.hpp"
#include "borrowck/diag/diagnostic.hpp"
#include "borrowck/types/oracle.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace borrowck::borrow {

using BorrowId = uint32_t;

enum class BorrowKind {
    Immutable,
    Mutable,
};

struct Borrow {
    BorrowId id;
    std::optional<BindingId> holder; ///< None for temporaries.
    Place place;
    BorrowKind kind;
    SourceSpan span;
    ScopeId scope; ///< Scope the borrow's lifetime is tied to.
};

/// Decides when a live borrow ends.
class BorrowEndPolicy {
public:
    virtual ~BorrowEndPolicy() = default;

    /// Whether `borrow` ends when `exiting` is closed.
    [[nodiscard]] virtual auto ends_at_scope_exit(const Borrow& borrow, const Scope& exiting) const
        -> bool = 0;

    /// Whether `borrow` ends at the end of a statement directly in `scope`.
    [[nodiscard]] virtual auto ends_at_statement_end(const Borrow& borrow, ScopeId scope,
                                                     const ScopeTable& scopes) const -> bool = 0;
};

/// Held borrows end with their holder's scope; temporaries with their
/// statement.
class LexicalScopePolicy : public BorrowEndPolicy {
public:
    [[nodiscard]] auto ends_at_scope_exit(const Borrow& borrow, const Scope& exiting) const
        -> bool override;

    [[nodiscard]] auto ends_at_statement_end(const Borrow& borrow, ScopeId scope,
                                             const ScopeTable& scopes) const -> bool override;
};

[[nodiscard]] auto make_borrow_end_policy(BorrowEndStrategy strategy)
    -> std::unique_ptr<BorrowEndPolicy>;

class BorrowChecker {
public:
    BorrowChecker(const ModuleEnv& env, const types::CopyOracle& oracle,
                  const CheckerOptions& options);

    /// Uses `policy` instead of the one named by `options.borrow_end`.
    BorrowChecker(const ModuleEnv& env, const types::CopyOracle& oracle,
                  std::unique_ptr<BorrowEndPolicy> policy);

    /// Checks one unit. Throws `InvariantViolation` on malformed input.
    void check(const CheckUnit& unit, diag::DiagnosticSink& sink);

    /// Capture analysis of every closure met so far, across units.
    [[nodiscard]] auto closures() const -> const ClosureTable& {
        return closures_;
    }

private:
    enum class Use { Read, Consume };

    /// A borrow carried by a value, not yet attached to a holder.
    struct Loan {
        Place place;
        BorrowKind kind;
        SourceSpan span;
    };
    using Loans = std::vector<Loan>;

    auto walk_scoped(const ast::Expr& expr, ScopeKind kind, Use use) -> Loans;
    void walk_stmt(const ast::Stmt& stmt);
    auto walk_expr(const ast::Expr& expr, Use use) -> Loans;
    auto walk_place(const ast::Expr& expr, const Place& place, Use use) -> Loans;
    void walk_projection_operands(const ast::Expr& expr);
    auto walk_assign(const ast::BinaryExpr& assign, SourceSpan span) -> Loans;
    auto walk_call(const ast::CallExpr& call) -> Loans;
    auto walk_method_call(const ast::MethodCallExpr& call, SourceSpan span) -> Loans;
    auto walk_args(const std::vector<ast::ExprPtr>& args,
                   const std::vector<types::TypePtr>& params) -> Loans;
    auto walk_closure(const ast::ClosureExpr& closure, SourceSpan span) -> Loans;
    auto walk_loop(const ast::Expr* condition, const ast::Expr& body, const ast::Pattern* pattern)
        -> Loans;

    /// Checks a new borrow of `place` and records it as a temporary.
    /// Returns the loan, or nullopt when it conflicted.
    auto create_borrow(const Place& place, BorrowKind kind, SourceSpan span)
        -> std::optional<Loan>;

    /// Records a temporary borrow without checking it.
    auto record_temporary(const Place& place, BorrowKind kind, SourceSpan span) -> Loan;

    /// Reports B004 if `place` has an overlapping live borrow.
    void check_mutation(const Place& place, SourceSpan span);

    /// Reports B002 if `place` has an overlapping live borrow.
    void check_move(const Place& place, SourceSpan span);

    /// Attaches `loans` to `holder` for the lifetime of its scope.
    void hold(BindingId holder, const Loans& loans);
    void release(BindingId holder);
    [[nodiscard]] auto held_by(BindingId holder) const -> Loans;

    void end_statement();

    /// Ends the temporaries created since `mark`, once a call's result is
    /// known not to carry them.
    void end_temporaries_since(BorrowId mark);
    void join_live(const std::vector<Borrow>& other);
    [[nodiscard]] auto first_overlap(const Place& place, bool mutable_only) const
        -> const Borrow*;
    [[nodiscard]] auto param_types(const ast::CallExpr& call) const -> std::vector<types::TypePtr>;
    void report(diag::Diagnostic diagnostic);

    const ModuleEnv& env_;
    const types::CopyOracle& oracle_;
    std::unique_ptr<BorrowEndPolicy> policy_;
    ClosureTable closures_;

    // Per-unit state
    ScopeTable scopes_;
    std::vector<Borrow> live_;
    BorrowId next_id_ = 0;
    int silent_ = 0;
    diag::DiagnosticSink* sink_ = nullptr;
};

} // namespace borrowck::borrow

#endif // BORROWCK_BORROW_BORROWS_HPP
