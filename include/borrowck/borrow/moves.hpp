//! # Move Checker (Phase 2)
//!
//! A forward dataflow pass per unit tracking the ownership state of every
//! non-Copy binding.
//!
//! ## State Machine
//!
//! ```text
//!             move whole                     move field
//!   Owned ───────────────> Moved    Owned ──────────────> PartiallyMoved{f}
//!     ^                      │        ^                        │
//!     └──── reassign ────────┘        └──── reassign all f ────┘
//! ```
//!
//! A binding declared without an initializer starts `Moved` with the
//! `uninitialized` flag, so its diagnostics say "possibly-uninitialized".
//!
//! ## Joins
//!
//! After `if` and `when` a binding is `Owned` only when it is `Owned` on
//! every incoming path that completes normally. Loops iterate silently to a
//! fixpoint and are then re-walked once with diagnostics enabled.

#ifndef BORROWCK_BORROW_MOVES_HPP
#define BORROWCK_BORROW_MOVES_HPP

#include "borrowck/borrow/closure.hpp"
#include "borrowck/borrow/env.hpp"
#include "borrowck/borrow/place.hpp"
#include "borrowck/diag/diagnostic.hpp"
#include "borrowck/types/oracle.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace borrowck::borrow {

enum class OwnershipKind {
    Owned,
    Moved,
    PartiallyMoved,
};

struct OwnershipState {
    OwnershipKind kind = OwnershipKind::Owned;
    bool uninitialized = false;         ///< Moved because never assigned.
    std::set<std::string> moved_fields; ///< Dotted field paths, for PartiallyMoved.
    std::optional<SourceSpan> moved_at;

    [[nodiscard]] auto operator==(const OwnershipState& other) const -> bool = default;

    [[nodiscard]] static auto join(const OwnershipState& a, const OwnershipState& b)
        -> OwnershipState;
};

/// Ownership of every tracked binding at one program point. Bindings absent
/// from the map are `Owned`.
struct FlowState {
    std::map<BindingId, OwnershipState> bindings;
    bool diverged = false; ///< No normal path reaches this point.

    [[nodiscard]] auto operator==(const FlowState& other) const -> bool = default;

    [[nodiscard]] auto get(BindingId id) const -> OwnershipState;
    void set(BindingId id, OwnershipState state);

    /// Join of two incoming paths; a diverged side contributes nothing.
    [[nodiscard]] static auto join(const FlowState& a, const FlowState& b) -> FlowState;
};

class MoveChecker {
public:
    /// Upper bound on silent loop iterations before the head state is taken as is.
    static constexpr int MAX_LOOP_ITERATIONS = 32;

    MoveChecker(const ModuleEnv& env, const types::CopyOracle& oracle);

    /// Checks one unit. Throws `InvariantViolation` on malformed input.
    void check(const CheckUnit& unit, diag::DiagnosticSink& sink);

private:
    enum class Use { Read, Consume };

    /// Break and continue states collected for one loop.
    struct LoopFrame {
        std::vector<FlowState> breaks;
        std::vector<FlowState> continues;
    };

    /// States observed during one walk of a loop body.
    struct LoopPass {
        FlowState head;     ///< After the condition, before the body.
        FlowState body_end; ///< After the body completes normally.
        LoopFrame frame;
    };

    void walk_scoped(const ast::Expr& expr, ScopeKind kind, Use use);
    void walk_block_body(const ast::BlockExpr& block, Use use);
    void walk_stmt(const ast::Stmt& stmt);
    void walk_expr(const ast::Expr& expr, Use use);
    void walk_place(const ast::Expr& expr, const Place& place, Use use);
    void walk_projection_operands(const ast::Expr& expr);
    void walk_assign(const ast::BinaryExpr& assign);
    void walk_args(const std::vector<ast::ExprPtr>& args,
                   const std::vector<types::TypePtr>& params);
    void walk_call(const ast::CallExpr& call);
    void walk_closure(const ast::ClosureExpr& closure, SourceSpan span);
    void walk_when(const ast::WhenExpr& when, Use use);

    /// Iterates the loop silently until the state at its head stops
    /// changing, then walks it once more with reporting on.
    auto walk_loop(const ast::Expr* condition, const ast::Expr& body, const ast::Pattern* pattern)
        -> LoopPass;
    auto walk_loop_once(const ast::Expr* condition, const ast::Expr& body,
                        const ast::Pattern* pattern) -> LoopPass;

    void declare_let(const ast::LetStmt& let);

    /// Reports a use of `place` that its current state forbids.
    void check_use(const Place& place, SourceSpan span);
    void mark_moved(const Place& place, SourceSpan span);

    [[nodiscard]] auto is_tracked(BindingId id) const -> bool;
    [[nodiscard]] auto param_types(const ast::CallExpr& call) const -> std::vector<types::TypePtr>;
    void prune(FlowState& state) const;
    void report(diag::Diagnostic diagnostic);

    const ModuleEnv& env_;
    const types::CopyOracle& oracle_;

    // Per-unit state
    ScopeTable scopes_;
    FlowState state_;
    std::map<BindingId, CallableKind> closure_kinds_;
    std::map<const ast::ClosureExpr*, CallableKind> closure_nodes_;
    std::vector<LoopFrame> loops_;
    int silent_ = 0;
    diag::DiagnosticSink* sink_ = nullptr;
};

} // namespace borrowck::borrow

#endif // BORROWCK_BORROW_MOVES_HPP
