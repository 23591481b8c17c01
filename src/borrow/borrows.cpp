//! # Borrow Checker Implementation
//!
//! Every walk returns the loans carried by the expression's value: the
//! borrows it was built from. A `let` or an assignment hands those loans to
//! the bound binding, which then holds them until the policy ends them.
//!
//! | Expression              | Loans carried                                 |
//! |-------------------------|-----------------------------------------------|
//! | `ref p` / `mut ref p`   | the new borrow of `p`                         |
//! | binding                 | the loans it holds                            |
//! | aggregate literal       | union of the elements' loans                  |
//! | call returning a borrow | loans of the arguments and receiver           |
//! | closure                 | borrows created for its by-reference captures |
//! | block, `if`, `when`     | loans of the tails                            |
//!
//! Branches and loops join by union: a borrow live on any incoming path is
//! live after the join. A loop body is walked once silently and once more
//! from the resulting set, so borrows stored across iterations are seen.

#include "borrowck/borrow/borrows.hpp"

#include "borrowck/log/log.hpp"

#include <algorithm>

namespace borrowck::borrow {

namespace {

template <typename T> void append(std::vector<T>& to, std::vector<T> from) {
    to.insert(to.end(), std::make_move_iterator(from.begin()), std::make_move_iterator(from.end()));
}

} // namespace

// ============================================================================
// Borrow end policies
// ============================================================================

auto LexicalScopePolicy::ends_at_scope_exit(const Borrow& borrow, const Scope& exiting) const
    -> bool {
    return borrow.holder.has_value() && borrow.scope == exiting.id;
}

auto LexicalScopePolicy::ends_at_statement_end(const Borrow& borrow, ScopeId scope,
                                               const ScopeTable& scopes) const -> bool {
    if (borrow.holder) {
        return false;
    }
    return borrow.scope == scope || !scopes.scope(borrow.scope).live;
}

auto make_borrow_end_policy(BorrowEndStrategy strategy) -> std::unique_ptr<BorrowEndPolicy> {
    switch (strategy) {
    case BorrowEndStrategy::LexicalScope:
        return std::make_unique<LexicalScopePolicy>();
    }
    return std::make_unique<LexicalScopePolicy>();
}

// ============================================================================
// BorrowChecker
// ============================================================================

BorrowChecker::BorrowChecker(const ModuleEnv& env, const types::CopyOracle& oracle,
                             const CheckerOptions& options)
    : BorrowChecker(env, oracle, make_borrow_end_policy(options.borrow_end)) {}

BorrowChecker::BorrowChecker(const ModuleEnv& env, const types::CopyOracle& oracle,
                             std::unique_ptr<BorrowEndPolicy> policy)
    : env_(env), oracle_(oracle), policy_(std::move(policy)) {}

void BorrowChecker::check(const CheckUnit& unit, diag::DiagnosticSink& sink) {
    BORROWCK_LOG_TRACE("borrows", "checking " << unit.qualified_name());

    scopes_ = ScopeTable{};
    live_.clear();
    next_id_ = 0;
    silent_ = 0;
    sink_ = &sink;

    scopes_.add_exit_hook([this](const Scope& scope) {
        std::erase_if(live_, [this, &scope](const Borrow& borrow) {
            return policy_->ends_at_scope_exit(borrow, scope);
        });
    });

    auto fn_scope = open_unit(scopes_, env_, unit);
    (void)walk_scoped(**unit.func->body, ScopeKind::Block, Use::Consume);
    end_statement();
    scopes_.exit_scope(fn_scope);
}

void BorrowChecker::report(diag::Diagnostic diagnostic) {
    if (silent_ > 0) {
        return;
    }
    sink_->report(std::move(diagnostic));
}

// ============================================================================
// Live set
// ============================================================================

auto BorrowChecker::first_overlap(const Place& place, bool mutable_only) const -> const Borrow* {
    for (const auto& borrow : live_) {
        if (mutable_only && borrow.kind != BorrowKind::Mutable) {
            continue;
        }
        if (borrow.place.overlaps(place)) {
            return &borrow;
        }
    }
    return nullptr;
}

auto BorrowChecker::record_temporary(const Place& place, BorrowKind kind, SourceSpan span)
    -> Loan {
    live_.push_back(Borrow{next_id_++, std::nullopt, place, kind, span, scopes_.current_scope()});
    return Loan{place, kind, span};
}

auto BorrowChecker::create_borrow(const Place& place, BorrowKind kind, SourceSpan span)
    -> std::optional<Loan> {
    bool is_mutable = kind == BorrowKind::Mutable;
    if (const auto* existing = first_overlap(place, !is_mutable)) {
        diag::ConflictKind conflict = diag::ConflictKind::ImmutableWhileMutablyBorrowed;
        if (is_mutable) {
            conflict = existing->kind == BorrowKind::Mutable
                           ? diag::ConflictKind::MutableWhileMutablyBorrowed
                           : diag::ConflictKind::MutableWhileImmutablyBorrowed;
        }
        report(diag::Diagnostic::borrow_conflict(conflict, place.to_string(scopes_), span,
                                                 existing->span));
        return std::nullopt;
    }
    return record_temporary(place, kind, span);
}

void BorrowChecker::check_mutation(const Place& place, SourceSpan span) {
    if (const auto* existing = first_overlap(place, false)) {
        report(diag::Diagnostic::mutation_while_borrowed(place.to_string(scopes_), span,
                                                         existing->span));
    }
}

void BorrowChecker::check_move(const Place& place, SourceSpan span) {
    if (const auto* existing = first_overlap(place, false)) {
        report(diag::Diagnostic::move_while_borrowed(place.to_string(scopes_), span,
                                                     existing->span));
    }
}

void BorrowChecker::hold(BindingId holder, const Loans& loans) {
    auto scope = scopes_.binding(holder).scope;
    for (const auto& loan : loans) {
        live_.push_back(Borrow{next_id_++, holder, loan.place, loan.kind, loan.span, scope});
    }
}

void BorrowChecker::release(BindingId holder) {
    std::erase_if(live_, [holder](const Borrow& borrow) { return borrow.holder == holder; });
}

auto BorrowChecker::held_by(BindingId holder) const -> Loans {
    Loans loans;
    for (const auto& borrow : live_) {
        if (borrow.holder == holder) {
            loans.push_back(Loan{borrow.place, borrow.kind, borrow.span});
        }
    }
    return loans;
}

void BorrowChecker::end_statement() {
    auto scope = scopes_.current_scope();
    std::erase_if(live_, [this, scope](const Borrow& borrow) {
        return policy_->ends_at_statement_end(borrow, scope, scopes_);
    });
}

void BorrowChecker::end_temporaries_since(BorrowId mark) {
    std::erase_if(live_,
                  [mark](const Borrow& borrow) { return !borrow.holder && borrow.id >= mark; });
}

void BorrowChecker::join_live(const std::vector<Borrow>& other) {
    for (const auto& borrow : other) {
        bool present = std::any_of(live_.begin(), live_.end(),
                                   [&borrow](const Borrow& b) { return b.id == borrow.id; });
        if (!present && scopes_.scope(borrow.scope).live) {
            live_.push_back(borrow);
        }
    }
}

// ============================================================================
// Statements
// ============================================================================

auto BorrowChecker::walk_scoped(const ast::Expr& expr, ScopeKind kind, Use use) -> Loans {
    auto scope = scopes_.enter_scope(kind);
    Loans loans;
    if (expr.is<ast::BlockExpr>()) {
        const auto& block = expr.as<ast::BlockExpr>();
        for (const auto& stmt : block.stmts) {
            walk_stmt(*stmt);
        }
        if (block.expr) {
            loans = walk_expr(**block.expr, use);
        }
    } else {
        loans = walk_expr(expr, use);
    }
    scopes_.exit_scope(scope);
    return loans;
}

void BorrowChecker::walk_stmt(const ast::Stmt& stmt) {
    if (stmt.is<ast::ExprStmt>()) {
        (void)walk_expr(*stmt.as<ast::ExprStmt>().expr, Use::Read);
        end_statement();
        return;
    }

    const auto& let = stmt.as<ast::LetStmt>();
    types::TypePtr type = let.type_annotation;
    Loans loans;
    if (let.init) {
        loans = walk_expr(**let.init, Use::Consume);
        if (!type) {
            type = type_of(**let.init, scopes_, env_);
        }
    }
    for (auto id : declare_pattern(scopes_, *let.pattern, type)) {
        hold(id, loans);
    }
    end_statement();
}

// ============================================================================
// Expressions
// ============================================================================

auto BorrowChecker::walk_expr(const ast::Expr& expr, Use use) -> Loans {
    if (auto place = extract_place(expr, scopes_)) {
        return walk_place(expr, *place, use);
    }

    return std::visit(
        [this, &expr, use](const auto& e) -> Loans {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, ast::UnaryExpr>) {
                bool is_ref = e.op == ast::UnaryOp::Ref || e.op == ast::UnaryOp::RefMut;
                if (is_ref) {
                    if (auto place = extract_place(*e.operand, scopes_)) {
                        walk_projection_operands(*e.operand);
                        auto kind = e.op == ast::UnaryOp::RefMut ? BorrowKind::Mutable
                                                                 : BorrowKind::Immutable;
                        if (auto loan = create_borrow(*place, kind, expr.span)) {
                            return Loans{*loan};
                        }
                        return {};
                    }
                    return walk_expr(*e.operand, Use::Read);
                }
                auto loans = walk_expr(*e.operand, Use::Read);
                return may_carry_borrow(type_of(expr, scopes_, env_)) ? loans : Loans{};
            } else if constexpr (std::is_same_v<T, ast::BinaryExpr>) {
                if (ast::is_assignment(e.op)) {
                    return walk_assign(e, expr.span);
                }
                (void)walk_expr(*e.left, Use::Read);
                (void)walk_expr(*e.right, Use::Read);
                return {};
            } else if constexpr (std::is_same_v<T, ast::CallExpr>) {
                return walk_call(e);
            } else if constexpr (std::is_same_v<T, ast::MethodCallExpr>) {
                return walk_method_call(e, expr.span);
            } else if constexpr (std::is_same_v<T, ast::FieldExpr> ||
                                 std::is_same_v<T, ast::IndexExpr>) {
                auto loans = walk_expr(*e.object, Use::Read);
                if constexpr (std::is_same_v<T, ast::IndexExpr>) {
                    (void)walk_expr(*e.index, Use::Read);
                }
                return may_carry_borrow(type_of(expr, scopes_, env_)) ? loans : Loans{};
            } else if constexpr (std::is_same_v<T, ast::TupleExpr> ||
                                 std::is_same_v<T, ast::ArrayExpr>) {
                Loans loans;
                for (const auto& elem : e.elements) {
                    append(loans, walk_expr(*elem, Use::Consume));
                }
                return loans;
            } else if constexpr (std::is_same_v<T, ast::StructExpr>) {
                Loans loans;
                for (const auto& field : e.fields) {
                    append(loans, walk_expr(*field.value, Use::Consume));
                }
                return loans;
            } else if constexpr (std::is_same_v<T, ast::IfExpr>) {
                (void)walk_expr(*e.condition, Use::Read);
                auto entry = live_;
                auto loans = walk_scoped(*e.then_branch, ScopeKind::Branch, use);
                auto then_live = std::move(live_);
                live_ = std::move(entry);
                if (e.else_branch) {
                    append(loans, walk_scoped(**e.else_branch, ScopeKind::Branch, use));
                }
                join_live(then_live);
                return loans;
            } else if constexpr (std::is_same_v<T, ast::WhenExpr>) {
                (void)walk_expr(*e.scrutinee, Use::Read);
                auto scrutinee_type = type_of(*e.scrutinee, scopes_, env_);
                auto entry = live_;
                std::vector<std::vector<Borrow>> arm_live;
                Loans loans;
                for (const auto& arm : e.arms) {
                    live_ = entry;
                    auto scope = scopes_.enter_scope(ScopeKind::Branch);
                    declare_pattern(scopes_, *arm.pattern, scrutinee_type);
                    if (arm.guard) {
                        (void)walk_expr(**arm.guard, Use::Read);
                    }
                    append(loans, walk_expr(*arm.body, use));
                    scopes_.exit_scope(scope);
                    arm_live.push_back(std::move(live_));
                }
                live_ = arm_live.empty() ? std::move(entry) : std::move(arm_live.front());
                for (size_t i = 1; i < arm_live.size(); ++i) {
                    join_live(arm_live[i]);
                }
                return loans;
            } else if constexpr (std::is_same_v<T, ast::LoopExpr>) {
                return walk_loop(nullptr, *e.body, nullptr);
            } else if constexpr (std::is_same_v<T, ast::WhileExpr>) {
                return walk_loop(e.condition.get(), *e.body, nullptr);
            } else if constexpr (std::is_same_v<T, ast::ForExpr>) {
                (void)walk_expr(*e.iter, Use::Consume);
                return walk_loop(nullptr, *e.body, e.pattern.get());
            } else if constexpr (std::is_same_v<T, ast::BlockExpr>) {
                return walk_scoped(expr, ScopeKind::Block, use);
            } else if constexpr (std::is_same_v<T, ast::ReturnExpr> ||
                                 std::is_same_v<T, ast::BreakExpr>) {
                if (e.value) {
                    (void)walk_expr(**e.value, Use::Consume);
                }
                return {};
            } else if constexpr (std::is_same_v<T, ast::ClosureExpr>) {
                return walk_closure(e, expr.span);
            } else if constexpr (std::is_same_v<T, ast::CastExpr>) {
                return walk_expr(*e.expr, Use::Read);
            } else if constexpr (std::is_same_v<T, ast::UnsafeExpr>) {
                return walk_scoped(*e.body, ScopeKind::Unsafe, use);
            } else {
                return {};
            }
        },
        expr.kind);
}

auto BorrowChecker::walk_place(const ast::Expr& expr, const Place& place, Use use) -> Loans {
    walk_projection_operands(expr);
    auto type = type_of(expr, scopes_, env_);
    if (use == Use::Consume && !place.through_deref && !place.through_index &&
        scopes_.binding(place.root).kind != BindingKind::Global && !oracle_.is_copy(type)) {
        check_move(place, expr.span);
    }
    return may_carry_borrow(type) ? held_by(place.root) : Loans{};
}

void BorrowChecker::walk_projection_operands(const ast::Expr& expr) {
    if (expr.is<ast::IndexExpr>()) {
        walk_projection_operands(*expr.as<ast::IndexExpr>().object);
        (void)walk_expr(*expr.as<ast::IndexExpr>().index, Use::Read);
    } else if (expr.is<ast::FieldExpr>()) {
        walk_projection_operands(*expr.as<ast::FieldExpr>().object);
    } else if (expr.is<ast::UnaryExpr>()) {
        walk_projection_operands(*expr.as<ast::UnaryExpr>().operand);
    }
}

auto BorrowChecker::walk_assign(const ast::BinaryExpr& assign, SourceSpan span) -> Loans {
    auto loans = walk_expr(*assign.right, Use::Consume);

    auto place = extract_place(*assign.left, scopes_);
    if (!place) {
        (void)walk_expr(*assign.left, Use::Read);
        return {};
    }
    walk_projection_operands(*assign.left);
    check_mutation(*place, span);

    if (assign.op == ast::BinaryOp::Assign) {
        if (place->is_whole()) {
            release(place->root);
        }
        hold(place->root, loans);
    }
    return {};
}

// ============================================================================
// Calls
// ============================================================================

auto BorrowChecker::param_types(const ast::CallExpr& call) const -> std::vector<types::TypePtr> {
    if (call.sig) {
        return call.sig->params;
    }
    auto callee = type_of(*call.callee, scopes_, env_);
    if (callee && callee->is<types::ClosureType>()) {
        return callee->as<types::ClosureType>().params;
    }
    if (callee && callee->is<types::FuncType>()) {
        return callee->as<types::FuncType>().params;
    }
    return {};
}

auto BorrowChecker::walk_args(const std::vector<ast::ExprPtr>& args,
                              const std::vector<types::TypePtr>& params) -> Loans {
    Loans loans;
    for (size_t i = 0; i < args.size(); ++i) {
        bool by_ref = i < params.size() && types::is_reference(params[i]);
        append(loans, walk_expr(*args[i], by_ref ? Use::Read : Use::Consume));
    }
    return loans;
}

auto BorrowChecker::walk_call(const ast::CallExpr& call) -> Loans {
    auto mark = next_id_;
    (void)walk_expr(*call.callee, Use::Read);
    auto loans = walk_args(call.args, param_types(call));

    types::TypePtr result;
    if (call.sig) {
        result = call.sig->return_type;
    } else if (auto callee = type_of(*call.callee, scopes_, env_)) {
        if (callee->is<types::ClosureType>()) {
            result = callee->as<types::ClosureType>().return_type;
        } else if (callee->is<types::FuncType>()) {
            result = callee->as<types::FuncType>().return_type;
        }
    }
    if (!may_carry_borrow(result)) {
        end_temporaries_since(mark);
        return {};
    }
    return loans;
}

auto BorrowChecker::walk_method_call(const ast::MethodCallExpr& call, SourceSpan span) -> Loans {
    if (!call.sig) {
        throw InvariantViolation("method call `" + call.method + "` has no resolved signature");
    }
    const auto& sig = *call.sig;
    auto receiver_kind = sig.receiver.value_or(types::ReceiverKind::Ref);

    auto mark = next_id_;
    Loans loans;
    bool receiver_borrowed = false;
    auto place = extract_place(*call.receiver, scopes_);
    if (receiver_kind == types::ReceiverKind::Value || !place) {
        loans = walk_expr(*call.receiver,
                          receiver_kind == types::ReceiverKind::Value ? Use::Consume : Use::Read);
    } else {
        walk_projection_operands(*call.receiver);
        if (sig.is_mutating) {
            // The exclusive borrow starts once the arguments are evaluated.
            receiver_borrowed = first_overlap(*place, false) != nullptr;
            check_mutation(*place, span);
        } else {
            auto kind = receiver_kind == types::ReceiverKind::MutRef ? BorrowKind::Mutable
                                                                     : BorrowKind::Immutable;
            if (auto loan = create_borrow(*place, kind, span)) {
                loans.push_back(*loan);
            }
        }
    }

    append(loans, walk_args(call.args, sig.params));
    // Borrows taken by the arguments are still live here. A receiver already
    // reported by `check_mutation` is not reported twice.
    if (place && sig.is_mutating && receiver_kind != types::ReceiverKind::Value) {
        if (receiver_borrowed) {
            loans.push_back(record_temporary(*place, BorrowKind::Mutable, span));
        } else if (auto loan = create_borrow(*place, BorrowKind::Mutable, span)) {
            loans.push_back(*loan);
        }
    }
    if (!may_carry_borrow(sig.return_type)) {
        end_temporaries_since(mark);
        return {};
    }
    return loans;
}

// ============================================================================
// Loops and closures
// ============================================================================

auto BorrowChecker::walk_loop(const ast::Expr* condition, const ast::Expr& body,
                              const ast::Pattern* pattern) -> Loans {
    auto entry = live_;
    auto walk_once = [&]() {
        auto scope = scopes_.enter_scope(ScopeKind::Loop);
        if (condition) {
            (void)walk_expr(*condition, Use::Read);
        }
        if (pattern) {
            declare_pattern(scopes_, *pattern, nullptr);
        }
        (void)walk_scoped(body, ScopeKind::Block, Use::Read);
        scopes_.exit_scope(scope);
    };

    ++silent_;
    walk_once();
    --silent_;
    walk_once();

    // The body may not run at all.
    join_live(entry);
    return {};
}

auto BorrowChecker::walk_closure(const ast::ClosureExpr& closure, SourceSpan span) -> Loans {
    auto info = analyze_closure(closure, span, scopes_, env_, oracle_);
    BORROWCK_LOG_TRACE("borrows", "closure at " << span_to_string(span) << " is "
                                               << callable_kind_name(info.kind) << " with "
                                               << info.captures.size() << " capture(s)");

    Loans loans;
    for (const auto& capture : info.captures) {
        Place place{capture.binding, {}, false, false};
        switch (capture.mode) {
        case CaptureMode::Immutable:
        case CaptureMode::Mutable: {
            auto kind = capture.mode == CaptureMode::Mutable ? BorrowKind::Mutable
                                                             : BorrowKind::Immutable;
            if (auto loan = create_borrow(place, kind, capture.span)) {
                loans.push_back(*loan);
            }
            break;
        }
        case CaptureMode::Move:
            check_move(place, capture.span);
            append(loans, held_by(capture.binding));
            break;
        }
    }
    closures_.record(&closure, std::move(info));

    // The body runs later, against its own borrows only.
    auto outer = std::move(live_);
    live_.clear();
    auto scope = scopes_.enter_scope(ScopeKind::Closure);
    for (const auto& param : closure.params) {
        scopes_.declare_binding(param.name, param.is_mut, param.type, span, BindingKind::Param);
    }
    (void)walk_expr(*closure.body, Use::Consume);
    end_statement();
    scopes_.exit_scope(scope);
    live_ = std::move(outer);

    return loans;
}

} // namespace borrowck::borrow
