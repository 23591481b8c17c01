//! # Immutability Checker (Phase 1)
//!
//! A single walk over the unit. Scopes are tracked only to resolve names and
//! to know whether a dereference sits inside a `unsafe` region.
//!
//! ## Receiver Mutation
//!
//! Inside a method that is not declared mutating, every mutation rooted at
//! `self` is reported as `MutableSelfInImmutableMethod`, whatever the
//! receiver's declared kind. A `mut ref self` receiver on such a method is
//! reported once at the receiver.
//!
//! ## Raw Pointer Detection
//!
//! | Mode        | A dereference `*e` targets a raw pointer when           |
//! |-------------|---------------------------------------------------------|
//! | `Heuristic` | `e` is a cast to `*T`, or a call of an allocation function |
//! | `Typed`     | the resolved type of `e` is `*T`                        |

#include "borrowck/borrow/immutability.hpp"

#include "borrowck/log/log.hpp"

#include <algorithm>

namespace borrowck::borrow {

ImmutabilityChecker::ImmutabilityChecker(const ModuleEnv& env,
                                         const types::ContractTable& contracts,
                                         const CheckerOptions& options)
    : env_(env), contracts_(contracts), options_(options) {}

void ImmutabilityChecker::check(const CheckUnit& unit, diag::DiagnosticSink& sink) {
    BORROWCK_LOG_TRACE("immut", "checking " << unit.qualified_name());

    scopes_ = ScopeTable{};
    sink_ = &sink;
    unit_ = &unit;

    auto fn_scope = open_unit(scopes_, env_, unit);
    check_signature();
    check_scoped(**unit.func->body, ScopeKind::Block);
    scopes_.exit_scope(fn_scope);
}

void ImmutabilityChecker::check_signature() {
    const auto& func = *unit_->func;

    if (func.receiver && func.receiver->kind == types::ReceiverKind::MutRef &&
        !func.is_mutating) {
        auto span = func.receiver->span.is_known() ? func.receiver->span : func.span;
        sink_->report(diag::Diagnostic::mutable_self_in_immutable_method(func.name, span));
    }

    if (unit_->contract.empty()) {
        return;
    }
    const auto* declared = contracts_.lookup(unit_->contract, func.name);
    if (declared && declared->is_mutating != func.is_mutating) {
        sink_->report(diag::Diagnostic::contract_mismatch(unit_->contract, func.name,
                                                          declared->is_mutating, func.span));
    }
}

void ImmutabilityChecker::check_scoped(const ast::Expr& expr, ScopeKind kind) {
    auto scope = scopes_.enter_scope(kind);
    if (expr.is<ast::BlockExpr>()) {
        check_block_body(expr.as<ast::BlockExpr>());
    } else {
        check_expr(expr);
    }
    scopes_.exit_scope(scope);
}

void ImmutabilityChecker::check_block_body(const ast::BlockExpr& block) {
    for (const auto& stmt : block.stmts) {
        check_stmt(*stmt);
    }
    if (block.expr) {
        check_expr(**block.expr);
    }
}

void ImmutabilityChecker::check_stmt(const ast::Stmt& stmt) {
    if (stmt.is<ast::ExprStmt>()) {
        check_expr(*stmt.as<ast::ExprStmt>().expr);
        return;
    }

    const auto& let = stmt.as<ast::LetStmt>();
    types::TypePtr type = let.type_annotation;
    if (let.init) {
        check_expr(**let.init);
        if (!type) {
            type = type_of(**let.init, scopes_, env_);
        }
    }
    declare_pattern(scopes_, *let.pattern, type);
}

void ImmutabilityChecker::check_expr(const ast::Expr& expr) {
    std::visit(
        [this, &expr](const auto& e) {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, ast::IdentExpr>) {
                // Resolving keeps the unresolved-name invariant checked here too.
                (void)scopes_.resolve(e.name);
            } else if constexpr (std::is_same_v<T, ast::UnaryExpr>) {
                if (e.op == ast::UnaryOp::RefMut) {
                    check_mutable_place(*e.operand, Mutation::BorrowMut, expr.span);
                } else if (e.op == ast::UnaryOp::Deref) {
                    check_deref(e, expr.span);
                }
                check_expr(*e.operand);
            } else if constexpr (std::is_same_v<T, ast::BinaryExpr>) {
                if (ast::is_assignment(e.op)) {
                    check_mutable_place(*e.left, Mutation::Assign, expr.span);
                }
                check_expr(*e.left);
                check_expr(*e.right);
            } else if constexpr (std::is_same_v<T, ast::CallExpr>) {
                check_call(e, expr.span);
            } else if constexpr (std::is_same_v<T, ast::MethodCallExpr>) {
                check_method_call(e, expr.span);
            } else if constexpr (std::is_same_v<T, ast::FieldExpr>) {
                check_expr(*e.object);
            } else if constexpr (std::is_same_v<T, ast::IndexExpr>) {
                check_expr(*e.object);
                check_expr(*e.index);
            } else if constexpr (std::is_same_v<T, ast::TupleExpr> ||
                                 std::is_same_v<T, ast::ArrayExpr>) {
                for (const auto& elem : e.elements) {
                    check_expr(*elem);
                }
            } else if constexpr (std::is_same_v<T, ast::StructExpr>) {
                for (const auto& field : e.fields) {
                    check_expr(*field.value);
                }
            } else if constexpr (std::is_same_v<T, ast::IfExpr>) {
                check_expr(*e.condition);
                check_scoped(*e.then_branch, ScopeKind::Branch);
                if (e.else_branch) {
                    check_scoped(**e.else_branch, ScopeKind::Branch);
                }
            } else if constexpr (std::is_same_v<T, ast::WhenExpr>) {
                check_expr(*e.scrutinee);
                auto scrutinee_type = type_of(*e.scrutinee, scopes_, env_);
                for (const auto& arm : e.arms) {
                    auto scope = scopes_.enter_scope(ScopeKind::Branch);
                    declare_pattern(scopes_, *arm.pattern, scrutinee_type);
                    if (arm.guard) {
                        check_expr(**arm.guard);
                    }
                    check_expr(*arm.body);
                    scopes_.exit_scope(scope);
                }
            } else if constexpr (std::is_same_v<T, ast::LoopExpr>) {
                check_scoped(*e.body, ScopeKind::Loop);
            } else if constexpr (std::is_same_v<T, ast::WhileExpr>) {
                check_expr(*e.condition);
                check_scoped(*e.body, ScopeKind::Loop);
            } else if constexpr (std::is_same_v<T, ast::ForExpr>) {
                check_expr(*e.iter);
                auto scope = scopes_.enter_scope(ScopeKind::Loop);
                declare_pattern(scopes_, *e.pattern, nullptr);
                check_scoped(*e.body, ScopeKind::Block);
                scopes_.exit_scope(scope);
            } else if constexpr (std::is_same_v<T, ast::BlockExpr>) {
                check_scoped(expr, ScopeKind::Block);
            } else if constexpr (std::is_same_v<T, ast::ReturnExpr> ||
                                 std::is_same_v<T, ast::BreakExpr>) {
                if (e.value) {
                    check_expr(**e.value);
                }
            } else if constexpr (std::is_same_v<T, ast::ClosureExpr>) {
                auto scope = scopes_.enter_scope(ScopeKind::Closure);
                for (const auto& param : e.params) {
                    scopes_.declare_binding(param.name, param.is_mut, param.type, expr.span,
                                            BindingKind::Param);
                }
                check_expr(*e.body);
                scopes_.exit_scope(scope);
            } else if constexpr (std::is_same_v<T, ast::CastExpr>) {
                check_expr(*e.expr);
            } else if constexpr (std::is_same_v<T, ast::UnsafeExpr>) {
                check_scoped(*e.body, ScopeKind::Unsafe);
            }
            // Literals and `continue` carry nothing to check.
        },
        expr.kind);
}

void ImmutabilityChecker::check_call(const ast::CallExpr& call, SourceSpan span) {
    if (call.sig) {
        std::string callee = call.callee->is<ast::IdentExpr>()
                                 ? call.callee->as<ast::IdentExpr>().name
                                 : call.sig->name;
        check_marker(callee, *call.sig, call.mutation_marker, span);
    }

    check_expr(*call.callee);
    for (const auto& arg : call.args) {
        check_expr(*arg);
    }
}

void ImmutabilityChecker::check_method_call(const ast::MethodCallExpr& call, SourceSpan span) {
    if (!call.sig) {
        throw InvariantViolation("method call `" + call.method + "` has no resolved signature");
    }

    check_marker(call.method, *call.sig, call.mutation_marker, span);
    if (call.sig->is_mutating) {
        check_mutable_place(*call.receiver, Mutation::MutatingCall, span, call.method);
    }

    check_expr(*call.receiver);
    for (const auto& arg : call.args) {
        check_expr(*arg);
    }
}

void ImmutabilityChecker::check_marker(const std::string& callee, const types::FuncSig& sig,
                                       bool marker, SourceSpan span) {
    if (sig.is_mutating && !marker) {
        sink_->report(diag::Diagnostic::missing_mutation_marker(callee, span));
    } else if (!sig.is_mutating && marker) {
        sink_->report(diag::Diagnostic::spurious_mutation_marker(callee, span));
    }
}

void ImmutabilityChecker::check_deref(const ast::UnaryExpr& unary, SourceSpan span) {
    if (scopes_.within(ScopeKind::Unsafe)) {
        return;
    }
    if (is_raw_pointer_operand(*unary.operand)) {
        sink_->report(diag::Diagnostic::unsafe_operation("raw pointer dereference", span));
    }
}

auto ImmutabilityChecker::is_raw_pointer_operand(const ast::Expr& operand) const -> bool {
    if (options_.raw_pointer_detection == RawPointerDetection::Typed) {
        return types::is_raw_pointer(type_of(operand, scopes_, env_));
    }

    if (operand.is<ast::CastExpr>()) {
        return types::is_raw_pointer(operand.as<ast::CastExpr>().target);
    }
    if (operand.is<ast::CallExpr>()) {
        const auto& callee = *operand.as<ast::CallExpr>().callee;
        if (callee.is<ast::IdentExpr>()) {
            const auto& names = options_.unsafe_alloc_names;
            return std::find(names.begin(), names.end(), callee.as<ast::IdentExpr>().name) !=
                   names.end();
        }
    }
    return false;
}

// ============================================================================
// Mutability of places
// ============================================================================

void ImmutabilityChecker::check_mutable_place(const ast::Expr& target, Mutation mutation,
                                              SourceSpan span, const std::string& method) {
    auto place = extract_place(target, scopes_);
    if (!place) {
        // Temporaries are freely mutable.
        return;
    }

    const auto& root = scopes_.binding(place->root);
    if (root.kind == BindingKind::Receiver && !unit_->func->is_mutating) {
        sink_->report(diag::Diagnostic::mutable_self_in_immutable_method(unit_->func->name, span));
        return;
    }

    if (place_is_mutable(target, mutation)) {
        return;
    }

    switch (mutation) {
    case Mutation::Assign:
        sink_->report(diag::Diagnostic::immutable_assignment(root.name, span, root.span));
        break;
    case Mutation::BorrowMut:
        sink_->report(diag::Diagnostic::immutable_borrow_mut(root.name, span, root.span));
        break;
    case Mutation::MutatingCall:
        sink_->report(diag::Diagnostic::immutable_receiver(root.name, method, span));
        break;
    }
}

auto ImmutabilityChecker::place_is_mutable(const ast::Expr& target, Mutation mutation) const
    -> bool {
    if (target.is<ast::IdentExpr>()) {
        const auto& binding = scopes_.binding(scopes_.resolve(target.as<ast::IdentExpr>().name));
        if (binding.is_mut) {
            return true;
        }
        // `mut ref x` and `x.push!()` on a `mut ref` binding reborrow its referent.
        return mutation != Mutation::Assign && types::is_mut_reference(binding.type);
    }

    const ast::Expr* object = nullptr;
    if (target.is<ast::FieldExpr>()) {
        object = target.as<ast::FieldExpr>().object.get();
    } else if (target.is<ast::IndexExpr>()) {
        object = target.as<ast::IndexExpr>().object.get();
    }
    if (object) {
        auto object_type = type_of(*object, scopes_, env_);
        if (types::is_reference(object_type)) {
            return types::is_mut_reference(object_type);
        }
        return place_is_mutable(*object, mutation == Mutation::Assign ? Mutation::Assign
                                                                      : Mutation::BorrowMut);
    }

    if (target.is<ast::UnaryExpr>() && target.as<ast::UnaryExpr>().op == ast::UnaryOp::Deref) {
        auto pointee = type_of(*target.as<ast::UnaryExpr>().operand, scopes_, env_);
        if (types::is_reference(pointee)) {
            return types::is_mut_reference(pointee);
        }
        if (types::is_raw_pointer(pointee)) {
            return pointee->as<types::PtrType>().is_mut;
        }
        return true;
    }

    return true;
}

} // namespace borrowck::borrow
