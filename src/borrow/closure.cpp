//! # Closure Capture Analysis Implementation
//!
//! `CaptureCollector` walks a closure body once, with the closure's own
//! scopes pushed on the caller's table, and records every use of a binding
//! declared outside the closure. Uses are classified by context:
//!
//! - **Consume**: `let` initializers, assignment right-hand sides, by-value
//!   arguments and receivers, aggregate elements, returned values, `for`
//!   iterables, and the tail of the closure body.
//! - **Mutate**: assignment targets, `mut ref` operands, receivers of
//!   mutating methods.
//! - **Read**: everything else.

#include "borrowck/borrow/closure.hpp"

#include "borrowck/borrow/place.hpp"

#include <algorithm>

namespace borrowck::borrow {

auto capture_mode_name(CaptureMode mode) -> const char* {
    switch (mode) {
    case CaptureMode::Immutable:
        return "immutable";
    case CaptureMode::Mutable:
        return "mutable";
    case CaptureMode::Move:
        return "move";
    }
    return "?";
}

auto callable_kind_name(CallableKind kind) -> const char* {
    switch (kind) {
    case CallableKind::ReadOnly:
        return "read-only";
    case CallableKind::Mutable:
        return "mutable";
    case CallableKind::OneShot:
        return "one-shot";
    }
    return "?";
}

auto satisfies(CallableKind kind, CallableKind bound) -> bool {
    return static_cast<int>(kind) <= static_cast<int>(bound);
}

auto ClosureInfo::find(std::string_view name) const -> const Capture* {
    for (const auto& capture : captures) {
        if (capture.name == name) {
            return &capture;
        }
    }
    return nullptr;
}

void ClosureTable::record(const ast::ClosureExpr* node, ClosureInfo info) {
    entries_[node] = std::move(info);
}

auto ClosureTable::lookup(const ast::ClosureExpr* node) const -> const ClosureInfo* {
    auto it = entries_.find(node);
    return it != entries_.end() ? &it->second : nullptr;
}

auto ClosureTable::satisfies(const ast::ClosureExpr* node, CallableKind bound) const -> bool {
    const auto* info = lookup(node);
    return info && borrow::satisfies(info->kind, bound);
}

void ClosureTable::merge(const ClosureTable& other) {
    for (const auto& [node, info] : other.entries_) {
        entries_[node] = info;
    }
}

namespace {

enum class Use { Read, Consume, Mutate };

class CaptureCollector {
public:
    CaptureCollector(ScopeTable& scopes, const ModuleEnv& env, const types::CopyOracle& oracle)
        : scopes_(scopes), env_(env), oracle_(oracle) {}

    auto run(const ast::ClosureExpr& closure, SourceSpan span) -> ClosureInfo {
        closure_scope_ = scopes_.enter_scope(ScopeKind::Closure);
        for (const auto& param : closure.params) {
            scopes_.declare_binding(param.name, param.is_mut, param.type, span, BindingKind::Param);
        }
        visit(*closure.body, Use::Consume);
        scopes_.exit_scope(closure_scope_);

        ClosureInfo info;
        info.is_move = closure.is_move;
        info.span = span;
        bool any_mutable = false;
        bool any_consumed = false;
        for (auto id : order_) {
            auto capture = captures_.at(id);
            if (closure.is_move && !oracle_.is_copy(scopes_.binding(id).type)) {
                capture.mode = CaptureMode::Move;
            }
            any_mutable = any_mutable || capture.mode == CaptureMode::Mutable;
            any_consumed = any_consumed || capture.consumed;
            info.captures.push_back(std::move(capture));
        }
        info.kind = any_consumed  ? CallableKind::OneShot
                    : any_mutable ? CallableKind::Mutable
                                  : CallableKind::ReadOnly;
        return info;
    }

private:
    void note(BindingId id, CaptureMode mode, bool consumed, SourceSpan span) {
        const auto& binding = scopes_.binding(id);
        if (binding.kind == BindingKind::Global || scopes_.declared_within(id, closure_scope_)) {
            return;
        }

        auto it = captures_.find(id);
        if (it == captures_.end()) {
            captures_.emplace(id, Capture{id, binding.name, mode, consumed, span});
            order_.push_back(id);
            return;
        }
        it->second.mode = std::max(it->second.mode, mode);
        it->second.consumed = it->second.consumed || consumed;
    }

    void visit_place(const ast::Expr& expr, const Place& place, Use use) {
        bool projected = place.through_deref || place.through_index;
        switch (use) {
        case Use::Mutate:
            note(place.root, CaptureMode::Mutable, false, expr.span);
            break;
        case Use::Consume:
            if (!projected && !oracle_.is_copy(type_of(expr, scopes_, env_))) {
                note(place.root, CaptureMode::Move, true, expr.span);
            } else {
                note(place.root, CaptureMode::Immutable, false, expr.span);
            }
            break;
        case Use::Read:
            note(place.root, CaptureMode::Immutable, false, expr.span);
            break;
        }
        visit_index_operands(expr);
    }

    void visit_index_operands(const ast::Expr& expr) {
        if (expr.is<ast::IndexExpr>()) {
            visit_index_operands(*expr.as<ast::IndexExpr>().object);
            visit(*expr.as<ast::IndexExpr>().index, Use::Read);
        } else if (expr.is<ast::FieldExpr>()) {
            visit_index_operands(*expr.as<ast::FieldExpr>().object);
        } else if (expr.is<ast::UnaryExpr>()) {
            visit_index_operands(*expr.as<ast::UnaryExpr>().operand);
        }
    }

    void visit_args(const std::vector<ast::ExprPtr>& args, const types::FuncSig* sig) {
        for (size_t i = 0; i < args.size(); ++i) {
            bool by_ref = sig && i < sig->params.size() && types::is_reference(sig->params[i]);
            visit(*args[i], by_ref ? Use::Read : Use::Consume);
        }
    }

    void visit_scoped(const ast::Expr& expr, Use use) {
        auto scope = scopes_.enter_scope(ScopeKind::Block);
        if (expr.is<ast::BlockExpr>()) {
            const auto& block = expr.as<ast::BlockExpr>();
            for (const auto& stmt : block.stmts) {
                visit_stmt(*stmt);
            }
            if (block.expr) {
                visit(**block.expr, use);
            }
        } else {
            visit(expr, use);
        }
        scopes_.exit_scope(scope);
    }

    void visit_stmt(const ast::Stmt& stmt) {
        if (stmt.is<ast::ExprStmt>()) {
            visit(*stmt.as<ast::ExprStmt>().expr, Use::Read);
            return;
        }
        const auto& let = stmt.as<ast::LetStmt>();
        types::TypePtr type = let.type_annotation;
        if (let.init) {
            visit(**let.init, Use::Consume);
            if (!type) {
                type = type_of(**let.init, scopes_, env_);
            }
        }
        declare_pattern(scopes_, *let.pattern, type);
    }

    void visit(const ast::Expr& expr, Use use) {
        if (auto place = extract_place(expr, scopes_)) {
            visit_place(expr, *place, use);
            return;
        }

        std::visit(
            [this, &expr, use](const auto& e) {
                using T = std::decay_t<decltype(e)>;

                if constexpr (std::is_same_v<T, ast::UnaryExpr>) {
                    if (e.op == ast::UnaryOp::RefMut) {
                        visit(*e.operand, Use::Mutate);
                    } else {
                        visit(*e.operand, Use::Read);
                    }
                } else if constexpr (std::is_same_v<T, ast::BinaryExpr>) {
                    if (ast::is_assignment(e.op)) {
                        visit(*e.left, Use::Mutate);
                        visit(*e.right, Use::Consume);
                    } else {
                        visit(*e.left, Use::Read);
                        visit(*e.right, Use::Read);
                    }
                } else if constexpr (std::is_same_v<T, ast::CallExpr>) {
                    visit(*e.callee, Use::Read);
                    visit_args(e.args, e.sig.get());
                } else if constexpr (std::is_same_v<T, ast::MethodCallExpr>) {
                    Use receiver_use = Use::Read;
                    if (e.sig && e.sig->receiver == types::ReceiverKind::Value) {
                        receiver_use = Use::Consume;
                    } else if (e.sig && (e.sig->is_mutating ||
                                         e.sig->receiver == types::ReceiverKind::MutRef)) {
                        receiver_use = Use::Mutate;
                    }
                    visit(*e.receiver, receiver_use);
                    visit_args(e.args, e.sig.get());
                } else if constexpr (std::is_same_v<T, ast::FieldExpr>) {
                    visit(*e.object, Use::Read);
                } else if constexpr (std::is_same_v<T, ast::IndexExpr>) {
                    visit(*e.object, Use::Read);
                    visit(*e.index, Use::Read);
                } else if constexpr (std::is_same_v<T, ast::TupleExpr> ||
                                     std::is_same_v<T, ast::ArrayExpr>) {
                    for (const auto& elem : e.elements) {
                        visit(*elem, Use::Consume);
                    }
                } else if constexpr (std::is_same_v<T, ast::StructExpr>) {
                    for (const auto& field : e.fields) {
                        visit(*field.value, Use::Consume);
                    }
                } else if constexpr (std::is_same_v<T, ast::IfExpr>) {
                    visit(*e.condition, Use::Read);
                    visit_scoped(*e.then_branch, use);
                    if (e.else_branch) {
                        visit_scoped(**e.else_branch, use);
                    }
                } else if constexpr (std::is_same_v<T, ast::WhenExpr>) {
                    visit(*e.scrutinee, Use::Read);
                    for (const auto& arm : e.arms) {
                        auto scope = scopes_.enter_scope(ScopeKind::Branch);
                        declare_pattern(scopes_, *arm.pattern, nullptr);
                        if (arm.guard) {
                            visit(**arm.guard, Use::Read);
                        }
                        visit(*arm.body, use);
                        scopes_.exit_scope(scope);
                    }
                } else if constexpr (std::is_same_v<T, ast::LoopExpr>) {
                    visit_scoped(*e.body, Use::Read);
                } else if constexpr (std::is_same_v<T, ast::WhileExpr>) {
                    visit(*e.condition, Use::Read);
                    visit_scoped(*e.body, Use::Read);
                } else if constexpr (std::is_same_v<T, ast::ForExpr>) {
                    visit(*e.iter, Use::Consume);
                    auto scope = scopes_.enter_scope(ScopeKind::Loop);
                    declare_pattern(scopes_, *e.pattern, nullptr);
                    visit_scoped(*e.body, Use::Read);
                    scopes_.exit_scope(scope);
                } else if constexpr (std::is_same_v<T, ast::BlockExpr>) {
                    visit_scoped(expr, use);
                } else if constexpr (std::is_same_v<T, ast::ReturnExpr> ||
                                     std::is_same_v<T, ast::BreakExpr>) {
                    if (e.value) {
                        visit(**e.value, Use::Consume);
                    }
                } else if constexpr (std::is_same_v<T, ast::ClosureExpr>) {
                    auto scope = scopes_.enter_scope(ScopeKind::Closure);
                    for (const auto& param : e.params) {
                        scopes_.declare_binding(param.name, param.is_mut, param.type, expr.span,
                                                BindingKind::Param);
                    }
                    visit(*e.body, Use::Consume);
                    scopes_.exit_scope(scope);
                } else if constexpr (std::is_same_v<T, ast::CastExpr>) {
                    visit(*e.expr, Use::Read);
                } else if constexpr (std::is_same_v<T, ast::UnsafeExpr>) {
                    visit(*e.body, use);
                }
            },
            expr.kind);
    }

    ScopeTable& scopes_;
    const ModuleEnv& env_;
    const types::CopyOracle& oracle_;
    ScopeId closure_scope_ = 0;
    std::map<BindingId, Capture> captures_;
    std::vector<BindingId> order_;
};

} // namespace

auto analyze_closure(const ast::ClosureExpr& closure, SourceSpan span, ScopeTable& scopes,
                     const ModuleEnv& env, const types::CopyOracle& oracle) -> ClosureInfo {
    CaptureCollector collector(scopes, env, oracle);
    return collector.run(closure, span);
}

} // namespace borrowck::borrow
