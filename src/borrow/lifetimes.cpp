//! # Lifetime Checker Implementation
//!
//! Each walk returns the regions the expression's value points into, the
//! same way the borrow phase returns loans. Regions are plain depths plus
//! the referent binding for diagnostics; nothing flows between iterations
//! or branches beyond the union of what each branch yields.

#include "borrowck/borrow/lifetimes.hpp"

#include "borrowck/log/log.hpp"

#include <algorithm>
#include <set>

namespace borrowck::borrow {

namespace {

template <typename T> void append(std::vector<T>& to, const std::vector<T>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

auto tail_span(const ast::Expr& expr) -> SourceSpan {
    if (expr.is<ast::BlockExpr>() && expr.as<ast::BlockExpr>().expr) {
        return (*expr.as<ast::BlockExpr>().expr)->span;
    }
    return expr.span;
}

} // namespace

LifetimeChecker::LifetimeChecker(const ModuleEnv& env, const types::CopyOracle& oracle)
    : env_(env), oracle_(oracle) {}

void LifetimeChecker::check(const CheckUnit& unit, diag::DiagnosticSink& sink) {
    BORROWCK_LOG_TRACE("lifetimes", "checking " << unit.qualified_name());

    scopes_ = ScopeTable{};
    referents_.clear();
    return_depths_.clear();
    sink_ = &sink;

    scopes_.add_exit_hook([this](const Scope& scope) {
        for (auto id : scope.bindings) {
            referents_.erase(id);
        }
    });

    auto fn_scope = open_unit(scopes_, env_, unit);
    seed_parameters(fn_scope);
    return_depths_.push_back(scopes_.scope(fn_scope).depth);

    const auto& body = **unit.func->body;
    auto regions = walk_scoped(body, ScopeKind::Block, false);
    check_return(regions, return_depths_.back(), tail_span(body));

    return_depths_.pop_back();
    scopes_.exit_scope(fn_scope);
}

void LifetimeChecker::seed_parameters(ScopeId scope) {
    const auto& params = scopes_.scope(scope);
    for (auto id : params.bindings) {
        const auto& binding = scopes_.binding(id);
        if (may_carry_borrow(binding.type)) {
            // The caller's storage outlives the unit.
            referents_[id] = {Region{params.depth, std::nullopt}};
        }
    }
}

auto LifetimeChecker::referents_of(BindingId id) const -> Regions {
    auto it = referents_.find(id);
    return it != referents_.end() ? it->second : Regions{};
}

auto LifetimeChecker::borrow_regions(const Place& place) const -> Regions {
    const auto& root = scopes_.binding(place.root);
    if (types::is_raw_pointer(root.type)) {
        return {};
    }

    bool through_reference = place.through_deref ||
                             (types::is_reference(root.type) &&
                              (!place.fields.empty() || place.through_index));
    if (through_reference) {
        return referents_of(place.root);
    }
    return {Region{root.depth, place.root}};
}

// ============================================================================
// Rule checks
// ============================================================================

void LifetimeChecker::check_return(const Regions& regions, size_t limit, SourceSpan span) {
    std::set<BindingId> reported;
    for (const auto& region : regions) {
        if (region.depth <= limit || !region.referent || !reported.insert(*region.referent).second) {
            continue;
        }
        const auto& referent = scopes_.binding(*region.referent);
        sink_->report(diag::Diagnostic::return_dangling(referent.name, span, referent.span));
    }
}

auto LifetimeChecker::check_store(const Regions& regions, size_t depth, SourceSpan span)
    -> Regions {
    Regions kept;
    std::set<BindingId> reported;
    for (const auto& region : regions) {
        if (region.depth <= depth || !region.referent) {
            kept.push_back(region);
            continue;
        }
        if (reported.insert(*region.referent).second) {
            const auto& referent = scopes_.binding(*region.referent);
            sink_->report(diag::Diagnostic::outlives_referent(referent.name, span, referent.span));
        }
    }
    return kept;
}

// ============================================================================
// Walk
// ============================================================================

auto LifetimeChecker::walk_scoped(const ast::Expr& expr, ScopeKind kind, bool escape_check)
    -> Regions {
    auto scope = scopes_.enter_scope(kind);
    Regions regions;
    if (expr.is<ast::BlockExpr>()) {
        const auto& block = expr.as<ast::BlockExpr>();
        for (const auto& stmt : block.stmts) {
            walk_stmt(*stmt);
        }
        if (block.expr) {
            regions = walk_expr(**block.expr);
        }
    } else {
        regions = walk_expr(expr);
    }

    if (escape_check) {
        regions = drop_escaping(regions, scope, tail_span(expr));
    }

    scopes_.exit_scope(scope);
    return regions;
}

auto LifetimeChecker::drop_escaping(const Regions& regions, ScopeId scope, SourceSpan span)
    -> Regions {
    Regions kept;
    std::set<BindingId> reported;
    for (const auto& region : regions) {
        if (!region.referent || !scopes_.declared_within(*region.referent, scope)) {
            kept.push_back(region);
        } else if (reported.insert(*region.referent).second) {
            const auto& referent = scopes_.binding(*region.referent);
            sink_->report(diag::Diagnostic::outlives_referent(referent.name, span, referent.span));
        }
    }
    return kept;
}

void LifetimeChecker::walk_stmt(const ast::Stmt& stmt) {
    if (stmt.is<ast::ExprStmt>()) {
        (void)walk_expr(*stmt.as<ast::ExprStmt>().expr);
        return;
    }

    const auto& let = stmt.as<ast::LetStmt>();
    types::TypePtr type = let.type_annotation;
    Regions regions;
    SourceSpan span = stmt.span;
    if (let.init) {
        regions = walk_expr(**let.init);
        span = (*let.init)->span;
        if (!type) {
            type = type_of(**let.init, scopes_, env_);
        }
    }

    for (auto id : declare_pattern(scopes_, *let.pattern, type)) {
        auto kept = check_store(regions, scopes_.region_depth(id), span);
        if (!kept.empty()) {
            referents_[id] = std::move(kept);
        }
    }
}

auto LifetimeChecker::walk_expr(const ast::Expr& expr) -> Regions {
    if (auto place = extract_place(expr, scopes_)) {
        if (expr.is<ast::IndexExpr>()) {
            (void)walk_expr(*expr.as<ast::IndexExpr>().index);
        }
        if (!may_carry_borrow(type_of(expr, scopes_, env_))) {
            return {};
        }
        return referents_of(place->root);
    }

    return std::visit(
        [this, &expr](const auto& e) -> Regions {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, ast::UnaryExpr>) {
                if (e.op == ast::UnaryOp::Ref || e.op == ast::UnaryOp::RefMut) {
                    if (auto place = extract_place(*e.operand, scopes_)) {
                        return borrow_regions(*place);
                    }
                    return walk_expr(*e.operand);
                }
                auto regions = walk_expr(*e.operand);
                return may_carry_borrow(type_of(expr, scopes_, env_)) ? regions : Regions{};
            } else if constexpr (std::is_same_v<T, ast::BinaryExpr>) {
                if (ast::is_assignment(e.op)) {
                    walk_assign(e, expr.span);
                } else {
                    (void)walk_expr(*e.left);
                    (void)walk_expr(*e.right);
                }
                return {};
            } else if constexpr (std::is_same_v<T, ast::CallExpr>) {
                (void)walk_expr(*e.callee);
                auto regions = walk_args(e.args);
                return may_carry_borrow(type_of(expr, scopes_, env_)) ? regions : Regions{};
            } else if constexpr (std::is_same_v<T, ast::MethodCallExpr>) {
                if (!e.sig) {
                    throw InvariantViolation("method call `" + e.method +
                                             "` has no resolved signature");
                }
                Regions regions;
                auto by_value = e.sig->receiver == types::ReceiverKind::Value;
                auto place = extract_place(*e.receiver, scopes_);
                if (by_value || !place ||
                    types::is_reference(type_of(*e.receiver, scopes_, env_))) {
                    regions = walk_expr(*e.receiver);
                } else {
                    // Auto-borrow of the receiver.
                    regions = borrow_regions(*place);
                }
                append(regions, walk_args(e.args));
                return may_carry_borrow(e.sig->return_type) ? regions : Regions{};
            } else if constexpr (std::is_same_v<T, ast::FieldExpr> ||
                                 std::is_same_v<T, ast::IndexExpr>) {
                auto regions = walk_expr(*e.object);
                if constexpr (std::is_same_v<T, ast::IndexExpr>) {
                    (void)walk_expr(*e.index);
                }
                return may_carry_borrow(type_of(expr, scopes_, env_)) ? regions : Regions{};
            } else if constexpr (std::is_same_v<T, ast::TupleExpr> ||
                                 std::is_same_v<T, ast::ArrayExpr>) {
                Regions regions;
                for (const auto& elem : e.elements) {
                    append(regions, walk_expr(*elem));
                }
                return regions;
            } else if constexpr (std::is_same_v<T, ast::StructExpr>) {
                Regions regions;
                for (const auto& field : e.fields) {
                    append(regions, walk_expr(*field.value));
                }
                return regions;
            } else if constexpr (std::is_same_v<T, ast::IfExpr>) {
                (void)walk_expr(*e.condition);
                auto regions = walk_scoped(*e.then_branch, ScopeKind::Branch, true);
                if (e.else_branch) {
                    append(regions, walk_scoped(**e.else_branch, ScopeKind::Branch, true));
                }
                return regions;
            } else if constexpr (std::is_same_v<T, ast::WhenExpr>) {
                auto scrutinee = walk_expr(*e.scrutinee);
                auto scrutinee_type = type_of(*e.scrutinee, scopes_, env_);
                Regions regions;
                for (const ast::WhenArm& arm : e.arms) {
                    auto scope = scopes_.enter_scope(ScopeKind::Branch);
                    for (auto id : declare_pattern(scopes_, *arm.pattern, scrutinee_type)) {
                        if (!scrutinee.empty()) {
                            referents_[id] = scrutinee;
                        }
                    }
                    if (arm.guard) {
                        (void)walk_expr(**arm.guard);
                    }
                    auto body = arm.body->is<ast::BlockExpr>()
                                    ? walk_scoped(*arm.body, ScopeKind::Block, false)
                                    : walk_expr(*arm.body);
                    append(regions, drop_escaping(body, scope, tail_span(*arm.body)));
                    scopes_.exit_scope(scope);
                }
                return regions;
            } else if constexpr (std::is_same_v<T, ast::LoopExpr>) {
                (void)walk_scoped(*e.body, ScopeKind::Loop, true);
                return {};
            } else if constexpr (std::is_same_v<T, ast::WhileExpr>) {
                (void)walk_expr(*e.condition);
                (void)walk_scoped(*e.body, ScopeKind::Loop, true);
                return {};
            } else if constexpr (std::is_same_v<T, ast::ForExpr>) {
                auto iterated = walk_expr(*e.iter);
                auto scope = scopes_.enter_scope(ScopeKind::Loop);
                for (auto id : declare_pattern(scopes_, *e.pattern, nullptr)) {
                    if (!iterated.empty()) {
                        referents_[id] = iterated;
                    }
                }
                (void)walk_scoped(*e.body, ScopeKind::Block, true);
                scopes_.exit_scope(scope);
                return {};
            } else if constexpr (std::is_same_v<T, ast::BlockExpr>) {
                return walk_scoped(expr, ScopeKind::Block, true);
            } else if constexpr (std::is_same_v<T, ast::ReturnExpr>) {
                if (e.value) {
                    auto regions = walk_expr(**e.value);
                    check_return(regions, return_depths_.back(), (*e.value)->span);
                }
                return {};
            } else if constexpr (std::is_same_v<T, ast::BreakExpr>) {
                if (e.value) {
                    (void)walk_expr(**e.value);
                }
                return {};
            } else if constexpr (std::is_same_v<T, ast::ClosureExpr>) {
                return walk_closure(e, expr.span);
            } else if constexpr (std::is_same_v<T, ast::CastExpr>) {
                auto regions = walk_expr(*e.expr);
                return types::is_raw_pointer(e.target) ? Regions{} : regions;
            } else if constexpr (std::is_same_v<T, ast::UnsafeExpr>) {
                return walk_scoped(*e.body, ScopeKind::Unsafe, true);
            } else {
                return {};
            }
        },
        expr.kind);
}

auto LifetimeChecker::walk_args(const std::vector<ast::ExprPtr>& args) -> Regions {
    Regions regions;
    for (const auto& arg : args) {
        append(regions, walk_expr(*arg));
    }
    return regions;
}

void LifetimeChecker::walk_assign(const ast::BinaryExpr& assign, SourceSpan span) {
    auto regions = walk_expr(*assign.right);

    auto place = extract_place(*assign.left, scopes_);
    if (!place) {
        (void)walk_expr(*assign.left);
        return;
    }
    if (assign.op != ast::BinaryOp::Assign) {
        return;
    }

    const auto& target = scopes_.binding(place->root);
    bool through_reference = place->through_deref ||
                             (types::is_reference(target.type) &&
                              (!place->fields.empty() || place->through_index));

    size_t depth = target.depth;
    if (through_reference) {
        // Stored into whatever the target points at.
        auto targets = referents_of(place->root);
        if (!targets.empty()) {
            depth = std::min_element(targets.begin(), targets.end(),
                                     [](const Region& a, const Region& b) {
                                         return a.depth < b.depth;
                                     })
                        ->depth;
        }
    }

    auto kept = check_store(regions, depth, span);
    if (through_reference) {
        return;
    }
    if (place->is_whole()) {
        if (kept.empty()) {
            referents_.erase(place->root);
        } else {
            referents_[place->root] = std::move(kept);
        }
    } else {
        append(referents_[place->root], kept);
    }
}

auto LifetimeChecker::walk_closure(const ast::ClosureExpr& closure, SourceSpan span) -> Regions {
    auto info = analyze_closure(closure, span, scopes_, env_, oracle_);

    // By-borrow captures make the closure point at the captured binding.
    Regions regions;
    for (const auto& capture : info.captures) {
        if (info.is_move || capture.mode == CaptureMode::Move) {
            append(regions, referents_of(capture.binding));
        } else {
            regions.push_back(Region{scopes_.region_depth(capture.binding), capture.binding});
        }
    }

    auto scope = scopes_.enter_scope(ScopeKind::Closure);
    auto depth = scopes_.current_depth();
    for (const auto& param : closure.params) {
        auto id = scopes_.declare_binding(param.name, param.is_mut, param.type, span,
                                          BindingKind::Param);
        if (may_carry_borrow(param.type)) {
            referents_[id] = {Region{depth, std::nullopt}};
        }
    }

    return_depths_.push_back(depth);
    Regions body = closure.body->is<ast::BlockExpr>()
                       ? walk_scoped(*closure.body, ScopeKind::Block, false)
                       : walk_expr(*closure.body);
    check_return(body, depth, tail_span(*closure.body));
    return_depths_.pop_back();

    scopes_.exit_scope(scope);
    return regions;
}

} // namespace borrowck::borrow
