//! # Move Checker Implementation
//!
//! The walk threads one `FlowState` through the unit. Branches copy it, walk
//! each arm from the copy and join the results; `return`, `break` and
//! `continue` mark the state diverged after handing a copy to the enclosing
//! loop frame.
//!
//! ## Use Contexts
//!
//! | Context                                           | Use       |
//! |---------------------------------------------------|-----------|
//! | `let` initializer, assignment right-hand side     | Consume   |
//! | argument for a by-value parameter                 | Consume   |
//! | receiver of a by-value method                     | Consume   |
//! | `return`/`break` value, aggregate element         | Consume   |
//! | `for` iterable, function body tail                | Consume   |
//! | block, `if` and `when` tails                      | inherited |
//! | everything else                                   | Read      |
//!
//! Consuming a place through a deref or index projection only reads it.

#include "borrowck/borrow/moves.hpp"

#include "borrowck/log/log.hpp"

namespace borrowck::borrow {

namespace {

auto join_path(const std::vector<std::string>& fields) -> std::string {
    std::string path;
    for (const auto& field : fields) {
        if (!path.empty()) {
            path += '.';
        }
        path += field;
    }
    return path;
}

/// True if `path` is `ancestor` or lies below it.
auto path_within(const std::string& path, const std::string& ancestor) -> bool {
    return path == ancestor ||
           (path.size() > ancestor.size() && path.compare(0, ancestor.size(), ancestor) == 0 &&
            path[ancestor.size()] == '.');
}

} // namespace

// ============================================================================
// Flow states
// ============================================================================

auto OwnershipState::join(const OwnershipState& a, const OwnershipState& b) -> OwnershipState {
    bool a_moved = a.kind == OwnershipKind::Moved;
    bool b_moved = b.kind == OwnershipKind::Moved;

    OwnershipState result;
    if (a_moved || b_moved) {
        result.kind = OwnershipKind::Moved;
        result.uninitialized = (!a_moved || a.uninitialized) && (!b_moved || b.uninitialized);
        result.moved_at = a_moved ? a.moved_at : b.moved_at;
        return result;
    }
    if (a.kind == OwnershipKind::PartiallyMoved || b.kind == OwnershipKind::PartiallyMoved) {
        result.kind = OwnershipKind::PartiallyMoved;
        result.moved_fields = a.moved_fields;
        result.moved_fields.insert(b.moved_fields.begin(), b.moved_fields.end());
        result.moved_at = a.moved_at ? a.moved_at : b.moved_at;
    }
    return result;
}

auto FlowState::get(BindingId id) const -> OwnershipState {
    auto it = bindings.find(id);
    return it != bindings.end() ? it->second : OwnershipState{};
}

void FlowState::set(BindingId id, OwnershipState state) {
    if (state.kind == OwnershipKind::Owned) {
        bindings.erase(id);
    } else {
        bindings[id] = std::move(state);
    }
}

auto FlowState::join(const FlowState& a, const FlowState& b) -> FlowState {
    if (a.diverged) {
        return b;
    }
    if (b.diverged) {
        return a;
    }

    FlowState result;
    for (const auto& [id, state] : a.bindings) {
        result.set(id, OwnershipState::join(state, b.get(id)));
    }
    for (const auto& [id, state] : b.bindings) {
        if (!a.bindings.contains(id)) {
            result.set(id, OwnershipState::join(OwnershipState{}, state));
        }
    }
    return result;
}

// ============================================================================
// MoveChecker
// ============================================================================

MoveChecker::MoveChecker(const ModuleEnv& env, const types::CopyOracle& oracle)
    : env_(env), oracle_(oracle) {}

void MoveChecker::check(const CheckUnit& unit, diag::DiagnosticSink& sink) {
    BORROWCK_LOG_TRACE("moves", "checking " << unit.qualified_name());

    scopes_ = ScopeTable{};
    state_ = FlowState{};
    closure_kinds_.clear();
    closure_nodes_.clear();
    loops_.clear();
    silent_ = 0;
    sink_ = &sink;

    // Bindings of an exited scope are gone; forget their states.
    scopes_.add_exit_hook([this](const Scope& scope) {
        for (auto id : scope.bindings) {
            state_.bindings.erase(id);
        }
    });

    auto fn_scope = open_unit(scopes_, env_, unit);
    walk_scoped(**unit.func->body, ScopeKind::Block, Use::Consume);
    scopes_.exit_scope(fn_scope);
}

auto MoveChecker::is_tracked(BindingId id) const -> bool {
    const auto& binding = scopes_.binding(id);
    return binding.kind != BindingKind::Global && !oracle_.is_copy(binding.type);
}

void MoveChecker::prune(FlowState& state) const {
    std::erase_if(state.bindings, [this](const auto& entry) {
        return !scopes_.scope(scopes_.binding(entry.first).scope).live;
    });
}

void MoveChecker::report(diag::Diagnostic diagnostic) {
    if (silent_ > 0 || state_.diverged) {
        return;
    }
    sink_->report(std::move(diagnostic));
}

// ============================================================================
// Statements and blocks
// ============================================================================

void MoveChecker::walk_scoped(const ast::Expr& expr, ScopeKind kind, Use use) {
    auto scope = scopes_.enter_scope(kind);
    if (expr.is<ast::BlockExpr>()) {
        walk_block_body(expr.as<ast::BlockExpr>(), use);
    } else {
        walk_expr(expr, use);
    }
    scopes_.exit_scope(scope);
}

void MoveChecker::walk_block_body(const ast::BlockExpr& block, Use use) {
    for (const auto& stmt : block.stmts) {
        walk_stmt(*stmt);
    }
    if (block.expr) {
        walk_expr(**block.expr, use);
    }
}

void MoveChecker::walk_stmt(const ast::Stmt& stmt) {
    if (stmt.is<ast::ExprStmt>()) {
        walk_expr(*stmt.as<ast::ExprStmt>().expr, Use::Read);
    } else {
        declare_let(stmt.as<ast::LetStmt>());
    }
}

void MoveChecker::declare_let(const ast::LetStmt& let) {
    types::TypePtr type = let.type_annotation;
    std::optional<CallableKind> closure_kind;

    if (let.init) {
        const auto& init = **let.init;
        walk_expr(init, Use::Consume);
        if (!type) {
            type = type_of(init, scopes_, env_);
        }
        if (init.is<ast::ClosureExpr>()) {
            auto it = closure_nodes_.find(&init.as<ast::ClosureExpr>());
            if (it != closure_nodes_.end()) {
                closure_kind = it->second;
            }
        } else if (init.is<ast::IdentExpr>()) {
            auto source = scopes_.resolve(init.as<ast::IdentExpr>().name);
            auto it = closure_kinds_.find(source);
            if (it != closure_kinds_.end()) {
                closure_kind = it->second;
            }
        }
    }

    auto ids = declare_pattern(scopes_, *let.pattern, type);
    for (auto id : ids) {
        if (!let.init && is_tracked(id)) {
            OwnershipState state;
            state.kind = OwnershipKind::Moved;
            state.uninitialized = true;
            state_.set(id, std::move(state));
        }
    }
    if (closure_kind && ids.size() == 1) {
        closure_kinds_[ids.front()] = *closure_kind;
    }
}

// ============================================================================
// Expressions
// ============================================================================

void MoveChecker::walk_expr(const ast::Expr& expr, Use use) {
    if (auto place = extract_place(expr, scopes_)) {
        walk_place(expr, *place, use);
        return;
    }

    std::visit(
        [this, &expr, use](const auto& e) {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, ast::UnaryExpr>) {
                walk_expr(*e.operand, Use::Read);
            } else if constexpr (std::is_same_v<T, ast::BinaryExpr>) {
                if (ast::is_assignment(e.op)) {
                    walk_assign(e);
                } else {
                    walk_expr(*e.left, Use::Read);
                    walk_expr(*e.right, Use::Read);
                }
            } else if constexpr (std::is_same_v<T, ast::CallExpr>) {
                walk_call(e);
            } else if constexpr (std::is_same_v<T, ast::MethodCallExpr>) {
                if (!e.sig) {
                    throw InvariantViolation("method call `" + e.method +
                                             "` has no resolved signature");
                }
                bool by_value = e.sig->receiver == types::ReceiverKind::Value;
                walk_expr(*e.receiver, by_value ? Use::Consume : Use::Read);
                walk_args(e.args, e.sig->params);
            } else if constexpr (std::is_same_v<T, ast::FieldExpr>) {
                walk_expr(*e.object, Use::Read);
            } else if constexpr (std::is_same_v<T, ast::IndexExpr>) {
                walk_expr(*e.object, Use::Read);
                walk_expr(*e.index, Use::Read);
            } else if constexpr (std::is_same_v<T, ast::TupleExpr> ||
                                 std::is_same_v<T, ast::ArrayExpr>) {
                for (const auto& elem : e.elements) {
                    walk_expr(*elem, Use::Consume);
                }
            } else if constexpr (std::is_same_v<T, ast::StructExpr>) {
                for (const auto& field : e.fields) {
                    walk_expr(*field.value, Use::Consume);
                }
            } else if constexpr (std::is_same_v<T, ast::IfExpr>) {
                walk_expr(*e.condition, Use::Read);
                FlowState entry = state_;
                walk_scoped(*e.then_branch, ScopeKind::Branch, use);
                FlowState then_state = std::move(state_);
                state_ = std::move(entry);
                if (e.else_branch) {
                    walk_scoped(**e.else_branch, ScopeKind::Branch, use);
                }
                state_ = FlowState::join(then_state, state_);
            } else if constexpr (std::is_same_v<T, ast::WhenExpr>) {
                walk_when(e, use);
            } else if constexpr (std::is_same_v<T, ast::LoopExpr>) {
                auto pass = walk_loop(nullptr, *e.body, nullptr);
                FlowState exit;
                exit.diverged = true;
                for (const auto& state : pass.frame.breaks) {
                    exit = FlowState::join(exit, state);
                }
                state_ = std::move(exit);
                prune(state_);
            } else if constexpr (std::is_same_v<T, ast::WhileExpr> ||
                                 std::is_same_v<T, ast::ForExpr>) {
                LoopPass pass;
                if constexpr (std::is_same_v<T, ast::WhileExpr>) {
                    pass = walk_loop(e.condition.get(), *e.body, nullptr);
                } else {
                    walk_expr(*e.iter, Use::Consume);
                    pass = walk_loop(nullptr, *e.body, e.pattern.get());
                }
                FlowState exit = std::move(pass.head);
                for (const auto& state : pass.frame.breaks) {
                    exit = FlowState::join(exit, state);
                }
                state_ = std::move(exit);
                prune(state_);
            } else if constexpr (std::is_same_v<T, ast::BlockExpr>) {
                walk_scoped(expr, ScopeKind::Block, use);
            } else if constexpr (std::is_same_v<T, ast::ReturnExpr>) {
                if (e.value) {
                    walk_expr(**e.value, Use::Consume);
                }
                state_.diverged = true;
            } else if constexpr (std::is_same_v<T, ast::BreakExpr>) {
                if (e.value) {
                    walk_expr(**e.value, Use::Consume);
                }
                if (!loops_.empty()) {
                    loops_.back().breaks.push_back(state_);
                }
                state_.diverged = true;
            } else if constexpr (std::is_same_v<T, ast::ContinueExpr>) {
                if (!loops_.empty()) {
                    loops_.back().continues.push_back(state_);
                }
                state_.diverged = true;
            } else if constexpr (std::is_same_v<T, ast::ClosureExpr>) {
                walk_closure(e, expr.span);
            } else if constexpr (std::is_same_v<T, ast::CastExpr>) {
                walk_expr(*e.expr, Use::Read);
            } else if constexpr (std::is_same_v<T, ast::UnsafeExpr>) {
                walk_scoped(*e.body, ScopeKind::Unsafe, use);
            }
        },
        expr.kind);
}

void MoveChecker::walk_place(const ast::Expr& expr, const Place& place, Use use) {
    walk_projection_operands(expr);
    if (!is_tracked(place.root)) {
        return;
    }

    check_use(place, expr.span);
    if (use == Use::Consume && !place.through_deref && !place.through_index &&
        !oracle_.is_copy(type_of(expr, scopes_, env_))) {
        mark_moved(place, expr.span);
    }
}

void MoveChecker::walk_projection_operands(const ast::Expr& expr) {
    if (expr.is<ast::IndexExpr>()) {
        walk_projection_operands(*expr.as<ast::IndexExpr>().object);
        walk_expr(*expr.as<ast::IndexExpr>().index, Use::Read);
    } else if (expr.is<ast::FieldExpr>()) {
        walk_projection_operands(*expr.as<ast::FieldExpr>().object);
    } else if (expr.is<ast::UnaryExpr>()) {
        walk_projection_operands(*expr.as<ast::UnaryExpr>().operand);
    }
}

void MoveChecker::check_use(const Place& place, SourceSpan span) {
    auto state = state_.get(place.root);
    const auto& binding = scopes_.binding(place.root);

    if (state.kind == OwnershipKind::Moved) {
        if (state.uninitialized) {
            report(diag::Diagnostic::use_of_uninitialized(binding.name, span));
        } else {
            report(diag::Diagnostic::use_after_move(binding.name, span, state.moved_at));
        }
        return;
    }
    if (state.kind != OwnershipKind::PartiallyMoved) {
        return;
    }

    std::vector<std::string> moved(state.moved_fields.begin(), state.moved_fields.end());
    if (place.fields.empty()) {
        report(diag::Diagnostic::use_of_partially_moved(binding.name, span, moved,
                                                        state.moved_at));
        return;
    }

    auto path = join_path(place.fields);
    for (const auto& field : moved) {
        if (path_within(path, field)) {
            report(diag::Diagnostic::use_after_move(binding.name + "." + path, span,
                                                    state.moved_at));
            return;
        }
    }
    std::vector<std::string> below;
    for (const auto& field : moved) {
        if (path_within(field, path)) {
            below.push_back(field);
        }
    }
    if (!below.empty()) {
        report(diag::Diagnostic::use_of_partially_moved(binding.name, span, below,
                                                        state.moved_at));
    }
}

void MoveChecker::mark_moved(const Place& place, SourceSpan span) {
    OwnershipState state = state_.get(place.root);
    if (place.fields.empty()) {
        state.kind = OwnershipKind::Moved;
        state.uninitialized = false;
        state.moved_fields.clear();
        state.moved_at = span;
    } else if (state.kind != OwnershipKind::Moved) {
        state.kind = OwnershipKind::PartiallyMoved;
        state.moved_fields.insert(join_path(place.fields));
        state.moved_at = span;
    }

    BORROWCK_LOG_TRACE("moves", "moved " << place.to_string(scopes_) << " at "
                                         << span_to_string(span));
    state_.set(place.root, std::move(state));
}

// ============================================================================
// Assignment and calls
// ============================================================================

void MoveChecker::walk_assign(const ast::BinaryExpr& assign) {
    walk_expr(*assign.right, Use::Consume);

    auto place = extract_place(*assign.left, scopes_);
    if (!place) {
        walk_expr(*assign.left, Use::Read);
        return;
    }
    walk_projection_operands(*assign.left);
    if (!is_tracked(place->root)) {
        return;
    }

    bool compound = assign.op != ast::BinaryOp::Assign;
    if (compound || place->through_deref || place->through_index) {
        // The target's current value is read, or written through.
        check_use(*place, assign.left->span);
        return;
    }

    if (place->fields.empty()) {
        state_.set(place->root, OwnershipState{});
        return;
    }

    auto state = state_.get(place->root);
    if (state.kind == OwnershipKind::Moved) {
        check_use(*place, assign.left->span);
        return;
    }
    auto path = join_path(place->fields);
    std::erase_if(state.moved_fields,
                  [&path](const std::string& field) { return path_within(field, path); });
    if (state.moved_fields.empty()) {
        state = OwnershipState{};
    }
    state_.set(place->root, std::move(state));
}

auto MoveChecker::param_types(const ast::CallExpr& call) const -> std::vector<types::TypePtr> {
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

void MoveChecker::walk_args(const std::vector<ast::ExprPtr>& args,
                            const std::vector<types::TypePtr>& params) {
    for (size_t i = 0; i < args.size(); ++i) {
        bool by_ref = i < params.size() && types::is_reference(params[i]);
        walk_expr(*args[i], by_ref ? Use::Read : Use::Consume);
    }
}

void MoveChecker::walk_call(const ast::CallExpr& call) {
    auto place = extract_place(*call.callee, scopes_);
    if (place && place->is_whole()) {
        // Calling a one-shot closure consumes it.
        auto it = closure_kinds_.find(place->root);
        bool one_shot = it != closure_kinds_.end() && it->second == CallableKind::OneShot;
        walk_place(*call.callee, *place, one_shot ? Use::Consume : Use::Read);
    } else {
        walk_expr(*call.callee, Use::Read);
    }
    walk_args(call.args, param_types(call));
}

// ============================================================================
// Branches, loops and closures
// ============================================================================

void MoveChecker::walk_when(const ast::WhenExpr& when, Use use) {
    walk_expr(*when.scrutinee, Use::Read);
    if (when.arms.empty()) {
        return;
    }

    auto scrutinee_type = type_of(*when.scrutinee, scopes_, env_);
    FlowState entry = state_;
    FlowState result;
    result.diverged = true;
    for (const auto& arm : when.arms) {
        state_ = entry;
        auto scope = scopes_.enter_scope(ScopeKind::Branch);
        declare_pattern(scopes_, *arm.pattern, scrutinee_type);
        if (arm.guard) {
            walk_expr(**arm.guard, Use::Read);
        }
        walk_expr(*arm.body, use);
        scopes_.exit_scope(scope);
        result = FlowState::join(result, state_);
    }
    state_ = std::move(result);
}

auto MoveChecker::walk_loop_once(const ast::Expr* condition, const ast::Expr& body,
                                 const ast::Pattern* pattern) -> LoopPass {
    LoopPass pass;
    loops_.emplace_back();

    auto scope = scopes_.enter_scope(ScopeKind::Loop);
    if (condition) {
        walk_expr(*condition, Use::Read);
    }
    pass.head = state_;
    if (pattern) {
        declare_pattern(scopes_, *pattern, nullptr);
    }
    walk_scoped(body, ScopeKind::Block, Use::Read);
    scopes_.exit_scope(scope);

    pass.body_end = state_;
    pass.frame = std::move(loops_.back());
    loops_.pop_back();

    prune(pass.head);
    for (auto& state : pass.frame.breaks) {
        prune(state);
    }
    for (auto& state : pass.frame.continues) {
        prune(state);
    }
    return pass;
}

auto MoveChecker::walk_loop(const ast::Expr* condition, const ast::Expr& body,
                            const ast::Pattern* pattern) -> LoopPass {
    const FlowState entry = state_;
    FlowState head = entry;

    ++silent_;
    for (int iteration = 0; iteration < MAX_LOOP_ITERATIONS; ++iteration) {
        state_ = head;
        auto pass = walk_loop_once(condition, body, pattern);

        FlowState next = FlowState::join(entry, pass.body_end);
        for (const auto& state : pass.frame.continues) {
            next = FlowState::join(next, state);
        }
        prune(next);
        if (next == head) {
            BORROWCK_LOG_TRACE("moves", "loop stable after " << iteration + 1 << " iteration(s)");
            break;
        }
        head = std::move(next);
    }
    --silent_;

    state_ = head;
    return walk_loop_once(condition, body, pattern);
}

void MoveChecker::walk_closure(const ast::ClosureExpr& closure, SourceSpan span) {
    auto info = analyze_closure(closure, span, scopes_, env_, oracle_);
    closure_nodes_[&closure] = info.kind;

    // Captures are used at creation; by-move captures leave the outer scope.
    for (const auto& capture : info.captures) {
        if (!is_tracked(capture.binding)) {
            continue;
        }
        Place place{capture.binding, {}, false, false};
        check_use(place, capture.span);
        if (capture.mode == CaptureMode::Move) {
            mark_moved(place, span);
        }
    }

    // The body runs later, owning or borrowing fresh copies of the captures.
    FlowState outer = state_;
    auto saved_loops = std::move(loops_);
    loops_.clear();
    for (const auto& capture : info.captures) {
        state_.bindings.erase(capture.binding);
    }

    auto scope = scopes_.enter_scope(ScopeKind::Closure);
    for (const auto& param : closure.params) {
        scopes_.declare_binding(param.name, param.is_mut, param.type, span, BindingKind::Param);
    }
    walk_expr(*closure.body, Use::Consume);
    scopes_.exit_scope(scope);

    loops_ = std::move(saved_loops);
    state_ = std::move(outer);
}

} // namespace borrowck::borrow
