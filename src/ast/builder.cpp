//! # Tree Construction Helpers
//!
//! Implementation of the factories declared in `ast/builder.hpp`.

#include "borrowck/ast/builder.hpp"

namespace borrowck::ast {

namespace {

auto make_pattern(decltype(Pattern::kind) kind) -> PatternPtr {
    auto pattern = make_box<Pattern>();
    pattern->kind = std::move(kind);
    return pattern;
}

auto make_stmt(decltype(Stmt::kind) kind, SourceSpan span = {}) -> StmtPtr {
    auto stmt = make_box<Stmt>();
    stmt->kind = std::move(kind);
    stmt->span = span;
    return stmt;
}

auto optional_of(ExprPtr expr) -> std::optional<ExprPtr> {
    if (!expr) {
        return std::nullopt;
    }
    return std::optional<ExprPtr>(std::move(expr));
}

} // namespace

auto make_expr(decltype(Expr::kind) kind, SourceSpan span) -> ExprPtr {
    auto expr = make_box<Expr>();
    expr->kind = std::move(kind);
    expr->span = span;
    return expr;
}

auto with_type(ExprPtr expr, TypePtr type) -> ExprPtr {
    expr->type = std::move(type);
    return expr;
}

auto make_int(int64_t value) -> ExprPtr {
    return with_type(make_expr(LiteralExpr{LiteralKind::Int, std::to_string(value)}),
                     types::make_i32());
}

auto make_bool_lit(bool value) -> ExprPtr {
    return with_type(make_expr(LiteralExpr{LiteralKind::Bool, value ? "true" : "false"}),
                     types::make_bool());
}

auto make_str_lit(std::string value) -> ExprPtr {
    return with_type(make_expr(LiteralExpr{LiteralKind::Str, std::move(value)}),
                     types::make_str());
}

auto make_unit_lit() -> ExprPtr {
    return with_type(make_expr(LiteralExpr{LiteralKind::Unit, "()"}), types::make_unit());
}

auto make_ident(std::string name, SourceSpan span) -> ExprPtr {
    return make_expr(IdentExpr{std::move(name)}, span);
}

auto make_unary(UnaryOp op, ExprPtr operand) -> ExprPtr {
    return make_expr(UnaryExpr{op, std::move(operand)});
}

auto make_ref(ExprPtr operand, SourceSpan span) -> ExprPtr {
    return make_expr(UnaryExpr{UnaryOp::Ref, std::move(operand)}, span);
}

auto make_ref_mut(ExprPtr operand, SourceSpan span) -> ExprPtr {
    return make_expr(UnaryExpr{UnaryOp::RefMut, std::move(operand)}, span);
}

auto make_deref(ExprPtr operand) -> ExprPtr {
    return make_expr(UnaryExpr{UnaryOp::Deref, std::move(operand)});
}

auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
    return make_expr(BinaryExpr{op, std::move(left), std::move(right)});
}

auto make_assign(ExprPtr target, ExprPtr value, SourceSpan span) -> ExprPtr {
    return make_expr(BinaryExpr{BinaryOp::Assign, std::move(target), std::move(value)}, span);
}

auto make_call(std::string callee, std::vector<ExprPtr> args, Rc<const types::FuncSig> sig,
               bool mutation_marker, SourceSpan span) -> ExprPtr {
    CallExpr call;
    call.callee = make_ident(std::move(callee), span);
    call.args = std::move(args);
    call.sig = std::move(sig);
    call.mutation_marker = mutation_marker;
    return make_expr(std::move(call), span);
}

auto make_closure_call(std::string callee, std::vector<ExprPtr> args, SourceSpan span) -> ExprPtr {
    return make_call(std::move(callee), std::move(args), nullptr, false, span);
}

auto make_method_call(ExprPtr receiver, std::string method, std::vector<ExprPtr> args,
                      Rc<const types::FuncSig> sig, bool mutation_marker, SourceSpan span)
    -> ExprPtr {
    MethodCallExpr call;
    call.receiver = std::move(receiver);
    call.method = std::move(method);
    call.args = std::move(args);
    call.sig = std::move(sig);
    call.mutation_marker = mutation_marker;
    return make_expr(std::move(call), span);
}

auto make_field(ExprPtr object, std::string field) -> ExprPtr {
    auto span = object->span;
    return make_expr(FieldExpr{std::move(object), std::move(field)}, span);
}

auto make_index(ExprPtr object, ExprPtr index) -> ExprPtr {
    auto span = object->span;
    return make_expr(IndexExpr{std::move(object), std::move(index)}, span);
}

auto make_tuple(std::vector<ExprPtr> elements) -> ExprPtr {
    return make_expr(TupleExpr{std::move(elements)});
}

auto make_array(std::vector<ExprPtr> elements) -> ExprPtr {
    return make_expr(ArrayExpr{std::move(elements)});
}

auto make_field_init(std::string name, ExprPtr value) -> FieldInit {
    return FieldInit{std::move(name), std::move(value)};
}

auto make_struct(std::string name, std::vector<FieldInit> fields, SourceSpan span) -> ExprPtr {
    return make_expr(StructExpr{std::move(name), std::move(fields)}, span);
}

auto make_if(ExprPtr condition, ExprPtr then_branch, ExprPtr else_branch) -> ExprPtr {
    return make_expr(
        IfExpr{std::move(condition), std::move(then_branch), optional_of(std::move(else_branch))});
}

auto make_arm(PatternPtr pattern, ExprPtr body, ExprPtr guard) -> WhenArm {
    return WhenArm{std::move(pattern), optional_of(std::move(guard)), std::move(body)};
}

auto make_when(ExprPtr scrutinee, std::vector<WhenArm> arms) -> ExprPtr {
    return make_expr(WhenExpr{std::move(scrutinee), std::move(arms)});
}

auto make_loop(ExprPtr body) -> ExprPtr {
    return make_expr(LoopExpr{std::move(body)});
}

auto make_while(ExprPtr condition, ExprPtr body) -> ExprPtr {
    return make_expr(WhileExpr{std::move(condition), std::move(body)});
}

auto make_for(PatternPtr pattern, ExprPtr iter, ExprPtr body) -> ExprPtr {
    return make_expr(ForExpr{std::move(pattern), std::move(iter), std::move(body)});
}

auto make_block(std::vector<StmtPtr> stmts, ExprPtr tail, SourceSpan span) -> ExprPtr {
    return make_expr(BlockExpr{std::move(stmts), optional_of(std::move(tail))}, span);
}

auto make_return(ExprPtr value, SourceSpan span) -> ExprPtr {
    return make_expr(ReturnExpr{optional_of(std::move(value))}, span);
}

auto make_break(ExprPtr value) -> ExprPtr {
    return make_expr(BreakExpr{optional_of(std::move(value))});
}

auto make_continue() -> ExprPtr {
    return make_expr(ContinueExpr{});
}

auto make_closure(std::vector<ClosureParam> params, ExprPtr body, bool is_move,
                  TypePtr return_type, SourceSpan span) -> ExprPtr {
    ClosureExpr closure;
    closure.params = std::move(params);
    closure.body = std::move(body);
    closure.is_move = is_move;
    closure.return_type = std::move(return_type);
    return make_expr(std::move(closure), span);
}

auto make_cast(ExprPtr expr, TypePtr target) -> ExprPtr {
    auto result = make_expr(CastExpr{std::move(expr), target});
    result->type = std::move(target);
    return result;
}

auto make_unsafe(ExprPtr body) -> ExprPtr {
    return make_expr(UnsafeExpr{std::move(body)});
}

auto make_ident_pattern(std::string name, bool is_mut) -> PatternPtr {
    return make_pattern(IdentPattern{std::move(name), is_mut});
}

auto make_wildcard_pattern() -> PatternPtr {
    return make_pattern(WildcardPattern{});
}

auto make_literal_pattern(std::string text) -> PatternPtr {
    return make_pattern(LiteralPattern{std::move(text)});
}

auto make_tuple_pattern(std::vector<PatternPtr> elements) -> PatternPtr {
    return make_pattern(TuplePattern{std::move(elements)});
}

auto make_let(std::string name, bool is_mut, ExprPtr init, TypePtr type, SourceSpan span)
    -> StmtPtr {
    auto pattern = make_ident_pattern(std::move(name), is_mut);
    pattern->span = span;
    return make_stmt(LetStmt{std::move(pattern), std::move(type), optional_of(std::move(init))},
                     span);
}

auto make_let_pattern(PatternPtr pattern, ExprPtr init, TypePtr type) -> StmtPtr {
    return make_stmt(LetStmt{std::move(pattern), std::move(type), optional_of(std::move(init))});
}

auto make_expr_stmt(ExprPtr expr) -> StmtPtr {
    auto span = expr->span;
    return make_stmt(ExprStmt{std::move(expr)}, span);
}

auto make_sig(std::string name, std::vector<TypePtr> params, TypePtr return_type, bool is_mutating,
              std::optional<types::ReceiverKind> receiver) -> Rc<const types::FuncSig> {
    auto sig = make_rc<types::FuncSig>();
    sig->name = std::move(name);
    sig->params = std::move(params);
    sig->return_type = std::move(return_type);
    sig->is_mutating = is_mutating;
    sig->receiver = receiver;
    return sig;
}

auto make_param(std::string name, TypePtr type, bool is_mut) -> FuncParam {
    FuncParam param;
    param.name = std::move(name);
    param.type = std::move(type);
    param.is_mut = is_mut;
    return param;
}

auto make_func(std::string name, std::vector<FuncParam> params, TypePtr return_type, ExprPtr body)
    -> FuncDecl {
    FuncDecl func;
    func.name = std::move(name);
    func.params = std::move(params);
    func.return_type = return_type ? std::move(return_type) : types::make_unit();
    func.body = optional_of(std::move(body));
    return func;
}

auto make_method(std::string name, types::ReceiverKind receiver, bool is_mutating,
                 std::vector<FuncParam> params, TypePtr return_type, ExprPtr body) -> FuncDecl {
    auto func = make_func(std::move(name), std::move(params), std::move(return_type),
                          std::move(body));
    func.receiver = Receiver{};
    func.receiver->kind = receiver;
    func.is_mutating = is_mutating;
    return func;
}

auto make_decl(FuncDecl func) -> DeclPtr {
    auto decl = make_box<Decl>();
    decl->span = func.span;
    decl->kind = std::move(func);
    return decl;
}

auto make_struct_decl(std::string name, std::vector<StructField> fields, bool is_copy)
    -> DeclPtr {
    auto decl = make_box<Decl>();
    decl->kind = StructDecl{std::move(name), std::move(fields), is_copy, {}};
    return decl;
}

auto make_contract_decl(std::string name, std::vector<types::FuncSig> methods) -> DeclPtr {
    auto decl = make_box<Decl>();
    decl->kind = ContractDecl{std::move(name), std::move(methods), {}};
    return decl;
}

auto make_impl_decl(std::string contract_name, std::string type_name,
                    std::vector<FuncDecl> methods) -> DeclPtr {
    auto decl = make_box<Decl>();
    decl->kind = ImplDecl{std::move(contract_name), std::move(type_name), std::move(methods), {}};
    return decl;
}

auto make_const_decl(std::string name, TypePtr type, ExprPtr value) -> DeclPtr {
    auto decl = make_box<Decl>();
    decl->kind = ConstDecl{std::move(name), std::move(type), std::move(value), {}};
    return decl;
}

} // namespace borrowck::ast
