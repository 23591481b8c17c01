//! # Tree Construction Helpers
//!
//! Factories for building resolved trees by hand: in tests, and in front-ends
//! that synthesize nodes. Node ownership is `Box`, so lists are built with
//! `list_of<T>(...)` rather than brace-init (which would copy).
//!
//! ```cpp
//! auto body = make_block(list_of<StmtPtr>(
//!     make_let("x", false, make_int(1)),
//!     make_expr_stmt(make_assign(make_ident("x"), make_int(2)))));
//! ```

#ifndef BORROWCK_AST_BUILDER_HPP
#define BORROWCK_AST_BUILDER_HPP

#include "borrowck/ast/ast.hpp"

#include <cstdint>
#include <utility>

namespace borrowck::ast {

/// Moves each argument into a new vector.
template <typename T, typename... Args> auto list_of(Args&&... args) -> std::vector<T> {
    std::vector<T> out;
    out.reserve(sizeof...(args));
    (out.push_back(std::forward<Args>(args)), ...);
    return out;
}

// ============================================================================
// Expressions
// ============================================================================

[[nodiscard]] auto make_expr(decltype(Expr::kind) kind, SourceSpan span = {}) -> ExprPtr;
[[nodiscard]] auto with_type(ExprPtr expr, TypePtr type) -> ExprPtr;

[[nodiscard]] auto make_int(int64_t value) -> ExprPtr;
[[nodiscard]] auto make_bool_lit(bool value) -> ExprPtr;
[[nodiscard]] auto make_str_lit(std::string value) -> ExprPtr;
[[nodiscard]] auto make_unit_lit() -> ExprPtr;
[[nodiscard]] auto make_ident(std::string name, SourceSpan span = {}) -> ExprPtr;

[[nodiscard]] auto make_unary(UnaryOp op, ExprPtr operand) -> ExprPtr;
[[nodiscard]] auto make_ref(ExprPtr operand, SourceSpan span = {}) -> ExprPtr;
[[nodiscard]] auto make_ref_mut(ExprPtr operand, SourceSpan span = {}) -> ExprPtr;
[[nodiscard]] auto make_deref(ExprPtr operand) -> ExprPtr;

[[nodiscard]] auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr;
[[nodiscard]] auto make_assign(ExprPtr target, ExprPtr value, SourceSpan span = {}) -> ExprPtr;

/// Call of a declared callable by name.
[[nodiscard]] auto make_call(std::string callee, std::vector<ExprPtr> args,
                             Rc<const types::FuncSig> sig, bool mutation_marker = false,
                             SourceSpan span = {}) -> ExprPtr;

/// Call of a closure value held by `callee`.
[[nodiscard]] auto make_closure_call(std::string callee, std::vector<ExprPtr> args,
                                     SourceSpan span = {}) -> ExprPtr;

[[nodiscard]] auto make_method_call(ExprPtr receiver, std::string method,
                                    std::vector<ExprPtr> args, Rc<const types::FuncSig> sig,
                                    bool mutation_marker = false, SourceSpan span = {})
    -> ExprPtr;

[[nodiscard]] auto make_field(ExprPtr object, std::string field) -> ExprPtr;
[[nodiscard]] auto make_index(ExprPtr object, ExprPtr index) -> ExprPtr;
[[nodiscard]] auto make_tuple(std::vector<ExprPtr> elements) -> ExprPtr;
[[nodiscard]] auto make_array(std::vector<ExprPtr> elements) -> ExprPtr;
[[nodiscard]] auto make_field_init(std::string name, ExprPtr value) -> FieldInit;
[[nodiscard]] auto make_struct(std::string name, std::vector<FieldInit> fields,
                               SourceSpan span = {}) -> ExprPtr;

[[nodiscard]] auto make_if(ExprPtr condition, ExprPtr then_branch, ExprPtr else_branch = nullptr)
    -> ExprPtr;
[[nodiscard]] auto make_arm(PatternPtr pattern, ExprPtr body, ExprPtr guard = nullptr) -> WhenArm;
[[nodiscard]] auto make_when(ExprPtr scrutinee, std::vector<WhenArm> arms) -> ExprPtr;
[[nodiscard]] auto make_loop(ExprPtr body) -> ExprPtr;
[[nodiscard]] auto make_while(ExprPtr condition, ExprPtr body) -> ExprPtr;
[[nodiscard]] auto make_for(PatternPtr pattern, ExprPtr iter, ExprPtr body) -> ExprPtr;
[[nodiscard]] auto make_block(std::vector<StmtPtr> stmts, ExprPtr tail = nullptr,
                              SourceSpan span = {}) -> ExprPtr;
[[nodiscard]] auto make_return(ExprPtr value = nullptr, SourceSpan span = {}) -> ExprPtr;
[[nodiscard]] auto make_break(ExprPtr value = nullptr) -> ExprPtr;
[[nodiscard]] auto make_continue() -> ExprPtr;
[[nodiscard]] auto make_closure(std::vector<ClosureParam> params, ExprPtr body,
                                bool is_move = false, TypePtr return_type = nullptr,
                                SourceSpan span = {}) -> ExprPtr;
[[nodiscard]] auto make_cast(ExprPtr expr, TypePtr target) -> ExprPtr;
[[nodiscard]] auto make_unsafe(ExprPtr body) -> ExprPtr;

// ============================================================================
// Patterns and Statements
// ============================================================================

[[nodiscard]] auto make_ident_pattern(std::string name, bool is_mut = false) -> PatternPtr;
[[nodiscard]] auto make_wildcard_pattern() -> PatternPtr;
[[nodiscard]] auto make_literal_pattern(std::string text) -> PatternPtr;
[[nodiscard]] auto make_tuple_pattern(std::vector<PatternPtr> elements) -> PatternPtr;

/// `let [mut] name[: type] [= init]`; a null `init` declares without initializing.
[[nodiscard]] auto make_let(std::string name, bool is_mut, ExprPtr init, TypePtr type = nullptr,
                            SourceSpan span = {}) -> StmtPtr;
[[nodiscard]] auto make_let_pattern(PatternPtr pattern, ExprPtr init, TypePtr type = nullptr)
    -> StmtPtr;
[[nodiscard]] auto make_expr_stmt(ExprPtr expr) -> StmtPtr;

// ============================================================================
// Declarations
// ============================================================================

[[nodiscard]] auto make_sig(std::string name, std::vector<TypePtr> params, TypePtr return_type,
                            bool is_mutating = false,
                            std::optional<types::ReceiverKind> receiver = std::nullopt)
    -> Rc<const types::FuncSig>;

[[nodiscard]] auto make_param(std::string name, TypePtr type, bool is_mut = false) -> FuncParam;

/// Free function declaration.
[[nodiscard]] auto make_func(std::string name, std::vector<FuncParam> params, TypePtr return_type,
                             ExprPtr body) -> FuncDecl;

/// Method declaration with a receiver.
[[nodiscard]] auto make_method(std::string name, types::ReceiverKind receiver, bool is_mutating,
                               std::vector<FuncParam> params, TypePtr return_type, ExprPtr body)
    -> FuncDecl;

[[nodiscard]] auto make_decl(FuncDecl func) -> DeclPtr;
[[nodiscard]] auto make_struct_decl(std::string name, std::vector<StructField> fields,
                                    bool is_copy = false) -> DeclPtr;
[[nodiscard]] auto make_contract_decl(std::string name, std::vector<types::FuncSig> methods)
    -> DeclPtr;
[[nodiscard]] auto make_impl_decl(std::string contract_name, std::string type_name,
                                  std::vector<FuncDecl> methods) -> DeclPtr;
[[nodiscard]] auto make_const_decl(std::string name, TypePtr type, ExprPtr value) -> DeclPtr;

} // namespace borrowck::ast

#endif // BORROWCK_AST_BUILDER_HPP
