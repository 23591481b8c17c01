//! # Syntax Tree
//!
//! The resolved, type-annotated tree the verifier walks. Upstream stages
//! (parsing, name resolution, type inference) produce it; the checkers only
//! read it.
//!
//! ## Node Families
//!
//! | Family    | Root type  | Variants                                      |
//! |-----------|------------|-----------------------------------------------|
//! | Patterns  | `Pattern`  | ident, tuple, wildcard, literal               |
//! | Exprs     | `Expr`     | literals, operators, calls, access, control flow, closures, casts, `unsafe` |
//! | Stmts     | `Stmt`     | `let`, expression statements                  |
//! | Decls     | `Decl`     | funcs, structs, contracts, impls, consts      |
//!
//! Every family is a closed `std::variant`; the phases dispatch over it with
//! `std::visit` or `is<T>()` / `as<T>()` chains.
//!
//! ## Resolution Guarantees
//!
//! - Every identifier resolves to a declaration in an enclosing scope.
//! - Every call of a declared callable carries its resolved `FuncSig`.
//!   Calls of closure values carry no signature.
//! - `Expr::type`, when set, is the resolved type of the expression.

#ifndef BORROWCK_AST_AST_HPP
#define BORROWCK_AST_AST_HPP

#include "borrowck/common.hpp"
#include "borrowck/types/type.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace borrowck::ast {

struct Expr;
struct Stmt;
struct Decl;
struct Pattern;

using ExprPtr = Box<Expr>;
using StmtPtr = Box<Stmt>;
using DeclPtr = Box<Decl>;
using PatternPtr = Box<Pattern>;
using types::TypePtr;

// ============================================================================
// Patterns
// ============================================================================

/// `_`
struct WildcardPattern {};

/// `x` or `mut x`.
struct IdentPattern {
    std::string name;
    bool is_mut = false;
};

/// `42`, `true` (only in `when` arms).
struct LiteralPattern {
    std::string text;
};

/// `(a, mut b, _)`.
struct TuplePattern {
    std::vector<PatternPtr> elements;
};

struct Pattern {
    std::variant<WildcardPattern, IdentPattern, LiteralPattern, TuplePattern> kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// ============================================================================
// Expressions
// ============================================================================

enum class LiteralKind { Int, Float, Bool, Char, Str, Unit };

struct LiteralExpr {
    LiteralKind lit_kind;
    std::string text;
};

struct IdentExpr {
    std::string name;
};

enum class UnaryOp {
    Neg,    ///< `-x`
    Not,    ///< `not x`
    Ref,    ///< `ref x`
    RefMut, ///< `mut ref x`
    Deref,  ///< `*x`
};

struct UnaryExpr {
    UnaryOp op;
    ExprPtr operand;
};

enum class BinaryOp {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Eq,
    Ne,
    Lt,
    Gt,
    Le,
    Ge,
    And,
    Or,
    Assign,
    AddAssign,
    SubAssign,
    MulAssign,
    DivAssign,
    ModAssign,
};

/// True for `=` and every compound assignment.
[[nodiscard]] auto is_assignment(BinaryOp op) -> bool;

/// True for comparisons and logical operators (result is `Bool`).
[[nodiscard]] auto is_comparison(BinaryOp op) -> bool;

[[nodiscard]] auto binary_op_to_string(BinaryOp op) -> const char*;

struct BinaryExpr {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
};

/// Call expression: `foo(a, b)` or `counter!(1)`.
///
/// `sig` is null when the callee is a closure value.
struct CallExpr {
    ExprPtr callee;
    std::vector<ExprPtr> args;
    Rc<const types::FuncSig> sig;
    bool mutation_marker = false; ///< Call written with the `!` marker.
};

/// Method call: `v.len()`, `v.push!(x)`.
struct MethodCallExpr {
    ExprPtr receiver;
    std::string method;
    std::vector<ExprPtr> args;
    Rc<const types::FuncSig> sig;
    bool mutation_marker = false;
};

/// `obj.field`, or `tuple.0`.
struct FieldExpr {
    ExprPtr object;
    std::string field;
};

struct IndexExpr {
    ExprPtr object;
    ExprPtr index;
};

struct TupleExpr {
    std::vector<ExprPtr> elements;
};

struct ArrayExpr {
    std::vector<ExprPtr> elements;
};

struct FieldInit {
    std::string name;
    ExprPtr value;
};

/// Aggregate literal: `Point { x: 1, y: 2 }`.
struct StructExpr {
    std::string name;
    std::vector<FieldInit> fields;
};

struct IfExpr {
    ExprPtr condition;
    ExprPtr then_branch;
    std::optional<ExprPtr> else_branch;
};

struct WhenArm {
    PatternPtr pattern;
    std::optional<ExprPtr> guard;
    ExprPtr body;
};

/// Pattern match: `when x { 1 => a, _ => b }`.
struct WhenExpr {
    ExprPtr scrutinee;
    std::vector<WhenArm> arms;
};

struct LoopExpr {
    ExprPtr body;
};

struct WhileExpr {
    ExprPtr condition;
    ExprPtr body;
};

/// `for item in iter { ... }`. The iterable is consumed.
struct ForExpr {
    PatternPtr pattern;
    ExprPtr iter;
    ExprPtr body;
};

/// `{ stmts; expr }`
struct BlockExpr {
    std::vector<StmtPtr> stmts;
    std::optional<ExprPtr> expr;
};

struct ReturnExpr {
    std::optional<ExprPtr> value;
};

struct BreakExpr {
    std::optional<ExprPtr> value;
};

struct ContinueExpr {};

struct ClosureParam {
    std::string name;
    bool is_mut = false;
    TypePtr type;
};

/// Closure: `do(x) x * 2`, `move do() consume(s)`.
struct ClosureExpr {
    std::vector<ClosureParam> params;
    TypePtr return_type;
    ExprPtr body;
    bool is_move = false;
};

/// `x as *U8`
struct CastExpr {
    ExprPtr expr;
    TypePtr target;
};

/// Unsafe region: `unsafe { ... }`.
struct UnsafeExpr {
    ExprPtr body;
};

struct Expr {
    std::variant<LiteralExpr, IdentExpr, UnaryExpr, BinaryExpr, CallExpr, MethodCallExpr,
                 FieldExpr, IndexExpr, TupleExpr, ArrayExpr, StructExpr, IfExpr, WhenExpr,
                 LoopExpr, WhileExpr, ForExpr, BlockExpr, ReturnExpr, BreakExpr, ContinueExpr,
                 ClosureExpr, CastExpr, UnsafeExpr>
        kind;
    SourceSpan span;
    TypePtr type; ///< Resolved type, if the upstream stage recorded one.

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// ============================================================================
// Statements
// ============================================================================

/// `let pattern: T = init`. `init` is absent for deferred initialization.
struct LetStmt {
    PatternPtr pattern;
    TypePtr type_annotation;
    std::optional<ExprPtr> init;
};

struct ExprStmt {
    ExprPtr expr;
};

struct Stmt {
    std::variant<LetStmt, ExprStmt> kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// ============================================================================
// Declarations
// ============================================================================

struct FuncParam {
    std::string name;
    bool is_mut = false;
    TypePtr type;
    SourceSpan span;
};

/// The `self` receiver of a method.
struct Receiver {
    std::string name = "self";
    types::ReceiverKind kind = types::ReceiverKind::Ref;
    bool is_mut = false; ///< `mut self` (by-value receivers only)
    SourceSpan span;
};

struct FuncDecl {
    std::string name;
    std::optional<Receiver> receiver;
    std::vector<FuncParam> params;
    TypePtr return_type;
    bool is_mutating = false; ///< Declared with the mutating marker.
    std::optional<ExprPtr> body;
    SourceSpan span;

    /// The resolved signature call sites carry.
    [[nodiscard]] auto signature() const -> types::FuncSig;
};

struct StructField {
    std::string name;
    TypePtr type;
};

struct StructDecl {
    std::string name;
    std::vector<StructField> fields;
    bool is_copy = false; ///< Type implements the Copy behavior.
    SourceSpan span;
};

/// Interface declaration: `behavior Counter { func bump!(mut ref this) }`.
struct ContractDecl {
    std::string name;
    std::vector<types::FuncSig> methods;
    SourceSpan span;
};

/// `impl Counter for Tally { ... }`; `contract_name` is empty for inherent impls.
struct ImplDecl {
    std::string contract_name;
    std::string type_name;
    std::vector<FuncDecl> methods;
    SourceSpan span;
};

struct ConstDecl {
    std::string name;
    TypePtr type;
    ExprPtr value;
    SourceSpan span;
};

struct Decl {
    std::variant<FuncDecl, StructDecl, ContractDecl, ImplDecl, ConstDecl> kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

/// A compilation unit.
struct Module {
    std::string name;
    std::vector<DeclPtr> decls;
};

} // namespace borrowck::ast

#endif // BORROWCK_AST_AST_HPP
