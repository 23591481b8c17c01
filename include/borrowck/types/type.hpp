//! # Resolved Type Model
//!
//! The verifier consumes a tree whose expressions and bindings already carry
//! their resolved types. This module defines that type representation.
//!
//! ## Type Kinds
//!
//! | Kind            | Syntax          | Notes                                  |
//! |-----------------|-----------------|----------------------------------------|
//! | `PrimitiveType` | `I32`, `Bool`   | Always Copy                            |
//! | `NamedType`     | `Box[T]`, `S`   | Copy only when the oracle says so      |
//! | `RefType`       | `ref T`, `mut ref T` | Shared references are Copy        |
//! | `PtrType`       | `*T`, `*mut T`  | Raw pointer, deref gated behind unsafe |
//! | `ArrayType`     | `[T; N]`        |                                        |
//! | `TupleType`     | `(A, B)`        |                                        |
//! | `FuncType`      | `func(A) -> R`  | Function items and pointers            |
//! | `ClosureType`   | `do(A) -> R`    | Closure values, never Copy             |

#ifndef BORROWCK_TYPES_TYPE_HPP
#define BORROWCK_TYPES_TYPE_HPP

#include "borrowck/common.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace borrowck::types {

struct Type;
using TypePtr = std::shared_ptr<Type>;

/// Primitive types.
enum class PrimitiveKind {
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    F32,
    F64,
    Bool,
    Char,
    Str,
    Unit,
    Never,
};

struct PrimitiveType {
    PrimitiveKind kind;
};

/// User-defined struct or generic container: `Box[I32]`, `Point`.
struct NamedType {
    std::string name;
    std::vector<TypePtr> type_args;
};

/// Reference type: `ref T` or `mut ref T`.
struct RefType {
    bool is_mut;
    TypePtr inner;
};

/// Raw pointer type: `*T` or `*mut T`.
struct PtrType {
    bool is_mut;
    TypePtr inner;
};

struct ArrayType {
    TypePtr element;
    size_t size;
};

struct TupleType {
    std::vector<TypePtr> elements;
};

struct FuncType {
    std::vector<TypePtr> params;
    TypePtr return_type;
};

/// The type of a closure value. Captures are inferred by the borrow phase.
struct ClosureType {
    std::vector<TypePtr> params;
    TypePtr return_type;
};

struct Type {
    std::variant<PrimitiveType, NamedType, RefType, PtrType, ArrayType, TupleType, FuncType,
                 ClosureType>
        kind;

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

// Helper functions
[[nodiscard]] auto make_primitive(PrimitiveKind kind) -> TypePtr;
[[nodiscard]] auto make_unit() -> TypePtr;
[[nodiscard]] auto make_bool() -> TypePtr;
[[nodiscard]] auto make_i32() -> TypePtr;
[[nodiscard]] auto make_i64() -> TypePtr;
[[nodiscard]] auto make_str() -> TypePtr;
[[nodiscard]] auto make_never() -> TypePtr;
[[nodiscard]] auto make_named(std::string name, std::vector<TypePtr> type_args = {}) -> TypePtr;
[[nodiscard]] auto make_ref(TypePtr inner, bool is_mut = false) -> TypePtr;
[[nodiscard]] auto make_ptr(TypePtr inner, bool is_mut = false) -> TypePtr;
[[nodiscard]] auto make_array(TypePtr element, size_t size) -> TypePtr;
[[nodiscard]] auto make_tuple(std::vector<TypePtr> elements) -> TypePtr;
[[nodiscard]] auto make_func(std::vector<TypePtr> params, TypePtr ret) -> TypePtr;
[[nodiscard]] auto make_closure(std::vector<TypePtr> params, TypePtr ret) -> TypePtr;

/// Structural equality.
[[nodiscard]] auto types_equal(const TypePtr& a, const TypePtr& b) -> bool;
[[nodiscard]] auto type_to_string(const TypePtr& type) -> std::string;
[[nodiscard]] auto primitive_kind_to_string(PrimitiveKind kind) -> std::string;

/// True for `ref T` / `mut ref T`.
[[nodiscard]] auto is_reference(const TypePtr& type) -> bool;

/// True for `mut ref T`.
[[nodiscard]] auto is_mut_reference(const TypePtr& type) -> bool;

/// True for `*T` / `*mut T`.
[[nodiscard]] auto is_raw_pointer(const TypePtr& type) -> bool;

/// True when a value of this type may hold a borrow: references anywhere in
/// the structure, and closure values.
[[nodiscard]] auto may_hold_borrow(const TypePtr& type) -> bool;

// ============================================================================
// Callable Signatures
// ============================================================================

/// How a method receives `self`.
enum class ReceiverKind {
    Ref,    ///< `ref this`
    MutRef, ///< `mut ref this`
    Value,  ///< `this` (consumes the receiver)
};

/// The resolved signature of a callable, attached to every call site.
///
/// `is_mutating` is the callable's mutability contract: it must agree with
/// the contract declaration, the implementation and the call-site `!` marker.
struct FuncSig {
    std::string name;
    std::vector<TypePtr> params;
    TypePtr return_type;
    bool is_mutating = false;
    std::optional<ReceiverKind> receiver;
};

} // namespace borrowck::types

#endif // BORROWCK_TYPES_TYPE_HPP
