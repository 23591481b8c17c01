//! # Type Implementation
//!
//! Type factories, structural comparison and display.
//!
//! ## Type Display
//!
//! `type_to_string()` produces the names used in diagnostics and logs:
//! `mut ref Box[I32]`, `(I32, Bool)`, `[U8; 4]`, `func(I32) -> Bool`.

#include "borrowck/types/type.hpp"

#include <sstream>

namespace borrowck::types {

namespace {

template <typename K> auto make_type(K kind) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = std::move(kind);
    return type;
}

auto all_equal(const std::vector<TypePtr>& a, const std::vector<TypePtr>& b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (!types_equal(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

void join_types(std::ostringstream& oss, const std::vector<TypePtr>& types) {
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << type_to_string(types[i]);
    }
}

} // namespace

auto make_primitive(PrimitiveKind kind) -> TypePtr {
    return make_type(PrimitiveType{kind});
}

auto make_unit() -> TypePtr {
    return make_primitive(PrimitiveKind::Unit);
}

auto make_bool() -> TypePtr {
    return make_primitive(PrimitiveKind::Bool);
}

auto make_i32() -> TypePtr {
    return make_primitive(PrimitiveKind::I32);
}

auto make_i64() -> TypePtr {
    return make_primitive(PrimitiveKind::I64);
}

auto make_str() -> TypePtr {
    return make_primitive(PrimitiveKind::Str);
}

auto make_never() -> TypePtr {
    return make_primitive(PrimitiveKind::Never);
}

auto make_named(std::string name, std::vector<TypePtr> type_args) -> TypePtr {
    return make_type(NamedType{std::move(name), std::move(type_args)});
}

auto make_ref(TypePtr inner, bool is_mut) -> TypePtr {
    return make_type(RefType{is_mut, std::move(inner)});
}

auto make_ptr(TypePtr inner, bool is_mut) -> TypePtr {
    return make_type(PtrType{is_mut, std::move(inner)});
}

auto make_array(TypePtr element, size_t size) -> TypePtr {
    return make_type(ArrayType{std::move(element), size});
}

auto make_tuple(std::vector<TypePtr> elements) -> TypePtr {
    return make_type(TupleType{std::move(elements)});
}

auto make_func(std::vector<TypePtr> params, TypePtr ret) -> TypePtr {
    return make_type(FuncType{std::move(params), std::move(ret)});
}

auto make_closure(std::vector<TypePtr> params, TypePtr ret) -> TypePtr {
    return make_type(ClosureType{std::move(params), std::move(ret)});
}

auto types_equal(const TypePtr& a, const TypePtr& b) -> bool {
    if (a == b) {
        return true;
    }
    if (!a || !b || a->kind.index() != b->kind.index()) {
        return false;
    }

    return std::visit(
        [&b](const auto& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            const auto& rhs = b->as<T>();
            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return lhs.kind == rhs.kind;
            } else if constexpr (std::is_same_v<T, NamedType>) {
                return lhs.name == rhs.name && all_equal(lhs.type_args, rhs.type_args);
            } else if constexpr (std::is_same_v<T, RefType> || std::is_same_v<T, PtrType>) {
                return lhs.is_mut == rhs.is_mut && types_equal(lhs.inner, rhs.inner);
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return lhs.size == rhs.size && types_equal(lhs.element, rhs.element);
            } else if constexpr (std::is_same_v<T, TupleType>) {
                return all_equal(lhs.elements, rhs.elements);
            } else {
                return all_equal(lhs.params, rhs.params) &&
                       types_equal(lhs.return_type, rhs.return_type);
            }
        },
        a->kind);
}

auto primitive_kind_to_string(PrimitiveKind kind) -> std::string {
    switch (kind) {
    case PrimitiveKind::I8:
        return "I8";
    case PrimitiveKind::I16:
        return "I16";
    case PrimitiveKind::I32:
        return "I32";
    case PrimitiveKind::I64:
        return "I64";
    case PrimitiveKind::U8:
        return "U8";
    case PrimitiveKind::U16:
        return "U16";
    case PrimitiveKind::U32:
        return "U32";
    case PrimitiveKind::U64:
        return "U64";
    case PrimitiveKind::F32:
        return "F32";
    case PrimitiveKind::F64:
        return "F64";
    case PrimitiveKind::Bool:
        return "Bool";
    case PrimitiveKind::Char:
        return "Char";
    case PrimitiveKind::Str:
        return "Str";
    case PrimitiveKind::Unit:
        return "Unit";
    case PrimitiveKind::Never:
        return "Never";
    }
    return "?";
}

auto type_to_string(const TypePtr& type) -> std::string {
    if (!type) {
        return "<unknown>";
    }

    std::ostringstream oss;
    std::visit(
        [&oss](const auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, PrimitiveType>) {
                oss << primitive_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, NamedType>) {
                oss << t.name;
                if (!t.type_args.empty()) {
                    oss << "[";
                    join_types(oss, t.type_args);
                    oss << "]";
                }
            } else if constexpr (std::is_same_v<T, RefType>) {
                oss << (t.is_mut ? "mut ref " : "ref ") << type_to_string(t.inner);
            } else if constexpr (std::is_same_v<T, PtrType>) {
                oss << (t.is_mut ? "*mut " : "*") << type_to_string(t.inner);
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                oss << "[" << type_to_string(t.element) << "; " << t.size << "]";
            } else if constexpr (std::is_same_v<T, TupleType>) {
                oss << "(";
                join_types(oss, t.elements);
                oss << ")";
            } else if constexpr (std::is_same_v<T, FuncType>) {
                oss << "func(";
                join_types(oss, t.params);
                oss << ") -> " << type_to_string(t.return_type);
            } else {
                oss << "do(";
                join_types(oss, t.params);
                oss << ") -> " << type_to_string(t.return_type);
            }
        },
        type->kind);
    return oss.str();
}

auto is_reference(const TypePtr& type) -> bool {
    return type && type->is<RefType>();
}

auto is_mut_reference(const TypePtr& type) -> bool {
    return is_reference(type) && type->as<RefType>().is_mut;
}

auto is_raw_pointer(const TypePtr& type) -> bool {
    return type && type->is<PtrType>();
}

auto may_hold_borrow(const TypePtr& type) -> bool {
    if (!type) {
        return false;
    }
    return std::visit(
        [](const auto& t) -> bool {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, RefType> || std::is_same_v<T, ClosureType>) {
                return true;
            } else if constexpr (std::is_same_v<T, NamedType>) {
                for (const auto& arg : t.type_args) {
                    if (may_hold_borrow(arg)) {
                        return true;
                    }
                }
                return false;
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return may_hold_borrow(t.element);
            } else if constexpr (std::is_same_v<T, TupleType>) {
                for (const auto& elem : t.elements) {
                    if (may_hold_borrow(elem)) {
                        return true;
                    }
                }
                return false;
            } else {
                return false;
            }
        },
        type->kind);
}

} // namespace borrowck::types
