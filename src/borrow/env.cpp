//! # Module Environment Implementation
//!
//! ## Expression Types
//!
//! `type_of` prefers the type the upstream stage recorded on the node. When
//! none was recorded it derives one:
//!
//! | Expression        | Derived type                               |
//! |-------------------|--------------------------------------------|
//! | identifier        | the binding's declared type                |
//! | `ref e`/`mut ref e` | reference to `type_of(e)`                |
//! | `*e`              | pointee of a reference or raw pointer      |
//! | call              | signature return type, or closure return   |
//! | `e.f`             | struct field type, or tuple element        |
//! | aggregate literal | the named struct type / tuple / array      |
//! | block, `if`, `when` | type of the tail / first arm             |
//! | loops             | `Unit`                                     |
//! | jumps             | `Never`                                    |

#include "borrowck/borrow/env.hpp"

#include <charconv>

namespace borrowck::borrow {

auto CheckUnit::qualified_name() const -> std::string {
    if (!func) {
        return "<none>";
    }
    return owner.empty() ? func->name : owner + "::" + func->name;
}

auto collect_units(const ast::Module& module) -> std::vector<CheckUnit> {
    std::vector<CheckUnit> units;
    for (const auto& decl : module.decls) {
        if (decl->is<ast::FuncDecl>()) {
            const auto& func = decl->as<ast::FuncDecl>();
            if (func.body) {
                units.push_back(CheckUnit{&func, {}, {}});
            }
        } else if (decl->is<ast::ImplDecl>()) {
            const auto& impl = decl->as<ast::ImplDecl>();
            for (const auto& method : impl.methods) {
                if (method.body) {
                    units.push_back(CheckUnit{&method, impl.type_name, impl.contract_name});
                }
            }
        }
    }
    return units;
}

// ============================================================================
// ModuleEnv
// ============================================================================

auto ModuleEnv::from_module(const ast::Module& module) -> ModuleEnv {
    ModuleEnv env;
    for (const auto& decl : module.decls) {
        if (decl->is<ast::FuncDecl>()) {
            const auto& func = decl->as<ast::FuncDecl>();
            auto sig = func.signature();
            env.globals_.push_back(
                Global{func.name, types::make_func(sig.params, sig.return_type), func.span});
        } else if (decl->is<ast::ConstDecl>()) {
            const auto& constant = decl->as<ast::ConstDecl>();
            env.globals_.push_back(Global{constant.name, constant.type, constant.span});
        } else if (decl->is<ast::StructDecl>()) {
            const auto& decl_struct = decl->as<ast::StructDecl>();
            env.structs_[decl_struct.name] = decl_struct.fields;
        }
    }
    return env;
}

void ModuleEnv::install_globals(ScopeTable& scopes) const {
    for (const auto& global : globals_) {
        scopes.declare_binding(global.name, false, global.type, global.span, BindingKind::Global);
    }
}

auto ModuleEnv::field_type(std::string_view type_name, std::string_view field) const
    -> types::TypePtr {
    auto it = structs_.find(type_name);
    if (it == structs_.end()) {
        return nullptr;
    }
    for (const auto& f : it->second) {
        if (f.name == field) {
            return f.type;
        }
    }
    return nullptr;
}

// ============================================================================
// Unit setup
// ============================================================================

auto open_unit(ScopeTable& scopes, const ModuleEnv& env, const CheckUnit& unit) -> ScopeId {
    if (!unit.func) {
        throw InvariantViolation("check unit without a function");
    }

    env.install_globals(scopes);
    auto fn_scope = scopes.enter_scope(ScopeKind::Function);

    const auto& func = *unit.func;
    if (func.receiver) {
        const auto& recv = *func.receiver;
        auto self_type = types::make_named(unit.owner);
        bool is_mut = false;
        switch (recv.kind) {
        case types::ReceiverKind::Ref:
            self_type = types::make_ref(self_type, false);
            break;
        case types::ReceiverKind::MutRef:
            self_type = types::make_ref(self_type, true);
            is_mut = true;
            break;
        case types::ReceiverKind::Value:
            is_mut = recv.is_mut;
            break;
        }
        scopes.declare_binding(recv.name, is_mut, self_type, recv.span, BindingKind::Receiver);
    }

    for (const auto& param : func.params) {
        scopes.declare_binding(param.name, param.is_mut, param.type, param.span,
                               BindingKind::Param);
    }
    return fn_scope;
}

auto declare_pattern(ScopeTable& scopes, const ast::Pattern& pattern, types::TypePtr type)
    -> std::vector<BindingId> {
    std::vector<BindingId> ids;

    if (pattern.is<ast::IdentPattern>()) {
        const auto& ident = pattern.as<ast::IdentPattern>();
        ids.push_back(scopes.declare_binding(ident.name, ident.is_mut, std::move(type),
                                             pattern.span, BindingKind::Local));
    } else if (pattern.is<ast::TuplePattern>()) {
        const auto& tuple = pattern.as<ast::TuplePattern>();
        for (size_t i = 0; i < tuple.elements.size(); ++i) {
            types::TypePtr elem_type;
            if (type && type->is<types::TupleType>() &&
                i < type->as<types::TupleType>().elements.size()) {
                elem_type = type->as<types::TupleType>().elements[i];
            }
            auto sub = declare_pattern(scopes, *tuple.elements[i], elem_type);
            ids.insert(ids.end(), sub.begin(), sub.end());
        }
    }
    return ids;
}

// ============================================================================
// Expression types
// ============================================================================

namespace {

auto strip_refs(types::TypePtr type) -> types::TypePtr {
    while (type && type->is<types::RefType>()) {
        type = type->as<types::RefType>().inner;
    }
    return type;
}

auto tuple_element(const types::TypePtr& type, std::string_view field) -> types::TypePtr {
    if (!type || !type->is<types::TupleType>()) {
        return nullptr;
    }
    size_t index = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), index);
    const auto& elements = type->as<types::TupleType>().elements;
    if (ec != std::errc() || ptr != field.data() + field.size() || index >= elements.size()) {
        return nullptr;
    }
    return elements[index];
}

} // namespace

auto type_of(const ast::Expr& expr, const ScopeTable& scopes, const ModuleEnv& env)
    -> types::TypePtr {
    if (expr.type) {
        return expr.type;
    }

    return std::visit(
        [&](const auto& node) -> types::TypePtr {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::LiteralExpr>) {
                switch (node.lit_kind) {
                case ast::LiteralKind::Int:
                    return types::make_i32();
                case ast::LiteralKind::Float:
                    return types::make_primitive(types::PrimitiveKind::F64);
                case ast::LiteralKind::Bool:
                    return types::make_bool();
                case ast::LiteralKind::Char:
                    return types::make_primitive(types::PrimitiveKind::Char);
                case ast::LiteralKind::Str:
                    return types::make_str();
                case ast::LiteralKind::Unit:
                    return types::make_unit();
                }
                return nullptr;
            } else if constexpr (std::is_same_v<T, ast::IdentExpr>) {
                return scopes.binding(scopes.resolve(node.name)).type;
            } else if constexpr (std::is_same_v<T, ast::UnaryExpr>) {
                types::TypePtr inner = type_of(*node.operand, scopes, env);
                switch (node.op) {
                case ast::UnaryOp::Ref:
                    return types::make_ref(inner, false);
                case ast::UnaryOp::RefMut:
                    return types::make_ref(inner, true);
                case ast::UnaryOp::Deref:
                    if (inner && inner->is<types::RefType>()) {
                        return inner->as<types::RefType>().inner;
                    }
                    if (inner && inner->is<types::PtrType>()) {
                        return inner->as<types::PtrType>().inner;
                    }
                    return nullptr;
                default:
                    return inner;
                }
            } else if constexpr (std::is_same_v<T, ast::BinaryExpr>) {
                if (ast::is_assignment(node.op)) {
                    return types::make_unit();
                }
                if (ast::is_comparison(node.op)) {
                    return types::make_bool();
                }
                return type_of(*node.left, scopes, env);
            } else if constexpr (std::is_same_v<T, ast::CallExpr>) {
                if (node.sig) {
                    return node.sig->return_type;
                }
                types::TypePtr callee = type_of(*node.callee, scopes, env);
                if (callee && callee->is<types::ClosureType>()) {
                    return callee->as<types::ClosureType>().return_type;
                }
                if (callee && callee->is<types::FuncType>()) {
                    return callee->as<types::FuncType>().return_type;
                }
                return nullptr;
            } else if constexpr (std::is_same_v<T, ast::MethodCallExpr>) {
                return node.sig ? node.sig->return_type : nullptr;
            } else if constexpr (std::is_same_v<T, ast::FieldExpr>) {
                types::TypePtr object = strip_refs(type_of(*node.object, scopes, env));
                if (object && object->is<types::NamedType>()) {
                    return env.field_type(object->as<types::NamedType>().name, node.field);
                }
                return tuple_element(object, node.field);
            } else if constexpr (std::is_same_v<T, ast::IndexExpr>) {
                types::TypePtr object = strip_refs(type_of(*node.object, scopes, env));
                if (object && object->is<types::ArrayType>()) {
                    return object->as<types::ArrayType>().element;
                }
                return nullptr;
            } else if constexpr (std::is_same_v<T, ast::TupleExpr>) {
                std::vector<types::TypePtr> elements;
                for (const auto& elem : node.elements) {
                    elements.push_back(type_of(*elem, scopes, env));
                }
                return types::make_tuple(std::move(elements));
            } else if constexpr (std::is_same_v<T, ast::ArrayExpr>) {
                auto element =
                    node.elements.empty() ? nullptr : type_of(*node.elements[0], scopes, env);
                return types::make_array(element, node.elements.size());
            } else if constexpr (std::is_same_v<T, ast::StructExpr>) {
                return types::make_named(node.name);
            } else if constexpr (std::is_same_v<T, ast::IfExpr>) {
                return type_of(*node.then_branch, scopes, env);
            } else if constexpr (std::is_same_v<T, ast::WhenExpr>) {
                return node.arms.empty() ? types::make_unit()
                                         : type_of(*node.arms[0].body, scopes, env);
            } else if constexpr (std::is_same_v<T, ast::BlockExpr>) {
                // The block's own locals are out of scope by now; only outer
                // identifiers and recorded types are usable.
                if (!node.expr) {
                    return types::make_unit();
                }
                const ast::Expr& tail = **node.expr;
                if (!tail.type && tail.is<ast::IdentExpr>()) {
                    auto id = scopes.lookup(tail.as<ast::IdentExpr>().name);
                    return id ? scopes.binding(*id).type : nullptr;
                }
                return tail.type;
            } else if constexpr (std::is_same_v<T, ast::LoopExpr> ||
                                 std::is_same_v<T, ast::WhileExpr> ||
                                 std::is_same_v<T, ast::ForExpr>) {
                return types::make_unit();
            } else if constexpr (std::is_same_v<T, ast::ReturnExpr> ||
                                 std::is_same_v<T, ast::BreakExpr> ||
                                 std::is_same_v<T, ast::ContinueExpr>) {
                return types::make_never();
            } else if constexpr (std::is_same_v<T, ast::ClosureExpr>) {
                std::vector<types::TypePtr> params;
                for (const auto& param : node.params) {
                    params.push_back(param.type);
                }
                return types::make_closure(std::move(params), node.return_type);
            } else if constexpr (std::is_same_v<T, ast::CastExpr>) {
                return node.target;
            } else {
                // UnsafeExpr
                return type_of(*node.body, scopes, env);
            }
        },
        expr.kind);
}

auto may_carry_borrow(const types::TypePtr& type) -> bool {
    if (!type) {
        return true;
    }
    return types::may_hold_borrow(type) || type->is<types::NamedType>();
}

} // namespace borrowck::borrow
