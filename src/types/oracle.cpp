//! # Copy Oracle and Contract Table

#include "borrowck/types/oracle.hpp"

#include "borrowck/ast/ast.hpp"
#include "borrowck/log/log.hpp"

namespace borrowck::types {

void DefaultCopyOracle::mark_copy(std::string name) {
    copy_types_.insert(std::move(name));
}

auto DefaultCopyOracle::is_copy(const TypePtr& type) const -> bool {
    if (!type) {
        // Unknown types are treated as moved.
        return false;
    }

    return std::visit(
        [this](const auto& t) -> bool {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return true;
            } else if constexpr (std::is_same_v<T, RefType>) {
                return !t.is_mut;
            } else if constexpr (std::is_same_v<T, PtrType> || std::is_same_v<T, FuncType>) {
                return true;
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return is_copy(t.element);
            } else if constexpr (std::is_same_v<T, TupleType>) {
                for (const auto& elem : t.elements) {
                    if (!is_copy(elem)) {
                        return false;
                    }
                }
                return true;
            } else if constexpr (std::is_same_v<T, NamedType>) {
                return copy_types_.find(t.name) != copy_types_.end();
            } else {
                return false;
            }
        },
        type->kind);
}

auto DefaultCopyOracle::from_module(const ast::Module& module) -> DefaultCopyOracle {
    DefaultCopyOracle oracle;
    for (const auto& decl : module.decls) {
        if (decl->is<ast::StructDecl>() && decl->as<ast::StructDecl>().is_copy) {
            oracle.mark_copy(decl->as<ast::StructDecl>().name);
        }
    }
    return oracle;
}

auto ContractTable::declare(const std::string& contract, FuncSig sig) -> Result<bool, std::string> {
    auto key = std::make_pair(contract, sig.name);
    if (methods_.count(key) > 0) {
        return "method `" + sig.name + "` is declared twice in contract `" + contract + "`";
    }
    methods_.emplace(std::move(key), std::move(sig));
    contracts_.insert(contract);
    return true;
}

auto ContractTable::lookup(std::string_view contract, std::string_view method) const
    -> const FuncSig* {
    auto it = methods_.find(std::make_pair(std::string(contract), std::string(method)));
    return it != methods_.end() ? &it->second : nullptr;
}

auto ContractTable::has_contract(std::string_view contract) const -> bool {
    return contracts_.find(contract) != contracts_.end();
}

auto ContractTable::from_module(const ast::Module& module) -> ContractTable {
    ContractTable table;
    for (const auto& decl : module.decls) {
        if (!decl->is<ast::ContractDecl>()) {
            continue;
        }
        const auto& contract = decl->as<ast::ContractDecl>();
        for (const auto& sig : contract.methods) {
            auto result = table.declare(contract.name, sig);
            if (is_err(result)) {
                BORROWCK_LOG_WARN("verify", unwrap_err(result));
            }
        }
    }
    return table;
}

} // namespace borrowck::types
