//! # Copy Oracle and Contract Table
//!
//! Read-only module metadata consulted by the checkers:
//!
//! - `CopyOracle` answers `is_copy(type)`; Copy values bypass move tracking.
//! - `ContractTable` maps `(contract, method)` to the declared signature, whose
//!   `is_mutating` flag every implementation must agree with.
//!
//! Both are derived from upstream type-definition metadata. `from_module`
//! builds them from the struct and contract declarations of an `ast::Module`.

#ifndef BORROWCK_TYPES_ORACLE_HPP
#define BORROWCK_TYPES_ORACLE_HPP

#include "borrowck/types/type.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>

namespace borrowck::ast {
struct Module;
}

namespace borrowck::types {

/// Copy-classification oracle.
class CopyOracle {
public:
    virtual ~CopyOracle() = default;

    /// Returns true if values of `type` are duplicated instead of moved.
    [[nodiscard]] virtual auto is_copy(const TypePtr& type) const -> bool = 0;
};

/// The standard classification.
///
/// | Type                       | Copy?                                   |
/// |----------------------------|-----------------------------------------|
/// | primitives                 | yes                                     |
/// | `ref T`                    | yes                                     |
/// | `mut ref T`                | no (exclusive)                          |
/// | `*T`, `func(..)`           | yes                                     |
/// | tuples, arrays             | if every element is Copy                |
/// | named types                | only when registered with `mark_copy`   |
/// | closures                   | no                                      |
class DefaultCopyOracle : public CopyOracle {
public:
    DefaultCopyOracle() = default;

    /// Registers a named type as Copy.
    void mark_copy(std::string name);

    [[nodiscard]] auto is_copy(const TypePtr& type) const -> bool override;

    /// Builds an oracle from the `is_copy` flags on the module's struct declarations.
    [[nodiscard]] static auto from_module(const ast::Module& module) -> DefaultCopyOracle;

private:
    std::set<std::string, std::less<>> copy_types_;
};

/// Declared contract methods, keyed by `(contract, method)`.
class ContractTable {
public:
    /// Declares a method of a contract.
    ///
    /// Returns an error message if `(contract, sig.name)` is already declared.
    auto declare(const std::string& contract, FuncSig sig) -> Result<bool, std::string>;

    /// Looks up the declared signature of `contract::method`.
    [[nodiscard]] auto lookup(std::string_view contract, std::string_view method) const
        -> const FuncSig*;

    [[nodiscard]] auto has_contract(std::string_view contract) const -> bool;

    [[nodiscard]] auto size() const -> size_t {
        return methods_.size();
    }

    /// Builds a table from the module's contract declarations. Duplicate
    /// declarations keep the first signature and are logged.
    [[nodiscard]] static auto from_module(const ast::Module& module) -> ContractTable;

private:
    std::map<std::pair<std::string, std::string>, FuncSig> methods_;
    std::set<std::string, std::less<>> contracts_;
};

} // namespace borrowck::types

#endif // BORROWCK_TYPES_ORACLE_HPP
