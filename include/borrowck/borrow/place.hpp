//! # Places
//!
//! A place is a storage location named by an expression: a root binding plus
//! a field path. Index and deref projections are only recorded as flags; the
//! path stops at the first of them, so `v[i].x` and `v[j].y` both name `v`.
//!
//! | Expression  | Root | Fields   | Flags        |
//! |-------------|------|----------|--------------|
//! | `s`         | `s`  |          |              |
//! | `s.a.b`     | `s`  | `a`, `b` |              |
//! | `v[i].x`    | `v`  |          | index        |
//! | `*r`        | `r`  |          | deref        |
//!
//! Two places overlap iff they share a root and one field path is a prefix
//! of the other.

#ifndef BORROWCK_BORROW_PLACE_HPP
#define BORROWCK_BORROW_PLACE_HPP

#include "borrowck/ast/ast.hpp"
#include "borrowck/borrow/scope.hpp"

#include <optional>
#include <string>
#include <vector>

namespace borrowck::borrow {

struct Place {
    BindingId root = 0;
    std::vector<std::string> fields;
    bool through_deref = false;
    bool through_index = false;

    [[nodiscard]] auto operator==(const Place& other) const -> bool = default;

    /// True when the field path is empty and no projection was applied.
    [[nodiscard]] auto is_whole() const -> bool {
        return fields.empty() && !through_deref && !through_index;
    }

    /// True if `this` is `other` or an ancestor of it.
    [[nodiscard]] auto is_prefix_of(const Place& other) const -> bool;

    [[nodiscard]] auto overlaps(const Place& other) const -> bool;

    /// `s.a.b`, `*r`, `v[..]`
    [[nodiscard]] auto to_string(const ScopeTable& scopes) const -> std::string;
};

/// The place `expr` denotes, or nullopt for value expressions.
///
/// Identifiers are resolved through `scopes`, so an unresolvable name raises
/// `InvariantViolation`.
[[nodiscard]] auto extract_place(const ast::Expr& expr, const ScopeTable& scopes)
    -> std::optional<Place>;

} // namespace borrowck::borrow

#endif // BORROWCK_BORROW_PLACE_HPP
